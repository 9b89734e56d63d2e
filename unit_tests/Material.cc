#include <doctest/doctest.h>

#include <LumenMaterial.hh>
#include <LumenShape.hh>

using namespace Lumen;

namespace {
  // surface point at the origin facing +y, hit by a ray coming down
  Hitrec upHit(const Ray &r) {
    Hitrec h;
    h.setHit(1, Vector3d(0, 0, 0), r, Vector3d(0, 1, 0), 0.5, 0.5, nullptr);
    return h;
  }

  bool nonNegative(const Color &c) {
    return c.x() >= 0 && c.y() >= 0 && c.z() >= 0;
  }
} // namespace

TEST_CASE("Lambertian") {
  RandEngine rand(21);
  Lambertian mat(Color(0.2, 0.4, 0.6));
  Ray in(Vector3d(1, 1, 0), Vector3d(-1, -1, 0));
  Hitrec h = upHit(in);
  REQUIRE(h.frontFace);

  SUBCASE("Scatters through a cosine pdf") {
    ScatterRecord srec;
    REQUIRE(mat.scatter(in, h, srec, rand));
    auto pdfRec = std::get_if<PdfScatter>(&srec);
    REQUIRE(pdfRec != nullptr);
    CHECK(pdfRec->attenuation.y() == doctest::Approx(0.4));
    for (int i = 0; i < 100; ++i) {
      Vector3d d = pdfRec->pdf->generate();
      CHECK(d.dot(h.norm) >= 0);
      CHECK(pdfRec->pdf->value(d) ==
            doctest::Approx(mat.scatteringPdf(in, h, Ray(h.p, d))));
    }
  }
  SUBCASE("Scattering pdf integrates to one") {
    double sum = 0;
    int n = 200000;
    for (int i = 0; i < n; ++i) {
      double pdf = mat.scatteringPdf(in, h, Ray(h.p, unitVectorRandom(rand)));
      CHECK(pdf >= 0);
      sum += pdf;
    }
    CHECK(4 * PI * sum / n == doctest::Approx(1).epsilon(0.02));
  }
  SUBCASE("No emission") { CHECK(mat.emitted(in, h).norm() == 0); }
}

TEST_CASE("Metal") {
  RandEngine rand(22);
  Ray in(Vector3d(-1, 1, 0), Vector3d(1, -1, 0));
  Hitrec h = upHit(in);

  SUBCASE("Mirror") {
    Metal mirror(Color(0.9, 0.8, 0.7), 0);
    ScatterRecord srec;
    REQUIRE(mirror.scatter(in, h, srec, rand));
    auto spec = std::get_if<SpecularScatter>(&srec);
    REQUIRE(spec != nullptr);
    Vector3d d = spec->ray.d.normalized();
    CHECK(d.x() == doctest::Approx(sqrt(0.5)));
    CHECK(d.y() == doctest::Approx(sqrt(0.5)));
    CHECK(spec->attenuation.x() == doctest::Approx(0.9));
  }
  SUBCASE("Fuzzy reflections stay above the surface") {
    Metal fuzzy(Color(1, 1, 1), 5);
    for (int i = 0; i < 500; ++i) {
      ScatterRecord srec;
      if (!fuzzy.scatter(in, h, srec, rand))
        continue;
      auto &spec = std::get<SpecularScatter>(srec);
      CHECK(spec.ray.d.dot(h.norm) > 0);
    }
  }
}

TEST_CASE("Dielectric") {
  RandEngine rand(23);
  Dielectric glass(1.5);

  SUBCASE("Total internal reflection") {
    // leaving the glass at a grazing angle
    Ray in(Vector3d(-1, 0.1, 0), Vector3d(1, -0.1, 0));
    Hitrec h;
    h.setHit(1, Vector3d(0, 0, 0), in, Vector3d(0, -1, 0), 0, 0, nullptr);
    REQUIRE_FALSE(h.frontFace);
    for (int i = 0; i < 100; ++i) {
      ScatterRecord srec;
      REQUIRE(glass.scatter(in, h, srec, rand));
      auto &spec = std::get<SpecularScatter>(srec);
      CHECK(spec.ray.d.y() > 0);
      CHECK(spec.attenuation == Color(1, 1, 1));
    }
  }
  SUBCASE("Mostly refracts at normal incidence") {
    Ray in(Vector3d(0, 1, 0), Vector3d(0, -1, 0));
    Hitrec h = upHit(in);
    int refracted = 0, n = 10000;
    for (int i = 0; i < n; ++i) {
      ScatterRecord srec;
      REQUIRE(glass.scatter(in, h, srec, rand));
      auto &spec = std::get<SpecularScatter>(srec);
      CHECK(spec.ray.d.norm() == doctest::Approx(1));
      if (spec.ray.d.y() < 0)
        ++refracted;
    }
    // Fresnel reflectance of 4% head on
    CHECK(double(refracted) / n == doctest::Approx(0.96).epsilon(0.01));
  }
}

TEST_CASE("DiffuseLight") {
  RandEngine rand(24);
  DiffuseLight light(Color(4, 4, 4));
  Ray down(Vector3d(0, 1, 0), Vector3d(0, -1, 0));
  Hitrec front = upHit(down);
  CHECK(light.emitted(down, front).x() == doctest::Approx(4));
  Ray up(Vector3d(0, -1, 0), Vector3d(0, 1, 0));
  Hitrec back = upHit(up);
  CHECK(light.emitted(up, back).norm() == 0);
  ScatterRecord srec;
  CHECK_FALSE(light.scatter(down, front, srec, rand));
}

TEST_CASE("Isotropic") {
  RandEngine rand(25);
  Isotropic phase(Color(0.5, 0.5, 0.5));
  Ray in(Vector3d(0, 1, 0), Vector3d(0, -1, 0));
  Hitrec h = upHit(in);
  Vector3d mean(0, 0, 0);
  int n = 20000;
  for (int i = 0; i < n; ++i) {
    ScatterRecord srec;
    REQUIRE(phase.scatter(in, h, srec, rand));
    auto &spec = std::get<SpecularScatter>(srec);
    CHECK(spec.ray.o == h.p);
    mean += spec.ray.d.normalized();
  }
  // no preferred direction
  CHECK((mean / n).norm() < 0.05);
}

TEST_CASE("Attenuation is never negative") {
  RandEngine rand(26);
  Array<MaterialPtr> mats = {
      std::make_shared<Lambertian>(Color(0.1, 0.5, 0.9)),
      std::make_shared<Metal>(Color(0.9, 0.6, 0.2), 0.3),
      std::make_shared<Dielectric>(1.5),
      std::make_shared<Isotropic>(Color(0.4, 0.4, 0.4))};
  Sphere sphere(Vector3d(0, 0, 0), 1, nullptr);
  for (auto &mat : mats) {
    for (int i = 0; i < 500; ++i) {
      Vector3d o = 3 * unitVectorRandom(rand);
      Ray r(o, rand(0, 0.5) * unitVectorRandom(rand) - o);
      Hitrec h;
      if (!sphere.intersect(r, 0.001, INF, h, rand))
        continue;
      ScatterRecord srec;
      if (!mat->scatter(r, h, srec, rand))
        continue;
      if (auto spec = std::get_if<SpecularScatter>(&srec))
        CHECK(nonNegative(spec->attenuation));
      else
        CHECK(nonNegative(std::get<PdfScatter>(srec).attenuation));
    }
  }
}
