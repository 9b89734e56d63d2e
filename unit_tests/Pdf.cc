#include <doctest/doctest.h>

#include <LumenMaterial.hh>
#include <LumenPdf.hh>
#include <LumenShape.hh>

using namespace Lumen;

TEST_CASE("CosinePdf") {
  RandEngine rand(31);
  Vector3d n = Vector3d(1, 2, -1).normalized();
  CosinePdf pdf(n, rand);

  SUBCASE("Generated directions are in the hemisphere") {
    for (int i = 0; i < 1000; ++i) {
      Vector3d d = pdf.generate();
      CHECK(d.dot(n) >= -1e-12);
      CHECK(pdf.value(d) == doctest::Approx(d.normalized().dot(n) / PI));
    }
    CHECK(pdf.value(-n) == 0);
  }
  SUBCASE("Integrates to one over the sphere") {
    double sum = 0;
    int count = 200000;
    for (int i = 0; i < count; ++i)
      sum += pdf.value(unitVectorRandom(rand));
    CHECK(4 * PI * sum / count == doctest::Approx(1).epsilon(0.02));
  }
}

TEST_CASE("HittablePdf") {
  RandEngine rand(32);
  auto light = std::make_shared<DiffuseLight>(Color(1, 1, 1));

  SUBCASE("Rectangle solid angle") {
    // 2x2 square at distance 1 subtends 4 asin(1/2) steradians
    XZRect rect(-1, 1, -1, 1, 1, light);
    HittablePdf pdf(rect, Vector3d(0, 0, 0), rand);
    double sum = 0;
    int count = 100000;
    for (int i = 0; i < count; ++i) {
      Vector3d d = pdf.generate();
      double value = pdf.value(d);
      REQUIRE(value > 0);
      sum += 1 / value;
    }
    CHECK(sum / count == doctest::Approx(4 * asin(0.5)).epsilon(0.02));
    CHECK(pdf.value(Vector3d(0, -1, 0)) == 0);
  }
  SUBCASE("Sphere cone is uniform") {
    Sphere sphere(Vector3d(0, 3, 0), 1, light);
    HittablePdf pdf(sphere, Vector3d(0, 0, 0), rand);
    double expected = 1 / (2 * PI * (1 - sqrt(1 - 1.0 / 9)));
    for (int i = 0; i < 500; ++i)
      CHECK(pdf.value(pdf.generate()) == doctest::Approx(expected));
  }
  SUBCASE("Light lists sample every member") {
    ObjectList lights;
    lights.add(std::make_shared<XZRect>(-1, 1, -1, 1, 2, light));
    lights.add(std::make_shared<XZRect>(-1, 1, -1, 1, -2, light));
    HittablePdf pdf(lights, Vector3d(0, 0, 0), rand);
    int up = 0, count = 10000;
    for (int i = 0; i < count; ++i) {
      Vector3d d = pdf.generate();
      CHECK(pdf.value(d) > 0);
      if (d.y() > 0)
        ++up;
    }
    CHECK(double(up) / count == doctest::Approx(0.5).epsilon(0.05));
  }
}

TEST_CASE("MixturePdf") {
  RandEngine rand(33);
  auto light = std::make_shared<DiffuseLight>(Color(1, 1, 1));
  XZRect rect(-1, 1, -1, 1, 2, light);
  Vector3d n(0, 1, 0);
  auto cosine = std::make_shared<CosinePdf>(n, rand);
  auto toLight = std::make_shared<HittablePdf>(rect, Vector3d(0, 0, 0), rand);
  MixturePdf mix(toLight, cosine, rand);

  for (int i = 0; i < 1000; ++i) {
    Vector3d d = mix.generate();
    CHECK(mix.value(d) ==
          doctest::Approx(0.5 * toLight->value(d) + 0.5 * cosine->value(d)));
    CHECK(mix.value(d) > 0);
  }
  // misses the light, only the cosine half remains
  Vector3d side = Vector3d(1, 0.1, 0).normalized();
  CHECK(mix.value(side) == doctest::Approx(0.5 * side.dot(n) / PI));
}
