#include <doctest/doctest.h>

#include <LumenMaterial.hh>
#include <LumenShape.hh>
#include <LumenTransform.hh>

using namespace Lumen;

namespace {
  MaterialPtr gray() { return std::make_shared<Lambertian>(Color(0.5, 0.5, 0.5)); }

  // compares hits of two objects over random rays aimed near the origin
  void checkSameHits(const Object &a, const Object &b, RandEngine &rand) {
    int hits = 0;
    for (int i = 0; i < 1000; ++i) {
      Vector3d o = randomVector(rand, -6, 6);
      Ray r(o, randomVector(rand, -1.5, 1.5) - o);
      Hitrec ha, hb;
      bool hitA = a.intersect(r, 0.001, INF, ha, rand);
      bool hitB = b.intersect(r, 0.001, INF, hb, rand);
      REQUIRE(hitA == hitB);
      if (!hitA)
        continue;
      ++hits;
      CHECK(ha.t == doctest::Approx(hb.t));
      CHECK((ha.p - hb.p).norm() < 1e-7);
      CHECK((ha.norm - hb.norm).norm() < 1e-7);
      CHECK(ha.frontFace == hb.frontFace);
    }
    CHECK(hits > 0);
  }
} // namespace

TEST_CASE("Translate") {
  RandEngine rand(8);
  auto sphere = std::make_shared<Sphere>(Vector3d(0.2, 0, 0), 1, gray());

  SUBCASE("Inverse translation is the identity") {
    Vector3d offset(3, -1, 2);
    Translate back(std::make_shared<Translate>(sphere, offset), -offset);
    checkSameHits(*sphere, back, rand);
  }
  SUBCASE("Matches an object built in place") {
    Vector3d offset(0.5, 0.25, -0.5);
    Translate moved(sphere, offset);
    Sphere direct(Vector3d(0.7, 0.25, -0.5), 1, gray());
    checkSameHits(moved, direct, rand);
    AABB box;
    REQUIRE(moved.boundingBox(0, 1, box));
    CHECK(box.min.x() == doctest::Approx(-0.3));
    CHECK(box.max.z() == doctest::Approx(0.5));
  }
}

TEST_CASE("RotateY") {
  RandEngine rand(8);
  auto box = std::make_shared<Box>(Vector3d(0, 0, 0), Vector3d(1, 1, 2), gray());

  SUBCASE("Bounding box of the rotated corners") {
    RotateY rotated(box, 90);
    AABB b;
    REQUIRE(rotated.boundingBox(0, 1, b));
    CHECK(b.min.x() == doctest::Approx(0));
    CHECK(b.max.x() == doctest::Approx(2));
    CHECK(b.min.z() == doctest::Approx(-1));
    CHECK(b.max.z() == doctest::Approx(0));
  }
  SUBCASE("Hit normal is rotated") {
    RotateY rotated(box, 90);
    Hitrec h;
    // the box now spans x in [0, 2], its old +z face looks down +x
    REQUIRE(rotated.intersect(Ray(Vector3d(5, 0.5, -0.5), Vector3d(-1, 0, 0)),
                              0.001, INF, h, rand));
    CHECK(h.t == doctest::Approx(3));
    CHECK(h.frontFace);
    CHECK(h.norm.x() == doctest::Approx(1));
  }
  SUBCASE("Opposite rotations cancel") {
    auto centered =
        std::make_shared<Box>(Vector3d(-1, -1, -0.5), Vector3d(1, 0.5, 1), gray());
    RotateY back(std::make_shared<RotateY>(centered, 37), -37);
    checkSameHits(*centered, back, rand);
  }
}

TEST_CASE("Transform") {
  RandEngine rand(12);
  auto sphere = std::make_shared<Sphere>(Vector3d(0, 0, 0), 1, gray());

  SUBCASE("Inverse matrix is the identity") {
    Affine3d m = Affine3d::Identity();
    m.translate(Vector3d(1, 2, -1));
    m.rotate(AngleAxisd(0.4, Vector3d(0.3, 1, 0.2).normalized()));
    m.scale(Vector3d(1.5, 0.5, 2));
    Transform forward(sphere, m);
    Transform back(std::make_shared<Transform>(sphere, m), m.inverse());
    checkSameHits(*sphere, back, rand);
    CHECK((forward.matrix() - m.matrix()).norm() < 1e-12);
  }
  SUBCASE("Rigid motion matches a moved sphere") {
    Affine3d m = Affine3d::Identity();
    m.translate(Vector3d(0.5, -0.25, 0.3));
    m.rotate(AngleAxisd(1.1, Vector3d::UnitY()));
    Transform moved(sphere, m);
    Sphere direct(Vector3d(0.5, -0.25, 0.3), 1, gray());
    checkSameHits(moved, direct, rand);
  }
  SUBCASE("Ellipsoid normal follows the gradient") {
    Affine3d m = Affine3d::Identity();
    m.scale(Vector3d(2, 1, 1));
    Transform ellipsoid(sphere, m);
    Hitrec h;
    REQUIRE(ellipsoid.intersect(Ray(Vector3d(5, 0, 0), Vector3d(-1, 0, 0)),
                                0.001, INF, h, rand));
    CHECK(h.t == doctest::Approx(3));
    CHECK(h.norm.x() == doctest::Approx(1));
    for (int i = 0; i < 200; ++i) {
      Vector3d o = 6 * unitVectorRandom(rand);
      if (!ellipsoid.intersect(Ray(o, -o), 0.001, INF, h, rand))
        continue;
      // x^2/4 + y^2 + z^2 = 1
      Vector3d grad(h.p.x() / 2, 2 * h.p.y(), 2 * h.p.z());
      CHECK(h.p.x() * h.p.x() / 4 + h.p.y() * h.p.y() + h.p.z() * h.p.z() ==
            doctest::Approx(1));
      CHECK(h.norm.dot(grad.normalized()) == doctest::Approx(1));
    }
    AABB box;
    REQUIRE(ellipsoid.boundingBox(0, 1, box));
    CHECK(box.min.x() == doctest::Approx(-2));
    CHECK(box.max.y() == doctest::Approx(1));
  }
}

TEST_CASE("FlipFace") {
  RandEngine rand(3);
  auto rect = std::make_shared<XZRect>(-1, 1, -1, 1, 2, gray());
  FlipFace flipped(rect);
  Ray r(Vector3d(0, 0, 0), Vector3d(0, 1, 0));
  Hitrec a, b;
  REQUIRE(rect->intersect(r, 0.001, INF, a, rand));
  REQUIRE(flipped.intersect(r, 0.001, INF, b, rand));
  CHECK(a.frontFace != b.frontFace);
  CHECK(a.t == doctest::Approx(b.t));
  CHECK((a.norm - b.norm).norm() == 0);
  Vector3d o(0, 0, 0);
  Vector3d v(0.1, 1, 0.2);
  CHECK(flipped.pdfValue(o, v, rand) == doctest::Approx(rect->pdfValue(o, v, rand)));
}
