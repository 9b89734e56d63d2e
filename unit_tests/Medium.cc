#include <doctest/doctest.h>

#include <LumenMedium.hh>
#include <LumenShape.hh>

using namespace Lumen;

namespace {
  ObjectPtr unitSphere() {
    return std::make_shared<Sphere>(Vector3d(0, 0, 0), 1, nullptr);
  }
} // namespace

TEST_CASE("ConstantMedium") {
  RandEngine rand(41);

  SUBCASE("Dense fog scatters right at the boundary") {
    ConstantMedium fog(unitSphere(), 1e6, Color(1, 1, 1));
    Ray r(Vector3d(0, 0, -5), Vector3d(0, 0, 1));
    for (int i = 0; i < 100; ++i) {
      Hitrec h;
      REQUIRE(fog.intersect(r, 0.001, INF, h, rand));
      CHECK(h.t == doctest::Approx(4).epsilon(1e-4));
      CHECK(h.frontFace);
      CHECK(h.norm == Vector3d(1, 0, 0));
      REQUIRE(h.mat != nullptr);
    }
  }
  SUBCASE("Hit probability follows Beer's law") {
    // a path of length 2 through density 0.5
    ConstantMedium fog(unitSphere(), 0.5, Color(1, 1, 1));
    int n = 20000;
    for (double scale : {1.0, 3.0}) {
      Ray r(Vector3d(0, 0, -5), Vector3d(0, 0, scale));
      int hits = 0;
      for (int i = 0; i < n; ++i) {
        Hitrec h;
        if (!fog.intersect(r, 0.001, INF, h, rand))
          continue;
        ++hits;
        CHECK(h.t > 4 / scale);
        CHECK(h.t < 6 / scale);
      }
      CHECK(double(hits) / n == doctest::Approx(1 - exp(-1.0)).epsilon(0.03));
    }
  }
  SUBCASE("Ray starting inside the medium") {
    ConstantMedium fog(unitSphere(), 1e6, Color(1, 1, 1));
    Hitrec h;
    REQUIRE(fog.intersect(Ray(Vector3d(0, 0, 0), Vector3d(1, 0, 0)), 0.001, INF,
                          h, rand));
    CHECK(h.t >= 0.001);
    CHECK(h.t < 0.01);
  }
  SUBCASE("Misses") {
    ConstantMedium fog(unitSphere(), 1e6, Color(1, 1, 1));
    Hitrec h;
    CHECK_FALSE(fog.intersect(Ray(Vector3d(0, 3, -5), Vector3d(0, 0, 1)), 0.001,
                              INF, h, rand));
    // the interval ends before the medium
    CHECK_FALSE(fog.intersect(Ray(Vector3d(0, 0, -5), Vector3d(0, 0, 1)), 0.001,
                              3, h, rand));
    // the medium is behind the ray
    CHECK_FALSE(fog.intersect(Ray(Vector3d(0, 0, 5), Vector3d(0, 0, 1)), 0.001,
                              INF, h, rand));
  }
  SUBCASE("Bounding box of the boundary") {
    ConstantMedium fog(unitSphere(), 1, Color(1, 1, 1));
    AABB box;
    REQUIRE(fog.boundingBox(0, 1, box));
    CHECK(box.min.x() == doctest::Approx(-1));
  }
}
