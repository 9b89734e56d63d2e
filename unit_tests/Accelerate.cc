#include <doctest/doctest.h>

#include <LumenAccelerate.hh>
#include <LumenMaterial.hh>
#include <LumenShape.hh>

using namespace Lumen;

namespace {
  Array<ObjectPtr> randomObjects(int count, RandEngine &rand) {
    Array<ObjectPtr> objs;
    for (int i = 0; i < count; ++i) {
      auto mat = std::make_shared<Lambertian>(randomVector(rand, 0, 1));
      Vector3d c = randomVector(rand, -10, 10);
      switch (i % 3) {
      case 0:
        objs.push_back(std::make_shared<Sphere>(c, rand(0.1, 1.5), mat));
        break;
      case 1:
        objs.push_back(std::make_shared<Box>(c, c + randomVector(rand, 0.1, 2),
                                             mat));
        break;
      default:
        objs.push_back(std::make_shared<Triangle>(
            c, c + randomVector(rand, -2, 2), c + randomVector(rand, -2, 2),
            mat));
        break;
      }
    }
    return objs;
  }

  void checkSameAsList(const Array<ObjectPtr> &objs, RandEngine &rand) {
    ObjectList list(objs);
    BVHNode bvh(objs, 0, 1, rand);
    int hits = 0;
    for (int i = 0; i < 2000; ++i) {
      Ray r(randomVector(rand, -15, 15), randomVector(rand, -1, 1));
      Hitrec a, b;
      bool hitList = list.intersect(r, 0.001, INF, a, rand);
      bool hitBvh = bvh.intersect(r, 0.001, INF, b, rand);
      REQUIRE(hitList == hitBvh);
      if (!hitList)
        continue;
      ++hits;
      CHECK(a.t == doctest::Approx(b.t));
      CHECK(a.mat == b.mat);
      CHECK(a.frontFace == b.frontFace);
      CHECK((a.p - b.p).norm() < 1e-9);
    }
    CHECK(hits > 0);
  }
} // namespace

TEST_CASE("BVHNode") {
  RandEngine rand(42);

  SUBCASE("Same nearest hit as a linear scan") {
    checkSameAsList(randomObjects(300, rand), rand);
  }
  SUBCASE("One and two objects") {
    checkSameAsList(randomObjects(1, rand), rand);
    checkSameAsList(randomObjects(2, rand), rand);
    checkSameAsList(randomObjects(3, rand), rand);
  }
  SUBCASE("Box covers the children") {
    auto objs = randomObjects(50, rand);
    BVHNode bvh(objs, 0, 1, rand);
    AABB root;
    REQUIRE(bvh.boundingBox(0, 1, root));
    for (auto &obj : objs) {
      AABB box;
      REQUIRE(obj->boundingBox(0, 1, box));
      CHECK(merge(root, box) == root);
    }
  }
  SUBCASE("Hits respect the ray interval") {
    Array<ObjectPtr> objs;
    auto mat = std::make_shared<Lambertian>(Color(1, 1, 1));
    for (int i = 0; i < 10; ++i)
      objs.push_back(
          std::make_shared<Sphere>(Vector3d(0, 0, -3.0 * (i + 1)), 1, mat));
    BVHNode bvh(objs, 0, 1, rand);
    Hitrec h;
    Ray r(Vector3d(0, 0, 0), Vector3d(0, 0, -1));
    REQUIRE(bvh.intersect(r, 0.001, INF, h, rand));
    CHECK(h.t == doctest::Approx(2));
    REQUIRE(bvh.intersect(r, 4.5, INF, h, rand));
    CHECK(h.t == doctest::Approx(5));
    CHECK_FALSE(bvh.intersect(r, 0.001, 1.5, h, rand));
  }
}
