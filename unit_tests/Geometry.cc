#include <doctest/doctest.h>

#include <LumenMaterial.hh>
#include <LumenQuadric.hh>
#include <LumenShape.hh>

using namespace Lumen;

namespace {
  MaterialPtr gray() { return std::make_shared<Lambertian>(Color(0.5, 0.5, 0.5)); }

  void checkVector(const Vector3d &a, const Vector3d &b) {
    CHECK(a.x() == doctest::Approx(b.x()));
    CHECK(a.y() == doctest::Approx(b.y()));
    CHECK(a.z() == doctest::Approx(b.z()));
  }

  Vector3d permuted(const Vector3d &v, const int perm[3]) {
    return Vector3d(v[perm[0]], v[perm[1]], v[perm[2]]);
  }
} // namespace

TEST_CASE("AABB") {
  RandEngine rand(11);
  auto randomBox = [&rand]() {
    Vector3d a = randomVector(rand, -2, 2), b = randomVector(rand, -2, 2);
    return AABB(boxMin(a, b), boxMax(a, b));
  };

  SUBCASE("Slab test does not depend on the axis order") {
    const int perms[6][3] = {{0, 1, 2}, {0, 2, 1}, {1, 0, 2},
                             {1, 2, 0}, {2, 0, 1}, {2, 1, 0}};
    for (int i = 0; i < 500; ++i) {
      AABB box = randomBox();
      Ray r(randomVector(rand, -5, 5), randomVector(rand, -1, 1));
      bool expected = box.intersect(r, 0.001, INF);
      for (auto &perm : perms) {
        AABB pb(permuted(box.min, perm), permuted(box.max, perm));
        Ray pr(permuted(r.o, perm), permuted(r.d, perm));
        CHECK(pb.intersect(pr, 0.001, INF) == expected);
      }
    }
  }
  SUBCASE("Axis parallel rays") {
    AABB box(Vector3d(0, 0, 0), Vector3d(1, 1, 1));
    CHECK(box.intersect(Ray(Vector3d(0.5, 0.5, -1), Vector3d(0, 0, 1)), 0, INF));
    CHECK_FALSE(
        box.intersect(Ray(Vector3d(2, 0.5, -1), Vector3d(0, 0, 1)), 0, INF));
    CHECK_FALSE(
        box.intersect(Ray(Vector3d(0.5, 0.5, -1), Vector3d(0, 0, 1)), 0, 0.5));
    CHECK_FALSE(
        box.intersect(Ray(Vector3d(0.5, 0.5, -1), Vector3d(0, 0, -1)), 0, INF));
  }
  SUBCASE("Merge") {
    for (int i = 0; i < 100; ++i) {
      AABB a = randomBox(), b = randomBox(), c = randomBox();
      CHECK(merge(AABB(), a) == a);
      CHECK(merge(a, AABB()) == a);
      CHECK(merge(a, b) == merge(b, a));
      CHECK(merge(merge(a, b), c) == merge(a, merge(b, c)));
      AABB m = merge(a, b);
      CHECK(m.min.x() <= a.min.x());
      CHECK(m.max.y() >= b.max.y());
    }
    CHECK(AABB().empty());
  }
  SUBCASE("Transformed box holds the transformed corners") {
    Affine3d m = Affine3d::Identity();
    m.translate(Vector3d(1, -2, 3));
    m.rotate(AngleAxisd(0.7, Vector3d(1, 1, 0).normalized()));
    m.scale(Vector3d(2, 1, 0.5));
    AABB box(Vector3d(-1, 0, 2), Vector3d(1, 3, 4));
    AABB out = AABB::transform(m.matrix(), box);
    for (int i = 0; i < 8; ++i) {
      Vector3d corner(i & 1 ? box.max.x() : box.min.x(),
                      i & 2 ? box.max.y() : box.min.y(),
                      i & 4 ? box.max.z() : box.min.z());
      Vector3d p = transPoint(m.matrix(), corner);
      for (int a = 0; a < 3; ++a) {
        CHECK(p[a] >= out.min[a] - 1e-9);
        CHECK(p[a] <= out.max[a] + 1e-9);
      }
    }
  }
}

TEST_CASE("Sphere") {
  RandEngine rand(5);
  Hitrec h;

  SUBCASE("Hit in front of the camera") {
    Sphere s(Vector3d(0, 0, -1), 0.5, gray());
    Ray r(Vector3d(0, 0, 0), Vector3d(0, 0, -1));
    REQUIRE(s.intersect(r, 0.001, INF, h, rand));
    CHECK(h.t == doctest::Approx(0.5));
    checkVector(h.norm, Vector3d(0, 0, 1));
    CHECK(h.frontFace);
    CHECK(h.mat != nullptr);
  }
  SUBCASE("Ray from inside hits the far side") {
    Sphere s(Vector3d(0, 0, 0), 1, gray());
    Ray r(Vector3d(0, 0, 0), Vector3d(0, 0, -1));
    REQUIRE(s.intersect(r, 0.001, INF, h, rand));
    CHECK(h.t == doctest::Approx(1));
    CHECK_FALSE(h.frontFace);
    checkVector(h.norm, Vector3d(0, 0, 1));
  }
  SUBCASE("t is measured in units of the direction") {
    Sphere s(Vector3d(0, 0, 0), 1, gray());
    Ray r(Vector3d(0, 0, 5), Vector3d(0, 0, -2));
    REQUIRE(s.intersect(r, 0.001, INF, h, rand));
    CHECK(h.t == doctest::Approx(2));
    checkVector(h.p, Vector3d(0, 0, 1));
  }
  SUBCASE("Misses") {
    Sphere s(Vector3d(0, 0, 0), 1, gray());
    CHECK_FALSE(s.intersect(Ray(Vector3d(0, 0, 5), Vector3d(0, 1, 0)), 0.001,
                            INF, h, rand));
    CHECK_FALSE(s.intersect(Ray(Vector3d(0, 0, 5), Vector3d(0, 0, -1)), 0.001,
                            3, h, rand));
    CHECK_FALSE(s.intersect(Ray(Vector3d(0, 0, 5), Vector3d(0, 0, 1)), 0.001,
                            INF, h, rand));
  }
  SUBCASE("Texture coordinates") {
    Sphere s(Vector3d(0, 0, 0), 1, gray());
    REQUIRE(s.intersect(Ray(Vector3d(0, 0, 5), Vector3d(0, 0, -1)), 0.001, INF,
                        h, rand));
    CHECK(h.u == doctest::Approx(0.25));
    CHECK(h.v == doctest::Approx(0.5));
    REQUIRE(s.intersect(Ray(Vector3d(0, 5, 0), Vector3d(0, -1, 0)), 0.001, INF,
                        h, rand));
    CHECK(h.v == doctest::Approx(1));
  }
  SUBCASE("Bounding box") {
    Sphere s(Vector3d(1, 2, 3), 2, gray());
    AABB box;
    REQUIRE(s.boundingBox(0, 1, box));
    checkVector(box.min, Vector3d(-1, 0, 1));
    checkVector(box.max, Vector3d(3, 4, 5));
  }
  SUBCASE("Directions sampled toward the sphere hit it") {
    Sphere s(Vector3d(0, 0, -5), 1, gray());
    Vector3d o(0, 0, 0);
    double expected = 1 / (2 * PI * (1 - sqrt(1 - 1.0 / 25)));
    for (int i = 0; i < 200; ++i) {
      Vector3d v = s.random(o, rand);
      CHECK(s.intersect(Ray(o, v), 0.001, INF, h, rand));
      CHECK(s.pdfValue(o, v, rand) == doctest::Approx(expected));
    }
    CHECK(s.pdfValue(o, Vector3d(0, 1, 0), rand) == 0);
  }
  SUBCASE("Sampling from inside covers the whole sphere") {
    Sphere s(Vector3d(0, 0, 0), 2, gray());
    Vector3d o(0.5, 0, 0);
    for (int i = 0; i < 200; ++i) {
      Vector3d v = s.random(o, rand);
      CHECK(v.norm() == doctest::Approx(1));
      CHECK(s.pdfValue(o, v, rand) == doctest::Approx(1 / (4 * PI)));
    }
  }
}

TEST_CASE("MovingSphere") {
  RandEngine rand(5);
  Hitrec h;
  MovingSphere s(Vector3d(0, 0, 0), Vector3d(0, 2, 0), 0, 1, 0.5, gray());
  // the center is at y = 1 halfway through the shutter
  Ray r(Vector3d(0, 1, 5), Vector3d(0, 0, -1), 0.5);
  REQUIRE(s.intersect(r, 0.001, INF, h, rand));
  CHECK(h.t == doctest::Approx(4.5));
  CHECK_FALSE(s.intersect(Ray(Vector3d(0, 1, 5), Vector3d(0, 0, -1), 0.0),
                          0.001, INF, h, rand));
  CHECK(s.intersect(Ray(Vector3d(0, 2, 5), Vector3d(0, 0, -1), 1.0), 0.001,
                    INF, h, rand));

  AABB box;
  REQUIRE(s.boundingBox(0, 1, box));
  CHECK(box.min.y() <= -0.5);
  CHECK(box.max.y() >= 2.5);
}

TEST_CASE("Axis aligned rectangles") {
  RandEngine rand(9);
  Hitrec h;

  SUBCASE("XY") {
    XYRect rect(0, 1, 0, 1, 2, gray());
    REQUIRE(rect.intersect(Ray(Vector3d(0.5, 0.25, 0), Vector3d(0, 0, 1)),
                           0.001, INF, h, rand));
    CHECK(h.t == doctest::Approx(2));
    CHECK(h.u == doctest::Approx(0.5));
    CHECK(h.v == doctest::Approx(0.25));
    CHECK_FALSE(h.frontFace);
    checkVector(h.norm, Vector3d(0, 0, -1));
    CHECK_FALSE(rect.intersect(Ray(Vector3d(1.5, 0.5, 0), Vector3d(0, 0, 1)),
                               0.001, INF, h, rand));
    CHECK_FALSE(rect.intersect(Ray(Vector3d(0.5, 0.5, 0), Vector3d(1, 0, 0)),
                               0.001, INF, h, rand));
  }
  SUBCASE("XZ and YZ") {
    XZRect xz(-1, 1, -1, 1, 3, gray());
    REQUIRE(xz.intersect(Ray(Vector3d(0, 0, 0), Vector3d(0, 1, 0)), 0.001, INF,
                         h, rand));
    CHECK(h.t == doctest::Approx(3));
    YZRect yz(-1, 1, -1, 1, -2, gray());
    REQUIRE(yz.intersect(Ray(Vector3d(0, 0, 0), Vector3d(-1, 0, 0)), 0.001,
                         INF, h, rand));
    CHECK(h.t == doctest::Approx(2));
    CHECK(h.frontFace);
    AABB box;
    REQUIRE(yz.boundingBox(0, 1, box));
    CHECK(box.max.x() - box.min.x() > 0);
  }
  SUBCASE("Area light density") {
    XYRect rect(0, 1, 0, 1, 2, gray());
    Vector3d o(0.5, 0.5, 0);
    CHECK(rect.pdfValue(o, Vector3d(0, 0, 1), rand) == doctest::Approx(4));
    CHECK(rect.pdfValue(o, Vector3d(0, 0, -1), rand) == 0);
    for (int i = 0; i < 100; ++i)
      CHECK(rect.pdfValue(o, rect.random(o, rand), rand) > 0);
  }
}

TEST_CASE("Box") {
  RandEngine rand(2);
  Hitrec h;
  Box box(Vector3d(0, 0, 0), Vector3d(1, 1, 1), gray());
  REQUIRE(box.intersect(Ray(Vector3d(0.5, 0.5, -5), Vector3d(0, 0, 1)), 0.001,
                        INF, h, rand));
  CHECK(h.t == doctest::Approx(5));
  CHECK(h.frontFace);
  checkVector(h.norm, Vector3d(0, 0, -1));
  REQUIRE(box.intersect(Ray(Vector3d(0.5, 0.5, 0.5), Vector3d(1, 0, 0)), 0.001,
                        INF, h, rand));
  CHECK(h.t == doctest::Approx(0.5));
  CHECK_FALSE(h.frontFace);
  CHECK_FALSE(box.intersect(Ray(Vector3d(2, 2, -5), Vector3d(0, 0, 1)), 0.001,
                            INF, h, rand));
}

TEST_CASE("Triangle") {
  RandEngine rand(4);
  Hitrec h;
  Triangle tri(Vector3d(0, 0, 0), Vector3d(1, 0, 0), Vector3d(0, 1, 0), gray());

  SUBCASE("Both sides are hit") {
    REQUIRE(tri.intersect(Ray(Vector3d(0.25, 0.25, 1), Vector3d(0, 0, -1)),
                          0.001, INF, h, rand));
    CHECK(h.t == doctest::Approx(1));
    CHECK(h.frontFace);
    checkVector(h.norm, Vector3d(0, 0, 1));
    REQUIRE(tri.intersect(Ray(Vector3d(0.25, 0.25, -1), Vector3d(0, 0, 1)),
                          0.001, INF, h, rand));
    CHECK_FALSE(h.frontFace);
    checkVector(h.norm, Vector3d(0, 0, -1));
  }
  SUBCASE("Misses outside the edges") {
    CHECK_FALSE(tri.intersect(Ray(Vector3d(0.75, 0.75, 1), Vector3d(0, 0, -1)),
                              0.001, INF, h, rand));
    CHECK_FALSE(tri.intersect(Ray(Vector3d(-0.1, 0.5, 1), Vector3d(0, 0, -1)),
                              0.001, INF, h, rand));
  }
  SUBCASE("Vertex normals are interpolated") {
    Triangle smooth(Vector3d(0, 0, 0), Vector3d(1, 0, 0), Vector3d(0, 1, 0),
                    Vector3d(0, 0, 1), Vector3d(1, 0, 1).normalized(),
                    Vector3d(0, 0, 1), gray());
    REQUIRE(smooth.intersect(Ray(Vector3d(0.5, 0.1, 1), Vector3d(0, 0, -1)),
                             0.001, INF, h, rand));
    CHECK(h.norm.x() > 0);
    CHECK(h.norm.norm() == doctest::Approx(1));
  }
  SUBCASE("Area density") {
    Vector3d o(0.25, 0.25, 1);
    for (int i = 0; i < 100; ++i)
      CHECK(tri.pdfValue(o, tri.random(o, rand), rand) > 0);
    // straight down, distance 1, area 1/2
    CHECK(tri.pdfValue(o, Vector3d(0, 0, -1), rand) == doctest::Approx(2));
  }
}

TEST_CASE("Disk and Plane") {
  RandEngine rand(4);
  Hitrec h;
  SUBCASE("Disk") {
    Disk disk(Vector3d(0, 0, 0), Vector3d(0, 2, 0), 1, gray());
    REQUIRE(disk.intersect(Ray(Vector3d(0.5, 1, 0), Vector3d(0, -1, 0)), 0.001,
                           INF, h, rand));
    CHECK(h.t == doctest::Approx(1));
    CHECK(h.frontFace);
    CHECK(h.u >= 0);
    CHECK(h.u <= 1);
    CHECK_FALSE(disk.intersect(Ray(Vector3d(2, 1, 0), Vector3d(0, -1, 0)),
                               0.001, INF, h, rand));
    AABB box;
    REQUIRE(disk.boundingBox(0, 1, box));
    CHECK(box.min.x() <= -1);
    CHECK(box.max.z() >= 1);
    CHECK(box.max.y() > box.min.y());
  }
  SUBCASE("Plane") {
    Plane plane(Vector3d(0, 0, 0), Vector3d(0, 1, 0), gray());
    AABB box;
    CHECK_FALSE(plane.boundingBox(0, 1, box));
    REQUIRE(plane.intersect(Ray(Vector3d(100, 1, -40), Vector3d(0, -1, 0)),
                            0.001, INF, h, rand));
    CHECK(h.t == doctest::Approx(1));
    CHECK_FALSE(plane.intersect(Ray(Vector3d(0, 1, 0), Vector3d(1, 0, 0)),
                                0.001, INF, h, rand));
  }
}

TEST_CASE("Quadrics") {
  RandEngine rand(6);
  Hitrec h;

  SUBCASE("Cylinder") {
    Cylinder cyl(1, 0, 2, 2 * PI, gray());
    REQUIRE(cyl.intersect(Ray(Vector3d(5, 0, 1), Vector3d(-1, 0, 0)), 0.001,
                          INF, h, rand));
    CHECK(h.t == doctest::Approx(4));
    CHECK(h.frontFace);
    checkVector(h.norm, Vector3d(1, 0, 0));
    CHECK(h.u == doctest::Approx(0));
    CHECK(h.v == doctest::Approx(0.5));
    CHECK_FALSE(cyl.intersect(Ray(Vector3d(5, 0, 3), Vector3d(-1, 0, 0)),
                              0.001, INF, h, rand));
    CHECK_FALSE(cyl.intersect(Ray(Vector3d(0, 0, -5), Vector3d(0, 0, 1)),
                              0.001, INF, h, rand));
  }
  SUBCASE("Partial sweep falls back to the far root") {
    Cylinder half(1, 0, 2, PI, gray());
    REQUIRE(half.intersect(Ray(Vector3d(0, 5, 1), Vector3d(0, -1, 0)), 0.001,
                           INF, h, rand));
    CHECK(h.t == doctest::Approx(4));
    CHECK(h.frontFace);
    REQUIRE(half.intersect(Ray(Vector3d(0, -5, 1), Vector3d(0, 1, 0)), 0.001,
                           INF, h, rand));
    CHECK(h.t == doctest::Approx(6));
    CHECK_FALSE(h.frontFace);
  }
  SUBCASE("Cylinder as a light") {
    Cylinder cyl(1, 0, 2, 2 * PI, gray());
    Vector3d o(4, 0, 1);
    for (int i = 0; i < 100; ++i) {
      Vector3d v = cyl.random(o, rand);
      // points on the far side are hidden, the near ones carry density
      double pdf = cyl.pdfValue(o, v, rand);
      CHECK(pdf >= 0);
    }
    CHECK(cyl.pdfValue(o, Vector3d(-1, 0, 0), rand) > 0);
    CHECK(cyl.pdfValue(o, Vector3d(1, 0, 0), rand) == 0);
  }
  SUBCASE("Cone") {
    Cone cone(1, 1, 2 * PI, gray());
    REQUIRE(cone.intersect(Ray(Vector3d(5, 0, 0.5), Vector3d(-1, 0, 0)), 0.001,
                           INF, h, rand));
    CHECK(h.t == doctest::Approx(4.5));
    CHECK(h.frontFace);
    checkVector(h.norm, Vector3d(1, 0, 1).normalized());
    CHECK_FALSE(cone.intersect(Ray(Vector3d(5, 0, 1.5), Vector3d(-1, 0, 0)),
                               0.001, INF, h, rand));
  }
  SUBCASE("Paraboloid") {
    Paraboloid para(1, 0, 1, 2 * PI, gray());
    REQUIRE(para.intersect(Ray(Vector3d(5, 0, 0.25), Vector3d(-1, 0, 0)), 0.001,
                           INF, h, rand));
    CHECK(h.t == doctest::Approx(4.5));
    CHECK(h.frontFace);
    checkVector(h.norm, Vector3d(1, 0, -1).normalized());
    // looking down into the bowl hits the inside
    REQUIRE(para.intersect(Ray(Vector3d(0.5, 0, 5), Vector3d(0, 0, -1)), 0.001,
                           INF, h, rand));
    CHECK(h.p.z() == doctest::Approx(0.25));
  }
  SUBCASE("Hyperboloid through a vertical line is a cylinder") {
    Hyperboloid hyp(Vector3d(1, 0, -1), Vector3d(1, 0, 1), 2 * PI, gray());
    REQUIRE(hyp.intersect(Ray(Vector3d(5, 0, 0), Vector3d(-1, 0, 0)), 0.001,
                          INF, h, rand));
    CHECK(h.t == doctest::Approx(4));
    CHECK(h.frontFace);
    checkVector(h.norm, Vector3d(1, 0, 0));
  }
  SUBCASE("Twisted hyperboloid") {
    // x^2 + y^2 - z^2 / 4 = 1
    Hyperboloid hyp(Vector3d(1, 0, 0), Vector3d(1, 1, 2), 2 * PI, gray());
    REQUIRE(hyp.intersect(Ray(Vector3d(5, 0, 1), Vector3d(-1, 0, 0)), 0.001,
                          INF, h, rand));
    CHECK(h.t == doctest::Approx(5 - sqrt(1.25)));
    for (int i = 0; i < 200; ++i) {
      Vector3d o = randomVector(rand, -4, 4);
      o.z() = rand(0.2, 1.8);
      Vector3d target(0, 0, rand(0.2, 1.8));
      if (o.head<2>().norm() < 2)
        continue;
      if (!hyp.intersect(Ray(o, target - o), 0.001, INF, h, rand))
        continue;
      double r2 = h.p.x() * h.p.x() + h.p.y() * h.p.y();
      CHECK(r2 == doctest::Approx(1 + h.p.z() * h.p.z() / 4).epsilon(1e-6));
      CHECK(h.p.z() >= -1e-9);
      CHECK(h.p.z() <= 2 + 1e-9);
    }
  }
}
