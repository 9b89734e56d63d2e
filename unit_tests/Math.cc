#include <doctest/doctest.h>

#include <LumenMath.hh>

using namespace Lumen;

TEST_CASE("polyQuadratic") {
  double roots[2];
  SUBCASE("Two roots in ascending order") {
    CHECK(polyQuadratic(1, -4, 3, roots) == 2);
    CHECK(roots[0] == doctest::Approx(1));
    CHECK(roots[1] == doctest::Approx(3));
    CHECK(polyQuadratic(-2, 8, -6, roots) == 2);
    CHECK(roots[0] == doctest::Approx(1));
    CHECK(roots[1] == doctest::Approx(3));
  }
  SUBCASE("Double root is reported twice") {
    CHECK(polyQuadratic(1, -4, 4, roots) == 2);
    CHECK(roots[0] == doctest::Approx(2));
    CHECK(roots[1] == doctest::Approx(2));
  }
  SUBCASE("No real roots") {
    CHECK(polyQuadratic(1, 0, 1, roots) == 0);
    CHECK(polyQuadratic(0, 0, 1, roots) == 0);
  }
  SUBCASE("Linear") {
    CHECK(polyQuadratic(0, 2, -4, roots) == 1);
    CHECK(roots[0] == doctest::Approx(2));
  }
  SUBCASE("Small root keeps its precision") {
    CHECK(polyQuadratic(1, -1e8, 1, roots) == 2);
    CHECK(roots[0] == doctest::Approx(1e-8).epsilon(1e-6));
    CHECK(roots[1] == doctest::Approx(1e8).epsilon(1e-6));
  }
  SUBCASE("Roots solve the polynomial") {
    RandEngine rand(7);
    for (int i = 0; i < 1000; ++i) {
      double a = rand(-10, 10), b = rand(-10, 10), c = rand(-10, 10);
      if (polyQuadratic(a, b, c, roots) != 2)
        continue;
      CHECK(roots[0] <= roots[1]);
      for (double t : roots) {
        double scale = fabs(a * t * t) + fabs(b * t) + fabs(c) + 1;
        CHECK(fabs(a * t * t + b * t + c) / scale < 1e-9);
      }
    }
  }
}

TEST_CASE("Onb") {
  RandEngine rand(1);
  for (int i = 0; i < 100; ++i) {
    Vector3d n = randomVector(rand, -1, 1);
    if (n.norm() < 1e-3)
      continue;
    Onb uvw(n);
    CHECK(uvw.w.dot(n.normalized()) == doctest::Approx(1));
    CHECK(uvw.u.norm() == doctest::Approx(1));
    CHECK(uvw.v.norm() == doctest::Approx(1));
    CHECK(uvw.u.dot(uvw.v) == doctest::Approx(0));
    CHECK(uvw.u.dot(uvw.w) == doctest::Approx(0));
    CHECK(uvw.v.dot(uvw.w) == doctest::Approx(0));
    Vector3d a = uvw.local(0.2, -0.4, 0.7);
    CHECK(a.dot(uvw.w) == doctest::Approx(0.7));
  }
}

TEST_CASE("Random directions") {
  RandEngine rand(3);
  for (int i = 0; i < 1000; ++i) {
    CHECK(unitSphereRandom(rand).squaredNorm() < 1);
    CHECK(unitVectorRandom(rand).norm() == doctest::Approx(1));
    Vector3d d = unitDiskRandom(rand);
    CHECK(d.z() == 0);
    CHECK(d.squaredNorm() < 1);
    Vector3d c = cosineDirectionRandom(rand);
    CHECK(c.z() >= 0);
    CHECK(c.norm() == doctest::Approx(1));
    // sphere of radius 1 seen from distance 2, half angle of 30 degrees
    Vector3d s = toSphereRandom(1, 4, rand);
    CHECK(s.norm() == doctest::Approx(1));
    CHECK(s.z() >= sqrt(0.75) - 1e-9);
  }
  SUBCASE("Cosine weighted mean") {
    // E[cos] of a cosine weighted hemisphere is 2/3
    double sum = 0;
    int n = 100000;
    for (int i = 0; i < n; ++i)
      sum += cosineDirectionRandom(rand).z();
    CHECK(sum / n == doctest::Approx(2.0 / 3.0).epsilon(0.01));
  }
}

TEST_CASE("Reflect and refract") {
  Vector3d n(0, 1, 0);
  Vector3d r = reflect(Vector3d(1, -1, 0), n);
  CHECK(r.x() == doctest::Approx(1));
  CHECK(r.y() == doctest::Approx(1));
  Vector3d straight = refract(Vector3d(0, -1, 0), n, 1 / 1.5);
  CHECK(straight.x() == doctest::Approx(0));
  CHECK(straight.y() == doctest::Approx(-1));
  // Snell's law
  Vector3d in = Vector3d(1, -1, 0).normalized();
  Vector3d out = refract(in, n, 1 / 1.5);
  CHECK(out.norm() == doctest::Approx(1));
  CHECK(1.5 * out.x() == doctest::Approx(in.x()));
  CHECK(schlick(1, 1.5) == doctest::Approx(0.04));
  CHECK(schlick(0, 1.5) == doctest::Approx(1));
}

TEST_CASE("Transforms of points and directions") {
  Affine3d m = Affine3d::Identity();
  m.translate(Vector3d(1, 2, 3));
  m.scale(2);
  Matrix4d mat = m.matrix();
  Vector3d p = transPoint(mat, Vector3d(1, 0, 0));
  CHECK(p.x() == doctest::Approx(3));
  CHECK(p.y() == doctest::Approx(2));
  CHECK(p.z() == doctest::Approx(3));
  Vector3d d = transDir(mat, Vector3d(1, 0, 0));
  CHECK(d.x() == doctest::Approx(2));
  CHECK(d.y() == doctest::Approx(0));
  CHECK(degToRad(180) == doctest::Approx(PI));
  CHECK(isFinite(Vector3d(1, 2, 3)));
  CHECK_FALSE(isFinite(Vector3d(1, INF, 3)));
}
