#include <doctest/doctest.h>

#include <LumenMaterial.hh>
#include <LumenMesh.hh>

#include <cstdio>
#include <fstream>

using namespace Lumen;

namespace {
  // a unit quad at z = 0 and a triangle above it at z = 1, both facing +z
  const char *QUAD_AND_TRIANGLE = R"(# test mesh
o quad
v 0 0 0
v 1 0 0
v 1 1 0
v 0 1 0
vt 0 0
vt 1 0
vt 1 1
vt 0 1
f 1/1 2/2 3/3 4/4
o tri
v 0 0 1
v 1 0 1
v 0 1 1
vn 0 0 1
f -3//1 -2//1 -1//1
)";

  MeshGeometry loadTestMesh() {
    const char *filename = "lumen_test_mesh.obj";
    {
      std::ofstream f(filename);
      f << QUAD_AND_TRIANGLE;
    }
    MeshGeometry geo = loadObj(filename);
    std::remove(filename);
    return geo;
  }
} // namespace

TEST_CASE("loadObj") {
  MeshGeometry geo = loadTestMesh();
  CHECK(geo.vertices.size() == 7);
  CHECK(geo.triangleCount() == 3);
  REQUIRE(geo.nodes.size() == 2);
  CHECK(geo.nodes[0].name == "quad");
  CHECK(geo.nodes[1].name == "tri");
  CHECK(geo.nodes[0].indices.size() == 6);
  for (auto &v : geo.vertices) {
    CHECK(v.normal.z() == doctest::Approx(1));
    CHECK(v.normal.norm() == doctest::Approx(1));
  }
  CHECK(geo.vertices[2].uv.x() == doctest::Approx(1));
  CHECK(geo.vertices[2].uv.y() == doctest::Approx(1));
  CHECK(geo.vertices[6].pos.y() == doctest::Approx(1));
  CHECK(detail::objIndex("3", 5) == 2);
  CHECK(detail::objIndex("-1", 5) == 4);
  CHECK(detail::objIndex("", 5) == -1);
}

TEST_CASE("loadObj with a long polygon") {
  // one face line of several kilobytes
  const int corners = 400;
  const char *filename = "lumen_test_polygon.obj";
  {
    std::ofstream f(filename);
    for (int i = 0; i < corners; ++i) {
      double a = 2 * PI * i / corners;
      f << "v " << cos(a) << " " << sin(a) << " 0\n";
    }
    f << "f";
    for (int i = 1; i <= corners; ++i)
      f << " " << i;
    f << "\n";
  }
  MeshGeometry geo = loadObj(filename);
  std::remove(filename);
  CHECK(geo.vertices.size() == size_t(corners));
  CHECK(geo.triangleCount() == size_t(corners - 2));
  REQUIRE(geo.nodes.size() == 1);
  CHECK(geo.nodes[0].indices.back() == uint32_t(corners - 1));
}

TEST_CASE("TriangleMesh") {
  RandEngine rand(51);
  MeshGeometry geo = loadTestMesh();
  auto mat = std::make_shared<Lambertian>(Color(1, 1, 1));
  Hitrec h;

  SUBCASE("Identity placement") {
    TriangleMesh mesh(geo, Matrix4d::Identity(), mat);
    CHECK(mesh.nodeCount() == 2);
    REQUIRE(mesh.intersect(Ray(Vector3d(0.25, 0.75, 0.5), Vector3d(0, 0, -1)),
                           0.001, INF, h, rand));
    CHECK(h.t == doctest::Approx(0.5));
    CHECK(h.frontFace);
    CHECK(h.norm.z() == doctest::Approx(1));
    CHECK(h.u == doctest::Approx(0.25));
    CHECK(h.v == doctest::Approx(0.75));
    CHECK(h.mat == mat.get());
  }
  SUBCASE("Nearest hit across nodes") {
    TriangleMesh mesh(geo, Matrix4d::Identity(), mat);
    REQUIRE(mesh.intersect(Ray(Vector3d(0.1, 0.1, 2), Vector3d(0, 0, -1)),
                           0.001, INF, h, rand));
    CHECK(h.t == doctest::Approx(1));
    REQUIRE(mesh.intersect(Ray(Vector3d(0.1, 0.1, 2), Vector3d(0, 0, -1)), 1.5,
                           INF, h, rand));
    CHECK(h.t == doctest::Approx(2));
  }
  SUBCASE("Back faces are culled") {
    TriangleMesh mesh(geo, Matrix4d::Identity(), mat);
    CHECK_FALSE(mesh.intersect(Ray(Vector3d(0.25, 0.25, -1), Vector3d(0, 0, 1)),
                               0.001, INF, h, rand));
  }
  SUBCASE("Vertices are placed in world space") {
    Affine3d m = Affine3d::Identity();
    m.translate(Vector3d(0, 0, 5));
    m.scale(2);
    TriangleMesh mesh(geo, m.matrix(), mat);
    REQUIRE(mesh.intersect(Ray(Vector3d(1.5, 1.5, 10), Vector3d(0, 0, -1)),
                           0.001, INF, h, rand));
    CHECK(h.t == doctest::Approx(5));
    CHECK(h.norm.z() == doctest::Approx(1));
    AABB box;
    REQUIRE(mesh.boundingBox(0, 1, box));
    CHECK(box.max.x() >= 2);
    CHECK(box.max.z() >= 7);
    CHECK(box.min.z() <= 5);
  }
}
