#pragma once

#include <LumenObject.hh>
#include <cstring>
#include <fstream>
#include <map>
#include <string>
#include <tuple>

namespace Lumen {
  struct MeshVertex {
    Vector3d pos, normal;
    Vector2d uv;

    MeshVertex() : pos(0, 0, 0), normal(0, 0, 0), uv(0, 0) {}
  };

  struct MeshNode {
    std::string name;
    Array<uint32_t> indices; // three per triangle
    AABB box;
  };

  struct MeshGeometry {
    Array<MeshVertex> vertices;
    Array<MeshNode> nodes;

    size_t triangleCount() const {
      size_t n = 0;
      for (auto &node : nodes)
        n += node.indices.size() / 3;
      return n;
    }
  };

  namespace detail {
    // resolves a 1-based or negative (relative) obj index, -1 when absent
    inline int objIndex(const char *s, size_t count) {
      if (*s == '\0')
        return -1;
      int i = atoi(s);
      if (i > 0)
        return i - 1;
      if (i < 0)
        return int(count) + i;
      return -1;
    }
  } // namespace detail

  // Wavefront obj: v, vt, vn, f (polygons are fanned), o and g start nodes
  inline MeshGeometry loadObj(const std::string &filename) {
    std::ifstream f(filename);
    if (!f)
      fatal("Cannot open mesh '%s'", filename.c_str());

    Array<Vector3d> positions, normals;
    Array<Vector2d> uvs;
    MeshGeometry geo;
    geo.nodes.push_back(MeshNode{"default", {}, AABB()});

    // (position, uv, normal) triple -> vertex index
    std::map<std::tuple<int, int, int>, uint32_t> cache;
    Array<int> vertexPos;
    Array<bool> hasNormal;

    std::string line;
    int lineNo = 0;
    while (std::getline(f, line)) {
      ++lineNo;
      char key[16];
      int consumed = 0;
      if (sscanf(line.c_str(), "%15s%n", key, &consumed) != 1 || key[0] == '#')
        continue;
      const char *rest = line.c_str() + consumed;

      if (!strcmp(key, "v")) {
        double x, y, z;
        if (sscanf(rest, "%lf %lf %lf", &x, &y, &z) != 3)
          fatal("'%s':%d: malformed vertex", filename.c_str(), lineNo);
        positions.push_back(Vector3d(x, y, z));
      } else if (!strcmp(key, "vn")) {
        double x, y, z;
        if (sscanf(rest, "%lf %lf %lf", &x, &y, &z) != 3)
          fatal("'%s':%d: malformed normal", filename.c_str(), lineNo);
        normals.push_back(Vector3d(x, y, z).normalized());
      } else if (!strcmp(key, "vt")) {
        double u, v = 0;
        if (sscanf(rest, "%lf %lf", &u, &v) < 1)
          fatal("'%s':%d: malformed uv", filename.c_str(), lineNo);
        uvs.push_back(Vector2d(u, v));
      } else if (!strcmp(key, "o") || !strcmp(key, "g")) {
        char name[256] = "unnamed";
        sscanf(rest, "%255s", name);
        if (geo.nodes.back().indices.empty())
          geo.nodes.back().name = name;
        else
          geo.nodes.push_back(MeshNode{name, {}, AABB()});
      } else if (!strcmp(key, "f")) {
        Array<uint32_t> face;
        char token[128];
        int n = 0;
        while (sscanf(rest, "%127s%n", token, &n) == 1) {
          rest += n;
          char parts[3][64] = {"", "", ""};
          int part = 0, len = 0;
          for (char *c = token; *c; ++c) {
            if (*c == '/') {
              if (++part > 2)
                break;
              len = 0;
            } else if (len < 63) {
              parts[part][len++] = *c;
              parts[part][len] = '\0';
            }
          }
          int pi = detail::objIndex(parts[0], positions.size());
          int ti = detail::objIndex(parts[1], uvs.size());
          int ni = detail::objIndex(parts[2], normals.size());
          if (pi < 0 || pi >= int(positions.size()) || ti >= int(uvs.size()) ||
              ni >= int(normals.size()))
            fatal("'%s':%d: face index out of range", filename.c_str(),
                  lineNo);

          auto key = std::make_tuple(pi, ti, ni);
          auto it = cache.find(key);
          if (it == cache.end()) {
            MeshVertex vtx;
            vtx.pos = positions[pi];
            if (ti >= 0)
              vtx.uv = uvs[ti];
            if (ni >= 0)
              vtx.normal = normals[ni];
            it = cache.emplace(key, uint32_t(geo.vertices.size())).first;
            geo.vertices.push_back(vtx);
            vertexPos.push_back(pi);
            hasNormal.push_back(ni >= 0);
          }
          face.push_back(it->second);
        }
        if (face.size() < 3)
          fatal("'%s':%d: face with fewer than 3 vertices", filename.c_str(),
                lineNo);
        auto &indices = geo.nodes.back().indices;
        for (size_t i = 1; i + 1 < face.size(); ++i) {
          indices.push_back(face[0]);
          indices.push_back(face[i]);
          indices.push_back(face[i + 1]);
        }
      }
    }

    // vertices without a normal get the average of the adjacent face normals
    Array<Vector3d> averaged(positions.size(), Vector3d(0, 0, 0));
    for (auto &node : geo.nodes) {
      for (size_t i = 0; i + 2 < node.indices.size(); i += 3) {
        auto &a = geo.vertices[node.indices[i]].pos;
        auto &b = geo.vertices[node.indices[i + 1]].pos;
        auto &c = geo.vertices[node.indices[i + 2]].pos;
        Vector3d n = (b - a).cross(c - a).normalized();
        for (int k = 0; k < 3; ++k)
          averaged[vertexPos[node.indices[i + k]]] += n;
      }
    }
    for (size_t i = 0; i < geo.vertices.size(); ++i)
      if (!hasNormal[i])
        geo.vertices[i].normal = averaged[vertexPos[i]].normalized();

    printf("> Import '%s' :: %zu Vertices, %zu Faces, %zu Nodes\n",
           filename.c_str(), geo.vertices.size(), geo.triangleCount(),
           geo.nodes.size());
    return geo;
  }

  // Vertices live in world space, so rays are never transformed. Nodes are
  // gated by their own box and scanned linearly. Triangles facing away from
  // the ray are culled, meshes are assumed consistently wound.
  class TriangleMesh : public Object {
    Array<MeshVertex> vertices;
    Array<MeshNode> nodes;
    AABB box;
    MaterialPtr mat;

    static AABB padded(const AABB &b) {
      Vector3d pad(0.0001, 0.0001, 0.0001);
      return AABB(b.min - pad, b.max + pad);
    }

    bool triangle(const uint32_t *idx, const Ray &r, double tMin, double tMax,
                  Hitrec &h) const {
      auto &v0 = vertices[idx[0]], &v1 = vertices[idx[1]],
           &v2 = vertices[idx[2]];
      Vector3d e1 = v1.pos - v0.pos;
      Vector3d e2 = v2.pos - v0.pos;
      Vector3d p = r.d.cross(e2);
      double det = p.dot(e1);
      if (det == 0)
        return false;

      double invDet = 1 / det;
      Vector3d s = r.o - v0.pos;
      double u = invDet * s.dot(p);
      if (u < 0 || u > 1)
        return false;

      Vector3d q = s.cross(e1);
      double v = invDet * r.d.dot(q);
      if (v < 0 || u + v > 1)
        return false;

      double t = invDet * e2.dot(q);
      if (t <= tMin || t > tMax)
        return false;

      double w = 1 - u - v;
      Vector3d normal =
          (w * v0.normal + u * v1.normal + v * v2.normal).normalized();
      if (r.d.dot(normal) > 0)
        return false;

      Vector2d uv = w * v0.uv + u * v1.uv + v * v2.uv;
      h.setHit(t, r.at(t), r, normal, uv.x(), uv.y(), mat.get());
      return true;
    }

  public:
    TriangleMesh(const MeshGeometry &geo, const Matrix4d &objToWorld,
                 MaterialPtr mat)
        : vertices(geo.vertices), mat(std::move(mat)) {
      if (objToWorld.determinant() == 0)
        fatal("Singular mesh transform");
      Matrix4d normalToWorld = objToWorld.inverse().transpose();

#pragma omp parallel for
      for (int i = 0; i < int(vertices.size()); ++i) {
        auto &vtx = vertices[i];
        vtx.pos = transPoint(objToWorld, vtx.pos);
        vtx.normal = transDir(normalToWorld, vtx.normal).normalized();
      }

      for (auto &vtx : vertices)
        box.fit(vtx.pos);
      box = padded(box);

      for (auto &node : geo.nodes) {
        if (node.indices.empty())
          continue;
        MeshNode n{node.name, node.indices, AABB()};
        for (auto i : n.indices)
          n.box.fit(vertices[i].pos);
        n.box = padded(n.box);
        nodes.push_back(std::move(n));
      }
    }

    size_t nodeCount() const { return nodes.size(); }

    bool intersect(const Ray &r, double tMin, double tMax, Hitrec &h,
                   RandEngine &) const override {
      if (nodes.empty() || !box.intersect(r, tMin, tMax))
        return false;

      bool hit = false;
      double closest = tMax;
      for (auto &node : nodes) {
        if (!node.box.intersect(r, tMin, closest))
          continue;
        for (size_t i = 0; i + 2 < node.indices.size(); i += 3) {
          if (triangle(&node.indices[i], r, tMin, closest, h)) {
            hit = true;
            closest = h.t;
          }
        }
      }
      return hit;
    }

    bool boundingBox(double, double, AABB &out) const override {
      if (nodes.empty())
        return false;
      out = box;
      return true;
    }
  };
} // namespace Lumen
