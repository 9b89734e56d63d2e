#pragma once

#include <LumenObject.hh>
#include <LumenTransform.hh>

namespace Lumen {
  class Sphere : public Object {
  protected:
    double rad;
    Vector3d p;
    MaterialPtr mat;

    // u: angle around y from x = -1, v: angle from y = -1 to y = +1
    static void getUV(const Vector3d &n, double &u, double &v) {
      double theta = acos(std::clamp(-n.y(), -1.0, 1.0));
      double phi = atan2(-n.z(), n.x()) + PI;
      u = phi / (2 * PI);
      v = theta / PI;
    }

    bool hitAt(const Vector3d &center, const Ray &r, double tMin, double tMax,
               Hitrec &h) const {
      Vector3d oc = r.o - center;
      double a = r.d.squaredNorm();
      double halfB = oc.dot(r.d);
      double c = oc.squaredNorm() - rad * rad;
      double det = halfB * halfB - a * c;
      if (det < 0 || a == 0)
        return false;
      det = sqrt(det);

      double t = (-halfB - det) / a;
      if (t <= tMin || t > tMax) {
        t = (-halfB + det) / a;
        if (t <= tMin || t > tMax)
          return false;
      }
      Vector3d pos = r.at(t);
      Vector3d outward = (pos - center) / rad;
      double u, v;
      getUV(outward, u, v);
      h.setHit(t, pos, r, outward, u, v, mat.get());
      return true;
    }

  public:
    Sphere(const Vector3d &p, double rad, MaterialPtr mat)
        : rad(rad), p(p), mat(std::move(mat)) {}

    const Vector3d &center() const { return p; }
    double radius() const { return rad; }

    bool intersect(const Ray &r, double tMin, double tMax, Hitrec &h,
                   RandEngine &) const override {
      return hitAt(p, r, tMin, tMax, h);
    }

    bool boundingBox(double, double, AABB &box) const override {
      Vector3d rr(rad, rad, rad);
      box = AABB(p - rr, p + rr);
      return true;
    }

    // uniform over the cone of directions subtended by the sphere
    double pdfValue(const Vector3d &o, const Vector3d &v,
                    RandEngine &rand) const override {
      Hitrec h;
      if (!intersect(Ray(o, v), 0.001, INF, h, rand))
        return 0;
      // seen from inside, every direction hits the sphere
      double distSquared = (p - o).squaredNorm();
      if (distSquared <= rad * rad)
        return 1 / (4 * PI);
      double cosThetaMax = sqrt(1 - rad * rad / distSquared);
      double solidAngle = 2 * PI * (1 - cosThetaMax);
      return 1 / solidAngle;
    }

    Vector3d random(const Vector3d &o, RandEngine &rand) const override {
      Vector3d direction = p - o;
      if (direction.squaredNorm() <= rad * rad)
        return unitVectorRandom(rand);
      Onb uvw(direction);
      return uvw.local(toSphereRandom(rad, direction.squaredNorm(), rand));
    }
  };

  // sphere whose center moves linearly from c0 at time0 to c1 at time1
  class MovingSphere : public Sphere {
    Vector3d c1;
    double time0, time1;

  public:
    MovingSphere(const Vector3d &c0, const Vector3d &c1, double time0,
                 double time1, double rad, MaterialPtr mat)
        : Sphere(c0, rad, std::move(mat)), c1(c1), time0(time0),
          time1(time1) {}

    Vector3d centerAt(double time) const {
      if (time1 == time0)
        return p;
      return p + ((time - time0) / (time1 - time0)) * (c1 - p);
    }

    bool intersect(const Ray &r, double tMin, double tMax, Hitrec &h,
                   RandEngine &) const override {
      return hitAt(centerAt(r.tm), r, tMin, tMax, h);
    }

    bool boundingBox(double t0, double t1, AABB &box) const override {
      Vector3d rr(rad, rad, rad);
      Vector3d a = centerAt(t0), b = centerAt(t1);
      box = AABB(a - rr, a + rr) + AABB(b - rr, b + rr);
      return true;
    }

    double pdfValue(const Vector3d &, const Vector3d &,
                    RandEngine &) const override {
      return 0;
    }

    Vector3d random(const Vector3d &, RandEngine &) const override {
      return Vector3d(1, 0, 0);
    }
  };

  // rectangle [a0,a1]x[b0,b1] in the plane axis K == k, A and B are the two
  // other axes
  template <int A, int B, int K> class AxisRect : public Object {
    double a0, a1, b0, b1, k;
    MaterialPtr mat;

  public:
    AxisRect(double a0, double a1, double b0, double b1, double k,
             MaterialPtr mat)
        : a0(a0), a1(a1), b0(b0), b1(b1), k(k), mat(std::move(mat)) {}

    double area() const { return (a1 - a0) * (b1 - b0); }

    bool intersect(const Ray &r, double tMin, double tMax, Hitrec &h,
                   RandEngine &) const override {
      if (r.d[K] == 0)
        return false;
      double t = (k - r.o[K]) / r.d[K];
      if (!(t > tMin && t <= tMax))
        return false;
      double a = r.o[A] + t * r.d[A];
      double b = r.o[B] + t * r.d[B];
      if (a < a0 || a > a1 || b < b0 || b > b1)
        return false;
      Vector3d outward(0, 0, 0);
      outward[K] = 1;
      h.setHit(t, r.at(t), r, outward, (a - a0) / (a1 - a0),
               (b - b0) / (b1 - b0), mat.get());
      return true;
    }

    // padded on the flat axis so the box is never degenerate
    bool boundingBox(double, double, AABB &box) const override {
      Vector3d lo, hi;
      lo[A] = a0, lo[B] = b0, lo[K] = k - 0.0001;
      hi[A] = a1, hi[B] = b1, hi[K] = k + 0.0001;
      box = AABB(lo, hi);
      return true;
    }

    double pdfValue(const Vector3d &o, const Vector3d &v,
                    RandEngine &rand) const override {
      Hitrec h;
      if (!intersect(Ray(o, v), 0.001, INF, h, rand))
        return 0;
      double distSquared = h.t * h.t * v.squaredNorm();
      double cosine = fabs(v.dot(h.norm) / v.norm());
      return distSquared / (cosine * area());
    }

    Vector3d random(const Vector3d &o, RandEngine &rand) const override {
      Vector3d pt;
      pt[A] = rand(a0, a1);
      pt[B] = rand(b0, b1);
      pt[K] = k;
      return pt - o;
    }
  };

  using XYRect = AxisRect<0, 1, 2>;
  using XZRect = AxisRect<0, 2, 1>;
  using YZRect = AxisRect<1, 2, 0>;

  // axis aligned box made of six rectangles
  class Box : public Object {
    Vector3d bmin, bmax;
    ObjectList sides;

  public:
    Box(const Vector3d &p0, const Vector3d &p1, const MaterialPtr &mat)
        : bmin(p0), bmax(p1) {
      // rectangles face +axis, the lower sides are flipped to face out
      sides.add(std::make_shared<XYRect>(p0.x(), p1.x(), p0.y(), p1.y(),
                                         p1.z(), mat));
      sides.add(std::make_shared<FlipFace>(std::make_shared<XYRect>(
          p0.x(), p1.x(), p0.y(), p1.y(), p0.z(), mat)));
      sides.add(std::make_shared<XZRect>(p0.x(), p1.x(), p0.z(), p1.z(),
                                         p1.y(), mat));
      sides.add(std::make_shared<FlipFace>(std::make_shared<XZRect>(
          p0.x(), p1.x(), p0.z(), p1.z(), p0.y(), mat)));
      sides.add(std::make_shared<YZRect>(p0.y(), p1.y(), p0.z(), p1.z(),
                                         p1.x(), mat));
      sides.add(std::make_shared<FlipFace>(std::make_shared<YZRect>(
          p0.y(), p1.y(), p0.z(), p1.z(), p0.x(), mat)));
    }

    bool intersect(const Ray &r, double tMin, double tMax, Hitrec &h,
                   RandEngine &rand) const override {
      return sides.intersect(r, tMin, tMax, h, rand);
    }

    bool boundingBox(double, double, AABB &box) const override {
      box = AABB(bmin, bmax);
      return true;
    }
  };

  class Triangle : public Object {
    Vector3d vertices[3];
    Vector3d norm[3];
    MaterialPtr mat;

  public:
    Triangle(const Vector3d &a, const Vector3d &b, const Vector3d &c,
             MaterialPtr mat)
        : vertices{a, b, c}, mat(std::move(mat)) {
      Vector3d n = (b - a).cross(c - a).normalized();
      norm[0] = norm[1] = norm[2] = n;
    }

    Triangle(const Vector3d &a, const Vector3d &b, const Vector3d &c,
             const Vector3d &n1, const Vector3d &n2, const Vector3d &n3,
             MaterialPtr mat)
        : vertices{a, b, c}, norm{n1, n2, n3}, mat(std::move(mat)) {}

    double area() const {
      return 0.5 * (vertices[1] - vertices[0])
                       .cross(vertices[2] - vertices[0])
                       .norm();
    }

    // double sided, normal interpolated from the vertex normals
    bool intersect(const Ray &r, double tMin, double tMax, Hitrec &h,
                   RandEngine &) const override {
      const Vector3d &v0 = vertices[0], &v1 = vertices[1], &v2 = vertices[2];
      Vector3d e1 = v1 - v0, e2 = v2 - v0;
      Vector3d p = r.d.cross(e2);
      double det = e1.dot(p);
      if (fabs(det) < 1e-12)
        return false;
      double invDet = 1 / det;
      Vector3d s = r.o - v0;
      double u = s.dot(p) * invDet;
      if (u < 0 || u > 1)
        return false;
      Vector3d q = s.cross(e1);
      double v = r.d.dot(q) * invDet;
      if (v < 0 || u + v > 1)
        return false;
      double t = e2.dot(q) * invDet;
      if (!(t > tMin && t <= tMax))
        return false;
      double w = 1 - u - v;
      Vector3d n = (w * norm[0] + u * norm[1] + v * norm[2]).normalized();
      h.setHit(t, r.at(t), r, n, u, v, mat.get());
      return true;
    }

    bool boundingBox(double, double, AABB &box) const override {
      AABB b;
      for (auto &v : vertices)
        b.fit(v);
      // flat triangles still need a volume
      Vector3d pad(0.0001, 0.0001, 0.0001);
      box = AABB(b.min - pad, b.max + pad);
      return true;
    }

    double pdfValue(const Vector3d &o, const Vector3d &v,
                    RandEngine &rand) const override {
      Hitrec h;
      if (!intersect(Ray(o, v), 0.001, INF, h, rand))
        return 0;
      double distSquared = h.t * h.t * v.squaredNorm();
      double cosine = fabs(v.dot(h.norm) / v.norm());
      return distSquared / (cosine * area());
    }

    Vector3d random(const Vector3d &o, RandEngine &rand) const override {
      double a = rand(), b = rand();
      if (a + b > 1)
        a = 1 - a, b = 1 - b;
      Vector3d pt = vertices[0] + a * (vertices[1] - vertices[0]) +
                    b * (vertices[2] - vertices[0]);
      return pt - o;
    }
  };

  class Disk : public Object {
    Vector3d origin, normal;
    double radius;
    MaterialPtr mat;

  public:
    Disk(const Vector3d &origin, const Vector3d &normal, double radius,
         MaterialPtr mat)
        : origin(origin), normal(normal.normalized()), radius(radius),
          mat(std::move(mat)) {}

    bool intersect(const Ray &r, double tMin, double tMax, Hitrec &h,
                   RandEngine &) const override {
      double dn = normal.dot(r.d);
      if (fabs(dn) < 1e-5)
        return false;
      double t = (origin - r.o).dot(normal) / dn;
      if (!(t > tMin && t <= tMax))
        return false;
      Vector3d pos = r.at(t);
      Vector3d local = pos - origin;
      if (local.squaredNorm() > radius * radius)
        return false;
      Onb uvw(normal);
      double u = 0.5 + 0.5 * local.dot(uvw.u) / radius;
      double v = 0.5 + 0.5 * local.dot(uvw.v) / radius;
      h.setHit(t, pos, r, normal, u, v, mat.get());
      return true;
    }

    bool boundingBox(double, double, AABB &box) const override {
      Vector3d ext;
      for (int i = 0; i < 3; ++i)
        ext[i] = radius * sqrt(max(0.0, 1 - normal[i] * normal[i])) + 0.0001;
      box = AABB(origin - ext, origin + ext);
      return true;
    }
  };

  // infinite plane, it has no bounding box and cannot go into a BVH
  class Plane : public Object {
    Vector3d normal;
    double d;
    MaterialPtr mat;

  public:
    Plane(const Vector3d &origin, const Vector3d &normal, MaterialPtr mat)
        : normal(normal.normalized()), d(this->normal.dot(origin)),
          mat(std::move(mat)) {}

    bool intersect(const Ray &r, double tMin, double tMax, Hitrec &h,
                   RandEngine &) const override {
      double bn = r.d.dot(normal);
      if (fabs(bn) < 1e-5)
        return false;
      double t = (d - r.o.dot(normal)) / bn;
      if (!(t > tMin && t <= tMax))
        return false;
      Vector3d pos = r.at(t);
      h.setHit(t, pos, r, normal, pos.x() - floor(pos.x()),
               pos.z() - floor(pos.z()), mat.get());
      return true;
    }

    bool boundingBox(double, double, AABB &) const override { return false; }
  };
} // namespace Lumen
