#pragma once

#include <LumenMath.hh>
#include <LumenTraceRecord.hh>
#include <memory>
#include <vector>

namespace Lumen {
  struct AABB {
    Vector3d min, max; // axis aligned bounding box

    // empty box, merging it with any box yields that box
    AABB() { reset(); }

    AABB(const Vector3d &min, const Vector3d &max) : min(min), max(max) {}

    void fit(const Vector3d &p) {
      min = boxMin(min, p);
      max = boxMax(max, p);
    }

    void reset() {
      min = Vector3d(INF, INF, INF);
      max = Vector3d(-INF, -INF, -INF);
    }

    bool empty() const {
      return min.x() > max.x() || min.y() > max.y() || min.z() > max.z();
    }

    Vector3d center() const { return 0.5 * (min + max); }

    AABB operator+(const AABB &b) const {
      return AABB(boxMin(min, b.min), boxMax(max, b.max));
    }

    AABB operator+(const Vector3d &offset) const {
      return AABB(min + offset, max + offset);
    }

    bool operator==(const AABB &b) const { return min == b.min && max == b.max; }

    // slab test, a zero direction component gives +-inf which the min/max
    // narrowing handles
    bool intersect(const Ray &r, double tMin, double tMax) const {
      for (int a = 0; a < 3; ++a) {
        double invD = r.id[a];
        double t0 = (min[a] - r.o[a]) * invD;
        double t1 = (max[a] - r.o[a]) * invD;
        if (t0 > t1)
          std::swap(t0, t1);
        tMin = t0 > tMin ? t0 : tMin;
        tMax = t1 < tMax ? t1 : tMax;
        if (tMax <= tMin)
          return false;
      }
      return true;
    }

    // conservative box of an affinely transformed box, one column of the
    // linear part per axis
    static AABB transform(const Matrix4d &m, const AABB &box) {
      Vector3d tMin(m(0, 3), m(1, 3), m(2, 3));
      Vector3d tMax = tMin;
      for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 3; ++j) {
          double a = m(i, j) * box.min[j];
          double b = m(i, j) * box.max[j];
          tMin[i] += std::min(a, b);
          tMax[i] += std::max(a, b);
        }
      }
      return AABB(tMin, tMax);
    }
  };

  inline AABB merge(const AABB &a, const AABB &b) { return a + b; }

  class Material;

  class Object {
  public:
    virtual bool intersect(const Ray &ray, double tMin, double tMax,
                           Hitrec &h, RandEngine &rand) const = 0;

    // false for unbounded objects
    virtual bool boundingBox(double time0, double time1, AABB &box) const = 0;

    // solid angle density of sampling this object from origin along v
    virtual double pdfValue(const Vector3d &origin, const Vector3d &v,
                            RandEngine &rand) const {
      return 0;
    }

    virtual Vector3d random(const Vector3d &origin, RandEngine &rand) const {
      return Vector3d(1, 0, 0);
    }

    virtual ~Object() {}
  };

  using ObjectPtr = std::shared_ptr<Object>;
  using MaterialPtr = std::shared_ptr<Material>;

  // nearest hit over a flat list; as a light list it samples its members
  // uniformly
  class ObjectList : public Object {
    Array<ObjectPtr> objects;

  public:
    ObjectList() {}

    ObjectList(Array<ObjectPtr> objs) : objects(std::move(objs)) {}

    void add(ObjectPtr obj) { objects.push_back(std::move(obj)); }

    void clear() { objects.clear(); }

    size_t size() const { return objects.size(); }
    bool empty() const { return objects.empty(); }

    const Array<ObjectPtr> &items() const { return objects; }
    Array<ObjectPtr> &items() { return objects; }

    bool intersect(const Ray &ray, double tMin, double tMax, Hitrec &h,
                   RandEngine &rand) const override {
      Hitrec tmp;
      bool hitAnything = false;
      double closest = tMax;
      for (auto &obj : objects) {
        if (obj->intersect(ray, tMin, closest, tmp, rand)) {
          hitAnything = true;
          closest = tmp.t;
          h = tmp;
        }
      }
      return hitAnything;
    }

    bool boundingBox(double time0, double time1, AABB &box) const override {
      if (objects.empty())
        return false;
      AABB out, tmp;
      for (auto &obj : objects) {
        if (!obj->boundingBox(time0, time1, tmp))
          return false;
        out = out + tmp;
      }
      box = out;
      return true;
    }

    double pdfValue(const Vector3d &origin, const Vector3d &v,
                    RandEngine &rand) const override {
      if (objects.empty())
        return 0;
      double weight = 1.0 / objects.size(), sum = 0;
      for (auto &obj : objects)
        sum += weight * obj->pdfValue(origin, v, rand);
      return sum;
    }

    Vector3d random(const Vector3d &origin, RandEngine &rand) const override {
      if (objects.empty())
        return Vector3d(1, 0, 0);
      auto i = rand.uniformInt(0, int(objects.size()) - 1);
      return objects[i]->random(origin, rand);
    }
  };
} // namespace Lumen
