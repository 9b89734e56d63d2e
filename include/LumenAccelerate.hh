#pragma once

#include <LumenObject.hh>
#include <vector>

namespace Lumen {
  class BVHNode : public Object {
    ObjectPtr left, right;
    AABB box;

    static AABB boxOf(const ObjectPtr &obj, double time0, double time1) {
      AABB b;
      if (!obj->boundingBox(time0, time1, b))
        fatal("No bounding box in BVHNode constructor");
      return b;
    }

    // objs[begin, end) is reordered in place
    void build(Array<ObjectPtr> &objs, size_t begin, size_t end, double time0,
               double time1, RandEngine &rand) {
      int axis = rand.uniformInt(0, 2);
      auto comparator = [axis, time0, time1](const ObjectPtr &a,
                                             const ObjectPtr &b) {
        return boxOf(a, time0, time1).min[axis] <
               boxOf(b, time0, time1).min[axis];
      };

      size_t n = end - begin;
      if (n == 1) {
        left = right = objs[begin];
      } else if (n == 2) {
        if (comparator(objs[begin], objs[begin + 1])) {
          left = objs[begin];
          right = objs[begin + 1];
        } else {
          left = objs[begin + 1];
          right = objs[begin];
        }
      } else {
        std::sort(objs.begin() + begin, objs.begin() + end, comparator);
        size_t mid = begin + n / 2;
        left = std::make_shared<BVHNode>(objs, begin, mid, time0, time1, rand);
        right = std::make_shared<BVHNode>(objs, mid, end, time0, time1, rand);
      }

      box = boxOf(left, time0, time1) + boxOf(right, time0, time1);
    }

  public:
    BVHNode(Array<ObjectPtr> &objs, size_t begin, size_t end, double time0,
            double time1, RandEngine &rand) {
      if (begin >= end)
        fatal("Empty object range in BVHNode constructor");
      build(objs, begin, end, time0, time1, rand);
    }

    BVHNode(Array<ObjectPtr> objs, double time0, double time1,
            RandEngine &rand)
        : BVHNode(objs, 0, objs.size(), time0, time1, rand) {}

    bool intersect(const Ray &ray, double tMin, double tMax, Hitrec &h,
                   RandEngine &rand) const override {
      if (!box.intersect(ray, tMin, tMax))
        return false;

      bool hitLeft = left->intersect(ray, tMin, tMax, h, rand);
      if (left == right)
        return hitLeft;
      bool hitRight =
          right->intersect(ray, tMin, hitLeft ? h.t : tMax, h, rand);
      return hitLeft || hitRight;
    }

    bool boundingBox(double, double, AABB &out) const override {
      out = box;
      return true;
    }
  };
} // namespace Lumen
