#pragma once

#include <LumenMaterial.hh>
#include <LumenObject.hh>

namespace Lumen {
  // homogeneous fog inside a convex boundary
  class ConstantMedium : public Object {
    ObjectPtr boundary;
    double negInvDensity;
    MaterialPtr phase;

  public:
    ConstantMedium(ObjectPtr boundary, double density, TexturePtr albedo)
        : boundary(std::move(boundary)), negInvDensity(-1 / density),
          phase(std::make_shared<Isotropic>(std::move(albedo))) {}

    ConstantMedium(ObjectPtr boundary, double density, const Color &albedo)
        : boundary(std::move(boundary)), negInvDensity(-1 / density),
          phase(std::make_shared<Isotropic>(albedo)) {}

    bool intersect(const Ray &r, double tMin, double tMax, Hitrec &h,
                   RandEngine &rand) const override {
      Hitrec rec1, rec2;
      if (!boundary->intersect(r, -INF, INF, rec1, rand))
        return false;
      if (!boundary->intersect(r, rec1.t + 0.0001, INF, rec2, rand))
        return false;

      double t1 = max(rec1.t, tMin);
      double t2 = min(rec2.t, tMax);
      if (t1 >= t2)
        return false;
      t1 = max(t1, 0.0);

      double rayLength = r.d.norm();
      double distInside = (t2 - t1) * rayLength;
      // 1 - xi keeps the log argument in (0, 1]
      double hitDistance = negInvDensity * log(1 - rand());
      if (hitDistance > distInside)
        return false;

      h.t = t1 + hitDistance / rayLength;
      h.p = r.at(h.t);
      h.norm = Vector3d(1, 0, 0); // arbitrary
      h.frontFace = true;
      h.u = h.v = 0;
      h.mat = phase.get();
      return true;
    }

    bool boundingBox(double time0, double time1, AABB &box) const override {
      return boundary->boundingBox(time0, time1, box);
    }
  };
} // namespace Lumen
