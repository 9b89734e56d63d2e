#pragma once

#include <LumenObject.hh>

namespace Lumen {
  class Translate : public Object {
    ObjectPtr base;
    Vector3d offset;

  public:
    Translate(ObjectPtr base, const Vector3d &offset)
        : base(std::move(base)), offset(offset) {}

    bool intersect(const Ray &r, double tMin, double tMax, Hitrec &h,
                   RandEngine &rand) const override {
      Ray moved(r.o - offset, r.d, r.tm);
      Hitrec tmp;
      if (!base->intersect(moved, tMin, tMax, tmp, rand))
        return false;
      tmp.p += offset;
      tmp.setFaceNormal(moved, tmp.frontFace ? tmp.norm : Vector3d(-tmp.norm));
      h = tmp;
      return true;
    }

    bool boundingBox(double time0, double time1, AABB &box) const override {
      if (!base->boundingBox(time0, time1, box))
        return false;
      box = box + offset;
      return true;
    }

    double pdfValue(const Vector3d &o, const Vector3d &v,
                    RandEngine &rand) const override {
      return base->pdfValue(o - offset, v, rand);
    }

    Vector3d random(const Vector3d &o, RandEngine &rand) const override {
      return base->random(o - offset, rand);
    }
  };

  // rotation around +y by an angle in degrees
  class RotateY : public Object {
    ObjectPtr base;
    double sinTheta, cosTheta;
    AABB box;

    // world to object
    Vector3d toLocal(const Vector3d &v) const {
      return Vector3d(cosTheta * v.x() - sinTheta * v.z(), v.y(),
                      sinTheta * v.x() + cosTheta * v.z());
    }

    Vector3d toWorld(const Vector3d &v) const {
      return Vector3d(cosTheta * v.x() + sinTheta * v.z(), v.y(),
                      -sinTheta * v.x() + cosTheta * v.z());
    }

  public:
    RotateY(ObjectPtr base, double angle) : base(std::move(base)) {
      double radians = degToRad(angle);
      sinTheta = sin(radians);
      cosTheta = cos(radians);

      AABB inner;
      if (!this->base->boundingBox(0, 1, inner))
        fatal("No bounding box in RotateY constructor");

      // extent of the eight rotated corners
      for (int i = 0; i < 2; i++)
        for (int j = 0; j < 2; j++)
          for (int k = 0; k < 2; k++) {
            Vector3d corner(i ? inner.max.x() : inner.min.x(),
                            j ? inner.max.y() : inner.min.y(),
                            k ? inner.max.z() : inner.min.z());
            box.fit(toWorld(corner));
          }
    }

    bool intersect(const Ray &r, double tMin, double tMax, Hitrec &h,
                   RandEngine &rand) const override {
      Ray rotated(toLocal(r.o), toLocal(r.d), r.tm);
      Hitrec tmp;
      if (!base->intersect(rotated, tMin, tMax, tmp, rand))
        return false;
      Vector3d outward = toWorld(tmp.frontFace ? tmp.norm : Vector3d(-tmp.norm));
      tmp.p = toWorld(tmp.p);
      tmp.setFaceNormal(r, outward);
      h = tmp;
      return true;
    }

    bool boundingBox(double, double, AABB &out) const override {
      out = box;
      return true;
    }

    double pdfValue(const Vector3d &o, const Vector3d &v,
                    RandEngine &rand) const override {
      return base->pdfValue(toLocal(o), toLocal(v), rand);
    }

    Vector3d random(const Vector3d &o, RandEngine &rand) const override {
      return toWorld(base->random(toLocal(o), rand));
    }
  };

  // general affine placement; the direction is transformed unnormalized so
  // t is the same in both spaces
  class Transform : public Object {
    ObjectPtr base;
    Matrix4d objToWorld, worldToObj, normalToWorld;

  public:
    Transform(ObjectPtr base, const Matrix4d &objToWorld)
        : base(std::move(base)), objToWorld(objToWorld) {
      if (objToWorld.determinant() == 0)
        fatal("Non invertible matrix in Transform constructor");
      worldToObj = objToWorld.inverse();
      normalToWorld = worldToObj.transpose();
    }

    Transform(ObjectPtr base, const Affine3d &objToWorld)
        : Transform(std::move(base), Matrix4d(objToWorld.matrix())) {}

    const Matrix4d &matrix() const { return objToWorld; }

    bool intersect(const Ray &r, double tMin, double tMax, Hitrec &h,
                   RandEngine &rand) const override {
      Ray local(transPoint(worldToObj, r.o), transDir(worldToObj, r.d), r.tm);
      Hitrec tmp;
      if (!base->intersect(local, tMin, tMax, tmp, rand))
        return false;
      Vector3d outward =
          transDir(normalToWorld, tmp.frontFace ? tmp.norm : Vector3d(-tmp.norm))
              .normalized();
      tmp.p = transPoint(objToWorld, tmp.p);
      tmp.setFaceNormal(r, outward);
      h = tmp;
      return true;
    }

    bool boundingBox(double time0, double time1, AABB &box) const override {
      if (!base->boundingBox(time0, time1, box))
        return false;
      box = AABB::transform(objToWorld, box);
      return true;
    }

    // exact for rigid motions only, the solid angle is not rescaled
    double pdfValue(const Vector3d &o, const Vector3d &v,
                    RandEngine &rand) const override {
      return base->pdfValue(transPoint(worldToObj, o), transDir(worldToObj, v),
                            rand);
    }

    Vector3d random(const Vector3d &o, RandEngine &rand) const override {
      return transDir(objToWorld,
                      base->random(transPoint(worldToObj, o), rand));
    }
  };

  // emits from the back of one sided lights
  class FlipFace : public Object {
    ObjectPtr base;

  public:
    explicit FlipFace(ObjectPtr base) : base(std::move(base)) {}

    bool intersect(const Ray &r, double tMin, double tMax, Hitrec &h,
                   RandEngine &rand) const override {
      if (!base->intersect(r, tMin, tMax, h, rand))
        return false;
      h.frontFace = !h.frontFace;
      return true;
    }

    bool boundingBox(double time0, double time1, AABB &box) const override {
      return base->boundingBox(time0, time1, box);
    }

    double pdfValue(const Vector3d &o, const Vector3d &v,
                    RandEngine &rand) const override {
      return base->pdfValue(o, v, rand);
    }

    Vector3d random(const Vector3d &o, RandEngine &rand) const override {
      return base->random(o, rand);
    }
  };
} // namespace Lumen
