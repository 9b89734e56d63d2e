#pragma once

#include <LumenMath.hh>

namespace Lumen {
  class Material;

  struct Ray {
    Vector3d o, d, id;
    double tm = 0;

    Ray() {}

    // the direction is kept as given, t is measured in units of |d|
    Ray(const Vector3d &org, const Vector3d &dir, double time = 0)
        : o(org), d(dir), tm(time) {
      id = invert(d);
    }

    Vector3d at(double t) const { return o + t * d; }
  };

  struct Hitrec {
    Vector3d p, norm;
    double t = 0;
    double u = 0, v = 0;
    bool frontFace = false;
    const Material *mat = nullptr;

    // orients the normal against the incoming ray
    void setFaceNormal(const Ray &r, const Vector3d &outwardNormal) {
      frontFace = r.d.dot(outwardNormal) < 0;
      norm = frontFace ? outwardNormal : Vector3d(-outwardNormal);
    }

    void setHit(double t, const Vector3d &p, const Ray &r,
                const Vector3d &outwardNormal, double u, double v,
                const Material *mat) {
      this->t = t;
      this->p = p;
      this->u = u;
      this->v = v;
      this->mat = mat;
      setFaceNormal(r, outwardNormal);
    }
  };
} // namespace Lumen
