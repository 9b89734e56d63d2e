#pragma once

#include <LumenObject.hh>

namespace Lumen {
  // surfaces of revolution around +z, clipped to [zMin, zMax] and to the
  // sweep angle phiMax. Place them in the scene with a Transform.
  class Quadric : public Object {
  protected:
    double zMin, zMax, phiMax;
    MaterialPtr mat;

    // a*t^2 + b*t + c of the implicit surface along the ray
    virtual void coefficients(const Ray &r, double &a, double &b,
                              double &c) const = 0;

    // v coordinate and the surface partials at p
    virtual void partials(const Vector3d &p, double phi, double &v,
                          Vector3d &dpdu, Vector3d &dpdv) const = 0;

    virtual double phiAt(const Vector3d &p) const {
      double phi = atan2(p.y(), p.x());
      return phi < 0 ? phi + 2 * PI : phi;
    }

    bool clipped(const Vector3d &p, double phi) const {
      return p.z() < zMin || p.z() > zMax || phi > phiMax;
    }

  public:
    Quadric(double z0, double z1, double phiMax, MaterialPtr mat)
        : zMin(min(z0, z1)), zMax(max(z0, z1)),
          phiMax(std::clamp(phiMax, 0.0, 2 * PI)), mat(std::move(mat)) {}

    bool intersect(const Ray &r, double tMin, double tMax, Hitrec &h,
                   RandEngine &) const override {
      double a, b, c, roots[2];
      coefficients(r, a, b, c);
      if (polyQuadratic(a, b, c, roots) == 0)
        return false;

      double t0 = roots[0], t1 = roots[1];
      if (t0 > tMax || t1 <= tMin)
        return false;
      double tHit = t0 <= tMin ? t1 : t0;
      if (tHit > tMax)
        return false;

      Vector3d p = r.at(tHit);
      double phi = phiAt(p);
      if (clipped(p, phi)) {
        // the near root is cut away, the far one may still be on the surface
        if (tHit == t1)
          return false;
        tHit = t1;
        if (tHit > tMax)
          return false;
        p = r.at(tHit);
        phi = phiAt(p);
        if (clipped(p, phi))
          return false;
      }

      double v;
      Vector3d dpdu, dpdv;
      partials(p, phi, v, dpdu, dpdv);
      h.setHit(tHit, p, r, dpdu.cross(dpdv).normalized(), phi / phiMax, v,
               mat.get());
      return true;
    }
  };

  // apex at (0, 0, height), base circle of the given radius at z = 0
  class Cone : public Quadric {
    double radius, height;

  protected:
    void coefficients(const Ray &r, double &a, double &b,
                      double &c) const override {
      double k = radius / height;
      k = k * k;
      const Vector3d &o = r.o, &d = r.d;
      double oz = o.z() - height;
      a = d.x() * d.x() + d.y() * d.y() - k * d.z() * d.z();
      b = 2 * (d.x() * o.x() + d.y() * o.y() - k * d.z() * oz);
      c = o.x() * o.x() + o.y() * o.y() - k * oz * oz;
    }

    void partials(const Vector3d &p, double, double &v, Vector3d &dpdu,
                  Vector3d &dpdv) const override {
      v = p.z() / height;
      dpdu = Vector3d(-phiMax * p.y(), phiMax * p.x(), 0);
      // scaled by (1 - v) so the apex does not divide by zero
      dpdv = Vector3d(-p.x(), -p.y(), height * (1 - v));
    }

  public:
    Cone(double radius, double height, double phiMax, MaterialPtr mat)
        : Quadric(0, height, phiMax, std::move(mat)), radius(radius),
          height(height) {}

    bool boundingBox(double, double, AABB &box) const override {
      box = AABB(Vector3d(-radius, -radius, 0),
                 Vector3d(radius, radius, height));
      return true;
    }
  };

  class Cylinder : public Quadric {
    double radius;

  protected:
    void coefficients(const Ray &r, double &a, double &b,
                      double &c) const override {
      const Vector3d &o = r.o, &d = r.d;
      a = d.x() * d.x() + d.y() * d.y();
      b = 2 * (d.x() * o.x() + d.y() * o.y());
      c = o.x() * o.x() + o.y() * o.y() - radius * radius;
    }

    void partials(const Vector3d &p, double, double &v, Vector3d &dpdu,
                  Vector3d &dpdv) const override {
      v = (p.z() - zMin) / (zMax - zMin);
      dpdu = Vector3d(-phiMax * p.y(), phiMax * p.x(), 0);
      dpdv = Vector3d(0, 0, zMax - zMin);
    }

  public:
    Cylinder(double radius, double z0, double z1, double phiMax,
             MaterialPtr mat)
        : Quadric(z0, z1, phiMax, std::move(mat)), radius(radius) {}

    double area() const { return (zMax - zMin) * radius * phiMax; }

    bool boundingBox(double, double, AABB &box) const override {
      box = AABB(Vector3d(-radius, -radius, zMin),
                 Vector3d(radius, radius, zMax));
      return true;
    }

    double pdfValue(const Vector3d &o, const Vector3d &v,
                    RandEngine &rand) const override {
      Hitrec h;
      if (!intersect(Ray(o, v), 0.0001, INF, h, rand))
        return 0;
      double distSquared = h.t * h.t * v.squaredNorm();
      double cosine = fabs(v.dot(h.norm) / v.norm());
      if (cosine == 0)
        return 0;
      return distSquared / (cosine * area());
    }

    Vector3d random(const Vector3d &o, RandEngine &rand) const override {
      double phi = rand(0, phiMax);
      Vector3d pt(radius * cos(phi), radius * sin(phi), rand(zMin, zMax));
      return pt - o;
    }
  };

  // one sheet hyperboloid swept by the segment p1-p2 around z
  class Hyperboloid : public Quadric {
    Vector3d p1, p2;
    double rMax, ah, ch;

  protected:
    void coefficients(const Ray &r, double &a, double &b,
                      double &c) const override {
      const Vector3d &o = r.o, &d = r.d;
      a = ah * d.x() * d.x() + ah * d.y() * d.y() - ch * d.z() * d.z();
      b = 2 * (ah * d.x() * o.x() + ah * d.y() * o.y() - ch * d.z() * o.z());
      c = ah * o.x() * o.x() + ah * o.y() * o.y() - ch * o.z() * o.z() - 1;
    }

    // phi measured from the point of the generating line at height p.z
    double phiAt(const Vector3d &p) const override {
      double v = (p.z() - p1.z()) / (p2.z() - p1.z());
      Vector3d pr = (1 - v) * p1 + v * p2;
      double phi = atan2(pr.x() * p.y() - p.x() * pr.y(),
                         p.x() * pr.x() + p.y() * pr.y());
      return phi < 0 ? phi + 2 * PI : phi;
    }

    void partials(const Vector3d &p, double phi, double &v, Vector3d &dpdu,
                  Vector3d &dpdv) const override {
      v = (p.z() - p1.z()) / (p2.z() - p1.z());
      double sinPhi = sin(phi), cosPhi = cos(phi);
      dpdu = Vector3d(-phiMax * p.y(), phiMax * p.x(), 0);
      dpdv = Vector3d((p2.x() - p1.x()) * cosPhi - (p2.y() - p1.y()) * sinPhi,
                      (p2.x() - p1.x()) * sinPhi + (p2.y() - p1.y()) * cosPhi,
                      p2.z() - p1.z());
    }

  public:
    Hyperboloid(const Vector3d &point1, const Vector3d &point2, double phiMax,
                MaterialPtr mat)
        : Quadric(point1.z(), point2.z(), phiMax, std::move(mat)),
          p1(point1), p2(point2) {
      if (p1.z() == p2.z())
        fatal("Hyperboloid with a horizontal generating line");

      double radius1 = sqrt(p1.x() * p1.x() + p1.y() * p1.y());
      double radius2 = sqrt(p2.x() * p2.x() + p2.y() * p2.y());
      rMax = max(radius1, radius2);

      if (p2.z() == 0)
        std::swap(p1, p2);

      // walk along the line until the implicit coefficients are defined
      Vector3d pp = p1;
      int steps = 0;
      do {
        if (++steps > 64)
          fatal("Cannot fit a hyperboloid through the given points");
        pp += 2 * (p2 - p1);
        double xy1 = pp.x() * pp.x() + pp.y() * pp.y();
        double xy2 = p2.x() * p2.x() + p2.y() * p2.y();
        ah = (1 / xy1 - (pp.z() * pp.z()) / (xy1 * p2.z() * p2.z())) /
             (1 - (xy2 * pp.z() * pp.z()) / (xy1 * p2.z() * p2.z()));
        ch = (ah * xy2 - 1) / (p2.z() * p2.z());
      } while (!std::isfinite(ah));
    }

    bool boundingBox(double, double, AABB &box) const override {
      box = AABB(Vector3d(-rMax, -rMax, zMin), Vector3d(rMax, rMax, zMax));
      return true;
    }
  };

  // z = zMax * (x^2 + y^2) / radius^2, clipped to [zMin, zMax]
  class Paraboloid : public Quadric {
    double radius;

  protected:
    void coefficients(const Ray &r, double &a, double &b,
                      double &c) const override {
      const Vector3d &o = r.o, &d = r.d;
      double k = zMax / (radius * radius);
      a = k * (d.x() * d.x() + d.y() * d.y());
      b = 2 * k * (d.x() * o.x() + d.y() * o.y()) - d.z();
      c = k * (o.x() * o.x() + o.y() * o.y()) - o.z();
    }

    void partials(const Vector3d &p, double, double &v, Vector3d &dpdu,
                  Vector3d &dpdv) const override {
      v = (p.z() - zMin) / (zMax - zMin);
      dpdu = Vector3d(-phiMax * p.y(), phiMax * p.x(), 0);
      // scaled by 2z, the vertex would otherwise divide by zero
      dpdv = (zMax - zMin) * Vector3d(p.x(), p.y(), 2 * p.z());
    }

  public:
    Paraboloid(double radius, double z0, double z1, double phiMax,
               MaterialPtr mat)
        : Quadric(z0, z1, phiMax, std::move(mat)), radius(radius) {}

    bool boundingBox(double, double, AABB &box) const override {
      box = AABB(Vector3d(-radius, -radius, zMin),
                 Vector3d(radius, radius, zMax));
      return true;
    }
  };
} // namespace Lumen
