#pragma once

#include <LumenPdf.hh>
#include <LumenTexture.hh>
#include <variant>

namespace Lumen {
  // a single certain outgoing ray, no pdf mixing
  struct SpecularScatter {
    Ray ray;
    Color attenuation;
  };

  // the integrator draws the direction from the pdf, mixed with light
  // sampling
  struct PdfScatter {
    Color attenuation;
    PdfPtr pdf;
  };

  using ScatterRecord = std::variant<SpecularScatter, PdfScatter>;

  // Materials hold no mutable state and are shared by all workers.
  class Material {
  public:
    // false when the ray is absorbed
    virtual bool scatter(const Ray &rIn, const Hitrec &h, ScatterRecord &srec,
                         RandEngine &rand) const {
      return false;
    }

    virtual double scatteringPdf(const Ray &rIn, const Hitrec &h,
                                 const Ray &scattered) const {
      return 0;
    }

    virtual Color emitted(const Ray &rIn, const Hitrec &h) const {
      return Color(0, 0, 0);
    }

    virtual ~Material() {}
  };

  class Lambertian : public Material {
    TexturePtr albedo;

  public:
    explicit Lambertian(TexturePtr albedo) : albedo(std::move(albedo)) {}

    explicit Lambertian(const Color &c)
        : albedo(std::make_shared<SolidColor>(c)) {}

    bool scatter(const Ray &, const Hitrec &h, ScatterRecord &srec,
                 RandEngine &rand) const override {
      srec = PdfScatter{albedo->value(h.u, h.v, h.p),
                        std::make_shared<CosinePdf>(h.norm, rand)};
      return true;
    }

    double scatteringPdf(const Ray &, const Hitrec &h,
                         const Ray &scattered) const override {
      double cosine = h.norm.dot(scattered.d.normalized());
      return cosine < 0 ? 0 : cosine / PI;
    }
  };

  class Metal : public Material {
    Color albedo;
    double fuzz;

  public:
    Metal(const Color &albedo, double fuzz)
        : albedo(albedo), fuzz(fuzz < 1 ? fuzz : 1) {}

    bool scatter(const Ray &rIn, const Hitrec &h, ScatterRecord &srec,
                 RandEngine &rand) const override {
      Vector3d reflected = reflect(rIn.d.normalized(), h.norm);
      Vector3d scattered = reflected + fuzz * unitSphereRandom(rand);
      // a reflection cannot point into the surface
      if (scattered.dot(h.norm) <= 0)
        return false;
      srec = SpecularScatter{Ray(h.p, scattered, rIn.tm), albedo};
      return true;
    }
  };

  class Dielectric : public Material {
    double ior;

  public:
    explicit Dielectric(double ior) : ior(ior) {}

    bool scatter(const Ray &rIn, const Hitrec &h, ScatterRecord &srec,
                 RandEngine &rand) const override {
      double eta = h.frontFace ? 1.0 / ior : ior;
      Vector3d unitDir = rIn.d.normalized();
      double cosTheta = min(-unitDir.dot(h.norm), 1.0);
      double sinTheta = sqrt(max(0.0, 1.0 - cosTheta * cosTheta));

      Vector3d direction;
      if (eta * sinTheta > 1.0 || rand() < schlick(cosTheta, eta))
        direction = reflect(unitDir, h.norm);
      else
        direction = refract(unitDir, h.norm, eta);

      srec = SpecularScatter{Ray(h.p, direction, rIn.tm), Color(1, 1, 1)};
      return true;
    }
  };

  // one sided, the back of a light is black
  class DiffuseLight : public Material {
    TexturePtr emit;

  public:
    explicit DiffuseLight(TexturePtr emit) : emit(std::move(emit)) {}

    explicit DiffuseLight(const Color &c)
        : emit(std::make_shared<SolidColor>(c)) {}

    Color emitted(const Ray &, const Hitrec &h) const override {
      if (!h.frontFace)
        return Color(0, 0, 0);
      return emit->value(h.u, h.v, h.p);
    }
  };

  // phase function of participating media
  class Isotropic : public Material {
    TexturePtr albedo;

  public:
    explicit Isotropic(TexturePtr albedo) : albedo(std::move(albedo)) {}

    explicit Isotropic(const Color &c)
        : albedo(std::make_shared<SolidColor>(c)) {}

    bool scatter(const Ray &rIn, const Hitrec &h, ScatterRecord &srec,
                 RandEngine &rand) const override {
      srec = SpecularScatter{Ray(h.p, unitSphereRandom(rand), rIn.tm),
                             albedo->value(h.u, h.v, h.p)};
      return true;
    }
  };
} // namespace Lumen
