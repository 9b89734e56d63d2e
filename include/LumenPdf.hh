#pragma once

#include <LumenObject.hh>
#include <memory>

namespace Lumen {
  // Densities are over solid angle. A pdf lives for one scattering event and
  // draws from the random engine of the worker that built it.
  class Pdf {
  protected:
    RandEngine &rand;

  public:
    explicit Pdf(RandEngine &rand) : rand(rand) {}

    virtual double value(const Vector3d &direction) const = 0;

    virtual Vector3d generate() const = 0;

    virtual ~Pdf() {}
  };

  using PdfPtr = std::shared_ptr<Pdf>;

  class CosinePdf : public Pdf {
    Onb uvw;

  public:
    CosinePdf(const Vector3d &w, RandEngine &rand) : Pdf(rand), uvw(w) {}

    double value(const Vector3d &direction) const override {
      double cosine = direction.normalized().dot(uvw.w);
      return max(0.0, cosine / PI);
    }

    Vector3d generate() const override {
      return uvw.local(cosineDirectionRandom(rand));
    }
  };

  // aims at an object, usually the lights list
  class HittablePdf : public Pdf {
    const Object &object;
    Vector3d origin;

  public:
    HittablePdf(const Object &object, const Vector3d &origin, RandEngine &rand)
        : Pdf(rand), object(object), origin(origin) {}

    double value(const Vector3d &direction) const override {
      return object.pdfValue(origin, direction, rand);
    }

    Vector3d generate() const override { return object.random(origin, rand); }
  };

  class MixturePdf : public Pdf {
    PdfPtr p[2];

  public:
    MixturePdf(PdfPtr p0, PdfPtr p1, RandEngine &rand)
        : Pdf(rand), p{std::move(p0), std::move(p1)} {}

    double value(const Vector3d &direction) const override {
      return 0.5 * p[0]->value(direction) + 0.5 * p[1]->value(direction);
    }

    Vector3d generate() const override {
      if (rand() < 0.5)
        return p[0]->generate();
      return p[1]->generate();
    }
  };
} // namespace Lumen
