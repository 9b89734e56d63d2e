#pragma once

#include <LumenAccelerate.hh>
#include <LumenCamera.hh>
#include <LumenMaterial.hh>
#include <LumenObject.hh>
#include <LumenPdf.hh>

namespace Lumen {
  // radiance of rays that leave the scene
  struct Background {
    bool sky = true;
    Color color{0, 0, 0};

    static Background skyGradient() { return Background(); }

    static Background constant(const Color &c) {
      Background bg;
      bg.sky = false;
      bg.color = c;
      return bg;
    }

    Color value(const Ray &r) const {
      if (!sky)
        return color;
      double t = 0.5 * (r.d.normalized().y() + 1.0);
      return (1.0 - t) * Color(1, 1, 1) + t * Color(0.5, 0.7, 1.0);
    }
  };

  // Bounded objects go into a BVH built once by build(), unbounded ones are
  // scanned linearly. Lights are also part of the world.
  class Scene {
    Array<ObjectPtr> objects;
    ObjectList unbounded;
    ObjectList lightList;
    ObjectPtr root;
    Background bg;
    CameraParams cam;
    double time0 = 0, time1 = 1;

  public:
    void add(ObjectPtr obj) {
      objects.push_back(std::move(obj));
      root.reset();
      unbounded.clear();
    }

    void addLight(ObjectPtr light) {
      lightList.add(light);
      add(std::move(light));
    }

    void setBackground(const Background &b) { bg = b; }
    const Background &background() const { return bg; }

    void setCamera(const CameraParams &c) { cam = c; }
    const CameraParams &camera() const { return cam; }
    CameraParams &camera() { return cam; }

    void setShutter(double t0, double t1) { time0 = t0, time1 = t1; }

    size_t objectSize() const { return objects.size(); }
    size_t lightSize() const { return lightList.size(); }
    bool built() const { return root != nullptr || !unbounded.empty(); }

    const ObjectList &lights() const { return lightList; }

    void build(RandEngine &rand) {
      if (objects.empty())
        fatal("Empty scene");

      Array<ObjectPtr> bounded;
      unbounded.clear();
      AABB tmp;
      for (auto &obj : objects) {
        if (obj->boundingBox(time0, time1, tmp))
          bounded.push_back(obj);
        else
          unbounded.add(obj);
      }
      root.reset();
      if (!bounded.empty())
        root = std::make_shared<BVHNode>(bounded, time0, time1, rand);
      printf("> Scene built :: %zu objects, %zu unbounded, %zu lights\n",
             objects.size(), unbounded.size(), lightList.size());
    }

    bool intersect(const Ray &r, double tMin, double tMax, Hitrec &h,
                   RandEngine &rand) const {
      bool hit = false;
      if (root && root->intersect(r, tMin, tMax, h, rand)) {
        hit = true;
        tMax = h.t;
      }
      if (unbounded.intersect(r, tMin, tMax, h, rand))
        hit = true;
      return hit;
    }
  };

  // densities closer to zero than this are replaced, keeping the sign
  constexpr double PDF_EPSILON = 1e-4;

  inline Color rayColor(const Ray &r, const Scene &scene, int depth,
                        RandEngine &rand) {
    if (depth <= 0)
      return Color(0, 0, 0);

    Hitrec h;
    if (!scene.intersect(r, 0.001, INF, h, rand))
      return scene.background().value(r);

    Color emitted = h.mat->emitted(r, h);
    ScatterRecord srec;
    if (!h.mat->scatter(r, h, srec, rand))
      return emitted;

    if (auto spec = std::get_if<SpecularScatter>(&srec))
      return emitted + spec->attenuation.cwiseProduct(
                           rayColor(spec->ray, scene, depth - 1, rand));

    auto &pdfRec = std::get<PdfScatter>(srec);
    PdfPtr pdf = pdfRec.pdf;
    if (!scene.lights().empty()) {
      auto lightPdf =
          std::make_shared<HittablePdf>(scene.lights(), h.p, rand);
      pdf = std::make_shared<MixturePdf>(lightPdf, pdfRec.pdf, rand);
    }

    Ray scattered(h.p, pdf->generate(), r.tm);
    double pdfValue = pdf->value(scattered.d);
    if (fabs(pdfValue) < PDF_EPSILON)
      pdfValue = std::copysign(PDF_EPSILON, pdfValue);

    double weight = h.mat->scatteringPdf(r, h, scattered) / pdfValue;
    return emitted +
           weight * pdfRec.attenuation.cwiseProduct(
                        rayColor(scattered, scene, depth - 1, rand));
  }
} // namespace Lumen
