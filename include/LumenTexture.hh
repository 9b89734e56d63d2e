#pragma once

#include <LumenMath.hh>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace Lumen {
  class Texture {
  public:
    virtual Color value(double u, double v, const Vector3d &p) const = 0;

    virtual ~Texture() {}
  };

  using TexturePtr = std::shared_ptr<Texture>;

  class SolidColor : public Texture {
    Color color;

  public:
    SolidColor(const Color &c) : color(c) {}

    SolidColor(double r, double g, double b) : color(r, g, b) {}

    Color value(double, double, const Vector3d &) const override {
      return color;
    }
  };

  class CheckerTexture : public Texture {
    TexturePtr odd, even;
    double repeat;

  public:
    CheckerTexture(TexturePtr odd, TexturePtr even, double repeat = 10)
        : odd(std::move(odd)), even(std::move(even)), repeat(repeat) {}

    CheckerTexture(const Color &odd, const Color &even, double repeat = 10)
        : odd(std::make_shared<SolidColor>(odd)),
          even(std::make_shared<SolidColor>(even)), repeat(repeat) {}

    Color value(double u, double v, const Vector3d &p) const override {
      double sines =
          sin(repeat * p.x()) * sin(repeat * p.y()) * sin(repeat * p.z());
      return sines < 0 ? odd->value(u, v, p) : even->value(u, v, p);
    }
  };

  // gradient noise over a 256 lattice
  class Perlin {
    static constexpr int POINT_COUNT = 256;
    Array<Vector3d> ranvec;
    Array<int> permX, permY, permZ;

    static Array<int> generatePerm(RandEngine &gen) {
      Array<int> p(POINT_COUNT);
      for (int i = 0; i < POINT_COUNT; ++i)
        p[i] = i;
      for (int i = POINT_COUNT - 1; i > 0; --i)
        std::swap(p[i], p[gen.uniformInt(0, i)]);
      return p;
    }

  public:
    explicit Perlin(RandEngine &gen) : ranvec(POINT_COUNT) {
      for (auto &v : ranvec)
        v = randomVector(gen, -1, 1).normalized();
      permX = generatePerm(gen);
      permY = generatePerm(gen);
      permZ = generatePerm(gen);
    }

    double noise(const Vector3d &p) const {
      double u = p.x() - floor(p.x());
      double v = p.y() - floor(p.y());
      double w = p.z() - floor(p.z());
      int i = int(floor(p.x()));
      int j = int(floor(p.y()));
      int k = int(floor(p.z()));

      Vector3d c[2][2][2];
      for (int di = 0; di < 2; di++)
        for (int dj = 0; dj < 2; dj++)
          for (int dk = 0; dk < 2; dk++)
            c[di][dj][dk] = ranvec[permX[(i + di) & 255] ^
                                   permY[(j + dj) & 255] ^
                                   permZ[(k + dk) & 255]];

      // hermite smoothing
      double uu = u * u * (3 - 2 * u);
      double vv = v * v * (3 - 2 * v);
      double ww = w * w * (3 - 2 * w);
      double accum = 0;
      for (int di = 0; di < 2; di++)
        for (int dj = 0; dj < 2; dj++)
          for (int dk = 0; dk < 2; dk++) {
            Vector3d weight(u - di, v - dj, w - dk);
            accum += (di * uu + (1 - di) * (1 - uu)) *
                     (dj * vv + (1 - dj) * (1 - vv)) *
                     (dk * ww + (1 - dk) * (1 - ww)) *
                     c[di][dj][dk].dot(weight);
          }
      return accum;
    }

    double turbulence(const Vector3d &p, int depth = 7) const {
      double accum = 0, weight = 1;
      Vector3d tp = p;
      for (int i = 0; i < depth; i++) {
        accum += weight * noise(tp);
        weight *= 0.5;
        tp *= 2;
      }
      return fabs(accum);
    }
  };

  class NoiseTexture : public Texture {
    Perlin noise;
    double scale;

  public:
    NoiseTexture(double scale, RandEngine &gen) : noise(gen), scale(scale) {}

    Color value(double, double, const Vector3d &p) const override {
      return Color(1, 1, 1) * 0.5 *
             (1 + sin(scale * p.z() + 10 * noise.turbulence(p)));
    }
  };

  // rgb texels in [0,1], row 0 is the top of the image
  class ImageTexture : public Texture {
    Array<Color> data;
    int w = 0, h = 0;

  public:
    ImageTexture() {}

    ImageTexture(int w, int h, Array<Color> texels)
        : data(std::move(texels)), w(w), h(h) {}

    // reads an ascii P3 pixmap
    static std::shared_ptr<ImageTexture> loadPPM(const std::string &filename) {
      std::ifstream f(filename);
      if (!f)
        fatal("cannot open texture '%s'", filename.c_str());
      std::string magic;
      int w, h, maxValue;
      f >> magic >> w >> h >> maxValue;
      if (magic != "P3" || !f || w <= 0 || h <= 0 || maxValue <= 0)
        fatal("'%s' is not an ascii P3 pixmap", filename.c_str());
      Array<Color> texels;
      texels.reserve(size_t(w) * h);
      for (auto i = 0; i < w * h; ++i) {
        double r, g, b;
        if (!(f >> r >> g >> b))
          fatal("truncated pixmap '%s'", filename.c_str());
        texels.push_back(Color(r, g, b) / double(maxValue));
      }
      printf("> Texture '%s' loaded (%dx%d)\n", filename.c_str(), w, h);
      return std::make_shared<ImageTexture>(w, h, std::move(texels));
    }

    int width() const { return w; }
    int height() const { return h; }

    Color value(double u, double v, const Vector3d &) const override {
      // cyan marks a missing image
      if (data.empty())
        return Color(0, 1, 1);

      u = std::clamp(u, 0.0, 1.0);
      v = 1.0 - std::clamp(v, 0.0, 1.0);
      auto x = int(u * w);
      auto y = int(v * h);
      x = x >= w ? w - 1 : x;
      y = y >= h ? h - 1 : y;
      return data[x + y * w];
    }
  };
} // namespace Lumen
