#pragma once

#include <Eigen/Eigen>
#include <algorithm>
#include <cmath>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <random>
#include <vector>

namespace Lumen {
  template <typename T> using Array = std::vector<T>;

  // uniform random generator, one instance per worker thread
  template <typename T> class DefaultRandEngine {
    std::default_random_engine e;
    std::uniform_real_distribution<T> u;

  public:
    DefaultRandEngine() : u(0.0, 1.0) {}

    explicit DefaultRandEngine(uint32_t seed) : e(seed), u(0.0, 1.0) {}

    void seed(uint32_t s) { e.seed(s); }

    // [0, 1)
    T operator()() { return u(e); }

    // [lo, hi)
    T operator()(T lo, T hi) { return lo + (hi - lo) * u(e); }

    // [lo, hi]
    int uniformInt(int lo, int hi) {
      return std::uniform_int_distribution<int>(lo, hi)(e);
    }

    uint32_t next() { return uint32_t(e()); }

    std::default_random_engine &engine() { return e; }
  };

  using RandEngine = DefaultRandEngine<double>;

  constexpr double PI = 3.14159265358979323846;
  constexpr double INF = std::numeric_limits<double>::infinity();

  using Eigen::Affine3d;
  using Eigen::AngleAxisd;
  using Eigen::Matrix3d;
  using Eigen::Matrix4d;
  using Eigen::Quaterniond;
  using Eigen::Vector2d;
  using Eigen::Vector3d;
  using Eigen::Vector4d;

  using Color = Vector3d;

  using std::max;
  using std::min;

  // prints "> Fatal: ..." and terminates, used for broken invariants
  [[noreturn]] inline void fatal(const char *fmt, ...) {
    va_list args;
    va_start(args, fmt);
    fprintf(stderr, "> Fatal: ");
    vfprintf(stderr, fmt, args);
    fprintf(stderr, "\n");
    va_end(args);
    exit(EXIT_FAILURE);
  }

  inline double degToRad(double deg) { return deg * PI / 180.0; }

  template <typename T>
  inline Eigen::Vector3<T> boxMin(const Eigen::Vector3<T> &a,
                                  const Eigen::Vector3<T> &b) {
    return Eigen::Vector3<T>(min(a.x(), b.x()), min(a.y(), b.y()),
                             min(a.z(), b.z()));
  }

  template <typename T>
  inline Eigen::Vector3<T> boxMax(const Eigen::Vector3<T> &a,
                                  const Eigen::Vector3<T> &b) {
    return Eigen::Vector3<T>(max(a.x(), b.x()), max(a.y(), b.y()),
                             max(a.z(), b.z()));
  }

  template <typename T>
  inline Eigen::Vector3<T> invert(const Eigen::Vector3<T> &vec) {
    return Eigen::Vector3<T>(1.0 / vec.x(), 1.0 / vec.y(), 1.0 / vec.z());
  }

  inline Vector3d transPoint(const Matrix4d &mat, const Vector3d &p) {
    Vector4d transed = mat * Vector4d(p.x(), p.y(), p.z(), 1);
    return Vector3d(transed.x(), transed.y(), transed.z());
  }

  inline Vector3d transDir(const Matrix4d &mat, const Vector3d &d) {
    Vector4d transed = mat * Vector4d(d.x(), d.y(), d.z(), 0);
    return Vector3d(transed.x(), transed.y(), transed.z());
  }

  inline bool isFinite(const Vector3d &v) {
    return std::isfinite(v.x()) && std::isfinite(v.y()) &&
           std::isfinite(v.z());
  }

  inline Vector3d randomVector(RandEngine &gen, double lo, double hi) {
    return Vector3d(gen(lo, hi), gen(lo, hi), gen(lo, hi));
  }

  inline Vector3d unitSphereRandom(RandEngine &gen) {
    Vector3d ret;
    do {
      ret = randomVector(gen, -1, 1);
    } while (ret.squaredNorm() >= 1);
    return ret;
  }

  inline Vector3d unitVectorRandom(RandEngine &gen) {
    return unitSphereRandom(gen).normalized();
  }

  inline Vector3d unitDiskRandom(RandEngine &gen) {
    Vector3d ret;
    do {
      ret = Vector3d(gen(-1, 1), gen(-1, 1), 0);
    } while (ret.squaredNorm() >= 1);
    return ret;
  }

  // cosine weighted direction around +z
  inline Vector3d cosineDirectionRandom(RandEngine &gen) {
    double r1 = gen(), r2 = gen();
    double z = sqrt(1 - r2);
    double phi = 2 * PI * r1;
    return Vector3d(cos(phi) * sqrt(r2), sin(phi) * sqrt(r2), z);
  }

  // uniform direction inside the cone subtended by a sphere, around +z
  inline Vector3d toSphereRandom(double radius, double distSquared,
                                 RandEngine &gen) {
    double r1 = gen(), r2 = gen();
    double z = 1 + r2 * (sqrt(1 - radius * radius / distSquared) - 1);
    double phi = 2 * PI * r1;
    double s = sqrt(max(0.0, 1 - z * z));
    return Vector3d(cos(phi) * s, sin(phi) * s, z);
  }

  // orthonormal basis with w along the given direction
  struct Onb {
    Vector3d u, v, w;

    Onb() {}

    explicit Onb(const Vector3d &n) {
      w = n.normalized();
      Vector3d a = fabs(w.x()) > 0.9 ? Vector3d(0, 1, 0) : Vector3d(1, 0, 0);
      v = w.cross(a).normalized();
      u = w.cross(v);
    }

    Vector3d local(double a, double b, double c) const {
      return a * u + b * v + c * w;
    }

    Vector3d local(const Vector3d &a) const {
      return a.x() * u + a.y() * v + a.z() * w;
    }
  };

  inline double schlick(double cosine, double refIdx) {
    double r0 = (1 - refIdx) / (1 + refIdx);
    r0 = r0 * r0;
    return r0 + (1 - r0) * pow(1 - cosine, 5);
  }

  inline Vector3d reflect(const Vector3d &v, const Vector3d &n) {
    return v - 2 * v.dot(n) * n;
  }

  // uv must be unit length
  inline Vector3d refract(const Vector3d &uv, const Vector3d &n,
                          double etaiOverEtat) {
    double cosTheta = min(-uv.dot(n), 1.0);
    Vector3d rOutPerp = etaiOverEtat * (uv + cosTheta * n);
    Vector3d rOutParallel = -sqrt(fabs(1.0 - rOutPerp.squaredNorm())) * n;
    return rOutPerp + rOutParallel;
  }

  // a*t^2 + b*t + c = 0, roots sorted ascending, returns the root count.
  // A double root is reported twice with a count of 2.
  inline int polyQuadratic(double a, double b, double c, double roots[2]) {
    if (a == 0) {
      if (b == 0)
        return 0;
      roots[0] = roots[1] = -c / b;
      return 1;
    }

    double delta = b * b - 4 * a * c;
    if (delta == 0) {
      roots[0] = roots[1] = -b / (2 * a);
      return 2;
    }

    if (delta > 0) {
      double q = -(b + std::copysign(sqrt(delta), b)) / 2;
      roots[0] = q / a;
      roots[1] = c / q;
      if (roots[0] > roots[1])
        std::swap(roots[0], roots[1]);
      return 2;
    }

    return 0;
  }
} // namespace Lumen
