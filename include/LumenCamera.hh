#pragma once

#include <LumenTraceRecord.hh>

namespace Lumen {
  struct CameraParams {
    Vector3d pos{0, 0, 0}, lookAt{0, 0, -1}, up{0, 1, 0};
    double fov = 90;
    double aperture = 0, focusDist = 1;
    double time0 = 0, time1 = 0;
  };

  // thin lens camera, rays carry a time inside the shutter interval
  class Camera {
    Vector3d lowerLeft, horizon, vertical, pos, _u, _v, _w;
    double lensR = 0;
    double time0 = 0, time1 = 0;
    double aspect;

  public:
    explicit Camera(double aspect = 1.0) : aspect(aspect) {
      configCamera(Vector3d(0, 0, 0), Vector3d(0, 0, -1), Vector3d(0, 1, 0),
                   90);
    }

    Camera(const CameraParams &p, double aspect) : aspect(aspect) {
      configCamera(p.pos, p.lookAt, p.up, p.fov, p.aperture, p.focusDist,
                   p.time0, p.time1);
    }

    void configCamera(const Vector3d &pos, const Vector3d &lookAt,
                      const Vector3d &up, double fov, double aperture = 0,
                      double focusDist = 1.0, double time0 = 0,
                      double time1 = 0) {
      lensR = aperture / 2;
      this->pos = pos;
      this->time0 = time0;
      this->time1 = time1;
      auto halfH = tan(degToRad(fov) / 2);
      auto halfW = aspect * halfH;
      _w = (pos - lookAt).normalized();
      _u = up.cross(_w).normalized();
      _v = _w.cross(_u);
      lowerLeft = pos - halfW * focusDist * _u - halfH * focusDist * _v -
                  focusDist * _w;
      horizon = 2 * halfW * focusDist * _u;
      vertical = 2 * halfH * focusDist * _v;
    }

    const Vector3d &position() const { return pos; }

    // s, t in [0,1], t = 0 is the bottom of the image
    Ray getRay(double s, double t, RandEngine &rand) const {
      Vector3d rd = lensR * unitDiskRandom(rand);
      Vector3d offset = _u * rd.x() + _v * rd.y();
      double time = time1 > time0 ? rand(time0, time1) : time0;
      return Ray(pos + offset,
                 lowerLeft + s * horizon + t * vertical - pos - offset, time);
    }
  };
} // namespace Lumen
