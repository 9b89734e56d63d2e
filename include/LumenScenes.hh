#pragma once

#include <LumenIntegrator.hh>
#include <LumenMedium.hh>
#include <LumenMesh.hh>
#include <LumenQuadric.hh>
#include <LumenShape.hh>
#include <LumenTexture.hh>
#include <LumenTransform.hh>

#include <string>

namespace Lumen {
  struct SceneOptions {
    std::string name = "random_world";
    std::string meshPath;
    std::string texturePath;
  };

  inline void simpleSphereScene(Scene &scene) {
    scene.add(std::make_shared<Sphere>(
        Vector3d(0, 0, -1), 0.5,
        std::make_shared<Lambertian>(Color(0.5, 0.5, 0.5))));
    scene.setBackground(Background::skyGradient());

    CameraParams cam;
    cam.pos = Vector3d(0, 0, 0);
    cam.lookAt = Vector3d(0, 0, -1);
    cam.fov = 90;
    scene.setCamera(cam);
  }

  inline void randomWorldScene(Scene &scene, RandEngine &rand) {
    auto checker = std::make_shared<CheckerTexture>(Color(0.2, 0.3, 0.1),
                                                    Color(0.9, 0.9, 0.9));
    scene.add(std::make_shared<Sphere>(Vector3d(0, -1000, 0), 1000,
                                       std::make_shared<Lambertian>(checker)));

    auto glass = std::make_shared<Dielectric>(1.5);
    for (int a = -11; a < 11; a++) {
      for (int b = -11; b < 11; b++) {
        double chooseMat = rand();
        Vector3d center(a + 0.9 * rand(), 0.2, b + 0.9 * rand());
        if ((center - Vector3d(4, 0.2, 0)).norm() <= 0.9)
          continue;

        if (chooseMat < 0.8) {
          Color albedo = randomVector(rand, 0, 1).cwiseProduct(
              randomVector(rand, 0, 1));
          scene.add(std::make_shared<Sphere>(
              center, 0.2, std::make_shared<Lambertian>(albedo)));
        } else if (chooseMat < 0.95) {
          Color albedo = randomVector(rand, 0.5, 1);
          double fuzz = rand(0, 0.5);
          scene.add(std::make_shared<Sphere>(
              center, 0.2, std::make_shared<Metal>(albedo, fuzz)));
        } else {
          scene.add(std::make_shared<Sphere>(center, 0.2, glass));
        }
      }
    }

    scene.add(std::make_shared<Sphere>(Vector3d(0, 1, 0), 1.0, glass));
    scene.add(std::make_shared<Sphere>(
        Vector3d(-4, 1, 0), 1.0,
        std::make_shared<Lambertian>(Color(0.4, 0.2, 0.1))));
    scene.add(std::make_shared<Sphere>(
        Vector3d(4, 1, 0), 1.0,
        std::make_shared<Metal>(Color(0.7, 0.6, 0.5), 0.0)));
    scene.setBackground(Background::skyGradient());

    CameraParams cam;
    cam.pos = Vector3d(13, 2, 3);
    cam.lookAt = Vector3d(0, 0, 0);
    cam.fov = 20;
    cam.aperture = 0.1;
    cam.focusDist = 10;
    scene.setCamera(cam);
  }

  // walls, floor, ceiling and the ceiling light of a 555 cornell box
  inline void cornellRoom(Scene &scene, const Color &light, double lx0,
                          double lx1, double lz0, double lz1) {
    auto red = std::make_shared<Lambertian>(Color(.65, .05, .05));
    auto white = std::make_shared<Lambertian>(Color(.73, .73, .73));
    auto green = std::make_shared<Lambertian>(Color(.12, .45, .15));
    auto emit = std::make_shared<DiffuseLight>(light);

    scene.add(std::make_shared<YZRect>(0, 555, 0, 555, 555, green));
    scene.add(std::make_shared<YZRect>(0, 555, 0, 555, 0, red));
    scene.addLight(std::make_shared<FlipFace>(
        std::make_shared<XZRect>(lx0, lx1, lz0, lz1, 554, emit)));
    scene.add(std::make_shared<XZRect>(0, 555, 0, 555, 0, white));
    scene.add(std::make_shared<XZRect>(0, 555, 0, 555, 555, white));
    scene.add(std::make_shared<XYRect>(0, 555, 0, 555, 555, white));
    scene.setBackground(Background::constant(Color(0, 0, 0)));

    CameraParams cam;
    cam.pos = Vector3d(278, 278, -800);
    cam.lookAt = Vector3d(278, 278, 0);
    cam.fov = 40;
    cam.focusDist = 10;
    scene.setCamera(cam);
  }

  inline ObjectPtr placedBox(const Vector3d &size, double angle,
                             const Vector3d &offset, const MaterialPtr &mat) {
    ObjectPtr box = std::make_shared<Box>(Vector3d(0, 0, 0), size, mat);
    box = std::make_shared<RotateY>(box, angle);
    return std::make_shared<Translate>(box, offset);
  }

  inline void cornellBoxScene(Scene &scene) {
    cornellRoom(scene, Color(15, 15, 15), 213, 343, 227, 332);
    auto white = std::make_shared<Lambertian>(Color(.73, .73, .73));
    scene.add(placedBox(Vector3d(165, 330, 165), 15, Vector3d(265, 0, 295),
                        white));
    scene.add(placedBox(Vector3d(165, 165, 165), -18, Vector3d(130, 0, 65),
                        white));
  }

  inline void cornellSmokeScene(Scene &scene) {
    cornellRoom(scene, Color(7, 7, 7), 113, 443, 127, 432);
    auto white = std::make_shared<Lambertian>(Color(.73, .73, .73));
    auto tall = placedBox(Vector3d(165, 330, 165), 15, Vector3d(265, 0, 295),
                          white);
    auto small = placedBox(Vector3d(165, 165, 165), -18, Vector3d(130, 0, 65),
                           white);
    scene.add(std::make_shared<ConstantMedium>(tall, 0.01, Color(0, 0, 0)));
    scene.add(std::make_shared<ConstantMedium>(small, 0.01, Color(1, 1, 1)));
  }

  // quadrics are modelled around +z, this stands them up on the ground
  inline ObjectPtr standUp(ObjectPtr obj, const Vector3d &at, double scale) {
    Affine3d m = Affine3d::Identity();
    m.translate(at);
    m.scale(scale);
    m.rotate(AngleAxisd(-PI / 2, Vector3d::UnitX()));
    return std::make_shared<Transform>(std::move(obj), m);
  }

  inline void quadricsScene(Scene &scene, RandEngine &rand) {
    auto ground = std::make_shared<Lambertian>(std::make_shared<CheckerTexture>(
        Color(0.2, 0.3, 0.1), Color(0.9, 0.9, 0.9)));
    scene.add(std::make_shared<Sphere>(Vector3d(0, -1000, 0), 1000, ground));

    auto orange = std::make_shared<Lambertian>(Color(0.8, 0.4, 0.1));
    auto teal = std::make_shared<Lambertian>(Color(0.1, 0.5, 0.5));
    auto gold = std::make_shared<Metal>(Color(0.8, 0.6, 0.2), 0.1);
    auto violet = std::make_shared<Lambertian>(Color(0.5, 0.2, 0.6));

    scene.add(standUp(std::make_shared<Cone>(1, 2, 2 * PI, orange),
                      Vector3d(-4.5, 0, 0), 1));
    scene.add(standUp(std::make_shared<Cylinder>(1, 0, 2, 1.5 * PI, teal),
                      Vector3d(-1.5, 0, 0), 1));
    scene.add(std::make_shared<Disk>(Vector3d(-1.5, 2, 0), Vector3d(0, 1, 0),
                                     1, teal));
    scene.add(standUp(std::make_shared<Hyperboloid>(Vector3d(1, 0, 0),
                                                    Vector3d(1, 1, 2), 2 * PI,
                                                    gold),
                      Vector3d(1.5, 0, 0), 1));
    scene.add(standUp(std::make_shared<Paraboloid>(1, 0, 2, 2 * PI, violet),
                      Vector3d(4.5, 0, 0), 1));

    scene.add(std::make_shared<MovingSphere>(
        Vector3d(-3, 0.5, 3), Vector3d(-3, 1, 3), 0, 1, 0.5,
        std::make_shared<Lambertian>(Color(0.7, 0.3, 0.3))));
    scene.add(std::make_shared<Sphere>(
        Vector3d(0, 0.7, 3), 0.7,
        std::make_shared<Lambertian>(
            std::make_shared<NoiseTexture>(4, rand))));
    scene.add(std::make_shared<Triangle>(
        Vector3d(2, 0, 3), Vector3d(4, 0, 3), Vector3d(3, 1.5, 3),
        std::make_shared<Metal>(Color(0.9, 0.9, 0.9), 0)));

    auto light = std::make_shared<DiffuseLight>(Color(4, 4, 4));
    scene.addLight(std::make_shared<FlipFace>(
        std::make_shared<XZRect>(-3, 3, -2, 2, 6, light)));
    scene.setBackground(Background::constant(Color(0.05, 0.05, 0.08)));

    CameraParams cam;
    cam.pos = Vector3d(0, 4, 12);
    cam.lookAt = Vector3d(0, 1, 0);
    cam.fov = 40;
    cam.focusDist = 12;
    cam.time0 = 0;
    cam.time1 = 1;
    scene.setCamera(cam);
  }

  // the mesh is scaled into a unit box resting on a checker plane
  inline void meshScene(Scene &scene, const SceneOptions &opt) {
    if (opt.meshPath.empty())
      fatal("The mesh scene needs a mesh path");
    MeshGeometry geo = loadObj(opt.meshPath);

    AABB bounds;
    for (auto &v : geo.vertices)
      bounds.fit(v.pos);
    if (bounds.empty())
      fatal("Mesh '%s' has no vertices", opt.meshPath.c_str());
    Vector3d extent = bounds.max - bounds.min;
    double scale = 2.0 / max(extent.maxCoeff(), 1e-9);
    Vector3d base(bounds.center().x(), bounds.min.y(), bounds.center().z());

    Affine3d m = Affine3d::Identity();
    m.scale(scale);
    m.translate(-base);

    MaterialPtr mat;
    if (!opt.texturePath.empty())
      mat = std::make_shared<Lambertian>(ImageTexture::loadPPM(opt.texturePath));
    else
      mat = std::make_shared<Lambertian>(Color(0.8, 0.8, 0.8));
    scene.add(std::make_shared<TriangleMesh>(geo, m.matrix(), mat));

    scene.add(std::make_shared<Plane>(
        Vector3d(0, 0, 0), Vector3d(0, 1, 0),
        std::make_shared<Lambertian>(std::make_shared<CheckerTexture>(
            Color(0.2, 0.2, 0.2), Color(0.9, 0.9, 0.9), 4))));
    scene.setBackground(Background::skyGradient());

    CameraParams cam;
    cam.pos = Vector3d(0, 2, 5);
    cam.lookAt = Vector3d(0, 1, 0);
    cam.fov = 40;
    cam.focusDist = 5;
    scene.setCamera(cam);
  }

  inline void buildScene(const SceneOptions &opt, Scene &scene,
                         RandEngine &rand) {
    printf("> Scene :: %s\n", opt.name.c_str());
    if (opt.name == "simple_sphere")
      simpleSphereScene(scene);
    else if (opt.name == "random_world")
      randomWorldScene(scene, rand);
    else if (opt.name == "cornell_box")
      cornellBoxScene(scene);
    else if (opt.name == "cornell_smoke")
      cornellSmokeScene(scene);
    else if (opt.name == "quadrics")
      quadricsScene(scene, rand);
    else if (opt.name == "mesh")
      meshScene(scene, opt);
    else
      fatal("Unknown scene '%s'", opt.name.c_str());
  }
} // namespace Lumen
