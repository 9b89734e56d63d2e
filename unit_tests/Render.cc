#include <doctest/doctest.h>

#include <LumenRender.hh>
#include <LumenScenes.hh>

#include <thread>

using namespace Lumen;

namespace {
  RenderParams smallParams(int w, int h, int spp) {
    RenderParams p;
    p.width = w;
    p.height = h;
    p.samplesPerPixel = spp;
    p.maxDepth = 8;
    p.workers = 2;
    p.blockSize = 8;
    return p;
  }

  Color sqrtColor(const Color &c) {
    return Color(sqrt(c.x()), sqrt(c.y()), sqrt(c.z()));
  }
} // namespace

TEST_CASE("Channel") {
  SUBCASE("Drains before reporting closed") {
    Channel<int> ch;
    int v = 0;
    CHECK_FALSE(ch.tryReceive(v));
    ch.send(1);
    ch.send(2);
    ch.close();
    REQUIRE(ch.receive(v));
    CHECK(v == 1);
    REQUIRE(ch.tryReceive(v));
    CHECK(v == 2);
    CHECK_FALSE(ch.receive(v));
  }
  SUBCASE("Many producers") {
    Channel<int> ch;
    std::atomic<int> left{4};
    Array<std::thread> producers;
    for (int t = 0; t < 4; ++t)
      producers.emplace_back([&ch, &left]() {
        for (int i = 0; i < 1000; ++i)
          ch.send(1);
        if (--left == 0)
          ch.close();
      });
    int sum = 0, v;
    while (ch.receive(v))
      sum += v;
    for (auto &p : producers)
      p.join();
    CHECK(sum == 4000);
  }
}

TEST_CASE("Image") {
  CHECK(Image::quantize(0) == 0);
  CHECK(Image::quantize(-1) == 0);
  CHECK(Image::quantize(1) == 255);
  CHECK(Image::quantize(4) == 255);
  CHECK(Image::quantize(0.5) == 128);
  Image image(3, 2);
  image.set(2, 1, Color(1, 0.5, 0));
  CHECK(image.at(2, 1) == Color(1, 0.5, 0));
  CHECK(image.at(0, 0) == Color(0, 0, 0));
}

TEST_CASE("Camera") {
  RandEngine rand(82);
  CameraParams params;
  params.pos = Vector3d(1, 2, 3);
  params.lookAt = Vector3d(1, 2, -7);
  params.fov = 60;
  params.time0 = 0.25;
  params.time1 = 0.75;
  Camera camera(params, 2.0);
  CHECK(camera.position() == params.pos);
  for (int i = 0; i < 100; ++i) {
    Ray center = camera.getRay(0.5, 0.5, rand);
    Vector3d d = center.d.normalized();
    CHECK(d.z() == doctest::Approx(-1));
    CHECK(center.tm >= 0.25);
    CHECK(center.tm < 0.75);
  }
  // the top edge is half the field of view above the axis
  Vector3d top = camera.getRay(0.5, 1, rand).d;
  CHECK(atan2(top.y(), -top.z()) == doctest::Approx(PI / 6));
  Vector3d right = camera.getRay(1, 0.5, rand).d;
  CHECK(right.x() / -right.z() == doctest::Approx(2 * tan(PI / 6)));
}

TEST_CASE("rayColor") {
  RandEngine rand(81);
  Scene scene;
  simpleSphereScene(scene);
  scene.build(rand);
  REQUIRE(scene.built());

  SUBCASE("The sphere is hit straight ahead") {
    Hitrec h;
    REQUIRE(scene.intersect(Ray(Vector3d(0, 0, 0), Vector3d(0, 0, -1)), 0.001,
                            INF, h, rand));
    CHECK(h.t == doctest::Approx(0.5));
    CHECK(h.norm.z() == doctest::Approx(1));
  }
  SUBCASE("Escaping rays see the background") {
    Ray up(Vector3d(0, 0, 0), Vector3d(0, 1, 0));
    Color c = rayColor(up, scene, 10, rand);
    CHECK(c.x() == doctest::Approx(0.5));
    CHECK(c.z() == doctest::Approx(1));
    Ray down(Vector3d(0, 0, 0), Vector3d(0, -1, 0));
    CHECK(rayColor(down, scene, 10, rand).x() == doctest::Approx(1));
  }
  SUBCASE("Depth exhausted is black") {
    Ray r(Vector3d(0, 0, 0), Vector3d(0, 0, -1));
    CHECK(rayColor(r, scene, 0, rand) == Color(0, 0, 0));
  }
  SUBCASE("Radiance is finite and non negative") {
    for (int i = 0; i < 500; ++i) {
      Ray r(Vector3d(0, 0, 0), unitVectorRandom(rand));
      Color c = rayColor(r, scene, 10, rand);
      CHECK(isFinite(c));
      CHECK(c.minCoeff() >= 0);
    }
  }
}

TEST_CASE("Renderer") {
  SUBCASE("Open sky in the top row of the random world") {
    RandEngine rand(2021);
    Scene scene;
    randomWorldScene(scene, rand);
    scene.build(rand);
    RenderParams params = smallParams(32, 18, 4);
    Renderer renderer(scene, params);
    const Image &image = renderer.render();
    CHECK(renderer.blocksDone() == renderer.totalBlocks());

    Camera camera(scene.camera(), double(params.width) / params.height);
    for (int x = 0; x < params.width; ++x) {
      double u = (x + 0.5) / (params.width - 1);
      double v = 1.0 - 0.5 / (params.height - 1);
      Color expected = sqrtColor(
          scene.background().value(camera.getRay(u, v, rand)));
      Color got = image.at(x, 0);
      CHECK(got.x() == doctest::Approx(expected.x()).epsilon(0.01));
      CHECK(got.y() == doctest::Approx(expected.y()).epsilon(0.01));
      CHECK(got.z() == doctest::Approx(expected.z()).epsilon(0.01));
    }
  }

  SUBCASE("Lit region is brighter than the shadowed one") {
    RandEngine rand(7);
    Scene scene;
    auto white = std::make_shared<Lambertian>(Color(0.73, 0.73, 0.73));
    auto boxMat = std::make_shared<Lambertian>(Color(0.73, 0.73, 0.73));
    auto emit = std::make_shared<DiffuseLight>(Color(4, 4, 4));
    // the light faces the camera, the block's front face looks away from it
    scene.addLight(std::make_shared<XYRect>(-1, 1, -1, 1, 0, emit));
    scene.add(std::make_shared<XZRect>(-5, 5, -5, 5, -2, white));
    scene.add(std::make_shared<Box>(Vector3d(-0.5, -2, 1),
                                    Vector3d(0.5, -1, 2), boxMat));
    scene.setBackground(Background::constant(Color(0, 0, 0)));
    CameraParams cam;
    cam.pos = Vector3d(0, 0, 5);
    cam.lookAt = Vector3d(0, 0, 0);
    cam.fov = 90;
    scene.setCamera(cam);
    scene.build(rand);
    CHECK(scene.objectSize() == 3);
    CHECK(scene.lightSize() == 1);

    RenderParams params = smallParams(40, 40, 16);
    params.maxDepth = 5;
    Renderer renderer(scene, params);
    const Image &image = renderer.render();

    // classify pixels by what all their corners see
    Camera camera(scene.camera(), 1.0);
    auto sees = [&](int x, int y, const Material *mat, double z) {
      for (double dx : {0.0, 1.0})
        for (double dy : {0.0, 1.0}) {
          double u = (x + dx) / (params.width - 1);
          double v = 1.0 - (y + dy) / (params.height - 1);
          Hitrec h;
          if (!scene.intersect(camera.getRay(u, v, rand), 0.001, INF, h, rand))
            return false;
          if (h.mat != mat || fabs(h.p.z() - z) > 1e-6)
            return false;
        }
      return true;
    };

    double litMin = INF, shadowMax = 0;
    int lit = 0, shadowed = 0;
    for (int y = 0; y < params.height; ++y)
      for (int x = 0; x < params.width; ++x) {
        double lum = image.at(x, y).sum();
        if (sees(x, y, emit.get(), 0)) {
          ++lit;
          litMin = min(litMin, lum);
        } else if (sees(x, y, boxMat.get(), 2)) {
          ++shadowed;
          shadowMax = max(shadowMax, lum);
        }
      }
    REQUIRE(lit > 0);
    REQUIRE(shadowed > 0);
    CHECK(litMin > shadowMax);
  }

  SUBCASE("Same seed, same image, any worker count") {
    RandEngine rand(3);
    Scene scene;
    simpleSphereScene(scene);
    scene.build(rand);

    RenderParams params = smallParams(24, 16, 4);
    params.blockSize = 5;
    params.workers = 1;
    Renderer first(scene, params);
    const Image &a = first.render();
    params.workers = 3;
    Renderer second(scene, params);
    const Image &b = second.render();
    for (int y = 0; y < params.height; ++y)
      for (int x = 0; x < params.width; ++x)
        CHECK(a.at(x, y) == b.at(x, y));
  }

  SUBCASE("Pixels use whole sample sets") {
    RandEngine rand(3);
    Scene scene;
    simpleSphereScene(scene);
    scene.build(rand);
    RenderParams params = smallParams(8, 8, 10);
    params.sampler = SamplerKind::Jittered;
    Renderer renderer(scene, params);
    CHECK(renderer.samplesPerPixel() == 9);

    SamplerPtr sampler = makeSampler(SamplerKind::Jittered, 10, rand);
    for (int x = 0; x < 3; ++x)
      CHECK(isFinite(renderer.renderPixel(x, 0, *sampler, rand)));
    // the next pixel starts a fresh set, three samples per strip
    Array<int> cols(3, 0), rows(3, 0);
    for (int i = 0; i < 9; ++i) {
      Vector2d p = sampler->sampleUnitSquare(rand);
      cols[int(p.x() * 3)]++;
      rows[int(p.y() * 3)]++;
    }
    for (int i = 0; i < 3; ++i) {
      CHECK(cols[i] == 3);
      CHECK(rows[i] == 3);
    }
  }

  SUBCASE("Blocks cover the image") {
    RandEngine rand(3);
    Scene scene;
    simpleSphereScene(scene);
    scene.build(rand);
    RenderParams params = smallParams(21, 13, 1);
    params.blockSize = 4;
    Renderer renderer(scene, params);
    CHECK(renderer.totalBlocks() == 6 * 4);
    const Image &image = renderer.render();
    CHECK(renderer.blocksDone() == renderer.totalBlocks());
    // the sky is never black, every pixel was written
    for (int y = 0; y < params.height; ++y)
      for (int x = 0; x < params.width; ++x)
        CHECK(image.at(x, y).sum() > 0);
  }

  SUBCASE("Cancel stops the workers") {
    RandEngine rand(3);
    Scene scene;
    randomWorldScene(scene, rand);
    scene.build(rand);
    RenderParams params = smallParams(64, 64, 4);
    params.blockSize = 4;
    params.workers = 2;
    Renderer renderer(scene, params);
    renderer.start();
    renderer.cancel();
    renderer.wait();
    CHECK(renderer.isCancelled());
    CHECK(renderer.blocksDone() <= renderer.totalBlocks());
  }
}
