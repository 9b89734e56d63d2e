#include <doctest/doctest.h>

#include <LumenConfig.hh>

#include <sstream>

using namespace Lumen;

TEST_CASE("parseConfig") {
  SUBCASE("Every section") {
    std::istringstream in(R"(
<<BEGIN>>
  <<CONFIG>>
    size 320 180
    samps 64 depth 12
    workers 3 block 8 shuffle 0
    output out.ppm
  <<SAMPLER>> multijittered
  <<CAMERA>>
    pos 1 2 3
    lookat 0 1 0
    lens 35 0.2 4.5
    time 0 1
  <<SCENE>> mesh bunny.obj texture fur.ppm
  <<SEED>> 99
<<END>>
<<ENDCONFIG>>
anything after the end marker is ignored
)");
    LumenConfig config = parseConfig(in);
    const RenderParams &r = config.render;
    CHECK(r.width == 320);
    CHECK(r.height == 180);
    CHECK(r.samplesPerPixel == 64);
    CHECK(r.maxDepth == 12);
    CHECK(r.workers == 3);
    CHECK(r.blockSize == 8);
    CHECK_FALSE(r.shuffleBlocks);
    CHECK(r.output == "out.ppm");
    CHECK(r.sampler == SamplerKind::MultiJittered);
    CHECK(r.seed == 99u);
    CHECK(config.scene.name == "mesh");
    CHECK(config.scene.meshPath == "bunny.obj");
    CHECK(config.scene.texturePath == "fur.ppm");

    CameraParams cam;
    config.camera.apply(cam);
    CHECK(cam.pos == Vector3d(1, 2, 3));
    CHECK(cam.lookAt == Vector3d(0, 1, 0));
    CHECK(cam.up == Vector3d(0, 1, 0));
    CHECK(cam.fov == doctest::Approx(35));
    CHECK(cam.aperture == doctest::Approx(0.2));
    CHECK(cam.focusDist == doctest::Approx(4.5));
    CHECK(cam.time1 == doctest::Approx(1));
  }
  SUBCASE("Defaults when sections are missing") {
    std::istringstream in("<<BEGIN>> <<SCENE>> cornell_box <<END>>");
    LumenConfig config = parseConfig(in);
    RenderParams defaults;
    CHECK(config.render.width == defaults.width);
    CHECK(config.render.samplesPerPixel == defaults.samplesPerPixel);
    CHECK(config.render.sampler == SamplerKind::Jittered);
    CHECK(config.scene.name == "cornell_box");
    CHECK(config.scene.meshPath.empty());
  }
  SUBCASE("Empty input") {
    std::istringstream in("");
    LumenConfig config = parseConfig(in);
    CHECK(config.scene.name == "random_world");
  }
  SUBCASE("Later blocks override earlier ones") {
    std::istringstream in("<<BEGIN>> <<CONFIG>> size 10 10 <<END>>\n"
                          "<<BEGIN>> <<CONFIG>> samps 3 <<END>>");
    LumenConfig config = parseConfig(in);
    CHECK(config.render.width == 10);
    CHECK(config.render.samplesPerPixel == 3);
  }
}

TEST_CASE("CameraOverride") {
  CameraParams cam;
  cam.pos = Vector3d(13, 2, 3);
  cam.fov = 20;
  cam.aperture = 0.1;

  CameraOverride none;
  none.apply(cam);
  CHECK(cam.pos == Vector3d(13, 2, 3));
  CHECK(cam.fov == doctest::Approx(20));

  CameraOverride some;
  some.fov = 45;
  some.apply(cam);
  CHECK(cam.fov == doctest::Approx(45));
  CHECK(cam.aperture == doctest::Approx(0.1));
  CHECK(cam.pos == Vector3d(13, 2, 3));
}

TEST_CASE("parseToken") {
  uint32_t seed = 7;
  CHECK(detail::parseToken("42", seed));
  CHECK(seed == 42);
  CHECK_FALSE(detail::parseToken("-1", seed));
  CHECK_FALSE(detail::parseToken("+1", seed));
  CHECK_FALSE(detail::parseToken("12abc", seed));

  int size = 0;
  CHECK(detail::parseToken("-3", size));
  CHECK(size == -3);
  double fov = 0;
  CHECK(detail::parseToken("0.5", fov));
  CHECK(fov == doctest::Approx(0.5));
  CHECK_FALSE(detail::parseToken("", fov));
}
