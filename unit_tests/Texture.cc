#include <doctest/doctest.h>

#include <LumenTexture.hh>

#include <cstdio>
#include <fstream>

using namespace Lumen;

TEST_CASE("Textures") {
  RandEngine rand(61);

  SUBCASE("Checker alternates") {
    CheckerTexture checker(Color(0, 0, 0), Color(1, 1, 1), PI);
    Color a = checker.value(0, 0, Vector3d(0.5, 0.5, 0.5));
    Color b = checker.value(0, 0, Vector3d(1.5, 0.5, 0.5));
    CHECK(a != b);
    CHECK(checker.value(0, 0, Vector3d(2.5, 0.5, 0.5)) == a);
  }
  SUBCASE("Noise stays in range") {
    NoiseTexture noise(4, rand);
    for (int i = 0; i < 1000; ++i) {
      Color c = noise.value(0, 0, randomVector(rand, -10, 10));
      CHECK(c.minCoeff() >= -1e-9);
      CHECK(c.maxCoeff() <= 1 + 1e-9);
    }
  }
  SUBCASE("Pixmap lookup") {
    const char *filename = "lumen_test_texture.ppm";
    {
      std::ofstream f(filename);
      f << "P3\n2 1\n255\n255 0 0   0 0 255\n";
    }
    auto tex = ImageTexture::loadPPM(filename);
    std::remove(filename);
    CHECK(tex->width() == 2);
    CHECK(tex->height() == 1);
    CHECK(tex->value(0.1, 0.5, Vector3d(0, 0, 0)) == Color(1, 0, 0));
    CHECK(tex->value(0.9, 0.5, Vector3d(0, 0, 0)) == Color(0, 0, 1));
    // clamped outside [0, 1]
    CHECK(tex->value(2, -1, Vector3d(0, 0, 0)) == Color(0, 0, 1));
    ImageTexture missing;
    CHECK(missing.value(0.5, 0.5, Vector3d(0, 0, 0)) == Color(0, 1, 1));
  }
}
