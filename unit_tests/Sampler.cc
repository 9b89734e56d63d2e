#include <doctest/doctest.h>

#include <LumenSampler.hh>

#include <set>

using namespace Lumen;

namespace {
  const Vector2d *setBegin(const Sampler &s, int set) {
    return s.allSamples().data() + size_t(set) * s.numSamples();
  }

  // every strip of width 1/strips along the axis holds perStrip samples
  void checkStrips(const Sampler &s, int axis, int strips, int perStrip) {
    for (int set = 0; set < s.numSets(); ++set) {
      Array<int> count(strips, 0);
      const Vector2d *p = setBegin(s, set);
      for (int i = 0; i < s.numSamples(); ++i)
        count[min(strips - 1, int(p[i][axis] * strips))]++;
      for (int c : count)
        CHECK(c == perStrip);
    }
  }
} // namespace

TEST_CASE("Samplers") {
  RandEngine rand(71);

  SUBCASE("Samples lie in the unit square") {
    for (auto kind : {SamplerKind::Random, SamplerKind::Regular,
                      SamplerKind::NRooks, SamplerKind::Jittered,
                      SamplerKind::MultiJittered}) {
      SamplerPtr s = makeSampler(kind, 16, rand);
      CHECK(s->numSamples() == 16);
      CHECK(s->allSamples().size() == size_t(s->numSets()) * 16);
      for (auto &p : s->allSamples()) {
        CHECK(p.x() >= 0);
        CHECK(p.x() < 1);
        CHECK(p.y() >= 0);
        CHECK(p.y() < 1);
      }
    }
  }
  SUBCASE("Regular samples are cell centers") {
    RegularSampler s(16, rand);
    std::set<std::pair<double, double>> centers;
    for (int i = 0; i < s.numSamples(); ++i)
      centers.insert({setBegin(s, 0)[i].x(), setBegin(s, 0)[i].y()});
    for (auto &c : centers) {
      CHECK(fmod(c.first * 4, 1) == doctest::Approx(0.5));
      CHECK(fmod(c.second * 4, 1) == doctest::Approx(0.5));
    }
  }
  SUBCASE("N-rooks has one sample per row and column") {
    NRooksSampler s(10, rand);
    checkStrips(s, 0, 10, 1);
    checkStrips(s, 1, 10, 1);
  }
  SUBCASE("Jittered strata") {
    JitteredSampler s(16, rand);
    checkStrips(s, 0, 4, 4);
    checkStrips(s, 1, 4, 4);
  }
  SUBCASE("Jittered rounds down to a square count") {
    JitteredSampler s(10, rand);
    CHECK(s.numSamples() == 9);
    checkStrips(s, 0, 3, 3);
  }
  SUBCASE("Multi-jittered is n-rooks on the fine grid") {
    MultiJitteredSampler s(16, rand);
    checkStrips(s, 0, 16, 1);
    checkStrips(s, 1, 16, 1);
    checkStrips(s, 0, 4, 4);
    checkStrips(s, 1, 4, 4);
  }
  SUBCASE("A run of samples comes from a single set") {
    NRooksSampler s(8, rand);
    for (int run = 0; run < 20; ++run) {
      Array<int> rows(8, 0), cols(8, 0);
      for (int i = 0; i < 8; ++i) {
        Vector2d p = s.sampleUnitSquare(rand);
        cols[int(p.x() * 8)]++;
        rows[int(p.y() * 8)]++;
      }
      for (int i = 0; i < 8; ++i) {
        CHECK(rows[i] == 1);
        CHECK(cols[i] == 1);
      }
    }
  }
  SUBCASE("Consecutive runs of a rounded count stay stratified") {
    JitteredSampler s(10, rand);
    REQUIRE(s.numSamples() == 9);
    for (int run = 0; run < 20; ++run) {
      Array<int> cols(3, 0), rows(3, 0);
      for (int i = 0; i < s.numSamples(); ++i) {
        Vector2d p = s.sampleUnitSquare(rand);
        cols[int(p.x() * 3)]++;
        rows[int(p.y() * 3)]++;
      }
      for (int i = 0; i < 3; ++i) {
        CHECK(cols[i] == 3);
        CHECK(rows[i] == 3);
      }
    }
  }
  SUBCASE("Reset restarts the run") {
    JitteredSampler s(4, rand);
    s.sampleUnitSquare(rand);
    s.reset();
    Array<int> cells(4, 0);
    for (int i = 0; i < 4; ++i) {
      Vector2d p = s.sampleUnitSquare(rand);
      cells[int(p.x() * 2)]++;
    }
    CHECK(cells[0] == 2);
    CHECK(cells[1] == 2);
  }
  SUBCASE("Clones share the sets") {
    MultiJitteredSampler s(9, rand);
    SamplerPtr c = s.clone();
    CHECK(c->allSamples() == s.allSamples());
    RandEngine a(5), b(5);
    for (int i = 0; i < 30; ++i)
      CHECK(c->sampleUnitSquare(a) == s.sampleUnitSquare(b));
  }
  SUBCASE("Names") {
    for (auto kind : {SamplerKind::Random, SamplerKind::Regular,
                      SamplerKind::NRooks, SamplerKind::Jittered,
                      SamplerKind::MultiJittered})
      CHECK(samplerKindFromName(samplerKindName(kind)) == kind);
  }
}
