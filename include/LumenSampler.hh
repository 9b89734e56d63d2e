#pragma once

#include <LumenMath.hh>
#include <memory>
#include <string>

namespace Lumen {
  enum class SamplerKind { Random, Regular, NRooks, Jittered, MultiJittered };

  // Precomputed sets of stratified points in the unit square. Each worker
  // owns a clone, the sets themselves are fixed at construction.
  class Sampler {
  protected:
    Array<Vector2d> samples;
    Array<uint32_t> shuffledIndices;
    int sets = 0, samplesInSet = 0;
    size_t count = 0, jump = 0;

    // shuffles coordinates within each set so x and y decorrelate
    void setup(int numSets, RandEngine &rand) {
      sets = numSets;
      samplesInSet = int(samples.size()) / sets;
      if (samplesInSet <= 0)
        fatal("Sampler without samples");

      for (int axis = 0; axis < 2; ++axis)
        for (int p = 0; p < sets; ++p)
          for (int i = 0; i < samplesInSet - 1; ++i) {
            int target = rand.uniformInt(0, samplesInSet - 1) + p * samplesInSet;
            std::swap(samples[i + p * samplesInSet + 1][axis],
                      samples[target][axis]);
          }

      Array<uint32_t> indices(samplesInSet);
      for (int i = 0; i < samplesInSet; ++i)
        indices[i] = i;
      shuffledIndices.clear();
      for (int p = 0; p < sets; ++p) {
        std::shuffle(indices.begin(), indices.end(), rand.engine());
        shuffledIndices.insert(shuffledIndices.end(), indices.begin(),
                               indices.end());
      }
    }

  public:
    virtual std::unique_ptr<Sampler> clone() const = 0;

    int numSets() const { return sets; }
    int numSamples() const { return samplesInSet; }
    const Array<Vector2d> &allSamples() const { return samples; }

    // a random set is picked at the start of every run of samplesInSet
    Vector2d sampleUnitSquare(RandEngine &rand) {
      if (count % samplesInSet == 0)
        jump = size_t(rand.uniformInt(0, sets - 1)) * samplesInSet;
      Vector2d s =
          samples[jump + shuffledIndices[jump + count % samplesInSet]];
      ++count;
      return s;
    }

    // restarts the sequence, the next sample picks a new set
    void reset() { count = 0; }

    virtual ~Sampler() {}
  };

  using SamplerPtr = std::unique_ptr<Sampler>;

  template <typename Strategy> class SamplerBase : public Sampler {
  public:
    SamplerBase(int numSamples, RandEngine &rand, int numSets = 83) {
      if (numSamples <= 0 || numSets <= 0)
        fatal("Invalid sampler size %d x %d", numSets, numSamples);
      samples = Strategy::generateSamples(numSets, numSamples, rand);
      setup(numSets, rand);
    }

    std::unique_ptr<Sampler> clone() const override {
      return std::make_unique<SamplerBase>(*this);
    }
  };

  struct RandomStrategy {
    static Array<Vector2d> generateSamples(int sets, int n, RandEngine &rand) {
      Array<Vector2d> out;
      out.reserve(size_t(sets) * n);
      for (int i = 0; i < sets * n; ++i)
        out.push_back(Vector2d(rand(), rand()));
      return out;
    }
  };

  // cell centers of a sqrt(n) x sqrt(n) grid
  struct RegularStrategy {
    static Array<Vector2d> generateSamples(int sets, int n, RandEngine &) {
      int k = max(1, int(sqrt(double(n))));
      Array<Vector2d> out;
      out.reserve(size_t(sets) * k * k);
      for (int s = 0; s < sets; ++s)
        for (int p = 0; p < k; ++p)
          for (int q = 0; q < k; ++q)
            out.push_back(Vector2d((q + 0.5) / k, (p + 0.5) / k));
      return out;
    }
  };

  // one sample per row and per column
  struct NRooksStrategy {
    static Array<Vector2d> generateSamples(int sets, int n, RandEngine &rand) {
      Array<Vector2d> out;
      out.reserve(size_t(sets) * n);
      for (int s = 0; s < sets; ++s)
        for (int j = 0; j < n; ++j)
          out.push_back(Vector2d((j + rand()) / n, (j + rand()) / n));
      return out;
    }
  };

  struct JitteredStrategy {
    static Array<Vector2d> generateSamples(int sets, int n, RandEngine &rand) {
      int k = max(1, int(sqrt(double(n))));
      Array<Vector2d> out;
      out.reserve(size_t(sets) * k * k);
      for (int s = 0; s < sets; ++s)
        for (int j = 0; j < k; ++j)
          for (int i = 0; i < k; ++i)
            out.push_back(Vector2d((i + rand()) / k, (j + rand()) / k));
      return out;
    }
  };

  // jittered on the coarse grid and n-rooks on the fine one
  struct MultiJitteredStrategy {
    static Array<Vector2d> generateSamples(int sets, int n, RandEngine &rand) {
      int k = max(1, int(sqrt(double(n))));
      double subcell = 1.0 / (k * k);
      Array<Vector2d> out;
      out.reserve(size_t(sets) * k * k);
      for (int s = 0; s < sets; ++s)
        for (int i = 0; i < k; ++i)
          for (int j = 0; j < k; ++j)
            out.push_back(Vector2d((i * k + j + rand()) * subcell,
                                   (j * k + i + rand()) * subcell));
      return out;
    }
  };

  using RandomSampler = SamplerBase<RandomStrategy>;
  using RegularSampler = SamplerBase<RegularStrategy>;
  using NRooksSampler = SamplerBase<NRooksStrategy>;
  using JitteredSampler = SamplerBase<JitteredStrategy>;
  using MultiJitteredSampler = SamplerBase<MultiJitteredStrategy>;

  inline SamplerPtr makeSampler(SamplerKind kind, int numSamples,
                                RandEngine &rand) {
    switch (kind) {
    case SamplerKind::Random:
      return std::make_unique<RandomSampler>(numSamples, rand);
    case SamplerKind::Regular:
      return std::make_unique<RegularSampler>(numSamples, rand);
    case SamplerKind::NRooks:
      return std::make_unique<NRooksSampler>(numSamples, rand);
    case SamplerKind::Jittered:
      return std::make_unique<JitteredSampler>(numSamples, rand);
    case SamplerKind::MultiJittered:
      return std::make_unique<MultiJitteredSampler>(numSamples, rand);
    }
    fatal("Unknown sampler kind");
  }

  inline SamplerKind samplerKindFromName(const std::string &name) {
    if (name == "random")
      return SamplerKind::Random;
    if (name == "regular")
      return SamplerKind::Regular;
    if (name == "nrooks")
      return SamplerKind::NRooks;
    if (name == "jittered")
      return SamplerKind::Jittered;
    if (name == "multijittered")
      return SamplerKind::MultiJittered;
    fatal("Unknown sampler '%s'", name.c_str());
  }

  inline const char *samplerKindName(SamplerKind kind) {
    switch (kind) {
    case SamplerKind::Random:
      return "random";
    case SamplerKind::Regular:
      return "regular";
    case SamplerKind::NRooks:
      return "nrooks";
    case SamplerKind::Jittered:
      return "jittered";
    case SamplerKind::MultiJittered:
      return "multijittered";
    }
    return "unknown";
  }
} // namespace Lumen
