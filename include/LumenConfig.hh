#pragma once

#include <LumenRender.hh>
#include <LumenScenes.hh>

#include <fstream>
#include <istream>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>

namespace Lumen {
  // camera settings given in the file, the rest comes from the scene
  struct CameraOverride {
    std::optional<Vector3d> pos, lookAt, up;
    std::optional<double> fov, aperture, focusDist;
    std::optional<double> time0, time1;

    void apply(CameraParams &c) const {
      c.pos = pos.value_or(c.pos);
      c.lookAt = lookAt.value_or(c.lookAt);
      c.up = up.value_or(c.up);
      c.fov = fov.value_or(c.fov);
      c.aperture = aperture.value_or(c.aperture);
      c.focusDist = focusDist.value_or(c.focusDist);
      c.time0 = time0.value_or(c.time0);
      c.time1 = time1.value_or(c.time1);
    }
  };

  struct LumenConfig {
    RenderParams render;
    SceneOptions scene;
    CameraOverride camera;
  };

  namespace detail {
    inline bool isSection(const std::string &word) {
      return word.size() > 4 && word.compare(0, 2, "<<") == 0 &&
             word.compare(word.size() - 2, 2, ">>") == 0;
    }

    // whole token as T, unsigned values take no sign
    template <typename T> bool parseToken(const std::string &word, T &v) {
      if (std::is_unsigned<T>::value && !word.empty() &&
          (word[0] == '-' || word[0] == '+'))
        return false;
      std::istringstream ss(word);
      return bool(ss >> v) && ss.eof();
    }

    // whitespace tokens with one token of lookahead
    class TokenReader {
      std::istream &in;
      std::string pending;
      bool hasPending = false;

    public:
      explicit TokenReader(std::istream &in) : in(in) {}

      bool next(std::string &word) {
        if (hasPending) {
          word = std::move(pending);
          hasPending = false;
          return true;
        }
        return bool(in >> word);
      }

      void putBack(std::string word) {
        pending = std::move(word);
        hasPending = true;
      }

      template <typename T> T value(const char *what) {
        std::string word;
        if (!next(word))
          fatal("Missing value for '%s'", what);
        T v;
        if (!parseToken(word, v))
          fatal("Bad value '%s' for '%s'", word.c_str(), what);
        return v;
      }

      Vector3d vec(const char *what) {
        double x = value<double>(what);
        double y = value<double>(what);
        double z = value<double>(what);
        return Vector3d(x, y, z);
      }
    };

    inline void parseRender(TokenReader &in, RenderParams &r) {
      std::string key;
      while (in.next(key)) {
        if (isSection(key)) {
          in.putBack(key);
          return;
        }
        if (key == "size") {
          r.width = in.value<int>("size");
          r.height = in.value<int>("size");
        } else if (key == "samps")
          r.samplesPerPixel = in.value<int>("samps");
        else if (key == "depth")
          r.maxDepth = in.value<int>("depth");
        else if (key == "workers")
          r.workers = in.value<int>("workers");
        else if (key == "block")
          r.blockSize = in.value<int>("block");
        else if (key == "shuffle")
          r.shuffleBlocks = in.value<int>("shuffle") != 0;
        else if (key == "output")
          r.output = in.value<std::string>("output");
        else
          fatal("Unknown <<CONFIG>> key '%s'", key.c_str());
      }
    }

    inline void parseCamera(TokenReader &in, CameraOverride &c) {
      std::string key;
      while (in.next(key)) {
        if (isSection(key)) {
          in.putBack(key);
          return;
        }
        if (key == "pos")
          c.pos = in.vec("pos");
        else if (key == "lookat")
          c.lookAt = in.vec("lookat");
        else if (key == "up")
          c.up = in.vec("up");
        else if (key == "lens") {
          c.fov = in.value<double>("lens");
          c.aperture = in.value<double>("lens");
          c.focusDist = in.value<double>("lens");
        } else if (key == "time") {
          c.time0 = in.value<double>("time");
          c.time1 = in.value<double>("time");
        } else
          fatal("Unknown <<CAMERA>> key '%s'", key.c_str());
      }
    }

    inline void parseScene(TokenReader &in, SceneOptions &s) {
      s.name = in.value<std::string>("<<SCENE>>");
      s.meshPath.clear();
      s.texturePath.clear();
      if (s.name == "mesh")
        s.meshPath = in.value<std::string>("mesh");

      std::string key;
      while (in.next(key)) {
        if (isSection(key)) {
          in.putBack(key);
          return;
        }
        if (key == "texture")
          s.texturePath = in.value<std::string>("texture");
        else
          fatal("Unknown <<SCENE>> key '%s'", key.c_str());
      }
    }
  } // namespace detail

  // <<BEGIN>> sections <<END>>, optionally terminated by <<ENDCONFIG>>
  inline LumenConfig parseConfig(std::istream &f) {
    LumenConfig config;
    detail::TokenReader in(f);
    std::string word;
    while (in.next(word)) {
      if (word == "<<ENDCONFIG>>")
        break;
      if (word != "<<BEGIN>>")
        fatal("Expected <<BEGIN>>, got '%s'", word.c_str());

      while (true) {
        if (!in.next(word))
          fatal("Missing <<END>>");
        if (word == "<<END>>")
          break;
        printf("> Loading :: %s\n", word.c_str());
        if (word == "<<CONFIG>>")
          detail::parseRender(in, config.render);
        else if (word == "<<SAMPLER>>")
          config.render.sampler =
              samplerKindFromName(in.value<std::string>("<<SAMPLER>>"));
        else if (word == "<<CAMERA>>")
          detail::parseCamera(in, config.camera);
        else if (word == "<<SCENE>>")
          detail::parseScene(in, config.scene);
        else if (word == "<<SEED>>")
          config.render.seed = in.value<uint32_t>("<<SEED>>");
        else
          fatal("Unknown section '%s'", word.c_str());
      }
    }
    return config;
  }

  inline LumenConfig loadConfig(const std::string &filename) {
    std::ifstream f(filename);
    if (!f)
      fatal("Cannot open configuration '%s'", filename.c_str());
    return parseConfig(f);
  }
} // namespace Lumen
