#pragma once

#include <LumenCamera.hh>
#include <LumenIntegrator.hh>
#include <LumenSampler.hh>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace Lumen {
  struct RenderParams {
    int width = 400, height = 225;
    int samplesPerPixel = 16;
    int maxDepth = 50;
    int workers = 0; // 0 picks the hardware concurrency
    int blockSize = 16;
    bool shuffleBlocks = true;
    SamplerKind sampler = SamplerKind::Jittered;
    uint32_t seed = 2021;
    std::string output = "image.ppm";
  };

  // pixel rectangle [x0, x1) x [y0, y1)
  struct Block {
    int x0, y0, x1, y1;
    uint32_t seed;
  };

  struct PixelResult {
    int x, y;
    Color color;
  };

  // many producers, one consumer
  template <typename T> class Channel {
    std::mutex m;
    std::condition_variable cv;
    std::deque<T> queue;
    bool closed = false;

  public:
    void send(T value) {
      {
        std::lock_guard<std::mutex> lock(m);
        queue.push_back(std::move(value));
      }
      cv.notify_one();
    }

    bool tryReceive(T &out) {
      std::lock_guard<std::mutex> lock(m);
      if (queue.empty())
        return false;
      out = std::move(queue.front());
      queue.pop_front();
      return true;
    }

    // false once the channel is closed and drained
    bool receive(T &out) {
      std::unique_lock<std::mutex> lock(m);
      cv.wait(lock, [this] { return !queue.empty() || closed; });
      if (queue.empty())
        return false;
      out = std::move(queue.front());
      queue.pop_front();
      return true;
    }

    void close() {
      {
        std::lock_guard<std::mutex> lock(m);
        closed = true;
      }
      cv.notify_all();
    }
  };

  // gamma corrected colors, row 0 is the top of the image
  class Image {
    int w = 0, h = 0;
    Array<Color> c;

  public:
    Image() {}

    Image(int w, int h) : w(w), h(h), c(size_t(w) * h, Color(0, 0, 0)) {}

    int width() const { return w; }
    int height() const { return h; }

    void set(int x, int y, const Color &color) { c[x + y * w] = color; }
    const Color &at(int x, int y) const { return c[x + y * w]; }

    static int quantize(double v) {
      return int(256 * std::clamp(v, 0.0, 0.999));
    }

    void savePPM(const std::string &filename) const {
      Array<int> rgb(c.size() * 3);
#pragma omp parallel for
      for (int i = 0; i < int(c.size()); ++i) {
        rgb[3 * i] = quantize(c[i].x());
        rgb[3 * i + 1] = quantize(c[i].y());
        rgb[3 * i + 2] = quantize(c[i].z());
      }

      FILE *f = fopen(filename.c_str(), "w");
      if (!f)
        fatal("Cannot write image '%s'", filename.c_str());
      fprintf(f, "P3\n%d %d\n255\n", w, h);
      for (size_t i = 0; i < c.size(); i++)
        fprintf(f, "%d %d %d\n", rgb[3 * i], rgb[3 * i + 1], rgb[3 * i + 2]);
      fclose(f);
      printf("> Image saved to '%s'\n", filename.c_str());
    }
  };

  // Splits the image into blocks and renders them on a pool of threads.
  // Workers only touch the work stack and the channel, the image belongs to
  // the thread that calls render().
  class Renderer {
    const Scene &scene;
    RenderParams params;
    Camera camera;
    SamplerPtr prototype;

    Array<Block> work;
    std::mutex workMutex;
    size_t total = 0;
    std::atomic<size_t> done{0};
    std::atomic<bool> cancelled{false};
    std::atomic<int> running{0};

    Channel<PixelResult> channel;
    Array<std::thread> threads;
    Image image;

    bool popBlock(Block &b) {
      std::lock_guard<std::mutex> lock(workMutex);
      if (work.empty())
        return false;
      b = work.back();
      work.pop_back();
      return true;
    }

    static const RenderParams &checked(const RenderParams &p) {
      if (p.width < 2 || p.height < 2)
        fatal("Image size %dx%d is too small", p.width, p.height);
      if (p.samplesPerPixel <= 0 || p.blockSize <= 0 || p.maxDepth < 0)
        fatal("Invalid render parameters");
      return p;
    }

    void workerFunc(SamplerPtr sampler) {
      RandEngine rand;
      Block b;
      while (!cancelled.load() && popBlock(b)) {
        // seeded per block so the image does not depend on scheduling
        rand.seed(b.seed);
        sampler->reset();
        for (int y = b.y0; y < b.y1; ++y)
          for (int x = b.x0; x < b.x1; ++x)
            channel.send(PixelResult{x, y, renderPixel(x, y, *sampler, rand)});
        done++;
      }
      if (--running == 0)
        channel.close();
    }

  public:
    Renderer(const Scene &scene, const RenderParams &p)
        : scene(scene), params(checked(p)),
          camera(scene.camera(), double(p.width) / double(p.height)),
          image(p.width, p.height) {
      if (!scene.built())
        fatal("Scene must be built before rendering");
      if (params.workers <= 0)
        params.workers = max(1, int(std::thread::hardware_concurrency()));

      RandEngine rand(params.seed);
      prototype = makeSampler(params.sampler, params.samplesPerPixel, rand);

      for (int y = 0; y < p.height; y += p.blockSize)
        for (int x = 0; x < p.width; x += p.blockSize)
          work.push_back(Block{x, y, min(x + p.blockSize, p.width),
                               min(y + p.blockSize, p.height), 0});
      if (params.shuffleBlocks)
        std::shuffle(work.begin(), work.end(), rand.engine());
      for (auto &b : work)
        b.seed = rand.next();
      total = work.size();
    }

    ~Renderer() {
      cancel();
      join();
    }

    Renderer(const Renderer &) = delete;
    Renderer &operator=(const Renderer &) = delete;

    // one full sample set averaged, gamma corrected, black when not finite
    Color renderPixel(int x, int y, Sampler &sampler, RandEngine &rand) const {
      int n = sampler.numSamples();
      Color sum(0, 0, 0);
      for (int s = 0; s < n; ++s) {
        Vector2d offset = sampler.sampleUnitSquare(rand);
        double u = (x + offset.x()) / (params.width - 1);
        double v = 1.0 - (y + offset.y()) / (params.height - 1);
        sum += rayColor(camera.getRay(u, v, rand), scene, params.maxDepth,
                        rand);
      }
      Color c = sum / n;
      c = Color(sqrt(c.x()), sqrt(c.y()), sqrt(c.z()));
      return isFinite(c) ? c : Color(0, 0, 0);
    }

    void start() {
      if (!threads.empty())
        return;
      running = params.workers;
      for (int i = 0; i < params.workers; ++i)
        threads.emplace_back(&Renderer::workerFunc, this, prototype->clone());
    }

    // drains the channel into the image until every worker has exited
    const Image &wait() {
      if (threads.empty())
        return image;
      PixelResult px;
      size_t reported = 0;
      while (channel.receive(px)) {
        image.set(px.x, px.y, px.color);
        size_t d = done.load();
        if (d != reported) {
          reported = d;
          fprintf(stderr, "\r> Rendering %5.2f%%", 100.0 * d / total);
        }
      }
      fprintf(stderr, "\n");
      join();
      return image;
    }

    const Image &render() {
      printf("> Rendering %dx%d, %d spp, depth %d, %d workers, %zu blocks, "
             "%s sampler\n",
             params.width, params.height, samplesPerPixel(),
             params.maxDepth, params.workers, total,
             samplerKindName(params.sampler));
      start();
      return wait();
    }

    void cancel() { cancelled = true; }

    void join() {
      for (auto &t : threads)
        if (t.joinable())
          t.join();
    }

    bool isCancelled() const { return cancelled.load(); }
    // grid samplers round the requested count down to a square
    int samplesPerPixel() const { return prototype->numSamples(); }
    size_t blocksDone() const { return done.load(); }
    size_t totalBlocks() const { return total; }
    const RenderParams &renderParams() const { return params; }
    const Image &result() const { return image; }
  };
} // namespace Lumen
