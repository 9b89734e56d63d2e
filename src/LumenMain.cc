#include <Lumen>
#include <string>
using namespace Lumen;

int main(int argc, char *argv[]) {
  if (argc != 2) {
    fprintf(stderr, "Usage: lumen {Configuration}\n");
    exit(EXIT_FAILURE);
  }

  LumenConfig config = loadConfig(argv[1]);
  const RenderParams &params = config.render;

  printf("> Finish Parsing, Display Details\n");
  printf("> Canvas :: %dx%d\n", params.width, params.height);
  printf("> Render :: %d samps, depth %d, seed %u\n", params.samplesPerPixel,
         params.maxDepth, params.seed);

  RandEngine rand(params.seed);
  Scene scene;
  buildScene(config.scene, scene, rand);
  config.camera.apply(scene.camera());

  const CameraParams &cam = scene.camera();
  scene.setShutter(min(cam.time0, cam.time1), max(cam.time0, cam.time1));
  scene.build(rand);

  Renderer renderer(scene, params);
  const Image &image = renderer.render();
  image.savePPM(params.output);
  return 0;
}
