// run  := ./prism scenes/cover.test && open cover.png
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "prism/camera.hpp"
#include "prism/error.hpp"
#include "prism/image.hpp"
#include "prism/parse_scene.hpp"

int32_t main(int32_t argc, char **argv) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <scene_file>" << std::endl;
        return 1;
    }
    std::optional<prism::Scene> scene;
    try {
        scene = prism::parse_scene_file(argv[1]);
    }
    catch (const prism::parse_error &e) {
        std::cerr << argv[1] << ": " << e.what() << std::endl;
        return 1;
    }
    if (!scene) return 1;

    std::optional<prism::Camera> camera;
    try {
        camera = scene->camera();
    }
    catch (const prism::precondition_error &e) {
        std::cerr << argv[1] << ": bad camera: " << e.what() << std::endl;
        return 1;
    }

    prism::Image img = prism::render(*camera, scene->world, scene->maxdepth, true);
    const std::string &out = scene->output_filename;
    bool ppm = out.size() >= 4 && out.compare(out.size() - 4, 4, ".ppm") == 0;
    bool ok = ppm ? img.dumpppm(out) : img.dumppng(out);
    return ok ? 0 : 1;
}
