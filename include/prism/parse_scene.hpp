#ifndef PRISM_PARSE_SCENE_HPP
#define PRISM_PARSE_SCENE_HPP

#include <istream>
#include <optional>
#include <string>

#include "prism/camera.hpp"
#include "prism/world.hpp"

namespace prism {

struct Scene {
    int width = 160, height = 120;
    int maxdepth = PRISM_MAX_DEPTH;
    std::string output_filename = "prism.png";
    Tuple camera_from = point(0, 0, -5);
    Tuple camera_to = point(0, 0, 0);
    Tuple camera_up = vector(0, 1, 0);
    double fov = 60.0; // degrees
    World world;

    Camera camera() const;
};

// base_dir resolves relative "obj" paths. Malformed statements throw parse_error.
Scene parse_scene(std::istream &in, const std::string &base_dir = "");
std::optional<Scene> parse_scene_file(const std::string &filename);

}

#endif
