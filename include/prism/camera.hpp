#ifndef PRISM_CAMERA_HPP
#define PRISM_CAMERA_HPP

#include "prism/image.hpp"
#include "prism/ray.hpp"
#include "prism/world.hpp"

namespace prism {

struct Camera {
    int hsize = 0, vsize = 0;
    double fov = 0.0; // radians
    glm::dmat4 transform = glm::dmat4(1.0);
    glm::dmat4 inverse = glm::dmat4(1.0);
    double half_width = 0.0, half_height = 0.0;
    double pixel_size = 0.0;

    Camera(int hsize, int vsize, double fov, const glm::dmat4 &transform = glm::dmat4(1.0));
    void set_transform(const glm::dmat4 &m);

    // Ray through the centre of pixel (px, py); the canvas sits at z = -1.
    Ray ray_for_pixel(double px, double py) const;
};

void render_segment(const Camera &camera, const World &world, Image &img, int start, int end, int maxdepth, bool show_progress);
Image render(const Camera &camera, const World &world, int maxdepth = PRISM_MAX_DEPTH, bool show_progress = false);

}

#endif
