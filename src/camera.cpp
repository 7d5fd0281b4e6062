#include <cmath>
#include <iostream>

#include "prism/camera.hpp"
#include "prism/error.hpp"

namespace prism {

Camera::Camera(int h, int v, double f, const glm::dmat4 &m) : hsize(h), vsize(v), fov(f) {
    if (hsize <= 0 || vsize <= 0) throw precondition_error("camera needs a positive image size");
    set_transform(m);
    double half_view = std::tan(fov / 2);
    double aspect = static_cast<double>(hsize) / vsize;
    if (aspect >= 1) {
        half_width = half_view;
        half_height = half_view / aspect;
    }
    else {
        half_width = half_view * aspect;
        half_height = half_view;
    }
    pixel_size = half_width * 2 / hsize;
}

void Camera::set_transform(const glm::dmat4 &m) {
    transform = m;
    inverse = glm::inverse(m);
}

Ray Camera::ray_for_pixel(double px, double py) const {
    double world_x = half_width - (px + 0.5) * pixel_size;
    double world_y = half_height - (py + 0.5) * pixel_size;
    Tuple pixel = inverse * point(world_x, world_y, -1);
    Tuple origin = inverse * point(0, 0, 0);
    return Ray(origin, normalize(pixel - origin));
}

void render_segment(const Camera &camera, const World &world, Image &img, int start, int end, int maxdepth, bool show_progress) {
    for (int i = start; i < end; ++i) {
        for (int j = 0; j < camera.hsize; ++j) img.set(i, j, world.color_at(camera.ray_for_pixel(j, i), maxdepth));
        if (show_progress) std::cerr << "row " << i + 1 << "/" << camera.vsize << std::endl;
    }
}

Image render(const Camera &camera, const World &world, int maxdepth, bool show_progress) {
    Image img(camera.hsize, camera.vsize);
    render_segment(camera, world, img, 0, camera.vsize, maxdepth, show_progress);
    return img;
}

}
