#ifndef PRISM_IMAGE_HPP
#define PRISM_IMAGE_HPP

#include <ostream>
#include <string>
#include <vector>
#define GLM_FORCE_SWIZZLE
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/glm.hpp>

#include "prism/tuple.hpp"

namespace prism {

// Pixels are addressed (row, column), row 0 at the top.
struct Image {
    int width = 0, height = 0;
    std::vector<glm::dvec3> data;
    Image();
    Image(int w, int h);
    void set_size(int w, int h);
    Tuple get(int x, int y) const;
    void set(int x, int y, const Tuple &color);
    bool dumppng(const std::string &filename) const;
    bool dumpppm(const std::string &filename) const;
    void writeppm(std::ostream &os) const;
};

}

#endif
