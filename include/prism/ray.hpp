#ifndef PRISM_RAY_HPP
#define PRISM_RAY_HPP

#include "prism/transform.hpp"
#include "prism/tuple.hpp"

namespace prism {

struct Ray {
    Tuple origin;
    Tuple direction;
    Ray(const Tuple &origin, const Tuple &direction);
    Tuple position(double t) const;
};

// Direction is not renormalized, so t stays comparable across spaces.
Ray transform_ray(const Ray &ray, const glm::dmat4 &transform);

}

#endif
