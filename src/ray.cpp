#include "prism/error.hpp"
#include "prism/ray.hpp"

namespace prism {

Ray::Ray(const Tuple &o, const Tuple &d) : origin(o), direction(d) {
    if (!origin.is_point()) throw precondition_error("ray origin must be a point");
    if (!direction.is_vector()) throw precondition_error("ray direction must be a vector");
}

Tuple Ray::position(double t) const { return origin + direction * t; }

Ray transform_ray(const Ray &ray, const glm::dmat4 &transform) {
    return Ray(transform * ray.origin, transform * ray.direction);
}

}
