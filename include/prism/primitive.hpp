#ifndef PRISM_PRIMITIVE_HPP
#define PRISM_PRIMITIVE_HPP

#include "prism/intersection.hpp"
#include "prism/ray.hpp"
#include "prism/shape.hpp"

namespace prism {

// Local-space routines. The ray is already in the shape's own space and
// every returned intersection refers to self.
Intersections local_intersect(const Sphere &sphere, const Ray &ray, ShapeId self);
Intersections local_intersect(const Plane &plane, const Ray &ray, ShapeId self);
Intersections local_intersect(const Cube &cube, const Ray &ray, ShapeId self);
Intersections local_intersect(const Cylinder &cyl, const Ray &ray, ShapeId self);
Intersections local_intersect(const Cone &cone, const Ray &ray, ShapeId self);
Intersections local_intersect(const Triangle &tri, const Ray &ray, ShapeId self);
Intersections local_intersect(const SmoothTriangle &tri, const Ray &ray, ShapeId self);

Tuple local_normal(const Sphere &sphere, const Tuple &p, const Intersection &hit);
Tuple local_normal(const Plane &plane, const Tuple &p, const Intersection &hit);
Tuple local_normal(const Cube &cube, const Tuple &p, const Intersection &hit);
Tuple local_normal(const Cylinder &cyl, const Tuple &p, const Intersection &hit);
Tuple local_normal(const Cone &cone, const Tuple &p, const Intersection &hit);
Tuple local_normal(const Triangle &tri, const Tuple &p, const Intersection &hit);
Tuple local_normal(const SmoothTriangle &tri, const Tuple &p, const Intersection &hit);

}

#endif
