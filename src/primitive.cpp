#include <algorithm>
#include <cmath>
#include <utility>

#include "prism/error.hpp"
#include "prism/primitive.hpp"

namespace prism {

Triangle::Triangle(const Tuple &a, const Tuple &b, const Tuple &c) : p1(a), p2(b), p3(c), e1(b - a), e2(c - a), normal(cross(e2, e1)) {}

SmoothTriangle::SmoothTriangle(const Tuple &a, const Tuple &b, const Tuple &c, const Tuple &na, const Tuple &nb, const Tuple &nc)
    : p1(a), p2(b), p3(c), n1(na), n2(nb), n3(nc), e1(b - a), e2(c - a) {}

bool Shape::is_composite() const {
    return std::holds_alternative<Group>(geometry) || std::holds_alternative<Csg>(geometry);
}

namespace {

// Moller-Trumbore; false if the ray is parallel to the plane or misses the triangle.
bool triangle_hit(const Ray &ray, const Tuple &p1, const Tuple &e1, const Tuple &e2, double &t, double &u, double &v) {
    Tuple dir_cross_e2 = cross(ray.direction, e2);
    double det = dot(e1, dir_cross_e2);
    if (std::fabs(det) < PRISM_EPS) return false;
    double f = 1.0 / det;
    Tuple p1_to_origin = ray.origin - p1;
    u = f * dot(p1_to_origin, dir_cross_e2);
    if (u < 0.0 || u > 1.0) return false;
    Tuple origin_cross_e1 = cross(p1_to_origin, e1);
    v = f * dot(ray.direction, origin_cross_e1);
    if (v < 0.0 || u + v > 1.0) return false;
    t = f * dot(e2, origin_cross_e1);
    return true;
}

std::pair<double, double> check_axis(double origin, double direction) {
    double tmin_numerator = -1.0 - origin;
    double tmax_numerator = 1.0 - origin;
    double tmin, tmax;
    if (std::fabs(direction) >= PRISM_EPS) {
        tmin = tmin_numerator / direction;
        tmax = tmax_numerator / direction;
    }
    else {
        // keep the sign instead of dividing by zero
        tmin = tmin_numerator * PRISM_INF;
        tmax = tmax_numerator * PRISM_INF;
    }
    if (tmin > tmax) std::swap(tmin, tmax);
    return {tmin, tmax};
}

// x^2 + z^2 at t, compared against the squared cap radius
bool within_cap(const Ray &ray, double t, double radius) {
    double x = ray.origin.x() + t * ray.direction.x();
    double z = ray.origin.z() + t * ray.direction.z();
    return x * x + z * z <= radius * radius;
}

template <typename T>
void intersect_caps(const T &shape, const Ray &ray, ShapeId self, bool cone, Intersections &xs) {
    if (!shape.closed || std::fabs(ray.direction.y()) < PRISM_EPS) return;
    double t = (shape.minimum - ray.origin.y()) / ray.direction.y();
    if (within_cap(ray, t, cone ? std::fabs(shape.minimum) : 1.0)) xs.add(Intersection(t, self));
    t = (shape.maximum - ray.origin.y()) / ray.direction.y();
    if (within_cap(ray, t, cone ? std::fabs(shape.maximum) : 1.0)) xs.add(Intersection(t, self));
}

// Side roots of a*t^2 + b*t + c, kept only strictly inside the y bounds.
template <typename T>
void intersect_sides(const T &shape, const Ray &ray, ShapeId self, double a, double b, double c, Intersections &xs) {
    double disc = b * b - 4 * a * c;
    if (disc < 0) return;
    double sqrtd = std::sqrt(disc);
    double t0 = (-b - sqrtd) / (2 * a);
    double t1 = (-b + sqrtd) / (2 * a);
    if (t0 > t1) std::swap(t0, t1);
    double y0 = ray.origin.y() + t0 * ray.direction.y();
    if (shape.minimum < y0 && y0 < shape.maximum) xs.add(Intersection(t0, self));
    double y1 = ray.origin.y() + t1 * ray.direction.y();
    if (shape.minimum < y1 && y1 < shape.maximum) xs.add(Intersection(t1, self));
}

}

Intersections local_intersect(const Sphere &, const Ray &ray, ShapeId self) {
    Tuple sphere_to_ray = ray.origin - point(0, 0, 0);
    double a = dot(ray.direction, ray.direction);
    double b = 2.0 * dot(ray.direction, sphere_to_ray);
    double c = dot(sphere_to_ray, sphere_to_ray) - 1.0;
    double discriminant = b * b - 4 * a * c;
    if (discriminant < 0) return Intersections();
    double sqrtd = std::sqrt(discriminant);
    // a tangent ray reports the same t twice
    return Intersections{Intersection((-b - sqrtd) / (2.0 * a), self), Intersection((-b + sqrtd) / (2.0 * a), self)};
}

Intersections local_intersect(const Plane &, const Ray &ray, ShapeId self) {
    // parallel or coplanar rays miss
    if (std::fabs(ray.direction.y()) < PRISM_EPS) return Intersections();
    return Intersections{Intersection(-ray.origin.y() / ray.direction.y(), self)};
}

Intersections local_intersect(const Cube &, const Ray &ray, ShapeId self) {
    auto [xtmin, xtmax] = check_axis(ray.origin.x(), ray.direction.x());
    auto [ytmin, ytmax] = check_axis(ray.origin.y(), ray.direction.y());
    auto [ztmin, ztmax] = check_axis(ray.origin.z(), ray.direction.z());
    double tmin = std::max(xtmin, std::max(ytmin, ztmin));
    double tmax = std::min(xtmax, std::min(ytmax, ztmax));
    if (tmin > tmax) return Intersections();
    return Intersections{Intersection(tmin, self), Intersection(tmax, self)};
}

Intersections local_intersect(const Cylinder &cyl, const Ray &ray, ShapeId self) {
    Intersections xs;
    const Tuple &o = ray.origin, &d = ray.direction;
    double a = d.x() * d.x() + d.z() * d.z();
    // parallel to the y axis: only the caps can be hit
    if (std::fabs(a) >= PRISM_EPS) {
        double b = 2 * o.x() * d.x() + 2 * o.z() * d.z();
        double c = o.x() * o.x() + o.z() * o.z() - 1;
        intersect_sides(cyl, ray, self, a, b, c, xs);
    }
    intersect_caps(cyl, ray, self, false, xs);
    return xs;
}

Intersections local_intersect(const Cone &cone, const Ray &ray, ShapeId self) {
    Intersections xs;
    const Tuple &o = ray.origin, &d = ray.direction;
    double a = d.x() * d.x() - d.y() * d.y() + d.z() * d.z();
    double b = 2 * o.x() * d.x() - 2 * o.y() * d.y() + 2 * o.z() * d.z();
    double c = o.x() * o.x() - o.y() * o.y() + o.z() * o.z();
    if (std::fabs(a) < PRISM_EPS) {
        // parallel to one nappe, the other may still be crossed once
        if (std::fabs(b) >= PRISM_EPS) xs.add(Intersection(-c / (2 * b), self));
    }
    else
        intersect_sides(cone, ray, self, a, b, c, xs);
    intersect_caps(cone, ray, self, true, xs);
    return xs;
}

Intersections local_intersect(const Triangle &tri, const Ray &ray, ShapeId self) {
    double t, u, v;
    if (!triangle_hit(ray, tri.p1, tri.e1, tri.e2, t, u, v)) return Intersections();
    return Intersections{Intersection(t, self, u, v)};
}

Intersections local_intersect(const SmoothTriangle &tri, const Ray &ray, ShapeId self) {
    double t, u, v;
    if (!triangle_hit(ray, tri.p1, tri.e1, tri.e2, t, u, v)) return Intersections();
    return Intersections{Intersection(t, self, u, v)};
}

Tuple local_normal(const Sphere &, const Tuple &p, const Intersection &) {
    return p - point(0, 0, 0);
}

Tuple local_normal(const Plane &, const Tuple &, const Intersection &) {
    return vector(0, 1, 0);
}

Tuple local_normal(const Cube &, const Tuple &p, const Intersection &) {
    // strict comparison keeps edges and corners on the x faces first
    double ax = std::fabs(p.x()), ay = std::fabs(p.y()), az = std::fabs(p.z());
    double maxc = std::max(ax, std::max(ay, az));
    if (maxc == ax) return vector(p.x(), 0, 0);
    if (maxc == ay) return vector(0, p.y(), 0);
    return vector(0, 0, p.z());
}

Tuple local_normal(const Cylinder &cyl, const Tuple &p, const Intersection &) {
    double dist = p.x() * p.x() + p.z() * p.z();
    if (dist < 1 && p.y() >= cyl.maximum - PRISM_EPS) return vector(0, 1, 0);
    if (dist < 1 && p.y() <= cyl.minimum + PRISM_EPS) return vector(0, -1, 0);
    return vector(p.x(), 0, p.z());
}

Tuple local_normal(const Cone &cone, const Tuple &p, const Intersection &) {
    double dist = p.x() * p.x() + p.z() * p.z();
    double y2 = p.y() * p.y();
    if (dist < y2 && p.y() >= cone.maximum - PRISM_EPS) return vector(0, 1, 0);
    if (dist < y2 && p.y() <= cone.minimum + PRISM_EPS) return vector(0, -1, 0);
    double y = std::sqrt(dist);
    if (p.y() > 0) y = -y;
    return vector(p.x(), y, p.z());
}

Tuple local_normal(const Triangle &tri, const Tuple &, const Intersection &) {
    return tri.normal;
}

Tuple local_normal(const SmoothTriangle &tri, const Tuple &, const Intersection &hit) {
    return tri.n2 * hit.u + tri.n3 * hit.v + tri.n1 * (1 - hit.u - hit.v);
}

}
