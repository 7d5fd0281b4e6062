#include "prism/error.hpp"
#include "prism/tuple.hpp"

#include <cmath>
#include <glm/gtx/string_cast.hpp>

namespace prism {

Tuple::Tuple() {}
Tuple::Tuple(double x, double y, double z, TupleKind k) : v(x, y, z), kind(k) {}
Tuple::Tuple(const glm::dvec3 &vec, TupleKind k) : v(vec), kind(k) {}

glm::dvec4 Tuple::homogeneous() const {
    return glm::dvec4(v, kind == TupleKind::Point ? 1.0 : 0.0);
}

Tuple point(double x, double y, double z) { return Tuple(x, y, z, TupleKind::Point); }
Tuple vector(double x, double y, double z) { return Tuple(x, y, z, TupleKind::Vector); }
Tuple color(double r, double g, double b) { return Tuple(r, g, b, TupleKind::Color); }

bool approx_equal(double a, double b, double eps) {
    if (a == b) return true;
    return std::fabs(a - b) < eps;
}

bool operator==(const Tuple &a, const Tuple &b) {
    return a.kind == b.kind && approx_equal(a.v.x, b.v.x) && approx_equal(a.v.y, b.v.y) && approx_equal(a.v.z, b.v.z);
}

bool operator!=(const Tuple &a, const Tuple &b) { return !(a == b); }

Tuple operator+(const Tuple &a, const Tuple &b) {
    if (a.is_point() && b.is_point()) throw precondition_error("cannot add two points");
    if (a.is_color() != b.is_color()) throw precondition_error("colors only add to colors");
    TupleKind kind = a.is_color() ? TupleKind::Color : (a.is_point() || b.is_point() ? TupleKind::Point : TupleKind::Vector);
    return Tuple(a.v + b.v, kind);
}

Tuple operator-(const Tuple &a, const Tuple &b) {
    if (a.is_vector() && b.is_point()) throw precondition_error("cannot subtract a point from a vector");
    if (a.is_color() != b.is_color()) throw precondition_error("colors only subtract from colors");
    TupleKind kind = a.is_color() ? TupleKind::Color : (a.is_point() && b.is_vector() ? TupleKind::Point : TupleKind::Vector);
    return Tuple(a.v - b.v, kind);
}

Tuple operator-(const Tuple &a) { return Tuple(-a.v, a.kind); }
Tuple operator*(const Tuple &a, double s) { return Tuple(a.v * s, a.kind); }
Tuple operator*(double s, const Tuple &a) { return Tuple(a.v * s, a.kind); }
Tuple operator/(const Tuple &a, double s) { return Tuple(a.v / s, a.kind); }

Tuple operator*(const Tuple &a, const Tuple &b) {
    if (!a.is_color() || !b.is_color()) throw precondition_error("tuple product is defined for colors only");
    return Tuple(a.v * b.v, TupleKind::Color);
}

double magnitude(const Tuple &a) {
    if (!a.is_vector()) throw precondition_error("magnitude of a non-vector");
    return glm::length(a.v);
}

Tuple normalize(const Tuple &a) {
    double len = magnitude(a);
    if (len == 0.0) throw precondition_error("cannot normalize a zero vector");
    return Tuple(a.v / len, TupleKind::Vector);
}

double dot(const Tuple &a, const Tuple &b) {
    if (!a.is_vector() || !b.is_vector()) throw precondition_error("dot product requires two vectors");
    return glm::dot(a.v, b.v);
}

Tuple cross(const Tuple &a, const Tuple &b) {
    if (!a.is_vector() || !b.is_vector()) throw precondition_error("cross product requires two vectors");
    return Tuple(glm::cross(a.v, b.v), TupleKind::Vector);
}

Tuple reflect(const Tuple &in, const Tuple &normal) {
    return in - normal * (2.0 * dot(in, normal));
}

std::ostream &operator<<(std::ostream &os, const Tuple &t) {
    static const char *names[] = {"vector", "point", "color"};
    return os << names[static_cast<int>(t.kind)] << glm::to_string(t.v);
}

}
