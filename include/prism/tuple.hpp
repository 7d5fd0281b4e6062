#ifndef PRISM_TUPLE_HPP
#define PRISM_TUPLE_HPP

#include <ostream>
#define GLM_FORCE_SWIZZLE
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/glm.hpp>

#define PRISM_EPS 1e-5
#define PRISM_INF 1e300

namespace prism {

enum class TupleKind { Vector, Point, Color };

struct Tuple {
    glm::dvec3 v = glm::dvec3(0.0);
    TupleKind kind = TupleKind::Vector;

    Tuple();
    Tuple(double x, double y, double z, TupleKind kind);
    Tuple(const glm::dvec3 &v, TupleKind kind);

    double x() const { return v.x; }
    double y() const { return v.y; }
    double z() const { return v.z; }

    bool is_point() const { return kind == TupleKind::Point; }
    bool is_vector() const { return kind == TupleKind::Vector; }
    bool is_color() const { return kind == TupleKind::Color; }

    // w = 1 for points, 0 otherwise
    glm::dvec4 homogeneous() const;
};

Tuple point(double x, double y, double z);
Tuple vector(double x, double y, double z);
Tuple color(double r, double g, double b);

bool approx_equal(double a, double b, double eps = PRISM_EPS);

// Component-wise approximate equality; kinds must match exactly.
bool operator==(const Tuple &a, const Tuple &b);
bool operator!=(const Tuple &a, const Tuple &b);

Tuple operator+(const Tuple &a, const Tuple &b);
Tuple operator-(const Tuple &a, const Tuple &b);
Tuple operator-(const Tuple &a);
Tuple operator*(const Tuple &a, double s);
Tuple operator*(double s, const Tuple &a);
Tuple operator/(const Tuple &a, double s);
// Hadamard product, colors only
Tuple operator*(const Tuple &a, const Tuple &b);

double magnitude(const Tuple &a);
Tuple normalize(const Tuple &a);
double dot(const Tuple &a, const Tuple &b);
Tuple cross(const Tuple &a, const Tuple &b);
Tuple reflect(const Tuple &in, const Tuple &normal);

std::ostream &operator<<(std::ostream &os, const Tuple &t);

const Tuple BLACK = Tuple(0.0, 0.0, 0.0, TupleKind::Color);
const Tuple WHITE = Tuple(1.0, 1.0, 1.0, TupleKind::Color);

}

#endif
