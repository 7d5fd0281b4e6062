#ifndef PRISM_SHAPE_HPP
#define PRISM_SHAPE_HPP

#include <variant>
#include <vector>

#include "prism/material.hpp"
#include "prism/shape_id.hpp"
#include "prism/transform.hpp"
#include "prism/tuple.hpp"

namespace prism {

// unit sphere at the origin
struct Sphere {};

// the xz plane through the origin
struct Plane {};

// axis aligned, [-1, 1] on every axis
struct Cube {};

// unit radius around the y axis; bounds are exclusive
struct Cylinder {
    double minimum = -PRISM_INF;
    double maximum = PRISM_INF;
    bool closed = false;
};

// double napped, apex at the origin
struct Cone {
    double minimum = -PRISM_INF;
    double maximum = PRISM_INF;
    bool closed = false;
};

struct Triangle {
    Tuple p1, p2, p3;
    Tuple e1, e2;
    Tuple normal; // e2 x e1, normalized on use
    Triangle(const Tuple &p1, const Tuple &p2, const Tuple &p3);
};

struct SmoothTriangle {
    Tuple p1, p2, p3;
    Tuple n1, n2, n3;
    Tuple e1, e2;
    SmoothTriangle(const Tuple &p1, const Tuple &p2, const Tuple &p3, const Tuple &n1, const Tuple &n2, const Tuple &n3);
};

struct Group {
    std::vector<ShapeId> children;
};

enum class CsgOp { Union, Intersection, Difference };

struct Csg {
    CsgOp op = CsgOp::Union;
    ShapeId left = NO_SHAPE;
    ShapeId right = NO_SHAPE;
};

using Geometry = std::variant<Sphere, Plane, Cube, Cylinder, Cone, Triangle, SmoothTriangle, Group, Csg>;

struct Shape {
    Geometry geometry;
    glm::dmat4 transform = glm::dmat4(1.0);
    glm::dmat4 inverse = glm::dmat4(1.0);
    glm::dmat4 inverse_transpose = glm::dmat4(1.0);
    Material material;
    ShapeId parent = NO_SHAPE;

    bool is_composite() const;
};

}

#endif
