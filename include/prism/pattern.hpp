#ifndef PRISM_PATTERN_HPP
#define PRISM_PATTERN_HPP

#include "prism/shape_id.hpp"
#include "prism/transform.hpp"
#include "prism/tuple.hpp"

namespace prism {

enum class PatternType { Stripe, Gradient, Ring, Checker, Test };

struct Pattern {
    PatternType type = PatternType::Stripe;
    Tuple a = WHITE;
    Tuple b = BLACK;
    glm::dmat4 transform = glm::dmat4(1.0);
    glm::dmat4 inverse = glm::dmat4(1.0);

    Pattern(PatternType type, const Tuple &a = WHITE, const Tuple &b = BLACK, const glm::dmat4 &transform = glm::dmat4(1.0));
    void set_transform(const glm::dmat4 &m);

    // pattern_point is already in pattern space
    Tuple at(const Tuple &pattern_point) const;
};

// world point -> object space (through every ancestor) -> pattern space
Tuple pattern_at_object(const Pattern &pattern, const SceneGraph &graph, ShapeId object, const Tuple &world_point);

}

#endif
