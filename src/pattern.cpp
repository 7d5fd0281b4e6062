#include <cmath>

#include "prism/error.hpp"
#include "prism/pattern.hpp"
#include "prism/scene_graph.hpp"

namespace prism {

Pattern::Pattern(PatternType t, const Tuple &ca, const Tuple &cb, const glm::dmat4 &m) : type(t), a(ca), b(cb) {
    if (!a.is_color() || !b.is_color()) throw precondition_error("pattern colors must be colors");
    set_transform(m);
}

void Pattern::set_transform(const glm::dmat4 &m) {
    transform = m;
    inverse = glm::inverse(m);
}

Tuple Pattern::at(const Tuple &p) const {
    auto even = [](double v) { return std::fmod(std::floor(v), 2.0) == 0.0; };
    switch (type) {
    case PatternType::Stripe:
        return even(p.x()) ? a : b;
    case PatternType::Gradient:
        return a + (b - a) * (p.x() - std::floor(p.x()));
    case PatternType::Ring:
        return even(std::sqrt(p.x() * p.x() + p.z() * p.z())) ? a : b;
    case PatternType::Checker:
        return even(std::floor(p.x()) + std::floor(p.y()) + std::floor(p.z())) ? a : b;
    case PatternType::Test:
        return color(p.x(), p.y(), p.z());
    }
    return a;
}

Tuple pattern_at_object(const Pattern &pattern, const SceneGraph &graph, ShapeId object, const Tuple &world_point) {
    Tuple object_point = graph.world_to_object(object, world_point);
    return pattern.at(pattern.inverse * object_point);
}

}
