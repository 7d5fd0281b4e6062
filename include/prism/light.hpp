#ifndef PRISM_LIGHT_HPP
#define PRISM_LIGHT_HPP

#include "prism/material.hpp"
#include "prism/scene_graph.hpp"
#include "prism/tuple.hpp"

namespace prism {

struct PointLight {
    Tuple position = point(0, 0, 0);
    Tuple intensity = WHITE;
    PointLight();
    PointLight(const Tuple &position, const Tuple &intensity);
};

// Phong reflection at surf_pos. object is only used to sample a pattern.
Tuple lighting(const Material &material, const PointLight &light, const Tuple &surf_pos, const Tuple &eye_v, const Tuple &normal, bool in_shadow,
               const SceneGraph &graph, ShapeId object);

}

#endif
