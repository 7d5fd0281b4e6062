#ifndef PRISM_WORLD_HPP
#define PRISM_WORLD_HPP

#include <vector>

#include "prism/intersection.hpp"
#include "prism/light.hpp"
#include "prism/ray.hpp"
#include "prism/scene_graph.hpp"
#include "prism/shading.hpp"

#define PRISM_MAX_DEPTH 5

namespace prism {

struct World {
    PointLight light;
    SceneGraph shapes;
    std::vector<ShapeId> objects; // top level only, groups recurse on their own
    // blend reflection and refraction by schlick() when both are present
    bool fresnel = false;

    World();
    explicit World(const PointLight &light);

    // Adds a top-level object built in this world's arena.
    ShapeId add_object(const Geometry &geometry, const glm::dmat4 &transform = glm::dmat4(1.0), const Material &material = Material());
    void add_object(ShapeId id);

    Intersections intersect_world(const Ray &ray) const;
    bool is_shadowed(const Tuple &p) const;

    Tuple color_at(const Ray &ray, int remaining = PRISM_MAX_DEPTH) const;
    Tuple shade_hit(const Comps &comps, int remaining = PRISM_MAX_DEPTH) const;
    Tuple reflected_color(const Comps &comps, int remaining = PRISM_MAX_DEPTH) const;
    Tuple refracted_color(const Comps &comps, int remaining = PRISM_MAX_DEPTH) const;

    // Two concentric spheres lit from point(-10, 10, -10).
    static World default_world();
};

PointLight default_light();

}

#endif
