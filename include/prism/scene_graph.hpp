#ifndef PRISM_SCENE_GRAPH_HPP
#define PRISM_SCENE_GRAPH_HPP

#include <vector>

#include "prism/intersection.hpp"
#include "prism/ray.hpp"
#include "prism/shape.hpp"
#include "prism/shape_id.hpp"

namespace prism {

// Arena owning every shape of a scene. Children are owned through the arena,
// the parent link is a lookup only. Shapes are never removed.
class SceneGraph {
public:
    ShapeId add(const Geometry &geometry, const glm::dmat4 &transform = glm::dmat4(1.0), const Material &material = Material());
    ShapeId add_csg(CsgOp op, ShapeId left, ShapeId right, const glm::dmat4 &transform = glm::dmat4(1.0));
    void add_child(ShapeId group, ShapeId child);

    void set_transform(ShapeId id, const glm::dmat4 &transform);
    void set_material(ShapeId id, const Material &material);

    const Shape &operator[](ShapeId id) const;
    std::size_t size() const { return shapes_.size(); }

    // Children of a Group, or {left, right} of a CSG; empty for primitives.
    std::vector<ShapeId> children(ShapeId id) const;

    // World-space ray in, intersections sorted by t out.
    Intersections intersect(ShapeId id, const Ray &ray) const;

    Tuple normal_at(ShapeId id, const Tuple &world_point) const;
    Tuple normal_at(ShapeId id, const Tuple &world_point, const Intersection &hit) const;

    Tuple world_to_object(ShapeId id, const Tuple &t) const;
    Tuple normal_to_world(ShapeId id, const Tuple &normal) const;

    // true if b is a or lies anywhere below a
    bool includes(ShapeId a, ShapeId b) const;

    Intersections filter_intersections(ShapeId csg, const Intersections &xs) const;

private:
    const Shape &at(ShapeId id) const;
    Shape &at(ShapeId id);
    void check_movable(ShapeId child) const;
    void attach(ShapeId parent, ShapeId child);
    Intersections local_intersect(ShapeId id, const Ray &local_ray) const;

    std::vector<Shape> shapes_;
};

// CSG admission rule, evaluated before the side flags are toggled.
bool intersection_allowed(CsgOp op, bool left_hit, bool in_left, bool in_right);

}

#endif
