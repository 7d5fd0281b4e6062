#include <algorithm>
#include <type_traits>

#include "prism/error.hpp"
#include "prism/primitive.hpp"
#include "prism/scene_graph.hpp"

namespace prism {

ShapeId SceneGraph::add(const Geometry &geometry, const glm::dmat4 &transform, const Material &material) {
    ShapeId id = shapes_.size();
    Shape shape;
    shape.geometry = geometry;
    shape.material = material;
    std::vector<ShapeId> pending;
    if (auto *group = std::get_if<Group>(&shape.geometry)) pending.swap(group->children);
    const Csg *csg = std::get_if<Csg>(&shape.geometry);
    // nothing enters the arena unless every adoption below will succeed
    if (csg) {
        if (csg->left == csg->right) throw precondition_error("csg operands must be distinct shapes");
        check_movable(csg->left);
        check_movable(csg->right);
    }
    for (ShapeId child: pending) check_movable(child);
    shapes_.push_back(shape);
    set_transform(id, transform);
    if (csg) {
        attach(id, csg->left);
        attach(id, csg->right);
    }
    for (ShapeId child: pending) add_child(id, child);
    return id;
}

ShapeId SceneGraph::add_csg(CsgOp op, ShapeId left, ShapeId right, const glm::dmat4 &transform) {
    Csg csg;
    csg.op = op, csg.left = left, csg.right = right;
    return add(csg, transform);
}

void SceneGraph::add_child(ShapeId group, ShapeId child) {
    if (!std::holds_alternative<Group>(at(group).geometry)) throw precondition_error("children can only be added to a group");
    attach(group, child);
    std::get<Group>(at(group).geometry).children.push_back(child);
}

void SceneGraph::check_movable(ShapeId child) const {
    ShapeId old = at(child).parent;
    if (old != NO_SHAPE && std::holds_alternative<Csg>(at(old).geometry)) throw precondition_error("csg operands cannot be moved");
}

void SceneGraph::attach(ShapeId parent, ShapeId child) {
    at(child);
    for (ShapeId p = parent; p != NO_SHAPE; p = at(p).parent)
        if (p == child) throw precondition_error("a shape cannot contain itself");
    check_movable(child);
    ShapeId old = at(child).parent;
    if (old != NO_SHAPE) {
        auto &siblings = std::get<Group>(at(old).geometry).children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), child), siblings.end());
    }
    at(child).parent = parent;
}

void SceneGraph::set_transform(ShapeId id, const glm::dmat4 &transform) {
    Shape &shape = at(id);
    shape.transform = transform;
    shape.inverse = glm::inverse(transform);
    shape.inverse_transpose = glm::transpose(shape.inverse);
}

void SceneGraph::set_material(ShapeId id, const Material &material) { at(id).material = material; }

const Shape &SceneGraph::operator[](ShapeId id) const { return at(id); }

const Shape &SceneGraph::at(ShapeId id) const {
    if (id >= shapes_.size()) throw precondition_error("unknown shape id");
    return shapes_[id];
}

Shape &SceneGraph::at(ShapeId id) {
    if (id >= shapes_.size()) throw precondition_error("unknown shape id");
    return shapes_[id];
}

std::vector<ShapeId> SceneGraph::children(ShapeId id) const {
    const Shape &shape = at(id);
    if (auto *group = std::get_if<Group>(&shape.geometry)) return group->children;
    if (auto *csg = std::get_if<Csg>(&shape.geometry)) return {csg->left, csg->right};
    return {};
}

Intersections SceneGraph::intersect(ShapeId id, const Ray &ray) const {
    return local_intersect(id, transform_ray(ray, at(id).inverse));
}

Intersections SceneGraph::local_intersect(ShapeId id, const Ray &local_ray) const {
    return std::visit([&](auto &&geom) -> Intersections {
        using T = std::decay_t<decltype(geom)>;
        if constexpr (std::is_same_v<T, Group>) {
            Intersections xs;
            for (ShapeId child: geom.children) xs.merge(intersect(child, local_ray));
            return xs;
        }
        else if constexpr (std::is_same_v<T, Csg>) {
            Intersections xs = intersect(geom.left, local_ray);
            xs.merge(intersect(geom.right, local_ray));
            return filter_intersections(id, xs);
        }
        else
            return prism::local_intersect(geom, local_ray, id);
    }, at(id).geometry);
}

Tuple SceneGraph::normal_at(ShapeId id, const Tuple &world_point) const {
    return normal_at(id, world_point, Intersection(0.0, id));
}

Tuple SceneGraph::normal_at(ShapeId id, const Tuple &world_point, const Intersection &hit) const {
    if (!world_point.is_point()) throw precondition_error("normal query location must be a point");
    const Shape &shape = at(id);
    if (shape.is_composite()) throw precondition_error("groups and csg nodes have no surface");
    Tuple local_point = world_to_object(id, world_point);
    Tuple local_n = std::visit([&](auto &&geom) -> Tuple {
        using T = std::decay_t<decltype(geom)>;
        if constexpr (std::is_same_v<T, Group> || std::is_same_v<T, Csg>)
            return vector(0, 0, 0);
        else
            return local_normal(geom, local_point, hit);
    }, shape.geometry);
    return normal_to_world(id, local_n);
}

Tuple SceneGraph::world_to_object(ShapeId id, const Tuple &t) const {
    const Shape &shape = at(id);
    Tuple local = shape.parent != NO_SHAPE ? world_to_object(shape.parent, t) : t;
    return shape.inverse * local;
}

Tuple SceneGraph::normal_to_world(ShapeId id, const Tuple &normal) const {
    if (!normal.is_vector()) throw precondition_error("normal must be a vector");
    const Shape &shape = at(id);
    // dropping w discards whatever the translation left behind
    glm::dvec4 w = shape.inverse_transpose * glm::dvec4(normal.v, 0.0);
    Tuple n = vector(w.x, w.y, w.z);
    // a degenerate normal (cone apex) is passed through unnormalized
    if (glm::length(n.v) > 0.0) n = normalize(n);
    return shape.parent != NO_SHAPE ? normal_to_world(shape.parent, n) : n;
}

bool SceneGraph::includes(ShapeId a, ShapeId b) const {
    std::vector<ShapeId> stack{a};
    while (!stack.empty()) {
        ShapeId id = stack.back();
        stack.pop_back();
        if (id == b) return true;
        for (ShapeId child: children(id)) stack.push_back(child);
    }
    return false;
}

bool intersection_allowed(CsgOp op, bool left_hit, bool in_left, bool in_right) {
    switch (op) {
    case CsgOp::Union:
        return (left_hit && !in_right) || (!left_hit && !in_left);
    case CsgOp::Intersection:
        return (left_hit && in_right) || (!left_hit && in_left);
    case CsgOp::Difference:
        return (left_hit && !in_right) || (!left_hit && in_left);
    }
    return false;
}

Intersections SceneGraph::filter_intersections(ShapeId id, const Intersections &xs) const {
    const Csg *csg = std::get_if<Csg>(&at(id).geometry);
    if (!csg) throw precondition_error("intersection filtering needs a csg node");
    bool in_left = false, in_right = false;
    Intersections result;
    for (auto &i: xs) {
        bool left_hit = includes(csg->left, i.object);
        if (intersection_allowed(csg->op, left_hit, in_left, in_right)) result.add(i);
        if (left_hit) in_left = !in_left;
        else
            in_right = !in_right;
    }
    return result;
}

}
