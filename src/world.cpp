#include <algorithm>
#include <cmath>

#include "prism/error.hpp"
#include "prism/transform.hpp"
#include "prism/world.hpp"

namespace prism {

PointLight default_light() { return PointLight(point(-10, 10, -10), WHITE); }

World::World() {}

World::World(const PointLight &l) : light(l) {}

ShapeId World::add_object(const Geometry &geometry, const glm::dmat4 &transform, const Material &material) {
    ShapeId id = shapes.add(geometry, transform, material);
    objects.push_back(id);
    return id;
}

void World::add_object(ShapeId id) {
    if (shapes[id].parent != NO_SHAPE) throw precondition_error("only root shapes can be world objects");
    if (std::find(objects.begin(), objects.end(), id) != objects.end()) throw precondition_error("shape is already a world object");
    objects.push_back(id);
}

Intersections World::intersect_world(const Ray &ray) const {
    Intersections xs;
    for (ShapeId id: objects) {
        // adopted since it was added; its new parent already reaches it
        if (shapes[id].parent != NO_SHAPE) continue;
        xs.merge(shapes.intersect(id, ray));
    }
    return xs;
}

bool World::is_shadowed(const Tuple &p) const {
    Tuple v = light.position - p;
    double distance = magnitude(v);
    auto hit = intersect_world(Ray(p, normalize(v))).hit();
    return hit && hit->t < distance;
}

Tuple World::color_at(const Ray &ray, int remaining) const {
    Intersections xs = intersect_world(ray);
    auto hit = xs.hit();
    if (!hit) return BLACK;
    return shade_hit(prepare_computations(shapes, *hit, ray, xs), remaining);
}

Tuple World::shade_hit(const Comps &comps, int remaining) const {
    const Material &material = shapes[comps.object].material;
    bool shadowed = is_shadowed(comps.over_point);
    Tuple surface = lighting(material, light, comps.point, comps.eye_v, comps.normal, shadowed, shapes, comps.object);
    Tuple reflected = reflected_color(comps, remaining);
    Tuple refracted = refracted_color(comps, remaining);
    if (fresnel && material.reflective() > 0 && material.transparency() > 0) {
        double reflectance = schlick(comps);
        return surface + reflected * reflectance + refracted * (1 - reflectance);
    }
    return surface + reflected + refracted;
}

Tuple World::reflected_color(const Comps &comps, int remaining) const {
    double reflective = shapes[comps.object].material.reflective();
    if (reflective == 0 || remaining <= 0) return BLACK;
    return color_at(Ray(comps.over_point, comps.reflect_v), remaining - 1) * reflective;
}

Tuple World::refracted_color(const Comps &comps, int remaining) const {
    double transparency = shapes[comps.object].material.transparency();
    if (transparency == 0 || remaining <= 0) return BLACK;
    double n_ratio = comps.n1 / comps.n2;
    double cos_i = dot(comps.eye_v, comps.normal);
    double sin2_t = n_ratio * n_ratio * (1 - cos_i * cos_i);
    // total internal reflection
    if (sin2_t > 1) return BLACK;
    double cos_t = std::sqrt(1.0 - sin2_t);
    Tuple direction = comps.normal * (n_ratio * cos_i - cos_t) - comps.eye_v * n_ratio;
    return color_at(Ray(comps.under_point, direction), remaining - 1) * transparency;
}

World World::default_world() {
    World world(default_light());
    world.add_object(Sphere{}, identity(), Material().with_color(color(0.8, 1.0, 0.6)).with_diffuse(0.7).with_specular(0.2));
    world.add_object(Sphere{}, scaling(0.5, 0.5, 0.5));
    return world;
}

}
