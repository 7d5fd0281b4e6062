#include <cmath>

#include "prism/error.hpp"
#include "prism/light.hpp"

namespace prism {

PointLight::PointLight() {}

PointLight::PointLight(const Tuple &p, const Tuple &i) : position(p), intensity(i) {
    if (!position.is_point()) throw precondition_error("light position must be a point");
    if (!intensity.is_color()) throw precondition_error("light intensity must be a color");
}

Tuple lighting(const Material &material, const PointLight &light, const Tuple &surf_pos, const Tuple &eye_v, const Tuple &normal, bool in_shadow,
               const SceneGraph &graph, ShapeId object) {
    Tuple base = material.pattern() ? pattern_at_object(*material.pattern(), graph, object, surf_pos) : material.color();
    Tuple effective_color = base * light.intensity;
    Tuple ambient = effective_color * material.ambient();
    if (in_shadow) return ambient;

    Tuple light_vec = normalize(light.position - surf_pos);
    double light_dot_normal = dot(light_vec, normal);
    // light on the other side of the surface
    if (light_dot_normal < 0) return ambient;

    Tuple diffuse = effective_color * material.diffuse() * light_dot_normal;
    Tuple specular = BLACK;
    double reflect_dot_eye = dot(reflect(-light_vec, normal), eye_v);
    if (reflect_dot_eye > 0) specular = light.intensity * material.specular() * std::pow(reflect_dot_eye, material.shininess());
    return ambient + diffuse + specular;
}

}
