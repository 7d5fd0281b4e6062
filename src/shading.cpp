#include <algorithm>
#include <cmath>
#include <vector>

#include "prism/shading.hpp"

namespace prism {

namespace {

void refractive_indices(const SceneGraph &graph, const Intersection &hit, const Intersections &xs, double &n1, double &n2) {
    auto top = [&](const std::vector<ShapeId> &containers) {
        return containers.empty() ? 1.0 : graph[containers.back()].material.refractive_index();
    };
    std::vector<ShapeId> containers;
    for (auto &i: xs) {
        if (i == hit) n1 = top(containers);
        auto it = std::find(containers.begin(), containers.end(), i.object);
        if (it != containers.end()) containers.erase(it);
        else
            containers.push_back(i.object);
        if (i == hit) {
            n2 = top(containers);
            return;
        }
    }
}

}

Comps prepare_computations(const SceneGraph &graph, const Intersection &hit, const Ray &ray, const Intersections &xs) {
    Comps comps;
    comps.t = hit.t;
    comps.object = hit.object;
    comps.point = ray.position(hit.t);
    comps.eye_v = -ray.direction;
    comps.normal = graph.normal_at(hit.object, comps.point, hit);
    if (dot(comps.normal, comps.eye_v) < 0) {
        comps.inside = true;
        comps.normal = -comps.normal;
    }
    comps.reflect_v = reflect(ray.direction, comps.normal);
    comps.over_point = comps.point + comps.normal * PRISM_EPS;
    comps.under_point = comps.point - comps.normal * PRISM_EPS;
    refractive_indices(graph, hit, xs, comps.n1, comps.n2);
    return comps;
}

Comps prepare_computations(const SceneGraph &graph, const Intersection &hit, const Ray &ray) {
    return prepare_computations(graph, hit, ray, Intersections{hit});
}

double schlick(const Comps &comps) {
    double cos = dot(comps.eye_v, comps.normal);
    // total internal reflection only happens leaving the denser medium
    if (comps.n1 > comps.n2) {
        double n = comps.n1 / comps.n2;
        double sin2_t = n * n * (1.0 - cos * cos);
        if (sin2_t > 1.0) return 1.0;
        cos = std::sqrt(1.0 - sin2_t);
    }
    double r0 = std::pow((comps.n1 - comps.n2) / (comps.n1 + comps.n2), 2);
    return r0 + (1 - r0) * std::pow(1 - cos, 5);
}

}
