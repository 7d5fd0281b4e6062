#ifndef PRISM_SHADING_HPP
#define PRISM_SHADING_HPP

#include "prism/intersection.hpp"
#include "prism/ray.hpp"
#include "prism/scene_graph.hpp"
#include "prism/tuple.hpp"

namespace prism {

// Per-hit snapshot used by the shading pipeline.
struct Comps {
    double t = 0.0;
    ShapeId object = NO_SHAPE;
    Tuple point;
    Tuple eye_v;
    Tuple normal;
    bool inside = false;
    Tuple reflect_v;
    double n1 = 1.0; // medium being exited
    double n2 = 1.0; // medium being entered
    Tuple over_point;
    Tuple under_point;
};

// xs is the full sorted sequence hit came from; it drives n1/n2.
Comps prepare_computations(const SceneGraph &graph, const Intersection &hit, const Ray &ray, const Intersections &xs);
Comps prepare_computations(const SceneGraph &graph, const Intersection &hit, const Ray &ray);

// Schlick approximation of the Fresnel reflectance at the hit.
double schlick(const Comps &comps);

}

#endif
