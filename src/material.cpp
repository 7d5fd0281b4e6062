#include <string>

#include "prism/error.hpp"
#include "prism/material.hpp"

namespace prism {

namespace {
double non_negative(const char *name, double v) {
    if (v < 0.0) throw precondition_error(std::string("material ") + name + " must be non-negative");
    return v;
}
}

Material::Material() {}

Material Material::with_color(const Tuple &c) const {
    if (!c.is_color()) throw precondition_error("material color must be a color");
    Material m = *this;
    m.color_ = c;
    return m;
}

Material Material::with_pattern(const Pattern &p) const {
    Material m = *this;
    m.pattern_ = p;
    return m;
}

Material Material::without_pattern() const {
    Material m = *this;
    m.pattern_.reset();
    return m;
}

Material Material::with_ambient(double v) const { Material m = *this; m.ambient_ = non_negative("ambient", v); return m; }
Material Material::with_diffuse(double v) const { Material m = *this; m.diffuse_ = non_negative("diffuse", v); return m; }
Material Material::with_specular(double v) const { Material m = *this; m.specular_ = non_negative("specular", v); return m; }
Material Material::with_shininess(double v) const { Material m = *this; m.shininess_ = non_negative("shininess", v); return m; }
Material Material::with_reflective(double v) const { Material m = *this; m.reflective_ = non_negative("reflective", v); return m; }
Material Material::with_transparency(double v) const { Material m = *this; m.transparency_ = non_negative("transparency", v); return m; }
Material Material::with_refractive_index(double v) const { Material m = *this; m.refractive_index_ = non_negative("refractive index", v); return m; }

Material glass() { return Material().with_transparency(1.0).with_refractive_index(1.5); }

}
