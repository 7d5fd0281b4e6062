#ifndef PRISM_MATERIAL_HPP
#define PRISM_MATERIAL_HPP

#include <optional>

#include "prism/pattern.hpp"
#include "prism/tuple.hpp"

namespace prism {

// Phong coefficients plus reflection/refraction. Immutable; the with_* helpers
// return a modified copy and reject negative coefficients.
class Material {
public:
    Material();

    const Tuple &color() const { return color_; }
    const std::optional<Pattern> &pattern() const { return pattern_; }
    double ambient() const { return ambient_; }
    double diffuse() const { return diffuse_; }
    double specular() const { return specular_; }
    double shininess() const { return shininess_; }
    double reflective() const { return reflective_; }
    double transparency() const { return transparency_; }
    double refractive_index() const { return refractive_index_; }

    Material with_color(const Tuple &c) const;
    Material with_pattern(const Pattern &p) const;
    Material without_pattern() const;
    Material with_ambient(double v) const;
    Material with_diffuse(double v) const;
    Material with_specular(double v) const;
    Material with_shininess(double v) const;
    Material with_reflective(double v) const;
    Material with_transparency(double v) const;
    Material with_refractive_index(double v) const;

private:
    Tuple color_ = WHITE;
    std::optional<Pattern> pattern_;
    double ambient_ = 0.1;
    double diffuse_ = 0.9;
    double specular_ = 0.9;
    double shininess_ = 200.0;
    double reflective_ = 0.0;
    double transparency_ = 0.0;
    double refractive_index_ = 1.0;
};

// Transparent, refractive index of glass.
Material glass();

}

#endif
