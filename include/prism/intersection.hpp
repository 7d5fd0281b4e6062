#ifndef PRISM_INTERSECTION_HPP
#define PRISM_INTERSECTION_HPP

#include <initializer_list>
#include <optional>
#include <vector>

#include "prism/shape_id.hpp"

namespace prism {

struct Intersection {
    double t = 0.0;
    ShapeId object = NO_SHAPE;
    // barycentric coordinates, only set by the triangle family
    double u = 0.0, v = 0.0;

    Intersection() = default;
    Intersection(double t, ShapeId object, double u = 0.0, double v = 0.0) : t(t), object(object), u(u), v(v) {}
};

bool operator==(const Intersection &a, const Intersection &b);
bool operator!=(const Intersection &a, const Intersection &b);

// Always sorted ascending by t. Equal t values keep insertion order.
class Intersections {
public:
    Intersections() = default;
    Intersections(std::initializer_list<Intersection> list);
    explicit Intersections(std::vector<Intersection> list);

    void add(const Intersection &i);
    void merge(const Intersections &other);

    std::size_t size() const { return data_.size(); }
    bool empty() const { return data_.empty(); }
    const Intersection &operator[](std::size_t i) const { return data_[i]; }
    std::vector<Intersection>::const_iterator begin() const { return data_.begin(); }
    std::vector<Intersection>::const_iterator end() const { return data_.end(); }

    // first entry with t > 0
    std::optional<Intersection> hit() const;

private:
    std::vector<Intersection> data_;
};

}

#endif
