#include <algorithm>
#include <iterator>
#include <utility>

#include "prism/intersection.hpp"

namespace prism {

namespace {
bool by_t(const Intersection &a, const Intersection &b) { return a.t < b.t; }
}

bool operator==(const Intersection &a, const Intersection &b) {
    return a.t == b.t && a.object == b.object && a.u == b.u && a.v == b.v;
}

bool operator!=(const Intersection &a, const Intersection &b) { return !(a == b); }

Intersections::Intersections(std::initializer_list<Intersection> list) : data_(list) {
    std::stable_sort(data_.begin(), data_.end(), by_t);
}

Intersections::Intersections(std::vector<Intersection> list) : data_(std::move(list)) {
    std::stable_sort(data_.begin(), data_.end(), by_t);
}

void Intersections::add(const Intersection &i) {
    data_.insert(std::upper_bound(data_.begin(), data_.end(), i, by_t), i);
}

void Intersections::merge(const Intersections &other) {
    std::vector<Intersection> merged;
    merged.reserve(data_.size() + other.data_.size());
    std::merge(data_.begin(), data_.end(), other.data_.begin(), other.data_.end(), std::back_inserter(merged), by_t);
    data_.swap(merged);
}

std::optional<Intersection> Intersections::hit() const {
    for (auto &i: data_)
        if (i.t > 0) return i;
    return std::nullopt;
}

}
