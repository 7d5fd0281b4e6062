#ifndef PRISM_TESTS_HELPERS_HPP
#define PRISM_TESTS_HELPERS_HPP

#include <cmath>

#include "prism/tuple.hpp"

// Looser than Tuple equality, for values that went through a few bounces.
inline bool near(const prism::Tuple &a, const prism::Tuple &b, double eps = 1e-4) {
    return a.kind == b.kind && std::fabs(a.x() - b.x()) < eps && std::fabs(a.y() - b.y()) < eps && std::fabs(a.z() - b.z()) < eps;
}

#endif
