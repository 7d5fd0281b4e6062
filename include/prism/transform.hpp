#ifndef PRISM_TRANSFORM_HPP
#define PRISM_TRANSFORM_HPP

#define GLM_FORCE_SWIZZLE
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/glm.hpp>

#include "prism/tuple.hpp"

namespace prism {

// All transforms are column-major glm matrices; a * b applies b first.
glm::dmat4 identity();
glm::dmat4 translation(double x, double y, double z);
glm::dmat4 scaling(double x, double y, double z);
glm::dmat4 rotation_x(double radians);
glm::dmat4 rotation_y(double radians);
glm::dmat4 rotation_z(double radians);
glm::dmat4 shearing(double xy, double xz, double yx, double yz, double zx, double zy);
glm::dmat4 view_transform(const Tuple &from, const Tuple &to, const Tuple &up);

// Builds a matrix from row-major values, the order they are usually written in.
glm::dmat4 from_rows(const double (&rows)[16]);

bool approx_equal(const glm::dmat4 &a, const glm::dmat4 &b, double eps = PRISM_EPS);

// Points keep their translation, vectors do not. Colors cannot be transformed.
Tuple operator*(const glm::dmat4 &m, const Tuple &t);

}

#endif
