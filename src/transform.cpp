#include "prism/error.hpp"
#include "prism/transform.hpp"

#include <glm/gtc/matrix_transform.hpp>

namespace prism {

glm::dmat4 identity() { return glm::dmat4(1.0); }

glm::dmat4 translation(double x, double y, double z) {
    return glm::translate(glm::dmat4(1.0), glm::dvec3(x, y, z));
}

glm::dmat4 scaling(double x, double y, double z) {
    return glm::scale(glm::dmat4(1.0), glm::dvec3(x, y, z));
}

glm::dmat4 rotation_x(double radians) { return glm::rotate(glm::dmat4(1.0), radians, glm::dvec3(1.0, 0.0, 0.0)); }
glm::dmat4 rotation_y(double radians) { return glm::rotate(glm::dmat4(1.0), radians, glm::dvec3(0.0, 1.0, 0.0)); }
glm::dmat4 rotation_z(double radians) { return glm::rotate(glm::dmat4(1.0), radians, glm::dvec3(0.0, 0.0, 1.0)); }

glm::dmat4 shearing(double xy, double xz, double yx, double yz, double zx, double zy) {
    glm::dmat4 m(1.0);
    // m[column][row]
    m[1][0] = xy, m[2][0] = xz;
    m[0][1] = yx, m[2][1] = yz;
    m[0][2] = zx, m[1][2] = zy;
    return m;
}

glm::dmat4 view_transform(const Tuple &from, const Tuple &to, const Tuple &up) {
    if (!from.is_point() || !to.is_point()) throw precondition_error("view transform needs two points");
    Tuple forward = normalize(to - from);
    // NOTE: left is not renormalized, a slanted up vector shears the view
    Tuple left = cross(forward, normalize(up));
    Tuple true_up = cross(left, forward);
    glm::dmat4 orientation = from_rows({
        left.x(), left.y(), left.z(), 0.0,
        true_up.x(), true_up.y(), true_up.z(), 0.0,
        -forward.x(), -forward.y(), -forward.z(), 0.0,
        0.0, 0.0, 0.0, 1.0,
    });
    return orientation * translation(-from.x(), -from.y(), -from.z());
}

glm::dmat4 from_rows(const double (&rows)[16]) {
    glm::dmat4 m;
    for (int r = 0; r < 4; ++r)
        for (int c = 0; c < 4; ++c) m[c][r] = rows[r * 4 + c];
    return m;
}

bool approx_equal(const glm::dmat4 &a, const glm::dmat4 &b, double eps) {
    for (int c = 0; c < 4; ++c)
        for (int r = 0; r < 4; ++r)
            if (!approx_equal(a[c][r], b[c][r], eps)) return false;
    return true;
}

Tuple operator*(const glm::dmat4 &m, const Tuple &t) {
    if (t.is_color()) throw precondition_error("colors cannot be transformed");
    glm::dvec4 res = m * t.homogeneous();
    return Tuple(glm::dvec3(res), t.kind);
}

}
