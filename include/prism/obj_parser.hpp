#ifndef PRISM_OBJ_PARSER_HPP
#define PRISM_OBJ_PARSER_HPP

#include <istream>
#include <string>
#include <vector>

#include "prism/scene_graph.hpp"

namespace prism {

struct ObjMesh {
    std::vector<Tuple> vertices;
    std::vector<Tuple> normals;
    ShapeId root = NO_SHAPE; // default group, named groups hang below it
    std::vector<ShapeId> groups;
    std::size_t ignored = 0; // lines that were not understood
};

// Wavefront statements v, vn, f and g. Faces are fan triangulated; faces
// that reference normals become smooth triangles.
ObjMesh parse_obj(std::istream &in, SceneGraph &graph, const Material &material = Material());
ObjMesh parse_obj_file(const std::string &filename, SceneGraph &graph, const Material &material = Material());

}

#endif
