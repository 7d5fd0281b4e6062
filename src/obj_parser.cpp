#include <fstream>
#include <iostream>
#include <sstream>

#include "prism/error.hpp"
#include "prism/obj_parser.hpp"

namespace prism {

namespace {

struct FaceVertex {
    int v = 0;
    int n = 0; // 0 when the face carries no normal
};

// "7", "7/2", "7//3" or "7/2/3"
bool parse_face_vertex(const std::string &token, FaceVertex &fv) {
    std::istringstream iss(token);
    if (!(iss >> fv.v)) return false;
    if (iss.peek() != '/') return iss.eof();
    iss.get();
    if (iss.peek() != '/') {
        int texture;
        if (!(iss >> texture)) return false;
    }
    if (iss.peek() != '/') return iss.eof();
    iss.get();
    return static_cast<bool>(iss >> fv.n);
}

template <typename T>
bool lookup(const std::vector<T> &list, int index, T &out) {
    if (index < 1 || index > static_cast<int>(list.size())) return false;
    out = list[index - 1];
    return true;
}

}

ObjMesh parse_obj(std::istream &in, SceneGraph &graph, const Material &material) {
    ObjMesh mesh;
    mesh.root = graph.add(Group{});
    mesh.groups.push_back(mesh.root);

    int lineno = 0;
    for (std::string line; std::getline(in, line);) {
        ++lineno;
        std::istringstream iss(line);
        std::string instruction;
        if (!(iss >> instruction)) continue;
        if (instruction == "v") {
            double x, y, z;
            if (!(iss >> x >> y >> z)) throw parse_error(lineno, "bad vertex");
            mesh.vertices.push_back(point(x, y, z));
        }
        else if (instruction == "vn") {
            double x, y, z;
            if (!(iss >> x >> y >> z)) throw parse_error(lineno, "bad vertex normal");
            mesh.normals.push_back(vector(x, y, z));
        }
        else if (instruction == "f") {
            std::vector<Tuple> ps, ns;
            for (std::string token; iss >> token;) {
                FaceVertex fv;
                Tuple p, n;
                if (!parse_face_vertex(token, fv) || !lookup(mesh.vertices, fv.v, p)) throw parse_error(lineno, "bad face vertex " + token);
                ps.push_back(p);
                if (fv.n != 0) {
                    if (!lookup(mesh.normals, fv.n, n)) throw parse_error(lineno, "bad face normal " + token);
                    ns.push_back(n);
                }
            }
            if (ps.size() < 3) throw parse_error(lineno, "face needs three vertices");
            bool smooth = ns.size() == ps.size();
            for (std::size_t i = 1; i + 1 < ps.size(); ++i) {
                ShapeId tri = smooth ? graph.add(SmoothTriangle(ps[0], ps[i], ps[i + 1], ns[0], ns[i], ns[i + 1]), glm::dmat4(1.0), material)
                                     : graph.add(Triangle(ps[0], ps[i], ps[i + 1]), glm::dmat4(1.0), material);
                graph.add_child(mesh.groups.back(), tri);
            }
        }
        else if (instruction == "g") {
            ShapeId group = graph.add(Group{});
            graph.add_child(mesh.root, group);
            mesh.groups.push_back(group);
        }
        else
            ++mesh.ignored;
    }
    return mesh;
}

ObjMesh parse_obj_file(const std::string &filename, SceneGraph &graph, const Material &material) {
    std::ifstream fin(filename);
    if (!fin) {
        std::cerr << "Error opening file " << filename << std::endl;
        return ObjMesh();
    }
    return parse_obj(fin, graph, material);
}

}
