#include <fstream>
#include <iostream>
#include <sstream>
#include <stack>
#include <utility>
#include <vector>

#include "prism/error.hpp"
#include "prism/obj_parser.hpp"
#include "prism/parse_scene.hpp"

#include <glm/gtc/constants.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace prism {

namespace {

template <typename... T>
void read(std::istringstream &iss, int lineno, T &...args) {
    if (!(iss >> ... >> args)) throw parse_error(lineno, "missing or malformed arguments");
}

bool read_closed(std::istringstream &iss, int lineno) {
    std::string s;
    read(iss, lineno, s);
    if (s != "open" && s != "closed") throw parse_error(lineno, "expected open or closed, got " + s);
    return s == "closed";
}

double radians(double degrees) { return degrees * glm::pi<double>() / 180.0; }

// A pending group or CSG; its members are created before the node itself.
struct Frame {
    bool csg = false;
    CsgOp op = CsgOp::Union;
    glm::dmat4 transform = glm::dmat4(1.0);
    std::vector<ShapeId> members;
    std::size_t depth = 0; // transform stack size right after the frame opened
};

}

Camera Scene::camera() const {
    return Camera(width, height, radians(fov), view_transform(camera_from, camera_to, camera_up));
}

Scene parse_scene(std::istream &in, const std::string &base_dir) {
    Scene scene;
    scene.world.light = default_light();

    auto string_trim = [](std::string s) -> std::string {
        const auto str_begin = s.find_first_not_of(" \t\r");
        if (str_begin == std::string::npos) return "";
        const auto str_end = s.find_last_not_of(" \t\r");
        return s.substr(str_begin, str_end - str_begin + 1);
    };

    glm::dmat4 current_transform(1.0);
    std::stack<glm::dmat4> transform_stack;
    std::vector<Frame> frames;
    std::vector<Tuple> vertices;
    std::vector<std::pair<Tuple, Tuple>> vertices_norm;
    Material current_material;
    bool light_set = false;
    SceneGraph &graph = scene.world.shapes;

    auto place = [&](ShapeId id) {
        if (frames.empty()) scene.world.add_object(id);
        else
            frames.back().members.push_back(id);
    };
    auto add_shape = [&](const Geometry &geometry) { place(graph.add(geometry, current_transform, current_material)); };
    auto begin_frame = [&](Frame frame) {
        frame.transform = current_transform;
        transform_stack.push(current_transform);
        frame.depth = transform_stack.size();
        frames.push_back(frame);
        current_transform = glm::dmat4(1.0);
    };
    auto end_frame = [&](int lineno, bool csg) -> Frame {
        if (frames.empty() || frames.back().csg != csg) throw parse_error(lineno, csg ? "endCSG without beginCSG" : "endGroup without beginGroup");
        if (transform_stack.size() != frames.back().depth) throw parse_error(lineno, "pushTransform without popTransform inside a group or csg");
        Frame frame = frames.back();
        frames.pop_back();
        current_transform = transform_stack.top();
        transform_stack.pop();
        return frame;
    };

    int lineno = 0;
    for (std::string line; std::getline(in, line);) {
        ++lineno;
        auto comment_pos = line.find("#");
        if (comment_pos != std::string::npos) line = line.substr(0, comment_pos);
        line = string_trim(line);
        if (line == "") continue;
        std::istringstream iss(line);
        std::string instruction;
        iss >> instruction;
        try {
            if (instruction == "size") {
                read(iss, lineno, scene.width, scene.height);
            }
            else if (instruction == "maxdepth") {
                read(iss, lineno, scene.maxdepth);
            }
            else if (instruction == "output") {
                read(iss, lineno, scene.output_filename);
            }
            else if (instruction == "camera") {
                double fx, fy, fz, tx, ty, tz, ux, uy, uz;
                read(iss, lineno, fx, fy, fz, tx, ty, tz, ux, uy, uz, scene.fov);
                scene.camera_from = point(fx, fy, fz);
                scene.camera_to = point(tx, ty, tz);
                scene.camera_up = vector(ux, uy, uz);
            }
            else if (instruction == "point" || instruction == "light") {
                double x, y, z, r, g, b;
                read(iss, lineno, x, y, z, r, g, b);
                if (light_set) std::cerr << "line " << lineno << ": only one light is supported, replacing the previous one" << std::endl;
                scene.world.light = PointLight(point(x, y, z), color(r, g, b));
                light_set = true;
            }
            else if (instruction == "fresnel") {
                std::string s;
                read(iss, lineno, s);
                scene.world.fresnel = s == "on";
            }
            else if (instruction == "translate") {
                double x, y, z;
                read(iss, lineno, x, y, z);
                current_transform = current_transform * translation(x, y, z);
            }
            else if (instruction == "rotate") {
                double x, y, z, angle;
                read(iss, lineno, x, y, z, angle);
                if (x == 0 && y == 0 && z == 0) throw parse_error(lineno, "rotation axis cannot be zero");
                current_transform = glm::rotate(current_transform, radians(angle), glm::dvec3(x, y, z));
            }
            else if (instruction == "scale") {
                double x, y, z;
                read(iss, lineno, x, y, z);
                current_transform = current_transform * scaling(x, y, z);
            }
            else if (instruction == "pushTransform") {
                transform_stack.push(current_transform);
            }
            else if (instruction == "popTransform") {
                if (transform_stack.empty()) throw parse_error(lineno, "popTransform on an empty stack");
                if (!frames.empty() && transform_stack.size() <= frames.back().depth) throw parse_error(lineno, "popTransform past the start of a group or csg");
                current_transform = transform_stack.top();
                transform_stack.pop();
            }
            else if (instruction == "color") {
                double r, g, b;
                read(iss, lineno, r, g, b);
                current_material = current_material.with_color(color(r, g, b));
            }
            else if (instruction == "ambient") {
                double v;
                read(iss, lineno, v);
                current_material = current_material.with_ambient(v);
            }
            else if (instruction == "diffuse") {
                double v;
                read(iss, lineno, v);
                current_material = current_material.with_diffuse(v);
            }
            else if (instruction == "specular") {
                double v;
                read(iss, lineno, v);
                current_material = current_material.with_specular(v);
            }
            else if (instruction == "shininess") {
                double v;
                read(iss, lineno, v);
                current_material = current_material.with_shininess(v);
            }
            else if (instruction == "reflective") {
                double v;
                read(iss, lineno, v);
                current_material = current_material.with_reflective(v);
            }
            else if (instruction == "transparency") {
                double v;
                read(iss, lineno, v);
                current_material = current_material.with_transparency(v);
            }
            else if (instruction == "refractiveindex") {
                double v;
                read(iss, lineno, v);
                current_material = current_material.with_refractive_index(v);
            }
            else if (instruction == "pattern") {
                std::string kind;
                double r0, g0, b0, r1, g1, b1;
                read(iss, lineno, kind, r0, g0, b0, r1, g1, b1);
                PatternType type;
                if (kind == "stripe") type = PatternType::Stripe;
                else if (kind == "gradient")
                    type = PatternType::Gradient;
                else if (kind == "ring")
                    type = PatternType::Ring;
                else if (kind == "checker")
                    type = PatternType::Checker;
                else
                    throw parse_error(lineno, "unknown pattern " + kind);
                current_material = current_material.with_pattern(Pattern(type, color(r0, g0, b0), color(r1, g1, b1)));
            }
            else if (instruction == "patterntransform") {
                if (!current_material.pattern()) throw parse_error(lineno, "patterntransform without a pattern");
                Pattern pattern = *current_material.pattern();
                pattern.set_transform(current_transform);
                current_material = current_material.with_pattern(pattern);
            }
            else if (instruction == "nopattern") {
                current_material = current_material.without_pattern();
            }
            else if (instruction == "sphere") {
                add_shape(Sphere{});
            }
            else if (instruction == "plane") {
                add_shape(Plane{});
            }
            else if (instruction == "cube") {
                add_shape(Cube{});
            }
            else if (instruction == "cylinder") {
                Cylinder cyl;
                read(iss, lineno, cyl.minimum, cyl.maximum);
                cyl.closed = read_closed(iss, lineno);
                add_shape(cyl);
            }
            else if (instruction == "cone") {
                Cone cone;
                read(iss, lineno, cone.minimum, cone.maximum);
                cone.closed = read_closed(iss, lineno);
                add_shape(cone);
            }
            else if (instruction == "maxverts" || instruction == "maxvertnorms") {
                // Do nothing
            }
            else if (instruction == "vertex") {
                double x, y, z;
                read(iss, lineno, x, y, z);
                vertices.push_back(point(x, y, z));
            }
            else if (instruction == "vertexnormal") {
                double x, y, z, nx, ny, nz;
                read(iss, lineno, x, y, z, nx, ny, nz);
                vertices_norm.push_back({point(x, y, z), vector(nx, ny, nz)});
            }
            else if (instruction == "tri") {
                std::size_t v0, v1, v2;
                read(iss, lineno, v0, v1, v2);
                if (v0 >= vertices.size() || v1 >= vertices.size() || v2 >= vertices.size()) throw parse_error(lineno, "vertex index out of range");
                add_shape(Triangle(vertices[v0], vertices[v1], vertices[v2]));
            }
            else if (instruction == "trinormal") {
                std::size_t v0, v1, v2;
                read(iss, lineno, v0, v1, v2);
                if (v0 >= vertices_norm.size() || v1 >= vertices_norm.size() || v2 >= vertices_norm.size())
                    throw parse_error(lineno, "vertex index out of range");
                add_shape(SmoothTriangle(vertices_norm[v0].first, vertices_norm[v1].first, vertices_norm[v2].first, vertices_norm[v0].second,
                                         vertices_norm[v1].second, vertices_norm[v2].second));
            }
            else if (instruction == "obj") {
                std::string filename;
                read(iss, lineno, filename);
                if (!base_dir.empty() && filename.front() != '/') filename = base_dir + "/" + filename;
                ObjMesh mesh;
                try {
                    mesh = parse_obj_file(filename, graph, current_material);
                }
                catch (const parse_error &e) {
                    throw parse_error(lineno, filename + ": " + e.what());
                }
                if (mesh.root == NO_SHAPE) throw parse_error(lineno, "cannot load " + filename);
                graph.set_transform(mesh.root, current_transform);
                place(mesh.root);
            }
            else if (instruction == "beginGroup") {
                begin_frame(Frame());
            }
            else if (instruction == "endGroup") {
                Frame frame = end_frame(lineno, false);
                ShapeId group = graph.add(Group{}, frame.transform);
                for (ShapeId id: frame.members) graph.add_child(group, id);
                place(group);
            }
            else if (instruction == "beginCSG") {
                std::string op;
                read(iss, lineno, op);
                Frame frame;
                frame.csg = true;
                if (op == "union") frame.op = CsgOp::Union;
                else if (op == "intersection")
                    frame.op = CsgOp::Intersection;
                else if (op == "difference")
                    frame.op = CsgOp::Difference;
                else
                    throw parse_error(lineno, "unknown csg operation " + op);
                begin_frame(frame);
            }
            else if (instruction == "endCSG") {
                Frame frame = end_frame(lineno, true);
                if (frame.members.size() != 2) throw parse_error(lineno, "csg needs exactly two operands");
                place(graph.add_csg(frame.op, frame.members[0], frame.members[1], frame.transform));
            }
            else {
                std::cerr << "Unknown instruction: " << instruction << std::endl;
            }
        }
        catch (const precondition_error &e) {
            throw parse_error(lineno, e.what());
        }
    }
    if (!frames.empty()) throw parse_error(lineno, "unterminated group or csg");
    return scene;
}

std::optional<Scene> parse_scene_file(const std::string &filename) {
    std::ifstream fin(filename);
    if (!fin) {
        std::cerr << "Error opening file " << filename << std::endl;
        return std::nullopt;
    }
    auto slash = filename.find_last_of('/');
    return parse_scene(fin, slash == std::string::npos ? "" : filename.substr(0, slash));
}

}
