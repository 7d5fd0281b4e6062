#include <catch2/catch.hpp>
#include <cmath>

#include "prism/error.hpp"
#include "prism/world.hpp"

#include "helpers.hpp"

using namespace prism;

namespace {

const double H = std::sqrt(2.0) / 2;

void set_material(World &w, ShapeId id, const Material &m) { w.shapes.set_material(id, m); }

}

TEST_CASE("Creating a world", "[world]") {
    World w;
    CHECK(w.objects.empty());
    CHECK(w.shapes.size() == 0);
    CHECK_FALSE(w.fresnel);
}

TEST_CASE("The default world", "[world]") {
    World w = World::default_world();
    CHECK(w.light.position == point(-10, 10, -10));
    CHECK(w.light.intensity == WHITE);
    REQUIRE(w.objects.size() == 2);
    const Shape &outer = w.shapes[w.objects[0]];
    const Shape &inner = w.shapes[w.objects[1]];
    CHECK(outer.material.color() == color(0.8, 1.0, 0.6));
    CHECK(outer.material.diffuse() == Approx(0.7));
    CHECK(outer.material.specular() == Approx(0.2));
    CHECK(approx_equal(inner.transform, scaling(0.5, 0.5, 0.5)));
}

TEST_CASE("Intersect a world with a ray", "[world]") {
    World w = World::default_world();
    Intersections xs = w.intersect_world(Ray(point(0, 0, -5), vector(0, 0, 1)));
    REQUIRE(xs.size() == 4);
    CHECK(xs[0].t == Approx(4));
    CHECK(xs[1].t == Approx(4.5));
    CHECK(xs[2].t == Approx(5.5));
    CHECK(xs[3].t == Approx(6));
}

TEST_CASE("Only root shapes can be world objects", "[world]") {
    World w;
    ShapeId group = w.shapes.add(Group{});
    ShapeId s = w.shapes.add(Sphere{});
    w.shapes.add_child(group, s);
    CHECK_THROWS_AS(w.add_object(s), precondition_error);
    w.add_object(group);
    CHECK(w.intersect_world(Ray(point(0, 0, -5), vector(0, 0, 1))).size() == 2);
}

TEST_CASE("A world object is added only once", "[world]") {
    World w;
    ShapeId s = w.add_object(Sphere{});
    CHECK_THROWS_AS(w.add_object(s), precondition_error);
    CHECK(w.objects.size() == 1);
    CHECK(w.intersect_world(Ray(point(0, 0, -5), vector(0, 0, 1))).size() == 2);
}

TEST_CASE("A world object adopted by a group is reached only through it", "[world]") {
    World w;
    ShapeId s = w.add_object(Sphere{}, translation(5, 0, 0));
    ShapeId grp = w.add_object(Group{}, translation(-5, 0, 0));
    w.shapes.add_child(grp, s);
    CHECK(w.intersect_world(Ray(point(5, 0, -5), vector(0, 0, 1))).empty());
    Intersections xs = w.intersect_world(Ray(point(0, 0, -5), vector(0, 0, 1)));
    REQUIRE(xs.size() == 2);
    CHECK(xs[0].object == s);
    CHECK(xs[1].object == s);
}

TEST_CASE("Shading an intersection", "[world]") {
    World w = World::default_world();

    SECTION("from the outside") {
        Ray r(point(0, 0, -5), vector(0, 0, 1));
        Comps comps = prepare_computations(w.shapes, Intersection(4, w.objects[0]), r);
        CHECK(near(w.shade_hit(comps), color(0.38066, 0.47583, 0.2855)));
    }
    SECTION("from the inside") {
        w.light = PointLight(point(0, 0.25, 0), WHITE);
        Ray r(point(0, 0, 0), vector(0, 0, 1));
        Comps comps = prepare_computations(w.shapes, Intersection(0.5, w.objects[1]), r);
        CHECK(near(w.shade_hit(comps), color(0.90498, 0.90498, 0.90498)));
    }
    SECTION("in shadow") {
        World w2(PointLight(point(0, 0, -10), WHITE));
        w2.add_object(Sphere{});
        ShapeId s2 = w2.add_object(Sphere{}, translation(0, 0, 10));
        Ray r(point(0, 0, 5), vector(0, 0, 1));
        Comps comps = prepare_computations(w2.shapes, Intersection(4, s2), r);
        CHECK(near(w2.shade_hit(comps), color(0.1, 0.1, 0.1)));
    }
}

TEST_CASE("The color of a ray", "[world]") {
    World w = World::default_world();

    SECTION("when it misses") {
        CHECK(w.color_at(Ray(point(0, 0, -5), vector(0, 1, 0))) == BLACK);
    }
    SECTION("when it hits") {
        CHECK(near(w.color_at(Ray(point(0, 0, -5), vector(0, 0, 1))), color(0.38066, 0.47583, 0.2855)));
    }
    SECTION("with an intersection behind the ray") {
        set_material(w, w.objects[0], w.shapes[w.objects[0]].material.with_ambient(1));
        set_material(w, w.objects[1], w.shapes[w.objects[1]].material.with_ambient(1));
        Tuple c = w.color_at(Ray(point(0, 0, 0.75), vector(0, 0, -1)));
        CHECK(c == w.shapes[w.objects[1]].material.color());
    }
}

TEST_CASE("Shadows", "[world]") {
    World w = World::default_world();
    CHECK_FALSE(w.is_shadowed(point(0, 10, 0)));
    CHECK(w.is_shadowed(point(10, -10, 10)));
    CHECK_FALSE(w.is_shadowed(point(-20, 20, -20)));
    CHECK_FALSE(w.is_shadowed(point(-2, 2, -2)));
}

TEST_CASE("Reflection", "[world]") {
    World w = World::default_world();

    SECTION("the reflected color for a nonreflective material") {
        set_material(w, w.objects[1], w.shapes[w.objects[1]].material.with_ambient(1));
        Ray r(point(0, 0, 0), vector(0, 0, 1));
        Comps comps = prepare_computations(w.shapes, Intersection(1, w.objects[1]), r);
        CHECK(w.reflected_color(comps) == BLACK);
    }
    SECTION("the reflected color for a reflective material") {
        ShapeId p = w.add_object(Plane{}, translation(0, -1, 0), Material().with_reflective(0.5));
        Ray r(point(0, 0, -3), vector(0, -H, H));
        Comps comps = prepare_computations(w.shapes, Intersection(std::sqrt(2.0), p), r);
        CHECK(near(w.reflected_color(comps), color(0.19033, 0.23791, 0.14274)));
    }
    SECTION("shade_hit with a reflective material") {
        ShapeId p = w.add_object(Plane{}, translation(0, -1, 0), Material().with_reflective(0.5));
        Ray r(point(0, 0, -3), vector(0, -H, H));
        Comps comps = prepare_computations(w.shapes, Intersection(std::sqrt(2.0), p), r);
        CHECK(near(w.shade_hit(comps), color(0.87675, 0.92434, 0.82917)));
    }
    SECTION("the reflected color at the maximum recursive depth") {
        ShapeId p = w.add_object(Plane{}, translation(0, -1, 0), Material().with_reflective(0.5));
        Ray r(point(0, 0, -3), vector(0, -H, H));
        Comps comps = prepare_computations(w.shapes, Intersection(std::sqrt(2.0), p), r);
        CHECK(w.reflected_color(comps, 0) == BLACK);
    }
}

TEST_CASE("Mutually reflective surfaces terminate", "[world]") {
    World w(PointLight(point(0, 0, 0), WHITE));
    w.add_object(Plane{}, translation(0, -1, 0), Material().with_reflective(1));
    w.add_object(Plane{}, translation(0, 1, 0), Material().with_reflective(1));
    Tuple c = w.color_at(Ray(point(0, 0, 0), vector(0, 1, 0)));
    REQUIRE(c.is_color());
    CHECK(std::isfinite(c.x()));
    CHECK(std::isfinite(c.y()));
    CHECK(std::isfinite(c.z()));
    // six lit bounces of ambient 0.1 + diffuse 0.9 + specular 0.9 before the depth runs out
    CHECK(near(c, color(11.4, 11.4, 11.4)));
}

TEST_CASE("Refraction", "[world]") {
    World w = World::default_world();
    ShapeId a = w.objects[0], b = w.objects[1];

    SECTION("the refracted color with an opaque surface") {
        Ray r(point(0, 0, -5), vector(0, 0, 1));
        Intersections xs{Intersection(4, a), Intersection(6, a)};
        Comps comps = prepare_computations(w.shapes, xs[0], r, xs);
        CHECK(w.refracted_color(comps, 5) == BLACK);
    }
    SECTION("the refracted color at the maximum recursive depth") {
        set_material(w, a, w.shapes[a].material.with_transparency(1.0).with_refractive_index(1.5));
        Ray r(point(0, 0, -5), vector(0, 0, 1));
        Intersections xs{Intersection(4, a), Intersection(6, a)};
        Comps comps = prepare_computations(w.shapes, xs[0], r, xs);
        CHECK(w.refracted_color(comps, 0) == BLACK);
    }
    SECTION("the refracted color under total internal reflection") {
        set_material(w, a, w.shapes[a].material.with_transparency(1.0).with_refractive_index(1.5));
        Ray r(point(0, 0, H), vector(0, 1, 0));
        Intersections xs{Intersection(-H, a), Intersection(H, a)};
        Comps comps = prepare_computations(w.shapes, xs[1], r, xs);
        CHECK(w.refracted_color(comps, 5) == BLACK);
    }
    SECTION("the refracted color with a refracted ray") {
        set_material(w, a, w.shapes[a].material.with_ambient(1.0).with_pattern(Pattern(PatternType::Test)));
        set_material(w, b, w.shapes[b].material.with_transparency(1.0).with_refractive_index(1.5));
        Ray r(point(0, 0, 0.1), vector(0, 1, 0));
        Intersections xs{Intersection(-0.9899, a), Intersection(-0.4899, b), Intersection(0.4899, b), Intersection(0.9899, a)};
        Comps comps = prepare_computations(w.shapes, xs[2], r, xs);
        CHECK(near(w.refracted_color(comps, 5), color(0, 0.99888, 0.04725)));
    }
    SECTION("shade_hit with a transparent material") {
        ShapeId floor = w.add_object(Plane{}, translation(0, -1, 0), Material().with_transparency(0.5).with_refractive_index(1.5));
        w.add_object(Sphere{}, translation(0, -3.5, -0.5), Material().with_color(color(1, 0, 0)).with_ambient(0.5));
        Ray r(point(0, 0, -3), vector(0, -H, H));
        Intersections xs{Intersection(std::sqrt(2.0), floor)};
        Comps comps = prepare_computations(w.shapes, xs[0], r, xs);
        CHECK(near(w.shade_hit(comps, 5), color(0.93642, 0.68642, 0.68642)));
    }
}

TEST_CASE("shade_hit with a reflective, transparent material", "[world]") {
    World w = World::default_world();
    ShapeId floor = w.add_object(Plane{}, translation(0, -1, 0),
                                 Material().with_reflective(0.5).with_transparency(0.5).with_refractive_index(1.5));
    w.add_object(Sphere{}, translation(0, -3.5, -0.5), Material().with_color(color(1, 0, 0)).with_ambient(0.5));
    Ray r(point(0, 0, -3), vector(0, -H, H));
    Intersections xs{Intersection(std::sqrt(2.0), floor)};
    Comps comps = prepare_computations(w.shapes, xs[0], r, xs);

    SECTION("blended by the Schlick approximation") {
        w.fresnel = true;
        CHECK(near(w.shade_hit(comps, 5), color(0.93391, 0.69643, 0.69243)));
    }
    SECTION("summed unweighted by default") {
        Tuple surface = lighting(w.shapes[floor].material, w.light, comps.point, comps.eye_v, comps.normal, w.is_shadowed(comps.over_point), w.shapes, floor);
        Tuple expected = surface + w.reflected_color(comps, 5) + w.refracted_color(comps, 5);
        CHECK(near(w.shade_hit(comps, 5), expected));
    }
}
