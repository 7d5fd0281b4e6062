#include <catch2/catch.hpp>
#include <cmath>

#include "prism/scene_graph.hpp"
#include "prism/shading.hpp"

using namespace prism;

TEST_CASE("An intersection encapsulates t and object", "[intersection]") {
    Intersection i(3.5, 7);
    CHECK(i.t == 3.5);
    CHECK(i.object == 7);
    CHECK(i.u == 0.0);
    CHECK(i.v == 0.0);
}

TEST_CASE("Aggregating intersections keeps them sorted", "[intersection]") {
    Intersections xs{Intersection(5, 0), Intersection(-3, 0), Intersection(2, 0), Intersection(7, 0)};
    REQUIRE(xs.size() == 4);
    CHECK(xs[0].t == -3);
    CHECK(xs[1].t == 2);
    CHECK(xs[2].t == 5);
    CHECK(xs[3].t == 7);

    xs.add(Intersection(3, 1));
    REQUIRE(xs.size() == 5);
    CHECK(xs[2].t == 3);

    xs.merge(Intersections{Intersection(-10, 2), Intersection(6, 2)});
    REQUIRE(xs.size() == 7);
    CHECK(xs[0].t == -10);
    CHECK(xs[5].t == 6);
}

TEST_CASE("Equal t values keep their insertion order", "[intersection]") {
    Intersections xs{Intersection(1, 3), Intersection(1, 4)};
    xs.add(Intersection(1, 5));
    CHECK(xs[0].object == 3);
    CHECK(xs[1].object == 4);
    CHECK(xs[2].object == 5);
}

TEST_CASE("The hit", "[intersection]") {
    SECTION("all intersections have positive t") {
        Intersections xs{Intersection(1, 0), Intersection(2, 0)};
        REQUIRE(xs.hit());
        CHECK(*xs.hit() == Intersection(1, 0));
    }
    SECTION("some intersections have negative t") {
        Intersections xs{Intersection(-1, 0), Intersection(1, 0)};
        REQUIRE(xs.hit());
        CHECK(xs.hit()->t == 1);
    }
    SECTION("all intersections have negative t") {
        Intersections xs{Intersection(-2, 0), Intersection(-1, 0)};
        CHECK_FALSE(xs.hit());
    }
    SECTION("is always the lowest nonnegative intersection") {
        Intersections xs{Intersection(5, 0), Intersection(7, 0), Intersection(-3, 0), Intersection(2, 0)};
        REQUIRE(xs.hit());
        CHECK(xs.hit()->t == 2);
    }
    SECTION("t of exactly zero is not a hit") {
        Intersections xs{Intersection(0, 0)};
        CHECK_FALSE(xs.hit());
    }
    SECTION("empty list") {
        CHECK_FALSE(Intersections().hit());
    }
}

TEST_CASE("Precomputing the state of an intersection", "[intersection][comps]") {
    SceneGraph g;

    SECTION("hit on the outside") {
        ShapeId s = g.add(Sphere{});
        Ray r(point(0, 0, -5), vector(0, 0, 1));
        Comps comps = prepare_computations(g, Intersection(4, s), r);
        CHECK(comps.t == 4);
        CHECK(comps.object == s);
        CHECK(comps.point == point(0, 0, -1));
        CHECK(comps.eye_v == vector(0, 0, -1));
        CHECK(comps.normal == vector(0, 0, -1));
        CHECK_FALSE(comps.inside);
    }
    SECTION("hit on the inside") {
        ShapeId s = g.add(Sphere{});
        Ray r(point(0, 0, 0), vector(0, 0, 1));
        Comps comps = prepare_computations(g, Intersection(1, s), r);
        CHECK(comps.point == point(0, 0, 1));
        CHECK(comps.eye_v == vector(0, 0, -1));
        CHECK(comps.inside);
        CHECK(comps.normal == vector(0, 0, -1));
    }
    SECTION("the reflection vector") {
        ShapeId p = g.add(Plane{});
        double h = std::sqrt(2.0) / 2;
        Ray r(point(0, 1, -1), vector(0, -h, h));
        Comps comps = prepare_computations(g, Intersection(std::sqrt(2.0), p), r);
        CHECK(comps.reflect_v == vector(0, h, h));
    }
    SECTION("the hit offsets the point above and below the surface") {
        ShapeId s = g.add(Sphere{}, translation(0, 0, 1), glass());
        Ray r(point(0, 0, -5), vector(0, 0, 1));
        Comps comps = prepare_computations(g, Intersection(5, s), r);
        CHECK(comps.over_point.z() < -PRISM_EPS / 2);
        CHECK(comps.point.z() > comps.over_point.z());
        CHECK(comps.under_point.z() > PRISM_EPS / 2);
        CHECK(comps.point.z() < comps.under_point.z());
    }
}

TEST_CASE("Finding n1 and n2 at various intersections", "[intersection][comps]") {
    SceneGraph g;
    ShapeId a = g.add(Sphere{}, scaling(2, 2, 2), glass().with_refractive_index(1.5));
    ShapeId b = g.add(Sphere{}, translation(0, 0, -0.25), glass().with_refractive_index(2.0));
    ShapeId c = g.add(Sphere{}, translation(0, 0, 0.25), glass().with_refractive_index(2.5));
    Ray r(point(0, 0, -4), vector(0, 0, 1));
    Intersections xs{Intersection(2, a), Intersection(2.75, b), Intersection(3.25, c),
                     Intersection(4.75, b), Intersection(5.25, c), Intersection(6, a)};
    double expected[][2] = {{1.0, 1.5}, {1.5, 2.0}, {2.0, 2.5}, {2.5, 2.5}, {2.5, 1.5}, {1.5, 1.0}};
    for (std::size_t i = 0; i < xs.size(); ++i) {
        Comps comps = prepare_computations(g, xs[i], r, xs);
        CHECK(comps.n1 == Approx(expected[i][0]));
        CHECK(comps.n2 == Approx(expected[i][1]));
    }
}

TEST_CASE("The Schlick approximation", "[intersection][comps]") {
    SceneGraph g;
    ShapeId s = g.add(Sphere{}, glm::dmat4(1.0), glass());

    SECTION("under total internal reflection") {
        double h = std::sqrt(2.0) / 2;
        Ray r(point(0, 0, h), vector(0, 1, 0));
        Intersections xs{Intersection(-h, s), Intersection(h, s)};
        Comps comps = prepare_computations(g, xs[1], r, xs);
        CHECK(schlick(comps) == Approx(1.0));
    }
    SECTION("with a perpendicular viewing angle") {
        Ray r(point(0, 0, 0), vector(0, 1, 0));
        Intersections xs{Intersection(-1, s), Intersection(1, s)};
        Comps comps = prepare_computations(g, xs[1], r, xs);
        CHECK(schlick(comps) == Approx(0.04));
    }
    SECTION("with small angle and n2 > n1") {
        Ray r(point(0, 0.99, -2), vector(0, 0, 1));
        Intersections xs{Intersection(1.8589, s)};
        Comps comps = prepare_computations(g, xs[0], r, xs);
        CHECK(schlick(comps) == Approx(0.48873).epsilon(1e-4));
    }
}
