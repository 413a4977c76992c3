#include <catch2/catch.hpp>

#include <cmath>

#include "SpatialMapper.h"

namespace {
// 相机距平面 8，垂直视角 75 度时画面上沿的世界 y
const float HALF_HEIGHT = 8.0f * std::tan(37.5f * 3.14159265f / 180.0f);
} // namespace

TEST_CASE("Screen center maps to the origin", "[mapper]") {
    Camera cam;
    auto   p = SpatialMapper::MapToPlane(0.5f, 0.5f, cam);
    REQUIRE(p.has_value());
    CHECK(p->x == Approx(0.0f).margin(1e-3));
    CHECK(p->y == Approx(0.0f).margin(1e-3));
    CHECK(p->z == Approx(0.0f).margin(1e-3));
}

TEST_CASE("Screen edges map to the visible frustum on z=0", "[mapper]") {
    Camera cam;
    cam.aspect = 16.0f / 9.0f;

    auto top = SpatialMapper::MapToPlane(0.5f, 0.0f, cam);
    REQUIRE(top.has_value());
    CHECK(top->y == Approx(HALF_HEIGHT).epsilon(1e-2));
    CHECK(top->z == Approx(0.0f).margin(1e-3));

    auto right = SpatialMapper::MapToPlane(1.0f, 0.5f, cam);
    REQUIRE(right.has_value());
    CHECK(right->x == Approx(HALF_HEIGHT * cam.aspect).epsilon(1e-2));
    CHECK(right->y == Approx(0.0f).margin(1e-3));
}

TEST_CASE("Image y axis is flipped into world y", "[mapper]") {
    Camera cam;
    auto   upper = SpatialMapper::MapToPlane(0.25f, 0.25f, cam);
    auto   lower = SpatialMapper::MapToPlane(0.25f, 0.75f, cam);
    REQUIRE(upper.has_value());
    REQUIRE(lower.has_value());
    CHECK(upper->y > 0.0f);
    CHECK(lower->y < 0.0f);
    CHECK(upper->x < 0.0f);
    CHECK(upper->x == Approx(lower->x).margin(1e-3));
}

TEST_CASE("Mapping follows a translated camera", "[mapper]") {
    Camera cam;
    cam.position = glm::vec3(2.0f, -1.0f, 8.0f);
    auto p       = SpatialMapper::MapToPlane(0.5f, 0.5f, cam);
    REQUIRE(p.has_value());
    CHECK(p->x == Approx(2.0f).margin(1e-3));
    CHECK(p->y == Approx(-1.0f).margin(1e-3));
    CHECK(p->z == Approx(0.0f).margin(1e-3));
}

TEST_CASE("Degenerate projection yields no position", "[mapper]") {
    Camera cam;
    cam.fov = 0.0f;
    CHECK_FALSE(SpatialMapper::MapToPlane(0.5f, 0.5f, cam).has_value());
    CHECK_FALSE(SpatialMapper::MapToPlane(0.1f, 0.9f, cam).has_value());
}
