#include <catch2/catch.hpp>

#include <glm/glm.hpp>

#include "ParticleSystem.h"

TEST_CASE("Sphere shape lies on the sphere radius", "[particles]") {
    std::mt19937   rng(42);
    ParticleShapes shapes;
    REQUIRE(ParticleSystem::GenerateShapes(5000, 1.5f, 8.0f, rng, shapes));
    REQUIRE(shapes.assembled.size() == 5000);
    REQUIRE(shapes.exploded.size() == 5000);

    for (const glm::vec3& p : shapes.assembled) {
        CHECK(glm::length(p) == Approx(1.5f).margin(1e-4));
    }
}

TEST_CASE("Explosion shape stays inside the shell", "[particles]") {
    std::mt19937   rng(7);
    ParticleShapes shapes;
    REQUIRE(ParticleSystem::GenerateShapes(2000, 1.5f, 8.0f, rng, shapes));

    for (const glm::vec3& p : shapes.exploded) {
        float r = glm::length(p);
        CHECK(r >= 1.5f - 1e-4f);
        CHECK(r <= 8.0f + 1e-4f);
    }
}

TEST_CASE("Sphere shape is deterministic, explosion follows the seed", "[particles]") {
    std::mt19937   rngA(1), rngB(1), rngC(2);
    ParticleShapes a, b, c;
    REQUIRE(ParticleSystem::GenerateShapes(100, 1.5f, 8.0f, rngA, a));
    REQUIRE(ParticleSystem::GenerateShapes(100, 1.5f, 8.0f, rngB, b));
    REQUIRE(ParticleSystem::GenerateShapes(100, 1.5f, 8.0f, rngC, c));

    CHECK(a.assembled == c.assembled);
    CHECK(a.exploded == b.exploded);
    CHECK(a.exploded != c.exploded);
}

TEST_CASE("Single particle sits at the sphere pole", "[particles]") {
    std::mt19937   rng(3);
    ParticleShapes shapes;
    REQUIRE(ParticleSystem::GenerateShapes(1, 2.0f, 2.0f, rng, shapes));
    REQUIRE(shapes.assembled.size() == 1);
    CHECK(shapes.assembled[0].z == Approx(-2.0f).margin(1e-5));
    // 爆炸半径等于球半径时退化为球面
    CHECK(glm::length(shapes.exploded[0]) == Approx(2.0f).margin(1e-4));
}

TEST_CASE("Invalid parameters leave the output untouched", "[particles]") {
    ParticleShapes shapes;
    shapes.assembled.push_back(glm::vec3(1.0f));

    CHECK_FALSE(ParticleSystem::GenerateShapes(0, 1.5f, 8.0f, shapes));
    CHECK_FALSE(ParticleSystem::GenerateShapes(-5, 1.5f, 8.0f, shapes));
    CHECK_FALSE(ParticleSystem::GenerateShapes(10, 0.0f, 8.0f, shapes));
    CHECK_FALSE(ParticleSystem::GenerateShapes(10, 3.0f, 2.0f, shapes));

    REQUIRE(shapes.assembled.size() == 1);
    CHECK(shapes.exploded.empty());
}

TEST_CASE("Interpolation blends the two shapes per index", "[particles]") {
    ParticleShapes shapes;
    shapes.assembled = {glm::vec3(0.0f, 0.0f, 0.0f), glm::vec3(1.0f, 1.0f, 1.0f)};
    shapes.exploded  = {glm::vec3(2.0f, 4.0f, 6.0f), glm::vec3(3.0f, 1.0f, -1.0f)};

    std::vector<glm::vec3> out(2);

    ParticleSystem::InterpolatePositions(shapes, 0.0f, out);
    CHECK(out[0] == shapes.assembled[0]);
    CHECK(out[1] == shapes.assembled[1]);

    ParticleSystem::InterpolatePositions(shapes, 1.0f, out);
    CHECK(out[0] == shapes.exploded[0]);
    CHECK(out[1] == shapes.exploded[1]);

    // 0.5 时为精确的算术平均
    ParticleSystem::InterpolatePositions(shapes, 0.5f, out);
    CHECK(out[0] == glm::vec3(1.0f, 2.0f, 3.0f));
    CHECK(out[1] == glm::vec3(2.0f, 1.0f, 0.0f));
}

TEST_CASE("Half factor is the exact mean of generated shapes", "[particles]") {
    std::mt19937   rng(19);
    ParticleShapes shapes;
    REQUIRE(ParticleSystem::GenerateShapes(500, 1.5f, 8.0f, rng, shapes));

    std::vector<glm::vec3> out(shapes.assembled.size());
    ParticleSystem::InterpolatePositions(shapes, 0.5f, out);
    for (size_t i = 0; i < out.size(); i++) {
        CHECK(out[i] == (shapes.assembled[i] + shapes.exploded[i]) * 0.5f);
    }
}
