#include <catch2/catch.hpp>

#include <random>

#include "Constants.h"
#include "Fakes.h"
#include "ParticleSystem.h"
#include "RenderPipeline.h"

namespace {

ParticleShapes MakeShapes(int count = 64) {
    std::mt19937   rng(11);
    ParticleShapes shapes;
    ParticleSystem::GenerateShapes(count, 1.5f, 8.0f, rng, shapes);
    return shapes;
}

} // namespace

TEST_CASE("Start creates the backend and registers for resize", "[pipeline]") {
    FakeRenderBackend backend;
    MorphState        morph;
    RenderPipeline    pipeline(backend, morph);

    REQUIRE(pipeline.GetState() == PipelineState::UNINITIALIZED);
    REQUIRE(pipeline.Start(MakeShapes(), 800, 600));

    CHECK(pipeline.IsRunning());
    CHECK(backend.createCalls == 1);
    CHECK(backend.particleCount == 64);
    CHECK(pipeline.GetCamera().aspect == Approx(800.0f / 600.0f));
    CHECK(bool(backend.listener));

    // 已启动时再次 Start 被拒绝
    CHECK_FALSE(pipeline.Start(MakeShapes(), 800, 600));
    CHECK(backend.createCalls == 1);
}

TEST_CASE("Backend failure terminates the pipeline", "[pipeline]") {
    FakeRenderBackend backend;
    backend.createOk = false;
    MorphState     morph;
    RenderPipeline pipeline(backend, morph);

    CHECK_FALSE(pipeline.Start(MakeShapes(), 800, 600));
    CHECK(pipeline.GetState() == PipelineState::TERMINATED);
    CHECK_FALSE(bool(backend.listener));
}

TEST_CASE("Mismatched shapes are rejected", "[pipeline]") {
    FakeRenderBackend backend;
    MorphState        morph;
    RenderPipeline    pipeline(backend, morph);

    ParticleShapes shapes = MakeShapes();
    shapes.exploded.pop_back();
    CHECK_FALSE(pipeline.Start(shapes, 800, 600));
    CHECK(backend.createCalls == 0);
}

TEST_CASE("Each tick rotates, interpolates and renders once", "[pipeline]") {
    FakeRenderBackend backend;
    MorphState        morph;
    RenderPipeline    pipeline(backend, morph);
    ParticleShapes    shapes = MakeShapes();
    REQUIRE(pipeline.Start(shapes, 800, 600, 1.5f));

    pipeline.Tick(0.016f);
    pipeline.Tick(0.5f);

    CHECK(backend.renderCalls == 2);
    CHECK(pipeline.GetFrameCount() == 2);
    // 旋转按帧累加，与 dt 无关
    CHECK(pipeline.GetTransform().rotation.y == Approx(2 * ROTATION_STEP_Y));
    CHECK(pipeline.GetTransform().rotation.z == Approx(2 * ROTATION_STEP_Z));
    CHECK(pipeline.GetTransform().rotation.x == Approx(0.0f));

    REQUIRE(backend.lastFrame.positions != nullptr);
    CHECK(backend.lastFrame.positions->size() == shapes.assembled.size());
    CHECK((*backend.lastFrame.positions)[3] == shapes.assembled[3]);
    CHECK(backend.lastFrame.bloomStrength == Approx(BLOOM_ASSEMBLED));
    CHECK(backend.lastFrame.pixelRatio == Approx(1.5f));
    CHECK(backend.lastFrame.color == HexToRGB(COLOR_ASSEMBLED));
}

TEST_CASE("Particles follow the morph factor", "[pipeline]") {
    FakeRenderBackend backend;
    MorphState        morph;
    RenderPipeline    pipeline(backend, morph);
    ParticleShapes    shapes = MakeShapes();
    REQUIRE(pipeline.Start(shapes, 800, 600));

    morph.SetTarget(MorphTarget::EXPLODED);
    morph.Update(1.0f);
    pipeline.Tick(0.016f);

    const glm::vec3& p = pipeline.GetPositions()[5];
    CHECK(p.x == Approx(shapes.exploded[5].x));
    CHECK(p.y == Approx(shapes.exploded[5].y));
    CHECK(pipeline.GetColor() == HexToRGB(COLOR_EXPLODED));
    CHECK(backend.lastFrame.bloomStrength == Approx(BLOOM_EXPLODED));
}

TEST_CASE("Color switches strictly above half", "[pipeline]") {
    CHECK(RenderPipeline::ColorForFactor(0.0f) == HexToRGB(COLOR_ASSEMBLED));
    CHECK(RenderPipeline::ColorForFactor(0.5f) == HexToRGB(COLOR_ASSEMBLED));
    CHECK(RenderPipeline::ColorForFactor(0.51f) == HexToRGB(COLOR_EXPLODED));
    CHECK(RenderPipeline::ColorForFactor(1.0f) == HexToRGB(COLOR_EXPLODED));
}

TEST_CASE("Cloud moves to the mapped hand position", "[pipeline]") {
    FakeRenderBackend backend;
    MorphState        morph;
    RenderPipeline    pipeline(backend, morph);
    REQUIRE(pipeline.Start(MakeShapes(), 800, 600));

    pipeline.MoveCloudTo(glm::vec3(1.0f, 2.0f, 0.0f));
    pipeline.Tick(0.1f);
    CHECK(pipeline.GetTransform().position.x > 0.0f);
    CHECK(pipeline.GetTransform().position.x < 1.0f);

    pipeline.Tick(0.1f);
    CHECK(pipeline.GetTransform().position.x == Approx(1.0f));
    CHECK(pipeline.GetTransform().position.y == Approx(2.0f));

    // 画面中心 -> 原点
    REQUIRE(pipeline.MoveCloudToScreenPoint(0.5f, 0.5f));
    pipeline.Tick(FOLLOW_DURATION);
    CHECK(pipeline.GetTransform().position.x == Approx(0.0f).margin(1e-3));
    CHECK(pipeline.GetTransform().position.y == Approx(0.0f).margin(1e-3));
}

TEST_CASE("Resize updates camera and render targets", "[pipeline]") {
    FakeRenderBackend backend;
    MorphState        morph;
    RenderPipeline    pipeline(backend, morph);
    REQUIRE(pipeline.Start(MakeShapes(), 800, 600));

    backend.FireResize(1920, 1080);
    CHECK(backend.resizeCalls == 1);
    CHECK(pipeline.GetWidth() == 1920);
    CHECK(pipeline.GetCamera().aspect == Approx(1920.0f / 1080.0f));

    // 最小化
    pipeline.OnResize(0, 0);
    CHECK(backend.resizeCalls == 1);
    CHECK(pipeline.GetWidth() == 1920);
}

TEST_CASE("Stop releases once and ignores later calls", "[pipeline]") {
    FakeRenderBackend backend;
    MorphState        morph;
    {
        RenderPipeline pipeline(backend, morph);
        REQUIRE(pipeline.Start(MakeShapes(), 800, 600));

        pipeline.Stop();
        pipeline.Stop();
        CHECK(pipeline.GetState() == PipelineState::TERMINATED);
        CHECK(backend.releaseCalls == 1);
        CHECK_FALSE(bool(backend.listener));

        pipeline.OnResize(1024, 768);
        pipeline.Tick(0.016f);
        CHECK(backend.resizeCalls == 0);
        CHECK(backend.renderCalls == 0);
    }
    // 析构不会再次释放
    CHECK(backend.releaseCalls == 1);
}

TEST_CASE("Stop before start does not touch the backend", "[pipeline]") {
    FakeRenderBackend backend;
    MorphState        morph;
    RenderPipeline    pipeline(backend, morph);

    pipeline.Stop();
    CHECK(pipeline.GetState() == PipelineState::TERMINATED);
    CHECK(backend.releaseCalls == 0);
    CHECK_FALSE(pipeline.Start(MakeShapes(), 800, 600));
}
