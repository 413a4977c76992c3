#include <catch2/catch.hpp>

#include <string>

#include "Constants.h"
#include "Fakes.h"
#include "Session.h"

namespace {

SessionConfig SmallConfig() {
    SessionConfig config;
    config.particleCount = 128;
    config.fixedSeed     = true;
    config.seed          = 5;
    return config;
}

} // namespace

TEST_CASE("Session walks through its lifecycle", "[session]") {
    FakeHandDetector  detector;
    FakeRenderBackend backend;
    Session           session(detector, backend, SmallConfig());

    CHECK(session.GetState() == SessionState::UNINITIALIZED);

    // 未初始化时不能启动
    CHECK_FALSE(session.Start(800, 600));
    CHECK(session.GetState() == SessionState::UNINITIALIZED);

    REQUIRE(session.Initialize());
    CHECK(session.GetState() == SessionState::READY);
    CHECK(detector.initCalls == 1);
    CHECK(detector.cameraCalls == 0);

    REQUIRE(session.Start(800, 600));
    CHECK(session.GetState() == SessionState::RUNNING);
    CHECK(detector.cameraCalls == 1);
    CHECK(backend.particleCount == 128);
    CHECK(std::string(session.GetStatusText()) == "No Hand Detected");

    session.Stop();
    CHECK(session.GetState() == SessionState::TERMINATED);
    CHECK(backend.releaseCalls == 1);
    CHECK(detector.releaseCalls == 1);

    session.Stop();
    CHECK(backend.releaseCalls == 1);
    CHECK(detector.releaseCalls == 1);
}

TEST_CASE("Model load failure puts the session in error", "[session]") {
    FakeHandDetector  detector;
    FakeRenderBackend backend;
    detector.initOk = false;
    Session session(detector, backend, SmallConfig());

    CHECK_FALSE(session.Initialize());
    CHECK(session.GetState() == SessionState::FAILURE);
    CHECK(session.GetErrorMessage().find("fake failure") != std::string::npos);

    CHECK_FALSE(session.Start(800, 600));
    CHECK(backend.createCalls == 0);

    // 错误状态在 Stop 后保留
    session.Stop();
    CHECK(session.GetState() == SessionState::FAILURE);
    CHECK(detector.releaseCalls == 1);
}

TEST_CASE("Camera failure tears the pipeline down", "[session]") {
    FakeHandDetector  detector;
    FakeRenderBackend backend;
    detector.cameraOk = false;
    Session session(detector, backend, SmallConfig());

    REQUIRE(session.Initialize());
    CHECK_FALSE(session.Start(800, 600));
    CHECK(session.GetState() == SessionState::FAILURE);
    CHECK(session.GetPipeline().GetState() == PipelineState::TERMINATED);
    CHECK(backend.releaseCalls == 1);
    CHECK_FALSE(session.GetErrorMessage().empty());
}

TEST_CASE("Fixed seed reproduces the same cloud", "[session]") {
    FakeHandDetector  detectorA, detectorB;
    FakeRenderBackend backendA, backendB;
    Session           a(detectorA, backendA, SmallConfig());
    Session           b(detectorB, backendB, SmallConfig());

    REQUIRE(a.Initialize());
    REQUIRE(b.Initialize());
    REQUIRE(a.Start(800, 600));
    REQUIRE(b.Start(800, 600));

    a.RequestMorph(MorphTarget::EXPLODED);
    b.RequestMorph(MorphTarget::EXPLODED);
    a.Tick(1.0f);
    b.Tick(1.0f);
    CHECK(a.GetPipeline().GetPositions() == b.GetPipeline().GetPositions());
}

TEST_CASE("Pinch then open palm explodes exactly once", "[session]") {
    FakeHandDetector  detector;
    FakeRenderBackend backend;
    Session           session(detector, backend, SmallConfig());
    REQUIRE(session.Initialize());
    REQUIRE(session.Start(800, 600));

    for (int i = 0; i < 3; i++) {
        detector.PushFrame(MakeResult(0.03f));
        session.Tick(0.016f);
    }
    // 已经是聚合状态，不产生新的过渡
    CHECK(session.GetMorph().GetTransitionCount() == 0);
    CHECK(std::string(session.GetStatusText()) == "Gesture: Pinch (Create)");

    detector.PushFrame(MakeResult(0.15f, "Open_Palm", 0.9f));
    session.Tick(0.016f);
    CHECK(session.GetMorph().GetTransitionCount() == 1);
    CHECK(session.GetMorph().GetTarget() == MorphTarget::EXPLODED);
    CHECK(std::string(session.GetStatusText()) == "Gesture: Open Palm (Explode)");

    // 同一帧重复 Tick 不会再次请求
    session.Tick(0.016f);
    detector.PushFrame(MakeResult(0.15f, "Open_Palm", 0.95f));
    session.Tick(1.0f);
    CHECK(session.GetMorph().GetTransitionCount() == 1);
    CHECK(session.GetMorph().GetFactor() == Approx(1.0f));
    CHECK(session.GetPipeline().GetColor() == HexToRGB(COLOR_EXPLODED));
    CHECK(backend.lastFrame.bloomStrength == Approx(BLOOM_EXPLODED));
}

TEST_CASE("Frames without a hand keep the cloud where it was", "[session]") {
    FakeHandDetector  detector;
    FakeRenderBackend backend;
    Session           session(detector, backend, SmallConfig());
    REQUIRE(session.Initialize());
    REQUIRE(session.Start(800, 600));

    DetectionResult right = MakeResult(0.15f);
    right.landmarks[0][9].x = 0.75f;
    detector.PushFrame(right);
    session.Tick(FOLLOW_DURATION);
    session.Tick(FOLLOW_DURATION);
    float x = session.GetPipeline().GetTransform().position.x;
    CHECK(x > 0.0f);

    detector.PushFrame(DetectionResult());
    session.Tick(FOLLOW_DURATION);
    CHECK(session.GetPipeline().GetTransform().position.x == Approx(x));
    CHECK_FALSE(session.GetMapper().HasHand());
}

TEST_CASE("Ticks outside the running state do nothing", "[session]") {
    FakeHandDetector  detector;
    FakeRenderBackend backend;
    Session           session(detector, backend, SmallConfig());
    REQUIRE(session.Initialize());

    detector.PushFrame(MakeResult(0.25f));
    session.Tick(0.016f);
    CHECK(detector.detectCalls == 0);
    CHECK(backend.renderCalls == 0);

    REQUIRE(session.Start(800, 600));
    session.Stop();
    session.Tick(0.016f);
    CHECK(detector.detectCalls == 0);
    CHECK(backend.renderCalls == 0);
}
