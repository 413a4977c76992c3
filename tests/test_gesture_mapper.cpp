#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include "Fakes.h"
#include "GestureMapper.h"

namespace {

struct RecordingTarget : public IGestureTarget {
    std::vector<MorphTarget> requests;
    int                      positionUpdates = 0;
    float                    lastX = -1.0f, lastY = -1.0f;

    void RequestMorph(MorphTarget target) override { requests.push_back(target); }
    void UpdateHandPosition(float x, float y) override {
        positionUpdates++;
        lastX = x;
        lastY = y;
    }
};

} // namespace

TEST_CASE("Classify by thumb to index distance", "[gesture]") {
    SECTION("pinch") {
        GestureDecision d = GestureMapper::Classify(MakeResult(0.03f));
        CHECK(d.status == GestureStatus::PINCH);
        CHECK(d.hasTarget);
        CHECK(d.target == MorphTarget::ASSEMBLED);
        CHECK(d.pinchDistance == Approx(0.03f));
    }
    SECTION("wide spread explodes") {
        GestureDecision d = GestureMapper::Classify(MakeResult(0.25f));
        CHECK(d.status == GestureStatus::OPEN_PALM);
        CHECK(d.target == MorphTarget::EXPLODED);
    }
    SECTION("in between only tracks") {
        GestureDecision d = GestureMapper::Classify(MakeResult(0.15f));
        CHECK(d.status == GestureStatus::TRACKING);
        CHECK_FALSE(d.hasTarget);
        CHECK(d.hasPalm);
    }
}

TEST_CASE("Open palm category needs enough confidence", "[gesture]") {
    CHECK(GestureMapper::Classify(MakeResult(0.15f, "Open_Palm", 0.9f)).status == GestureStatus::OPEN_PALM);
    CHECK(GestureMapper::Classify(MakeResult(0.15f, "Open_Palm", 0.4f)).status == GestureStatus::TRACKING);
    CHECK(GestureMapper::Classify(MakeResult(0.15f, "Closed_Fist", 0.9f)).status == GestureStatus::TRACKING);

    // 捏合优先
    CHECK(GestureMapper::Classify(MakeResult(0.03f, "Open_Palm", 0.9f)).status == GestureStatus::PINCH);
}

TEST_CASE("Incomplete hands count as no hand", "[gesture]") {
    DetectionResult empty;
    CHECK(GestureMapper::Classify(empty).status == GestureStatus::NO_HAND);

    DetectionResult partial = MakeResult(0.03f);
    partial.landmarks[0].resize(10);
    GestureDecision d = GestureMapper::Classify(partial);
    CHECK(d.status == GestureStatus::NO_HAND);
    CHECK_FALSE(d.hasPalm);
}

TEST_CASE("Palm center comes from landmark 9", "[gesture]") {
    DetectionResult result = MakeResult(0.15f);
    result.landmarks[0][9].x = 0.7f;
    result.landmarks[0][9].y = 0.2f;

    FakeHandDetector detector;
    RecordingTarget  target;
    GestureMapper    mapper(detector, target);
    mapper.Apply(result);

    CHECK(target.positionUpdates == 1);
    CHECK(target.lastX == Approx(0.7f));
    CHECK(target.lastY == Approx(0.2f));
}

TEST_CASE("Morph requests are only sent when the target changes", "[gesture]") {
    FakeHandDetector detector;
    RecordingTarget  target;
    GestureMapper    mapper(detector, target);

    // 初始目标为聚合，捏合不会重复请求
    mapper.Apply(MakeResult(0.03f));
    mapper.Apply(MakeResult(0.03f));
    CHECK(target.requests.empty());

    mapper.Apply(MakeResult(0.25f));
    mapper.Apply(MakeResult(0.3f));
    REQUIRE(target.requests.size() == 1);
    CHECK(target.requests[0] == MorphTarget::EXPLODED);
    CHECK(mapper.GetLastTarget() == MorphTarget::EXPLODED);

    // 中间距离不改变目标
    mapper.Apply(MakeResult(0.15f));
    CHECK(target.requests.size() == 1);

    mapper.Apply(MakeResult(0.02f));
    REQUIRE(target.requests.size() == 2);
    CHECK(target.requests[1] == MorphTarget::ASSEMBLED);
}

TEST_CASE("No hand keeps the last target and skips position", "[gesture]") {
    FakeHandDetector detector;
    RecordingTarget  target;
    GestureMapper    mapper(detector, target);

    mapper.Apply(MakeResult(0.25f));
    REQUIRE(target.positionUpdates == 1);

    mapper.Apply(DetectionResult());
    CHECK(mapper.GetStatus() == GestureStatus::NO_HAND);
    CHECK_FALSE(mapper.HasHand());
    CHECK(mapper.GetLastTarget() == MorphTarget::EXPLODED);
    CHECK(target.positionUpdates == 1);
    CHECK(target.requests.size() == 1);
    CHECK(std::string(mapper.GetStatusText()) == "No Hand Detected");
}

TEST_CASE("Poll only detects when the video frame advances", "[gesture]") {
    FakeHandDetector detector;
    RecordingTarget  target;
    GestureMapper    mapper(detector, target);

    // 还没有帧
    CHECK_FALSE(mapper.Poll());
    CHECK(detector.detectCalls == 0);

    detector.PushFrame(MakeResult(0.25f));
    CHECK(mapper.Poll());
    CHECK(detector.detectCalls == 1);
    CHECK(mapper.GetStatus() == GestureStatus::OPEN_PALM);

    // 同一帧: 不检测，状态保留
    CHECK_FALSE(mapper.Poll());
    CHECK(detector.detectCalls == 1);
    CHECK(mapper.GetStatus() == GestureStatus::OPEN_PALM);

    detector.PushFrame(MakeResult(0.15f));
    CHECK(mapper.Poll());
    CHECK(mapper.GetStatus() == GestureStatus::TRACKING);
    CHECK(std::string(mapper.GetStatusText()) == "Gesture: Tracking...");
}

TEST_CASE("Detector failure is treated as no hand", "[gesture]") {
    FakeHandDetector detector;
    RecordingTarget  target;
    GestureMapper    mapper(detector, target);

    detector.PushFrame(MakeResult(0.03f));
    REQUIRE(mapper.Poll());
    REQUIRE(mapper.GetStatus() == GestureStatus::PINCH);

    detector.detectOk = false;
    detector.PushFrame(MakeResult(0.03f));
    CHECK(mapper.Poll());
    CHECK(mapper.GetStatus() == GestureStatus::NO_HAND);
}

TEST_CASE("Reset forgets frame time and target", "[gesture]") {
    FakeHandDetector detector;
    RecordingTarget  target;
    GestureMapper    mapper(detector, target);

    detector.PushFrame(MakeResult(0.25f));
    REQUIRE(mapper.Poll());
    REQUIRE(mapper.GetLastTarget() == MorphTarget::EXPLODED);

    mapper.Reset();
    CHECK(mapper.GetLastTarget() == MorphTarget::ASSEMBLED);
    CHECK(mapper.GetStatus() == GestureStatus::NO_HAND);
    // 同一帧时间在重置后再次有效
    CHECK(mapper.Poll());
}

TEST_CASE("Status texts", "[gesture]") {
    CHECK(std::string(GetGestureStatusText(GestureStatus::PINCH)) == "Gesture: Pinch (Create)");
    CHECK(std::string(GetGestureStatusText(GestureStatus::OPEN_PALM)) == "Gesture: Open Palm (Explode)");
}
