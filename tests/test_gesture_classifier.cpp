#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include "GestureClassifier.h"

namespace {

// 像素坐标的手: 手腕在原点，手掌中心 (9) 在正上方 100 处
// ratios: 食指/中指/无名指/小指 指尖到手腕距离与根部到手腕距离之比
// thumbGap: 拇指尖到食指根部的距离
std::vector<cv::Point3f> MakeHand(const float ratios[4], float thumbGap) {
    std::vector<cv::Point3f> lm(21, cv::Point3f(0.0f, 0.0f, 0.0f));
    const cv::Point3f mcp[4] = {{-30.0f, -90.0f, 0.0f}, {0.0f, -100.0f, 0.0f}, {25.0f, -95.0f, 0.0f},
                                {45.0f, -85.0f, 0.0f}};
    const int mcpIndex[4] = {5, 9, 13, 17};
    const int tipIndex[4] = {8, 12, 16, 20};
    for (int f = 0; f < 4; f++) {
        lm[mcpIndex[f]] = mcp[f];
        lm[tipIndex[f]] = mcp[f] * ratios[f];
    }
    lm[4] = cv::Point3f(mcp[0].x - thumbGap, mcp[0].y, 0.0f);
    return lm;
}

std::vector<cv::Point3f> OpenHand() {
    const float ratios[4] = {2.0f, 2.0f, 2.0f, 2.0f};
    return MakeHand(ratios, 80.0f);
}

std::vector<cv::Point3f> Fist() {
    const float ratios[4] = {0.8f, 0.8f, 0.8f, 0.8f};
    return MakeHand(ratios, 20.0f);
}

std::vector<cv::Point3f> PointingUp() {
    const float ratios[4] = {2.0f, 0.8f, 0.8f, 0.8f};
    return MakeHand(ratios, 20.0f);
}

float ScoreOf(const std::vector<GestureScore>& scores, const std::string& name) {
    for (const GestureScore& s : scores) {
        if (s.name == name) {
            return s.score;
        }
    }
    return -1.0f;
}

void CheckSortedDescending(const std::vector<GestureScore>& scores) {
    for (size_t i = 1; i < scores.size(); i++) {
        CHECK(scores[i - 1].score >= scores[i].score);
    }
}

} // namespace

TEST_CASE("Finger openness separates extended and curled fingers", "[classifier]") {
    float open[5], fist[5];
    GestureClassifier::FingerOpenness(OpenHand(), open);
    GestureClassifier::FingerOpenness(Fist(), fist);
    for (int i = 0; i < 5; i++) {
        CHECK(open[i] == Approx(1.0f));
        CHECK(fist[i] == Approx(0.0f));
    }
}

TEST_CASE("Open hand ranks Open_Palm first", "[classifier]") {
    std::vector<GestureScore> scores;
    GestureClassifier::Classify(OpenHand(), scores);

    REQUIRE_FALSE(scores.empty());
    CHECK(scores[0].name == "Open_Palm");
    CHECK(scores[0].score > 0.5f);
    CheckSortedDescending(scores);
}

TEST_CASE("Fist does not reach the open palm confidence", "[classifier]") {
    std::vector<GestureScore> scores;
    GestureClassifier::Classify(Fist(), scores);

    REQUIRE_FALSE(scores.empty());
    CHECK(scores[0].name == "Closed_Fist");
    float openPalm = ScoreOf(scores, "Open_Palm");
    CHECK(openPalm <= 0.5f);
    CheckSortedDescending(scores);
}

TEST_CASE("Single extended index finger points up", "[classifier]") {
    std::vector<GestureScore> scores;
    GestureClassifier::Classify(PointingUp(), scores);

    REQUIRE(scores.size() == 4);
    CHECK(scores[0].name == "Pointing_Up");
    CHECK(scores[0].score == Approx(1.0f));
    CHECK(ScoreOf(scores, "Open_Palm") == Approx(0.2f));
    CHECK(ScoreOf(scores, "Open_Palm") <= 0.5f);
    CheckSortedDescending(scores);
}

TEST_CASE("None is the complement of the best gesture", "[classifier]") {
    // 所有手指半张开
    const float ratios[4] = {1.4f, 1.4f, 1.4f, 1.4f};
    std::vector<GestureScore> scores;
    GestureClassifier::Classify(MakeHand(ratios, 50.0f), scores, 5);

    REQUIRE(scores.size() == 5);
    float none = ScoreOf(scores, "None");
    REQUIRE(none >= 0.0f);
    CHECK(scores[0].score == Approx(0.5f).margin(1e-4));
    CHECK(none == Approx(1.0f - scores[0].score).margin(1e-5));
    CheckSortedDescending(scores);
}

TEST_CASE("Output is capped at max_count", "[classifier]") {
    std::vector<GestureScore> scores;
    GestureClassifier::Classify(OpenHand(), scores, 2);
    REQUIRE(scores.size() == 2);
    CHECK(scores[0].name == "Open_Palm");

    GestureClassifier::Classify(OpenHand(), scores);
    CHECK(scores.size() == 4);
}

TEST_CASE("Incomplete landmark sets produce no gestures", "[classifier]") {
    std::vector<cv::Point3f> partial = OpenHand();
    partial.resize(10);

    std::vector<GestureScore> scores = {{"stale", 1.0f}};
    GestureClassifier::Classify(partial, scores);
    CHECK(scores.empty());

    float openness[5] = {1.0f, 1.0f, 1.0f, 1.0f, 1.0f};
    GestureClassifier::FingerOpenness(partial, openness);
    for (float v : openness) {
        CHECK(v == 0.0f);
    }
}
