#include "GestureClassifier.h"

#include <algorithm>
#include <cmath>

namespace GestureClassifier {

namespace {

const int WRIST     = 0;
const int THUMB_TIP = 4;
const int INDEX_MCP = 5;
const int PALM      = 9;

// 各手指 (MCP, TIP)
const int FINGERS[4][2] = {{5, 8}, {9, 12}, {13, 16}, {17, 20}};

float Dist2D(const cv::Point3f& a, const cv::Point3f& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

float Clamp01(float v) {
    return std::max(0.0f, std::min(1.0f, v));
}

float Mean(std::initializer_list<float> values) {
    float sum = 0.0f;
    for (float v : values) {
        sum += v;
    }
    return sum / (float)values.size();
}

} // namespace

void FingerOpenness(const std::vector<cv::Point3f>& lm, float out[5]) {
    std::fill(out, out + 5, 0.0f);
    if (lm.size() < 21) {
        return;
    }

    const float hand = Dist2D(lm[WRIST], lm[PALM]);
    if (hand <= 1e-6f) {
        return;
    }

    // 拇指: 指尖离食指根部越远越张开
    out[0] = Clamp01((Dist2D(lm[THUMB_TIP], lm[INDEX_MCP]) / hand - 0.3f) / 0.4f);

    // 其他手指: 指尖到手腕 / 根部到手腕，伸直时约 1.8，握拳时约 1.0
    for (int f = 0; f < 4; f++) {
        float mcp = Dist2D(lm[FINGERS[f][0]], lm[WRIST]);
        float tip = Dist2D(lm[FINGERS[f][1]], lm[WRIST]);
        float ratio = mcp > 1e-6f ? tip / mcp : 0.0f;
        out[f + 1]  = Clamp01((ratio - 1.1f) / 0.6f);
    }
}

void Classify(const std::vector<cv::Point3f>& landmarks, std::vector<GestureScore>& out, size_t max_count) {
    out.clear();
    if (landmarks.size() < 21) {
        return;
    }

    float o[5];
    FingerOpenness(landmarks, o);
    const float thumb = o[0], index = o[1], middle = o[2], ring = o[3], pinky = o[4];

    std::vector<GestureScore> scores = {
        {"Open_Palm", Mean({thumb, index, middle, ring, pinky})},
        {"Closed_Fist", Mean({1.0f - index, 1.0f - middle, 1.0f - ring, 1.0f - pinky})},
        {"Pointing_Up", index * Mean({1.0f - middle, 1.0f - ring, 1.0f - pinky})},
        {"Victory", Mean({index, middle}) * Mean({1.0f - ring, 1.0f - pinky})},
    };

    float best = 0.0f;
    for (const GestureScore& s : scores) {
        best = std::max(best, s.score);
    }
    scores.push_back({"None", 1.0f - best});

    std::sort(scores.begin(), scores.end(), [](const GestureScore& a, const GestureScore& b) { return a.score > b.score; });
    if (scores.size() > max_count) {
        scores.resize(max_count);
    }
    out = std::move(scores);
}

} // namespace GestureClassifier
