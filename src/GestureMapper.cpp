// GestureMapper.cpp - 手势分类与状态映射

#include "GestureMapper.h"

#include <cmath>
#include <iostream>

#include "Constants.h"

const char* GetGestureStatusText(GestureStatus status) {
    switch (status) {
    case GestureStatus::PINCH:
        return "Gesture: Pinch (Create)";
    case GestureStatus::OPEN_PALM:
        return "Gesture: Open Palm (Explode)";
    case GestureStatus::TRACKING:
        return "Gesture: Tracking...";
    case GestureStatus::NO_HAND:
    default:
        return "No Hand Detected";
    }
}

GestureMapper::GestureMapper(IHandDetector& detector, IGestureTarget& target) : m_detector(detector), m_target(target) {}

bool GestureMapper::Poll() {
    // 视频帧未前进时跳过检测，保留上次状态
    double frameTime = m_detector.GetFrameTime();
    if (frameTime < 0.0 || frameTime <= m_lastFrameTime) {
        return false;
    }
    m_lastFrameTime = frameTime;

    m_result.landmarks.clear();
    m_result.gestures.clear();
    if (!m_detector.Detect(m_result)) {
        // 检测失败按无手处理
        m_result.landmarks.clear();
        m_result.gestures.clear();
    }
    Apply(m_result);
    return true;
}

GestureDecision GestureMapper::Classify(const DetectionResult& result) {
    GestureDecision decision;

    if (result.landmarks.empty() || (int)result.landmarks[0].size() < LANDMARK_COUNT) {
        return decision;
    }

    const std::vector<Landmark>& hand  = result.landmarks[0];
    const Landmark&              thumb = hand[LANDMARK_THUMB_TIP];
    const Landmark&              index = hand[LANDMARK_INDEX_TIP];
    const Landmark&              palm  = hand[LANDMARK_PALM];

    decision.hasPalm = true;
    decision.palmX   = palm.x;
    decision.palmY   = palm.y;

    // 只在图像平面内计算距离
    float distance         = std::hypot(thumb.x - index.x, thumb.y - index.y);
    decision.pinchDistance = distance;

    bool openPalm = false;
    if (!result.gestures.empty()) {
        for (const GestureCategory& category : result.gestures[0]) {
            if (category.categoryName == "Open_Palm" && category.score > OPEN_PALM_CONFIDENCE) {
                openPalm = true;
                break;
            }
        }
    }

    if (distance < PINCH_THRESHOLD) {
        decision.status    = GestureStatus::PINCH;
        decision.hasTarget = true;
        decision.target    = MorphTarget::ASSEMBLED;
    } else if (openPalm || distance > EXPLODE_DISTANCE) {
        decision.status    = GestureStatus::OPEN_PALM;
        decision.hasTarget = true;
        decision.target    = MorphTarget::EXPLODED;
    } else {
        decision.status = GestureStatus::TRACKING;
    }
    return decision;
}

void GestureMapper::Apply(const DetectionResult& result) {
    GestureDecision decision = Classify(result);
    m_status                 = decision.status;
    m_pinchDistance          = decision.pinchDistance;

    if (decision.status == GestureStatus::NO_HAND) {
        return;
    }

    // 只在目标变化时发出请求
    if (decision.hasTarget && decision.target != m_lastTarget) {
        m_lastTarget = decision.target;
        m_target.RequestMorph(decision.target);
    }

    if (decision.hasPalm) {
        m_target.UpdateHandPosition(decision.palmX, decision.palmY);
    }
}

void GestureMapper::Reset() {
    m_lastFrameTime = -1.0;
    m_lastTarget    = MorphTarget::ASSEMBLED;
    m_status        = GestureStatus::NO_HAND;
    m_pinchDistance = 0.0f;
}
