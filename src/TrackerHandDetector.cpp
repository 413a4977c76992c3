// TrackerHandDetector.cpp - HandTracker C API 适配

#include "TrackerHandDetector.h"

#include <HandTracker.h>

#include <iostream>
#include <utility>
#include <vector>

TrackerHandDetector::TrackerHandDetector(std::string modelDir, int cameraId)
    : m_modelDir(std::move(modelDir)), m_cameraId(cameraId) {}

TrackerHandDetector::~TrackerHandDetector() {
    Release();
}

bool TrackerHandDetector::Initialize() {
    m_initialized = InitTracker(m_modelDir.c_str());
    return m_initialized;
}

bool TrackerHandDetector::StartCamera() {
    m_cameraActive = StartTrackerCamera(m_cameraId);
    return m_cameraActive;
}

double TrackerHandDetector::GetFrameTime() const {
    return m_cameraActive ? GetTrackerFrameTime() : -1.0;
}

bool TrackerHandDetector::Detect(DetectionResult& out) {
    out.landmarks.clear();
    out.gestures.clear();

    HandResult result;
    if (!DetectHand(&result)) {
        return false;
    }
    if (!result.hasHand) {
        return true;
    }

    std::vector<Landmark> hand(HAND_LANDMARK_COUNT);
    for (int i = 0; i < HAND_LANDMARK_COUNT; i++) {
        hand[i].x = result.landmarks[i].x;
        hand[i].y = result.landmarks[i].y;
        hand[i].z = result.landmarks[i].z;
    }
    out.landmarks.push_back(std::move(hand));

    std::vector<GestureCategory> categories;
    for (int i = 0; i < result.gestureCount && i < HAND_GESTURE_MAX; i++) {
        categories.push_back({result.gestures[i].categoryName, result.gestures[i].score});
    }
    out.gestures.push_back(std::move(categories));
    return true;
}

void TrackerHandDetector::Release() {
    if (!m_initialized && !m_cameraActive) {
        return;
    }
    ReleaseTracker();
    m_initialized  = false;
    m_cameraActive = false;
}

std::string TrackerHandDetector::GetLastError() const {
    const char* message = GetTrackerLastErrorMessage();
    std::string text    = message ? message : "";
    return text + " (code " + std::to_string(GetTrackerLastError()) + ")";
}

bool TrackerHandDetector::GetFrame(std::vector<unsigned char>& buffer, int& width, int& height) {
    width  = 0;
    height = 0;
    if (!m_cameraActive) {
        return false;
    }
    if (GetTrackerFrame(buffer.empty() ? nullptr : buffer.data(), (int)buffer.size(), &width, &height)) {
        return true;
    }
    // 容量不足时按返回尺寸扩容后重试
    size_t needed = (size_t)width * height * 3;
    if (width <= 0 || height <= 0 || buffer.size() >= needed) {
        return false;
    }
    buffer.resize(needed);
    return GetTrackerFrame(buffer.data(), (int)buffer.size(), &width, &height);
}

void TrackerHandDetector::SetDebugMode(bool enabled) {
    SetTrackerDebugMode(enabled);
}

bool TrackerHandDetector::GetDebugMode() const {
    return GetTrackerDebugMode();
}
