#include "HandTracker.h"

#include <algorithm>
#include <atomic>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <memory>
#include <mutex>
#include <opencv2/opencv.hpp>
#include <string>

#include "CameraCapture.h"
#include "GestureClassifier.h"
#include "HandLandmark.h"
#include "PalmDetector.h"

namespace {

const float PALM_SCORE_THRESHOLD = 0.4f;
const float PALM_NMS_THRESHOLD   = 0.3f;
const float PRESENCE_THRESHOLD   = 0.1f;
const char* DEBUG_WINDOW         = "HandTracker Debug";

std::unique_ptr<PalmDetector>   g_palm_detector;
std::unique_ptr<HandLandmark>   g_landmark_detector;
std::unique_ptr<ICameraCapture> g_capture;
std::mutex                      g_tracker_mutex;

std::atomic<bool> g_debug_mode{false};
bool              g_debug_window_created = false;

int         g_last_error = HANDTRACKER_OK;
std::string g_last_error_message;

void SetError(int code, const std::string& message) {
    g_last_error         = code;
    g_last_error_message = message;
    if (code != HANDTRACKER_OK) {
        std::cerr << "[HandTracker] Error: " << message << std::endl;
    }
}

std::string JoinPath(const std::string& folder, const std::string& filename) {
    if (folder.empty()) {
        return filename;
    }
    char last = folder.back();
    if (last == '/' || last == '\\') {
        return folder + filename;
    }
    return folder + "/" + filename;
}

void CopyGestureName(const std::string& name, char (&dst)[HAND_GESTURE_NAME_MAX]) {
    size_t n = std::min(name.size(), (size_t)HAND_GESTURE_NAME_MAX - 1);
    std::memcpy(dst, name.data(), n);
    dst[n] = '\0';
}

void CloseDebugWindow() {
    if (g_debug_window_created) {
        cv::destroyWindow(DEBUG_WINDOW);
        g_debug_window_created = false;
    }
}

// 调试窗口：手掌框、ROI、骨架
void ShowDebugFrame(const cv::Mat& frame_rgb, const PalmDetection* palm, const std::vector<cv::Point3f>& lm,
                    const std::vector<GestureScore>& gestures) {
    if (!g_debug_window_created) {
        cv::namedWindow(DEBUG_WINDOW, cv::WINDOW_AUTOSIZE);
        g_debug_window_created = true;
    }

    cv::Mat debug_frame;
    cv::cvtColor(frame_rgb, debug_frame, cv::COLOR_RGB2BGR);
    const int img_w = frame_rgb.cols;
    const int img_h = frame_rgb.rows;

    if (palm) {
        const cv::Rect2f& rect = palm->rect;
        cv::rectangle(debug_frame, cv::Point((int)(rect.x * img_w), (int)(rect.y * img_h)),
                      cv::Point((int)((rect.x + rect.width) * img_w), (int)((rect.y + rect.height) * img_h)),
                      cv::Scalar(0, 255, 255), 2);
        for (int i = 0; i < 4; i++) {
            const cv::Point2f& a = palm->roi[i];
            const cv::Point2f& b = palm->roi[(i + 1) % 4];
            cv::line(debug_frame, cv::Point((int)(a.x * img_w), (int)(a.y * img_h)),
                     cv::Point((int)(b.x * img_w), (int)(b.y * img_h)), cv::Scalar(255, 0, 255), 2);
        }
    }

    if (lm.size() >= HAND_LANDMARK_COUNT) {
        static const int connections[][2] = {{0, 1},   {1, 2},   {2, 3},   {3, 4},   {0, 5},   {5, 6},
                                             {6, 7},   {7, 8},   {0, 9},   {9, 10},  {10, 11}, {11, 12},
                                             {0, 13},  {13, 14}, {14, 15}, {15, 16}, {0, 17},  {17, 18},
                                             {18, 19}, {19, 20}, {5, 9},   {9, 13},  {13, 17}};
        for (auto& conn : connections) {
            cv::line(debug_frame, cv::Point((int)lm[conn[0]].x, (int)lm[conn[0]].y),
                     cv::Point((int)lm[conn[1]].x, (int)lm[conn[1]].y), cv::Scalar(0, 255, 0), 2);
        }
        for (int i = 0; i < HAND_LANDMARK_COUNT; i++) {
            bool       key   = (i == 4 || i == 8 || i == 9);
            cv::Scalar color = key ? cv::Scalar(0, 0, 255) : cv::Scalar(0, 255, 255);
            cv::circle(debug_frame, cv::Point((int)lm[i].x, (int)lm[i].y), key ? 8 : 5, color, -1);
        }
        // 捏合距离
        cv::line(debug_frame, cv::Point((int)lm[4].x, (int)lm[4].y), cv::Point((int)lm[8].x, (int)lm[8].y),
                 cv::Scalar(0, 0, 255), 3);
    }

    char info[128];
    if (!gestures.empty()) {
        snprintf(info, sizeof(info), "Gesture: %s (%.2f)", gestures[0].name.c_str(), gestures[0].score);
    } else {
        snprintf(info, sizeof(info), "Gesture: -");
    }
    cv::putText(debug_frame, info, cv::Point(10, 30), cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(0, 255, 0), 2);

    cv::imshow(DEBUG_WINDOW, debug_frame);
    cv::waitKey(1);
}

} // namespace

HAND_API bool InitTracker(const char* model_dir) {
    std::lock_guard<std::mutex> lock(g_tracker_mutex);
    if (g_palm_detector && g_landmark_detector) {
        return true;
    }
    if (model_dir == nullptr) {
        SetError(HANDTRACKER_ERROR_UNKNOWN, "Model directory is null");
        return false;
    }

    auto palm     = std::make_unique<PalmDetector>();
    auto landmark = std::make_unique<HandLandmark>();

    std::string palm_path = JoinPath(model_dir, "palm_detection_full.tflite");
    if (!palm->load(palm_path)) {
        SetError(HANDTRACKER_ERROR_PALM_MODEL, "Failed to load palm detection model: " + palm_path);
        return false;
    }
    std::string landmark_path = JoinPath(model_dir, "hand_landmark_full.tflite");
    if (!landmark->load(landmark_path)) {
        SetError(HANDTRACKER_ERROR_HAND_MODEL, "Failed to load hand landmark model: " + landmark_path);
        return false;
    }

    g_palm_detector     = std::move(palm);
    g_landmark_detector = std::move(landmark);
    SetError(HANDTRACKER_OK, "");
    std::cout << "[HandTracker] Models loaded from " << model_dir << std::endl;
    return true;
}

HAND_API bool StartTrackerCamera(int camera_id) {
    std::lock_guard<std::mutex> lock(g_tracker_mutex);
    if (!g_palm_detector || !g_landmark_detector) {
        SetError(HANDTRACKER_ERROR_NOT_INITIALIZED, "Tracker models are not loaded");
        return false;
    }
    if (g_capture && g_capture->isOpened()) {
        return true;
    }

    auto capture = CreateCameraCapture();
    if (!capture->open(camera_id)) {
        SetError(HANDTRACKER_ERROR_CAMERA_OPEN, "Failed to open camera " + std::to_string(camera_id));
        return false;
    }
    g_capture = std::move(capture);
    SetError(HANDTRACKER_OK, "");
    return true;
}

HAND_API int GetTrackerLastError() {
    std::lock_guard<std::mutex> lock(g_tracker_mutex);
    return g_last_error;
}

HAND_API const char* GetTrackerLastErrorMessage() {
    std::lock_guard<std::mutex> lock(g_tracker_mutex);
    return g_last_error_message.c_str();
}

HAND_API double GetTrackerFrameTime() {
    std::lock_guard<std::mutex> lock(g_tracker_mutex);
    return g_capture ? g_capture->getFrameTime() : -1.0;
}

HAND_API bool DetectHand(HandResult* out_result) {
    if (out_result == nullptr) {
        return false;
    }
    std::lock_guard<std::mutex> lock(g_tracker_mutex);
    std::memset(out_result, 0, sizeof(HandResult));
    out_result->frameTime = -1.0;

    if (!g_palm_detector || !g_landmark_detector || !g_capture) {
        SetError(HANDTRACKER_ERROR_NOT_INITIALIZED, "Tracker is not running");
        return false;
    }

    cv::Mat frame;
    double  frame_time = -1.0;
    if (!g_capture->getLatestFrame(frame, &frame_time)) {
        return true;
    }
    out_result->frameTime = frame_time;

    // OpenCV 异常在库边界转换为错误码
    try {
        std::vector<PalmDetection> palms;
        if (!g_palm_detector->detect(frame, palms, PALM_SCORE_THRESHOLD, PALM_NMS_THRESHOLD, 1)) {
            SetError(HANDTRACKER_ERROR_INFERENCE, "Palm detection failed");
            return false;
        }

        std::vector<cv::Point3f>  landmarks;
        std::vector<GestureScore> gestures;
        if (!palms.empty()) {
            cv::Mat roi_image, inverse;
            PalmDetector::cropHand(frame, palms[0], HandLandmark::INPUT_SIZE, roi_image, inverse);

            float presence = 0.0f;
            if (!g_landmark_detector->detect(roi_image, inverse, landmarks, presence)) {
                SetError(HANDTRACKER_ERROR_INFERENCE, "Hand landmark inference failed");
                return false;
            }
            if (presence <= PRESENCE_THRESHOLD) {
                landmarks.clear();
            }
        }

        if (landmarks.size() >= HAND_LANDMARK_COUNT) {
            GestureClassifier::Classify(landmarks, gestures, HAND_GESTURE_MAX);

            // 像素坐标 -> 归一化图像坐标，z 与 x 同尺度
            const float inv_w = 1.0f / frame.cols;
            const float inv_h = 1.0f / frame.rows;
            out_result->hasHand = true;
            for (int i = 0; i < HAND_LANDMARK_COUNT; i++) {
                out_result->landmarks[i] = {landmarks[i].x * inv_w, landmarks[i].y * inv_h, landmarks[i].z * inv_w};
            }
            out_result->gestureCount = (int)gestures.size();
            for (size_t i = 0; i < gestures.size(); i++) {
                CopyGestureName(gestures[i].name, out_result->gestures[i].categoryName);
                out_result->gestures[i].score = gestures[i].score;
            }
        }

        if (g_debug_mode) {
            ShowDebugFrame(frame, palms.empty() ? nullptr : &palms[0], landmarks, gestures);
        } else {
            CloseDebugWindow();
        }
    } catch (const cv::Exception& e) {
        SetError(HANDTRACKER_ERROR_INFERENCE, std::string("OpenCV error during detection: ") + e.what());
        return false;
    }
    return true;
}

HAND_API bool GetTrackerFrame(unsigned char* out_rgb, int capacity, int* out_width, int* out_height) {
    std::lock_guard<std::mutex> lock(g_tracker_mutex);
    if (!g_capture) {
        return false;
    }

    cv::Mat frame;
    if (!g_capture->getLatestFrame(frame)) {
        return false;
    }
    if (out_width) {
        *out_width = frame.cols;
    }
    if (out_height) {
        *out_height = frame.rows;
    }

    const int size = frame.cols * frame.rows * 3;
    if (out_rgb == nullptr || capacity < size) {
        return false;
    }
    if (frame.isContinuous()) {
        std::memcpy(out_rgb, frame.data, (size_t)size);
    } else {
        for (int y = 0; y < frame.rows; y++) {
            std::memcpy(out_rgb + (size_t)y * frame.cols * 3, frame.ptr(y), (size_t)frame.cols * 3);
        }
    }
    return true;
}

HAND_API void ReleaseTracker() {
    std::lock_guard<std::mutex> lock(g_tracker_mutex);
    CloseDebugWindow();
    if (g_capture) {
        g_capture->close();
        g_capture.reset();
    }
    g_landmark_detector.reset();
    g_palm_detector.reset();
    std::cout << "[HandTracker] Released" << std::endl;
}

HAND_API void SetTrackerDebugMode(bool enabled) {
    g_debug_mode = enabled;
}

HAND_API bool GetTrackerDebugMode() {
    return g_debug_mode;
}
