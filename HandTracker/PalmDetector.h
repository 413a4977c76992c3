#pragma once
#ifndef PALM_DETECTOR_H
#define PALM_DETECTOR_H

#include <memory>
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

#include "tensorflow/lite/interpreter.h"
#include "tensorflow/lite/model.h"

// 手掌检测结果 (坐标均归一化到 0~1)
struct PalmDetection {
    float       score    = 0.0f;
    cv::Rect2f  rect;             // 手掌包围框
    cv::Point2f keypoints[7];     // 0=手腕, 2=中指根部
    float       rotation = 0.0f;  // 手掌朝向 (弧度)
    cv::Point2f roi[4];           // 扩展后的手部 ROI 四角 (旋转矩形)
};

// 手掌检测器 - MediaPipe Palm Detection (192x192)
class PalmDetector {
  public:
    bool load(const std::string& model_path);
    bool isLoaded() const { return interpreter != nullptr; }

    // 检测置信度最高的手掌 (NMS 后)
    // image: RGB 图像
    // 返回 false 表示推理失败，未检测到手掌时返回 true 且 out 为空
    bool detect(const cv::Mat& image, std::vector<PalmDetection>& out, float prob_threshold = 0.5f,
                float nms_threshold = 0.3f, size_t max_hands = 1);

    // 将手部 ROI 仿射到 size x size 的图像，同时给出逆变换 (ROI 像素 -> 原图像素)
    static void cropHand(const cv::Mat& image, const PalmDetection& palm, int size, cv::Mat& roi_image,
                         cv::Mat& inverse);

  private:
    struct Anchor {
        float x_center, y_center;
    };

    std::unique_ptr<tflite::FlatBufferModel> model;
    std::unique_ptr<tflite::Interpreter>     interpreter;
    std::vector<Anchor>                      anchors;
    const int                                input_size = 192;

    void generateAnchors();
    void decode(const float* scores, const float* boxes, int count, float threshold,
                std::vector<PalmDetection>& candidates) const;
    static void computeROI(PalmDetection& det);
};

#endif
