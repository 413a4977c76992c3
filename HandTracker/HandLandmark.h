#pragma once
#ifndef HAND_LANDMARK_H
#define HAND_LANDMARK_H

#include <memory>
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

#include "tensorflow/lite/interpreter.h"
#include "tensorflow/lite/model.h"

// 手部关键点检测器 - MediaPipe Hand Landmark (224x224)
class HandLandmark {
  public:
    static const int INPUT_SIZE = 224;

    bool load(const std::string& model_path);
    bool isLoaded() const { return interpreter != nullptr; }

    // 检测 21 个关键点
    // roi_image: INPUT_SIZE x INPUT_SIZE 的手部 RGB 图像
    // inverse: ROI 像素 -> 原图像素的 2x3 仿射矩阵
    // landmarks: 输出原图像素坐标 (z 与 x 同尺度)
    // presence: 手部存在置信度 (0.0~1.0)
    // 返回 false 表示推理失败
    bool detect(const cv::Mat& roi_image, const cv::Mat& inverse, std::vector<cv::Point3f>& landmarks,
                float& presence);

  private:
    std::unique_ptr<tflite::FlatBufferModel> model;
    std::unique_ptr<tflite::Interpreter>     interpreter;
};

#endif
