#pragma once
// 手势分类 - 基于手指伸展程度的几何启发式，输出 MediaPipe 风格类别与分数

#include <opencv2/core.hpp>

#include <string>
#include <vector>

struct GestureScore {
    std::string name;
    float       score;
};

namespace GestureClassifier {

// 单根手指伸展程度 (0=弯曲, 1=伸直)
// 0=拇指, 1=食指, 2=中指, 3=无名指, 4=小指
void FingerOpenness(const std::vector<cv::Point3f>& landmarks, float out[5]);

// landmarks: 21 个关键点 (任意统一尺度)
// 输出按分数降序，最多 max_count 项
void Classify(const std::vector<cv::Point3f>& landmarks, std::vector<GestureScore>& out, size_t max_count = 4);

} // namespace GestureClassifier
