#include "HandLandmark.h"

#include <algorithm>
#include <cmath>
#include <iostream>

#include "ModelUtils.h"

bool HandLandmark::load(const std::string& model_path) {
    return ModelUtils::LoadInterpreter(model_path, "HandLandmark", model, interpreter);
}

bool HandLandmark::detect(const cv::Mat& roi_image, const cv::Mat& inverse, std::vector<cv::Point3f>& landmarks,
                          float& presence) {
    landmarks.clear();
    presence = 0.0f;
    if (!interpreter) {
        return false;
    }
    if (roi_image.empty()) {
        return true;
    }

    cv::Mat input = roi_image;
    if (input.cols != INPUT_SIZE || input.rows != INPUT_SIZE) {
        cv::resize(roi_image, input, cv::Size(INPUT_SIZE, INPUT_SIZE));
    }

    // 归一化到 0~1 直接写入输入张量
    float* tensor = interpreter->typed_input_tensor<float>(0);
    for (int y = 0; y < INPUT_SIZE; ++y) {
        const uint8_t* src = input.ptr<uint8_t>(y);
        float*         dst = tensor + y * INPUT_SIZE * 3;
        for (int x = 0; x < INPUT_SIZE * 3; ++x) {
            dst[x] = src[x] * (1.0f / 255.0f);
        }
    }

    if (interpreter->Invoke() != kTfLiteOk) {
        std::cerr << "[HandLandmark] Inference failed" << std::endl;
        return false;
    }

    // hand_landmark_full 输出 (顺序因导出版本而异):
    // 63 = 屏幕坐标关键点, 1 = presence, 1 = handedness, 63 = 世界坐标关键点
    const float* points = nullptr;
    float        score  = -1.0f;
    for (size_t i = 0; i < interpreter->outputs().size(); i++) {
        int          total = ModelUtils::ElementCount(interpreter->tensor(interpreter->outputs()[i]));
        const float* data  = interpreter->typed_output_tensor<float>((int)i);
        if (total == 63 && !points) {
            points = data;
        } else if (total == 1 && score < 0.0f) {
            // 第一个标量为 presence (logit 或概率)
            score = (data[0] < 0.0f || data[0] > 1.0f) ? ModelUtils::Sigmoid(data[0]) : data[0];
        }
    }
    if (!points) {
        std::cerr << "[HandLandmark] Unexpected output layout" << std::endl;
        return false;
    }
    presence = score < 0.0f ? 1.0f : score;

    // 部分模型输出 0~1，统一到 ROI 像素
    float max_abs = 0.0f;
    for (int i = 0; i < 21; i++) {
        max_abs = std::max(max_abs, std::max(std::abs(points[i * 3]), std::abs(points[i * 3 + 1])));
    }
    const float to_pixels = max_abs > 2.0f ? 1.0f : (float)INPUT_SIZE;

    const double a = inverse.at<double>(0, 0), b = inverse.at<double>(0, 1), c = inverse.at<double>(0, 2);
    const double d = inverse.at<double>(1, 0), e = inverse.at<double>(1, 1), f = inverse.at<double>(1, 2);
    // ROI -> 原图的缩放系数，用于 z
    const float scale = (float)std::sqrt(a * a + d * d);

    landmarks.reserve(21);
    for (int i = 0; i < 21; i++) {
        float x = points[i * 3] * to_pixels;
        float y = points[i * 3 + 1] * to_pixels;
        float z = points[i * 3 + 2] * to_pixels;
        landmarks.emplace_back((float)(a * x + b * y + c), (float)(d * x + e * y + f), z * scale);
    }
    return true;
}
