#define _USE_MATH_DEFINES
#include "PalmDetector.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <iostream>

#include "ModelUtils.h"

namespace {

const int   BOX_STRIDE     = 18;     // 4 个框参数 + 7 个关键点 * 2
const float ROI_SCALE      = 2.6f;   // 手掌框扩展为整只手
const float ROI_SHIFT_Y    = -0.5f;  // 向手指方向平移

float IoU(const cv::Rect2f& a, const cv::Rect2f& b) {
    float inter = (a & b).area();
    float uni   = a.area() + b.area() - inter;
    return uni > 0.0f ? inter / uni : 0.0f;
}

float NormalizeAngle(float angle) {
    while (angle > (float)M_PI) {
        angle -= 2.0f * (float)M_PI;
    }
    while (angle < -(float)M_PI) {
        angle += 2.0f * (float)M_PI;
    }
    return angle;
}

} // namespace

bool PalmDetector::load(const std::string& model_path) {
    if (!ModelUtils::LoadInterpreter(model_path, "PalmDetector", model, interpreter)) {
        return false;
    }
    generateAnchors();
    return true;
}

// SSD anchor: 步长 8 (2 个/格) 与步长 16 (6 个/格)
void PalmDetector::generateAnchors() {
    anchors.clear();
    const int strides[] = {8, 16, 16, 16};
    const int layers    = 4;

    int layer = 0;
    while (layer < layers) {
        int next = layer;
        while (next < layers && strides[next] == strides[layer]) {
            next++;
        }
        int per_cell = 2 * (next - layer);
        int grid     = input_size / strides[layer];
        for (int y = 0; y < grid; y++) {
            for (int x = 0; x < grid; x++) {
                for (int n = 0; n < per_cell; n++) {
                    anchors.push_back({(x + 0.5f) / grid, (y + 0.5f) / grid});
                }
            }
        }
        layer = next;
    }
    std::cout << "[PalmDetector] " << anchors.size() << " anchors" << std::endl;
}

void PalmDetector::decode(const float* scores, const float* boxes, int count, float threshold,
                          std::vector<PalmDetection>& candidates) const {
    const float inv = 1.0f / input_size;
    for (int i = 0; i < count && i < (int)anchors.size(); i++) {
        float score = ModelUtils::Sigmoid(scores[i]);
        if (score < threshold) {
            continue;
        }

        const float*  p = boxes + i * BOX_STRIDE;
        const Anchor& a = anchors[i];

        float cx = p[0] * inv + a.x_center;
        float cy = p[1] * inv + a.y_center;
        float w  = p[2] * inv;
        float h  = p[3] * inv;

        PalmDetection det;
        det.score = score;
        det.rect  = cv::Rect2f(cx - w * 0.5f, cy - h * 0.5f, w, h);
        for (int k = 0; k < 7; k++) {
            det.keypoints[k] = cv::Point2f(p[4 + k * 2] * inv + a.x_center, p[5 + k * 2] * inv + a.y_center);
        }
        candidates.push_back(det);
    }
}

// 旋转角: 手腕(0) -> 中指根部(2) 对齐竖直方向，然后扩展为手部 ROI
void PalmDetector::computeROI(PalmDetection& det) {
    const cv::Point2f& wrist  = det.keypoints[0];
    const cv::Point2f& middle = det.keypoints[2];
    det.rotation = NormalizeAngle((float)M_PI * 0.5f - std::atan2(-(middle.y - wrist.y), middle.x - wrist.x));

    float w  = det.rect.width;
    float h  = det.rect.height;
    float cx = det.rect.x + w * 0.5f;
    float cy = det.rect.y + h * 0.5f;

    float sin_r = std::sin(det.rotation);
    float cos_r = std::cos(det.rotation);
    cx += -(h * ROI_SHIFT_Y) * sin_r;
    cy += (h * ROI_SHIFT_Y) * cos_r;

    float half = std::max(w, h) * ROI_SCALE * 0.5f;
    const cv::Point2f corners[4] = {{-half, -half}, {half, -half}, {half, half}, {-half, half}};
    for (int i = 0; i < 4; i++) {
        det.roi[i] = cv::Point2f(cx + corners[i].x * cos_r - corners[i].y * sin_r,
                                 cy + corners[i].x * sin_r + corners[i].y * cos_r);
    }
}

bool PalmDetector::detect(const cv::Mat& image, std::vector<PalmDetection>& out, float prob_threshold,
                          float nms_threshold, size_t max_hands) {
    out.clear();
    if (!interpreter) {
        return false;
    }
    if (image.empty()) {
        return true;
    }

    // 输入: NHWC float, 0~1
    cv::Mat resized, input;
    cv::resize(image, resized, cv::Size(input_size, input_size));
    resized.convertTo(input, CV_32FC3, 1.0 / 255.0);
    float* tensor = interpreter->typed_input_tensor<float>(0);
    std::memcpy(tensor, input.ptr<float>(), (size_t)input_size * input_size * 3 * sizeof(float));

    if (interpreter->Invoke() != kTfLiteOk) {
        std::cerr << "[PalmDetector] Inference failed" << std::endl;
        return false;
    }

    // 按元素数量识别输出 (不同导出版本顺序不同)
    const float* scores = nullptr;
    const float* boxes  = nullptr;
    int          count  = 0;
    for (size_t i = 0; i < interpreter->outputs().size(); i++) {
        int total = ModelUtils::ElementCount(interpreter->tensor(interpreter->outputs()[i]));
        if (total == (int)anchors.size()) {
            scores = interpreter->typed_output_tensor<float>((int)i);
            count  = total;
        } else if (total == (int)anchors.size() * BOX_STRIDE) {
            boxes = interpreter->typed_output_tensor<float>((int)i);
        }
    }
    if (!scores || !boxes) {
        std::cerr << "[PalmDetector] Unexpected output layout" << std::endl;
        return false;
    }

    std::vector<PalmDetection> candidates;
    decode(scores, boxes, count, prob_threshold, candidates);
    std::sort(candidates.begin(), candidates.end(),
              [](const PalmDetection& a, const PalmDetection& b) { return a.score > b.score; });

    // 非极大值抑制
    std::vector<bool> suppressed(candidates.size(), false);
    for (size_t i = 0; i < candidates.size() && out.size() < max_hands; i++) {
        if (suppressed[i]) {
            continue;
        }
        PalmDetection det = candidates[i];
        computeROI(det);
        out.push_back(det);
        for (size_t j = i + 1; j < candidates.size(); j++) {
            if (!suppressed[j] && IoU(candidates[i].rect, candidates[j].rect) > nms_threshold) {
                suppressed[j] = true;
            }
        }
    }
    return true;
}

void PalmDetector::cropHand(const cv::Mat& image, const PalmDetection& palm, int size, cv::Mat& roi_image,
                            cv::Mat& inverse) {
    const float w = (float)image.cols;
    const float h = (float)image.rows;

    cv::Point2f src[3], dst[3];
    for (int i = 0; i < 3; i++) {
        src[i] = cv::Point2f(palm.roi[i].x * w, palm.roi[i].y * h);
    }
    dst[0] = cv::Point2f(0, 0);
    dst[1] = cv::Point2f((float)size, 0);
    dst[2] = cv::Point2f((float)size, (float)size);

    cv::Mat forward = cv::getAffineTransform(src, dst);
    cv::warpAffine(image, roi_image, forward, cv::Size(size, size));
    cv::invertAffineTransform(forward, inverse);
}
