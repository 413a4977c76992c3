#pragma once
// 手部检测器接口 - 由 HandTracker 后端实现，测试中可替换

#include <string>
#include <vector>

struct Landmark {
    float x = 0.0f;  // 归一化图像坐标 (0~1, 原点左上)
    float y = 0.0f;
    float z = 0.0f;  // 相对深度
};

struct GestureCategory {
    std::string categoryName;
    float       score = 0.0f;
};

// 每只手一组关键点和一组手势分类，只使用第一只手
struct DetectionResult {
    std::vector<std::vector<Landmark>>        landmarks;
    std::vector<std::vector<GestureCategory>> gestures;
};

class IHandDetector {
  public:
    virtual ~IHandDetector() = default;

    // 加载模型
    virtual bool Initialize() = 0;

    // 打开摄像头
    virtual bool StartCamera() = 0;

    // 最新视频帧的时间戳 (秒)，无帧时为负
    virtual double GetFrameTime() const = 0;

    // 对最新帧执行检测，失败返回 false
    virtual bool Detect(DetectionResult& out) = 0;

    virtual void Release() = 0;

    virtual std::string GetLastError() const = 0;
};
