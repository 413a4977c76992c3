#pragma once
// 测试替身 - 可编程的手部检测器与记录调用的渲染后端

#include <string>
#include <vector>

#include "HandDetector.h"
#include "RenderPipeline.h"

// 构造一只手: 21 个关键点，拇指与食指指尖在 x 方向相距 distance
inline std::vector<Landmark> MakeHand(float distance, float palmX = 0.5f, float palmY = 0.5f) {
    std::vector<Landmark> hand(21);
    for (Landmark& lm : hand) {
        lm.x = palmX;
        lm.y = palmY;
    }
    hand[4].x = 0.4f;
    hand[4].y = 0.5f;
    hand[8].x = 0.4f + distance;
    hand[8].y = 0.5f;
    return hand;
}

inline DetectionResult MakeResult(float distance, const std::string& gesture = "", float score = 0.0f) {
    DetectionResult result;
    result.landmarks.push_back(MakeHand(distance));
    std::vector<GestureCategory> categories;
    if (!gesture.empty()) {
        GestureCategory category;
        category.categoryName = gesture;
        category.score        = score;
        categories.push_back(category);
    }
    result.gestures.push_back(categories);
    return result;
}

class FakeHandDetector : public IHandDetector {
  public:
    bool initOk   = true;
    bool cameraOk = true;
    bool detectOk = true;

    double          frameTime = -1.0;
    DetectionResult next;

    int initCalls    = 0;
    int cameraCalls  = 0;
    int detectCalls  = 0;
    int releaseCalls = 0;

    // 推进一帧并设置该帧的检测结果
    void PushFrame(const DetectionResult& result) {
        next = result;
        frameTime += 1.0 / 30.0;
        if (frameTime < 0.0) {
            frameTime = 0.0;
        }
    }

    bool Initialize() override {
        initCalls++;
        return initOk;
    }
    bool StartCamera() override {
        cameraCalls++;
        return cameraOk;
    }
    double GetFrameTime() const override { return frameTime; }
    bool   Detect(DetectionResult& out) override {
        detectCalls++;
        if (!detectOk) {
            return false;
        }
        out = next;
        return true;
    }
    void        Release() override { releaseCalls++; }
    std::string GetLastError() const override { return "fake failure"; }
};

class FakeRenderBackend : public IRenderBackend {
  public:
    bool createOk = true;

    int createCalls   = 0;
    int resizeCalls   = 0;
    int renderCalls   = 0;
    int releaseCalls  = 0;
    int lastWidth     = 0;
    int lastHeight    = 0;
    int particleCount = 0;

    FrameData      lastFrame;
    ResizeListener listener;

    bool Create(int count, int width, int height) override {
        createCalls++;
        particleCount = count;
        lastWidth     = width;
        lastHeight    = height;
        return createOk;
    }
    void Resize(int width, int height) override {
        resizeCalls++;
        lastWidth  = width;
        lastHeight = height;
    }
    void Render(const FrameData& frame) override {
        renderCalls++;
        lastFrame = frame;
    }
    void Release() override { releaseCalls++; }
    void AddResizeListener(ResizeListener l) override { listener = std::move(l); }
    void RemoveResizeListener() override { listener = nullptr; }

    // 模拟窗口大小变化事件
    void FireResize(int width, int height) {
        if (listener) {
            listener(width, height);
        }
    }
};
