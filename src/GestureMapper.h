#pragma once
// GestureMapper - 将检测结果分类为捏合/张开手掌/追踪，并驱动形变与跟随

#include "HandDetector.h"
#include "MorphState.h"

enum class GestureStatus { NO_HAND, PINCH, OPEN_PALM, TRACKING };

const char* GetGestureStatusText(GestureStatus status);

// 手势结果的接收方 (Session 实现)
class IGestureTarget {
  public:
    virtual ~IGestureTarget() = default;

    virtual void RequestMorph(MorphTarget target) = 0;

    // x, y: 手掌中心的归一化图像坐标
    virtual void UpdateHandPosition(float x, float y) = 0;
};

// 单帧分类结果
struct GestureDecision {
    GestureStatus status    = GestureStatus::NO_HAND;
    bool          hasTarget = false;
    MorphTarget   target    = MorphTarget::ASSEMBLED;
    bool          hasPalm   = false;
    float         palmX     = 0.0f;
    float         palmY     = 0.0f;
    float         pinchDistance = 0.0f;
};

class GestureMapper {
  public:
    GestureMapper(IHandDetector& detector, IGestureTarget& target);

    // 视频帧前进时执行一次检测并应用结果
    // 返回本次是否执行了检测
    bool Poll();

    // 应用一次检测结果 (Poll 内部调用)
    void Apply(const DetectionResult& result);

    // 纯分类，不产生副作用
    static GestureDecision Classify(const DetectionResult& result);

    GestureStatus GetStatus() const { return m_status; }
    const char*   GetStatusText() const { return GetGestureStatusText(m_status); }
    MorphTarget   GetLastTarget() const { return m_lastTarget; }
    float         GetPinchDistance() const { return m_pinchDistance; }
    bool          HasHand() const { return m_status != GestureStatus::NO_HAND; }

    // 重置帧时间与上次目标 (重新启动会话时)
    void Reset();

  private:
    IHandDetector&  m_detector;
    IGestureTarget& m_target;
    double          m_lastFrameTime = -1.0;
    MorphTarget     m_lastTarget    = MorphTarget::ASSEMBLED;
    GestureStatus   m_status        = GestureStatus::NO_HAND;
    float           m_pinchDistance = 0.0f;
    DetectionResult m_result;  // 复用，避免每帧分配
};
