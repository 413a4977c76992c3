#pragma once
// MorphState - 爆炸系数与 bloom 强度的补间状态

#include "Tween.h"

enum class MorphTarget { ASSEMBLED, EXPLODED };

inline const char* GetMorphTargetName(MorphTarget target) {
    return target == MorphTarget::EXPLODED ? "EXPLODED" : "ASSEMBLED";
}

class MorphState {
  public:
    MorphState();

    // 开始向目标过渡，覆盖正在进行的动画
    // 聚合: 0.6s IN_OUT_CUBIC, bloom -> 1.0
    // 爆炸: 0.8s OUT_CUBIC,    bloom -> 2.0
    void SetTarget(MorphTarget target);

    void Update(float dt);

    // 停止所有动画，保持当前值
    void Cancel();

    float       GetFactor() const { return m_factor.Value(); }
    float       GetBloomStrength() const { return m_bloom.Value(); }
    MorphTarget GetTarget() const { return m_target; }
    bool        IsAnimating() const { return m_factor.IsActive() || m_bloom.IsActive(); }
    int         GetTransitionCount() const { return m_transitionCount; }

  private:
    Tween<float> m_factor;
    Tween<float> m_bloom;
    MorphTarget  m_target          = MorphTarget::ASSEMBLED;
    int          m_transitionCount = 0;
};
