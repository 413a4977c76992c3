#pragma once
// Tween - 带缓动曲线的补间动画 (标量或向量)

#include <algorithm>

// 缓动曲线
enum class Ease {
    LINEAR,
    OUT_QUAD,      // 1 - (1-t)^2
    OUT_CUBIC,     // 1 - (1-t)^3
    IN_OUT_CUBIC   // 前半段 4t^3, 后半段对称
};

inline float ApplyEase(float t, Ease curve) {
    t = std::max(0.0f, std::min(1.0f, t));
    switch (curve) {
    case Ease::OUT_QUAD: {
        float u = 1.0f - t;
        return 1.0f - u * u;
    }
    case Ease::OUT_CUBIC: {
        float u = 1.0f - t;
        return 1.0f - u * u * u;
    }
    case Ease::IN_OUT_CUBIC: {
        if (t < 0.5f) {
            return 4.0f * t * t * t;
        }
        float u = -2.0f * t + 2.0f;
        return 1.0f - u * u * u * 0.5f;
    }
    case Ease::LINEAR:
    default:
        return t;
    }
}

// 补间: 从当前值过渡到目标值
// To() 总是覆盖正在进行的动画 (起点取当前值)，Cancel() 停在当前值
template<typename T>
class Tween {
  public:
    Tween() = default;
    explicit Tween(const T& initial) : m_value(initial), m_from(initial), m_to(initial) {}

    void To(const T& target, float duration, Ease curve) {
        m_from     = m_value;
        m_to       = target;
        m_duration = duration;
        m_elapsed  = 0.0f;
        m_curve    = curve;
        if (duration <= 0.0f) {
            m_value  = target;
            m_active = false;
            return;
        }
        m_active = true;
    }

    void Update(float dt) {
        if (!m_active) {
            return;
        }
        m_elapsed += dt;
        if (m_elapsed >= m_duration) {
            m_value  = m_to;
            m_active = false;
            return;
        }
        float k = ApplyEase(m_elapsed / m_duration, m_curve);
        m_value = m_from + (m_to - m_from) * k;
    }

    void Cancel() { m_active = false; }

    // 直接设置值并停止动画
    void Set(const T& value) {
        m_value  = value;
        m_from   = value;
        m_to     = value;
        m_active = false;
    }

    bool     IsActive() const { return m_active; }
    const T& Value() const { return m_value; }
    const T& Target() const { return m_to; }

  private:
    T     m_value{};
    T     m_from{};
    T     m_to{};
    float m_duration = 0.0f;
    float m_elapsed  = 0.0f;
    Ease  m_curve    = Ease::LINEAR;
    bool  m_active   = false;
};
