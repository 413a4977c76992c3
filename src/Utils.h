#pragma once
// 工具 - UI 动画值与 FPS 统计

#include <cmath>

// 指数趋近的动画值 (UI 控件)
struct AnimFloat {
    float val    = 0.0f;
    float target = 0.0f;

    void Update(float dt, float speed = 15.0f) {
        val += (target - val) * (1.0f - std::exp(-speed * dt));
        if (std::abs(target - val) < 0.001f) {
            val = target;
        }
    }
};

// 环形缓冲区 FPS 计算器
// 使用固定大小的环形缓冲区存储最近 N 帧的帧时间，计算滑动平均
template<int N = 60>
class RingBufferFPS {
public:
    RingBufferFPS() {
        for (int i = 0; i < N; i++) frameTimes[i] = 1.0f / 60.0f;
    }

    void AddFrameTime(float dt) {
        sum -= frameTimes[index];
        frameTimes[index] = dt;
        sum += dt;
        index = (index + 1) % N;
        if (count < N) count++;
    }

    float GetAverageFPS() const {
        if (count == 0 || sum <= 0.0f) return 60.0f;
        return (float)N / sum;
    }

    float GetAverageFrameTime() const {
        return sum / (float)N;
    }

private:
    float frameTimes[N];
    float sum   = N * (1.0f / 60.0f);  // 初始假设 60 FPS
    int   index = 0;
    int   count = 0;
};
