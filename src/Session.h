#pragma once
// Session - 应用生命周期: 加载 -> 就绪 -> 运行 -> 终止 (或错误)
// 每帧顺序: 检测器轮询/手势映射 -> 补间更新 -> 渲染

#include <string>

#include "Constants.h"
#include "GestureMapper.h"
#include "HandDetector.h"
#include "MorphState.h"
#include "RenderPipeline.h"

enum class SessionState { UNINITIALIZED, READY, RUNNING, TERMINATED, FAILURE };

const char* GetSessionStateName(SessionState state);

struct SessionConfig {
    int          particleCount   = PARTICLE_COUNT;
    float        sphereRadius    = SPHERE_RADIUS;
    float        explosionRadius = EXPLOSION_RADIUS;
    bool         fixedSeed       = false;  // 为 true 时使用 seed，否则 random_device
    unsigned int seed            = 0;
};

class Session : public IGestureTarget {
  public:
    Session(IHandDetector& detector, IRenderBackend& backend, const SessionConfig& config = SessionConfig());
    ~Session() override;

    Session(const Session&)            = delete;
    Session& operator=(const Session&) = delete;

    // uninitialized -> ready (模型加载)，失败进入 error
    bool Initialize();

    // ready -> running (生成粒子、启动渲染、打开摄像头)，失败进入 error
    bool Start(int width, int height, float pixelRatio = 1.0f);

    void Tick(float dt);

    // 释放所有资源，可重复调用
    void Stop();

    // IGestureTarget
    void RequestMorph(MorphTarget target) override;
    void UpdateHandPosition(float x, float y) override;

    SessionState          GetState() const { return m_state; }
    const std::string&    GetErrorMessage() const { return m_error; }
    const char*           GetStatusText() const { return m_mapper.GetStatusText(); }
    const MorphState&     GetMorph() const { return m_morph; }
    const GestureMapper&  GetMapper() const { return m_mapper; }
    const RenderPipeline& GetPipeline() const { return m_pipeline; }
    RenderPipeline&       GetPipeline() { return m_pipeline; }
    const SessionConfig&  GetConfig() const { return m_config; }

  private:
    void Fail(const std::string& message);

    IHandDetector& m_detector;
    SessionConfig  m_config;
    MorphState     m_morph;
    RenderPipeline m_pipeline;
    GestureMapper  m_mapper;
    SessionState   m_state            = SessionState::UNINITIALIZED;
    std::string    m_error;
    bool           m_detectorReleased = false;
};
