#pragma once
// RenderPipeline - 粒子云场景状态与每帧渲染流程
// GPU 部分通过 IRenderBackend 实现 (GLRenderBackend)

#include <glm/glm.hpp>

#include <functional>
#include <vector>

#include "MorphState.h"
#include "ParticleSystem.h"
#include "SpatialMapper.h"
#include "Tween.h"

// 粒子云变换
struct CloudTransform {
    glm::vec3 position = glm::vec3(0.0f);
    glm::vec3 rotation = glm::vec3(0.0f);  // 各轴累积角度 (弧度)

    glm::mat4 GetModel() const;
};

// 提交给后端的一帧数据
struct FrameData {
    const std::vector<glm::vec3>* positions     = nullptr;
    bool                          positionsDirty = false;
    glm::vec3                     color         = glm::vec3(1.0f);
    glm::mat4                     model         = glm::mat4(1.0f);
    glm::mat4                     view          = glm::mat4(1.0f);
    glm::mat4                     projection    = glm::mat4(1.0f);
    float                         bloomStrength = 1.0f;
    float                         pixelRatio    = 1.0f;
    int                           width         = 0;
    int                           height        = 0;
};

using ResizeListener = std::function<void(int width, int height)>;

class IRenderBackend {
  public:
    virtual ~IRenderBackend() = default;

    // 创建 GPU 几何缓冲与渲染目标
    virtual bool Create(int particleCount, int width, int height) = 0;

    // 重建渲染目标
    virtual void Resize(int width, int height) = 0;

    // 基础 pass + bloom pass + 合成
    virtual void Render(const FrameData& frame) = 0;

    // 释放 GPU 资源
    virtual void Release() = 0;

    virtual void AddResizeListener(ResizeListener listener) = 0;
    virtual void RemoveResizeListener() = 0;
};

enum class PipelineState { UNINITIALIZED, RUNNING, TERMINATED };

class RenderPipeline {
  public:
    RenderPipeline(IRenderBackend& backend, const MorphState& morph);
    ~RenderPipeline();

    RenderPipeline(const RenderPipeline&)            = delete;
    RenderPipeline& operator=(const RenderPipeline&) = delete;

    // uninitialized -> running
    bool Start(const ParticleShapes& shapes, int width, int height, float pixelRatio = 1.0f);

    // 每帧调用一次: 跟随动画、旋转、插值、颜色、渲染
    void Tick(float dt);

    // 窗口大小变化，终止后为空操作
    void OnResize(int width, int height);

    // 粒子云移动到世界坐标 (0.2s 补间，覆盖之前的动画)
    void MoveCloudTo(const glm::vec3& target);

    // 归一化屏幕坐标经 SpatialMapper 映射后移动，射线退化时保持原位置
    bool MoveCloudToScreenPoint(float x, float y);

    // -> terminated, 可重复调用
    void Stop();

    PipelineState                 GetState() const { return m_state; }
    bool                          IsRunning() const { return m_state == PipelineState::RUNNING; }
    const Camera&                 GetCamera() const { return m_camera; }
    const CloudTransform&         GetTransform() const { return m_transform; }
    const std::vector<glm::vec3>& GetPositions() const { return m_positions; }
    glm::vec3                     GetColor() const { return m_color; }
    int                           GetWidth() const { return m_width; }
    int                           GetHeight() const { return m_height; }
    long long                     GetFrameCount() const { return m_frameCount; }

    // 颜色阈值: factor > 0.5 为爆炸色
    static glm::vec3 ColorForFactor(float factor);

  private:
    IRenderBackend&        m_backend;
    const MorphState&      m_morph;
    PipelineState          m_state = PipelineState::UNINITIALIZED;
    ParticleShapes         m_shapes;
    std::vector<glm::vec3> m_positions;
    CloudTransform         m_transform;
    Tween<glm::vec3>       m_follow;
    Camera                 m_camera;
    glm::vec3              m_color;
    int                    m_width      = 0;
    int                    m_height     = 0;
    float                  m_pixelRatio = 1.0f;
    long long              m_frameCount = 0;
};
