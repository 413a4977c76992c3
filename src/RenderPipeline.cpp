// RenderPipeline.cpp - 渲染流程实现

#include "RenderPipeline.h"

#include <glm/gtc/matrix_transform.hpp>

#include <algorithm>
#include <iostream>

#include "Constants.h"

glm::mat4 CloudTransform::GetModel() const {
    // 与 Euler XYZ 顺序一致
    glm::mat4 m = glm::translate(glm::mat4(1.0f), position);
    m           = glm::rotate(m, rotation.x, glm::vec3(1, 0, 0));
    m           = glm::rotate(m, rotation.y, glm::vec3(0, 1, 0));
    m           = glm::rotate(m, rotation.z, glm::vec3(0, 0, 1));
    return m;
}

RenderPipeline::RenderPipeline(IRenderBackend& backend, const MorphState& morph)
    : m_backend(backend), m_morph(morph), m_follow(glm::vec3(0.0f)), m_color(HexToRGB(COLOR_ASSEMBLED)) {}

RenderPipeline::~RenderPipeline() {
    Stop();
}

glm::vec3 RenderPipeline::ColorForFactor(float factor) {
    return HexToRGB(factor > COLOR_THRESHOLD ? COLOR_EXPLODED : COLOR_ASSEMBLED);
}

bool RenderPipeline::Start(const ParticleShapes& shapes, int width, int height, float pixelRatio) {
    if (m_state != PipelineState::UNINITIALIZED) {
        std::cerr << "[Pipeline] Start() ignored: pipeline already started" << std::endl;
        return false;
    }
    if (shapes.assembled.empty() || shapes.assembled.size() != shapes.exploded.size()) {
        std::cerr << "[Pipeline] Invalid particle shapes (" << shapes.assembled.size() << " / "
                  << shapes.exploded.size() << ")" << std::endl;
        return false;
    }

    m_width      = std::max(width, 1);
    m_height     = std::max(height, 1);
    m_pixelRatio = std::min(pixelRatio, MAX_PIXEL_RATIO);
    m_shapes     = shapes;
    m_positions.assign(m_shapes.assembled.size(), glm::vec3(0.0f));
    ParticleSystem::InterpolatePositions(m_shapes, m_morph.GetFactor(), m_positions);

    m_camera        = Camera();
    m_camera.aspect = (float)m_width / (float)m_height;

    if (!m_backend.Create((int)m_positions.size(), m_width, m_height)) {
        std::cerr << "[Pipeline] Render backend creation failed" << std::endl;
        m_backend.Release();
        m_state = PipelineState::TERMINATED;
        return false;
    }

    m_backend.AddResizeListener([this](int w, int h) { OnResize(w, h); });
    m_state = PipelineState::RUNNING;
    std::cout << "[Pipeline] Running: " << m_positions.size() << " particles, " << m_width << "x" << m_height
              << std::endl;
    return true;
}

void RenderPipeline::Tick(float dt) {
    if (m_state != PipelineState::RUNNING) {
        return;
    }

    // 0. 跟随动画
    m_follow.Update(dt);
    m_transform.position = m_follow.Value();

    // 1. 固定步长旋转
    m_transform.rotation.y += ROTATION_STEP_Y;
    m_transform.rotation.z += ROTATION_STEP_Z;

    // 2. 插值所有粒子
    float factor = m_morph.GetFactor();
    ParticleSystem::InterpolatePositions(m_shapes, factor, m_positions);

    // 3. 颜色硬切换
    m_color = ColorForFactor(factor);

    // 4. 渲染
    FrameData frame;
    frame.positions      = &m_positions;
    frame.positionsDirty = true;
    frame.color          = m_color;
    frame.model          = m_transform.GetModel();
    frame.view           = m_camera.GetView();
    frame.projection     = m_camera.GetProjection();
    frame.bloomStrength  = m_morph.GetBloomStrength();
    frame.pixelRatio     = m_pixelRatio;
    frame.width          = m_width;
    frame.height         = m_height;
    m_backend.Render(frame);

    m_frameCount++;
}

void RenderPipeline::OnResize(int width, int height) {
    if (m_state != PipelineState::RUNNING) {
        return;
    }
    // 最小化时 framebuffer 为 0
    if (width <= 0 || height <= 0) {
        return;
    }
    m_width         = width;
    m_height        = height;
    m_camera.aspect = (float)width / (float)height;
    m_backend.Resize(width, height);
}

void RenderPipeline::MoveCloudTo(const glm::vec3& target) {
    if (m_state != PipelineState::RUNNING) {
        return;
    }
    m_follow.To(target, FOLLOW_DURATION, Ease::OUT_QUAD);
}

bool RenderPipeline::MoveCloudToScreenPoint(float x, float y) {
    std::optional<glm::vec3> world = SpatialMapper::MapToPlane(x, y, m_camera);
    if (!world) {
        return false;
    }
    MoveCloudTo(*world);
    return true;
}

void RenderPipeline::Stop() {
    if (m_state == PipelineState::TERMINATED) {
        return;
    }
    bool wasRunning = m_state == PipelineState::RUNNING;
    m_state         = PipelineState::TERMINATED;
    m_follow.Cancel();
    if (wasRunning) {
        m_backend.RemoveResizeListener();
        m_backend.Release();
        std::cout << "[Pipeline] Terminated after " << m_frameCount << " frames" << std::endl;
    }
}
