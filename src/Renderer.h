#pragma once

// 渲染器 - OpenGL 渲染目标、着色器编译、粒子/bloom/合成 pass

#include "AppState.h"
#include "RenderPipeline.h"

// 离屏渲染目标
// 场景用 RGBA16F，模糊用紧凑的 R11F_G11F_B10F
struct RenderTarget {
    GLuint fbo = 0, tex = 0;
    int    w = 0, h = 0;

    bool Init(int width, int height, GLenum internalFormat);
    void Release();
};

// Uniform 位置缓存（避免重复查询）
struct UniformCache {
    GLint pt_model, pt_view, pt_proj, pt_uColor, pt_uSize, pt_uScale, pt_uPixelRatio, pt_uOpacity;
    GLint th_uTexture, th_uThreshold;
    GLint blur_uTexture, blur_uTexelSize, blur_uOffset;
    GLint comp_uScene, comp_uBloom, comp_uBloomStrength, comp_uExposure;
};

namespace Renderer {

// 编译并链接着色器程序，失败返回 0
unsigned int CreateProgram(const char* vertexSrc, const char* fragmentSrc);

// 全屏四边形 (两个三角形, NDC)
void CreateQuad(GLuint& vao, GLuint& vbo);

} // namespace Renderer

// IRenderBackend 的 OpenGL 实现
class GLRenderBackend : public IRenderBackend {
  public:
    explicit GLRenderBackend(AppState& state);
    ~GLRenderBackend() override;

    bool Create(int particleCount, int width, int height) override;
    void Resize(int width, int height) override;
    void Render(const FrameData& frame) override;
    void Release() override;
    void AddResizeListener(ResizeListener listener) override;
    void RemoveResizeListener() override;

    // 启动时的淡入 (0..1)，乘到粒子不透明度上
    void SetFadeAlpha(float alpha) { m_fade = alpha; }

  private:
    bool CreatePrograms();
    bool CreateTargets(int width, int height);
    void DrawParticles(const FrameData& frame);
    void DrawBloom();
    void DrawComposite(const FrameData& frame);

    AppState&      m_state;
    bool           m_created       = false;
    int            m_particleCount = 0;
    float          m_fade          = 1.0f;
    GLuint         m_pParticle = 0, m_pThreshold = 0, m_pBlur = 0, m_pComposite = 0;
    GLuint         m_particleVAO = 0, m_particleVBO = 0;
    GLuint         m_quadVAO = 0, m_quadVBO = 0;
    RenderTarget   m_scene;
    RenderTarget   m_blur[2];
    UniformCache   m_uc{};
    ResizeListener m_listener;
};

// 摄像头画面背景
class VideoBackground {
  public:
    ~VideoBackground();

    bool Init();
    void Release();

    // 上传 RGB24 帧，尺寸变化时重建纹理
    void Upload(const unsigned char* rgb, int width, int height);

    // 以 cover 方式铺满屏幕并叠加暗色遮罩
    void Draw(int screenW, int screenH, float dim);

    bool HasFrame() const { return m_frameW > 0; }

  private:
    GLuint m_program = 0;
    GLuint m_tex     = 0;
    GLuint m_vao = 0, m_vbo = 0;
    int    m_frameW = 0, m_frameH = 0;
    GLint  m_uTexture = -1, m_uUVScale = -1, m_uDim = -1;
};
