// Renderer.cpp - 渲染器实现

#include "pch.h"

#include "Renderer.h"

#include "Constants.h"
#include "ErrorHandler.h"
#include "Shaders.h"

namespace {

const int BLUR_PASSES = 4;

} // namespace

namespace Renderer {

// 检查 shader 编译状态
static bool CheckShaderCompile(unsigned int shader, const char* type) {
    int success;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (!success) {
        char infoLog[512];
        glGetShaderInfoLog(shader, sizeof(infoLog), nullptr, infoLog);
        std::cerr << "[Renderer] " << type << " shader compile error: " << infoLog << std::endl;
        return false;
    }
    return true;
}

// 检查 program 链接状态
static bool CheckProgramLink(unsigned int program) {
    int success;
    glGetProgramiv(program, GL_LINK_STATUS, &success);
    if (!success) {
        char infoLog[512];
        glGetProgramInfoLog(program, sizeof(infoLog), nullptr, infoLog);
        std::cerr << "[Renderer] Program link error: " << infoLog << std::endl;
        return false;
    }
    return true;
}

unsigned int CreateProgram(const char* vertexSrc, const char* fragmentSrc) {
    unsigned int vs = glCreateShader(GL_VERTEX_SHADER);
    glShaderSource(vs, 1, &vertexSrc, 0);
    glCompileShader(vs);
    bool ok = CheckShaderCompile(vs, "Vertex");

    unsigned int fs = glCreateShader(GL_FRAGMENT_SHADER);
    glShaderSource(fs, 1, &fragmentSrc, 0);
    glCompileShader(fs);
    ok = CheckShaderCompile(fs, "Fragment") && ok;

    unsigned int program = glCreateProgram();
    glAttachShader(program, vs);
    glAttachShader(program, fs);
    glLinkProgram(program);
    ok = ok && CheckProgramLink(program);

    glDeleteShader(vs);
    glDeleteShader(fs);
    if (!ok) {
        glDeleteProgram(program);
        return 0;
    }
    return program;
}

void CreateQuad(GLuint& vao, GLuint& vbo) {
    const float quad[] = {-1, -1, 1, -1, 1, 1, -1, -1, 1, 1, -1, 1};
    glGenVertexArrays(1, &vao);
    glGenBuffers(1, &vbo);
    glBindVertexArray(vao);
    glBindBuffer(GL_ARRAY_BUFFER, vbo);
    glBufferData(GL_ARRAY_BUFFER, sizeof(quad), quad, GL_STATIC_DRAW);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, 2 * sizeof(float), (void*)0);
    glBindVertexArray(0);
}

} // namespace Renderer

// ========== RenderTarget ==========

bool RenderTarget::Init(int width, int height, GLenum internalFormat) {
    Release();
    w = std::max(width, 1);
    h = std::max(height, 1);
    glGenFramebuffers(1, &fbo);
    glGenTextures(1, &tex);
    glBindTexture(GL_TEXTURE_2D, tex);
    glTexImage2D(GL_TEXTURE_2D, 0, internalFormat, w, h, 0, GL_RGBA, GL_FLOAT, nullptr);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glBindFramebuffer(GL_FRAMEBUFFER, fbo);
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_COLOR_ATTACHMENT0, GL_TEXTURE_2D, tex, 0);
    bool complete = glCheckFramebufferStatus(GL_FRAMEBUFFER) == GL_FRAMEBUFFER_COMPLETE;
    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    if (!complete) {
        std::cerr << "[Renderer] Framebuffer incomplete (" << w << "x" << h << ")" << std::endl;
        Release();
        return false;
    }
    return true;
}

void RenderTarget::Release() {
    if (fbo) {
        glDeleteFramebuffers(1, &fbo);
        fbo = 0;
    }
    if (tex) {
        glDeleteTextures(1, &tex);
        tex = 0;
    }
    w = h = 0;
}

// ========== GLRenderBackend ==========

GLRenderBackend::GLRenderBackend(AppState& state) : m_state(state) {}

GLRenderBackend::~GLRenderBackend() {
    Release();
}

bool GLRenderBackend::CreatePrograms() {
    ErrorHandler::SetStage(ErrorHandler::AppStage::SHADER_COMPILE);
    m_pParticle  = Renderer::CreateProgram(Shaders::VertexParticle, Shaders::FragmentParticle);
    m_pThreshold = Renderer::CreateProgram(Shaders::VertexQuad, Shaders::FragmentThreshold);
    m_pBlur      = Renderer::CreateProgram(Shaders::VertexQuad, Shaders::FragmentBlur);
    m_pComposite = Renderer::CreateProgram(Shaders::VertexQuad, Shaders::FragmentComposite);
    if (!m_pParticle || !m_pThreshold || !m_pBlur || !m_pComposite) {
        return false;
    }

    m_uc.pt_model       = glGetUniformLocation(m_pParticle, "model");
    m_uc.pt_view        = glGetUniformLocation(m_pParticle, "view");
    m_uc.pt_proj        = glGetUniformLocation(m_pParticle, "projection");
    m_uc.pt_uColor      = glGetUniformLocation(m_pParticle, "uColor");
    m_uc.pt_uSize       = glGetUniformLocation(m_pParticle, "uSize");
    m_uc.pt_uScale      = glGetUniformLocation(m_pParticle, "uScale");
    m_uc.pt_uPixelRatio = glGetUniformLocation(m_pParticle, "uPixelRatio");
    m_uc.pt_uOpacity    = glGetUniformLocation(m_pParticle, "uOpacity");

    m_uc.th_uTexture   = glGetUniformLocation(m_pThreshold, "uTexture");
    m_uc.th_uThreshold = glGetUniformLocation(m_pThreshold, "uThreshold");

    m_uc.blur_uTexture   = glGetUniformLocation(m_pBlur, "uTexture");
    m_uc.blur_uTexelSize = glGetUniformLocation(m_pBlur, "uTexelSize");
    m_uc.blur_uOffset    = glGetUniformLocation(m_pBlur, "uOffset");

    m_uc.comp_uScene         = glGetUniformLocation(m_pComposite, "uScene");
    m_uc.comp_uBloom         = glGetUniformLocation(m_pComposite, "uBloom");
    m_uc.comp_uBloomStrength = glGetUniformLocation(m_pComposite, "uBloomStrength");
    m_uc.comp_uExposure      = glGetUniformLocation(m_pComposite, "uExposure");
    return true;
}

bool GLRenderBackend::CreateTargets(int width, int height) {
    int bw = std::max(width / BLOOM_DOWNSCALE, 1);
    int bh = std::max(height / BLOOM_DOWNSCALE, 1);
    return m_scene.Init(width, height, GL_RGBA16F) && m_blur[0].Init(bw, bh, GL_R11F_G11F_B10F) &&
           m_blur[1].Init(bw, bh, GL_R11F_G11F_B10F);
}

bool GLRenderBackend::Create(int particleCount, int width, int height) {
    Release();

    if (!CreatePrograms()) {
        std::cerr << "[Renderer] Shader program creation failed" << std::endl;
        return false;
    }
    if (!CreateTargets(width, height)) {
        return false;
    }

    // 粒子位置每帧更新
    m_particleCount = particleCount;
    glGenVertexArrays(1, &m_particleVAO);
    glGenBuffers(1, &m_particleVBO);
    glBindVertexArray(m_particleVAO);
    glBindBuffer(GL_ARRAY_BUFFER, m_particleVBO);
    glBufferData(GL_ARRAY_BUFFER, (GLsizeiptr)particleCount * sizeof(glm::vec3), nullptr, GL_DYNAMIC_DRAW);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, sizeof(glm::vec3), (void*)0);
    glBindVertexArray(0);

    Renderer::CreateQuad(m_quadVAO, m_quadVBO);

    m_created = true;
    std::cout << "[Renderer] Created: " << particleCount << " particles, scene " << m_scene.w << "x" << m_scene.h
              << ", bloom " << m_blur[0].w << "x" << m_blur[0].h << std::endl;
    return true;
}

void GLRenderBackend::Resize(int width, int height) {
    if (!m_created) {
        return;
    }
    if (!CreateTargets(width, height)) {
        std::cerr << "[Renderer] Resize to " << width << "x" << height << " failed" << std::endl;
    }
}

void GLRenderBackend::DrawParticles(const FrameData& frame) {
    glBindFramebuffer(GL_FRAMEBUFFER, m_scene.fbo);
    glViewport(0, 0, m_scene.w, m_scene.h);
    glClearColor(0.0f, 0.0f, 0.0f, 0.0f);
    glClear(GL_COLOR_BUFFER_BIT);

    if (frame.positions && frame.positionsDirty) {
        size_t count = std::min(frame.positions->size(), (size_t)m_particleCount);
        glBindBuffer(GL_ARRAY_BUFFER, m_particleVBO);
        glBufferSubData(GL_ARRAY_BUFFER, 0, (GLsizeiptr)(count * sizeof(glm::vec3)), frame.positions->data());
    }

    // 加法混合，不写深度
    glDisable(GL_DEPTH_TEST);
    glDepthMask(GL_FALSE);
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE);
    glEnable(GL_PROGRAM_POINT_SIZE);

    glUseProgram(m_pParticle);
    glUniformMatrix4fv(m_uc.pt_model, 1, GL_FALSE, glm::value_ptr(frame.model));
    glUniformMatrix4fv(m_uc.pt_view, 1, GL_FALSE, glm::value_ptr(frame.view));
    glUniformMatrix4fv(m_uc.pt_proj, 1, GL_FALSE, glm::value_ptr(frame.projection));
    glUniform3fv(m_uc.pt_uColor, 1, glm::value_ptr(frame.color));
    glUniform1f(m_uc.pt_uSize, POINT_SIZE);
    glUniform1f(m_uc.pt_uScale, m_scene.h * 0.5f);
    glUniform1f(m_uc.pt_uPixelRatio, frame.pixelRatio);
    glUniform1f(m_uc.pt_uOpacity, POINT_OPACITY * m_fade);

    glBindVertexArray(m_particleVAO);
    glDrawArrays(GL_POINTS, 0, m_particleCount);
    glBindVertexArray(0);

    glDepthMask(GL_TRUE);
}

void GLRenderBackend::DrawBloom() {
    glDisable(GL_BLEND);
    glBindVertexArray(m_quadVAO);

    // 降采样到 1/6
    glBindFramebuffer(GL_FRAMEBUFFER, m_blur[0].fbo);
    glViewport(0, 0, m_blur[0].w, m_blur[0].h);
    glUseProgram(m_pThreshold);
    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, m_scene.tex);
    glUniform1i(m_uc.th_uTexture, 0);
    glUniform1f(m_uc.th_uThreshold, BLOOM_THRESHOLD);
    glDrawArrays(GL_TRIANGLES, 0, 6);

    // Kawase 乒乓模糊，radius 0.08 对应每次 1 texel 步进
    glUseProgram(m_pBlur);
    glUniform1i(m_uc.blur_uTexture, 0);
    glUniform2f(m_uc.blur_uTexelSize, 1.0f / m_blur[0].w, 1.0f / m_blur[0].h);
    for (int i = 0; i < BLUR_PASSES; i++) {
        const RenderTarget& src = m_blur[i % 2];
        const RenderTarget& dst = m_blur[(i + 1) % 2];
        glBindFramebuffer(GL_FRAMEBUFFER, dst.fbo);
        glBindTexture(GL_TEXTURE_2D, src.tex);
        glUniform1f(m_uc.blur_uOffset, (float)i * BLOOM_RADIUS * 12.5f);
        glDrawArrays(GL_TRIANGLES, 0, 6);
    }
}

void GLRenderBackend::DrawComposite(const FrameData& frame) {
    // BLUR_PASSES 为偶数时结果在 m_blur[0]
    const RenderTarget& bloom = m_blur[BLUR_PASSES % 2];

    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    glViewport(0, 0, frame.width, frame.height);
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    glUseProgram(m_pComposite);
    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, m_scene.tex);
    glUniform1i(m_uc.comp_uScene, 0);
    glActiveTexture(GL_TEXTURE1);
    glBindTexture(GL_TEXTURE_2D, bloom.tex);
    glUniform1i(m_uc.comp_uBloom, 1);
    glUniform1f(m_uc.comp_uBloomStrength, frame.bloomStrength);
    glUniform1f(m_uc.comp_uExposure, TONE_EXPOSURE);

    glBindVertexArray(m_quadVAO);
    glDrawArrays(GL_TRIANGLES, 0, 6);
    glBindVertexArray(0);
    glActiveTexture(GL_TEXTURE0);
}

void GLRenderBackend::Render(const FrameData& frame) {
    if (!m_created) {
        return;
    }
    DrawParticles(frame);
    DrawBloom();
    DrawComposite(frame);
}

void GLRenderBackend::Release() {
    if (!m_created && !m_pParticle && !m_pThreshold && !m_pBlur && !m_pComposite) {
        return;
    }
    RemoveResizeListener();

    GLuint programs[] = {m_pParticle, m_pThreshold, m_pBlur, m_pComposite};
    for (GLuint p : programs) {
        if (p) {
            glDeleteProgram(p);
        }
    }
    m_pParticle = m_pThreshold = m_pBlur = m_pComposite = 0;

    if (m_particleVAO) {
        glDeleteVertexArrays(1, &m_particleVAO);
        glDeleteBuffers(1, &m_particleVBO);
        m_particleVAO = m_particleVBO = 0;
    }
    if (m_quadVAO) {
        glDeleteVertexArrays(1, &m_quadVAO);
        glDeleteBuffers(1, &m_quadVBO);
        m_quadVAO = m_quadVBO = 0;
    }
    m_scene.Release();
    m_blur[0].Release();
    m_blur[1].Release();

    if (m_created) {
        std::cout << "[Renderer] Released" << std::endl;
    }
    m_created = false;
}

void GLRenderBackend::AddResizeListener(ResizeListener listener) {
    m_listener                  = std::move(listener);
    m_state.onFramebufferResize = [this](int w, int h) {
        if (m_listener) {
            m_listener(w, h);
        }
    };
}

void GLRenderBackend::RemoveResizeListener() {
    m_listener = nullptr;
    m_state.onFramebufferResize = nullptr;
}

// ========== VideoBackground ==========

VideoBackground::~VideoBackground() {
    Release();
}

bool VideoBackground::Init() {
    m_program = Renderer::CreateProgram(Shaders::VertexQuad, Shaders::FragmentVideo);
    if (!m_program) {
        return false;
    }
    m_uTexture = glGetUniformLocation(m_program, "uTexture");
    m_uUVScale = glGetUniformLocation(m_program, "uUVScale");
    m_uDim     = glGetUniformLocation(m_program, "uDim");
    Renderer::CreateQuad(m_vao, m_vbo);
    glGenTextures(1, &m_tex);
    return true;
}

void VideoBackground::Release() {
    if (m_program) {
        glDeleteProgram(m_program);
        m_program = 0;
    }
    if (m_tex) {
        glDeleteTextures(1, &m_tex);
        m_tex = 0;
    }
    if (m_vao) {
        glDeleteVertexArrays(1, &m_vao);
        glDeleteBuffers(1, &m_vbo);
        m_vao = m_vbo = 0;
    }
    m_frameW = m_frameH = 0;
}

void VideoBackground::Upload(const unsigned char* rgb, int width, int height) {
    if (!m_tex || !rgb || width <= 0 || height <= 0) {
        return;
    }
    glBindTexture(GL_TEXTURE_2D, m_tex);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    if (width != m_frameW || height != m_frameH) {
        glTexImage2D(GL_TEXTURE_2D, 0, GL_RGB8, width, height, 0, GL_RGB, GL_UNSIGNED_BYTE, rgb);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
        glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
        m_frameW = width;
        m_frameH = height;
    } else {
        glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, width, height, GL_RGB, GL_UNSIGNED_BYTE, rgb);
    }
    glPixelStorei(GL_UNPACK_ALIGNMENT, 4);
}

void VideoBackground::Draw(int screenW, int screenH, float dim) {
    if (!m_program || !HasFrame() || screenW <= 0 || screenH <= 0) {
        return;
    }

    // cover: 保持比例铺满，裁掉多余部分
    float screenAspect = (float)screenW / (float)screenH;
    float frameAspect  = (float)m_frameW / (float)m_frameH;
    glm::vec2 uvScale(1.0f);
    if (screenAspect > frameAspect) {
        uvScale.y = frameAspect / screenAspect;
    } else {
        uvScale.x = screenAspect / frameAspect;
    }

    glBindFramebuffer(GL_FRAMEBUFFER, 0);
    glViewport(0, 0, screenW, screenH);
    glDisable(GL_BLEND);
    glUseProgram(m_program);
    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, m_tex);
    glUniform1i(m_uTexture, 0);
    glUniform2f(m_uUVScale, uvScale.x, uvScale.y);
    glUniform1f(m_uDim, dim);
    glBindVertexArray(m_vao);
    glDrawArrays(GL_TRIANGLES, 0, 6);
    glBindVertexArray(0);
}
