#pragma once

// 着色器源码 - 所有 GLSL 着色器代码

namespace Shaders {

// 粒子顶点着色器 - 圆形点精灵，透视衰减
const char* const VertexParticle = R"(
#version 430 core
layout (location = 0) in vec3 aPos;
uniform mat4 model; uniform mat4 view; uniform mat4 projection;
uniform vec3 uColor;
uniform float uSize;        // 世界单位
uniform float uScale;       // 帧缓冲高度 * 0.5
uniform float uPixelRatio;
out vec3 vColor;

void main() {
    vec4 worldPos = model * vec4(aPos, 1.0);
    vec4 mvPosition = view * worldPos;
    gl_Position = projection * mvPosition;

    float dist = max(-mvPosition.z, 0.001);
    gl_PointSize = max(uSize * uScale / dist, uPixelRatio);

    // 点材质不受光照影响，颜色只由形变系数决定
    vColor = uColor;
}
)";

const char* const FragmentParticle = R"(
#version 430 core
out vec4 FragColor;
in vec3 vColor;
uniform float uOpacity;

void main() {
    vec2 cxy = 2.0 * gl_PointCoord - 1.0;
    if (dot(cxy, cxy) > 1.0) discard;
    FragColor = vec4(vColor, uOpacity);
}
)";

// 全屏四边形着色器
const char* const VertexQuad = R"(
#version 430 core
layout(location=0) in vec2 aPos;
out vec2 vUV;
void main(){ vUV = aPos * 0.5 + 0.5; gl_Position = vec4(aPos, 0.0, 1.0); }
)";

// 降采样 + 亮度阈值 (bloom 输入)
const char* const FragmentThreshold = R"(
#version 430 core
out vec4 F; in vec2 vUV;
uniform sampler2D uTexture; uniform float uThreshold;
void main(){
    vec3 col = texture(uTexture, vUV).rgb;
    float luma = dot(col, vec3(0.2126, 0.7152, 0.0722));
    F = vec4(col * step(uThreshold, luma), 1.0);
}
)";

// Kawase Blur 着色器
// 每次迭代采样4个对角线方向的像素，通过多次迭代实现模糊
const char* const FragmentBlur = R"(
#version 430 core
out vec4 F; in vec2 vUV; uniform sampler2D uTexture; uniform vec2 uTexelSize; uniform float uOffset;
void main(){
    vec2 off = uTexelSize * (uOffset + 0.5);
    vec4 sum = texture(uTexture, vUV + vec2(-off.x, off.y));  // 左上
    sum += texture(uTexture, vUV + vec2(off.x, off.y));       // 右上
    sum += texture(uTexture, vUV + vec2(off.x, -off.y));      // 右下
    sum += texture(uTexture, vUV + vec2(-off.x, -off.y));     // 左下
    F = sum * 0.25;
}
)";

// 合成: 场景 + bloom，Reinhard tone mapping，透明输出 (alpha = 最大通道)
const char* const FragmentComposite = R"(
#version 430 core
out vec4 FragColor;
in vec2 vUV;
uniform sampler2D uScene;
uniform sampler2D uBloom;
uniform float uBloomStrength;
uniform float uExposure;

void main(){
    vec3 col = texture(uScene, vUV).rgb + texture(uBloom, vUV).rgb * uBloomStrength;
    col *= uExposure;
    col = col / (col + vec3(1.0));
    float alpha = clamp(max(max(col.r, col.g), col.b), 0.0, 1.0);
    FragColor = vec4(col, alpha);
}
)";

// 摄像头背景: cover 适配 + 暗色遮罩
const char* const FragmentVideo = R"(
#version 430 core
out vec4 FragColor;
in vec2 vUV;
uniform sampler2D uTexture;
uniform vec2 uUVScale;
uniform float uDim;

void main(){
    vec2 uv = (vUV - 0.5) * uUVScale + 0.5;
    uv.y = 1.0 - uv.y;  // 图像原点在左上
    vec3 col = texture(uTexture, uv).rgb;
    FragColor = vec4(col * (1.0 - uDim), 1.0);
}
)";

} // namespace Shaders
