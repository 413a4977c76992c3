#pragma once
// 全局常量 - 粒子、相机、手势阈值、动画参数

#include <glm/glm.hpp>

// 粒子
const int   PARTICLE_COUNT   = 5000;
const float SPHERE_RADIUS    = 1.5f;
const float EXPLOSION_RADIUS = 8.0f;

// 手势阈值 (归一化图像坐标)
const float PINCH_THRESHOLD      = 0.08f;
const float EXPLODE_DISTANCE     = 0.2f;
const float OPEN_PALM_CONFIDENCE = 0.5f;

// 手部关键点索引
const int LANDMARK_THUMB_TIP = 4;
const int LANDMARK_INDEX_TIP = 8;
const int LANDMARK_PALM      = 9;
const int LANDMARK_COUNT     = 21;

// 相机
const float     CAMERA_FOV  = 75.0f;  // 垂直视角 (度)
const float     CAMERA_NEAR = 0.1f;
const float     CAMERA_FAR  = 100.0f;
const glm::vec3 CAMERA_POSITION(0.0f, 0.0f, 8.0f);

// 每帧旋转增量 (弧度)
const float ROTATION_STEP_Y = 0.002f;
const float ROTATION_STEP_Z = 0.001f;

// 形变动画
const float ASSEMBLE_DURATION = 0.6f;
const float EXPLODE_DURATION  = 0.8f;
const float FOLLOW_DURATION   = 0.2f;  // 粒子云跟随手部
const float BLOOM_ASSEMBLED   = 1.0f;
const float BLOOM_EXPLODED    = 2.0f;
const float COLOR_THRESHOLD   = 0.5f;

// 颜色
const int COLOR_ASSEMBLED = 0x8b5cf6;  // 紫罗兰
const int COLOR_EXPLODED  = 0xe879f9;  // 品红

// 粒子材质
const float POINT_SIZE    = 0.08f;
const float POINT_OPACITY = 0.8f;

// Bloom
const float BLOOM_THRESHOLD = 0.0f;
const float BLOOM_RADIUS    = 0.08f;
const int   BLOOM_DOWNSCALE = 6;  // 模糊 FBO 为窗口的 1/6
const float TONE_EXPOSURE   = 1.0f;

// 最大像素比
const float MAX_PIXEL_RATIO = 2.0f;

inline glm::vec3 HexToRGB(int hex) {
    return glm::vec3(((hex >> 16) & 0xFF) / 255.0f, ((hex >> 8) & 0xFF) / 255.0f, (hex & 0xFF) / 255.0f);
}

// 摄像头背景暗色遮罩
const float VIDEO_DIM = 0.4f;
