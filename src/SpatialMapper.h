#pragma once
// SpatialMapper - 归一化屏幕坐标 -> z=0 平面上的世界坐标

#include <glm/glm.hpp>

#include <optional>

#include "Constants.h"

// 透视相机 (朝 -Z 方向)
struct Camera {
    glm::vec3 position = CAMERA_POSITION;
    float     fov      = CAMERA_FOV;  // 垂直视角 (度)
    float     aspect   = 16.0f / 9.0f;
    float     nearZ    = CAMERA_NEAR;
    float     farZ     = CAMERA_FAR;

    glm::mat4 GetProjection() const;
    glm::mat4 GetView() const;
};

namespace SpatialMapper {

// x, y: 归一化图像坐标 (0~1, 原点左上)
// 射线几乎平行于 z=0 平面或相机投影退化时返回空，调用方保持原位置
std::optional<glm::vec3> MapToPlane(float x, float y, const Camera& camera);

} // namespace SpatialMapper
