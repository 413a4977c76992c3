// SpatialMapper.cpp - 屏幕坐标反投影

#include "SpatialMapper.h"

#include <glm/gtc/matrix_transform.hpp>

#include <cmath>

glm::mat4 Camera::GetProjection() const {
    return glm::perspective(glm::radians(fov), aspect, nearZ, farZ);
}

glm::mat4 Camera::GetView() const {
    return glm::lookAt(position, position + glm::vec3(0, 0, -1), glm::vec3(0, 1, 0));
}

namespace SpatialMapper {

namespace {
const float PARALLEL_EPSILON = 1e-6f;

bool IsFinite(const glm::vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}
} // namespace

std::optional<glm::vec3> MapToPlane(float x, float y, const Camera& camera) {
    // 屏幕 y 向下，NDC y 向上
    glm::vec4 clip(x * 2.0f - 1.0f, -y * 2.0f + 1.0f, 0.5f, 1.0f);

    glm::mat4 invViewProj = glm::inverse(camera.GetProjection() * camera.GetView());
    glm::vec4 world       = invViewProj * clip;
    // 投影矩阵退化 (fov 或 aspect 为 0) 时逆矩阵含 inf/NaN
    if (!std::isfinite(world.w) || std::abs(world.w) < PARALLEL_EPSILON) {
        return std::nullopt;
    }
    glm::vec3 point  = glm::vec3(world) / world.w;
    glm::vec3 offset = point - camera.position;
    if (!IsFinite(offset) || glm::length(offset) < PARALLEL_EPSILON) {
        return std::nullopt;
    }

    glm::vec3 dir = glm::normalize(offset);
    if (std::abs(dir.z) < PARALLEL_EPSILON) {
        return std::nullopt;
    }

    float     t   = -camera.position.z / dir.z;
    glm::vec3 hit = camera.position + dir * t;
    if (!IsFinite(hit)) {
        return std::nullopt;
    }
    return hit;
}

} // namespace SpatialMapper
