#pragma once
// 粒子系统 - 球体/爆炸两组目标形状的生成与插值

#include <glm/glm.hpp>

#include <random>
#include <vector>

// 两组等长、按下标对齐的目标形状
struct ParticleShapes {
    std::vector<glm::vec3> assembled;  // 斐波那契球面 (确定性)
    std::vector<glm::vec3> exploded;   // 随机球壳
};

namespace ParticleSystem {

// 生成目标形状，返回是否成功
// count <= 0、sphereRadius <= 0 或 explosionRadius < sphereRadius 时失败，out 不变
bool GenerateShapes(int count, float sphereRadius, float explosionRadius, std::mt19937& rng, ParticleShapes& out);

// 使用 random_device 播种
bool GenerateShapes(int count, float sphereRadius, float explosionRadius, ParticleShapes& out);

// out[i] = assembled[i] * (1 - factor) + exploded[i] * factor
// out 必须已分配为相同长度
void InterpolatePositions(const ParticleShapes& shapes, float factor, std::vector<glm::vec3>& out);

} // namespace ParticleSystem
