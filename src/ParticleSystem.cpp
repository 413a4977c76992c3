// ParticleSystem.cpp - 目标形状生成

#include "ParticleSystem.h"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace ParticleSystem {

namespace {
const float PI = 3.14159265358979f;
}

bool GenerateShapes(int count, float sphereRadius, float explosionRadius, std::mt19937& rng, ParticleShapes& out) {
    if (count <= 0) {
        std::cerr << "[ParticleSystem] Invalid particle count: " << count << std::endl;
        return false;
    }
    if (sphereRadius <= 0.0f || explosionRadius < sphereRadius) {
        std::cerr << "[ParticleSystem] Invalid radii: sphere=" << sphereRadius << " explosion=" << explosionRadius
                  << std::endl;
        return false;
    }

    std::vector<glm::vec3> assembled(count);
    std::vector<glm::vec3> exploded(count);

    // 球面: 斐波那契螺旋分布
    const float spiral = std::sqrt((float)count * PI);
    for (int i = 0; i < count; i++) {
        float phi   = std::acos(-1.0f + (2.0f * i) / count);
        float theta = spiral * phi;
        assembled[i] =
            sphereRadius * glm::vec3(std::cos(theta) * std::sin(phi), std::sin(theta) * std::sin(phi), std::cos(phi));
    }

    // 爆炸: 随机方向 + [sphereRadius, explosionRadius] 内的随机半径
    std::uniform_real_distribution<float> rnd(0.0f, 1.0f);
    for (int i = 0; i < count; i++) {
        float theta = 2.0f * PI * rnd(rng);
        float phi   = std::acos(2.0f * rnd(rng) - 1.0f);
        float r     = sphereRadius + rnd(rng) * (explosionRadius - sphereRadius);
        exploded[i] = r * glm::vec3(std::sin(phi) * std::cos(theta), std::sin(phi) * std::sin(theta), std::cos(phi));
    }

    out.assembled = std::move(assembled);
    out.exploded  = std::move(exploded);
    return true;
}

bool GenerateShapes(int count, float sphereRadius, float explosionRadius, ParticleShapes& out) {
    std::random_device rd;
    std::mt19937       rng(rd());
    return GenerateShapes(count, sphereRadius, explosionRadius, rng, out);
}

void InterpolatePositions(const ParticleShapes& shapes, float factor, std::vector<glm::vec3>& out) {
    const size_t n   = std::min(out.size(), shapes.assembled.size());
    const float  inv = 1.0f - factor;
    for (size_t i = 0; i < n; i++) {
        out[i] = shapes.assembled[i] * inv + shapes.exploded[i] * factor;
    }
}

} // namespace ParticleSystem
