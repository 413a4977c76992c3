// MorphState.cpp - 形变状态实现

#include "MorphState.h"

#include <iostream>

#include "Constants.h"

MorphState::MorphState() : m_factor(0.0f), m_bloom(BLOOM_ASSEMBLED) {}

void MorphState::SetTarget(MorphTarget target) {
    m_target = target;
    m_transitionCount++;

    if (target == MorphTarget::EXPLODED) {
        m_factor.To(1.0f, EXPLODE_DURATION, Ease::OUT_CUBIC);
        m_bloom.To(BLOOM_EXPLODED, EXPLODE_DURATION, Ease::OUT_CUBIC);
    } else {
        m_factor.To(0.0f, ASSEMBLE_DURATION, Ease::IN_OUT_CUBIC);
        m_bloom.To(BLOOM_ASSEMBLED, ASSEMBLE_DURATION, Ease::IN_OUT_CUBIC);
    }

    std::cout << "[Morph] Target: " << GetMorphTargetName(target) << " (from factor " << m_factor.Value() << ")"
              << std::endl;
}

void MorphState::Update(float dt) {
    m_factor.Update(dt);
    m_bloom.Update(dt);
}

void MorphState::Cancel() {
    m_factor.Cancel();
    m_bloom.Cancel();
}
