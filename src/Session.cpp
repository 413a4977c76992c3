// Session.cpp - 生命周期与每帧调度

#include "Session.h"

#include <iostream>
#include <random>

#include "ParticleSystem.h"

const char* GetSessionStateName(SessionState state) {
    switch (state) {
    case SessionState::UNINITIALIZED:
        return "UNINITIALIZED";
    case SessionState::READY:
        return "READY";
    case SessionState::RUNNING:
        return "RUNNING";
    case SessionState::TERMINATED:
        return "TERMINATED";
    case SessionState::FAILURE:
        return "FAILURE";
    default:
        return "UNKNOWN";
    }
}

Session::Session(IHandDetector& detector, IRenderBackend& backend, const SessionConfig& config)
    : m_detector(detector), m_config(config), m_pipeline(backend, m_morph), m_mapper(detector, *this) {}

Session::~Session() {
    Stop();
}

bool Session::Initialize() {
    if (m_state != SessionState::UNINITIALIZED) {
        return m_state == SessionState::READY;
    }

    std::cout << "[Session] Loading hand detector..." << std::endl;
    if (!m_detector.Initialize()) {
        Fail("Hand detector initialization failed: " + m_detector.GetLastError());
        return false;
    }

    m_state = SessionState::READY;
    std::cout << "[Session] Ready" << std::endl;
    return true;
}

bool Session::Start(int width, int height, float pixelRatio) {
    if (m_state != SessionState::READY) {
        std::cerr << "[Session] Start() ignored in state " << GetSessionStateName(m_state) << std::endl;
        return false;
    }

    ParticleShapes shapes;
    bool           generated;
    if (m_config.fixedSeed) {
        std::mt19937 rng(m_config.seed);
        generated = ParticleSystem::GenerateShapes(m_config.particleCount, m_config.sphereRadius,
                                                   m_config.explosionRadius, rng, shapes);
    } else {
        generated = ParticleSystem::GenerateShapes(m_config.particleCount, m_config.sphereRadius,
                                                   m_config.explosionRadius, shapes);
    }
    if (!generated) {
        Fail("Particle shape generation failed");
        return false;
    }

    if (!m_pipeline.Start(shapes, width, height, pixelRatio)) {
        Fail("Render pipeline failed to start");
        return false;
    }

    std::cout << "[Session] Opening camera..." << std::endl;
    if (!m_detector.StartCamera()) {
        Fail("Camera could not be started: " + m_detector.GetLastError());
        return false;
    }

    m_mapper.Reset();
    m_state = SessionState::RUNNING;
    std::cout << "[Session] Running" << std::endl;
    return true;
}

void Session::Tick(float dt) {
    if (m_state != SessionState::RUNNING) {
        return;
    }
    m_mapper.Poll();
    m_morph.Update(dt);
    m_pipeline.Tick(dt);
}

void Session::Stop() {
    m_morph.Cancel();
    m_pipeline.Stop();
    if (!m_detectorReleased) {
        m_detectorReleased = true;
        m_detector.Release();
    }
    if (m_state != SessionState::FAILURE && m_state != SessionState::TERMINATED) {
        m_state = SessionState::TERMINATED;
        std::cout << "[Session] Terminated" << std::endl;
    }
}

void Session::RequestMorph(MorphTarget target) {
    m_morph.SetTarget(target);
}

void Session::UpdateHandPosition(float x, float y) {
    // 射线退化时保持上一次位置
    m_pipeline.MoveCloudToScreenPoint(x, y);
}

void Session::Fail(const std::string& message) {
    std::cerr << "[Session] Error: " << message << std::endl;
    m_error = message;
    m_morph.Cancel();
    m_pipeline.Stop();
    m_state = SessionState::FAILURE;
}
