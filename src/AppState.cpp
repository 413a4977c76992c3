// AppState.cpp - AppState 辅助函数与命令行解析

#include "pch.h"

#include "AppState.h"

#include <cstdlib>

AppState* GetAppState(GLFWwindow* window) {
    return static_cast<AppState*>(glfwGetWindowUserPointer(window));
}

void SetAppState(GLFWwindow* window, AppState* state) {
    glfwSetWindowUserPointer(window, state);
}

// ParticleMorph [model_dir] [camera_id]
bool ParseCommandLine(int argc, char** argv, AppState& state) {
    if (argc > 1 && argv[1][0] != '\0') {
        state.tracker.modelDir = argv[1];
    }
    if (argc > 2) {
        char* end = nullptr;
        long  id  = std::strtol(argv[2], &end, 10);
        if (end == argv[2] || *end != '\0' || id < 0) {
            std::cerr << "[Main] Invalid camera id: " << argv[2] << std::endl;
            return false;
        }
        state.tracker.cameraId = (int)id;
    }
    if (argc > 3) {
        std::cerr << "[Main] Usage: " << argv[0] << " [model_dir] [camera_id]" << std::endl;
        return false;
    }
    return true;
}
