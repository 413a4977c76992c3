#pragma once
// 窗口管理器 - 全屏切换、帧缓冲大小回调

#include <GLFW/glfw3.h>

#include <algorithm>
#include <iostream>

#include "AppState.h"
#include "Constants.h"

namespace WindowManager {

// 帧缓冲 / 窗口 的像素比，上限 MAX_PIXEL_RATIO
inline float ComputePixelRatio(GLFWwindow* window) {
    int fbW = 0, fbH = 0, winW = 0, winH = 0;
    glfwGetFramebufferSize(window, &fbW, &fbH);
    glfwGetWindowSize(window, &winW, &winH);
    if (winW <= 0 || fbW <= 0) {
        return 1.0f;
    }
    return std::min((float)fbW / (float)winW, MAX_PIXEL_RATIO);
}

// 切换全屏模式
inline void ToggleFullscreen(GLFWwindow* window, AppState& state) {
    if (!state.window.isFullscreen) {
        glfwGetWindowPos(window, &state.window.windowedX, &state.window.windowedY);
        glfwGetWindowSize(window, &state.window.windowedW, &state.window.windowedH);

        GLFWmonitor*       monitor = glfwGetPrimaryMonitor();
        const GLFWvidmode* mode    = monitor ? glfwGetVideoMode(monitor) : nullptr;
        if (!mode) {
            std::cerr << "[Window] No monitor available for fullscreen" << std::endl;
            return;
        }
        glfwSetWindowMonitor(window, monitor, 0, 0, mode->width, mode->height, mode->refreshRate);
        state.window.isFullscreen = true;
        std::cout << "[Window] Fullscreen: " << mode->width << "x" << mode->height << std::endl;
    } else {
        glfwSetWindowMonitor(window, nullptr, state.window.windowedX, state.window.windowedY, state.window.windowedW,
                             state.window.windowedH, 0);
        state.window.isFullscreen = false;
        std::cout << "[Window] Windowed: " << state.window.windowedW << "x" << state.window.windowedH << std::endl;
    }
}

// 帧缓冲大小变更回调
inline void FramebufferSizeCallback(GLFWwindow* window, int width, int height) {
    if (width > 0 && height > 0) {
        AppState* state = GetAppState(window);
        if (state) {
            state->window.width      = width;
            state->window.height     = height;
            state->render.pixelRatio = ComputePixelRatio(window);
            if (state->onFramebufferResize) {
                state->onFramebufferResize(width, height);
            }
        }
        glViewport(0, 0, width, height);
    }
}

} // namespace WindowManager
