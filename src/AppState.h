#pragma once
// AppState - 应用程序全局状态封装

#include <functional>
#include <string>

// 前向声明
struct GLFWwindow;

struct AppState {
    // 窗口状态
    struct {
        unsigned int width        = 1280;
        unsigned int height       = 720;
        bool         isFullscreen = false;
        int          windowedX    = 100;
        int          windowedY    = 100;
        int          windowedW    = 1280;
        int          windowedH    = 720;
    } window;

    // 渲染状态
    struct {
        float pixelRatio = 1.0f;  // 帧缓冲 / 窗口尺寸，上限 MAX_PIXEL_RATIO
    } render;

    // UI 状态
    struct {
        bool  showDebugWindow = false;
        bool  showCameraDebug = false;
        bool  showVideo       = true;
        float dpiScale        = 1.0f;
    } ui;

    // 输入状态 (按键防抖)
    struct {
        bool keyF3_pressed  = false;
        bool keyF11_pressed = false;
    } input;

    // 手部追踪配置
    struct {
        std::string modelDir = "models";
        int         cameraId = 0;
    } tracker;

    // OpenGL 信息 (用于错误报告)
    struct {
        std::string version;
        std::string renderer;
    } gl;

    // 帧缓冲大小变化时通知渲染后端
    std::function<void(int, int)> onFramebufferResize;
};

// 从 GLFWwindow 获取 AppState 指针的辅助函数
AppState* GetAppState(GLFWwindow* window);

// 设置 AppState 到 GLFWwindow 的辅助函数
void SetAppState(GLFWwindow* window, AppState* state);

// 解析命令行: ParticleMorph [model_dir] [camera_id]
bool ParseCommandLine(int argc, char** argv, AppState& state);
