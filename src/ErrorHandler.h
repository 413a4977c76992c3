#pragma once
// Error Handler - 运行阶段追踪、错误报告、ImGui 错误对话框

#include <chrono>
#include <cstdlib>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "DebugLog.h"

namespace ErrorHandler {

// Application execution stages
enum class AppStage {
    STARTUP,
    WINDOW_INIT,
    OPENGL_INIT,
    SHADER_COMPILE,
    HAND_TRACKER_INIT,
    CAMERA_INIT,
    PARTICLE_INIT,
    IMGUI_INIT,
    RENDER_LOOP,
    SHUTDOWN
};

// Global state
inline AppStage                              g_currentStage = AppStage::STARTUP;
inline std::chrono::steady_clock::time_point g_startTime    = std::chrono::steady_clock::now();
inline long long                             g_frameCount    = 0;
inline int                                   g_particleCount = 0;
inline std::string                           g_sessionState;
inline int                                   g_cameraIndex  = -1;
inline bool                                  g_cameraActive = false;
inline std::string                           g_modelDir;
inline std::string                           g_gpuRenderer;
inline std::string                           g_gpuVersion;

// Pending error for ImGui display
struct PendingError {
    bool        active    = false;
    bool        isWarning = true;
    bool        fatal     = false;  // 关闭对话框即退出
    std::string title;
    std::string message;
    std::string details;
    bool        detailsExpanded = false;
};

inline PendingError g_pendingError;

inline const char* GetStageName(AppStage stage) {
    switch (stage) {
    case AppStage::STARTUP:
        return "STARTUP";
    case AppStage::WINDOW_INIT:
        return "WINDOW_INIT";
    case AppStage::OPENGL_INIT:
        return "OPENGL_INIT";
    case AppStage::SHADER_COMPILE:
        return "SHADER_COMPILE";
    case AppStage::HAND_TRACKER_INIT:
        return "HAND_TRACKER_INIT";
    case AppStage::CAMERA_INIT:
        return "CAMERA_INIT";
    case AppStage::PARTICLE_INIT:
        return "PARTICLE_INIT";
    case AppStage::IMGUI_INIT:
        return "IMGUI_INIT";
    case AppStage::RENDER_LOOP:
        return "RENDER_LOOP";
    case AppStage::SHUTDOWN:
        return "SHUTDOWN";
    default:
        return "UNKNOWN";
    }
}

// Format uptime
inline std::string FormatUptime() {
    auto               now     = std::chrono::steady_clock::now();
    auto               elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - g_startTime).count();
    int                hours   = static_cast<int>(elapsed / 3600);
    int                minutes = static_cast<int>((elapsed % 3600) / 60);
    int                seconds = static_cast<int>(elapsed % 60);
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(2) << hours << ":" << std::setfill('0') << std::setw(2) << minutes << ":"
        << std::setfill('0') << std::setw(2) << seconds;
    return oss.str();
}

inline void SetGPUInfo(const std::string& renderer, const std::string& version) {
    g_gpuRenderer = renderer;
    g_gpuVersion  = version;
}

inline void SetCameraInfo(int index, bool active) {
    g_cameraIndex  = index;
    g_cameraActive = active;
}

inline void SetModelDir(const std::string& dir) {
    g_modelDir = dir;
}

// Update state (call each frame)
inline void UpdateState(long long frameCount, int particleCount, const char* sessionState) {
    g_frameCount    = frameCount;
    g_particleCount = particleCount;
    g_sessionState  = sessionState ? sessionState : "";
}

inline void SetStage(AppStage stage) {
    g_currentStage = stage;
}

// 纯文本错误报告，附在对话框详情中
inline std::string BuildReport() {
    std::ostringstream report;

    report << "== Application ==\n";
    report << "Stage: " << GetStageName(g_currentStage) << "\n";
    if (!g_sessionState.empty()) {
        report << "Session: " << g_sessionState << "\n";
    }
    report << "Uptime: " << FormatUptime() << "\n";
    report << "Frame: " << g_frameCount << "\n";
    report << "Particles: " << g_particleCount << "\n\n";

    report << "== Graphics ==\n";
    report << "GPU: " << (g_gpuRenderer.empty() ? "Unknown" : g_gpuRenderer) << "\n";
    report << "OpenGL: " << (g_gpuVersion.empty() ? "Unknown" : g_gpuVersion) << "\n\n";

    report << "== Hand Tracking ==\n";
    report << "Models: " << (g_modelDir.empty() ? "-" : g_modelDir) << "\n";
    if (g_cameraIndex >= 0) {
        report << "Camera: " << g_cameraIndex << " (" << (g_cameraActive ? "Active" : "Inactive") << ")\n\n";
    } else {
        report << "Camera: Disabled\n\n";
    }

    report << "== Recent Logs ==\n";
    report << DebugLog::Instance().GetAllText(10);
    return report.str();
}

inline void ShowRecoverableError(const std::string& title, const std::string& message, const std::string& details,
                                 bool isWarning, bool fatal) {
    g_pendingError.active          = true;
    g_pendingError.isWarning       = isWarning;
    g_pendingError.fatal           = fatal;
    g_pendingError.title           = title;
    g_pendingError.message         = message;
    g_pendingError.details         = details;
    g_pendingError.detailsExpanded = false;
}

// 终止性错误：对话框关闭后退出
inline void ShowError(const std::string& message, const std::string& technicalDetails = "") {
    std::string details = technicalDetails.empty() ? BuildReport() : technicalDetails + "\n\n" + BuildReport();
    ShowRecoverableError("Error", message, details, false, true);
}

inline void ShowWarning(const std::string& message, const std::string& technicalDetails = "") {
    ShowRecoverableError("Warning", message, technicalDetails, true, false);
}

// 渲染错误对话框 (在 ImGui::NewFrame 之后调用)
// 返回 true 表示用户关闭了终止性错误，应退出
inline bool RenderErrorDialog() {
    if (!g_pendingError.active) {
        return false;
    }

    bool closeApp = false;
    ImGui::OpenPopup("##ErrorDialog");

    ImVec2 center = ImGui::GetMainViewport()->GetCenter();
    ImGui::SetNextWindowPos(center, ImGuiCond_Appearing, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(450, 0), ImGuiCond_Appearing);

    ImGuiWindowFlags flags =
        ImGuiWindowFlags_AlwaysAutoResize | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoSavedSettings;
    if (ImGui::BeginPopupModal("##ErrorDialog", nullptr, flags)) {
        ImVec4 iconColor = g_pendingError.isWarning ? ImVec4(1.0f, 0.7f, 0.0f, 1.0f) : ImVec4(1.0f, 0.3f, 0.3f, 1.0f);
        ImGui::PushStyleColor(ImGuiCol_Text, iconColor);
        ImGui::TextUnformatted(g_pendingError.isWarning ? "!" : "X");
        ImGui::PopStyleColor();
        ImGui::SameLine();
        ImGui::Text("%s", g_pendingError.title.c_str());
        ImGui::Separator();
        ImGui::Spacing();

        ImGui::TextWrapped("%s", g_pendingError.message.c_str());
        ImGui::Spacing();

        if (!g_pendingError.details.empty()) {
            if (ImGui::Button(g_pendingError.detailsExpanded ? "Hide Details" : "Show Details")) {
                g_pendingError.detailsExpanded = !g_pendingError.detailsExpanded;
            }
            if (g_pendingError.detailsExpanded) {
                ImGui::BeginChild("##Details", ImVec2(0, 150), true);
                ImGui::TextUnformatted(g_pendingError.details.c_str());
                ImGui::EndChild();
                if (ImGui::Button("Copy All")) {
                    ImGui::SetClipboardText(g_pendingError.details.c_str());
                }
            }
        }

        ImGui::Spacing();
        ImGui::Separator();
        ImGui::Spacing();

        float buttonWidth = 100.0f;
        ImGui::SetCursorPosX((ImGui::GetWindowSize().x - buttonWidth) * 0.5f);
        if (ImGui::Button(g_pendingError.fatal ? "Quit" : "Close", ImVec2(buttonWidth, 0))) {
            closeApp              = g_pendingError.fatal;
            g_pendingError.active = false;
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
    return closeApp;
}

// ImGui 可用之前的致命错误
inline void ShowEarlyFatalError(const char* message, const char* details = nullptr) {
    std::cerr << "[Fatal] " << message << std::endl;
    if (details) {
        std::cerr << details << std::endl;
    }
    std::cerr << BuildReport() << std::endl;
}

// 未捕获异常: 打印报告后终止
inline void TerminateHandler() {
    std::string what = "Unknown exception";
    if (std::exception_ptr ep = std::current_exception()) {
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            what = "Non-standard exception";
        }
    }
    ShowEarlyFatalError("Unhandled exception", what.c_str());
    std::abort();
}

inline void Init() {
    g_startTime = std::chrono::steady_clock::now();
    std::set_terminate(TerminateHandler);
}

} // namespace ErrorHandler
