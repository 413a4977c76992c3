#pragma once
// UI 管理器 - ImGui 初始化、主题、开始面板、状态 HUD、调试面板

#include "AppState.h"
#include "Session.h"
#include "Utils.h"

class TrackerHandDetector;

// 调试面板需要的帧统计
struct DebugStats {
    float fps       = 0.0f;
    float frameTime = 0.0f;
};

namespace UIManager {

// 紫色深色主题
void ApplyVioletTheme();

// 开关控件
bool Toggle(const char* label, bool* v, float dt);

// 初始化 ImGui
bool Init(GLFWwindow* window, AppState& state);

// 关闭 ImGui
void Shutdown();

// 开始面板 (alpha 控制淡出)
// 加载中显示提示，就绪后显示按钮；返回 true 表示点击了开始
bool DrawStartPanel(const AppState& state, SessionState session, float alpha);

// 底部居中的状态胶囊
void DrawStatusHUD(const AppState& state, const char* text, float alpha);

// F3 调试面板
void DrawDebugPanel(AppState& state, const Session& session, TrackerHandDetector& tracker, const DebugStats& stats,
                    float dt);

} // namespace UIManager
