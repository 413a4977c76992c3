// UIManager.cpp - UI 管理器实现

#include "pch.h"

#include "UIManager.h"

#include <cctype>
#include <cstdio>
#include <unordered_map>

#include "Constants.h"
#include "DebugLog.h"
#include "TrackerHandDetector.h"

namespace {

// 开关控件动画状态
struct ToggleAnimState {
    AnimFloat bgOpacity, knobPos;
};

std::unordered_map<ImGuiID, ToggleAnimState> s_toggleStates;

// 静态 AppState 指针，用于需要访问状态的内部函数
AppState* s_appState = nullptr;

const ImVec4 VIOLET      = ImVec4(0.545f, 0.361f, 0.965f, 1.00f);  // 0x8b5cf6
const ImVec4 VIOLET_SOFT = ImVec4(0.655f, 0.545f, 0.980f, 1.00f);
const ImVec4 FUCHSIA     = ImVec4(0.910f, 0.475f, 0.976f, 1.00f);  // 0xe879f9
const ImVec4 STONE_950   = ImVec4(0.047f, 0.039f, 0.035f, 1.00f);
const ImVec4 STONE_400   = ImVec4(0.659f, 0.635f, 0.620f, 1.00f);

ImVec4 WithAlpha(ImVec4 c, float a) {
    c.w *= a;
    return c;
}

} // namespace

namespace UIManager {

void ApplyVioletTheme() {
    ImGuiStyle& style  = ImGui::GetStyle();
    ImVec4*     colors = style.Colors;

    style.WindowRounding    = 16.0f;
    style.ChildRounding     = 12.0f;
    style.FrameRounding     = 20.0f;
    style.PopupRounding     = 16.0f;
    style.ScrollbarRounding = 12.0f;
    style.GrabRounding      = 20.0f;
    style.WindowPadding     = ImVec2(20, 20);
    style.FramePadding      = ImVec2(10, 6);
    style.ItemSpacing       = ImVec2(10, 10);
    style.WindowBorderSize  = 0.0f;

    ImVec4 surface     = ImVec4(0.08f, 0.07f, 0.09f, 0.92f);
    ImVec4 cardBg      = ImVec4(0.14f, 0.12f, 0.17f, 0.60f);
    ImVec4 buttonBg    = ImVec4(0.20f, 0.17f, 0.26f, 1.00f);
    ImVec4 buttonHover = ImVec4(0.28f, 0.22f, 0.38f, 1.00f);
    ImVec4 text        = ImVec4(0.92f, 0.91f, 0.95f, 1.00f);
    ImVec4 textDim     = STONE_400;
    ImVec4 outline     = ImVec4(0.50f, 0.45f, 0.60f, 0.40f);

    colors[ImGuiCol_WindowBg]             = surface;
    colors[ImGuiCol_ChildBg]              = cardBg;
    colors[ImGuiCol_PopupBg]              = ImVec4(0.10f, 0.09f, 0.12f, 0.98f);
    colors[ImGuiCol_ModalWindowDimBg]     = ImVec4(0.0f, 0.0f, 0.0f, 0.55f);
    colors[ImGuiCol_Border]               = outline;
    colors[ImGuiCol_FrameBg]              = buttonBg;
    colors[ImGuiCol_FrameBgHovered]       = buttonHover;
    colors[ImGuiCol_FrameBgActive]        = ImVec4(0.34f, 0.26f, 0.46f, 1.00f);
    colors[ImGuiCol_TitleBg]              = cardBg;
    colors[ImGuiCol_TitleBgActive]        = ImVec4(0.20f, 0.15f, 0.30f, 0.90f);
    colors[ImGuiCol_ScrollbarBg]          = ImVec4(0, 0, 0, 0);
    colors[ImGuiCol_ScrollbarGrab]        = outline;
    colors[ImGuiCol_ScrollbarGrabHovered] = textDim;
    colors[ImGuiCol_ScrollbarGrabActive]  = text;
    colors[ImGuiCol_CheckMark]            = VIOLET;
    colors[ImGuiCol_SliderGrab]           = VIOLET;
    colors[ImGuiCol_SliderGrabActive]     = FUCHSIA;
    colors[ImGuiCol_Button]               = buttonBg;
    colors[ImGuiCol_ButtonHovered]        = buttonHover;
    colors[ImGuiCol_ButtonActive]         = VIOLET;
    colors[ImGuiCol_Text]                 = text;
    colors[ImGuiCol_TextDisabled]         = textDim;
    colors[ImGuiCol_Separator]            = outline;
    colors[ImGuiCol_Header]               = buttonBg;
    colors[ImGuiCol_HeaderHovered]        = buttonHover;
    colors[ImGuiCol_HeaderActive]         = VIOLET;
}

bool Toggle(const char* label, bool* v, float dt) {
    using namespace ImGui;
    ImGuiID id = GetID(label);
    auto    it = s_toggleStates.find(id);
    if (it == s_toggleStates.end()) {
        it                       = s_toggleStates.emplace(id, ToggleAnimState()).first;
        it->second.bgOpacity.val = *v ? 1.0f : 0.0f;
        it->second.knobPos.val   = *v ? 1.0f : 0.0f;
    }
    ToggleAnimState& s = it->second;
    s.bgOpacity.target = *v ? 1.0f : 0.0f;
    s.knobPos.target   = *v ? 1.0f : 0.0f;
    s.bgOpacity.Update(dt, 18.0f);
    s.knobPos.Update(dt, 14.0f);

    float       scale  = s_appState ? s_appState->ui.dpiScale : 1.0f;
    float       height = 24.0f * scale;
    float       width  = 44.0f * scale;
    ImVec2      p      = GetCursorScreenPos();
    ImDrawList* dl     = GetWindowDrawList();

    bool pressed = InvisibleButton(label, ImVec2(width, height));
    if (pressed) {
        *v = !*v;
    }

    ImVec4 cOff   = GetStyle().Colors[ImGuiCol_FrameBg];
    ImVec4 cOn    = GetStyle().Colors[ImGuiCol_CheckMark];
    float  t      = s.bgOpacity.val;
    ImVec4 cTrack = ImVec4(cOff.x + (cOn.x - cOff.x) * t, cOff.y + (cOn.y - cOff.y) * t, cOff.z + (cOn.z - cOff.z) * t,
                           cOff.w + (cOn.w - cOff.w) * t);
    dl->AddRectFilled(p, ImVec2(p.x + width, p.y + height), GetColorU32(cTrack), height * 0.5f);

    float r     = height * 0.35f;
    float pad   = height * 0.15f;
    float x0    = p.x + pad + r;
    float x1    = p.x + width - pad - r;
    float x_cur = x0 + (x1 - x0) * s.knobPos.val;
    dl->AddCircleFilled(ImVec2(x_cur, p.y + height * 0.5f), r, IM_COL32(255, 255, 255, 255));

    SameLine();
    SetCursorPosY(GetCursorPosY() + (height - GetTextLineHeight()) * 0.5f);
    Text("%s", label);
    return pressed;
}

bool Init(GLFWwindow* window, AppState& state) {
    s_appState = &state;

    IMGUI_CHECKVERSION();
    if (!ImGui::CreateContext()) {
        std::cerr << "[UI] ImGui context creation failed" << std::endl;
        return false;
    }
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;

    // 高 DPI 缩放
    float xscale, yscale;
    glfwGetWindowContentScale(window, &xscale, &yscale);
    state.ui.dpiScale = std::max(std::max(xscale, yscale), 1.0f);

    // 系统等宽字体，找不到时用内置字体
    ImFontConfig fontCfg;
    fontCfg.OversampleH = 2;
    fontCfg.OversampleV = 2;
    float fontSize      = 16.0f * state.ui.dpiScale;

    const char* fonts[] = {"/usr/share/fonts/truetype/dejavu/DejaVuSansMono.ttf",
                           "/usr/share/fonts/TTF/DejaVuSansMono.ttf", "/System/Library/Fonts/Menlo.ttc",
                           "C:\\Windows\\Fonts\\consola.ttf", nullptr};
    ImFont* font = nullptr;
    for (int i = 0; fonts[i] && !font; i++) {
        FILE* f = fopen(fonts[i], "rb");
        if (!f) {
            continue;
        }
        fclose(f);
        font = io.Fonts->AddFontFromFileTTF(fonts[i], fontSize, &fontCfg);
        if (font) {
            std::cout << "[UI] Font: " << fonts[i] << std::endl;
        }
    }
    if (!font) {
        fontCfg.SizePixels = fontSize;
        io.Fonts->AddFontDefault(&fontCfg);
        std::cout << "[UI] Using default font" << std::endl;
    }

    ApplyVioletTheme();
    ImGui::GetStyle().ScaleAllSizes(state.ui.dpiScale);
    std::cout << "[UI] DPI scale: " << state.ui.dpiScale << std::endl;

    if (!ImGui_ImplGlfw_InitForOpenGL(window, true) || !ImGui_ImplOpenGL3_Init("#version 430")) {
        std::cerr << "[UI] ImGui backend initialization failed" << std::endl;
        return false;
    }
    std::cout << "[UI] Dear ImGui initialized." << std::endl;
    return true;
}

void Shutdown() {
    s_appState = nullptr;
    s_toggleStates.clear();
    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
}

bool DrawStartPanel(const AppState& state, SessionState session, float alpha) {
    if (alpha <= 0.0f) {
        return false;
    }

    const float   scale = state.ui.dpiScale;
    ImGuiViewport* vp   = ImGui::GetMainViewport();

    // 全屏底色
    ImGui::GetBackgroundDrawList()->AddRectFilled(vp->Pos, ImVec2(vp->Pos.x + vp->Size.x, vp->Pos.y + vp->Size.y),
                                                  ImGui::GetColorU32(WithAlpha(STONE_950, alpha)));

    ImGui::SetNextWindowPos(vp->GetCenter(), ImGuiCond_Always, ImVec2(0.5f, 0.5f));
    ImGui::SetNextWindowSize(ImVec2(460 * scale, 0));
    ImGui::PushStyleVar(ImGuiStyleVar_Alpha, alpha);
    ImGui::PushStyleColor(ImGuiCol_WindowBg, ImVec4(0, 0, 0, 0));
    ImGui::Begin("##StartPanel", nullptr,
                 ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoSavedSettings |
                     ImGuiWindowFlags_AlwaysAutoResize);

    const float width = ImGui::GetContentRegionAvail().x;
    auto        centered = [&](const char* text, const ImVec4& color, float fontScale) {
        ImGui::SetWindowFontScale(fontScale);
        float w = ImGui::CalcTextSize(text).x;
        ImGui::SetCursorPosX(ImGui::GetCursorPosX() + std::max(0.0f, (width - w) * 0.5f));
        ImGui::TextColored(color, "%s", text);
        ImGui::SetWindowFontScale(1.0f);
    };

    centered("VIOLET VOID", VIOLET_SOFT, 2.6f);
    ImGui::Spacing();
    centered("Web Camera Required.", STONE_400, 1.0f);
    centered("Pinch to Create. Open Palm to Destroy.", STONE_400, 1.0f);
    ImGui::Dummy(ImVec2(0, 16 * scale));

    bool clicked = false;
    if (session == SessionState::UNINITIALIZED) {
        // 模型加载中
        const char* dots[] = {"Loading", "Loading.", "Loading..", "Loading..."};
        centered(dots[(int)(ImGui::GetTime() * 3.0) % 4], VIOLET, 1.0f);
    } else if (session == SessionState::READY) {
        float bw = 200 * scale;
        ImGui::SetCursorPosX(ImGui::GetCursorPosX() + (width - bw) * 0.5f);
        ImGui::PushStyleColor(ImGuiCol_Button, ImVec4(0, 0, 0, 0));
        ImGui::PushStyleColor(ImGuiCol_ButtonHovered, WithAlpha(VIOLET, 0.2f));
        ImGui::PushStyleColor(ImGuiCol_ButtonActive, WithAlpha(VIOLET, 0.4f));
        ImGui::PushStyleColor(ImGuiCol_Border, VIOLET);
        ImGui::PushStyleColor(ImGuiCol_Text, VIOLET_SOFT);
        ImGui::PushStyleVar(ImGuiStyleVar_FrameBorderSize, 1.0f);
        clicked = ImGui::Button("ENTER VOID", ImVec2(bw, 48 * scale));
        ImGui::PopStyleVar();
        ImGui::PopStyleColor(5);
    }

    ImGui::End();
    ImGui::PopStyleColor();
    ImGui::PopStyleVar();
    return clicked;
}

void DrawStatusHUD(const AppState& state, const char* text, float alpha) {
    if (alpha <= 0.0f || !text) {
        return;
    }

    const float    scale = state.ui.dpiScale;
    ImGuiViewport* vp    = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(ImVec2(vp->Pos.x + vp->Size.x * 0.5f, vp->Pos.y + vp->Size.y - 32 * scale),
                            ImGuiCond_Always, ImVec2(0.5f, 1.0f));
    ImGui::PushStyleVar(ImGuiStyleVar_Alpha, alpha);
    ImGui::PushStyleVar(ImGuiStyleVar_WindowRounding, 100.0f);
    ImGui::PushStyleVar(ImGuiStyleVar_WindowBorderSize, 1.0f);
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(24 * scale, 8 * scale));
    ImGui::PushStyleColor(ImGuiCol_WindowBg, WithAlpha(STONE_950, 0.5f));
    ImGui::PushStyleColor(ImGuiCol_Border, ImVec4(0.16f, 0.15f, 0.14f, 1.0f));
    ImGui::Begin("##StatusHUD", nullptr,
                 ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoInputs | ImGuiWindowFlags_NoSavedSettings |
                     ImGuiWindowFlags_AlwaysAutoResize | ImGuiWindowFlags_NoFocusOnAppearing |
                     ImGuiWindowFlags_NoNav);

    // 大写显示
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return (char)std::toupper(c); });
    ImGui::TextColored(VIOLET_SOFT, "%s", upper.c_str());

    ImGui::End();
    ImGui::PopStyleColor(2);
    ImGui::PopStyleVar(4);
}

void DrawDebugPanel(AppState& state, const Session& session, TrackerHandDetector& tracker, const DebugStats& stats,
                    float dt) {
    if (!state.ui.showDebugWindow) {
        return;
    }

    ImGui::SetNextWindowSize(ImVec2(420 * state.ui.dpiScale, 560 * state.ui.dpiScale), ImGuiCond_FirstUseEver);
    if (!ImGui::Begin("Debug (F3)", &state.ui.showDebugWindow, ImGuiWindowFlags_NoCollapse)) {
        ImGui::End();
        return;
    }

    const MorphState&     morph    = session.GetMorph();
    const GestureMapper&  mapper   = session.GetMapper();
    const RenderPipeline& pipeline = session.GetPipeline();

    if (ImGui::CollapsingHeader("Performance", ImGuiTreeNodeFlags_DefaultOpen)) {
        ImGui::Text("FPS: %.1f (%.2f ms)", stats.fps, stats.frameTime * 1000.0f);
        ImGui::Text("Particles: %d", session.GetConfig().particleCount);
        ImGui::Text("Resolution: %u x %u", state.window.width, state.window.height);
        ImGui::Text("Pixel Ratio: %.2f", state.render.pixelRatio);
        ImGui::Text("Frames: %lld", pipeline.GetFrameCount());
    }

    if (ImGui::CollapsingHeader("Morph", ImGuiTreeNodeFlags_DefaultOpen)) {
        ImGui::Text("Session: %s", GetSessionStateName(session.GetState()));
        ImGui::Text("Target: %s%s", GetMorphTargetName(morph.GetTarget()), morph.IsAnimating() ? " (animating)" : "");
        ImGui::ProgressBar(morph.GetFactor(), ImVec2(-1, 0), "");
        ImGui::SameLine(0, 0);
        ImGui::SetCursorPosX(ImGui::GetStyle().WindowPadding.x + 8);
        ImGui::Text("Factor %.3f", morph.GetFactor());
        ImGui::Text("Bloom: %.2f", morph.GetBloomStrength());
        ImGui::Text("Transitions: %d", morph.GetTransitionCount());
        const glm::vec3& pos = pipeline.GetTransform().position;
        ImGui::Text("Cloud: (%.2f, %.2f, %.2f)", pos.x, pos.y, pos.z);
    }

    if (ImGui::CollapsingHeader("Hand Tracking", ImGuiTreeNodeFlags_DefaultOpen)) {
        ImGui::Text("Status: %s", mapper.GetStatusText());
        ImGui::Text("Hand: %s", mapper.HasHand() ? "Yes" : "No");
        if (mapper.HasHand()) {
            ImGui::Text("Pinch: %.3f (< %.2f create, > %.2f explode)", mapper.GetPinchDistance(), PINCH_THRESHOLD,
                        EXPLODE_DISTANCE);
        }
        ImGui::Text("Camera: %d (%s)", tracker.GetCameraId(), tracker.IsCameraActive() ? "active" : "inactive");
        ImGui::Text("Models: %s", state.tracker.modelDir.c_str());

        ImGui::Dummy(ImVec2(0, 4));
        if (Toggle("Camera Debug Window", &state.ui.showCameraDebug, dt)) {
            tracker.SetDebugMode(state.ui.showCameraDebug);
            std::cout << "[UI] Camera debug: " << (state.ui.showCameraDebug ? "on" : "off") << std::endl;
        }
        Toggle("Show Video", &state.ui.showVideo, dt);
    }

    if (ImGui::CollapsingHeader("Log", ImGuiTreeNodeFlags_DefaultOpen)) {
        if (ImGui::Button("Clear")) {
            DebugLog::Instance().Clear();
        }
        ImGui::SameLine();
        if (ImGui::Button("Copy All")) {
            std::string allText = DebugLog::Instance().GetAllText();
            ImGui::SetClipboardText(allText.c_str());
        }
        DebugLog::Instance().Draw();
    }

    ImGui::End();
}

} // namespace UIManager
