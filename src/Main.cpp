// Violet Void - 手势控制的粒子聚合/爆散
// 摄像头手势追踪 + 粒子插值 + bloom 透明合成

#include "pch.h"

#include <sstream>

#include "AppState.h"
#include "DebugLog.h"
#include "ErrorHandler.h"
#include "Renderer.h"
#include "Session.h"
#include "TrackerHandDetector.h"
#include "Tween.h"
#include "UIManager.h"
#include "Utils.h"
#include "WindowManager.h"

const unsigned int INIT_WIDTH  = 1280;
const unsigned int INIT_HEIGHT = 720;

const float OVERLAY_FADE_DURATION = 0.8f;
const float CONTENT_FADE_DURATION = 1.0f;

int main(int argc, char** argv) {
    AppState appState;

    ErrorHandler::Init();
    ErrorHandler::SetStage(ErrorHandler::AppStage::STARTUP);

    // 重定向 cout / cerr 到调试日志
    std::streambuf*       coutOrig = std::cout.rdbuf();
    std::streambuf*       cerrOrig = std::cerr.rdbuf();
    static DebugStreamBuf debugBuf(coutOrig);
    static DebugStreamBuf errorBuf(cerrOrig, true);
    std::cout.rdbuf(&debugBuf);
    std::cerr.rdbuf(&errorBuf);

    if (!ParseCommandLine(argc, argv, appState)) {
        return 1;
    }
    ErrorHandler::SetModelDir(appState.tracker.modelDir);

    std::cout << "[Main] Violet Void starting (models: " << appState.tracker.modelDir
              << ", camera: " << appState.tracker.cameraId << ")" << std::endl;

    ErrorHandler::SetStage(ErrorHandler::AppStage::WINDOW_INIT);

    if (!glfwInit()) {
        ErrorHandler::ShowEarlyFatalError("Failed to initialize GLFW", "glfwInit() returned false");
        return -1;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 4);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
    glfwWindowHint(GLFW_TRANSPARENT_FRAMEBUFFER, GLFW_TRUE);

    GLFWwindow* window = glfwCreateWindow(INIT_WIDTH, INIT_HEIGHT, "Violet Void", nullptr, nullptr);
    if (!window) {
        ErrorHandler::ShowEarlyFatalError("Failed to create window",
                                          "glfwCreateWindow() returned NULL.\n"
                                          "OpenGL 4.3 Core Profile is required.");
        glfwTerminate();
        return -1;
    }

    glfwMakeContextCurrent(window);

    if (!gladLoadGLLoader((GLADloadproc)glfwGetProcAddress)) {
        ErrorHandler::ShowEarlyFatalError("Failed to load OpenGL", "gladLoadGLLoader() returned false");
        glfwDestroyWindow(window);
        glfwTerminate();
        return -1;
    }

    int glMajor = 0, glMinor = 0;
    glGetIntegerv(GL_MAJOR_VERSION, &glMajor);
    glGetIntegerv(GL_MINOR_VERSION, &glMinor);
    if (glMajor < 4 || (glMajor == 4 && glMinor < 3)) {
        std::ostringstream details;
        details << "Detected OpenGL version: " << glMajor << "." << glMinor << "\n"
                << "Required: OpenGL 4.3 or higher\n"
                << "GPU: " << (const char*)glGetString(GL_RENDERER);
        ErrorHandler::ShowEarlyFatalError("OpenGL version not supported", details.str().c_str());
        glfwDestroyWindow(window);
        glfwTerminate();
        return -1;
    }

    glfwSwapInterval(1);

    ErrorHandler::SetStage(ErrorHandler::AppStage::OPENGL_INIT);
    appState.gl.version  = (const char*)glGetString(GL_VERSION);
    appState.gl.renderer = (const char*)glGetString(GL_RENDERER);
    ErrorHandler::SetGPUInfo(appState.gl.renderer, appState.gl.version);
    std::cout << "[Main] OpenGL " << appState.gl.version << " on " << appState.gl.renderer << std::endl;

    SetAppState(window, &appState);
    glfwSetFramebufferSizeCallback(window, WindowManager::FramebufferSizeCallback);

    {
        int fbW = 0, fbH = 0;
        glfwGetFramebufferSize(window, &fbW, &fbH);
        appState.window.width      = fbW;
        appState.window.height     = fbH;
        appState.render.pixelRatio = WindowManager::ComputePixelRatio(window);
    }

    ErrorHandler::SetStage(ErrorHandler::AppStage::IMGUI_INIT);
    if (!UIManager::Init(window, appState)) {
        ErrorHandler::ShowEarlyFatalError("Failed to initialize ImGui");
        glfwDestroyWindow(window);
        glfwTerminate();
        return -1;
    }

    // GPU 资源必须在上下文销毁前释放，放在独立作用域中
    {
        TrackerHandDetector tracker(appState.tracker.modelDir, appState.tracker.cameraId);
        GLRenderBackend     backend(appState);
        Session             session(tracker, backend);

        VideoBackground video;
        ErrorHandler::SetStage(ErrorHandler::AppStage::SHADER_COMPILE);
        if (!video.Init()) {
            ErrorHandler::ShowWarning("Camera background shader failed to compile.",
                                      "The particle view still works without the video layer.");
            appState.ui.showVideo = false;
        }

        // 加载模型 (uninitialized -> ready)
        ErrorHandler::SetStage(ErrorHandler::AppStage::HAND_TRACKER_INIT);
        if (!session.Initialize()) {
            ErrorHandler::ShowError("Failed to load the hand tracking models.", session.GetErrorMessage());
        }

        Tween<float> overlayAlpha(1.0f);  // 开始面板
        Tween<float> contentAlpha(0.0f);  // 视频 + 粒子
        bool         fadeStarted = false;

        std::vector<unsigned char> frameBuffer;
        RingBufferFPS<60>          fpsCounter;
        DebugStats                 stats;

        double lastTime = glfwGetTime();

        while (!glfwWindowShouldClose(window)) {
            double now = glfwGetTime();
            float  dt  = (float)(now - lastTime);
            lastTime   = now;
            if (dt > 0.1f) {
                dt = 0.1f;  // 拖动窗口等长暂停
            }
            fpsCounter.AddFrameTime(dt);
            stats.fps       = fpsCounter.GetAverageFPS();
            stats.frameTime = fpsCounter.GetAverageFrameTime();

            const int fbW = (int)appState.window.width;
            const int fbH = (int)appState.window.height;

            if (session.GetState() == SessionState::RUNNING && !fadeStarted) {
                overlayAlpha.To(0.0f, OVERLAY_FADE_DURATION, Ease::IN_OUT_CUBIC);
                contentAlpha.To(1.0f, CONTENT_FADE_DURATION, Ease::IN_OUT_CUBIC);
                fadeStarted = true;
            }
            overlayAlpha.Update(dt);
            contentAlpha.Update(dt);

            glViewport(0, 0, fbW, fbH);
            glClearColor(0.0f, 0.0f, 0.0f, 0.0f);
            glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

            if (session.GetState() == SessionState::RUNNING && appState.ui.showVideo) {
                int frameW = 0, frameH = 0;
                if (tracker.GetFrame(frameBuffer, frameW, frameH)) {
                    video.Upload(frameBuffer.data(), frameW, frameH);
                }
                if (video.HasFrame()) {
                    // 暗色遮罩随淡入一起出现
                    video.Draw(fbW, fbH, VIDEO_DIM * contentAlpha.Value());
                }
            }

            backend.SetFadeAlpha(contentAlpha.Value());
            session.Tick(dt);

            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplGlfw_NewFrame();
            ImGui::NewFrame();

            if (overlayAlpha.Value() > 0.001f) {
                if (UIManager::DrawStartPanel(appState, session.GetState(), overlayAlpha.Value()) &&
                    session.GetState() == SessionState::READY) {
                    ErrorHandler::SetStage(ErrorHandler::AppStage::CAMERA_INIT);
                    if (session.Start(fbW, fbH, appState.render.pixelRatio)) {
                        ErrorHandler::SetCameraInfo(tracker.GetCameraId(), tracker.IsCameraActive());
                        ErrorHandler::SetStage(ErrorHandler::AppStage::RENDER_LOOP);
                    } else {
                        ErrorHandler::ShowError("Could not start the camera.", session.GetErrorMessage());
                    }
                }
            }

            if (session.GetState() == SessionState::RUNNING) {
                UIManager::DrawStatusHUD(appState, session.GetStatusText(), contentAlpha.Value());
            }

            UIManager::DrawDebugPanel(appState, session, tracker, stats, dt);

            if (ErrorHandler::RenderErrorDialog()) {
                glfwSetWindowShouldClose(window, GLFW_TRUE);
            }

            ImGui::Render();
            glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

            glfwSwapBuffers(window);
            glfwPollEvents();

            ErrorHandler::UpdateState(session.GetPipeline().GetFrameCount(), session.GetConfig().particleCount,
                                      GetSessionStateName(session.GetState()));

            if (glfwGetKey(window, GLFW_KEY_F3) == GLFW_PRESS) {
                if (!appState.input.keyF3_pressed) {
                    appState.input.keyF3_pressed = true;
                    appState.ui.showDebugWindow  = !appState.ui.showDebugWindow;
                    std::cout << "[Main] Debug window: " << (appState.ui.showDebugWindow ? "shown" : "hidden")
                              << std::endl;
                }
            } else {
                appState.input.keyF3_pressed = false;
            }

            if (glfwGetKey(window, GLFW_KEY_F11) == GLFW_PRESS) {
                if (!appState.input.keyF11_pressed) {
                    appState.input.keyF11_pressed = true;
                    WindowManager::ToggleFullscreen(window, appState);
                }
            } else {
                appState.input.keyF11_pressed = false;
            }

            if (glfwGetKey(window, GLFW_KEY_ESCAPE) == GLFW_PRESS) {
                break;
            }
        }

        ErrorHandler::SetStage(ErrorHandler::AppStage::SHUTDOWN);
        std::cout << "[Main] Shutting down..." << std::endl;
        session.Stop();
        backend.Release();
        video.Release();
    }

    UIManager::Shutdown();
    glfwDestroyWindow(window);
    glfwTerminate();

    std::cout.rdbuf(coutOrig);
    std::cerr.rdbuf(cerrOrig);
    return 0;
}
