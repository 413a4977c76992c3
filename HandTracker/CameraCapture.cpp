// CameraCapture.cpp - 摄像头捕获实现

#include "CameraCapture.h"

#include <chrono>
#include <iostream>
#include <system_error>

namespace {

double NowSeconds() {
    using namespace std::chrono;
    return duration<double>(steady_clock::now().time_since_epoch()).count();
}

} // namespace

OpenCVCapture::OpenCVCapture() {}

OpenCVCapture::~OpenCVCapture() { close(); }

bool OpenCVCapture::open(int cameraId, int width, int height) {
    close();

    try {
        m_cap.open(cameraId, cv::CAP_ANY);
    } catch (const cv::Exception& e) {
        std::cerr << "[Camera] Open failed: " << e.what() << std::endl;
        return false;
    }
    if (!m_cap.isOpened()) {
        std::cerr << "[Camera] Cannot open camera " << cameraId << std::endl;
        return false;
    }

    m_cap.set(cv::CAP_PROP_FRAME_WIDTH, width);
    m_cap.set(cv::CAP_PROP_FRAME_HEIGHT, height);

    m_width  = (int)m_cap.get(cv::CAP_PROP_FRAME_WIDTH);
    m_height = (int)m_cap.get(cv::CAP_PROP_FRAME_HEIGHT);

    m_running = true;
    try {
        m_thread = std::thread(&OpenCVCapture::grabLoop, this);
    } catch (const std::system_error& e) {
        std::cerr << "[Camera] Cannot start capture thread: " << e.what() << std::endl;
        m_running = false;
        m_cap.release();
        return false;
    }

    std::cout << "[Camera] Opened: " << m_width << "x" << m_height << std::endl;
    return true;
}

void OpenCVCapture::grabLoop() {
    cv::Mat raw, mirrored;
    while (m_running) {
        bool ok = false;
        try {
            ok = m_cap.read(raw);
        } catch (const cv::Exception& e) {
            std::cerr << "[Camera] Read failed: " << e.what() << std::endl;
        }
        if (!ok || raw.empty()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            continue;
        }

        // 自拍视角：水平镜像
        cv::flip(raw, mirrored, 1);
        {
            std::lock_guard<std::mutex> lock(m_frameMutex);
            cv::cvtColor(mirrored, m_frameBuffer, cv::COLOR_BGR2RGB);
            m_frameTime = NowSeconds();
        }
    }
}

void OpenCVCapture::close() {
    m_running = false;
    if (m_thread.joinable()) {
        m_thread.join();
    }
    if (m_cap.isOpened()) {
        m_cap.release();
    }
    {
        std::lock_guard<std::mutex> lock(m_frameMutex);
        m_frameBuffer.release();
    }
    m_frameTime = -1.0;
    m_width     = 0;
    m_height    = 0;
}

bool OpenCVCapture::isOpened() const { return m_running && m_cap.isOpened(); }

bool OpenCVCapture::getLatestFrame(cv::Mat& frame, double* timestamp) {
    std::lock_guard<std::mutex> lock(m_frameMutex);
    if (m_frameBuffer.empty()) {
        return false;
    }
    m_frameBuffer.copyTo(frame);
    if (timestamp) {
        *timestamp = m_frameTime.load();
    }
    return true;
}

std::unique_ptr<ICameraCapture> CreateCameraCapture() {
    return std::make_unique<OpenCVCapture>();
}
