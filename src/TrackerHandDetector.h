#pragma once
// IHandDetector 的 HandTracker 库实现

#include <string>

#include "HandDetector.h"

class TrackerHandDetector : public IHandDetector {
  public:
    TrackerHandDetector(std::string modelDir, int cameraId);
    ~TrackerHandDetector() override;

    bool        Initialize() override;
    bool        StartCamera() override;
    double      GetFrameTime() const override;
    bool        Detect(DetectionResult& out) override;
    void        Release() override;
    std::string GetLastError() const override;

    int  GetCameraId() const { return m_cameraId; }
    bool IsCameraActive() const { return m_cameraActive; }

    // 复制最新 RGB 帧 (视频背景)，buffer 按需扩容
    bool GetFrame(std::vector<unsigned char>& buffer, int& width, int& height);

    void SetDebugMode(bool enabled);
    bool GetDebugMode() const;

  private:
    std::string m_modelDir;
    int         m_cameraId;
    bool        m_initialized  = false;
    bool        m_cameraActive = false;
};
