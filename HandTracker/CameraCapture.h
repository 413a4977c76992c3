#pragma once
// CameraCapture - 摄像头捕获抽象层
// 后台线程持续抓帧，主线程非阻塞获取最新帧 (已镜像，RGB)

#include <atomic>
#include <memory>
#include <mutex>
#include <opencv2/opencv.hpp>
#include <thread>

// 摄像头捕获接口
class ICameraCapture {
  public:
    virtual ~ICameraCapture() = default;

    // 打开摄像头并开始抓帧
    virtual bool open(int cameraId, int width = 640, int height = 480) = 0;

    // 停止抓帧并关闭摄像头
    virtual void close() = 0;

    virtual bool isOpened() const = 0;

    // 获取最新帧 (非阻塞，返回是否有帧)
    // timestamp: 可选，输出该帧的捕获时间 (秒)
    virtual bool getLatestFrame(cv::Mat& frame, double* timestamp = nullptr) = 0;

    // 最新帧的捕获时间 (秒)，尚无帧时返回 -1
    virtual double getFrameTime() const = 0;

    virtual int getWidth() const  = 0;
    virtual int getHeight() const = 0;
};

// OpenCV VideoCapture + 抓帧线程
class OpenCVCapture : public ICameraCapture {
  public:
    OpenCVCapture();
    ~OpenCVCapture() override;

    bool   open(int cameraId, int width = 640, int height = 480) override;
    void   close() override;
    bool   isOpened() const override;
    bool   getLatestFrame(cv::Mat& frame, double* timestamp = nullptr) override;
    double getFrameTime() const override { return m_frameTime.load(); }
    int    getWidth() const override { return m_width; }
    int    getHeight() const override { return m_height; }

  private:
    void grabLoop();

    cv::VideoCapture    m_cap;
    std::thread         m_thread;
    std::atomic<bool>   m_running{false};
    std::atomic<double> m_frameTime{-1.0};
    std::mutex          m_frameMutex;
    cv::Mat             m_frameBuffer;
    int                 m_width  = 0;
    int                 m_height = 0;
};

// 工厂函数：创建摄像头捕获实例
std::unique_ptr<ICameraCapture> CreateCameraCapture();
