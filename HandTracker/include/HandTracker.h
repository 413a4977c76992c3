#pragma once

#ifdef HANDTRACKER_STATIC
#define HAND_API
#elif defined(_WIN32) && defined(HANDTRACKER_EXPORTS)
#define HAND_API __declspec(dllexport)
#elif defined(_WIN32)
#define HAND_API __declspec(dllimport)
#else
#define HAND_API __attribute__((visibility("default")))
#endif

#define HAND_LANDMARK_COUNT   21
#define HAND_GESTURE_MAX      4
#define HAND_GESTURE_NAME_MAX 32

// 错误码枚举
enum HandTrackerError {
    HANDTRACKER_OK                    = 0,  // 成功
    HANDTRACKER_ERROR_UNKNOWN         = 1,  // 未知错误
    HANDTRACKER_ERROR_PALM_MODEL      = 2,  // 手掌检测模型加载失败
    HANDTRACKER_ERROR_HAND_MODEL      = 3,  // 手部关键点模型加载失败
    HANDTRACKER_ERROR_CAMERA_OPEN     = 4,  // 摄像头打开失败
    HANDTRACKER_ERROR_NOT_INITIALIZED = 5,  // 未调用 InitTracker / StartTrackerCamera
    HANDTRACKER_ERROR_INFERENCE       = 6   // 推理失败
};

// 单个关键点 (x, y 为归一化图像坐标，原点左上；z 为相对深度)
struct HandPoint {
    float x;
    float y;
    float z;
};

// 手势分类 (MediaPipe 类别名: Open_Palm, Closed_Fist, Pointing_Up, Victory, None)
struct HandGesture {
    char  categoryName[HAND_GESTURE_NAME_MAX];
    float score;
};

// 单帧检测结果 (只追踪一只手)
struct HandResult {
    bool        hasHand;
    HandPoint   landmarks[HAND_LANDMARK_COUNT];
    int         gestureCount;
    HandGesture gestures[HAND_GESTURE_MAX];  // 按分数降序
    double      frameTime;                   // 被检测帧的时间戳 (秒)
};

extern "C" {
// 加载 palm_detection_full.tflite 与 hand_landmark_full.tflite
// model_dir: 模型目录路径
HAND_API bool InitTracker(const char* model_dir);

// 打开摄像头并启动采集线程 (需先 InitTracker)
// camera_id: 摄像头索引（通常为 0）
HAND_API bool StartTrackerCamera(int camera_id);

// 获取最后一次错误码
HAND_API int GetTrackerLastError();

// 获取最后一次错误信息（人类可读）
HAND_API const char* GetTrackerLastErrorMessage();

// 最新摄像头帧的时间戳 (秒，单调不减)，尚无帧时返回 -1
HAND_API double GetTrackerFrameTime();

// 对最新帧执行检测
// 返回 false 表示未初始化或推理失败；未检测到手时返回 true 且 hasHand = false
HAND_API bool DetectHand(HandResult* out_result);

// 复制最新帧 (RGB24, 已水平镜像)
// capacity 不足时只写出尺寸并返回 false
HAND_API bool GetTrackerFrame(unsigned char* out_rgb, int capacity, int* out_width, int* out_height);

// 释放资源并关闭摄像头
HAND_API void ReleaseTracker();

// 启用/禁用 OpenCV 调试窗口
HAND_API void SetTrackerDebugMode(bool enabled);

// 获取当前调试模式状态
HAND_API bool GetTrackerDebugMode();
}
