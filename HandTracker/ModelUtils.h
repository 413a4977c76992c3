#pragma once
// TFLite 模型加载辅助

#include <cmath>
#include <iostream>
#include <memory>
#include <string>

#include "tensorflow/lite/interpreter.h"
#include "tensorflow/lite/kernels/register.h"
#include "tensorflow/lite/model.h"

namespace ModelUtils {

// 加载模型文件并分配张量
inline bool LoadInterpreter(const std::string& path, const char* tag, std::unique_ptr<tflite::FlatBufferModel>& model,
                            std::unique_ptr<tflite::Interpreter>& interpreter) {
    model = tflite::FlatBufferModel::BuildFromFile(path.c_str());
    if (!model) {
        std::cerr << "[" << tag << "] Failed to load model: " << path << std::endl;
        return false;
    }

    tflite::ops::builtin::BuiltinOpResolver resolver;
    tflite::InterpreterBuilder              builder(*model, resolver);
    if (builder(&interpreter) != kTfLiteOk || !interpreter) {
        std::cerr << "[" << tag << "] Failed to build interpreter" << std::endl;
        model.reset();
        return false;
    }

    if (interpreter->AllocateTensors() != kTfLiteOk) {
        std::cerr << "[" << tag << "] Failed to allocate tensors" << std::endl;
        interpreter.reset();
        model.reset();
        return false;
    }

    std::cout << "[" << tag << "] Model loaded: " << path << std::endl;
    return true;
}

// 张量元素总数
inline int ElementCount(const TfLiteTensor* tensor) {
    int total = 1;
    for (int d = 0; d < tensor->dims->size; d++) {
        total *= tensor->dims->data[d];
    }
    return total;
}

inline float Sigmoid(float x) {
    return 1.0f / (1.0f + std::exp(-x));
}

} // namespace ModelUtils
