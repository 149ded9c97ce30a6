#pragma once

#include <opencv2/core.hpp>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "core/types.h"

struct DetectorConfig {
    std::string backend = "opencv_dnn";      // - "opencv_dnn" (ONNX) или "rknn" (NPU).
    std::string model_path;                  // - путь к модели.
    std::string class_names_path;            // - файл с именами классов (пусто = COCO-80).
    int input_size = 640;                    // - сторона входа для opencv_dnn (rknn берёт из модели).
    float nms_threshold = 0.45f;             // - порог IoU для NMS.
    float scale = 1.0f / 255.0f;             // - нормализация входа.
    bool swap_rb = true;                     // - BGR -> RGB перед подачей в сеть.
    bool shared_instance = true;             // - один экземпляр на все камеры.
    bool verbose = false;
};

// Детектор объектов. detect() бросает DetectionError при сбое бэкенда.
// Реализации сериализуют вызовы внутренним мьютексом: один экземпляр
// можно вызывать из нескольких CameraWorker одновременно.
class Detector {
public:
    virtual ~Detector() = default;

    // classes пуст = все классы. Результат в координатах кадра, порядок по убыванию уверенности.
    virtual std::vector<Detection> detect(const cv::Mat& frame_bgr,
                                          const std::set<std::string>& classes,
                                          float conf_threshold) = 0;

    virtual std::string name() const = 0;
};

// Создаёт бэкенд по cfg.backend. Ошибки загрузки модели -> DetectionError,
// неизвестный бэкенд -> ConfigError.
std::shared_ptr<Detector> make_detector(const DetectorConfig& cfg);
