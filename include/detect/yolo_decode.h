#pragma once

#include <opencv2/core.hpp>
#include <set>
#include <string>
#include <vector>

#include "core/types.h"

// Параметры letterbox: кадр масштабирован с сохранением пропорций и
// дополнен рамкой до input_size.
struct Letterbox {
    float scale = 1.0f;
    int pad_left = 0;
    int pad_top = 0;
    cv::Size input_size;
};

// Готовит вход сети (тот же тип, что у кадра). Бросает DetectionError на пустом кадре.
cv::Mat letterbox_image(const cv::Mat& frame_bgr, const cv::Size& input_size, Letterbox& info);

struct YoloDecodeParams {
    float conf_threshold = 0.5f;
    float nms_threshold = 0.45f;
    bool verbose = false;
};

// Декодирует выход YOLOv5 (xywh + obj + классы) или YOLOv8 (xywh + классы).
// Поддерживает [1 x attrs x N], [1 x N x attrs] и [N x attrs].
// Классы вне allowed (если не пуст) отбрасываются до NMS.
std::vector<Detection> decode_yolo_output(const cv::Mat& output,
                                          const Letterbox& lb,
                                          const cv::Size& frame_size,
                                          const std::vector<std::string>& class_names,
                                          const std::set<std::string>& allowed,
                                          const YoloDecodeParams& params);
