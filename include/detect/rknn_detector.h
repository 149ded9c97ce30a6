#pragma once

#include <opencv2/core.hpp>
#include <rknn_api.h>
#include <mutex>
#include <string>
#include <vector>

#include "detect/detector.h"

// YOLO на NPU Rockchip через RKNN runtime.
class RknnDetector : public Detector {
public:
    explicit RknnDetector(const DetectorConfig& cfg);
    ~RknnDetector() override;

    RknnDetector(const RknnDetector&) = delete;
    RknnDetector& operator=(const RknnDetector&) = delete;

    std::vector<Detection> detect(const cv::Mat& frame_bgr,
                                  const std::set<std::string>& classes,
                                  float conf_threshold) override;

    std::string name() const override { return "rknn"; }

private:
    // Выход с наибольшим числом элементов как cv::Mat (копия).
    cv::Mat largest_output(const std::vector<rknn_output>& outputs) const;

    DetectorConfig cfg_;
    std::vector<std::string> class_names_;
    std::mutex mutex_;                  // - один rknn_context на все вызовы.
    rknn_context ctx_ = 0;
    rknn_tensor_attr input_attr_{};
    std::vector<rknn_tensor_attr> output_attrs_;
};
