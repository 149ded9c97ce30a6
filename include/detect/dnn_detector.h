#pragma once

#include <opencv2/dnn.hpp>
#include <mutex>
#include <string>
#include <vector>

#include "detect/detector.h"

// YOLO (ONNX) через OpenCV DNN на CPU.
class DnnDetector : public Detector {
public:
    explicit DnnDetector(const DetectorConfig& cfg);

    std::vector<Detection> detect(const cv::Mat& frame_bgr,
                                  const std::set<std::string>& classes,
                                  float conf_threshold) override;

    std::string name() const override { return "opencv_dnn"; }

private:
    DetectorConfig cfg_;
    std::vector<std::string> class_names_;
    std::mutex mutex_;      // - cv::dnn::Net не потокобезопасен.
    cv::dnn::Net net_;
};
