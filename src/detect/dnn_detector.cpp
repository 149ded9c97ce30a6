#include "detect/dnn_detector.h"
#include "detect/class_names.h"
#include "detect/yolo_decode.h"
#include "core/errors.h"

#include <iostream>

DnnDetector::DnnDetector(const DetectorConfig& cfg)
        : cfg_(cfg), class_names_(resolve_class_names(cfg.class_names_path)) {
    if (cfg_.model_path.empty()) {
        throw DetectionError("detector.model_path is empty");
    }
    try {
        net_ = cv::dnn::readNet(cfg_.model_path);
        net_.setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
        net_.setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
    } catch (const cv::Exception& e) {
        throw DetectionError("could not load model " + cfg_.model_path + ": " + e.what());
    }
    if (net_.empty()) {
        throw DetectionError("could not load model " + cfg_.model_path);
    }
    std::cout << "[DET] loaded OpenCV DNN model: " << cfg_.model_path
              << " classes=" << class_names_.size() << std::endl;
}

std::vector<Detection> DnnDetector::detect(const cv::Mat& frame_bgr,
                                           const std::set<std::string>& classes,
                                           float conf_threshold) {
    Letterbox lb;
    const cv::Mat input = letterbox_image(frame_bgr, cv::Size(cfg_.input_size, cfg_.input_size), lb);

    cv::Mat output;
    try {
        const cv::Mat blob = cv::dnn::blobFromImage(input, cfg_.scale, lb.input_size,
                                                    cv::Scalar(), cfg_.swap_rb, false);
        std::lock_guard<std::mutex> lock(mutex_);
        net_.setInput(blob);
        output = net_.forward().clone();
    } catch (const cv::Exception& e) {
        throw DetectionError(std::string("dnn forward failed: ") + e.what());
    }

    YoloDecodeParams params;
    params.conf_threshold = conf_threshold;
    params.nms_threshold = cfg_.nms_threshold;
    params.verbose = cfg_.verbose;
    return decode_yolo_output(output, lb, frame_bgr.size(), class_names_, classes, params);
}
