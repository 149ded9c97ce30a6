#include "detect/rknn_detector.h"
#include "detect/class_names.h"
#include "detect/yolo_decode.h"
#include "core/errors.h"

#include <opencv2/imgproc.hpp>
#include <fstream>
#include <iostream>
#include <sstream>

namespace {
    cv::Size input_size_from_attr(const rknn_tensor_attr &attr) {
        if (attr.n_dims >= 4) {
            if (attr.fmt == RKNN_TENSOR_NCHW) {
                return {static_cast<int>(attr.dims[3]), static_cast<int>(attr.dims[2])};
            }
            return {static_cast<int>(attr.dims[2]), static_cast<int>(attr.dims[1])};
        }
        return {0, 0};
    }

    size_t tensor_elem_count(const rknn_tensor_attr &attr) {
        size_t count = 1;
        for (uint32_t i = 0; i < attr.n_dims; ++i) {
            count *= static_cast<size_t>(attr.dims[i]);
        }
        return count;
    }

    std::string tensor_dims_to_string(const rknn_tensor_attr &attr) {
        std::ostringstream oss;
        oss << "[";
        for (uint32_t i = 0; i < attr.n_dims; ++i) {
            oss << attr.dims[i];
            if (i + 1 < attr.n_dims) oss << "x";
        }
        oss << "]";
        return oss.str();
    }
}

RknnDetector::RknnDetector(const DetectorConfig& cfg)
        : cfg_(cfg), class_names_(resolve_class_names(cfg.class_names_path)) {
    if (cfg_.model_path.empty()) {
        throw DetectionError("detector.model_path is empty");
    }
    std::ifstream file(cfg_.model_path, std::ios::binary | std::ios::ate);
    if (!file) {
        throw DetectionError("failed to open rknn model file: " + cfg_.model_path);
    }
    const std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);
    std::vector<unsigned char> model_data(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(model_data.data()), size)) {
        throw DetectionError("failed to read rknn model file: " + cfg_.model_path);
    }

    if (rknn_init(&ctx_, model_data.data(), static_cast<uint32_t>(model_data.size()), 0, nullptr) != RKNN_SUCC) {
        ctx_ = 0;
        throw DetectionError("rknn_init failed");
    }

    // Дальше ctx_ уже создан: при ошибке освобождаем его сами, деструктор не вызовется.
    try {
        rknn_input_output_num io_num{};
        if (rknn_query(ctx_, RKNN_QUERY_IN_OUT_NUM, &io_num, sizeof(io_num)) != RKNN_SUCC) {
            throw DetectionError("rknn_query io num failed");
        }
        input_attr_.index = 0;
        if (rknn_query(ctx_, RKNN_QUERY_INPUT_ATTR, &input_attr_, sizeof(input_attr_)) != RKNN_SUCC) {
            throw DetectionError("rknn_query input attr failed");
        }
        output_attrs_.resize(io_num.n_output);
        for (uint32_t i = 0; i < io_num.n_output; ++i) {
            output_attrs_[i].index = i;
            if (rknn_query(ctx_, RKNN_QUERY_OUTPUT_ATTR, &output_attrs_[i], sizeof(output_attrs_[i])) != RKNN_SUCC) {
                throw DetectionError("rknn_query output attr failed");
            }
            if (cfg_.verbose) {
                std::cout << "[DET] rknn output[" << i << "] dims="
                          << tensor_dims_to_string(output_attrs_[i])
                          << " fmt=" << output_attrs_[i].fmt
                          << " type=" << output_attrs_[i].type
                          << std::endl;
            }
        }
        if (output_attrs_.empty()) {
            throw DetectionError("rknn model has no outputs");
        }
    } catch (...) {
        rknn_destroy(ctx_);
        ctx_ = 0;
        throw;
    }

    std::cout << "[DET] rknn model loaded: " << cfg_.model_path
              << " (outputs=" << output_attrs_.size()
              << ", classes=" << class_names_.size() << ")"
              << std::endl;
}

RknnDetector::~RknnDetector() {
    if (ctx_ != 0) {
        rknn_destroy(ctx_);
        ctx_ = 0;
    }
}

cv::Mat RknnDetector::largest_output(const std::vector<rknn_output>& outputs) const {
    size_t best_idx = 0;
    size_t best_count = 0;
    for (size_t i = 0; i < output_attrs_.size(); ++i) {
        const size_t count = tensor_elem_count(output_attrs_[i]);
        if (count > best_count) {
            best_count = count;
            best_idx = i;
        }
    }
    const rknn_tensor_attr &attr = output_attrs_[best_idx];
    std::vector<int> sizes(attr.n_dims);
    for (uint32_t i = 0; i < attr.n_dims; ++i) {
        sizes[i] = static_cast<int>(attr.dims[i]);
    }
    // Буфер принадлежит runtime до rknn_outputs_release.
    return cv::Mat(static_cast<int>(attr.n_dims), sizes.data(), CV_32F, outputs[best_idx].buf).clone();
}

std::vector<Detection> RknnDetector::detect(const cv::Mat& frame_bgr,
                                            const std::set<std::string>& classes,
                                            float conf_threshold) {
    Letterbox lb;
    const cv::Mat input = letterbox_image(frame_bgr, input_size_from_attr(input_attr_), lb);

    cv::Mat input_rgb;
    if (cfg_.swap_rb) {
        cv::cvtColor(input, input_rgb, cv::COLOR_BGR2RGB);
    } else {
        input_rgb = input;
    }
    cv::Mat input_float;
    input_rgb.convertTo(input_float, CV_32F, cfg_.scale);

    cv::Mat output;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        rknn_input inputs[1]{};
        inputs[0].index = 0;
        inputs[0].type = RKNN_TENSOR_FLOAT32;
        inputs[0].fmt = input_attr_.fmt == RKNN_TENSOR_NCHW ? RKNN_TENSOR_NCHW : RKNN_TENSOR_NHWC;
        inputs[0].size = static_cast<uint32_t>(tensor_elem_count(input_attr_) * sizeof(float));
        inputs[0].buf = input_float.data;
        if (rknn_inputs_set(ctx_, 1, inputs) != RKNN_SUCC) {
            throw DetectionError("rknn_inputs_set failed");
        }
        if (rknn_run(ctx_, nullptr) != RKNN_SUCC) {
            throw DetectionError("rknn_run failed");
        }

        std::vector<rknn_output> outputs(output_attrs_.size());
        for (auto& o : outputs) {
            o.want_float = 1;
        }
        if (rknn_outputs_get(ctx_, static_cast<uint32_t>(outputs.size()), outputs.data(), nullptr) != RKNN_SUCC) {
            throw DetectionError("rknn_outputs_get failed");
        }
        output = largest_output(outputs);
        rknn_outputs_release(ctx_, static_cast<uint32_t>(outputs.size()), outputs.data());
    }

    YoloDecodeParams params;
    params.conf_threshold = conf_threshold;
    params.nms_threshold = cfg_.nms_threshold;
    params.verbose = cfg_.verbose;
    return decode_yolo_output(output, lb, frame_bgr.size(), class_names_, classes, params);
}
