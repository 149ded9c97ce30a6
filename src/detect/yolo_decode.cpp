#include "detect/yolo_decode.h"
#include "core/errors.h"

#include <opencv2/dnn.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace {
    float sigmoid(float v) {
        return 1.0f / (1.0f + std::exp(-v));
    }

    bool attrs_match(int n, int num_classes) {
        return num_classes > 0 && (n == num_classes + 4 || n == num_classes + 5);
    }

    std::string label_for(int class_id, const std::vector<std::string>& names) {
        if (class_id >= 0 && class_id < static_cast<int>(names.size())) {
            return names[static_cast<size_t>(class_id)];
        }
        return "class_" + std::to_string(class_id);
    }

    // Приводит выход к виду "строка = одна гипотеза".
    cv::Mat to_rows(const cv::Mat& output, int num_classes) {
        if (output.dims == 2) {
            if (!attrs_match(output.cols, num_classes) && attrs_match(output.rows, num_classes)) {
                return output.t();
            }
            return output;
        }
        if (output.dims == 3) {
            const int dim1 = output.size[1];
            const int dim2 = output.size[2];
            if (dim1 <= 0 || dim2 <= 0) return cv::Mat();
            // Берём только первый элемент батча; reshape делит данные без копии.
            const cv::Range first[] = {cv::Range(0, 1), cv::Range::all(), cv::Range::all()};
            cv::Mat batch = output(first);
            if (!batch.isContinuous()) batch = batch.clone();
            const int shape[] = {dim1, dim2};
            cv::Mat data = batch.reshape(1, 2, shape);
            bool transpose = dim1 < dim2;
            if (attrs_match(dim1, num_classes) && !attrs_match(dim2, num_classes)) transpose = true;
            if (attrs_match(dim2, num_classes) && !attrs_match(dim1, num_classes)) transpose = false;
            return transpose ? cv::Mat(data.t()) : data;
        }
        return cv::Mat();
    }
}

cv::Mat letterbox_image(const cv::Mat& frame_bgr, const cv::Size& input_size, Letterbox& info) {
    if (frame_bgr.empty()) {
        throw DetectionError("empty frame");
    }
    if (input_size.width <= 0 || input_size.height <= 0) {
        throw DetectionError("invalid model input size");
    }

    const float scale = std::min(
            static_cast<float>(input_size.width) / static_cast<float>(frame_bgr.cols),
            static_cast<float>(input_size.height) / static_cast<float>(frame_bgr.rows)
    );
    const int resized_w = std::max(1, static_cast<int>(std::round(frame_bgr.cols * scale)));
    const int resized_h = std::max(1, static_cast<int>(std::round(frame_bgr.rows * scale)));

    info.scale = scale;
    info.pad_left = (input_size.width - resized_w) / 2;
    info.pad_top = (input_size.height - resized_h) / 2;
    info.input_size = input_size;

    cv::Mat resized;
    cv::resize(frame_bgr, resized, cv::Size(resized_w, resized_h));

    cv::Mat input(input_size, frame_bgr.type(), cv::Scalar(0, 0, 0));
    resized.copyTo(input(cv::Rect(info.pad_left, info.pad_top, resized.cols, resized.rows)));
    return input;
}

std::vector<Detection> decode_yolo_output(const cv::Mat& output,
                                          const Letterbox& lb,
                                          const cv::Size& frame_size,
                                          const std::vector<std::string>& class_names,
                                          const std::set<std::string>& allowed,
                                          const YoloDecodeParams& params) {
    std::vector<Detection> out;
    if (output.empty()) return out;
    if (output.type() != CV_32F) {
        throw DetectionError("yolo output must be CV_32F");
    }
    if (lb.scale <= 0.0f) {
        throw DetectionError("invalid letterbox scale");
    }

    const int num_classes = static_cast<int>(class_names.size());
    const cv::Mat dets = to_rows(output, num_classes);
    if (dets.empty()) {
        throw DetectionError("unsupported yolo output layout: dims=" + std::to_string(output.dims));
    }

    const int num_attrs = dets.cols;
    if (num_attrs < 6) {
        throw DetectionError("too few attributes in yolo output: " + std::to_string(num_attrs));
    }

    // v5: xywh + obj + классы; v8: xywh + классы.
    bool has_objectness = (num_attrs - 4) > 1 && num_attrs != 84;
    if (num_classes > 0) {
        if (num_attrs == num_classes + 5) has_objectness = true;
        else if (num_attrs == num_classes + 4) has_objectness = false;
    }
    const int class_offset = has_objectness ? 5 : 4;

    std::vector<cv::Rect> boxes;
    std::vector<float> scores;
    std::vector<int> class_ids;

    for (int i = 0; i < dets.rows; ++i) {
        const float* row = dets.ptr<float>(i);

        bool needs_sigmoid = false;
        for (int c = 4; c < num_attrs; ++c) {
            if (row[c] < 0.0f || row[c] > 1.0f) {
                needs_sigmoid = true;
                break;
            }
        }

        float obj_score = 1.0f;
        if (has_objectness) {
            obj_score = needs_sigmoid ? sigmoid(row[4]) : row[4];
        }

        int best_class = -1;
        float best_score = 0.0f;
        for (int c = class_offset; c < num_attrs; ++c) {
            const float class_score = needs_sigmoid ? sigmoid(row[c]) : row[c];
            const float score = class_score * obj_score;
            if (score > best_score) {
                best_score = score;
                best_class = c - class_offset;
            }
        }
        if (best_class < 0 || best_score < params.conf_threshold) continue;
        if (!allowed.empty() && !allowed.count(label_for(best_class, class_names))) continue;

        float x = row[0];
        float y = row[1];
        float w = row[2];
        float h = row[3];
        // Нормализованные координаты.
        if (x <= 1.0f && y <= 1.0f && w <= 1.0f && h <= 1.0f) {
            x *= static_cast<float>(lb.input_size.width);
            y *= static_cast<float>(lb.input_size.height);
            w *= static_cast<float>(lb.input_size.width);
            h *= static_cast<float>(lb.input_size.height);
        }

        // Обратно из letterbox в координаты кадра.
        float left = (x - 0.5f * w - static_cast<float>(lb.pad_left)) / lb.scale;
        float top = (y - 0.5f * h - static_cast<float>(lb.pad_top)) / lb.scale;
        float right = left + w / lb.scale;
        float bottom = top + h / lb.scale;
        left = std::max(0.0f, std::min(left, static_cast<float>(frame_size.width - 1)));
        top = std::max(0.0f, std::min(top, static_cast<float>(frame_size.height - 1)));
        right = std::max(0.0f, std::min(right, static_cast<float>(frame_size.width)));
        bottom = std::max(0.0f, std::min(bottom, static_cast<float>(frame_size.height)));
        if (right - left <= 1.0f || bottom - top <= 1.0f) continue;

        boxes.emplace_back(static_cast<int>(left),
                           static_cast<int>(top),
                           static_cast<int>(right - left),
                           static_cast<int>(bottom - top));
        scores.push_back(best_score);
        class_ids.push_back(best_class);
    }

    std::vector<int> indices;
    cv::dnn::NMSBoxes(boxes, scores, params.conf_threshold, params.nms_threshold, indices);
    std::stable_sort(indices.begin(), indices.end(), [&scores](int a, int b) {
        return scores[static_cast<size_t>(a)] > scores[static_cast<size_t>(b)];
    });

    if (params.verbose) {
        std::cout << "[DET] rows=" << dets.rows
                  << " attrs=" << num_attrs
                  << " layout=" << (has_objectness ? "obj+class" : "class-only")
                  << " boxes=" << boxes.size()
                  << " after_nms=" << indices.size()
                  << std::endl;
    }

    out.reserve(indices.size());
    for (int idx : indices) {
        const cv::Rect& r = boxes[static_cast<size_t>(idx)];
        Detection det;
        det.box = cv::Rect2f(static_cast<float>(r.x), static_cast<float>(r.y),
                             static_cast<float>(r.width), static_cast<float>(r.height));
        det.label = label_for(class_ids[static_cast<size_t>(idx)], class_names);
        det.confidence = scores[static_cast<size_t>(idx)];
        out.push_back(std::move(det));
    }
    return out;
}
