#include "detect/motion_gate.h"

#include <algorithm>
#include <iostream>

MotionGate::MotionGate(const Config& cfg, std::string tag) : cfg_(cfg), tag_(std::move(tag)) {
    if (cfg_.blur_kernel < 1) cfg_.blur_kernel = 1;
    if (cfg_.blur_kernel % 2 == 0) cfg_.blur_kernel += 1;
}

const char* MotionGate::reason_name(Reason r) {
    switch (r) {
        case Reason::None: return "none";
        case Reason::Disabled: return "disabled";
        case Reason::Motion: return "motion";
        case Reason::Forced: return "forced";
        case Reason::Holdover: return "holdover";
    }
    return "?";
}

void MotionGate::reset() {
    prev_gray_.release();
    last_motion_index_ = -1;
    last_area_ = 0.0;
    last_reason_ = Reason::None;
}

bool MotionGate::should_detect(const cv::Mat& frame_bgr, long long frame_index) {
    if (!cfg_.enabled) {
        last_reason_ = Reason::Disabled;
        return true;
    }

    // Опорный кадр обновляется всегда, даже если решение принято принудительно.
    last_area_ = measure_motion(frame_bgr);

    if (last_area_ >= cfg_.min_area && last_area_ > 0.0) {
        last_motion_index_ = frame_index;
        last_reason_ = Reason::Motion;
    } else if (cfg_.force_interval > 0 && frame_index % cfg_.force_interval == 0) {
        last_reason_ = Reason::Forced;
    } else if (cfg_.skip_frames > 0 && last_motion_index_ >= 0 &&
               frame_index - last_motion_index_ < cfg_.skip_frames) {
        last_reason_ = Reason::Holdover;
    } else {
        last_reason_ = Reason::None;
    }

    if (cfg_.verbose && last_reason_ != Reason::None) {
        std::cout << "[MOT:" << tag_ << "] frame=" << frame_index
                  << " area=" << last_area_
                  << " reason=" << reason_name(last_reason_)
                  << std::endl;
    }
    return last_reason_ != Reason::None;
}

double MotionGate::measure_motion(const cv::Mat& frame_bgr) {
    if (frame_bgr.empty()) return 0.0;

    cv::Mat gray;
    if (frame_bgr.channels() == 3) {
        cv::cvtColor(frame_bgr, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = frame_bgr.clone();
    }
    cv::GaussianBlur(gray, gray, cv::Size(cfg_.blur_kernel, cfg_.blur_kernel), 0);

    // Первый кадр или смена разрешения после переподключения.
    if (prev_gray_.empty() || prev_gray_.size() != gray.size()) {
        prev_gray_ = gray;
        return 0.0;
    }

    cv::Mat diff;
    cv::absdiff(prev_gray_, gray, diff);
    prev_gray_ = gray;

    cv::threshold(diff, diff, cfg_.threshold, 255, cv::THRESH_BINARY);

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(diff, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    double best = 0.0;
    for (const auto& c : contours) {
        best = std::max(best, cv::contourArea(c));
    }
    return best;
}
