#pragma once
#include <opencv2/opencv.hpp>
#include <string>

// Решает, нужно ли запускать дорогой детектор на этом кадре.
// Опорный кадр - предыдущий размытый серый кадр.
class MotionGate {
public:
    struct Config {
        bool enabled = true;        // - false: детектор запускается на каждом кадре.
        int threshold = 25;         // - порог бинаризации diff-кадра.
        int blur_kernel = 21;       // - размер ядра GaussianBlur (приводится к нечётному).
        double min_area = 5000.0;   // - минимальная площадь контура, считаемая движением.
        int skip_frames = 5;        // - окно удержания после движения (кадров), 0 = выкл.
        int force_interval = 25;    // - принудительная проверка каждые N кадров, 0 = выкл. (конфиг требует > 0).
        bool verbose = false;
    };

    enum class Reason {
        None,
        Disabled,
        Motion,
        Forced,
        Holdover
    };

    explicit MotionGate(const Config& cfg, std::string tag = "");

    bool should_detect(const cv::Mat& frame_bgr, long long frame_index);

    void reset();

    double last_motion_area() const { return last_area_; }
    Reason last_reason() const { return last_reason_; }

    static const char* reason_name(Reason r);

private:
    double measure_motion(const cv::Mat& frame_bgr);

    Config cfg_;
    std::string tag_;
    cv::Mat prev_gray_;                 // - опорный кадр.
    long long last_motion_index_ = -1;  // - кадр, на котором движение последний раз запустило детектор.
    double last_area_ = 0.0;
    Reason last_reason_ = Reason::None;
};
