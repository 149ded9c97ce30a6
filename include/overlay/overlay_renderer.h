#pragma once

#include <opencv2/core.hpp>
#include <map>
#include <string>
#include <vector>

#include "core/types.h"

//------------------------------------------------------------------------------
// OverlayRenderer
//
// Draws alert overlays on a copy of the frame:
//  - ROI rectangle
//  - tracked boxes with id, label and dwell time
//  - HUD line (camera, time)
//
// Stateless; safe to share between cameras.
//------------------------------------------------------------------------------
class OverlayRenderer {
public:
    struct Config {
        float hud_alpha = 0.35f;    // - прозрачность подложки HUD.
        float roi_alpha = 0.15f;    // - заливка ROI.
        int box_thickness = 2;
    };

    explicit OverlayRenderer(const Config& cfg);

    // dwell: id -> секунды в ROI (только для объектов внутри).
    // Бросает RenderError (пустой кадр, ошибка OpenCV).
    cv::Mat render(const cv::Mat& frame,
                   const std::vector<TrackedObject>& objects,
                   const Roi* roi,
                   const std::map<int, double>& dwell,
                   const std::string& caption) const;

private:
    Config cfg_;

    static void draw_rect_alpha(
            cv::Mat& frame,
            const cv::Rect& r,
            const cv::Scalar& color,
            float alpha
    );

    static void draw_label(
            cv::Mat& frame,
            const cv::Point& org,
            const std::string& text,
            const cv::Scalar& color
    );
};
