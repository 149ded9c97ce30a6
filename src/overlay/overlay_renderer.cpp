#include "overlay/overlay_renderer.h"
#include "core/errors.h"
#include "util/rect_utils.h"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cstdio>

namespace {
    const cv::Scalar kRoiColor(255, 128, 0);       // blue
    const cv::Scalar kTrackColor(0, 255, 0);       // green
    const cv::Scalar kLingerColor(0, 165, 255);    // orange
    const cv::Scalar kMissingColor(160, 160, 160); // gray
}

//------------------------------------------------------------------------------
// ctor
//------------------------------------------------------------------------------
OverlayRenderer::OverlayRenderer(const Config& cfg)
        : cfg_(cfg) {}

//------------------------------------------------------------------------------
// Utility helpers
//------------------------------------------------------------------------------
void OverlayRenderer::draw_rect_alpha(
        cv::Mat& frame,
        const cv::Rect& r,
        const cv::Scalar& color,
        float alpha
) {
    if (alpha <= 0.0f)
        return;

    alpha = std::min(1.0f, alpha);

    const cv::Rect rr = r & cv::Rect(0, 0, frame.cols, frame.rows);
    if (rr.width <= 0 || rr.height <= 0)
        return;

    cv::Mat roi = frame(rr);
    cv::Mat overlay(roi.size(), roi.type(), color);
    cv::addWeighted(overlay, alpha, roi, 1.0f - alpha, 0.0, roi);
}

void OverlayRenderer::draw_label(
        cv::Mat& frame,
        const cv::Point& org,
        const std::string& text,
        const cv::Scalar& color
) {
    int baseline = 0;
    cv::Size ts = cv::getTextSize(
            text, cv::FONT_HERSHEY_SIMPLEX, 0.5, 1, &baseline);

    cv::Rect bg(
            org.x,
            org.y - ts.height - baseline - 4,
            ts.width + 6,
            ts.height + baseline + 6
    );
    draw_rect_alpha(frame, bg, cv::Scalar(0, 0, 0), 0.35f);

    cv::putText(
            frame, text, org,
            cv::FONT_HERSHEY_SIMPLEX, 0.5,
            color, 1, cv::LINE_AA
    );
}

//------------------------------------------------------------------------------
// Render
//------------------------------------------------------------------------------
cv::Mat OverlayRenderer::render(const cv::Mat& frame,
                                const std::vector<TrackedObject>& objects,
                                const Roi* roi,
                                const std::map<int, double>& dwell,
                                const std::string& caption) const {
    if (frame.empty()) {
        throw RenderError("empty frame");
    }

    cv::Mat out = frame.clone();
    try {
        if (roi && roi->valid()) {
            const cv::Rect r = util::toPixelRect(roi->rect(), out.size());
            draw_rect_alpha(out, r, kRoiColor, cfg_.roi_alpha);
            cv::rectangle(out, r, kRoiColor, cfg_.box_thickness);
        }

        for (const auto& obj : objects) {
            const cv::Rect r = util::toPixelRect(obj.box, out.size());
            if (r.width <= 0 || r.height <= 0) continue;

            auto it = dwell.find(obj.id);
            const bool lingering = it != dwell.end() && it->second > 0.0;

            cv::Scalar color = kTrackColor;
            if (obj.missing_frames > 0) color = kMissingColor;
            else if (lingering) color = kLingerColor;
            cv::rectangle(out, r, color, cfg_.box_thickness);

            char buf[96];
            if (lingering) {
                std::snprintf(buf, sizeof(buf), "#%d %s %.1fs", obj.id, obj.label.c_str(), it->second);
            } else {
                std::snprintf(buf, sizeof(buf), "#%d %s", obj.id, obj.label.c_str());
            }
            draw_label(out, cv::Point(r.x + 2, std::max(14, r.y - 2)), buf, color);
        }

        if (!caption.empty()) {
            draw_rect_alpha(out, cv::Rect(0, 0, out.cols, 24), cv::Scalar(0, 0, 0), cfg_.hud_alpha);
            cv::putText(out, caption, cv::Point(6, 17),
                        cv::FONT_HERSHEY_SIMPLEX, 0.5, cv::Scalar(255, 255, 255), 1, cv::LINE_AA);
        }
    } catch (const cv::Exception& e) {
        throw RenderError(std::string("overlay failed: ") + e.what());
    }
    return out;
}
