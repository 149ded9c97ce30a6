#include "util/rect_utils.h"
#include <algorithm>
#include <cmath>

namespace util {

cv::Point2f centroid(const cv::Rect2f& r) {
    return cv::Point2f(r.x + r.width * 0.5f, r.y + r.height * 0.5f);
}

cv::Rect2f clampRect(const cv::Rect2f& r, const cv::Size& frameSize) {
    float x1 = std::max(0.0f, r.x);
    float y1 = std::max(0.0f, r.y);
    float x2 = std::min((float)frameSize.width,  r.x + r.width);
    float y2 = std::min((float)frameSize.height, r.y + r.height);
    float w = std::max(0.0f, x2 - x1);
    float h = std::max(0.0f, y2 - y1);
    return cv::Rect2f(x1, y1, w, h);
}

cv::Rect toPixelRect(const cv::Rect2f& r, const cv::Size& frameSize) {
    const cv::Rect2f c = clampRect(r, frameSize);
    return cv::Rect((int)std::lround(c.x),
                    (int)std::lround(c.y),
                    (int)std::lround(c.width),
                    (int)std::lround(c.height));
}

float iou(const cv::Rect2f& a, const cv::Rect2f& b) {
    cv::Rect2f inter = a & b;
    float ia = inter.area();
    if (ia <= 0.0f) return 0.0f;
    float ua = a.area() + b.area() - ia;
    if (ua <= 0.0f) return 0.0f;
    return ia / ua;
}

float distance(const cv::Point2f& a, const cv::Point2f& b) {
    float dx = a.x - b.x;
    float dy = a.y - b.y;
    return std::sqrt(dx*dx + dy*dy);
}

} // namespace util
