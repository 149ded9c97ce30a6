#pragma once
#include <opencv2/core.hpp>

namespace util {

// Center of the rectangle.
cv::Point2f centroid(const cv::Rect2f& r);

// Clamp rectangle to frame bounds (0..W, 0..H).
cv::Rect2f clampRect(const cv::Rect2f& r, const cv::Size& frameSize);

// Integer rectangle for drawing, clamped to the frame. May be empty.
cv::Rect toPixelRect(const cv::Rect2f& r, const cv::Size& frameSize);

// Intersection over Union. Returns 0..1.
float iou(const cv::Rect2f& a, const cv::Rect2f& b);

// Euclidean distance between two points (pixels).
float distance(const cv::Point2f& a, const cv::Point2f& b);

} // namespace util
