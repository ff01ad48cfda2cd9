/**
 * @file geometry.cpp
 * @brief Bounding-box geometry helpers.
 */

#include "geometry.hpp"
#include <algorithm>

cv::Rect2f toRect(const RawDetection& det) {
    return cv::Rect2f(det.centerX - det.width / 2.0f, det.centerY - det.height / 2.0f,
                      det.width, det.height);
}

float boxArea(const RawDetection& det) {
    if (det.width <= 0.0f || det.height <= 0.0f) return 0.0f;
    return det.width * det.height;
}

/// Compute Intersection over Union between two bounding boxes
float computeIoU(const cv::Rect2f& a, const cv::Rect2f& b) {
    float x1 = std::max(a.x, b.x);
    float y1 = std::max(a.y, b.y);
    float x2 = std::min(a.x + a.width, b.x + b.width);
    float y2 = std::min(a.y + a.height, b.y + b.height);

    if (x2 <= x1 || y2 <= y1) {
        return 0.0f;
    }

    float intersection = (x2 - x1) * (y2 - y1);
    float unionArea = a.area() + b.area() - intersection;
    if (unionArea <= 0.0f) return 0.0f;

    return intersection / unionArea;
}

float computeIoU(const RawDetection& a, const RawDetection& b) {
    return computeIoU(toRect(a), toRect(b));
}

double euclideanDistance(const cv::Point2d& a, const cv::Point2d& b) {
    return cv::norm(b - a);
}
