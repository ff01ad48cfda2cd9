/**
 * @file geometry.hpp
 * @brief Bounding-box geometry: area, IoU and center distance.
 */

#pragma once

#include <opencv2/core.hpp>
#include "observation.hpp"

/// Axis-aligned box (top-left + size) of a center-format detection
cv::Rect2f toRect(const RawDetection& det);

/// Box area in square pixels (0 for degenerate boxes)
float boxArea(const RawDetection& det);

/**
 * @brief Intersection over Union of two axis-aligned boxes.
 * @return Value in [0, 1]; 0 when the boxes do not overlap or the union is empty
 */
float computeIoU(const cv::Rect2f& a, const cv::Rect2f& b);
float computeIoU(const RawDetection& a, const RawDetection& b);

/// Euclidean distance between two positions
double euclideanDistance(const cv::Point2d& a, const cv::Point2d& b);
