/**
 * @file observation.hpp
 * @brief Records exchanged between the pipeline stages.
 *
 * RawDetection comes from the inference collaborator, one per bounding box.
 * ObservationRecord is one row per observation cycle; the detection filter
 * creates it and the time-series cleaner and activity calculator consume
 * sequences of it.
 */

#pragma once

#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "timestamp.hpp"

/**
 * @struct RawDetection
 * @brief One bounding box returned by one inference call (center format, pixels).
 */
struct RawDetection {
    float centerX = 0.0f;
    float centerY = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
    float confidence = 0.0f;
    std::string className;
    Timestamp timestamp;
};

/**
 * @struct ObservationRecord
 * @brief Summary of one observation cycle.
 *
 * When detectionCount is 0 every measurement field is empty. An empty
 * position is "not observed", never (0, 0).
 */
struct ObservationRecord {
    Timestamp timestamp;
    int observationNumber = 0;
    int detectionCount = 0;
    bool hasDetection = false;

    std::optional<double> centerX;
    std::optional<double> centerY;
    std::optional<double> meanConfidence;
    std::optional<double> maxConfidence;
    std::optional<double> bboxWidth;
    std::optional<double> bboxHeight;
    std::optional<double> bboxArea;
    std::optional<double> qualityScore;
    std::optional<double> processingTimeMs;

    bool hasPosition() const { return centerX.has_value() && centerY.has_value(); }
    cv::Point2d position() const { return cv::Point2d(*centerX, *centerY); }
};

using ObservationSeries = std::vector<ObservationRecord>;

/// Nullable numeric field of ObservationRecord addressed by column name
using RecordColumn = std::optional<double> ObservationRecord::*;

/// Column names that can be cleaned, in file order
const std::vector<std::string>& cleanableColumns();

/**
 * @brief Look up a nullable numeric column by its file header name.
 * @return nullptr if the name is not a cleanable column
 */
RecordColumn findColumn(const std::string& name);
