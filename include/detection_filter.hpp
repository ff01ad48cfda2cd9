/**
 * @file detection_filter.hpp
 * @brief Per-cycle detection filtering, duplicate suppression and record synthesis.
 *
 * DetectionFilter turns the raw detections of one observation cycle into a
 * cleaned detection list and one ObservationRecord. It holds configuration
 * only; the filter counters live in a FilterStatistics object owned by the
 * caller, so separate runs (and tests) never share counters.
 */

#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "observation.hpp"

/**
 * @struct FilterStatistics
 * @brief Counts of detections removed by each rule, accumulated across cycles.
 */
struct FilterStatistics {
    int cyclesProcessed = 0;
    int detectionsProcessed = 0;
    int detectionsKept = 0;
    int invalidRejected = 0;
    int confidenceFiltered = 0;
    int sizeFiltered = 0;
    int classFiltered = 0;
    int duplicateFiltered = 0;

    int totalFilteredOut() const {
        return invalidRejected + confidenceFiltered + sizeFiltered + classFiltered + duplicateFiltered;
    }

    void merge(const FilterStatistics& other);
    void reset() { *this = FilterStatistics(); }
};

/**
 * @struct FilterResult
 * @brief Surviving detections (input order preserved) and per-item problems.
 */
struct FilterResult {
    std::vector<RawDetection> kept;
    Diagnostics diagnostics;
};

/**
 * @class DetectionFilter
 * @brief Confidence, size and class filtering plus IoU duplicate suppression.
 *
 * Pipeline stages:
 * 1. Reject malformed detections (reported, never fatal)
 * 2. Drop detections below the confidence threshold (threshold itself is kept)
 * 3. Drop boxes whose width or height is outside [min, max]
 * 4. Drop blocked / not-allowed classes
 * 5. Suppress duplicates: of two boxes with IoU above the threshold the
 *    higher-confidence one survives, the earlier one on equal confidence
 *
 * Filtering an already filtered list with the same configuration returns it unchanged.
 */
class DetectionFilter {
public:
    // Quality score shaping
    static constexpr float MIN_ASPECT_RATIO = 0.5f;
    static constexpr float MAX_ASPECT_RATIO = 3.0f;
    static constexpr float ASPECT_PENALTY = 0.8f;
    static constexpr float REFERENCE_AREA = 10000.0f;   // px^2 that earns the full size score
    static constexpr float SIZE_BASE_WEIGHT = 0.7f;
    static constexpr float SIZE_SCORE_WEIGHT = 0.3f;
    static constexpr float BORDER_MARGIN = 50.0f;       // px
    static constexpr float BORDER_PENALTY = 0.9f;

    DetectionFilter();
    explicit DetectionFilter(const Config& config);

    // Configure from Config struct (recommended)
    void configure(const Config& config);

    // Individual configuration setters
    void setPositionMode(PositionMode mode) { positionMode = mode; }
    void setClassFilter(const std::set<std::string>& allowed, const std::set<std::string>& blocked);
    bool shouldKeepClass(const std::string& className) const;

    /// Run all filter stages over one cycle's detections
    FilterResult filter(const std::vector<RawDetection>& detections, FilterStatistics& stats) const;

    /**
     * @brief Build the ObservationRecord for one cycle from surviving detections.
     *
     * With no detections every measurement field stays empty.
     */
    ObservationRecord summarize(const std::vector<RawDetection>& kept,
                                const Timestamp& timestamp,
                                int observationNumber,
                                std::optional<double> processingTimeMs) const;

    /// filter() followed by summarize(); counts the cycle in stats
    ObservationRecord processCycle(const std::vector<RawDetection>& detections,
                                   const Timestamp& timestamp,
                                   int observationNumber,
                                   std::optional<double> processingTimeMs,
                                   FilterStatistics& stats,
                                   Diagnostics& diagnostics) const;

    /// Coarse per-detection quality in [0, 1]; annotates records, never filters
    float qualityScore(const RawDetection& detection) const;

    /// Structural validity check; reason is set when false
    static bool isValid(const RawDetection& detection, std::string& reason);

private:
    // Filter stages
    std::vector<RawDetection> rejectInvalid(const std::vector<RawDetection>& detections,
                                            FilterStatistics& stats,
                                            Diagnostics& diagnostics) const;
    std::vector<RawDetection> filterByConfidence(const std::vector<RawDetection>& detections) const;
    std::vector<RawDetection> filterBySize(const std::vector<RawDetection>& detections) const;
    std::vector<RawDetection> filterByClass(const std::vector<RawDetection>& detections) const;
    std::vector<RawDetection> removeDuplicates(const std::vector<RawDetection>& detections) const;

    // Configuration
    float confidenceThreshold;
    float minWidth;
    float minHeight;
    float maxWidth;
    float maxHeight;
    float duplicateIoU;
    bool confidenceFilterEnabled;
    bool sizeFilterEnabled;
    bool duplicateFilterEnabled;
    PositionMode positionMode;
    int frameWidth;
    int frameHeight;

    // Class filtering
    std::set<std::string> allowedClasses;
    std::set<std::string> blockedClasses;
};
