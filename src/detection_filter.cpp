/**
 * @file detection_filter.cpp
 * @brief Implementation of per-cycle detection filtering.
 *
 * Runs the validation, confidence, size, class and duplicate stages in
 * order and synthesizes the cycle's ObservationRecord from the survivors.
 */

#include "detection_filter.hpp"
#include "geometry.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

// ============================================================================
// Statistics
// ============================================================================

void FilterStatistics::merge(const FilterStatistics& other) {
    cyclesProcessed += other.cyclesProcessed;
    detectionsProcessed += other.detectionsProcessed;
    detectionsKept += other.detectionsKept;
    invalidRejected += other.invalidRejected;
    confidenceFiltered += other.confidenceFiltered;
    sizeFiltered += other.sizeFiltered;
    classFiltered += other.classFiltered;
    duplicateFiltered += other.duplicateFiltered;
}

// ============================================================================
// Constructor / Configuration
// ============================================================================

DetectionFilter::DetectionFilter() {
    configure(Config());
}

DetectionFilter::DetectionFilter(const Config& config) {
    configure(config);
}

void DetectionFilter::configure(const Config& config) {
    confidenceThreshold = config.confidenceThreshold;
    minWidth = config.minBoxWidth;
    minHeight = config.minBoxHeight;
    maxWidth = config.maxBoxWidth;
    maxHeight = config.maxBoxHeight;
    duplicateIoU = config.duplicateIoU;
    confidenceFilterEnabled = config.enableConfidenceFilter;
    sizeFilterEnabled = config.enableSizeFilter;
    duplicateFilterEnabled = config.enableDuplicateFilter;
    positionMode = config.positionMode;
    frameWidth = config.frameWidth;
    frameHeight = config.frameHeight;
    allowedClasses = config.allowedClasses;
    blockedClasses = config.blockedClasses;
}

void DetectionFilter::setClassFilter(const std::set<std::string>& allowed,
                                     const std::set<std::string>& blocked) {
    allowedClasses = allowed;
    blockedClasses = blocked;
}

bool DetectionFilter::shouldKeepClass(const std::string& className) const {
    if (!blockedClasses.empty() && blockedClasses.count(className)) {
        return false;
    }
    if (!allowedClasses.empty()) {
        return allowedClasses.count(className) > 0;
    }
    return true;
}

// ============================================================================
// Filter Stages
// ============================================================================

bool DetectionFilter::isValid(const RawDetection& detection, std::string& reason) {
    if (!std::isfinite(detection.confidence) ||
        detection.confidence < 0.0f || detection.confidence > 1.0f) {
        reason = "confidence outside [0, 1]: " + std::to_string(detection.confidence);
        return false;
    }
    if (!std::isfinite(detection.width) || !std::isfinite(detection.height) ||
        detection.width <= 0.0f || detection.height <= 0.0f) {
        reason = "non-positive box size " + std::to_string(detection.width) + "x" +
                 std::to_string(detection.height);
        return false;
    }
    if (!std::isfinite(detection.centerX) || !std::isfinite(detection.centerY)) {
        reason = "non-finite box center";
        return false;
    }
    return true;
}

/// Stage 1: Reject malformed detections, one diagnostic each
std::vector<RawDetection> DetectionFilter::rejectInvalid(const std::vector<RawDetection>& detections,
                                                         FilterStatistics& stats,
                                                         Diagnostics& diagnostics) const {
    std::vector<RawDetection> valid;
    valid.reserve(detections.size());

    for (size_t i = 0; i < detections.size(); i++) {
        std::string reason;
        if (isValid(detections[i], reason)) {
            valid.push_back(detections[i]);
        } else {
            stats.invalidRejected++;
            diagnostics.push_back({"filter", static_cast<int>(i), reason});
        }
    }
    return valid;
}

/// Stage 2: Confidence threshold (inclusive)
std::vector<RawDetection> DetectionFilter::filterByConfidence(const std::vector<RawDetection>& detections) const {
    std::vector<RawDetection> kept;
    std::copy_if(detections.begin(), detections.end(), std::back_inserter(kept),
                 [this](const RawDetection& d) { return d.confidence >= confidenceThreshold; });
    return kept;
}

/// Stage 3: Box size bounds (inclusive on both ends)
std::vector<RawDetection> DetectionFilter::filterBySize(const std::vector<RawDetection>& detections) const {
    std::vector<RawDetection> kept;
    std::copy_if(detections.begin(), detections.end(), std::back_inserter(kept),
                 [this](const RawDetection& d) {
                     return d.width >= minWidth && d.width <= maxWidth &&
                            d.height >= minHeight && d.height <= maxHeight;
                 });
    return kept;
}

/// Stage 4: Allow/block class lists
std::vector<RawDetection> DetectionFilter::filterByClass(const std::vector<RawDetection>& detections) const {
    std::vector<RawDetection> kept;
    std::copy_if(detections.begin(), detections.end(), std::back_inserter(kept),
                 [this](const RawDetection& d) { return shouldKeepClass(d.className); });
    return kept;
}

/**
 * @brief Stage 5: IoU duplicate suppression.
 *
 * Visits detections by descending confidence (stable, so equal confidences
 * keep input order) and keeps one only if it does not overlap an already
 * kept detection above the threshold. Survivors are returned in input order.
 */
std::vector<RawDetection> DetectionFilter::removeDuplicates(const std::vector<RawDetection>& detections) const {
    if (detections.size() <= 1) return detections;

    std::vector<size_t> order(detections.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&detections](size_t a, size_t b) {
        return detections[a].confidence > detections[b].confidence;
    });

    std::vector<bool> keep(detections.size(), false);
    std::vector<size_t> keptIdx;
    for (size_t idx : order) {
        bool duplicate = false;
        for (size_t k : keptIdx) {
            if (computeIoU(detections[idx], detections[k]) > duplicateIoU) {
                duplicate = true;
                break;
            }
        }
        if (!duplicate) {
            keep[idx] = true;
            keptIdx.push_back(idx);
        }
    }

    std::vector<RawDetection> kept;
    for (size_t i = 0; i < detections.size(); i++) {
        if (keep[i]) kept.push_back(detections[i]);
    }
    return kept;
}

/**
 * @brief Run the full filter pipeline for one cycle.
 *
 * Each stage's removals are counted in stats. Malformed items are reported
 * in the result's diagnostics; the remaining items are still processed.
 */
FilterResult DetectionFilter::filter(const std::vector<RawDetection>& detections,
                                     FilterStatistics& stats) const {
    FilterResult result;
    stats.detectionsProcessed += static_cast<int>(detections.size());

    std::vector<RawDetection> current = rejectInvalid(detections, stats, result.diagnostics);

    if (confidenceFilterEnabled) {
        size_t before = current.size();
        current = filterByConfidence(current);
        stats.confidenceFiltered += static_cast<int>(before - current.size());
    }

    if (sizeFilterEnabled) {
        size_t before = current.size();
        current = filterBySize(current);
        stats.sizeFiltered += static_cast<int>(before - current.size());
    }

    {
        size_t before = current.size();
        current = filterByClass(current);
        stats.classFiltered += static_cast<int>(before - current.size());
    }

    if (duplicateFilterEnabled) {
        size_t before = current.size();
        current = removeDuplicates(current);
        stats.duplicateFiltered += static_cast<int>(before - current.size());
    }

    stats.detectionsKept += static_cast<int>(current.size());
    result.kept = std::move(current);
    return result;
}

// ============================================================================
// Quality / Record Synthesis
// ============================================================================

float DetectionFilter::qualityScore(const RawDetection& detection) const {
    float score = detection.confidence;

    // Extreme aspect ratios are rarely a single insect
    float aspect = detection.height > 0.0f ? detection.width / detection.height : 0.0f;
    if (aspect < MIN_ASPECT_RATIO || aspect > MAX_ASPECT_RATIO) {
        score *= ASPECT_PENALTY;
    }

    float sizeScore = std::min(1.0f, boxArea(detection) / REFERENCE_AREA);
    score *= (SIZE_BASE_WEIGHT + SIZE_SCORE_WEIGHT * sizeScore);

    // Boxes touching the frame border are often cut off
    if (detection.centerX < BORDER_MARGIN || detection.centerY < BORDER_MARGIN ||
        detection.centerX > frameWidth - BORDER_MARGIN ||
        detection.centerY > frameHeight - BORDER_MARGIN) {
        score *= BORDER_PENALTY;
    }

    return std::min(1.0f, std::max(0.0f, score));
}

ObservationRecord DetectionFilter::summarize(const std::vector<RawDetection>& kept,
                                             const Timestamp& timestamp,
                                             int observationNumber,
                                             std::optional<double> processingTimeMs) const {
    ObservationRecord record;
    record.timestamp = timestamp;
    record.observationNumber = observationNumber;
    record.detectionCount = static_cast<int>(kept.size());
    record.hasDetection = !kept.empty();
    record.processingTimeMs = processingTimeMs;

    if (kept.empty()) return record;

    double sumConf = 0.0;
    double sumQuality = 0.0;
    size_t best = 0;
    for (size_t i = 0; i < kept.size(); i++) {
        sumConf += kept[i].confidence;
        sumQuality += qualityScore(kept[i]);
        if (kept[i].confidence > kept[best].confidence) best = i;
    }
    const double n = static_cast<double>(kept.size());

    record.meanConfidence = sumConf / n;
    record.maxConfidence = static_cast<double>(kept[best].confidence);
    record.qualityScore = sumQuality / n;

    if (positionMode == PositionMode::BestConfidence) {
        const RawDetection& d = kept[best];
        record.centerX = d.centerX;
        record.centerY = d.centerY;
        record.bboxWidth = d.width;
        record.bboxHeight = d.height;
        record.bboxArea = static_cast<double>(boxArea(d));
    } else {
        double sx = 0.0, sy = 0.0, sw = 0.0, sh = 0.0, sa = 0.0;
        for (const auto& d : kept) {
            sx += d.centerX;
            sy += d.centerY;
            sw += d.width;
            sh += d.height;
            sa += boxArea(d);
        }
        record.centerX = sx / n;
        record.centerY = sy / n;
        record.bboxWidth = sw / n;
        record.bboxHeight = sh / n;
        record.bboxArea = sa / n;
    }

    return record;
}

ObservationRecord DetectionFilter::processCycle(const std::vector<RawDetection>& detections,
                                                const Timestamp& timestamp,
                                                int observationNumber,
                                                std::optional<double> processingTimeMs,
                                                FilterStatistics& stats,
                                                Diagnostics& diagnostics) const {
    FilterResult result = filter(detections, stats);
    stats.cyclesProcessed++;
    diagnostics.insert(diagnostics.end(), result.diagnostics.begin(), result.diagnostics.end());
    return summarize(result.kept, timestamp, observationNumber, processingTimeMs);
}
