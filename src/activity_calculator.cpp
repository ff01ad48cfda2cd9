/**
 * @file activity_calculator.cpp
 * @brief Implementation of movement and activity analytics.
 */

#include "activity_calculator.hpp"
#include "geometry.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <opencv2/core.hpp>

// ============================================================================
// Constructor / Configuration
// ============================================================================

ActivityCalculator::ActivityCalculator() {
    configure(Config());
}

ActivityCalculator::ActivityCalculator(const Config& config) {
    configure(config);
}

void ActivityCalculator::configure(const Config& config) {
    speedCeiling = config.speedCeiling();
    minMovementDistance = config.minMovementDistance;
    outlierRemovalEnabled = config.enableMovementOutlierRemoval;
    outlierThreshold = config.movementOutlierThreshold;
    smoothingEnabled = config.enableMovementSmoothing;
    smoothingWindow = config.movementSmoothingWindow;
    intervalMinutes = config.observationIntervalMinutes;
}

// ============================================================================
// Movement
// ============================================================================

std::vector<MovementSample> ActivityCalculator::computeMovementSamples(const ObservationSeries& series) const {
    int outliersReplaced = 0;
    return movementSamples(series, outliersReplaced);
}

std::vector<MovementSample> ActivityCalculator::movementSamples(const ObservationSeries& series,
                                                                int& outliersReplaced) const {
    outliersReplaced = 0;
    ObservationSeries ordered = series;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const ObservationRecord& a, const ObservationRecord& b) {
                         return a.timestamp < b.timestamp;
                     });

    std::vector<MovementSample> samples;
    const ObservationRecord* prev = nullptr;

    for (const auto& record : ordered) {
        if (!record.hasPosition()) continue;
        if (prev == nullptr) {
            prev = &record;
            continue;
        }

        double distance = euclideanDistance(prev->position(), record.position());
        double elapsed = minutesBetween(prev->timestamp, record.timestamp);
        prev = &record;

        // No time passed: speed undefined
        if (elapsed <= 0.0) continue;
        // Faster than the insect can move: detector jumped to another object
        if (distance / elapsed > speedCeiling) continue;

        if (distance < minMovementDistance) distance = 0.0;

        MovementSample sample;
        sample.distance = distance;
        sample.elapsedMinutes = elapsed;
        sample.timestamp = record.timestamp;
        samples.push_back(sample);
    }

    if (samples.empty()) return samples;

    std::vector<double> distances;
    distances.reserve(samples.size());
    for (const auto& s : samples) distances.push_back(s.distance);

    if (outlierRemovalEnabled && distances.size() > ActivityParams::MIN_SAMPLES_FOR_OUTLIERS) {
        distances = removeOutliers(distances, outlierThreshold, &outliersReplaced);
    }
    if (smoothingEnabled && distances.size() > static_cast<size_t>(smoothingWindow)) {
        distances = smooth(distances, smoothingWindow);
    }

    for (size_t i = 0; i < samples.size(); i++) samples[i].distance = distances[i];
    return samples;
}

std::vector<double> ActivityCalculator::computeMovements(const ObservationSeries& series) const {
    std::vector<double> distances;
    for (const auto& s : computeMovementSamples(series)) distances.push_back(s.distance);
    return distances;
}

std::vector<double> ActivityCalculator::removeOutliers(const std::vector<double>& values, double threshold,
                                                       int* replaced) {
    if (replaced) *replaced = 0;
    if (values.size() < 3) return values;

    cv::Scalar mean, stddev;
    cv::meanStdDev(values, mean, stddev);
    if (stddev[0] <= 0.0) return values;

    const size_t n = values.size();
    std::vector<bool> outlier(n, false);
    bool any = false;
    for (size_t i = 0; i < n; i++) {
        if (std::abs(values[i] - mean[0]) / stddev[0] > threshold) {
            outlier[i] = true;
            any = true;
        }
    }
    if (!any) return values;

    std::vector<double> cleaned = values;
    for (size_t i = 0; i < n; i++) {
        if (!outlier[i]) continue;
        if (replaced) (*replaced)++;

        // Nearest valid neighbours by index
        int left = static_cast<int>(i) - 1;
        while (left >= 0 && outlier[left]) left--;
        size_t right = i + 1;
        while (right < n && outlier[right]) right++;

        bool hasLeft = left >= 0;
        bool hasRight = right < n;
        if (hasLeft && hasRight) {
            double frac = static_cast<double>(static_cast<int>(i) - left) /
                          static_cast<double>(static_cast<int>(right) - left);
            cleaned[i] = values[left] + (values[right] - values[left]) * frac;
        } else if (hasLeft) {
            cleaned[i] = values[left];
        } else if (hasRight) {
            cleaned[i] = values[right];
        } else {
            cleaned[i] = 0.0;
        }
    }
    return cleaned;
}

std::vector<double> ActivityCalculator::smooth(const std::vector<double>& values, int window) {
    if (window <= 1 || values.empty()) return values;

    const int n = static_cast<int>(values.size());
    const int half = window / 2;
    std::vector<double> out(values.size(), 0.0);
    for (int i = 0; i < n; i++) {
        int lo = std::max(0, i - half);
        int hi = std::min(n - 1, i + half);
        double sum = 0.0;
        for (int j = lo; j <= hi; j++) sum += values[j];
        out[i] = sum / (hi - lo + 1);
    }
    return out;
}

MovementStatistics ActivityCalculator::movementStatistics(const std::vector<double>& movements) {
    MovementStatistics stats;
    if (movements.empty()) return stats;

    cv::Scalar mean, stddev;
    cv::meanStdDev(movements, mean, stddev);
    stats.mean = mean[0];
    stats.stdDev = stddev[0];
    stats.max = *std::max_element(movements.begin(), movements.end());
    stats.nonZeroCount = static_cast<int>(
        std::count_if(movements.begin(), movements.end(), [](double m) { return m > 0.0; }));
    return stats;
}

// ============================================================================
// Patterns / Quality
// ============================================================================

MovementPattern ActivityCalculator::analyzeMovementPattern(
        const MovementStatistics& stats, int sampleCount,
        const std::array<int, TimeConst::HOURS_PER_DAY>& hourlyDetections) {
    using namespace ActivityParams;
    MovementPattern pattern;
    if (sampleCount < MIN_SAMPLES_FOR_PATTERN) return pattern;

    if (stats.mean < LOW_MOBILITY_MEAN) {
        pattern.mobility = MobilityLevel::Low;
    } else if (stats.mean > HIGH_MOBILITY_MEAN) {
        pattern.mobility = MobilityLevel::High;
    } else {
        pattern.mobility = MobilityLevel::Moderate;
    }

    if (stats.stdDev < stats.mean * CONSISTENT_MAX_CV) {
        pattern.consistency = MovementConsistency::Consistent;
    } else if (stats.stdDev > stats.mean * ERRATIC_MIN_CV) {
        pattern.consistency = MovementConsistency::Erratic;
    } else {
        pattern.consistency = MovementConsistency::Variable;
    }

    if (stats.nonZeroCount == 0) {
        pattern.continuity = ActivityContinuity::None;
    } else {
        double ratio = static_cast<double>(stats.nonZeroCount) / sampleCount;
        if (ratio > CONTINUOUS_MIN_RATIO) {
            pattern.continuity = ActivityContinuity::Continuous;
        } else if (ratio < SPORADIC_MAX_RATIO) {
            pattern.continuity = ActivityContinuity::Sporadic;
        } else {
            pattern.continuity = ActivityContinuity::Intermittent;
        }
    }

    int day = 0, night = 0;
    for (int h = 0; h < TimeConst::HOURS_PER_DAY; h++) {
        if (h >= DAY_START_HOUR && h < DAY_END_HOUR) {
            day += hourlyDetections[h];
        } else {
            night += hourlyDetections[h];
        }
    }
    if (night > day * DIEL_DOMINANCE) {
        pattern.diel = DielPattern::Nocturnal;
    } else if (day > night * DIEL_DOMINANCE) {
        pattern.diel = DielPattern::Diurnal;
    } else {
        pattern.diel = DielPattern::Crepuscular;
    }
    return pattern;
}

double ActivityCalculator::dataQuality(const ObservationSeries& series, double reliability,
                                       const std::vector<double>& movements, int outliersReplaced) {
    if (series.empty()) return 0.0;

    // Evenness of the observation spacing: 1 - coefficient of variation
    double timing = 0.0;
    if (series.size() > 1) {
        std::vector<int64_t> times;
        times.reserve(series.size());
        for (const auto& record : series) times.push_back(record.timestamp.epochMs);
        std::sort(times.begin(), times.end());

        std::vector<double> intervals;
        for (size_t i = 1; i < times.size(); i++) {
            intervals.push_back(static_cast<double>(times[i] - times[i - 1]));
        }
        cv::Scalar mean, stddev;
        cv::meanStdDev(intervals, mean, stddev);
        if (mean[0] > 0.0) timing = std::max(0.0, std::min(1.0, 1.0 - stddev[0] / mean[0]));
    }

    double plausible = 0.0;
    double outlierFree = 1.0;
    if (!movements.empty()) {
        int count = static_cast<int>(std::count_if(movements.begin(), movements.end(), [](double m) {
            return m > 0.0 && m < ActivityParams::PLAUSIBLE_MOVEMENT_MAX;
        }));
        plausible = static_cast<double>(count) / movements.size();
        outlierFree = std::max(0.0, 1.0 - static_cast<double>(outliersReplaced) / movements.size());
    }

    double quality = (timing + reliability + plausible + outlierFree) / 4.0;
    return std::max(0.0, std::min(1.0, quality));
}

// ============================================================================
// Metrics
// ============================================================================

double ActivityCalculator::activityScore(int detections, double distance, double durationMinutes,
                                         int movementCount) {
    using namespace ActivityParams;
    double detectionScore = std::min(1.0, detections / DETECTIONS_FOR_FULL_SCORE);
    double distanceScore = std::min(1.0, distance / DISTANCE_FOR_FULL_SCORE);
    double durationScore = std::min(1.0, (durationMinutes / TimeConst::MINUTES_PER_HOUR) / DURATION_FOR_FULL_SCORE);
    double movementScore = std::min(1.0, movementCount / MOVEMENTS_FOR_FULL_SCORE);

    double score = DETECTION_WEIGHT * detectionScore + DISTANCE_WEIGHT * distanceScore +
                   DURATION_WEIGHT * durationScore + MOVEMENT_WEIGHT * movementScore;
    return std::max(0.0, std::min(1.0, score));
}

ActivityLevel ActivityCalculator::classifyActivity(int detections, double distance) {
    using namespace ActivityParams;
    if (detections == 0) return ActivityLevel::None;
    if (detections < LOW_MAX_DETECTIONS && distance < LOW_MAX_DISTANCE) return ActivityLevel::Low;
    if (detections < MEDIUM_MAX_DETECTIONS && distance < MEDIUM_MAX_DISTANCE) return ActivityLevel::Medium;
    return ActivityLevel::High;
}

double ActivityCalculator::completeness(int observed, double periodMinutes) const {
    if (intervalMinutes <= 0.0 || periodMinutes <= 0.0) return 0.0;
    double expected = periodMinutes / intervalMinutes;
    return std::min(1.0, observed / expected);
}

ActivityMetrics ActivityCalculator::computeMetrics(const ObservationSeries& series, double periodMinutes) const {
    ActivityMetrics metrics;
    if (series.empty()) return metrics;

    metrics.totalObservations = static_cast<int>(series.size());

    double confidenceSum = 0.0;
    int confidenceCount = 0;
    bool haveDetection = false;
    Timestamp first, last;

    for (const auto& record : series) {
        if (!record.hasDetection) continue;
        metrics.totalDetections++;
        metrics.hourlyDetections[localHour(record.timestamp)]++;

        if (record.meanConfidence) {
            confidenceSum += *record.meanConfidence;
            confidenceCount++;
        }

        if (!haveDetection || record.timestamp < first) first = record.timestamp;
        if (!haveDetection || last < record.timestamp) last = record.timestamp;
        haveDetection = true;
    }

    std::vector<double> movements;
    for (const auto& s : movementSamples(series, metrics.movementOutliersReplaced)) {
        movements.push_back(s.distance);
    }
    for (double m : movements) metrics.totalMovementDistance += m;
    metrics.movementSampleCount = static_cast<int>(movements.size());
    metrics.movementStats = movementStatistics(movements);

    if (metrics.totalDetections > 0) {
        metrics.averageMovementPerDetection = metrics.totalMovementDistance / metrics.totalDetections;

        // Earliest hour wins ties
        int peak = 0;
        for (int h = 1; h < TimeConst::HOURS_PER_DAY; h++) {
            if (metrics.hourlyDetections[h] > metrics.hourlyDetections[peak]) peak = h;
        }
        metrics.peakActivityHour = peak;
        metrics.activeDurationMinutes = std::max(0.0, minutesBetween(first, last));
    }

    if (confidenceCount > 0) metrics.detectionReliability = confidenceSum / confidenceCount;
    metrics.dataCompletenessRatio = completeness(metrics.totalObservations, periodMinutes);
    metrics.activityScore = activityScore(metrics.totalDetections, metrics.totalMovementDistance,
                                          metrics.activeDurationMinutes, metrics.movementSampleCount);
    metrics.movementPattern = analyzeMovementPattern(metrics.movementStats, metrics.movementSampleCount,
                                                     metrics.hourlyDetections);
    metrics.dataQuality = dataQuality(series, metrics.detectionReliability, movements,
                                      metrics.movementOutliersReplaced);
    return metrics;
}

// ============================================================================
// Aggregation
// ============================================================================

std::vector<HourlySummary> ActivityCalculator::hourlySummaries(const ObservationSeries& series,
                                                               const std::string& date) const {
    std::vector<ObservationSeries> buckets(TimeConst::HOURS_PER_DAY);
    for (const auto& record : series) {
        if (localDate(record.timestamp) != date) continue;
        buckets[localHour(record.timestamp)].push_back(record);
    }

    std::vector<HourlySummary> summaries;
    summaries.reserve(TimeConst::HOURS_PER_DAY);
    for (int h = 0; h < TimeConst::HOURS_PER_DAY; h++) {
        const ObservationSeries& bucket = buckets[h];

        HourlySummary summary;
        summary.date = date;
        summary.hour = h;
        summary.observationCount = static_cast<int>(bucket.size());

        double confidenceSum = 0.0;
        int confidenceCount = 0;
        for (const auto& record : bucket) {
            if (!record.hasDetection) continue;
            summary.detectionCount++;
            if (record.meanConfidence) {
                confidenceSum += *record.meanConfidence;
                confidenceCount++;
            }
        }
        if (confidenceCount > 0) summary.meanConfidence = confidenceSum / confidenceCount;

        for (double m : computeMovements(bucket)) summary.movementDistance += m;
        summary.completenessRatio = completeness(summary.observationCount, TimeConst::MINUTES_PER_HOUR);
        summary.activityLevel = classifyActivity(summary.detectionCount, summary.movementDistance);
        summaries.push_back(summary);
    }
    return summaries;
}

std::vector<DailySummary> ActivityCalculator::dailySummaries(const ObservationSeries& series) const {
    std::map<std::string, ObservationSeries> days;
    for (const auto& record : series) {
        days[localDate(record.timestamp)].push_back(record);
    }

    std::vector<DailySummary> summaries;
    for (const auto& day : days) {
        DailySummary summary;
        summary.date = day.first;
        summary.metrics = computeMetrics(day.second, TimeConst::MINUTES_PER_DAY);
        summary.hours = hourlySummaries(day.second, day.first);
        for (const auto& hour : summary.hours) {
            if (hour.detectionCount > 0) summary.activeHours++;
        }
        summaries.push_back(summary);
    }
    return summaries;
}
