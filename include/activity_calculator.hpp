/**
 * @file activity_calculator.hpp
 * @brief Movement distances, activity metrics and hourly/daily summaries.
 *
 * Works on a cleaned, time-ordered ObservationSeries. Distances are taken
 * between consecutive observed positions; implausibly fast samples are
 * dropped before any statistic is computed.
 */

#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "observation.hpp"
#include "timestamp.hpp"

/// Activity score and classification parameters
namespace ActivityParams {
    constexpr double DETECTION_WEIGHT = 0.3;
    constexpr double DISTANCE_WEIGHT = 0.3;
    constexpr double DURATION_WEIGHT = 0.2;
    constexpr double MOVEMENT_WEIGHT = 0.2;
    constexpr double DETECTIONS_FOR_FULL_SCORE = 100.0;
    constexpr double DISTANCE_FOR_FULL_SCORE = 1000.0;     ///< Pixels
    constexpr double DURATION_FOR_FULL_SCORE = 12.0;       ///< Hours
    constexpr double MOVEMENTS_FOR_FULL_SCORE = 50.0;

    constexpr size_t MIN_SAMPLES_FOR_OUTLIERS = 5;         ///< Outlier removal needs more samples than this

    constexpr int LOW_MAX_DETECTIONS = 5;                  ///< "low" below this many detections
    constexpr double LOW_MAX_DISTANCE = 50.0;              ///< ... and below this distance
    constexpr int MEDIUM_MAX_DETECTIONS = 15;
    constexpr double MEDIUM_MAX_DISTANCE = 200.0;

    // Movement pattern labels
    constexpr int MIN_SAMPLES_FOR_PATTERN = 5;
    constexpr double LOW_MOBILITY_MEAN = 10.0;             ///< Pixels per sample
    constexpr double HIGH_MOBILITY_MEAN = 50.0;
    constexpr double CONSISTENT_MAX_CV = 0.3;              ///< stdDev / mean
    constexpr double ERRATIC_MIN_CV = 0.8;
    constexpr double CONTINUOUS_MIN_RATIO = 0.7;           ///< Non-zero samples / samples
    constexpr double SPORADIC_MAX_RATIO = 0.3;
    constexpr int DAY_START_HOUR = 6;                      ///< Daytime is [6, 18) local
    constexpr int DAY_END_HOUR = 18;
    constexpr double DIEL_DOMINANCE = 1.5;

    // Data quality
    constexpr double PLAUSIBLE_MOVEMENT_MAX = 200.0;       ///< Pixels per sample
}

enum class ActivityLevel { None, Low, Medium, High };

inline const char* toString(ActivityLevel level) {
    switch (level) {
        case ActivityLevel::None: return "none";
        case ActivityLevel::Low: return "low";
        case ActivityLevel::Medium: return "medium";
        case ActivityLevel::High: return "high";
    }
    return "unknown";
}

enum class MobilityLevel { Insufficient, Low, Moderate, High };
enum class MovementConsistency { Insufficient, Consistent, Variable, Erratic };
enum class ActivityContinuity { Insufficient, None, Continuous, Intermittent, Sporadic };
enum class DielPattern { Insufficient, Diurnal, Nocturnal, Crepuscular };

inline const char* toString(MobilityLevel m) {
    switch (m) {
        case MobilityLevel::Insufficient: return "insufficient_data";
        case MobilityLevel::Low: return "low";
        case MobilityLevel::Moderate: return "moderate";
        case MobilityLevel::High: return "high";
    }
    return "unknown";
}

inline const char* toString(MovementConsistency c) {
    switch (c) {
        case MovementConsistency::Insufficient: return "insufficient_data";
        case MovementConsistency::Consistent: return "consistent";
        case MovementConsistency::Variable: return "variable";
        case MovementConsistency::Erratic: return "erratic";
    }
    return "unknown";
}

inline const char* toString(ActivityContinuity c) {
    switch (c) {
        case ActivityContinuity::Insufficient: return "insufficient_data";
        case ActivityContinuity::None: return "none";
        case ActivityContinuity::Continuous: return "continuous";
        case ActivityContinuity::Intermittent: return "intermittent";
        case ActivityContinuity::Sporadic: return "sporadic";
    }
    return "unknown";
}

inline const char* toString(DielPattern d) {
    switch (d) {
        case DielPattern::Insufficient: return "insufficient_data";
        case DielPattern::Diurnal: return "diurnal";
        case DielPattern::Nocturnal: return "nocturnal";
        case DielPattern::Crepuscular: return "crepuscular";
    }
    return "unknown";
}

/**
 * @struct MovementPattern
 * @brief Qualitative labels for one period's movement.
 *
 * Every label is Insufficient with fewer than
 * ActivityParams::MIN_SAMPLES_FOR_PATTERN movement samples.
 */
struct MovementPattern {
    MobilityLevel mobility = MobilityLevel::Insufficient;
    MovementConsistency consistency = MovementConsistency::Insufficient;
    ActivityContinuity continuity = ActivityContinuity::Insufficient;   ///< None when no sample moved
    DielPattern diel = DielPattern::Insufficient;
};

/**
 * @struct MovementSample
 * @brief Displacement between two consecutive observed positions.
 */
struct MovementSample {
    double distance = 0.0;          ///< Pixels, >= 0
    double elapsedMinutes = 0.0;    ///< > 0 for every retained sample
    Timestamp timestamp;            ///< Time of the later observation
};

struct MovementStatistics {
    double mean = 0.0;
    double stdDev = 0.0;
    double max = 0.0;
    int nonZeroCount = 0;
};

/**
 * @struct ActivityMetrics
 * @brief Activity figures for one period (normally one day).
 */
struct ActivityMetrics {
    int totalObservations = 0;
    int totalDetections = 0;
    double totalMovementDistance = 0.0;
    double averageMovementPerDetection = 0.0;
    int peakActivityHour = 0;
    double activeDurationMinutes = 0.0;
    double detectionReliability = 0.0;
    double dataCompletenessRatio = 0.0;

    int movementSampleCount = 0;
    int movementOutliersReplaced = 0;
    MovementStatistics movementStats;
    MovementPattern movementPattern;
    double activityScore = 0.0;
    double dataQuality = 0.0;       ///< [0, 1]
    std::array<int, TimeConst::HOURS_PER_DAY> hourlyDetections{};
};

struct HourlySummary {
    std::string date;               ///< YYYY-MM-DD
    int hour = 0;
    int observationCount = 0;
    int detectionCount = 0;
    double movementDistance = 0.0;
    std::optional<double> meanConfidence;   ///< Empty when the hour has no detections
    double completenessRatio = 0.0;
    ActivityLevel activityLevel = ActivityLevel::None;
};

struct DailySummary {
    std::string date;               ///< YYYY-MM-DD
    ActivityMetrics metrics;
    int activeHours = 0;            ///< Hours with at least one detection
    std::vector<HourlySummary> hours;   ///< Always 24 rows, hour 0 first
};

/**
 * @class ActivityCalculator
 * @brief Derives movement and activity metrics from an observation series.
 *
 * Movement pipeline:
 * 1. Distance between consecutive non-null positions
 * 2. Drop samples with non-positive elapsed time or speed above the ceiling
 * 3. Distances below the minimum movement become 0
 * 4. Z-score outliers replaced by index interpolation (more than 5 samples)
 * 5. Centered moving average (more samples than the window)
 */
class ActivityCalculator {
public:
    ActivityCalculator();
    explicit ActivityCalculator(const Config& config);

    void configure(const Config& config);

    /// Retained movement samples after the full movement pipeline
    std::vector<MovementSample> computeMovementSamples(const ObservationSeries& series) const;

    /// Distances of computeMovementSamples()
    std::vector<double> computeMovements(const ObservationSeries& series) const;

    /**
     * @brief Metrics for a series covering periodMinutes.
     *
     * An empty series gives all-zero metrics (completeness 0), not an error.
     */
    ActivityMetrics computeMetrics(const ObservationSeries& series,
                                   double periodMinutes = TimeConst::MINUTES_PER_DAY) const;

    /// Exactly 24 rows for the records of the given local date; each hour computed on its own
    std::vector<HourlySummary> hourlySummaries(const ObservationSeries& series, const std::string& date) const;

    /// One summary per local date present in the series, in date order
    std::vector<DailySummary> dailySummaries(const ObservationSeries& series) const;

    static ActivityLevel classifyActivity(int detections, double distance);
    static double activityScore(int detections, double distance, double durationMinutes, int movementCount);
    static MovementStatistics movementStatistics(const std::vector<double>& movements);

    /**
     * @brief Mobility, consistency, continuity and day/night labels.
     * @param stats movementStatistics() of the samples
     * @param sampleCount Number of movement samples
     * @param hourlyDetections Detections per local hour
     */
    static MovementPattern analyzeMovementPattern(const MovementStatistics& stats, int sampleCount,
                                                  const std::array<int, TimeConst::HOURS_PER_DAY>& hourlyDetections);

    /**
     * @brief Mean of four factors in [0, 1]: evenness of the observation
     * spacing, detection reliability, share of plausible movements and
     * share of movement samples that were not outliers.
     */
    static double dataQuality(const ObservationSeries& series, double reliability,
                              const std::vector<double>& movements, int outliersReplaced);

    /// Replace |z| > threshold values by interpolation over their valid neighbours
    static std::vector<double> removeOutliers(const std::vector<double>& values, double threshold,
                                              int* replaced = nullptr);

    /// Centered moving average with shorter windows at the edges
    static std::vector<double> smooth(const std::vector<double>& values, int window);

private:
    std::vector<MovementSample> movementSamples(const ObservationSeries& series, int& outliersReplaced) const;
    double completeness(int observed, double periodMinutes) const;

    double speedCeiling;            // Pixels/minute
    double minMovementDistance;
    bool outlierRemovalEnabled;
    double outlierThreshold;
    bool smoothingEnabled;
    int smoothingWindow;
    double intervalMinutes;
};
