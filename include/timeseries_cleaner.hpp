/**
 * @file timeseries_cleaner.hpp
 * @brief Cleaning of ObservationRecord sequences before analysis.
 *
 * Stages, in order:
 * 1. Stable sort by timestamp, duplicate timestamps keep the first record
 * 2. Linear-in-time gap interpolation, edge gaps back/forward filled
 * 3. Outlier detection (z-score, IQR or density) and resolution
 * 4. Centered moving-average smoothing
 * 5. Optional normalization into a separate column map
 *
 * The stage functions are static and return new data; only the fitted
 * normalization scalers are kept between calls.
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "observation.hpp"

/// One nullable numeric column, row-aligned with a series
using ValueColumn = std::vector<std::optional<double>>;

/**
 * @struct CleaningStatistics
 * @brief What one clean() call changed.
 */
struct CleaningStatistics {
    int recordsIn = 0;
    int recordsOut = 0;
    int duplicatesDropped = 0;
    int missingFilled = 0;
    int outliersDetected = 0;
    int outliersCorrected = 0;
    int rowsRemoved = 0;
    int valuesSmoothed = 0;
};

/// Fitted scaler: normalized = (value - center) / scale
struct ScalerParams {
    ScalingMethod method = ScalingMethod::None;
    double center = 0.0;
    double scale = 1.0;
};

/// Inclusive value range; values strictly outside are outliers
struct OutlierBounds {
    double lower = 0.0;
    double upper = 0.0;
};

/**
 * @struct CleanResult
 * @brief Cleaned records plus everything reported about the run.
 */
struct CleanResult {
    ObservationSeries records;
    CleaningStatistics stats;
    Diagnostics warnings;
    std::map<std::string, ValueColumn> normalized;   // Empty when normalization is off
};

/**
 * @class TimeSeriesCleaner
 * @brief Interpolation, outlier handling, smoothing and scaling of record columns.
 */
class TimeSeriesCleaner {
public:
    TimeSeriesCleaner();
    explicit TimeSeriesCleaner(const Config& config);

    void configure(const Config& config);

    /// Clean the configured columns
    CleanResult clean(const ObservationSeries& records);

    /**
     * @brief Clean the named columns.
     *
     * Unknown column names are skipped with a warning; the other columns
     * are still cleaned. Rows are dropped only by OutlierAction::Remove.
     */
    CleanResult clean(const ObservationSeries& records, const std::vector<std::string>& columns);

    /**
     * @brief Scale values with the scaler fitted for column.
     * @return false if no scaler has been fitted for column
     */
    bool transform(const std::string& column, const ValueColumn& values, ValueColumn& out) const;

    bool hasScaler(const std::string& column) const { return scalers.count(column) > 0; }
    void resetScalers() { scalers.clear(); }

    // ------------------------------------------------------------------
    // Stage functions
    // ------------------------------------------------------------------

    /// Stable sort by timestamp; returns the number of duplicate timestamps dropped
    static ObservationSeries sortAndDeduplicate(const ObservationSeries& records, int& duplicatesDropped);

    static ValueColumn extractColumn(const ObservationSeries& records, RecordColumn column);
    static void storeColumn(ObservationSeries& records, RecordColumn column, const ValueColumn& values);

    /**
     * @brief Fill nulls linearly in time between the nearest valid neighbours.
     *
     * Leading nulls take the first valid value, trailing nulls the last one.
     * A column without any value is returned unchanged.
     */
    static ValueColumn interpolate(const ValueColumn& values, const std::vector<int64_t>& timesMs);

    /// Bounds of the z-score or IQR rule; false when the column has no spread to judge
    static bool computeBounds(const ValueColumn& values, OutlierMethod method,
                              double threshold, double iqrMultiplier, OutlierBounds& bounds);

    /// Flags values strictly outside bounds (nulls are never flagged)
    static std::vector<bool> flagOutside(const ValueColumn& values, const OutlierBounds& bounds);

    /**
     * @brief Density outliers over several columns jointly.
     *
     * Each column is standardized. A row with at least minNeighbors other
     * rows within radius is a core row; rows that are neither core nor
     * within radius of a core row are flagged. Rows with any null are
     * never flagged.
     */
    static std::vector<bool> detectDensityOutliers(const std::vector<ValueColumn>& columns,
                                                   double radius, int minNeighbors);

    /// Centered moving average, shorter window at the edges, nulls skipped and kept null
    static ValueColumn smooth(const ValueColumn& values, int window);

    /// Linear-interpolated quantile of sorted values (q in [0, 1])
    static double quantile(const std::vector<double>& sorted, double q);

    static ScalerParams fitScaler(const ValueColumn& values, ScalingMethod method);

private:
    void resolveOutliers(ObservationSeries& records,
                         const std::vector<std::pair<std::string, RecordColumn>>& columns,
                         CleaningStatistics& stats) const;

    // Configuration
    std::vector<std::string> defaultColumns;
    OutlierMethod outlierMethod;
    double outlierThreshold;
    double iqrMultiplier;
    double densityRadius;
    int densityMinNeighbors;
    OutlierAction outlierAction;
    bool smoothingEnabled;
    int smoothingWindow;
    ScalingMethod normalization;

    // Fitted on first use, kept until resetScalers()
    std::map<std::string, ScalerParams> scalers;
};
