/**
 * @file timeseries_cleaner.cpp
 * @brief Implementation of the observation time-series cleaning stages.
 */

#include "timeseries_cleaner.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <opencv2/core.hpp>

namespace {

std::vector<int64_t> timesOf(const ObservationSeries& records) {
    std::vector<int64_t> times;
    times.reserve(records.size());
    for (const auto& r : records) times.push_back(r.timestamp.epochMs);
    return times;
}

std::vector<double> presentValues(const ValueColumn& values) {
    std::vector<double> data;
    data.reserve(values.size());
    for (const auto& v : values) {
        if (v) data.push_back(*v);
    }
    return data;
}

int countFlags(const std::vector<bool>& flags) {
    return static_cast<int>(std::count(flags.begin(), flags.end(), true));
}

ObservationSeries dropRows(const ObservationSeries& records, const std::vector<bool>& drop) {
    ObservationSeries kept;
    kept.reserve(records.size());
    for (size_t i = 0; i < records.size(); i++) {
        if (!drop[i]) kept.push_back(records[i]);
    }
    return kept;
}

}  // namespace

// ============================================================================
// Constructor / Configuration
// ============================================================================

TimeSeriesCleaner::TimeSeriesCleaner() {
    configure(Config());
}

TimeSeriesCleaner::TimeSeriesCleaner(const Config& config) {
    configure(config);
}

void TimeSeriesCleaner::configure(const Config& config) {
    defaultColumns = config.cleanColumns;
    outlierMethod = config.outlierMethod;
    outlierThreshold = config.outlierThreshold;
    iqrMultiplier = config.iqrMultiplier;
    densityRadius = config.densityRadius;
    densityMinNeighbors = config.densityMinNeighbors;
    outlierAction = config.outlierAction;
    smoothingEnabled = config.enableSmoothing;
    smoothingWindow = config.smoothingWindow;
    normalization = config.normalization;
}

// ============================================================================
// Pipeline
// ============================================================================

CleanResult TimeSeriesCleaner::clean(const ObservationSeries& records) {
    return clean(records, defaultColumns);
}

CleanResult TimeSeriesCleaner::clean(const ObservationSeries& records,
                                     const std::vector<std::string>& columns) {
    CleanResult result;
    result.stats.recordsIn = static_cast<int>(records.size());

    result.records = sortAndDeduplicate(records, result.stats.duplicatesDropped);

    // Resolve requested names; unknown ones are skipped
    std::vector<std::pair<std::string, RecordColumn>> targets;
    for (const auto& name : columns) {
        RecordColumn column = findColumn(name);
        if (column == nullptr) {
            std::cerr << "Warning: Column '" << name << "' not present, skipping" << std::endl;
            result.warnings.push_back({"cleaner", -1, "column '" + name + "' not present"});
            continue;
        }
        bool duplicate = false;
        for (const auto& t : targets) duplicate = duplicate || t.first == name;
        if (!duplicate) targets.emplace_back(name, column);
    }

    if (result.records.empty() || targets.empty()) {
        result.stats.recordsOut = static_cast<int>(result.records.size());
        return result;
    }

    // Stage 2: gap interpolation
    std::vector<int64_t> times = timesOf(result.records);
    for (const auto& target : targets) {
        ValueColumn before = extractColumn(result.records, target.second);
        ValueColumn after = interpolate(before, times);
        for (size_t i = 0; i < before.size(); i++) {
            if (!before[i] && after[i]) result.stats.missingFilled++;
        }
        storeColumn(result.records, target.second, after);
    }

    // Stage 3: outliers
    resolveOutliers(result.records, targets, result.stats);

    // Stage 4: smoothing
    if (smoothingEnabled && smoothingWindow > 1) {
        for (const auto& target : targets) {
            ValueColumn values = extractColumn(result.records, target.second);
            ValueColumn smoothed = smooth(values, smoothingWindow);
            result.stats.valuesSmoothed += static_cast<int>(presentValues(smoothed).size());
            storeColumn(result.records, target.second, smoothed);
        }
    }

    // Stage 5: normalization into a separate map
    if (normalization != ScalingMethod::None) {
        for (const auto& target : targets) {
            ValueColumn values = extractColumn(result.records, target.second);
            auto it = scalers.find(target.first);
            if (it == scalers.end() || it->second.method != normalization) {
                scalers[target.first] = fitScaler(values, normalization);
            }
            ValueColumn scaled;
            if (transform(target.first, values, scaled)) {
                result.normalized[target.first] = scaled;
            }
        }
    }

    result.stats.recordsOut = static_cast<int>(result.records.size());
    return result;
}

void TimeSeriesCleaner::resolveOutliers(ObservationSeries& records,
                                        const std::vector<std::pair<std::string, RecordColumn>>& columns,
                                        CleaningStatistics& stats) const {
    if (records.empty()) return;

    if (outlierMethod == OutlierMethod::Density) {
        std::vector<ValueColumn> values;
        for (const auto& c : columns) values.push_back(extractColumn(records, c.second));

        std::vector<bool> flags = detectDensityOutliers(values, densityRadius, densityMinNeighbors);
        int flagged = countFlags(flags);
        stats.outliersDetected += flagged;
        if (flagged == 0) return;

        switch (outlierAction) {
            case OutlierAction::Remove:
                records = dropRows(records, flags);
                stats.rowsRemoved += flagged;
                break;

            case OutlierAction::Interpolate: {
                std::vector<int64_t> times = timesOf(records);
                for (size_t c = 0; c < columns.size(); c++) {
                    for (size_t i = 0; i < flags.size(); i++) {
                        if (flags[i]) values[c][i].reset();
                    }
                    storeColumn(records, columns[c].second, interpolate(values[c], times));
                }
                break;
            }

            case OutlierAction::Clip:
                for (size_t c = 0; c < columns.size(); c++) {
                    // Clip to the range seen on non-outlier rows
                    bool haveRange = false;
                    OutlierBounds range;
                    for (size_t i = 0; i < flags.size(); i++) {
                        if (flags[i] || !values[c][i]) continue;
                        double v = *values[c][i];
                        range.lower = haveRange ? std::min(range.lower, v) : v;
                        range.upper = haveRange ? std::max(range.upper, v) : v;
                        haveRange = true;
                    }
                    if (!haveRange) continue;
                    for (size_t i = 0; i < flags.size(); i++) {
                        if (flags[i] && values[c][i]) {
                            values[c][i] = std::min(range.upper, std::max(range.lower, *values[c][i]));
                        }
                    }
                    storeColumn(records, columns[c].second, values[c]);
                }
                break;
        }
        stats.outliersCorrected += flagged;
        return;
    }

    std::vector<bool> removeRow(records.size(), false);
    std::vector<int64_t> times = timesOf(records);

    for (const auto& column : columns) {
        ValueColumn values = extractColumn(records, column.second);
        OutlierBounds bounds;
        if (!computeBounds(values, outlierMethod, outlierThreshold, iqrMultiplier, bounds)) continue;

        std::vector<bool> flags = flagOutside(values, bounds);
        int flagged = countFlags(flags);
        if (flagged == 0) continue;
        stats.outliersDetected += flagged;
        stats.outliersCorrected += flagged;

        switch (outlierAction) {
            case OutlierAction::Remove:
                for (size_t i = 0; i < flags.size(); i++) {
                    if (flags[i]) removeRow[i] = true;
                }
                break;

            case OutlierAction::Interpolate:
                for (size_t i = 0; i < flags.size(); i++) {
                    if (flags[i]) values[i].reset();
                }
                storeColumn(records, column.second, interpolate(values, times));
                break;

            case OutlierAction::Clip:
                for (size_t i = 0; i < flags.size(); i++) {
                    if (flags[i]) values[i] = std::min(bounds.upper, std::max(bounds.lower, *values[i]));
                }
                storeColumn(records, column.second, values);
                break;
        }
    }

    if (outlierAction == OutlierAction::Remove) {
        int removed = countFlags(removeRow);
        if (removed > 0) {
            records = dropRows(records, removeRow);
            stats.rowsRemoved += removed;
        }
    }
}

// ============================================================================
// Stage Functions
// ============================================================================

ObservationSeries TimeSeriesCleaner::sortAndDeduplicate(const ObservationSeries& records,
                                                        int& duplicatesDropped) {
    ObservationSeries sorted = records;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const ObservationRecord& a, const ObservationRecord& b) {
                         return a.timestamp < b.timestamp;
                     });

    ObservationSeries unique;
    unique.reserve(sorted.size());
    duplicatesDropped = 0;
    for (const auto& r : sorted) {
        if (!unique.empty() && unique.back().timestamp == r.timestamp) {
            duplicatesDropped++;
            continue;
        }
        unique.push_back(r);
    }
    return unique;
}

ValueColumn TimeSeriesCleaner::extractColumn(const ObservationSeries& records, RecordColumn column) {
    ValueColumn values;
    values.reserve(records.size());
    for (const auto& r : records) values.push_back(r.*column);
    return values;
}

void TimeSeriesCleaner::storeColumn(ObservationSeries& records, RecordColumn column,
                                    const ValueColumn& values) {
    for (size_t i = 0; i < records.size() && i < values.size(); i++) {
        records[i].*column = values[i];
    }
}

ValueColumn TimeSeriesCleaner::interpolate(const ValueColumn& values, const std::vector<int64_t>& timesMs) {
    ValueColumn out = values;

    std::vector<size_t> valid;
    for (size_t i = 0; i < values.size(); i++) {
        if (values[i]) valid.push_back(i);
    }
    if (valid.empty()) return out;

    // Edge gaps: backward fill, then forward fill
    for (size_t i = 0; i < valid.front(); i++) out[i] = values[valid.front()];
    for (size_t i = valid.back() + 1; i < values.size(); i++) out[i] = values[valid.back()];

    for (size_t k = 0; k + 1 < valid.size(); k++) {
        size_t a = valid[k];
        size_t b = valid[k + 1];
        if (b - a < 2) continue;

        double v1 = *values[a];
        double v2 = *values[b];
        double t1 = static_cast<double>(timesMs[a]);
        double t2 = static_cast<double>(timesMs[b]);
        for (size_t i = a + 1; i < b; i++) {
            if (t2 <= t1) {
                out[i] = v1;
            } else {
                double t = static_cast<double>(timesMs[i]);
                out[i] = v1 + (v2 - v1) * (t - t1) / (t2 - t1);
            }
        }
    }
    return out;
}

double TimeSeriesCleaner::quantile(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) return 0.0;
    double pos = q * static_cast<double>(sorted.size() - 1);
    size_t lo = static_cast<size_t>(std::floor(pos));
    size_t hi = std::min(lo + 1, sorted.size() - 1);
    double frac = pos - static_cast<double>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

bool TimeSeriesCleaner::computeBounds(const ValueColumn& values, OutlierMethod method,
                                      double threshold, double iqrMultiplier, OutlierBounds& bounds) {
    std::vector<double> data = presentValues(values);
    if (data.size() < 2) return false;

    if (method == OutlierMethod::ZScore) {
        cv::Scalar mean, stddev;
        cv::meanStdDev(data, mean, stddev);
        if (stddev[0] <= 0.0) return false;
        bounds.lower = mean[0] - threshold * stddev[0];
        bounds.upper = mean[0] + threshold * stddev[0];
        return true;
    }

    if (method == OutlierMethod::Iqr) {
        std::sort(data.begin(), data.end());
        double q1 = quantile(data, 0.25);
        double q3 = quantile(data, 0.75);
        double iqr = q3 - q1;
        bounds.lower = q1 - iqrMultiplier * iqr;
        bounds.upper = q3 + iqrMultiplier * iqr;
        return true;
    }

    return false;
}

std::vector<bool> TimeSeriesCleaner::flagOutside(const ValueColumn& values, const OutlierBounds& bounds) {
    std::vector<bool> flags(values.size(), false);
    for (size_t i = 0; i < values.size(); i++) {
        if (values[i] && (*values[i] < bounds.lower || *values[i] > bounds.upper)) {
            flags[i] = true;
        }
    }
    return flags;
}

std::vector<bool> TimeSeriesCleaner::detectDensityOutliers(const std::vector<ValueColumn>& columns,
                                                           double radius, int minNeighbors) {
    if (columns.empty()) return {};
    const size_t n = columns.front().size();
    std::vector<bool> flags(n, false);

    std::vector<size_t> complete;
    for (size_t i = 0; i < n; i++) {
        bool ok = true;
        for (const auto& col : columns) ok = ok && i < col.size() && col[i].has_value();
        if (ok) complete.push_back(i);
    }

    // Too few rows for any row to reach core density
    if (complete.size() < static_cast<size_t>(minNeighbors) + 1) return flags;

    const int rows = static_cast<int>(complete.size());
    const int dims = static_cast<int>(columns.size());
    cv::Mat points(rows, dims, CV_64F);
    for (int d = 0; d < dims; d++) {
        std::vector<double> data;
        for (size_t idx : complete) data.push_back(*columns[d][idx]);
        cv::Scalar mean, stddev;
        cv::meanStdDev(data, mean, stddev);
        for (int r = 0; r < rows; r++) {
            points.at<double>(r, d) = stddev[0] > 0.0 ? (data[r] - mean[0]) / stddev[0] : 0.0;
        }
    }

    std::vector<std::vector<int>> neighbors(rows);
    for (int a = 0; a < rows; a++) {
        for (int b = a + 1; b < rows; b++) {
            if (cv::norm(points.row(a), points.row(b), cv::NORM_L2) <= radius) {
                neighbors[a].push_back(b);
                neighbors[b].push_back(a);
            }
        }
    }

    std::vector<bool> core(rows, false);
    for (int r = 0; r < rows; r++) {
        core[r] = static_cast<int>(neighbors[r].size()) >= minNeighbors;
    }

    for (int r = 0; r < rows; r++) {
        if (core[r]) continue;
        bool reachable = false;
        for (int nb : neighbors[r]) reachable = reachable || core[nb];
        if (!reachable) flags[complete[r]] = true;
    }
    return flags;
}

ValueColumn TimeSeriesCleaner::smooth(const ValueColumn& values, int window) {
    if (window <= 1 || values.empty()) return values;

    const int n = static_cast<int>(values.size());
    const int half = window / 2;
    ValueColumn out(values.size());

    for (int i = 0; i < n; i++) {
        if (!values[i]) continue;
        double sum = 0.0;
        int count = 0;
        for (int j = std::max(0, i - half); j <= std::min(n - 1, i + half); j++) {
            if (values[j]) {
                sum += *values[j];
                count++;
            }
        }
        out[i] = sum / count;
    }
    return out;
}

// ============================================================================
// Normalization
// ============================================================================

ScalerParams TimeSeriesCleaner::fitScaler(const ValueColumn& values, ScalingMethod method) {
    ScalerParams params;
    params.method = method;

    std::vector<double> data = presentValues(values);
    if (data.empty() || method == ScalingMethod::None) return params;

    switch (method) {
        case ScalingMethod::MinMax: {
            auto mm = std::minmax_element(data.begin(), data.end());
            params.center = *mm.first;
            params.scale = *mm.second - *mm.first;
            break;
        }
        case ScalingMethod::Standard: {
            cv::Scalar mean, stddev;
            cv::meanStdDev(data, mean, stddev);
            params.center = mean[0];
            params.scale = stddev[0];
            break;
        }
        case ScalingMethod::Robust: {
            std::sort(data.begin(), data.end());
            params.center = quantile(data, 0.5);
            params.scale = quantile(data, 0.75) - quantile(data, 0.25);
            break;
        }
        case ScalingMethod::None:
            break;
    }

    // Constant columns map to 0
    if (params.scale <= 0.0) params.scale = 1.0;
    return params;
}

bool TimeSeriesCleaner::transform(const std::string& column, const ValueColumn& values, ValueColumn& out) const {
    auto it = scalers.find(column);
    if (it == scalers.end()) return false;

    const ScalerParams& p = it->second;
    out.assign(values.size(), std::nullopt);
    for (size_t i = 0; i < values.size(); i++) {
        if (values[i]) out[i] = (*values[i] - p.center) / p.scale;
    }
    return true;
}
