/**
 * @file application.hpp
 * @brief Batch driver for the insect activity analytics pipeline.
 *
 * Reads a raw detection log, filters every observation cycle into an
 * ObservationRecord, cleans each day's series and derives activity
 * metrics, then writes the observation, hourly and daily summary files.
 * Output files are written only after every day has been processed.
 */

#pragma once

#include <map>
#include <string>
#include <vector>

#include "activity_calculator.hpp"
#include "config.hpp"
#include "detection_filter.hpp"
#include "errors.hpp"
#include "record_io.hpp"
#include "timeseries_cleaner.hpp"

/**
 * @class Application
 * @brief Command-line controller: init() parses arguments and config, run() processes.
 */
class Application {
public:
    Application();

    bool init(int argc, char** argv);
    int run();

    const Diagnostics& getDiagnostics() const { return diagnostics; }
    const FilterStatistics& getFilterStatistics() const { return filterStats; }

private:
    /// Output of one local date, held until everything is computed
    struct DayOutput {
        std::string fileDate;           // YYYYMMDD
        ObservationSeries observations;
        DailySummary summary;
    };

    ObservationSeries buildObservations(const std::vector<DetectionCycle>& cycles);
    DayOutput analyzeDay(const std::string& dayKey, const ObservationSeries& observations);
    void writeOutputs(const std::vector<DayOutput>& days) const;
    void printSummary(const std::vector<DayOutput>& days) const;
    void reportDiagnostics() const;

    Config config;
    std::string inputPath;
    std::string outputDirectory;

    DetectionFilter detectionFilter;
    TimeSeriesCleaner cleaner;
    ActivityCalculator calculator;

    FilterStatistics filterStats;
    Diagnostics diagnostics;

    static constexpr int MAX_LISTED_DIAGNOSTICS = 20;
};
