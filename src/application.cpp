/**
 * @file application.cpp
 * @brief Implementation of the batch Application driver.
 *
 * Handles argument parsing, config loading, the filter / clean / analyze
 * pipeline per local date, and writing the result files.
 */

#include "application.hpp"
#include <iomanip>
#include <iostream>

// ============================================================================
// Constructor
// ============================================================================

Application::Application() = default;

// ============================================================================
// Initialization
// ============================================================================

/**
 * @brief Initialize the application.
 * @param argc Command line argument count
 * @param argv Command line arguments: <raw_log.csv> [output_dir] [config_file]
 * @return true if initialization successful, false otherwise
 */
bool Application::init(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <raw_log.csv> [output_dir] [config_file]" << std::endl;
        std::cerr << "  raw_log.csv: detection log with one row per observation cycle" << std::endl;
        std::cerr << "  output_dir:  overrides observation.output_dir from the config" << std::endl;
        return false;
    }
    inputPath = argv[1];

    try {
        if (argc > 3) {
            // Explicit config file must exist
            if (!config.loadFromFile(argv[3])) {
                std::cerr << "Error: Cannot load config file: " << argv[3] << std::endl;
                return false;
            }
        } else {
            // Look for config in common locations
            std::vector<std::string> configPaths = {
                "config/insect_activity.yaml",
                "../config/insect_activity.yaml",
                "insect_activity.yaml"
            };

            for (const auto& path : configPaths) {
                if (config.loadFromFile(path)) {
                    break;
                }
            }
        }
        config.validate();
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return false;
    }

    outputDirectory = config.outputDirectory;
    if (argc > 2) {
        outputDirectory = argv[2];
    }

    // Print loaded config
    config.print();

    detectionFilter.configure(config);
    cleaner.configure(config);
    calculator.configure(config);

    return true;
}

// ============================================================================
// Pipeline
// ============================================================================

int Application::run() {
    filterStats.reset();
    diagnostics.clear();
    std::vector<DayOutput> days;

    try {
        std::vector<DetectionCycle> cycles = readDetectionLog(inputPath, diagnostics);
        std::cout << "Read " << cycles.size() << " observation cycles from " << inputPath << std::endl;

        ObservationSeries observations = buildObservations(cycles);

        // Group by local date; the map keeps dates in order
        std::map<std::string, ObservationSeries> byDate;
        for (const auto& record : observations) {
            byDate[compactDate(record.timestamp)].push_back(record);
        }

        for (const auto& day : byDate) {
            days.push_back(analyzeDay(day.first, day.second));
        }

        writeOutputs(days);
    } catch (const PersistenceError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        reportDiagnostics();
        return 1;
    }

    printSummary(days);
    reportDiagnostics();
    return 0;
}

ObservationSeries Application::buildObservations(const std::vector<DetectionCycle>& cycles) {
    ObservationSeries observations;
    observations.reserve(cycles.size());

    for (const auto& cycle : cycles) {
        observations.push_back(detectionFilter.processCycle(cycle.detections, cycle.timestamp,
                                                            cycle.observationNumber,
                                                            cycle.processingTimeMs,
                                                            filterStats, diagnostics));
    }

    std::cout << "Filtered " << filterStats.detectionsProcessed << " detections: "
              << filterStats.detectionsKept << " kept, "
              << filterStats.invalidRejected << " invalid, "
              << filterStats.confidenceFiltered << " low confidence, "
              << filterStats.sizeFiltered << " bad size, "
              << filterStats.classFiltered << " class, "
              << filterStats.duplicateFiltered << " duplicate" << std::endl;
    return observations;
}

Application::DayOutput Application::analyzeDay(const std::string& dayKey,
                                               const ObservationSeries& observations) {
    DayOutput day;
    day.fileDate = dayKey;
    day.observations = observations;

    CleanResult cleaned = cleaner.clean(observations);
    diagnostics.insert(diagnostics.end(), cleaned.warnings.begin(), cleaned.warnings.end());

    std::cout << "Cleaned " << dayKey << ": " << cleaned.stats.recordsIn << " -> "
              << cleaned.stats.recordsOut << " records, "
              << cleaned.stats.missingFilled << " filled, "
              << cleaned.stats.outliersDetected << " outliers" << std::endl;

    std::vector<DailySummary> summaries = calculator.dailySummaries(cleaned.records);
    if (summaries.empty()) {
        // Every row removed by outlier handling: keep the day with zero metrics
        day.summary.date = localDate(observations.front().timestamp);
        day.summary.hours = calculator.hourlySummaries(ObservationSeries(), day.summary.date);
    } else {
        day.summary = summaries.front();
    }
    return day;
}

void Application::writeOutputs(const std::vector<DayOutput>& days) const {
    if (days.empty()) return;
    ensureDirectory(outputDirectory);

    std::vector<DailySummary> summaries;
    for (const auto& day : days) summaries.push_back(day.summary);

    // Merge first: a foreign daily file aborts before anything is written
    const std::string dailyPath = joinPath(outputDirectory, RecordFiles::DAILY_SUMMARY);
    std::string dailyContent = mergeDailySummaries(dailyPath, summaries);

    StagedWrites writes;
    for (const auto& day : days) {
        writes.stage(joinPath(outputDirectory, observationFileName(day.fileDate)),
                     formatObservationCsv(day.observations));
        writes.stage(joinPath(outputDirectory, hourlyFileName(day.fileDate)),
                     formatHourlyCsv(day.summary.hours));
    }
    writes.stage(dailyPath, dailyContent);
    writes.commit();
}

// ============================================================================
// Reporting
// ============================================================================

void Application::printSummary(const std::vector<DayOutput>& days) const {
    std::cout << "=== Activity Summary ===" << std::endl;
    for (const auto& day : days) {
        const ActivityMetrics& m = day.summary.metrics;
        std::cout << day.summary.date << ": "
                  << m.totalDetections << "/" << m.totalObservations << " detections, "
                  << std::fixed << std::setprecision(1)
                  << m.totalMovementDistance << " px moved, peak "
                  << std::setw(2) << std::setfill('0') << m.peakActivityHour << std::setfill(' ')
                  << ":00, " << day.summary.activeHours << " active hours, score "
                  << std::setprecision(3) << m.activityScore
                  << ", quality " << m.dataQuality << std::endl;
        std::cout << "  movement: " << toString(m.movementPattern.mobility) << " mobility, "
                  << toString(m.movementPattern.consistency) << ", "
                  << toString(m.movementPattern.continuity) << ", "
                  << toString(m.movementPattern.diel) << std::endl;
    }
    std::cout << "Output written to: " << outputDirectory << std::endl;
}

void Application::reportDiagnostics() const {
    if (diagnostics.empty()) return;

    std::cerr << "Warning: " << diagnostics.size() << " item(s) skipped or adjusted" << std::endl;
    int listed = 0;
    for (const auto& issue : diagnostics) {
        if (listed++ >= MAX_LISTED_DIAGNOSTICS) {
            std::cerr << "  ..." << std::endl;
            break;
        }
        std::cerr << "  [" << issue.source << " #" << issue.index << "] " << issue.message << std::endl;
    }
}
