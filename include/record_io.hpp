/**
 * @file record_io.hpp
 * @brief CSV persistence for detection logs, observation files and summaries.
 *
 * Every writer replaces its target atomically: the content goes to a
 * temporary file in the same directory which is then renamed into place.
 * I/O failures and unusable headers throw PersistenceError; malformed rows
 * are skipped and reported as diagnostics.
 */

#pragma once

#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "activity_calculator.hpp"
#include "errors.hpp"
#include "observation.hpp"

/**
 * @struct DetectionCycle
 * @brief One row of the raw detection log: all boxes of one inference call.
 */
struct DetectionCycle {
    Timestamp timestamp;
    int observationNumber = 0;
    std::vector<RawDetection> detections;
    std::optional<double> processingTimeMs;
};

namespace RecordFiles {
    constexpr const char* DAILY_SUMMARY = "daily_summary.csv";

    // Decimal places written per value kind
    constexpr int POSITION_PRECISION = 2;
    constexpr int CONFIDENCE_PRECISION = 4;
    constexpr int TIME_PRECISION = 1;
}

/// "detection_log_YYYYMMDD.csv"
std::string observationFileName(const std::string& compactDate);

/// "hourly_summary_YYYYMMDD.csv"
std::string hourlyFileName(const std::string& compactDate);

std::string joinPath(const std::string& directory, const std::string& fileName);

/// Create directory (and parents) if missing; throws PersistenceError on failure
void ensureDirectory(const std::string& directory);

/**
 * @class StagedWrites
 * @brief A batch of files that replace their targets together.
 *
 * stage() writes each file to "<path>.tmp"; commit() renames them all into
 * place. Temporaries left when the batch is destroyed without a commit
 * (or after a failed one) are removed, so a failed stage() leaves every
 * target untouched.
 */
class StagedWrites {
public:
    StagedWrites() = default;
    ~StagedWrites();

    StagedWrites(const StagedWrites&) = delete;
    StagedWrites& operator=(const StagedWrites&) = delete;

    /// Throws PersistenceError if the temporary cannot be written
    void stage(const std::string& path, const std::string& content);

    /// Throws PersistenceError if a rename fails
    void commit();

private:
    std::vector<std::string> paths;
};

/// Write content to path via temporary file + rename
void writeFileAtomically(const std::string& path, const std::string& content);

/// Split one CSV line; double-quoted fields may contain commas
std::vector<std::string> splitCsvLine(const std::string& line);

// ----------------------------------------------------------------------------
// Raw detection log
// ----------------------------------------------------------------------------

/**
 * @brief Read the raw detection log.
 *
 * Columns are matched by header name; unknown columns are ignored.
 * Rows with an unparsable timestamp, an unparsable number or per-detection
 * lists of different lengths are skipped with a diagnostic.
 * @throws PersistenceError if the file cannot be read or has no timestamp column
 */
std::vector<DetectionCycle> readDetectionLog(const std::string& path, Diagnostics& diagnostics);
std::vector<DetectionCycle> parseDetectionLog(std::istream& in, const std::string& source,
                                              Diagnostics& diagnostics);

// ----------------------------------------------------------------------------
// Observation file
// ----------------------------------------------------------------------------

/// Observation file text; empty measurement fields stand for "not observed"
std::string formatObservationCsv(const ObservationSeries& records);
void writeObservationFile(const std::string& path, const ObservationSeries& records);

ObservationSeries readObservationFile(const std::string& path, Diagnostics& diagnostics);
ObservationSeries parseObservationCsv(std::istream& in, const std::string& source,
                                      Diagnostics& diagnostics);

// ----------------------------------------------------------------------------
// Summaries
// ----------------------------------------------------------------------------

std::string formatHourlyCsv(const std::vector<HourlySummary>& hours);
void writeHourlyFile(const std::string& path, const std::vector<HourlySummary>& hours);

/// One daily_summary.csv row (no trailing newline)
std::string formatDailyRow(const DailySummary& summary);

/**
 * @brief Contents of the daily file at path with summaries inserted or replaced by date.
 *
 * Rows are sorted by date. The file itself is not modified.
 * @throws PersistenceError if an existing file has a different header
 */
std::string mergeDailySummaries(const std::string& path, const std::vector<DailySummary>& summaries);

/// mergeDailySummaries() written back atomically
void upsertDailySummaries(const std::string& path, const std::vector<DailySummary>& summaries);
