/**
 * @file record_io.cpp
 * @brief CSV reading and writing of records and summaries.
 */

#include "record_io.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <map>
#include <sstream>

namespace fs = std::filesystem;

namespace {

const char* OBSERVATION_HEADER =
    "timestamp,observation_number,detection_count,has_detection,center_x,center_y,"
    "mean_confidence,max_confidence,bbox_width,bbox_height,bbox_area,quality_score,processing_time_ms";

const char* HOURLY_HEADER =
    "date,hour,observation_count,detection_count,movement_distance,mean_confidence,"
    "completeness_ratio,activity_level";

const char* DAILY_HEADER =
    "date,total_observations,total_detections,total_movement_distance,"
    "average_movement_per_detection,peak_activity_hour,active_duration_minutes,active_hours,"
    "detection_reliability,data_completeness_ratio,activity_score,mobility,movement_consistency,"
    "activity_continuity,diel_pattern,data_quality";

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

bool parseDouble(const std::string& text, double& value) {
    std::string t = trim(text);
    if (t.empty()) return false;
    errno = 0;
    char* end = nullptr;
    value = std::strtod(t.c_str(), &end);
    return errno == 0 && end == t.c_str() + t.size();
}

bool parseInt(const std::string& text, int& value) {
    std::string t = trim(text);
    if (t.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(t.c_str(), &end, 10);
    if (errno != 0 || end != t.c_str() + t.size()) return false;
    value = static_cast<int>(v);
    return true;
}

bool parseBool(const std::string& text, bool& value) {
    std::string t = trim(text);
    std::transform(t.begin(), t.end(), t.begin(), [](unsigned char c) { return std::tolower(c); });
    if (t == "true" || t == "1") { value = true; return true; }
    if (t == "false" || t == "0") { value = false; return true; }
    return false;
}

/// Empty field = null; anything else must be a number
bool parseOptional(const std::string& text, std::optional<double>& value) {
    if (trim(text).empty()) {
        value.reset();
        return true;
    }
    double v = 0.0;
    if (!parseDouble(text, v)) return false;
    value = v;
    return true;
}

std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> items;
    std::string t = trim(text);
    if (t.empty()) return items;
    std::istringstream ss(t);
    std::string item;
    while (std::getline(ss, item, ';')) items.push_back(trim(item));
    if (t.back() == ';') items.push_back("");
    return items;
}

std::string formatFixed(double value, int precision) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision) << value;
    return out.str();
}

std::string formatOptional(const std::optional<double>& value, int precision) {
    return value ? formatFixed(*value, precision) : std::string();
}

/// Header name -> column index
std::map<std::string, size_t> indexHeader(const std::string& line) {
    std::map<std::string, size_t> columns;
    std::vector<std::string> names = splitCsvLine(line);
    for (size_t i = 0; i < names.size(); i++) {
        std::string name = trim(names[i]);
        // Strip a UTF-8 byte order mark on the first column
        if (i == 0 && name.size() >= 3 && name.compare(0, 3, "\xEF\xBB\xBF") == 0) name = name.substr(3);
        columns.emplace(name, i);
    }
    return columns;
}

/// Field by header name; empty if the column or the field is missing
std::string field(const std::vector<std::string>& row, const std::map<std::string, size_t>& columns,
                  const std::string& name) {
    auto it = columns.find(name);
    if (it == columns.end() || it->second >= row.size()) return "";
    return row[it->second];
}

std::ifstream openForRead(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw PersistenceError(path, "cannot open for reading");
    }
    return file;
}

}  // namespace

// ============================================================================
// Paths / Files
// ============================================================================

std::string observationFileName(const std::string& compactDate) {
    return "detection_log_" + compactDate + ".csv";
}

std::string hourlyFileName(const std::string& compactDate) {
    return "hourly_summary_" + compactDate + ".csv";
}

std::string joinPath(const std::string& directory, const std::string& fileName) {
    if (directory.empty()) return fileName;
    return (fs::path(directory) / fileName).string();
}

void ensureDirectory(const std::string& directory) {
    if (directory.empty()) return;
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw PersistenceError(directory, "cannot create directory: " + ec.message());
    }
}

StagedWrites::~StagedWrites() {
    // Temporaries of a batch that never committed
    for (const auto& path : paths) {
        std::error_code ignored;
        fs::remove(path + ".tmp", ignored);
    }
}

void StagedWrites::stage(const std::string& path, const std::string& content) {
    const std::string tmpPath = path + ".tmp";
    paths.push_back(path);

    std::ofstream out(tmpPath, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        throw PersistenceError(path, "cannot open for writing");
    }
    out << content;
    out.flush();
    if (!out) {
        throw PersistenceError(path, "write failed");
    }
}

void StagedWrites::commit() {
    for (const auto& path : paths) {
        std::error_code ec;
        fs::rename(path + ".tmp", path, ec);
        if (ec) {
            throw PersistenceError(path, "cannot replace file: " + ec.message());
        }
    }
    paths.clear();
}

void writeFileAtomically(const std::string& path, const std::string& content) {
    StagedWrites writes;
    writes.stage(path, content);
    writes.commit();
}

std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); i++) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                current += '"';
                i++;
            } else if (c == '"') {
                quoted = false;
            } else {
                current += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(current);
            current.clear();
        } else if (c != '\r' && c != '\n') {
            current += c;
        }
    }
    fields.push_back(current);
    return fields;
}

// ============================================================================
// Raw Detection Log
// ============================================================================

std::vector<DetectionCycle> readDetectionLog(const std::string& path, Diagnostics& diagnostics) {
    std::ifstream file = openForRead(path);
    return parseDetectionLog(file, path, diagnostics);
}

std::vector<DetectionCycle> parseDetectionLog(std::istream& in, const std::string& source,
                                              Diagnostics& diagnostics) {
    std::vector<DetectionCycle> cycles;

    std::string line;
    if (!std::getline(in, line)) {
        throw PersistenceError(source, "empty detection log");
    }
    std::map<std::string, size_t> columns = indexHeader(line);
    if (!columns.count("timestamp")) {
        throw PersistenceError(source, "detection log has no timestamp column");
    }

    int lineNumber = 1;
    while (std::getline(in, line)) {
        lineNumber++;
        if (trim(line).empty()) continue;

        std::vector<std::string> row = splitCsvLine(line);
        auto reject = [&](const std::string& reason) {
            diagnostics.push_back({"reader", lineNumber, source + ": " + reason});
        };

        DetectionCycle cycle;
        if (!parseTimestamp(trim(field(row, columns, "timestamp")), cycle.timestamp)) {
            reject("unparsable timestamp '" + field(row, columns, "timestamp") + "'");
            continue;
        }

        std::string number = field(row, columns, "observation_number");
        if (trim(number).empty()) {
            cycle.observationNumber = static_cast<int>(cycles.size()) + 1;
        } else if (!parseInt(number, cycle.observationNumber)) {
            reject("unparsable observation number '" + number + "'");
            continue;
        }

        if (!parseOptional(field(row, columns, "processing_time_ms"), cycle.processingTimeMs)) {
            reject("unparsable processing time");
            continue;
        }

        std::vector<std::string> confidences = splitList(field(row, columns, "confidence_values"));
        std::vector<std::string> xs = splitList(field(row, columns, "center_x"));
        std::vector<std::string> ys = splitList(field(row, columns, "center_y"));
        std::vector<std::string> widths = splitList(field(row, columns, "bbox_width"));
        std::vector<std::string> heights = splitList(field(row, columns, "bbox_height"));
        std::vector<std::string> classes = splitList(field(row, columns, "class_names"));

        const size_t n = confidences.size();
        if (xs.size() != n || ys.size() != n || widths.size() != n || heights.size() != n ||
            (!classes.empty() && classes.size() != n)) {
            reject("per-detection lists have different lengths");
            continue;
        }

        bool ok = true;
        for (size_t i = 0; i < n && ok; i++) {
            RawDetection det;
            double conf = 0.0, x = 0.0, y = 0.0, w = 0.0, h = 0.0;
            ok = parseDouble(confidences[i], conf) && parseDouble(xs[i], x) && parseDouble(ys[i], y) &&
                 parseDouble(widths[i], w) && parseDouble(heights[i], h);
            if (!ok) break;
            det.confidence = static_cast<float>(conf);
            det.centerX = static_cast<float>(x);
            det.centerY = static_cast<float>(y);
            det.width = static_cast<float>(w);
            det.height = static_cast<float>(h);
            det.className = classes.empty() ? std::string() : classes[i];
            det.timestamp = cycle.timestamp;
            cycle.detections.push_back(det);
        }
        if (!ok) {
            reject("unparsable detection value");
            continue;
        }

        cycles.push_back(cycle);
    }
    return cycles;
}

// ============================================================================
// Observation File
// ============================================================================

std::string formatObservationCsv(const ObservationSeries& records) {
    using namespace RecordFiles;
    std::ostringstream out;
    out << OBSERVATION_HEADER << "\n";
    for (const auto& r : records) {
        out << formatTimestamp(r.timestamp) << ","
            << r.observationNumber << ","
            << r.detectionCount << ","
            << (r.hasDetection ? "true" : "false") << ","
            << formatOptional(r.centerX, POSITION_PRECISION) << ","
            << formatOptional(r.centerY, POSITION_PRECISION) << ","
            << formatOptional(r.meanConfidence, CONFIDENCE_PRECISION) << ","
            << formatOptional(r.maxConfidence, CONFIDENCE_PRECISION) << ","
            << formatOptional(r.bboxWidth, POSITION_PRECISION) << ","
            << formatOptional(r.bboxHeight, POSITION_PRECISION) << ","
            << formatOptional(r.bboxArea, POSITION_PRECISION) << ","
            << formatOptional(r.qualityScore, CONFIDENCE_PRECISION) << ","
            << formatOptional(r.processingTimeMs, TIME_PRECISION) << "\n";
    }
    return out.str();
}

void writeObservationFile(const std::string& path, const ObservationSeries& records) {
    writeFileAtomically(path, formatObservationCsv(records));
}

ObservationSeries readObservationFile(const std::string& path, Diagnostics& diagnostics) {
    std::ifstream file = openForRead(path);
    return parseObservationCsv(file, path, diagnostics);
}

ObservationSeries parseObservationCsv(std::istream& in, const std::string& source,
                                      Diagnostics& diagnostics) {
    ObservationSeries records;

    std::string line;
    if (!std::getline(in, line)) {
        throw PersistenceError(source, "empty observation file");
    }
    std::map<std::string, size_t> columns = indexHeader(line);
    if (!columns.count("timestamp")) {
        throw PersistenceError(source, "observation file has no timestamp column");
    }

    int lineNumber = 1;
    while (std::getline(in, line)) {
        lineNumber++;
        if (trim(line).empty()) continue;

        std::vector<std::string> row = splitCsvLine(line);
        ObservationRecord record;
        std::string problem;

        if (!parseTimestamp(trim(field(row, columns, "timestamp")), record.timestamp)) {
            problem = "unparsable timestamp";
        } else if (!parseInt(field(row, columns, "observation_number"), record.observationNumber)) {
            problem = "unparsable observation number";
        } else if (!parseInt(field(row, columns, "detection_count"), record.detectionCount)) {
            problem = "unparsable detection count";
        } else if (!parseBool(field(row, columns, "has_detection"), record.hasDetection)) {
            problem = "unparsable has_detection flag";
        } else {
            for (const auto& name : cleanableColumns()) {
                if (!parseOptional(field(row, columns, name), record.*findColumn(name))) {
                    problem = "unparsable value in column " + name;
                    break;
                }
            }
        }

        if (!problem.empty()) {
            diagnostics.push_back({"reader", lineNumber, source + ": " + problem});
            continue;
        }
        records.push_back(record);
    }
    return records;
}

// ============================================================================
// Summaries
// ============================================================================

std::string formatHourlyCsv(const std::vector<HourlySummary>& hours) {
    using namespace RecordFiles;
    std::ostringstream out;
    out << HOURLY_HEADER << "\n";
    for (const auto& h : hours) {
        out << h.date << ","
            << h.hour << ","
            << h.observationCount << ","
            << h.detectionCount << ","
            << formatFixed(h.movementDistance, POSITION_PRECISION) << ","
            << formatOptional(h.meanConfidence, CONFIDENCE_PRECISION) << ","
            << formatFixed(h.completenessRatio, CONFIDENCE_PRECISION) << ","
            << toString(h.activityLevel) << "\n";
    }
    return out.str();
}

void writeHourlyFile(const std::string& path, const std::vector<HourlySummary>& hours) {
    writeFileAtomically(path, formatHourlyCsv(hours));
}

std::string formatDailyRow(const DailySummary& summary) {
    using namespace RecordFiles;
    const ActivityMetrics& m = summary.metrics;
    std::ostringstream out;
    out << summary.date << ","
        << m.totalObservations << ","
        << m.totalDetections << ","
        << formatFixed(m.totalMovementDistance, POSITION_PRECISION) << ","
        << formatFixed(m.averageMovementPerDetection, POSITION_PRECISION) << ","
        << m.peakActivityHour << ","
        << formatFixed(m.activeDurationMinutes, TIME_PRECISION) << ","
        << summary.activeHours << ","
        << formatFixed(m.detectionReliability, CONFIDENCE_PRECISION) << ","
        << formatFixed(m.dataCompletenessRatio, CONFIDENCE_PRECISION) << ","
        << formatFixed(m.activityScore, CONFIDENCE_PRECISION) << ","
        << toString(m.movementPattern.mobility) << ","
        << toString(m.movementPattern.consistency) << ","
        << toString(m.movementPattern.continuity) << ","
        << toString(m.movementPattern.diel) << ","
        << formatFixed(m.dataQuality, CONFIDENCE_PRECISION);
    return out.str();
}

std::string mergeDailySummaries(const std::string& path, const std::vector<DailySummary>& summaries) {
    std::map<std::string, std::string> rows;   // date -> row text, sorted by date

    std::error_code ec;
    if (fs::exists(path, ec)) {
        std::ifstream file = openForRead(path);
        std::string line;
        if (std::getline(file, line) && trim(line) != DAILY_HEADER) {
            throw PersistenceError(path, "unexpected daily summary header");
        }
        while (std::getline(file, line)) {
            std::string row = trim(line);
            if (row.empty()) continue;
            std::string date = row.substr(0, row.find(','));
            rows[date] = row;
        }
    }

    for (const auto& summary : summaries) {
        rows[summary.date] = formatDailyRow(summary);
    }

    std::ostringstream out;
    out << DAILY_HEADER << "\n";
    for (const auto& entry : rows) out << entry.second << "\n";
    return out.str();
}

void upsertDailySummaries(const std::string& path, const std::vector<DailySummary>& summaries) {
    writeFileAtomically(path, mergeDailySummaries(path, summaries));
}
