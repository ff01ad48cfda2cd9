#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "record_io.hpp"

namespace fs = std::filesystem;

namespace {

const char* RAW_HEADER =
    "timestamp,observation_number,detection_count,class_names,confidence_values,"
    "center_x,center_y,bbox_width,bbox_height,processing_time_ms\n";

/// Fresh scratch directory per test, removed on destruction
class ScratchDir {
public:
    explicit ScratchDir(const std::string& name)
        : path((fs::temp_directory_path() / ("insect_activity_" + name)).string()) {
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~ScratchDir() {
        std::error_code ignored;
        fs::remove_all(path, ignored);
    }

    std::string file(const std::string& name) const { return joinPath(path, name); }

    const std::string path;
};

std::string readAll(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    return out;
}

DailySummary daySummary(const std::string& date, int observations) {
    DailySummary summary;
    summary.date = date;
    summary.metrics.totalObservations = observations;
    return summary;
}

}  // namespace

TEST(RecordIO, FileNames) {
    EXPECT_EQ(observationFileName("20250728"), "detection_log_20250728.csv");
    EXPECT_EQ(hourlyFileName("20250728"), "hourly_summary_20250728.csv");
    EXPECT_EQ(joinPath("", "a.csv"), "a.csv");
}

TEST(RecordIO, SplitCsvLineHonoursQuotes) {
    std::vector<std::string> fields = splitCsvLine("a,\"b,c\",,\"say \"\"hi\"\"\"\r");
    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[0], "a");
    EXPECT_EQ(fields[1], "b,c");
    EXPECT_EQ(fields[2], "");
    EXPECT_EQ(fields[3], "say \"hi\"");
}

TEST(RecordIO, ParsesDetectionLogRows) {
    std::istringstream in(std::string(RAW_HEADER) +
        "2025-07-28T21:15:00+09:00,1,2,beetle;moth,0.91;0.55,100.5;900,200;400.25,40;30,50;20,812.3\n"
        "2025-07-28T21:16:00+09:00,2,0,,,,,,,790.0\n");
    Diagnostics diagnostics;

    std::vector<DetectionCycle> cycles = parseDetectionLog(in, "log.csv", diagnostics);

    EXPECT_TRUE(diagnostics.empty());
    ASSERT_EQ(cycles.size(), 2u);

    const DetectionCycle& first = cycles[0];
    EXPECT_EQ(first.observationNumber, 1);
    EXPECT_EQ(first.timestamp.offsetMinutes, 540);
    ASSERT_EQ(first.detections.size(), 2u);
    EXPECT_EQ(first.detections[0].className, "beetle");
    EXPECT_FLOAT_EQ(first.detections[0].confidence, 0.91f);
    EXPECT_FLOAT_EQ(first.detections[0].centerX, 100.5f);
    EXPECT_FLOAT_EQ(first.detections[1].centerY, 400.25f);
    EXPECT_FLOAT_EQ(first.detections[1].height, 20.0f);
    ASSERT_TRUE(first.processingTimeMs.has_value());
    EXPECT_DOUBLE_EQ(*first.processingTimeMs, 812.3);

    EXPECT_TRUE(cycles[1].detections.empty());
    EXPECT_EQ(cycles[1].observationNumber, 2);
}

TEST(RecordIO, MalformedLogRowsAreSkippedWithDiagnostics) {
    std::istringstream in(std::string(RAW_HEADER) +
        "not-a-time,1,1,beetle,0.9,100,100,40,40,10\n"
        "2025-07-28T10:01:00,2,2,beetle;moth,0.9;0.8,100,100;200,40;40,40;40,10\n"
        "2025-07-28T10:02:00,3,1,beetle,high,100,100,40,40,10\n"
        "2025-07-28T10:03:00,4,1,beetle,0.9,100,100,40,40,10\n");
    Diagnostics diagnostics;

    std::vector<DetectionCycle> cycles = parseDetectionLog(in, "log.csv", diagnostics);

    ASSERT_EQ(cycles.size(), 1u);
    EXPECT_EQ(cycles[0].observationNumber, 4);
    ASSERT_EQ(diagnostics.size(), 3u);
    EXPECT_EQ(diagnostics[0].source, "reader");
    EXPECT_EQ(diagnostics[0].index, 2);
    EXPECT_EQ(diagnostics[1].index, 3);
    EXPECT_EQ(diagnostics[2].index, 4);
}

TEST(RecordIO, MissingObservationNumberUsesRowPosition) {
    std::istringstream in("timestamp,confidence_values,center_x,center_y,bbox_width,bbox_height\n"
                          "2025-07-28T10:00:00,,,,,\n"
                          "2025-07-28T10:01:00,0.7,5,5,20,20\n");
    Diagnostics diagnostics;

    std::vector<DetectionCycle> cycles = parseDetectionLog(in, "log.csv", diagnostics);
    ASSERT_EQ(cycles.size(), 2u);
    EXPECT_EQ(cycles[0].observationNumber, 1);
    EXPECT_EQ(cycles[1].observationNumber, 2);
    EXPECT_TRUE(cycles[1].detections[0].className.empty());
}

TEST(RecordIO, UnusableLogThrows) {
    Diagnostics diagnostics;
    std::istringstream noTimestamp("observation_number,center_x\n1,2\n");
    EXPECT_THROW(parseDetectionLog(noTimestamp, "log.csv", diagnostics), PersistenceError);

    std::istringstream empty("");
    EXPECT_THROW(parseDetectionLog(empty, "log.csv", diagnostics), PersistenceError);

    try {
        readDetectionLog("/nonexistent/detection_log.csv", diagnostics);
        FAIL() << "expected PersistenceError";
    } catch (const PersistenceError& e) {
        EXPECT_EQ(e.path(), "/nonexistent/detection_log.csv");
    }
}

TEST(RecordIO, ObservationFileKeepsNullsDistinctFromZero) {
    ScratchDir dir("observation_roundtrip");

    ObservationRecord observed;
    observed.timestamp = makeTimestamp(2025, 7, 28, 21, 15, 0, 540, true);
    observed.observationNumber = 1;
    observed.detectionCount = 1;
    observed.hasDetection = true;
    observed.centerX = 0.0;
    observed.centerY = 12.346;
    observed.meanConfidence = 0.8;
    observed.processingTimeMs = 0.0;

    ObservationRecord empty;
    empty.timestamp = makeTimestamp(2025, 7, 28, 21, 16, 0, 540, true);
    empty.observationNumber = 2;

    std::string path = dir.file(observationFileName("20250728"));
    writeObservationFile(path, {observed, empty});
    EXPECT_FALSE(fs::exists(path + ".tmp"));

    Diagnostics diagnostics;
    ObservationSeries read = readObservationFile(path, diagnostics);

    EXPECT_TRUE(diagnostics.empty());
    ASSERT_EQ(read.size(), 2u);
    EXPECT_EQ(read[0].timestamp, observed.timestamp);
    EXPECT_EQ(read[0].timestamp.offsetMinutes, 540);
    EXPECT_TRUE(read[0].hasDetection);
    ASSERT_TRUE(read[0].centerX.has_value());
    EXPECT_DOUBLE_EQ(*read[0].centerX, 0.0);
    EXPECT_DOUBLE_EQ(*read[0].centerY, 12.35);
    ASSERT_TRUE(read[0].processingTimeMs.has_value());
    EXPECT_FALSE(read[0].bboxArea.has_value());

    EXPECT_FALSE(read[1].hasDetection);
    EXPECT_FALSE(read[1].centerX.has_value());
    EXPECT_FALSE(read[1].meanConfidence.has_value());
    EXPECT_FALSE(read[1].processingTimeMs.has_value());
}

TEST(RecordIO, ObservationRowFormatting) {
    ObservationRecord r;
    r.timestamp = makeTimestamp(2025, 7, 28, 9, 5, 0, 0, true);
    r.observationNumber = 3;
    r.detectionCount = 2;
    r.hasDetection = true;
    r.centerX = 100.0;
    r.centerY = 200.456;
    r.meanConfidence = 0.123456;

    std::vector<std::string> rows = lines(formatObservationCsv({r}));
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].substr(0, 10), "timestamp,");
    EXPECT_EQ(rows[1], "2025-07-28T09:05:00.000+00:00,3,2,true,100.00,200.46,0.1235,,,,,,");
}

TEST(RecordIO, ObservationReaderAcceptsNumericFlagsAndReportsBadRows) {
    std::istringstream in(
        "timestamp,observation_number,detection_count,has_detection,center_x,center_y\n"
        "2025-07-28T10:00:00,1,1,1,5,6\n"
        "2025-07-28T10:01:00,2,0,FALSE,,\n"
        "2025-07-28T10:02:00,3,1,maybe,5,6\n"
        "2025-07-28T10:03:00,4,1,true,abc,6\n");
    Diagnostics diagnostics;

    ObservationSeries records = parseObservationCsv(in, "obs.csv", diagnostics);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_TRUE(records[0].hasDetection);
    EXPECT_FALSE(records[1].hasDetection);
    EXPECT_FALSE(records[1].centerX.has_value());
    ASSERT_EQ(diagnostics.size(), 2u);
    EXPECT_EQ(diagnostics[0].index, 4);
    EXPECT_EQ(diagnostics[1].index, 5);
}

TEST(RecordIO, HourlyFileHas24Rows) {
    ActivityCalculator calculator;
    std::vector<HourlySummary> hours = calculator.hourlySummaries(ObservationSeries(), "2025-07-28");

    std::vector<std::string> rows = lines(formatHourlyCsv(hours));
    ASSERT_EQ(rows.size(), 25u);
    EXPECT_EQ(rows[0], "date,hour,observation_count,detection_count,movement_distance,mean_confidence,"
                       "completeness_ratio,activity_level");
    EXPECT_EQ(rows[1], "2025-07-28,0,0,0,0.00,,0.0000,none");
    EXPECT_EQ(rows[24], "2025-07-28,23,0,0,0.00,,0.0000,none");
}

TEST(RecordIO, DailySummaryUpsertReplacesAndSorts) {
    ScratchDir dir("daily_upsert");
    std::string path = dir.file(RecordFiles::DAILY_SUMMARY);

    upsertDailySummaries(path, {daySummary("2025-07-29", 10)});
    upsertDailySummaries(path, {daySummary("2025-07-27", 5)});
    upsertDailySummaries(path, {daySummary("2025-07-29", 42)});

    std::vector<std::string> rows = lines(readAll(path));
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[1].substr(0, 13), "2025-07-27,5,");
    EXPECT_EQ(rows[2].substr(0, 14), "2025-07-29,42,");
    EXPECT_FALSE(fs::exists(path + ".tmp"));
}

TEST(RecordIO, DailySummaryRowFormatting) {
    DailySummary summary = daySummary("2025-07-28", 1440);
    summary.metrics.totalDetections = 4;
    summary.metrics.totalMovementDistance = 50.0;
    summary.metrics.averageMovementPerDetection = 12.5;
    summary.metrics.peakActivityHour = 8;
    summary.metrics.activeDurationMinutes = 390.0;
    summary.metrics.detectionReliability = 0.75;
    summary.metrics.dataCompletenessRatio = 1.0;
    summary.metrics.activityScore = 0.25;
    summary.activeHours = 2;

    EXPECT_EQ(formatDailyRow(summary),
              "2025-07-28,1440,4,50.00,12.50,8,390.0,2,0.7500,1.0000,0.2500,"
              "insufficient_data,insufficient_data,insufficient_data,insufficient_data,0.0000");

    summary.metrics.movementPattern.mobility = MobilityLevel::Moderate;
    summary.metrics.movementPattern.consistency = MovementConsistency::Erratic;
    summary.metrics.movementPattern.continuity = ActivityContinuity::Intermittent;
    summary.metrics.movementPattern.diel = DielPattern::Nocturnal;
    summary.metrics.dataQuality = 0.8125;
    std::string row = formatDailyRow(summary);
    EXPECT_EQ(row.substr(row.find(",0.2500,") + 8), "moderate,erratic,intermittent,nocturnal,0.8125");
}

TEST(RecordIO, StagedWritesAppearOnlyOnCommit) {
    ScratchDir dir("staged_commit");
    std::string a = dir.file("a.csv");
    std::string b = dir.file("b.csv");
    {
        std::ofstream old(a);
        old << "old\n";
    }

    StagedWrites writes;
    writes.stage(a, "new a\n");
    writes.stage(b, "new b\n");
    EXPECT_EQ(readAll(a), "old\n");
    EXPECT_FALSE(fs::exists(b));

    writes.commit();
    EXPECT_EQ(readAll(a), "new a\n");
    EXPECT_EQ(readAll(b), "new b\n");
    EXPECT_FALSE(fs::exists(a + ".tmp"));
    EXPECT_FALSE(fs::exists(b + ".tmp"));
}

TEST(RecordIO, FailedStageDiscardsWholeBatch) {
    ScratchDir dir("staged_rollback");
    std::string a = dir.file("a.csv");
    {
        StagedWrites writes;
        writes.stage(a, "new a\n");
        EXPECT_THROW(writes.stage(dir.file("missing/b.csv"), "b\n"), PersistenceError);
    }
    EXPECT_FALSE(fs::exists(a));
    EXPECT_FALSE(fs::exists(a + ".tmp"));
}

TEST(RecordIO, MergeLeavesDailyFileUntouched) {
    ScratchDir dir("daily_merge");
    std::string path = dir.file(RecordFiles::DAILY_SUMMARY);
    upsertDailySummaries(path, {daySummary("2025-07-27", 5)});
    std::string before = readAll(path);

    std::string merged = mergeDailySummaries(path, {daySummary("2025-07-28", 9)});
    EXPECT_EQ(lines(merged).size(), 3u);
    EXPECT_EQ(readAll(path), before);
}

TEST(RecordIO, ForeignDailySummaryIsNotOverwritten) {
    ScratchDir dir("daily_foreign");
    std::string path = dir.file(RecordFiles::DAILY_SUMMARY);
    {
        std::ofstream out(path);
        out << "day,count\n2025-07-28,3\n";
    }

    EXPECT_THROW(upsertDailySummaries(path, {daySummary("2025-07-28", 1)}), PersistenceError);
    EXPECT_EQ(readAll(path), "day,count\n2025-07-28,3\n");
}

TEST(RecordIO, WritingIntoMissingDirectoryThrows) {
    EXPECT_THROW(writeObservationFile("/nonexistent_dir/insect/detection_log_20250728.csv", {}),
                 PersistenceError);
}
