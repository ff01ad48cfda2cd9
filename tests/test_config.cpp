#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <limits>

#include "config.hpp"

namespace {

std::string writeTempYaml(const std::string& name, const std::string& body) {
    std::string path = (std::filesystem::temp_directory_path() / name).string();
    std::ofstream out(path);
    out << "%YAML:1.0\n---\n" << body;
    return path;
}

}  // namespace

TEST(Config, DefaultsAreValid) {
    Config config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_FLOAT_EQ(config.confidenceThreshold, 0.5f);
    EXPECT_FLOAT_EQ(config.duplicateIoU, 0.7f);
    EXPECT_EQ(config.outlierMethod, OutlierMethod::ZScore);
    EXPECT_EQ(config.outlierAction, OutlierAction::Interpolate);
    EXPECT_EQ(config.normalization, ScalingMethod::None);
}

TEST(Config, DefaultSpeedCeilingIsHalfFrameDiagonal) {
    Config config;
    EXPECT_NEAR(config.speedCeiling(), 1101.45, 0.01);

    config.maxMovementSpeed = 250.0;
    EXPECT_DOUBLE_EQ(config.speedCeiling(), 250.0);
}

TEST(Config, RejectsInvalidValues) {
    Config config;
    config.confidenceThreshold = 1.5f;
    EXPECT_THROW(config.validate(), ConfigurationError);

    config = Config();
    config.smoothingWindow = 4;
    EXPECT_THROW(config.validate(), ConfigurationError);

    config = Config();
    config.minBoxWidth = 600.0f;
    EXPECT_THROW(config.validate(), ConfigurationError);

    config = Config();
    config.observationIntervalMinutes = 0.0;
    EXPECT_THROW(config.validate(), ConfigurationError);

    config = Config();
    config.movementSmoothingWindow = 0;
    EXPECT_THROW(config.validate(), ConfigurationError);
}

TEST(Config, ParsesStrategyNames) {
    EXPECT_EQ(parseOutlierMethod("density"), OutlierMethod::Density);
    EXPECT_EQ(parseOutlierAction("clip"), OutlierAction::Clip);
    EXPECT_EQ(parseScalingMethod("robust"), ScalingMethod::Robust);
    EXPECT_EQ(parsePositionMode("best"), PositionMode::BestConfidence);
    EXPECT_THROW(parseOutlierMethod("isolation"), ConfigurationError);
    EXPECT_THROW(parseScalingMethod("log"), ConfigurationError);
}

TEST(Config, RejectsNaN) {
    const double nan = std::numeric_limits<double>::quiet_NaN();

    Config config;
    config.outlierThreshold = nan;
    EXPECT_THROW(config.validate(), ConfigurationError);

    config = Config();
    config.iqrMultiplier = nan;
    EXPECT_THROW(config.validate(), ConfigurationError);

    config = Config();
    config.densityRadius = nan;
    EXPECT_THROW(config.validate(), ConfigurationError);

    config = Config();
    config.minMovementDistance = nan;
    EXPECT_THROW(config.validate(), ConfigurationError);

    config = Config();
    config.movementOutlierThreshold = nan;
    EXPECT_THROW(config.validate(), ConfigurationError);

    config = Config();
    config.maxMovementSpeed = nan;
    EXPECT_THROW(config.validate(), ConfigurationError);

    config = Config();
    config.minBoxWidth = std::numeric_limits<float>::quiet_NaN();
    EXPECT_THROW(config.validate(), ConfigurationError);
}

TEST(Config, LoadRejectsNaNThreshold) {
    std::string path = writeTempYaml("insect_activity_config_nan.yaml",
        "cleaning:\n"
        "  outlier_threshold: .nan\n");

    Config config;
    EXPECT_THROW(config.loadFromFile(path), ConfigurationError);
    std::remove(path.c_str());
}

TEST(Config, LoadsYamlSections) {
    std::string path = writeTempYaml("insect_activity_config_ok.yaml",
        "detection:\n"
        "  confidence: 0.4\n"
        "  position_mode: \"best\"\n"
        "classes:\n"
        "  blocked: [\"spider\"]\n"
        "cleaning:\n"
        "  outlier_method: \"iqr\"\n"
        "  smoothing_window: 7\n"
        "  columns: [\"center_x\"]\n"
        "movement:\n"
        "  min_distance: 5.0\n"
        "observation:\n"
        "  interval_minutes: 2.0\n");

    Config config;
    ASSERT_TRUE(config.loadFromFile(path));
    EXPECT_FLOAT_EQ(config.confidenceThreshold, 0.4f);
    EXPECT_EQ(config.positionMode, PositionMode::BestConfidence);
    EXPECT_EQ(config.blockedClasses.count("spider"), 1u);
    EXPECT_EQ(config.outlierMethod, OutlierMethod::Iqr);
    EXPECT_EQ(config.smoothingWindow, 7);
    ASSERT_EQ(config.cleanColumns.size(), 1u);
    EXPECT_EQ(config.cleanColumns[0], "center_x");
    EXPECT_DOUBLE_EQ(config.minMovementDistance, 5.0);
    EXPECT_DOUBLE_EQ(config.observationIntervalMinutes, 2.0);
    // Untouched values keep their defaults
    EXPECT_FLOAT_EQ(config.duplicateIoU, 0.7f);

    std::remove(path.c_str());
}

TEST(Config, LoadRejectsUnknownStrategy) {
    std::string path = writeTempYaml("insect_activity_config_bad.yaml",
        "cleaning:\n"
        "  outlier_method: \"magic\"\n");

    Config config;
    EXPECT_THROW(config.loadFromFile(path), ConfigurationError);
    std::remove(path.c_str());
}

TEST(Config, LoadRejectsEvenWindow) {
    std::string path = writeTempYaml("insect_activity_config_window.yaml",
        "movement:\n"
        "  smoothing_window: 4\n");

    Config config;
    EXPECT_THROW(config.loadFromFile(path), ConfigurationError);
    std::remove(path.c_str());
}

TEST(Config, MissingFileIsNotAnError) {
    Config config;
    EXPECT_FALSE(config.loadFromFile("/nonexistent/insect_activity.yaml"));
    EXPECT_NO_THROW(config.validate());
}
