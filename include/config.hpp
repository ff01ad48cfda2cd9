/**
 * @file config.hpp
 * @brief Centralized configuration for all tunable parameters.
 *
 * Provides default values and runtime configuration for detection
 * filtering, time-series cleaning, movement analysis and the observation
 * cadence. Can load settings from a YAML config file; invalid values are
 * rejected at load time with ConfigurationError.
 */

#pragma once

#include <cmath>
#include <string>
#include <vector>
#include <set>
#include <opencv2/core.hpp>
#include <iostream>

#include "errors.hpp"

/// Outlier detection strategy (exactly one per run)
enum class OutlierMethod { ZScore, Iqr, Density };

/// What happens to a value flagged as an outlier
enum class OutlierAction { Remove, Interpolate, Clip };

/// Optional feature scaling applied after cleaning
enum class ScalingMethod { None, MinMax, Standard, Robust };

/// How one record position is derived from several surviving detections
enum class PositionMode { Mean, BestConfidence };

inline const char* toString(OutlierMethod m) {
    switch (m) {
        case OutlierMethod::ZScore: return "zscore";
        case OutlierMethod::Iqr: return "iqr";
        case OutlierMethod::Density: return "density";
    }
    return "unknown";
}

inline const char* toString(OutlierAction a) {
    switch (a) {
        case OutlierAction::Remove: return "remove";
        case OutlierAction::Interpolate: return "interpolate";
        case OutlierAction::Clip: return "clip";
    }
    return "unknown";
}

inline const char* toString(ScalingMethod s) {
    switch (s) {
        case ScalingMethod::None: return "none";
        case ScalingMethod::MinMax: return "minmax";
        case ScalingMethod::Standard: return "standard";
        case ScalingMethod::Robust: return "robust";
    }
    return "unknown";
}

inline const char* toString(PositionMode p) {
    return p == PositionMode::Mean ? "mean" : "best";
}

inline OutlierMethod parseOutlierMethod(const std::string& name) {
    if (name == "zscore") return OutlierMethod::ZScore;
    if (name == "iqr") return OutlierMethod::Iqr;
    if (name == "density") return OutlierMethod::Density;
    throw ConfigurationError("unknown outlier method '" + name + "' (zscore|iqr|density)");
}

inline OutlierAction parseOutlierAction(const std::string& name) {
    if (name == "remove") return OutlierAction::Remove;
    if (name == "interpolate") return OutlierAction::Interpolate;
    if (name == "clip") return OutlierAction::Clip;
    throw ConfigurationError("unknown outlier action '" + name + "' (remove|interpolate|clip)");
}

inline ScalingMethod parseScalingMethod(const std::string& name) {
    if (name == "none" || name.empty()) return ScalingMethod::None;
    if (name == "minmax") return ScalingMethod::MinMax;
    if (name == "standard") return ScalingMethod::Standard;
    if (name == "robust") return ScalingMethod::Robust;
    throw ConfigurationError("unknown normalization '" + name + "' (none|minmax|standard|robust)");
}

inline PositionMode parsePositionMode(const std::string& name) {
    if (name == "mean") return PositionMode::Mean;
    if (name == "best") return PositionMode::BestConfidence;
    throw ConfigurationError("unknown position mode '" + name + "' (mean|best)");
}

/**
 * @struct Config
 * @brief Centralized configuration for all tunable parameters.
 */
struct Config {
    // Detection filter settings
    float confidenceThreshold = 0.5f;   // Inclusive lower bound
    float minBoxWidth = 10.0f;          // Pixels
    float minBoxHeight = 10.0f;
    float maxBoxWidth = 500.0f;
    float maxBoxHeight = 500.0f;
    float duplicateIoU = 0.7f;          // IoU above which two boxes are the same object
    bool enableConfidenceFilter = true;
    bool enableSizeFilter = true;
    bool enableDuplicateFilter = true;
    PositionMode positionMode = PositionMode::Mean;

    // Frame geometry (quality border penalty, default speed ceiling)
    int frameWidth = 1920;
    int frameHeight = 1080;

    // Class filtering (empty = keep all classes)
    std::set<std::string> allowedClasses;
    std::set<std::string> blockedClasses;

    // Time-series cleaning
    std::vector<std::string> cleanColumns = {"center_x", "center_y", "mean_confidence"};
    OutlierMethod outlierMethod = OutlierMethod::ZScore;
    double outlierThreshold = 3.0;      // |z| limit
    double iqrMultiplier = 1.5;         // k in [Q1 - k*IQR, Q3 + k*IQR]
    double densityRadius = 1.5;         // Neighborhood radius in standardized units
    int densityMinNeighbors = 3;
    OutlierAction outlierAction = OutlierAction::Interpolate;
    bool enableSmoothing = true;
    int smoothingWindow = 5;            // Odd
    ScalingMethod normalization = ScalingMethod::None;

    // Movement analysis
    double maxMovementSpeed = 0.0;      // Pixels/minute; 0 = half frame diagonal per minute
    double minMovementDistance = 0.0;   // Pixels; retained distances below become 0
    bool enableMovementOutlierRemoval = true;
    double movementOutlierThreshold = 3.0;
    bool enableMovementSmoothing = true;
    int movementSmoothingWindow = 5;

    // Observation cadence
    double observationIntervalMinutes = 1.0;

    // Output
    std::string outputDirectory = "./logs";

    /// Speed ceiling actually applied to movement samples (pixels/minute)
    double speedCeiling() const {
        if (maxMovementSpeed > 0.0) return maxMovementSpeed;
        double diagonal = std::sqrt(static_cast<double>(frameWidth) * frameWidth +
                                    static_cast<double>(frameHeight) * frameHeight);
        return diagonal / 2.0;
    }

    /**
     * @brief Reject values no pipeline run could use.
     * @throws ConfigurationError describing the first invalid value
     */
    void validate() const {
        // Comparisons are written so that NaN fails them
        auto inUnitRange = [](double v) { return v >= 0.0 && v <= 1.0; };

        if (!inUnitRange(confidenceThreshold))
            throw ConfigurationError("detection.confidence must be within [0, 1]");
        if (!inUnitRange(duplicateIoU))
            throw ConfigurationError("detection.duplicate_iou must be within [0, 1]");
        if (!(minBoxWidth >= 0.0f) || !(minBoxHeight >= 0.0f))
            throw ConfigurationError("detection minimum box size must not be negative");
        if (!(minBoxWidth <= maxBoxWidth) || !(minBoxHeight <= maxBoxHeight))
            throw ConfigurationError("detection minimum box size exceeds the maximum");
        if (frameWidth <= 0 || frameHeight <= 0)
            throw ConfigurationError("detection.frame_width/frame_height must be positive");

        if (!(outlierThreshold > 0.0))
            throw ConfigurationError("cleaning.outlier_threshold must be positive");
        if (!(iqrMultiplier >= 0.0))
            throw ConfigurationError("cleaning.iqr_multiplier must not be negative");
        if (!(densityRadius > 0.0))
            throw ConfigurationError("cleaning.density_radius must be positive");
        if (densityMinNeighbors < 1)
            throw ConfigurationError("cleaning.density_min_neighbors must be at least 1");
        if (smoothingWindow <= 0 || smoothingWindow % 2 == 0)
            throw ConfigurationError("cleaning.smoothing_window must be a positive odd number");

        if (!(maxMovementSpeed >= 0.0))
            throw ConfigurationError("movement.max_speed must not be negative");
        if (!(minMovementDistance >= 0.0))
            throw ConfigurationError("movement.min_distance must not be negative");
        if (!(movementOutlierThreshold > 0.0))
            throw ConfigurationError("movement.outlier_threshold must be positive");
        if (movementSmoothingWindow <= 0 || movementSmoothingWindow % 2 == 0)
            throw ConfigurationError("movement.smoothing_window must be a positive odd number");

        if (!(observationIntervalMinutes > 0.0))
            throw ConfigurationError("observation.interval_minutes must be positive");
    }

    /**
     * @brief Load configuration from YAML file (OpenCV YAML requires %YAML:1.0 header).
     * @return false if the file cannot be opened or parsed
     * @throws ConfigurationError if the file holds an invalid value
     */
    bool loadFromFile(const std::string& configPath) {
        cv::FileStorage fs;
        try {
            fs.open(configPath, cv::FileStorage::READ);
        } catch (const cv::Exception&) {
            std::cerr << "Warning: Invalid config file: " << configPath << std::endl;
            return false;
        }
        if (!fs.isOpened()) {
            std::cerr << "Warning: Could not open config file: " << configPath << std::endl;
            return false;
        }

        std::cout << "Loading config from: " << configPath << std::endl;

        // Detection settings
        if (!fs["detection"].empty()) {
            cv::FileNode detection = fs["detection"];
            if (!detection["confidence"].empty()) detection["confidence"] >> confidenceThreshold;
            if (!detection["min_width"].empty()) detection["min_width"] >> minBoxWidth;
            if (!detection["min_height"].empty()) detection["min_height"] >> minBoxHeight;
            if (!detection["max_width"].empty()) detection["max_width"] >> maxBoxWidth;
            if (!detection["max_height"].empty()) detection["max_height"] >> maxBoxHeight;
            if (!detection["duplicate_iou"].empty()) detection["duplicate_iou"] >> duplicateIoU;
            if (!detection["confidence_filter"].empty()) detection["confidence_filter"] >> enableConfidenceFilter;
            if (!detection["size_filter"].empty()) detection["size_filter"] >> enableSizeFilter;
            if (!detection["duplicate_filter"].empty()) detection["duplicate_filter"] >> enableDuplicateFilter;
            if (!detection["position_mode"].empty()) positionMode = parsePositionMode(readString(detection["position_mode"]));
            if (!detection["frame_width"].empty()) detection["frame_width"] >> frameWidth;
            if (!detection["frame_height"].empty()) detection["frame_height"] >> frameHeight;
        }

        // Class filtering
        if (!fs["classes"].empty()) {
            cv::FileNode classes = fs["classes"];
            if (!classes["allowed"].empty()) readStringSet(classes["allowed"], allowedClasses);
            if (!classes["blocked"].empty()) readStringSet(classes["blocked"], blockedClasses);
        }

        // Cleaning settings
        if (!fs["cleaning"].empty()) {
            cv::FileNode cleaning = fs["cleaning"];
            if (!cleaning["columns"].empty()) {
                cleanColumns.clear();
                cv::FileNode columns = cleaning["columns"];
                for (auto it = columns.begin(); it != columns.end(); ++it) {
                    std::string column;
                    *it >> column;
                    if (!column.empty()) cleanColumns.push_back(column);
                }
            }
            if (!cleaning["outlier_method"].empty()) outlierMethod = parseOutlierMethod(readString(cleaning["outlier_method"]));
            if (!cleaning["outlier_threshold"].empty()) cleaning["outlier_threshold"] >> outlierThreshold;
            if (!cleaning["iqr_multiplier"].empty()) cleaning["iqr_multiplier"] >> iqrMultiplier;
            if (!cleaning["density_radius"].empty()) cleaning["density_radius"] >> densityRadius;
            if (!cleaning["density_min_neighbors"].empty()) cleaning["density_min_neighbors"] >> densityMinNeighbors;
            if (!cleaning["outlier_action"].empty()) outlierAction = parseOutlierAction(readString(cleaning["outlier_action"]));
            if (!cleaning["smoothing"].empty()) cleaning["smoothing"] >> enableSmoothing;
            if (!cleaning["smoothing_window"].empty()) cleaning["smoothing_window"] >> smoothingWindow;
            if (!cleaning["normalization"].empty()) normalization = parseScalingMethod(readString(cleaning["normalization"]));
        }

        // Movement settings
        if (!fs["movement"].empty()) {
            cv::FileNode movement = fs["movement"];
            if (!movement["max_speed"].empty()) movement["max_speed"] >> maxMovementSpeed;
            if (!movement["min_distance"].empty()) movement["min_distance"] >> minMovementDistance;
            if (!movement["outlier_removal"].empty()) movement["outlier_removal"] >> enableMovementOutlierRemoval;
            if (!movement["outlier_threshold"].empty()) movement["outlier_threshold"] >> movementOutlierThreshold;
            if (!movement["smoothing"].empty()) movement["smoothing"] >> enableMovementSmoothing;
            if (!movement["smoothing_window"].empty()) movement["smoothing_window"] >> movementSmoothingWindow;
        }

        // Observation cadence and output
        if (!fs["observation"].empty()) {
            cv::FileNode observation = fs["observation"];
            if (!observation["interval_minutes"].empty()) observation["interval_minutes"] >> observationIntervalMinutes;
            if (!observation["output_dir"].empty()) observation["output_dir"] >> outputDirectory;
        }

        fs.release();
        validate();
        return true;
    }

    // Print current configuration
    void print() const {
        std::cout << "=== Insect Activity Configuration ===" << std::endl;
        std::cout << "Detection:" << std::endl;
        std::cout << "  confidence: " << confidenceThreshold
                  << (enableConfidenceFilter ? "" : " (disabled)") << std::endl;
        std::cout << "  box size: [" << minBoxWidth << "x" << minBoxHeight << ", "
                  << maxBoxWidth << "x" << maxBoxHeight << "]"
                  << (enableSizeFilter ? "" : " (disabled)") << std::endl;
        std::cout << "  duplicate_iou: " << duplicateIoU
                  << (enableDuplicateFilter ? "" : " (disabled)") << std::endl;
        std::cout << "  position_mode: " << toString(positionMode) << std::endl;
        std::cout << "  frame: " << frameWidth << "x" << frameHeight << std::endl;
        std::cout << "Cleaning:" << std::endl;
        std::cout << "  columns: ";
        for (const auto& c : cleanColumns) std::cout << c << " ";
        std::cout << std::endl;
        std::cout << "  outliers: " << toString(outlierMethod) << " -> " << toString(outlierAction) << std::endl;
        std::cout << "  smoothing: " << (enableSmoothing ? "window " + std::to_string(smoothingWindow) : "off") << std::endl;
        std::cout << "  normalization: " << toString(normalization) << std::endl;
        std::cout << "Movement:" << std::endl;
        std::cout << "  speed ceiling: " << speedCeiling() << " px/min" << std::endl;
        std::cout << "  outlier removal: " << (enableMovementOutlierRemoval ? "yes" : "no") << std::endl;
        std::cout << "Observation interval: " << observationIntervalMinutes << " min" << std::endl;
        std::cout << "Output: " << outputDirectory << std::endl;
        if (!allowedClasses.empty()) {
            std::cout << "Allowed classes: ";
            for (const auto& c : allowedClasses) std::cout << c << " ";
            std::cout << std::endl;
        }
        if (!blockedClasses.empty()) {
            std::cout << "Blocked classes: ";
            for (const auto& c : blockedClasses) std::cout << c << " ";
            std::cout << std::endl;
        }
        std::cout << "=====================================" << std::endl;
    }

private:
    static std::string readString(const cv::FileNode& node) {
        std::string value;
        node >> value;
        return value;
    }

    static void readStringSet(const cv::FileNode& node, std::set<std::string>& out) {
        out.clear();
        for (auto it = node.begin(); it != node.end(); ++it) {
            std::string cls;
            *it >> cls;
            if (!cls.empty()) out.insert(cls);
        }
    }
};
