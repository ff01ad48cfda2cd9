/**
 * @file errors.hpp
 * @brief Error types shared by the analytics pipeline.
 *
 * Configuration and persistence failures are exceptions and abort the run.
 * Item-level problems (a malformed detection, an unreadable log row, a
 * requested column that does not exist) are recorded as ValidationIssue
 * entries and the run continues.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

/// Invalid pipeline parameter. Thrown at configuration load, before any processing.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

/// Failure reading or writing the tabular record files.
class PersistenceError : public std::runtime_error {
public:
    PersistenceError(const std::string& path, const std::string& message)
        : std::runtime_error("Persistence error (" + path + "): " + message), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/**
 * @struct ValidationIssue
 * @brief One recovered item-level problem.
 */
struct ValidationIssue {
    std::string source;   ///< Stage that reported it ("filter", "cleaner", "reader", ...)
    int index;            ///< Item index within its input (-1 when not applicable)
    std::string message;
};

using Diagnostics = std::vector<ValidationIssue>;
