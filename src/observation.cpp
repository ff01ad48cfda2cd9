#include "observation.hpp"
#include <utility>

namespace {

const std::vector<std::pair<std::string, RecordColumn>>& columnTable() {
    static const std::vector<std::pair<std::string, RecordColumn>> table = {
        {"center_x", &ObservationRecord::centerX},
        {"center_y", &ObservationRecord::centerY},
        {"mean_confidence", &ObservationRecord::meanConfidence},
        {"max_confidence", &ObservationRecord::maxConfidence},
        {"bbox_width", &ObservationRecord::bboxWidth},
        {"bbox_height", &ObservationRecord::bboxHeight},
        {"bbox_area", &ObservationRecord::bboxArea},
        {"quality_score", &ObservationRecord::qualityScore},
        {"processing_time_ms", &ObservationRecord::processingTimeMs},
    };
    return table;
}

}  // namespace

const std::vector<std::string>& cleanableColumns() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> out;
        for (const auto& entry : columnTable()) out.push_back(entry.first);
        return out;
    }();
    return names;
}

RecordColumn findColumn(const std::string& name) {
    for (const auto& entry : columnTable()) {
        if (entry.first == name) return entry.second;
    }
    return nullptr;
}
