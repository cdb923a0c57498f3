/**
 * @file ReportWriter.cpp
 * @brief Implementation of report JSON serialization
 */

#include "proctor/report/ReportWriter.hpp"
#include "proctor/core/Logger.hpp"
#include "proctor/core/exception.h"
#include <cmath>
#include <fstream>

namespace proctor {
namespace report {

namespace {

nlohmann::json thresholds_to_json(const detection::Thresholds& thresholds) {
    nlohmann::json json;
    json["eye_horizontal"] = thresholds.eye_horizontal;
    json["eye_vertical"] = thresholds.eye_vertical;
    json["yaw"] = thresholds.yaw;
    json["pitch"] = thresholds.pitch;
    json["roll"] = thresholds.roll;
    return json;
}

} // namespace

nlohmann::json ReportWriter::to_json(const AnalysisReport& report) {
    nlohmann::json gestures = nlohmann::json::array();
    for (const auto& group : report.gestures) {
        nlohmann::json occurrences = nlohmann::json::array();
        for (const auto& occurrence : group.occurrences) {
            nlohmann::json entry;
            entry["timestamp"] = occurrence.timestamp;
            entry["duration"] = occurrence.duration;
            entry["direction"] = occurrence.direction;
            entry["intensity"] = occurrence.intensity;
            occurrences.push_back(entry);
        }

        nlohmann::json groupJson;
        groupJson["name"] = group.name;
        groupJson["occurrence"] = occurrences;
        gestures.push_back(groupJson);
    }

    nlohmann::json metadata;
    metadata["processing_time_sec"] = std::llround(report.metadata.processing_time_sec);
    metadata["video_duration_sec"] = std::llround(report.metadata.video_duration_sec);
    metadata["frames_processed"] = report.metadata.frames_processed;

    nlohmann::json analysis;
    analysis["gestures"] = gestures;
    analysis["thresholds_used"] = thresholds_to_json(report.thresholds_used);
    analysis["processing_metadata"] = metadata;

    nlohmann::json document;
    document["session_id"] = report.session_id;
    document["status"] = report.status;
    document["message"] = report.message;
    document["analysis"] = analysis;
    return document;
}

std::string ReportWriter::to_string(const AnalysisReport& report, int indent) {
    return to_json(report).dump(indent);
}

void ReportWriter::write_file(const AnalysisReport& report, const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        PROCTOR_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                           "Cannot open report file for writing: " + path);
    }

    file << to_string(report, 2) << "\n";
    if (!file) {
        PROCTOR_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                           "Failed to write report file: " + path);
    }

    LOG_INFO("Report written to " + path);
}

} // namespace report
} // namespace proctor
