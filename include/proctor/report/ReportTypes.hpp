/**
 * @file ReportTypes.hpp
 * @brief Report-facing data model
 *
 * @copyright 2025 Proctor Project
 * @license MIT License
 */

#ifndef PROCTOR_REPORT_TYPES_HPP
#define PROCTOR_REPORT_TYPES_HPP

#include <cstddef>
#include <string>
#include <vector>
#include "proctor/detection/DetectionTypes.hpp"

namespace proctor {
namespace report {

/**
 * @brief One reported event, rendered for display
 */
struct GestureOccurrence {
    std::string timestamp;   ///< Start time as "M:SS"
    double duration = 0.0;   ///< Seconds, one decimal
    std::string direction;   ///< "left", "right", "up", "down" or empty
    std::string intensity;   ///< "<n> degrees" or empty
};

/**
 * @brief Occurrences of one gesture group, sorted by start time
 */
struct GestureGroup {
    std::string name;
    std::vector<GestureOccurrence> occurrences;
};

struct ProcessingMetadata {
    double processing_time_sec = 0.0;   ///< Whole seconds
    double video_duration_sec = 0.0;    ///< Whole seconds
    std::size_t frames_processed = 0;
};

/**
 * @brief Complete analysis result for one session
 */
struct AnalysisReport {
    std::string session_id;
    std::string status = "success";
    std::string message = "Video processed successfully";
    std::vector<GestureGroup> gestures;
    detection::Thresholds thresholds_used;
    ProcessingMetadata metadata;
};

} // namespace report
} // namespace proctor

#endif // PROCTOR_REPORT_TYPES_HPP
