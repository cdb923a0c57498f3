/**
 * @file ReportWriter.hpp
 * @brief JSON serialization of analysis reports
 *
 * @copyright 2025 Proctor Project
 * @license MIT License
 */

#ifndef PROCTOR_REPORT_REPORT_WRITER_HPP
#define PROCTOR_REPORT_REPORT_WRITER_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "ReportTypes.hpp"

namespace proctor {
namespace report {

/**
 * @brief Serializes an AnalysisReport into the response document
 *
 * @code
 * {
 *   "session_id": "...", "status": "success", "message": "...",
 *   "analysis": {
 *     "gestures": [{"name": "head_movement", "occurrence": [
 *         {"timestamp": "0:12", "duration": 1.4, "direction": "left",
 *          "intensity": "35 degrees"}]}],
 *     "thresholds_used": {...},
 *     "processing_metadata": {"processing_time_sec": 3,
 *                             "video_duration_sec": 42,
 *                             "frames_processed": 630}
 *   }
 * }
 * @endcode
 */
class ReportWriter {
public:
    static nlohmann::json to_json(const AnalysisReport& report);

    static std::string to_string(const AnalysisReport& report, int indent = 2);

    /**
     * @brief Write the report document to a file
     * @throws core::FileException if the file cannot be written
     */
    static void write_file(const AnalysisReport& report, const std::string& path);
};

} // namespace report
} // namespace proctor

#endif // PROCTOR_REPORT_REPORT_WRITER_HPP
