/**
 * @file EventReportBuilder.hpp
 * @brief Groups violation events into the externally reported shape
 *
 * @copyright 2025 Proctor Project
 * @license MIT License
 */

#ifndef PROCTOR_REPORT_EVENT_REPORT_BUILDER_HPP
#define PROCTOR_REPORT_EVENT_REPORT_BUILDER_HPP

#include <array>
#include <optional>
#include <string>
#include <vector>
#include "proctor/detection/DetectionTypes.hpp"
#include "ReportTypes.hpp"

namespace proctor {
namespace report {

/**
 * @brief Stateless event to gesture-group transformer
 *
 * Group order is fixed: head_movement, eye_movement, face_missing,
 * multiple_faces. Groups without occurrences are left out.
 */
class EventReportBuilder {
public:
    static constexpr const char* HEAD_MOVEMENT = "head_movement";
    static constexpr const char* EYE_MOVEMENT = "eye_movement";
    static constexpr const char* FACE_MISSING = "face_missing";
    static constexpr const char* MULTIPLE_FACES = "multiple_faces";

    /// Reported group names in output order
    static const std::array<std::string, 4>& group_names();

    /**
     * @brief Partition, sort and render events
     */
    static std::vector<GestureGroup> build(const std::vector<detection::ViolationEvent>& events);

    /**
     * @brief Render seconds as "M:SS", truncating the fractional part
     *
     * Negative and non-finite values render as "0:00".
     */
    static std::string format_timestamp(double seconds);

    /// Group a category is reported under
    static std::string group_name(detection::ViolationCategory category);

    /// Category tag without its "head_"/"gaze_" prefix; empty for presence categories
    static std::string direction(detection::ViolationCategory category);

    /// "<n> degrees", or empty when there is no intensity
    static std::string format_intensity(const std::optional<double>& intensity);
};

} // namespace report
} // namespace proctor

#endif // PROCTOR_REPORT_EVENT_REPORT_BUILDER_HPP
