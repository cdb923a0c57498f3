/**
 * @file EventReportBuilder.cpp
 * @brief Implementation of event grouping and rendering
 */

#include "proctor/report/EventReportBuilder.hpp"
#include "proctor/core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace proctor {
namespace report {

using detection::ViolationCategory;
using detection::ViolationEvent;

const std::array<std::string, 4>& EventReportBuilder::group_names() {
    static const std::array<std::string, 4> names = {
        HEAD_MOVEMENT, EYE_MOVEMENT, FACE_MISSING, MULTIPLE_FACES
    };
    return names;
}

std::string EventReportBuilder::group_name(ViolationCategory category) {
    switch (category) {
        case ViolationCategory::HEAD_LEFT:
        case ViolationCategory::HEAD_RIGHT:
        case ViolationCategory::HEAD_UP:
        case ViolationCategory::HEAD_DOWN:
            return HEAD_MOVEMENT;
        case ViolationCategory::GAZE_LEFT:
        case ViolationCategory::GAZE_RIGHT:
        case ViolationCategory::GAZE_UP:
        case ViolationCategory::GAZE_DOWN:
            return EYE_MOVEMENT;
        case ViolationCategory::FACE_MISSING:
            return FACE_MISSING;
        case ViolationCategory::MULTIPLE_FACES:
            return MULTIPLE_FACES;
    }
    return FACE_MISSING;
}

std::string EventReportBuilder::direction(ViolationCategory category) {
    if (!detection::is_angle_category(category)) {
        return "";
    }
    const std::string tag = detection::category_to_string(category);
    const auto separator = tag.find('_');
    return separator == std::string::npos ? tag : tag.substr(separator + 1);
}

std::string EventReportBuilder::format_intensity(const std::optional<double>& intensity) {
    if (!intensity || !std::isfinite(*intensity)) {
        return "";
    }
    return std::to_string(static_cast<long long>(std::llround(*intensity))) + " degrees";
}

std::string EventReportBuilder::format_timestamp(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        seconds = 0.0;
    }
    const long long total = static_cast<long long>(std::floor(seconds));

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%lld:%02lld", total / 60, total % 60);
    return buffer;
}

std::vector<GestureGroup> EventReportBuilder::build(const std::vector<ViolationEvent>& events) {
    const auto& names = group_names();

    std::array<std::vector<ViolationEvent>, 4> partitions;
    for (const auto& event : events) {
        const std::string name = group_name(event.category);
        const auto it = std::find(names.begin(), names.end(), name);
        partitions[static_cast<std::size_t>(it - names.begin())].push_back(event);
    }

    std::vector<GestureGroup> groups;
    for (std::size_t i = 0; i < names.size(); ++i) {
        auto& bucket = partitions[i];
        if (bucket.empty()) {
            continue;
        }

        std::stable_sort(bucket.begin(), bucket.end(),
                         [](const ViolationEvent& a, const ViolationEvent& b) {
                             return a.start_time < b.start_time;
                         });

        GestureGroup group;
        group.name = names[i];
        group.occurrences.reserve(bucket.size());
        for (const auto& event : bucket) {
            GestureOccurrence occurrence;
            occurrence.timestamp = format_timestamp(event.start_time);
            occurrence.duration = event.duration;
            occurrence.direction = direction(event.category);
            occurrence.intensity = format_intensity(event.intensity);
            group.occurrences.push_back(occurrence);
        }

        LOG_INFO("EventReportBuilder: " + group.name + " -> " +
                 std::to_string(group.occurrences.size()) + " occurrence(s)");
        groups.push_back(std::move(group));
    }

    return groups;
}

} // namespace report
} // namespace proctor
