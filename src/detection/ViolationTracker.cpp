/**
 * @file ViolationTracker.cpp
 * @brief Implementation of the per-category violation state machines
 */

#include "proctor/detection/ViolationTracker.hpp"
#include "proctor/core/Logger.hpp"
#include "proctor/core/exception.h"
#include "proctor/utils/MathUtils.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace proctor {
namespace detection {

namespace {

/**
 * @brief Threshold evaluation result for one category on one frame
 */
struct Condition {
    bool met = false;
    double intensity = 0.0;
};

bool usable(const std::optional<double>& value) {
    return value.has_value() && std::isfinite(*value);
}

Condition below(const std::optional<double>& value, double limit) {
    if (!usable(value)) {
        return {};
    }
    return Condition{*value < -limit, std::abs(*value)};
}

Condition above(const std::optional<double>& value, double limit) {
    if (!usable(value)) {
        return {};
    }
    return Condition{*value > limit, std::abs(*value)};
}

} // namespace

/**
 * @brief PIMPL implementation for ViolationTracker
 */
class ViolationTracker::Impl {
public:
    Thresholds thresholds;
    TrackerConfig config;
    ViolationCallback callback;

    std::array<ViolationState, kViolationCategoryCount> states{};
    std::array<std::size_t, kViolationCategoryCount> counts{};
    std::array<std::vector<double>, kViolationCategoryCount> timestamps;
    std::array<double, kViolationCategoryCount> max_intensities{};

    std::vector<ViolationEvent> events;
    std::size_t frame_count = 0;
    std::optional<double> previous_timestamp;

    Impl(const Thresholds& t, const TrackerConfig& cfg)
        : thresholds(t)
        , config(cfg) {
    }

    Condition evaluate(ViolationCategory category, const FrameSignal& frame) const {
        switch (category) {
            case ViolationCategory::GAZE_LEFT:
                return below(frame.gaze_h, thresholds.eye_horizontal);
            case ViolationCategory::GAZE_RIGHT:
                return above(frame.gaze_h, thresholds.eye_horizontal);
            case ViolationCategory::GAZE_UP:
                return below(frame.gaze_v, thresholds.eye_vertical);
            case ViolationCategory::GAZE_DOWN:
                return above(frame.gaze_v, thresholds.eye_vertical);
            case ViolationCategory::HEAD_LEFT:
                return below(frame.yaw, thresholds.yaw);
            case ViolationCategory::HEAD_RIGHT:
                return above(frame.yaw, thresholds.yaw);
            case ViolationCategory::HEAD_UP:
                return below(frame.pitch, thresholds.pitch);
            case ViolationCategory::HEAD_DOWN:
                return above(frame.pitch, thresholds.pitch);
            case ViolationCategory::FACE_MISSING:
                return Condition{frame.num_faces == 0, 0.0};
            case ViolationCategory::MULTIPLE_FACES:
                return Condition{frame.num_faces > 1, 0.0};
        }
        return {};
    }

    void start_violation(ViolationCategory category, double timestamp, double intensity) {
        ViolationState& state = states[category_index(category)];
        state.active = true;
        state.start_time = timestamp;
        state.duration = 0.0;
        state.max_intensity = intensity;

        double& session_max = max_intensities[category_index(category)];
        session_max = std::max(session_max, intensity);
    }

    void update_violation(ViolationCategory category, double timestamp, double intensity) {
        ViolationState& state = states[category_index(category)];
        state.duration = timestamp - state.start_time;
        state.max_intensity = std::max(state.max_intensity, intensity);

        double& session_max = max_intensities[category_index(category)];
        session_max = std::max(session_max, state.max_intensity);
    }

    void end_violation(ViolationCategory category) {
        const std::size_t index = category_index(category);
        // Commit the transition first so a throwing callback cannot re-emit the span
        const ViolationState state = states[index];
        states[index].active = false;

        if (state.active && state.duration >= config.min_event_duration_sec) {
            ViolationEvent event;
            event.category = category;
            event.start_time = state.start_time;
            event.duration = utils::MathUtils::roundTo(state.duration, 1);
            if (is_angle_category(category)) {
                event.intensity = utils::MathUtils::roundTo(state.max_intensity, 0);
            }

            counts[index]++;
            timestamps[index].push_back(utils::MathUtils::roundTo(state.start_time, 2));
            events.push_back(event);

            std::ostringstream oss;
            oss << "ViolationTracker: " << category_to_string(category)
                << " at " << event.start_time << "s for " << event.duration << "s";
            if (event.intensity) {
                oss << " (peak " << *event.intensity << " deg)";
            }
            LOG_DEBUG(oss.str());

            if (callback) {
                callback(event);
            }
        } else if (state.active) {
            LOG_TRACE("ViolationTracker: dropped " + category_to_string(category) +
                      " span of " + std::to_string(state.duration) + "s");
        }
    }

    void check_and_update(ViolationCategory category, const Condition& condition, double timestamp) {
        const bool is_active = states[category_index(category)].active;

        if (condition.met) {
            if (!is_active) {
                start_violation(category, timestamp, condition.intensity);
            } else {
                update_violation(category, timestamp, condition.intensity);
            }
        } else if (is_active) {
            end_violation(category);
        }
    }

    void update(const FrameSignal& frame) {
        if (!std::isfinite(frame.timestamp)) {
            PROCTOR_THROW(core::InputException, "Frame timestamp is not finite");
        }
        if (previous_timestamp && frame.timestamp < *previous_timestamp) {
            std::ostringstream oss;
            oss << "Frame timestamp " << frame.timestamp
                << "s precedes previous frame at " << *previous_timestamp << "s";
            PROCTOR_THROW(core::InputException, oss.str());
        }

        for (ViolationCategory category : kAllViolationCategories) {
            check_and_update(category, evaluate(category, frame), frame.timestamp);
        }

        previous_timestamp = frame.timestamp;
        frame_count++;
    }

    void finalize() {
        for (ViolationCategory category : kAllViolationCategories) {
            if (states[category_index(category)].active) {
                end_violation(category);
            }
        }
    }

    void reset() {
        states.fill(ViolationState{});
        counts.fill(0);
        for (auto& list : timestamps) {
            list.clear();
        }
        max_intensities.fill(0.0);
        events.clear();
        frame_count = 0;
        previous_timestamp.reset();
    }
};

// ===== Public API Implementation =====

ViolationTracker::ViolationTracker(const Thresholds& thresholds, const TrackerConfig& config) {
    if (!thresholds.is_valid()) {
        PROCTOR_THROW(core::ConfigException, "Violation thresholds must be positive");
    }
    if (!config.is_valid()) {
        PROCTOR_THROW(core::ConfigException, "Minimum event duration must not be negative");
    }
    pImpl = std::make_unique<Impl>(thresholds, config);
}

ViolationTracker::~ViolationTracker() = default;

ViolationTracker::ViolationTracker(ViolationTracker&&) noexcept = default;
ViolationTracker& ViolationTracker::operator=(ViolationTracker&&) noexcept = default;

void ViolationTracker::update(const FrameSignal& frame) {
    pImpl->update(frame);
}

void ViolationTracker::finalize() {
    pImpl->finalize();
}

void ViolationTracker::reset() {
    pImpl->reset();
}

void ViolationTracker::set_event_callback(ViolationCallback callback) {
    pImpl->callback = std::move(callback);
}

std::vector<ViolationEvent> ViolationTracker::get_events() const {
    return pImpl->events;
}

std::size_t ViolationTracker::get_count(ViolationCategory category) const {
    return pImpl->counts[category_index(category)];
}

std::array<std::size_t, kViolationCategoryCount> ViolationTracker::get_counts() const {
    return pImpl->counts;
}

std::vector<double> ViolationTracker::get_timestamps(ViolationCategory category) const {
    return pImpl->timestamps[category_index(category)];
}

double ViolationTracker::get_max_intensity(ViolationCategory category) const {
    return pImpl->max_intensities[category_index(category)];
}

ViolationState ViolationTracker::get_state(ViolationCategory category) const {
    return pImpl->states[category_index(category)];
}

bool ViolationTracker::is_active(ViolationCategory category) const {
    return pImpl->states[category_index(category)].active;
}

std::size_t ViolationTracker::frames_processed() const {
    return pImpl->frame_count;
}

std::optional<double> ViolationTracker::last_timestamp() const {
    return pImpl->previous_timestamp;
}

Thresholds ViolationTracker::get_thresholds() const {
    return pImpl->thresholds;
}

TrackerConfig ViolationTracker::get_config() const {
    return pImpl->config;
}

} // namespace detection
} // namespace proctor
