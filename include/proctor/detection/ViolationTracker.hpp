/**
 * @file ViolationTracker.hpp
 * @brief Duration-aware attention deviation state machine
 *
 * Converts per-frame threshold crossings into discrete, debounced violation
 * events with start time, duration and peak intensity. One independent
 * two-state machine is kept per violation category.
 *
 * @copyright 2025 Proctor Project
 * @license MIT License
 */

#ifndef PROCTOR_DETECTION_VIOLATION_TRACKER_HPP
#define PROCTOR_DETECTION_VIOLATION_TRACKER_HPP

#include <array>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>
#include "DetectionTypes.hpp"

namespace proctor {
namespace detection {

/**
 * @brief State of a single category machine
 *
 * When active is false, duration and max_intensity are stale.
 */
struct ViolationState {
    bool active = false;
    double start_time = 0.0;
    double duration = 0.0;
    double max_intensity = 0.0;
};

/**
 * @brief Per-category debounce state machine
 *
 * States per category: Inactive (initial) and Active.
 * - Inactive -> Active when the condition becomes true: start_time and
 *   max_intensity are taken from the current frame.
 * - Active, condition still true: duration = t - start_time and
 *   max_intensity = max(max_intensity, intensity).
 * - Active -> Inactive when the condition becomes false: an event is emitted
 *   if duration >= TrackerConfig::min_event_duration_sec, otherwise the span
 *   is dropped.
 *
 * Conditions (absent or non-finite readings are always false):
 * | category       | condition                     |
 * |----------------|-------------------------------|
 * | GAZE_LEFT      | gaze_h < -eye_horizontal      |
 * | GAZE_RIGHT     | gaze_h >  eye_horizontal      |
 * | GAZE_UP        | gaze_v < -eye_vertical        |
 * | GAZE_DOWN      | gaze_v >  eye_vertical        |
 * | HEAD_LEFT      | yaw    < -yaw                 |
 * | HEAD_RIGHT     | yaw    >  yaw                 |
 * | HEAD_UP        | pitch  < -pitch               |
 * | HEAD_DOWN      | pitch  >  pitch               |
 * | FACE_MISSING   | num_faces == 0                |
 * | MULTIPLE_FACES | num_faces > 1                 |
 *
 * Frames must arrive in non-decreasing timestamp order. finalize() must be
 * called at end of stream to flush categories that are still active.
 *
 * Thread-safety: Not thread-safe. Use one instance per video stream.
 */
class ViolationTracker {
public:
    /**
     * @brief Constructor
     *
     * @param thresholds Fixed thresholds for this run
     * @param config Debounce configuration
     * @throws core::ConfigException if thresholds or config are invalid
     */
    explicit ViolationTracker(const Thresholds& thresholds,
                              const TrackerConfig& config = TrackerConfig{});

    ~ViolationTracker();

    // Disable copy, allow move
    ViolationTracker(const ViolationTracker&) = delete;
    ViolationTracker& operator=(const ViolationTracker&) = delete;
    ViolationTracker(ViolationTracker&&) noexcept;
    ViolationTracker& operator=(ViolationTracker&&) noexcept;

    /**
     * @brief Evaluate every category against one frame
     *
     * @param frame Frame signal; timestamp must not precede the previous frame
     * @throws core::InputException on a non-finite or decreasing timestamp
     */
    void update(const FrameSignal& frame);

    /**
     * @brief End every active category, emitting events where long enough
     */
    void finalize();

    /**
     * @brief Return all machines to Inactive and clear events and statistics
     */
    void reset();

    /**
     * @brief Register a callback invoked for each emitted event
     */
    void set_event_callback(ViolationCallback callback);

    /**
     * @brief Emitted events, in emission order
     */
    std::vector<ViolationEvent> get_events() const;

    /**
     * @brief Number of events emitted for a category
     */
    std::size_t get_count(ViolationCategory category) const;

    /**
     * @brief Event counts indexed by category_index()
     */
    std::array<std::size_t, kViolationCategoryCount> get_counts() const;

    /**
     * @brief Start times (rounded to 0.01 s) of events emitted for a category
     */
    std::vector<double> get_timestamps(ViolationCategory category) const;

    /**
     * @brief Largest intensity seen for a category over the whole session
     */
    double get_max_intensity(ViolationCategory category) const;

    ViolationState get_state(ViolationCategory category) const;

    bool is_active(ViolationCategory category) const;

    /**
     * @brief Frames consumed since construction or reset
     */
    std::size_t frames_processed() const;

    /**
     * @brief Timestamp of the most recent frame, if any
     */
    std::optional<double> last_timestamp() const;

    Thresholds get_thresholds() const;

    TrackerConfig get_config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace detection
} // namespace proctor

#endif // PROCTOR_DETECTION_VIOLATION_TRACKER_HPP
