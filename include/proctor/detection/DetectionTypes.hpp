/**
 * @file DetectionTypes.hpp
 * @brief Core data types for attention deviation detection
 *
 * Defines the per-frame signal, thresholds, violation categories and events
 * shared by the smoothing, head pose and violation tracking components.
 *
 * @copyright 2025 Proctor Project
 * @license MIT License
 */

#ifndef PROCTOR_DETECTION_TYPES_HPP
#define PROCTOR_DETECTION_TYPES_HPP

#include <array>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <opencv2/core.hpp>

namespace proctor {
namespace detection {

/**
 * @brief Fixed angular thresholds for one analysis run (degrees)
 *
 * Roll is carried for reporting only; no category is evaluated against it.
 */
struct Thresholds {
    double eye_horizontal = 8.0;   ///< Gaze left/right limit
    double eye_vertical = 6.0;     ///< Gaze up/down limit
    double yaw = 30.0;             ///< Head left/right limit
    double pitch = 20.0;           ///< Head up/down limit
    double roll = 30.0;            ///< Head tilt limit (not evaluated)

    bool is_valid() const {
        return eye_horizontal > 0.0 && eye_vertical > 0.0 &&
               yaw > 0.0 && pitch > 0.0 && roll > 0.0;
    }
};

/**
 * @brief Gaze smoothing parameters
 */
struct SmootherConfig {
    /// Kalman process noise (scales identity covariance)
    double process_noise = 0.03;

    /// Kalman measurement noise
    double measurement_noise = 0.1;

    /// Rolling history capacity (frames)
    std::size_t history_capacity = 7;

    /// Ratio compression applied before asin() to stay clear of +-1
    double angle_compression = 0.9;

    bool is_valid() const {
        return process_noise > 0.0 &&
               measurement_noise > 0.0 &&
               history_capacity >= 5 &&
               angle_compression > 0.0 && angle_compression <= 1.0;
    }
};

/**
 * @brief Violation tracking parameters
 */
struct TrackerConfig {
    /// Spans shorter than this are discarded as flicker (seconds)
    double min_event_duration_sec = 0.15;

    bool is_valid() const {
        return min_event_duration_sec >= 0.0;
    }
};

/**
 * @brief Validity floors for landmark-derived gaze ratios
 */
struct GazeConfig {
    /// Average eye aspect ratio below this means eyes closed
    double min_eye_aspect_ratio = 0.12;

    /// Average eye width below this (pixels) is too small to measure
    double min_eye_width_px = 1.8;

    bool is_valid() const {
        return min_eye_aspect_ratio >= 0.0 && min_eye_width_px >= 0.0;
    }
};

/**
 * @brief Horizontal/vertical iris displacement normalized by eye width, in [-1, 1]
 */
struct GazeRatio {
    double horizontal = 0.0;
    double vertical = 0.0;
};

/**
 * @brief Gaze angles in degrees
 */
struct GazeAngles {
    double horizontal = 0.0;
    double vertical = 0.0;
};

/**
 * @brief Head orientation in degrees; all fields absent when the solve failed
 */
struct HeadPose {
    std::optional<double> yaw;
    std::optional<double> pitch;
    std::optional<double> roll;

    bool is_valid() const {
        return yaw.has_value() && pitch.has_value() && roll.has_value();
    }
};

/**
 * @brief Six 2D landmarks used for pose recovery
 *
 * Order: nose tip, chin, left eye outer corner, right eye outer corner,
 * left mouth corner, right mouth corner.
 */
using PosePoints = std::array<cv::Point2d, 6>;

/**
 * @brief Per-frame signal consumed by the violation tracker
 *
 * Absent values mean the upstream detector had no reliable reading for the
 * frame. They are never interpreted as zero.
 */
struct FrameSignal {
    double timestamp = 0.0;            ///< Seconds from stream start
    std::optional<double> gaze_h;      ///< Smoothed horizontal gaze (deg)
    std::optional<double> gaze_v;      ///< Smoothed vertical gaze (deg)
    std::optional<double> yaw;         ///< Head yaw (deg)
    std::optional<double> pitch;       ///< Head pitch (deg)
    std::optional<double> roll;        ///< Head roll (deg)
    int num_faces = 0;                 ///< Faces found in the frame
};

/**
 * @brief Raw per-frame measurement before smoothing and pose recovery
 */
struct FrameMeasurement {
    double timestamp = 0.0;
    int num_faces = 0;
    std::optional<GazeRatio> gaze_ratio;
    std::optional<PosePoints> pose_points;
    cv::Size frame_size;
};

/**
 * @brief Closed set of attention deviation categories
 *
 * Declaration order is the per-frame evaluation order.
 */
enum class ViolationCategory {
    GAZE_LEFT = 0,
    GAZE_RIGHT,
    GAZE_UP,
    GAZE_DOWN,
    HEAD_LEFT,
    HEAD_RIGHT,
    HEAD_UP,
    HEAD_DOWN,
    FACE_MISSING,
    MULTIPLE_FACES
};

constexpr std::size_t kViolationCategoryCount = 10;

constexpr std::array<ViolationCategory, kViolationCategoryCount> kAllViolationCategories = {
    ViolationCategory::GAZE_LEFT,
    ViolationCategory::GAZE_RIGHT,
    ViolationCategory::GAZE_UP,
    ViolationCategory::GAZE_DOWN,
    ViolationCategory::HEAD_LEFT,
    ViolationCategory::HEAD_RIGHT,
    ViolationCategory::HEAD_UP,
    ViolationCategory::HEAD_DOWN,
    ViolationCategory::FACE_MISSING,
    ViolationCategory::MULTIPLE_FACES
};

/**
 * @brief Index of a category into per-category tables
 */
constexpr std::size_t category_index(ViolationCategory category) {
    return static_cast<std::size_t>(category);
}

/**
 * @brief Convert category to its tag ("gaze_left", "face_missing", ...)
 */
inline std::string category_to_string(ViolationCategory category) {
    switch (category) {
        case ViolationCategory::GAZE_LEFT: return "gaze_left";
        case ViolationCategory::GAZE_RIGHT: return "gaze_right";
        case ViolationCategory::GAZE_UP: return "gaze_up";
        case ViolationCategory::GAZE_DOWN: return "gaze_down";
        case ViolationCategory::HEAD_LEFT: return "head_left";
        case ViolationCategory::HEAD_RIGHT: return "head_right";
        case ViolationCategory::HEAD_UP: return "head_up";
        case ViolationCategory::HEAD_DOWN: return "head_down";
        case ViolationCategory::FACE_MISSING: return "face_missing";
        case ViolationCategory::MULTIPLE_FACES: return "multiple_faces";
        default: return "invalid";
    }
}

/**
 * @brief Parse a category tag
 * @return Category, or nullopt for an unknown tag
 */
inline std::optional<ViolationCategory> category_from_string(const std::string& tag) {
    for (ViolationCategory category : kAllViolationCategories) {
        if (category_to_string(category) == tag) {
            return category;
        }
    }
    return std::nullopt;
}

/**
 * @brief True for gaze and head categories (those carrying an angle intensity)
 */
inline bool is_angle_category(ViolationCategory category) {
    return category != ViolationCategory::FACE_MISSING &&
           category != ViolationCategory::MULTIPLE_FACES;
}

/**
 * @brief Finalized violation span
 */
struct ViolationEvent {
    ViolationCategory category = ViolationCategory::FACE_MISSING;

    /// Timestamp of the first frame that crossed the threshold (seconds)
    double start_time = 0.0;

    /// Span length, rounded to 0.1 s
    double duration = 0.0;

    /// Peak absolute angle in whole degrees; absent for presence categories
    std::optional<double> intensity;
};

/**
 * @brief Callback invoked once per emitted event
 */
using ViolationCallback = std::function<void(const ViolationEvent& event)>;

} // namespace detection
} // namespace proctor

#endif // PROCTOR_DETECTION_TYPES_HPP
