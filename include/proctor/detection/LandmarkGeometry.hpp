/**
 * @file LandmarkGeometry.hpp
 * @brief Face mesh geometry for gaze ratio and pose point extraction
 *
 * Works on a refined 478-point face mesh expressed in pixel coordinates.
 * The landmark detector itself is external.
 *
 * @copyright 2025 Proctor Project
 * @license MIT License
 */

#ifndef PROCTOR_DETECTION_LANDMARK_GEOMETRY_HPP
#define PROCTOR_DETECTION_LANDMARK_GEOMETRY_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <vector>
#include <opencv2/core.hpp>
#include "DetectionTypes.hpp"

namespace proctor {
namespace detection {

/// Face mesh in pixel coordinates, indexed by landmark id
using FaceMesh = std::vector<cv::Point2d>;

/**
 * @brief Mesh landmark indices
 */
struct MeshIndices {
    static constexpr std::array<int, 8> LEFT_EYE = {33, 133, 160, 159, 158, 144, 145, 153};
    static constexpr std::array<int, 8> RIGHT_EYE = {362, 263, 387, 386, 385, 373, 374, 380};
    static constexpr std::array<int, 4> LEFT_IRIS = {474, 475, 476, 477};
    static constexpr std::array<int, 4> RIGHT_IRIS = {469, 470, 471, 472};
    static constexpr std::array<int, 2> LEFT_EYE_CORNERS = {33, 133};
    static constexpr std::array<int, 2> RIGHT_EYE_CORNERS = {362, 263};

    /// Nose tip, chin, left eye corner, right eye corner, left/right mouth corner
    static constexpr std::array<int, 6> POSE = {1, 152, 33, 263, 61, 291};

    /// Smallest mesh that covers every index above
    static constexpr std::size_t REQUIRED_POINTS = 478;
};

/**
 * @brief Stateless landmark geometry
 *
 * Gaze ratio per axis = mean(iris_center - eye_center) over both eyes, where
 * eye_center is the mean of the eight contour points, divided
 * by the average eye width, clamped to [-1, 1]. The ratio is withheld when the
 * eyes are closed, an iris point falls outside the frame or the eyes are too
 * small to measure.
 */
class LandmarkGeometry {
public:
    explicit LandmarkGeometry(const GazeConfig& config = GazeConfig{});

    /**
     * @brief Eye aspect ratio from the first six contour points
     *
     * EAR = (|p1-p5| + |p2-p4|) / (2 * |p0-p3|); 0 when |p0-p3| is 0.
     */
    static double eye_aspect_ratio(const FaceMesh& mesh, const std::array<int, 8>& eye);

    /**
     * @brief Normalized iris displacement, or nullopt when unreliable
     */
    std::optional<GazeRatio> extract_gaze_ratio(const FaceMesh& mesh, const cv::Size& frame_size) const;

    /**
     * @brief Six pose landmarks, or nullopt when the mesh is incomplete
     */
    static std::optional<PosePoints> extract_pose_points(const FaceMesh& mesh);

    /**
     * @brief Build the raw measurement for one frame
     *
     * @param mesh Mesh of the primary face; ignored when num_faces is 0
     * @param frame_size Frame dimensions in pixels
     * @param num_faces Faces found by the detector
     * @param timestamp Seconds from stream start
     */
    FrameMeasurement measure(const FaceMesh& mesh, const cv::Size& frame_size,
                             int num_faces, double timestamp) const;

    const GazeConfig& get_config() const { return config_; }

private:
    GazeConfig config_;
};

} // namespace detection
} // namespace proctor

#endif // PROCTOR_DETECTION_LANDMARK_GEOMETRY_HPP
