/**
 * @file HeadPoseSolver.hpp
 * @brief Head orientation recovery from six facial landmarks
 *
 * Solves the Perspective-n-Point problem between a generic 3D face model and
 * six observed 2D landmarks, then decomposes the rotation into yaw, pitch
 * and roll.
 *
 * @copyright 2025 Proctor Project
 * @license MIT License
 */

#ifndef PROCTOR_DETECTION_HEAD_POSE_SOLVER_HPP
#define PROCTOR_DETECTION_HEAD_POSE_SOLVER_HPP

#include <array>
#include <opencv2/core.hpp>
#include "DetectionTypes.hpp"

namespace proctor {
namespace detection {

/**
 * @brief Stateless PnP head pose solver
 *
 * Camera model: focal length = frame width, principal point = frame center,
 * no lens distortion. No per-subject calibration is applied.
 *
 * Euler extraction (R = Rz(roll) * Ry(yaw) * Rx(pitch)):
 * - pitch = atan2(R21, R22)
 * - yaw   = atan2(-R20, sqrt(R00^2 + R10^2))
 * - roll  = atan2(R10, R00)
 * When sqrt(R00^2 + R10^2) < 1e-6 (gimbal lock) pitch = atan2(-R12, R11)
 * and roll = 0.
 */
class HeadPoseSolver {
public:
    /// Generic head model, same order as PosePoints
    static const std::array<cv::Point3d, 6>& model_points();

    HeadPoseSolver() = default;

    /**
     * @brief Recover head pose for one frame
     *
     * @param image_points Observed landmarks in pixels
     * @param frame_size Frame dimensions used to build the camera matrix
     * @return Angles in degrees rounded to 2 decimals, or all-absent when the
     *         solve fails or the input is degenerate
     */
    HeadPose solve(const PosePoints& image_points, const cv::Size& frame_size) const;

    /**
     * @brief Decompose a rotation matrix into angles
     *
     * @param rotation 3x3 rotation matrix
     * @return Unrounded {yaw, pitch, roll} in degrees
     */
    static cv::Vec3d rotation_to_euler(const cv::Matx33d& rotation);

    /**
     * @brief Approximate pinhole camera matrix for a frame
     */
    static cv::Matx33d camera_matrix(const cv::Size& frame_size);
};

} // namespace detection
} // namespace proctor

#endif // PROCTOR_DETECTION_HEAD_POSE_SOLVER_HPP
