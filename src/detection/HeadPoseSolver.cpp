/**
 * @file HeadPoseSolver.cpp
 * @brief Implementation of PnP head pose recovery
 */

#include "proctor/detection/HeadPoseSolver.hpp"
#include "proctor/core/Logger.hpp"
#include "proctor/utils/MathUtils.hpp"
#include <opencv2/calib3d.hpp>
#include <cmath>
#include <vector>

namespace proctor {
namespace detection {

namespace {

constexpr double kGimbalLockEpsilon = 1e-6;

bool is_finite_point(const cv::Point2d& p) {
    return std::isfinite(p.x) && std::isfinite(p.y);
}

/**
 * @brief Twice the signed area of the triangle (a, b, c)
 */
double triangle_area2(const cv::Point2d& a, const cv::Point2d& b, const cv::Point2d& c) {
    return (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
}

/**
 * @brief Reject landmark sets that cannot constrain a pose
 *
 * All points collinear (or coincident) leaves the rotation undetermined.
 */
bool is_degenerate(const PosePoints& points) {
    for (const auto& p : points) {
        if (!is_finite_point(p)) {
            return true;
        }
    }

    for (std::size_t i = 0; i < points.size(); ++i) {
        for (std::size_t j = i + 1; j < points.size(); ++j) {
            for (std::size_t k = j + 1; k < points.size(); ++k) {
                if (std::abs(triangle_area2(points[i], points[j], points[k])) > 1e-6) {
                    return false;
                }
            }
        }
    }
    return true;
}

} // namespace

const std::array<cv::Point3d, 6>& HeadPoseSolver::model_points() {
    static const std::array<cv::Point3d, 6> points = {
        cv::Point3d(0.0, 0.0, 0.0),       // Nose tip
        cv::Point3d(0.0, -3.3, -2.5),     // Chin
        cv::Point3d(-2.3, 1.65, -1.5),    // Left eye outer corner
        cv::Point3d(2.3, 1.65, -1.5),     // Right eye outer corner
        cv::Point3d(-1.5, -1.65, -1.5),   // Left mouth corner
        cv::Point3d(1.5, -1.65, -1.5)     // Right mouth corner
    };
    return points;
}

cv::Matx33d HeadPoseSolver::camera_matrix(const cv::Size& frame_size) {
    const double focal_length = static_cast<double>(frame_size.width);
    return cv::Matx33d(focal_length, 0.0, frame_size.width / 2.0,
                       0.0, focal_length, frame_size.height / 2.0,
                       0.0, 0.0, 1.0);
}

cv::Vec3d HeadPoseSolver::rotation_to_euler(const cv::Matx33d& r) {
    const double sy = std::sqrt(r(0, 0) * r(0, 0) + r(1, 0) * r(1, 0));
    const bool singular = sy < kGimbalLockEpsilon;

    double pitch = 0.0;
    double yaw = std::atan2(-r(2, 0), sy);
    double roll = 0.0;

    if (!singular) {
        pitch = std::atan2(r(2, 1), r(2, 2));
        roll = std::atan2(r(1, 0), r(0, 0));
    } else {
        pitch = std::atan2(-r(1, 2), r(1, 1));
    }

    return cv::Vec3d(utils::MathUtils::radToDeg(yaw),
                     utils::MathUtils::radToDeg(pitch),
                     utils::MathUtils::radToDeg(roll));
}

HeadPose HeadPoseSolver::solve(const PosePoints& image_points, const cv::Size& frame_size) const {
    HeadPose pose;

    if (frame_size.width <= 0 || frame_size.height <= 0) {
        LOG_DEBUG("HeadPoseSolver: invalid frame size " + std::to_string(frame_size.width) +
                  "x" + std::to_string(frame_size.height));
        return pose;
    }

    if (is_degenerate(image_points)) {
        LOG_DEBUG("HeadPoseSolver: degenerate landmark configuration");
        return pose;
    }

    const auto& model = model_points();
    std::vector<cv::Point3d> object_points(model.begin(), model.end());
    std::vector<cv::Point2d> observed(image_points.begin(), image_points.end());

    const cv::Mat camera = cv::Mat(camera_matrix(frame_size));
    const cv::Mat dist_coeffs = cv::Mat::zeros(4, 1, CV_64F);

    try {
        cv::Mat rotation_vec, translation_vec;
        bool success = cv::solvePnP(object_points, observed, camera, dist_coeffs,
                                    rotation_vec, translation_vec, false,
                                    cv::SOLVEPNP_ITERATIVE);
        if (!success || rotation_vec.empty()) {
            LOG_DEBUG("HeadPoseSolver: solvePnP did not converge");
            return pose;
        }

        cv::Mat rotation_mat;
        cv::Rodrigues(rotation_vec, rotation_mat);
        if (rotation_mat.rows != 3 || rotation_mat.cols != 3) {
            return pose;
        }

        const cv::Matx33d rotation = rotation_mat;

        const cv::Vec3d angles = rotation_to_euler(rotation);
        if (!std::isfinite(angles[0]) || !std::isfinite(angles[1]) || !std::isfinite(angles[2])) {
            LOG_DEBUG("HeadPoseSolver: non-finite Euler angles");
            return pose;
        }

        pose.yaw = utils::MathUtils::roundTo(angles[0], 2);
        pose.pitch = utils::MathUtils::roundTo(angles[1], 2);
        pose.roll = utils::MathUtils::roundTo(angles[2], 2);
    } catch (const cv::Exception& e) {
        LOG_DEBUG(std::string("HeadPoseSolver: OpenCV error: ") + e.what());
        return HeadPose{};
    }

    return pose;
}

} // namespace detection
} // namespace proctor
