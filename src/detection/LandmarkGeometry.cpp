/**
 * @file LandmarkGeometry.cpp
 * @brief Implementation of face mesh geometry helpers
 */

#include "proctor/detection/LandmarkGeometry.hpp"
#include "proctor/core/Logger.hpp"
#include "proctor/utils/MathUtils.hpp"
#include <cmath>

namespace proctor {
namespace detection {

namespace {

double distance(const cv::Point2d& a, const cv::Point2d& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

template<std::size_t N>
cv::Point2d centroid(const FaceMesh& mesh, const std::array<int, N>& indices) {
    cv::Point2d sum(0.0, 0.0);
    for (int index : indices) {
        sum += mesh[static_cast<std::size_t>(index)];
    }
    return sum * (1.0 / static_cast<double>(N));
}

bool inside_frame(const cv::Point2d& p, const cv::Size& frame_size) {
    return p.x >= 0.0 && p.x <= frame_size.width &&
           p.y >= 0.0 && p.y <= frame_size.height;
}

} // namespace

LandmarkGeometry::LandmarkGeometry(const GazeConfig& config)
    : config_(config.is_valid() ? config : GazeConfig{}) {
    if (!config.is_valid()) {
        LOG_WARNING("LandmarkGeometry: invalid configuration, using defaults");
    }
}

double LandmarkGeometry::eye_aspect_ratio(const FaceMesh& mesh, const std::array<int, 8>& eye) {
    const cv::Point2d& p0 = mesh[eye[0]];
    const cv::Point2d& p1 = mesh[eye[1]];
    const cv::Point2d& p2 = mesh[eye[2]];
    const cv::Point2d& p3 = mesh[eye[3]];
    const cv::Point2d& p4 = mesh[eye[4]];
    const cv::Point2d& p5 = mesh[eye[5]];

    const double horizontal = distance(p0, p3);
    if (horizontal == 0.0) {
        return 0.0;
    }
    return (distance(p1, p5) + distance(p2, p4)) / (2.0 * horizontal);
}

std::optional<GazeRatio> LandmarkGeometry::extract_gaze_ratio(const FaceMesh& mesh,
                                                              const cv::Size& frame_size) const {
    if (mesh.size() < MeshIndices::REQUIRED_POINTS) {
        return std::nullopt;
    }

    const double ear = (eye_aspect_ratio(mesh, MeshIndices::LEFT_EYE) +
                        eye_aspect_ratio(mesh, MeshIndices::RIGHT_EYE)) / 2.0;
    if (!(ear >= config_.min_eye_aspect_ratio)) {
        LOG_TRACE("LandmarkGeometry: eyes closed (EAR " + std::to_string(ear) + ")");
        return std::nullopt;
    }

    for (int index : MeshIndices::LEFT_IRIS) {
        if (!inside_frame(mesh[index], frame_size)) {
            return std::nullopt;
        }
    }
    for (int index : MeshIndices::RIGHT_IRIS) {
        if (!inside_frame(mesh[index], frame_size)) {
            return std::nullopt;
        }
    }

    const cv::Point2d left_iris = centroid(mesh, MeshIndices::LEFT_IRIS);
    const cv::Point2d right_iris = centroid(mesh, MeshIndices::RIGHT_IRIS);
    // Eye center is the mean of the whole contour, not the corner midpoint
    const cv::Point2d left_center = centroid(mesh, MeshIndices::LEFT_EYE);
    const cv::Point2d right_center = centroid(mesh, MeshIndices::RIGHT_EYE);

    const double left_width = distance(mesh[MeshIndices::LEFT_EYE_CORNERS[0]],
                                       mesh[MeshIndices::LEFT_EYE_CORNERS[1]]);
    const double right_width = distance(mesh[MeshIndices::RIGHT_EYE_CORNERS[0]],
                                        mesh[MeshIndices::RIGHT_EYE_CORNERS[1]]);
    const double eye_width = (left_width + right_width) / 2.0;
    if (!(eye_width >= config_.min_eye_width_px)) {
        return std::nullopt;
    }

    const cv::Point2d displacement = ((left_iris - left_center) + (right_iris - right_center)) * 0.5;

    GazeRatio ratio;
    ratio.horizontal = utils::MathUtils::clamp(displacement.x / eye_width, -1.0, 1.0);
    ratio.vertical = utils::MathUtils::clamp(displacement.y / eye_width, -1.0, 1.0);
    return ratio;
}

std::optional<PosePoints> LandmarkGeometry::extract_pose_points(const FaceMesh& mesh) {
    if (mesh.size() < MeshIndices::REQUIRED_POINTS) {
        return std::nullopt;
    }

    PosePoints points;
    for (std::size_t i = 0; i < points.size(); ++i) {
        points[i] = mesh[static_cast<std::size_t>(MeshIndices::POSE[i])];
    }
    return points;
}

FrameMeasurement LandmarkGeometry::measure(const FaceMesh& mesh, const cv::Size& frame_size,
                                           int num_faces, double timestamp) const {
    FrameMeasurement measurement;
    measurement.timestamp = timestamp;
    measurement.num_faces = num_faces;
    measurement.frame_size = frame_size;

    if (num_faces > 0) {
        measurement.gaze_ratio = extract_gaze_ratio(mesh, frame_size);
        measurement.pose_points = extract_pose_points(mesh);
    }
    return measurement;
}

} // namespace detection
} // namespace proctor
