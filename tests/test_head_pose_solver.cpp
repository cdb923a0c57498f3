/**
 * @file test_head_pose_solver.cpp
 * @brief Unit tests for HeadPoseSolver
 *
 * Validates:
 * - Near-frontal pose recovery from projected model points
 * - Known yaw recovery
 * - Euler decomposition including the gimbal lock branch
 * - Degenerate input handling
 */

#include <gtest/gtest.h>
#include <proctor/detection/HeadPoseSolver.hpp>
#include <proctor/core/Logger.hpp>
#include <opencv2/calib3d.hpp>
#include <cmath>
#include <vector>

using namespace proctor::detection;

namespace {

double rad(double degrees) {
    return degrees * CV_PI / 180.0;
}

cv::Matx33d rot_x(double degrees) {
    const double c = std::cos(rad(degrees));
    const double s = std::sin(rad(degrees));
    return cv::Matx33d(1, 0, 0,
                       0, c, -s,
                       0, s, c);
}

cv::Matx33d rot_y(double degrees) {
    const double c = std::cos(rad(degrees));
    const double s = std::sin(rad(degrees));
    return cv::Matx33d(c, 0, s,
                       0, 1, 0,
                       -s, 0, c);
}

cv::Matx33d rot_z(double degrees) {
    const double c = std::cos(rad(degrees));
    const double s = std::sin(rad(degrees));
    return cv::Matx33d(c, -s, 0,
                       s, c, 0,
                       0, 0, 1);
}

} // namespace

class HeadPoseSolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        proctor::core::Logger::getInstance().setLevel(proctor::core::LogLevel::WARNING);
    }

    /**
     * Project the head model with the given rotation, 20 units in front of the camera
     */
    PosePoints project(const cv::Matx33d& rotation) const {
        const auto& model = HeadPoseSolver::model_points();
        std::vector<cv::Point3d> object(model.begin(), model.end());

        cv::Mat rvec;
        cv::Rodrigues(cv::Mat(rotation), rvec);
        const cv::Mat tvec = (cv::Mat_<double>(3, 1) << 0.0, 0.0, 20.0);
        const cv::Mat camera(HeadPoseSolver::camera_matrix(frame_size_));
        const cv::Mat dist = cv::Mat::zeros(4, 1, CV_64F);

        std::vector<cv::Point2d> projected;
        cv::projectPoints(object, rvec, tvec, camera, dist, projected);

        PosePoints points;
        for (std::size_t i = 0; i < points.size(); ++i) {
            points[i] = projected[i];
        }
        return points;
    }

    cv::Size frame_size_{640, 480};
    HeadPoseSolver solver_;
};

TEST_F(HeadPoseSolverTest, CameraMatrixFromFrameSize) {
    const cv::Matx33d k = HeadPoseSolver::camera_matrix(frame_size_);
    EXPECT_DOUBLE_EQ(k(0, 0), 640.0);
    EXPECT_DOUBLE_EQ(k(1, 1), 640.0);
    EXPECT_DOUBLE_EQ(k(0, 2), 320.0);
    EXPECT_DOUBLE_EQ(k(1, 2), 240.0);
    EXPECT_DOUBLE_EQ(k(2, 2), 1.0);
}

TEST_F(HeadPoseSolverTest, FrontalPoseIsNearZero) {
    const HeadPose pose = solver_.solve(project(cv::Matx33d::eye()), frame_size_);

    ASSERT_TRUE(pose.is_valid());
    EXPECT_NEAR(*pose.yaw, 0.0, 1.0);
    EXPECT_NEAR(*pose.pitch, 0.0, 1.0);
    EXPECT_NEAR(*pose.roll, 0.0, 1.0);
}

TEST_F(HeadPoseSolverTest, RecoversKnownYaw) {
    const HeadPose pose = solver_.solve(project(rot_y(20.0)), frame_size_);

    ASSERT_TRUE(pose.is_valid());
    EXPECT_NEAR(*pose.yaw, 20.0, 1.0);
    EXPECT_NEAR(*pose.pitch, 0.0, 1.0);
    EXPECT_NEAR(*pose.roll, 0.0, 1.0);
}

TEST_F(HeadPoseSolverTest, EulerDecompositionRoundTrip) {
    const cv::Matx33d r = rot_z(10.0) * rot_y(-25.0) * rot_x(15.0);
    const cv::Vec3d angles = HeadPoseSolver::rotation_to_euler(r);

    EXPECT_NEAR(angles[0], -25.0, 1e-9);
    EXPECT_NEAR(angles[1], 15.0, 1e-9);
    EXPECT_NEAR(angles[2], 10.0, 1e-9);
}

TEST_F(HeadPoseSolverTest, GimbalLockSetsRollToZero) {
    const cv::Vec3d angles = HeadPoseSolver::rotation_to_euler(rot_y(90.0));

    EXPECT_NEAR(angles[0], 90.0, 1e-6);
    EXPECT_NEAR(angles[1], 0.0, 1e-6);
    EXPECT_DOUBLE_EQ(angles[2], 0.0);
}

TEST_F(HeadPoseSolverTest, DegenerateInputYieldsAbsentPose) {
    PosePoints collinear;
    for (std::size_t i = 0; i < collinear.size(); ++i) {
        collinear[i] = cv::Point2d(100.0 + 10.0 * i, 200.0);
    }
    EXPECT_FALSE(solver_.solve(collinear, frame_size_).is_valid());

    PosePoints coincident;
    coincident.fill(cv::Point2d(320.0, 240.0));
    const HeadPose pose = solver_.solve(coincident, frame_size_);
    EXPECT_FALSE(pose.yaw.has_value());
    EXPECT_FALSE(pose.pitch.has_value());
    EXPECT_FALSE(pose.roll.has_value());

    PosePoints with_nan = project(cv::Matx33d::eye());
    with_nan[2].x = std::nan("");
    EXPECT_FALSE(solver_.solve(with_nan, frame_size_).is_valid());
}

TEST_F(HeadPoseSolverTest, InvalidFrameSizeYieldsAbsentPose) {
    EXPECT_FALSE(solver_.solve(project(cv::Matx33d::eye()), cv::Size(0, 480)).is_valid());
}
