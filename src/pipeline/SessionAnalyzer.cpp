/**
 * @file SessionAnalyzer.cpp
 * @brief Implementation of per-session orchestration
 */

#include "proctor/pipeline/SessionAnalyzer.hpp"
#include "proctor/core/Logger.hpp"
#include "proctor/core/exception.h"
#include "proctor/detection/AngleSmoother.hpp"
#include "proctor/detection/HeadPoseSolver.hpp"
#include "proctor/report/EventReportBuilder.hpp"
#include "proctor/utils/MathUtils.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>

namespace proctor {
namespace pipeline {

using namespace detection;

namespace {

constexpr std::size_t kFrameLogInterval = 50;
constexpr std::size_t kProgressInterval = 100;

std::string describe(const std::optional<double>& value) {
    if (!value) {
        return "n/a";
    }
    std::ostringstream oss;
    oss << *value;
    return oss.str();
}

} // namespace

/**
 * @brief PIMPL implementation for SessionAnalyzer
 */
class SessionAnalyzer::Impl {
public:
    std::string session_id;
    core::ProctoringConfig config;

    AngleSmoother smoother;
    HeadPoseSolver solver;
    ViolationTracker tracker;

    std::size_t frame_count = 0;
    bool finished = false;
    std::chrono::steady_clock::time_point start_time;

    Impl(const std::string& id, const core::ProctoringConfig& cfg)
        : session_id(id)
        , config(cfg)
        , smoother(cfg.smoothing)
        , tracker(cfg.thresholds, cfg.tracking)
        , start_time(std::chrono::steady_clock::now()) {
    }

    void ensure_open() const {
        if (finished) {
            PROCTOR_THROW(core::ProcessingException,
                          "Session " + session_id + " already finished");
        }
    }

    void track(const FrameSignal& signal) {
        tracker.update(signal);
        frame_count++;

        if (frame_count % kFrameLogInterval == 0) {
            LOG_DEBUG("Frame " + std::to_string(frame_count) + " t=" + std::to_string(signal.timestamp) +
                      "s faces=" + std::to_string(signal.num_faces) +
                      " gaze=(" + describe(signal.gaze_h) + ", " + describe(signal.gaze_v) + ")" +
                      " pose=(" + describe(signal.yaw) + ", " + describe(signal.pitch) + ", " +
                      describe(signal.roll) + ")");
        }
        if (frame_count % kProgressInterval == 0) {
            LOG_INFO("Session " + session_id + ": processed " + std::to_string(frame_count) +
                     " frames (" + std::to_string(tracker.get_events().size()) + " events so far)");
        }
    }

    FrameSignal build_signal(const FrameMeasurement& measurement) {
        FrameSignal signal;
        signal.timestamp = measurement.timestamp;
        signal.num_faces = measurement.num_faces;

        if (measurement.gaze_ratio) {
            const GazeAngles angles = smoother.smooth(*measurement.gaze_ratio);
            if (std::isfinite(angles.horizontal) && std::isfinite(angles.vertical)) {
                signal.gaze_h = angles.horizontal;
                signal.gaze_v = angles.vertical;
            }
        }

        if (measurement.pose_points) {
            const HeadPose pose = solver.solve(*measurement.pose_points, measurement.frame_size);
            signal.yaw = pose.yaw;
            signal.pitch = pose.pitch;
            signal.roll = pose.roll;
        }

        return signal;
    }

    void log_breakdown() const {
        const auto counts = tracker.get_counts();
        std::size_t total = 0;
        for (ViolationCategory category : kAllViolationCategories) {
            const std::size_t count = counts[category_index(category)];
            total += count;
            if (count > 0) {
                std::ostringstream oss;
                oss << "  " << category_to_string(category) << ": " << count;
                if (is_angle_category(category)) {
                    oss << " (max " << utils::MathUtils::roundTo(
                        tracker.get_max_intensity(category), 1) << " deg)";
                }
                LOG_INFO(oss.str());
            }
        }
        LOG_INFO("Session " + session_id + ": " + std::to_string(total) + " event(s) in total");
    }
};

// ===== Public API Implementation =====

SessionAnalyzer::SessionAnalyzer(const std::string& session_id, const core::ProctoringConfig& config)
    : pImpl(std::make_unique<Impl>(session_id, config)) {
    const Thresholds& t = config.thresholds;
    std::ostringstream oss;
    oss << "Session " << session_id << " started with thresholds: eye_h=" << t.eye_horizontal
        << " eye_v=" << t.eye_vertical << " yaw=" << t.yaw << " pitch=" << t.pitch
        << " roll=" << t.roll;
    LOG_INFO(oss.str());
}

SessionAnalyzer::~SessionAnalyzer() = default;

SessionAnalyzer::SessionAnalyzer(SessionAnalyzer&&) noexcept = default;
SessionAnalyzer& SessionAnalyzer::operator=(SessionAnalyzer&&) noexcept = default;

FrameSignal SessionAnalyzer::process(const FrameMeasurement& measurement) {
    pImpl->ensure_open();
    FrameSignal signal = pImpl->build_signal(measurement);
    pImpl->track(signal);
    return signal;
}

void SessionAnalyzer::process(const FrameSignal& signal) {
    pImpl->ensure_open();
    pImpl->track(signal);
}

report::AnalysisReport SessionAnalyzer::finish(double video_duration_sec) {
    pImpl->ensure_open();

    pImpl->tracker.finalize();
    pImpl->finished = true;

    const auto events = pImpl->tracker.get_events();
    LOG_INFO("Session " + pImpl->session_id + ": event breakdown");
    pImpl->log_breakdown();

    report::AnalysisReport result;
    result.session_id = pImpl->session_id;
    result.gestures = report::EventReportBuilder::build(events);
    result.thresholds_used = pImpl->config.thresholds;

    const double elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - pImpl->start_time).count();
    result.metadata.processing_time_sec = utils::MathUtils::roundTo(elapsed, 0);
    result.metadata.video_duration_sec =
        std::isfinite(video_duration_sec) ? utils::MathUtils::roundTo(std::max(0.0, video_duration_sec), 0) : 0.0;
    result.metadata.frames_processed = pImpl->frame_count;

    LOG_INFO("Session " + pImpl->session_id + " finished: " +
             std::to_string(pImpl->frame_count) + " frames in " +
             std::to_string(elapsed) + "s");
    return result;
}

void SessionAnalyzer::set_event_callback(ViolationCallback callback) {
    pImpl->tracker.set_event_callback(std::move(callback));
}

std::vector<ViolationEvent> SessionAnalyzer::get_events() const {
    return pImpl->tracker.get_events();
}

const ViolationTracker& SessionAnalyzer::tracker() const {
    return pImpl->tracker;
}

std::size_t SessionAnalyzer::frames_processed() const {
    return pImpl->frame_count;
}

bool SessionAnalyzer::is_finished() const {
    return pImpl->finished;
}

const std::string& SessionAnalyzer::session_id() const {
    return pImpl->session_id;
}

} // namespace pipeline
} // namespace proctor
