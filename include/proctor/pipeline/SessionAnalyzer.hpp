/**
 * @file SessionAnalyzer.hpp
 * @brief Per-session orchestration of smoothing, pose recovery and tracking
 *
 * @copyright 2025 Proctor Project
 * @license MIT License
 */

#ifndef PROCTOR_PIPELINE_SESSION_ANALYZER_HPP
#define PROCTOR_PIPELINE_SESSION_ANALYZER_HPP

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include "proctor/core/Configuration.hpp"
#include "proctor/detection/DetectionTypes.hpp"
#include "proctor/detection/ViolationTracker.hpp"
#include "proctor/report/ReportTypes.hpp"

namespace proctor {
namespace pipeline {

/**
 * @brief Analysis of one video stream
 *
 * Owns a fresh AngleSmoother, HeadPoseSolver and ViolationTracker. Frames
 * must be supplied in timestamp order; finish() flushes active violations
 * and produces the report.
 *
 * Usage:
 * @code
 * SessionAnalyzer session("exam-42", config);
 * for (const auto& m : measurements) {
 *     session.process(m);
 * }
 * report::AnalysisReport result = session.finish(video_duration);
 * @endcode
 *
 * Thread-safety: Not thread-safe. Use one instance per video stream.
 */
class SessionAnalyzer {
public:
    /**
     * @throws core::ConfigException if the configuration is invalid
     */
    explicit SessionAnalyzer(const std::string& session_id,
                             const core::ProctoringConfig& config = core::ProctoringConfig{});

    ~SessionAnalyzer();

    // Disable copy, allow move
    SessionAnalyzer(const SessionAnalyzer&) = delete;
    SessionAnalyzer& operator=(const SessionAnalyzer&) = delete;
    SessionAnalyzer(SessionAnalyzer&&) noexcept;
    SessionAnalyzer& operator=(SessionAnalyzer&&) noexcept;

    /**
     * @brief Smooth gaze, solve pose and track one raw measurement
     *
     * Absent gaze ratios or pose points skip the smoother or solver for
     * that frame.
     *
     * @return Signal that was fed to the tracker
     * @throws core::ProcessingException after finish()
     * @throws core::InputException on out-of-order timestamps
     */
    detection::FrameSignal process(const detection::FrameMeasurement& measurement);

    /**
     * @brief Track one precomputed signal
     * @throws core::ProcessingException after finish()
     * @throws core::InputException on out-of-order timestamps
     */
    void process(const detection::FrameSignal& signal);

    /**
     * @brief Finalize the tracker and assemble the report
     * @throws core::ProcessingException if called twice
     */
    report::AnalysisReport finish(double video_duration_sec);

    void set_event_callback(detection::ViolationCallback callback);

    std::vector<detection::ViolationEvent> get_events() const;

    const detection::ViolationTracker& tracker() const;

    std::size_t frames_processed() const;

    bool is_finished() const;

    const std::string& session_id() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace pipeline
} // namespace proctor

#endif // PROCTOR_PIPELINE_SESSION_ANALYZER_HPP
