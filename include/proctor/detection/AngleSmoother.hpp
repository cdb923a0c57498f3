/**
 * @file AngleSmoother.hpp
 * @brief Gaze angle derivation and temporal smoothing
 *
 * Converts per-frame iris displacement ratios into gaze angles and smooths
 * them with a constant-velocity Kalman filter followed by a recency-weighted
 * moving average.
 *
 * @copyright 2025 Proctor Project
 * @license MIT License
 */

#ifndef PROCTOR_DETECTION_ANGLE_SMOOTHER_HPP
#define PROCTOR_DETECTION_ANGLE_SMOOTHER_HPP

#include <array>
#include <cstddef>
#include <memory>
#include "DetectionTypes.hpp"

namespace proctor {
namespace detection {

/**
 * @brief Stateful gaze angle smoother
 *
 * Pipeline per call:
 * 1. angle = asin(clamp(ratio) * compression) in degrees, per axis
 * 2. Independent 2-state (position, velocity) Kalman filter per axis.
 *    The first call seeds the filter and returns the raw angle.
 * 3. Kalman output appended to a bounded history; once 5 samples are
 *    available the last 5 are blended with kRecencyWeights (oldest first)
 * 4. Result rounded to 0.01 degree
 *
 * A numeric failure inside the filter returns the raw angles for that call
 * and leaves the filter state untouched.
 *
 * Thread-safety: Not thread-safe. Use one instance per video stream.
 */
class AngleSmoother {
public:
    /// Weights applied to the last 5 history entries, oldest to newest
    static constexpr std::array<double, 5> kRecencyWeights = {0.10, 0.15, 0.20, 0.25, 0.30};

    /**
     * @brief Constructor with configuration
     *
     * Invalid configurations are replaced by the defaults.
     */
    explicit AngleSmoother(const SmootherConfig& config = SmootherConfig{});

    ~AngleSmoother();

    // Disable copy, allow move
    AngleSmoother(const AngleSmoother&) = delete;
    AngleSmoother& operator=(const AngleSmoother&) = delete;
    AngleSmoother(AngleSmoother&&) noexcept;
    AngleSmoother& operator=(AngleSmoother&&) noexcept;

    /**
     * @brief Smooth one frame of gaze ratios
     *
     * @param horizontal_ratio Horizontal displacement ratio (clamped to [-1, 1])
     * @param vertical_ratio Vertical displacement ratio (clamped to [-1, 1])
     * @return Smoothed angles in degrees, rounded to 2 decimals
     */
    GazeAngles smooth(double horizontal_ratio, double vertical_ratio);

    /**
     * @brief Smooth one frame of gaze ratios
     */
    GazeAngles smooth(const GazeRatio& ratio);

    /**
     * @brief Drop filter state and history
     */
    void reset();

    /**
     * @brief True once the filter has been seeded by a first measurement
     */
    bool is_initialized() const;

    /**
     * @brief Number of samples currently held in the rolling history
     */
    std::size_t history_size() const;

    SmootherConfig get_config() const;

    /**
     * @brief Arcsine projection of a displacement ratio
     *
     * @param ratio Displacement ratio, clamped to [-1, 1]
     * @param compression Range compression factor
     * @return Angle in degrees
     */
    static double ratio_to_angle(double ratio, double compression);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace detection
} // namespace proctor

#endif // PROCTOR_DETECTION_ANGLE_SMOOTHER_HPP
