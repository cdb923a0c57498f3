/**
 * @file FrameSampler.hpp
 * @brief Frame decimation and timestamping for fixed-rate video
 *
 * @copyright 2025 Proctor Project
 * @license MIT License
 */

#ifndef PROCTOR_PIPELINE_FRAME_SAMPLER_HPP
#define PROCTOR_PIPELINE_FRAME_SAMPLER_HPP

#include <cstdint>

namespace proctor {
namespace pipeline {

/**
 * @brief Reduces a video stream to roughly the target analysis rate
 *
 * frame_skip = max(1, int(fps / target_fps)); frame i is analysed when
 * i % frame_skip == 0 and stamped at i / fps seconds.
 */
class FrameSampler {
public:
    /**
     * @throws core::InputException if fps or target_fps is not positive
     */
    explicit FrameSampler(double fps, double target_fps = 15.0);

    int frame_skip() const { return frame_skip_; }

    double fps() const { return fps_; }

    double target_fps() const { return target_fps_; }

    bool should_process(int64_t frame_index) const;

    double timestamp(int64_t frame_index) const;

    /**
     * @brief Stream length in seconds; 0 when fps is not positive
     */
    static double video_duration(int64_t total_frames, double fps);

private:
    double fps_;
    double target_fps_;
    int frame_skip_;
};

} // namespace pipeline
} // namespace proctor

#endif // PROCTOR_PIPELINE_FRAME_SAMPLER_HPP
