#include "proctor/pipeline/FrameSampler.hpp"
#include "proctor/core/exception.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace proctor {
namespace pipeline {

FrameSampler::FrameSampler(double fps, double target_fps)
    : fps_(fps)
    , target_fps_(target_fps)
    , frame_skip_(1) {
    if (!std::isfinite(fps) || fps <= 0.0) {
        PROCTOR_THROW(core::InputException, "Video frame rate must be positive (got " +
                      std::to_string(fps) + ")");
    }
    if (!std::isfinite(target_fps) || target_fps <= 0.0) {
        PROCTOR_THROW(core::InputException, "Target frame rate must be positive (got " +
                      std::to_string(target_fps) + ")");
    }
    // Saturate before the cast; a huge fps/target ratio would overflow int
    const double ratio = std::min(fps / target_fps,
                                  static_cast<double>(std::numeric_limits<int>::max()));
    frame_skip_ = std::max(1, static_cast<int>(ratio));
}

bool FrameSampler::should_process(int64_t frame_index) const {
    return frame_index >= 0 && frame_index % frame_skip_ == 0;
}

double FrameSampler::timestamp(int64_t frame_index) const {
    return static_cast<double>(frame_index) / fps_;
}

double FrameSampler::video_duration(int64_t total_frames, double fps) {
    if (!(fps > 0.0) || total_frames <= 0) {
        return 0.0;
    }
    return static_cast<double>(total_frames) / fps;
}

} // namespace pipeline
} // namespace proctor
