/**
 * @file AngleSmoother.cpp
 * @brief Implementation of Kalman + weighted moving average gaze smoothing
 */

#include "proctor/detection/AngleSmoother.hpp"
#include "proctor/core/Logger.hpp"
#include "proctor/utils/MathUtils.hpp"
#include <cmath>
#include <deque>
#include <optional>

namespace proctor {
namespace detection {

namespace {

/**
 * @brief Single-axis constant velocity Kalman filter
 *
 * State: [position, velocity]. Measurement: position.
 */
struct AxisKalman {
    cv::Vec2d state;
    cv::Matx22d covariance = cv::Matx22d::zeros();

    void seed(double position) {
        state = cv::Vec2d(position, 0.0);
        covariance = cv::Matx22d::zeros();
    }
};

/**
 * @brief Result of one predict/correct cycle, committed only when finite
 */
struct AxisUpdate {
    cv::Vec2d state;
    cv::Matx22d covariance;
};

std::optional<AxisUpdate> predict_and_correct(const AxisKalman& filter,
                                              double measurement,
                                              const cv::Matx22d& transition,
                                              const cv::Matx22d& process_noise,
                                              double measurement_noise) {
    // Predict
    const cv::Vec2d predicted = transition * filter.state;
    const cv::Matx22d predicted_cov = transition * filter.covariance * transition.t() + process_noise;

    // Correct (H = [1 0])
    const double innovation_cov = predicted_cov(0, 0) + measurement_noise;
    if (!std::isfinite(innovation_cov) || std::abs(innovation_cov) < 1e-12) {
        return std::nullopt;
    }

    const cv::Vec2d gain(predicted_cov(0, 0) / innovation_cov,
                         predicted_cov(1, 0) / innovation_cov);
    const double innovation = measurement - predicted[0];

    const cv::Matx22d gain_h(gain[0], 0.0,
                             gain[1], 0.0);

    AxisUpdate update;
    update.state = predicted + gain * innovation;
    update.covariance = (cv::Matx22d::eye() - gain_h) * predicted_cov;

    if (!std::isfinite(update.state[0]) || !std::isfinite(update.state[1])) {
        return std::nullopt;
    }
    return update;
}

} // namespace

/**
 * @brief PIMPL implementation for AngleSmoother
 */
class AngleSmoother::Impl {
public:
    SmootherConfig config;

    const cv::Matx22d transition{1.0, 1.0,
                                 0.0, 1.0};
    cv::Matx22d process_noise;

    AxisKalman horizontal;
    AxisKalman vertical;
    bool initialized = false;

    std::deque<GazeAngles> history;

    explicit Impl(const SmootherConfig& cfg)
        : config(cfg.is_valid() ? cfg : SmootherConfig{}) {
        if (!cfg.is_valid()) {
            LOG_WARNING("AngleSmoother: invalid configuration, using defaults");
        }
        process_noise = cv::Matx22d::eye() * config.process_noise;
    }

    GazeAngles kalman_step(const GazeAngles& raw) {
        if (!initialized) {
            horizontal.seed(raw.horizontal);
            vertical.seed(raw.vertical);
            initialized = true;
            return raw;
        }

        auto h_update = predict_and_correct(horizontal, raw.horizontal, transition,
                                            process_noise, config.measurement_noise);
        auto v_update = predict_and_correct(vertical, raw.vertical, transition,
                                            process_noise, config.measurement_noise);

        if (!h_update || !v_update) {
            LOG_DEBUG("AngleSmoother: filter update not finite, returning raw angles");
            return raw;
        }

        horizontal.state = h_update->state;
        horizontal.covariance = h_update->covariance;
        vertical.state = v_update->state;
        vertical.covariance = v_update->covariance;

        return GazeAngles{horizontal.state[0], vertical.state[0]};
    }

    void push_history(const GazeAngles& angles) {
        history.push_back(angles);
        while (history.size() > config.history_capacity) {
            history.pop_front();
        }
    }

    GazeAngles weighted_average() const {
        const std::size_t window = kRecencyWeights.size();
        const std::size_t offset = history.size() - window;

        double weight_sum = 0.0;
        GazeAngles blended;
        for (std::size_t i = 0; i < window; ++i) {
            const GazeAngles& sample = history[offset + i];
            blended.horizontal += sample.horizontal * kRecencyWeights[i];
            blended.vertical += sample.vertical * kRecencyWeights[i];
            weight_sum += kRecencyWeights[i];
        }

        blended.horizontal /= weight_sum;
        blended.vertical /= weight_sum;
        return blended;
    }

    GazeAngles smooth(double horizontal_ratio, double vertical_ratio) {
        GazeAngles raw{ratio_to_angle(horizontal_ratio, config.angle_compression),
                       ratio_to_angle(vertical_ratio, config.angle_compression)};

        if (!std::isfinite(raw.horizontal) || !std::isfinite(raw.vertical)) {
            // Nothing sensible to filter; keep state and history intact
            return raw;
        }

        GazeAngles result = kalman_step(raw);
        push_history(result);

        if (history.size() >= kRecencyWeights.size()) {
            result = weighted_average();
        }

        return GazeAngles{utils::MathUtils::roundTo(result.horizontal, 2),
                          utils::MathUtils::roundTo(result.vertical, 2)};
    }

    void reset() {
        initialized = false;
        horizontal.seed(0.0);
        vertical.seed(0.0);
        history.clear();
    }
};

// ===== Public API Implementation =====

AngleSmoother::AngleSmoother(const SmootherConfig& config)
    : pImpl(std::make_unique<Impl>(config)) {
}

AngleSmoother::~AngleSmoother() = default;

AngleSmoother::AngleSmoother(AngleSmoother&&) noexcept = default;
AngleSmoother& AngleSmoother::operator=(AngleSmoother&&) noexcept = default;

GazeAngles AngleSmoother::smooth(double horizontal_ratio, double vertical_ratio) {
    return pImpl->smooth(horizontal_ratio, vertical_ratio);
}

GazeAngles AngleSmoother::smooth(const GazeRatio& ratio) {
    return pImpl->smooth(ratio.horizontal, ratio.vertical);
}

void AngleSmoother::reset() {
    pImpl->reset();
}

bool AngleSmoother::is_initialized() const {
    return pImpl->initialized;
}

std::size_t AngleSmoother::history_size() const {
    return pImpl->history.size();
}

SmootherConfig AngleSmoother::get_config() const {
    return pImpl->config;
}

double AngleSmoother::ratio_to_angle(double ratio, double compression) {
    if (!std::isfinite(ratio)) {
        return ratio;
    }
    const double clamped = utils::MathUtils::clamp(ratio, -1.0, 1.0);
    return utils::MathUtils::radToDeg(std::asin(clamped * compression));
}

} // namespace detection
} // namespace proctor
