#include "proctor/core/Configuration.hpp"
#include "proctor/core/Logger.hpp"
#include "proctor/core/exception.h"
#include <sstream>
#include <vector>

namespace proctor {
namespace core {

namespace {

std::vector<std::string> splitKey(const std::string& key) {
    std::vector<std::string> parts;
    std::stringstream ss(key);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

void checkPositive(const std::string& key, double value) {
    if (!(value > 0.0)) {
        PROCTOR_THROW(ConfigException, key + " must be positive (got " + std::to_string(value) + ")");
    }
}

} // namespace

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

bool Configuration::load(const std::string& filename) {
    try {
        config_ = YAML::LoadFile(filename);
        loaded_ = true;
        source_ = filename;
        LOG_INFO("Configuration loaded from " + filename);
        return true;
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Failed to load configuration " + filename + ": " + e.what());
        clear();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml) {
    try {
        config_ = YAML::Load(yaml);
        loaded_ = true;
        source_ = "<string>";
        return true;
    } catch (const YAML::Exception& e) {
        LOG_ERROR(std::string("Failed to parse configuration: ") + e.what());
        clear();
        return false;
    }
}

void Configuration::clear() {
    config_ = YAML::Node();
    loaded_ = false;
    source_.clear();
}

bool Configuration::has(const std::string& key) const {
    YAML::Node node = find(key);
    return node && !node.IsNull();
}

YAML::Node Configuration::find(const std::string& key) const {
    // Collect nodes instead of reassigning one handle: YAML::Node assignment
    // writes through to the referenced node.
    std::vector<YAML::Node> chain;
    chain.push_back(config_);

    for (const auto& part : splitKey(key)) {
        const YAML::Node& parent = chain.back();
        if (!parent || !parent.IsMap()) {
            return YAML::Node();
        }
        chain.push_back(parent[part]);
    }
    return chain.back();
}

template<typename T>
T Configuration::require(const std::string& key, const T& defaultValue) const {
    YAML::Node node = find(key);
    if (!node || node.IsNull()) {
        return defaultValue;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception& e) {
        PROCTOR_THROW(ConfigException, "Invalid value for " + key + ": " + e.what());
    }
}

ProctoringConfig Configuration::getProctoringConfig() const {
    ProctoringConfig cfg;

    auto& t = cfg.thresholds;
    t.eye_horizontal = require<double>("thresholds.eye_horizontal", t.eye_horizontal);
    t.eye_vertical = require<double>("thresholds.eye_vertical", t.eye_vertical);
    t.yaw = require<double>("thresholds.yaw", t.yaw);
    t.pitch = require<double>("thresholds.pitch", t.pitch);
    t.roll = require<double>("thresholds.roll", t.roll);
    checkPositive("thresholds.eye_horizontal", t.eye_horizontal);
    checkPositive("thresholds.eye_vertical", t.eye_vertical);
    checkPositive("thresholds.yaw", t.yaw);
    checkPositive("thresholds.pitch", t.pitch);
    checkPositive("thresholds.roll", t.roll);

    auto& s = cfg.smoothing;
    s.process_noise = require<double>("smoothing.process_noise", s.process_noise);
    s.measurement_noise = require<double>("smoothing.measurement_noise", s.measurement_noise);
    const int capacity = require<int>("smoothing.history_capacity",
                                      static_cast<int>(s.history_capacity));
    s.angle_compression = require<double>("smoothing.angle_compression", s.angle_compression);
    checkPositive("smoothing.process_noise", s.process_noise);
    checkPositive("smoothing.measurement_noise", s.measurement_noise);
    if (capacity < 5) {
        PROCTOR_THROW(ConfigException, "smoothing.history_capacity must be at least 5 (got " +
                      std::to_string(capacity) + ")");
    }
    s.history_capacity = static_cast<std::size_t>(capacity);
    if (!(s.angle_compression > 0.0 && s.angle_compression <= 1.0)) {
        PROCTOR_THROW(ConfigException, "smoothing.angle_compression must be in (0, 1]");
    }

    cfg.tracking.min_event_duration_sec =
        require<double>("tracking.min_event_duration_sec", cfg.tracking.min_event_duration_sec);
    if (!cfg.tracking.is_valid()) {
        PROCTOR_THROW(ConfigException, "tracking.min_event_duration_sec must not be negative");
    }

    cfg.gaze.min_eye_aspect_ratio =
        require<double>("gaze.min_eye_aspect_ratio", cfg.gaze.min_eye_aspect_ratio);
    cfg.gaze.min_eye_width_px = require<double>("gaze.min_eye_width_px", cfg.gaze.min_eye_width_px);
    if (!cfg.gaze.is_valid()) {
        PROCTOR_THROW(ConfigException, "gaze validity floors must not be negative");
    }

    cfg.video.target_fps = require<double>("video.target_fps", cfg.video.target_fps);
    checkPositive("video.target_fps", cfg.video.target_fps);

    cfg.logging.level = require<std::string>("logging.level", cfg.logging.level);
    cfg.logging.directory = require<std::string>("logging.directory", cfg.logging.directory);

    return cfg;
}

} // namespace core
} // namespace proctor
