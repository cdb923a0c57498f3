#pragma once

#include "proctor/detection/DetectionTypes.hpp"
#include <yaml-cpp/yaml.h>
#include <string>

/**
 * @file Configuration.hpp
 * @brief YAML backed run configuration
 */

namespace proctor {
namespace core {

/**
 * @brief Video sampling parameters
 */
struct VideoConfig {
    double target_fps = 15.0;   ///< Analysis rate; frames are skipped down to this
};

/**
 * @brief Logging parameters
 */
struct LoggingConfig {
    std::string level = "info";
    std::string directory;      ///< Empty disables the log file
};

/**
 * @brief Typed, validated configuration for one analysis run
 */
struct ProctoringConfig {
    detection::Thresholds thresholds;
    detection::SmootherConfig smoothing;
    detection::TrackerConfig tracking;
    detection::GazeConfig gaze;
    VideoConfig video;
    LoggingConfig logging;
};

/**
 * @brief Process-wide configuration store
 *
 * Keys are addressed with dotted paths ("thresholds.yaw"). Missing keys fall
 * back to the supplied default.
 *
 * Example file:
 * @code
 * thresholds:
 *   eye_horizontal: 8.0
 *   yaw: 30.0
 * tracking:
 *   min_event_duration_sec: 0.15
 * @endcode
 */
class Configuration {
public:
    static Configuration& getInstance();

    /**
     * @brief Load a YAML file, replacing any previous content
     * @return false if the file is missing or not valid YAML
     */
    bool load(const std::string& filename);

    /**
     * @brief Load YAML from a string, replacing any previous content
     */
    bool loadFromString(const std::string& yaml);

    /**
     * @brief Drop all loaded values
     */
    void clear();

    bool isLoaded() const { return loaded_; }

    const std::string& getSource() const { return source_; }

    /**
     * @brief Check whether a dotted key is present
     */
    bool has(const std::string& key) const;

    /**
     * @brief Read a value, returning the default when missing or unconvertible
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue) const {
        YAML::Node node = find(key);
        if (!node || node.IsNull()) {
            return defaultValue;
        }
        try {
            return node.as<T>();
        } catch (const YAML::Exception&) {
            return defaultValue;
        }
    }

    /**
     * @brief Assemble and validate the analysis configuration
     *
     * Missing keys take their defaults.
     * @throws ConfigException on a value of the wrong type or out of range
     */
    ProctoringConfig getProctoringConfig() const;

private:
    Configuration() = default;

    YAML::Node find(const std::string& key) const;

    template<typename T>
    T require(const std::string& key, const T& defaultValue) const;

    YAML::Node config_;
    bool loaded_ = false;
    std::string source_;
};

} // namespace core
} // namespace proctor
