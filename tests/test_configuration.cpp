/**
 * @file test_configuration.cpp
 * @brief Unit tests for YAML configuration loading and validation
 */

#include <gtest/gtest.h>
#include <proctor/core/Configuration.hpp>
#include <proctor/core/Logger.hpp>
#include <proctor/core/exception.h>
#include <cstdio>
#include <fstream>

using namespace proctor::core;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().setLevel(LogLevel::CRITICAL);
        Configuration::getInstance().clear();
    }

    void TearDown() override {
        Configuration::getInstance().clear();
    }

    Configuration& config() { return Configuration::getInstance(); }
};

TEST_F(ConfigurationTest, DefaultsWhenNothingLoaded) {
    const ProctoringConfig cfg = config().getProctoringConfig();

    EXPECT_DOUBLE_EQ(cfg.thresholds.eye_horizontal, 8.0);
    EXPECT_DOUBLE_EQ(cfg.thresholds.eye_vertical, 6.0);
    EXPECT_DOUBLE_EQ(cfg.thresholds.yaw, 30.0);
    EXPECT_DOUBLE_EQ(cfg.thresholds.pitch, 20.0);
    EXPECT_DOUBLE_EQ(cfg.thresholds.roll, 30.0);
    EXPECT_DOUBLE_EQ(cfg.smoothing.process_noise, 0.03);
    EXPECT_DOUBLE_EQ(cfg.smoothing.measurement_noise, 0.1);
    EXPECT_EQ(cfg.smoothing.history_capacity, 7u);
    EXPECT_DOUBLE_EQ(cfg.tracking.min_event_duration_sec, 0.15);
    EXPECT_DOUBLE_EQ(cfg.gaze.min_eye_aspect_ratio, 0.12);
    EXPECT_DOUBLE_EQ(cfg.gaze.min_eye_width_px, 1.8);
    EXPECT_DOUBLE_EQ(cfg.video.target_fps, 15.0);
}

TEST_F(ConfigurationTest, OverridesFromYaml) {
    ASSERT_TRUE(config().loadFromString(
        "thresholds:\n"
        "  yaw: 25\n"
        "  eye_horizontal: 10.5\n"
        "smoothing:\n"
        "  history_capacity: 9\n"
        "tracking:\n"
        "  min_event_duration_sec: 0.3\n"
        "logging:\n"
        "  level: debug\n"));

    const ProctoringConfig cfg = config().getProctoringConfig();
    EXPECT_DOUBLE_EQ(cfg.thresholds.yaw, 25.0);
    EXPECT_DOUBLE_EQ(cfg.thresholds.eye_horizontal, 10.5);
    EXPECT_DOUBLE_EQ(cfg.thresholds.pitch, 20.0);
    EXPECT_EQ(cfg.smoothing.history_capacity, 9u);
    EXPECT_DOUBLE_EQ(cfg.tracking.min_event_duration_sec, 0.3);
    EXPECT_EQ(cfg.logging.level, "debug");
}

TEST_F(ConfigurationTest, DottedKeyAccess) {
    ASSERT_TRUE(config().loadFromString("video:\n  target_fps: 10\n"));

    EXPECT_TRUE(config().has("video.target_fps"));
    EXPECT_FALSE(config().has("video.missing"));
    EXPECT_FALSE(config().has("video.target_fps.deeper"));
    EXPECT_DOUBLE_EQ(config().get<double>("video.target_fps", 0.0), 10.0);
    EXPECT_EQ(config().get<int>("missing.key", 42), 42);
    EXPECT_EQ(config().get<std::string>("video.target_fps", ""), "10");
}

TEST_F(ConfigurationTest, RejectsNonPositiveThreshold) {
    ASSERT_TRUE(config().loadFromString("thresholds:\n  pitch: -5\n"));
    EXPECT_THROW(config().getProctoringConfig(), ConfigException);
}

TEST_F(ConfigurationTest, RejectsSmallHistory) {
    ASSERT_TRUE(config().loadFromString("smoothing:\n  history_capacity: 3\n"));
    EXPECT_THROW(config().getProctoringConfig(), ConfigException);
}

TEST_F(ConfigurationTest, RejectsBadCompressionAndNoise) {
    ASSERT_TRUE(config().loadFromString("smoothing:\n  angle_compression: 1.5\n"));
    EXPECT_THROW(config().getProctoringConfig(), ConfigException);

    ASSERT_TRUE(config().loadFromString("smoothing:\n  process_noise: 0\n"));
    EXPECT_THROW(config().getProctoringConfig(), ConfigException);
}

TEST_F(ConfigurationTest, RejectsNegativeDebounceFloor) {
    ASSERT_TRUE(config().loadFromString("tracking:\n  min_event_duration_sec: -0.1\n"));
    EXPECT_THROW(config().getProctoringConfig(), ConfigException);
}

TEST_F(ConfigurationTest, RejectsWrongType) {
    ASSERT_TRUE(config().loadFromString("thresholds:\n  yaw: sideways\n"));
    try {
        config().getProctoringConfig();
        FAIL() << "Expected ConfigException";
    } catch (const ConfigException& e) {
        EXPECT_EQ(e.getResultCode(), ResultCode::ERROR_CONFIG_INVALID);
        EXPECT_NE(e.getMessage().find("thresholds.yaw"), std::string::npos);
    }
}

TEST_F(ConfigurationTest, LoadFromFile) {
    const std::string path = ::testing::TempDir() + "proctor_config_test.yaml";
    {
        std::ofstream file(path);
        file << "thresholds:\n  eye_vertical: 4.0\n";
    }

    ASSERT_TRUE(config().load(path));
    EXPECT_TRUE(config().isLoaded());
    EXPECT_EQ(config().getSource(), path);
    EXPECT_DOUBLE_EQ(config().getProctoringConfig().thresholds.eye_vertical, 4.0);

    std::remove(path.c_str());
}

TEST_F(ConfigurationTest, MissingFileFailsToLoad) {
    EXPECT_FALSE(config().load("/nonexistent/proctor.yaml"));
    EXPECT_FALSE(config().isLoaded());
}

TEST_F(ConfigurationTest, MalformedYamlFailsToLoad) {
    EXPECT_FALSE(config().loadFromString("thresholds: [unclosed"));
    EXPECT_FALSE(config().isLoaded());
}
