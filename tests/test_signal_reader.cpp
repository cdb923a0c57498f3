/**
 * @file test_signal_reader.cpp
 * @brief Unit tests for SignalReader and FrameSampler
 */

#include <gtest/gtest.h>
#include <proctor/io/SignalReader.hpp>
#include <proctor/pipeline/FrameSampler.hpp>
#include <proctor/core/Logger.hpp>
#include <proctor/core/exception.h>
#include <limits>
#include <sstream>

using namespace proctor;

class FrameSamplerTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::getInstance().setLevel(core::LogLevel::WARNING);
    }
};

TEST_F(FrameSamplerTest, FrameSkipFromRates) {
    EXPECT_EQ(pipeline::FrameSampler(30.0).frame_skip(), 2);
    EXPECT_EQ(pipeline::FrameSampler(60.0).frame_skip(), 4);
    EXPECT_EQ(pipeline::FrameSampler(25.0).frame_skip(), 1);
    EXPECT_EQ(pipeline::FrameSampler(10.0).frame_skip(), 1);
    EXPECT_EQ(pipeline::FrameSampler(30.0, 10.0).frame_skip(), 3);

    // Ratios beyond int range saturate
    EXPECT_EQ(pipeline::FrameSampler(1e12, 1e-3).frame_skip(), std::numeric_limits<int>::max());
}

TEST_F(FrameSamplerTest, SamplingAndTimestamps) {
    pipeline::FrameSampler sampler(30.0);
    EXPECT_TRUE(sampler.should_process(0));
    EXPECT_FALSE(sampler.should_process(1));
    EXPECT_TRUE(sampler.should_process(2));
    EXPECT_FALSE(sampler.should_process(-2));
    EXPECT_DOUBLE_EQ(sampler.timestamp(45), 1.5);
}

TEST_F(FrameSamplerTest, VideoDuration) {
    EXPECT_DOUBLE_EQ(pipeline::FrameSampler::video_duration(300, 30.0), 10.0);
    EXPECT_DOUBLE_EQ(pipeline::FrameSampler::video_duration(300, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(pipeline::FrameSampler::video_duration(0, 30.0), 0.0);
}

TEST_F(FrameSamplerTest, RejectsNonPositiveRate) {
    EXPECT_THROW(pipeline::FrameSampler(0.0), core::InputException);
    EXPECT_THROW(pipeline::FrameSampler(-30.0), core::InputException);
    EXPECT_THROW(pipeline::FrameSampler(30.0, 0.0), core::InputException);
}

class SignalReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        core::Logger::getInstance().setLevel(core::LogLevel::WARNING);
    }

    static core::ResultCode parse_code(const std::string& text) {
        std::istringstream input(text);
        try {
            io::SignalReader::read(input, "test.csv");
        } catch (const core::FileException& e) {
            return e.getResultCode();
        }
        return core::ResultCode::SUCCESS;
    }
};

TEST_F(SignalReaderTest, DetectsFormat) {
    EXPECT_EQ(io::SignalReader::detect_format("timestamp,gaze_h,gaze_v,yaw,pitch,roll,num_faces"),
              io::SignalFileFormat::SIGNAL);
    EXPECT_EQ(io::SignalReader::detect_format(
                  "frame,num_faces,h_ratio,v_ratio,nose_x,nose_y,chin_x,chin_y,leye_x,leye_y,"
                  "reye_x,reye_y,lmouth_x,lmouth_y,rmouth_x,rmouth_y"),
              io::SignalFileFormat::MEASUREMENT);
    EXPECT_FALSE(io::SignalReader::detect_format("a,b,c").has_value());
}

TEST_F(SignalReaderTest, ReadsSignalRows) {
    std::istringstream input(
        "timestamp,gaze_h,gaze_v,yaw,pitch,roll,num_faces\n"
        "0.0,1.5,-2.0,10,5,1,1\n"
        "\n"
        "0.1,,,,,,0\r\n"
        "0.2, 12.0 ,0,35.5,0,0,2\n");

    const io::SignalFile file = io::SignalReader::read(input);

    EXPECT_EQ(file.format, io::SignalFileFormat::SIGNAL);
    ASSERT_EQ(file.signals.size(), 3u);

    EXPECT_DOUBLE_EQ(file.signals[0].timestamp, 0.0);
    EXPECT_DOUBLE_EQ(*file.signals[0].gaze_h, 1.5);
    EXPECT_DOUBLE_EQ(*file.signals[0].gaze_v, -2.0);
    EXPECT_DOUBLE_EQ(*file.signals[0].yaw, 10.0);
    EXPECT_EQ(file.signals[0].num_faces, 1);

    EXPECT_FALSE(file.signals[1].gaze_h.has_value());
    EXPECT_FALSE(file.signals[1].yaw.has_value());
    EXPECT_FALSE(file.signals[1].roll.has_value());
    EXPECT_EQ(file.signals[1].num_faces, 0);

    EXPECT_DOUBLE_EQ(*file.signals[2].gaze_h, 12.0);
    EXPECT_EQ(file.signals[2].num_faces, 2);
}

TEST_F(SignalReaderTest, ReadsMeasurementRows) {
    std::istringstream input(
        "frame,num_faces,h_ratio,v_ratio,nose_x,nose_y,chin_x,chin_y,leye_x,leye_y,"
        "reye_x,reye_y,lmouth_x,lmouth_y,rmouth_x,rmouth_y\n"
        "0,1,0.1,-0.05,320,260,320,380,260,200,380,200,280,320,360,320\n"
        "1,1,,,320,260,320,380,260,200,380,200,280,320,360,320\n"
        "2,1,0.2,0.0,320,260,,,260,200,380,200,280,320,360,320\n"
        "3,0,,,,,,,,,,,,,,\n");

    const io::SignalFile file = io::SignalReader::read(input);

    EXPECT_EQ(file.format, io::SignalFileFormat::MEASUREMENT);
    ASSERT_EQ(file.measurements.size(), 4u);

    const auto& first = file.measurements[0];
    EXPECT_EQ(first.frame, 0);
    ASSERT_TRUE(first.gaze_ratio.has_value());
    EXPECT_DOUBLE_EQ(first.gaze_ratio->horizontal, 0.1);
    ASSERT_TRUE(first.pose_points.has_value());
    EXPECT_EQ((*first.pose_points)[1], cv::Point2d(320.0, 380.0));
    EXPECT_EQ((*first.pose_points)[5], cv::Point2d(360.0, 320.0));

    EXPECT_FALSE(file.measurements[1].gaze_ratio.has_value());
    EXPECT_TRUE(file.measurements[1].pose_points.has_value());

    EXPECT_TRUE(file.measurements[2].gaze_ratio.has_value());
    EXPECT_FALSE(file.measurements[2].pose_points.has_value());

    EXPECT_EQ(file.measurements[3].num_faces, 0);
    EXPECT_FALSE(file.measurements[3].pose_points.has_value());
}

TEST_F(SignalReaderTest, ConvertsMeasurementsWithSampler) {
    std::vector<io::MeasurementRow> rows(6);
    for (int i = 0; i < 6; ++i) {
        rows[i].frame = i;
        rows[i].num_faces = 1;
    }

    const pipeline::FrameSampler sampler(30.0);
    const auto measurements = io::SignalReader::to_measurements(rows, sampler, cv::Size(640, 480));

    ASSERT_EQ(measurements.size(), 3u);
    EXPECT_DOUBLE_EQ(measurements[0].timestamp, 0.0);
    EXPECT_DOUBLE_EQ(measurements[1].timestamp, 2.0 / 30.0);
    EXPECT_DOUBLE_EQ(measurements[2].timestamp, 4.0 / 30.0);
    EXPECT_EQ(measurements[2].frame_size, cv::Size(640, 480));
}

TEST_F(SignalReaderTest, MalformedInputIsParseFailure) {
    const std::string header = "timestamp,gaze_h,gaze_v,yaw,pitch,roll,num_faces\n";

    EXPECT_EQ(parse_code(""), core::ResultCode::ERROR_PARSE_FAILURE);
    EXPECT_EQ(parse_code("a,b,c\n1,2,3\n"), core::ResultCode::ERROR_PARSE_FAILURE);
    EXPECT_EQ(parse_code(header + "0.0,1,2,3\n"), core::ResultCode::ERROR_PARSE_FAILURE);
    EXPECT_EQ(parse_code(header + "0.0,abc,0,0,0,0,1\n"), core::ResultCode::ERROR_PARSE_FAILURE);
    EXPECT_EQ(parse_code(header + ",0,0,0,0,0,1\n"), core::ResultCode::ERROR_PARSE_FAILURE);
    EXPECT_EQ(parse_code(header + "0.0,0,0,0,0,0,-1\n"), core::ResultCode::ERROR_PARSE_FAILURE);
    EXPECT_EQ(parse_code(header + "0.0,0,0,0,0,0,1.5\n"), core::ResultCode::ERROR_PARSE_FAILURE);
    EXPECT_EQ(parse_code(header + "0.0,0,0,0,0,0,3000000000\n"), core::ResultCode::ERROR_PARSE_FAILURE);
    EXPECT_EQ(parse_code(header + "0.0,0,0,0,0,0,1\n"), core::ResultCode::SUCCESS);
}

TEST_F(SignalReaderTest, ParseErrorNamesLine) {
    std::istringstream input(
        "timestamp,gaze_h,gaze_v,yaw,pitch,roll,num_faces\n"
        "0.0,0,0,0,0,0,1\n"
        "0.1,x,0,0,0,0,1\n");
    try {
        io::SignalReader::read(input, "session.csv");
        FAIL() << "Expected FileException";
    } catch (const core::FileException& e) {
        EXPECT_NE(e.getMessage().find("session.csv:3"), std::string::npos);
    }
}

TEST_F(SignalReaderTest, MissingFileIsNotFound) {
    try {
        io::SignalReader::read_file("/nonexistent/signals.csv");
        FAIL() << "Expected FileException";
    } catch (const core::FileException& e) {
        EXPECT_EQ(e.getResultCode(), core::ResultCode::ERROR_FILE_NOT_FOUND);
    }
}
