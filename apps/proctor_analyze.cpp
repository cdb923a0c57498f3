/**
 * @file proctor_analyze.cpp
 * @brief Command-line attention deviation analysis of a signal or measurement file
 */

#include "proctor/core/Configuration.hpp"
#include "proctor/core/Logger.hpp"
#include "proctor/core/exception.h"
#include "proctor/core/types.hpp"
#include "proctor/io/SignalReader.hpp"
#include "proctor/pipeline/FrameSampler.hpp"
#include "proctor/pipeline/SessionAnalyzer.hpp"
#include "proctor/report/ReportWriter.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <string>

using namespace proctor;

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitUsage = 1;
constexpr int kExitRuntime = 2;

struct Options {
    std::string input;
    std::string configFile;
    std::string sessionId = "session";
    std::string output;
    std::string logDir;
    double fps = 30.0;
    int width = 640;
    int height = 480;
    bool verbose = false;
};

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " --input FILE [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -h, --help           Show this help message" << std::endl;
    std::cout << "  -i, --input FILE     Signal or measurement CSV file" << std::endl;
    std::cout << "  -c, --config FILE    Load configuration from YAML file" << std::endl;
    std::cout << "  -f, --fps FPS        Source video frame rate (default: 30)" << std::endl;
    std::cout << "      --width W        Frame width in pixels (default: 640)" << std::endl;
    std::cout << "      --height H       Frame height in pixels (default: 480)" << std::endl;
    std::cout << "  -s, --session ID     Session identifier for the report" << std::endl;
    std::cout << "  -o, --output FILE    Write JSON report to file (default: stdout)" << std::endl;
    std::cout << "      --log-dir DIR    Write a timestamped log file to DIR" << std::endl;
    std::cout << "  -v, --verbose        Enable verbose logging" << std::endl;
}

void printTimeline(std::ostream& out, const report::AnalysisReport& result) {
    out << "\n=== Attention Timeline: " << result.session_id << " ===" << std::endl;
    if (result.gestures.empty()) {
        out << "No violations detected" << std::endl;
    }
    for (const auto& group : result.gestures) {
        out << group.name << " (" << group.occurrences.size() << ")" << std::endl;
        for (const auto& occurrence : group.occurrences) {
            out << "  " << std::setw(6) << occurrence.timestamp
                << "  " << std::fixed << std::setprecision(1) << occurrence.duration << "s";
            if (!occurrence.direction.empty()) {
                out << "  " << occurrence.direction;
            }
            if (!occurrence.intensity.empty()) {
                out << "  " << occurrence.intensity;
            }
            out << std::endl;
        }
    }
    out << "Frames processed: " << result.metadata.frames_processed
        << ", video duration: " << std::setprecision(0) << result.metadata.video_duration_sec
        << "s" << std::endl;
}

report::AnalysisReport analyze(const Options& options, const core::ProctoringConfig& config) {
    const io::SignalFile file = io::SignalReader::read_file(options.input);
    pipeline::SessionAnalyzer session(options.sessionId, config);

    double videoDuration = 0.0;
    if (file.format == io::SignalFileFormat::SIGNAL) {
        for (const auto& signal : file.signals) {
            session.process(signal);
            videoDuration = std::max(videoDuration, signal.timestamp);
        }
    } else {
        pipeline::FrameSampler sampler(options.fps, config.video.target_fps);
        LOG_INFO("Frame skip " + std::to_string(sampler.frame_skip()) + " at " +
                 std::to_string(options.fps) + " fps");

        const auto measurements = io::SignalReader::to_measurements(
            file.measurements, sampler, cv::Size(options.width, options.height));
        for (const auto& measurement : measurements) {
            session.process(measurement);
        }

        int64_t totalFrames = 0;
        for (const auto& row : file.measurements) {
            totalFrames = std::max(totalFrames, row.frame + 1);
        }
        videoDuration = pipeline::FrameSampler::video_duration(totalFrames, options.fps);
    }

    return session.finish(videoDuration);
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return kExitSuccess;
            } else if ((arg == "-i" || arg == "--input") && i + 1 < argc) {
                options.input = argv[++i];
            } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
                options.configFile = argv[++i];
            } else if ((arg == "-f" || arg == "--fps") && i + 1 < argc) {
                options.fps = std::stod(argv[++i]);
            } else if (arg == "--width" && i + 1 < argc) {
                options.width = std::stoi(argv[++i]);
            } else if (arg == "--height" && i + 1 < argc) {
                options.height = std::stoi(argv[++i]);
            } else if ((arg == "-s" || arg == "--session") && i + 1 < argc) {
                options.sessionId = argv[++i];
            } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
                options.output = argv[++i];
            } else if (arg == "--log-dir" && i + 1 < argc) {
                options.logDir = argv[++i];
            } else if (arg == "-v" || arg == "--verbose") {
                options.verbose = true;
            } else {
                std::cerr << "Unknown option: " << arg << std::endl;
                printUsage(argv[0]);
                return kExitUsage;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid option value: " << e.what() << std::endl;
        printUsage(argv[0]);
        return kExitUsage;
    }

    if (options.input.empty()) {
        std::cerr << "Missing required --input" << std::endl;
        printUsage(argv[0]);
        return kExitUsage;
    }

    auto& logger = core::Logger::getInstance();

    try {
        auto& configuration = core::Configuration::getInstance();
        if (!options.configFile.empty() && !configuration.load(options.configFile)) {
            PROCTOR_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_NOT_FOUND,
                               "Cannot load configuration " + options.configFile);
        }
        const core::ProctoringConfig config = configuration.getProctoringConfig();

        const core::LogLevel level = options.verbose ? core::LogLevel::DEBUG
                                                     : core::logLevelFromString(config.logging.level);
        logger.setLevel(level);

        const std::string logDir = options.logDir.empty() ? config.logging.directory : options.logDir;
        if (!logDir.empty()) {
            if (logger.initializeWithTimestamp(logDir, level)) {
                LOG_INFO("File logging initialized: " + logger.getCurrentLogFile());
            } else {
                std::cerr << "[LOGGING] Warning: File logging initialization failed, using console only" << std::endl;
            }
        }

        logger.setSessionTag(options.sessionId);
        LOG_INFO("proctor_analyze v" + core::API_VERSION.toString());
        LOG_INFO("Input: " + options.input);

        const report::AnalysisReport result = analyze(options, config);
        // stdout carries only the JSON report when no output file is given
        if (options.output.empty()) {
            printTimeline(std::cerr, result);
            std::cout << report::ReportWriter::to_string(result) << std::endl;
        } else {
            printTimeline(std::cout, result);
            report::ReportWriter::write_file(result, options.output);
        }
    } catch (const core::Exception& e) {
        LOG_ERROR(e.what());
        logger.flush();
        return kExitRuntime;
    } catch (const std::exception& e) {
        LOG_CRITICAL(std::string("Unexpected error: ") + e.what());
        logger.flush();
        return kExitRuntime;
    }

    logger.flush();
    return kExitSuccess;
}
