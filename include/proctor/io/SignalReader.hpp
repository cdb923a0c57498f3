/**
 * @file SignalReader.hpp
 * @brief CSV readers for precomputed signals and raw landmark measurements
 *
 * @copyright 2025 Proctor Project
 * @license MIT License
 */

#ifndef PROCTOR_IO_SIGNAL_READER_HPP
#define PROCTOR_IO_SIGNAL_READER_HPP

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include "proctor/detection/DetectionTypes.hpp"
#include "proctor/pipeline/FrameSampler.hpp"

namespace proctor {
namespace io {

enum class SignalFileFormat {
    SIGNAL,        ///< timestamp,gaze_h,gaze_v,yaw,pitch,roll,num_faces
    MEASUREMENT    ///< frame,num_faces,h_ratio,v_ratio + twelve pose coordinates
};

/**
 * @brief One row of a measurement file, keyed by frame index
 */
struct MeasurementRow {
    int64_t frame = 0;
    int num_faces = 0;
    std::optional<detection::GazeRatio> gaze_ratio;
    std::optional<detection::PosePoints> pose_points;
};

struct SignalFile {
    SignalFileFormat format = SignalFileFormat::SIGNAL;
    std::vector<detection::FrameSignal> signals;      ///< SIGNAL files only
    std::vector<MeasurementRow> measurements;         ///< MEASUREMENT files only
};

/**
 * @brief Reader for the CSV formats accepted by proctor_analyze
 *
 * A header row is required and selects the format. Columns are matched by
 * name; an empty cell is an absent value.
 */
class SignalReader {
public:
    static const std::vector<std::string>& signal_columns();

    static const std::vector<std::string>& measurement_columns();

    /**
     * @brief Identify the format from the header row
     * @return nullopt when the header matches neither format
     */
    static std::optional<SignalFileFormat> detect_format(const std::string& header);

    /**
     * @throws core::FileException ERROR_FILE_NOT_FOUND if the file cannot be opened
     * @throws core::FileException ERROR_PARSE_FAILURE on a malformed header or row
     */
    static SignalFile read_file(const std::string& path);

    /**
     * @param source Name used in error messages
     */
    static SignalFile read(std::istream& input, const std::string& source = "<stream>");

    /**
     * @brief Decimate and timestamp measurement rows
     *
     * Rows whose frame index is not sampled are dropped.
     */
    static std::vector<detection::FrameMeasurement> to_measurements(
        const std::vector<MeasurementRow>& rows,
        const pipeline::FrameSampler& sampler,
        const cv::Size& frame_size);
};

} // namespace io
} // namespace proctor

#endif // PROCTOR_IO_SIGNAL_READER_HPP
