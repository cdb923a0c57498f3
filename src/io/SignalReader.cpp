/**
 * @file SignalReader.cpp
 * @brief Implementation of the CSV signal readers
 */

#include "proctor/io/SignalReader.hpp"
#include "proctor/core/Logger.hpp"
#include "proctor/core/exception.h"
#include <algorithm>
#include <array>
#include <cmath>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>

namespace proctor {
namespace io {

namespace {

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::vector<std::string> split(const std::string& raw) {
    const std::string line = trim(raw);
    std::vector<std::string> cells;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        cells.push_back(trim(cell));
    }
    if (!line.empty() && line.back() == ',') {
        cells.emplace_back();
    }
    return cells;
}

[[noreturn]] void parse_error(const std::string& source, std::size_t line, const std::string& what) {
    PROCTOR_THROW_CODE(core::FileException, core::ResultCode::ERROR_PARSE_FAILURE,
                       source + ":" + std::to_string(line) + ": " + what);
}

/**
 * @brief Cell accessor for one data row
 */
class Row {
public:
    Row(const std::map<std::string, std::size_t>& columns,
        std::vector<std::string> cells,
        const std::string& source,
        std::size_t line)
        : columns_(columns)
        , cells_(std::move(cells))
        , source_(source)
        , line_(line) {
    }

    std::optional<double> number(const std::string& column) const {
        const std::string& cell = cell_of(column);
        if (cell.empty()) {
            return std::nullopt;
        }
        std::size_t consumed = 0;
        double value = 0.0;
        try {
            value = std::stod(cell, &consumed);
        } catch (const std::exception&) {
            parse_error(source_, line_, "invalid number '" + cell + "' in column " + column);
        }
        if (consumed != cell.size()) {
            parse_error(source_, line_, "invalid number '" + cell + "' in column " + column);
        }
        return value;
    }

    double required_number(const std::string& column) const {
        const auto value = number(column);
        if (!value) {
            parse_error(source_, line_, "missing value in column " + column);
        }
        return *value;
    }

    int64_t integer(const std::string& column) const {
        const std::string& cell = cell_of(column);
        if (cell.empty()) {
            parse_error(source_, line_, "missing value in column " + column);
        }
        std::size_t consumed = 0;
        long long value = 0;
        try {
            value = std::stoll(cell, &consumed);
        } catch (const std::exception&) {
            parse_error(source_, line_, "invalid integer '" + cell + "' in column " + column);
        }
        if (consumed != cell.size()) {
            parse_error(source_, line_, "invalid integer '" + cell + "' in column " + column);
        }
        return static_cast<int64_t>(value);
    }

    int face_count() const {
        const int64_t faces = integer("num_faces");
        if (faces < 0) {
            parse_error(source_, line_, "num_faces must not be negative");
        }
        if (faces > std::numeric_limits<int>::max()) {
            parse_error(source_, line_, "num_faces out of range");
        }
        return static_cast<int>(faces);
    }

private:
    const std::string& cell_of(const std::string& column) const {
        return cells_[columns_.at(column)];
    }

    const std::map<std::string, std::size_t>& columns_;
    std::vector<std::string> cells_;
    const std::string& source_;
    std::size_t line_;
};

detection::FrameSignal parse_signal(const Row& row) {
    detection::FrameSignal signal;
    signal.timestamp = row.required_number("timestamp");
    signal.gaze_h = row.number("gaze_h");
    signal.gaze_v = row.number("gaze_v");
    signal.yaw = row.number("yaw");
    signal.pitch = row.number("pitch");
    signal.roll = row.number("roll");
    signal.num_faces = row.face_count();
    return signal;
}

MeasurementRow parse_measurement(const Row& row) {
    static const std::array<const char*, 6> kPointNames = {
        "nose", "chin", "leye", "reye", "lmouth", "rmouth"
    };

    MeasurementRow measurement;
    measurement.frame = row.integer("frame");
    measurement.num_faces = row.face_count();

    const auto h_ratio = row.number("h_ratio");
    const auto v_ratio = row.number("v_ratio");
    if (h_ratio && v_ratio) {
        measurement.gaze_ratio = detection::GazeRatio{*h_ratio, *v_ratio};
    }

    detection::PosePoints points;
    bool complete = true;
    for (std::size_t i = 0; i < kPointNames.size() && complete; ++i) {
        const std::string name = kPointNames[i];
        const auto x = row.number(name + "_x");
        const auto y = row.number(name + "_y");
        if (!x || !y) {
            complete = false;
        } else {
            points[i] = cv::Point2d(*x, *y);
        }
    }
    if (complete) {
        measurement.pose_points = points;
    }
    return measurement;
}

} // namespace

const std::vector<std::string>& SignalReader::signal_columns() {
    static const std::vector<std::string> columns = {
        "timestamp", "gaze_h", "gaze_v", "yaw", "pitch", "roll", "num_faces"
    };
    return columns;
}

const std::vector<std::string>& SignalReader::measurement_columns() {
    static const std::vector<std::string> columns = {
        "frame", "num_faces", "h_ratio", "v_ratio",
        "nose_x", "nose_y", "chin_x", "chin_y",
        "leye_x", "leye_y", "reye_x", "reye_y",
        "lmouth_x", "lmouth_y", "rmouth_x", "rmouth_y"
    };
    return columns;
}

std::optional<SignalFileFormat> SignalReader::detect_format(const std::string& header) {
    const auto cells = split(header);
    auto covers = [&cells](const std::vector<std::string>& required) {
        return std::all_of(required.begin(), required.end(), [&cells](const std::string& name) {
            return std::find(cells.begin(), cells.end(), name) != cells.end();
        });
    };

    if (covers(signal_columns())) {
        return SignalFileFormat::SIGNAL;
    }
    if (covers(measurement_columns())) {
        return SignalFileFormat::MEASUREMENT;
    }
    return std::nullopt;
}

SignalFile SignalReader::read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        PROCTOR_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_NOT_FOUND,
                           "Cannot open input file: " + path);
    }
    return read(file, path);
}

SignalFile SignalReader::read(std::istream& input, const std::string& source) {
    std::string line;
    std::size_t line_number = 0;

    // Header: first non-blank line
    std::string header;
    while (header.empty() && std::getline(input, line)) {
        line_number++;
        header = trim(line);
    }
    if (header.empty()) {
        parse_error(source, line_number, "missing header row");
    }

    const auto format = detect_format(header);
    if (!format) {
        parse_error(source, line_number, "unrecognized header '" + header + "'");
    }

    const auto header_cells = split(header);
    std::map<std::string, std::size_t> columns;
    for (std::size_t i = 0; i < header_cells.size(); ++i) {
        columns[header_cells[i]] = i;
    }

    SignalFile result;
    result.format = *format;

    while (std::getline(input, line)) {
        line_number++;
        if (trim(line).empty()) {
            continue;
        }

        auto cells = split(line);
        if (cells.size() != header_cells.size()) {
            parse_error(source, line_number, "expected " + std::to_string(header_cells.size()) +
                        " columns, found " + std::to_string(cells.size()));
        }

        Row row(columns, std::move(cells), source, line_number);
        if (result.format == SignalFileFormat::SIGNAL) {
            result.signals.push_back(parse_signal(row));
        } else {
            result.measurements.push_back(parse_measurement(row));
        }
    }

    const std::size_t rows = result.format == SignalFileFormat::SIGNAL
        ? result.signals.size() : result.measurements.size();
    LOG_INFO("Read " + std::to_string(rows) + " " +
             (result.format == SignalFileFormat::SIGNAL ? "signal" : "measurement") +
             " rows from " + source);
    return result;
}

std::vector<detection::FrameMeasurement> SignalReader::to_measurements(
    const std::vector<MeasurementRow>& rows,
    const pipeline::FrameSampler& sampler,
    const cv::Size& frame_size) {

    std::vector<detection::FrameMeasurement> measurements;
    measurements.reserve(rows.size() / static_cast<std::size_t>(sampler.frame_skip()) + 1);

    for (const auto& row : rows) {
        if (!sampler.should_process(row.frame)) {
            continue;
        }
        detection::FrameMeasurement measurement;
        measurement.timestamp = sampler.timestamp(row.frame);
        measurement.num_faces = row.num_faces;
        measurement.gaze_ratio = row.gaze_ratio;
        measurement.pose_points = row.pose_points;
        measurement.frame_size = frame_size;
        measurements.push_back(measurement);
    }
    return measurements;
}

} // namespace io
} // namespace proctor
