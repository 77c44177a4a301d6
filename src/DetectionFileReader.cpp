/**
 * @file DetectionFileReader.cpp
 * @brief MOTChallenge 检测文件读取的实现文件。
 */

#include "DetectionFileReader.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace {

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(field);
    }
    return fields;
}

double to_number(const std::string& field, const std::string& source, int line_number) {
    size_t consumed = 0;
    double value = 0.0;
    try {
        value = std::stod(field, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    // 允许数字后面跟空白（例如行尾的 \r）
    if (consumed == 0 ||
        field.find_first_not_of(" \t\r", consumed) != std::string::npos) {
        throw std::runtime_error(source + ":" + std::to_string(line_number) +
                                 ": invalid number '" + field + "'");
    }
    return value;
}

// 帧号和类别必须是 int 范围内的整数，拒绝 nan、inf、1e20、2.5 之类的值
int to_integer(const std::string& field, const std::string& source, int line_number) {
    double value = to_number(field, source, line_number);
    if (!std::isfinite(value) || value != std::floor(value) ||
        value < static_cast<double>(std::numeric_limits<int>::min()) ||
        value > static_cast<double>(std::numeric_limits<int>::max())) {
        throw std::runtime_error(source + ":" + std::to_string(line_number) +
                                 ": expected an integer, got '" + field + "'");
    }
    return static_cast<int>(value);
}

}  // namespace

DetectionFileReader::DetectionFileReader(const std::string& path, int default_class_id)
    : default_class_id_(default_class_id), last_frame_(0), count_(0) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("cannot open detection file: " + path);
    }
    parse(input, path);
}

DetectionFileReader::DetectionFileReader(std::istream& input, int default_class_id)
    : default_class_id_(default_class_id), last_frame_(0), count_(0) {
    parse(input, "<stream>");
}

void DetectionFileReader::parse(std::istream& input, const std::string& source) {
    std::string line;
    int line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        size_t start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos || line[start] == '#') {
            continue;
        }

        std::vector<std::string> fields = split_fields(line);
        if (fields.size() < 7) {
            throw std::runtime_error(source + ":" + std::to_string(line_number) +
                                     ": expected at least 7 fields, got " +
                                     std::to_string(fields.size()));
        }

        int frame = to_integer(fields[0], source, line_number);
        if (frame < 1) {
            throw std::runtime_error(source + ":" + std::to_string(line_number) +
                                     ": frame numbers start at 1");
        }

        Detection detection;
        detection.box = cv::Rect2f(static_cast<float>(to_number(fields[2], source, line_number)),
                                   static_cast<float>(to_number(fields[3], source, line_number)),
                                   static_cast<float>(to_number(fields[4], source, line_number)),
                                   static_cast<float>(to_number(fields[5], source, line_number)));
        detection.confidence = static_cast<float>(to_number(fields[6], source, line_number));
        detection.class_id = default_class_id_;
        if (fields.size() > 7) {
            int class_id = to_integer(fields[7], source, line_number);
            if (class_id >= 0) {
                detection.class_id = class_id;
            }
        }

        // 合法性检查留给 TrackingSession，这里只负责解析
        frames_[frame].push_back(detection);
        last_frame_ = std::max(last_frame_, frame);
        ++count_;
    }
}

std::vector<Detection> DetectionFileReader::detect(int frame_number, const cv::Mat& /*image*/) {
    auto it = frames_.find(frame_number);
    if (it == frames_.end()) {
        return {};
    }
    return it->second;
}
