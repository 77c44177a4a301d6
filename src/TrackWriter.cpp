/**
 * @file TrackWriter.cpp
 * @brief MOTChallenge 结果输出的实现文件。
 */

#include "TrackWriter.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

TrackWriter::TrackWriter(const std::string& path)
    : out_(path), path_(path), lines_(0) {
    if (!out_.is_open()) {
        throw std::runtime_error("cannot create track output file: " + path);
    }
}

void TrackWriter::write(const FrameResult& frame) {
    for (const auto& track : frame.tracks) {
        out_ << format_line(frame.frame_number, track) << '\n';
        ++lines_;
    }
    if (!out_) {
        throw std::runtime_error("failed writing track output file: " + path_);
    }
}

std::string TrackWriter::format_line(int frame_number, const TrackSnapshot& track) {
    std::ostringstream line;
    line << frame_number << ',' << track.id << ','
         << std::fixed << std::setprecision(2)
         << track.box.x << ',' << track.box.y << ','
         << track.box.width << ',' << track.box.height << ','
         << std::setprecision(3) << track.confidence << ','
         << track.class_id << ",-1,-1";
    return line.str();
}
