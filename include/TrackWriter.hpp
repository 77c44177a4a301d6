/**
 * @file TrackWriter.hpp
 * @brief 以 MOTChallenge 结果格式输出轨迹。
 */

#pragma once

#include "TrackingSession.hpp"

#include <fstream>
#include <ostream>
#include <string>

class TrackWriter {
public:
    /**
     * @throws std::runtime_error 输出文件无法创建。
     */
    explicit TrackWriter(const std::string& path);

    /**
     * @brief 写入一帧的轨迹，每条一行：frame,id,left,top,width,height,conf,class,-1,-1
     */
    void write(const FrameResult& frame);

    size_t lines_written() const { return lines_; }

    /**
     * @brief 生成单条轨迹的输出行（不含换行）。
     */
    static std::string format_line(int frame_number, const TrackSnapshot& track);

private:
    std::ofstream out_;
    std::string path_;
    size_t lines_;
};
