/**
 * @file DetectionFileReader.hpp
 * @brief 从 MOTChallenge 格式的检测文件读取逐帧检测结果。
 *
 * @details
 * 每行格式：frame,id,left,top,width,height,conf,x,y,z
 * frame 从 1 开始；第 8 列若 >= 0 则被当作类别ID，否则类别为 default_class_id。
 * 空行与以 # 开头的行被忽略。
 */

#pragma once

#include "Detector.hpp"

#include <istream>
#include <map>
#include <string>
#include <vector>

class DetectionFileReader : public Detector {
public:
    /**
     * @brief 读取整个检测文件。
     * @throws std::runtime_error 文件无法打开或某一行格式错误（错误信息包含行号）。
     */
    explicit DetectionFileReader(const std::string& path, int default_class_id = -1);

    /**
     * @brief 从输入流读取，便于测试。
     */
    explicit DetectionFileReader(std::istream& input, int default_class_id = -1);

    std::vector<Detection> detect(int frame_number, const cv::Mat& image) override;

    int last_frame() const { return last_frame_; }     ///< 文件中出现的最大帧号，没有检测时为 0。
    size_t detection_count() const { return count_; }

private:
    void parse(std::istream& input, const std::string& source);

    int default_class_id_;
    std::map<int, std::vector<Detection>> frames_;
    int last_frame_;
    size_t count_;
};
