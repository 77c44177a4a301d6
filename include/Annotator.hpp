/**
 * @file Annotator.hpp
 * @brief 把追踪结果绘制到图像上（边界框 + "#ID 类别" 标签）。
 */

#pragma once

#include "TrackingSession.hpp"

#include <opencv2/core.hpp>
#include <map>
#include <string>
#include <vector>

class Annotator {
public:
    /**
     * @param class_names 类别ID -> 名称，缺失的类别显示为数字ID。
     * @param class_aliases 名称 -> 显示用的别名。
     */
    Annotator(const std::vector<std::string>& class_names = std::vector<std::string>(),
              const std::map<std::string, std::string>& class_aliases = std::map<std::string, std::string>());

    /**
     * @brief 生成标签文本，例如 "#3 moto"。
     */
    std::string label_for(const TrackSnapshot& track) const;

    /**
     * @brief 在 frame 上原地绘制所有轨迹。Lost 轨迹用灰色细框。
     */
    void draw(cv::Mat& frame, const std::vector<TrackSnapshot>& tracks) const;

    /**
     * @brief 按ID分配一个固定的颜色，同一个ID在整个视频中颜色不变。
     */
    static cv::Scalar color_for(int track_id);

private:
    std::vector<std::string> class_names_;
    std::map<std::string, std::string> class_aliases_;
};
