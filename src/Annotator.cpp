/**
 * @file Annotator.cpp
 * @brief 追踪结果可视化的实现文件。
 */

#include "Annotator.hpp"

#include <opencv2/imgproc.hpp>

Annotator::Annotator(const std::vector<std::string>& class_names,
                     const std::map<std::string, std::string>& class_aliases)
    : class_names_(class_names), class_aliases_(class_aliases) {}

std::string Annotator::label_for(const TrackSnapshot& track) const {
    std::string label = "#" + std::to_string(track.id);
    if (track.class_id < 0) {
        return label;
    }

    std::string name;
    if (track.class_id < static_cast<int>(class_names_.size())) {
        name = class_names_[track.class_id];
    } else {
        name = std::to_string(track.class_id);
    }

    auto alias = class_aliases_.find(name);
    if (alias != class_aliases_.end()) {
        name = alias->second;
    }
    return label + " " + name;
}

cv::Scalar Annotator::color_for(int track_id) {
    // 固定调色板，按ID取模
    static const cv::Scalar palette[] = {
        cv::Scalar(0, 255, 0),   cv::Scalar(255, 128, 0), cv::Scalar(0, 128, 255),
        cv::Scalar(255, 0, 255), cv::Scalar(0, 255, 255), cv::Scalar(255, 255, 0),
        cv::Scalar(128, 0, 255), cv::Scalar(0, 0, 255),   cv::Scalar(128, 255, 128),
        cv::Scalar(255, 128, 128)
    };
    const int size = static_cast<int>(sizeof(palette) / sizeof(palette[0]));
    int index = track_id % size;
    if (index < 0) index += size;
    return palette[index];
}

void Annotator::draw(cv::Mat& frame, const std::vector<TrackSnapshot>& tracks) const {
    if (frame.empty()) return;

    for (const auto& track : tracks) {
        cv::Rect box(cv::Point(cvRound(track.box.x), cvRound(track.box.y)),
                     cv::Point(cvRound(track.box.x + track.box.width),
                               cvRound(track.box.y + track.box.height)));
        bool lost = track.state == TrackState::Lost;
        cv::Scalar color = lost ? cv::Scalar(128, 128, 128) : color_for(track.id);

        // 绘制边界框
        cv::rectangle(frame, box, color, lost ? 1 : 2);

        // 准备标签文本
        std::string label = label_for(track);
        int baseLine = 0;
        cv::Size label_size = cv::getTextSize(label, cv::FONT_HERSHEY_SIMPLEX, 0.6, 2, &baseLine);

        // 标签放在框的上方，超出图像顶部时放到框内
        int top = box.y - label_size.height - baseLine;
        if (top < 0) top = box.y;

        // 绘制标签背景和文本
        cv::rectangle(frame, cv::Point(box.x, top),
                      cv::Point(box.x + label_size.width, top + label_size.height + baseLine),
                      color, cv::FILLED);
        cv::putText(frame, label, cv::Point(box.x, top + label_size.height),
                    cv::FONT_HERSHEY_SIMPLEX, 0.6, cv::Scalar(0, 0, 0), 2);
    }
}
