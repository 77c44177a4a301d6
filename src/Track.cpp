/**
 * @file Track.cpp
 * @brief 单个追踪轨迹的实现文件。
 */

#include "Track.hpp"

const char* to_string(TrackState state) {
    switch (state) {
        case TrackState::Tentative: return "tentative";
        case TrackState::Confirmed: return "confirmed";
        case TrackState::Lost: return "lost";
        case TrackState::Removed: return "removed";
    }
    return "unknown";
}

Track::Track(int track_id, const Detection& detection, int frame_number)
    : id_(track_id),
      state_(TrackState::Tentative),
      class_id_(detection.class_id),
      confidence_(detection.confidence),
      motion_(detection.box),
      hit_streak_(1), // 创建这一帧算作第一次命中
      miss_streak_(0),
      total_hits_(1),
      age_(0),
      last_hit_frame_(frame_number),
      detection_index_(-1) {}

cv::Rect2f Track::predict() {
    return motion_.predict();
}

void Track::mark_hit(const Detection& detection, int frame_number) {
    motion_.update(detection.box);
    confidence_ = detection.confidence;
    ++hit_streak_;
    ++total_hits_;
    miss_streak_ = 0;
    ++age_;
    last_hit_frame_ = frame_number;
}

void Track::mark_missed() {
    motion_.coast();
    hit_streak_ = 0;
    ++miss_streak_;
    ++age_;
    detection_index_ = -1;
}
