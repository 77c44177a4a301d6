/**
 * @file TrackManager.cpp
 * @brief 轨迹生命周期管理的实现文件。
 */

#include "TrackManager.hpp"
#include "Logger.hpp"

#include <algorithm>
#include <iterator>

TrackManager::TrackManager(const TrackerConfig& config)
    : min_hits_(config.min_hits),
      max_misses_(config.max_misses),
      new_track_threshold_(config.new_track_threshold),
      next_id_(1), // 初始化追踪ID从1开始
      created_count_(0),
      removed_count_(0) {}

std::vector<TrackCandidate> TrackManager::predict() {
    std::vector<TrackCandidate> candidates;
    candidates.reserve(tracks_.size());
    for (auto& track : tracks_) {
        track.set_detection_index(-1);
        candidates.push_back({track.id(), track.hit_streak(), track.predict()});
    }
    return candidates;
}

void TrackManager::apply(const AssociationResult& association,
                         const std::vector<Detection>& detections,
                         const std::vector<int>& detection_ids,
                         int frame_number) {
    // --- 1. 匹配成功的轨迹 ---
    for (const auto& match : association.matches) {
        on_hit(tracks_[match.track], detections[match.detection],
               detection_ids[match.detection], frame_number);
    }

    // --- 2. 未匹配的轨迹 ---
    for (int index : association.unmatched_tracks) {
        on_miss(tracks_[index]);
    }

    // --- 3. 删除进入 Removed 状态的轨迹 ---
    auto removed_begin = std::remove_if(tracks_.begin(), tracks_.end(),
        [](const Track& track) { return track.state() == TrackState::Removed; });
    removed_count_ += static_cast<int>(std::distance(removed_begin, tracks_.end()));
    tracks_.erase(removed_begin, tracks_.end());

    // --- 4. 为未匹配的检测创建新轨迹 ---
    for (int index : association.unmatched_detections) {
        if (detections[index].confidence >= new_track_threshold_) {
            create_track(detections[index], detection_ids[index], frame_number);
        }
    }
}

void TrackManager::clear() {
    tracks_.clear();
    next_id_ = 1;
    created_count_ = 0;
    removed_count_ = 0;
}

const Track* TrackManager::find(int track_id) const {
    auto it = std::lower_bound(tracks_.begin(), tracks_.end(), track_id,
        [](const Track& track, int id) { return track.id() < id; });
    if (it != tracks_.end() && it->id() == track_id) {
        return &*it;
    }
    return nullptr;
}

void TrackManager::on_hit(Track& track, const Detection& detection, int detection_id, int frame_number) {
    TrackState previous = track.state();
    track.mark_hit(detection, frame_number);
    track.set_detection_index(detection_id);

    if (previous == TrackState::Lost) {
        track.set_state(TrackState::Confirmed);
        FRAMETRACK_LOG_DEBUG("lifecycle", "track {} recovered at frame {}", track.id(), frame_number);
    } else if (previous == TrackState::Tentative && track.hit_streak() >= min_hits_) {
        track.set_state(TrackState::Confirmed);
        FRAMETRACK_LOG_DEBUG("lifecycle", "track {} confirmed at frame {}", track.id(), frame_number);
    }
}

void TrackManager::on_miss(Track& track) {
    track.mark_missed();

    switch (track.state()) {
        case TrackState::Tentative:
            track.set_state(TrackState::Removed);
            FRAMETRACK_LOG_DEBUG("lifecycle", "tentative track {} dropped", track.id());
            return;
        case TrackState::Confirmed:
            track.set_state(TrackState::Lost);
            FRAMETRACK_LOG_DEBUG("lifecycle", "track {} lost", track.id());
            break;
        case TrackState::Lost:
        case TrackState::Removed:
            break;
    }

    if (track.state() == TrackState::Lost && track.miss_streak() > max_misses_) {
        track.set_state(TrackState::Removed);
        FRAMETRACK_LOG_DEBUG("lifecycle", "track {} removed after {} missed frames",
                             track.id(), track.miss_streak());
    }
}

void TrackManager::create_track(const Detection& detection, int detection_id, int frame_number) {
    tracks_.emplace_back(next_id_++, detection, frame_number);
    Track& track = tracks_.back();
    track.set_detection_index(detection_id);
    ++created_count_;

    if (track.hit_streak() >= min_hits_) {
        track.set_state(TrackState::Confirmed);
    }
    FRAMETRACK_LOG_DEBUG("lifecycle", "track {} created at frame {} (class {}, conf {:.2f})",
                         track.id(), frame_number, track.class_id(), track.confidence());
}
