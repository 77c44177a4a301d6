/**
 * @file TrackingSession.cpp
 * @brief 追踪会话实现文件。
 * @details
 * 每一帧依次执行：输入校验、预测、两阶段关联、生命周期更新、准备输出。
 */

#include "TrackingSession.hpp"
#include "LinearAssignment.hpp"
#include "Logger.hpp"

#include <stdexcept>
#include <utility>

namespace {

const TrackerConfig& validated(const TrackerConfig& config) {
    config.validate();
    return config;
}

}  // namespace

TrackingSession::TrackingSession(const TrackerConfig& config)
    : TrackingSession(config, std::make_unique<AssociationEngine>(validated(config))) {}

TrackingSession::TrackingSession(const TrackerConfig& config, std::unique_ptr<AssociationEngine> association)
    : config_(validated(config)),
      association_(std::move(association)),
      manager_(config_),
      frame_count_(0),
      failed_(false) {
    if (!association_) {
        throw std::invalid_argument("tracking session needs an association engine");
    }
}

FrameResult TrackingSession::update(const std::vector<Detection>& detections) {
    if (failed_) {
        throw SessionFailedError("tracking session failed earlier; call reset() before reuse");
    }

    FrameResult result;
    result.frame_number = ++frame_count_;
    result.filtered_count = 0;

    // --- 0. 输入校验 ---
    // 不合法的检测只影响它自己，不影响本帧其他检测
    std::vector<Detection> accepted;
    std::vector<int> accepted_ids;
    accepted.reserve(detections.size());
    accepted_ids.reserve(detections.size());
    for (size_t i = 0; i < detections.size(); ++i) {
        DetectionIssue issue = validate_detection(detections[i]);
        if (issue != DetectionIssue::None) {
            result.rejected.push_back({static_cast<int>(i), issue});
            FRAMETRACK_LOG_WARN("session", "frame {}: rejected detection {} ({})",
                                result.frame_number, i, to_string(issue));
            continue;
        }
        if (!config_.should_track_class(detections[i].class_id)) {
            ++result.filtered_count;
            continue;
        }
        accepted.push_back(detections[i]);
        accepted_ids.push_back(static_cast<int>(i));
    }

    // --- 1. 预测 (Prediction) ---
    std::vector<TrackCandidate> candidates = manager_.predict();

    // --- 2. 关联 (Association) ---
    AssociationResult association;
    try {
        association = association_->associate(candidates, accepted);
    } catch (const AssignmentError& e) {
        failed_ = true;
        FRAMETRACK_LOG_CRITICAL("session", "frame {}: association failed: {}", result.frame_number, e.what());
        throw;
    }

    // --- 3. 轨迹管理 (Track Management) ---
    manager_.apply(association, accepted, accepted_ids, result.frame_number);

    // --- 4. 准备输出 ---
    for (const auto& track : manager_.tracks()) {
        if (!should_report(track)) {
            continue;
        }
        result.tracks.push_back({track.id(), track.box(), track.velocity(), track.class_id(),
                                 track.confidence(), track.state(), track.hit_streak(),
                                 track.miss_streak(), track.age(), track.detection_index()});
    }

    FRAMETRACK_LOG_TRACE("session", "frame {}: {} detections, {} matches, {} live tracks, {} reported",
                         result.frame_number, accepted.size(), association.matches.size(),
                         manager_.tracks().size(), result.tracks.size());
    return result;
}

void TrackingSession::reset() {
    manager_.clear();
    frame_count_ = 0;
    failed_ = false;
}

bool TrackingSession::should_report(const Track& track) const {
    switch (track.state()) {
        case TrackState::Confirmed:
            return true;
        case TrackState::Lost:
            return track.miss_streak() <= config_.report_lost_within;
        case TrackState::Tentative:
        case TrackState::Removed:
            return false;
    }
    return false;
}
