/**
 * @file Association.cpp
 * @brief 两阶段关联的实现文件。
 */

#include "Association.hpp"
#include "IoU.hpp"
#include "LinearAssignment.hpp"

#include <algorithm>

AssociationEngine::AssociationEngine(const TrackerConfig& config)
    : high_confidence_threshold_(config.high_confidence_threshold),
      low_confidence_floor_(config.low_confidence_floor),
      max_iou_distance_(config.max_iou_distance),
      low_confidence_max_iou_distance_(config.low_confidence_max_iou_distance) {}

AssociationResult AssociationEngine::associate(const std::vector<TrackCandidate>& tracks,
                                               const std::vector<Detection>& detections) const {
    AssociationResult result;

    // --- 1. 按置信度划分检测 ---
    std::vector<int> high_detections;
    std::vector<int> low_detections;
    for (size_t j = 0; j < detections.size(); ++j) {
        float confidence = detections[j].confidence;
        if (confidence >= high_confidence_threshold_) {
            high_detections.push_back(static_cast<int>(j));
        } else if (confidence >= low_confidence_floor_) {
            low_detections.push_back(static_cast<int>(j));
        } else {
            result.ignored_detections.push_back(static_cast<int>(j));
        }
    }

    std::vector<int> all_tracks(tracks.size());
    for (size_t i = 0; i < tracks.size(); ++i) {
        all_tracks[i] = static_cast<int>(i);
    }

    // --- 2. 第一阶段：高置信度检测 vs 所有轨迹 ---
    std::vector<int> leftover_high;
    std::vector<int> remaining_tracks = match_stage(tracks, detections, all_tracks, high_detections,
                                                    max_iou_distance_, MatchStage::HighConfidence,
                                                    result, leftover_high);

    // --- 3. 第二阶段：低置信度检测 vs 第一阶段剩下的轨迹 ---
    std::vector<int> leftover_low;
    result.unmatched_tracks = match_stage(tracks, detections, remaining_tracks, low_detections,
                                          low_confidence_max_iou_distance_, MatchStage::LowConfidence,
                                          result, leftover_low);

    result.unmatched_detections = leftover_high;
    result.unmatched_detections.insert(result.unmatched_detections.end(),
                                       leftover_low.begin(), leftover_low.end());
    std::sort(result.unmatched_detections.begin(), result.unmatched_detections.end());
    std::sort(result.unmatched_tracks.begin(), result.unmatched_tracks.end());

    return result;
}

std::vector<int> AssociationEngine::match_stage(const std::vector<TrackCandidate>& tracks,
                                                const std::vector<Detection>& detections,
                                                const std::vector<int>& track_indices,
                                                const std::vector<int>& detection_indices,
                                                double max_distance,
                                                MatchStage stage,
                                                AssociationResult& result,
                                                std::vector<int>& leftover_detections) const {
    if (track_indices.empty() || detection_indices.empty()) {
        leftover_detections = detection_indices;
        return track_indices;
    }

    // a. 构建成本矩阵：成本定义为 1 - IoU
    std::vector<cv::Rect2f> predicted_boxes;
    for (int t : track_indices) {
        predicted_boxes.push_back(tracks[t].predicted_box);
    }
    std::vector<cv::Rect2f> detection_boxes;
    for (int d : detection_indices) {
        detection_boxes.push_back(detections[d].box);
    }
    std::vector<std::vector<double>> cost_matrix = iou_distance_matrix(predicted_boxes, detection_boxes);

    // b. 行优先级：连续命中多的轨迹优先，其次ID小的优先
    std::vector<int> order(track_indices.size());
    for (size_t k = 0; k < order.size(); ++k) {
        order[k] = static_cast<int>(k);
    }
    std::sort(order.begin(), order.end(), [&](int lhs, int rhs) {
        const TrackCandidate& a = tracks[track_indices[lhs]];
        const TrackCandidate& b = tracks[track_indices[rhs]];
        if (a.hit_streak != b.hit_streak) {
            return a.hit_streak > b.hit_streak;
        }
        return a.track_id < b.track_id;
    });
    std::vector<int> row_priority(order.size());
    for (size_t rank = 0; rank < order.size(); ++rank) {
        row_priority[order[rank]] = static_cast<int>(rank);
    }

    // c. 求解带上限的最优分配
    AssignmentResult assignment = solve_assignment(cost_matrix, max_distance, row_priority);

    for (const auto& pair : assignment.matches) {
        result.matches.push_back({track_indices[pair.first], detection_indices[pair.second],
                                  cost_matrix[pair.first][pair.second], stage});
    }

    std::vector<int> unmatched_tracks;
    for (int row : assignment.unmatched_rows) {
        unmatched_tracks.push_back(track_indices[row]);
    }
    leftover_detections.clear();
    for (int col : assignment.unmatched_cols) {
        leftover_detections.push_back(detection_indices[col]);
    }
    return unmatched_tracks;
}
