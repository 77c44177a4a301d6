/**
 * @file Association.hpp
 * @brief 轨迹与检测的两阶段关联（高置信度优先，低置信度补充）。
 *
 * @details
 * 第一阶段：置信度 >= high_confidence_threshold 的检测与所有存活轨迹匹配；
 * 第二阶段：剩余的低置信度检测只与第一阶段没匹配上的轨迹匹配，
 * 用来找回因遮挡或检测器不确定而置信度下降的目标。
 * 两个阶段都以 1 - IoU 作为成本，超过上限的配对一律拒绝。
 */

#pragma once

#include "Config.hpp"
#include "Detector.hpp"
#include <vector>

/**
 * @struct TrackCandidate
 * @brief 参与关联的轨迹：预测框以及用于平局打破的命中次数和ID。
 */
struct TrackCandidate {
    int track_id;
    int hit_streak;
    cv::Rect2f predicted_box;
};

enum class MatchStage {
    HighConfidence = 1,
    LowConfidence = 2
};

struct Match {
    int track;        ///< TrackCandidate 下标。
    int detection;    ///< Detection 下标。
    double cost;      ///< 1 - IoU。
    MatchStage stage;
};

/**
 * @struct AssociationResult
 * @brief 关联结果的三个划分，外加低于 low_confidence_floor 被忽略的检测。
 */
struct AssociationResult {
    std::vector<Match> matches;
    std::vector<int> unmatched_tracks;
    std::vector<int> unmatched_detections;
    std::vector<int> ignored_detections;
};

class AssociationEngine {
public:
    explicit AssociationEngine(const TrackerConfig& config);
    virtual ~AssociationEngine() = default;

    /**
     * @brief 对一帧执行两阶段关联。
     *
     * 每个轨迹最多匹配一个检测，每个检测最多匹配一个轨迹。
     * 总成本相同时，优先匹配连续命中次数更多的轨迹（其次ID更小）。
     *
     * @throws AssignmentError 分配求解失败（内部错误）。
     */
    virtual AssociationResult associate(const std::vector<TrackCandidate>& tracks,
                                        const std::vector<Detection>& detections) const;

private:
    /**
     * @brief 单阶段匹配：track_indices x detection_indices，成功的写入 result.matches，
     *        返回本阶段未匹配的轨迹下标。未匹配的检测写入 leftover_detections。
     */
    std::vector<int> match_stage(const std::vector<TrackCandidate>& tracks,
                                 const std::vector<Detection>& detections,
                                 const std::vector<int>& track_indices,
                                 const std::vector<int>& detection_indices,
                                 double max_distance,
                                 MatchStage stage,
                                 AssociationResult& result,
                                 std::vector<int>& leftover_detections) const;

    double high_confidence_threshold_;
    double low_confidence_floor_;
    double max_iou_distance_;
    double low_confidence_max_iou_distance_;
};
