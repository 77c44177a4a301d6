/**
 * @file Track.hpp
 * @brief 代表单个被追踪目标的类的头文件。
 * @details
 * 每个 Track 对象都包含一个运动模型（卡尔曼滤波器）来预测和更新目标的状态，
 * 以及用于生命周期管理的元数据（ID、状态、命中/丢失计数等）。
 * 状态转移由 TrackManager 负责，Track 只记录计数。
 */

#pragma once

#include "Detector.hpp"
#include "MotionModel.hpp"

/**
 * @enum TrackState
 * @brief 轨迹生命周期状态。
 */
enum class TrackState {
    Tentative,  ///< 新建，尚未连续命中足够次数。
    Confirmed,  ///< 已确认的可靠轨迹。
    Lost,       ///< 已确认但最近几帧没有匹配，继续预测等待重新匹配。
    Removed     ///< 终止状态，随后从轨迹集合中删除。
};

const char* to_string(TrackState state);

class Track {
public:
    /**
     * @brief Track 构造函数，用于创建一个新的追踪轨迹（Tentative 状态）。
     *
     * @param track_id 分配给这个轨迹的唯一ID。
     * @param detection 第一次检测到该目标时的检测结果，类别由它确定且之后不再改变。
     * @param frame_number 创建时的帧号。
     */
    Track(int track_id, const Detection& detection, int frame_number);

    /**
     * @brief 预测目标在当前帧的位置，不改变 box()。
     */
    cv::Rect2f predict();

    /**
     * @brief 本帧匹配成功：用检测结果更新运动模型和计数。
     */
    void mark_hit(const Detection& detection, int frame_number);

    /**
     * @brief 本帧没有匹配：沿用预测位置，连续命中清零，连续丢失加一。
     */
    void mark_missed();

    void set_state(TrackState state) { state_ = state; }

    int id() const { return id_; }
    TrackState state() const { return state_; }
    int class_id() const { return class_id_; }
    float confidence() const { return confidence_; }
    cv::Rect2f box() const { return motion_.box(); }
    cv::Rect2f predicted_box() const { return motion_.predicted_box(); }
    cv::Point2f velocity() const { return motion_.velocity(); }

    int hit_streak() const { return hit_streak_; }           ///< 连续命中次数。
    int miss_streak() const { return miss_streak_; }         ///< 连续丢失次数。
    int total_hits() const { return total_hits_; }
    int age() const { return age_; }                         ///< 自创建以来经过的帧数。
    int last_hit_frame() const { return last_hit_frame_; }
    int detection_index() const { return detection_index_; } ///< 本帧匹配的检测下标，-1 表示没有。
    void set_detection_index(int index) { detection_index_ = index; }

    bool is_live() const { return state_ != TrackState::Removed; }

private:
    int id_;
    TrackState state_;
    int class_id_;
    float confidence_;
    MotionModel motion_;

    int hit_streak_;
    int miss_streak_;
    int total_hits_;
    int age_;
    int last_hit_frame_;
    int detection_index_;
};
