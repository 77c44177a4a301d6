/**
 * @file TrackingSession.hpp
 * @brief 追踪会话：一个视频一个会话，逐帧驱动 预测 -> 关联 -> 生命周期更新。
 *
 * @details
 * 会话独占自己的轨迹集合，不依赖任何全局状态；
 * 不同视频可以在不同线程中各自使用独立的会话，但同一个会话不能并发提交帧。
 * 帧必须按视频顺序提交。
 */

#pragma once

#include "Association.hpp"
#include "Config.hpp"
#include "Detector.hpp"
#include "TrackManager.hpp"

#include <memory>
#include <stdexcept>
#include <vector>

/**
 * @class SessionFailedError
 * @brief 会话因内部错误失效后继续调用 update() 时抛出，需先 reset()。
 */
class SessionFailedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @struct TrackSnapshot
 * @brief 某一帧输出给调用方（绘制/记录）的轨迹快照。
 */
struct TrackSnapshot {
    int id;
    cv::Rect2f box;
    cv::Point2f velocity;
    int class_id;
    float confidence;      ///< 最近一次匹配的检测置信度。
    TrackState state;
    int hit_streak;
    int miss_streak;
    int age;
    int detection_index;   ///< 本帧匹配的输入检测下标，-1 表示没有。
};

/**
 * @struct RejectedDetection
 * @brief 在会话边界被拒绝的检测：输入下标与原因。
 */
struct RejectedDetection {
    int index;
    DetectionIssue issue;
};

struct FrameResult {
    int frame_number;                        ///< 从 1 开始。
    std::vector<TrackSnapshot> tracks;       ///< Confirmed（以及按策略输出的 Lost）轨迹，按ID升序。
    std::vector<RejectedDetection> rejected; ///< 不合法的检测。
    int filtered_count;                      ///< 因类别过滤被丢弃的检测数量。
};

class TrackingSession {
public:
    /**
     * @brief 用给定参数创建会话。
     * @throws std::invalid_argument 配置不合法。
     */
    explicit TrackingSession(const TrackerConfig& config = TrackerConfig());

    /**
     * @brief 使用自定义的关联引擎（例如替换匹配策略）。
     * @throws std::invalid_argument 配置不合法或 association 为空。
     */
    TrackingSession(const TrackerConfig& config, std::unique_ptr<AssociationEngine> association);

    /**
     * @brief 会话的主更新函数，处理新一帧的检测结果。
     *
     * @param detections 当前帧的检测结果列表（可以为空）。
     * @return FrameResult 本帧输出的轨迹以及被拒绝的检测。
     * @throws AssignmentError 分配求解失败，会话随之失效。
     * @throws SessionFailedError 会话已经失效。
     */
    FrameResult update(const std::vector<Detection>& detections);

    /**
     * @brief 开始一个新视频：清空轨迹、ID 计数器和帧计数。
     */
    void reset();

    const std::vector<Track>& tracks() const { return manager_.tracks(); }
    const TrackerConfig& config() const { return config_; }
    int frame_count() const { return frame_count_; }
    bool failed() const { return failed_; }
    int created_count() const { return manager_.created_count(); }
    int removed_count() const { return manager_.removed_count(); }

private:
    bool should_report(const Track& track) const;

    TrackerConfig config_;
    std::unique_ptr<AssociationEngine> association_;
    TrackManager manager_;
    int frame_count_;
    bool failed_;
};
