/**
 * @file TrackManager.hpp
 * @brief 轨迹生命周期管理：创建、确认、丢失、删除。
 *
 * @details
 * 状态转移规则：
 *   - Tentative -> Confirmed：连续命中达到 min_hits。
 *   - Tentative -> Removed：任何一帧未匹配（过滤一次性的误检）。
 *   - Confirmed -> Lost：一帧未匹配，继续预测等待重新匹配。
 *   - Lost -> Confirmed：重新匹配成功。
 *   - Lost -> Removed：连续丢失超过 max_misses 帧。
 * 只有创建和删除会改变轨迹集合的成员，其余转移都原地修改轨迹。
 */

#pragma once

#include "Association.hpp"
#include "Config.hpp"
#include "Track.hpp"

#include <vector>

class TrackManager {
public:
    explicit TrackManager(const TrackerConfig& config);

    /**
     * @brief 对所有存活轨迹执行预测，返回参与关联的候选（与 tracks() 一一对应）。
     */
    std::vector<TrackCandidate> predict();

    /**
     * @brief 根据关联结果更新轨迹、创建新轨迹、删除过期轨迹。
     *
     * @param association associate() 的结果，track 下标对应 predict() 的返回值。
     * @param detections 本帧（已校验的）检测结果。
     * @param detection_ids detections[i] 在调用方原始输入中的下标。
     * @param frame_number 当前帧号。
     */
    void apply(const AssociationResult& association,
               const std::vector<Detection>& detections,
               const std::vector<int>& detection_ids,
               int frame_number);

    /**
     * @brief 清空所有轨迹，ID 计数器重新从 1 开始。
     */
    void clear();

    const std::vector<Track>& tracks() const { return tracks_; }
    const Track* find(int track_id) const;

    int next_id() const { return next_id_; }
    int created_count() const { return created_count_; }
    int removed_count() const { return removed_count_; }

private:
    void on_hit(Track& track, const Detection& detection, int detection_id, int frame_number);
    void on_miss(Track& track);
    void create_track(const Detection& detection, int detection_id, int frame_number);

    int min_hits_;
    int max_misses_;
    double new_track_threshold_;

    std::vector<Track> tracks_; ///< 按ID升序排列的存活轨迹。
    int next_id_;               ///< 用于分配给新轨迹的下一个唯一ID。
    int created_count_;
    int removed_count_;
};
