/**
 * @file Config.hpp
 * @brief 追踪器与命令行程序的集中配置。
 *
 * 提供默认值，并可以从 OpenCV YAML 文件（需要 %YAML:1.0 头）加载。
 */

#pragma once

#include <opencv2/core.hpp>
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @struct TrackerConfig
 * @brief 追踪会话的可调参数。
 */
struct TrackerConfig {
    // 关联
    double high_confidence_threshold = 0.5;        ///< 第一阶段检测的最低置信度。
    double low_confidence_floor = 0.0;             ///< 低于该值的检测直接忽略。
    double max_iou_distance = 0.7;                 ///< 第一阶段允许的最大 1 - IoU（即 IoU >= 0.3）。
    double low_confidence_max_iou_distance = 0.5;  ///< 第二阶段允许的最大 1 - IoU。

    // 生命周期
    int min_hits = 3;                   ///< 成为 Confirmed 所需的连续命中次数。
    int max_misses = 30;                ///< Lost 轨迹最多容忍的连续丢失帧数（30fps 下约 1 秒）。
    double new_track_threshold = 0.0;   ///< 未匹配检测创建新轨迹所需的最低置信度。

    // 输出
    int report_lost_within = 0;         ///< 连续丢失不超过该帧数的 Lost 轨迹也输出；0 表示只输出 Confirmed。

    std::set<int> class_filter;         ///< 只追踪这些类别（为空表示全部）。

    bool should_track_class(int class_id) const {
        return class_filter.empty() || class_filter.count(class_id) > 0;
    }

    /**
     * @brief 从 YAML 节点读取，缺失的键保持默认值。
     */
    void read(const cv::FileNode& node);

    /**
     * @brief 检查参数是否自洽。
     * @throws std::invalid_argument
     */
    void validate() const;
};

/**
 * @struct AppConfig
 * @brief 命令行程序的配置。
 */
struct AppConfig {
    TrackerConfig tracker;

    std::string detections_path;     ///< MOTChallenge 格式的检测文件。
    std::string video_path;          ///< 源视频（可选，用于绘制）。
    std::string output_video_path;   ///< 绘制后的视频输出路径（可选）。
    std::string output_tracks_path;  ///< MOTChallenge 格式的轨迹输出路径（可选）。

    std::vector<std::string> class_names;              ///< 类别ID -> 名称。
    std::map<std::string, std::string> class_aliases;  ///< 标签里显示的别名，例如 motorcycle -> moto。

    std::string log_level = "info";
    std::string log_file;

    /**
     * @brief 从 YAML 配置文件加载。
     * @return 文件无法打开或格式错误时返回 false，并保留已有的值。
     */
    bool load_from_file(const std::string& config_path);

    void read(const cv::FileNode& root);
};
