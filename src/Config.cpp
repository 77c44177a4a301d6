/**
 * @file Config.cpp
 * @brief 配置加载与校验。
 */

#include "Config.hpp"
#include "Logger.hpp"

#include <stdexcept>

namespace {

template <typename T>
void read_if_present(const cv::FileNode& node, const char* key, T& value) {
    if (!node[key].empty()) {
        node[key] >> value;
    }
}

void read_if_present(const cv::FileNode& node, const char* key, std::string& value) {
    if (!node[key].empty()) {
        value = static_cast<std::string>(node[key]);
    }
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::invalid_argument("invalid tracker config: " + message);
    }
}

}  // namespace

void TrackerConfig::read(const cv::FileNode& node) {
    if (node.empty()) {
        return;
    }

    read_if_present(node, "high_confidence_threshold", high_confidence_threshold);
    read_if_present(node, "low_confidence_floor", low_confidence_floor);
    read_if_present(node, "max_iou_distance", max_iou_distance);
    read_if_present(node, "low_confidence_max_iou_distance", low_confidence_max_iou_distance);
    read_if_present(node, "min_hits", min_hits);
    read_if_present(node, "max_misses", max_misses);
    read_if_present(node, "new_track_threshold", new_track_threshold);
    read_if_present(node, "report_lost_within", report_lost_within);

    if (!node["class_filter"].empty()) {
        std::vector<int> classes;
        node["class_filter"] >> classes;
        class_filter = std::set<int>(classes.begin(), classes.end());
    }
}

void TrackerConfig::validate() const {
    require(high_confidence_threshold >= 0.0 && high_confidence_threshold <= 1.0,
            "high_confidence_threshold must be in [0, 1]");
    require(low_confidence_floor >= 0.0 && low_confidence_floor <= high_confidence_threshold,
            "low_confidence_floor must be in [0, high_confidence_threshold]");
    require(max_iou_distance >= 0.0 && max_iou_distance <= 1.0,
            "max_iou_distance must be in [0, 1]");
    require(low_confidence_max_iou_distance >= 0.0 && low_confidence_max_iou_distance <= 1.0,
            "low_confidence_max_iou_distance must be in [0, 1]");
    require(min_hits >= 1, "min_hits must be at least 1");
    require(max_misses >= 0, "max_misses must not be negative");
    require(new_track_threshold >= 0.0 && new_track_threshold <= 1.0,
            "new_track_threshold must be in [0, 1]");
    require(report_lost_within >= 0, "report_lost_within must not be negative");
}

bool AppConfig::load_from_file(const std::string& config_path) {
    cv::FileStorage fs;
    try {
        fs.open(config_path, cv::FileStorage::READ);
    } catch (const cv::Exception& e) {
        FRAMETRACK_LOG_WARN("config", "Invalid config file {}: {}", config_path, e.what());
        return false;
    }
    if (!fs.isOpened()) {
        FRAMETRACK_LOG_WARN("config", "Could not open config file: {}", config_path);
        return false;
    }

    FRAMETRACK_LOG_INFO("config", "Loading config from: {}", config_path);
    read(fs.root());
    fs.release();
    return true;
}

void AppConfig::read(const cv::FileNode& root) {
    tracker.read(root["tracker"]);

    if (!root["io"].empty()) {
        cv::FileNode io = root["io"];
        read_if_present(io, "detections", detections_path);
        read_if_present(io, "video", video_path);
        read_if_present(io, "output_video", output_video_path);
        read_if_present(io, "output_tracks", output_tracks_path);
    }

    if (!root["classes"].empty()) {
        cv::FileNode classes = root["classes"];
        if (!classes["names"].empty()) {
            class_names.clear();
            cv::FileNode names = classes["names"];
            for (auto it = names.begin(); it != names.end(); ++it) {
                class_names.push_back(static_cast<std::string>(*it));
            }
        }
        if (!classes["aliases"].empty()) {
            cv::FileNode aliases = classes["aliases"];
            for (auto it = aliases.begin(); it != aliases.end(); ++it) {
                class_aliases[(*it).name()] = static_cast<std::string>(*it);
            }
        }
    }

    if (!root["logging"].empty()) {
        cv::FileNode logging = root["logging"];
        read_if_present(logging, "level", log_level);
        read_if_present(logging, "file", log_file);
    }
}
