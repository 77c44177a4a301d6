/**
 * @file Detector.cpp
 * @brief 检测结果的构造与合法性检查。
 */

#include "Detector.hpp"
#include <cmath>

Detection make_detection(float x_min, float y_min, float x_max, float y_max,
                         float confidence, int class_id) {
    return {cv::Rect2f(x_min, y_min, x_max - x_min, y_max - y_min), confidence, class_id};
}

DetectionIssue validate_detection(const Detection& detection) {
    const cv::Rect2f& box = detection.box;
    if (!std::isfinite(box.x) || !std::isfinite(box.y) ||
        !std::isfinite(box.width) || !std::isfinite(box.height) ||
        !std::isfinite(detection.confidence)) {
        return DetectionIssue::NonFinite;
    }
    // 右下角也必须有限，例如 x = 3e38, width = 3e38 时 x_max 会溢出为 inf
    if (!std::isfinite(box.x + box.width) || !std::isfinite(box.y + box.height)) {
        return DetectionIssue::NonFinite;
    }

    // 宽高必须为正：x_min < x_max 且 y_min < y_max
    if (box.width <= 0.0f || box.height <= 0.0f) {
        return DetectionIssue::EmptyBox;
    }

    if (detection.confidence < 0.0f || detection.confidence > 1.0f) {
        return DetectionIssue::ConfidenceOutOfRange;
    }

    return DetectionIssue::None;
}

const char* to_string(DetectionIssue issue) {
    switch (issue) {
        case DetectionIssue::None: return "ok";
        case DetectionIssue::NonFinite: return "non-finite value";
        case DetectionIssue::EmptyBox: return "empty or inverted box";
        case DetectionIssue::ConfidenceOutOfRange: return "confidence outside [0, 1]";
    }
    return "unknown";
}
