/**
 * @file Detector.hpp
 * @brief 检测结果结构体与检测器抽象接口。
 *
 * @details
 * 追踪核心不关心检测结果来自哪里（OpenVINO、TensorRT、离线文件……），
 * 只要求每一帧提供一组 Detection。具体的检测来源通过继承 Detector 接入。
 */

#pragma once

#include <opencv2/core.hpp>
#include <vector>

/**
 * @struct Detection
 * @brief 用于存储单个检测结果的结构体。
 */
struct Detection {
    cv::Rect2f box;     ///< 目标的边界框（左上角 + 宽高，实数像素坐标）。
    float confidence;   ///< 检测结果的置信度，取值 [0, 1]。
    int class_id;       ///< 目标的类别ID，-1 表示未知类别。
};

/**
 * @brief 用角点形式 (x_min, y_min, x_max, y_max) 构造一个检测结果。
 */
Detection make_detection(float x_min, float y_min, float x_max, float y_max,
                         float confidence, int class_id = -1);

/**
 * @enum DetectionIssue
 * @brief 检测结果的合法性检查结果。
 */
enum class DetectionIssue {
    None,                 ///< 合法。
    NonFinite,            ///< 坐标或置信度包含 NaN / Inf。
    EmptyBox,             ///< x_min >= x_max 或 y_min >= y_max。
    ConfidenceOutOfRange  ///< 置信度不在 [0, 1] 内。
};

/**
 * @brief 检查一个检测结果是否可以交给追踪器。
 */
DetectionIssue validate_detection(const Detection& detection);

const char* to_string(DetectionIssue issue);

/**
 * @class Detector
 * @brief 检测器接口：为指定帧提供检测结果。
 */
class Detector {
public:
    virtual ~Detector() = default;

    /**
     * @brief 对一帧执行目标检测。
     *
     * @param frame_number 帧号，从 1 开始。
     * @param image 当前帧图像，离线检测来源可以忽略它（可能为空）。
     * @return std::vector<Detection> 检测到的目标列表。
     */
    virtual std::vector<Detection> detect(int frame_number, const cv::Mat& image) = 0;
};
