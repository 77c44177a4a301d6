/**
 * @file MotionModel.hpp
 * @brief 单个轨迹的运动模型（恒定速度卡尔曼滤波器）。
 *
 * @details
 * 预测与更新是两个独立阶段：predict() 只推进滤波器内部的先验状态，
 * 不改变对外可见的边界框和速度；只有 update()（匹配成功）或
 * coast()（本帧未匹配，沿用预测）才会提交新的状态。
 * 这样关联阶段可以先拿到所有轨迹的预测框，再统一决定匹配结果。
 */

#pragma once

#include <opencv2/core.hpp>
#include <opencv2/video/tracking.hpp>

class MotionModel {
public:
    /**
     * @brief 用第一次检测到的边界框初始化滤波器，初始速度为 0。
     */
    explicit MotionModel(const cv::Rect2f& bbox);

    /**
     * @brief 将状态向前推进一帧，返回预测的边界框。
     *
     * 同一帧内重复调用只推进一次。
     */
    cv::Rect2f predict();

    /**
     * @brief 使用匹配上的检测框校正滤波器，并重新估计速度。
     *
     * 若本帧尚未调用 predict()，会先补做一次预测。
     */
    void update(const cv::Rect2f& bbox);

    /**
     * @brief 本帧没有匹配：把预测结果提交为当前状态，速度保持不变。
     */
    void coast();

    cv::Rect2f box() const { return box_; }                     ///< 最近一次提交的边界框。
    cv::Rect2f predicted_box() const { return predicted_box_; } ///< 最近一次预测的边界框。

    /**
     * @brief 对外报告的速度（像素/帧）：相邻两次被接受位置的中心点位移除以间隔帧数。
     *
     * predict() 外推时使用的是滤波器状态里的速度分量（见 filter_velocity()），
     * 两者都收敛到真实速度，但在目标刚出现或刚恢复时可能不同。
     */
    cv::Point2f velocity() const { return velocity_; }

    /**
     * @brief 滤波器状态中的中心点速度 (vx, vy)，即 predict() 实际使用的速度。
     */
    cv::Point2f filter_velocity() const;

private:
    /**
     * @brief 卡尔曼滤波器对象。
     * @details
     * 状态向量为8维: [cx, cy, a, h, vx, vy, va, vh]
     *   - cx, cy: 边界框中心点x, y
     *   - a: 宽高比 (aspect ratio)
     *   - h: 高度
     *   - vx, vy, va, vh: 对应状态量的速度
     * 测量向量为4维: [cx, cy, a, h]，直接来自检测框。
     */
    cv::KalmanFilter kf_;

    cv::Rect2f box_;            ///< 当前提交的状态。
    cv::Rect2f predicted_box_;  ///< 本帧预测的状态。
    cv::Point2f velocity_;      ///< 中心点速度估计。
    cv::Point2f accepted_center_; ///< 最近一次被接受位置的中心点。
    int frames_since_accept_;   ///< 距离上次接受检测已经过去的帧数。
    bool predicted_;            ///< 本帧是否已经预测过。
};

/**
 * @brief 边界框 -> 测量向量 [cx, cy, a, h]。
 */
cv::Mat box_to_measurement(const cv::Rect2f& bbox);

/**
 * @brief 状态向量 -> 边界框。宽高会被截断到一个正的最小值，保证 x_min < x_max、y_min < y_max。
 */
cv::Rect2f state_to_box(const cv::Mat& state);
