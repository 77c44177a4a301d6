/**
 * @file MotionModel.cpp
 * @brief 运动模型（卡尔曼滤波器）的实现文件。
 */

#include "MotionModel.hpp"
#include <algorithm>

namespace {

// 预测出的宽高可能因为速度外推变为 0 或负数，输出前截断到这个值
const float kMinSide = 1e-2f;
const float kMinAspect = 1e-3f;

cv::Point2f center_of(const cv::Rect2f& bbox) {
    return cv::Point2f(bbox.x + bbox.width / 2.0f, bbox.y + bbox.height / 2.0f);
}

}  // namespace

cv::Mat box_to_measurement(const cv::Rect2f& bbox) {
    cv::Mat measurement = cv::Mat::zeros(4, 1, CV_32F);
    measurement.at<float>(0) = bbox.x + bbox.width / 2.0f;
    measurement.at<float>(1) = bbox.y + bbox.height / 2.0f;
    measurement.at<float>(2) = (bbox.height > 0) ? (bbox.width / bbox.height) : 0.0f;
    measurement.at<float>(3) = bbox.height;
    return measurement;
}

cv::Rect2f state_to_box(const cv::Mat& state) {
    float cx = state.at<float>(0);
    float cy = state.at<float>(1);
    float aspect_ratio = std::max(state.at<float>(2), kMinAspect);
    float h = std::max(state.at<float>(3), kMinSide);
    float w = std::max(aspect_ratio * h, kMinSide);

    return cv::Rect2f(cx - w / 2.0f, cy - h / 2.0f, w, h);
}

MotionModel::MotionModel(const cv::Rect2f& bbox)
    : kf_(8, 4, 0),
      velocity_(0.0f, 0.0f),
      frames_since_accept_(0),
      predicted_(false) {

    // --- 1. 初始化状态向量 (statePost) ---
    // [cx, cy, a, h, vx, vy, va, vh]，初始速度分量为 0
    cv::Mat measurement = box_to_measurement(bbox);
    kf_.statePost = cv::Mat::zeros(8, 1, CV_32F);
    for (int i = 0; i < 4; ++i) {
        kf_.statePost.at<float>(i) = measurement.at<float>(i);
    }

    // --- 2. 状态转移矩阵 F：x_k = x_{k-1} + v_{k-1} * dt (dt=1帧) ---
    cv::setIdentity(kf_.transitionMatrix);
    kf_.transitionMatrix.at<float>(0, 4) = 1;
    kf_.transitionMatrix.at<float>(1, 5) = 1;
    kf_.transitionMatrix.at<float>(2, 6) = 1;
    kf_.transitionMatrix.at<float>(3, 7) = 1;

    // --- 3. 测量矩阵 H：只能直接测量 cx, cy, a, h ---
    kf_.measurementMatrix = cv::Mat::zeros(4, 8, CV_32F);
    kf_.measurementMatrix.at<float>(0, 0) = 1;
    kf_.measurementMatrix.at<float>(1, 1) = 1;
    kf_.measurementMatrix.at<float>(2, 2) = 1;
    kf_.measurementMatrix.at<float>(3, 3) = 1;

    // --- 4. 噪声协方差 ---
    // Q: 速度分量的不确定性更大；宽高比和高度变化通常较小
    cv::setIdentity(kf_.processNoiseCov, cv::Scalar::all(1e-2));
    kf_.processNoiseCov.at<float>(4, 4) = 1e-1f;
    kf_.processNoiseCov.at<float>(5, 5) = 1e-1f;
    kf_.processNoiseCov.at<float>(6, 6) = 1e-4f;
    kf_.processNoiseCov.at<float>(7, 7) = 1e-2f;

    // R: 检测器结果的不确定性
    cv::setIdentity(kf_.measurementNoiseCov, cv::Scalar::all(1e-1));
    kf_.measurementNoiseCov.at<float>(2, 2) = 1e-3f;

    // P: 初始状态估计的不确定性
    cv::setIdentity(kf_.errorCovPost, cv::Scalar::all(1));

    box_ = state_to_box(kf_.statePost);
    predicted_box_ = box_;
    accepted_center_ = center_of(box_);
}

cv::Rect2f MotionModel::predict() {
    if (!predicted_) {
        // KalmanFilter::predict() 只写 statePre/errorCovPre（并同步 statePost），
        // box_ 和 velocity_ 保持不变，直到 update() 或 coast()
        predicted_box_ = state_to_box(kf_.predict());
        ++frames_since_accept_;
        predicted_ = true;
    }
    return predicted_box_;
}

void MotionModel::update(const cv::Rect2f& bbox) {
    if (!predicted_) {
        predict();
    }

    box_ = state_to_box(kf_.correct(box_to_measurement(bbox)));

    // 速度 = 相邻两次被接受位置的位移 / 间隔帧数（中间 coast 的帧不算被接受）
    cv::Point2f center = center_of(box_);
    cv::Point2f displacement = center - accepted_center_;
    accepted_center_ = center;
    float frames = static_cast<float>(std::max(frames_since_accept_, 1));
    velocity_ = cv::Point2f(displacement.x / frames, displacement.y / frames);

    frames_since_accept_ = 0;
    predicted_ = false;
}

cv::Point2f MotionModel::filter_velocity() const {
    return cv::Point2f(kf_.statePost.at<float>(4), kf_.statePost.at<float>(5));
}

void MotionModel::coast() {
    if (!predicted_) {
        predict();
    }
    box_ = predicted_box_;
    predicted_ = false;
}
