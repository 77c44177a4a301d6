/**
 * @file IoU.hpp
 * @brief 交并比（Intersection over Union, IoU）及其距离矩阵。
 */

#pragma once

#include <opencv2/core.hpp>
#include <vector>

/**
 * @brief 计算两个边界框的交并比 (IoU)。
 * @return double 取值 [0.0, 1.0]；并集面积为 0 时返回 0。
 */
double calculate_iou(const cv::Rect2f& box1, const cv::Rect2f& box2);

/**
 * @brief IoU 距离，即 1 - IoU。
 */
double iou_distance(const cv::Rect2f& box1, const cv::Rect2f& box2);

/**
 * @brief 构建成本矩阵：cost[i][j] = 1 - IoU(rows[i], cols[j])。
 */
std::vector<std::vector<double>> iou_distance_matrix(const std::vector<cv::Rect2f>& rows,
                                                     const std::vector<cv::Rect2f>& cols);
