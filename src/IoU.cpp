/**
 * @file IoU.cpp
 * @brief 提供了计算两个边界框之间交并比（Intersection over Union, IoU）的函数。
 * @details
 * IoU 的值域为 [0, 1]，值越大表示重叠程度越高。
 * 追踪器用 1 - IoU 作为轨迹与检测之间的匹配成本。
 */

#include "IoU.hpp"
#include <algorithm> // For std::max and std::min

/**
 * @details
 * IoU 的计算公式为：
 *   IoU = Area(Intersection) / Area(Union)
 * 其中 Area(Union) = Area(box1) + Area(box2) - Area(Intersection)。
 */
double calculate_iou(const cv::Rect2f& box1, const cv::Rect2f& box2) {
    // 1. 交集区域的左上角取两个框左上角中较大的，右下角取较小的。
    double x1 = std::max(box1.x, box2.x);
    double y1 = std::max(box1.y, box2.y);
    double x2 = std::min(box1.x + box1.width, box2.x + box2.width);
    double y2 = std::min(box1.y + box1.height, box2.y + box2.height);

    // 2. 不重叠时宽或高为负数，截断为 0。
    double intersection_width = std::max(0.0, x2 - x1);
    double intersection_height = std::max(0.0, y2 - y1);
    double intersection_area = intersection_width * intersection_height;

    // 3. 并集面积。
    double area1 = static_cast<double>(box1.width) * box1.height;
    double area2 = static_cast<double>(box2.width) * box2.height;
    double union_area = area1 + area2 - intersection_area;

    if (union_area <= 0.0) {
        return 0.0;
    }

    // 浮点误差可能让结果略微超出 [0, 1]
    return std::min(1.0, std::max(0.0, intersection_area / union_area));
}

double iou_distance(const cv::Rect2f& box1, const cv::Rect2f& box2) {
    return 1.0 - calculate_iou(box1, box2);
}

std::vector<std::vector<double>> iou_distance_matrix(const std::vector<cv::Rect2f>& rows,
                                                     const std::vector<cv::Rect2f>& cols) {
    std::vector<std::vector<double>> cost_matrix(rows.size(), std::vector<double>(cols.size()));
    for (size_t i = 0; i < rows.size(); ++i) {
        for (size_t j = 0; j < cols.size(); ++j) {
            cost_matrix[i][j] = iou_distance(rows[i], cols[j]);
        }
    }
    return cost_matrix;
}
