/**
 * @file LinearAssignment.hpp
 * @brief 带成本上限的矩形线性分配（匈牙利算法）。
 *
 * @details
 * 成本矩阵按行表示轨迹、按列表示检测。每一行/列都可以不分配；
 * 只有成本不超过 cost_limit 的配对才可能被选中（宁可不匹配，也不接受劣质匹配）。
 * 内部把 N x M 矩阵扩展成 (N+M) x (N+M) 方阵，
 * 让“不分配”对应成本为 cost_limit / 2 的虚拟行列，再用带势函数的最短增广路求最优解，
 * 复杂度 O((N+M)^3)。
 */

#pragma once

#include <stdexcept>
#include <utility>
#include <vector>

/**
 * @class AssignmentError
 * @brief 分配求解器内部不变量被破坏（例如成本矩阵中出现 NaN）。
 */
class AssignmentError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/**
 * @struct AssignmentResult
 * @brief 分配结果：匹配对以及未匹配的行、列（均按索引升序）。
 */
struct AssignmentResult {
    std::vector<std::pair<int, int>> matches;  ///< (row, col)，按 row 升序。
    std::vector<int> unmatched_rows;
    std::vector<int> unmatched_cols;
};

/**
 * @brief 求解带成本上限的最小成本二分匹配。
 *
 * @param cost_matrix N x M 成本矩阵，所有行长度必须相同。
 * @param cost_limit 可接受的最大成本（含）。
 * @param row_priority 行优先级，数值越小优先级越高；为空时按行号。
 *        当多个分配方案总成本相同时，优先让高优先级的行获得匹配。
 * @return AssignmentResult
 * @throws AssignmentError 成本矩阵不合法，或求解结果违反一对一约束。
 */
AssignmentResult solve_assignment(const std::vector<std::vector<double>>& cost_matrix,
                                  double cost_limit,
                                  const std::vector<int>& row_priority = std::vector<int>());
