/**
 * @file LinearAssignment.cpp
 * @brief 带成本上限的矩形线性分配实现。
 */

#include "LinearAssignment.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <string>

namespace {

// 平局打破用的扰动总量上限，远小于 IoU 距离的有效精度
const double kTieEpsilon = 1e-9;

/**
 * @brief 方阵上的匈牙利算法（最短增广路 + 势函数）。
 *
 * @param a (size+1) x (size+1) 的成本矩阵，下标从 1 开始，第 0 行/列不使用。
 * @return std::vector<int> col_to_row，col_to_row[j] 为分配到第 j 列的行（下标从 1 开始）。
 */
std::vector<int> hungarian(const std::vector<std::vector<double>>& a, int size) {
    const double inf = std::numeric_limits<double>::infinity();
    std::vector<double> u(size + 1, 0.0), v(size + 1, 0.0);
    std::vector<int> col_to_row(size + 1, 0), way(size + 1, 0);

    for (int i = 1; i <= size; ++i) {
        col_to_row[0] = i;
        int j0 = 0;
        std::vector<double> minv(size + 1, inf);
        std::vector<char> used(size + 1, false);

        do {
            used[j0] = true;
            int i0 = col_to_row[j0];
            int j1 = 0;
            double delta = inf;
            for (int j = 1; j <= size; ++j) {
                if (used[j]) continue;
                double cur = a[i0][j] - u[i0] - v[j];
                if (cur < minv[j]) {
                    minv[j] = cur;
                    way[j] = j0;
                }
                if (minv[j] < delta) {
                    delta = minv[j];
                    j1 = j;
                }
            }
            if (j1 == 0 || !std::isfinite(delta)) {
                throw AssignmentError("no augmenting path found for row " + std::to_string(i));
            }
            for (int j = 0; j <= size; ++j) {
                if (used[j]) {
                    u[col_to_row[j]] += delta;
                    v[j] -= delta;
                } else {
                    minv[j] -= delta;
                }
            }
            j0 = j1;
        } while (col_to_row[j0] != 0);

        // 沿增广路翻转匹配
        do {
            int j1 = way[j0];
            col_to_row[j0] = col_to_row[j1];
            j0 = j1;
        } while (j0 != 0);
    }

    return col_to_row;
}

}  // namespace

AssignmentResult solve_assignment(const std::vector<std::vector<double>>& cost_matrix,
                                  double cost_limit,
                                  const std::vector<int>& row_priority) {
    const int n = static_cast<int>(cost_matrix.size());
    const int m = n > 0 ? static_cast<int>(cost_matrix[0].size()) : 0;

    // --- 1. 检查输入 ---
    if (!std::isfinite(cost_limit)) {
        throw AssignmentError("cost limit must be finite");
    }
    if (!row_priority.empty() && static_cast<int>(row_priority.size()) != n) {
        throw AssignmentError("row priority size does not match cost matrix rows");
    }
    double max_abs = std::fabs(cost_limit);
    for (int i = 0; i < n; ++i) {
        if (static_cast<int>(cost_matrix[i].size()) != m) {
            throw AssignmentError("cost matrix rows have different lengths");
        }
        for (int j = 0; j < m; ++j) {
            double c = cost_matrix[i][j];
            if (!std::isfinite(c)) {
                throw AssignmentError("non-finite cost at (" + std::to_string(i) + ", " +
                                      std::to_string(j) + ")");
            }
            if (c <= cost_limit) {
                max_abs = std::max(max_abs, std::fabs(c));
            }
        }
    }

    AssignmentResult result;
    if (n == 0 || m == 0) {
        result.unmatched_rows.resize(n);
        std::iota(result.unmatched_rows.begin(), result.unmatched_rows.end(), 0);
        result.unmatched_cols.resize(m);
        std::iota(result.unmatched_cols.begin(), result.unmatched_cols.end(), 0);
        return result;
    }

    // --- 2. 按优先级排列行 ---
    std::vector<int> order(n);
    std::iota(order.begin(), order.end(), 0);
    if (!row_priority.empty()) {
        std::stable_sort(order.begin(), order.end(), [&row_priority](int lhs, int rhs) {
            return row_priority[lhs] < row_priority[rhs];
        });
    }

    // --- 3. 构建扩展方阵 ---
    //  [ cost(+扰动)   | unmatched ]   n 行
    //  [ unmatched     | 0         ]   m 行
    //    m 列            n 列
    const int size = n + m;
    const double unmatched = (cost_limit + kTieEpsilon) / 2.0;
    max_abs = std::max(max_abs, std::fabs(unmatched));
    const double infeasible = (max_abs + 1.0) * (size + 1) * 2.0;

    // 扰动分两级，总量都小于 kTieEpsilon：
    //  - 行常数项：优先级越高（r 越小）越小，决定总成本相同时匹配哪些行；
    //  - 行列项：与成本成正比，优先级越高权重越大，匹配的行相同时让高优先级行拿到自己最便宜的列。
    //    行列项之和小于相邻行常数项之差的一半，不会改变第一级的结果。
    const double row_step = kTieEpsilon / (n + 1);
    const double cost_scale = row_step / (2.0 * (n + 1) * max_abs);

    std::vector<std::vector<double>> a(size + 1, std::vector<double>(size + 1, 0.0));
    for (int r = 1; r <= n; ++r) {
        const std::vector<double>& row = cost_matrix[order[r - 1]];
        double tie = row_step * r;
        double weight = cost_scale * (n - r + 1) / n;
        for (int c = 1; c <= m; ++c) {
            double cost = row[c - 1];
            a[r][c] = cost <= cost_limit ? cost + tie + weight * cost : infeasible;
        }
        for (int c = m + 1; c <= size; ++c) {
            a[r][c] = unmatched;
        }
    }
    for (int r = n + 1; r <= size; ++r) {
        for (int c = 1; c <= m; ++c) {
            a[r][c] = unmatched;
        }
    }

    // --- 4. 求解并还原到原始行列 ---
    std::vector<int> col_to_row = hungarian(a, size);

    std::vector<int> row_to_col(n, -1);
    for (int c = 1; c <= m; ++c) {
        int r = col_to_row[c];
        if (r < 1 || r > n) continue;

        int row = order[r - 1];
        int col = c - 1;
        if (cost_matrix[row][col] > cost_limit) {
            throw AssignmentError("solver assigned a pair above the cost limit");
        }
        if (row_to_col[row] != -1) {
            throw AssignmentError("solver assigned a row twice");
        }
        row_to_col[row] = col;
    }

    std::vector<bool> col_matched(m, false);
    for (int row = 0; row < n; ++row) {
        if (row_to_col[row] == -1) {
            result.unmatched_rows.push_back(row);
        } else {
            result.matches.emplace_back(row, row_to_col[row]);
            col_matched[row_to_col[row]] = true;
        }
    }
    for (int col = 0; col < m; ++col) {
        if (!col_matched[col]) {
            result.unmatched_cols.push_back(col);
        }
    }

    return result;
}
