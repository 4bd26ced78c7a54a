#pragma once
#include <functional>
#include <limits>

namespace formation {

// ============================================================
// 有序二元变量 (first, second) 的有界约束最小化：
//   lower <= first,  second <= upper,  second - first >= min_gap
// 做法：坐标下降 + 黄金分割线搜索。每一轮依次沿 first、second、
// 以及 (1,1) 平移方向各做一次一维搜索；平移方向保证在 gap 约束
// 起作用时仍能移动。
// ============================================================

struct OrderedPairBounds {
  double lower{0.0};
  double upper{0.0};
  double min_gap{0.0};
};

struct MinimizerOptions {
  int max_sweeps{200};
  int max_line_iterations{80};
  double tolerance{1e-6};          // 一轮下降量小于它视为收敛
  double line_tolerance{1e-5};     // 线搜索区间宽度
};

struct MinimizerResult {
  double first{0.0};
  double second{0.0};
  double value{std::numeric_limits<double>::infinity()};
  int sweeps{0};
  bool converged{false};
};

using PairObjective = std::function<double(double, double)>;

MinimizerResult MinimizeOrderedPair(const PairObjective& f,
                                    const OrderedPairBounds& bounds,
                                    double first0, double second0,
                                    const MinimizerOptions& options = {});

} // namespace formation
