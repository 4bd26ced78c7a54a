#pragma once
/**
 * @file corridor_optimizer.hpp
 *
 * 加速走廊（boost corridor）路径优化：
 *   [1] EntryExitSolver：单条走廊上求最优进入/退出距离 (e, x)
 *         time = d(origin, entry)/v_n + d(entry, exit)/v_b + d(exit, dest)/v_n
 *         约束 0 <= e, x <= L, x - e >= min_boost_segment_km
 *       类似光的折射：走廊内“介质”更快，最优路径会向走廊偏折。
 *       求解器不收敛 => 该走廊不可用（返回 nullopt），不是错误。
 *   [2] PathSelector：在一个航班可用的走廊集合上比较
 *         直飞 / 单走廊 / 两条走廊串联
 *       取加权时间最小者。
 */

#include <cstddef>
#include <optional>
#include <vector>

#include "common/minimizer.hpp"
#include "common/types.hpp"

namespace formation::corridor {

struct CorridorSolution {
  double entry_along_km{0.0};
  double exit_along_km{0.0};
  GeoPoint entry;
  GeoPoint exit;
  double weighted_time{0.0};
  double distance_in_boost_km{0.0};
  int sweeps{0};
};

class EntryExitSolver {
public:
  explicit EntryExitSolver(const CorridorConfig& cfg);

  std::optional<CorridorSolution> Solve(const GeoPoint& origin, const GeoPoint& destination,
                                        const BoostCorridor& corridor) const;

  /// origin -> entry -> exit -> destination 的加权时间（entry..exit 段按走廊速度）
  double WeightedTime(const GeoPoint& origin, const GeoPoint& entry,
                      const GeoPoint& exit, const GeoPoint& destination) const;

private:
  CorridorConfig cfg_;
  MinimizerOptions options_;
};

struct SelectionResult {
  OptimizedPath path;
  int solver_failures{0};
};

class PathSelector {
public:
  explicit PathSelector(const CorridorConfig& cfg);

  /// available 是 corridors 的下标；调用方保证 flight 有端点坐标
  SelectionResult Select(const Flight& flight,
                         const std::vector<BoostCorridor>& corridors,
                         const std::vector<std::size_t>& available) const;

  /// 超过 cap 条时按 efficiency 降序保留前 cap 条（同分保持原顺序）
  static std::vector<std::size_t> CapByEfficiency(const std::vector<BoostCorridor>& corridors,
                                                  std::vector<std::size_t> available,
                                                  std::size_t cap);

private:
  CorridorConfig cfg_;
  EntryExitSolver solver_;
};

/// 相邻 waypoint 大圆距离之和
double PathLengthKm(const std::vector<PathWaypoint>& waypoints);

} // namespace formation::corridor
