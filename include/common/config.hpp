#pragma once
#include <cstddef>
#include <optional>
#include <vector>

namespace formation {

// ========================
// 可调参数（全部带默认值，config.json 中缺省的键沿用这里的值）
// ========================

// 候选配对（similar / intersecting）判定阈值
struct PairFinderConfig {
  double similar_max_angle_deg{45.0};
  double similar_max_time_gap_minutes{180.0};     // 按“一天内的分钟数”比较，跨午夜回绕
  double intersecting_max_angle_deg{10.0};
  double intersecting_max_time_gap_minutes{60.0}; // 两机到达交点的绝对时间差
};

// 节点级邻域搜索 + 可行性打分
struct FeasibilityConfig {
  double max_distance_km{50.0};
  double max_time_diff_minutes{10.0};
  bool   use_heading{true};
  std::size_t max_candidates_per_node{100};

  // 默认不剪枝；设置后低于阈值（或没有任何 edge）的配对会被删掉
  std::optional<double> min_score;
};

// 加速走廊（boost corridor）构建与求解
struct CorridorConfig {
  double normal_speed{1.0};
  double boost_speed{1.1};
  double min_boost_segment_km{10.0};

  double initial_entry_fraction{0.33};
  double initial_exit_fraction{0.66};

  std::size_t max_corridors_per_flight{3};
  double average_speed_kmh{800.0};     // 把加权时间差换算成分钟

  double intersecting_length_km{400.0};
  double similar_length_factor{0.8};
  double intersecting_efficiency_bonus{1.2};
  double efficiency_reference_angle_deg{45.0};

  int    solver_max_sweeps{200};
  int    solver_max_line_iterations{80};
  double solver_tolerance{1e-6};
};

// 跟飞（flight following）+ 起飞时间偏移搜索
struct FollowingConfig {
  std::vector<int> departure_offsets_minutes{-60, -40, -20, 0, 20, 40, 60};
  double candidate_window_minutes{10.0};
  double max_bearing_diff_deg{45.0};
  std::size_t max_candidates{50};

  double efficiency_gain{0.05};
  double max_detour_km{200.0};
  double intercept_reach_factor{2.0};    // 可达半径 = factor * max_detour_km
  double max_intercept_minutes{240.0};
  double max_divergence_km{100.0};
  double cruise_speed_kmh{800.0};
  double intercept_time_weight{0.1};
  double path_step_minutes{5.0};
};

struct EngineConfig {
  PairFinderConfig  pairs;
  FeasibilityConfig feasibility;
  CorridorConfig    corridor;
  FollowingConfig   following;

  // 0 表示按 std::thread::hardware_concurrency() 决定
  int worker_threads{0};
};

} // namespace formation
