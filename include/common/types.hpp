#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/config.hpp"

namespace formation {

class ITrajectoryStore;

// UTC 秒（Unix epoch）
using EpochSeconds = std::int64_t;

// ========================
// 1) 基础地理类型
// ========================

struct GeoPoint {
  double lat_deg{0.0};
  double lon_deg{0.0};
};

// 航迹采样点：同一航班内 timestamp 单调不减
struct TrajectoryNode {
  double lat_deg{0.0};
  double lon_deg{0.0};
  EpochSeconds timestamp_s{0};
};

// ========================
// 2) 航班（输入）
// ========================

// 起飞/到达端点。position 缺失时由机场表补齐，仍缺失则该航班被跳过。
struct Endpoint {
  std::string airport;
  std::optional<GeoPoint> position;
  std::optional<EpochSeconds> time_s;
};

struct Flight {
  std::string id;
  std::string route_label;
  Endpoint departure;
  Endpoint arrival;
  std::vector<TrajectoryNode> nodes; // 可为空（只有端点摘要）

  bool HasCoordinates() const { return departure.position.has_value() && arrival.position.has_value(); }
  bool HasSchedule() const { return departure.time_s.has_value() && arrival.time_s.has_value(); }
};

// ========================
// 3) 配对 / 可行性
// ========================

enum class PairKind {
  kSimilar,      ///< 共享一个机场（起飞或到达），航向接近
  kIntersecting  ///< 不共享机场，航线相交且到达交点时间接近
};

inline const char* ToString(PairKind k) {
  return k == PairKind::kIntersecting ? "intersecting" : "similar";
}

// flight_a / flight_b 是 MatchingContext::flights 的下标（flight_a < flight_b）
struct CompatiblePair {
  PairKind kind{PairKind::kSimilar};
  std::size_t flight_a{0};
  std::size_t flight_b{0};
  double angle_deg{0.0};                   // 恒 >= 0
  std::optional<GeoPoint> intersection;    // 仅 intersecting
  std::optional<double> feasibility_score; // 由 FeasibilityStage 填写
};

// 两个航班各取一个节点组成的“编队候选边”
struct FormationEdge {
  std::string flight_a; // flight_a < flight_b（按 id 字典序）
  std::string flight_b;
  std::size_t node_a{0};
  std::size_t node_b{0};
  EpochSeconds t_a{0};
  EpochSeconds t_b{0};
  double time_diff_s{0.0};
  double distance_km{0.0};
  std::optional<double> heading_a_deg;
  std::optional<double> heading_b_deg;
  std::optional<double> heading_similarity;
  double score{0.0};
};

// ========================
// 4) 加速走廊 / 优化路径
// ========================

struct BoostCorridor {
  GeoPoint start;
  double bearing_deg{0.0};
  double length_km{0.0};
  std::size_t source_pair{0}; // MatchingContext::pairs 下标
  double efficiency{0.0};
};

enum class WaypointKind { kDeparture, kBoostEntry, kBoostExit, kArrival };

inline const char* ToString(WaypointKind k) {
  switch (k) {
    case WaypointKind::kDeparture:  return "departure";
    case WaypointKind::kBoostEntry: return "boost_entry";
    case WaypointKind::kBoostExit:  return "boost_exit";
    case WaypointKind::kArrival:    return "arrival";
  }
  return "unknown";
}

struct PathWaypoint {
  GeoPoint position;
  WaypointKind kind{WaypointKind::kDeparture};
};

struct BoostUsage {
  std::size_t corridor{0}; // MatchingContext::corridors 下标
  GeoPoint entry;
  GeoPoint exit;
  double entry_along_km{0.0};
  double exit_along_km{0.0};
  double distance_in_boost_km{0.0};
  double bearing_deg{0.0};
};

struct OptimizedPath {
  std::string flight_id;
  std::string departure_airport;
  std::string arrival_airport;
  double original_distance_km{0.0};
  double optimized_distance_km{0.0};  // waypoints 相邻段大圆距离之和
  double weighted_time{0.0};          // 距离/速度 加权后的代价
  double time_savings_minutes{0.0};   // 恒 >= 0
  std::vector<PathWaypoint> waypoints;
  std::vector<BoostUsage> boost_segments;
};

// ========================
// 5) 跟飞 / 起飞时间推荐
// ========================

struct PathNode {
  double lat_deg{0.0};
  double lon_deg{0.0};
  EpochSeconds timestamp_s{0};
  bool following{false};
  double segment_distance_km{0.0}; // 到下一个节点的距离，最后一个为 0
};

struct FollowingCostAnalysis {
  double solo_cost{0.0};
  double total_cost{0.0};
  double savings{0.0};
  double savings_percent{0.0};
  double detour_km{0.0};
  double following_km{0.0};
  double continuation_km{0.0};
  int total_segments{0};
  int connected_segments{0};
};

// followed_flight_id 为空 <=> 直飞，savings 恒为 0
struct FollowingResult {
  EpochSeconds departure_time_s{0};
  int offset_minutes{0};
  std::optional<std::string> followed_flight_id;
  std::vector<PathNode> path_nodes;
  FollowingCostAnalysis cost;

  // 被跟飞航班航迹中的会合/脱离下标，以及它们在 path_nodes 中的位置
  std::size_t intercept_index{0};
  std::size_t departure_index{0};
  std::size_t intercept_path_index{0};
  std::size_t departure_path_index{0};
};

struct DepartureRequest {
  std::string id;
  std::string origin_airport;
  std::string destination_airport;
  std::optional<GeoPoint> origin;
  std::optional<GeoPoint> destination;
  EpochSeconds scheduled_departure_s{0};
  std::optional<double> duration_minutes;
  std::optional<double> distance_km;
};

// 单个偏移量的评估记录
struct OffsetEvaluation {
  int offset_minutes{0};
  EpochSeconds departure_time_s{0};
  std::optional<std::string> followed_flight_id;
  double total_cost{0.0};
  double savings_percent{0.0};
  int candidates_considered{0};
};

struct DepartureStatistics {
  int offsets_evaluated{0};
  int offsets_with_partner{0};
  double average_cost{0.0};
  double average_savings_percent{0.0};
  double cost_reduction_vs_average_percent{0.0};
};

struct DepartureRecommendation {
  std::string request_id;
  std::string origin_airport;
  std::string destination_airport;
  GeoPoint origin;
  GeoPoint destination;
  EpochSeconds scheduled_departure_s{0};
  EpochSeconds recommended_departure_s{0};
  int offset_minutes{0};

  FollowingResult best;
  std::vector<PathNode> original_path;
  std::vector<TrajectoryNode> partner_path;
  std::vector<OffsetEvaluation> evaluations;
  DepartureStatistics statistics;
};

// ========================
// 6) 被跳过条目的计数（不致命，仅供调用方观察）
// ========================

struct SkipCounters {
  int flights_missing_coordinates{0};
  int flights_degenerate_course{0};
  int pairs_non_positive_duration{0};
  int pairs_unknown_flight{0};
  int corridor_solver_failures{0};
  int requests_unresolved{0};
};

// ========================
// 7) 一次批处理的上下文（各 Stage 之间传递的载体）
// ========================

struct MatchingContext {
  // === 输入 ===
  EngineConfig config;
  std::vector<Flight> flights;
  const ITrajectoryStore* store{nullptr}; // 只读；为空时跳过节点级搜索与跟飞
  std::vector<DepartureRequest> departure_requests;

  // === 中间结果 ===
  std::vector<CompatiblePair> pairs;
  std::vector<FormationEdge> edges;
  std::vector<BoostCorridor> corridors;

  // === 输出 ===
  std::vector<OptimizedPath> optimized_paths; // 按 time_savings_minutes 降序
  std::vector<DepartureRecommendation> recommendations;
  SkipCounters skipped;
};

} // namespace formation
