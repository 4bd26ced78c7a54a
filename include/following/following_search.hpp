#pragma once
/**
 * @file following_search.hpp
 *
 * 跟飞（flight following）起飞时间搜索。
 *
 * 环节对应关系：
 *   [1] CandidateFlightFinder   在偏移后的起飞时刻 ±窗口 内起飞、且总航向与本航线相近的航班
 *   [2] InterceptPointFinder    在候选航迹上（跳过其起点）找会合点
 *   [3] DeparturePointFinder    从会合点往后扫，找“继续跟飞会明显远离目的地”之前的脱离点
 *   [4] FollowingCostEvaluator  绕飞 + 跟飞×(1-gain) + 续飞，和直飞比较，并合成路径节点
 *   [5] DepartureTimeSelector   在所有偏移量的结果中取总代价最小、且节省为正的方案
 *
 * 每个环节都是带默认实现的 virtual 接口，tests 中可以替换成桩。
 * FollowingSearcher 负责按顺序组装这些环节。
 */

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "common/types.hpp"
#include "geo/geometry.hpp"
#include "store/trajectory_store.hpp"

namespace formation::following {

// ============================================================
// 小工具
// ============================================================

static inline GeoPoint ToPoint(const TrajectoryNode& n) { return {n.lat_deg, n.lon_deg}; }
static inline GeoPoint ToPoint(const PathNode& n) { return {n.lat_deg, n.lon_deg}; }

static inline EpochSeconds AddMinutes(EpochSeconds t, double minutes) {
  return t + static_cast<EpochSeconds>(std::llround(minutes * 60.0));
}

/// 大圆上等分取点：floor(duration/step) 段（至少 1 段），时间在 duration 内均匀分布。
/// duration < 0 返回空。
static inline std::vector<PathNode> SynthesizePath(const GeoPoint& from, const GeoPoint& to,
                                                   EpochSeconds start, double duration_minutes,
                                                   double step_minutes) {
  std::vector<PathNode> out;
  if (!(duration_minutes >= 0.0)) return out;

  int segments = 1;
  if (step_minutes > 0.0) {
    segments = std::max(1, static_cast<int>(std::floor(duration_minutes / step_minutes)));
  }
  out.reserve(static_cast<std::size_t>(segments) + 1);
  for (int i = 0; i <= segments; ++i) {
    const double fraction = static_cast<double>(i) / segments;
    const GeoPoint p = geo::Interpolate(from, to, fraction);
    PathNode n;
    n.lat_deg = p.lat_deg;
    n.lon_deg = p.lon_deg;
    n.timestamp_s = AddMinutes(start, duration_minutes * fraction);
    out.push_back(n);
  }
  return out;
}

/// 写入每个节点到下一个节点的距离（最后一个为 0）
static inline void AssignSegmentDistances(std::vector<PathNode>& path) {
  for (std::size_t i = 0; i < path.size(); ++i) {
    path[i].segment_distance_km = (i + 1 < path.size()) ? geo::DistanceKm(ToPoint(path[i]), ToPoint(path[i + 1])) : 0.0;
  }
}

// ============================================================
// 数据载体
// ============================================================

struct FollowingQuery {
  GeoPoint origin;
  GeoPoint destination;
  EpochSeconds scheduled_departure_s{0};
  double duration_minutes{0.0};
  double solo_cost_km{0.0}; // 直飞代价（默认 = 大圆距离）
};

struct Candidate {
  std::string flight_id;
  std::vector<TrajectoryNode> nodes;
  double bearing_deg{0.0};
  double bearing_diff_deg{0.0};
  EpochSeconds start_time_s{0};
};

struct InterceptChoice {
  std::size_t index{0};
  double score{std::numeric_limits<double>::infinity()};
  double distance_km{0.0};
  double minutes_to_intercept{0.0};
};

// 一个偏移量下的最佳结果（没有可行候选时 result 为直飞）
struct OffsetOutcome {
  int offset_minutes{0};
  EpochSeconds departure_time_s{0};
  int candidates_considered{0};
  std::optional<FollowingResult> result; // 仅当存在 savings_percent > 0 的候选
};

struct FollowingSearchResult {
  FollowingResult best;
  std::vector<OffsetEvaluation> evaluations;
};

// ============================================================
// [1] 候选航班
// ============================================================
class CandidateFlightFinder {
public:
  virtual ~CandidateFlightFinder() = default;

  virtual std::vector<Candidate> Find(const ITrajectoryStore& store, const FollowingQuery& q,
                                      EpochSeconds departure_time_s, const FollowingConfig& cfg) const {
    std::vector<Candidate> out;

    const EpochSeconds w = AddMinutes(0, cfg.candidate_window_minutes);
    const std::vector<std::string> ids = store.FlightsDepartingWithin({departure_time_s - w, departure_time_s + w});
    const double route_bearing = geo::BearingDeg(q.origin, q.destination);

    std::size_t examined = 0;
    for (const auto& id : ids) {
      if (examined >= cfg.max_candidates) break;
      ++examined;

      std::vector<TrajectoryNode> nodes = store.Trajectory(id);
      if (nodes.size() < 2) continue;

      const double fb = geo::BearingDeg(ToPoint(nodes.front()), ToPoint(nodes.back()));
      const double diff = geo::HeadingDifferenceDeg(fb, route_bearing);
      if (diff > cfg.max_bearing_diff_deg) continue;

      Candidate c;
      c.flight_id = id;
      c.bearing_deg = fb;
      c.bearing_diff_deg = diff;
      c.start_time_s = nodes.front().timestamp_s;
      c.nodes = std::move(nodes);
      out.push_back(std::move(c));
    }
    return out;
  }
};

// ============================================================
// [2] 会合点
// ============================================================
class InterceptPointFinder {
public:
  virtual ~InterceptPointFinder() = default;

  /// score = 距离 + weight * |到达该节点的时刻差 - 按巡航速度飞过去所需时间|，越小越好。
  /// 下标 0（候选航班自己的起点）不参与。
  virtual std::optional<InterceptChoice> Find(const GeoPoint& origin, const std::vector<TrajectoryNode>& nodes,
                                              EpochSeconds departure_time_s, const FollowingConfig& cfg) const {
    std::optional<InterceptChoice> best;
    const double reach_km = cfg.intercept_reach_factor * cfg.max_detour_km;

    for (std::size_t i = 1; i < nodes.size(); ++i) {
      const double d = geo::DistanceKm(origin, ToPoint(nodes[i]));
      if (d > reach_km) continue;

      const double minutes = static_cast<double>(nodes[i].timestamp_s - departure_time_s) / 60.0;
      if (minutes < 0.0 || minutes > cfg.max_intercept_minutes) continue;

      const double fly_minutes = d / cfg.cruise_speed_kmh * 60.0;
      const double score = d + cfg.intercept_time_weight * std::fabs(minutes - fly_minutes);
      if (!best || score < best->score) {
        best = InterceptChoice{i, score, d, minutes};
      }
    }
    return best;
  }
};

// ============================================================
// [3] 脱离点
// ============================================================
class DeparturePointFinder {
public:
  virtual ~DeparturePointFinder() = default;

  /// 相邻节点到目的地距离增加超过 max_divergence_km 时，在前一个节点脱离；
  /// 一直没超过则跟到最后一个节点。
  virtual std::size_t Find(const std::vector<TrajectoryNode>& nodes, std::size_t intercept_index,
                           const GeoPoint& destination, const FollowingConfig& cfg) const {
    if (nodes.empty()) return 0;
    for (std::size_t i = intercept_index + 1; i < nodes.size(); ++i) {
      const double prev = geo::DistanceKm(ToPoint(nodes[i - 1]), destination);
      const double cur = geo::DistanceKm(ToPoint(nodes[i]), destination);
      if (cur > prev + cfg.max_divergence_km) {
        return i - 1;
      }
    }
    return nodes.size() - 1;
  }
};

// ============================================================
// [4] 代价 + 路径合成
// ============================================================
class FollowingCostEvaluator {
public:
  virtual ~FollowingCostEvaluator() = default;

  virtual FollowingResult Evaluate(const FollowingQuery& q, EpochSeconds departure_time_s,
                                   const Candidate& cand, const InterceptChoice& intercept,
                                   std::size_t departure_index, const FollowingConfig& cfg) const {
    FollowingResult r;
    r.departure_time_s = departure_time_s;
    if (intercept.index >= cand.nodes.size()) {
      // 下标越界：当作不可跟飞，savings 保持 0
      r.cost.solo_cost = q.solo_cost_km;
      r.cost.total_cost = q.solo_cost_km;
      return r;
    }
    r.followed_flight_id = cand.flight_id;
    r.intercept_index = intercept.index;
    r.departure_index = std::min(std::max(departure_index, intercept.index), cand.nodes.size() - 1);

    const TrajectoryNode& in_node = cand.nodes[r.intercept_index];
    const TrajectoryNode& out_node = cand.nodes[r.departure_index];

    // --- 代价 ---
    FollowingCostAnalysis& c = r.cost;
    c.detour_km = geo::DistanceKm(q.origin, ToPoint(in_node));
    for (std::size_t i = r.intercept_index; i < r.departure_index; ++i) {
      c.following_km += geo::DistanceKm(ToPoint(cand.nodes[i]), ToPoint(cand.nodes[i + 1]));
    }
    c.continuation_km = geo::DistanceKm(ToPoint(out_node), q.destination);

    c.solo_cost = q.solo_cost_km;
    c.total_cost = c.detour_km + c.following_km * (1.0 - cfg.efficiency_gain) + c.continuation_km;
    c.savings = c.solo_cost - c.total_cost;
    c.savings_percent = (c.solo_cost > 0.0) ? c.savings / c.solo_cost * 100.0 : 0.0;

    // --- 路径：绕飞（不含会合点） + 跟飞节点 + 续飞（不含脱离点） ---
    std::vector<PathNode> detour = SynthesizePath(q.origin, ToPoint(in_node), departure_time_s,
                                                  static_cast<double>(in_node.timestamp_s - departure_time_s) / 60.0,
                                                  cfg.path_step_minutes);
    if (!detour.empty()) detour.pop_back();
    r.path_nodes = std::move(detour);

    r.intercept_path_index = r.path_nodes.size();
    for (std::size_t i = r.intercept_index; i <= r.departure_index; ++i) {
      PathNode n;
      n.lat_deg = cand.nodes[i].lat_deg;
      n.lon_deg = cand.nodes[i].lon_deg;
      n.timestamp_s = cand.nodes[i].timestamp_s;
      n.following = true;
      r.path_nodes.push_back(n);
    }
    r.departure_path_index = r.path_nodes.size() - 1;

    const double cont_minutes = c.continuation_km / cfg.cruise_speed_kmh * 60.0;
    std::vector<PathNode> tail = SynthesizePath(ToPoint(out_node), q.destination, out_node.timestamp_s,
                                                cont_minutes, cfg.path_step_minutes);
    for (std::size_t i = 1; i < tail.size(); ++i) r.path_nodes.push_back(tail[i]);

    AssignSegmentDistances(r.path_nodes);
    c.total_segments = static_cast<int>(r.path_nodes.size()) - 1;
    c.connected_segments = static_cast<int>(r.departure_index - r.intercept_index);
    return r;
  }

  /// 不跟飞：按计划时间直飞
  virtual FollowingResult Direct(const FollowingQuery& q, EpochSeconds departure_time_s,
                                 const FollowingConfig& cfg) const {
    FollowingResult r;
    r.departure_time_s = departure_time_s;
    r.path_nodes = SynthesizePath(q.origin, q.destination, departure_time_s, q.duration_minutes, cfg.path_step_minutes);
    AssignSegmentDistances(r.path_nodes);
    r.cost.solo_cost = q.solo_cost_km;
    r.cost.total_cost = q.solo_cost_km;
    r.cost.continuation_km = q.solo_cost_km;
    r.cost.total_segments = r.path_nodes.empty() ? 0 : static_cast<int>(r.path_nodes.size()) - 1;
    return r;
  }
};

// ============================================================
// [5] 跨偏移量选优
// ============================================================
class DepartureTimeSelector {
public:
  virtual ~DepartureTimeSelector() = default;

  /// 返回 outcomes 中 total_cost 最小的那个（只看 result 非空的）；都没有则 nullopt。
  /// 同代价取先出现的。
  virtual std::optional<FollowingResult> Select(const std::vector<OffsetOutcome>& outcomes) const {
    std::optional<FollowingResult> best;
    for (const auto& o : outcomes) {
      if (!o.result || !(o.result->cost.savings_percent > 0.0)) continue;
      if (!best || o.result->cost.total_cost < best->cost.total_cost) {
        best = o.result;
      }
    }
    return best;
  }
};

// ============================================================
// 串联各环节
// ============================================================
class FollowingSearcher {
public:
  struct Dependencies {
    const CandidateFlightFinder* candidate_finder = nullptr;
    const InterceptPointFinder* intercept_finder = nullptr;
    const DeparturePointFinder* departure_finder = nullptr;
    const FollowingCostEvaluator* cost_evaluator = nullptr;
    const DepartureTimeSelector* selector = nullptr;
  };

  explicit FollowingSearcher(Dependencies deps) : deps_(deps) {}

  FollowingSearchResult Solve(const ITrajectoryStore* store, const FollowingQuery& q,
                              const FollowingConfig& cfg) const {
    FollowingSearchResult out;
    if (!deps_.cost_evaluator) {
      // 没有 evaluator 连直飞路径都合成不了，只给出计划时间
      out.best.departure_time_s = q.scheduled_departure_s;
      out.best.cost.solo_cost = q.solo_cost_km;
      out.best.cost.total_cost = q.solo_cost_km;
      return out;
    }

    const FollowingResult direct = deps_.cost_evaluator->Direct(q, q.scheduled_departure_s, cfg);
    out.best = direct;

    if (!store || !deps_.candidate_finder || !deps_.intercept_finder || !deps_.departure_finder || !deps_.selector) {
      return out; // 依赖不全：退回直飞
    }

    std::vector<OffsetOutcome> outcomes;
    outcomes.reserve(cfg.departure_offsets_minutes.size());

    // ========== 外层：遍历起飞时间偏移 ==========
    for (int offset : cfg.departure_offsets_minutes) {
      OffsetOutcome o;
      o.offset_minutes = offset;
      o.departure_time_s = AddMinutes(q.scheduled_departure_s, offset);

      // [1]
      const std::vector<Candidate> cands = deps_.candidate_finder->Find(*store, q, o.departure_time_s, cfg);
      o.candidates_considered = static_cast<int>(cands.size());

      // ========== 内层：遍历候选航班 ==========
      for (const auto& cand : cands) {
        // [2]
        const std::optional<InterceptChoice> ic =
            deps_.intercept_finder->Find(q.origin, cand.nodes, o.departure_time_s, cfg);
        if (!ic) continue;

        // [3]
        const std::size_t dep_idx = deps_.departure_finder->Find(cand.nodes, ic->index, q.destination, cfg);

        // [4]
        FollowingResult r = deps_.cost_evaluator->Evaluate(q, o.departure_time_s, cand, *ic, dep_idx, cfg);
        r.offset_minutes = offset;
        if (!(r.cost.savings_percent > 0.0)) continue;

        if (!o.result || r.cost.total_cost < o.result->cost.total_cost) {
          o.result = std::move(r);
        }
      }

      OffsetEvaluation ev;
      ev.offset_minutes = offset;
      ev.departure_time_s = o.departure_time_s;
      ev.candidates_considered = o.candidates_considered;
      if (o.result) {
        ev.followed_flight_id = o.result->followed_flight_id;
        ev.total_cost = o.result->cost.total_cost;
        ev.savings_percent = o.result->cost.savings_percent;
      } else {
        ev.total_cost = q.solo_cost_km;
        ev.savings_percent = 0.0;
      }
      out.evaluations.push_back(ev);
      outcomes.push_back(std::move(o));
    }

    // [5]
    std::optional<FollowingResult> best = deps_.selector->Select(outcomes);
    if (best) {
      out.best = std::move(*best);
    }
    return out;
  }

private:
  Dependencies deps_;
};

} // namespace formation::following
