#include "stages/feasibility_stage.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <string>
#include <utility>

#include "geo/geometry.hpp"

namespace formation {

double FeasibilityStage::ScoreNodePair(double distance_km, double time_diff_s,
                                       std::optional<double> heading_diff_deg,
                                       const FeasibilityConfig& cfg) {
  const double max_d = cfg.max_distance_km;
  const double max_t = cfg.max_time_diff_minutes * 60.0;

  const double distance_score = (max_d > 0.0) ? std::max(0.0, 1.0 - std::fabs(distance_km) / max_d)
                                              : (distance_km <= 0.0 ? 1.0 : 0.0);
  const double time_score = (max_t > 0.0) ? std::max(0.0, 1.0 - std::fabs(time_diff_s) / max_t)
                                          : (time_diff_s == 0.0 ? 1.0 : 0.0);

  if (cfg.use_heading && heading_diff_deg.has_value()) {
    const double hd = std::min(std::fabs(*heading_diff_deg), 360.0 - std::fabs(*heading_diff_deg));
    const double heading_score = std::max(0.0, 1.0 - hd / 180.0);
    return 0.4 * distance_score + 0.4 * time_score + 0.2 * heading_score;
  }
  return 0.5 * distance_score + 0.5 * time_score;
}

std::optional<double> FeasibilityStage::NodeHeading(const std::vector<TrajectoryNode>& nodes, std::size_t i) {
  if (nodes.size() < 2 || i >= nodes.size()) return std::nullopt;
  if (i + 1 < nodes.size()) {
    return geo::BearingDeg({nodes[i].lat_deg, nodes[i].lon_deg}, {nodes[i + 1].lat_deg, nodes[i + 1].lon_deg});
  }
  return geo::BearingDeg({nodes[i - 1].lat_deg, nodes[i - 1].lon_deg}, {nodes[i].lat_deg, nodes[i].lon_deg});
}

std::vector<FormationEdge> FeasibilityStage::FindFormationEdges(const std::vector<Flight>& flights,
                                                                const ITrajectoryStore& store,
                                                                const FeasibilityConfig& cfg) {
  std::vector<FormationEdge> edges;
  const auto window_s = static_cast<EpochSeconds>(std::llround(cfg.max_time_diff_minutes * 60.0));

  // 命中航班的航迹只取一次
  std::map<std::string, std::vector<TrajectoryNode>> cache;
  auto trajectory_of = [&](const std::string& id) -> const std::vector<TrajectoryNode>& {
    auto it = cache.find(id);
    if (it == cache.end()) it = cache.emplace(id, store.Trajectory(id)).first;
    return it->second;
  };

  for (const Flight& f : flights) {
    const std::vector<TrajectoryNode>& nodes = trajectory_of(f.id);
    for (std::size_t i = 0; i < nodes.size(); ++i) {
      const TrajectoryNode& n = nodes[i];
      const GeoPoint here{n.lat_deg, n.lon_deg};
      const std::vector<NodeHit> hits =
          store.Nearby(here, cfg.max_distance_km, {n.timestamp_s - window_s, n.timestamp_s + window_s});

      const std::optional<double> heading_a = NodeHeading(nodes, i);
      std::size_t accepted = 0;
      for (const NodeHit& h : hits) {
        if (accepted >= cfg.max_candidates_per_node) break;
        // 同航班跳过；无序航班对只在 id 较小的一侧生成
        if (h.flight_id == f.id || !(f.id < h.flight_id)) continue;

        const double d = geo::DistanceKm(here, {h.node.lat_deg, h.node.lon_deg});
        const double dt = static_cast<double>(h.node.timestamp_s - n.timestamp_s);
        if (d > cfg.max_distance_km || std::fabs(dt) > cfg.max_time_diff_minutes * 60.0) continue;

        FormationEdge e;
        e.flight_a = f.id;
        e.flight_b = h.flight_id;
        e.node_a = i;
        e.node_b = h.node_index;
        e.t_a = n.timestamp_s;
        e.t_b = h.node.timestamp_s;
        e.time_diff_s = std::fabs(dt);
        e.distance_km = d;
        e.heading_a_deg = heading_a;
        e.heading_b_deg = NodeHeading(trajectory_of(h.flight_id), h.node_index);

        std::optional<double> hd;
        if (e.heading_a_deg && e.heading_b_deg) {
          hd = geo::HeadingDifferenceDeg(*e.heading_a_deg, *e.heading_b_deg);
          e.heading_similarity = std::max(0.0, 1.0 - *hd / 180.0);
        }
        e.score = ScoreNodePair(d, dt, hd, cfg);
        edges.push_back(std::move(e));
        ++accepted;
      }
    }
  }

  std::stable_sort(edges.begin(), edges.end(),
                   [](const FormationEdge& a, const FormationEdge& b) { return a.score > b.score; });
  return edges;
}

void FeasibilityStage::Run(MatchingContext& ctx) {
  ctx.edges.clear();
  for (auto& p : ctx.pairs) p.feasibility_score.reset();

  if (ctx.store) {
    ctx.edges = FindFormationEdges(ctx.flights, *ctx.store, ctx.config.feasibility);
  }

  // 航班对 -> 最高边分
  std::map<std::pair<std::string, std::string>, double> best;
  for (const auto& e : ctx.edges) {
    auto key = std::make_pair(e.flight_a, e.flight_b);
    auto it = best.find(key);
    if (it == best.end() || e.score > it->second) best[key] = e.score;
  }

  for (auto& p : ctx.pairs) {
    if (p.flight_a >= ctx.flights.size() || p.flight_b >= ctx.flights.size()) continue;
    const std::string& a = ctx.flights[p.flight_a].id;
    const std::string& b = ctx.flights[p.flight_b].id;
    auto it = best.find(a < b ? std::make_pair(a, b) : std::make_pair(b, a));
    if (it != best.end()) p.feasibility_score = it->second;
  }

  if (ctx.config.feasibility.min_score.has_value()) {
    const double th = *ctx.config.feasibility.min_score;
    ctx.pairs.erase(std::remove_if(ctx.pairs.begin(), ctx.pairs.end(),
                                   [th](const CompatiblePair& p) {
                                     return !p.feasibility_score || *p.feasibility_score < th;
                                   }),
                    ctx.pairs.end());
  }

  std::stable_sort(ctx.pairs.begin(), ctx.pairs.end(), [](const CompatiblePair& a, const CompatiblePair& b) {
    const double sa = a.feasibility_score.value_or(-1.0);
    const double sb = b.feasibility_score.value_or(-1.0);
    return sa > sb;
  });
}

} // namespace formation
