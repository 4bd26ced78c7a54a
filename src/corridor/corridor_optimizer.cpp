#include "corridor/corridor_optimizer.hpp"

#include <algorithm>
#include <cmath>

#include "geo/geometry.hpp"

namespace formation::corridor {

// ============================================================
// [1] EntryExitSolver
// ============================================================

EntryExitSolver::EntryExitSolver(const CorridorConfig& cfg) : cfg_(cfg) {
  options_.max_sweeps = cfg.solver_max_sweeps;
  options_.max_line_iterations = cfg.solver_max_line_iterations;
  options_.tolerance = cfg.solver_tolerance;
}

double EntryExitSolver::WeightedTime(const GeoPoint& origin, const GeoPoint& entry,
                                     const GeoPoint& exit, const GeoPoint& destination) const {
  return geo::DistanceKm(origin, entry) / cfg_.normal_speed +
         geo::DistanceKm(entry, exit) / cfg_.boost_speed +
         geo::DistanceKm(exit, destination) / cfg_.normal_speed;
}

std::optional<CorridorSolution> EntryExitSolver::Solve(const GeoPoint& origin, const GeoPoint& destination,
                                                       const BoostCorridor& corridor) const {
  const double L = corridor.length_km;
  if (!(L >= cfg_.min_boost_segment_km) || cfg_.normal_speed <= 0.0 || cfg_.boost_speed <= 0.0) {
    return std::nullopt;
  }

  auto point_at = [&corridor](double along_km) {
    return geo::DestinationPoint(corridor.start, corridor.bearing_deg, along_km);
  };
  auto objective = [&](double e, double x) {
    return WeightedTime(origin, point_at(e), point_at(x), destination);
  };

  const MinimizerResult r = MinimizeOrderedPair(objective, {0.0, L, cfg_.min_boost_segment_km},
                                                cfg_.initial_entry_fraction * L,
                                                cfg_.initial_exit_fraction * L, options_);
  if (!r.converged) {
    return std::nullopt;
  }

  CorridorSolution s;
  s.entry_along_km = r.first;
  s.exit_along_km = r.second;
  s.entry = point_at(r.first);
  s.exit = point_at(r.second);
  s.weighted_time = r.value;
  s.distance_in_boost_km = geo::DistanceKm(s.entry, s.exit);
  s.sweeps = r.sweeps;
  return s;
}

// ============================================================
// [2] PathSelector
// ============================================================

double PathLengthKm(const std::vector<PathWaypoint>& waypoints) {
  double sum = 0.0;
  for (std::size_t i = 0; i + 1 < waypoints.size(); ++i) {
    sum += geo::DistanceKm(waypoints[i].position, waypoints[i + 1].position);
  }
  return sum;
}

static BoostUsage MakeUsage(std::size_t idx, const BoostCorridor& c, const CorridorSolution& s) {
  BoostUsage u;
  u.corridor = idx;
  u.entry = s.entry;
  u.exit = s.exit;
  u.entry_along_km = s.entry_along_km;
  u.exit_along_km = s.exit_along_km;
  u.distance_in_boost_km = s.distance_in_boost_km;
  u.bearing_deg = c.bearing_deg;
  return u;
}

PathSelector::PathSelector(const CorridorConfig& cfg) : cfg_(cfg), solver_(cfg) {}

std::vector<std::size_t> PathSelector::CapByEfficiency(const std::vector<BoostCorridor>& corridors,
                                                       std::vector<std::size_t> available,
                                                       std::size_t cap) {
  if (available.size() <= cap) return available;
  std::stable_sort(available.begin(), available.end(), [&](std::size_t a, std::size_t b) {
    return corridors[a].efficiency > corridors[b].efficiency;
  });
  available.resize(cap);
  return available;
}

SelectionResult PathSelector::Select(const Flight& flight,
                                     const std::vector<BoostCorridor>& corridors,
                                     const std::vector<std::size_t>& requested) const {
  SelectionResult out;
  OptimizedPath& path = out.path;
  path.flight_id = flight.id;
  path.departure_airport = flight.departure.airport;
  path.arrival_airport = flight.arrival.airport;

  if (!flight.HasCoordinates()) {
    return out;
  }
  const GeoPoint dep = *flight.departure.position;
  const GeoPoint arr = *flight.arrival.position;

  std::vector<std::size_t> available;
  for (std::size_t idx : requested) {
    if (idx < corridors.size()) available.push_back(idx);
  }

  // --- 1) 直飞基线 ---
  const double direct = geo::DistanceKm(dep, arr);
  const double baseline_time = direct / cfg_.normal_speed;
  double best_time = baseline_time;
  path.original_distance_km = direct;
  path.waypoints = {{dep, WaypointKind::kDeparture}, {arr, WaypointKind::kArrival}};

  // 单走廊解在两条走廊组合时还要用到，先缓存
  std::vector<std::optional<CorridorSolution>> single(available.size());

  // --- 2) 单走廊 ---
  for (std::size_t k = 0; k < available.size(); ++k) {
    const std::size_t idx = available[k];
    single[k] = solver_.Solve(dep, arr, corridors[idx]);
    if (!single[k]) {
      out.solver_failures++;
      continue;
    }
    const CorridorSolution& s = *single[k];
    if (s.weighted_time < best_time) {
      best_time = s.weighted_time;
      path.waypoints = {{dep, WaypointKind::kDeparture},
                        {s.entry, WaypointKind::kBoostEntry},
                        {s.exit, WaypointKind::kBoostExit},
                        {arr, WaypointKind::kArrival}};
      path.boost_segments = {MakeUsage(idx, corridors[idx], s)};
    }
  }

  // --- 3) 两条走廊串联：按走廊起点离出发点的距离排序，第 1 条从出发点解，第 2 条从第 1 条出口解 ---
  std::vector<std::size_t> order(available.size());
  for (std::size_t k = 0; k < order.size(); ++k) order[k] = k;
  std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
    return geo::DistanceKm(dep, corridors[available[a]].start) < geo::DistanceKm(dep, corridors[available[b]].start);
  });

  for (std::size_t i = 0; i < order.size(); ++i) {
    const auto& first = single[order[i]];
    if (!first) continue;
    const std::size_t idx1 = available[order[i]];

    for (std::size_t j = i + 1; j < order.size(); ++j) {
      const std::size_t idx2 = available[order[j]];
      const auto second = solver_.Solve(first->exit, arr, corridors[idx2]);
      if (!second) {
        out.solver_failures++;
        continue;
      }

      const double total = geo::DistanceKm(dep, first->entry) / cfg_.normal_speed +
                           first->distance_in_boost_km / cfg_.boost_speed +
                           geo::DistanceKm(first->exit, second->entry) / cfg_.normal_speed +
                           second->distance_in_boost_km / cfg_.boost_speed +
                           geo::DistanceKm(second->exit, arr) / cfg_.normal_speed;
      if (total < best_time) {
        best_time = total;
        path.waypoints = {{dep, WaypointKind::kDeparture},
                          {first->entry, WaypointKind::kBoostEntry},
                          {first->exit, WaypointKind::kBoostExit},
                          {second->entry, WaypointKind::kBoostEntry},
                          {second->exit, WaypointKind::kBoostExit},
                          {arr, WaypointKind::kArrival}};
        path.boost_segments = {MakeUsage(idx1, corridors[idx1], *first),
                               MakeUsage(idx2, corridors[idx2], *second)};
      }
    }
  }

  path.weighted_time = best_time;
  path.optimized_distance_km = PathLengthKm(path.waypoints);
  const double savings = (baseline_time - best_time) * cfg_.normal_speed / cfg_.average_speed_kmh * 60.0;
  path.time_savings_minutes = std::max(0.0, savings);
  return out;
}

} // namespace formation::corridor
