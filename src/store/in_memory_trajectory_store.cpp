#include "store/trajectory_store.hpp"

#include <algorithm>
#include <cmath>

#include "geo/geometry.hpp"

namespace formation {

namespace {

constexpr double kKmPerDegLat = geo::kEarthRadiusKm * geo::kPi / 180.0;

int LonCellCount(double cell_deg) {
  return static_cast<int>(std::ceil(360.0 / cell_deg));
}

int WrapIndex(int i, int n) {
  const int r = i % n;
  return r < 0 ? r + n : r;
}

} // namespace

InMemoryTrajectoryStore::InMemoryTrajectoryStore(double cell_deg)
    : cell_deg_(cell_deg > 1e-6 ? cell_deg : 1.0) {}

InMemoryTrajectoryStore::CellKey InMemoryTrajectoryStore::CellOf(double lat_deg, double lon_deg) const {
  const int lat_idx = static_cast<int>(std::floor((lat_deg + 90.0) / cell_deg_));
  const int lon_idx = WrapIndex(static_cast<int>(std::floor((lon_deg + 180.0) / cell_deg_)), LonCellCount(cell_deg_));
  return {lat_idx, lon_idx};
}

void InMemoryTrajectoryStore::RemoveFromGrid(const std::string& flight_id) {
  for (auto it = grid_.begin(); it != grid_.end();) {
    auto& refs = it->second;
    refs.erase(std::remove_if(refs.begin(), refs.end(),
                              [&](const NodeRef& r) { return r.flight_id == flight_id; }),
               refs.end());
    if (refs.empty()) {
      it = grid_.erase(it);
    } else {
      ++it;
    }
  }
}

void InMemoryTrajectoryStore::Add(const std::string& flight_id, std::vector<TrajectoryNode> nodes) {
  if (trajectories_.count(flight_id)) {
    RemoveFromGrid(flight_id);
  }

  std::stable_sort(nodes.begin(), nodes.end(),
                   [](const TrajectoryNode& a, const TrajectoryNode& b) { return a.timestamp_s < b.timestamp_s; });

  for (std::size_t i = 0; i < nodes.size(); ++i) {
    grid_[CellOf(nodes[i].lat_deg, nodes[i].lon_deg)].push_back({flight_id, i});
  }
  trajectories_[flight_id] = std::move(nodes);
}

void InMemoryTrajectoryStore::AddFlights(const std::vector<Flight>& flights) {
  for (const auto& f : flights) {
    if (!f.nodes.empty()) {
      Add(f.id, f.nodes);
    }
  }
}

std::vector<NodeHit> InMemoryTrajectoryStore::Nearby(const GeoPoint& point, double radius_km,
                                                     const TimeWindow& window) const {
  std::vector<NodeHit> out;
  if (radius_km < 0.0 || grid_.empty()) return out;

  // --- 1) 覆盖查询圆的格子范围 ---
  const double lat_span = radius_km / kKmPerDegLat;
  const double cos_lat = std::cos(geo::Deg2Rad(std::min(89.999, std::fabs(point.lat_deg) + lat_span)));
  const double lon_span = (cos_lat > 1e-6) ? lat_span / cos_lat : 360.0;

  const int lat_lo = static_cast<int>(std::floor((point.lat_deg - lat_span + 90.0) / cell_deg_));
  const int lat_hi = static_cast<int>(std::floor((point.lat_deg + lat_span + 90.0) / cell_deg_));

  const int n_lon = LonCellCount(cell_deg_);
  std::vector<int> lon_cells;
  if (2.0 * lon_span >= 360.0) {
    for (int k = 0; k < n_lon; ++k) lon_cells.push_back(k);
  } else {
    const int lo = static_cast<int>(std::floor((point.lon_deg - lon_span + 180.0) / cell_deg_));
    const int hi = static_cast<int>(std::floor((point.lon_deg + lon_span + 180.0) / cell_deg_));
    for (int k = lo; k <= hi; ++k) lon_cells.push_back(WrapIndex(k, n_lon));
    std::sort(lon_cells.begin(), lon_cells.end());
    lon_cells.erase(std::unique(lon_cells.begin(), lon_cells.end()), lon_cells.end());
  }

  // --- 2) 精筛：时间窗 + 大圆距离 ---
  for (int la = lat_lo; la <= lat_hi; ++la) {
    for (int lo : lon_cells) {
      auto it = grid_.find({la, lo});
      if (it == grid_.end()) continue;

      for (const auto& ref : it->second) {
        const auto& node = trajectories_.at(ref.flight_id)[ref.node_index];
        if (!window.Contains(node.timestamp_s)) continue;
        if (geo::DistanceKm(point, {node.lat_deg, node.lon_deg}) > radius_km) continue;
        out.push_back({ref.flight_id, ref.node_index, node});
      }
    }
  }

  std::sort(out.begin(), out.end(), [](const NodeHit& a, const NodeHit& b) {
    if (a.flight_id != b.flight_id) return a.flight_id < b.flight_id;
    return a.node_index < b.node_index;
  });
  return out;
}

std::vector<TrajectoryNode> InMemoryTrajectoryStore::Trajectory(const std::string& flight_id) const {
  auto it = trajectories_.find(flight_id);
  if (it == trajectories_.end()) return {};
  return it->second;
}

std::vector<std::string> InMemoryTrajectoryStore::FlightsDepartingWithin(const TimeWindow& window) const {
  std::vector<std::string> out;
  for (const auto& [id, nodes] : trajectories_) {
    if (!nodes.empty() && window.Contains(nodes.front().timestamp_s)) {
      out.push_back(id);
    }
  }
  return out; // std::map 已按 id 排序
}

} // namespace formation
