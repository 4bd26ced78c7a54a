#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "common/types.hpp"

namespace formation {

// 闭区间 [begin_s, end_s]
struct TimeWindow {
  EpochSeconds begin_s{0};
  EpochSeconds end_s{0};

  bool Contains(EpochSeconds t) const { return t >= begin_s && t <= end_s; }
};

struct NodeHit {
  std::string flight_id;
  std::size_t node_index{0};
  TrajectoryNode node;
};

// ============================================================
// 航迹/时空索引的查询接口（外部协作者）。
// 核心算法只依赖这三个查询；调用是阻塞的，没有超时语义。
// 实现必须支持多线程并发只读访问。
// ============================================================
class ITrajectoryStore {
public:
  virtual ~ITrajectoryStore() = default;

  /// point 周围 radius_km 内、时间落在 window 内的所有节点
  virtual std::vector<NodeHit> Nearby(const GeoPoint& point, double radius_km, const TimeWindow& window) const = 0;

  /// 按时间排序的完整航迹；未知航班返回空
  virtual std::vector<TrajectoryNode> Trajectory(const std::string& flight_id) const = 0;

  /// 首个节点时间落在 window 内的航班 id（按 id 排序）
  virtual std::vector<std::string> FlightsDepartingWithin(const TimeWindow& window) const = 0;
};

// ============================================================
// 内存实现：经纬度均匀网格（默认 1 度一格）做粗筛，再用 haversine 精筛。
// 构建后只读。
// ============================================================
class InMemoryTrajectoryStore final : public ITrajectoryStore {
public:
  explicit InMemoryTrajectoryStore(double cell_deg = 1.0);

  /// 添加/替换一条航迹（会按时间排序）
  void Add(const std::string& flight_id, std::vector<TrajectoryNode> nodes);

  /// 把 flights 中带节点的航班全部加入
  void AddFlights(const std::vector<Flight>& flights);

  std::size_t FlightCount() const { return trajectories_.size(); }

  std::vector<NodeHit> Nearby(const GeoPoint& point, double radius_km, const TimeWindow& window) const override;
  std::vector<TrajectoryNode> Trajectory(const std::string& flight_id) const override;
  std::vector<std::string> FlightsDepartingWithin(const TimeWindow& window) const override;

private:
  struct NodeRef {
    std::string flight_id;
    std::size_t node_index{0};
  };
  using CellKey = std::pair<int, int>; // (lat 格号, lon 格号)

  CellKey CellOf(double lat_deg, double lon_deg) const;
  void RemoveFromGrid(const std::string& flight_id);

  double cell_deg_{1.0};
  std::map<std::string, std::vector<TrajectoryNode>> trajectories_;
  std::map<CellKey, std::vector<NodeRef>> grid_;
};

} // namespace formation
