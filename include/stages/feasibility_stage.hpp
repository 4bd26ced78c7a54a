#pragma once
#include <optional>
#include <vector>

#include "stages/stage_base.hpp"
#include "store/trajectory_store.hpp"

namespace formation {

// ======================
// 环节：节点级邻域搜索 + 可行性打分
//
// 输入：
//   ctx.store（为空时本环节只做排序，不打分）
//   ctx.flights / ctx.pairs
//   ctx.config.feasibility
//
// 输出：
//   ctx.edges：所有编队候选边，按 score 降序
//   ctx.pairs[i].feasibility_score = 该航班对所有边的最高分（无边则为空）
//   ctx.pairs 按分数稳定降序（无分数的排最后）；仅当设置了 min_score 时才剪枝
// ======================
class FeasibilityStage final : public IStage {
public:
  void Run(MatchingContext& ctx) override;

  /// 单个节点对的打分，恒在 [0,1]。
  /// heading_diff_deg 为两节点航向的最小夹角；为空或关闭航向项时只用距离+时间。
  static double ScoreNodePair(double distance_km, double time_diff_s,
                              std::optional<double> heading_diff_deg,
                              const FeasibilityConfig& cfg);

  /// 节点航向：指向同航班下一个节点；最后一个节点用“上一个 -> 当前”；单点航迹为空
  static std::optional<double> NodeHeading(const std::vector<TrajectoryNode>& nodes, std::size_t i);

  /// 对每个航班的每个节点查询邻域，生成去重后的候选边（已按 score 降序）
  static std::vector<FormationEdge> FindFormationEdges(const std::vector<Flight>& flights,
                                                       const ITrajectoryStore& store,
                                                       const FeasibilityConfig& cfg);
};

} // namespace formation
