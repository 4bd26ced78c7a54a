#pragma once
#include <optional>

#include "stages/stage_base.hpp"

namespace formation {

// ======================
// 环节：由配对生成加速走廊
//
// 输入：ctx.pairs / ctx.flights / ctx.config.corridor
// 输出：ctx.corridors（source_pair 为配对下标；航班缺坐标的配对跳过，
//       计入 ctx.skipped.flights_missing_coordinates）
//
//   intersecting：以交点为中心，沿两航向角平分线前后各 length/2（默认共 400 km）
//   similar：     从共享机场出发（共享起飞机场取 flight_a 起点，否则取 flight_a 终点），
//                 长度 = similar_length_factor * min(两航班航程)
//   efficiency = (1 - angle/45) * (intersecting ? 1.2 : 1.0)
// ======================
class CorridorBuildStage final : public IStage {
public:
  void Run(MatchingContext& ctx) override;

  /// 任一航班缺起降坐标时返回 nullopt
  static std::optional<BoostCorridor> BuildCorridor(const CompatiblePair& pair, const Flight& a, const Flight& b,
                                                    const CorridorConfig& cfg);
};

} // namespace formation
