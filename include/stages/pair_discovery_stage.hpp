#pragma once
#include <optional>

#include "stages/stage_base.hpp"

namespace formation {

// ======================
// 环节：候选配对发现
//
// 输入：
//   ctx.flights（端点坐标、机场代码、计划起降时间）
//   ctx.config.pairs
//
// 输出：
//   ctx.pairs：similar / intersecting 两类配对，每个无序航班对至多出现一次（i < j）
//   ctx.skipped.flights_missing_coordinates / flights_degenerate_course / pairs_non_positive_duration
// ======================
class PairDiscoveryStage final : public IStage {
public:
  void Run(MatchingContext& ctx) override;

  // 共享且只共享一个机场 + 夹角 <= 阈值 + 共享端的计划时间（一天内分钟）足够接近
  static std::optional<CompatiblePair> ClassifySimilar(const Flight& a, const Flight& b,
                                                       const PairFinderConfig& cfg);

  // 不共享机场 + 夹角 <= 阈值 + 航线相交 + 到达交点的时间足够接近。
  // non_positive_duration 非空时，若因某一方起降时间非法而放弃，会被置 true。
  static std::optional<CompatiblePair> ClassifyIntersecting(const Flight& a, const Flight& b,
                                                            const PairFinderConfig& cfg,
                                                            bool* non_positive_duration = nullptr);
};

} // namespace formation
