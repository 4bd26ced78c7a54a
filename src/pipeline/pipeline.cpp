#include "pipeline/pipeline.hpp"

// 具体 Stage
#include "stages/pair_discovery_stage.hpp"
#include "stages/feasibility_stage.hpp"
#include "stages/corridor_build_stage.hpp"
#include "stages/path_optimization_stage.hpp"
#include "stages/departure_time_stage.hpp"

namespace formation {

Pipeline::Pipeline() {
  stages_.emplace_back(std::make_unique<PairDiscoveryStage>());
  stages_.emplace_back(std::make_unique<FeasibilityStage>());
  stages_.emplace_back(std::make_unique<CorridorBuildStage>());
  stages_.emplace_back(std::make_unique<PathOptimizationStage>());
  // 跟飞推荐不依赖前面的结果，只读 ctx.store / ctx.departure_requests
  stages_.emplace_back(std::make_unique<DepartureTimeStage>());
}

void Pipeline::Run(MatchingContext& ctx) {
  for (auto& stage : stages_) {
    stage->Run(ctx);
  }
}

void Pipeline::RunFromPairs(MatchingContext& ctx) {
  // Stage index mapping (must match Pipeline::Pipeline() order)
  constexpr std::size_t kFeasibility = 1;

  for (std::size_t i = kFeasibility; i < stages_.size(); ++i) {
    stages_[i]->Run(ctx);
  }
}

} // namespace formation
