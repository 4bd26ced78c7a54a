#include "stages/departure_time_stage.hpp"

#include "following/departure_optimizer.hpp"
#include "following/following_search.hpp"

namespace formation {

void DepartureTimeStage::Run(MatchingContext& ctx) {
  ctx.recommendations.clear();
  ctx.skipped.requests_unresolved = 0;
  if (ctx.departure_requests.empty()) return;

  // -------------------------
  // 1) 组装跟飞各环节 + searcher
  // -------------------------
  following::CandidateFlightFinder candidate_finder;   // [1]
  following::InterceptPointFinder intercept_finder;    // [2]
  following::DeparturePointFinder departure_finder;    // [3]
  following::FollowingCostEvaluator cost_evaluator;    // [4]
  following::DepartureTimeSelector selector;           // [5]

  following::FollowingSearcher::Dependencies deps;
  deps.candidate_finder = &candidate_finder;
  deps.intercept_finder = &intercept_finder;
  deps.departure_finder = &departure_finder;
  deps.cost_evaluator = &cost_evaluator;
  deps.selector = &selector;

  const following::FollowingSearcher searcher(deps);
  const FollowingConfig& cfg = ctx.config.following;

  // -------------------------
  // 2) 逐个请求求解
  // -------------------------
  for (const auto& req : ctx.departure_requests) {
    const std::optional<following::FollowingQuery> q = following::MakeQuery(req, cfg);
    if (!q) {
      ctx.skipped.requests_unresolved++;
      continue;
    }
    const following::FollowingSearchResult res = searcher.Solve(ctx.store, *q, cfg);
    ctx.recommendations.push_back(following::BuildRecommendation(req, *q, res, ctx.store, cfg));
  }
}

} // namespace formation
