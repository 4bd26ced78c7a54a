#include "tests/test_framework.hpp"

#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "following/departure_optimizer.hpp"
#include "following/following_search.hpp"
#include "geo/geometry.hpp"
#include "stages/departure_time_stage.hpp"
#include "store/trajectory_store.hpp"

namespace {

using formation::EpochSeconds;
using formation::FollowingConfig;
using formation::GeoPoint;
using formation::PathNode;
using formation::TrajectoryNode;
namespace following = formation::following;
namespace geo = formation::geo;

constexpr EpochSeconds kT0 = 1717228800; // 2024-06-01T08:00:00Z

const GeoPoint kOrigin{40.0, -100.0};
const GeoPoint kDest{40.0, -80.0};

std::vector<TrajectoryNode> ToTrajectory(const std::vector<PathNode>& path) {
  std::vector<TrajectoryNode> out;
  for (const auto& n : path) out.push_back({n.lat_deg, n.lon_deg, n.timestamp_s});
  return out;
}

// 与本航线几乎重合、按巡航速度飞行的领航航班
std::vector<TrajectoryNode> LeadTrack(EpochSeconds start) {
  const GeoPoint from{40.1, -100.5};
  const GeoPoint to{40.1, -79.9};
  const double minutes = geo::DistanceKm(from, to) / 800.0 * 60.0;
  return ToTrajectory(following::SynthesizePath(from, to, start, minutes, 5.0));
}

following::FollowingQuery MakeQuery() {
  following::FollowingQuery q;
  q.origin = kOrigin;
  q.destination = kDest;
  q.scheduled_departure_s = kT0;
  q.solo_cost_km = geo::DistanceKm(kOrigin, kDest);
  q.duration_minutes = q.solo_cost_km / 800.0 * 60.0;
  return q;
}

void PrintBanner(const std::string& title) {
  std::cout << "\n";
  std::cout << "============================================================\n";
  std::cout << title << "\n";
  std::cout << "============================================================\n";
  std::cout << std::fixed << std::setprecision(6);
}

void DumpResult(const formation::FollowingResult& r) {
  std::cout << "departure=" << r.departure_time_s << " offset=" << r.offset_minutes
            << " followed=" << r.followed_flight_id.value_or("<none>")
            << " total_cost=" << r.cost.total_cost << " solo=" << r.cost.solo_cost
            << " savings%=" << r.cost.savings_percent << " path_nodes=" << r.path_nodes.size() << "\n";
  std::cout << "  detour=" << r.cost.detour_km << " following=" << r.cost.following_km
            << " continuation=" << r.cost.continuation_km
            << " intercept=" << r.intercept_index << " departure=" << r.departure_index << "\n";
}

// 默认实现组装的 searcher
struct DefaultSearcher {
  following::CandidateFlightFinder candidate_finder;
  following::InterceptPointFinder intercept_finder;
  following::DeparturePointFinder departure_finder;
  following::FollowingCostEvaluator cost_evaluator;
  following::DepartureTimeSelector selector;

  following::FollowingSearcher Make() const {
    following::FollowingSearcher::Dependencies deps;
    deps.candidate_finder = &candidate_finder;
    deps.intercept_finder = &intercept_finder;
    deps.departure_finder = &departure_finder;
    deps.cost_evaluator = &cost_evaluator;
    deps.selector = &selector;
    return following::FollowingSearcher(deps);
  }
};

// =========================
// 小工具
// =========================

bool Test_SynthesizePath_EvenTimes() {
  const auto p = following::SynthesizePath(kOrigin, kDest, kT0, 12.0, 5.0);
  FORMATION_EXPECT_EQ(p.size(), static_cast<std::size_t>(3));
  FORMATION_EXPECT_EQ(p[0].timestamp_s, kT0);
  FORMATION_EXPECT_EQ(p[1].timestamp_s, kT0 + 360);
  FORMATION_EXPECT_EQ(p[2].timestamp_s, kT0 + 720);
  FORMATION_EXPECT_NEAR(geo::DistanceKm({p.back().lat_deg, p.back().lon_deg}, kDest), 0.0, 1e-6);

  const auto zero = following::SynthesizePath(kOrigin, kDest, kT0, 0.0, 5.0);
  FORMATION_EXPECT_EQ(zero.size(), static_cast<std::size_t>(2));
  FORMATION_EXPECT_EQ(zero.back().timestamp_s, kT0);
  FORMATION_EXPECT_TRUE(following::SynthesizePath(kOrigin, kDest, kT0, -1.0, 5.0).empty());

  std::vector<PathNode> path = following::SynthesizePath(kOrigin, kDest, kT0, 60.0, 5.0);
  following::AssignSegmentDistances(path);
  double sum = 0.0;
  for (const auto& n : path) sum += n.segment_distance_km;
  FORMATION_EXPECT_NEAR(sum, geo::DistanceKm(kOrigin, kDest), 1e-6);
  FORMATION_EXPECT_NEAR(path.back().segment_distance_km, 0.0, 1e-12);
  return true;
}

// =========================
// [1]..[5] 各环节
// =========================

bool Test_CandidateFinder_WindowAndBearing() {
  formation::InMemoryTrajectoryStore store;
  store.Add("LEAD", LeadTrack(kT0 + 5 * 60));
  store.Add("LATE", LeadTrack(kT0 + 30 * 60));
  // 反向航班：航向差 180
  std::vector<TrajectoryNode> reverse = LeadTrack(kT0);
  for (std::size_t i = 0; i < reverse.size() / 2; ++i) {
    std::swap(reverse[i].lat_deg, reverse[reverse.size() - 1 - i].lat_deg);
    std::swap(reverse[i].lon_deg, reverse[reverse.size() - 1 - i].lon_deg);
  }
  store.Add("BACK", reverse);

  const FollowingConfig cfg;
  const auto cands = following::CandidateFlightFinder().Find(store, MakeQuery(), kT0, cfg);
  FORMATION_EXPECT_EQ(cands.size(), static_cast<std::size_t>(1));
  FORMATION_EXPECT_EQ(cands.front().flight_id, std::string("LEAD"));
  FORMATION_EXPECT_TRUE(cands.front().bearing_diff_deg <= 45.0);
  FORMATION_EXPECT_EQ(cands.front().start_time_s, kT0 + 5 * 60);
  return true;
}

bool Test_InterceptFinder_SkipsStartAndPast() {
  const std::vector<TrajectoryNode> nodes{
      {40.0, -100.0, kT0},
      {40.0, -99.9, kT0 + 600},
      {45.0, -90.0, kT0 + 1200},
  };
  const FollowingConfig cfg;
  const auto ic = following::InterceptPointFinder().Find(kOrigin, nodes, kT0, cfg);
  FORMATION_EXPECT_TRUE(ic.has_value());
  FORMATION_EXPECT_EQ(ic->index, static_cast<std::size_t>(1));
  FORMATION_EXPECT_NEAR(ic->minutes_to_intercept, 10.0, 1e-9);

  // 出发时节点 1 已经飞过，节点 2 超出可达半径
  FORMATION_EXPECT_NONE(following::InterceptPointFinder().Find(kOrigin, nodes, kT0 + 700, cfg));
  return true;
}

bool Test_DepartureFinder_StopsBeforeDivergence() {
  const FollowingConfig cfg;
  const std::vector<TrajectoryNode> diverging{
      {40.0, -100.0, kT0}, {40.0, -99.0, kT0 + 300}, {40.0, -98.0, kT0 + 600}, {30.0, -98.0, kT0 + 900}};
  FORMATION_EXPECT_EQ(following::DeparturePointFinder().Find(diverging, 0, kDest, cfg), static_cast<std::size_t>(2));

  const std::vector<TrajectoryNode> approaching{
      {40.0, -100.0, kT0}, {40.0, -99.0, kT0 + 300}, {40.0, -98.0, kT0 + 600}, {40.0, -97.0, kT0 + 900}};
  FORMATION_EXPECT_EQ(following::DeparturePointFinder().Find(approaching, 1, kDest, cfg), static_cast<std::size_t>(3));
  return true;
}

bool Test_CostEvaluator_DirectAndOutOfRange() {
  const FollowingConfig cfg;
  const following::FollowingCostEvaluator eval;
  const following::FollowingQuery q = MakeQuery();

  const formation::FollowingResult direct = eval.Direct(q, kT0, cfg);
  FORMATION_EXPECT_NONE(direct.followed_flight_id);
  FORMATION_EXPECT_NEAR(direct.cost.total_cost, q.solo_cost_km, 1e-12);
  FORMATION_EXPECT_NEAR(direct.cost.savings_percent, 0.0, 1e-12);
  FORMATION_EXPECT_TRUE(direct.path_nodes.size() >= 2);
  FORMATION_EXPECT_EQ(direct.path_nodes.front().timestamp_s, kT0);
  for (const auto& n : direct.path_nodes) FORMATION_EXPECT_FALSE(n.following);

  following::Candidate cand;
  cand.flight_id = "LEAD";
  cand.nodes = LeadTrack(kT0);
  following::InterceptChoice ic;
  ic.index = cand.nodes.size() + 3;
  const formation::FollowingResult bad = eval.Evaluate(q, kT0, cand, ic, 0, cfg);
  FORMATION_EXPECT_NONE(bad.followed_flight_id);
  FORMATION_EXPECT_NEAR(bad.cost.savings, 0.0, 1e-12);
  return true;
}

bool Test_Selector_PositiveSavingsOnly() {
  auto outcome = [](int offset, double total, double pct) {
    following::OffsetOutcome o;
    o.offset_minutes = offset;
    formation::FollowingResult r;
    r.offset_minutes = offset;
    r.followed_flight_id = "X" + std::to_string(offset);
    r.cost.total_cost = total;
    r.cost.savings_percent = pct;
    o.result = r;
    return o;
  };

  const following::DepartureTimeSelector selector;
  std::vector<following::OffsetOutcome> outcomes{outcome(-20, 90.0, 10.0), outcome(0, 80.0, 20.0),
                                                 outcome(20, 50.0, 0.0), following::OffsetOutcome{}};
  const auto best = selector.Select(outcomes);
  FORMATION_EXPECT_TRUE(best.has_value());
  FORMATION_EXPECT_EQ(best->offset_minutes, 0);

  outcomes = {outcome(20, 50.0, 0.0)};
  FORMATION_EXPECT_NONE(selector.Select(outcomes));
  return true;
}

// =========================
// FollowingSearcher
// =========================

bool Test_Searcher_EmptyStoreFallsBackToDirect() {
  PrintBanner("FollowingSearcher: empty store");
  DefaultSearcher d;
  const following::FollowingSearcher searcher = d.Make();
  const formation::InMemoryTrajectoryStore store;
  const FollowingConfig cfg;

  const following::FollowingSearchResult res = searcher.Solve(&store, MakeQuery(), cfg);
  DumpResult(res.best);

  FORMATION_EXPECT_EQ(res.best.departure_time_s, kT0);
  FORMATION_EXPECT_NONE(res.best.followed_flight_id);
  FORMATION_EXPECT_NEAR(res.best.cost.savings_percent, 0.0, 1e-12);
  FORMATION_EXPECT_EQ(res.evaluations.size(), cfg.departure_offsets_minutes.size());
  for (const auto& e : res.evaluations) {
    FORMATION_EXPECT_EQ(e.candidates_considered, 0);
    FORMATION_EXPECT_NONE(e.followed_flight_id);
  }

  // 没有 store 同样直飞，且不评估任何偏移量
  const following::FollowingSearchResult none = searcher.Solve(nullptr, MakeQuery(), cfg);
  FORMATION_EXPECT_EQ(none.best.departure_time_s, kT0);
  FORMATION_EXPECT_TRUE(none.evaluations.empty());
  return true;
}

bool Test_Searcher_FollowsLeadFlight() {
  PrintBanner("FollowingSearcher: lead flight on the same route");
  formation::InMemoryTrajectoryStore store;
  store.Add("LEAD", LeadTrack(kT0));

  DefaultSearcher d;
  const FollowingConfig cfg;
  const following::FollowingSearchResult res = d.Make().Solve(&store, MakeQuery(), cfg);
  DumpResult(res.best);

  const formation::FollowingResult& b = res.best;
  FORMATION_EXPECT_EQ(b.followed_flight_id.value_or(""), std::string("LEAD"));
  FORMATION_EXPECT_EQ(b.offset_minutes, 0);
  FORMATION_EXPECT_EQ(b.departure_time_s, kT0);
  FORMATION_EXPECT_TRUE(b.cost.savings_percent > 0.0);
  FORMATION_EXPECT_TRUE(b.cost.total_cost < b.cost.solo_cost);
  FORMATION_EXPECT_EQ(b.intercept_index, static_cast<std::size_t>(1));
  FORMATION_EXPECT_EQ(b.departure_index, store.Trajectory("LEAD").size() - 1);
  FORMATION_EXPECT_EQ(b.cost.connected_segments, static_cast<int>(b.departure_index - b.intercept_index));

  // 跟飞段标记 + 首尾
  FORMATION_EXPECT_TRUE(b.intercept_path_index <= b.departure_path_index);
  for (std::size_t i = 0; i < b.path_nodes.size(); ++i) {
    const bool in_follow = i >= b.intercept_path_index && i <= b.departure_path_index;
    FORMATION_EXPECT_EQ(b.path_nodes[i].following, in_follow);
  }
  FORMATION_EXPECT_NEAR(geo::DistanceKm({b.path_nodes.front().lat_deg, b.path_nodes.front().lon_deg}, kOrigin), 0.0, 1e-6);
  FORMATION_EXPECT_NEAR(geo::DistanceKm({b.path_nodes.back().lat_deg, b.path_nodes.back().lon_deg}, kDest), 0.0, 1e-6);

  int with_partner = 0;
  for (const auto& e : res.evaluations) {
    if (e.followed_flight_id) with_partner++;
  }
  FORMATION_EXPECT_EQ(with_partner, 1);
  return true;
}

bool Test_Searcher_PicksShiftedDeparture() {
  PrintBanner("FollowingSearcher: lead flight leaves 40 minutes later");
  formation::InMemoryTrajectoryStore store;
  store.Add("LEAD", LeadTrack(kT0 + 40 * 60));

  DefaultSearcher d;
  const FollowingConfig cfg;
  const following::FollowingSearchResult res = d.Make().Solve(&store, MakeQuery(), cfg);
  DumpResult(res.best);

  FORMATION_EXPECT_EQ(res.best.offset_minutes, 40);
  FORMATION_EXPECT_EQ(res.best.departure_time_s, kT0 + 40 * 60);
  FORMATION_EXPECT_EQ(res.best.followed_flight_id.value_or(""), std::string("LEAD"));
  for (const auto& e : res.evaluations) {
    FORMATION_EXPECT_EQ(e.followed_flight_id.has_value(), e.offset_minutes == 40);
  }
  return true;
}

// 桩：统计调用次数，并且永远不给候选
class CountingCandidateFinder final : public following::CandidateFlightFinder {
public:
  std::vector<following::Candidate> Find(const formation::ITrajectoryStore&, const following::FollowingQuery&,
                                         EpochSeconds, const FollowingConfig&) const override {
    ++called;
    return {};
  }
  mutable int called{0};
};

// 桩：直接给出固定的会合点，忽略几何
class FixedInterceptFinder final : public following::InterceptPointFinder {
public:
  std::optional<following::InterceptChoice> Find(const GeoPoint&, const std::vector<TrajectoryNode>&,
                                                  EpochSeconds, const FollowingConfig&) const override {
    ++called;
    following::InterceptChoice ic;
    ic.index = 1;
    return ic;
  }
  mutable int called{0};
};

bool Test_Searcher_WithFakes() {
  DefaultSearcher d;
  CountingCandidateFinder counting;
  following::FollowingSearcher::Dependencies deps;
  deps.candidate_finder = &counting;
  deps.intercept_finder = &d.intercept_finder;
  deps.departure_finder = &d.departure_finder;
  deps.cost_evaluator = &d.cost_evaluator;
  deps.selector = &d.selector;

  formation::InMemoryTrajectoryStore store;
  store.Add("LEAD", LeadTrack(kT0));
  const FollowingConfig cfg;
  const following::FollowingSearchResult res = following::FollowingSearcher(deps).Solve(&store, MakeQuery(), cfg);
  FORMATION_EXPECT_EQ(counting.called, static_cast<int>(cfg.departure_offsets_minutes.size()));
  FORMATION_EXPECT_NONE(res.best.followed_flight_id);

  // 会合点桩：每个偏移量下的每个候选都调用一次
  FixedInterceptFinder fixed;
  deps.candidate_finder = &d.candidate_finder;
  deps.intercept_finder = &fixed;
  const following::FollowingSearchResult res2 = following::FollowingSearcher(deps).Solve(&store, MakeQuery(), cfg);
  FORMATION_EXPECT_EQ(fixed.called, 1);
  FORMATION_EXPECT_EQ(res2.best.followed_flight_id.value_or(""), std::string("LEAD"));
  return true;
}

// =========================
// 请求 -> 推荐
// =========================

bool Test_MakeQuery_Defaults() {
  const FollowingConfig cfg;
  formation::DepartureRequest req;
  req.origin = kOrigin;
  req.scheduled_departure_s = kT0;
  FORMATION_EXPECT_NONE(following::MakeQuery(req, cfg));

  req.destination = kDest;
  auto q = following::MakeQuery(req, cfg);
  FORMATION_EXPECT_TRUE(q.has_value());
  FORMATION_EXPECT_NEAR(q->solo_cost_km, geo::DistanceKm(kOrigin, kDest), 1e-9);
  FORMATION_EXPECT_NEAR(q->duration_minutes, q->solo_cost_km / 800.0 * 60.0, 1e-9);

  req.distance_km = 2000.0;
  req.duration_minutes = 200.0;
  q = following::MakeQuery(req, cfg);
  FORMATION_EXPECT_NEAR(q->solo_cost_km, 2000.0, 1e-12);
  FORMATION_EXPECT_NEAR(q->duration_minutes, 200.0, 1e-12);
  return true;
}

bool Test_ComputeStatistics() {
  std::vector<formation::OffsetEvaluation> evals(3);
  evals[0].total_cost = 100.0;
  evals[1].total_cost = 80.0;
  evals[1].savings_percent = 20.0;
  evals[1].followed_flight_id = std::string("A");
  evals[2].total_cost = 60.0;
  evals[2].savings_percent = 40.0;
  evals[2].followed_flight_id = std::string("B");

  const formation::DepartureStatistics s = following::ComputeStatistics(evals, 60.0);
  FORMATION_EXPECT_EQ(s.offsets_evaluated, 3);
  FORMATION_EXPECT_EQ(s.offsets_with_partner, 2);
  FORMATION_EXPECT_NEAR(s.average_cost, 80.0, 1e-12);
  FORMATION_EXPECT_NEAR(s.average_savings_percent, 20.0, 1e-12);
  FORMATION_EXPECT_NEAR(s.cost_reduction_vs_average_percent, 25.0, 1e-12);

  const formation::DepartureStatistics empty = following::ComputeStatistics({}, 0.0);
  FORMATION_EXPECT_EQ(empty.offsets_evaluated, 0);
  return true;
}

bool Test_DepartureTimeStage_Recommendations() {
  PrintBanner("Stage: DepartureTimeStage");
  formation::InMemoryTrajectoryStore store;
  store.Add("LEAD", LeadTrack(kT0 + 40 * 60));

  formation::MatchingContext ctx;
  ctx.store = &store;
  formation::DepartureRequest req;
  req.id = "R1";
  req.origin_airport = "ORG";
  req.destination_airport = "DST";
  req.origin = kOrigin;
  req.destination = kDest;
  req.scheduled_departure_s = kT0;
  formation::DepartureRequest missing = req;
  missing.id = "R2";
  missing.destination.reset();
  ctx.departure_requests = {req, missing};

  formation::DepartureTimeStage stage;
  stage.Run(ctx);

  FORMATION_EXPECT_EQ(ctx.recommendations.size(), static_cast<std::size_t>(1));
  FORMATION_EXPECT_EQ(ctx.skipped.requests_unresolved, 1);
  const formation::DepartureRecommendation& r = ctx.recommendations.front();
  std::cout << "request=" << r.request_id << " recommended=" << r.recommended_departure_s
            << " offset=" << r.offset_minutes << " avg_cost=" << r.statistics.average_cost << "\n";

  FORMATION_EXPECT_EQ(r.request_id, std::string("R1"));
  FORMATION_EXPECT_EQ(r.origin_airport, std::string("ORG"));
  FORMATION_EXPECT_EQ(r.recommended_departure_s, kT0 + 40 * 60);
  FORMATION_EXPECT_EQ(r.offset_minutes, 40);
  FORMATION_EXPECT_EQ(r.partner_path.size(), store.Trajectory("LEAD").size());
  FORMATION_EXPECT_TRUE(r.original_path.size() >= 2);
  FORMATION_EXPECT_EQ(r.original_path.front().timestamp_s, kT0);
  FORMATION_EXPECT_EQ(r.statistics.offsets_evaluated, 7);
  FORMATION_EXPECT_EQ(r.statistics.offsets_with_partner, 1);
  FORMATION_EXPECT_TRUE(r.statistics.cost_reduction_vs_average_percent > 0.0);

  // 再跑一次不累积
  stage.Run(ctx);
  FORMATION_EXPECT_EQ(ctx.recommendations.size(), static_cast<std::size_t>(1));
  FORMATION_EXPECT_EQ(ctx.skipped.requests_unresolved, 1);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  using formation::test::TestCase;

  std::vector<TestCase> cases{
      {"SynthesizePath even times", Test_SynthesizePath_EvenTimes},
      {"CandidateFinder window and bearing", Test_CandidateFinder_WindowAndBearing},
      {"InterceptFinder skips start and past nodes", Test_InterceptFinder_SkipsStartAndPast},
      {"DepartureFinder stops before divergence", Test_DepartureFinder_StopsBeforeDivergence},
      {"CostEvaluator direct and out-of-range", Test_CostEvaluator_DirectAndOutOfRange},
      {"Selector positive savings only", Test_Selector_PositiveSavingsOnly},
      {"Searcher empty store falls back to direct", Test_Searcher_EmptyStoreFallsBackToDirect},
      {"Searcher follows lead flight", Test_Searcher_FollowsLeadFlight},
      {"Searcher picks shifted departure", Test_Searcher_PicksShiftedDeparture},
      {"Searcher with fakes", Test_Searcher_WithFakes},
      {"MakeQuery defaults", Test_MakeQuery_Defaults},
      {"ComputeStatistics", Test_ComputeStatistics},
      {"DepartureTimeStage recommendations", Test_DepartureTimeStage_Recommendations},
  };

  return formation::test::RunAll(cases, argc, argv);
}
