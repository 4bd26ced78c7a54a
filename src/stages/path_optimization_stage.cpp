#include "stages/path_optimization_stage.hpp"

#include <algorithm>
#include <optional>
#include <thread>
#include <vector>

#include "corridor/corridor_optimizer.hpp"

namespace formation {

int PathOptimizationStage::ResolveWorkerCount(int requested, std::size_t jobs) {
  int n = requested;
  if (n <= 0) {
    n = static_cast<int>(std::thread::hardware_concurrency());
  }
  if (n <= 0) n = 1;
  if (jobs > 0 && static_cast<std::size_t>(n) > jobs) n = static_cast<int>(jobs);
  return std::max(1, n);
}

void PathOptimizationStage::Run(MatchingContext& ctx) {
  ctx.optimized_paths.clear();
  ctx.skipped.corridor_solver_failures = 0;

  // --- 1) 每个航班可用的走廊（来自它参与的配对） ---
  std::vector<std::vector<std::size_t>> available(ctx.flights.size());
  for (std::size_t c = 0; c < ctx.corridors.size(); ++c) {
    const std::size_t p = ctx.corridors[c].source_pair;
    if (p >= ctx.pairs.size()) continue;
    const CompatiblePair& pair = ctx.pairs[p];
    if (pair.flight_a < available.size()) available[pair.flight_a].push_back(c);
    if (pair.flight_b < available.size()) available[pair.flight_b].push_back(c);
  }

  std::vector<std::size_t> jobs;
  for (std::size_t f = 0; f < available.size(); ++f) {
    if (!available[f].empty() && ctx.flights[f].HasCoordinates()) {
      available[f] = corridor::PathSelector::CapByEfficiency(ctx.corridors, available[f],
                                                             ctx.config.corridor.max_corridors_per_flight);
      jobs.push_back(f);
    }
  }
  if (jobs.empty()) return;

  // --- 2) 分块并行 ---
  const int num_threads = ResolveWorkerCount(ctx.config.worker_threads, jobs.size());
  const std::size_t chunk = (jobs.size() + num_threads - 1) / num_threads;

  std::vector<std::optional<OptimizedPath>> results(jobs.size());
  std::vector<int> failures(static_cast<std::size_t>(num_threads), 0);
  const corridor::PathSelector selector(ctx.config.corridor);
  const MatchingContext& view = ctx;

  auto work = [&](std::size_t begin, std::size_t end, int t) {
    for (std::size_t k = begin; k < end; ++k) {
      const std::size_t f = jobs[k];
      corridor::SelectionResult r = selector.Select(view.flights[f], view.corridors, available[f]);
      failures[static_cast<std::size_t>(t)] += r.solver_failures;
      results[k] = std::move(r.path);
    }
  };

  if (num_threads == 1) {
    work(0, jobs.size(), 0);
  } else {
    std::vector<std::thread> threads;
    threads.reserve(static_cast<std::size_t>(num_threads));
    for (int t = 0; t < num_threads; ++t) {
      const std::size_t begin = static_cast<std::size_t>(t) * chunk;
      const std::size_t end = std::min(begin + chunk, jobs.size());
      if (begin >= end) break;
      threads.emplace_back(work, begin, end, t);
    }
    for (auto& th : threads) th.join();
  }

  // --- 3) 合并 + 排序 ---
  for (auto& r : results) {
    if (r) ctx.optimized_paths.push_back(std::move(*r));
  }
  for (int n : failures) ctx.skipped.corridor_solver_failures += n;

  std::stable_sort(ctx.optimized_paths.begin(), ctx.optimized_paths.end(),
                   [](const OptimizedPath& a, const OptimizedPath& b) {
                     if (a.time_savings_minutes != b.time_savings_minutes) {
                       return a.time_savings_minutes > b.time_savings_minutes;
                     }
                     return a.flight_id < b.flight_id;
                   });
}

} // namespace formation
