#pragma once
#include "stages/stage_base.hpp"

namespace formation {

// ======================
// 环节：逐航班走廊路径优化
//
// 输入：
//   ctx.flights / ctx.pairs / ctx.corridors
//   ctx.config.corridor / ctx.config.worker_threads
//
// 输出：
//   ctx.optimized_paths：只包含出现在至少一个配对里的航班，
//                        按 time_savings_minutes 降序（同值按 flight_id 升序）
//   ctx.skipped.corridor_solver_failures
//
// 并发：航班按连续分块分给 worker 线程，每个线程只写自己负责的结果槽位，
//       ctx 其余部分只读，因此不需要加锁。
// ======================
class PathOptimizationStage final : public IStage {
public:
  void Run(MatchingContext& ctx) override;

  /// 实际使用的线程数（>= 1，且不超过任务数）
  static int ResolveWorkerCount(int requested, std::size_t jobs);
};

} // namespace formation
