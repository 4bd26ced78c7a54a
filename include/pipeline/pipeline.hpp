#pragma once
#include <memory>
#include <vector>
#include "common/types.hpp"
#include "stages/stage_base.hpp"

namespace formation {

// Pipeline 把各 Stage 按固定顺序串起来：
//   配对发现 -> 可行性打分 -> 走廊构建 -> 走廊路径优化 -> 起飞时间推荐
// 替换某个 Stage 的内部算法不影响主流程，只要接口不变。
class Pipeline {
public:
  Pipeline();

  // 从原始航班开始跑完整流程
  void Run(MatchingContext& ctx);

  // 配对已由调用方给出（ctx.pairs），跳过配对发现
  void RunFromPairs(MatchingContext& ctx);

private:
  std::vector<std::unique_ptr<IStage>> stages_;
};

} // namespace formation
