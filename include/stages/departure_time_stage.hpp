#pragma once
#include "stages/stage_base.hpp"

namespace formation {

// ======================
// 环节：起飞时间推荐（跟飞）
//
// 输入：
//   ctx.departure_requests（起终点坐标已由 IO 层用机场表补齐）
//   ctx.store（为空时所有请求都按计划时间直飞）
//   ctx.config.following
//
// 输出：
//   ctx.recommendations：与可解析的请求一一对应，顺序同输入
//   ctx.skipped.requests_unresolved：起终点坐标缺失的请求数
// ======================
class DepartureTimeStage final : public IStage {
public:
  void Run(MatchingContext& ctx) override;
};

} // namespace formation
