#pragma once
#include "common/types.hpp"

namespace formation {

// 每个环节实现一个 Stage，输入输出都经由 MatchingContext 传递。
// Run 必须可重复调用：每次进入先清空本环节负责的输出字段。
class IStage {
public:
  virtual ~IStage() = default;
  virtual void Run(MatchingContext& ctx) = 0;
};

} // namespace formation
