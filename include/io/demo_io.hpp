#pragma once
#include <string>
#include <vector>
#include "common/types.hpp"

namespace formation::io {

// DemoIO 只负责把 input_dir 下的 JSON 读进 MatchingContext。
//
// input_dir 结构：
//   flights.json                 必需。数组，或 {"flights": [...]}
//   airports.json                可选。机场代码 -> [lat, lon] 或 {"lat","lon"}，用于补齐端点坐标
//   pairs.json                   可选。存在时 ctx.pairs 直接来自该文件（跳过配对发现）
//   config.json                  可选。覆盖 EngineConfig 中的默认值
//   departure_requests.json      可选。起飞时间推荐请求
//
// 文件打不开/JSON 格式错误抛 std::runtime_error；缺坐标的航班不报错，由 Stage 计数跳过。
// ctx.store 不在这里设置（存储对象的所有权在调用方）。
class DemoIO {
public:
  static MatchingContext LoadContext(const std::string& input_dir);

  // 分开暴露，方便单测只读某一种文件
  static void ApplyConfigJson(const std::string& json_text, EngineConfig& cfg);
  static std::vector<Flight> ParseFlightsJson(const std::string& json_text);
};

} // namespace formation::io
