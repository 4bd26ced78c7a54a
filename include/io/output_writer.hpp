#pragma once
#include <cstddef>
#include <string>
#include "common/types.hpp"

namespace formation::io {

// OutputWriter 负责把 ctx 中的“最终产物”写到 output_dir：
// 1) optimized_paths.json：汇总计数 + 每个航班的走廊优化路径
// 2) pairs.json：配对结果（格式可被 DemoIO::LoadContext 再读回）
// 3) formation_edges.json：得分最高的若干条编队候选边
// 4) departure_recommendations.json：起飞时间推荐
// 5) paths/<flight_id>.csv：每条优化路径的航路点 lat,lon,kind
class OutputWriter {
public:
  static void WriteAll(const MatchingContext& ctx, const std::string& output_dir);

  // 分开暴露接口，方便只写某一种输出进行调试
  static void WriteOptimizedPathsJson(const MatchingContext& ctx, const std::string& output_path);
  static void WritePairsJson(const MatchingContext& ctx, const std::string& output_path);
  static void WriteEdgesJson(const MatchingContext& ctx, const std::string& output_path,
                             std::size_t max_edges = 1000);
  static void WriteRecommendationsJson(const MatchingContext& ctx, const std::string& output_path);
  static void WritePathsCsv(const MatchingContext& ctx, const std::string& output_dir);
};

} // namespace formation::io
