#pragma once
#include <optional>
#include <vector>

#include "common/types.hpp"
#include "following/following_search.hpp"
#include "store/trajectory_store.hpp"

namespace formation::following {

/// 由请求构造查询。起终点坐标缺失返回 nullopt。
/// distance_km 缺省 = 大圆距离；duration_minutes 缺省 = distance / cruise_speed。
std::optional<FollowingQuery> MakeQuery(const DepartureRequest& req, const FollowingConfig& cfg);

/// 所有偏移量的平均代价/平均节省率，以及 best_cost 相对平均代价的降低百分比
DepartureStatistics ComputeStatistics(const std::vector<OffsetEvaluation>& evaluations, double best_cost);

/// 把搜索结果整理成面向展示的推荐记录（含原始直飞路径、被跟飞航班航迹、统计）
DepartureRecommendation BuildRecommendation(const DepartureRequest& req, const FollowingQuery& q,
                                            const FollowingSearchResult& res,
                                            const ITrajectoryStore* store, const FollowingConfig& cfg);

} // namespace formation::following
