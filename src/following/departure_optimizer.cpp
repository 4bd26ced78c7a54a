#include "following/departure_optimizer.hpp"

#include "geo/geometry.hpp"

namespace formation::following {

std::optional<FollowingQuery> MakeQuery(const DepartureRequest& req, const FollowingConfig& cfg) {
  if (!req.origin || !req.destination) {
    return std::nullopt;
  }

  FollowingQuery q;
  q.origin = *req.origin;
  q.destination = *req.destination;
  q.scheduled_departure_s = req.scheduled_departure_s;
  q.solo_cost_km = req.distance_km.value_or(geo::DistanceKm(q.origin, q.destination));

  if (req.duration_minutes) {
    q.duration_minutes = *req.duration_minutes;
  } else {
    q.duration_minutes = (cfg.cruise_speed_kmh > 0.0) ? q.solo_cost_km / cfg.cruise_speed_kmh * 60.0 : 0.0;
  }
  return q;
}

DepartureStatistics ComputeStatistics(const std::vector<OffsetEvaluation>& evaluations, double best_cost) {
  DepartureStatistics s;
  s.offsets_evaluated = static_cast<int>(evaluations.size());
  if (evaluations.empty()) return s;

  double cost_sum = 0.0;
  double savings_sum = 0.0;
  for (const auto& e : evaluations) {
    cost_sum += e.total_cost;
    savings_sum += e.savings_percent;
    if (e.followed_flight_id) s.offsets_with_partner++;
  }
  s.average_cost = cost_sum / evaluations.size();
  s.average_savings_percent = savings_sum / evaluations.size();
  if (s.average_cost > 0.0) {
    s.cost_reduction_vs_average_percent = (s.average_cost - best_cost) / s.average_cost * 100.0;
  }
  return s;
}

DepartureRecommendation BuildRecommendation(const DepartureRequest& req, const FollowingQuery& q,
                                            const FollowingSearchResult& res,
                                            const ITrajectoryStore* store, const FollowingConfig& cfg) {
  DepartureRecommendation rec;
  rec.request_id = req.id;
  rec.origin_airport = req.origin_airport;
  rec.destination_airport = req.destination_airport;
  rec.origin = q.origin;
  rec.destination = q.destination;
  rec.scheduled_departure_s = q.scheduled_departure_s;

  rec.best = res.best;
  rec.recommended_departure_s = res.best.departure_time_s;
  rec.offset_minutes = res.best.followed_flight_id ? res.best.offset_minutes : 0;

  rec.original_path = SynthesizePath(q.origin, q.destination, q.scheduled_departure_s,
                                     q.duration_minutes, cfg.path_step_minutes);
  AssignSegmentDistances(rec.original_path);

  if (store && res.best.followed_flight_id) {
    rec.partner_path = store->Trajectory(*res.best.followed_flight_id);
  }

  rec.evaluations = res.evaluations;
  rec.statistics = ComputeStatistics(res.evaluations, res.best.cost.total_cost);
  return rec;
}

} // namespace formation::following
