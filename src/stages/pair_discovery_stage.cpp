#include "stages/pair_discovery_stage.hpp"

#include <cmath>
#include <vector>

#include "common/time_utils.hpp"
#include "geo/geometry.hpp"

namespace formation {

namespace {

inline bool SameAirport(const Endpoint& a, const Endpoint& b) {
  return !a.airport.empty() && a.airport == b.airport;
}

// 计划时间按一天内的分钟比较（跨午夜回绕）
inline bool WithinMinutesOfDay(const std::optional<EpochSeconds>& a, const std::optional<EpochSeconds>& b,
                               double max_gap_minutes) {
  if (!a || !b) return false;
  return CircularMinuteGap(MinutesOfDay(*a), MinutesOfDay(*b)) <= max_gap_minutes;
}

// 按交点参数在计划起降时间之间线性插值
inline double TimeAtFraction(const Flight& f, double fraction) {
  const double dep = static_cast<double>(*f.departure.time_s);
  const double arr = static_cast<double>(*f.arrival.time_s);
  return dep + (arr - dep) * fraction;
}

inline bool HasPositiveDuration(const Flight& f) {
  return f.HasSchedule() && *f.arrival.time_s > *f.departure.time_s;
}

} // namespace

std::optional<CompatiblePair> PairDiscoveryStage::ClassifySimilar(const Flight& a, const Flight& b,
                                                                  const PairFinderConfig& cfg) {
  if (!a.HasCoordinates() || !b.HasCoordinates()) return std::nullopt;

  const bool same_dep = SameAirport(a.departure, b.departure);
  const bool same_arr = SameAirport(a.arrival, b.arrival);
  // 恰好共享一个端点；完全相同的航线不算
  if (same_dep == same_arr) return std::nullopt;

  const auto angle = geo::AngleBetweenCourses(*a.departure.position, *a.arrival.position,
                                              *b.departure.position, *b.arrival.position);
  if (!angle || *angle > cfg.similar_max_angle_deg) return std::nullopt;

  bool time_ok = false;
  if (same_dep && WithinMinutesOfDay(a.departure.time_s, b.departure.time_s, cfg.similar_max_time_gap_minutes)) {
    time_ok = true;
  }
  if (same_arr && WithinMinutesOfDay(a.arrival.time_s, b.arrival.time_s, cfg.similar_max_time_gap_minutes)) {
    time_ok = true;
  }
  if (!time_ok) return std::nullopt;

  CompatiblePair p;
  p.kind = PairKind::kSimilar;
  p.angle_deg = *angle;
  return p;
}

std::optional<CompatiblePair> PairDiscoveryStage::ClassifyIntersecting(const Flight& a, const Flight& b,
                                                                       const PairFinderConfig& cfg,
                                                                       bool* non_positive_duration) {
  if (!a.HasCoordinates() || !b.HasCoordinates()) return std::nullopt;
  if (SameAirport(a.departure, b.departure) || SameAirport(a.arrival, b.arrival)) return std::nullopt;

  const GeoPoint& a_dep = *a.departure.position;
  const GeoPoint& a_arr = *a.arrival.position;
  const GeoPoint& b_dep = *b.departure.position;
  const GeoPoint& b_arr = *b.arrival.position;

  const auto angle = geo::AngleBetweenCourses(a_dep, a_arr, b_dep, b_arr);
  if (!angle || *angle > cfg.intersecting_max_angle_deg) return std::nullopt;

  const auto cross = geo::IntersectSegments(a_dep, a_arr, b_dep, b_arr);
  if (!cross) return std::nullopt;

  if (!HasPositiveDuration(a) || !HasPositiveDuration(b)) {
    if (non_positive_duration) *non_positive_duration = true;
    return std::nullopt;
  }

  const double t_a = TimeAtFraction(a, cross->t1);
  const double t_b = TimeAtFraction(b, cross->t2);
  if (std::fabs(t_a - t_b) > cfg.intersecting_max_time_gap_minutes * 60.0) return std::nullopt;

  CompatiblePair p;
  p.kind = PairKind::kIntersecting;
  p.angle_deg = *angle;
  p.intersection = cross->point;
  return p;
}

void PairDiscoveryStage::Run(MatchingContext& ctx) {
  ctx.pairs.clear();
  ctx.skipped.flights_missing_coordinates = 0;
  ctx.skipped.flights_degenerate_course = 0;
  ctx.skipped.pairs_non_positive_duration = 0;

  // 先筛掉缺坐标 / 起降点重合的航班（只计数一次）
  std::vector<std::size_t> usable;
  usable.reserve(ctx.flights.size());
  for (std::size_t i = 0; i < ctx.flights.size(); ++i) {
    const Flight& f = ctx.flights[i];
    if (!f.HasCoordinates()) {
      ctx.skipped.flights_missing_coordinates++;
      continue;
    }
    if (f.departure.position->lat_deg == f.arrival.position->lat_deg &&
        f.departure.position->lon_deg == f.arrival.position->lon_deg) {
      ctx.skipped.flights_degenerate_course++;
      continue;
    }
    usable.push_back(i);
  }

  const auto& cfg = ctx.config.pairs;
  for (std::size_t ui = 0; ui < usable.size(); ++ui) {
    for (std::size_t uj = ui + 1; uj < usable.size(); ++uj) {
      const std::size_t i = usable[ui];
      const std::size_t j = usable[uj];
      const Flight& a = ctx.flights[i];
      const Flight& b = ctx.flights[j];

      // 两类判定互斥：是否共享机场决定走哪一支
      std::optional<CompatiblePair> p;
      const bool shares_airport = SameAirport(a.departure, b.departure) || SameAirport(a.arrival, b.arrival);
      if (shares_airport) {
        p = ClassifySimilar(a, b, cfg);
      } else {
        bool bad_duration = false;
        p = ClassifyIntersecting(a, b, cfg, &bad_duration);
        if (bad_duration) ctx.skipped.pairs_non_positive_duration++;
      }

      if (p) {
        p->flight_a = i;
        p->flight_b = j;
        ctx.pairs.push_back(*p);
      }
    }
  }
}

} // namespace formation
