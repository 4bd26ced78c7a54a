#include "stages/corridor_build_stage.hpp"

#include <algorithm>
#include <set>

#include "geo/geometry.hpp"

namespace formation {

std::optional<BoostCorridor> CorridorBuildStage::BuildCorridor(const CompatiblePair& pair, const Flight& a,
                                                               const Flight& b, const CorridorConfig& cfg) {
  if (!a.HasCoordinates() || !b.HasCoordinates()) {
    return std::nullopt;
  }

  BoostCorridor c;

  const GeoPoint& a_dep = *a.departure.position;
  const GeoPoint& a_arr = *a.arrival.position;
  const GeoPoint& b_dep = *b.departure.position;
  const GeoPoint& b_arr = *b.arrival.position;

  c.bearing_deg = geo::BisectorDeg(geo::BearingDeg(a_dep, a_arr), geo::BearingDeg(b_dep, b_arr));

  if (pair.kind == PairKind::kIntersecting && pair.intersection.has_value()) {
    // 起点退回半个长度，使交点位于走廊中点
    c.length_km = cfg.intersecting_length_km;
    c.start = geo::DestinationPoint(*pair.intersection, c.bearing_deg + 180.0, c.length_km / 2.0);
  } else {
    const bool shared_departure = !a.departure.airport.empty() && a.departure.airport == b.departure.airport;
    c.start = shared_departure ? a_dep : a_arr;
    c.length_km = cfg.similar_length_factor * std::min(geo::DistanceKm(a_dep, a_arr), geo::DistanceKm(b_dep, b_arr));
  }

  const double ref = cfg.efficiency_reference_angle_deg > 0.0 ? cfg.efficiency_reference_angle_deg : 45.0;
  const double type_score = (pair.kind == PairKind::kIntersecting) ? cfg.intersecting_efficiency_bonus : 1.0;
  c.efficiency = (1.0 - pair.angle_deg / ref) * type_score;
  return c;
}

void CorridorBuildStage::Run(MatchingContext& ctx) {
  ctx.corridors.clear();
  ctx.corridors.reserve(ctx.pairs.size());

  // 调用方直接给的配对可能引用缺坐标的航班；每个航班只计一次
  std::set<std::size_t> missing;

  for (std::size_t i = 0; i < ctx.pairs.size(); ++i) {
    const CompatiblePair& p = ctx.pairs[i];
    if (p.flight_a >= ctx.flights.size() || p.flight_b >= ctx.flights.size()) {
      ctx.skipped.pairs_unknown_flight++;
      continue;
    }
    const Flight& a = ctx.flights[p.flight_a];
    const Flight& b = ctx.flights[p.flight_b];
    std::optional<BoostCorridor> c = BuildCorridor(p, a, b, ctx.config.corridor);
    if (!c) {
      if (!a.HasCoordinates() && missing.insert(p.flight_a).second) ctx.skipped.flights_missing_coordinates++;
      if (!b.HasCoordinates() && missing.insert(p.flight_b).second) ctx.skipped.flights_missing_coordinates++;
      continue;
    }
    c->source_pair = i;
    ctx.corridors.push_back(*c);
  }
}

} // namespace formation
