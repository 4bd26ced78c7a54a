#include "io/output_writer.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "common/time_utils.hpp"

namespace fs = std::filesystem;

namespace formation::io {

using json = nlohmann::json;

static void EnsureDir(const fs::path& p) {
  if (!fs::exists(p)) {
    fs::create_directories(p);
  }
}

static void WriteJsonFile(const json& j, const std::string& output_path) {
  std::ofstream ofs(output_path);
  if (!ofs) throw std::runtime_error("Failed to write: " + output_path);
  ofs << j.dump(2) << "\n";
}

void OutputWriter::WriteAll(const MatchingContext& ctx, const std::string& output_dir) {
  const fs::path outdir(output_dir);
  EnsureDir(outdir);
  WriteOptimizedPathsJson(ctx, (outdir / "optimized_paths.json").string());
  WritePairsJson(ctx, (outdir / "pairs.json").string());
  WriteEdgesJson(ctx, (outdir / "formation_edges.json").string());
  WriteRecommendationsJson(ctx, (outdir / "departure_recommendations.json").string());
  WritePathsCsv(ctx, (outdir / "paths").string());
}

// ---------- 小工具 ----------

static json PointJson(const GeoPoint& p) {
  return json{{"lat", p.lat_deg}, {"lon", p.lon_deg}};
}

template <typename T>
static json OptionalJson(const std::optional<T>& v) {
  return v ? json(*v) : json(nullptr);
}

static json EndpointJson(const Endpoint& e) {
  json j;
  j["airport"] = e.airport;
  if (e.position) {
    j["lat"] = e.position->lat_deg;
    j["lon"] = e.position->lon_deg;
  }
  if (e.time_s) j["time"] = FormatIsoTimestamp(*e.time_s);
  return j;
}

static json PathNodesJson(const std::vector<PathNode>& nodes) {
  json arr = json::array();
  for (const auto& n : nodes) {
    arr.push_back({{"lat", n.lat_deg},
                   {"lon", n.lon_deg},
                   {"timestamp", FormatIsoTimestamp(n.timestamp_s)},
                   {"following", n.following},
                   {"segment_distance_km", n.segment_distance_km}});
  }
  return arr;
}

// ---------- optimized_paths.json ----------

void OutputWriter::WriteOptimizedPathsJson(const MatchingContext& ctx, const std::string& output_path) {
  int similar = 0;
  int intersecting = 0;
  for (const auto& p : ctx.pairs) {
    if (p.kind == PairKind::kIntersecting) intersecting++;
    else similar++;
  }

  json root;
  root["summary"] = {
      {"total_flights", ctx.flights.size()},
      {"total_pairs_found", ctx.pairs.size()},
      {"similar_pairs", similar},
      {"intersecting_pairs", intersecting},
      {"corridors", ctx.corridors.size()},
      {"flights_optimized", ctx.optimized_paths.size()},
      {"skipped",
       {{"flights_missing_coordinates", ctx.skipped.flights_missing_coordinates},
        {"flights_degenerate_course", ctx.skipped.flights_degenerate_course},
        {"pairs_non_positive_duration", ctx.skipped.pairs_non_positive_duration},
        {"pairs_unknown_flight", ctx.skipped.pairs_unknown_flight},
        {"corridor_solver_failures", ctx.skipped.corridor_solver_failures},
        {"requests_unresolved", ctx.skipped.requests_unresolved}}}};

  json paths = json::array();
  for (const auto& p : ctx.optimized_paths) {
    json wps = json::array();
    for (const auto& w : p.waypoints) {
      json wj = PointJson(w.position);
      wj["kind"] = ToString(w.kind);
      wps.push_back(wj);
    }
    json boosts = json::array();
    for (const auto& b : p.boost_segments) {
      boosts.push_back({{"corridor", b.corridor},
                        {"entry", PointJson(b.entry)},
                        {"exit", PointJson(b.exit)},
                        {"entry_along_km", b.entry_along_km},
                        {"exit_along_km", b.exit_along_km},
                        {"distance_in_boost_km", b.distance_in_boost_km},
                        {"bearing_deg", b.bearing_deg}});
    }
    paths.push_back({{"flight_id", p.flight_id},
                     {"departure_airport", p.departure_airport},
                     {"arrival_airport", p.arrival_airport},
                     {"original_distance_km", p.original_distance_km},
                     {"optimized_distance_km", p.optimized_distance_km},
                     {"weighted_time", p.weighted_time},
                     {"time_savings_minutes", p.time_savings_minutes},
                     {"waypoints", wps},
                     {"boost_segments", boosts}});
  }
  root["optimized_paths"] = paths;

  WriteJsonFile(root, output_path);
}

// ---------- pairs.json ----------

void OutputWriter::WritePairsJson(const MatchingContext& ctx, const std::string& output_path) {
  json arr = json::array();
  for (const auto& p : ctx.pairs) {
    if (p.flight_a >= ctx.flights.size() || p.flight_b >= ctx.flights.size()) continue;
    const Flight& a = ctx.flights[p.flight_a];
    const Flight& b = ctx.flights[p.flight_b];

    json j;
    j["type"] = ToString(p.kind);
    j["flight1"] = {{"id", a.id}, {"departure", EndpointJson(a.departure)}, {"arrival", EndpointJson(a.arrival)}};
    j["flight2"] = {{"id", b.id}, {"departure", EndpointJson(b.departure)}, {"arrival", EndpointJson(b.arrival)}};
    j["angle"] = p.angle_deg;
    if (p.intersection) j["intersection"] = PointJson(*p.intersection);
    j["feasibility_score"] = OptionalJson(p.feasibility_score);
    arr.push_back(j);
  }
  WriteJsonFile(json{{"pairs", arr}}, output_path);
}

// ---------- formation_edges.json ----------

void OutputWriter::WriteEdgesJson(const MatchingContext& ctx, const std::string& output_path,
                                  std::size_t max_edges) {
  // ctx.edges 已按 score 降序
  json arr = json::array();
  for (std::size_t i = 0; i < ctx.edges.size() && i < max_edges; ++i) {
    const auto& e = ctx.edges[i];
    arr.push_back({{"flight_a", e.flight_a},
                   {"flight_b", e.flight_b},
                   {"node_a", e.node_a},
                   {"node_b", e.node_b},
                   {"t_a", FormatIsoTimestamp(e.t_a)},
                   {"t_b", FormatIsoTimestamp(e.t_b)},
                   {"time_diff_s", e.time_diff_s},
                   {"distance_km", e.distance_km},
                   {"heading_a_deg", OptionalJson(e.heading_a_deg)},
                   {"heading_b_deg", OptionalJson(e.heading_b_deg)},
                   {"heading_similarity", OptionalJson(e.heading_similarity)},
                   {"score", e.score}});
  }
  WriteJsonFile(json{{"total_edges", ctx.edges.size()}, {"edges", arr}}, output_path);
}

// ---------- departure_recommendations.json ----------

void OutputWriter::WriteRecommendationsJson(const MatchingContext& ctx, const std::string& output_path) {
  json arr = json::array();
  for (const auto& r : ctx.recommendations) {
    const FollowingResult& b = r.best;

    json evals = json::array();
    for (const auto& e : r.evaluations) {
      evals.push_back({{"offset_minutes", e.offset_minutes},
                       {"departure_time", FormatIsoTimestamp(e.departure_time_s)},
                       {"followed_flight_id", OptionalJson(e.followed_flight_id)},
                       {"total_cost", e.total_cost},
                       {"savings_percent", e.savings_percent},
                       {"candidates_considered", e.candidates_considered}});
    }

    json partner = json::array();
    for (const auto& n : r.partner_path) {
      partner.push_back({{"lat", n.lat_deg}, {"lon", n.lon_deg}, {"timestamp", FormatIsoTimestamp(n.timestamp_s)}});
    }

    json j;
    j["request_id"] = r.request_id;
    j["origin"] = PointJson(r.origin);
    j["origin"]["airport"] = r.origin_airport;
    j["destination"] = PointJson(r.destination);
    j["destination"]["airport"] = r.destination_airport;
    j["scheduled_departure"] = FormatIsoTimestamp(r.scheduled_departure_s);
    j["recommended_departure"] = FormatIsoTimestamp(r.recommended_departure_s);
    j["offset_minutes"] = r.offset_minutes;
    j["followed_flight_id"] = OptionalJson(b.followed_flight_id);
    j["cost"] = {{"solo_cost", b.cost.solo_cost},
                 {"total_cost", b.cost.total_cost},
                 {"savings", b.cost.savings},
                 {"savings_percent", b.cost.savings_percent},
                 {"detour_km", b.cost.detour_km},
                 {"following_km", b.cost.following_km},
                 {"continuation_km", b.cost.continuation_km},
                 {"total_segments", b.cost.total_segments},
                 {"connected_segments", b.cost.connected_segments}};
    j["intercept_index"] = b.intercept_index;
    j["departure_index"] = b.departure_index;
    j["path_nodes"] = PathNodesJson(b.path_nodes);
    j["original_path"] = PathNodesJson(r.original_path);
    j["partner_path"] = partner;
    j["evaluations"] = evals;
    j["statistics"] = {{"offsets_evaluated", r.statistics.offsets_evaluated},
                       {"offsets_with_partner", r.statistics.offsets_with_partner},
                       {"average_cost", r.statistics.average_cost},
                       {"average_savings_percent", r.statistics.average_savings_percent},
                       {"cost_reduction_vs_average_percent", r.statistics.cost_reduction_vs_average_percent}};
    arr.push_back(j);
  }
  WriteJsonFile(json{{"recommendations", arr}}, output_path);
}

// ---------- paths/<flight_id>.csv ----------

static std::string SafeFileName(const std::string& id) {
  std::string out = id;
  for (auto& c : out) {
    if (c == '/' || c == '\\' || c == ':' || c == ' ') c = '_';
  }
  return out.empty() ? std::string("unnamed") : out;
}

static void WriteCsv(const fs::path& p, const std::vector<PathWaypoint>& pts) {
  std::ofstream ofs(p);
  if (!ofs) throw std::runtime_error("Failed to write: " + p.string());
  ofs << "lat,lon,kind\n";
  ofs << std::fixed << std::setprecision(6);
  for (const auto& w : pts) {
    ofs << w.position.lat_deg << "," << w.position.lon_deg << "," << ToString(w.kind) << "\n";
  }
}

void OutputWriter::WritePathsCsv(const MatchingContext& ctx, const std::string& output_dir) {
  const fs::path outdir(output_dir);
  EnsureDir(outdir);
  for (const auto& p : ctx.optimized_paths) {
    WriteCsv(outdir / (SafeFileName(p.flight_id) + ".csv"), p.waypoints);
  }
}

} // namespace formation::io
