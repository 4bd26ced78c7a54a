#include "io/demo_io.hpp"

#include <filesystem>
#include <algorithm>
#include <fstream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/time_utils.hpp"

namespace fs = std::filesystem;

namespace formation::io {

using json = nlohmann::json;

static std::string ReadAllText(const fs::path& p) {
  std::ifstream ifs(p, std::ios::in | std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("Failed to open file: " + p.string());
  }
  std::ostringstream oss;
  oss << ifs.rdbuf();
  return oss.str();
}

static std::string ReadAllTextIfExists(const fs::path& p) {
  if (!fs::exists(p)) return {};
  return ReadAllText(p);
}

static json ParseJson(const std::string& text, const std::string& hint) {
  try {
    return json::parse(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("JSON parse failed for " + hint + ": " + std::string(e.what()));
  }
}

// 顶层既可以是数组，也可以是 {"<key>": [...]}
static json ArrayOf(const json& root, const char* key) {
  if (root.is_array()) return root;
  if (root.is_object() && root.contains(key) && root[key].is_array()) return root[key];
  return json::array();
}

// id 允许写成字符串或整数
static std::string IdOf(const json& j, const char* key) {
  if (!j.contains(key)) return {};
  const json& v = j[key];
  if (v.is_string()) return v.get<std::string>();
  if (v.is_number_integer()) return std::to_string(v.get<long long>());
  return {};
}

// 时间：ISO 字符串或 epoch 秒
static std::optional<EpochSeconds> TimeOf(const json& v) {
  if (v.is_string()) return ParseIsoTimestamp(v.get<std::string>());
  if (v.is_number()) return static_cast<EpochSeconds>(v.get<double>());
  return std::nullopt;
}

static std::optional<GeoPoint> PointOf(const json& j, const char* lat_key, const char* lon_key) {
  if (j.contains(lat_key) && j.contains(lon_key) && j[lat_key].is_number() && j[lon_key].is_number()) {
    return GeoPoint{j[lat_key].get<double>(), j[lon_key].get<double>()};
  }
  return std::nullopt;
}

// ---------- flights ----------

static Endpoint ParseEndpoint(const json& j) {
  Endpoint e;
  if (!j.is_object()) return e;
  e.airport = j.value("airport", std::string{});
  e.position = PointOf(j, "lat", "lon");
  if (j.contains("time")) e.time_s = TimeOf(j["time"]);
  return e;
}

static Flight ParseFlight(const json& j) {
  Flight f;
  f.id = IdOf(j, "id");
  if (f.id.empty()) f.id = IdOf(j, "flight_no");
  if (f.id.empty()) f.id = IdOf(j, "number");

  if (j.contains("departure") || j.contains("arrival")) {
    f.departure = ParseEndpoint(j.value("departure", json::object()));
    f.arrival = ParseEndpoint(j.value("arrival", json::object()));
  } else if (j.contains("dep") || j.contains("arr")) {
    // 配对请求里内嵌的精简航班 {dep:{lat,lon,airport,time}, arr:{...}}
    f.departure = ParseEndpoint(j.value("dep", json::object()));
    f.arrival = ParseEndpoint(j.value("arr", json::object()));
  } else {
    // 扁平原始记录
    f.departure.airport = j.value("departure_airport", std::string{});
    f.arrival.airport = j.value("arrival_airport", std::string{});
    f.departure.position = PointOf(j, "dep_lat", "dep_lon");
    f.arrival.position = PointOf(j, "arr_lat", "arr_lon");
    if (j.contains("scheduled_departure")) f.departure.time_s = TimeOf(j["scheduled_departure"]);
    if (j.contains("scheduled_arrival")) f.arrival.time_s = TimeOf(j["scheduled_arrival"]);
  }

  f.route_label = j.value("route_label", f.departure.airport + "-" + f.arrival.airport);

  if (j.contains("nodes") && j["nodes"].is_array()) {
    for (const auto& n : j["nodes"]) {
      const auto p = PointOf(n, "lat", "lon");
      const auto t = n.contains("timestamp") ? TimeOf(n["timestamp"]) : std::nullopt;
      if (!p || !t) {
        throw std::runtime_error("Invalid trajectory node for flight " + f.id);
      }
      f.nodes.push_back({p->lat_deg, p->lon_deg, *t});
    }
  }
  return f;
}

std::vector<Flight> DemoIO::ParseFlightsJson(const std::string& json_text) {
  const json root = ParseJson(json_text, "flights");
  std::vector<Flight> out;
  for (const auto& j : ArrayOf(root, "flights")) {
    if (!j.is_object()) continue;
    out.push_back(ParseFlight(j));
  }
  return out;
}

// ---------- airports ----------

static std::map<std::string, GeoPoint> ParseAirports(const json& root) {
  std::map<std::string, GeoPoint> out;
  if (!root.is_object()) return out;
  for (auto it = root.begin(); it != root.end(); ++it) {
    const json& v = it.value();
    if (v.is_array() && v.size() >= 2 && v[0].is_number() && v[1].is_number()) {
      out[it.key()] = GeoPoint{v[0].get<double>(), v[1].get<double>()};
    } else if (v.is_object()) {
      if (auto p = PointOf(v, "lat", "lon")) out[it.key()] = *p;
    }
  }
  return out;
}

static void ResolveEndpoint(Endpoint& e, const std::map<std::string, GeoPoint>& airports) {
  if (e.position || e.airport.empty()) return;
  auto it = airports.find(e.airport);
  if (it != airports.end()) e.position = it->second;
}

// ---------- config ----------

void DemoIO::ApplyConfigJson(const std::string& json_text, EngineConfig& cfg) {
  const json root = ParseJson(json_text, "config");
  if (!root.is_object()) return;

  cfg.worker_threads = root.value("worker_threads", cfg.worker_threads);

  const json p = root.value("pairs", json::object());
  cfg.pairs.similar_max_angle_deg = p.value("similar_max_angle_deg", cfg.pairs.similar_max_angle_deg);
  cfg.pairs.similar_max_time_gap_minutes = p.value("similar_max_time_gap_minutes", cfg.pairs.similar_max_time_gap_minutes);
  cfg.pairs.intersecting_max_angle_deg = p.value("intersecting_max_angle_deg", cfg.pairs.intersecting_max_angle_deg);
  cfg.pairs.intersecting_max_time_gap_minutes =
      p.value("intersecting_max_time_gap_minutes", cfg.pairs.intersecting_max_time_gap_minutes);

  const json fz = root.value("feasibility", json::object());
  auto& f = cfg.feasibility;
  f.max_distance_km = fz.value("max_distance_km", f.max_distance_km);
  f.max_time_diff_minutes = fz.value("max_time_diff_minutes", f.max_time_diff_minutes);
  f.use_heading = fz.value("use_heading", f.use_heading);
  f.max_candidates_per_node = fz.value("max_candidates_per_node", f.max_candidates_per_node);
  if (fz.contains("min_score") && fz["min_score"].is_number()) {
    f.min_score = fz["min_score"].get<double>();
  }

  const json cz = root.value("corridor", json::object());
  auto& c = cfg.corridor;
  c.normal_speed = cz.value("normal_speed", c.normal_speed);
  c.boost_speed = cz.value("boost_speed", c.boost_speed);
  c.min_boost_segment_km = cz.value("min_boost_segment_km", c.min_boost_segment_km);
  c.initial_entry_fraction = cz.value("initial_entry_fraction", c.initial_entry_fraction);
  c.initial_exit_fraction = cz.value("initial_exit_fraction", c.initial_exit_fraction);
  c.max_corridors_per_flight = cz.value("max_corridors_per_flight", c.max_corridors_per_flight);
  c.average_speed_kmh = cz.value("average_speed_kmh", c.average_speed_kmh);
  c.intersecting_length_km = cz.value("intersecting_length_km", c.intersecting_length_km);
  c.similar_length_factor = cz.value("similar_length_factor", c.similar_length_factor);
  c.intersecting_efficiency_bonus = cz.value("intersecting_efficiency_bonus", c.intersecting_efficiency_bonus);
  c.efficiency_reference_angle_deg = cz.value("efficiency_reference_angle_deg", c.efficiency_reference_angle_deg);
  c.solver_max_sweeps = cz.value("solver_max_sweeps", c.solver_max_sweeps);
  c.solver_max_line_iterations = cz.value("solver_max_line_iterations", c.solver_max_line_iterations);
  c.solver_tolerance = cz.value("solver_tolerance", c.solver_tolerance);

  const json fw = root.value("following", json::object());
  auto& w = cfg.following;
  w.departure_offsets_minutes = fw.value("departure_offsets_minutes", w.departure_offsets_minutes);
  w.candidate_window_minutes = fw.value("candidate_window_minutes", w.candidate_window_minutes);
  w.max_bearing_diff_deg = fw.value("max_bearing_diff_deg", w.max_bearing_diff_deg);
  w.max_candidates = fw.value("max_candidates", w.max_candidates);
  w.efficiency_gain = fw.value("efficiency_gain", w.efficiency_gain);
  w.max_detour_km = fw.value("max_detour_km", w.max_detour_km);
  w.intercept_reach_factor = fw.value("intercept_reach_factor", w.intercept_reach_factor);
  w.max_intercept_minutes = fw.value("max_intercept_minutes", w.max_intercept_minutes);
  w.max_divergence_km = fw.value("max_divergence_km", w.max_divergence_km);
  w.cruise_speed_kmh = fw.value("cruise_speed_kmh", w.cruise_speed_kmh);
  w.intercept_time_weight = fw.value("intercept_time_weight", w.intercept_time_weight);
  w.path_step_minutes = fw.value("path_step_minutes", w.path_step_minutes);
}

// ---------- departure requests ----------

static void ParseRequestEnd(const json& j, const char* key, std::string& airport, std::optional<GeoPoint>& pos) {
  if (!j.contains(key)) return;
  const json& v = j[key];
  if (v.is_string()) {
    airport = v.get<std::string>();
  } else if (v.is_object()) {
    airport = v.value("airport", std::string{});
    pos = PointOf(v, "lat", "lon");
  }
}

static DepartureRequest ParseRequest(const json& j, std::size_t ordinal) {
  DepartureRequest r;
  r.id = IdOf(j, "id");
  if (r.id.empty()) r.id = "request-" + std::to_string(ordinal + 1);

  ParseRequestEnd(j, "origin", r.origin_airport, r.origin);
  ParseRequestEnd(j, "destination", r.destination_airport, r.destination);

  const auto t = j.contains("scheduled_departure") ? TimeOf(j["scheduled_departure"]) : std::nullopt;
  if (!t) {
    throw std::runtime_error("Invalid scheduled_departure in departure request " + r.id);
  }
  r.scheduled_departure_s = *t;

  if (j.contains("duration_minutes") && j["duration_minutes"].is_number()) {
    r.duration_minutes = j["duration_minutes"].get<double>();
  }
  if (j.contains("distance_km") && j["distance_km"].is_number()) {
    r.distance_km = j["distance_km"].get<double>();
  }
  return r;
}

// ---------- pairs ----------

// flight1/flight2 可以是航班 id，也可以是内嵌的航班对象（不在 flights 里时追加）
static std::optional<std::size_t> FlightRef(const json& v, std::vector<Flight>& flights,
                                            std::map<std::string, std::size_t>& index) {
  std::string id;
  if (v.is_string()) {
    id = v.get<std::string>();
  } else if (v.is_number_integer()) {
    id = std::to_string(v.get<long long>());
  } else if (v.is_object()) {
    Flight f = ParseFlight(v);
    id = f.id;
    if (!id.empty() && !index.count(id)) {
      index[id] = flights.size();
      flights.push_back(std::move(f));
    }
  }
  auto it = index.find(id);
  if (it == index.end()) return std::nullopt;
  return it->second;
}

static void ParsePairs(const json& root, MatchingContext& ctx) {
  std::map<std::string, std::size_t> index;
  for (std::size_t i = 0; i < ctx.flights.size(); ++i) index[ctx.flights[i].id] = i;

  for (const auto& j : ArrayOf(root, "pairs")) {
    if (!j.is_object()) continue;
    const auto a = j.contains("flight1") ? FlightRef(j["flight1"], ctx.flights, index) : std::nullopt;
    const auto b = j.contains("flight2") ? FlightRef(j["flight2"], ctx.flights, index) : std::nullopt;
    if (!a || !b || *a == *b) {
      ctx.skipped.pairs_unknown_flight++;
      continue;
    }

    CompatiblePair p;
    p.kind = (j.value("type", std::string("similar")) == "intersecting") ? PairKind::kIntersecting : PairKind::kSimilar;
    p.flight_a = std::min(*a, *b);
    p.flight_b = std::max(*a, *b);
    p.angle_deg = j.value("angle", 0.0);
    if (j.contains("intersection") && j["intersection"].is_object()) {
      p.intersection = PointOf(j["intersection"], "lat", "lon");
    }
    ctx.pairs.push_back(p);
  }
}

// ---------- entry ----------

MatchingContext DemoIO::LoadContext(const std::string& input_dir) {
  MatchingContext ctx;
  const fs::path dir(input_dir);

  // ---------- config ----------
  const std::string config_text = ReadAllTextIfExists(dir / "config.json");
  if (!config_text.empty()) {
    ApplyConfigJson(config_text, ctx.config);
  }

  // ---------- flights ----------
  const std::string flights_text = ReadAllTextIfExists(dir / "flights.json");
  if (flights_text.empty()) {
    throw std::runtime_error("No flights.json found in: " + dir.string());
  }
  ctx.flights = ParseFlightsJson(flights_text);

  // ---------- pairs (optional) ----------
  const std::string pairs_text = ReadAllTextIfExists(dir / "pairs.json");
  if (!pairs_text.empty()) {
    ParsePairs(ParseJson(pairs_text, "pairs"), ctx);
  }

  // ---------- airports: 补齐端点坐标 ----------
  const std::string airports_text = ReadAllTextIfExists(dir / "airports.json");
  std::map<std::string, GeoPoint> airports;
  if (!airports_text.empty()) {
    airports = ParseAirports(ParseJson(airports_text, "airports"));
  }
  for (auto& f : ctx.flights) {
    ResolveEndpoint(f.departure, airports);
    ResolveEndpoint(f.arrival, airports);
  }

  // ---------- departure requests (optional) ----------
  const std::string req_text = ReadAllTextIfExists(dir / "departure_requests.json");
  if (!req_text.empty()) {
    const json root = ParseJson(req_text, "departure_requests");
    const json arr = ArrayOf(root, "requests");
    for (std::size_t i = 0; i < arr.size(); ++i) {
      if (!arr[i].is_object()) continue;
      DepartureRequest r = ParseRequest(arr[i], i);
      if (!r.origin) {
        auto it = airports.find(r.origin_airport);
        if (it != airports.end()) r.origin = it->second;
      }
      if (!r.destination) {
        auto it = airports.find(r.destination_airport);
        if (it != airports.end()) r.destination = it->second;
      }
      ctx.departure_requests.push_back(std::move(r));
    }
  }

  return ctx;
}

} // namespace formation::io
