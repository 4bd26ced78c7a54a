#include "geo/geometry.hpp"

#include <algorithm>
#include <cmath>

namespace formation::geo {

static inline double Wrap360(double deg) {
  double r = std::fmod(deg, 360.0);
  if (r < 0.0) r += 360.0;
  if (r >= 360.0) r -= 360.0;
  return r;
}

double DistanceKm(const GeoPoint& a, const GeoPoint& b) {
  const double lat1 = Deg2Rad(a.lat_deg);
  const double lat2 = Deg2Rad(b.lat_deg);
  const double dlat = Deg2Rad(b.lat_deg - a.lat_deg);
  const double dlon = Deg2Rad(b.lon_deg - a.lon_deg);

  const double s1 = std::sin(dlat / 2.0);
  const double s2 = std::sin(dlon / 2.0);
  const double h = s1 * s1 + std::cos(lat1) * std::cos(lat2) * s2 * s2;
  const double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(std::max(0.0, 1.0 - h)));
  return kEarthRadiusKm * c;
}

double BearingDeg(const GeoPoint& a, const GeoPoint& b) {
  const double lat1 = Deg2Rad(a.lat_deg);
  const double lat2 = Deg2Rad(b.lat_deg);
  const double dlon = Deg2Rad(b.lon_deg - a.lon_deg);

  const double y = std::sin(dlon) * std::cos(lat2);
  const double x = std::cos(lat1) * std::sin(lat2) - std::sin(lat1) * std::cos(lat2) * std::cos(dlon);
  return Wrap360(Rad2Deg(std::atan2(y, x)));
}

double BisectorDeg(double bearing1_deg, double bearing2_deg) {
  double diff = Wrap360(bearing2_deg - bearing1_deg);
  if (diff > 180.0) diff -= 360.0; // 走短弧
  return Wrap360(bearing1_deg + diff / 2.0);
}

double HeadingDifferenceDeg(double a_deg, double b_deg) {
  const double d = std::fabs(Wrap360(a_deg) - Wrap360(b_deg));
  return std::min(d, 360.0 - d);
}

GeoPoint DestinationPoint(const GeoPoint& origin, double bearing_deg, double distance_km) {
  const double lat1 = Deg2Rad(origin.lat_deg);
  const double lon1 = Deg2Rad(origin.lon_deg);
  const double brg = Deg2Rad(bearing_deg);
  const double ang = distance_km / kEarthRadiusKm;

  const double sin_lat2 = std::sin(lat1) * std::cos(ang) + std::cos(lat1) * std::sin(ang) * std::cos(brg);
  const double lat2 = std::asin(std::clamp(sin_lat2, -1.0, 1.0));
  const double lon2 = lon1 + std::atan2(std::sin(brg) * std::sin(ang) * std::cos(lat1),
                                        std::cos(ang) - std::sin(lat1) * std::sin(lat2));

  // 经度归一到 [-180, 180)
  double lon_deg = std::fmod(Rad2Deg(lon2) + 540.0, 360.0) - 180.0;
  return {Rad2Deg(lat2), lon_deg};
}

GeoPoint Interpolate(const GeoPoint& a, const GeoPoint& b, double fraction) {
  const double d = DistanceKm(a, b) / kEarthRadiusKm;
  if (d < 1e-12) return a;

  const double lat1 = Deg2Rad(a.lat_deg), lon1 = Deg2Rad(a.lon_deg);
  const double lat2 = Deg2Rad(b.lat_deg), lon2 = Deg2Rad(b.lon_deg);

  const double wa = std::sin((1.0 - fraction) * d) / std::sin(d);
  const double wb = std::sin(fraction * d) / std::sin(d);

  const double x = wa * std::cos(lat1) * std::cos(lon1) + wb * std::cos(lat2) * std::cos(lon2);
  const double y = wa * std::cos(lat1) * std::sin(lon1) + wb * std::cos(lat2) * std::sin(lon2);
  const double z = wa * std::sin(lat1) + wb * std::sin(lat2);

  return {Rad2Deg(std::atan2(z, std::sqrt(x * x + y * y))), Rad2Deg(std::atan2(y, x))};
}

std::optional<SegmentIntersection> IntersectSegments(const GeoPoint& p1, const GeoPoint& p2,
                                                     const GeoPoint& p3, const GeoPoint& p4) {
  // x = lon, y = lat
  const double x1 = p1.lon_deg, y1 = p1.lat_deg;
  const double x2 = p2.lon_deg, y2 = p2.lat_deg;
  const double x3 = p3.lon_deg, y3 = p3.lat_deg;
  const double x4 = p4.lon_deg, y4 = p4.lat_deg;

  const double denom = (x1 - x2) * (y3 - y4) - (y1 - y2) * (x3 - x4);
  if (std::fabs(denom) < 1e-10) {
    return std::nullopt;
  }

  const double t = ((x1 - x3) * (y3 - y4) - (y1 - y3) * (x3 - x4)) / denom;
  const double u = -((x1 - x2) * (y1 - y3) - (y1 - y2) * (x1 - x3)) / denom;
  if (t < 0.0 || t > 1.0 || u < 0.0 || u > 1.0) {
    return std::nullopt;
  }

  SegmentIntersection out;
  out.point = {y1 + t * (y2 - y1), x1 + t * (x2 - x1)};
  out.t1 = t;
  out.t2 = u;
  return out;
}

std::optional<double> AngleBetweenCourses(const GeoPoint& dep1, const GeoPoint& arr1,
                                          const GeoPoint& dep2, const GeoPoint& arr2) {
  const double v1_lat = arr1.lat_deg - dep1.lat_deg;
  const double v1_lon = arr1.lon_deg - dep1.lon_deg;
  const double v2_lat = arr2.lat_deg - dep2.lat_deg;
  const double v2_lon = arr2.lon_deg - dep2.lon_deg;

  const double mag1 = std::sqrt(v1_lat * v1_lat + v1_lon * v1_lon);
  const double mag2 = std::sqrt(v2_lat * v2_lat + v2_lon * v2_lon);
  if (mag1 == 0.0 || mag2 == 0.0) {
    return std::nullopt;
  }

  const double dot = v1_lat * v2_lat + v1_lon * v2_lon;
  if (dot < 0.0) {
    return std::nullopt;
  }

  const double cos_a = std::clamp(dot / (mag1 * mag2), -1.0, 1.0);
  return Rad2Deg(std::acos(cos_a));
}

} // namespace formation::geo
