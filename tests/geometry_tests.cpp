#include "tests/test_framework.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "common/minimizer.hpp"
#include "common/time_utils.hpp"
#include "geo/geometry.hpp"

// =========================
// 几何内核 / 时间工具 / 有界最小化器
// =========================

namespace {

using formation::GeoPoint;
namespace geo = formation::geo;

void PrintBanner(const std::string& title) {
  std::cout << "\n";
  std::cout << "============================================================\n";
  std::cout << title << "\n";
  std::cout << "============================================================\n";
  std::cout << std::fixed << std::setprecision(6);
}

void DumpPoint(const std::string& name, const GeoPoint& p) {
  std::cout << name << " { lat_deg=" << p.lat_deg << ", lon_deg=" << p.lon_deg << " }\n";
}

// ---------- geometry ----------

bool Test_Distance_SymmetricAndKnownValue() {
  PrintBanner("geo::DistanceKm");
  const GeoPoint a{0.0, 0.0};
  const GeoPoint b{0.0, 1.0};
  const GeoPoint sfo{37.62, -122.38};
  const GeoPoint jfk{40.64, -73.78};

  const double d_ab = geo::DistanceKm(a, b);
  std::cout << "d(0,0 -> 0,1)=" << d_ab << "\n";
  FORMATION_EXPECT_NEAR(d_ab, 111.195, 1e-2);
  FORMATION_EXPECT_NEAR(geo::DistanceKm(sfo, jfk), geo::DistanceKm(jfk, sfo), 1e-9);
  FORMATION_EXPECT_NEAR(geo::DistanceKm(sfo, sfo), 0.0, 1e-9);
  // SFO-JFK 大约 4150 km
  FORMATION_EXPECT_TRUE(geo::DistanceKm(sfo, jfk) > 4100.0 && geo::DistanceKm(sfo, jfk) < 4200.0);
  return true;
}

bool Test_Bearing_RangeAndCardinals() {
  PrintBanner("geo::BearingDeg");
  const GeoPoint o{0.0, 0.0};
  FORMATION_EXPECT_NEAR(geo::BearingDeg(o, {1.0, 0.0}), 0.0, 1e-9);
  FORMATION_EXPECT_NEAR(geo::BearingDeg(o, {0.0, 1.0}), 90.0, 1e-9);
  FORMATION_EXPECT_NEAR(geo::BearingDeg(o, {-1.0, 0.0}), 180.0, 1e-9);
  FORMATION_EXPECT_NEAR(geo::BearingDeg(o, {0.0, -1.0}), 270.0, 1e-9);

  const std::vector<GeoPoint> pts{{10, 20}, {-30, 170}, {60, -170}, {-45, -60}, {89, 0}};
  for (const auto& p : pts) {
    for (const auto& q : pts) {
      const double b = geo::BearingDeg(p, q);
      FORMATION_EXPECT_TRUE(b >= 0.0 && b < 360.0);
    }
  }
  return true;
}

bool Test_Bisector_TakesShortArc() {
  PrintBanner("geo::BisectorDeg");
  FORMATION_EXPECT_NEAR(geo::BisectorDeg(10.0, 50.0), 30.0, 1e-9);
  FORMATION_EXPECT_NEAR(geo::BisectorDeg(50.0, 10.0), 30.0, 1e-9);
  FORMATION_EXPECT_NEAR(geo::BisectorDeg(350.0, 10.0), 0.0, 1e-9);
  FORMATION_EXPECT_NEAR(geo::BisectorDeg(300.0, 100.0), 20.0, 1e-9);
  return true;
}

bool Test_HeadingDifference_Wraps() {
  FORMATION_EXPECT_NEAR(geo::HeadingDifferenceDeg(350.0, 10.0), 20.0, 1e-9);
  FORMATION_EXPECT_NEAR(geo::HeadingDifferenceDeg(0.0, 180.0), 180.0, 1e-9);
  FORMATION_EXPECT_NEAR(geo::HeadingDifferenceDeg(-90.0, 270.0), 0.0, 1e-9);
  return true;
}

bool Test_DestinationPoint_AndInterpolate() {
  PrintBanner("geo::DestinationPoint / Interpolate");
  const GeoPoint start{37.0, -122.0};
  const GeoPoint p = geo::DestinationPoint(start, 135.0, 400.0);
  DumpPoint("dest", p);
  FORMATION_EXPECT_NEAR(geo::DistanceKm(start, p), 400.0, 1e-6);
  FORMATION_EXPECT_NEAR(geo::BearingDeg(start, p), 135.0, 1e-6);

  // 跨日界线归一化
  const GeoPoint east = geo::DestinationPoint({0.0, 179.5}, 90.0, 111.195);
  DumpPoint("east", east);
  FORMATION_EXPECT_TRUE(east.lon_deg >= -180.0 && east.lon_deg < 180.0);
  FORMATION_EXPECT_NEAR(east.lon_deg, -179.5, 1e-3);

  const GeoPoint a{40.0, -100.0};
  const GeoPoint b{40.0, -80.0};
  const GeoPoint m0 = geo::Interpolate(a, b, 0.0);
  const GeoPoint m1 = geo::Interpolate(a, b, 1.0);
  const GeoPoint mid = geo::Interpolate(a, b, 0.5);
  FORMATION_EXPECT_NEAR(geo::DistanceKm(m0, a), 0.0, 1e-6);
  FORMATION_EXPECT_NEAR(geo::DistanceKm(m1, b), 0.0, 1e-6);
  FORMATION_EXPECT_NEAR(geo::DistanceKm(a, mid), geo::DistanceKm(mid, b), 1e-6);
  // 大圆中点向极地一侧偏
  FORMATION_EXPECT_TRUE(mid.lat_deg > 40.0);
  return true;
}

bool Test_IntersectSegments_CrossAndParallel() {
  PrintBanner("geo::IntersectSegments");
  const auto x = geo::IntersectSegments({30.0, -100.0}, {40.0, -80.0}, {29.5, -99.0}, {40.5, -81.0});
  FORMATION_EXPECT_TRUE(x.has_value());
  DumpPoint("cross", x->point);
  FORMATION_EXPECT_NEAR(x->point.lat_deg, 35.0, 1e-9);
  FORMATION_EXPECT_NEAR(x->point.lon_deg, -90.0, 1e-9);
  FORMATION_EXPECT_NEAR(x->t1, 0.5, 1e-9);
  FORMATION_EXPECT_NEAR(x->t2, 0.5, 1e-9);

  // 平行
  FORMATION_EXPECT_NONE(geo::IntersectSegments({0, 0}, {0, 10}, {1, 0}, {1, 10}));
  // 直线相交但交点在线段外
  FORMATION_EXPECT_NONE(geo::IntersectSegments({0, 0}, {1, 1}, {0, 5}, {1, 4}));
  return true;
}

bool Test_AngleBetweenCourses_NoneCases() {
  PrintBanner("geo::AngleBetweenCourses");
  const auto a = geo::AngleBetweenCourses({30, -100}, {40, -80}, {29.5, -99}, {40.5, -81});
  FORMATION_EXPECT_TRUE(a.has_value());
  std::cout << "angle=" << *a << "\n";
  FORMATION_EXPECT_NEAR(*a, 4.865, 1e-2);

  // 零长度
  FORMATION_EXPECT_NONE(geo::AngleBetweenCourses({1, 1}, {1, 1}, {0, 0}, {1, 1}));
  // 方向相背
  FORMATION_EXPECT_NONE(geo::AngleBetweenCourses({0, 0}, {0, 10}, {1, 10}, {1, 0}));
  // 垂直：点积为 0 仍有值
  const auto right = geo::AngleBetweenCourses({0, 0}, {0, 10}, {0, 0}, {10, 0});
  FORMATION_EXPECT_TRUE(right.has_value());
  FORMATION_EXPECT_NEAR(*right, 90.0, 1e-9);
  return true;
}

// ---------- time ----------

bool Test_TimeUtils_ParseFormat() {
  PrintBanner("time utils");
  using formation::ParseIsoTimestamp;
  using formation::FormatIsoTimestamp;

  FORMATION_EXPECT_EQ(ParseIsoTimestamp("1970-01-01T00:00:00Z").value_or(-1), 0);
  FORMATION_EXPECT_EQ(ParseIsoTimestamp("2024-03-01T10:30:00Z").value_or(-1), 1709289000);
  FORMATION_EXPECT_EQ(ParseIsoTimestamp("2024-03-01 10:30").value_or(-1), 1709289000);
  FORMATION_EXPECT_EQ(ParseIsoTimestamp("2024-03-01T12:30:00+02:00").value_or(-1), 1709289000);
  FORMATION_EXPECT_EQ(ParseIsoTimestamp("2024-03-01T10:30:00.250Z").value_or(-1), 1709289000);
  FORMATION_EXPECT_NONE(ParseIsoTimestamp("not a time"));
  FORMATION_EXPECT_NONE(ParseIsoTimestamp("2024-13-01T00:00:00Z"));

  FORMATION_EXPECT_EQ(FormatIsoTimestamp(1709289000), std::string("2024-03-01T10:30:00Z"));
  FORMATION_EXPECT_EQ(FormatIsoTimestamp(0), std::string("1970-01-01T00:00:00Z"));
  return true;
}

bool Test_TimeUtils_MinutesOfDayWraps() {
  using formation::CircularMinuteGap;
  using formation::MinutesOfDay;

  FORMATION_EXPECT_EQ(MinutesOfDay(1709289000), 10 * 60 + 30);
  FORMATION_EXPECT_EQ(MinutesOfDay(-60), 23 * 60 + 59);
  FORMATION_EXPECT_EQ(CircularMinuteGap(1430, 10), 20);
  FORMATION_EXPECT_EQ(CircularMinuteGap(10, 1430), 20);
  FORMATION_EXPECT_EQ(CircularMinuteGap(600, 660), 60);
  FORMATION_EXPECT_EQ(CircularMinuteGap(0, 720), 720);
  return true;
}

// ---------- minimizer ----------

bool Test_Minimizer_InteriorOptimum() {
  PrintBanner("MinimizeOrderedPair (interior)");
  auto f = [](double e, double x) { return (e - 2.0) * (e - 2.0) + (x - 5.0) * (x - 5.0); };
  const formation::MinimizerResult r = formation::MinimizeOrderedPair(f, {0.0, 10.0, 1.0}, 3.3, 6.6);
  std::cout << "first=" << r.first << " second=" << r.second << " sweeps=" << r.sweeps << "\n";
  FORMATION_EXPECT_TRUE(r.converged);
  FORMATION_EXPECT_NEAR(r.first, 2.0, 1e-3);
  FORMATION_EXPECT_NEAR(r.second, 5.0, 1e-3);
  return true;
}

bool Test_Minimizer_GapConstraintActive() {
  PrintBanner("MinimizeOrderedPair (gap active)");
  // 无约束最优 (5,5) 不满足 second - first >= 2，约束最优为 (4,6)
  auto f = [](double e, double x) { return (e - 5.0) * (e - 5.0) + (x - 5.0) * (x - 5.0); };
  const formation::MinimizerResult r = formation::MinimizeOrderedPair(f, {0.0, 10.0, 2.0}, 3.3, 6.6);
  std::cout << "first=" << r.first << " second=" << r.second << "\n";
  FORMATION_EXPECT_TRUE(r.converged);
  FORMATION_EXPECT_TRUE(r.second - r.first >= 2.0 - 1e-9);
  FORMATION_EXPECT_TRUE(r.first >= 0.0 && r.second <= 10.0);
  FORMATION_EXPECT_NEAR(r.first, 4.0, 1e-3);
  FORMATION_EXPECT_NEAR(r.second, 6.0, 1e-3);
  return true;
}

bool Test_Minimizer_EmptyFeasibleSet() {
  auto f = [](double e, double x) { return e + x; };
  const formation::MinimizerResult r = formation::MinimizeOrderedPair(f, {0.0, 5.0, 10.0}, 1.0, 2.0);
  FORMATION_EXPECT_FALSE(r.converged);
  return true;
}

} // namespace

int main(int argc, char** argv) {
  using formation::test::TestCase;

  std::vector<TestCase> cases{
      {"Distance symmetric and known value", Test_Distance_SymmetricAndKnownValue},
      {"Bearing range and cardinals", Test_Bearing_RangeAndCardinals},
      {"Bisector takes short arc", Test_Bisector_TakesShortArc},
      {"Heading difference wraps", Test_HeadingDifference_Wraps},
      {"DestinationPoint and Interpolate", Test_DestinationPoint_AndInterpolate},
      {"IntersectSegments cross and parallel", Test_IntersectSegments_CrossAndParallel},
      {"AngleBetweenCourses none cases", Test_AngleBetweenCourses_NoneCases},
      {"Time utils parse/format", Test_TimeUtils_ParseFormat},
      {"Time utils minutes of day", Test_TimeUtils_MinutesOfDayWraps},
      {"Minimizer interior optimum", Test_Minimizer_InteriorOptimum},
      {"Minimizer gap constraint active", Test_Minimizer_GapConstraintActive},
      {"Minimizer empty feasible set", Test_Minimizer_EmptyFeasibleSet},
  };

  return formation::test::RunAll(cases, argc, argv);
}
