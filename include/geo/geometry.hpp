#pragma once
#include <optional>

#include "common/types.hpp"

namespace formation::geo {

// ============================================================
// 球面几何内核：纯函数，无状态。角度单位 deg，距离单位 km。
// ============================================================

constexpr double kPi = 3.14159265358979323846;
constexpr double kEarthRadiusKm = 6371.0;

inline double Deg2Rad(double deg) { return deg * kPi / 180.0; }
inline double Rad2Deg(double rad) { return rad * 180.0 / kPi; }

/// 大圆距离（haversine）
double DistanceKm(const GeoPoint& a, const GeoPoint& b);

/// a -> b 的初始航向，范围 [0, 360)
double BearingDeg(const GeoPoint& a, const GeoPoint& b);

/// 两个航向的角平分线，沿较短的圆弧取中点
double BisectorDeg(double bearing1_deg, double bearing2_deg);

/// 两个航向之间的最小夹角，范围 [0, 180]
double HeadingDifferenceDeg(double a_deg, double b_deg);

/// 从 origin 沿 bearing 前进 distance_km 后的点（球面余弦公式）
GeoPoint DestinationPoint(const GeoPoint& origin, double bearing_deg, double distance_km);

/// 大圆插值，fraction=0 -> a，fraction=1 -> b
GeoPoint Interpolate(const GeoPoint& a, const GeoPoint& b, double fraction);

struct SegmentIntersection {
  GeoPoint point;
  double t1{0.0}; // 在 p1->p2 上的参数
  double t2{0.0}; // 在 p3->p4 上的参数
};

/// 线段 p1p2 与 p3p4 的交点。
/// 注意：把 (lon, lat) 当作平面直角坐标求交，只在中短距离上近似成立，
/// 并不是真正的大圆求交。平行或近平行（|denom| < 1e-10）返回 nullopt。
std::optional<SegmentIntersection> IntersectSegments(const GeoPoint& p1, const GeoPoint& p2,
                                                     const GeoPoint& p3, const GeoPoint& p4);

/// 两条航线 (dep->arr) 航向向量（经纬度差）的夹角。
/// 任一向量长度为 0，或点积 < 0（方向相背）时返回 nullopt。
std::optional<double> AngleBetweenCourses(const GeoPoint& dep1, const GeoPoint& arr1,
                                          const GeoPoint& dep2, const GeoPoint& arr2);

} // namespace formation::geo
