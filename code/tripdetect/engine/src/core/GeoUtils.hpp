#pragma once
#include "models/CoreTypes.hpp"
#include <vector>

// Running inverse-variance weighted centroid. Each fix contributes with
// weight 1/accuracy (accuracy floored at 1 m), so adding or removing a fix
// is O(1) instead of re-reducing the member list.
class CentroidAccumulator {
public:
  void add(const Coordinate &c, double accuracy_m);
  void remove(const Coordinate &c, double accuracy_m);
  void reset() noexcept;

  bool empty() const noexcept { return count_ == 0; }
  int count() const noexcept { return count_; }

  // Σ(v/acc) / Σ(1/acc)
  Coordinate centroid() const;
  // 1 / sqrt(Σ 1/acc²)
  double accuracy() const;

private:
  double sum_lat_ = 0.0;
  double sum_lon_ = 0.0;
  double sum_w_ = 0.0;
  double sum_w2_ = 0.0;
  int count_ = 0;
};

class GeoUtils {
public:
  static constexpr double kEarthRadiusM = 6371000.0;

  // haversine formulas
  static double haversine(double lat1, double lon1, double lat2, double lon2);
  static double haversine(const Coordinate &p1, const Coordinate &p2);
  static double haversine_km(const Coordinate &p1, const Coordinate &p2);

  // Plain arithmetic mean of the coordinates.
  static Coordinate unweighted_centroid(const std::vector<Coordinate> &pts);
  static Coordinate unweighted_centroid(const std::vector<GpsFix> &fixes);

  // Distance from a fix to a reference point, reduced by the fix's own
  // accuracy and clamped at zero.
  static double adjusted_distance(const Coordinate &ref, const Coordinate &p,
                                  double accuracy_m);

  struct BBox {
    double min_lat, min_lon, max_lat, max_lon;
  };
  static BBox compute_bbox(const std::vector<Coordinate> &pts);
  static BBox inflate_bbox(const BBox &b, double pad_m);
  static bool bbox_contains(const BBox &b, const Coordinate &c);
};
