#include "core/GeoUtils.hpp"
#include <algorithm>
#include <cmath>
#include <math.h>

static inline double floor_accuracy(double accuracy_m) {
  return std::max(accuracy_m, 1.0);
}

void CentroidAccumulator::add(const Coordinate &c, double accuracy_m) {
  const double a = floor_accuracy(accuracy_m);
  sum_lat_ += c.lat / a;
  sum_lon_ += c.lon / a;
  sum_w_ += 1.0 / a;
  sum_w2_ += 1.0 / (a * a);
  ++count_;
}

void CentroidAccumulator::remove(const Coordinate &c, double accuracy_m) {
  if (count_ == 0)
    return;
  if (count_ == 1) {
    reset();
    return;
  }
  const double a = floor_accuracy(accuracy_m);
  sum_lat_ -= c.lat / a;
  sum_lon_ -= c.lon / a;
  sum_w_ -= 1.0 / a;
  sum_w2_ -= 1.0 / (a * a);
  --count_;
}

void CentroidAccumulator::reset() noexcept {
  sum_lat_ = sum_lon_ = sum_w_ = sum_w2_ = 0.0;
  count_ = 0;
}

Coordinate CentroidAccumulator::centroid() const {
  if (count_ == 0 || sum_w_ <= 0.0)
    return {};
  return {sum_lat_ / sum_w_, sum_lon_ / sum_w_};
}

double CentroidAccumulator::accuracy() const {
  if (count_ == 0 || sum_w2_ <= 0.0)
    return 0.0;
  return 1.0 / std::sqrt(sum_w2_);
}

double GeoUtils::haversine(double lat1, double lon1, double lat2,
                           double lon2) {
  double phi1 = lat1 * (M_PI / 180);
  double phi2 = lat2 * (M_PI / 180);
  double delta_phi = (lat2 - lat1) * (M_PI / 180);
  double delta_gamma = (lon2 - lon1) * (M_PI / 180);
  double h = pow(sin(delta_phi / 2), 2) +
             cos(phi1) * cos(phi2) * pow(sin(delta_gamma / 2), 2);
  return 2 * kEarthRadiusM * asin(sqrt(std::min(1.0, h)));
}

double GeoUtils::haversine(const Coordinate &p1, const Coordinate &p2) {
  return haversine(p1.lat, p1.lon, p2.lat, p2.lon);
}

double GeoUtils::haversine_km(const Coordinate &p1, const Coordinate &p2) {
  return haversine(p1, p2) / 1000.0;
}

Coordinate GeoUtils::unweighted_centroid(const std::vector<Coordinate> &pts) {
  if (pts.empty())
    return {};
  double lat = 0.0, lon = 0.0;
  for (const auto &c : pts) {
    lat += c.lat;
    lon += c.lon;
  }
  const double n = static_cast<double>(pts.size());
  return {lat / n, lon / n};
}

Coordinate GeoUtils::unweighted_centroid(const std::vector<GpsFix> &fixes) {
  std::vector<Coordinate> pts;
  pts.reserve(fixes.size());
  for (const auto &f : fixes)
    pts.push_back(f.coord);
  return unweighted_centroid(pts);
}

double GeoUtils::adjusted_distance(const Coordinate &ref, const Coordinate &p,
                                   double accuracy_m) {
  return std::max(haversine(ref, p) - accuracy_m, 0.0);
}

GeoUtils::BBox GeoUtils::compute_bbox(const std::vector<Coordinate> &pts) {
  GeoUtils::BBox b{+90, +180, -90, -180};
  for (auto &c : pts) {
    b.min_lat = std::min(b.min_lat, c.lat);
    b.max_lat = std::max(b.max_lat, c.lat);
    b.min_lon = std::min(b.min_lon, c.lon);
    b.max_lon = std::max(b.max_lon, c.lon);
  }
  return b;
}

// Pad a bbox by a distance in metres (equirectangular approximation around
// the box's mid latitude).
GeoUtils::BBox GeoUtils::inflate_bbox(const BBox &b, double pad_m) {
  const double lat0 = ((b.min_lat + b.max_lat) * 0.5) * M_PI / 180.0;
  const double m_per_deg_lat = 111132.954;
  const double m_per_deg_lon =
      std::max(111132.954 * std::cos(lat0), 1e-6); // poles
  const double dlat = pad_m / m_per_deg_lat;
  const double dlon = pad_m / m_per_deg_lon;
  return {b.min_lat - dlat, b.min_lon - dlon, b.max_lat + dlat,
          b.max_lon + dlon};
}

bool GeoUtils::bbox_contains(const BBox &b, const Coordinate &c) {
  return c.lat >= b.min_lat && c.lat <= b.max_lat && c.lon >= b.min_lon &&
         c.lon <= b.max_lon;
}
