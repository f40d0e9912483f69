#pragma once

#include <nlohmann/json.hpp>
#include <string>

// Thresholds controlling cluster detection, trip building and transport
// classification. Missing keys in the settings file keep these defaults.
struct DetectionParams {
  // Stationary clustering
  double cluster_radius_m = 50.0;
  double min_dwell_minutes = 3.0;
  double max_accuracy_m = 200.0;
  double gps_gap_minutes = 15.0;
  double default_accuracy_m = 20.0; // stands in for a missing accuracy
  double stop_speed_mps = 0.28;     // sensor speed below which a fix is stopped
  double slow_movement_kmh = 8.0;   // unclaimed fixes move slower than this
  int coherence_min_points = 3;

  // Trip building
  double correction_factor = 1.3;
  double min_distance_km = 0.2;
  double min_distance_driving_km = 0.5;
  double min_displacement_walking_km = 0.1;
  double min_displacement_driving_km = 0.05;
  int straightness_max_points = 10;
  double min_straightness = 0.10;
  double low_accuracy_m = 50.0;
  double default_confidence = 0.80;
  double continuity_radius_m = 100.0;

  // Transport classification
  double driving_speed_kmh = 10.0;
  double walking_speed_kmh = 4.0;
  double slow_segment_kmh = 5.0;
  double slow_segment_ratio = 0.8;
  double walking_max_distance_km = 1.0;
  double glitch_speed_kmh = 200.0;
  double tiebreak_speed_kmh = 6.0;

  // Location matching
  double voting_threshold = 0.30;
  double voting_search_factor = 3.0;

  static DetectionParams from_json(const nlohmann::json &j) {
    DetectionParams p;
    auto read = [&j](const char *key, auto &field) {
      if (j.contains(key))
        field = j.at(key).get<std::decay_t<decltype(field)>>();
    };
    read("cluster_radius_m", p.cluster_radius_m);
    read("min_dwell_minutes", p.min_dwell_minutes);
    read("max_accuracy_m", p.max_accuracy_m);
    read("gps_gap_minutes", p.gps_gap_minutes);
    read("default_accuracy_m", p.default_accuracy_m);
    read("stop_speed_mps", p.stop_speed_mps);
    read("slow_movement_kmh", p.slow_movement_kmh);
    read("coherence_min_points", p.coherence_min_points);
    read("correction_factor", p.correction_factor);
    read("min_distance_km", p.min_distance_km);
    read("min_distance_driving_km", p.min_distance_driving_km);
    read("min_displacement_walking_km", p.min_displacement_walking_km);
    read("min_displacement_driving_km", p.min_displacement_driving_km);
    read("straightness_max_points", p.straightness_max_points);
    read("min_straightness", p.min_straightness);
    read("low_accuracy_m", p.low_accuracy_m);
    read("default_confidence", p.default_confidence);
    read("continuity_radius_m", p.continuity_radius_m);
    read("driving_speed_kmh", p.driving_speed_kmh);
    read("walking_speed_kmh", p.walking_speed_kmh);
    read("slow_segment_kmh", p.slow_segment_kmh);
    read("slow_segment_ratio", p.slow_segment_ratio);
    read("walking_max_distance_km", p.walking_max_distance_km);
    read("glitch_speed_kmh", p.glitch_speed_kmh);
    read("tiebreak_speed_kmh", p.tiebreak_speed_kmh);
    read("voting_threshold", p.voting_threshold);
    read("voting_search_factor", p.voting_search_factor);
    return p;
  }
};

// Carpool pairing thresholds.
struct CarpoolParams {
  double max_endpoint_distance_m = 200.0;
  double min_overlap_ratio = 0.8;

  static CarpoolParams from_json(const nlohmann::json &j) {
    CarpoolParams p;
    if (j.contains("max_endpoint_distance_m"))
      p.max_endpoint_distance_m = j.at("max_endpoint_distance_m").get<double>();
    if (j.contains("min_overlap_ratio"))
      p.min_overlap_ratio = j.at("min_overlap_ratio").get<double>();
    return p;
  }
};

// Suggested-location grouping over unmatched clusters.
struct SuggestionParams {
  double link_radius_m = 30.0;       // neighbouring centroids join one group
  double ignore_radius_m = 150.0;    // reach of a dismissed suggestion
  double occurrence_radius_m = 35.0; // drill-down search around a centroid
  int min_occurrences = 1;

  static SuggestionParams from_json(const nlohmann::json &j) {
    SuggestionParams p;
    p.link_radius_m = j.value("link_radius_m", p.link_radius_m);
    p.ignore_radius_m = j.value("ignore_radius_m", p.ignore_radius_m);
    p.occurrence_radius_m =
        j.value("occurrence_radius_m", p.occurrence_radius_m);
    p.min_occurrences = j.value("min_occurrences", p.min_occurrences);
    return p;
  }
};
