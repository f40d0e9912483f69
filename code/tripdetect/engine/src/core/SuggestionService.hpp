#pragma once
#include "models/CoreTypes.hpp"
#include "models/DetectionModel.hpp"
#include "models/params.hpp"
#include <string>
#include <vector>

class DetectionDB;

// Suggested locations: unmatched stationary clusters of every shift, grouped
// by single-linkage on their centroids. A group is offered as a place worth
// adding as a location until someone dismisses it.
class SuggestionService {
public:
  explicit SuggestionService(SuggestionParams p = {}) : P(p) {}

  // Groups with at least `min_occurrences` members (the configured minimum
  // when 0), dismissed places left out, most frequent first.
  std::vector<SuggestedLocation> suggest(DetectionDB &db,
                                         int min_occurrences = 0) const;

  // Member clusters of the group whose centroid lies nearest to `at` within
  // `radius_m` (the configured radius when <= 0), newest first.
  std::vector<StationaryCluster> occurrences(DetectionDB &db,
                                             const Coordinate &at,
                                             double radius_m = 0.0) const;

  // Dismisses the suggestion at `centroid` seen with `occurrence_count`
  // members. Throws std::invalid_argument when the count is not positive.
  IgnoredSuggestion ignore_suggestion(DetectionDB &db,
                                      const Coordinate &centroid,
                                      int occurrence_count,
                                      EpochMs ignored_at) const;

  // Dismisses one occurrence; false when it is unknown or already dismissed.
  bool ignore_occurrence(DetectionDB &db, const std::string &cluster_id) const;

  // Single-linkage groups of cluster indices, each sorted, in order of
  // first index.
  std::vector<std::vector<size_t>>
  group_clusters(const std::vector<StationaryCluster> &clusters) const;

  static SuggestedLocation
  aggregate(const std::vector<StationaryCluster> &clusters,
            const std::vector<size_t> &members);

private:
  SuggestionParams P;

  bool hidden(const SuggestedLocation &s,
              const std::vector<IgnoredSuggestion> &ignored) const;
};
