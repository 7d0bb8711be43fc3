#ifndef CANDIDATE_H
#define CANDIDATE_H

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

using TimePoint = std::chrono::system_clock::time_point;

// One table under consideration, built fresh from the statistics snapshot on
// every run. Counters are clamped to zero on construction.
struct Candidate {
  std::string schema;
  std::string table;
  int64_t liveTuples = 0;
  int64_t deadTuples = 0;
  int64_t inserts = 0;
  int64_t updates = 0;
  int64_t deletes = 0;
  int64_t modificationsSinceAnalyze = 0;
  int64_t sizeBytes = 0;
  std::optional<TimePoint> lastVacuum;
  std::optional<TimePoint> lastAutovacuum;
  std::optional<TimePoint> lastAnalyze;
  std::optional<TimePoint> lastAutoanalyze;

  std::string qualifiedName() const { return schema + "." + table; }

  int64_t totalTuples() const { return liveTuples + deadTuples; }

  // dead / (live + dead), 0 when the table holds no tuples at all.
  double deadTupleRatio() const {
    int64_t total = totalTuples();
    if (total <= 0)
      return 0.0;
    return static_cast<double>(deadTuples) / static_cast<double>(total);
  }

  std::optional<TimePoint> lastAnalyzed() const {
    if (lastAnalyze && lastAutoanalyze)
      return std::max(*lastAnalyze, *lastAutoanalyze);
    if (lastAnalyze)
      return lastAnalyze;
    return lastAutoanalyze;
  }

  // Time since the most recent statistics refresh, empty if never analyzed.
  std::optional<std::chrono::seconds> staleness(TimePoint now) const {
    auto analyzed = lastAnalyzed();
    if (!analyzed)
      return std::nullopt;
    auto age = std::chrono::duration_cast<std::chrono::seconds>(now - *analyzed);
    if (age.count() < 0)
      return std::chrono::seconds(0);
    return age;
  }

  void clampCounters() {
    for (int64_t *counter : {&liveTuples, &deadTuples, &inserts, &updates,
                             &deletes, &modificationsSinceAnalyze, &sizeBytes}) {
      if (*counter < 0)
        *counter = 0;
    }
  }
};

#endif
