#ifndef CANDIDATE_COLLECTOR_H
#define CANDIDATE_COLLECTOR_H

#include "core/maintenance_config.h"
#include "maintenance/candidate.h"
#include "maintenance/statistics_source.h"
#include <string>
#include <vector>

class CandidateCollector {
public:
  CandidateCollector(IStatisticsSource &source, TargetScope scope,
                     bool allowPartial);

  // Every in-scope table with at least one live or dead tuple. Rows that fail
  // conversion are dropped with a warning when partial collection is allowed,
  // otherwise the whole collection fails with CollectionError.
  std::vector<Candidate> collect();

  size_t rejectedRows() const { return rejectedRows_; }

  bool inScope(const std::string &schema, const std::string &table) const;

  static bool isSystemSchema(const std::string &schema);
  static Candidate toCandidate(const StatisticsRow &row);

private:
  IStatisticsSource &source_;
  TargetScope scope_;
  bool allowPartial_;
  size_t rejectedRows_ = 0;
};

#endif
