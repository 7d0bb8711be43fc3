#ifndef THRESHOLD_EVALUATOR_H
#define THRESHOLD_EVALUATOR_H

#include "core/maintenance_config.h"
#include "maintenance/candidate.h"
#include "maintenance/operation.h"
#include <optional>
#include <vector>

// Classifies one candidate against the threshold policy. Vacuum-family rules
// are checked Urgent then High, analyze rules Never-analyzed, Stale then
// High-churn; the first match of each family wins, so a candidate yields at
// most one operation per family.
class ThresholdEvaluator {
public:
  explicit ThresholdEvaluator(ThresholdPolicy policy);

  std::vector<Operation> evaluate(const Candidate &candidate,
                                  OperationMode mode, TimePoint now) const;

  std::optional<Operation> evaluateVacuum(const Candidate &candidate,
                                          OperationKind kind) const;
  std::optional<Operation> evaluateAnalyze(const Candidate &candidate,
                                           TimePoint now) const;
  std::optional<Operation> evaluateReindex(const Candidate &candidate) const;

  const ThresholdPolicy &policy() const { return policy_; }

private:
  ThresholdPolicy policy_;
};

#endif
