#ifndef PLAN_BUILDER_H
#define PLAN_BUILDER_H

#include "maintenance/threshold_evaluator.h"
#include <vector>

class PlanBuilder {
public:
  PlanBuilder(const ThresholdEvaluator &evaluator, OperationMode mode);

  // Proposed operations for every candidate, in plan order, ranked from 1.
  std::vector<Operation> build(const std::vector<Candidate> &candidates,
                               TimePoint now) const;

  // Tier ascending, then dead tuples, size and staleness descending, then
  // qualified name and kind so equal inputs always give the same order.
  static void sortByPriority(std::vector<Operation> &operations,
                             TimePoint now);
  static void assignRanks(std::vector<Operation> &operations);

private:
  const ThresholdEvaluator &evaluator_;
  OperationMode mode_;
};

#endif
