#include "maintenance/plan_builder.h"
#include "core/logger.h"
#include <algorithm>
#include <limits>

PlanBuilder::PlanBuilder(const ThresholdEvaluator &evaluator,
                         OperationMode mode)
    : evaluator_(evaluator), mode_(mode) {}

std::vector<Operation>
PlanBuilder::build(const std::vector<Candidate> &candidates,
                   TimePoint now) const {
  std::vector<Operation> operations;
  for (const auto &candidate : candidates) {
    auto proposed = evaluator_.evaluate(candidate, mode_, now);
    for (auto &op : proposed) {
      Logger::debug(LogCategory::MAINTENANCE, "PlanBuilder",
                    operationKindToString(op.kind()) + " " +
                        candidate.qualifiedName() + " tier " +
                        std::to_string(op.tier()) + " - " +
                        op.reason().toString());
      operations.push_back(std::move(op));
    }
  }

  sortByPriority(operations, now);
  assignRanks(operations);

  Logger::info(LogCategory::MAINTENANCE, "PlanBuilder",
               "Proposed " + std::to_string(operations.size()) +
                   " operations for " + std::to_string(candidates.size()) +
                   " candidates (mode " + operationModeToString(mode_) + ")");
  return operations;
}

void PlanBuilder::sortByPriority(std::vector<Operation> &operations,
                                 TimePoint now) {
  auto stalenessOf = [now](const Operation &op) {
    auto age = op.target().staleness(now);
    return age ? age->count() : std::numeric_limits<int64_t>::max();
  };

  std::stable_sort(
      operations.begin(), operations.end(),
      [&](const Operation &a, const Operation &b) {
        if (a.tier() != b.tier())
          return a.tier() < b.tier();
        if (a.target().deadTuples != b.target().deadTuples)
          return a.target().deadTuples > b.target().deadTuples;
        if (a.target().sizeBytes != b.target().sizeBytes)
          return a.target().sizeBytes > b.target().sizeBytes;
        int64_t staleA = stalenessOf(a);
        int64_t staleB = stalenessOf(b);
        if (staleA != staleB)
          return staleA > staleB;
        std::string nameA = a.target().qualifiedName();
        std::string nameB = b.target().qualifiedName();
        if (nameA != nameB)
          return nameA < nameB;
        return static_cast<int>(a.kind()) > static_cast<int>(b.kind());
      });
}

void PlanBuilder::assignRanks(std::vector<Operation> &operations) {
  for (size_t i = 0; i < operations.size(); ++i) {
    operations[i].setRank(i + 1);
  }
}
