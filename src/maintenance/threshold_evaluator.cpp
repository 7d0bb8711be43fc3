#include "maintenance/threshold_evaluator.h"
#include <iomanip>
#include <sstream>

namespace {

std::string percent(double ratio) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1) << ratio * 100.0 << "%";
  return oss.str();
}

std::string days(double value) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1) << value << "d";
  return oss.str();
}

} // namespace

ThresholdEvaluator::ThresholdEvaluator(ThresholdPolicy policy)
    : policy_(policy) {}

std::optional<Operation>
ThresholdEvaluator::evaluateVacuum(const Candidate &candidate,
                                   OperationKind kind) const {
  double ratio = candidate.deadTupleRatio();
  double urgent = 2.0 * policy_.deadTupleRatio;

  if (ratio >= urgent) {
    return Operation(candidate, kind,
                     {"Urgent",
                      "dead tuple ratio " + percent(ratio) + " >= " +
                          percent(urgent),
                      ratio * 100.0},
                     1);
  }
  if (ratio >= policy_.deadTupleRatio) {
    return Operation(candidate, kind,
                     {"High",
                      "dead tuple ratio " + percent(ratio) + " >= " +
                          percent(policy_.deadTupleRatio),
                      ratio * 100.0},
                     2);
  }
  return std::nullopt;
}

std::optional<Operation>
ThresholdEvaluator::evaluateAnalyze(const Candidate &candidate,
                                    TimePoint now) const {
  auto staleness = candidate.staleness(now);
  int64_t mods = candidate.modificationsSinceAnalyze;

  if (!staleness) {
    if (candidate.liveTuples > policy_.neverAnalyzedMinLiveRows) {
      return Operation(candidate, OperationKind::Analyze,
                       {"Never-analyzed",
                        "no statistics with " +
                            std::to_string(candidate.liveTuples) +
                            " live rows",
                        static_cast<double>(candidate.liveTuples)},
                       1);
    }
  } else {
    double ageDays = static_cast<double>(staleness->count()) / 86400.0;
    if (ageDays >= policy_.staleDays && mods > policy_.staleMinModifications) {
      return Operation(candidate, OperationKind::Analyze,
                       {"Stale",
                        "last analyzed " + days(ageDays) + " ago with " +
                            std::to_string(mods) + " modifications",
                        ageDays},
                       2);
    }
  }

  if (mods > 0 &&
      static_cast<double>(mods) >=
          policy_.modificationRatio * static_cast<double>(candidate.liveTuples)) {
    double ratio = candidate.liveTuples > 0
                       ? static_cast<double>(mods) /
                             static_cast<double>(candidate.liveTuples)
                       : 1.0;
    return Operation(candidate, OperationKind::Analyze,
                     {"High-churn",
                      std::to_string(mods) + " modifications, " +
                          percent(ratio) + " of live rows",
                      ratio * 100.0},
                     3);
  }
  return std::nullopt;
}

// The dead tuple ratio stands in for index bloat.
std::optional<Operation>
ThresholdEvaluator::evaluateReindex(const Candidate &candidate) const {
  double ratio = candidate.deadTupleRatio();
  double bloat = policy_.reindexBloatRatio;

  if (ratio >= 2.0 * bloat) {
    return Operation(candidate, OperationKind::Reindex,
                     {"Urgent",
                      "bloat estimate " + percent(ratio) + " >= " +
                          percent(2.0 * bloat),
                      ratio * 100.0},
                     1);
  }
  if (ratio >= bloat) {
    return Operation(candidate, OperationKind::Reindex,
                     {"Bloat",
                      "bloat estimate " + percent(ratio) + " >= " +
                          percent(bloat),
                      ratio * 100.0},
                     2);
  }
  return std::nullopt;
}

std::vector<Operation> ThresholdEvaluator::evaluate(const Candidate &candidate,
                                                    OperationMode mode,
                                                    TimePoint now) const {
  std::vector<Operation> operations;
  if (candidate.totalTuples() <= 0)
    return operations;

  switch (mode) {
  case OperationMode::VACUUM:
    if (auto op = evaluateVacuum(candidate, OperationKind::Vacuum))
      operations.push_back(std::move(*op));
    break;
  case OperationMode::FULL_VACUUM:
    if (auto op = evaluateVacuum(candidate, OperationKind::VacuumFull))
      operations.push_back(std::move(*op));
    break;
  case OperationMode::ANALYZE:
    if (auto op = evaluateAnalyze(candidate, now))
      operations.push_back(std::move(*op));
    break;
  case OperationMode::AUTO:
    if (auto op = evaluateVacuum(candidate, OperationKind::Vacuum))
      operations.push_back(std::move(*op));
    if (auto op = evaluateAnalyze(candidate, now))
      operations.push_back(std::move(*op));
    break;
  case OperationMode::REINDEX:
    if (auto op = evaluateReindex(candidate))
      operations.push_back(std::move(*op));
    break;
  }
  return operations;
}
