#include "maintenance/candidate_collector.h"
#include "core/errors.h"
#include "core/logger.h"
#include "utils/string_utils.h"

namespace {

int64_t parseCounter(const std::optional<std::string> &value,
                     const char *column) {
  if (!value || value->empty())
    return 0;
  try {
    size_t consumed = 0;
    long long parsed = std::stoll(*value, &consumed);
    if (consumed != value->size())
      throw std::invalid_argument("trailing characters");
    return parsed;
  } catch (const std::logic_error &) {
    throw CollectionError(std::string("Malformed ") + column + " value '" +
                          *value + "'");
  }
}

std::optional<TimePoint> parseEpoch(const std::optional<std::string> &value,
                                    const char *column) {
  if (!value || value->empty())
    return std::nullopt;
  return TimePoint(std::chrono::seconds(parseCounter(value, column)));
}

} // namespace

CandidateCollector::CandidateCollector(IStatisticsSource &source,
                                       TargetScope scope, bool allowPartial)
    : source_(source), scope_(std::move(scope)), allowPartial_(allowPartial) {}

bool CandidateCollector::isSystemSchema(const std::string &schema) {
  return schema == "information_schema" || schema == "pg_catalog" ||
         schema == "pg_toast" || StringUtils::startsWith(schema, "pg_temp_") ||
         StringUtils::startsWith(schema, "pg_toast_temp_");
}

bool CandidateCollector::inScope(const std::string &schema,
                                 const std::string &table) const {
  if (isSystemSchema(schema))
    return false;
  if (!scope_.schemaPattern.empty() &&
      !StringUtils::globMatch(scope_.schemaPattern, schema))
    return false;
  if (scope_.tablePatterns.empty())
    return true;
  for (const auto &pattern : scope_.tablePatterns) {
    if (StringUtils::globMatch(pattern, table))
      return true;
  }
  return false;
}

Candidate CandidateCollector::toCandidate(const StatisticsRow &row) {
  if (row.schema.empty() || row.table.empty()) {
    throw CollectionError("Statistics row without a table name");
  }

  Candidate candidate;
  candidate.schema = row.schema;
  candidate.table = row.table;
  candidate.liveTuples = parseCounter(row.liveTuples, "n_live_tup");
  candidate.deadTuples = parseCounter(row.deadTuples, "n_dead_tup");
  candidate.inserts = parseCounter(row.inserts, "n_tup_ins");
  candidate.updates = parseCounter(row.updates, "n_tup_upd");
  candidate.deletes = parseCounter(row.deletes, "n_tup_del");
  candidate.modificationsSinceAnalyze =
      parseCounter(row.modificationsSinceAnalyze, "n_mod_since_analyze");
  candidate.sizeBytes = parseCounter(row.totalSizeBytes, "total_size");
  candidate.lastVacuum = parseEpoch(row.lastVacuum, "last_vacuum");
  candidate.lastAutovacuum = parseEpoch(row.lastAutovacuum, "last_autovacuum");
  candidate.lastAnalyze = parseEpoch(row.lastAnalyze, "last_analyze");
  candidate.lastAutoanalyze =
      parseEpoch(row.lastAutoanalyze, "last_autoanalyze");
  candidate.clampCounters();
  return candidate;
}

std::vector<Candidate> CandidateCollector::collect() {
  std::vector<StatisticsRow> rows = source_.fetchTableStatistics();
  std::vector<Candidate> candidates;
  candidates.reserve(rows.size());
  rejectedRows_ = 0;
  size_t outOfScope = 0;
  size_t empty = 0;

  for (const auto &row : rows) {
    if (!inScope(row.schema, row.table)) {
      ++outOfScope;
      continue;
    }

    Candidate candidate;
    try {
      candidate = toCandidate(row);
    } catch (const CollectionError &e) {
      if (!allowPartial_) {
        throw CollectionError("Table " + row.schema + "." + row.table + ": " +
                              e.what());
      }
      ++rejectedRows_;
      Logger::warning(LogCategory::MAINTENANCE, "CandidateCollector",
                      "Skipping " + row.schema + "." + row.table + ": " +
                          e.what());
      continue;
    }

    if (candidate.totalTuples() == 0) {
      ++empty;
      continue;
    }
    candidates.push_back(std::move(candidate));
  }

  Logger::info(LogCategory::MAINTENANCE, "CandidateCollector",
               "Collected " + std::to_string(candidates.size()) +
                   " candidates (" + std::to_string(outOfScope) +
                   " out of scope, " + std::to_string(empty) + " empty, " +
                   std::to_string(rejectedRows_) + " rejected)");
  return candidates;
}
