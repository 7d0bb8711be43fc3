#ifndef STATISTICS_SOURCE_H
#define STATISTICS_SOURCE_H

#include "core/database_config.h"
#include <optional>
#include <string>
#include <vector>

// One row of pg_stat_user_tables as text, exactly as the server returned it.
// Timestamps are epoch seconds. Null columns are empty optionals.
struct StatisticsRow {
  std::string schema;
  std::string table;
  std::optional<std::string> liveTuples;
  std::optional<std::string> deadTuples;
  std::optional<std::string> inserts;
  std::optional<std::string> updates;
  std::optional<std::string> deletes;
  std::optional<std::string> modificationsSinceAnalyze;
  std::optional<std::string> totalSizeBytes;
  std::optional<std::string> lastVacuum;
  std::optional<std::string> lastAutovacuum;
  std::optional<std::string> lastAnalyze;
  std::optional<std::string> lastAutoanalyze;
};

class IStatisticsSource {
public:
  virtual ~IStatisticsSource() = default;

  // Single read-only snapshot. Throws ConnectivityError when the server
  // cannot be reached and CollectionError when the query itself fails.
  virtual std::vector<StatisticsRow> fetchTableStatistics() = 0;
};

class PostgresStatisticsSource : public IStatisticsSource {
  DatabaseConfig database_;

public:
  explicit PostgresStatisticsSource(DatabaseConfig database);

  std::vector<StatisticsRow> fetchTableStatistics() override;
};

#endif
