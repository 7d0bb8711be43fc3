#include "maintenance/statistics_source.h"
#include "core/errors.h"
#include "core/logger.h"
#include <memory>
#include <pqxx/pqxx>

namespace {

// System schemas are excluded server side; user patterns are matched by the
// collector so no user text reaches this statement.
const char *const TABLE_STATISTICS_QUERY = R"(
  SELECT
    schemaname,
    relname,
    n_live_tup,
    n_dead_tup,
    n_tup_ins,
    n_tup_upd,
    n_tup_del,
    n_mod_since_analyze,
    pg_total_relation_size(relid) AS total_size,
    EXTRACT(EPOCH FROM last_vacuum)::bigint AS last_vacuum,
    EXTRACT(EPOCH FROM last_autovacuum)::bigint AS last_autovacuum,
    EXTRACT(EPOCH FROM last_analyze)::bigint AS last_analyze,
    EXTRACT(EPOCH FROM last_autoanalyze)::bigint AS last_autoanalyze
  FROM pg_stat_user_tables
  WHERE schemaname NOT IN ('information_schema', 'pg_catalog', 'pg_toast')
  ORDER BY schemaname, relname
)";

std::optional<std::string> optionalField(const pqxx::field &field) {
  if (field.is_null())
    return std::nullopt;
  return std::string(field.c_str());
}

} // namespace

PostgresStatisticsSource::PostgresStatisticsSource(DatabaseConfig database)
    : database_(std::move(database)) {}

std::vector<StatisticsRow> PostgresStatisticsSource::fetchTableStatistics() {
  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(database_.connectionString());
  } catch (const pqxx::broken_connection &e) {
    throw ConnectivityError("Cannot connect to " +
                            database_.connectionStringForLogging() + ": " +
                            std::string(e.what()));
  } catch (const pqxx::failure &e) {
    throw ConnectivityError("Cannot open a session on " +
                            database_.connectionStringForLogging() + ": " +
                            std::string(e.what()));
  }
  if (!conn->is_open()) {
    throw ConnectivityError("Connection to " +
                            database_.connectionStringForLogging() +
                            " is not open");
  }

  Logger::debug(LogCategory::DATABASE, "PostgresStatisticsSource",
                "Connected to " + database_.connectionStringForLogging());

  std::vector<StatisticsRow> rows;
  try {
    pqxx::read_transaction txn(*conn);
    pqxx::result result = txn.exec(TABLE_STATISTICS_QUERY);
    txn.commit();

    rows.reserve(result.size());
    for (const auto &row : result) {
      StatisticsRow stats;
      stats.schema = row[0].c_str();
      stats.table = row[1].c_str();
      stats.liveTuples = optionalField(row[2]);
      stats.deadTuples = optionalField(row[3]);
      stats.inserts = optionalField(row[4]);
      stats.updates = optionalField(row[5]);
      stats.deletes = optionalField(row[6]);
      stats.modificationsSinceAnalyze = optionalField(row[7]);
      stats.totalSizeBytes = optionalField(row[8]);
      stats.lastVacuum = optionalField(row[9]);
      stats.lastAutovacuum = optionalField(row[10]);
      stats.lastAnalyze = optionalField(row[11]);
      stats.lastAutoanalyze = optionalField(row[12]);
      rows.push_back(std::move(stats));
    }
  } catch (const pqxx::broken_connection &e) {
    throw ConnectivityError("Connection lost while reading statistics: " +
                            std::string(e.what()));
  } catch (const pqxx::sql_error &e) {
    throw CollectionError("Statistics query failed: " + std::string(e.what()));
  } catch (const pqxx::failure &e) {
    throw CollectionError("Reading statistics failed: " +
                          std::string(e.what()));
  }

  Logger::info(LogCategory::DATABASE, "PostgresStatisticsSource",
               "Fetched statistics for " + std::to_string(rows.size()) +
                   " tables");
  return rows;
}
