#include "maintenance/maintenance_executor.h"
#include "core/logger.h"
#include "maintenance/maintenance_statement.h"
#include <pqxx/pqxx>
#include <stdexcept>

PostgresMaintenanceExecutor::PostgresMaintenanceExecutor(
    DatabaseConfig database, int statementTimeoutMs, int lockTimeoutMs)
    : database_(std::move(database)), statementTimeoutMs_(statementTimeoutMs),
      lockTimeoutMs_(lockTimeoutMs) {}

void PostgresMaintenanceExecutor::registerConnection(pqxx::connection *conn) {
  std::lock_guard<std::mutex> lock(activeMutex_);
  active_.insert(conn);
}

void PostgresMaintenanceExecutor::unregisterConnection(
    pqxx::connection *conn) {
  std::lock_guard<std::mutex> lock(activeMutex_);
  active_.erase(conn);
}

void PostgresMaintenanceExecutor::execute(const Operation &op) {
  if (cancelled_.load()) {
    throw std::runtime_error("cancelled before the statement was sent");
  }

  try {
    pqxx::connection conn(database_.connectionString());
    if (!conn.is_open()) {
      throw std::runtime_error("Failed to connect to PostgreSQL");
    }

    registerConnection(&conn);
    struct Unregister {
      PostgresMaintenanceExecutor *self;
      pqxx::connection *conn;
      ~Unregister() { self->unregisterConnection(conn); }
    } unregister{this, &conn};

    if (cancelled_.load()) {
      throw std::runtime_error("cancelled before the statement was sent");
    }

    // VACUUM and REINDEX refuse to run inside a transaction block.
    pqxx::nontransaction txn(conn);
    if (statementTimeoutMs_ > 0) {
      txn.exec("SET statement_timeout = " +
               std::to_string(statementTimeoutMs_));
    }
    if (lockTimeoutMs_ > 0) {
      txn.exec("SET lock_timeout = " + std::to_string(lockTimeoutMs_));
    }

    std::string statement = buildMaintenanceStatement(op, txn);
    Logger::debug(LogCategory::DATABASE, "PostgresMaintenanceExecutor",
                  "Executing: " + statement);
    txn.exec(statement);
  } catch (const pqxx::broken_connection &e) {
    throw std::runtime_error("Connection failed: " + std::string(e.what()));
  } catch (const pqxx::sql_error &e) {
    std::string message = e.what();
    if (!e.sqlstate().empty()) {
      message += " [SQLSTATE " + e.sqlstate() + "]";
    }
    throw std::runtime_error(message);
  }
}

void PostgresMaintenanceExecutor::cancelAll() {
  cancelled_.store(true);
  std::lock_guard<std::mutex> lock(activeMutex_);
  for (auto *conn : active_) {
    try {
      conn->cancel_query();
    } catch (const std::exception &e) {
      Logger::warning(LogCategory::DATABASE, "PostgresMaintenanceExecutor",
                      "Cancel request failed: " + std::string(e.what()));
    }
  }
  Logger::warning(LogCategory::DATABASE, "PostgresMaintenanceExecutor",
                  "Sent cancel to " + std::to_string(active_.size()) +
                      " running statements");
}
