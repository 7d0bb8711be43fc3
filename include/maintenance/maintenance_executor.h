#ifndef MAINTENANCE_EXECUTOR_H
#define MAINTENANCE_EXECUTOR_H

#include "core/database_config.h"
#include "maintenance/operation.h"
#include <atomic>
#include <mutex>
#include <set>

namespace pqxx {
class connection;
}

class IMaintenanceExecutor {
public:
  virtual ~IMaintenanceExecutor() = default;

  // Runs the statement for op in its own session. Throws on any failure; the
  // caller records the message on the operation.
  virtual void execute(const Operation &op) = 0;

  // Asks the server to cancel every statement currently in flight. Later
  // execute() calls fail immediately.
  virtual void cancelAll() = 0;
};

class PostgresMaintenanceExecutor : public IMaintenanceExecutor {
public:
  PostgresMaintenanceExecutor(DatabaseConfig database, int statementTimeoutMs,
                              int lockTimeoutMs);

  void execute(const Operation &op) override;
  void cancelAll() override;

private:
  void registerConnection(pqxx::connection *conn);
  void unregisterConnection(pqxx::connection *conn);

  DatabaseConfig database_;
  int statementTimeoutMs_;
  int lockTimeoutMs_;
  std::atomic<bool> cancelled_{false};
  std::mutex activeMutex_;
  std::set<pqxx::connection *> active_;
};

#endif
