#include "maintenance/maintenance_statement.h"
#include <pqxx/pqxx>
#include <stdexcept>

std::string maintenanceStatementFor(OperationKind kind,
                                    const std::string &quotedTarget) {
  if (quotedTarget.empty()) {
    throw std::invalid_argument("Maintenance target cannot be empty");
  }
  switch (kind) {
  case OperationKind::Analyze:
    return "ANALYZE (VERBOSE) " + quotedTarget;
  case OperationKind::Vacuum:
    return "VACUUM (VERBOSE) " + quotedTarget;
  case OperationKind::VacuumFull:
    return "VACUUM (FULL, VERBOSE) " + quotedTarget;
  case OperationKind::Reindex:
    return "REINDEX (VERBOSE) TABLE " + quotedTarget;
  }
  throw std::invalid_argument("Unknown operation kind");
}

std::string buildMaintenanceStatement(const Operation &op,
                                      pqxx::transaction_base &txn) {
  const Candidate &target = op.target();
  if (target.schema.empty() || target.table.empty()) {
    throw std::invalid_argument("Operation has no schema or table name");
  }
  return maintenanceStatementFor(op.kind(), txn.quote_name(target.schema) +
                                                "." +
                                                txn.quote_name(target.table));
}
