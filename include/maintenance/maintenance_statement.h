#ifndef MAINTENANCE_STATEMENT_H
#define MAINTENANCE_STATEMENT_H

#include "maintenance/operation.h"
#include <string>

namespace pqxx {
class transaction_base;
}

// SQL text for one operation against an already quoted target.
std::string maintenanceStatementFor(OperationKind kind,
                                    const std::string &quotedTarget);

// Quotes schema and table through the session's quote_name and builds the
// statement. This is the only way executed statements get their object names.
std::string buildMaintenanceStatement(const Operation &op,
                                      pqxx::transaction_base &txn);

#endif
