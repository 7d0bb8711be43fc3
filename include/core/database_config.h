#ifndef DATABASE_CONFIG_H
#define DATABASE_CONFIG_H

#include <string>

// Connection parameters of the database being maintained. Every worker opens
// its own session from connectionString().
struct DatabaseConfig {
  std::string host = "localhost";
  std::string port = "5432";
  std::string database = "postgres";
  std::string user = "postgres";
  std::string password;
  int connectTimeoutSeconds = 10;
  std::string applicationName = "pgmaint";

  std::string connectionString() const;
  std::string connectionStringForLogging() const;
  // "dbname on host:port as user", for reports.
  std::string displayName() const;

  static std::string escapeConnectionParam(const std::string &param);
  static bool isValidPort(const std::string &portStr);
};

#endif
