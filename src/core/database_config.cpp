#include "core/database_config.h"
#include <cctype>

// libpq keyword/value strings need single quotes around values containing
// spaces or quotes, with backslash escapes inside.
std::string DatabaseConfig::escapeConnectionParam(const std::string &param) {
  if (param.empty()) {
    return "''";
  }

  bool needsQuoting = false;
  for (char c : param) {
    if (std::isspace(static_cast<unsigned char>(c)) || c == '\'' ||
        c == '\\') {
      needsQuoting = true;
      break;
    }
  }
  if (!needsQuoting) {
    return param;
  }

  std::string escaped = "'";
  for (char c : param) {
    if (c == '\'' || c == '\\') {
      escaped += '\\';
    }
    escaped += c;
  }
  escaped += "'";
  return escaped;
}

bool DatabaseConfig::isValidPort(const std::string &portStr) {
  if (portStr.empty() || portStr.length() > 5)
    return false;

  for (char c : portStr) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
  }

  int portNum = std::stoi(portStr);
  return portNum > 0 && portNum <= 65535;
}

std::string DatabaseConfig::connectionString() const {
  std::string conn = "host=" + escapeConnectionParam(host) +
                     " port=" + escapeConnectionParam(port) +
                     " dbname=" + escapeConnectionParam(database) +
                     " user=" + escapeConnectionParam(user);
  if (!password.empty()) {
    conn += " password=" + escapeConnectionParam(password);
  }
  conn += " connect_timeout=" + std::to_string(connectTimeoutSeconds);
  conn += " application_name=" + escapeConnectionParam(applicationName);
  return conn;
}

std::string DatabaseConfig::connectionStringForLogging() const {
  return "host=" + escapeConnectionParam(host) +
         " port=" + escapeConnectionParam(port) +
         " dbname=" + escapeConnectionParam(database) +
         " user=" + escapeConnectionParam(user) + " password=***";
}

std::string DatabaseConfig::displayName() const {
  return database + " on " + host + ":" + port + " as " + user;
}
