#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

// Statistics source unreachable. Fatal: no plan can be built.
class ConnectivityError : public std::runtime_error {
public:
  explicit ConnectivityError(const std::string &message)
      : std::runtime_error(message) {}
};

// Statistics query failed or returned unusable rows.
class CollectionError : public std::runtime_error {
public:
  explicit CollectionError(const std::string &message)
      : std::runtime_error(message) {}
};

// Invalid flag, environment value or config file entry.
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &message)
      : std::runtime_error(message) {}
};

#endif
