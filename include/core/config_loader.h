#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include "core/maintenance_config.h"
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

// Values given explicitly on the command line. Unset optionals fall through
// to the environment, then to the config file, then to built-in defaults.
struct CommandLineOverrides {
  std::optional<std::string> configPath;
  std::optional<std::string> host;
  std::optional<std::string> port;
  std::optional<std::string> database;
  std::optional<std::string> user;
  std::optional<std::string> operation;
  std::optional<std::string> schemaPattern;
  std::optional<std::string> tablePatterns;
  std::optional<size_t> parallelJobs;
  std::optional<double> deadThresholdPct;
  std::optional<double> staleDays;
  std::optional<double> churnThresholdPct;
  std::optional<double> bloatThresholdPct;
  std::optional<std::string> largeSize;
  std::optional<std::string> cancelPolicy;
  std::optional<std::string> outputFile;
  std::optional<std::string> logLevel;
  std::optional<std::string> logFile;
  std::optional<std::string> logMaxSize;
  std::optional<int> logBackups;
  std::optional<int> statementTimeoutMs;
  std::optional<int> lockTimeoutMs;
  bool dryRun = false;
  bool skipLarge = false;
  bool confirmDestructive = false;
  bool allowPartial = false;
  bool verbose = false;
};

using EnvLookup =
    std::function<std::optional<std::string>(const std::string &name)>;

class ConfigLoader {
public:
  static constexpr const char *DEFAULT_CONFIG_PATH = "config.json";

  // Resolves the final configuration once. Throws ConfigError on any invalid
  // value or on an explicitly requested config file that cannot be read.
  static MaintenanceConfig resolve(const CommandLineOverrides &overrides,
                                   const EnvLookup &env);

  static void applyFile(MaintenanceConfig &config, const json &document);
  static void applyEnvironment(MaintenanceConfig &config,
                               const EnvLookup &env);
  static void applyOverrides(MaintenanceConfig &config,
                             const CommandLineOverrides &overrides);
  static void validate(const MaintenanceConfig &config);

  static EnvLookup processEnvironment();

private:
  static std::optional<json> readConfigFile(const std::string &path,
                                            bool required);
  static double percentToRatio(double pct, const std::string &name);
  static bool parseBool(const std::string &value, const std::string &name);
};

#endif
