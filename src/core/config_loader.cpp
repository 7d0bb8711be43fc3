#include "core/config_loader.h"
#include "core/errors.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include <cstdlib>
#include <fstream>
#include <type_traits>

namespace {

int64_t sizeFromJson(const json &value) {
  if (value.is_number_integer()) {
    return value.get<int64_t>();
  }
  if (value.is_string()) {
    return StringUtils::parseSizeBytes(value.get<std::string>());
  }
  throw ConfigError("large_table_size must be a byte count or a size string");
}

std::vector<std::string> patternsFromJson(const json &value) {
  if (value.is_array()) {
    std::vector<std::string> patterns;
    for (const auto &item : value) {
      std::string pattern = StringUtils::trim(item.get<std::string>());
      if (!pattern.empty())
        patterns.push_back(pattern);
    }
    return patterns;
  }
  return StringUtils::splitAndTrim(value.get<std::string>(), ',');
}

template <typename T>
T parseNumber(const std::string &text, const std::string &name) {
  try {
    size_t consumed = 0;
    T value;
    if constexpr (std::is_floating_point_v<T>) {
      value = static_cast<T>(std::stod(text, &consumed));
    } else {
      value = static_cast<T>(std::stoll(text, &consumed));
    }
    if (consumed != text.size()) {
      throw ConfigError("Invalid numeric value for " + name + ": " + text);
    }
    return value;
  } catch (const std::logic_error &) {
    throw ConfigError("Invalid numeric value for " + name + ": " + text);
  }
}

} // namespace

double ConfigLoader::percentToRatio(double pct, const std::string &name) {
  if (!(pct > 0.0 && pct <= 100.0)) {
    throw ConfigError(name + " must be a percentage in (0, 100], got " +
                      std::to_string(pct));
  }
  return pct / 100.0;
}

bool ConfigLoader::parseBool(const std::string &value,
                             const std::string &name) {
  std::string v = StringUtils::toLower(StringUtils::trim(value));
  if (v == "1" || v == "true" || v == "yes" || v == "on")
    return true;
  if (v == "0" || v == "false" || v == "no" || v == "off" || v.empty())
    return false;
  throw ConfigError("Invalid boolean value for " + name + ": " + value);
}

std::optional<json> ConfigLoader::readConfigFile(const std::string &path,
                                                 bool required) {
  std::ifstream configFile(path);
  if (!configFile.is_open()) {
    if (required) {
      throw ConfigError("Could not open config file '" + path + "'");
    }
    Logger::debug(LogCategory::CONFIG, "ConfigLoader",
                  "No config file at '" + path +
                      "', using environment and defaults");
    return std::nullopt;
  }

  try {
    json document;
    configFile >> document;
    return document;
  } catch (const json::exception &e) {
    throw ConfigError("Error parsing config file '" + path +
                      "': " + std::string(e.what()));
  }
}

// Expected layout, every key optional:
//   { "database": { "postgres": { "host", "port", "database", "user",
//                                 "password" } },
//     "maintenance": { "operation", "schema", "tables", "parallel_jobs",
//                      "dead_tuple_threshold_pct", ... } }
void ConfigLoader::applyFile(MaintenanceConfig &config, const json &document) {
  try {
    if (document.contains("database") &&
        document["database"].contains("postgres")) {
      const auto &pg = document["database"]["postgres"];
      if (pg.contains("host"))
        config.database.host = pg["host"].get<std::string>();
      if (pg.contains("port")) {
        config.database.port = pg["port"].is_number()
                                   ? std::to_string(pg["port"].get<int>())
                                   : pg["port"].get<std::string>();
      }
      if (pg.contains("database"))
        config.database.database = pg["database"].get<std::string>();
      if (pg.contains("user"))
        config.database.user = pg["user"].get<std::string>();
      if (pg.contains("password"))
        config.database.password = pg["password"].get<std::string>();
      if (pg.contains("connect_timeout"))
        config.database.connectTimeoutSeconds =
            pg["connect_timeout"].get<int>();
    }

    if (document.contains("schedule")) {
      std::vector<ScheduleEntry> entries;
      for (const auto &item : document["schedule"]) {
        ScheduleEntry entry;
        entry.cronExpression = item.at("cron").get<std::string>();
        entry.arguments = item.value("args", std::string());
        if (StringUtils::splitAndTrim(entry.cronExpression, ' ').size() != 5) {
          throw ConfigError("schedule entry needs five cron fields: " +
                            entry.cronExpression);
        }
        entries.push_back(entry);
      }
      config.scheduleEntries = entries;
    }

    if (!document.contains("maintenance")) {
      return;
    }
    const auto &m = document["maintenance"];

    if (m.contains("operation")) {
      std::string op = m["operation"].get<std::string>();
      if (!parseOperationMode(op, config.mode))
        throw ConfigError("Invalid operation in config file: " + op);
    }
    if (m.contains("schema"))
      config.scope.schemaPattern = m["schema"].get<std::string>();
    if (m.contains("tables"))
      config.scope.tablePatterns = patternsFromJson(m["tables"]);
    if (m.contains("parallel_jobs"))
      config.parallelJobs = m["parallel_jobs"].get<size_t>();
    if (m.contains("dry_run"))
      config.dryRun = m["dry_run"].get<bool>();
    if (m.contains("dead_tuple_threshold_pct"))
      config.thresholds.deadTupleRatio = percentToRatio(
          m["dead_tuple_threshold_pct"].get<double>(), "dead_tuple_threshold_pct");
    if (m.contains("stale_days"))
      config.thresholds.staleDays = m["stale_days"].get<double>();
    if (m.contains("churn_threshold_pct"))
      config.thresholds.modificationRatio = percentToRatio(
          m["churn_threshold_pct"].get<double>(), "churn_threshold_pct");
    if (m.contains("bloat_threshold_pct"))
      config.thresholds.reindexBloatRatio = percentToRatio(
          m["bloat_threshold_pct"].get<double>(), "bloat_threshold_pct");
    if (m.contains("never_analyzed_min_live_rows"))
      config.thresholds.neverAnalyzedMinLiveRows =
          m["never_analyzed_min_live_rows"].get<int64_t>();
    if (m.contains("stale_min_modifications"))
      config.thresholds.staleMinModifications =
          m["stale_min_modifications"].get<int64_t>();
    if (m.contains("skip_large_tables"))
      config.safety.skipLarge = m["skip_large_tables"].get<bool>();
    if (m.contains("large_table_size"))
      config.safety.largeTableSizeBytes = sizeFromJson(m["large_table_size"]);
    if (m.contains("confirm_destructive"))
      config.safety.confirmDestructive = m["confirm_destructive"].get<bool>();
    if (m.contains("cancel_policy")) {
      std::string policy = m["cancel_policy"].get<std::string>();
      if (!parseCancelPolicy(policy, config.cancelPolicy))
        throw ConfigError("Invalid cancel_policy in config file: " + policy);
    }
    if (m.contains("allow_partial_collection"))
      config.allowPartialCollection =
          m["allow_partial_collection"].get<bool>();
    if (m.contains("statement_timeout_ms"))
      config.statementTimeoutMs = m["statement_timeout_ms"].get<int>();
    if (m.contains("lock_timeout_ms"))
      config.lockTimeoutMs = m["lock_timeout_ms"].get<int>();
    if (m.contains("output_file"))
      config.outputFile = m["output_file"].get<std::string>();
    if (m.contains("log_level")) {
      std::string level = m["log_level"].get<std::string>();
      if (!Logger::parseLogLevel(level, config.logLevel))
        throw ConfigError("Invalid log_level in config file: " + level);
    }
    if (m.contains("log_file"))
      config.logFile = m["log_file"].get<std::string>();
    if (m.contains("log_max_size"))
      config.logRotation.maxBytes = sizeFromJson(m["log_max_size"]);
    if (m.contains("log_backups"))
      config.logRotation.backups = m["log_backups"].get<int>();
  } catch (const json::exception &e) {
    throw ConfigError("Invalid value in config file: " +
                      std::string(e.what()));
  } catch (const std::invalid_argument &e) {
    throw ConfigError("Invalid value in config file: " +
                      std::string(e.what()));
  }
}

// Standard libpq variables for the connection, PGMAINT_* for the rest.
// Destructive confirmation is never read from the environment.
void ConfigLoader::applyEnvironment(MaintenanceConfig &config,
                                    const EnvLookup &env) {
  if (auto v = env("PGHOST"); v && !v->empty())
    config.database.host = *v;
  if (auto v = env("PGPORT"); v && !v->empty())
    config.database.port = *v;
  if (auto v = env("PGDATABASE"); v && !v->empty())
    config.database.database = *v;
  if (auto v = env("PGUSER"); v && !v->empty())
    config.database.user = *v;
  if (auto v = env("PGPASSWORD"))
    config.database.password = *v;

  if (auto v = env("PGMAINT_OPERATION"); v && !v->empty()) {
    if (!parseOperationMode(*v, config.mode))
      throw ConfigError("Invalid PGMAINT_OPERATION: " + *v);
  }
  if (auto v = env("PGMAINT_SCHEMA"); v && !v->empty())
    config.scope.schemaPattern = *v;
  if (auto v = env("PGMAINT_TABLES"); v && !v->empty())
    config.scope.tablePatterns = StringUtils::splitAndTrim(*v, ',');
  if (auto v = env("PGMAINT_PARALLEL_JOBS"); v && !v->empty())
    config.parallelJobs = parseNumber<size_t>(*v, "PGMAINT_PARALLEL_JOBS");
  if (auto v = env("PGMAINT_DEAD_THRESHOLD"); v && !v->empty())
    config.thresholds.deadTupleRatio = percentToRatio(
        parseNumber<double>(*v, "PGMAINT_DEAD_THRESHOLD"),
        "PGMAINT_DEAD_THRESHOLD");
  if (auto v = env("PGMAINT_STALE_DAYS"); v && !v->empty())
    config.thresholds.staleDays = parseNumber<double>(*v, "PGMAINT_STALE_DAYS");
  if (auto v = env("PGMAINT_CHURN_THRESHOLD"); v && !v->empty())
    config.thresholds.modificationRatio = percentToRatio(
        parseNumber<double>(*v, "PGMAINT_CHURN_THRESHOLD"),
        "PGMAINT_CHURN_THRESHOLD");
  if (auto v = env("PGMAINT_BLOAT_THRESHOLD"); v && !v->empty())
    config.thresholds.reindexBloatRatio = percentToRatio(
        parseNumber<double>(*v, "PGMAINT_BLOAT_THRESHOLD"),
        "PGMAINT_BLOAT_THRESHOLD");
  if (auto v = env("PGMAINT_SKIP_LARGE"); v && !v->empty())
    config.safety.skipLarge = parseBool(*v, "PGMAINT_SKIP_LARGE");
  if (auto v = env("PGMAINT_LARGE_SIZE"); v && !v->empty()) {
    try {
      config.safety.largeTableSizeBytes = StringUtils::parseSizeBytes(*v);
    } catch (const std::invalid_argument &e) {
      throw ConfigError("Invalid PGMAINT_LARGE_SIZE: " + std::string(e.what()));
    }
  }
  if (auto v = env("PGMAINT_CANCEL_POLICY"); v && !v->empty()) {
    if (!parseCancelPolicy(*v, config.cancelPolicy))
      throw ConfigError("Invalid PGMAINT_CANCEL_POLICY: " + *v);
  }
  if (auto v = env("PGMAINT_STATEMENT_TIMEOUT_MS"); v && !v->empty())
    config.statementTimeoutMs =
        parseNumber<int>(*v, "PGMAINT_STATEMENT_TIMEOUT_MS");
  if (auto v = env("PGMAINT_LOCK_TIMEOUT_MS"); v && !v->empty())
    config.lockTimeoutMs = parseNumber<int>(*v, "PGMAINT_LOCK_TIMEOUT_MS");
  if (auto v = env("PGMAINT_OUTPUT"); v && !v->empty())
    config.outputFile = *v;
  if (auto v = env("PGMAINT_LOG_LEVEL"); v && !v->empty()) {
    if (!Logger::parseLogLevel(*v, config.logLevel))
      throw ConfigError("Invalid PGMAINT_LOG_LEVEL: " + *v);
  }
  if (auto v = env("PGMAINT_LOG_FILE"); v && !v->empty())
    config.logFile = *v;
  if (auto v = env("PGMAINT_LOG_MAX_SIZE"); v && !v->empty()) {
    try {
      config.logRotation.maxBytes = StringUtils::parseSizeBytes(*v);
    } catch (const std::invalid_argument &e) {
      throw ConfigError("Invalid PGMAINT_LOG_MAX_SIZE: " +
                        std::string(e.what()));
    }
  }
  if (auto v = env("PGMAINT_LOG_BACKUPS"); v && !v->empty())
    config.logRotation.backups = parseNumber<int>(*v, "PGMAINT_LOG_BACKUPS");
}

void ConfigLoader::applyOverrides(MaintenanceConfig &config,
                                  const CommandLineOverrides &o) {
  if (o.host)
    config.database.host = *o.host;
  if (o.port)
    config.database.port = *o.port;
  if (o.database)
    config.database.database = *o.database;
  if (o.user)
    config.database.user = *o.user;

  if (o.operation && !parseOperationMode(*o.operation, config.mode))
    throw ConfigError("Invalid operation: " + *o.operation);
  if (o.schemaPattern)
    config.scope.schemaPattern = *o.schemaPattern;
  if (o.tablePatterns)
    config.scope.tablePatterns = StringUtils::splitAndTrim(*o.tablePatterns, ',');
  if (o.parallelJobs)
    config.parallelJobs = *o.parallelJobs;
  if (o.deadThresholdPct)
    config.thresholds.deadTupleRatio =
        percentToRatio(*o.deadThresholdPct, "--dead-threshold");
  if (o.staleDays)
    config.thresholds.staleDays = *o.staleDays;
  if (o.churnThresholdPct)
    config.thresholds.modificationRatio =
        percentToRatio(*o.churnThresholdPct, "--churn-threshold");
  if (o.bloatThresholdPct)
    config.thresholds.reindexBloatRatio =
        percentToRatio(*o.bloatThresholdPct, "--bloat-threshold");
  if (o.largeSize) {
    try {
      config.safety.largeTableSizeBytes = StringUtils::parseSizeBytes(*o.largeSize);
    } catch (const std::invalid_argument &e) {
      throw ConfigError("Invalid --large-size: " + std::string(e.what()));
    }
  }
  if (o.cancelPolicy && !parseCancelPolicy(*o.cancelPolicy, config.cancelPolicy))
    throw ConfigError("Invalid --cancel-policy: " + *o.cancelPolicy);
  if (o.outputFile)
    config.outputFile = *o.outputFile;
  if (o.logLevel && !Logger::parseLogLevel(*o.logLevel, config.logLevel))
    throw ConfigError("Invalid --log-level: " + *o.logLevel);
  if (o.logFile)
    config.logFile = *o.logFile;
  if (o.logMaxSize) {
    try {
      config.logRotation.maxBytes = StringUtils::parseSizeBytes(*o.logMaxSize);
    } catch (const std::invalid_argument &e) {
      throw ConfigError("Invalid --log-max-size: " + std::string(e.what()));
    }
  }
  if (o.logBackups)
    config.logRotation.backups = *o.logBackups;
  if (o.statementTimeoutMs)
    config.statementTimeoutMs = *o.statementTimeoutMs;
  if (o.lockTimeoutMs)
    config.lockTimeoutMs = *o.lockTimeoutMs;

  if (o.dryRun)
    config.dryRun = true;
  if (o.skipLarge)
    config.safety.skipLarge = true;
  if (o.confirmDestructive)
    config.safety.confirmDestructive = true;
  if (o.allowPartial)
    config.allowPartialCollection = true;
  if (o.verbose)
    config.logLevel = LogLevel::DEBUG;
}

void ConfigLoader::validate(const MaintenanceConfig &config) {
  if (config.parallelJobs < MaintenanceConfig::MIN_PARALLEL_JOBS ||
      config.parallelJobs > MaintenanceConfig::MAX_PARALLEL_JOBS) {
    throw ConfigError(
        "parallel jobs must be between " +
        std::to_string(MaintenanceConfig::MIN_PARALLEL_JOBS) + " and " +
        std::to_string(MaintenanceConfig::MAX_PARALLEL_JOBS) + ", got " +
        std::to_string(config.parallelJobs));
  }
  if (!DatabaseConfig::isValidPort(config.database.port)) {
    throw ConfigError("Invalid port number: " + config.database.port);
  }
  if (config.database.host.empty() || config.database.database.empty() ||
      config.database.user.empty()) {
    throw ConfigError("host, database and user must not be empty");
  }
  if (!(config.thresholds.staleDays > 0.0)) {
    throw ConfigError("stale days must be positive");
  }
  if (config.thresholds.neverAnalyzedMinLiveRows < 0 ||
      config.thresholds.staleMinModifications < 0) {
    throw ConfigError("row floors must not be negative");
  }
  if (config.safety.largeTableSizeBytes <= 0) {
    throw ConfigError("large table size must be positive");
  }
  if (config.statementTimeoutMs < 0 || config.lockTimeoutMs < 0) {
    throw ConfigError("timeouts must not be negative");
  }
  if (config.logRotation.maxBytes <= 0) {
    throw ConfigError("log max size must be positive");
  }
  if (config.logRotation.backups < 0 ||
      config.logRotation.backups > LogRotation::MAX_BACKUPS) {
    throw ConfigError("log backups must be between 0 and " +
                      std::to_string(LogRotation::MAX_BACKUPS) + ", got " +
                      std::to_string(config.logRotation.backups));
  }
  if (config.database.connectTimeoutSeconds <= 0) {
    throw ConfigError("connect timeout must be positive");
  }
}

MaintenanceConfig ConfigLoader::resolve(const CommandLineOverrides &overrides,
                                        const EnvLookup &env) {
  MaintenanceConfig config;

  std::string configPath = DEFAULT_CONFIG_PATH;
  bool required = false;
  if (overrides.configPath) {
    configPath = *overrides.configPath;
    required = true;
  } else if (auto v = env("PGMAINT_CONFIG"); v && !v->empty()) {
    configPath = *v;
    required = true;
  }

  if (auto document = readConfigFile(configPath, required)) {
    applyFile(config, *document);
    Logger::debug(LogCategory::CONFIG, "ConfigLoader",
                  "Loaded config file '" + configPath + "'");
  }

  applyEnvironment(config, env);
  applyOverrides(config, overrides);
  validate(config);

  if (config.database.password.empty()) {
    Logger::debug(LogCategory::CONFIG, "ConfigLoader",
                  "No password configured, relying on libpq defaults "
                  "(.pgpass, trust or peer authentication)");
  }
  return config;
}

EnvLookup ConfigLoader::processEnvironment() {
  return [](const std::string &name) -> std::optional<std::string> {
    const char *value = std::getenv(name.c_str());
    if (!value)
      return std::nullopt;
    return std::string(value);
  };
}
