#include "core/config_loader.h"
#include "core/errors.h"
#include "core/logger.h"
#include "maintenance/crontab_sync.h"
#include "maintenance/maintenance_command.h"
#include "maintenance/maintenance_executor.h"
#include "maintenance/safety_filter.h"
#include "maintenance/statistics_source.h"
#include <CLI/CLI.hpp>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <unistd.h>

namespace {
std::atomic<bool> g_shutdownRequested{false};

void signalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_shutdownRequested.store(true);
  }
}

void cleanupLogger() { Logger::shutdown(); }

std::string executablePath(const char *argv0) {
  std::error_code ec;
  auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (!ec)
    return self.string();
  auto absolute = std::filesystem::absolute(argv0, ec);
  return ec ? std::string(argv0) : absolute.string();
}

int runSchedule(const std::string &action, const MaintenanceConfig &config,
                const CommandLineOverrides &overrides, const char *argv0,
                const std::string &cronLog, const std::string &cronBackup) {
  std::string command = executablePath(argv0);
  if (overrides.configPath) {
    std::error_code ec;
    auto configPath = std::filesystem::absolute(*overrides.configPath, ec);
    command += " --config " +
               CrontabSync::shellQuote(ec ? *overrides.configPath
                                          : configPath.string());
  }

  SystemCrontabStore store;
  CrontabSync sync(store, command, cronLog, cronBackup);

  try {
    if (action == "install") {
      bool changed = sync.install(config.scheduleEntries);
      std::cout << (changed ? "pgmaint cron entries installed"
                            : "pgmaint cron entries already up to date")
                << std::endl;
    } else if (action == "remove") {
      bool changed = sync.remove();
      std::cout << (changed ? "pgmaint cron entries removed"
                            : "No pgmaint cron entries installed")
                << std::endl;
    } else {
      auto lines = sync.status();
      if (lines.empty()) {
        std::cout << "No pgmaint cron entries installed" << std::endl;
      } else {
        std::cout << "Installed pgmaint cron entries:" << std::endl;
        for (const auto &line : lines)
          std::cout << "  " << line << std::endl;
      }
    }
  } catch (const std::exception &e) {
    Logger::error(LogCategory::SYSTEM, "main",
                  "Schedule " + action + " failed: " + std::string(e.what()));
    std::cerr << "Schedule error: " << e.what() << std::endl;
    return EXIT_SCHEDULE_ERROR;
  }
  return EXIT_SUCCESS_CODE;
}
} // namespace

int main(int argc, char **argv) {
  CLI::App app{"Automated PostgreSQL maintenance scheduler"};
  app.fallthrough();

  CommandLineOverrides overrides;
  std::string operation, schema, tables, largeSize, cancelPolicy, output;
  std::string host, port, dbname, user, configPath, logLevel, logFile;
  size_t parallel = MaintenanceConfig::DEFAULT_PARALLEL_JOBS;
  double deadThreshold = 0, staleDays = 0, churnThreshold = 0,
         bloatThreshold = 0;

  auto *operationOpt =
      app.add_option("-o,--operation", operation,
                     "vacuum, analyze, auto, full-vacuum or reindex "
                     "(default: analyze)");
  auto *schemaOpt =
      app.add_option("-s,--schema", schema, "Schema name or glob pattern");
  auto *tablesOpt = app.add_option("-t,--tables", tables,
                                   "Comma-separated table glob patterns");
  auto *parallelOpt = app.add_option("-j,--parallel", parallel,
                                     "Number of concurrent operations");
  app.add_flag("-n,--dry-run", overrides.dryRun,
               "Show the plan without executing anything");
  auto *deadOpt = app.add_option("--dead-threshold", deadThreshold,
                                 "Dead tuple percentage for VACUUM (default 20)");
  auto *staleOpt = app.add_option("--stale-days", staleDays,
                                  "Days before statistics count as stale "
                                  "(default 7)");
  auto *churnOpt = app.add_option("--churn-threshold", churnThreshold,
                                  "Modified rows as percentage of live rows "
                                  "for ANALYZE (default 10)");
  auto *bloatOpt = app.add_option("--bloat-threshold", bloatThreshold,
                                  "Bloat percentage for REINDEX (default 30)");
  app.add_flag("--skip-large", overrides.skipLarge,
               "Skip tables at or above --large-size");
  auto *largeOpt = app.add_option("--large-size", largeSize,
                                  "Large table threshold, e.g. 10GB");
  auto *outputOpt =
      app.add_option("--output", output, "Write the run report to FILE");
  app.add_flag("-y,--yes,--confirm-destructive", overrides.confirmDestructive,
               "Run VACUUM FULL and REINDEX without asking");
  auto *cancelOpt = app.add_option("--cancel-policy", cancelPolicy,
                                   "On interrupt: finish or abort running "
                                   "statements");
  app.add_flag("--allow-partial", overrides.allowPartial,
               "Skip unreadable statistics rows instead of failing");
  auto *hostOpt = app.add_option("--host", host, "Database host");
  auto *portOpt = app.add_option("--port", port, "Database port");
  auto *dbnameOpt = app.add_option("--dbname", dbname, "Database name");
  auto *userOpt = app.add_option("--user", user, "Database user");
  auto *configOpt =
      app.add_option("--config", configPath, "Path to config.json");
  auto *logLevelOpt = app.add_option("--log-level", logLevel,
                                     "DEBUG, INFO, WARNING, ERROR or CRITICAL");
  auto *logFileOpt = app.add_option("--log-file", logFile, "Also log to FILE");
  std::string logMaxSize;
  int logBackups = LogRotation::DEFAULT_BACKUPS;
  auto *logMaxSizeOpt = app.add_option(
      "--log-max-size", logMaxSize, "Rotate the log file at SIZE (default 10MB)");
  auto *logBackupsOpt = app.add_option(
      "--log-backups", logBackups, "Rotated log files to keep (default 5)");
  app.add_flag("-v,--verbose", overrides.verbose, "Debug logging");

  std::string scheduleAction;
  std::string cronLog = "pgmaint-cron.log";
  std::string cronBackup = "pgmaint-crontab.bak";
  auto *schedule =
      app.add_subcommand("schedule", "Manage the pgmaint crontab entries");
  schedule->add_option("action", scheduleAction, "install, remove or status")
      ->required()
      ->check(CLI::IsMember({"install", "remove", "status"}));
  schedule->add_option("--cron-log", cronLog,
                       "File the scheduled runs append their output to");
  schedule->add_option("--cron-backup", cronBackup,
                       "Where the previous crontab is saved before a change");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &error) {
    int code = app.exit(error);
    return code == 0 ? EXIT_SUCCESS_CODE : EXIT_CONFIG_ERROR;
  }

  if (operationOpt->count())
    overrides.operation = operation;
  if (schemaOpt->count())
    overrides.schemaPattern = schema;
  if (tablesOpt->count())
    overrides.tablePatterns = tables;
  if (parallelOpt->count())
    overrides.parallelJobs = parallel;
  if (deadOpt->count())
    overrides.deadThresholdPct = deadThreshold;
  if (staleOpt->count())
    overrides.staleDays = staleDays;
  if (churnOpt->count())
    overrides.churnThresholdPct = churnThreshold;
  if (bloatOpt->count())
    overrides.bloatThresholdPct = bloatThreshold;
  if (largeOpt->count())
    overrides.largeSize = largeSize;
  if (outputOpt->count())
    overrides.outputFile = output;
  if (cancelOpt->count())
    overrides.cancelPolicy = cancelPolicy;
  if (hostOpt->count())
    overrides.host = host;
  if (portOpt->count())
    overrides.port = port;
  if (dbnameOpt->count())
    overrides.database = dbname;
  if (userOpt->count())
    overrides.user = user;
  if (configOpt->count())
    overrides.configPath = configPath;
  if (logLevelOpt->count())
    overrides.logLevel = logLevel;
  if (logFileOpt->count())
    overrides.logFile = logFile;
  if (logMaxSizeOpt->count())
    overrides.logMaxSize = logMaxSize;
  if (logBackupsOpt->count())
    overrides.logBackups = logBackups;

  Logger::initialize(overrides.verbose ? LogLevel::DEBUG : LogLevel::INFO);

  MaintenanceConfig config;
  try {
    config = ConfigLoader::resolve(overrides, ConfigLoader::processEnvironment());
  } catch (const ConfigError &e) {
    Logger::error(LogCategory::CONFIG, "main", e.what());
    std::cerr << "Configuration error: " << e.what() << std::endl;
    cleanupLogger();
    return EXIT_CONFIG_ERROR;
  }

  Logger::initialize(config.logLevel, config.logFile, config.logRotation);

  if (schedule->parsed()) {
    std::error_code ec;
    auto cronLogPath = std::filesystem::absolute(cronLog, ec);
    std::string cronLogArg = ec ? cronLog : cronLogPath.string();
    auto cronBackupPath = std::filesystem::absolute(cronBackup, ec);
    int code = runSchedule(scheduleAction, config, overrides, argv[0],
                           cronLogArg,
                           ec ? cronBackup : cronBackupPath.string());
    cleanupLogger();
    return code;
  }

  if (std::signal(SIGINT, signalHandler) == SIG_ERR ||
      std::signal(SIGTERM, signalHandler) == SIG_ERR) {
    Logger::error(LogCategory::SYSTEM, "main",
                  "Failed to register signal handlers");
    cleanupLogger();
    return EXIT_CONFIG_ERROR;
  }

  PostgresStatisticsSource source(config.database);
  PostgresMaintenanceExecutor executor(
      config.database, config.statementTimeoutMs, config.lockTimeoutMs);

  std::unique_ptr<StreamConfirmationPrompt> prompt;
  if (isatty(STDIN_FILENO)) {
    prompt = std::make_unique<StreamConfirmationPrompt>();
  }

  int code = runMaintenanceCommand(
      config, source, executor, prompt.get(),
      [] { return g_shutdownRequested.load(); }, std::cout, std::cerr);
  cleanupLogger();
  return code;
}
