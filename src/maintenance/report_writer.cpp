#include "maintenance/report_writer.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace {
std::string percent(double value) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1) << value << "%";
  return oss.str();
}
} // namespace

json ReportWriter::toJson(const RunSummary &summary) {
  const RunContext &context = summary.context;
  json report;
  report["run"] = {{"mode", context.mode},
                   {"database", context.database},
                   {"dry_run", summary.dryRun},
                   {"parallel_jobs", context.parallelJobs},
                   {"dead_tuple_threshold_pct", context.deadTupleThresholdPct},
                   {"stale_days", context.staleDays},
                   {"churn_threshold_pct", context.churnThresholdPct},
                   {"bloat_threshold_pct", context.bloatThresholdPct},
                   {"skip_large", context.skipLarge},
                   {"large_table_size_bytes", context.largeTableSizeBytes}};
  report["started_at"] = summary.startedAt;
  report["dry_run"] = summary.dryRun;
  report["elapsed_ms"] = summary.elapsedMs;
  report["counts"] = {{"total", summary.total()},
                      {"succeeded", summary.succeeded},
                      {"failed", summary.failed},
                      {"skipped", summary.skipped},
                      {"dry_run", summary.dryRunReported}};

  json operations = json::array();
  for (const auto &record : summary.records) {
    json item;
    item["rank"] = record.rank;
    item["target"] = record.target;
    item["kind"] = operationKindToString(record.kind);
    item["tier"] = record.tier;
    item["reason"] = record.reason;
    item["state"] = operationStateToString(record.state);
    item["duration_ms"] = record.durationMs;
    item["error"] = record.errorText;
    item["note"] = record.note;
    operations.push_back(item);
  }
  report["operations"] = operations;
  return report;
}

void ReportWriter::writeText(const RunSummary &summary, std::ostream &out) {
  const std::vector<std::string> headers = {"#",      "TARGET",   "KIND",
                                            "STATE",  "DURATION", "REASON",
                                            "DETAIL"};
  std::vector<std::vector<std::string>> rows;
  for (const auto &record : summary.records) {
    std::string detail =
        !record.errorText.empty() ? record.errorText : record.note;
    rows.push_back({record.rank == 0 ? "-" : std::to_string(record.rank),
                    record.target, operationKindToString(record.kind),
                    operationStateToString(record.state),
                    TimeUtils::formatDurationMs(record.durationMs),
                    record.reason, detail});
  }

  std::vector<size_t> widths(headers.size());
  for (size_t i = 0; i < headers.size(); ++i) {
    widths[i] = headers[i].size();
    for (const auto &row : rows)
      widths[i] = std::max(widths[i], row[i].size());
  }

  auto printRow = [&](const std::vector<std::string> &cells) {
    for (size_t i = 0; i < cells.size(); ++i) {
      if (i + 1 == cells.size()) {
        out << cells[i];
      } else {
        out << std::left << std::setw(static_cast<int>(widths[i])) << cells[i]
            << "  ";
      }
    }
    out << "\n";
  };

  const RunContext &context = summary.context;
  out << "PostgreSQL maintenance run " << summary.startedAt
      << (summary.dryRun ? " (dry run)" : "") << "\n";
  out << "Mode: " << context.mode << " | Database: " << context.database
      << " | Parallel jobs: " << context.parallelJobs << "\n";
  out << "Thresholds: dead tuples " << percent(context.deadTupleThresholdPct)
      << " | stale " << std::fixed << std::setprecision(1) << context.staleDays
      << "d | churn " << percent(context.churnThresholdPct) << " | bloat "
      << percent(context.bloatThresholdPct) << " | large tables "
      << (context.skipLarge
              ? "skipped from " +
                    TimeUtils::formatBytes(context.largeTableSizeBytes)
              : std::string("included"))
      << "\n";
  printRow(headers);
  for (const auto &row : rows)
    printRow(row);
  out << "\nTotal: " << summary.total() << " | Succeeded: " << summary.succeeded
      << " | Failed: " << summary.failed << " | Skipped: " << summary.skipped
      << " | Dry run: " << summary.dryRunReported
      << " | Elapsed: " << TimeUtils::formatDurationMs(summary.elapsedMs)
      << "\n";
}

void ReportWriter::writeToFile(const RunSummary &summary,
                               const std::string &path) {
  std::ofstream file(path, std::ios::out | std::ios::trunc);
  if (!file.is_open()) {
    throw std::runtime_error("Cannot open report file '" + path + "'");
  }

  if (StringUtils::endsWith(StringUtils::toLower(path), ".json")) {
    file << toJson(summary).dump(2) << "\n";
  } else {
    writeText(summary, file);
  }

  file.flush();
  if (!file) {
    throw std::runtime_error("Failed writing report file '" + path + "'");
  }
  Logger::info(LogCategory::REPORT, "ReportWriter",
               "Report written to " + path);
}
