#ifndef REPORT_WRITER_H
#define REPORT_WRITER_H

#include "maintenance/outcome_recorder.h"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

using json = nlohmann::json;

// Flat per-operation report: target, kind, reason, state, duration, error.
class ReportWriter {
public:
  static json toJson(const RunSummary &summary);
  static void writeText(const RunSummary &summary, std::ostream &out);

  // JSON when path ends in ".json", aligned text otherwise. Throws
  // std::runtime_error when the file cannot be written.
  static void writeToFile(const RunSummary &summary, const std::string &path);
};

#endif
