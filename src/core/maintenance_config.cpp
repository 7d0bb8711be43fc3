#include "core/maintenance_config.h"
#include "utils/string_utils.h"

std::string operationModeToString(OperationMode mode) {
  switch (mode) {
  case OperationMode::VACUUM:
    return "vacuum";
  case OperationMode::ANALYZE:
    return "analyze";
  case OperationMode::AUTO:
    return "auto";
  case OperationMode::FULL_VACUUM:
    return "full-vacuum";
  case OperationMode::REINDEX:
    return "reindex";
  }
  return "unknown";
}

bool parseOperationMode(const std::string &text, OperationMode &out) {
  std::string value = StringUtils::toLower(StringUtils::trim(text));
  if (value == "vacuum") {
    out = OperationMode::VACUUM;
  } else if (value == "analyze") {
    out = OperationMode::ANALYZE;
  } else if (value == "auto") {
    out = OperationMode::AUTO;
  } else if (value == "full-vacuum" || value == "full_vacuum") {
    out = OperationMode::FULL_VACUUM;
  } else if (value == "reindex") {
    out = OperationMode::REINDEX;
  } else {
    return false;
  }
  return true;
}

std::string cancelPolicyToString(CancelPolicy policy) {
  return policy == CancelPolicy::ABORT ? "abort" : "finish";
}

bool parseCancelPolicy(const std::string &text, CancelPolicy &out) {
  std::string value = StringUtils::toLower(StringUtils::trim(text));
  if (value == "finish") {
    out = CancelPolicy::FINISH;
  } else if (value == "abort") {
    out = CancelPolicy::ABORT;
  } else {
    return false;
  }
  return true;
}

std::vector<ScheduleEntry> defaultScheduleEntries() {
  return {{"0 2 * * *", "--operation analyze"},
          {"0 3 * * 0", "--operation vacuum --skip-large"}};
}
