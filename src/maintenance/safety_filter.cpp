#include "maintenance/safety_filter.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include "utils/time_utils.h"

StreamConfirmationPrompt::StreamConfirmationPrompt(std::istream &in,
                                                   std::ostream &out)
    : in_(in), out_(out) {}

bool StreamConfirmationPrompt::confirm(const std::string &question) {
  out_ << question << " (yes/no): " << std::flush;
  std::string answer;
  if (!std::getline(in_, answer)) {
    return false;
  }
  return StringUtils::trim(answer) == "yes";
}

SafetyFilter::SafetyFilter(SafetyPolicy policy, bool dryRun,
                           IConfirmationPrompt *prompt)
    : policy_(policy), dryRun_(dryRun), prompt_(prompt) {}

bool SafetyFilter::isLarge(const Operation &op) const {
  return policy_.skipLarge &&
         op.target().sizeBytes >= policy_.largeTableSizeBytes;
}

bool SafetyFilter::confirmDestructive(size_t count) {
  if (policy_.confirmDestructive)
    return true;
  if (dryRun_ || !prompt_)
    return false;

  promptShown_ = true;
  bool accepted = prompt_->confirm(
      "About to run " + std::to_string(count) +
      " VACUUM FULL / REINDEX operation(s). These take exclusive locks and "
      "block reads and writes on each table while they run. Are you sure you "
      "want to continue?");
  Logger::info(LogCategory::MAINTENANCE, "SafetyFilter",
               std::string("Destructive operations ") +
                   (accepted ? "confirmed" : "declined") + " by operator");
  return accepted;
}

SafetyResult SafetyFilter::apply(std::vector<Operation> operations) {
  SafetyResult result;
  std::vector<Operation> remaining;

  for (auto &op : operations) {
    if (isLarge(op)) {
      Logger::warning(LogCategory::MAINTENANCE, "SafetyFilter",
                      "Skipping large table " + op.target().qualifiedName() +
                          " (" + TimeUtils::formatBytes(op.target().sizeBytes) +
                          ")");
      op.markSkipped(LARGE_TABLE_NOTE);
      result.skipped.push_back(std::move(op));
    } else {
      remaining.push_back(std::move(op));
    }
  }

  size_t destructive = 0;
  for (const auto &op : remaining) {
    if (isDestructive(op.kind()))
      ++destructive;
  }

  bool allowed = true;
  if (destructive > 0) {
    allowed = confirmDestructive(destructive);
  }

  for (auto &op : remaining) {
    if (isDestructive(op.kind()) && !allowed) {
      if (dryRun_) {
        // Reported so a dry run shows the full plan, never executed.
        op.setNote(CONFIRMATION_NOTE);
        result.plan.push_back(std::move(op));
        continue;
      }
      Logger::warning(LogCategory::MAINTENANCE, "SafetyFilter",
                      operationKindToString(op.kind()) + " on " +
                          op.target().qualifiedName() +
                          " needs confirmation, skipping");
      op.markSkipped(CONFIRMATION_NOTE);
      result.skipped.push_back(std::move(op));
      continue;
    }
    result.plan.push_back(std::move(op));
  }

  Logger::info(LogCategory::MAINTENANCE, "SafetyFilter",
               std::to_string(result.plan.size()) + " operations kept, " +
                   std::to_string(result.skipped.size()) + " skipped");
  return result;
}
