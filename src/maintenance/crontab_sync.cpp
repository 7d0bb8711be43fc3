#include "maintenance/crontab_sync.h"
#include "core/logger.h"
#include "utils/string_utils.h"
#include <cctype>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <sys/wait.h>

namespace {

std::vector<std::string> splitLines(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(line);
  }
  return lines;
}

std::string joinLines(const std::vector<std::string> &lines) {
  std::string text;
  for (const auto &line : lines) {
    text += line;
    text += "\n";
  }
  return text;
}

} // namespace

std::string SystemCrontabStore::read() {
  FILE *pipe = popen("crontab -l 2>/dev/null", "r");
  if (!pipe) {
    throw std::runtime_error("Could not run crontab -l");
  }
  char buffer[256];
  std::string result;
  while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
    result += buffer;
  }
  int status = pclose(pipe);
  // crontab -l exits non-zero when the user has no crontab yet.
  if (status != 0) {
    Logger::debug(LogCategory::SYSTEM, "SystemCrontabStore",
                  "crontab -l returned " + std::to_string(status) +
                      ", treating as empty");
    return "";
  }
  return result;
}

void SystemCrontabStore::write(const std::string &content) {
  FILE *pipe = popen("crontab -", "w");
  if (!pipe) {
    throw std::runtime_error("Could not run crontab -");
  }
  bool written = fputs(content.c_str(), pipe) >= 0;
  int status = pclose(pipe);
  if (!written || status == -1 || !WIFEXITED(status) ||
      WEXITSTATUS(status) != 0) {
    throw std::runtime_error("crontab rejected the new schedule");
  }
}

CrontabSync::CrontabSync(ICrontabStore &store, std::string command,
                         std::string logPath, std::string backupPath)
    : store_(store), command_(std::move(command)),
      logPath_(std::move(logPath)), backupPath_(std::move(backupPath)) {}

std::string CrontabSync::shellQuote(const std::string &value) {
  bool plain = !value.empty();
  for (char c : value) {
    if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '/' ||
          c == '.' || c == '_' || c == '-' || c == '=' || c == ':')) {
      plain = false;
      break;
    }
  }
  if (plain)
    return value;

  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'')
      quoted += "'\\''";
    else
      quoted += c;
  }
  quoted += "'";
  return quoted;
}

std::string CrontabSync::escapePercent(const std::string &command) {
  std::string escaped;
  escaped.reserve(command.size());
  for (size_t i = 0; i < command.size(); ++i) {
    if (command[i] == '\\' && i + 1 < command.size() &&
        command[i + 1] == '%') {
      escaped += "\\%";
      ++i;
    } else if (command[i] == '%') {
      escaped += "\\%";
    } else {
      escaped += command[i];
    }
  }
  return escaped;
}

std::vector<std::string>
CrontabSync::renderBlock(const std::vector<ScheduleEntry> &entries) const {
  std::vector<std::string> block;
  block.push_back(BEGIN_MARKER);
  for (const auto &entry : entries) {
    std::string command = shellQuote(command_);
    if (!entry.arguments.empty())
      command += " " + entry.arguments;
    if (!logPath_.empty())
      command += " >> " + shellQuote(logPath_) + " 2>&1";
    block.push_back(entry.cronExpression + " " + escapePercent(command));
  }
  block.push_back(END_MARKER);
  return block;
}

std::vector<std::string> CrontabSync::managedLines(const std::string &crontab) {
  std::vector<std::string> managed;
  bool inside = false;
  for (const auto &line : splitLines(crontab)) {
    std::string trimmed = StringUtils::trim(line);
    if (trimmed == BEGIN_MARKER) {
      inside = true;
    } else if (trimmed == END_MARKER) {
      inside = false;
    } else if (inside) {
      managed.push_back(line);
    }
  }
  return managed;
}

// An unterminated block swallows the rest of the file, the same way the
// block would have been written by install.
std::string CrontabSync::withoutManagedBlock(const std::string &crontab) {
  std::vector<std::string> kept;
  bool inside = false;
  for (const auto &line : splitLines(crontab)) {
    std::string trimmed = StringUtils::trim(line);
    if (trimmed == BEGIN_MARKER) {
      inside = true;
      continue;
    }
    if (trimmed == END_MARKER) {
      inside = false;
      continue;
    }
    if (!inside)
      kept.push_back(line);
  }
  while (!kept.empty() && StringUtils::trim(kept.back()).empty())
    kept.pop_back();
  return joinLines(kept);
}

std::string
CrontabSync::withManagedBlock(const std::string &crontab,
                              const std::vector<std::string> &block) {
  std::string result = withoutManagedBlock(crontab);
  return result + joinLines(block);
}

bool CrontabSync::apply(const std::string &current,
                        const std::string &desired) {
  if (current == desired) {
    Logger::info(LogCategory::SYSTEM, "CrontabSync",
                 "Crontab already up to date");
    return false;
  }
  backup(current);
  store_.write(desired);
  return true;
}

void CrontabSync::backup(const std::string &current) {
  if (backupPath_.empty() || current.empty())
    return;
  std::ofstream out(backupPath_, std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error("Cannot write crontab backup " + backupPath_);
  }
  out << current;
  out.close();
  if (!out) {
    throw std::runtime_error("Failed writing crontab backup " + backupPath_);
  }
  Logger::info(LogCategory::SYSTEM, "CrontabSync",
               "Saved previous crontab to " + backupPath_);
}

bool CrontabSync::install(const std::vector<ScheduleEntry> &entries) {
  if (entries.empty()) {
    throw std::invalid_argument("No schedule entries to install");
  }
  std::string current = store_.read();
  std::string desired = withManagedBlock(current, renderBlock(entries));
  bool changed = apply(current, desired);
  if (changed) {
    Logger::info(LogCategory::SYSTEM, "CrontabSync",
                 "Installed " + std::to_string(entries.size()) +
                     " pgmaint cron entries");
  }
  return changed;
}

bool CrontabSync::remove() {
  std::string current = store_.read();
  if (managedLines(current).empty() &&
      current.find(BEGIN_MARKER) == std::string::npos) {
    Logger::info(LogCategory::SYSTEM, "CrontabSync",
                 "No pgmaint cron entries installed");
    return false;
  }
  bool changed = apply(current, withoutManagedBlock(current));
  if (changed) {
    Logger::info(LogCategory::SYSTEM, "CrontabSync",
                 "Removed pgmaint cron entries");
  }
  return changed;
}

std::vector<std::string> CrontabSync::status() {
  return managedLines(store_.read());
}
