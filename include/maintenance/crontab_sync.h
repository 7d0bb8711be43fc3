#ifndef CRONTAB_SYNC_H
#define CRONTAB_SYNC_H

#include "core/maintenance_config.h"
#include <string>
#include <vector>

class ICrontabStore {
public:
  virtual ~ICrontabStore() = default;

  // Current crontab text, empty when the user has none.
  virtual std::string read() = 0;
  virtual void write(const std::string &content) = 0;
};

// The invoking user's crontab through the crontab(1) command.
class SystemCrontabStore : public ICrontabStore {
public:
  std::string read() override;
  void write(const std::string &content) override;
};

// Keeps a marked block of pgmaint entries in the crontab equal to the desired
// schedule. Lines outside the block are never touched and nothing is written
// when the crontab already matches.
class CrontabSync {
public:
  static constexpr const char *BEGIN_MARKER = "# BEGIN pgmaint managed block";
  static constexpr const char *END_MARKER = "# END pgmaint managed block";

  // When backupPath is set, the crontab as it was is saved there before any
  // change is written.
  CrontabSync(ICrontabStore &store, std::string command, std::string logPath,
              std::string backupPath = "");

  // Returns true when the crontab was changed.
  bool install(const std::vector<ScheduleEntry> &entries);
  bool remove();
  std::vector<std::string> status();

  std::vector<std::string>
  renderBlock(const std::vector<ScheduleEntry> &entries) const;

  static std::vector<std::string> managedLines(const std::string &crontab);
  static std::string withoutManagedBlock(const std::string &crontab);
  static std::string withManagedBlock(const std::string &crontab,
                                      const std::vector<std::string> &block);
  static std::string shellQuote(const std::string &value);
  // cron turns an unescaped % in the command field into a newline.
  static std::string escapePercent(const std::string &command);

private:
  bool apply(const std::string &current, const std::string &desired);
  void backup(const std::string &current);

  ICrontabStore &store_;
  std::string command_;
  std::string logPath_;
  std::string backupPath_;
};

#endif
