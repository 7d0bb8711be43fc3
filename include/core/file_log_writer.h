#ifndef FILE_LOG_WRITER_H
#define FILE_LOG_WRITER_H

#include "core/log_writer.h"
#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

// Size limit of the active log file and how many rotated copies
// (file.1 .. file.N, newest first) are kept. With zero backups the file is
// truncated instead of rotated.
struct LogRotation {
  static constexpr int64_t DEFAULT_MAX_BYTES = int64_t{10} << 20;
  static constexpr int DEFAULT_BACKUPS = 5;
  static constexpr int MAX_BACKUPS = 100;

  int64_t maxBytes = DEFAULT_MAX_BYTES;
  int backups = DEFAULT_BACKUPS;
};

// Appends to a log file shared by interactive and cron runs. The running size
// is tracked in memory, starting from the size the file had when opened, so a
// write never needs a stat. A line that would push the file past maxBytes
// rotates first; a single line longer than the limit is still written whole.
class FileLogWriter : public ILogWriter {
public:
  FileLogWriter(const std::string &fileName, LogRotation rotation);
  ~FileLogWriter() override { close(); }

  bool write(const std::string &formattedMessage) override;
  void flush() override;
  void close() override;
  bool isOpen() const override;

  int64_t currentSize() const;
  int rotations() const;

private:
  void openFile();
  void rotate();

  std::string fileName_;
  LogRotation rotation_;
  std::ofstream file_;
  int64_t currentSize_ = 0;
  int rotations_ = 0;
  mutable std::mutex mutex_;
};

#endif
