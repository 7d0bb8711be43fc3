#ifndef CONSOLE_LOG_WRITER_H
#define CONSOLE_LOG_WRITER_H

#include "core/log_writer.h"
#include <mutex>
#include <ostream>

// Writes formatted log lines to a stream, stderr by default so that the run
// summary printed on stdout stays machine readable.
class ConsoleLogWriter : public ILogWriter {
private:
  std::ostream &out_;
  std::mutex mutex_;
  bool open_;

public:
  ConsoleLogWriter();
  explicit ConsoleLogWriter(std::ostream &out);
  ~ConsoleLogWriter() override = default;

  bool write(const std::string &formattedMessage) override;
  void flush() override;
  void close() override;
  bool isOpen() const override { return open_; }
};

#endif
