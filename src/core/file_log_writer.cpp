#include "core/file_log_writer.h"
#include <filesystem>
#include <system_error>

FileLogWriter::FileLogWriter(const std::string &fileName, LogRotation rotation)
    : fileName_(fileName), rotation_(rotation) {
  if (rotation_.maxBytes <= 0)
    rotation_.maxBytes = LogRotation::DEFAULT_MAX_BYTES;
  if (rotation_.backups < 0)
    rotation_.backups = 0;
  openFile();
}

void FileLogWriter::openFile() {
  file_.open(fileName_, std::ios::out | std::ios::app);
  currentSize_ = 0;
  if (!file_.is_open())
    return;

  std::error_code ec;
  auto size = std::filesystem::file_size(fileName_, ec);
  if (!ec)
    currentSize_ = static_cast<int64_t>(size);
}

bool FileLogWriter::write(const std::string &formattedMessage) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!file_.is_open())
    return false;

  int64_t lineBytes = static_cast<int64_t>(formattedMessage.size()) + 1;
  if (currentSize_ > 0 && currentSize_ + lineBytes > rotation_.maxBytes) {
    rotate();
    if (!file_.is_open())
      return false;
  }

  file_ << formattedMessage << '\n';
  file_.flush();
  if (!file_.good())
    return false;
  currentSize_ += lineBytes;
  return true;
}

void FileLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open())
    file_.flush();
}

void FileLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

bool FileLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_.is_open();
}

int64_t FileLogWriter::currentSize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return currentSize_;
}

int FileLogWriter::rotations() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return rotations_;
}

// Called with mutex_ held. Filesystem errors are ignored: the worst case is a
// backup that is not shifted and logging continues into the reopened file.
void FileLogWriter::rotate() {
  file_.close();
  ++rotations_;

  std::error_code ec;
  if (rotation_.backups == 0) {
    std::filesystem::resize_file(fileName_, 0, ec);
    openFile();
    return;
  }

  std::filesystem::remove(fileName_ + "." + std::to_string(rotation_.backups),
                          ec);
  for (int i = rotation_.backups - 1; i >= 1; --i) {
    std::string from = fileName_ + "." + std::to_string(i);
    if (std::filesystem::exists(from, ec)) {
      std::filesystem::rename(from, fileName_ + "." + std::to_string(i + 1),
                              ec);
    }
  }
  std::filesystem::rename(fileName_, fileName_ + ".1", ec);
  openFile();
}
