#include "core/logger.h"
#include "core/console_log_writer.h"
#include "core/file_log_writer.h"
#include <algorithm>
#include <cctype>
#include <iostream>

std::vector<std::unique_ptr<ILogWriter>> Logger::writers_;
std::mutex Logger::logMutex;

LogLevel Logger::currentLogLevel = LogLevel::INFO;
std::mutex Logger::configMutex;

const std::unordered_map<std::string, LogLevel> Logger::levelMap = {
    {"DEBUG", LogLevel::DEBUG},      {"INFO", LogLevel::INFO},
    {"WARN", LogLevel::WARNING},     {"WARNING", LogLevel::WARNING},
    {"ERROR", LogLevel::ERROR},      {"FATAL", LogLevel::CRITICAL},
    {"CRITICAL", LogLevel::CRITICAL}};

// Replaces the active writer set. A log file that cannot be opened is reported
// on stderr and skipped; console logging keeps working in that case.
void Logger::initialize(LogLevel level, const std::string &logFile,
                        LogRotation rotation, bool console) {
  setLogLevel(level);

  std::vector<std::unique_ptr<ILogWriter>> writers;
  if (console) {
    writers.push_back(std::make_unique<ConsoleLogWriter>());
  }

  if (!logFile.empty()) {
    auto fileWriter = std::make_unique<FileLogWriter>(logFile, rotation);
    if (fileWriter->isOpen()) {
      writers.push_back(std::move(fileWriter));
    } else {
      std::cerr << "Warning: could not open log file '" << logFile
                << "', file logging disabled" << std::endl;
    }
  }

  std::lock_guard<std::mutex> lock(logMutex);
  for (auto &writer : writers_) {
    if (writer) {
      writer->close();
    }
  }
  writers_ = std::move(writers);
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex);
  currentLogLevel = level;
}

// Accepts DEBUG, INFO, WARN/WARNING, ERROR, FATAL/CRITICAL in any case.
// Returns false and leaves the level unchanged for anything else.
bool Logger::setLogLevel(const std::string &levelStr) {
  LogLevel level;
  if (!parseLogLevel(levelStr, level)) {
    return false;
  }
  setLogLevel(level);
  return true;
}

LogLevel Logger::getCurrentLogLevel() {
  std::lock_guard<std::mutex> lock(configMutex);
  return currentLogLevel;
}

bool Logger::parseLogLevel(const std::string &levelStr, LogLevel &out) {
  if (levelStr.empty()) {
    return false;
  }

  std::string upperLevelStr = levelStr;
  std::transform(upperLevelStr.begin(), upperLevelStr.end(),
                 upperLevelStr.begin(),
                 [](unsigned char c) { return std::toupper(c); });

  auto it = levelMap.find(upperLevelStr);
  if (it == levelMap.end()) {
    return false;
  }
  out = it->second;
  return true;
}
