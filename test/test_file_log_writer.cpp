#include "core/file_log_writer.h"
#include "test_runner.h"
#include <filesystem>
#include <fstream>
#include <iterator>

namespace fs = std::filesystem;

namespace {
fs::path freshDirectory(const std::string &name) {
  fs::path dir = fs::temp_directory_path() / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

std::string readAll(const fs::path &path) {
  std::ifstream in(path);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

// 19 characters, 20 bytes on disk with the newline.
const std::string LINE = "0123456789abcdefghi";
} // namespace

int main() {
  TestRunner runner;

  std::cout << "\n========================================" << std::endl;
  std::cout << "FILE LOG WRITER - TESTS" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Lines are appended to an existing file", [&]() {
    fs::path dir = freshDirectory("pgmaint_log_append");
    fs::path log = dir / "pgmaint.log";
    {
      std::ofstream seed(log);
      seed << "earlier run\n";
    }
    FileLogWriter writer(log.string(), LogRotation{});
    runner.assertTrue(writer.isOpen(), "Opened");
    runner.assertEquals(12, static_cast<int>(writer.currentSize()),
                        "Starts from the existing size");
    runner.assertTrue(writer.write(LINE), "Written");
    writer.close();
    runner.assertEquals("earlier run\n" + LINE + "\n", readAll(log),
                        "Appended after the old content");
    fs::remove_all(dir);
  });

  runner.runTest("Rotation keeps the configured number of backups", [&]() {
    fs::path dir = freshDirectory("pgmaint_log_rotate");
    fs::path log = dir / "pgmaint.log";
    LogRotation rotation;
    rotation.maxBytes = 100;
    rotation.backups = 2;
    {
      FileLogWriter writer(log.string(), rotation);
      for (int i = 0; i < 20; ++i)
        runner.assertTrue(writer.write(LINE), "Line written");
      // 5 lines fill a file exactly, so 20 lines rotate 3 times.
      runner.assertEquals(3, writer.rotations(), "Three rotations");
    }
    runner.assertTrue(fs::exists(log), "Active file");
    runner.assertTrue(fs::exists(dir / "pgmaint.log.1"), "First backup");
    runner.assertTrue(fs::exists(dir / "pgmaint.log.2"), "Second backup");
    runner.assertFalse(fs::exists(dir / "pgmaint.log.3"), "No third backup");
    for (const auto &name : {"pgmaint.log", "pgmaint.log.1", "pgmaint.log.2"}) {
      runner.assertLessOrEqual(100, static_cast<int>(fs::file_size(dir / name)),
                               std::string(name) + " within the limit");
    }
    fs::remove_all(dir);
  });

  runner.runTest("Zero backups truncates in place", [&]() {
    fs::path dir = freshDirectory("pgmaint_log_truncate");
    fs::path log = dir / "pgmaint.log";
    LogRotation rotation;
    rotation.maxBytes = 50;
    rotation.backups = 0;
    {
      FileLogWriter writer(log.string(), rotation);
      for (int i = 0; i < 7; ++i)
        writer.write(LINE);
      runner.assertEquals(3, writer.rotations(), "Truncated three times");
    }
    runner.assertFalse(fs::exists(dir / "pgmaint.log.1"), "No backup file");
    runner.assertEquals(LINE + "\n", readAll(log), "Only the newest line");
    fs::remove_all(dir);
  });

  runner.runTest("A pre-existing large file rotates on the first write",
                 [&]() {
                   fs::path dir = freshDirectory("pgmaint_log_existing");
                   fs::path log = dir / "pgmaint.log";
                   {
                     std::ofstream seed(log);
                     seed << std::string(90, 'x') << "\n";
                   }
                   LogRotation rotation;
                   rotation.maxBytes = 100;
                   rotation.backups = 1;
                   {
                     FileLogWriter writer(log.string(), rotation);
                     writer.write(LINE);
                   }
                   runner.assertEquals(91, static_cast<int>(fs::file_size(
                                               dir / "pgmaint.log.1")),
                                       "Old content moved aside");
                   runner.assertEquals(LINE + "\n", readAll(log),
                                       "New file holds the new line");
                   fs::remove_all(dir);
                 });

  runner.runTest("Unwritable path leaves the writer closed", [&]() {
    FileLogWriter writer("/nonexistent/dir/pgmaint.log", LogRotation{});
    runner.assertFalse(writer.isOpen(), "Not open");
    runner.assertFalse(writer.write(LINE), "Write refused");
  });

  runner.printSummary();
  return 0;
}
