#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace streamfilt {

// Console stream for the colour sink. Data output goes to stdout, so logs default to stderr.
enum class ConsoleStream_e { kStdout, kStderr };

struct FileSinkConfig_t {
  bool enabled = false;
  std::string path = "logs/streamfilt.log";
  std::size_t maxSizeBytes = 5 * 1024 * 1024;
  std::size_t maxFiles = 3;
};

// Per-class rotating files, one "<name>.log" per GetClass() caller.
struct ClassSinkConfig_t {
  bool enabled = false;
  std::string directory = "logs/classes";
  std::size_t maxSizeBytes = 5 * 1024 * 1024;
  std::size_t maxFiles = 3;
};

class Logger {
 public:
  static void Initialize();
  static std::shared_ptr<spdlog::logger> Get();
  static std::shared_ptr<spdlog::logger> GetClass(const std::string& name);
  static void SetEnabled(bool enabled);
  static bool IsEnabled();
  static void SetLevel(spdlog::level::level_enum level);
  static spdlog::level::level_enum ParseLevel(const std::string& value);
  static void ConfigureFileSink(const FileSinkConfig_t& config);
  static void ConfigureClassSink(const ClassSinkConfig_t& config);
  static void SetConsoleStream(ConsoleStream_e stream);
  static ConsoleStream_e ParseConsoleStream(const std::string& value);
};

} // namespace streamfilt
