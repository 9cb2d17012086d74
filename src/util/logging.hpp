#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace mnemoscan::util {

enum class LogLevel {
  kDebug = 0,
  kInfo = 1,
  kWarn = 2,
  kError = 3,
};

const char* LogLevelName(LogLevel level);

// Accepts debug/info/warn/warning/error in any case.
std::optional<LogLevel> ParseLogLevel(std::string_view value);

struct LogSettings {
  LogLevel threshold{LogLevel::kInfo};
  // 0 disables rotation.
  std::uintmax_t max_bytes{0};
  std::size_t max_files{0};
};

// Log file for one scan run. The file is opened (parent directories created)
// on construction and closed with the object; a line that would push the file
// past `max_bytes` first shifts it to path.1 ... path.max_files.
class RunLog {
 public:
  // Throws std::runtime_error when the file cannot be opened.
  RunLog(std::filesystem::path path, LogSettings settings);

  void Write(LogLevel level, std::string_view message);

 private:
  void RotateLocked();

  std::mutex mutex_;
  std::filesystem::path path_;
  LogSettings settings_;
  std::ofstream stream_;
  std::uintmax_t written_{0};
};

// Route the LogX helpers to `log`. With no run log installed they do nothing.
void InstallRunLog(std::shared_ptr<RunLog> log);

void LogDebug(std::string_view message);
void LogInfo(std::string_view message);
void LogWarn(std::string_view message);
void LogError(std::string_view message);

}  // namespace mnemoscan::util
