#include "util/logging.hpp"

#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace mnemoscan::util {

namespace {

std::string FormatTimestamp() {
  const std::time_t time = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm_buf{};
#ifdef _WIN32
  localtime_s(&tm_buf, &time);
#else
  localtime_r(&time, &tm_buf);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

std::filesystem::path RotatedPath(const std::filesystem::path& path, std::size_t generation) {
  return std::filesystem::path(path).concat("." + std::to_string(generation));
}

std::mutex g_run_log_mutex;
std::shared_ptr<RunLog> g_run_log;

void WriteToRunLog(LogLevel level, std::string_view message) {
  std::shared_ptr<RunLog> log;
  {
    std::lock_guard<std::mutex> lock(g_run_log_mutex);
    log = g_run_log;
  }
  if (log) {
    log->Write(level, message);
  }
}

}  // namespace

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kWarn:
      return "WARN";
    case LogLevel::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

std::optional<LogLevel> ParseLogLevel(std::string_view value) {
  std::string lower(value);
  for (auto& c : lower) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  if (lower == "debug") return LogLevel::kDebug;
  if (lower == "info") return LogLevel::kInfo;
  if (lower == "warn" || lower == "warning") return LogLevel::kWarn;
  if (lower == "error") return LogLevel::kError;
  return std::nullopt;
}

RunLog::RunLog(std::filesystem::path path, LogSettings settings)
    : path_(std::move(path)), settings_(settings) {
  if (path_.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path_.parent_path(), ec);
  }
  stream_.open(path_, std::ios::app);
  if (!stream_) {
    throw std::runtime_error("failed to open debug log: " + path_.string());
  }
  std::error_code ec;
  const auto existing = std::filesystem::file_size(path_, ec);
  written_ = ec ? 0 : existing;
  Write(LogLevel::kInfo, "mnemoscan run started, threshold " +
                             std::string(LogLevelName(settings_.threshold)));
}

void RunLog::Write(LogLevel level, std::string_view message) {
  if (level < settings_.threshold) {
    return;
  }
  std::string line = "[" + FormatTimestamp() + "] [" + LogLevelName(level) + "] ";
  line.append(message);
  line.push_back('\n');

  std::lock_guard<std::mutex> lock(mutex_);
  if (settings_.max_bytes > 0 && written_ > 0 && written_ + line.size() > settings_.max_bytes) {
    RotateLocked();
  }
  if (!stream_.is_open()) {
    return;
  }
  stream_ << line;
  stream_.flush();
  written_ += line.size();
}

void RunLog::RotateLocked() {
  if (settings_.max_files == 0) {
    return;
  }
  stream_.close();
  std::error_code ec;
  std::filesystem::remove(RotatedPath(path_, settings_.max_files), ec);
  for (std::size_t generation = settings_.max_files; generation > 1; --generation) {
    const auto older = RotatedPath(path_, generation - 1);
    if (std::filesystem::exists(older, ec)) {
      std::filesystem::rename(older, RotatedPath(path_, generation), ec);
    }
  }
  std::filesystem::rename(path_, RotatedPath(path_, 1), ec);
  stream_.open(path_, std::ios::trunc);
  written_ = 0;
}

void InstallRunLog(std::shared_ptr<RunLog> log) {
  std::lock_guard<std::mutex> lock(g_run_log_mutex);
  g_run_log = std::move(log);
}

void LogDebug(std::string_view message) { WriteToRunLog(LogLevel::kDebug, message); }
void LogInfo(std::string_view message) { WriteToRunLog(LogLevel::kInfo, message); }
void LogWarn(std::string_view message) { WriteToRunLog(LogLevel::kWarn, message); }
void LogError(std::string_view message) { WriteToRunLog(LogLevel::kError, message); }

}  // namespace mnemoscan::util
