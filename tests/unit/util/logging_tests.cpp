#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>

#include "util/atomic_file.hpp"
#include "util/logging.hpp"

using mnemoscan::util::LogLevel;

namespace {

std::filesystem::path MakeTempDir() {
  const auto base = std::filesystem::temp_directory_path();
  const auto suffix = static_cast<std::uint64_t>(std::random_device{}());
  return base / ("mnemoscan_util_tests_" + std::to_string(suffix));
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

bool CheckLevels() {
  using mnemoscan::util::ParseLogLevel;
  if (ParseLogLevel("DEBUG") != LogLevel::kDebug || ParseLogLevel("info") != LogLevel::kInfo ||
      ParseLogLevel("Warning") != LogLevel::kWarn || ParseLogLevel("error") != LogLevel::kError ||
      ParseLogLevel("verbose")) {
    std::cerr << "log level parsing is wrong\n";
    return false;
  }
  if (std::string(mnemoscan::util::LogLevelName(LogLevel::kWarn)) != "WARN") {
    std::cerr << "log level name is wrong\n";
    return false;
  }
  return true;
}

bool CheckRunLogWritesAndFilters(const std::filesystem::path& dir) {
  using mnemoscan::util::InstallRunLog;
  using mnemoscan::util::LogError;
  using mnemoscan::util::LogInfo;
  const auto path = dir / "logs" / "scan.log";

  LogError("dropped without a run log");
  mnemoscan::util::LogSettings settings;
  settings.threshold = LogLevel::kInfo;
  InstallRunLog(std::make_shared<mnemoscan::util::RunLog>(path, settings));
  mnemoscan::util::LogDebug("below threshold");
  LogInfo("cursor resumed");
  LogError("checkpoint write failed");
  InstallRunLog(nullptr);
  LogError("dropped after the run log is removed");

  const auto text = ReadFile(path);
  if (text.find("dropped") != std::string::npos ||
      text.find("below threshold") != std::string::npos ||
      text.find("[INFO] mnemoscan run started, threshold INFO") == std::string::npos ||
      text.find("[INFO] cursor resumed") == std::string::npos ||
      text.find("[ERROR] checkpoint write failed") == std::string::npos) {
    std::cerr << "unexpected log contents:\n" << text;
    return false;
  }
  return true;
}

bool CheckRotation(const std::filesystem::path& dir) {
  const auto path = dir / "rotate.log";
  {
    mnemoscan::util::LogSettings settings;
    settings.threshold = LogLevel::kDebug;
    settings.max_bytes = 200;
    settings.max_files = 2;
    mnemoscan::util::RunLog log(path, settings);
    for (int i = 0; i < 40; ++i) {
      log.Write(LogLevel::kDebug, "line " + std::to_string(i));
    }
  }
  const auto first = std::filesystem::path(path).concat(".1");
  const auto second = std::filesystem::path(path).concat(".2");
  const auto third = std::filesystem::path(path).concat(".3");
  if (!std::filesystem::exists(first) || !std::filesystem::exists(second) ||
      std::filesystem::exists(third)) {
    std::cerr << "log rotation kept the wrong number of files\n";
    return false;
  }
  for (const auto& file : {path, first, second}) {
    if (std::filesystem::file_size(file) > 200) {
      std::cerr << file << " grew past the rotation size\n";
      return false;
    }
  }
  if (ReadFile(path).find("line 39") == std::string::npos) {
    std::cerr << "active log should hold the latest line\n";
    return false;
  }
  return true;
}

bool CheckUnwritableLog(const std::filesystem::path& dir) {
  // A directory cannot be opened as the log file.
  std::filesystem::create_directories(dir / "taken");
  try {
    mnemoscan::util::RunLog log(dir / "taken", {});
  } catch (const std::runtime_error&) {
    return true;
  }
  std::cerr << "opening a directory as a log should throw\n";
  return false;
}

bool CheckAtomicWrite(const std::filesystem::path& dir) {
  const auto path = dir / "nested" / "state.json";
  std::string error;
  if (!mnemoscan::util::AtomicWriteText(path, "first", &error) ||
      !mnemoscan::util::AtomicWriteText(path, "second", &error)) {
    std::cerr << "atomic write failed: " << error << "\n";
    return false;
  }
  if (ReadFile(path) != "second") {
    std::cerr << "atomic write did not replace contents\n";
    return false;
  }
  const bool failed = mnemoscan::util::AtomicWriteFile(
      path, [](std::ostream& out) {
        out << "partial";
        return false;
      },
      &error);
  if (failed || error.empty() || ReadFile(path) != "second") {
    std::cerr << "failed writer must leave the previous contents\n";
    return false;
  }
  std::size_t entries = 0;
  for (const auto& entry : std::filesystem::directory_iterator(path.parent_path())) {
    (void)entry;
    ++entries;
  }
  if (entries != 1) {
    std::cerr << "temporary files were left behind\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  const auto dir = MakeTempDir();
  int status = EXIT_SUCCESS;
  try {
    if (!CheckLevels() || !CheckRunLogWritesAndFilters(dir) || !CheckRotation(dir) ||
        !CheckUnwritableLog(dir) || !CheckAtomicWrite(dir)) {
      status = EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "logging_tests exception: " << ex.what() << "\n";
    status = EXIT_FAILURE;
  }
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  return status;
}
