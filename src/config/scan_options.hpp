#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "enumerate/combination_cursor.hpp"

namespace mnemoscan::config {

struct ScanOptions {
  std::string wordlist_path{"english.txt"};
  std::size_t width{enumerate::kDefaultWidth};
  std::optional<enumerate::IndexTuple> start;
  // 0 means no limit.
  std::uint64_t limit{100};
  std::string checkpoint_path;
  std::uint64_t checkpoint_interval{10000};
  std::optional<std::string> shard;
  bool json_output{false};
  bool numbered{false};
  bool count_only{false};
  bool show_help{false};
  std::string debug_log_path;
  std::string log_level{"info"};
  std::size_t log_max_size_mb{0};
  std::size_t log_max_files{0};
  std::string config_path{"mnemoscan.conf"};
  bool config_explicit{false};
  bool no_config{false};
};

// Parse "3,17,42" into indices. Whitespace around entries is ignored.
std::optional<enumerate::IndexTuple> ParseIndexList(std::string_view text,
                                                    std::string* error = nullptr);

// Apply one key=value setting as found in the config file. Keys are
// case-insensitive; unknown keys are reported on stderr and ignored.
// Throws std::runtime_error for malformed values.
void ApplyConfigOption(const std::string& raw_key, const std::string& value,
                       ScanOptions* opts);

// Apply key=value lines from `path`. A missing file is ignored unless it was
// named explicitly.
void LoadConfigFile(const std::filesystem::path& path, bool required, ScanOptions* opts);

// Apply MNEMOSCAN_* environment overrides.
void ApplyEnvironment(ScanOptions* opts);

// Defaults, then config file, then environment, then command line.
// Throws std::runtime_error on unknown flags or malformed values.
ScanOptions ParseScanOptions(int argc, char** argv);

std::string ScanUsage();

}  // namespace mnemoscan::config
