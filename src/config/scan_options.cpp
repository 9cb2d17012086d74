#include "config/scan_options.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace mnemoscan::config {

namespace {

std::string Trim(const std::string& input) {
  const auto begin = input.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return {};
  }
  const auto end = input.find_last_not_of(" \t\r\n");
  return input.substr(begin, end - begin + 1);
}

std::string Lowercase(std::string_view value) {
  std::string lower;
  lower.reserve(value.size());
  for (char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return lower;
}

bool ParseBool(const std::string& value) {
  const std::string lower = Lowercase(value);
  if (lower.empty()) {
    return true;
  }
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    return false;
  }
  throw std::runtime_error("invalid boolean value: " + value);
}

std::uint64_t ParseUnsigned(std::string_view name, const std::string& value) {
  const std::string trimmed = Trim(value);
  std::uint64_t out = 0;
  const auto* first = trimmed.data();
  const auto* last = trimmed.data() + trimmed.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  if (trimmed.empty() || ec != std::errc() || ptr != last) {
    throw std::runtime_error("invalid value for " + std::string(name) + ": '" + value + "'");
  }
  return out;
}

std::optional<std::string> GetEnvValue(std::string_view name) {
  std::string key(name);
  const char* value = std::getenv(key.c_str());
  if (!value || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

void ApplyStart(const std::string& value, ScanOptions* opts) {
  std::string error;
  auto tuple = ParseIndexList(value, &error);
  if (!tuple) {
    throw std::runtime_error("invalid start tuple: " + error);
  }
  opts->start = std::move(*tuple);
}

}  // namespace

std::optional<enumerate::IndexTuple> ParseIndexList(std::string_view text, std::string* error) {
  enumerate::IndexTuple tuple;
  while (true) {
    const auto comma = text.find(',');
    const std::string item =
        Trim(std::string(comma == std::string_view::npos ? text : text.substr(0, comma)));
    std::uint32_t value = 0;
    const auto* last = item.data() + item.size();
    auto [ptr, ec] = std::from_chars(item.data(), last, value);
    if (item.empty() || ec != std::errc() || ptr != last) {
      if (error) {
        *error = "'" + item + "' is not an index";
      }
      return std::nullopt;
    }
    tuple.push_back(value);
    if (comma == std::string_view::npos) {
      break;
    }
    text.remove_prefix(comma + 1);
  }
  return tuple;
}

void ApplyConfigOption(const std::string& raw_key, const std::string& value,
                       ScanOptions* opts) {
  const std::string key = Lowercase(raw_key);
  if (key == "wordlist") {
    opts->wordlist_path = value;
  } else if (key == "width") {
    opts->width = static_cast<std::size_t>(ParseUnsigned(key, value));
  } else if (key == "start") {
    ApplyStart(value, opts);
  } else if (key == "limit") {
    opts->limit = ParseUnsigned(key, value);
  } else if (key == "checkpoint") {
    opts->checkpoint_path = value;
  } else if (key == "checkpointinterval") {
    opts->checkpoint_interval = ParseUnsigned(key, value);
  } else if (key == "shard") {
    opts->shard = value;
  } else if (key == "json") {
    opts->json_output = ParseBool(value);
  } else if (key == "numbered") {
    opts->numbered = ParseBool(value);
  } else if (key == "debuglog") {
    opts->debug_log_path = value;
  } else if (key == "loglevel") {
    opts->log_level = value;
  } else if (key == "logmaxsizemb") {
    opts->log_max_size_mb = static_cast<std::size_t>(ParseUnsigned(key, value));
  } else if (key == "logmaxfiles") {
    opts->log_max_files = static_cast<std::size_t>(ParseUnsigned(key, value));
  } else {
    std::cerr << "[mnemoscan] warn: unknown config key '" << raw_key << "'\n";
  }
}

void LoadConfigFile(const std::filesystem::path& path, bool required, ScanOptions* opts) {
  if (path.empty()) {
    return;
  }
  if (!std::filesystem::exists(path)) {
    if (required) {
      throw std::runtime_error("config file not found: " + path.string());
    }
    return;
  }
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open config file: " + path.string());
  }
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.resize(comment_pos);
    }
    line = Trim(line);
    if (line.empty()) {
      continue;
    }
    std::string key;
    std::string value;
    const auto eq_pos = line.find('=');
    if (eq_pos == std::string::npos) {
      key = line;
      value = "1";
    } else {
      key = Trim(line.substr(0, eq_pos));
      value = Trim(line.substr(eq_pos + 1));
    }
    try {
      ApplyConfigOption(key, value, opts);
    } catch (const std::exception& ex) {
      throw std::runtime_error(path.string() + ":" + std::to_string(lineno) + ": " + ex.what());
    }
  }
}

void ApplyEnvironment(ScanOptions* opts) {
  auto apply_string = [&](std::string_view name, std::string* target) {
    if (auto value = GetEnvValue(name)) {
      *target = std::move(*value);
    }
  };
  auto apply_bool = [&](std::string_view name, bool* target) {
    if (auto value = GetEnvValue(name)) {
      *target = ParseBool(*value);
    }
  };

  apply_string("MNEMOSCAN_WORDLIST", &opts->wordlist_path);
  if (auto value = GetEnvValue("MNEMOSCAN_WIDTH")) {
    opts->width = static_cast<std::size_t>(ParseUnsigned("MNEMOSCAN_WIDTH", *value));
  }
  if (auto value = GetEnvValue("MNEMOSCAN_START")) {
    ApplyStart(*value, opts);
  }
  if (auto value = GetEnvValue("MNEMOSCAN_LIMIT")) {
    opts->limit = ParseUnsigned("MNEMOSCAN_LIMIT", *value);
  }
  apply_string("MNEMOSCAN_CHECKPOINT", &opts->checkpoint_path);
  if (auto value = GetEnvValue("MNEMOSCAN_CHECKPOINT_INTERVAL")) {
    opts->checkpoint_interval = ParseUnsigned("MNEMOSCAN_CHECKPOINT_INTERVAL", *value);
  }
  if (auto value = GetEnvValue("MNEMOSCAN_SHARD")) {
    opts->shard = std::move(*value);
  }
  apply_bool("MNEMOSCAN_JSON", &opts->json_output);
  apply_bool("MNEMOSCAN_NUMBERED", &opts->numbered);
  apply_string("MNEMOSCAN_DEBUG_LOG", &opts->debug_log_path);
  apply_string("MNEMOSCAN_LOG_LEVEL", &opts->log_level);
  if (auto value = GetEnvValue("MNEMOSCAN_LOG_MAX_SIZE_MB")) {
    opts->log_max_size_mb =
        static_cast<std::size_t>(ParseUnsigned("MNEMOSCAN_LOG_MAX_SIZE_MB", *value));
  }
  if (auto value = GetEnvValue("MNEMOSCAN_LOG_MAX_FILES")) {
    opts->log_max_files =
        static_cast<std::size_t>(ParseUnsigned("MNEMOSCAN_LOG_MAX_FILES", *value));
  }
}

ScanOptions ParseScanOptions(int argc, char** argv) {
  ScanOptions opts;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }

  auto ensure_value = [&](std::size_t& idx) -> std::string {
    if (idx + 1 >= args.size()) {
      throw std::runtime_error("missing value for argument " + args[idx]);
    }
    return args[++idx];
  };

  // The config file has the lowest precedence, so locate it first.
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--conf") {
      opts.config_path = ensure_value(i);
      opts.config_explicit = true;
    } else if (args[i] == "--no-conf") {
      opts.no_config = true;
    }
  }
  if (!opts.no_config) {
    LoadConfigFile(opts.config_path, opts.config_explicit, &opts);
  }
  ApplyEnvironment(&opts);

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--help" || arg == "-h") {
      opts.show_help = true;
    } else if (arg == "--wordlist") {
      opts.wordlist_path = ensure_value(i);
    } else if (arg == "--width") {
      opts.width = static_cast<std::size_t>(ParseUnsigned(arg, ensure_value(i)));
    } else if (arg == "--start") {
      ApplyStart(ensure_value(i), &opts);
    } else if (arg == "--limit") {
      opts.limit = ParseUnsigned(arg, ensure_value(i));
    } else if (arg == "--checkpoint") {
      opts.checkpoint_path = ensure_value(i);
    } else if (arg == "--checkpoint-interval") {
      opts.checkpoint_interval = ParseUnsigned(arg, ensure_value(i));
    } else if (arg == "--shard") {
      opts.shard = ensure_value(i);
    } else if (arg == "--json") {
      opts.json_output = true;
    } else if (arg == "--numbered") {
      opts.numbered = true;
    } else if (arg == "--count") {
      opts.count_only = true;
    } else if (arg == "--debug-log") {
      opts.debug_log_path = ensure_value(i);
    } else if (arg == "--log-level") {
      opts.log_level = ensure_value(i);
    } else if (arg == "--log-max-size-mb") {
      opts.log_max_size_mb = static_cast<std::size_t>(ParseUnsigned(arg, ensure_value(i)));
    } else if (arg == "--log-max-files") {
      opts.log_max_files = static_cast<std::size_t>(ParseUnsigned(arg, ensure_value(i)));
    } else if (arg == "--conf") {
      ++i;  // already handled
    } else if (arg == "--no-conf") {
      continue;
    } else {
      throw std::runtime_error("unknown option: " + arg);
    }
  }
  return opts;
}

std::string ScanUsage() {
  return "mnemoscan-cli options:\n"
         "  --wordlist PATH             word list, one word per line (default english.txt)\n"
         "  --width K                   words per phrase (default 12)\n"
         "  --start I,J,...             first index tuple to emit\n"
         "  --limit N                   stop after N phrases, 0 for no limit (default 100)\n"
         "  --checkpoint PATH           resume from and save progress to PATH\n"
         "  --checkpoint-interval N     save every N phrases (default 10000)\n"
         "  --shard I/N                 enumerate only shard I of N\n"
         "  --json                      print one JSON object per phrase\n"
         "  --numbered                  prefix phrases with their sequence number\n"
         "  --count                     print the number of phrases and exit\n"
         "  --debug-log PATH            write a log file\n"
         "  --log-level LEVEL           debug, info, warn or error (default info)\n"
         "  --log-max-size-mb N         rotate the log after N MiB\n"
         "  --log-max-files N           rotated log files to keep\n"
         "  --conf PATH                 config file (default mnemoscan.conf)\n"
         "  --no-conf                   ignore the config file\n"
         "  --help                      show this message\n";
}

}  // namespace mnemoscan::config
