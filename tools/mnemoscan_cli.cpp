#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "checkpoint/cursor_checkpoint.hpp"
#include "config/scan_options.hpp"
#include "enumerate/combination_cursor.hpp"
#include "enumerate/combinatorics.hpp"
#include "enumerate/shard.hpp"
#include "nlohmann/json.hpp"
#include "util/logging.hpp"
#include "wordlist/wordlist.hpp"

namespace {

using mnemoscan::enumerate::Count;

std::atomic<bool> g_shutdown_requested{false};

void HandleSignal(int) {
  // Keep signal handler minimal and async-signal-safe.
  g_shutdown_requested.store(true);
}

void InstallSignalHandlers() {
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);
}

void ConfigureLogging(const mnemoscan::config::ScanOptions& opts) {
  if (opts.debug_log_path.empty()) {
    return;
  }
  const auto level = mnemoscan::util::ParseLogLevel(opts.log_level);
  if (!level) {
    throw std::runtime_error("invalid log level: " + opts.log_level);
  }
  mnemoscan::util::LogSettings settings;
  settings.threshold = *level;
  settings.max_bytes = static_cast<std::uintmax_t>(opts.log_max_size_mb) * 1024u * 1024u;
  settings.max_files = opts.log_max_files;
  mnemoscan::util::InstallRunLog(
      std::make_shared<mnemoscan::util::RunLog>(opts.debug_log_path, settings));
}

std::string JoinWords(const mnemoscan::enumerate::MnemonicPhrase& phrase) {
  std::string out;
  for (const auto& word : phrase) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += word;
  }
  return out;
}

void PrintPhrase(const mnemoscan::config::ScanOptions& opts, Count sequence,
                 const mnemoscan::enumerate::IndexTuple& indices,
                 const mnemoscan::enumerate::MnemonicPhrase& phrase) {
  if (opts.json_output) {
    nlohmann::json line;
    line["n"] = mnemoscan::enumerate::CountToString(sequence);
    line["indices"] = indices;
    line["words"] = phrase;
    std::cout << line.dump() << '\n';
  } else if (opts.numbered) {
    std::cout << "Mnemonic #" << mnemoscan::enumerate::CountToString(sequence) << ": "
              << JoinWords(phrase) << '\n';
  } else {
    std::cout << JoinWords(phrase) << '\n';
  }
}

bool SaveProgress(const std::string& path, const mnemoscan::checkpoint::CursorCheckpoint& cp) {
  std::string error;
  if (!mnemoscan::checkpoint::SaveCheckpoint(path, cp, &error)) {
    std::cerr << "[mnemoscan] warn: unable to write checkpoint " << path << ": " << error
              << "\n";
    mnemoscan::util::LogWarn("checkpoint write failed: " + error);
    return false;
  }
  mnemoscan::util::LogDebug("checkpoint saved at phrase " +
                            mnemoscan::enumerate::CountToString(cp.emitted));
  return true;
}

int Run(const mnemoscan::config::ScanOptions& opts) {
  using namespace mnemoscan;

  std::vector<std::string> vocabulary;
  std::string error;
  if (!wordlist::LoadWordlistFile(opts.wordlist_path, &vocabulary, &error)) {
    throw std::runtime_error(error);
  }
  util::LogInfo("loaded " + std::to_string(vocabulary.size()) + " words from " +
                opts.wordlist_path);
  if (auto duplicate = wordlist::FindDuplicateWord(vocabulary)) {
    std::cerr << "[mnemoscan] warn: word list repeats '" << *duplicate << "'\n";
    util::LogWarn("word list repeats '" + *duplicate + "'");
  }

  const auto total = enumerate::BinomialCoefficient(vocabulary.size(), opts.width);
  if (!total) {
    throw std::runtime_error("combination count overflows 128 bits");
  }
  if (*total == 0 || opts.width == 0) {
    throw std::runtime_error("vocabulary of " + std::to_string(vocabulary.size()) +
                             " words cannot form combinations of " +
                             std::to_string(opts.width));
  }

  // Ranks this run covers: the whole space, the tail after --start, or one shard.
  std::optional<enumerate::IndexTuple> range_start = opts.start;
  checkpoint::RankRange range{0, *total};
  if (opts.shard) {
    const auto spec = enumerate::ParseShardSpec(*opts.shard, &error);
    if (!spec) {
      throw std::runtime_error(error);
    }
    const auto shard =
        enumerate::ShardAt(vocabulary.size(), opts.width, spec->second, spec->first, &error);
    if (!shard) {
      throw std::runtime_error(error);
    }
    if (shard->size == 0) {
      std::cerr << "[mnemoscan] shard " << *opts.shard << " is empty\n";
      return EXIT_SUCCESS;
    }
    if (opts.start) {
      std::cerr << "[mnemoscan] warn: --start is ignored when --shard is set\n";
    }
    range_start = shard->start;
    range = {shard->begin_rank, shard->begin_rank + shard->size};
    util::LogInfo("shard " + *opts.shard + " starts at rank " +
                  enumerate::CountToString(shard->begin_rank) + " and spans " +
                  enumerate::CountToString(shard->size) + " phrases");
  } else if (opts.start) {
    if (opts.start->size() != opts.width) {
      throw std::runtime_error("start tuple has " + std::to_string(opts.start->size()) +
                               " indices, expected " + std::to_string(opts.width));
    }
    const auto rank = enumerate::RankOf(*opts.start, vocabulary.size(), &error);
    if (!rank) {
      throw std::runtime_error(error);
    }
    range.begin = *rank;
  }

  if (opts.count_only) {
    std::cout << enumerate::CountToString(range.end - range.begin) << '\n';
    return EXIT_SUCCESS;
  }

  // A shard that stops short of the last combination gets its own message.
  const std::string range_done =
      range.end == *total ? std::string("Reached the end of combinations.")
                          : "Reached the end of shard " + opts.shard.value_or("") + ".";

  std::optional<enumerate::CombinationCursor> cursor;
  Count emitted = 0;
  const bool resuming =
      !opts.checkpoint_path.empty() && std::filesystem::exists(opts.checkpoint_path);
  if (resuming) {
    auto cp = checkpoint::LoadCheckpoint(opts.checkpoint_path, &error);
    if (!cp) {
      throw std::runtime_error(error);
    }
    if (!checkpoint::CheckpointCoversRange(*cp, range, &error)) {
      throw std::runtime_error(opts.checkpoint_path + ": " + error);
    }
    if (cp->exhausted) {
      std::cerr << range_done << '\n';
      util::LogInfo("checkpoint " + opts.checkpoint_path + " is already complete");
      return EXIT_SUCCESS;
    }
    cursor = checkpoint::ResumeCursor(vocabulary, *cp, &error);
    emitted = cp->emitted;
    util::LogInfo("resuming after " + enumerate::CountToString(emitted) + " phrases");
  } else {
    cursor = enumerate::CombinationCursor::Create(vocabulary, opts.width, range_start, &error);
  }
  if (!cursor) {
    throw std::runtime_error(error);
  }
  const auto position = enumerate::RankOf(cursor->Current(), vocabulary.size(), &error);
  if (!position) {
    throw std::runtime_error(error);
  }
  Count remaining = range.end - *position;

  InstallSignalHandlers();
  bool finished = false;
  enumerate::IndexTuple last;
  std::uint64_t produced = 0;
  while (!g_shutdown_requested.load() && (opts.limit == 0 || produced < opts.limit)) {
    auto step = cursor->NextIndices();
    ++emitted;
    ++produced;
    --remaining;
    PrintPhrase(opts, emitted, step.indices,
                enumerate::MaterializePhrase(vocabulary, step.indices));
    if (!step.has_more || remaining == 0) {
      last = std::move(step.indices);
      finished = true;
      break;
    }
    if (!opts.checkpoint_path.empty() && opts.checkpoint_interval > 0 &&
        produced % opts.checkpoint_interval == 0) {
      (void)SaveProgress(opts.checkpoint_path,
                         checkpoint::CaptureCheckpoint(*cursor, range, emitted));
    }
  }
  std::cout.flush();

  if (g_shutdown_requested.load()) {
    std::cerr << "[mnemoscan] interrupted after " << produced << " phrases\n";
    util::LogInfo("interrupted after " + std::to_string(produced) + " phrases");
  }
  if (!opts.checkpoint_path.empty()) {
    const auto cp =
        finished ? checkpoint::CompletedCheckpoint(*cursor, std::move(last), range, emitted)
                 : checkpoint::CaptureCheckpoint(*cursor, range, emitted);
    if (!SaveProgress(opts.checkpoint_path, cp)) {
      return EXIT_FAILURE;
    }
  }
  if (finished) {
    std::cerr << range_done << '\n';
    util::LogInfo("range complete after " + enumerate::CountToString(emitted) + " phrases");
  }
  return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const auto opts = mnemoscan::config::ParseScanOptions(argc, argv);
    if (opts.show_help) {
      std::cout << mnemoscan::config::ScanUsage();
      return EXIT_SUCCESS;
    }
    ConfigureLogging(opts);
    return Run(opts);
  } catch (const std::exception& ex) {
    std::cerr << "[mnemoscan] fatal: " << ex.what() << "\n";
    mnemoscan::util::LogError(ex.what());
    return EXIT_FAILURE;
  }
}
