#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "checkpoint/cursor_checkpoint.hpp"
#include "enumerate/combination_cursor.hpp"
#include "enumerate/shard.hpp"
#include "nlohmann/json.hpp"

using mnemoscan::checkpoint::RankRange;
using mnemoscan::enumerate::CombinationCursor;
using mnemoscan::enumerate::IndexTuple;
namespace checkpoint = mnemoscan::checkpoint;

namespace {

std::filesystem::path MakeTempCheckpointPath() {
  const auto base = std::filesystem::temp_directory_path();
  const auto suffix = static_cast<std::uint64_t>(std::random_device{}());
  return base / ("mnemoscan_checkpoint_tests_" + std::to_string(suffix)) / "progress.json";
}

std::vector<std::string> MakeVocabulary(std::size_t n) {
  std::vector<std::string> words;
  for (std::size_t i = 0; i < n; ++i) {
    words.push_back("w" + std::to_string(i));
  }
  return words;
}

nlohmann::json ReadJsonFile(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open json file for read: " + path.string());
  }
  nlohmann::json json;
  in >> json;
  return json;
}

bool ExpectDecodeFailure(const nlohmann::json& doc, const char* label) {
  std::string error;
  if (checkpoint::DecodeCheckpoint(doc.dump(), &error) || error.empty()) {
    std::cerr << "malformed checkpoint accepted: " << label << "\n";
    return false;
  }
  return true;
}

// A drained cursor checkpoints as exhausted; resuming it must not yield the
// last tuple again.
bool CheckExhaustedCheckpointDoesNotResume() {
  const auto vocab = MakeVocabulary(4);
  auto cursor = CombinationCursor::Create(vocab, 2);
  std::size_t pulled = 0;
  while (true) {
    ++pulled;
    if (!cursor->Next().has_more) {
      break;
    }
  }
  if (pulled != 6) {
    std::cerr << "4 choose 2 should yield 6 tuples, got " << pulled << "\n";
    return false;
  }
  std::string error;
  const auto decoded = checkpoint::DecodeCheckpoint(
      checkpoint::EncodeCheckpoint(checkpoint::CaptureCheckpoint(*cursor, {0, 6}, 6)), &error);
  if (!decoded || !decoded->exhausted || decoded->next != IndexTuple{2, 3}) {
    std::cerr << "drained cursor should decode as exhausted at (2, 3): " << error << "\n";
    return false;
  }
  error.clear();
  if (checkpoint::ResumeCursor(vocab, *decoded, &error) ||
      error.find("already complete") == std::string::npos) {
    std::cerr << "exhausted checkpoint resumed into a live cursor\n";
    return false;
  }
  return true;
}

// A finished shard records its own last tuple, and its checkpoint cannot be
// picked up by a run over another shard.
bool CheckShardCheckpoints() {
  const auto vocab = MakeVocabulary(6);
  std::string error;
  const auto first = mnemoscan::enumerate::ShardAt(6, 3, 2, 0, &error);
  const auto second = mnemoscan::enumerate::ShardAt(6, 3, 2, 1, &error);
  if (!first || !second) {
    std::cerr << "failed to locate shards of 6 choose 3: " << error << "\n";
    return false;
  }
  const RankRange first_range{first->begin_rank, first->begin_rank + first->size};
  const RankRange second_range{second->begin_rank, second->begin_rank + second->size};

  auto cursor = CombinationCursor::Create(vocab, 3, first->start);
  IndexTuple last;
  for (mnemoscan::enumerate::Count i = 0; i < first->size; ++i) {
    last = cursor->NextIndices().indices;
  }
  const auto done = checkpoint::CompletedCheckpoint(*cursor, last, first_range, first->size);
  if (!done.exhausted || done.next != IndexTuple{0, 4, 5} || done.next != last ||
      cursor->Current() != second->start) {
    std::cerr << "finished shard should hold its own last tuple\n";
    return false;
  }
  const auto decoded =
      checkpoint::DecodeCheckpoint(checkpoint::EncodeCheckpoint(done), &error);
  if (!decoded || decoded->range != first_range) {
    std::cerr << "shard range did not survive encoding: " << error << "\n";
    return false;
  }
  if (!checkpoint::CheckpointCoversRange(*decoded, first_range, &error)) {
    std::cerr << "checkpoint should cover its own shard: " << error << "\n";
    return false;
  }
  error.clear();
  if (checkpoint::CheckpointCoversRange(*decoded, second_range, &error) || error.empty()) {
    std::cerr << "checkpoint of shard 0/2 accepted for shard 1/2\n";
    return false;
  }
  if (checkpoint::CheckpointCoversRange(*decoded, RankRange{0, 20}, &error)) {
    std::cerr << "shard checkpoint accepted for the whole space\n";
    return false;
  }

  // A live checkpoint whose position lies outside its range is rejected.
  auto live = checkpoint::CaptureCheckpoint(*cursor, first_range, first->size);
  if (checkpoint::ResumeCursor(vocab, live, &error)) {
    std::cerr << "resumed at a tuple outside the checkpoint range\n";
    return false;
  }
  live.range = second_range;
  live.emitted = 0;
  auto resumed = checkpoint::ResumeCursor(vocab, live, &error);
  if (!resumed || resumed->Current() != second->start) {
    std::cerr << "failed to resume at the start of shard 1/2: " << error << "\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  try {
    const auto vocab = MakeVocabulary(10);
    auto cursor = CombinationCursor::Create(vocab, 4);
    for (int i = 0; i < 25; ++i) {
      cursor->Next();
    }

    const auto path = MakeTempCheckpointPath();
    const RankRange whole{0, 210};
    const auto cp = checkpoint::CaptureCheckpoint(*cursor, whole, 25);
    std::string error;
    if (!checkpoint::SaveCheckpoint(path, cp, &error)) {
      std::cerr << "failed to save checkpoint: " << error << "\n";
      return EXIT_FAILURE;
    }

    const auto json = ReadJsonFile(path);
    if (json.at("format").get<std::string>() != "mnemoscan-checkpoint" ||
        json.at("version").get<int>() != 2 || json.at("vocabulary_size").get<int>() != 10 ||
        json.at("width").get<int>() != 4 || json.at("emitted").get<std::string>() != "25" ||
        json.at("range_begin").get<std::string>() != "0" ||
        json.at("range_end").get<std::string>() != "210" ||
        json.at("exhausted").get<bool>() ||
        json.at("next").get<IndexTuple>() != cursor->Current()) {
      std::cerr << "checkpoint file has unexpected contents: " << json.dump() << "\n";
      return EXIT_FAILURE;
    }

    auto loaded = checkpoint::LoadCheckpoint(path, &error);
    std::filesystem::remove_all(path.parent_path());
    if (!loaded) {
      std::cerr << "failed to load checkpoint: " << error << "\n";
      return EXIT_FAILURE;
    }
    if (loaded->next != cp.next || loaded->emitted != 25 || loaded->width != 4 ||
        loaded->vocabulary_size != 10 || loaded->range != whole || loaded->exhausted) {
      std::cerr << "loaded checkpoint differs from the saved one\n";
      return EXIT_FAILURE;
    }

    // The resumed cursor continues exactly where the live one is.
    auto resumed = checkpoint::ResumeCursor(vocab, *loaded, &error);
    if (!resumed) {
      std::cerr << "failed to resume: " << error << "\n";
      return EXIT_FAILURE;
    }
    while (true) {
      const auto a = cursor->Next();
      const auto b = resumed->Next();
      if (a.phrase != b.phrase || a.has_more != b.has_more) {
        std::cerr << "resumed cursor diverged from the original\n";
        return EXIT_FAILURE;
      }
      if (!a.has_more) {
        break;
      }
    }

    const auto done = checkpoint::CaptureCheckpoint(*cursor, whole, 210);
    if (!done.exhausted || done.next != IndexTuple{6, 7, 8, 9}) {
      std::cerr << "exhausted cursor should checkpoint as exhausted at the last tuple\n";
      return EXIT_FAILURE;
    }
    const auto decoded =
        checkpoint::DecodeCheckpoint(checkpoint::EncodeCheckpoint(done), &error);
    if (!decoded || !decoded->exhausted || decoded->emitted != 210) {
      std::cerr << "exhausted checkpoint did not survive encoding: " << error << "\n";
      return EXIT_FAILURE;
    }

    // A checkpoint only fits the vocabulary it was taken over.
    if (checkpoint::ResumeCursor(MakeVocabulary(11), *loaded, &error) || error.empty()) {
      std::cerr << "resume over a different vocabulary size should fail\n";
      return EXIT_FAILURE;
    }
    auto tampered = *loaded;
    tampered.next = {3, 2, 5, 7};
    if (checkpoint::ResumeCursor(vocab, tampered, &error)) {
      std::cerr << "resume from a non-increasing tuple should fail\n";
      return EXIT_FAILURE;
    }
    tampered.next = {1, 2, 3};
    if (checkpoint::ResumeCursor(vocab, tampered, &error)) {
      std::cerr << "resume with a width mismatch should fail\n";
      return EXIT_FAILURE;
    }

    // Large counters are kept as decimal strings.
    auto big = *loaded;
    if (!mnemoscan::enumerate::ParseCount("11005261717918037175659349191167", &big.emitted)) {
      std::cerr << "failed to parse large counter\n";
      return EXIT_FAILURE;
    }
    const auto big_decoded = checkpoint::DecodeCheckpoint(checkpoint::EncodeCheckpoint(big));
    if (!big_decoded || big_decoded->emitted != big.emitted) {
      std::cerr << "large emitted counter was not preserved\n";
      return EXIT_FAILURE;
    }

    if (!CheckExhaustedCheckpointDoesNotResume() || !CheckShardCheckpoints()) {
      return EXIT_FAILURE;
    }

    const auto valid = nlohmann::json::parse(checkpoint::EncodeCheckpoint(cp));
    auto doc = valid;
    doc["format"] = "something-else";
    if (!ExpectDecodeFailure(doc, "wrong format")) return EXIT_FAILURE;
    doc = valid;
    doc["version"] = 3;
    if (!ExpectDecodeFailure(doc, "future version")) return EXIT_FAILURE;
    doc = valid;
    doc["version"] = 4294967298ULL;
    if (!ExpectDecodeFailure(doc, "version wider than int")) return EXIT_FAILURE;
    doc = valid;
    doc["version"] = -2;
    if (!ExpectDecodeFailure(doc, "negative version")) return EXIT_FAILURE;
    doc = valid;
    doc["range_end"] = "211";
    if (!ExpectDecodeFailure(doc, "range past the space")) return EXIT_FAILURE;
    doc = valid;
    doc["range_begin"] = "210";
    if (!ExpectDecodeFailure(doc, "empty range")) return EXIT_FAILURE;
    doc = valid;
    doc.erase("next");
    if (!ExpectDecodeFailure(doc, "missing next")) return EXIT_FAILURE;
    doc = valid;
    doc["next"] = nlohmann::json::array({0, -1, 2, 3});
    if (!ExpectDecodeFailure(doc, "negative index")) return EXIT_FAILURE;
    doc = valid;
    doc["next"] = nlohmann::json::array({0, 1, 2, 4294967296ULL});
    if (!ExpectDecodeFailure(doc, "index wider than 32 bits")) return EXIT_FAILURE;
    doc = valid;
    doc["emitted"] = 25;
    if (!ExpectDecodeFailure(doc, "numeric emitted")) return EXIT_FAILURE;
    doc = valid;
    doc["range_begin"] = "12x";
    if (!ExpectDecodeFailure(doc, "garbled range")) return EXIT_FAILURE;
    doc = valid;
    doc.erase("exhausted");
    if (!ExpectDecodeFailure(doc, "missing exhausted")) return EXIT_FAILURE;
    if (checkpoint::DecodeCheckpoint("{ not json", &error) || error.empty()) {
      std::cerr << "invalid JSON accepted\n";
      return EXIT_FAILURE;
    }
    if (checkpoint::DecodeCheckpoint("[1, 2, 3]", &error)) {
      std::cerr << "JSON array accepted as checkpoint\n";
      return EXIT_FAILURE;
    }
    if (checkpoint::LoadCheckpoint(path, &error)) {
      std::cerr << "loading a removed checkpoint should fail\n";
      return EXIT_FAILURE;
    }
  } catch (const std::exception& ex) {
    std::cerr << "checkpoint_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  } catch (...) {
    std::cerr << "checkpoint_tests unknown exception\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
