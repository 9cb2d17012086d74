#include "checkpoint/cursor_checkpoint.hpp"

#include <cstdint>
#include <exception>
#include <fstream>
#include <limits>
#include <sstream>
#include <utility>

#include "nlohmann/json.hpp"
#include "util/atomic_file.hpp"

namespace mnemoscan::checkpoint {

namespace {

bool ReadCount(const nlohmann::json& doc, const char* key, enumerate::Count* out,
               std::string* error) {
  const auto it = doc.find(key);
  if (it == doc.end() || !it->is_string() ||
      !enumerate::ParseCount(it->get<std::string>(), out)) {
    if (error) {
      *error = std::string("checkpoint field '") + key + "' must be a decimal string";
    }
    return false;
  }
  return true;
}

bool ReadSize(const nlohmann::json& doc, const char* key, std::size_t* out,
              std::string* error) {
  const auto it = doc.find(key);
  if (it == doc.end() || !it->is_number_unsigned()) {
    if (error) {
      *error = std::string("checkpoint field '") + key + "' must be an unsigned integer";
    }
    return false;
  }
  *out = it->get<std::size_t>();
  return true;
}

}  // namespace

CursorCheckpoint CaptureCheckpoint(const enumerate::CombinationCursor& cursor, RankRange range,
                                   enumerate::Count emitted) {
  CursorCheckpoint checkpoint;
  checkpoint.vocabulary_size = cursor.VocabularySize();
  checkpoint.width = cursor.Width();
  checkpoint.range = range;
  checkpoint.next = cursor.Current();
  checkpoint.emitted = emitted;
  checkpoint.exhausted = cursor.Exhausted();
  return checkpoint;
}

CursorCheckpoint CompletedCheckpoint(const enumerate::CombinationCursor& cursor,
                                     enumerate::IndexTuple last, RankRange range,
                                     enumerate::Count emitted) {
  auto checkpoint = CaptureCheckpoint(cursor, range, emitted);
  checkpoint.next = std::move(last);
  checkpoint.exhausted = true;
  return checkpoint;
}

bool CheckpointCoversRange(const CursorCheckpoint& checkpoint, const RankRange& expected,
                           std::string* error) {
  if (checkpoint.range == expected) {
    return true;
  }
  if (error) {
    *error = "checkpoint covers ranks " + enumerate::CountToString(checkpoint.range.begin) +
             ".." + enumerate::CountToString(checkpoint.range.end) + " but this run covers " +
             enumerate::CountToString(expected.begin) + ".." +
             enumerate::CountToString(expected.end);
  }
  return false;
}

std::string EncodeCheckpoint(const CursorCheckpoint& checkpoint) {
  nlohmann::json doc;
  doc["format"] = std::string(kCheckpointFormat);
  doc["version"] = kCheckpointVersion;
  doc["vocabulary_size"] = checkpoint.vocabulary_size;
  doc["width"] = checkpoint.width;
  doc["range_begin"] = enumerate::CountToString(checkpoint.range.begin);
  doc["range_end"] = enumerate::CountToString(checkpoint.range.end);
  doc["next"] = checkpoint.next;
  doc["emitted"] = enumerate::CountToString(checkpoint.emitted);
  doc["exhausted"] = checkpoint.exhausted;
  return doc.dump(2);
}

std::optional<CursorCheckpoint> DecodeCheckpoint(std::string_view text, std::string* error) {
  if (error) {
    error->clear();
  }
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(text.begin(), text.end());
  } catch (const std::exception& ex) {
    if (error) {
      *error = "failed to parse checkpoint: " + std::string(ex.what());
    }
    return std::nullopt;
  }
  if (!doc.is_object()) {
    if (error) {
      *error = "checkpoint must be a JSON object";
    }
    return std::nullopt;
  }
  const auto format = doc.find("format");
  if (format == doc.end() || !format->is_string() ||
      format->get<std::string>() != kCheckpointFormat) {
    if (error) {
      *error = "not a mnemoscan checkpoint";
    }
    return std::nullopt;
  }
  const auto version = doc.find("version");
  if (version == doc.end() || !version->is_number_unsigned() ||
      version->get<std::uint64_t>() != kCheckpointVersion) {
    if (error) {
      *error = "unsupported checkpoint version";
    }
    return std::nullopt;
  }

  CursorCheckpoint checkpoint;
  if (!ReadSize(doc, "vocabulary_size", &checkpoint.vocabulary_size, error) ||
      !ReadSize(doc, "width", &checkpoint.width, error) ||
      !ReadCount(doc, "range_begin", &checkpoint.range.begin, error) ||
      !ReadCount(doc, "range_end", &checkpoint.range.end, error) ||
      !ReadCount(doc, "emitted", &checkpoint.emitted, error)) {
    return std::nullopt;
  }
  const auto total = enumerate::BinomialCoefficient(checkpoint.vocabulary_size, checkpoint.width);
  if (!total || checkpoint.range.begin >= checkpoint.range.end ||
      checkpoint.range.end > *total) {
    if (error) {
      *error = "checkpoint range is empty or exceeds the combination space";
    }
    return std::nullopt;
  }
  const auto next = doc.find("next");
  if (next == doc.end() || !next->is_array()) {
    if (error) {
      *error = "checkpoint field 'next' must be an array";
    }
    return std::nullopt;
  }
  for (const auto& item : *next) {
    if (!item.is_number_unsigned() ||
        item.get<std::uint64_t>() > std::numeric_limits<std::uint32_t>::max()) {
      if (error) {
        *error = "checkpoint field 'next' must hold 32-bit unsigned indices";
      }
      return std::nullopt;
    }
    checkpoint.next.push_back(item.get<std::uint32_t>());
  }
  const auto exhausted = doc.find("exhausted");
  if (exhausted == doc.end() || !exhausted->is_boolean()) {
    if (error) {
      *error = "checkpoint field 'exhausted' must be a boolean";
    }
    return std::nullopt;
  }
  checkpoint.exhausted = exhausted->get<bool>();
  return checkpoint;
}

bool SaveCheckpoint(const std::filesystem::path& path, const CursorCheckpoint& checkpoint,
                    std::string* error) {
  return util::AtomicWriteText(path, EncodeCheckpoint(checkpoint) + "\n", error);
}

std::optional<CursorCheckpoint> LoadCheckpoint(const std::filesystem::path& path,
                                               std::string* error) {
  std::ifstream in(path);
  if (!in) {
    if (error) {
      *error = "failed to open checkpoint file for read: " + path.string();
    }
    return std::nullopt;
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return DecodeCheckpoint(buffer.str(), error);
}

std::optional<enumerate::CombinationCursor> ResumeCursor(
    const std::vector<std::string>& vocabulary, const CursorCheckpoint& checkpoint,
    std::string* error) {
  if (checkpoint.vocabulary_size != vocabulary.size()) {
    if (error) {
      *error = "checkpoint was taken over " + std::to_string(checkpoint.vocabulary_size) +
               " words but the word list has " + std::to_string(vocabulary.size());
    }
    return std::nullopt;
  }
  if (checkpoint.exhausted) {
    if (error) {
      *error = "checkpoint is already complete";
    }
    return std::nullopt;
  }
  if (checkpoint.width != checkpoint.next.size()) {
    if (error) {
      *error = "checkpoint width " + std::to_string(checkpoint.width) +
               " does not match its tuple of " + std::to_string(checkpoint.next.size());
    }
    return std::nullopt;
  }
  auto cursor = enumerate::CombinationCursor::Create(vocabulary, checkpoint.width,
                                                     checkpoint.next, error);
  if (!cursor) {
    return std::nullopt;
  }
  const auto rank = enumerate::RankOf(checkpoint.next, vocabulary.size(), error);
  if (!rank) {
    return std::nullopt;
  }
  if (*rank < checkpoint.range.begin || *rank >= checkpoint.range.end) {
    if (error) {
      *error = "checkpoint position " + enumerate::CountToString(*rank) +
               " lies outside its range";
    }
    return std::nullopt;
  }
  return cursor;
}

}  // namespace mnemoscan::checkpoint
