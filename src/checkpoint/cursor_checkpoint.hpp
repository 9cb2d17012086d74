#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "enumerate/combination_cursor.hpp"
#include "enumerate/combinatorics.hpp"

namespace mnemoscan::checkpoint {

constexpr std::string_view kCheckpointFormat = "mnemoscan-checkpoint";
constexpr std::uint64_t kCheckpointVersion = 2;

// Half-open span [begin, end) of lexicographic ranks a run covers: the whole
// space, the tail after an explicit start tuple, or one shard.
struct RankRange {
  enumerate::Count begin{0};
  enumerate::Count end{0};

  bool operator==(const RankRange&) const = default;
};

// Saved enumeration position inside `range`. `next` is the tuple the resumed
// cursor yields first; once `exhausted` is set every tuple of the range has
// been produced and `next` holds the last one.
struct CursorCheckpoint {
  std::size_t vocabulary_size{0};
  std::size_t width{0};
  RankRange range;
  enumerate::IndexTuple next;
  enumerate::Count emitted{0};
  bool exhausted{false};
};

CursorCheckpoint CaptureCheckpoint(const enumerate::CombinationCursor& cursor, RankRange range,
                                   enumerate::Count emitted);

// Checkpoint for a run whose range is finished; `last` is the final tuple
// the run yielded.
CursorCheckpoint CompletedCheckpoint(const enumerate::CombinationCursor& cursor,
                                     enumerate::IndexTuple last, RankRange range,
                                     enumerate::Count emitted);

// False, with the reason in `error`, when the checkpoint was taken over a
// different range than `expected`.
bool CheckpointCoversRange(const CursorCheckpoint& checkpoint, const RankRange& expected,
                           std::string* error = nullptr);

std::string EncodeCheckpoint(const CursorCheckpoint& checkpoint);
std::optional<CursorCheckpoint> DecodeCheckpoint(std::string_view text,
                                                 std::string* error = nullptr);

// Writes are atomic: an interrupted save leaves the previous file intact.
bool SaveCheckpoint(const std::filesystem::path& path, const CursorCheckpoint& checkpoint,
                    std::string* error = nullptr);
std::optional<CursorCheckpoint> LoadCheckpoint(const std::filesystem::path& path,
                                               std::string* error = nullptr);

// Rebuild a cursor positioned at `checkpoint.next`. Fails when the checkpoint
// is exhausted, was taken over a vocabulary of a different size or a
// different width, or when `next` lies outside its range.
std::optional<enumerate::CombinationCursor> ResumeCursor(
    const std::vector<std::string>& vocabulary, const CursorCheckpoint& checkpoint,
    std::string* error = nullptr);

}  // namespace mnemoscan::checkpoint
