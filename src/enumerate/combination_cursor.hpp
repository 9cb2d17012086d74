#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mnemoscan::enumerate {

// Default tuple width: a 12-word mnemonic.
constexpr std::size_t kDefaultWidth = 12;

// Strictly increasing indices into a vocabulary.
using IndexTuple = std::vector<std::uint32_t>;
using MnemonicPhrase = std::vector<std::string>;

struct CursorStep {
  MnemonicPhrase phrase;
  bool has_more{false};
};

struct IndexStep {
  IndexTuple indices;
  bool has_more{false};
};

// Returns true when `tuple` has exactly `width` entries, every entry is below
// `vocabulary_size` and the entries are strictly increasing. On failure a
// human-readable reason is written to `error`.
bool ValidateIndexTuple(const IndexTuple& tuple, std::size_t vocabulary_size,
                        std::size_t width, std::string* error = nullptr);

// Map every index through the vocabulary. Indices must be in range.
MnemonicPhrase MaterializePhrase(const std::vector<std::string>& vocabulary,
                                 const IndexTuple& tuple);

// CombinationCursor walks the k-combinations of a vocabulary in
// lexicographic order. Each call to Next() yields the current tuple and then
// moves to its successor, so the first call returns the construction-time
// tuple. The current tuple is the complete enumeration state: a cursor built
// from Current() produces the same remaining sequence.
//
// The cursor keeps a pointer to the vocabulary; the caller must keep it alive
// and unmodified for the cursor's lifetime. Distinct cursors may share one
// vocabulary across threads.
class CombinationCursor {
 public:
  // Build a cursor over `vocabulary` yielding tuples of `width` indices.
  // Without `start` the cursor begins at (0, 1, ..., width-1). Returns
  // std::nullopt for width 0, a vocabulary smaller than `width`, or an
  // invalid start tuple.
  static std::optional<CombinationCursor> Create(
      const std::vector<std::string>& vocabulary, std::size_t width,
      std::optional<IndexTuple> start = std::nullopt,
      std::string* error = nullptr);

  // Yield the phrase for the current tuple and advance. `has_more` is false
  // when the yielded tuple was the last combination; further calls keep
  // returning that tuple with `has_more` false.
  CursorStep Next();

  // Same as Next() without the index-to-word mapping.
  IndexStep NextIndices();

  // Tuple the next call will yield.
  const IndexTuple& Current() const { return current_; }
  bool Exhausted() const { return exhausted_; }
  std::size_t VocabularySize() const { return vocabulary_->size(); }
  std::size_t Width() const { return current_.size(); }

 private:
  CombinationCursor(const std::vector<std::string>* vocabulary, IndexTuple start);

  bool AtLastCombination() const;
  // Move current_ to its lexicographic successor. Returns false when no
  // position can be incremented.
  bool Advance();

  const std::vector<std::string>* vocabulary_;
  IndexTuple current_;
  bool exhausted_{false};
};

}  // namespace mnemoscan::enumerate
