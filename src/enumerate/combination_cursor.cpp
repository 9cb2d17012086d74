#include "enumerate/combination_cursor.hpp"

#include <stdexcept>
#include <utility>

namespace mnemoscan::enumerate {

bool ValidateIndexTuple(const IndexTuple& tuple, std::size_t vocabulary_size,
                        std::size_t width, std::string* error) {
  if (error) {
    error->clear();
  }
  if (tuple.size() != width) {
    if (error) {
      *error = "start tuple has " + std::to_string(tuple.size()) +
               " indices, expected " + std::to_string(width);
    }
    return false;
  }
  for (std::size_t i = 0; i < tuple.size(); ++i) {
    if (tuple[i] >= vocabulary_size) {
      if (error) {
        *error = "index " + std::to_string(tuple[i]) + " at position " + std::to_string(i) +
                 " is outside the vocabulary of " + std::to_string(vocabulary_size) + " words";
      }
      return false;
    }
    if (i > 0 && tuple[i] <= tuple[i - 1]) {
      if (error) {
        *error = tuple[i] == tuple[i - 1]
                     ? "index " + std::to_string(tuple[i]) + " is repeated at position " +
                           std::to_string(i)
                     : "indices decrease at position " + std::to_string(i);
      }
      return false;
    }
  }
  return true;
}

MnemonicPhrase MaterializePhrase(const std::vector<std::string>& vocabulary,
                                 const IndexTuple& tuple) {
  MnemonicPhrase phrase;
  phrase.reserve(tuple.size());
  for (const auto index : tuple) {
    phrase.push_back(vocabulary[index]);
  }
  return phrase;
}

std::optional<CombinationCursor> CombinationCursor::Create(
    const std::vector<std::string>& vocabulary, std::size_t width,
    std::optional<IndexTuple> start, std::string* error) {
  if (error) {
    error->clear();
  }
  if (width == 0) {
    if (error) {
      *error = "combination width must be positive";
    }
    return std::nullopt;
  }
  if (vocabulary.size() < width) {
    if (error) {
      *error = "vocabulary of " + std::to_string(vocabulary.size()) +
               " words cannot form combinations of " + std::to_string(width);
    }
    return std::nullopt;
  }
  IndexTuple initial;
  if (start) {
    if (!ValidateIndexTuple(*start, vocabulary.size(), width, error)) {
      return std::nullopt;
    }
    initial = std::move(*start);
  } else {
    initial.resize(width);
    for (std::size_t i = 0; i < width; ++i) {
      initial[i] = static_cast<std::uint32_t>(i);
    }
  }
  return CombinationCursor(&vocabulary, std::move(initial));
}

CombinationCursor::CombinationCursor(const std::vector<std::string>* vocabulary,
                                     IndexTuple start)
    : vocabulary_(vocabulary), current_(std::move(start)) {}

CursorStep CombinationCursor::Next() {
  auto step = NextIndices();
  return CursorStep{MaterializePhrase(*vocabulary_, step.indices), step.has_more};
}

IndexStep CombinationCursor::NextIndices() {
  IndexStep step{current_, false};
  if (exhausted_) {
    return step;
  }
  const bool last = AtLastCombination();
  const bool advanced = !last && Advance();
  if (!last && !advanced) {
    throw std::logic_error("combination cursor has no successor before the last combination");
  }
  exhausted_ = last;
  step.has_more = advanced;
  return step;
}

bool CombinationCursor::AtLastCombination() const {
  const std::size_t n = vocabulary_->size();
  const std::size_t k = current_.size();
  for (std::size_t i = 0; i < k; ++i) {
    if (current_[i] != n - k + i) {
      return false;
    }
  }
  return true;
}

bool CombinationCursor::Advance() {
  const std::size_t n = vocabulary_->size();
  const std::size_t k = current_.size();
  // Position i can hold at most n - k + i.
  for (std::size_t pos = k; pos > 0; --pos) {
    const std::size_t i = pos - 1;
    if (current_[i] < n - k + i) {
      ++current_[i];
      for (std::size_t j = i + 1; j < k; ++j) {
        current_[j] = current_[j - 1] + 1;
      }
      return true;
    }
  }
  return false;
}

}  // namespace mnemoscan::enumerate
