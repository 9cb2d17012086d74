#include "enumerate/combinatorics.hpp"

#include <algorithm>
#include <string>

namespace mnemoscan::enumerate {

namespace {

constexpr Count kCountMax = ~static_cast<Count>(0);

// BinomialCoefficient for callers that have already bounded n and k by a
// total that is known to fit.
Count BinomialOrZero(std::size_t n, std::size_t k) {
  auto value = BinomialCoefficient(n, k);
  return value ? *value : 0;
}

}  // namespace

std::optional<Count> BinomialCoefficient(std::size_t n, std::size_t k) {
  if (k > n) {
    return Count{0};
  }
  k = std::min(k, n - k);
  Count result = 1;
  for (std::size_t i = 0; i < k; ++i) {
    // result == C(n, i) here; C(n, i+1) = C(n, i) * (n - i) / (i + 1) is exact.
    const Count factor = static_cast<Count>(n - i);
    if (result > kCountMax / factor) {
      return std::nullopt;
    }
    result = result * factor / static_cast<Count>(i + 1);
  }
  return result;
}

IndexTuple FirstCombination(std::size_t k) {
  IndexTuple tuple(k);
  for (std::size_t i = 0; i < k; ++i) {
    tuple[i] = static_cast<std::uint32_t>(i);
  }
  return tuple;
}

IndexTuple LastCombination(std::size_t n, std::size_t k) {
  IndexTuple tuple(k);
  for (std::size_t i = 0; i < k; ++i) {
    tuple[i] = static_cast<std::uint32_t>(n - k + i);
  }
  return tuple;
}

std::optional<Count> RankOf(const IndexTuple& tuple, std::size_t n, std::string* error) {
  const std::size_t k = tuple.size();
  if (k == 0 || n < k) {
    if (error) {
      *error = "no combinations of " + std::to_string(k) + " out of " + std::to_string(n);
    }
    return std::nullopt;
  }
  if (!ValidateIndexTuple(tuple, n, k, error)) {
    return std::nullopt;
  }
  if (!BinomialCoefficient(n, k)) {
    if (error) {
      *error = "combination count overflows 128 bits";
    }
    return std::nullopt;
  }
  // Tuples that agree up to position i and hold a smaller value there are
  // counted with the hockey-stick identity:
  //   sum_{v=lo}^{c-1} C(n-1-v, k-1-i) = C(n-lo, k-i) - C(n-c, k-i)
  Count rank = 0;
  std::size_t lower = 0;
  for (std::size_t i = 0; i < k; ++i) {
    const std::size_t value = tuple[i];
    rank += BinomialOrZero(n - lower, k - i) - BinomialOrZero(n - value, k - i);
    lower = value + 1;
  }
  return rank;
}

std::optional<IndexTuple> TupleAtRank(Count rank, std::size_t n, std::size_t k,
                                      std::string* error) {
  if (k == 0 || n < k) {
    if (error) {
      *error = "no combinations of " + std::to_string(k) + " out of " + std::to_string(n);
    }
    return std::nullopt;
  }
  const auto total = BinomialCoefficient(n, k);
  if (!total) {
    if (error) {
      *error = "combination count overflows 128 bits";
    }
    return std::nullopt;
  }
  if (rank >= *total) {
    if (error) {
      *error = "rank " + CountToString(rank) + " is beyond the last combination (" +
               CountToString(*total) + " total)";
    }
    return std::nullopt;
  }
  IndexTuple tuple(k);
  std::size_t value = 0;
  for (std::size_t i = 0; i < k; ++i) {
    for (;; ++value) {
      const Count block = BinomialOrZero(n - 1 - value, k - 1 - i);
      if (rank < block) {
        break;
      }
      rank -= block;
    }
    tuple[i] = static_cast<std::uint32_t>(value);
    ++value;
  }
  return tuple;
}

std::string CountToString(Count value) {
  if (value == 0) {
    return "0";
  }
  std::string out;
  while (value > 0) {
    out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
    value /= 10;
  }
  std::reverse(out.begin(), out.end());
  return out;
}

bool ParseCount(std::string_view text, Count* out) {
  if (text.empty()) {
    return false;
  }
  Count value = 0;
  for (char ch : text) {
    if (ch < '0' || ch > '9') {
      return false;
    }
    const Count digit = static_cast<Count>(ch - '0');
    if (value > (kCountMax - digit) / 10) {
      return false;
    }
    value = value * 10 + digit;
  }
  *out = value;
  return true;
}

}  // namespace mnemoscan::enumerate
