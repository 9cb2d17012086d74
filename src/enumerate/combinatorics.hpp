#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "enumerate/combination_cursor.hpp"

namespace mnemoscan::enumerate {

// C(2048, 12) needs 104 bits.
__extension__ typedef unsigned __int128 Count;

// Exact C(n, k); 0 when k > n. std::nullopt if the value does not fit in
// Count.
std::optional<Count> BinomialCoefficient(std::size_t n, std::size_t k);

// (0, 1, ..., k-1)
IndexTuple FirstCombination(std::size_t k);
// (n-k, ..., n-1); requires k <= n.
IndexTuple LastCombination(std::size_t n, std::size_t k);

// Zero-based position of `tuple` among all k-combinations of n in
// lexicographic order, k being the tuple length. The tuple must satisfy
// ValidateIndexTuple.
std::optional<Count> RankOf(const IndexTuple& tuple, std::size_t n,
                            std::string* error = nullptr);

// Inverse of RankOf. Fails when `rank` >= C(n, k).
std::optional<IndexTuple> TupleAtRank(Count rank, std::size_t n, std::size_t k,
                                      std::string* error = nullptr);

// Decimal conversion for counts that do not fit in 64 bits.
std::string CountToString(Count value);
bool ParseCount(std::string_view text, Count* out);

}  // namespace mnemoscan::enumerate
