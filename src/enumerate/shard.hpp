#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "enumerate/combination_cursor.hpp"
#include "enumerate/combinatorics.hpp"

namespace mnemoscan::enumerate {

// A contiguous run of the lexicographic combination order. A cursor created
// at `start` and pulled `size` times yields exactly this shard.
struct Shard {
  std::size_t index{0};
  Count begin_rank{0};
  Count size{0};
  IndexTuple start;
};

// Shard `index` of `shard_count` over the k-combinations of n, computed
// without planning the others. The first C(n, k) % shard_count shards hold
// one extra combination. When shard_count exceeds C(n, k) the trailing
// shards have size 0 and an empty start.
std::optional<Shard> ShardAt(std::size_t n, std::size_t k, std::size_t shard_count,
                             std::size_t index, std::string* error = nullptr);

// Split all k-combinations of n into at most `shard_count` shards whose sizes
// differ by at most one. Shards that would be empty (shard_count > C(n, k))
// are omitted.
std::optional<std::vector<Shard>> PlanShards(std::size_t n, std::size_t k,
                                             std::size_t shard_count,
                                             std::string* error = nullptr);

// Parse "I/N" into {I, N} with N > 0 and I < N.
std::optional<std::pair<std::size_t, std::size_t>> ParseShardSpec(std::string_view spec,
                                                                  std::string* error = nullptr);

}  // namespace mnemoscan::enumerate
