#include "enumerate/shard.hpp"

#include <algorithm>
#include <charconv>
#include <system_error>
#include <utility>

namespace mnemoscan::enumerate {

namespace {

bool ParseSize(std::string_view text, std::size_t* out) {
  if (text.empty()) {
    return false;
  }
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(first, last, *out);
  return ec == std::errc() && ptr == last;
}

}  // namespace

std::optional<Shard> ShardAt(std::size_t n, std::size_t k, std::size_t shard_count,
                             std::size_t index, std::string* error) {
  if (shard_count == 0) {
    if (error) {
      *error = "shard count must be positive";
    }
    return std::nullopt;
  }
  if (index >= shard_count) {
    if (error) {
      *error = "shard index " + std::to_string(index) + " is outside 0.." +
               std::to_string(shard_count - 1);
    }
    return std::nullopt;
  }
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

  const Count count = static_cast<Count>(shard_count);
  const Count position = static_cast<Count>(index);
  const Count base = *total / count;
  const Count extra = *total % count;

  Shard shard;
  shard.index = index;
  // index * base <= total, so neither term overflows.
  shard.begin_rank = position * base + std::min(position, extra);
  shard.size = base + (position < extra ? 1 : 0);
  if (shard.size == 0) {
    return shard;
  }
  auto start = TupleAtRank(shard.begin_rank, n, k, error);
  if (!start) {
    return std::nullopt;
  }
  shard.start = std::move(*start);
  return shard;
}

std::optional<std::vector<Shard>> PlanShards(std::size_t n, std::size_t k,
                                             std::size_t shard_count, std::string* error) {
  if (shard_count == 0) {
    if (error) {
      *error = "shard count must be positive";
    }
    return std::nullopt;
  }
  std::vector<Shard> shards;
  for (std::size_t i = 0; i < shard_count; ++i) {
    auto shard = ShardAt(n, k, shard_count, i, error);
    if (!shard) {
      return std::nullopt;
    }
    if (shard->size == 0) {
      break;
    }
    shards.push_back(std::move(*shard));
  }
  return shards;
}

std::optional<std::pair<std::size_t, std::size_t>> ParseShardSpec(std::string_view spec,
                                                                  std::string* error) {
  const auto slash = spec.find('/');
  std::size_t index = 0;
  std::size_t count = 0;
  if (slash == std::string_view::npos || !ParseSize(spec.substr(0, slash), &index) ||
      !ParseSize(spec.substr(slash + 1), &count)) {
    if (error) {
      *error = "shard must be given as INDEX/COUNT: " + std::string(spec);
    }
    return std::nullopt;
  }
  if (count == 0 || index >= count) {
    if (error) {
      *error = "shard index " + std::to_string(index) + " is outside 0.." +
               (count == 0 ? std::string("?") : std::to_string(count - 1));
    }
    return std::nullopt;
  }
  return std::make_pair(index, count);
}

}  // namespace mnemoscan::enumerate
