#include "erasurecore/stress_utils.hpp"
#include "erasurecore/block_geometry.hpp"

#include <algorithm>
#include <bitset>
#include <random>

namespace erasurecore {

std::vector<std::byte> generate_pseudo_random_data(std::size_t size,
                                                   unsigned int seed) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> dist(0, 255);

  std::vector<std::byte> buffer(size);
  for (std::size_t i = 0; i < size; ++i) {
    buffer[i] = static_cast<std::byte>(dist(rng));
  }
  return buffer;
}

std::vector<std::vector<std::byte>>
split_into_data_shards(const std::vector<std::byte> &data, int dataBlocks) {
  const auto shardLen = static_cast<std::size_t>(
      getEncodedBlockLen(static_cast<int64_t>(data.size()), dataBlocks));
  std::vector<std::vector<std::byte>> shards(
      static_cast<std::size_t>(dataBlocks),
      std::vector<std::byte>(shardLen, std::byte{0}));

  std::size_t offset = 0;
  for (auto &shard : shards) {
    if (offset >= data.size())
      break;
    std::size_t n = std::min(shardLen, data.size() - offset);
    std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), n,
                shard.begin());
    offset += n;
  }
  return shards;
}

std::size_t count_bit_errors(const std::vector<std::byte> &expected,
                             const std::vector<std::byte> &actual) {
  std::size_t errors = 0;

  std::size_t min_size = std::min(expected.size(), actual.size());
  for (std::size_t i = 0; i < min_size; ++i) {
    // XOR reveals all differing bits in the current byte.
    auto diff = std::to_integer<unsigned>(expected[i] ^ actual[i]);
    errors += std::bitset<8>(diff).count();
  }

  if (expected.size() > actual.size()) {
    errors += (expected.size() - actual.size()) * 8;
  } else if (actual.size() > expected.size()) {
    errors += (actual.size() - expected.size()) * 8;
  }
  return errors;
}

} // namespace erasurecore
