#ifndef ERASURECORE_STRESS_UTILS_HPP
#define ERASURECORE_STRESS_UTILS_HPP

#include <cstddef>
#include <vector>

// Helpers shared by the unit tests and benchmarks for building
// reproducible payloads and shard sets.

namespace erasurecore {

/**
 * @brief Generate deterministic pseudo-random data.
 *
 * Uses a Mersenne Twister engine so runs are reproducible across
 * platforms.
 *
 * @param size  Number of bytes to generate.
 * @param seed  Seed value for the generator.
 */
std::vector<std::byte> generate_pseudo_random_data(std::size_t size,
                                                   unsigned int seed = 0xDEADBEEF);

/**
 * @brief Split data into dataBlocks shards of getEncodedBlockLen bytes.
 *
 * The final shards are zero padded the way an erasure encoder pads
 * them. No parity shards are produced.
 */
std::vector<std::vector<std::byte>>
split_into_data_shards(const std::vector<std::byte> &data, int dataBlocks);

/**
 * @brief Count differing bits between two buffers.
 *
 * Bytes present in only one buffer count as eight differing bits each.
 */
std::size_t count_bit_errors(const std::vector<std::byte> &expected,
                             const std::vector<std::byte> &actual);

} // namespace erasurecore

#endif // ERASURECORE_STRESS_UTILS_HPP
