#ifndef ERASURECORE_SHARD_ASSEMBLER_HPP
#define ERASURECORE_SHARD_ASSEMBLER_HPP

#include <cstddef> // For std::byte
#include <cstdint>
#include <vector>

#include "erasurecore/byte_sink.hpp"

namespace erasurecore {

/// Shards of one encoded block: data shards first, then parity shards.
using EncodedBlocks = std::vector<std::vector<std::byte>>;

/**
 * @brief Total number of bytes held by the first dataBlocks shards.
 * @pre enBlocks.size() >= dataBlocks.
 */
int64_t getDataBlockLen(const EncodedBlocks &enBlocks, size_t dataBlocks);

/**
 * @brief Write outSize bytes of the concatenated data shards to dst,
 *        skipping the first outOffset bytes.
 *
 * Parity shards are never read. The returned count never exceeds
 * outSize and equals it whenever the data shards extend to
 * outOffset + outSize.
 *
 * @throw ErasureCoreError INSUFFICIENT_SHARDS when fewer than dataBlocks
 *        shards are present, INSUFFICIENT_DATA when the data shards hold
 *        fewer than outSize bytes, SHORT_WRITE when dst rejects bytes.
 * @throw std::invalid_argument if outOffset or outSize is negative.
 */
int64_t writeDataBlocks(ByteSink &dst, const EncodedBlocks &enBlocks,
                        size_t dataBlocks, int64_t outOffset, int64_t outSize);

} // namespace erasurecore

#endif // ERASURECORE_SHARD_ASSEMBLER_HPP
