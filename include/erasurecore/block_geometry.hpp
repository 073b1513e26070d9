#ifndef ERASURECORE_BLOCK_GEOMETRY_HPP
#define ERASURECORE_BLOCK_GEOMETRY_HPP

#include <cstdint>

namespace erasurecore {

struct BlockInfo {
  int64_t startBlock{0};
  int64_t endBlock{0};
  int64_t bytesToSkip{0};
};

/**
 * @brief Locate a byte range within fixed-size blocks.
 *
 * startBlock and bytesToSkip come from offset. endBlock is
 * length / blockSize, not (offset + length) / blockSize; read loops
 * pair it with their own remaining-length counter.
 *
 * @pre blockSize > 0.
 */
BlockInfo getBlockInfo(int64_t offset, int64_t length, int64_t blockSize);

/**
 * @brief Per-shard size needed to spread inputLen bytes over dataBlocks.
 *
 * Rounds up, so the result times dataBlocks is the smallest multiple of
 * dataBlocks that is >= inputLen.
 *
 * @pre dataBlocks >= 1.
 */
int64_t getEncodedBlockLen(int64_t inputLen, int dataBlocks);

} // namespace erasurecore

#endif // ERASURECORE_BLOCK_GEOMETRY_HPP
