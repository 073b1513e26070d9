#include "erasurecore/block_geometry.hpp"

namespace erasurecore {

BlockInfo getBlockInfo(int64_t offset, int64_t length, int64_t blockSize) {
  BlockInfo info;
  info.startBlock = offset / blockSize;
  info.bytesToSkip = offset % blockSize;
  info.endBlock = length / blockSize;
  return info;
}

int64_t getEncodedBlockLen(int64_t inputLen, int dataBlocks) {
  return (inputLen + static_cast<int64_t>(dataBlocks) - 1) /
         static_cast<int64_t>(dataBlocks);
}

} // namespace erasurecore
