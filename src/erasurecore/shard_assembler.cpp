#include "erasurecore/shard_assembler.hpp"
#include "erasurecore/errors.hpp"
#include "erasurecore/logger.h"
#include "erasurecore/metrics.h"

#include <span>
#include <stdexcept>
#include <string>

namespace erasurecore {

int64_t getDataBlockLen(const EncodedBlocks &enBlocks, size_t dataBlocks) {
  int64_t size = 0;
  for (size_t i = 0; i < dataBlocks; ++i) {
    size += static_cast<int64_t>(enBlocks[i].size());
  }
  return size;
}

static size_t writeShard(ByteSink &dst, std::span<const std::byte> block) {
  if (block.empty())
    return 0;
  size_t n = dst.write(block);
  if (n != block.size()) {
    throw ErasureCoreError(ErrorKind::SHORT_WRITE,
                           "sink accepted " + std::to_string(n) + " of " +
                               std::to_string(block.size()) + " shard bytes");
  }
  return n;
}

int64_t writeDataBlocks(ByteSink &dst, const EncodedBlocks &enBlocks,
                        size_t dataBlocks, int64_t outOffset,
                        int64_t outSize) {
  if (outOffset < 0 || outSize < 0) {
    throw std::invalid_argument("writeDataBlocks: negative offset or size");
  }

  // Do we have enough blocks?
  if (enBlocks.size() < dataBlocks) {
    throw ErasureCoreError(ErrorKind::INSUFFICIENT_SHARDS,
                           "have " + std::to_string(enBlocks.size()) +
                               " shards, need " + std::to_string(dataBlocks));
  }

  // Do we have enough data?
  const int64_t available = getDataBlockLen(enBlocks, dataBlocks);
  if (available < outSize) {
    throw ErasureCoreError(ErrorKind::INSUFFICIENT_DATA,
                           "data shards hold " + std::to_string(available) +
                               " bytes, " + std::to_string(outSize) +
                               " requested");
  }

  int64_t write = outSize;
  int64_t totalWritten = 0;

  for (size_t i = 0; i < dataBlocks; ++i) {
    std::span<const std::byte> block(enBlocks[i]);

    // Skip whole shards until we reach the offset.
    if (outOffset >= static_cast<int64_t>(block.size())) {
      outOffset -= static_cast<int64_t>(block.size());
      continue;
    }
    block = block.subspan(static_cast<size_t>(outOffset));
    outOffset = 0;

    // This shard covers what is left: write its prefix and stop.
    if (write <= static_cast<int64_t>(block.size())) {
      totalWritten += static_cast<int64_t>(
          writeShard(dst, block.first(static_cast<size_t>(write))));
      break;
    }

    size_t n = writeShard(dst, block);
    write -= static_cast<int64_t>(n);
    totalWritten += static_cast<int64_t>(n);
  }

  if (totalWritten < outSize) {
    Logger::getInstance().log(
        LogLevel::WARN, "writeDataBlocks produced " +
                            std::to_string(totalWritten) + " of " +
                            std::to_string(outSize) +
                            " bytes; offset lies past the data shards");
  }
  MetricsRegistry::instance().incrementCounter(
      "erasurecore_assembled_bytes_total", static_cast<double>(totalWritten));
  return totalWritten;
}

} // namespace erasurecore
