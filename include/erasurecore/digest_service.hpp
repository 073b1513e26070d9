#ifndef ERASURECORE_DIGEST_SERVICE_HPP
#define ERASURECORE_DIGEST_SERVICE_HPP

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "erasurecore/hash_accumulator.hpp"
#include "erasurecore/storage_device.hpp"

namespace erasurecore {

/**
 * @brief Hash the whole of volume/path and return the final digest.
 *
 * Streams the file through writer with copyBuffer and a freshly
 * allocated READ_SIZE_V1 staging buffer, then finalizes writer. An
 * empty file yields the algorithm's digest of empty input.
 *
 * @throw ErasureCoreError whatever copyBuffer throws; writer is left
 *        unfinalized in that case and no digest is produced.
 */
std::vector<uint8_t> hashSum(StorageDevice &disk, const std::string &volume,
                             const std::string &path, HashAccumulator &writer,
                             const std::atomic<bool> *cancelled = nullptr);

} // namespace erasurecore

#endif // ERASURECORE_DIGEST_SERVICE_HPP
