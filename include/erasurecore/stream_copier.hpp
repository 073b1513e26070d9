#ifndef ERASURECORE_STREAM_COPIER_HPP
#define ERASURECORE_STREAM_COPIER_HPP

#include <atomic>
#include <cstddef> // For std::byte
#include <cstdint>
#include <span>
#include <string>

#include "erasurecore/byte_sink.hpp"
#include "erasurecore/storage_device.hpp"

namespace erasurecore {

/// Staging buffer size used for every device copy (128 KiB).
inline constexpr size_t READ_SIZE_V1 = 128 * 1024;

/**
 * @brief Copy volume/path from offset 0 into writer until the device
 *        reports end of stream.
 *
 * Both END_OF_STREAM and UNEXPECTED_END_OF_STREAM end the copy
 * successfully, after any bytes delivered with them are written. Reads
 * are staged through buf, which the caller owns for the whole call.
 *
 * @param cancelled Optional flag checked before every read.
 * @throw ErasureCoreError INVALID_BUFFER if buf is empty (no I/O is
 *        attempted), SHORT_WRITE if writer accepts fewer bytes than
 *        offered, DEVICE_READ_ERROR for any other device failure,
 *        CANCELLED if the flag is raised.
 */
void copyBuffer(ByteSink &writer, StorageDevice &disk,
                const std::string &volume, const std::string &path,
                std::span<std::byte> buf,
                const std::atomic<bool> *cancelled = nullptr);

/**
 * @brief Copy at most length bytes of volume/path starting at offset.
 *
 * Best effort: if the device runs out of data first the copy stops and
 * returns the shorter count WITHOUT raising an error. Callers that need
 * every byte must compare the result with length, or use copyExactlyN.
 *
 * @return Number of bytes written to writer.
 * @throw ErasureCoreError SHORT_WRITE, DEVICE_READ_ERROR or CANCELLED.
 */
int64_t copyAtMostN(ByteSink &writer, StorageDevice &disk,
                    const std::string &volume, const std::string &path,
                    int64_t offset, int64_t length,
                    const std::atomic<bool> *cancelled = nullptr);

/**
 * @brief Like copyAtMostN but a source that ends early is an error.
 * @throw ErasureCoreError TRUNCATED_READ when fewer than length bytes
 *        were available, plus everything copyAtMostN throws.
 */
void copyExactlyN(ByteSink &writer, StorageDevice &disk,
                  const std::string &volume, const std::string &path,
                  int64_t offset, int64_t length,
                  const std::atomic<bool> *cancelled = nullptr);

} // namespace erasurecore

#endif // ERASURECORE_STREAM_COPIER_HPP
