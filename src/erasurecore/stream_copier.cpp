#include "erasurecore/stream_copier.hpp"
#include "erasurecore/errors.hpp"
#include "erasurecore/logger.h"
#include "erasurecore/metrics.h"

#include <vector>

namespace erasurecore {

namespace {

std::string describe(const std::string &volume, const std::string &path) {
  return volume + "/" + path;
}

void checkCancelled(const std::atomic<bool> *cancelled,
                    const std::string &volume, const std::string &path) {
  if (cancelled && cancelled->load(std::memory_order_relaxed)) {
    throw ErasureCoreError(ErrorKind::CANCELLED,
                           "copy of " + describe(volume, path) + " cancelled");
  }
}

// Rejects results that cannot be trusted before any byte is forwarded.
void validateRead(const ReadResult &rr, size_t requested,
                  const std::string &volume, const std::string &path) {
  if (rr.bytesRead > requested) {
    MetricsRegistry::instance().incrementCounter(
        "erasurecore_device_read_errors_total");
    throw ErasureCoreError(ErrorKind::DEVICE_READ_ERROR,
                           describe(volume, path) + ": device returned " +
                               std::to_string(rr.bytesRead) +
                               " bytes for a " + std::to_string(requested) +
                               " byte read");
  }
  MetricsRegistry::instance().incrementCounter(
      "erasurecore_device_bytes_read_total",
      static_cast<double>(rr.bytesRead));
}

// Hands a chunk to the writer; anything but full acceptance is fatal.
size_t deliver(ByteSink &writer, std::span<const std::byte> chunk,
               const std::string &volume, const std::string &path) {
  size_t accepted = writer.write(chunk);
  if (accepted != chunk.size()) {
    MetricsRegistry::instance().incrementCounter(
        "erasurecore_short_writes_total");
    std::string msg = describe(volume, path) + ": sink accepted " +
                      std::to_string(accepted) + " of " +
                      std::to_string(chunk.size()) + " bytes";
    Logger::getInstance().log(LogLevel::ERROR, "Short write. " + msg);
    throw ErasureCoreError(ErrorKind::SHORT_WRITE, msg);
  }
  return accepted;
}

[[noreturn]] void raiseDeviceError(const ReadResult &rr, int64_t offset,
                                   const std::string &volume,
                                   const std::string &path) {
  MetricsRegistry::instance().incrementCounter(
      "erasurecore_device_read_errors_total");
  std::string msg = describe(volume, path) + " at offset " +
                    std::to_string(offset) + ": " +
                    (rr.error.empty() ? std::string("unspecified failure")
                                      : rr.error);
  Logger::getInstance().log(LogLevel::ERROR, "Device read failed. " + msg);
  throw ErasureCoreError(ErrorKind::DEVICE_READ_ERROR, msg);
}

bool isEndOfStream(ReadStatus status) {
  return status == ReadStatus::END_OF_STREAM ||
         status == ReadStatus::UNEXPECTED_END_OF_STREAM;
}

} // namespace

void copyBuffer(ByteSink &writer, StorageDevice &disk,
                const std::string &volume, const std::string &path,
                std::span<std::byte> buf, const std::atomic<bool> *cancelled) {
  if (buf.empty()) {
    throw ErasureCoreError(ErrorKind::INVALID_BUFFER,
                           "empty buffer in copyBuffer");
  }

  int64_t startOffset = 0;

  for (;;) {
    checkCancelled(cancelled, volume, path);

    ReadResult rr = disk.readFile(volume, path, startOffset, buf);
    validateRead(rr, buf.size(), volume, path);

    size_t accepted = 0;
    if (rr.bytesRead > 0) {
      accepted = deliver(writer, buf.first(rr.bytesRead), volume, path);
    }
    if (isEndOfStream(rr.status)) {
      Logger::getInstance().log(
          LogLevel::DEBUG, "copyBuffer reached end of " +
                               describe(volume, path) + " after " +
                               std::to_string(startOffset + accepted) +
                               " bytes");
      break;
    }
    if (rr.status == ReadStatus::ERROR) {
      raiseDeviceError(rr, startOffset, volume, path);
    }
    if (accepted == 0) {
      // MORE_DATA with nothing read would spin forever.
      ReadResult stalled = rr;
      stalled.error = "device reported more data but returned none";
      raiseDeviceError(stalled, startOffset, volume, path);
    }

    startOffset += static_cast<int64_t>(accepted);
  }
}

int64_t copyAtMostN(ByteSink &writer, StorageDevice &disk,
                    const std::string &volume, const std::string &path,
                    int64_t offset, int64_t length,
                    const std::atomic<bool> *cancelled) {
  std::vector<std::byte> buf(READ_SIZE_V1);
  const int64_t requested = length;
  int64_t written = 0;

  while (length > 0) {
    checkCancelled(cancelled, volume, path);

    size_t curLength = READ_SIZE_V1;
    if (length < static_cast<int64_t>(READ_SIZE_V1)) {
      curLength = static_cast<size_t>(length);
    }
    auto window = std::span<std::byte>(buf).first(curLength);

    ReadResult rr = disk.readFile(volume, path, offset, window);
    validateRead(rr, curLength, volume, path);

    size_t accepted = 0;
    if (rr.bytesRead > 0) {
      accepted = deliver(writer, window.first(rr.bytesRead), volume, path);
      length -= static_cast<int64_t>(accepted);
      offset += static_cast<int64_t>(accepted);
      written += static_cast<int64_t>(accepted);
    }
    if (isEndOfStream(rr.status)) {
      break;
    }
    if (rr.status == ReadStatus::ERROR) {
      raiseDeviceError(rr, offset, volume, path);
    }
    if (accepted == 0) {
      ReadResult stalled = rr;
      stalled.error = "device reported more data but returned none";
      raiseDeviceError(stalled, offset, volume, path);
    }
  }

  if (written < requested) {
    Logger::getInstance().log(
        LogLevel::DEBUG, "copyAtMostN: " + describe(volume, path) +
                             " exhausted after " + std::to_string(written) +
                             " of " + std::to_string(requested) + " bytes");
  }
  return written;
}

void copyExactlyN(ByteSink &writer, StorageDevice &disk,
                  const std::string &volume, const std::string &path,
                  int64_t offset, int64_t length,
                  const std::atomic<bool> *cancelled) {
  int64_t written =
      copyAtMostN(writer, disk, volume, path, offset, length, cancelled);
  if (written < length) {
    throw ErasureCoreError(ErrorKind::TRUNCATED_READ,
                           describe(volume, path) + ": wanted " +
                               std::to_string(length) + " bytes from offset " +
                               std::to_string(offset) + ", got " +
                               std::to_string(written));
  }
}

} // namespace erasurecore
