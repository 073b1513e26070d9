#ifndef ERASURECORE_STORAGE_DEVICE_HPP
#define ERASURECORE_STORAGE_DEVICE_HPP

#include <cstddef> // For std::byte
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace erasurecore {

/// Outcome of a single positioned read.
enum class ReadStatus {
  MORE_DATA,                ///< Buffer filled, the file continues.
  END_OF_STREAM,            ///< Nothing left at this offset.
  UNEXPECTED_END_OF_STREAM, ///< File ended part way through the buffer.
  ERROR                     ///< Any other device failure.
};

struct ReadResult {
  size_t bytesRead{0};
  ReadStatus status{ReadStatus::MORE_DATA};
  std::string error; ///< Device supplied description when status is ERROR.
};

/**
 * @brief Positioned read access to files stored on one disk.
 *
 * bytesRead may be non-zero together with an end-of-stream status; the
 * trailing bytes are valid and must be consumed by the caller.
 * Implementations that are shared between threads must support
 * concurrent positioned reads.
 */
class StorageDevice {
public:
  virtual ~StorageDevice() = default;

  virtual ReadResult readFile(const std::string &volume,
                              const std::string &path, int64_t offset,
                              std::span<std::byte> buffer) = 0;
};

/**
 * @brief Disk backed by a local directory.
 *
 * Volumes are sub-directories of the root; paths are relative to the
 * volume. Reads fill the buffer as far as the file allows.
 */
class LocalStorageDevice : public StorageDevice {
public:
  explicit LocalStorageDevice(std::string root);

  ReadResult readFile(const std::string &volume, const std::string &path,
                      int64_t offset, std::span<std::byte> buffer) override;

  const std::string &root() const { return root_; }

  /// Absolute location of volume/path under the root.
  std::string resolve(const std::string &volume, const std::string &path) const;

private:
  std::string root_;
};

/**
 * @brief Thread-safe in-memory disk.
 *
 * Holds whole files keyed by volume and path. End-of-stream reporting
 * matches LocalStorageDevice so the two are interchangeable.
 */
class MemoryStorageDevice : public StorageDevice {
public:
  void putFile(const std::string &volume, const std::string &path,
               std::vector<std::byte> data);

  bool hasFile(const std::string &volume, const std::string &path) const;

  bool deleteFile(const std::string &volume, const std::string &path);

  ReadResult readFile(const std::string &volume, const std::string &path,
                      int64_t offset, std::span<std::byte> buffer) override;

private:
  static std::string makeKey(const std::string &volume,
                             const std::string &path);

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::vector<std::byte>> files_;
};

} // namespace erasurecore

#endif // ERASURECORE_STORAGE_DEVICE_HPP
