#include "erasurecore/storage_device.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <unistd.h>
#include <utility>

namespace erasurecore {

namespace {

// Closes the descriptor on every exit path of readFile.
class FdGuard {
public:
  explicit FdGuard(int fd) : fd_(fd) {}
  ~FdGuard() {
    if (fd_ >= 0)
      ::close(fd_);
  }
  FdGuard(const FdGuard &) = delete;
  FdGuard &operator=(const FdGuard &) = delete;
  int get() const { return fd_; }

private:
  int fd_;
};

} // namespace

LocalStorageDevice::LocalStorageDevice(std::string root)
    : root_(std::move(root)) {}

std::string LocalStorageDevice::resolve(const std::string &volume,
                                        const std::string &path) const {
  return (std::filesystem::path(root_) / volume / path).string();
}

ReadResult LocalStorageDevice::readFile(const std::string &volume,
                                        const std::string &path,
                                        int64_t offset,
                                        std::span<std::byte> buffer) {
  ReadResult result;
  if (offset < 0) {
    result.status = ReadStatus::ERROR;
    result.error = "negative offset " + std::to_string(offset);
    return result;
  }

  const std::string fullPath = resolve(volume, path);
  FdGuard fd(::open(fullPath.c_str(), O_RDONLY | O_CLOEXEC));
  if (fd.get() < 0) {
    result.status = ReadStatus::ERROR;
    result.error = fullPath + ": " + std::strerror(errno);
    return result;
  }

  // Keep reading until the buffer is full or the file ends so that a
  // short result always means end of file, never a short pread.
  while (result.bytesRead < buffer.size()) {
    auto rest = buffer.subspan(result.bytesRead);
    ssize_t n = ::pread(fd.get(), rest.data(), rest.size(),
                        static_cast<off_t>(offset + result.bytesRead));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      result.status = ReadStatus::ERROR;
      result.error = fullPath + ": " + std::strerror(errno);
      return result;
    }
    if (n == 0)
      break;
    result.bytesRead += static_cast<size_t>(n);
  }

  if (result.bytesRead == buffer.size() && !buffer.empty()) {
    result.status = ReadStatus::MORE_DATA;
  } else if (result.bytesRead == 0) {
    result.status = ReadStatus::END_OF_STREAM;
  } else {
    result.status = ReadStatus::UNEXPECTED_END_OF_STREAM;
  }
  return result;
}

} // namespace erasurecore
