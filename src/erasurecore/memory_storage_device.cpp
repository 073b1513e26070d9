#include "erasurecore/storage_device.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

namespace erasurecore {

std::string MemoryStorageDevice::makeKey(const std::string &volume,
                                         const std::string &path) {
  return volume + '\0' + path;
}

void MemoryStorageDevice::putFile(const std::string &volume,
                                  const std::string &path,
                                  std::vector<std::byte> data) {
  std::lock_guard<std::mutex> lock(mutex_);
  files_[makeKey(volume, path)] = std::move(data);
}

bool MemoryStorageDevice::hasFile(const std::string &volume,
                                  const std::string &path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return files_.count(makeKey(volume, path)) > 0;
}

bool MemoryStorageDevice::deleteFile(const std::string &volume,
                                     const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  return files_.erase(makeKey(volume, path)) > 0;
}

ReadResult MemoryStorageDevice::readFile(const std::string &volume,
                                         const std::string &path,
                                         int64_t offset,
                                         std::span<std::byte> buffer) {
  ReadResult result;
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = files_.find(makeKey(volume, path));
  if (it == files_.end()) {
    result.status = ReadStatus::ERROR;
    result.error = volume + "/" + path + ": file not found";
    return result;
  }
  if (offset < 0) {
    result.status = ReadStatus::ERROR;
    result.error = "negative offset " + std::to_string(offset);
    return result;
  }

  const auto &file = it->second;
  const size_t start = static_cast<size_t>(offset);
  if (start >= file.size() || buffer.empty()) {
    result.status = ReadStatus::END_OF_STREAM;
    return result;
  }

  result.bytesRead = std::min(buffer.size(), file.size() - start);
  if (result.bytesRead > 0)
    std::memcpy(buffer.data(), file.data() + start, result.bytesRead);
  result.status = result.bytesRead == buffer.size()
                      ? ReadStatus::MORE_DATA
                      : ReadStatus::UNEXPECTED_END_OF_STREAM;
  return result;
}

} // namespace erasurecore
