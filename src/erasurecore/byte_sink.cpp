#include "erasurecore/byte_sink.hpp"

namespace erasurecore {

size_t VectorSink::write(std::span<const std::byte> data) {
  data_.insert(data_.end(), data.begin(), data.end());
  return data.size();
}

std::vector<std::byte> VectorSink::release() {
  std::vector<std::byte> out;
  out.swap(data_);
  return out;
}

size_t OstreamSink::write(std::span<const std::byte> data) {
  if (data.empty())
    return 0;
  out_.write(reinterpret_cast<const char *>(data.data()),
             static_cast<std::streamsize>(data.size()));
  if (!out_)
    return 0;
  return data.size();
}

} // namespace erasurecore
