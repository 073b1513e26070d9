#include "erasurecore/digest_service.hpp"
#include "erasurecore/metrics.h"
#include "erasurecore/stream_copier.hpp"

#include <cstddef> // For std::byte

namespace erasurecore {

namespace {

// Counts bytes on their way into the accumulator.
class CountingSink : public ByteSink {
public:
  explicit CountingSink(ByteSink &inner) : inner_(inner) {}
  size_t write(std::span<const std::byte> data) override {
    size_t n = inner_.write(data);
    total_ += n;
    return n;
  }
  size_t total() const { return total_; }

private:
  ByteSink &inner_;
  size_t total_ = 0;
};

} // namespace

std::vector<uint8_t> hashSum(StorageDevice &disk, const std::string &volume,
                             const std::string &path, HashAccumulator &writer,
                             const std::atomic<bool> *cancelled) {
  // Allocate staging buffer of 128KiB for copyBuffer.
  std::vector<std::byte> buf(READ_SIZE_V1);

  CountingSink counter(writer);
  copyBuffer(counter, disk, volume, path, buf, cancelled);

  MetricsRegistry::instance().observe(
      "erasurecore_digest_bytes", static_cast<double>(counter.total()),
      {{"algorithm", hashAlgorithmToString(writer.algorithm())}});
  return writer.finalize();
}

} // namespace erasurecore
