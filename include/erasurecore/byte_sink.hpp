#ifndef ERASURECORE_BYTE_SINK_HPP
#define ERASURECORE_BYTE_SINK_HPP

#include <cstddef> // For std::byte
#include <ostream>
#include <span>
#include <vector>

namespace erasurecore {

/**
 * @brief Destination for streamed bytes.
 *
 * write() returns how many bytes were accepted. Returning less than
 * data.size() is a short write, which the data path treats as fatal.
 * Sinks report their own failures by throwing.
 */
class ByteSink {
public:
  virtual ~ByteSink() = default;
  virtual size_t write(std::span<const std::byte> data) = 0;
};

/// Appends everything it receives to an in-memory vector.
class VectorSink : public ByteSink {
public:
  size_t write(std::span<const std::byte> data) override;

  const std::vector<std::byte> &data() const { return data_; }
  std::vector<std::byte> release();

private:
  std::vector<std::byte> data_;
};

/**
 * @brief Forwards bytes to a std::ostream.
 *
 * A stream that enters a failed state counts as having accepted
 * nothing, which surfaces as a short write.
 */
class OstreamSink : public ByteSink {
public:
  explicit OstreamSink(std::ostream &out) : out_(out) {}
  size_t write(std::span<const std::byte> data) override;

private:
  std::ostream &out_;
};

} // namespace erasurecore

#endif // ERASURECORE_BYTE_SINK_HPP
