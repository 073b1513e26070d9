#ifndef ERASURECORE_ERRORS_HPP
#define ERASURECORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace erasurecore {

/// Failure categories reported by the data path.
enum class ErrorKind {
  INSUFFICIENT_SHARDS, ///< Fewer data shards supplied than required.
  INSUFFICIENT_DATA,   ///< Shard bytes fall short of the requested size.
  SHORT_WRITE,         ///< Sink accepted fewer bytes than offered.
  DEVICE_READ_ERROR,   ///< Storage device failed for a reason other than EOF.
  INVALID_BUFFER,      ///< Zero-capacity staging buffer.
  CANCELLED,           ///< Caller raised the cancellation flag.
  TRUNCATED_READ       ///< Strict bounded copy ran out of source data.
};

const char *errorKindToString(ErrorKind kind);

/**
 * @brief Exception carrying an ErrorKind alongside a readable message.
 *
 * None of these errors are retried internally; callers inspect kind()
 * to decide whether to re-fetch, re-decode or give up.
 */
class ErasureCoreError : public std::runtime_error {
public:
  ErasureCoreError(ErrorKind kind, const std::string &message)
      : std::runtime_error(std::string(errorKindToString(kind)) + ": " +
                           message),
        kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace erasurecore

#endif // ERASURECORE_ERRORS_HPP
