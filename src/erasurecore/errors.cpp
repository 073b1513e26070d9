#include "erasurecore/errors.hpp"

namespace erasurecore {

const char *errorKindToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::INSUFFICIENT_SHARDS:
    return "insufficient shards";
  case ErrorKind::INSUFFICIENT_DATA:
    return "insufficient data";
  case ErrorKind::SHORT_WRITE:
    return "short write";
  case ErrorKind::DEVICE_READ_ERROR:
    return "device read error";
  case ErrorKind::INVALID_BUFFER:
    return "invalid buffer";
  case ErrorKind::CANCELLED:
    return "cancelled";
  case ErrorKind::TRUNCATED_READ:
    return "truncated read";
  default:
    return "unknown error";
  }
}

} // namespace erasurecore
