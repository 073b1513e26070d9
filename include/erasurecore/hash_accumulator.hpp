#ifndef ERASURECORE_HASH_ACCUMULATOR_HPP
#define ERASURECORE_HASH_ACCUMULATOR_HPP

#include <cstddef> // For std::byte
#include <cstdint>
#include <memory>
#include <sodium.h> // For libsodium
#include <span>
#include <string>
#include <vector>

#include "blake3.h"
#include "erasurecore/byte_sink.hpp"

namespace erasurecore {

/// Supported hashing algorithms.
enum class HashAlgorithm { BLAKE2B_512, SHA256, BLAKE3 };

inline constexpr HashAlgorithm DEFAULT_HASH_ALGORITHM =
    HashAlgorithm::BLAKE2B_512;

/// Digest length in bytes: 64 for BLAKE2b-512, 32 otherwise.
size_t digestSize(HashAlgorithm algo);

/**
 * @brief Resolve an algorithm token ("blake2b", "sha256", "blake3").
 *
 * Matching is exact. Any other token, including the empty string,
 * resolves to DEFAULT_HASH_ALGORITHM; this never fails.
 */
HashAlgorithm hashAlgorithmFromString(const std::string &name);

const char *hashAlgorithmToString(HashAlgorithm algo);

/// Lower-case hex rendering of a digest.
std::string digestToHex(const std::vector<uint8_t> &digest);

/**
 * @brief Running hash over every byte written to it.
 *
 * One accumulator belongs to one device stream. It doubles as a
 * ByteSink so the stream copier can feed it directly; write() always
 * accepts the whole buffer.
 */
class HashAccumulator : public ByteSink {
public:
  /**
   * @brief Construct an accumulator for the given algorithm.
   * @throw std::runtime_error if libsodium cannot be initialized.
   */
  explicit HashAccumulator(HashAlgorithm algo = DEFAULT_HASH_ALGORITHM);

  HashAccumulator(const HashAccumulator &) = delete;
  HashAccumulator &operator=(const HashAccumulator &) = delete;

  size_t write(std::span<const std::byte> data) override;

  // Feeds data into the running hash.
  void update(const std::byte *data, size_t size);

  /**
   * @brief Produce the final digest.
   * @throw std::logic_error If finalize() has already been called.
   */
  std::vector<uint8_t> finalize();

  bool finalized() const { return finalized_; }
  HashAlgorithm algorithm() const { return algo_; }
  size_t digestSize() const { return erasurecore::digestSize(algo_); }

private:
  HashAlgorithm algo_;
  bool finalized_ = false;
  crypto_generichash_state blake2b_state_;
  crypto_hash_sha256_state sha256_state_;
  blake3_hasher blake3_state_;
};

/**
 * @brief Create a fresh accumulator for an algorithm token.
 *
 * Unknown tokens fall back to BLAKE2b-512; the result is then
 * indistinguishable from newHashAccumulator("blake2b").
 */
std::unique_ptr<HashAccumulator> newHashAccumulator(const std::string &algorithm);

/// One default accumulator per disk, indexed by disk position.
std::vector<std::unique_ptr<HashAccumulator>>
newHashAccumulatorSet(size_t diskCount);

} // namespace erasurecore

#endif // ERASURECORE_HASH_ACCUMULATOR_HPP
