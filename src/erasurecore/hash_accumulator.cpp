#include "erasurecore/hash_accumulator.hpp"
#include "erasurecore/logger.h"

#include <stdexcept> // For std::runtime_error

namespace erasurecore {

namespace {
constexpr size_t BLAKE2B_512_BYTES = 64;
static_assert(BLAKE2B_512_BYTES <= crypto_generichash_BYTES_MAX,
              "libsodium generichash cannot produce 512-bit digests");
} // namespace

size_t digestSize(HashAlgorithm algo) {
  switch (algo) {
  case HashAlgorithm::SHA256:
    return crypto_hash_sha256_BYTES;
  case HashAlgorithm::BLAKE3:
    return BLAKE3_OUT_LEN;
  case HashAlgorithm::BLAKE2B_512:
  default:
    return BLAKE2B_512_BYTES;
  }
}

HashAlgorithm hashAlgorithmFromString(const std::string &name) {
  if (name == "blake2b")
    return HashAlgorithm::BLAKE2B_512;
  if (name == "sha256")
    return HashAlgorithm::SHA256;
  if (name == "blake3")
    return HashAlgorithm::BLAKE3;
  // Add new hashes here.
  return DEFAULT_HASH_ALGORITHM;
}

const char *hashAlgorithmToString(HashAlgorithm algo) {
  switch (algo) {
  case HashAlgorithm::SHA256:
    return "sha256";
  case HashAlgorithm::BLAKE3:
    return "blake3";
  case HashAlgorithm::BLAKE2B_512:
  default:
    return "blake2b";
  }
}

std::string digestToHex(const std::vector<uint8_t> &digest) {
  std::string hex(digest.size() * 2 + 1, '\0');
  sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
  hex.resize(digest.size() * 2);
  return hex;
}

HashAccumulator::HashAccumulator(HashAlgorithm algo) : algo_(algo) {
  // sodium_init() returns -1 on error, 0 on success, 1 if already initialized
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }

  switch (algo_) {
  case HashAlgorithm::SHA256:
    crypto_hash_sha256_init(&sha256_state_);
    break;
  case HashAlgorithm::BLAKE3:
    blake3_hasher_init(&blake3_state_);
    break;
  case HashAlgorithm::BLAKE2B_512:
  default:
    crypto_generichash_init(&blake2b_state_, nullptr, 0, BLAKE2B_512_BYTES);
    break;
  }
}

size_t HashAccumulator::write(std::span<const std::byte> data) {
  update(data.data(), data.size());
  return data.size();
}

void HashAccumulator::update(const std::byte *data, size_t size) {
  if (finalized_) {
    throw std::logic_error(
        "Cannot update hash after finalize() has been called.");
  }
  if (!data || size == 0)
    return;

  const auto *bytes = reinterpret_cast<const unsigned char *>(data);
  switch (algo_) {
  case HashAlgorithm::SHA256:
    crypto_hash_sha256_update(&sha256_state_, bytes, size);
    break;
  case HashAlgorithm::BLAKE3:
    blake3_hasher_update(&blake3_state_, bytes, size);
    break;
  case HashAlgorithm::BLAKE2B_512:
  default:
    crypto_generichash_update(&blake2b_state_, bytes, size);
    break;
  }
}

std::vector<uint8_t> HashAccumulator::finalize() {
  if (finalized_) {
    throw std::logic_error("finalize() already called.");
  }

  std::vector<uint8_t> digest(digestSize());
  switch (algo_) {
  case HashAlgorithm::SHA256:
    crypto_hash_sha256_final(&sha256_state_, digest.data());
    break;
  case HashAlgorithm::BLAKE3:
    blake3_hasher_finalize(&blake3_state_, digest.data(), digest.size());
    break;
  case HashAlgorithm::BLAKE2B_512:
  default:
    crypto_generichash_final(&blake2b_state_, digest.data(), digest.size());
    break;
  }
  finalized_ = true;
  return digest;
}

std::unique_ptr<HashAccumulator>
newHashAccumulator(const std::string &algorithm) {
  HashAlgorithm algo = hashAlgorithmFromString(algorithm);
  if (algorithm != hashAlgorithmToString(algo)) {
    Logger::getInstance().log(
        LogLevel::DEBUG, "Unknown hash algorithm '" + algorithm +
                             "', defaulting to " + hashAlgorithmToString(algo));
  }
  return std::make_unique<HashAccumulator>(algo);
}

std::vector<std::unique_ptr<HashAccumulator>>
newHashAccumulatorSet(size_t diskCount) {
  std::vector<std::unique_ptr<HashAccumulator>> accumulators;
  accumulators.reserve(diskCount);
  for (size_t i = 0; i < diskCount; ++i) {
    accumulators.push_back(
        newHashAccumulator(hashAlgorithmToString(DEFAULT_HASH_ALGORITHM)));
  }
  return accumulators;
}

} // namespace erasurecore
