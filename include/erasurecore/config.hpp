#ifndef ERASURECORE_CONFIG_HPP
#define ERASURECORE_CONFIG_HPP

#include <cstdint>
#include <string>

#include "erasurecore/logger.h"

namespace erasurecore {

/// Settings for the command line tool and embedding services.
struct RuntimeOptions {
  std::string storageRoot = "var/erasurecore";
  std::string hashAlgorithm = "blake2b";
  std::string logFile = Logger::CONSOLE_ONLY_OUTPUT;
  LogLevel logLevel = LogLevel::INFO;
  int dataBlocks = 8;
  int parityBlocks = 8;
  int64_t blockSize = 10 * 1024 * 1024;
};

/**
 * @brief Read options from a YAML file on top of the defaults.
 *
 * Recognised keys: storage_root, hash_algorithm, log_file, log_level,
 * data_blocks, parity_blocks, block_size. A missing or unparsable file
 * leaves the defaults untouched; bad values are skipped with a warning.
 */
RuntimeOptions loadRuntimeOptionsFromFile(const std::string &path);

/**
 * @brief Load options the way the tools do at startup.
 *
 * The file named by ERASURECORE_CONFIG (default erasurecore_config.yaml)
 * is read first, then ERASURECORE_STORAGE_ROOT, ERASURECORE_HASH_ALGO and
 * ERASURECORE_LOG_LEVEL override individual settings.
 */
RuntimeOptions loadRuntimeOptions();

} // namespace erasurecore

#endif // ERASURECORE_CONFIG_HPP
