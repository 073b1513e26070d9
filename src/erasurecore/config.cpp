#include "erasurecore/config.hpp"

#include <cstdlib>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace erasurecore {

namespace {

void warn(const std::string &msg) {
  Logger::getInstance().log(LogLevel::WARN, msg);
}

template <typename T>
void readKey(const YAML::Node &node, const char *key, T &out) {
  if (!node[key])
    return;
  try {
    out = node[key].as<T>();
  } catch (const YAML::Exception &e) {
    warn(std::string("Ignoring config key '") + key + "': " + e.what());
  }
}

} // namespace

RuntimeOptions loadRuntimeOptionsFromFile(const std::string &path) {
  RuntimeOptions opts;
  YAML::Node node;
  try {
    node = YAML::LoadFile(path);
  } catch (const YAML::BadFile &) {
    return opts;
  } catch (const YAML::Exception &e) {
    warn("Could not parse config " + path + ": " + e.what());
    return opts;
  }

  readKey(node, "storage_root", opts.storageRoot);
  readKey(node, "hash_algorithm", opts.hashAlgorithm);
  readKey(node, "log_file", opts.logFile);
  readKey(node, "data_blocks", opts.dataBlocks);
  readKey(node, "parity_blocks", opts.parityBlocks);
  readKey(node, "block_size", opts.blockSize);

  std::string level;
  readKey(node, "log_level", level);
  if (!level.empty()) {
    try {
      opts.logLevel = Logger::levelFromString(level);
    } catch (const std::invalid_argument &e) {
      warn(std::string("Ignoring config key 'log_level': ") + e.what());
    }
  }

  if (opts.dataBlocks < 1) {
    warn("data_blocks must be at least 1, using default");
    opts.dataBlocks = RuntimeOptions{}.dataBlocks;
  }
  if (opts.parityBlocks < 0) {
    warn("parity_blocks must not be negative, using default");
    opts.parityBlocks = RuntimeOptions{}.parityBlocks;
  }
  if (opts.blockSize <= 0) {
    warn("block_size must be positive, using default");
    opts.blockSize = RuntimeOptions{}.blockSize;
  }
  return opts;
}

RuntimeOptions loadRuntimeOptions() {
  const char *cfg = std::getenv("ERASURECORE_CONFIG");
  if (!cfg)
    cfg = "erasurecore_config.yaml";
  RuntimeOptions opts = loadRuntimeOptionsFromFile(cfg);

  if (const char *env = std::getenv("ERASURECORE_STORAGE_ROOT"))
    opts.storageRoot = env;
  if (const char *env = std::getenv("ERASURECORE_HASH_ALGO"))
    opts.hashAlgorithm = env;
  if (const char *env = std::getenv("ERASURECORE_LOG_LEVEL")) {
    try {
      opts.logLevel = Logger::levelFromString(env);
    } catch (const std::invalid_argument &e) {
      warn(std::string("Ignoring ERASURECORE_LOG_LEVEL: ") + e.what());
    }
  }
  return opts;
}

} // namespace erasurecore
