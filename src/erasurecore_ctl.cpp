#include "erasurecore/block_geometry.hpp"
#include "erasurecore/byte_sink.hpp"
#include "erasurecore/config.hpp"
#include "erasurecore/digest_service.hpp"
#include "erasurecore/errors.hpp"
#include "erasurecore/hash_accumulator.hpp"
#include "erasurecore/logger.h"
#include "erasurecore/metrics.h"
#include "erasurecore/shard_assembler.hpp"
#include "erasurecore/storage_device.hpp"
#include "erasurecore/stream_copier.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace erasurecore;

static void usage() {
  std::cerr
      << "Usage: erasurecore_ctl [--metrics] <command> ...\n"
      << "       erasurecore_ctl digest <volume> <path> [algorithm]\n"
      << "       erasurecore_ctl blockinfo <offset> <length> <blockSize>\n"
      << "       erasurecore_ctl encodedlen <inputLen> [dataBlocks]\n"
      << "       erasurecore_ctl copy <volume> <path> <offset> <length>\n"
      << "       erasurecore_ctl extract <dataBlocks> <offset> <size> "
         "<volume> <shard>...\n";
}

static int64_t parseInt(const std::string &text, const char *what) {
  size_t used = 0;
  int64_t value = 0;
  try {
    value = std::stoll(text, &used);
  } catch (const std::invalid_argument &) {
    throw std::invalid_argument(std::string("Invalid ") + what + ": " + text);
  } catch (const std::out_of_range &) {
    throw std::invalid_argument(std::string(what) + " out of range: " + text);
  }
  if (used != text.size()) {
    throw std::invalid_argument(std::string("Invalid ") + what + ": " + text);
  }
  return value;
}

static int digest_command(const RuntimeOptions &opts, const std::string &volume,
                          const std::string &path,
                          const std::string &algorithm) {
  LocalStorageDevice disk(opts.storageRoot);
  auto writer = newHashAccumulator(algorithm);
  std::vector<uint8_t> digest = hashSum(disk, volume, path, *writer);
  std::cout << digestToHex(digest) << "  "
            << hashAlgorithmToString(writer->algorithm()) << "  " << volume
            << "/" << path << std::endl;
  return 0;
}

static int blockinfo_command(int64_t offset, int64_t length,
                             int64_t blockSize) {
  if (blockSize <= 0) {
    std::cerr << "blockSize must be positive" << std::endl;
    return 1;
  }
  BlockInfo info = getBlockInfo(offset, length, blockSize);
  std::cout << "startBlock\t" << info.startBlock << "\n"
            << "endBlock\t" << info.endBlock << "\n"
            << "bytesToSkip\t" << info.bytesToSkip << std::endl;
  return 0;
}

static int encodedlen_command(int64_t inputLen, int64_t dataBlocks) {
  if (dataBlocks < 1) {
    std::cerr << "dataBlocks must be at least 1" << std::endl;
    return 1;
  }
  std::cout << getEncodedBlockLen(inputLen, static_cast<int>(dataBlocks))
            << std::endl;
  return 0;
}

static int copy_command(const RuntimeOptions &opts, const std::string &volume,
                        const std::string &path, int64_t offset,
                        int64_t length) {
  LocalStorageDevice disk(opts.storageRoot);
  OstreamSink out(std::cout);
  int64_t written = copyAtMostN(out, disk, volume, path, offset, length);
  std::cout.flush();
  if (written < length) {
    std::cerr << "Source ended early: copied " << written << " of " << length
              << " bytes" << std::endl;
    return 2;
  }
  return 0;
}

static int extract_command(const RuntimeOptions &opts, size_t dataBlocks,
                           int64_t offset, int64_t size,
                           const std::string &volume,
                           const std::vector<std::string> &shards) {
  LocalStorageDevice disk(opts.storageRoot);
  std::vector<std::byte> staging(READ_SIZE_V1);

  EncodedBlocks blocks;
  blocks.reserve(shards.size());
  for (const auto &shard : shards) {
    VectorSink sink;
    copyBuffer(sink, disk, volume, shard, staging);
    blocks.push_back(sink.release());
  }

  OstreamSink out(std::cout);
  int64_t written = writeDataBlocks(out, blocks, dataBlocks, offset, size);
  std::cout.flush();
  if (written < size) {
    std::cerr << "Offset beyond data shards: wrote " << written << " of "
              << size << " bytes" << std::endl;
    return 2;
  }
  return 0;
}

static int run_command(const RuntimeOptions &opts,
                       const std::vector<std::string> &args) {
  const std::string &cmd = args[0];

  try {
    if (cmd == "digest" && (args.size() == 3 || args.size() == 4)) {
      std::string algorithm = args.size() == 4 ? args[3] : opts.hashAlgorithm;
      return digest_command(opts, args[1], args[2], algorithm);
    }
    if (cmd == "blockinfo" && args.size() == 4) {
      return blockinfo_command(parseInt(args[1], "offset"),
                               parseInt(args[2], "length"),
                               parseInt(args[3], "blockSize"));
    }
    if (cmd == "encodedlen" && (args.size() == 2 || args.size() == 3)) {
      int64_t dataBlocks = args.size() == 3 ? parseInt(args[2], "dataBlocks")
                                            : opts.dataBlocks;
      return encodedlen_command(parseInt(args[1], "inputLen"), dataBlocks);
    }
    if (cmd == "copy" && args.size() == 5) {
      return copy_command(opts, args[1], args[2], parseInt(args[3], "offset"),
                          parseInt(args[4], "length"));
    }
    if (cmd == "extract" && args.size() >= 6) {
      int64_t dataBlocks = parseInt(args[1], "dataBlocks");
      if (dataBlocks < 1) {
        std::cerr << "dataBlocks must be at least 1" << std::endl;
        return 1;
      }
      std::vector<std::string> shards(args.begin() + 5, args.end());
      return extract_command(opts, static_cast<size_t>(dataBlocks),
                             parseInt(args[2], "offset"),
                             parseInt(args[3], "size"), args[4], shards);
    }
  } catch (const ErasureCoreError &e) {
    Logger::getInstance().log(LogLevel::ERROR, e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const std::invalid_argument &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  } catch (const std::runtime_error &e) {
    Logger::getInstance().log(LogLevel::FATAL, e.what());
    std::cerr << "Fatal: " << e.what() << std::endl;
    return 1;
  }

  std::cerr << "Unknown command" << std::endl;
  usage();
  return 1;
}

int main(int argc, char **argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  // --metrics dumps the registry to stderr once the command has run.
  bool dumpMetrics = false;
  if (!args.empty() && args[0] == "--metrics") {
    dumpMetrics = true;
    args.erase(args.begin());
  }
  if (args.empty()) {
    usage();
    return 1;
  }

  RuntimeOptions opts = loadRuntimeOptions();
  Logger::init(opts.logFile, opts.logLevel);

  int rc = run_command(opts, args);
  if (dumpMetrics) {
    std::cerr << MetricsRegistry::instance().toPrometheus();
  }
  return rc;
}
