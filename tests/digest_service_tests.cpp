#include "erasurecore/digest_service.hpp"
#include "erasurecore/metrics.h"
#include "erasurecore/stream_copier.hpp"
#include "erasurecore/stress_utils.hpp"
#include "mocks/mock_storage_device.h"
#include "gtest/gtest.h"
#include <atomic>

using namespace erasurecore;
using namespace erasurecore::test_support;
using ::testing::_;
using ::testing::Invoke;

TEST(HashSum, EmptyFileGivesDigestOfEmptyInput) {
  MemoryStorageDevice disk;
  disk.putFile("vol", "empty", {});
  HashAccumulator writer;
  auto digest = hashSum(disk, "vol", "empty", writer);
  EXPECT_EQ(digestToHex(digest),
            "786a02f742015903c6c6fd852552d272912f4740e15847618a86e217f71f5419"
            "d25e1031afee585313896444934eb04b903a685b1448b755d56f701afe9be2ce");
  EXPECT_TRUE(writer.finalized());
}

TEST(HashSum, MatchesOneShotHashAcrossChunks) {
  // Not a multiple of the staging buffer so the tail arrives with EOF.
  auto payload = generate_pseudo_random_data(2 * READ_SIZE_V1 + 4321, 11);
  MemoryStorageDevice disk;
  disk.putFile("vol", "part.1", payload);

  for (HashAlgorithm algo : {HashAlgorithm::BLAKE2B_512, HashAlgorithm::SHA256,
                             HashAlgorithm::BLAKE3}) {
    HashAccumulator streamed(algo);
    auto digest = hashSum(disk, "vol", "part.1", streamed);

    HashAccumulator direct(algo);
    direct.write(payload);
    EXPECT_EQ(digest, direct.finalize()) << hashAlgorithmToString(algo);
  }
}

TEST(HashSum, ExactMultipleOfBufferSize) {
  auto payload = generate_pseudo_random_data(READ_SIZE_V1, 3);
  MemoryStorageDevice disk;
  disk.putFile("vol", "aligned", payload);

  HashAccumulator streamed;
  HashAccumulator direct;
  direct.write(payload);
  EXPECT_EQ(hashSum(disk, "vol", "aligned", streamed), direct.finalize());
}

TEST(HashSum, ReadsWithStagingBufferOfReadSizeV1) {
  MockStorageDevice disk;
  EXPECT_CALL(disk, readFile("vol", "obj", 0, _))
      .WillOnce(Invoke([](const std::string &, const std::string &, int64_t,
                          std::span<std::byte> buffer) {
        EXPECT_EQ(buffer.size(), READ_SIZE_V1);
        ReadResult rr;
        rr.status = ReadStatus::END_OF_STREAM;
        return rr;
      }));
  HashAccumulator writer;
  hashSum(disk, "vol", "obj", writer);
}

TEST(HashSum, DeviceFailureLeavesWriterUnfinalized) {
  ScriptedDevice disk;
  disk.addStep(sequentialBytes(16), ReadStatus::MORE_DATA);
  disk.addStep({}, ReadStatus::ERROR, "faulty disk");

  HashAccumulator writer;
  EXPECT_ERASURE_ERROR(hashSum(disk, "vol", "obj", writer),
                       ErrorKind::DEVICE_READ_ERROR);
  EXPECT_FALSE(writer.finalized());
}

TEST(HashSum, MissingFileFails) {
  MemoryStorageDevice disk;
  HashAccumulator writer;
  EXPECT_ERASURE_ERROR(hashSum(disk, "vol", "nope", writer),
                       ErrorKind::DEVICE_READ_ERROR);
}

TEST(HashSum, CancellationStopsHashing) {
  MemoryStorageDevice disk;
  disk.putFile("vol", "obj", sequentialBytes(100));
  std::atomic<bool> cancelled{true};
  HashAccumulator writer;
  EXPECT_ERASURE_ERROR(hashSum(disk, "vol", "obj", writer, &cancelled),
                       ErrorKind::CANCELLED);
  EXPECT_FALSE(writer.finalized());
}

TEST(HashSum, RecordsDigestedBytes) {
  MetricsRegistry::instance().reset();
  MemoryStorageDevice disk;
  disk.putFile("vol", "obj", sequentialBytes(1234));
  HashAccumulator writer(HashAlgorithm::SHA256);
  hashSum(disk, "vol", "obj", writer);

  std::string text = MetricsRegistry::instance().toPrometheus();
  EXPECT_NE(text.find("erasurecore_digest_bytes_sum{algorithm=\"sha256\"} 1234"),
            std::string::npos)
      << text;
  MetricsRegistry::instance().reset();
}
