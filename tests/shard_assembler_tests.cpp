#include "erasurecore/block_geometry.hpp"
#include "erasurecore/shard_assembler.hpp"
#include "erasurecore/stress_utils.hpp"
#include "mocks/mock_storage_device.h"
#include "gtest/gtest.h"
#include <stdexcept>
#include <vector>

using namespace erasurecore;
using namespace erasurecore::test_support;
using ::testing::_;
using ::testing::Invoke;

namespace {

// Ten shards of 100 bytes; shard i holds bytes [i*100, i*100+100) of a
// running counter so every position is recognisable.
EncodedBlocks tenShardsOfHundred() {
  EncodedBlocks blocks;
  for (size_t i = 0; i < 10; ++i)
    blocks.push_back(sequentialBytes(100, i * 100));
  return blocks;
}

std::vector<std::byte> concatenated(const EncodedBlocks &blocks, size_t n) {
  std::vector<std::byte> out;
  for (size_t i = 0; i < n; ++i)
    out.insert(out.end(), blocks[i].begin(), blocks[i].end());
  return out;
}

} // namespace

TEST(ShardAssembler, RoundTripsSplitData) {
  const int dataBlocks = 6;
  auto data = generate_pseudo_random_data(10007, 42);
  auto shards = split_into_data_shards(data, dataBlocks);
  ASSERT_EQ(shards.size(), static_cast<size_t>(dataBlocks));
  ASSERT_EQ(static_cast<int64_t>(shards[0].size()),
            getEncodedBlockLen(static_cast<int64_t>(data.size()), dataBlocks));

  VectorSink sink;
  int64_t n = writeDataBlocks(sink, shards, dataBlocks, 0,
                              static_cast<int64_t>(data.size()));
  EXPECT_EQ(n, static_cast<int64_t>(data.size()));
  EXPECT_EQ(count_bit_errors(data, sink.data()), 0u);
}

TEST(ShardAssembler, WindowAtEndOfDataShards) {
  auto blocks = tenShardsOfHundred();
  VectorSink sink;
  EXPECT_EQ(writeDataBlocks(sink, blocks, 8, 750, 50), 50);

  auto all = concatenated(blocks, 8);
  std::vector<std::byte> expected(all.begin() + 750, all.begin() + 800);
  EXPECT_EQ(sink.data(), expected);
}

TEST(ShardAssembler, WindowSpanningSeveralShards) {
  auto blocks = tenShardsOfHundred();
  VectorSink sink;
  EXPECT_EQ(writeDataBlocks(sink, blocks, 8, 130, 333), 333);

  auto all = concatenated(blocks, 8);
  std::vector<std::byte> expected(all.begin() + 130, all.begin() + 463);
  EXPECT_EQ(sink.data(), expected);
}

TEST(ShardAssembler, WindowEndingExactlyOnShardBoundary) {
  auto blocks = tenShardsOfHundred();
  MockByteSink sink;
  // Shard 1 tail (50 bytes) then all of shard 2; nothing more.
  EXPECT_CALL(sink, write(_))
      .Times(2)
      .WillRepeatedly(Invoke(
          [](std::span<const std::byte> data) { return data.size(); }));
  EXPECT_EQ(writeDataBlocks(sink, blocks, 8, 150, 150), 150);
}

TEST(ShardAssembler, MoreThanAvailableDataFails) {
  auto blocks = tenShardsOfHundred();
  VectorSink sink;
  EXPECT_ERASURE_ERROR(writeDataBlocks(sink, blocks, 8, 0, 900),
                       ErrorKind::INSUFFICIENT_DATA);
  EXPECT_TRUE(sink.data().empty());
}

TEST(ShardAssembler, TooFewShardsFails) {
  EncodedBlocks blocks = {sequentialBytes(10), sequentialBytes(10)};
  VectorSink sink;
  EXPECT_ERASURE_ERROR(writeDataBlocks(sink, blocks, 4, 0, 5),
                       ErrorKind::INSUFFICIENT_SHARDS);
}

TEST(ShardAssembler, ParityShardsAreNeverWritten) {
  EncodedBlocks blocks = {bytesOf("AAAA"), bytesOf("BBBB"), bytesOf("PPPP"),
                          bytesOf("QQQQ")};
  VectorSink sink;
  EXPECT_EQ(writeDataBlocks(sink, blocks, 2, 0, 8), 8);
  EXPECT_EQ(sink.data(), bytesOf("AAAABBBB"));
}

TEST(ShardAssembler, ShorterFinalShardIsHandled) {
  EncodedBlocks blocks = {bytesOf("abcd"), bytesOf("efgh"), bytesOf("ij"),
                          bytesOf("xxxx")};
  VectorSink sink;
  EXPECT_EQ(writeDataBlocks(sink, blocks, 3, 3, 7), 7);
  EXPECT_EQ(sink.data(), bytesOf("defghij"));
}

TEST(ShardAssembler, ZeroSizeWritesNothing) {
  auto blocks = tenShardsOfHundred();
  MockByteSink sink;
  EXPECT_CALL(sink, write(_)).Times(0);
  EXPECT_EQ(writeDataBlocks(sink, blocks, 8, 10, 0), 0);
}

TEST(ShardAssembler, OffsetPastDataReturnsShortCount) {
  auto blocks = tenShardsOfHundred();
  VectorSink sink;
  EXPECT_EQ(writeDataBlocks(sink, blocks, 8, 790, 50), 10);
  EXPECT_EQ(writeDataBlocks(sink, blocks, 8, 5000, 50), 0);
  EXPECT_EQ(sink.data(), sequentialBytes(10, 790));
}

TEST(ShardAssembler, ShortWriteIsFatal) {
  auto blocks = tenShardsOfHundred();
  ShortWriteSink sink(20);
  EXPECT_ERASURE_ERROR(writeDataBlocks(sink, blocks, 8, 0, 200),
                       ErrorKind::SHORT_WRITE);
}

TEST(ShardAssembler, NegativeArgumentsRejected) {
  auto blocks = tenShardsOfHundred();
  VectorSink sink;
  EXPECT_THROW(writeDataBlocks(sink, blocks, 8, -1, 10),
               std::invalid_argument);
  EXPECT_THROW(writeDataBlocks(sink, blocks, 8, 0, -10),
               std::invalid_argument);
}

TEST(ShardAssembler, DataBlockLenIgnoresParity) {
  auto blocks = tenShardsOfHundred();
  EXPECT_EQ(getDataBlockLen(blocks, 8), 800);
  EXPECT_EQ(getDataBlockLen(blocks, 10), 1000);
}
