#include "erasurecore/metrics.h"
#include "erasurecore/storage_device.hpp"
#include "erasurecore/stream_copier.hpp"
#include "mocks/mock_storage_device.h"
#include <gtest/gtest.h>

using namespace erasurecore;

/**
 * @brief Verify correct formatting of label strings in Prometheus format.
 */
TEST(MetricsRegistry, LabelsToString) {
  std::map<std::string, std::string> labels{{"k", "v"}, {"a", "b"}};
  std::string formatted = MetricsRegistry::labelsToString(labels);
  // Map iteration is ordered, so "a" should come before "k".
  EXPECT_EQ(formatted, "{a=\"b\",k=\"v\"}");
}

/**
 * @brief Validate counter and histogram reporting.
 */
TEST(MetricsRegistry, BasicRecording) {
  MetricsRegistry::instance().reset();
  MetricsRegistry::instance().incrementCounter("requests_total", 3,
                                               {{"host", "localhost"}});
  MetricsRegistry::instance().observe("latency_seconds", 1.2);
  std::string metrics = MetricsRegistry::instance().toPrometheus();
  EXPECT_NE(metrics.find("requests_total{host=\"localhost\"} 3"),
            std::string::npos);
  EXPECT_NE(metrics.find("latency_seconds_sum 1.2"), std::string::npos);
  EXPECT_NE(metrics.find("latency_seconds_count 1"), std::string::npos);
  MetricsRegistry::instance().reset();
  EXPECT_TRUE(MetricsRegistry::instance().toPrometheus().empty());
}

TEST(MetricsRegistry, CounterValueByLabels) {
  MetricsRegistry::instance().reset();
  auto &reg = MetricsRegistry::instance();
  reg.incrementCounter("reads_total", 2, {{"disk", "a"}});
  reg.incrementCounter("reads_total", 5, {{"disk", "a"}});
  reg.incrementCounter("reads_total", 1, {{"disk", "b"}});
  EXPECT_DOUBLE_EQ(reg.counterValue("reads_total", {{"disk", "a"}}), 7.0);
  EXPECT_DOUBLE_EQ(reg.counterValue("reads_total", {{"disk", "b"}}), 1.0);
  EXPECT_DOUBLE_EQ(reg.counterValue("reads_total"), 0.0);
  reg.reset();
}

/**
 * @brief Counters recorded by the copy path appear in the exported text.
 */
TEST(MetricsRegistry, ExportsDataPathCounters) {
  MetricsRegistry::instance().reset();
  erasurecore::MemoryStorageDevice disk;
  disk.putFile("vol", "obj", erasurecore::test_support::sequentialBytes(128));
  erasurecore::VectorSink sink;
  erasurecore::copyAtMostN(sink, disk, "vol", "obj", 0, 128);

  std::string text = MetricsRegistry::instance().toPrometheus();
  EXPECT_NE(text.find("erasurecore_device_bytes_read_total 128"),
            std::string::npos)
      << text;
  MetricsRegistry::instance().reset();
}
