/***
 * Name: test_metrics
 * Purpose: Metrics registry recording and printers.
 */
#include <gtest/gtest.h>

#include <sstream>

#include "tycast/metrics/metrics.h"

using tycast::metrics::Metrics;

namespace {
class MetricsTest : public ::testing::Test {
 protected:
  void SetUp() override { Metrics::Reset(); }
  void TearDown() override { Metrics::Reset(); }
};
}  // namespace

TEST_F(MetricsTest, DisabledRecordsNothing) {
  { const Metrics::ScopedTimer timer(Metrics::Phase::Parse); }
  Metrics::IncCounter("parse.unions");
  EXPECT_TRUE(Metrics::GetRegistry().durations_ns.empty());
  EXPECT_TRUE(Metrics::GetRegistry().counters.empty());
  std::ostringstream out;
  Metrics::PrintMetrics(Metrics::GetRegistry(), out);
  EXPECT_TRUE(out.str().empty());
}

TEST_F(MetricsTest, EnabledRecordsTimersAndCounters) {
  Metrics::Enable(true);
  { const Metrics::ScopedTimer timer(Metrics::Phase::CastCheck); }
  Metrics::IncCounter("cast.castable");
  Metrics::IncCounter("cast.castable", 2);
  Metrics::SetCounter("types.interned", 17);
  const auto& reg = Metrics::GetRegistry();
  ASSERT_EQ(reg.durations_ns.size(), 1u);
  EXPECT_EQ(reg.durations_ns[0].first, Metrics::Phase::CastCheck);
  EXPECT_EQ(reg.counters.at("cast.castable"), 3u);
  EXPECT_EQ(reg.counters.at("types.interned"), 17u);
}

TEST_F(MetricsTest, TextAndJsonPrinters) {
  Metrics::Enable(true);
  { const Metrics::ScopedTimer timer(Metrics::Phase::RegistryLoad); }
  Metrics::IncCounter("parse.unions");
  std::ostringstream text;
  Metrics::PrintMetrics(Metrics::GetRegistry(), text);
  EXPECT_NE(text.str().find("RegistryLoad"), std::string::npos);
  EXPECT_NE(text.str().find("parse.unions = 1"), std::string::npos);
  std::ostringstream json;
  Metrics::PrintMetricsJson(Metrics::GetRegistry(), json);
  EXPECT_NE(json.str().find("\"phase\": \"RegistryLoad\""), std::string::npos);
  EXPECT_NE(json.str().find("\"parse.unions\": 1"), std::string::npos);
}
