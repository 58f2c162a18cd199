// File: tests/TrackerConfigTest.cpp
// Purpose: Validate positional argument parsing and configuration errors.

#include <gtest/gtest.h>

#include "SampleStore.hpp"
#include "TrackerConfig.hpp"
#include "Utilities.hpp"

#include <string>
#include <vector>

using namespace ptt;

namespace
{

bool parse(TrackerConfig &config, std::vector<std::string> args)
{
    args.insert(args.begin(), "pool_tag_tracker");
    std::vector<char *> argv;
    for (auto &a : args)
        argv.push_back(a.data());
    return config.parseArgs(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(TrackerConfig, DefaultsWithoutArguments)
{
    TrackerConfig config;
    ASSERT_TRUE(parse(config, {}));
    EXPECT_EQ(config.interval_seconds, 30u);
    EXPECT_EQ(config.sample_count, 20u);
    EXPECT_EQ(config.threshold_bytes, 102'400);
    EXPECT_EQ(config.top_n, 15u);
    EXPECT_EQ(config.totalSeconds(), 600u);
}

TEST(TrackerConfig, PositionalArguments)
{
    TrackerConfig interval_only;
    ASSERT_TRUE(parse(interval_only, {"5"}));
    EXPECT_EQ(interval_only.interval_seconds, 5u);
    EXPECT_EQ(interval_only.sample_count, 20u);

    TrackerConfig both;
    ASSERT_TRUE(parse(both, {"60", "120"}));
    EXPECT_EQ(both.interval_seconds, 60u);
    EXPECT_EQ(both.sample_count, 120u);
    EXPECT_EQ(both.totalSeconds(), 7'200u);
}

TEST(TrackerConfig, RejectsNonIntegerArguments)
{
    for (const char *bad : {"abc", "1.5", "-3", "+4", " 7", "10s", "", "99999999999"})
    {
        TrackerConfig config;
        EXPECT_FALSE(parse(config, {bad})) << "interval '" << bad << "'";

        TrackerConfig second;
        EXPECT_FALSE(parse(second, {"30", bad})) << "samples '" << bad << "'";
    }
}

TEST(TrackerConfig, RejectsZeroAndSurplusArguments)
{
    TrackerConfig zero_interval;
    EXPECT_FALSE(parse(zero_interval, {"0"}));

    TrackerConfig zero_samples;
    EXPECT_FALSE(parse(zero_samples, {"30", "0"}));

    TrackerConfig surplus;
    EXPECT_FALSE(parse(surplus, {"30", "20", "extra"}));
}

TEST(Utilities, ParseUnsignedIsStrict)
{
    uint32_t value = 7;
    EXPECT_TRUE(parseUnsigned("4294967295", value));
    EXPECT_EQ(value, 4294967295u);
    EXPECT_FALSE(parseUnsigned("4294967296", value));
    EXPECT_EQ(value, 4294967295u);
}

TEST(Utilities, FormatBytes)
{
    EXPECT_EQ(formatBytes(512), "512.00 B");
    EXPECT_EQ(formatBytes(1536), "1.50 KB");
    EXPECT_EQ(formatBytes(2ULL * 1024 * 1024), "2.00 MB");
}

TEST(Utilities, QueryBufferDefaultsToTwoMegabytes)
{
    EXPECT_EQ(getQueryBufferBytes(), 2u * 1024 * 1024);
}

TEST(TrackerConfig, ThresholdDefaultMatchesSampleStore)
{
    TrackerConfig config;
    EXPECT_EQ(config.threshold_bytes, SampleStore::kDefaultThresholdBytes);
}
