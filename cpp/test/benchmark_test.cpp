#include <gtest/gtest.h>

#include <vector>

#include "ksuid/benchmark.hpp"
#include "ksuid/clock.hpp"
#include "test_support.hpp"

TEST(BenchmarkTest, FormatCountGroupsThousands) {
    EXPECT_EQ(ksuid::bench::FormatCount(0), "0");
    EXPECT_EQ(ksuid::bench::FormatCount(999), "999");
    EXPECT_EQ(ksuid::bench::FormatCount(1000), "1,000");
    EXPECT_EQ(ksuid::bench::FormatCount(12345), "12,345");
    EXPECT_EQ(ksuid::bench::FormatCount(1234567), "1,234,567");
}

TEST(BenchmarkTest, FormatRateReportsPerSecond) {
    ksuid::bench::Measurement m;
    m.iterations = 5000;
    m.seconds = 2.0;
    EXPECT_EQ(ksuid::bench::FormatRate(m), "2,500/second");
    EXPECT_EQ(ksuid::bench::FormatRate(m, "KSUIDs"), "2,500 KSUIDs/second");

    m.seconds = 0.0;
    EXPECT_EQ(ksuid::bench::FormatRate(m, "parses"), "0 parses/second");
}

TEST(BenchmarkTest, RunsEveryStage) {
    ksuid::SystemClock clock;
    ksuid::crypto::OpenSslRandomSource random;
    ksuid::Generator generator(clock, random);

    ksuid::bench::GenerationRun run = ksuid::bench::RunGeneration(500, generator);
    EXPECT_EQ(run.ids.size(), 500u);
    EXPECT_EQ(run.measurement.iterations, 500u);
    EXPECT_EQ(run.measurement.unique, 500u);
    EXPECT_GE(run.measurement.Rate(), 0.0);

    EXPECT_EQ(ksuid::bench::RunStringParsing(run.ids).iterations, 500u);
    EXPECT_EQ(ksuid::bench::RunBytesParsing(run.ids).iterations, 500u);
    EXPECT_EQ(ksuid::bench::RunComparison(run.ids, 2000).iterations, 2000u);
    EXPECT_TRUE(ksuid::bench::RunSorting(run.ids).sorted_ok);
}

TEST(BenchmarkTest, DuplicatesAreCounted) {
    ksuid::FixedClock clock(1609459200);
    ksuid::testing::ConstantRandomSource random(0x42);
    ksuid::Generator generator(clock, random);

    ksuid::bench::GenerationRun run = ksuid::bench::RunGeneration(10, generator);
    EXPECT_EQ(run.measurement.unique, 1u);
    EXPECT_EQ(ksuid::bench::RunComparison({}, 10).iterations, 0u);
}
