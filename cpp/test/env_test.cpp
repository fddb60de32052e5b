#include <gtest/gtest.h>

#include <cstdlib>

#include "ksuid/constants.hpp"
#include "ksuid/env.hpp"

namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        setenv(name_, value, 1);
    }
    ~ScopedEnv() { unsetenv(name_); }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    const char* name_;
};

}  // namespace

TEST(EnvTest, MissingVariableIsEmpty) {
    unsetenv("KSUID_TEST_UNSET");
    EXPECT_EQ(ksuid::env::Get("KSUID_TEST_UNSET"), "");
    EXPECT_FALSE(ksuid::env::IsEnabled("KSUID_TEST_UNSET"));
    EXPECT_TRUE(ksuid::env::IsEnabled("KSUID_TEST_UNSET", true));
}

TEST(EnvTest, TruthyValues) {
    for (const char* value : {"1", "true", "YES", " on "}) {
        ScopedEnv env("KSUID_TEST_FLAG", value);
        EXPECT_TRUE(ksuid::env::IsEnabled("KSUID_TEST_FLAG")) << value;
    }
    ScopedEnv env("KSUID_TEST_FLAG", "nope");
    EXPECT_FALSE(ksuid::env::IsEnabled("KSUID_TEST_FLAG", true));
}

TEST(EnvTest, PositiveCountParsing) {
    unsetenv("KSUID_TEST_COUNT");
    EXPECT_EQ(ksuid::env::GetPositiveCount("KSUID_TEST_COUNT", 7), 7u);
    {
        ScopedEnv env("KSUID_TEST_COUNT", " 42 ");
        EXPECT_EQ(ksuid::env::GetPositiveCount("KSUID_TEST_COUNT", 7), 42u);
    }
    for (const char* value : {"0", "-3", "12abc", "abc", ""}) {
        ScopedEnv env("KSUID_TEST_COUNT", value);
        EXPECT_EQ(ksuid::env::GetPositiveCount("KSUID_TEST_COUNT", 7), 7u) << value;
    }
    {
        ScopedEnv env("KSUID_TEST_COUNT", "99999999999");
        EXPECT_EQ(ksuid::env::GetPositiveCount("KSUID_TEST_COUNT", 7), 0xFFFFFFFFu);
    }
}

TEST(EnvTest, BenchIterationsFallsBackOnBadInput) {
    {
        ScopedEnv env("KSUID_BENCH_ITERATIONS", "2500");
        EXPECT_EQ(ksuid::constants::BenchIterations(), 2500u);
    }
    {
        ScopedEnv env("KSUID_BENCH_ITERATIONS", "0");
        EXPECT_EQ(ksuid::constants::BenchIterations(), ksuid::constants::kBenchIterations);
    }
    {
        ScopedEnv env("KSUID_BENCH_ITERATIONS", "lots");
        EXPECT_EQ(ksuid::constants::BenchIterations(), ksuid::constants::kBenchIterations);
    }
    EXPECT_EQ(ksuid::constants::BenchIterations(), ksuid::constants::kBenchIterations);
}

TEST(EnvTest, LowercaseDefault) {
    EXPECT_FALSE(ksuid::constants::LowercaseByDefault());
    ScopedEnv env("KSUID_LOWERCASE", "1");
    EXPECT_TRUE(ksuid::constants::LowercaseByDefault());
}
