#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include "ksuid/env.hpp"

namespace ksuid::constants {

// 2014-05-13T16:53:20Z
inline constexpr std::int64_t kEpoch = 1400000000;

inline constexpr std::size_t kTimestampLength = 4;
inline constexpr std::size_t kPayloadLength = 16;
inline constexpr std::size_t kTotalLength = kTimestampLength + kPayloadLength;

inline constexpr std::int64_t kMaxRawTimestamp = std::numeric_limits<std::uint32_t>::max();

// ceil(160 * log(2) / log(radix))
inline constexpr std::size_t kBase62Length = 27;
inline constexpr std::size_t kBase36Length = 31;

inline constexpr std::string_view kBase62Alphabet = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
inline constexpr std::string_view kBase36Alphabet = "0123456789abcdefghijklmnopqrstuvwxyz";

inline constexpr std::string_view kLibraryVersion = "2.0.0";

inline constexpr std::size_t kBenchIterations = 10000;

inline std::size_t BenchIterations() {
    return ksuid::env::GetPositiveCount("KSUID_BENCH_ITERATIONS", kBenchIterations);
}

inline bool LowercaseByDefault() {
    return ksuid::env::IsEnabled("KSUID_LOWERCASE");
}

inline bool ColorsDisabledByEnv() {
    return !ksuid::env::Get("NO_COLOR").empty() || ksuid::env::IsEnabled("KSUID_NO_COLOR");
}

}  // namespace ksuid::constants
