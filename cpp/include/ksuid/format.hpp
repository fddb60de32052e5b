#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace ksuid::format {

std::string HexEncode(const std::uint8_t* data, std::size_t size);

std::uint32_t ReadU32BE(const std::uint8_t* data, std::size_t size, std::size_t offset);
void WriteU32BE(std::uint32_t value, std::uint8_t* out);

// "2021-01-01 00:00:00+00:00"
std::string FormatUtc(std::int64_t unix_seconds);

// "[N day[s], ]H:MM:SS", with a leading '-' for negative spans.
std::string FormatDuration(std::int64_t seconds);

}  // namespace ksuid::format
