#include "ksuid/format.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace ksuid::format {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

constexpr std::int64_t kSecondsPerDay = 86400;

}  // namespace

std::string HexEncode(const std::uint8_t* data, std::size_t size) {
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(kHexDigits[(data[i] >> 4) & 0x0F]);
        out.push_back(kHexDigits[data[i] & 0x0F]);
    }
    return out;
}

std::uint32_t ReadU32BE(const std::uint8_t* data, std::size_t size, std::size_t offset) {
    if (offset + 4 > size) {
        throw std::runtime_error("Buffer too short for a 32-bit field");
    }
    return (static_cast<std::uint32_t>(data[offset]) << 24)
           | (static_cast<std::uint32_t>(data[offset + 1]) << 16)
           | (static_cast<std::uint32_t>(data[offset + 2]) << 8)
           | static_cast<std::uint32_t>(data[offset + 3]);
}

void WriteU32BE(std::uint32_t value, std::uint8_t* out) {
    out[0] = static_cast<std::uint8_t>((value >> 24) & 0xFF);
    out[1] = static_cast<std::uint8_t>((value >> 16) & 0xFF);
    out[2] = static_cast<std::uint8_t>((value >> 8) & 0xFF);
    out[3] = static_cast<std::uint8_t>(value & 0xFF);
}

std::string FormatUtc(std::int64_t unix_seconds) {
    const auto when = static_cast<std::time_t>(unix_seconds);
    std::tm parts{};
#if defined(_WIN32) || defined(_WIN64)
    if (gmtime_s(&parts, &when) != 0) {
        throw std::runtime_error("Timestamp is not representable as UTC time");
    }
#else
    if (gmtime_r(&when, &parts) == nullptr) {
        throw std::runtime_error("Timestamp is not representable as UTC time");
    }
#endif
    std::ostringstream oss;
    oss << std::put_time(&parts, "%Y-%m-%d %H:%M:%S") << "+00:00";
    return oss.str();
}

std::string FormatDuration(std::int64_t seconds) {
    std::ostringstream oss;
    std::uint64_t span = 0;
    if (seconds < 0) {
        oss << '-';
        span = static_cast<std::uint64_t>(-(seconds + 1)) + 1;
    } else {
        span = static_cast<std::uint64_t>(seconds);
    }
    const std::uint64_t days = span / kSecondsPerDay;
    const std::uint64_t rest = span % kSecondsPerDay;
    if (days > 0) {
        oss << days << (days == 1 ? " day, " : " days, ");
    }
    oss << rest / 3600 << ':' << std::setw(2) << std::setfill('0') << (rest / 60) % 60 << ':' << std::setw(2)
        << std::setfill('0') << rest % 60;
    return oss.str();
}

}  // namespace ksuid::format
