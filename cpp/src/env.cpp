#include "ksuid/env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace ksuid::env {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string Trim(const std::string& value) {
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(begin, end - begin);
}

}  // namespace

std::string Get(std::string_view name) {
    std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (!value) {
        return {};
    }
    return std::string(value);
}

bool IsEnabled(std::string_view name, bool default_value) {
    std::string value = Trim(Get(name));
    if (value.empty()) {
        return default_value;
    }
    value = ToLower(value);
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

std::size_t GetPositiveCount(std::string_view name, std::size_t fallback) {
    const std::string raw = Trim(Get(name));
    if (raw.empty() || raw.front() == '-') {
        return fallback;
    }
    std::size_t used = 0;
    unsigned long long parsed = 0;
    try {
        parsed = std::stoull(raw, &used);
    } catch (const std::invalid_argument&) {
        return fallback;
    } catch (const std::out_of_range&) {
        return std::numeric_limits<std::uint32_t>::max();
    }
    if (used != raw.size() || parsed == 0) {
        return fallback;
    }
    if (parsed > std::numeric_limits<std::uint32_t>::max()) {
        return std::numeric_limits<std::uint32_t>::max();
    }
    return static_cast<std::size_t>(parsed);
}

}  // namespace ksuid::env
