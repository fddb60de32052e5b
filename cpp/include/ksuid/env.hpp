#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace ksuid::env {

// Raw value, or an empty string when the variable is unset.
std::string Get(std::string_view name);

// 1/true/yes/on (any case, surrounding whitespace ignored) enable a flag.
bool IsEnabled(std::string_view name, bool default_value = false);

// Positive decimal count, capped at 2^32-1. Unset, zero or malformed
// values yield `fallback`.
std::size_t GetPositiveCount(std::string_view name, std::size_t fallback);

}  // namespace ksuid::env
