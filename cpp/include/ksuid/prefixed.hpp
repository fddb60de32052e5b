#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "ksuid/ksuid.hpp"

namespace ksuid::prefixed {

// Stripe-style "<prefix>_<base62 ksuid>" identifiers, e.g. "cus_0ujtsYcgvSTl8PAuAdqWYSMnLOv".
struct ParsedId {
    std::string prefix;
    Ksuid id;
};

bool IsValidPrefix(std::string_view prefix) noexcept;

std::string Create(std::string_view prefix);
std::string Create(std::string_view prefix, const Ksuid& id);
// "<prefix>_<base36 ksuid>"; Parse() accepts either suffix form.
std::string CreateLowercase(std::string_view prefix, const Ksuid& id);

// Splits at the last underscore, so prefixes may themselves contain '_'.
ParsedId Parse(std::string_view prefixed_id);

bool Validate(std::string_view prefixed_id, std::string_view expected_prefix = {});
std::string GetPrefix(std::string_view prefixed_id);
Ksuid GetKsuid(std::string_view prefixed_id);

// Conventional short prefix for an entity name ("customer" -> "cus").
std::optional<std::string_view> EntityPrefix(std::string_view entity) noexcept;

}  // namespace ksuid::prefixed
