#include "ksuid/prefixed.hpp"

#include "ksuid/errors.hpp"

namespace ksuid::prefixed {

namespace {

struct EntityEntry {
    std::string_view entity;
    std::string_view prefix;
};

constexpr EntityEntry kEntityPrefixes[] = {
    {"user", "user"},          {"admin", "adm"},
    {"guest", "gst"},          {"payment_intent", "pi"},
    {"payment_method", "pm"},  {"customer", "cus"},
    {"charge", "ch"},          {"refund", "re"},
    {"invoice", "in"},         {"subscription", "sub"},
    {"product", "prod"},       {"price", "price"},
    {"secret_key", "sk"},      {"public_key", "pk"},
    {"api_key", "ak"},         {"token", "tok"},
    {"session", "sess"},       {"order", "ord"},
    {"transaction", "txn"},    {"shipment", "ship"},
    {"warehouse", "wh"},       {"inventory", "inv"},
    {"post", "post"},          {"comment", "comm"},
    {"file", "file"},          {"upload", "up"},
    {"download", "dl"},        {"log", "log"},
    {"event", "evt"},          {"notification", "notif"},
    {"webhook", "whk"},        {"job", "job"},
    {"task", "task"},
};

constexpr char kSeparator = '_';

bool IsAsciiAlpha(char ch) noexcept {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

bool IsAsciiDigit(char ch) noexcept {
    return ch >= '0' && ch <= '9';
}

void RequireValidPrefix(std::string_view prefix) {
    if (prefix.empty()) {
        throw ValidationError("Prefix cannot be empty");
    }
    if (!IsValidPrefix(prefix)) {
        throw ValidationError(
            "Prefix must start with a letter and contain only alphanumeric characters and underscores");
    }
}

std::string Join(std::string_view prefix, const std::string& encoded) {
    std::string out;
    out.reserve(prefix.size() + 1 + encoded.size());
    out.append(prefix);
    out.push_back(kSeparator);
    out.append(encoded);
    return out;
}

}  // namespace

bool IsValidPrefix(std::string_view prefix) noexcept {
    if (prefix.empty() || !IsAsciiAlpha(prefix.front())) {
        return false;
    }
    for (char ch : prefix) {
        if (!IsAsciiAlpha(ch) && !IsAsciiDigit(ch) && ch != kSeparator) {
            return false;
        }
    }
    return true;
}

std::string Create(std::string_view prefix) {
    RequireValidPrefix(prefix);
    return Create(prefix, Ksuid::Create());
}

std::string Create(std::string_view prefix, const Ksuid& id) {
    RequireValidPrefix(prefix);
    return Join(prefix, id.ToBase62());
}

std::string CreateLowercase(std::string_view prefix, const Ksuid& id) {
    RequireValidPrefix(prefix);
    return Join(prefix, id.ToBase36());
}

ParsedId Parse(std::string_view prefixed_id) {
    const std::size_t split = prefixed_id.rfind(kSeparator);
    if (split == std::string_view::npos || split == 0) {
        throw ValidationError("Invalid prefixed KSUID format");
    }
    ParsedId parsed;
    parsed.prefix = std::string(prefixed_id.substr(0, split));
    try {
        const std::string_view suffix = prefixed_id.substr(split + 1);
        parsed.id = suffix.size() == constants::kBase36Length ? Ksuid::FromBase36(suffix) : Ksuid::FromString(suffix);
    } catch (const DecodeError& exc) {
        throw ValidationError(std::string("Invalid KSUID part: ") + exc.what());
    }
    return parsed;
}

bool Validate(std::string_view prefixed_id, std::string_view expected_prefix) {
    try {
        ParsedId parsed = Parse(prefixed_id);
        return expected_prefix.empty() || parsed.prefix == expected_prefix;
    } catch (const ValidationError&) {
        return false;
    }
}

std::string GetPrefix(std::string_view prefixed_id) {
    return Parse(prefixed_id).prefix;
}

Ksuid GetKsuid(std::string_view prefixed_id) {
    return Parse(prefixed_id).id;
}

std::optional<std::string_view> EntityPrefix(std::string_view entity) noexcept {
    for (const auto& entry : kEntityPrefixes) {
        if (entry.entity == entity) {
            return entry.prefix;
        }
    }
    return std::nullopt;
}

}  // namespace ksuid::prefixed
