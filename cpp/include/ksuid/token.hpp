#pragma once

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

#include "ksuid/codec.hpp"
#include "ksuid/crypto.hpp"

namespace ksuid {

// 160 bits from the secure random source with no timestamp, for API keys and
// session secrets. Shares the KSUID text formats but exposes no time accessor
// and no ordering.
class Token {
public:
    static Token Generate();
    static Token Generate(crypto::RandomSource& random);

    static Token FromString(std::string_view text);
    static Token FromBase36(std::string_view text);
    static Token FromBytes(const crypto::Bytes& data);

    const codec::RawBytes& Bytes() const noexcept { return data_; }

    std::string ToBase62() const;
    std::string ToBase36() const;
    std::string ToString() const { return ToBase62(); }

private:
    explicit Token(const codec::RawBytes& data) noexcept : data_(data) {}

    codec::RawBytes data_{};
};

inline bool operator==(const Token& lhs, const Token& rhs) noexcept { return lhs.Bytes() == rhs.Bytes(); }
inline bool operator!=(const Token& lhs, const Token& rhs) noexcept { return lhs.Bytes() != rhs.Bytes(); }

std::ostream& operator<<(std::ostream& os, const Token& token);

}  // namespace ksuid

namespace std {

template <>
struct hash<ksuid::Token> {
    std::size_t operator()(const ksuid::Token& token) const noexcept {
        const auto& raw = token.Bytes();
        return std::hash<std::string_view>{}(std::string_view(reinterpret_cast<const char*>(raw.data()), raw.size()));
    }
};

}  // namespace std
