#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>

#include "ksuid/clock.hpp"
#include "ksuid/codec.hpp"
#include "ksuid/constants.hpp"
#include "ksuid/crypto.hpp"

namespace ksuid {

using RawBytes = codec::RawBytes;
using PayloadBytes = std::array<std::uint8_t, constants::kPayloadLength>;

// K-Sortable Unique Identifier: 4-byte big-endian timestamp (seconds since
// 2014-05-13T16:53:20Z) followed by a 16-byte payload. Immutable once built;
// ordering is unsigned byte-lexicographic over all 20 bytes, which matches
// the ordering of both string encodings.
class Ksuid {
public:
    // Nil value, all bytes zero.
    Ksuid() = default;

    // Omitted timestamp reads the system clock; omitted payload is filled
    // from OpenSSL. Timestamps are Unix seconds.
    static Ksuid Create(std::optional<std::int64_t> unix_timestamp = std::nullopt,
                        const std::optional<crypto::Bytes>& payload = std::nullopt);
    static Ksuid Create(std::optional<std::int64_t> unix_timestamp,
                        const std::optional<crypto::Bytes>& payload,
                        Clock& clock,
                        crypto::RandomSource& random);

    static Ksuid FromString(std::string_view text);
    static Ksuid FromBase36(std::string_view text);
    static Ksuid FromBytes(const crypto::Bytes& data);
    static Ksuid FromBytes(const RawBytes& data) noexcept;

    std::int64_t Timestamp() const noexcept;
    std::uint32_t RawTimestamp() const noexcept;
    std::chrono::system_clock::time_point Datetime() const;
    PayloadBytes Payload() const noexcept;
    const RawBytes& Bytes() const noexcept { return data_; }
    bool IsNil() const noexcept;

    std::string ToBase62() const;
    std::string ToBase36() const;
    std::string ToString() const { return ToBase62(); }

private:
    explicit Ksuid(const RawBytes& data) noexcept : data_(data) {}

    RawBytes data_{};
};

inline bool operator==(const Ksuid& lhs, const Ksuid& rhs) noexcept { return lhs.Bytes() == rhs.Bytes(); }
inline bool operator!=(const Ksuid& lhs, const Ksuid& rhs) noexcept { return lhs.Bytes() != rhs.Bytes(); }
inline bool operator<(const Ksuid& lhs, const Ksuid& rhs) noexcept { return lhs.Bytes() < rhs.Bytes(); }
inline bool operator<=(const Ksuid& lhs, const Ksuid& rhs) noexcept { return lhs.Bytes() <= rhs.Bytes(); }
inline bool operator>(const Ksuid& lhs, const Ksuid& rhs) noexcept { return lhs.Bytes() > rhs.Bytes(); }
inline bool operator>=(const Ksuid& lhs, const Ksuid& rhs) noexcept { return lhs.Bytes() >= rhs.Bytes(); }

// Equality over arbitrary values: anything that is not a Ksuid is unequal.
template <typename T>
bool SameValue(const Ksuid& id, const T& other) noexcept {
    if constexpr (std::is_same_v<std::decay_t<T>, Ksuid>) {
        return id == other;
    } else {
        return false;
    }
}

std::ostream& operator<<(std::ostream& os, const Ksuid& id);

}  // namespace ksuid

namespace std {

template <>
struct hash<ksuid::Ksuid> {
    std::size_t operator()(const ksuid::Ksuid& id) const noexcept {
        const auto& raw = id.Bytes();
        return std::hash<std::string_view>{}(std::string_view(reinterpret_cast<const char*>(raw.data()), raw.size()));
    }
};

}  // namespace std
