#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "ksuid/constants.hpp"

namespace ksuid::codec {

using RawBytes = std::array<std::uint8_t, constants::kTotalLength>;

enum class Alphabet {
    kBase62,  // 0-9, A-Z, a-z
    kBase36,  // 0-9, a-z
};

std::size_t EncodedLength(Alphabet alphabet) noexcept;
std::string_view Symbols(Alphabet alphabet) noexcept;

// Fixed-width, order-preserving rendering of the 160-bit big-endian value.
std::string Encode(const RawBytes& data, Alphabet alphabet);

// Throws DecodeError on wrong length, foreign characters or values >= 2^160.
RawBytes Decode(std::string_view text, Alphabet alphabet);

bool IsValid(std::string_view text, Alphabet alphabet) noexcept;

std::string Base62Encode(const RawBytes& data);
RawBytes Base62Decode(std::string_view text);

std::string Base36Encode(const RawBytes& data);
RawBytes Base36Decode(std::string_view text);

}  // namespace ksuid::codec
