#include "ksuid/codec.hpp"

#include "ksuid/errors.hpp"
#include "ksuid/format.hpp"

#include <array>
#include <string>

namespace ksuid::codec {

namespace {

constexpr std::size_t kWordCount = constants::kTotalLength / 4;
constexpr std::uint8_t kInvalidDigit = 0xFF;

using Words = std::array<std::uint32_t, kWordCount>;
using DecodeTable = std::array<std::uint8_t, 256>;

DecodeTable BuildDecodeTable(std::string_view symbols) {
    DecodeTable table{};
    table.fill(kInvalidDigit);
    for (std::size_t i = 0; i < symbols.size(); ++i) {
        table[static_cast<unsigned char>(symbols[i])] = static_cast<std::uint8_t>(i);
    }
    return table;
}

const DecodeTable kBase62DecodeTable = BuildDecodeTable(constants::kBase62Alphabet);
const DecodeTable kBase36DecodeTable = BuildDecodeTable(constants::kBase36Alphabet);

const DecodeTable& TableFor(Alphabet alphabet) noexcept {
    return alphabet == Alphabet::kBase62 ? kBase62DecodeTable : kBase36DecodeTable;
}

const char* NameOf(Alphabet alphabet) noexcept {
    return alphabet == Alphabet::kBase62 ? "Base62" : "Base36";
}

Words ToWords(const RawBytes& data) {
    Words words{};
    for (std::size_t i = 0; i < kWordCount; ++i) {
        words[i] = format::ReadU32BE(data.data(), data.size(), i * 4);
    }
    return words;
}

RawBytes FromWords(const Words& words) {
    RawBytes out{};
    for (std::size_t i = 0; i < kWordCount; ++i) {
        format::WriteU32BE(words[i], out.data() + i * 4);
    }
    return out;
}

bool IsZero(const Words& words) noexcept {
    for (std::uint32_t word : words) {
        if (word != 0) {
            return false;
        }
    }
    return true;
}

// Divides the big-endian word array in place and returns the remainder.
std::uint32_t DivMod(Words& words, std::uint32_t divisor) noexcept {
    std::uint64_t remainder = 0;
    for (std::uint32_t& word : words) {
        const std::uint64_t value = (remainder << 32) | word;
        word = static_cast<std::uint32_t>(value / divisor);
        remainder = value % divisor;
    }
    return static_cast<std::uint32_t>(remainder);
}

// words = words * multiplier + addend; returns false once the value no longer fits in 160 bits.
bool MulAdd(Words& words, std::uint32_t multiplier, std::uint32_t addend) noexcept {
    std::uint64_t carry = addend;
    for (std::size_t i = kWordCount; i-- > 0;) {
        const std::uint64_t value = static_cast<std::uint64_t>(words[i]) * multiplier + carry;
        words[i] = static_cast<std::uint32_t>(value & 0xFFFFFFFFu);
        carry = value >> 32;
    }
    return carry == 0;
}

}  // namespace

std::size_t EncodedLength(Alphabet alphabet) noexcept {
    return alphabet == Alphabet::kBase62 ? constants::kBase62Length : constants::kBase36Length;
}

std::string_view Symbols(Alphabet alphabet) noexcept {
    return alphabet == Alphabet::kBase62 ? constants::kBase62Alphabet : constants::kBase36Alphabet;
}

std::string Encode(const RawBytes& data, Alphabet alphabet) {
    const std::string_view symbols = Symbols(alphabet);
    const auto radix = static_cast<std::uint32_t>(symbols.size());
    const std::size_t width = EncodedLength(alphabet);

    std::string out(width, symbols[0]);
    Words words = ToWords(data);
    std::size_t pos = width;
    while (!IsZero(words) && pos > 0) {
        out[--pos] = symbols[DivMod(words, radix)];
    }
    return out;
}

RawBytes Decode(std::string_view text, Alphabet alphabet) {
    const std::size_t width = EncodedLength(alphabet);
    if (text.size() != width) {
        if (alphabet == Alphabet::kBase62) {
            throw DecodeError("KSUID string must be exactly " + std::to_string(width) + " characters");
        }
        throw DecodeError("Base36 KSUID string must be exactly " + std::to_string(width) + " characters");
    }
    const DecodeTable& table = TableFor(alphabet);
    const auto radix = static_cast<std::uint32_t>(Symbols(alphabet).size());

    Words words{};
    for (char ch : text) {
        const std::uint8_t digit = table[static_cast<unsigned char>(ch)];
        if (digit == kInvalidDigit) {
            throw DecodeError(std::string("Invalid ") + (alphabet == Alphabet::kBase62 ? "base62" : "base36")
                              + " character: " + ch);
        }
        if (!MulAdd(words, radix, digit)) {
            throw DecodeError(std::string(NameOf(alphabet)) + " value exceeds maximum for KSUID");
        }
    }
    return FromWords(words);
}

bool IsValid(std::string_view text, Alphabet alphabet) noexcept {
    if (text.size() != EncodedLength(alphabet)) {
        return false;
    }
    const DecodeTable& table = TableFor(alphabet);
    const auto radix = static_cast<std::uint32_t>(Symbols(alphabet).size());
    Words words{};
    for (char ch : text) {
        const std::uint8_t digit = table[static_cast<unsigned char>(ch)];
        if (digit == kInvalidDigit || !MulAdd(words, radix, digit)) {
            return false;
        }
    }
    return true;
}

std::string Base62Encode(const RawBytes& data) {
    return Encode(data, Alphabet::kBase62);
}

RawBytes Base62Decode(std::string_view text) {
    return Decode(text, Alphabet::kBase62);
}

std::string Base36Encode(const RawBytes& data) {
    return Encode(data, Alphabet::kBase36);
}

RawBytes Base36Decode(std::string_view text) {
    return Decode(text, Alphabet::kBase36);
}

}  // namespace ksuid::codec
