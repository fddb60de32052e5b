#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "ksuid/codec.hpp"
#include "ksuid/crypto.hpp"

namespace ksuid::testing {

// Writes 0, 1, 2, ... (mod 256) and counts how many bytes were requested.
class SequenceRandomSource final : public crypto::RandomSource {
public:
    void Fill(std::uint8_t* out, std::size_t size) override {
        for (std::size_t i = 0; i < size; ++i) {
            out[i] = static_cast<std::uint8_t>(next_++ & 0xFF);
        }
        consumed_ += size;
    }

    std::size_t Consumed() const { return consumed_; }

private:
    std::size_t next_ = 0;
    std::size_t consumed_ = 0;
};

class ConstantRandomSource final : public crypto::RandomSource {
public:
    explicit ConstantRandomSource(std::uint8_t value) : value_(value) {}

    void Fill(std::uint8_t* out, std::size_t size) override {
        for (std::size_t i = 0; i < size; ++i) {
            out[i] = value_;
        }
    }

private:
    std::uint8_t value_;
};

inline codec::RawBytes RawFromHex(const std::string& hex) {
    codec::RawBytes out{};
    if (hex.size() != out.size() * 2) {
        throw std::invalid_argument("hex fixture must be 40 characters");
    }
    for (std::size_t i = 0; i < out.size(); ++i) {
        out[i] = static_cast<std::uint8_t>(std::stoul(hex.substr(i * 2, 2), nullptr, 16));
    }
    return out;
}

}  // namespace ksuid::testing
