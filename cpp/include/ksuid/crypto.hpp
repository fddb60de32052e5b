#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ksuid::crypto {

using Bytes = std::vector<std::uint8_t>;

// Source of secure random bytes. Implementations used from several threads
// must be safe for concurrent Fill() calls.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    virtual void Fill(std::uint8_t* out, std::size_t size) = 0;

protected:
    RandomSource() = default;
    RandomSource(const RandomSource&) = default;
    RandomSource& operator=(const RandomSource&) = default;
};

// OpenSSL CSPRNG (RAND_bytes). Stateless, safe to share across threads.
class OpenSslRandomSource final : public RandomSource {
public:
    OpenSslRandomSource() = default;

    void Fill(std::uint8_t* out, std::size_t size) override;
};

}  // namespace ksuid::crypto
