#pragma once

#include <string>

#include "ksuid/clock.hpp"
#include "ksuid/crypto.hpp"
#include "ksuid/ksuid.hpp"
#include "ksuid/token.hpp"

namespace ksuid {

// Binds a clock and a random source. Holds references only; both must outlive
// the generator. Safe to share across threads when both sources are.
class Generator {
public:
    Generator(Clock& clock, crypto::RandomSource& random) : clock_(clock), random_(random) {}

    Ksuid Next();
    std::string NextLowercase();
    Token NextToken();
    std::string NextTokenString();
    std::string NextTokenLowercase();

private:
    Clock& clock_;
    crypto::RandomSource& random_;
};

Ksuid Generate();
std::string GenerateLowercase();
std::string GenerateToken();
std::string GenerateTokenLowercase();

}  // namespace ksuid
