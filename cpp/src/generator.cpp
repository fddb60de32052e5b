#include "ksuid/generator.hpp"

#include <optional>

namespace ksuid {

Ksuid Generator::Next() {
    return Ksuid::Create(std::nullopt, std::nullopt, clock_, random_);
}

std::string Generator::NextLowercase() {
    return Next().ToBase36();
}

Token Generator::NextToken() {
    return Token::Generate(random_);
}

std::string Generator::NextTokenString() {
    return NextToken().ToBase62();
}

std::string Generator::NextTokenLowercase() {
    return NextToken().ToBase36();
}

Ksuid Generate() {
    return Ksuid::Create();
}

std::string GenerateLowercase() {
    return Ksuid::Create().ToBase36();
}

std::string GenerateToken() {
    return Token::Generate().ToBase62();
}

std::string GenerateTokenLowercase() {
    return Token::Generate().ToBase36();
}

}  // namespace ksuid
