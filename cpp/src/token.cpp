#include "ksuid/token.hpp"

#include "ksuid/errors.hpp"

#include <algorithm>

namespace ksuid {

Token Token::Generate() {
    crypto::OpenSslRandomSource random;
    return Generate(random);
}

Token Token::Generate(crypto::RandomSource& random) {
    codec::RawBytes data{};
    random.Fill(data.data(), data.size());
    return Token(data);
}

Token Token::FromString(std::string_view text) {
    return Token(codec::Base62Decode(text));
}

Token Token::FromBase36(std::string_view text) {
    return Token(codec::Base36Decode(text));
}

Token Token::FromBytes(const crypto::Bytes& data) {
    if (data.size() != constants::kTotalLength) {
        throw ValidationError("Token bytes must be exactly " + std::to_string(constants::kTotalLength) + " bytes");
    }
    codec::RawBytes raw{};
    std::copy(data.begin(), data.end(), raw.begin());
    return Token(raw);
}

std::string Token::ToBase62() const {
    return codec::Base62Encode(data_);
}

std::string Token::ToBase36() const {
    return codec::Base36Encode(data_);
}

std::ostream& operator<<(std::ostream& os, const Token& token) {
    return os << token.ToBase62();
}

}  // namespace ksuid
