#include "ksuid/crypto.hpp"

#include <openssl/rand.h>

#include <climits>
#include <stdexcept>

namespace ksuid::crypto {

namespace {

void Ensure(bool ok, const char* message) {
    if (!ok) {
        throw std::runtime_error(message);
    }
}

}  // namespace

void OpenSslRandomSource::Fill(std::uint8_t* out, std::size_t size) {
    while (size > 0) {
        const std::size_t chunk = size > static_cast<std::size_t>(INT_MAX) ? static_cast<std::size_t>(INT_MAX) : size;
        Ensure(RAND_bytes(out, static_cast<int>(chunk)) == 1, "RAND_bytes failed");
        out += chunk;
        size -= chunk;
    }
}

}  // namespace ksuid::crypto
