#include <iostream>
#include <string>
#include "ksuid/format.hpp"
#include "ksuid/ksuid.hpp"

namespace {

bool Check(const std::string& label, const std::string& actual, const std::string& expected) {
    bool match = actual == expected;
    std::cout << "  " << label << ": " << actual << std::endl;
    std::cout << "  Expected: " << expected << std::endl;
    std::cout << "  Match: " << (match ? "true" : "false") << std::endl;
    return match;
}

}  // namespace

int main() {
    bool ok = true;

    // Reference value published with the original Go implementation.
    std::string goEncoded = "0ujtsYcgvSTl8PAuAdqWYSMnLOv";
    std::cout << "C++ decoding Go-encoded KSUID:" << std::endl;
    ksuid::Ksuid decoded = ksuid::Ksuid::FromString(goEncoded);
    const auto& raw = decoded.Bytes();
    ok &= Check("Raw bytes", ksuid::format::HexEncode(raw.data(), raw.size()),
                "0669f7efb5a1cd34b5f99d1154fb6853345c9735");
    ok &= Check("Raw timestamp", std::to_string(decoded.RawTimestamp()), "107608047");
    ok &= Check("Datetime", ksuid::format::FormatUtc(decoded.Timestamp()), "2017-10-10 04:00:47+00:00");
    ok &= Check("Base36", decoded.ToBase36(), "0qyzlcs6br8o5i39m8a82au1x92sg8l");

    std::cout << "\nC++ encoding the maximum KSUID:" << std::endl;
    ksuid::crypto::Bytes max_bytes(ksuid::constants::kTotalLength, 0xFF);
    ksuid::Ksuid max_id = ksuid::Ksuid::FromBytes(max_bytes);
    ok &= Check("Base62", max_id.ToBase62(), "aWgEPTl1tmebfsQzFP4bxwgy80V");
    ok &= Check("Base36", max_id.ToBase36(), "twj4yidkw7a8pn4g709kzmfoaol3x8f");

    std::cout << "\nC++ encoding for Python/Go (2021-01-01, payload 0x01 * 16):" << std::endl;
    ksuid::Ksuid fixed = ksuid::Ksuid::Create(1609459200, ksuid::crypto::Bytes(16, 0x01));
    ok &= Check("Base62", fixed.ToBase62(), "1mRb9ctddm7jgERwPW7WPDfNQXZ");
    ok &= Check("Base36", fixed.ToBase36(), "1gi13tg43i8hbvw2i90b4ggl4z3bif5");

    std::cout << "\nOverall: " << (ok ? "PASS" : "FAIL") << std::endl;
    return ok ? 0 : 1;
}
