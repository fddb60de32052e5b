#include "ksuid/ksuid.hpp"

#include "ksuid/errors.hpp"
#include "ksuid/format.hpp"

#include <algorithm>
#include <string>

namespace ksuid {

namespace {

std::uint32_t ToRawTimestamp(std::int64_t unix_timestamp) {
    if (unix_timestamp < constants::kEpoch) {
        throw ValidationError("Timestamp cannot be before KSUID epoch (2014-05-13 16:53:20 UTC)");
    }
    const std::int64_t raw = unix_timestamp - constants::kEpoch;
    if (raw > constants::kMaxRawTimestamp) {
        throw ValidationError("Timestamp overflow: too far in the future");
    }
    return static_cast<std::uint32_t>(raw);
}

}  // namespace

Ksuid Ksuid::Create(std::optional<std::int64_t> unix_timestamp, const std::optional<crypto::Bytes>& payload) {
    SystemClock clock;
    crypto::OpenSslRandomSource random;
    return Create(unix_timestamp, payload, clock, random);
}

Ksuid Ksuid::Create(std::optional<std::int64_t> unix_timestamp,
                    const std::optional<crypto::Bytes>& payload,
                    Clock& clock,
                    crypto::RandomSource& random) {
    if (payload && payload->size() != constants::kPayloadLength) {
        throw ValidationError("Payload must be exactly " + std::to_string(constants::kPayloadLength) + " bytes");
    }
    const std::uint32_t raw_timestamp = ToRawTimestamp(unix_timestamp ? *unix_timestamp : clock.NowUnixSeconds());

    RawBytes data{};
    format::WriteU32BE(raw_timestamp, data.data());
    std::uint8_t* payload_out = data.data() + constants::kTimestampLength;
    if (payload) {
        std::copy(payload->begin(), payload->end(), payload_out);
    } else {
        random.Fill(payload_out, constants::kPayloadLength);
    }
    return Ksuid(data);
}

Ksuid Ksuid::FromString(std::string_view text) {
    return Ksuid(codec::Base62Decode(text));
}

Ksuid Ksuid::FromBase36(std::string_view text) {
    return Ksuid(codec::Base36Decode(text));
}

Ksuid Ksuid::FromBytes(const crypto::Bytes& data) {
    if (data.size() != constants::kTotalLength) {
        throw ValidationError("KSUID bytes must be exactly " + std::to_string(constants::kTotalLength) + " bytes");
    }
    RawBytes raw{};
    std::copy(data.begin(), data.end(), raw.begin());
    return Ksuid(raw);
}

Ksuid Ksuid::FromBytes(const RawBytes& data) noexcept {
    return Ksuid(data);
}

std::uint32_t Ksuid::RawTimestamp() const noexcept {
    return format::ReadU32BE(data_.data(), data_.size(), 0);
}

std::int64_t Ksuid::Timestamp() const noexcept {
    return static_cast<std::int64_t>(RawTimestamp()) + constants::kEpoch;
}

std::chrono::system_clock::time_point Ksuid::Datetime() const {
    return std::chrono::system_clock::time_point(std::chrono::seconds(Timestamp()));
}

PayloadBytes Ksuid::Payload() const noexcept {
    PayloadBytes payload{};
    std::copy(data_.begin() + constants::kTimestampLength, data_.end(), payload.begin());
    return payload;
}

bool Ksuid::IsNil() const noexcept {
    return std::all_of(data_.begin(), data_.end(), [](std::uint8_t b) { return b == 0; });
}

std::string Ksuid::ToBase62() const {
    return codec::Base62Encode(data_);
}

std::string Ksuid::ToBase36() const {
    return codec::Base36Encode(data_);
}

std::ostream& operator<<(std::ostream& os, const Ksuid& id) {
    return os << id.ToBase62();
}

}  // namespace ksuid
