#include "ratmap/protocol/random_payload.hpp"
#include "ratmap/crypto/sodium_interop.hpp"
#include <algorithm>
#include <fmt/core.h>

namespace ratmap::protocol {
    using crypto::SodiumInterop;

    RandomPayload::~RandomPayload() {
        SodiumInterop::SecureWipe(bytes_);
    }

    Result<RandomPayload, SodiumFailure> RandomPayload::Generate() {
        RandomPayload payload;
        if (auto fill_result = SodiumInterop::FillRandom(payload.bytes_); fill_result.IsErr()) {
            return Result<RandomPayload, SodiumFailure>::Err(std::move(fill_result).UnwrapErr());
        }
        return Result<RandomPayload, SodiumFailure>::Ok(std::move(payload));
    }

    Result<RandomPayload, HandshakeFailure> RandomPayload::FromBytes(std::span<const uint8_t> bytes) {
        if (bytes.size() != kRandomPayloadBytes) {
            return Result<RandomPayload, HandshakeFailure>::Err(
                HandshakeFailure::InvalidInput(
                    fmt::format("Random payload must be {} bytes, got {}", kRandomPayloadBytes, bytes.size())));
        }
        RandomPayload payload;
        std::copy(bytes.begin(), bytes.end(), payload.bytes_.begin());
        return Result<RandomPayload, HandshakeFailure>::Ok(std::move(payload));
    }

    RandomPayload RandomPayload::Zero() noexcept {
        return RandomPayload();
    }

    Result<bool, SodiumFailure> RandomPayload::Matches(const RandomPayload& other) const {
        return SodiumInterop::ConstantTimeEquals(bytes_, other.bytes_);
    }
}
