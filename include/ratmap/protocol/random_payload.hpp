#pragma once
#include "ratmap/core/constants.hpp"
#include "ratmap/core/failures.hpp"
#include "ratmap/core/result.hpp"
#include <array>
#include <cstdint>
#include <span>

namespace ratmap::protocol {

/// The 1528-byte nonce carried in C1/S1 and echoed back in C2/S2.
///
/// Always exactly kRandomPayloadBytes long. Comparison runs in constant
/// time and the buffer is wiped when the payload is destroyed.
class RandomPayload {
public:
    using Storage = std::array<uint8_t, kRandomPayloadBytes>;

    /// Fresh bytes from the libsodium CSPRNG.
    [[nodiscard]] static Result<RandomPayload, SodiumFailure> Generate();

    [[nodiscard]] static Result<RandomPayload, HandshakeFailure> FromBytes(
        std::span<const uint8_t> bytes);

    [[nodiscard]] static RandomPayload Zero() noexcept;

    [[nodiscard]] std::span<const uint8_t, kRandomPayloadBytes> Bytes() const noexcept {
        return std::span<const uint8_t, kRandomPayloadBytes>(bytes_);
    }

    [[nodiscard]] std::span<uint8_t, kRandomPayloadBytes> MutableBytes() noexcept {
        return std::span<uint8_t, kRandomPayloadBytes>(bytes_);
    }

    /// Constant-time comparison. Err when libsodium is unusable, which
    /// callers must not read as a mismatch.
    [[nodiscard]] Result<bool, SodiumFailure> Matches(const RandomPayload& other) const;

    RandomPayload(const RandomPayload&) = default;
    RandomPayload& operator=(const RandomPayload&) = default;
    RandomPayload(RandomPayload&&) noexcept = default;
    RandomPayload& operator=(RandomPayload&&) noexcept = default;
    ~RandomPayload();

private:
    RandomPayload() = default;

    Storage bytes_{};
};

}  // namespace ratmap::protocol
