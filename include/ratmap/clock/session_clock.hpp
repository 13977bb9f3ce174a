#pragma once
#include "ratmap/interfaces/i_clock.hpp"
#include <chrono>
#include <cstdint>
namespace ratmap::protocol::clock {
/// Milliseconds elapsed since construction, modulo 2^32.
class SessionClock final : public interfaces::IClock {
public:
    SessionClock();
    [[nodiscard]] uint32_t NowMillis() const override;
private:
    std::chrono::steady_clock::time_point start_;
};

/// Wrapping distance from `from` to `to`.
[[nodiscard]] constexpr uint32_t SerialDelta(const uint32_t from, const uint32_t to) noexcept {
    return to - from;
}

/// RFC 1982 ordering: `a` comes after `b` when the forward distance from
/// `b` to `a` is non-zero and below 2^31.
[[nodiscard]] bool SerialIsAfter(uint32_t a, uint32_t b) noexcept;
}
