#include "ratmap/clock/session_clock.hpp"
#include "ratmap/core/constants.hpp"

namespace ratmap::protocol::clock {
    SessionClock::SessionClock()
        : start_(std::chrono::steady_clock::now()) {
    }

    uint32_t SessionClock::NowMillis() const {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_);
        return static_cast<uint32_t>(static_cast<uint64_t>(elapsed.count()) & 0xFFFFFFFFull);
    }

    bool SerialIsAfter(const uint32_t a, const uint32_t b) noexcept {
        const uint32_t distance = SerialDelta(b, a);
        return distance != 0 && distance < kSerialHalfRange;
    }
}
