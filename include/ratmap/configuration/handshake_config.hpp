#pragma once

#include <cstdint>

namespace ratmap::protocol::configuration {

/// Where a generated engine takes its local epoch from
enum class EpochSource : uint8_t {
    /// Current reading of the caller's clock (milliseconds, wrapping).
    /// The epoch doubles as the stream's starting timestamp.
    SessionClock = 0,

    /// A CSPRNG value. Hides process uptime from the peer.
    Random = 1
};

/// Settings consulted when HandshakeEngine::Generate builds a local identity.
///
/// The wire procedure itself has no knobs: version, field layout and the
/// three validation checks are fixed.
///
/// @example
/// ```cpp
/// clock::SessionClock clock;
/// auto engine = HandshakeEngine::Generate(HandshakeConfig::Default(), clock);
/// ```
class HandshakeConfig {
public:
    /// Clock-stamped epoch
    [[nodiscard]] static constexpr HandshakeConfig Default() noexcept {
        return HandshakeConfig(EpochSource::SessionClock);
    }

    [[nodiscard]] static constexpr HandshakeConfig RandomEpoch() noexcept {
        return HandshakeConfig(EpochSource::Random);
    }

    [[nodiscard]] constexpr EpochSource GetEpochSource() const noexcept {
        return epoch_source_;
    }

    [[nodiscard]] constexpr bool UsesClockEpoch() const noexcept {
        return epoch_source_ == EpochSource::SessionClock;
    }

    [[nodiscard]] constexpr bool operator==(const HandshakeConfig& other) const noexcept {
        return epoch_source_ == other.epoch_source_;
    }

private:
    explicit constexpr HandshakeConfig(const EpochSource source) noexcept
        : epoch_source_(source) {}

    EpochSource epoch_source_;
};

} // namespace ratmap::protocol::configuration
