#pragma once
#include "ratmap/configuration/handshake_config.hpp"
#include "ratmap/core/failures.hpp"
#include "ratmap/core/result.hpp"
#include "ratmap/interfaces/i_byte_channel.hpp"
#include "ratmap/interfaces/i_clock.hpp"
#include "ratmap/protocol/handshake_identity.hpp"
#include "handshake/transcript.pb.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

namespace ratmap::protocol {

enum class HandshakeState : uint8_t {
    Pending,
    Established,
    Failed
};

/// Plain RTMP handshake over a borrowed byte channel.
///
/// Both parties run the same procedure; there is no initiator or responder
/// role. One engine covers exactly one attempt: after Shake returns the
/// engine is either Established or Failed and refuses to run again.
///
/// Thread Safety: none. One engine and one channel per peer.
class HandshakeEngine {
public:
    /// Engine for a caller-chosen identity. The nonce must be unpredictable
    /// to the peer; an all-zero nonce is rejected.
    [[nodiscard]] static Result<std::unique_ptr<HandshakeEngine>, HandshakeFailure> Create(
        HandshakeIdentity self);

    /// Engine with a fresh CSPRNG nonce and an epoch chosen per `config`.
    [[nodiscard]] static Result<std::unique_ptr<HandshakeEngine>, HandshakeFailure> Generate(
        const configuration::HandshakeConfig& config,
        const interfaces::IClock& clock);

    /// Runs send_0, send_1, recv_0, recv_1, send_2, recv_2 in that order.
    ///
    /// Stops at the first failure; the channel is left wherever the failing
    /// step stopped and should be closed by the caller. On success the
    /// channel is positioned at the first byte after the handshake.
    [[nodiscard]] Result<Unit, HandshakeFailure> Shake(interfaces::IByteChannel& channel);

    [[nodiscard]] HandshakeState GetState() const noexcept { return state_; }
    [[nodiscard]] const std::optional<HandshakeFailure>& Failure() const noexcept { return failure_; }
    [[nodiscard]] const HandshakeIdentity& SelfIdentity() const noexcept { return self_; }

    /// Peer data is only trustworthy once the whole exchange has validated.
    [[nodiscard]] Result<const HandshakeIdentity*, HandshakeFailure> PeerIdentity() const;

    /// Second field of the peer's echo packet. Unverified.
    [[nodiscard]] Result<uint32_t, HandshakeFailure> PeerEchoTimestamp() const;

    /// Serial distance from the peer's epoch to its echo timestamp.
    ///
    /// ratmap peers put their own epoch in that field, so against another
    /// ratmap engine the delta is always 0. It only carries a round-trip
    /// hint for peers that stamp the time they received our C1.
    [[nodiscard]] Result<uint32_t, HandshakeFailure> PeerEchoDelta() const;

    [[nodiscard]] Result<ratmap::proto::handshake::HandshakeTranscript, HandshakeFailure> ExportTranscript() const;

    [[nodiscard]] uint64_t BytesSent() const noexcept { return bytes_sent_; }
    [[nodiscard]] uint64_t BytesReceived() const noexcept { return bytes_received_; }

    HandshakeEngine(const HandshakeEngine&) = delete;
    HandshakeEngine& operator=(const HandshakeEngine&) = delete;
    HandshakeEngine(HandshakeEngine&&) noexcept = delete;
    HandshakeEngine& operator=(HandshakeEngine&&) noexcept = delete;
    ~HandshakeEngine() = default;

private:
    explicit HandshakeEngine(HandshakeIdentity self);

    [[nodiscard]] Result<Unit, HandshakeFailure> Run(interfaces::IByteChannel& channel);

    [[nodiscard]] Result<Unit, HandshakeFailure> SendVersion(interfaces::IByteChannel& channel);
    [[nodiscard]] Result<Unit, HandshakeFailure> SendIdentity(interfaces::IByteChannel& channel);
    [[nodiscard]] Result<Unit, HandshakeFailure> ReceiveVersion(interfaces::IByteChannel& channel);
    [[nodiscard]] Result<Unit, HandshakeFailure> ReceiveIdentity(interfaces::IByteChannel& channel);
    [[nodiscard]] Result<Unit, HandshakeFailure> SendEcho(interfaces::IByteChannel& channel);
    [[nodiscard]] Result<Unit, HandshakeFailure> ReceiveEcho(interfaces::IByteChannel& channel);
    [[nodiscard]] Result<Unit, HandshakeFailure> VerifyNonceEcho(const RandomPayload& nonce_echo) const;

    [[nodiscard]] Result<Unit, HandshakeFailure> Write(
        interfaces::IByteChannel& channel,
        std::span<const uint8_t> bytes,
        std::string_view step);
    [[nodiscard]] Result<Unit, HandshakeFailure> Read(
        interfaces::IByteChannel& channel,
        std::span<uint8_t> buffer,
        std::string_view step);
    [[nodiscard]] Result<uint32_t, HandshakeFailure> ReadUint32(
        interfaces::IByteChannel& channel,
        std::string_view step);
    [[nodiscard]] Result<Unit, HandshakeFailure> RequireEstablished(std::string_view what) const;

    HandshakeIdentity self_;
    HandshakeIdentity peer_{};
    uint32_t peer_echo_timestamp_ = 0;
    HandshakeState state_ = HandshakeState::Pending;
    std::optional<HandshakeFailure> failure_{};
    uint64_t bytes_sent_ = 0;
    uint64_t bytes_received_ = 0;
};

}  // namespace ratmap::protocol
