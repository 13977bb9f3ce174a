#include "ratmap/protocol/handshake.hpp"
#include "ratmap/clock/session_clock.hpp"
#include "ratmap/core/constants.hpp"
#include "ratmap/crypto/sodium_interop.hpp"
#include "ratmap/debug/handshake_logger.hpp"
#include <algorithm>
#include <array>
#include <fmt/core.h>
#include <string>
#include <utility>

namespace ratmap::protocol {
    using crypto::SodiumInterop;
    using interfaces::IByteChannel;

    namespace {
        void StoreUint32BE(const uint32_t value, std::span<uint8_t, 4> out) {
            out[0] = static_cast<uint8_t>((value >> 24) & 0xFF);
            out[1] = static_cast<uint8_t>((value >> 16) & 0xFF);
            out[2] = static_cast<uint8_t>((value >> 8) & 0xFF);
            out[3] = static_cast<uint8_t>(value & 0xFF);
        }

        uint32_t LoadUint32BE(std::span<const uint8_t, 4> in) {
            return (static_cast<uint32_t>(in[0]) << 24) |
                   (static_cast<uint32_t>(in[1]) << 16) |
                   (static_cast<uint32_t>(in[2]) << 8) |
                   static_cast<uint32_t>(in[3]);
        }

        /// epoch(4) | field(4) | nonce(1528), the layout shared by C1 and C2.
        std::array<uint8_t, kHandshakePacketBytes> BuildPacket(
            const uint32_t first,
            const uint32_t second,
            std::span<const uint8_t, kRandomPayloadBytes> nonce) {
            std::array<uint8_t, kHandshakePacketBytes> packet{};
            StoreUint32BE(first, std::span<uint8_t, 4>(packet.data(), 4));
            StoreUint32BE(second, std::span<uint8_t, 4>(packet.data() + kEpochBytes, 4));
            std::copy(nonce.begin(), nonce.end(), packet.begin() + kEchoNonceOffset);
            return packet;
        }
    }

    HandshakeEngine::HandshakeEngine(HandshakeIdentity self)
        : self_(std::move(self)) {
    }

    Result<std::unique_ptr<HandshakeEngine>, HandshakeFailure> HandshakeEngine::Create(
        HandshakeIdentity self) {
        if (SodiumInterop::IsAllZero(self.random_bytes.Bytes())) {
            return Result<std::unique_ptr<HandshakeEngine>, HandshakeFailure>::Err(
                HandshakeFailure::InvalidInput("Local random payload is all zero"));
        }
        return Result<std::unique_ptr<HandshakeEngine>, HandshakeFailure>::Ok(
            std::unique_ptr<HandshakeEngine>(new HandshakeEngine(std::move(self))));
    }

    Result<std::unique_ptr<HandshakeEngine>, HandshakeFailure> HandshakeEngine::Generate(
        const configuration::HandshakeConfig& config,
        const interfaces::IClock& clock) {
        auto payload_result = RandomPayload::Generate();
        if (payload_result.IsErr()) {
            return Result<std::unique_ptr<HandshakeEngine>, HandshakeFailure>::Err(
                HandshakeFailure::FromSodiumFailure(payload_result.UnwrapErr()));
        }

        uint32_t epoch = 0;
        if (config.UsesClockEpoch()) {
            epoch = clock.NowMillis();
        } else {
            auto epoch_result = SodiumInterop::GenerateRandomUInt32();
            if (epoch_result.IsErr()) {
                return Result<std::unique_ptr<HandshakeEngine>, HandshakeFailure>::Err(
                    HandshakeFailure::FromSodiumFailure(epoch_result.UnwrapErr()));
            }
            epoch = epoch_result.Unwrap();
        }

        return Create(HandshakeIdentity{
            .epoch = epoch,
            .random_bytes = std::move(payload_result).Unwrap()
        });
    }

    Result<Unit, HandshakeFailure> HandshakeEngine::Shake(IByteChannel& channel) {
        if (state_ != HandshakeState::Pending) {
            return Result<Unit, HandshakeFailure>::Err(
                HandshakeFailure::InvalidState(
                    "Handshake engine already used; create a new engine for each attempt"));
        }

        debug::LogHandshakeStart(self_.epoch, self_.random_bytes.Bytes());

        auto run_result = Run(channel);
        if (run_result.IsErr()) {
            state_ = HandshakeState::Failed;
            failure_ = run_result.UnwrapErr();
            debug::LogHandshakeFailed(self_.epoch, ToString(failure_->type), failure_->message);
            return run_result;
        }

        state_ = HandshakeState::Established;
        debug::LogHandshakeEstablished(self_.epoch, peer_echo_timestamp_);
        return run_result;
    }

    Result<Unit, HandshakeFailure> HandshakeEngine::Run(IByteChannel& channel) {
        if (auto result = SendVersion(channel); result.IsErr()) {
            return result;
        }
        if (auto result = SendIdentity(channel); result.IsErr()) {
            return result;
        }
        if (auto result = ReceiveVersion(channel); result.IsErr()) {
            return result;
        }
        if (auto result = ReceiveIdentity(channel); result.IsErr()) {
            return result;
        }
        if (auto result = SendEcho(channel); result.IsErr()) {
            return result;
        }
        return ReceiveEcho(channel);
    }

    Result<Unit, HandshakeFailure> HandshakeEngine::SendVersion(IByteChannel& channel) {
        const std::array<uint8_t, kVersionBytes> version{kRtmpVersion};
        return Write(channel, version, kStepSend0);
    }

    Result<Unit, HandshakeFailure> HandshakeEngine::SendIdentity(IByteChannel& channel) {
        const auto packet = BuildPacket(self_.epoch, 0, self_.random_bytes.Bytes());
        if (auto result = Write(channel, packet, kStepSend1); result.IsErr()) {
            return result;
        }
        if (auto flush = channel.Flush(); flush.IsErr()) {
            return Result<Unit, HandshakeFailure>::Err(
                HandshakeFailure::FromChannelFailure(flush.UnwrapErr(), kStepSend1));
        }
        return Result<Unit, HandshakeFailure>::Ok(unit);
    }

    Result<Unit, HandshakeFailure> HandshakeEngine::ReceiveVersion(IByteChannel& channel) {
        std::array<uint8_t, kVersionBytes> version{};
        if (auto result = Read(channel, version, kStepRecv0); result.IsErr()) {
            return result;
        }
        if (version[0] != kRtmpVersion) {
            return Result<Unit, HandshakeFailure>::Err(
                HandshakeFailure::InvalidPeerVersion(
                    fmt::format("Only RTMP version {} is supported, peer sent version {}",
                                kRtmpVersion, version[0])));
        }
        return Result<Unit, HandshakeFailure>::Ok(unit);
    }

    Result<Unit, HandshakeFailure> HandshakeEngine::ReceiveIdentity(IByteChannel& channel) {
        return ReadUint32(channel, kStepRecv1)
            .Bind([this, &channel](const uint32_t epoch) {
                peer_.epoch = epoch;
                return ReadUint32(channel, kStepRecv1);
            })
            .Bind([this, &channel](const uint32_t zero) -> Result<Unit, HandshakeFailure> {
                if (zero != 0) {
                    return Result<Unit, HandshakeFailure>::Err(
                        HandshakeFailure::InvalidZeroBytes(
                            fmt::format("Expected zero field from peer, received {:#010x}", zero)));
                }
                if (auto result = Read(channel, peer_.random_bytes.MutableBytes(), kStepRecv1); result.IsErr()) {
                    return result;
                }
                debug::LogPeerIdentity(self_.epoch, peer_.epoch, peer_.random_bytes.Bytes());
                return Result<Unit, HandshakeFailure>::Ok(unit);
            });
    }

    Result<Unit, HandshakeFailure> HandshakeEngine::SendEcho(IByteChannel& channel) {
        const auto packet = BuildPacket(peer_.epoch, self_.epoch, peer_.random_bytes.Bytes());
        if (auto result = Write(channel, packet, kStepSend2); result.IsErr()) {
            return result;
        }
        if (auto flush = channel.Flush(); flush.IsErr()) {
            return Result<Unit, HandshakeFailure>::Err(
                HandshakeFailure::FromChannelFailure(flush.UnwrapErr(), kStepSend2));
        }
        return Result<Unit, HandshakeFailure>::Ok(unit);
    }

    Result<Unit, HandshakeFailure> HandshakeEngine::ReceiveEcho(IByteChannel& channel) {
        return ReadUint32(channel, kStepRecv2)
            .Bind([this, &channel](const uint32_t epoch_echo) -> Result<uint32_t, HandshakeFailure> {
                if (epoch_echo != self_.epoch) {
                    return Result<uint32_t, HandshakeFailure>::Err(
                        HandshakeFailure::IncorrectEpochEcho(
                            fmt::format("Peer echoed epoch {} but we sent {}", epoch_echo, self_.epoch)));
                }
                return ReadUint32(channel, kStepRecv2);
            })
            .Bind([this, &channel](const uint32_t timestamp) -> Result<Unit, HandshakeFailure> {
                peer_echo_timestamp_ = timestamp;
                RandomPayload nonce_echo = RandomPayload::Zero();
                if (auto result = Read(channel, nonce_echo.MutableBytes(), kStepRecv2); result.IsErr()) {
                    return result;
                }
                return VerifyNonceEcho(nonce_echo);
            });
    }

    Result<Unit, HandshakeFailure> HandshakeEngine::VerifyNonceEcho(const RandomPayload& nonce_echo) const {
        // A failed comparison is a local fault, never an echo mismatch.
        return nonce_echo.Matches(self_.random_bytes)
            .MapErr([](const SodiumFailure& failure) {
                return HandshakeFailure::FromSodiumFailure(failure);
            })
            .Bind([](const bool matches) {
                if (!matches) {
                    return Result<Unit, HandshakeFailure>::Err(
                        HandshakeFailure::IncorrectRandomBytesEcho("Peer failed to echo our random bytes"));
                }
                return Result<Unit, HandshakeFailure>::Ok(unit);
            });
    }

    Result<Unit, HandshakeFailure> HandshakeEngine::Write(
        IByteChannel& channel,
        std::span<const uint8_t> bytes,
        const std::string_view step) {
        auto result = channel.WriteExact(bytes).MapErr([step](const ChannelFailure& failure) {
            return HandshakeFailure::FromChannelFailure(failure, step);
        });
        if (result.IsOk()) {
            bytes_sent_ += bytes.size();
            debug::LogStepCompleted(self_.epoch, step, bytes.size());
        }
        return result;
    }

    Result<Unit, HandshakeFailure> HandshakeEngine::Read(
        IByteChannel& channel,
        std::span<uint8_t> buffer,
        const std::string_view step) {
        auto result = channel.ReadExact(buffer).MapErr([step](const ChannelFailure& failure) {
            return HandshakeFailure::FromChannelFailure(failure, step);
        });
        if (result.IsOk()) {
            bytes_received_ += buffer.size();
            debug::LogStepCompleted(self_.epoch, step, buffer.size());
        }
        return result;
    }

    Result<uint32_t, HandshakeFailure> HandshakeEngine::ReadUint32(
        IByteChannel& channel,
        const std::string_view step) {
        std::array<uint8_t, 4> field{};
        return Read(channel, field, step).Map([&field](Unit) {
            return LoadUint32BE(field);
        });
    }

    Result<Unit, HandshakeFailure> HandshakeEngine::RequireEstablished(const std::string_view what) const {
        if (state_ != HandshakeState::Established) {
            return Result<Unit, HandshakeFailure>::Err(
                HandshakeFailure::InvalidState(
                    fmt::format("{} is only available after an established handshake", what)));
        }
        return Result<Unit, HandshakeFailure>::Ok(unit);
    }

    Result<const HandshakeIdentity*, HandshakeFailure> HandshakeEngine::PeerIdentity() const {
        if (auto check = RequireEstablished("Peer identity"); check.IsErr()) {
            return Result<const HandshakeIdentity*, HandshakeFailure>::Err(check.UnwrapErr());
        }
        return Result<const HandshakeIdentity*, HandshakeFailure>::Ok(&peer_);
    }

    Result<uint32_t, HandshakeFailure> HandshakeEngine::PeerEchoTimestamp() const {
        if (auto check = RequireEstablished("Peer echo timestamp"); check.IsErr()) {
            return Result<uint32_t, HandshakeFailure>::Err(check.UnwrapErr());
        }
        return Result<uint32_t, HandshakeFailure>::Ok(peer_echo_timestamp_);
    }

    Result<uint32_t, HandshakeFailure> HandshakeEngine::PeerEchoDelta() const {
        if (auto check = RequireEstablished("Peer echo delta"); check.IsErr()) {
            return Result<uint32_t, HandshakeFailure>::Err(check.UnwrapErr());
        }
        return Result<uint32_t, HandshakeFailure>::Ok(
            clock::SerialDelta(peer_.epoch, peer_echo_timestamp_));
    }

    Result<ratmap::proto::handshake::HandshakeTranscript, HandshakeFailure>
    HandshakeEngine::ExportTranscript() const {
        using TranscriptResult = Result<ratmap::proto::handshake::HandshakeTranscript, HandshakeFailure>;
        if (auto check = RequireEstablished("Transcript export"); check.IsErr()) {
            return TranscriptResult::Err(check.UnwrapErr());
        }

        auto self_digest = SodiumInterop::Sha256(self_.random_bytes.Bytes());
        if (self_digest.IsErr()) {
            return TranscriptResult::Err(HandshakeFailure::Encode(
                "Failed to digest local nonce: " + self_digest.UnwrapErr().message));
        }
        auto peer_digest = SodiumInterop::Sha256(peer_.random_bytes.Bytes());
        if (peer_digest.IsErr()) {
            return TranscriptResult::Err(HandshakeFailure::Encode(
                "Failed to digest peer nonce: " + peer_digest.UnwrapErr().message));
        }

        ratmap::proto::handshake::HandshakeTranscript transcript;
        transcript.set_protocol_version(kRtmpVersion);
        transcript.set_self_epoch(self_.epoch);
        transcript.set_peer_epoch(peer_.epoch);
        transcript.set_peer_echo_timestamp(peer_echo_timestamp_);
        const auto& self_bytes = self_digest.Unwrap();
        const auto& peer_bytes = peer_digest.Unwrap();
        transcript.set_self_nonce_sha256(std::string(self_bytes.begin(), self_bytes.end()));
        transcript.set_peer_nonce_sha256(std::string(peer_bytes.begin(), peer_bytes.end()));
        transcript.set_bytes_sent(bytes_sent_);
        transcript.set_bytes_received(bytes_received_);
        return TranscriptResult::Ok(std::move(transcript));
    }
}
