#include <catch2/catch_test_macros.hpp>
#include "ratmap/protocol/handshake.hpp"
#include "ratmap/transport/memory_duplex_channel.hpp"
#include "ratmap/crypto/sodium_interop.hpp"
#include "helpers/handshake_pair.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace ratmap::protocol;
using namespace ratmap::protocol::crypto;
using namespace ratmap::protocol::transport;
using namespace ratmap::protocol::test_helpers;

namespace {
    /// Waits for the engine's C0+C1, answers with a fixed prefix of a peer
    /// stream and then hangs up.
    Result<Unit, HandshakeFailure> ShakeAgainstTruncatedPeer(
        HandshakeEngine& engine,
        const std::vector<uint8_t>& peer_prefix) {
        auto channels = MemoryDuplexChannel::CreatePair();
        auto& engine_end = channels.first;
        auto& peer_end = channels.second;

        std::optional<Result<Unit, HandshakeFailure>> result;
        std::thread engine_thread([&] { result.emplace(engine.Shake(*engine_end)); });

        std::vector<uint8_t> opening(kVersionBytes + kHandshakePacketBytes);
        const bool opening_read = peer_end->ReadExact(opening).IsOk();
        const bool prefix_written = peer_prefix.empty() || peer_end->WriteExact(peer_prefix).IsOk();
        peer_end->Close();
        engine_thread.join();
        REQUIRE(opening_read);
        REQUIRE(prefix_written);
        return std::move(*result);
    }

    std::vector<uint8_t> HonestPeerPrefix(const size_t length) {
        std::vector<uint8_t> stream{kRtmpVersion, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00};
        stream.resize(kVersionBytes + kHandshakePacketBytes, 0x5A);
        stream.resize(length);
        return stream;
    }
}

TEST_CASE("Boundaries - Peer hangs up mid-handshake", "[boundaries][handshake][channel]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    SECTION("Before sending anything") {
        auto engine = MakeEngine(100);
        auto result = ShakeAgainstTruncatedPeer(*engine, {});

        REQUIRE(result.IsErr());
        const auto& failure = result.UnwrapErr();
        REQUIRE(failure.type == HandshakeFailureType::ChannelError);
        REQUIRE(failure.channel_failure == ChannelFailureType::Closed);
        REQUIRE(failure.message.find(std::string(kStepRecv0)) != std::string::npos);
        REQUIRE(engine->BytesReceived() == 0);
        REQUIRE_FALSE(failure.IsProtocolViolation());
    }

    SECTION("Inside the nonce of S1") {
        auto engine = MakeEngine(100);
        auto result = ShakeAgainstTruncatedPeer(*engine, HonestPeerPrefix(kVersionBytes + kEpochBytes + kZeroFieldBytes + 100));

        REQUIRE(result.IsErr());
        const auto& failure = result.UnwrapErr();
        REQUIRE(failure.type == HandshakeFailureType::ChannelError);
        REQUIRE(failure.channel_failure == ChannelFailureType::ShortRead);
        REQUIRE(failure.message.find(std::string(kStepRecv1)) != std::string::npos);
        REQUIRE(engine->GetState() == HandshakeState::Failed);
        REQUIRE(engine->BytesReceived() == kVersionBytes + kEpochBytes + kZeroFieldBytes);
    }

    SECTION("Right after a complete S1") {
        auto engine = MakeEngine(100);
        auto result = ShakeAgainstTruncatedPeer(*engine, HonestPeerPrefix(kVersionBytes + kHandshakePacketBytes));

        REQUIRE(result.IsErr());
        const auto& failure = result.UnwrapErr();
        REQUIRE(failure.type == HandshakeFailureType::ChannelError);
        // C2 may or may not get out before the hang-up; S2 never arrives.
        REQUIRE(failure.channel_failure == ChannelFailureType::Closed);
        REQUIRE(engine->BytesReceived() == kVersionBytes + kHandshakePacketBytes);
    }
}

TEST_CASE("Boundaries - Silent peer times out", "[boundaries][handshake][channel]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    ChannelOptions options;
    options.read_timeout = std::chrono::milliseconds(50);
    auto channels = MemoryDuplexChannel::CreatePair(options);
    auto engine = MakeEngine(7);

    const auto started = std::chrono::steady_clock::now();
    auto result = engine->Shake(*channels.first);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(result.IsErr());
    const auto& failure = result.UnwrapErr();
    REQUIRE(failure.type == HandshakeFailureType::ChannelError);
    REQUIRE(failure.channel_failure == ChannelFailureType::Timeout);
    REQUIRE(failure.IsRetryable());
    REQUIRE(failure.message.find(std::string(kStepRecv0)) != std::string::npos);
    REQUIRE(elapsed >= std::chrono::milliseconds(50));

    // C0 and C1 were fully written before the engine blocked.
    REQUIRE(engine->BytesSent() == kVersionBytes + kHandshakePacketBytes);
    REQUIRE(channels.second->BytesRead() == 0);
}

TEST_CASE("Boundaries - Transport buffer too small for C1", "[boundaries][handshake][channel]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    ChannelOptions options;
    options.max_buffered_bytes = 100;
    auto channels = MemoryDuplexChannel::CreatePair(options);
    auto engine = MakeEngine(7);

    auto result = engine->Shake(*channels.first);

    REQUIRE(result.IsErr());
    const auto& failure = result.UnwrapErr();
    REQUIRE(failure.type == HandshakeFailureType::ChannelError);
    REQUIRE(failure.channel_failure == ChannelFailureType::BufferFull);
    REQUIRE(failure.message.find(std::string(kStepSend1)) != std::string::npos);
    REQUIRE(engine->BytesSent() == kVersionBytes);
    REQUIRE(channels.first->BytesWritten() == kVersionBytes);
}

TEST_CASE("Boundaries - Failed engine exposes no peer data", "[boundaries][handshake][state]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());

    auto engine = MakeEngine(55);
    REQUIRE(engine->GetState() == HandshakeState::Pending);
    REQUIRE_FALSE(engine->Failure().has_value());
    REQUIRE(engine->PeerIdentity().IsErr());

    // A complete, valid-looking S0+S1 so the peer's epoch and nonce are
    // read, then the peer vanishes before S2.
    auto result = ShakeAgainstTruncatedPeer(*engine, HonestPeerPrefix(kVersionBytes + kHandshakePacketBytes));
    REQUIRE(result.IsErr());

    REQUIRE(engine->GetState() == HandshakeState::Failed);
    REQUIRE(engine->Failure().has_value());
    REQUIRE(engine->Failure()->type == result.UnwrapErr().type);

    const auto peer = engine->PeerIdentity();
    REQUIRE(peer.IsErr());
    REQUIRE(peer.UnwrapErr().type == HandshakeFailureType::InvalidState);
    REQUIRE(engine->PeerEchoTimestamp().IsErr());
    REQUIRE(engine->PeerEchoDelta().IsErr());
    REQUIRE(engine->ExportTranscript().IsErr());

    auto channels = MemoryDuplexChannel::CreatePair();
    auto retry = engine->Shake(*channels.first);
    REQUIRE(retry.IsErr());
    REQUIRE(retry.UnwrapErr().type == HandshakeFailureType::InvalidState);
    REQUIRE(channels.first->BytesWritten() == 0);
}
