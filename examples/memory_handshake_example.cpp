/**
 * @file memory_handshake_example.cpp
 * @brief Two peers completing the plain RTMP handshake over an in-process pipe
 */

#include "ratmap/clock/session_clock.hpp"
#include "ratmap/configuration/handshake_config.hpp"
#include "ratmap/crypto/sodium_interop.hpp"
#include "ratmap/protocol/handshake.hpp"
#include "ratmap/transport/memory_duplex_channel.hpp"

#include <iomanip>
#include <iostream>
#include <optional>
#include <thread>

using namespace ratmap::protocol;
using namespace ratmap::protocol::crypto;
using namespace ratmap::protocol::transport;
using ratmap::protocol::clock::SessionClock;
using ratmap::protocol::configuration::HandshakeConfig;

void print_hex(const std::string& label, const std::string& data) {
    std::cout << label << ": ";
    for (auto byte : data) {
        std::cout << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<int>(static_cast<uint8_t>(byte));
    }
    std::cout << std::dec << std::endl;
}

int main() {
    std::cout << "=== ratmap - In-Memory Handshake Example ===" << std::endl;
    std::cout << std::endl;

    std::cout << "1. Initializing libsodium..." << std::endl;
    auto init_result = SodiumInterop::Initialize();
    if (init_result.IsErr()) {
        std::cerr << "Failed to initialize: "
                  << init_result.UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Initialized successfully" << std::endl;
    std::cout << std::endl;

    // The server stamps its epoch from a session clock, the client picks a
    // random one.
    std::cout << "2. Generating handshake engines..." << std::endl;
    const SessionClock clock;
    auto client_result = HandshakeEngine::Generate(HandshakeConfig::RandomEpoch(), clock);
    auto server_result = HandshakeEngine::Generate(HandshakeConfig::Default(), clock);
    if (client_result.IsErr() || server_result.IsErr()) {
        std::cerr << "Failed to generate handshake engines" << std::endl;
        return 1;
    }
    auto client = std::move(client_result).Unwrap();
    auto server = std::move(server_result).Unwrap();
    std::cout << "   Client epoch: " << client->SelfIdentity().epoch << std::endl;
    std::cout << "   Server epoch: " << server->SelfIdentity().epoch << std::endl;
    std::cout << std::endl;

    std::cout << "3. Shaking hands over a memory duplex channel..." << std::endl;
    auto channels = MemoryDuplexChannel::CreatePair();
    auto& client_end = channels.first;
    auto& server_end = channels.second;

    std::optional<Result<Unit, HandshakeFailure>> server_outcome;
    std::thread server_thread([&] {
        server_outcome.emplace(server->Shake(*server_end));
        if (server_outcome->IsErr()) {
            server_end->Close();
        }
    });
    auto client_outcome = client->Shake(*client_end);
    if (client_outcome.IsErr()) {
        client_end->Close();
    }
    server_thread.join();

    if (client_outcome.IsErr()) {
        std::cerr << "Client handshake failed: " << client_outcome.UnwrapErr().message << std::endl;
        return 1;
    }
    if (server_outcome->IsErr()) {
        std::cerr << "Server handshake failed: " << server_outcome->UnwrapErr().message << std::endl;
        return 1;
    }
    std::cout << "   ✓ Both sides established" << std::endl;
    std::cout << "   Client sent " << client->BytesSent() << " bytes, received "
              << client->BytesReceived() << " bytes" << std::endl;
    std::cout << "   Server echo timestamp: " << client->PeerEchoTimestamp().Unwrap()
              << " (serial delta from its epoch: " << client->PeerEchoDelta().Unwrap() << ")" << std::endl;
    std::cout << std::endl;

    std::cout << "4. Exporting the client transcript..." << std::endl;
    auto transcript_result = client->ExportTranscript();
    if (transcript_result.IsErr()) {
        std::cerr << "Failed to export transcript: "
                  << transcript_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto transcript = std::move(transcript_result).Unwrap();
    std::cout << "   Peer epoch: " << transcript.peer_epoch() << std::endl;
    print_hex("   Own nonce SHA-256 ", transcript.self_nonce_sha256());
    print_hex("   Peer nonce SHA-256", transcript.peer_nonce_sha256());
    std::cout << "   Serialized size: " << transcript.ByteSizeLong() << " bytes" << std::endl;
    std::cout << std::endl;

    std::cout << "=== Example completed successfully ===" << std::endl;
    return 0;
}
