#pragma once

/**
 * @file handshake_logger.hpp
 * @brief Debug tracing of the handshake exchange.
 *
 * Prints epochs, nonces and per-step progress to stdout. The nonce is the
 * only authentication material of the plain handshake, so traces must stay
 * out of production builds.
 *
 * Enable via CMake: -DRATMAP_DEBUG_HANDSHAKE=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace ratmap::debug {

#ifdef RATMAP_DEBUG_HANDSHAKE

inline std::string ToHexTruncated(std::span<const uint8_t> data, size_t max_bytes = 16) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    const size_t shown = data.size() < max_bytes ? data.size() : max_bytes;
    std::string result;
    result.reserve(shown * 2 + 24);
    for (size_t i = 0; i < shown; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    if (shown < data.size()) {
        result += "...(" + std::to_string(data.size()) + " bytes)";
    }
    return result;
}

#define RATMAP_LOG_MSG(tag, operation, message) \
    do { \
        fprintf(stdout, "[RATMAP-DEBUG] %08x %s %s\n", \
            static_cast<unsigned>(tag), \
            operation, \
            message); \
        fflush(stdout); \
    } while(0)

#define RATMAP_LOG_VALUE(tag, operation, name, value) \
    do { \
        fprintf(stdout, "[RATMAP-DEBUG] %08x %s %s: %u\n", \
            static_cast<unsigned>(tag), \
            operation, \
            name, \
            static_cast<unsigned>(value)); \
        fflush(stdout); \
    } while(0)

#define RATMAP_LOG_BYTES(tag, operation, name, data) \
    do { \
        fprintf(stdout, "[RATMAP-DEBUG] %08x %s %s: %s\n", \
            static_cast<unsigned>(tag), \
            operation, \
            name, \
            ::ratmap::debug::ToHexTruncated(data).c_str()); \
        fflush(stdout); \
    } while(0)

inline void LogHandshakeStart(uint32_t self_epoch, std::span<const uint8_t> self_nonce) {
    RATMAP_LOG_MSG(self_epoch, "HANDSHAKE", "========== START ==========");
    RATMAP_LOG_VALUE(self_epoch, "HANDSHAKE", "self_epoch", self_epoch);
    RATMAP_LOG_BYTES(self_epoch, "HANDSHAKE", "self_nonce", self_nonce);
}

inline void LogStepCompleted(uint32_t self_epoch, std::string_view step, size_t bytes) {
    const std::string name(step);
    RATMAP_LOG_VALUE(self_epoch, "STEP", name.c_str(), bytes);
}

inline void LogPeerIdentity(uint32_t self_epoch, uint32_t peer_epoch, std::span<const uint8_t> peer_nonce) {
    RATMAP_LOG_VALUE(self_epoch, "PEER", "peer_epoch", peer_epoch);
    RATMAP_LOG_BYTES(self_epoch, "PEER", "peer_nonce", peer_nonce);
}

inline void LogHandshakeFailed(uint32_t self_epoch, std::string_view type, std::string_view message) {
    const std::string line = std::string(type) + ": " + std::string(message);
    RATMAP_LOG_MSG(self_epoch, "FAILED", line.c_str());
}

inline void LogHandshakeEstablished(uint32_t self_epoch, uint32_t peer_echo_timestamp) {
    RATMAP_LOG_VALUE(self_epoch, "ESTABLISHED", "peer_echo_timestamp", peer_echo_timestamp);
}

#else // !RATMAP_DEBUG_HANDSHAKE

#define RATMAP_LOG_MSG(tag, operation, message) ((void)0)
#define RATMAP_LOG_VALUE(tag, operation, name, value) ((void)0)
#define RATMAP_LOG_BYTES(tag, operation, name, data) ((void)0)

inline void LogHandshakeStart(uint32_t, std::span<const uint8_t>) {}
inline void LogStepCompleted(uint32_t, std::string_view, size_t) {}
inline void LogPeerIdentity(uint32_t, uint32_t, std::span<const uint8_t>) {}
inline void LogHandshakeFailed(uint32_t, std::string_view, std::string_view) {}
inline void LogHandshakeEstablished(uint32_t, uint32_t) {}

#endif // RATMAP_DEBUG_HANDSHAKE

} // namespace ratmap::debug
