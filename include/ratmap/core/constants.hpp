#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace ratmap::protocol {
inline constexpr uint8_t kRtmpVersion = 3;

inline constexpr size_t kVersionBytes = 1;
inline constexpr size_t kEpochBytes = 4;
inline constexpr size_t kZeroFieldBytes = 4;
inline constexpr size_t kEchoTimestampBytes = 4;
inline constexpr size_t kRandomPayloadBytes = 1528;

inline constexpr size_t kHandshakePacketBytes = kEpochBytes + kZeroFieldBytes + kRandomPayloadBytes;
static_assert(kHandshakePacketBytes == 1536, "C1/C2 packets are 1536 bytes on the wire");

inline constexpr size_t kEchoNonceOffset = kEpochBytes + kEchoTimestampBytes;
inline constexpr size_t kNonceDigestBytes = 32;

inline constexpr uint64_t kSerialHalfRange = 0x80000000ull;

inline constexpr std::string_view kStepSend0 = "send_0";
inline constexpr std::string_view kStepSend1 = "send_1";
inline constexpr std::string_view kStepRecv0 = "recv_0";
inline constexpr std::string_view kStepRecv1 = "recv_1";
inline constexpr std::string_view kStepSend2 = "send_2";
inline constexpr std::string_view kStepRecv2 = "recv_2";
}
