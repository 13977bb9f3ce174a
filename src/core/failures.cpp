#include "ratmap/core/failures.hpp"
#include <fmt/core.h>

namespace ratmap::protocol {
    std::string_view ToString(const ChannelFailureType type) noexcept {
        switch (type) {
            case ChannelFailureType::Closed: return "Closed";
            case ChannelFailureType::Timeout: return "Timeout";
            case ChannelFailureType::ShortRead: return "ShortRead";
            case ChannelFailureType::BufferFull: return "BufferFull";
        }
        return "Unknown";
    }

    std::string_view ToString(const HandshakeFailureType type) noexcept {
        switch (type) {
            case HandshakeFailureType::InvalidPeerVersion: return "InvalidPeerVersion";
            case HandshakeFailureType::InvalidZeroBytes: return "InvalidZeroBytes";
            case HandshakeFailureType::IncorrectEpochEcho: return "IncorrectEpochEcho";
            case HandshakeFailureType::IncorrectRandomBytesEcho: return "IncorrectRandomBytesEcho";
            case HandshakeFailureType::ChannelError: return "ChannelError";
            case HandshakeFailureType::InvalidState: return "InvalidState";
            case HandshakeFailureType::InvalidInput: return "InvalidInput";
            case HandshakeFailureType::RandomSource: return "RandomSource";
            case HandshakeFailureType::Encode: return "Encode";
        }
        return "Unknown";
    }

    HandshakeFailure HandshakeFailure::FromChannelFailure(
        const ChannelFailure& cf,
        const std::string_view step) {
        HandshakeFailure failure(
            HandshakeFailureType::ChannelError,
            fmt::format("Channel failure during {} ({}): {}", step, ToString(cf.type), cf.message));
        failure.channel_failure = cf.type;
        return failure;
    }

    bool HandshakeFailure::IsProtocolViolation() const noexcept {
        switch (type) {
            case HandshakeFailureType::InvalidPeerVersion:
            case HandshakeFailureType::InvalidZeroBytes:
            case HandshakeFailureType::IncorrectEpochEcho:
            case HandshakeFailureType::IncorrectRandomBytesEcho:
                return true;
            default:
                return false;
        }
    }
}
