#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <utility>
namespace ratmap::protocol {
enum class SodiumFailureType {
    InitializationFailed,
    ComparisonFailed
};
enum class ChannelFailureType {
    Closed,
    Timeout,
    ShortRead,
    BufferFull
};
enum class HandshakeFailureType {
    InvalidPeerVersion,
    InvalidZeroBytes,
    IncorrectEpochEcho,
    IncorrectRandomBytesEcho,
    ChannelError,
    InvalidState,
    InvalidInput,
    RandomSource,
    Encode
};
[[nodiscard]] std::string_view ToString(ChannelFailureType type) noexcept;
[[nodiscard]] std::string_view ToString(HandshakeFailureType type) noexcept;
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
};
class ChannelFailure {
public:
    ChannelFailureType type;
    std::string message;
    ChannelFailure(const ChannelFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static ChannelFailure Closed(std::string msg) {
        return {ChannelFailureType::Closed, std::move(msg)};
    }
    static ChannelFailure Timeout(std::string msg) {
        return {ChannelFailureType::Timeout, std::move(msg)};
    }
    static ChannelFailure ShortRead(std::string msg) {
        return {ChannelFailureType::ShortRead, std::move(msg)};
    }
    static ChannelFailure BufferFull(std::string msg) {
        return {ChannelFailureType::BufferFull, std::move(msg)};
    }
};
/// Terminal outcome of a failed handshake attempt.
///
/// The first four types are wire validation failures raised against the
/// peer's bytes. ChannelError wraps a transport failure and keeps its
/// original ChannelFailureType in channel_failure.
class HandshakeFailure {
public:
    HandshakeFailureType type;
    std::string message;
    std::optional<ChannelFailureType> channel_failure;
    HandshakeFailure(const HandshakeFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static HandshakeFailure InvalidPeerVersion(std::string msg) {
        return {HandshakeFailureType::InvalidPeerVersion, std::move(msg)};
    }
    static HandshakeFailure InvalidZeroBytes(std::string msg) {
        return {HandshakeFailureType::InvalidZeroBytes, std::move(msg)};
    }
    static HandshakeFailure IncorrectEpochEcho(std::string msg) {
        return {HandshakeFailureType::IncorrectEpochEcho, std::move(msg)};
    }
    static HandshakeFailure IncorrectRandomBytesEcho(std::string msg) {
        return {HandshakeFailureType::IncorrectRandomBytesEcho, std::move(msg)};
    }
    static HandshakeFailure InvalidState(std::string msg) {
        return {HandshakeFailureType::InvalidState, std::move(msg)};
    }
    static HandshakeFailure InvalidInput(std::string msg) {
        return {HandshakeFailureType::InvalidInput, std::move(msg)};
    }
    static HandshakeFailure RandomSource(std::string msg) {
        return {HandshakeFailureType::RandomSource, std::move(msg)};
    }
    static HandshakeFailure Encode(std::string msg) {
        return {HandshakeFailureType::Encode, std::move(msg)};
    }
    static HandshakeFailure FromChannelFailure(const ChannelFailure& cf, std::string_view step);
    static HandshakeFailure FromSodiumFailure(const SodiumFailure& sf) {
        return RandomSource(sf.message);
    }
    [[nodiscard]] bool IsProtocolViolation() const noexcept;
    [[nodiscard]] bool IsRetryable() const noexcept {
        return type == HandshakeFailureType::ChannelError;
    }
};
}
