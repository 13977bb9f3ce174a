#pragma once
#include "ratmap/core/result.hpp"
#include "ratmap/core/failures.hpp"
#include <cstdint>
#include <span>
namespace ratmap::protocol::interfaces {
using protocol::Result;
using protocol::Unit;
using protocol::ChannelFailure;
/// Blocking byte-stream transport the handshake runs over.
///
/// ReadExact fills the whole buffer or fails; WriteExact transfers the whole
/// buffer or fails. Implementations retry partial transfers themselves and
/// own any deadline or cancellation policy.
class IByteChannel {
public:
    virtual ~IByteChannel() = default;
    [[nodiscard]] virtual Result<Unit, ChannelFailure> ReadExact(std::span<uint8_t> buffer) = 0;
    [[nodiscard]] virtual Result<Unit, ChannelFailure> WriteExact(std::span<const uint8_t> bytes) = 0;
    [[nodiscard]] virtual Result<Unit, ChannelFailure> Flush() = 0;
};
}
