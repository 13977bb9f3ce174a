#pragma once
#include "ratmap/protocol/random_payload.hpp"
#include <cstdint>

namespace ratmap::protocol {

/// One side's contribution to the handshake: a 32-bit epoch and the nonce.
///
/// The epoch is a session tag. Peers echo and compare it but never check it
/// against a real clock.
struct HandshakeIdentity {
    uint32_t epoch = 0;
    RandomPayload random_bytes = RandomPayload::Zero();
};

}  // namespace ratmap::protocol
