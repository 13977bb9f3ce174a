#pragma once

#include "ratmap/core/result.hpp"
#include "ratmap/core/failures.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <vector>

namespace ratmap::protocol::crypto {

/**
 * @brief Interop layer for the libsodium primitives the handshake relies on
 *
 * Covers the random source for nonces and epochs, constant-time comparison
 * of echoed nonces and wiping of nonce buffers.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium library
     *
     * Must be called before any other sodium operations.
     * Thread-safe and idempotent.
     *
     * @return Ok if initialization succeeded, Err otherwise
     */
    static Result<Unit, SodiumFailure> Initialize();

    /**
     * @brief Check if libsodium is initialized
     */
    static bool IsInitialized() noexcept;

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    /**
     * @brief Fill a buffer with cryptographically secure random bytes
     *
     * Initializes libsodium on first use.
     */
    static Result<Unit, SodiumFailure> FillRandom(std::span<uint8_t> buffer);

    /**
     * @brief Generate random uint32_t
     *
     * @param ensure_non_zero If true, guarantees result != 0
     */
    static Result<uint32_t, SodiumFailure> GenerateRandomUInt32(bool ensure_non_zero = false);

    // ========================================================================
    // Comparison, Hashing and Wiping
    // ========================================================================

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different size are never equal. Initializes libsodium
     * on first use.
     *
     * @return Ok(true) if equal, Ok(false) if different, Err on failure
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    /**
     * @brief SHA-256 digest (crypto_hash_sha256)
     */
    static Result<std::vector<uint8_t>, SodiumFailure> Sha256(std::span<const uint8_t> data);

    /**
     * @brief Check a buffer for all-zero content in constant time
     */
    static bool IsAllZero(std::span<const uint8_t> data) noexcept;

    /**
     * @brief Zero a buffer with sodium_memzero
     */
    static void SecureWipe(std::span<uint8_t> buffer) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace ratmap::protocol::crypto
