#include "ratmap/crypto/sodium_interop.hpp"

#include <string>

namespace ratmap::protocol::crypto {

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        // sodium_init returns 1 when the library was already initialised
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed("libsodium initialization failed"));
    }

    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Random Number Generation
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::FillRandom(std::span<uint8_t> buffer) {
    if (auto init_result = Initialize(); init_result.IsErr()) {
        return init_result;
    }
    if (!buffer.empty()) {
        randombytes_buf(buffer.data(), buffer.size());
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<uint32_t, SodiumFailure> SodiumInterop::GenerateRandomUInt32(const bool ensure_non_zero) {
    if (auto init_result = Initialize(); init_result.IsErr()) {
        return Result<uint32_t, SodiumFailure>::Err(std::move(init_result).UnwrapErr());
    }
    uint32_t value = randombytes_random();
    while (ensure_non_zero && value == 0) {
        value = randombytes_random();
    }
    return Result<uint32_t, SodiumFailure>::Ok(value);
}

// ============================================================================
// Comparison, Hashing and Wiping
// ============================================================================

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {

    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }

    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }

    if (auto init_result = Initialize(); init_result.IsErr()) {
        return Result<bool, SodiumFailure>::Err(
            SodiumFailure::ComparisonFailed(
                "Constant-time comparison unavailable: " + init_result.UnwrapErr().message));
    }

    return Result<bool, SodiumFailure>::Ok(
        sodium_memcmp(a.data(), b.data(), a.size()) == 0);
}

Result<std::vector<uint8_t>, SodiumFailure> SodiumInterop::Sha256(std::span<const uint8_t> data) {
    if (auto init_result = Initialize(); init_result.IsErr()) {
        return Result<std::vector<uint8_t>, SodiumFailure>::Err(std::move(init_result).UnwrapErr());
    }
    std::vector<uint8_t> digest(crypto_hash_sha256_BYTES);
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    return Result<std::vector<uint8_t>, SodiumFailure>::Ok(std::move(digest));
}

bool SodiumInterop::IsAllZero(std::span<const uint8_t> data) noexcept {
    return data.empty() || sodium_is_zero(data.data(), data.size()) == 1;
}

void SodiumInterop::SecureWipe(std::span<uint8_t> buffer) noexcept {
    if (!buffer.empty()) {
        sodium_memzero(buffer.data(), buffer.size());
    }
}

} // namespace ratmap::protocol::crypto
