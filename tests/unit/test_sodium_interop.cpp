#include <catch2/catch_test_macros.hpp>
#include "ratmap/crypto/sodium_interop.hpp"
#include "ratmap/core/constants.hpp"
#include <algorithm>
#include <array>
#include <set>
#include <string>
#include <vector>
using namespace ratmap::protocol;
using namespace ratmap::protocol::crypto;
TEST_CASE("SodiumInterop - Initialization", "[sodium][crypto]") {
    SECTION("Initialize succeeds") {
        auto result = SodiumInterop::Initialize();
        REQUIRE(result.IsOk());
        REQUIRE(SodiumInterop::IsInitialized());
    }
    SECTION("Multiple Initialize calls are safe") {
        auto result1 = SodiumInterop::Initialize();
        auto result2 = SodiumInterop::Initialize();
        REQUIRE(result1.IsOk());
        REQUIRE(result2.IsOk());
    }
}

TEST_CASE("SodiumInterop - Random Fill", "[sodium][crypto][random]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Fills a nonce-sized buffer") {
        std::vector<uint8_t> buffer(kRandomPayloadBytes, 0x00);
        REQUIRE(SodiumInterop::FillRandom(buffer).IsOk());
        REQUIRE_FALSE(SodiumInterop::IsAllZero(buffer));
    }
    SECTION("Empty buffer is a no-op") {
        std::vector<uint8_t> buffer;
        REQUIRE(SodiumInterop::FillRandom(buffer).IsOk());
    }
    SECTION("Consecutive fills differ") {
        std::array<uint8_t, 32> a{};
        std::array<uint8_t, 32> b{};
        REQUIRE(SodiumInterop::FillRandom(a).IsOk());
        REQUIRE(SodiumInterop::FillRandom(b).IsOk());
        REQUIRE(a != b);
    }
}

TEST_CASE("SodiumInterop - Random UInt32", "[sodium][crypto][random]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Values spread out") {
        std::set<uint32_t> seen;
        for (int i = 0; i < 64; ++i) {
            auto result = SodiumInterop::GenerateRandomUInt32();
            REQUIRE(result.IsOk());
            seen.insert(result.Unwrap());
        }
        REQUIRE(seen.size() > 60);
    }
    SECTION("Non-zero when requested") {
        for (int i = 0; i < 256; ++i) {
            auto result = SodiumInterop::GenerateRandomUInt32(true);
            REQUIRE(result.IsOk());
            REQUIRE(result.Unwrap() != 0u);
        }
    }
}

TEST_CASE("SodiumInterop - Constant Time Comparison", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Equal buffers return true") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 5};
        auto result = SodiumInterop::ConstantTimeEquals(a, b);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == true);
    }
    SECTION("Different buffers return false") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4, 6};
        auto result = SodiumInterop::ConstantTimeEquals(a, b);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == false);
    }
    SECTION("Different sizes return false") {
        std::vector<uint8_t> a = {1, 2, 3, 4, 5};
        std::vector<uint8_t> b = {1, 2, 3, 4};
        auto result = SodiumInterop::ConstantTimeEquals(a, b);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == false);
    }
    SECTION("Difference in the last nonce byte is detected") {
        std::vector<uint8_t> a(kRandomPayloadBytes, 0x42);
        std::vector<uint8_t> b = a;
        b.back() ^= 0x01;
        auto result = SodiumInterop::ConstantTimeEquals(a, b);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == false);
    }
}

TEST_CASE("SodiumInterop - SHA-256", "[sodium][crypto][hash]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("Known answer for \"abc\"") {
        const std::string input = "abc";
        const std::vector<uint8_t> expected = {
            0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea,
            0x41, 0x41, 0x40, 0xde, 0x5d, 0xae, 0x22, 0x23,
            0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17, 0x7a, 0x9c,
            0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad};
        auto result = SodiumInterop::Sha256(std::span<const uint8_t>(
            reinterpret_cast<const uint8_t*>(input.data()), input.size()));
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == expected);
    }
    SECTION("Digest size") {
        std::vector<uint8_t> nonce(kRandomPayloadBytes, 0x11);
        auto result = SodiumInterop::Sha256(nonce);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().size() == kNonceDigestBytes);
    }
}

TEST_CASE("SodiumInterop - Zero Detection and Wipe", "[sodium][crypto][security]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    SECTION("All-zero buffer") {
        std::vector<uint8_t> buffer(kRandomPayloadBytes, 0x00);
        REQUIRE(SodiumInterop::IsAllZero(buffer));
        buffer[kRandomPayloadBytes - 1] = 0x01;
        REQUIRE_FALSE(SodiumInterop::IsAllZero(buffer));
    }
    SECTION("Wipe clears the buffer") {
        std::vector<uint8_t> buffer(10000, 0xFF);
        SodiumInterop::SecureWipe(buffer);
        REQUIRE(std::all_of(buffer.begin(), buffer.end(), [](const uint8_t b) { return b == 0; }));
    }
    SECTION("Wipe empty buffer") {
        std::vector<uint8_t> buffer;
        SodiumInterop::SecureWipe(buffer);
        REQUIRE(buffer.empty());
    }
}
