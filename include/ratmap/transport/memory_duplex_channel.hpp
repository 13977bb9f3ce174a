#pragma once
#include "ratmap/interfaces/i_byte_channel.hpp"
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

namespace ratmap::protocol::transport {

struct ChannelOptions {
    /// Upper bound on a single ReadExact call; unset blocks indefinitely.
    std::optional<std::chrono::milliseconds> read_timeout{};
    /// Pending bytes allowed per direction before WriteExact fails with
    /// BufferFull. Zero means unbounded.
    size_t max_buffered_bytes = 0;
};

/// One end of an in-process byte pipe pair.
///
/// Each end may be driven from its own thread. Closing either end (or
/// destroying it) closes both directions: blocked readers wake up and drain
/// what is left, writers fail with Closed.
class MemoryDuplexChannel final : public interfaces::IByteChannel {
public:
    using Pair = std::pair<std::unique_ptr<MemoryDuplexChannel>, std::unique_ptr<MemoryDuplexChannel>>;

    [[nodiscard]] static Pair CreatePair(ChannelOptions options = {});

    [[nodiscard]] Result<Unit, ChannelFailure> ReadExact(std::span<uint8_t> buffer) override;
    [[nodiscard]] Result<Unit, ChannelFailure> WriteExact(std::span<const uint8_t> bytes) override;
    [[nodiscard]] Result<Unit, ChannelFailure> Flush() override;

    void Close();
    [[nodiscard]] bool IsClosed() const;

    [[nodiscard]] uint64_t BytesRead() const noexcept { return bytes_read_.load(); }
    [[nodiscard]] uint64_t BytesWritten() const noexcept { return bytes_written_.load(); }

    MemoryDuplexChannel(const MemoryDuplexChannel&) = delete;
    MemoryDuplexChannel& operator=(const MemoryDuplexChannel&) = delete;
    MemoryDuplexChannel(MemoryDuplexChannel&&) = delete;
    MemoryDuplexChannel& operator=(MemoryDuplexChannel&&) = delete;
    ~MemoryDuplexChannel() override;

private:
    struct Pipe;

    MemoryDuplexChannel(
        std::shared_ptr<Pipe> inbound,
        std::shared_ptr<Pipe> outbound,
        ChannelOptions options);

    std::shared_ptr<Pipe> inbound_;
    std::shared_ptr<Pipe> outbound_;
    ChannelOptions options_;
    std::atomic<uint64_t> bytes_read_{0};
    std::atomic<uint64_t> bytes_written_{0};
};

}  // namespace ratmap::protocol::transport
