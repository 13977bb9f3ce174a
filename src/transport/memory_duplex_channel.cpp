#include "ratmap/transport/memory_duplex_channel.hpp"
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <fmt/core.h>
#include <mutex>

namespace ratmap::protocol::transport {
    struct MemoryDuplexChannel::Pipe {
        std::mutex lock;
        std::condition_variable readable;
        std::deque<uint8_t> buffer;
        bool closed = false;

        void Close() {
            {
                std::lock_guard guard(lock);
                closed = true;
            }
            readable.notify_all();
        }
    };

    MemoryDuplexChannel::Pair MemoryDuplexChannel::CreatePair(const ChannelOptions options) {
        auto a_to_b = std::make_shared<Pipe>();
        auto b_to_a = std::make_shared<Pipe>();
        std::unique_ptr<MemoryDuplexChannel> a(new MemoryDuplexChannel(b_to_a, a_to_b, options));
        std::unique_ptr<MemoryDuplexChannel> b(new MemoryDuplexChannel(a_to_b, b_to_a, options));
        return {std::move(a), std::move(b)};
    }

    MemoryDuplexChannel::MemoryDuplexChannel(
        std::shared_ptr<Pipe> inbound,
        std::shared_ptr<Pipe> outbound,
        const ChannelOptions options)
        : inbound_(std::move(inbound))
          , outbound_(std::move(outbound))
          , options_(options) {
    }

    MemoryDuplexChannel::~MemoryDuplexChannel() {
        Close();
    }

    Result<Unit, ChannelFailure> MemoryDuplexChannel::ReadExact(std::span<uint8_t> buffer) {
        std::optional<std::chrono::steady_clock::time_point> deadline;
        if (options_.read_timeout.has_value()) {
            deadline = std::chrono::steady_clock::now() + *options_.read_timeout;
        }
        size_t filled = 0;
        std::unique_lock guard(inbound_->lock);
        while (filled < buffer.size()) {
            const auto ready = [this] { return !inbound_->buffer.empty() || inbound_->closed; };
            if (deadline.has_value()) {
                if (!inbound_->readable.wait_until(guard, *deadline, ready)) {
                    bytes_read_ += filled;
                    return Result<Unit, ChannelFailure>::Err(
                        ChannelFailure::Timeout(
                            fmt::format("Read timed out after {} of {} bytes", filled, buffer.size())));
                }
            } else {
                inbound_->readable.wait(guard, ready);
            }
            if (inbound_->buffer.empty()) {
                bytes_read_ += filled;
                if (filled == 0) {
                    return Result<Unit, ChannelFailure>::Err(
                        ChannelFailure::Closed("Channel closed by peer"));
                }
                return Result<Unit, ChannelFailure>::Err(
                    ChannelFailure::ShortRead(
                        fmt::format("Channel closed after {} of {} bytes", filled, buffer.size())));
            }
            const size_t take = std::min(buffer.size() - filled, inbound_->buffer.size());
            const auto begin = inbound_->buffer.begin();
            std::copy(begin, begin + static_cast<std::ptrdiff_t>(take), buffer.begin() + static_cast<std::ptrdiff_t>(filled));
            inbound_->buffer.erase(begin, begin + static_cast<std::ptrdiff_t>(take));
            filled += take;
        }
        bytes_read_ += filled;
        return Result<Unit, ChannelFailure>::Ok(unit);
    }

    Result<Unit, ChannelFailure> MemoryDuplexChannel::WriteExact(std::span<const uint8_t> bytes) {
        {
            std::lock_guard guard(outbound_->lock);
            if (outbound_->closed) {
                return Result<Unit, ChannelFailure>::Err(
                    ChannelFailure::Closed("Write on closed channel"));
            }
            if (options_.max_buffered_bytes != 0 &&
                outbound_->buffer.size() + bytes.size() > options_.max_buffered_bytes) {
                return Result<Unit, ChannelFailure>::Err(
                    ChannelFailure::BufferFull(
                        fmt::format("Write of {} bytes exceeds buffer limit of {} ({} pending)",
                                    bytes.size(), options_.max_buffered_bytes, outbound_->buffer.size())));
            }
            outbound_->buffer.insert(outbound_->buffer.end(), bytes.begin(), bytes.end());
        }
        outbound_->readable.notify_all();
        bytes_written_ += bytes.size();
        return Result<Unit, ChannelFailure>::Ok(unit);
    }

    Result<Unit, ChannelFailure> MemoryDuplexChannel::Flush() {
        if (IsClosed()) {
            return Result<Unit, ChannelFailure>::Err(
                ChannelFailure::Closed("Flush on closed channel"));
        }
        return Result<Unit, ChannelFailure>::Ok(unit);
    }

    void MemoryDuplexChannel::Close() {
        inbound_->Close();
        outbound_->Close();
    }

    bool MemoryDuplexChannel::IsClosed() const {
        std::lock_guard guard(outbound_->lock);
        return outbound_->closed;
    }
}
