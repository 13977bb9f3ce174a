#pragma once
#include <cstdint>
namespace ratmap::protocol::interfaces {
/// Millisecond timestamp source relative to an unspecified epoch.
///
/// Values are 32 bits wide and roll over every ~49.7 days; compare them
/// with serial arithmetic (clock::SerialIsAfter), never with operator<.
class IClock {
public:
    virtual ~IClock() = default;
    [[nodiscard]] virtual uint32_t NowMillis() const = 0;
};
}
