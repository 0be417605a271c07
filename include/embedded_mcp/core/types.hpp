#pragma once

#include <embedded_mcp/core/result.hpp>

#include <cstdint>
#include <string>

namespace embedded_mcp {

// ---------------------------------------------------------------------------
// Port — validated TCP port for the loopback listener.
//
// Only the registered/dynamic range [1024, 65535] is accepted; well-known
// ports need privileges the host process should not have.
// ---------------------------------------------------------------------------
class Port {
public:
    static constexpr int kMin = 1024;
    static constexpr int kMax = 65535;

    static Result<Port, std::string> Create(int value);

    [[nodiscard]] uint16_t Value() const noexcept { return value_; }

    bool operator==(const Port& other) const { return value_ == other.value_; }
    bool operator!=(const Port& other) const { return value_ != other.value_; }

private:
    explicit Port(uint16_t value) : value_(value) {}
    uint16_t value_;
};

/// The only address the listener binds to.
constexpr const char* kLoopbackHost = "127.0.0.1";

// Loopback URL for a port, e.g. "http://127.0.0.1:12345".
std::string LoopbackUrl(uint16_t port);

} // namespace embedded_mcp
