#include <embedded_mcp/core/types.hpp>

namespace embedded_mcp {

Result<Port, std::string> Port::Create(int value) {
    if (value < kMin || value > kMax) {
        return Result<Port, std::string>::Err(
            "Port must be between " + std::to_string(kMin) + " and " +
            std::to_string(kMax) + ", got: " + std::to_string(value));
    }
    return Result<Port, std::string>::Ok(Port(static_cast<uint16_t>(value)));
}

std::string LoopbackUrl(uint16_t port) {
    return std::string("http://") + kLoopbackHost + ":" + std::to_string(port);
}

} // namespace embedded_mcp
