#pragma once

#include <embedded_mcp/automation/i_automation_backend.hpp>

#include <chrono>

namespace embedded_mcp {

// ---------------------------------------------------------------------------
// MockAutomationBackend — canned responses with simulated device latency.
//
// Nothing touches a real device. latency_scale multiplies every simulated
// delay (0 disables them).
// ---------------------------------------------------------------------------
class MockAutomationBackend : public IAutomationBackend {
public:
    explicit MockAutomationBackend(double latency_scale = 1.0);

    Result<std::string, Error> Tap(
        const TapRequest& request, const CancellationToken& token) override;

    Result<std::string, Error> InputText(
        const InputTextRequest& request, const CancellationToken& token) override;

    Result<std::string, Error> GetScreenInfo(
        const ScreenInfoRequest& request, const CancellationToken& token) override;

    Result<std::string, Error> Scroll(
        const ScrollRequest& request, const CancellationToken& token) override;

private:
    // Ok if the delay elapsed, Cancelled error otherwise.
    Result<void, Error> SimulateLatency(const char* operation,
                                        std::chrono::milliseconds base,
                                        const CancellationToken& token) const;

    double latency_scale_;
};

} // namespace embedded_mcp
