#include <embedded_mcp/automation/mock_automation_backend.hpp>

#include <embedded_mcp/core/log.hpp>

#include <sstream>

namespace embedded_mcp {

namespace {

constexpr std::chrono::milliseconds kTapLatency{100};
constexpr std::chrono::milliseconds kInputLatency{50};
constexpr std::chrono::milliseconds kScreenInfoLatency{200};
constexpr std::chrono::milliseconds kScrollLatency{100};

} // anonymous namespace

// ---------------------------------------------------------------------------
// MockAutomationBackend
// ---------------------------------------------------------------------------
MockAutomationBackend::MockAutomationBackend(double latency_scale)
    : latency_scale_(latency_scale < 0.0 ? 0.0 : latency_scale) {}

Result<void, Error> MockAutomationBackend::SimulateLatency(
    const char* operation, std::chrono::milliseconds base,
    const CancellationToken& token) const {
    const auto delay = std::chrono::milliseconds(
        static_cast<long long>(static_cast<double>(base.count()) * latency_scale_));
    if (token.WaitFor(delay)) {
        return Result<void, Error>::Ok();
    }
    return Result<void, Error>::Err(Error::Make(
        operation, "Interrupted before completion", ErrorCategory::Cancelled));
}

Result<std::string, Error> MockAutomationBackend::Tap(
    const TapRequest& request, const CancellationToken& token) {
    using R = Result<std::string, Error>;

    std::string target;
    if (request.text.has_value()) {
        target = "button with text '" + *request.text + "'";
    } else if (request.resource_id.has_value()) {
        target = "button with resource ID '" + *request.resource_id + "'";
    } else {
        return R::Err(Error::Make("Tap",
            "Either 'text' or 'resourceId' parameter is required",
            ErrorCategory::Automation));
    }

    auto waited = SimulateLatency("Tap", kTapLatency, token);
    if (waited.IsErr()) return R::Err(waited.Error());

    LogDebug("automation", "tap " + target);
    return R::Ok("Successfully tapped " + target + " (timeout: " +
                 std::to_string(request.timeout.count()) + "ms)");
}

Result<std::string, Error> MockAutomationBackend::InputText(
    const InputTextRequest& request, const CancellationToken& token) {
    using R = Result<std::string, Error>;

    std::string target = "focused text field";
    if (request.field_id.has_value()) {
        target = "field with ID '" + *request.field_id + "'";
    } else if (request.field_hint.has_value()) {
        target = "field with hint '" + *request.field_hint + "'";
    }

    auto waited = SimulateLatency("InputText", kInputLatency, token);
    if (waited.IsErr()) return R::Err(waited.Error());

    const char* action = request.clear_first ? "cleared and entered" : "appended";
    return R::Ok(std::string("Successfully ") + action + " text '" +
                 request.text + "' into " + target);
}

Result<std::string, Error> MockAutomationBackend::GetScreenInfo(
    const ScreenInfoRequest& request, const CancellationToken& token) {
    using R = Result<std::string, Error>;

    auto waited = SimulateLatency("GetScreenInfo", kScreenInfoLatency, token);
    if (waited.IsErr()) return R::Err(waited.Error());

    std::ostringstream oss;
    oss << "Screen Analysis Results:\n"
        << "- Screen size: 1080x2340 pixels\n"
        << "- Orientation: Portrait\n"
        << "- Visible elements: 12 buttons, 3 text fields, 1 scroll view\n";
    if (request.include_invisible) {
        oss << "- Hidden elements: 2 buttons, 1 progress bar\n";
    }
    oss << "- UI hierarchy depth: " << request.max_depth << " levels scanned\n"
        << "- Current activity: com.example.MainActivity\n";
    return R::Ok(oss.str());
}

Result<std::string, Error> MockAutomationBackend::Scroll(
    const ScrollRequest& request, const CancellationToken& token) {
    using R = Result<std::string, Error>;

    auto waited = SimulateLatency("Scroll", kScrollLatency, token);
    if (waited.IsErr()) return R::Err(waited.Error());

    const auto target = request.container_id.has_value()
        ? "container '" + *request.container_id + "'"
        : std::string("main screen");
    return R::Ok(std::string("Successfully scrolled ") +
                 ScrollDirectionName(request.direction) + " (" +
                 ScrollDistanceName(request.distance) + " distance) on " + target);
}

} // namespace embedded_mcp
