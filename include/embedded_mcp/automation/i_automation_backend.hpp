#pragma once

#include <embedded_mcp/core/cancellation.hpp>
#include <embedded_mcp/core/result.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace embedded_mcp {

// ---------------------------------------------------------------------------
// Request types for the automation actions.
// ---------------------------------------------------------------------------

// Exactly one of text / resource_id identifies the target.
struct TapRequest {
    std::optional<std::string> text;
    std::optional<std::string> resource_id;
    std::chrono::milliseconds timeout{5000};
};

struct InputTextRequest {
    std::string text;
    std::optional<std::string> field_id;
    std::optional<std::string> field_hint;
    bool clear_first = true;
};

struct ScreenInfoRequest {
    bool include_invisible = false;
    int max_depth = 10;
};

enum class ScrollDirection { Up, Down, Left, Right };
enum class ScrollDistance { Short, Medium, Long };

const char* ScrollDirectionName(ScrollDirection direction);
const char* ScrollDistanceName(ScrollDistance distance);
std::optional<ScrollDirection> ParseScrollDirection(const std::string& text);
std::optional<ScrollDistance> ParseScrollDistance(const std::string& text);

struct ScrollRequest {
    ScrollDirection direction = ScrollDirection::Down;
    ScrollDistance distance = ScrollDistance::Medium;
    std::optional<std::string> container_id;
};

// ---------------------------------------------------------------------------
// IAutomationBackend — the UI automation capability tools delegate to.
//
// Each action returns a human-readable description of what happened, or an
// Error. Implementations must honour `token`: a cancelled token means the
// caller has gone away and the action should stop as soon as it can.
// ---------------------------------------------------------------------------
class IAutomationBackend {
public:
    virtual ~IAutomationBackend() = default;

    IAutomationBackend() = default;
    IAutomationBackend(const IAutomationBackend&) = delete;
    IAutomationBackend& operator=(const IAutomationBackend&) = delete;

    [[nodiscard]] virtual Result<std::string, Error> Tap(
        const TapRequest& request, const CancellationToken& token) = 0;

    [[nodiscard]] virtual Result<std::string, Error> InputText(
        const InputTextRequest& request, const CancellationToken& token) = 0;

    [[nodiscard]] virtual Result<std::string, Error> GetScreenInfo(
        const ScreenInfoRequest& request, const CancellationToken& token) = 0;

    [[nodiscard]] virtual Result<std::string, Error> Scroll(
        const ScrollRequest& request, const CancellationToken& token) = 0;
};

} // namespace embedded_mcp
