#include <embedded_mcp/automation/i_automation_backend.hpp>

namespace embedded_mcp {

// ---------------------------------------------------------------------------
// Scroll enums
// ---------------------------------------------------------------------------
const char* ScrollDirectionName(ScrollDirection direction) {
    switch (direction) {
        case ScrollDirection::Up:    return "up";
        case ScrollDirection::Down:  return "down";
        case ScrollDirection::Left:  return "left";
        case ScrollDirection::Right: return "right";
    }
    return "down";
}

const char* ScrollDistanceName(ScrollDistance distance) {
    switch (distance) {
        case ScrollDistance::Short:  return "short";
        case ScrollDistance::Medium: return "medium";
        case ScrollDistance::Long:   return "long";
    }
    return "medium";
}

std::optional<ScrollDirection> ParseScrollDirection(const std::string& text) {
    if (text == "up") return ScrollDirection::Up;
    if (text == "down") return ScrollDirection::Down;
    if (text == "left") return ScrollDirection::Left;
    if (text == "right") return ScrollDirection::Right;
    return std::nullopt;
}

std::optional<ScrollDistance> ParseScrollDistance(const std::string& text) {
    if (text == "short") return ScrollDistance::Short;
    if (text == "medium") return ScrollDistance::Medium;
    if (text == "long") return ScrollDistance::Long;
    return std::nullopt;
}

} // namespace embedded_mcp
