#include <embedded_mcp/automation/automation_tools.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>

namespace embedded_mcp {

namespace {

// ---------------------------------------------------------------------------
// Argument helpers. Arguments reaching a handler are already validated, so
// these only deal with optional presence.
// ---------------------------------------------------------------------------

std::optional<std::string> OptString(const nlohmann::ordered_json& args,
                                     const std::string& key) {
    if (args.contains(key) && args[key].is_string()) {
        return args[key].get<std::string>();
    }
    return std::nullopt;
}

bool OptBool(const nlohmann::ordered_json& args, const std::string& key,
             bool default_val) {
    if (args.contains(key) && args[key].is_boolean()) {
        return args[key].get<bool>();
    }
    return default_val;
}

// Rounded and clamped to [lo, hi] before conversion.
long long OptNumber(const nlohmann::ordered_json& args, const std::string& key,
                    long long default_val, long long lo, long long hi) {
    if (args.contains(key) && args[key].is_number()) {
        const auto value = std::clamp(args[key].get<double>(),
                                      static_cast<double>(lo),
                                      static_cast<double>(hi));
        return std::llround(value);
    }
    return default_val;
}

ToolResult FromBackend(const Result<std::string, Error>& outcome) {
    if (outcome.IsErr()) {
        return ToolResult::Failure(outcome.Error().message);
    }
    return ToolResult::Text(outcome.Value());
}

InputSchema Schema(std::vector<ParamSchema> properties,
                   std::vector<std::string> required = {}) {
    return InputSchema{std::move(properties), std::move(required), false};
}

// ---------------------------------------------------------------------------
// Tool definitions
// ---------------------------------------------------------------------------

ToolEntry TapButtonTool(std::shared_ptr<IAutomationBackend> backend) {
    ToolDefinition def{
        "tapButton",
        "Tap a button on the screen by its text content or resource ID",
        Schema({
            StringParam("text", "The text displayed on the button to tap"),
            StringParam("resourceId",
                        "The Android resource ID of the button (alternative to text)"),
            WithDefault(NumberParam("timeout",
                        "Maximum time to wait for the button in milliseconds"),
                        5000),
        })};

    // text or resourceId is needed but neither is required on its own, so
    // the check lives in the backend.
    auto handler = [backend](const nlohmann::ordered_json& args,
                             const CancellationToken& token) {
        TapRequest request;
        request.text = OptString(args, "text");
        request.resource_id = OptString(args, "resourceId");
        request.timeout = std::chrono::milliseconds(
            OptNumber(args, "timeout", 5000, 0, kMaxTimeoutMs));
        return FromBackend(backend->Tap(request, token));
    };
    return ToolEntry{std::move(def), std::move(handler)};
}

ToolEntry InputTextTool(std::shared_ptr<IAutomationBackend> backend) {
    ToolDefinition def{
        "inputText",
        "Input text into a text field or editable view",
        Schema({
            StringParam("text", "The text to input"),
            StringParam("fieldId", "The resource ID of the target text field"),
            StringParam("fieldHint",
                        "The hint text of the target field (alternative to fieldId)"),
            WithDefault(BooleanParam("clearFirst",
                        "Whether to clear existing text before input"), true),
        }, {"text"})};

    auto handler = [backend](const nlohmann::ordered_json& args,
                             const CancellationToken& token) {
        InputTextRequest request;
        request.text = args.at("text").get<std::string>();
        request.field_id = OptString(args, "fieldId");
        request.field_hint = OptString(args, "fieldHint");
        request.clear_first = OptBool(args, "clearFirst", true);
        return FromBackend(backend->InputText(request, token));
    };
    return ToolEntry{std::move(def), std::move(handler)};
}

ToolEntry ScrollTool(std::shared_ptr<IAutomationBackend> backend) {
    ToolDefinition def{
        "scroll",
        "Scroll the screen or a specific scrollable view",
        Schema({
            EnumParam("direction", "Direction to scroll",
                      {"up", "down", "left", "right"}),
            WithDefault(EnumParam("distance", "How far to scroll",
                                  {"short", "medium", "long"}),
                        "medium"),
            StringParam("containerId",
                        "Resource ID of specific scrollable container (optional)"),
        }, {"direction"})};

    auto handler = [backend](const nlohmann::ordered_json& args,
                             const CancellationToken& token) {
        auto direction = ParseScrollDirection(args.at("direction").get<std::string>());
        auto distance = ParseScrollDistance(
            OptString(args, "distance").value_or("medium"));
        if (!direction.has_value() || !distance.has_value()) {
            return ToolResult::Failure(
                "Invalid direction. Must be one of: up, down, left, right");
        }

        ScrollRequest request;
        request.direction = *direction;
        request.distance = *distance;
        request.container_id = OptString(args, "containerId");
        return FromBackend(backend->Scroll(request, token));
    };
    return ToolEntry{std::move(def), std::move(handler)};
}

ToolEntry GetScreenInfoTool(std::shared_ptr<IAutomationBackend> backend) {
    ToolDefinition def{
        "getScreenInfo",
        "Get information about the current screen content and UI elements",
        Schema({
            WithDefault(BooleanParam("includeInvisible",
                        "Whether to include invisible UI elements"), false),
            WithDefault(NumberParam("maxDepth",
                        "Maximum depth of UI hierarchy to scan"), 10),
        })};

    auto handler = [backend](const nlohmann::ordered_json& args,
                             const CancellationToken& token) {
        ScreenInfoRequest request;
        request.include_invisible = OptBool(args, "includeInvisible", false);
        request.max_depth = static_cast<int>(
            OptNumber(args, "maxDepth", 10, 0, kMaxHierarchyDepth));
        return FromBackend(backend->GetScreenInfo(request, token));
    };
    return ToolEntry{std::move(def), std::move(handler)};
}

} // anonymous namespace

std::vector<ToolEntry> AutomationToolEntries(
    std::shared_ptr<IAutomationBackend> backend) {
    std::vector<ToolEntry> entries;
    entries.push_back(TapButtonTool(backend));
    entries.push_back(InputTextTool(backend));
    entries.push_back(ScrollTool(backend));
    entries.push_back(GetScreenInfoTool(backend));
    return entries;
}

Result<ToolRegistry, std::string> BuildAutomationRegistry(
    std::shared_ptr<IAutomationBackend> backend) {
    return ToolRegistry::Create(AutomationToolEntries(std::move(backend)));
}

} // namespace embedded_mcp
