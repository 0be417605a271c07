#include <embedded_mcp/mcp/tool_dispatcher.hpp>

#include <embedded_mcp/core/log.hpp>

#include <algorithm>
#include <vector>

namespace embedded_mcp {

namespace {

std::string Join(const std::vector<std::string>& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += ", ";
        out += values[i];
    }
    return out;
}

RpcError InvalidParams(const std::vector<std::string>& violations) {
    return RpcError::Make(RpcErrorCode::InvalidParams,
                          "Invalid params: " + violations.front(),
                          nlohmann::ordered_json{{"violations", violations}});
}

// Decrements the in-flight counter on every exit path.
class InFlightGuard {
public:
    InFlightGuard(std::mutex& mutex, std::condition_variable& cv, size_t& count)
        : mutex_(mutex), cv_(cv), count_(count) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++count_;
    }
    ~InFlightGuard() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --count_;
        }
        cv_.notify_all();
    }
    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::mutex& mutex_;
    std::condition_variable& cv_;
    size_t& count_;
};

} // anonymous namespace

// ---------------------------------------------------------------------------
// ValidateArguments
// ---------------------------------------------------------------------------
Result<nlohmann::ordered_json, RpcError> ValidateArguments(
    const InputSchema& schema, const nlohmann::ordered_json& raw_arguments) {
    using R = Result<nlohmann::ordered_json, RpcError>;

    if (!raw_arguments.is_null() && !raw_arguments.is_object()) {
        return R::Err(InvalidParams({"arguments must be an object"}));
    }
    const nlohmann::ordered_json args = raw_arguments.is_null()
        ? nlohmann::ordered_json::object() : raw_arguments;

    std::vector<std::string> violations;

    if (!schema.additional_properties) {
        for (const auto& [key, value] : args.items()) {
            if (schema.FindProperty(key) == nullptr) {
                violations.push_back("unknown parameter '" + key + "'");
            }
        }
    }

    for (const auto& name : schema.required) {
        if (!args.contains(name)) {
            violations.push_back("missing required parameter '" + name + "'");
        }
    }

    for (const auto& param : schema.properties) {
        auto it = args.find(param.name);
        if (it == args.end()) continue;
        if (!MatchesType(param.type, *it)) {
            violations.push_back("parameter '" + param.name + "' must be a " +
                                 ParamTypeName(param.type));
            continue;
        }
        if (param.enum_values.has_value()) {
            const auto& allowed = *param.enum_values;
            if (std::find(allowed.begin(), allowed.end(),
                          it->get<std::string>()) == allowed.end()) {
                violations.push_back("parameter '" + param.name +
                                     "' must be one of: " + Join(allowed));
            }
        }
    }

    if (!violations.empty()) {
        return R::Err(InvalidParams(violations));
    }

    nlohmann::ordered_json validated = args;
    for (const auto& param : schema.properties) {
        if (!validated.contains(param.name) && param.default_value.has_value()) {
            validated[param.name] = *param.default_value;
        }
    }
    return R::Ok(std::move(validated));
}

// ---------------------------------------------------------------------------
// ToolDispatcher
// ---------------------------------------------------------------------------
ToolDispatcher::ToolDispatcher(std::shared_ptr<const ToolRegistry> registry,
                               DispatcherOptions options)
    : registry_(std::move(registry)), options_(options) {}

Result<ToolResult, RpcError> ToolDispatcher::Invoke(
    const std::string& name, const nlohmann::ordered_json& raw_arguments) {
    using R = Result<ToolResult, RpcError>;

    const auto* definition = registry_->FindDefinition(name);
    const auto* handler = registry_->FindHandler(name);
    if (definition == nullptr || handler == nullptr) {
        LogWarn("dispatch", "Unknown tool: " + name);
        return R::Err(RpcError::Make(RpcErrorCode::ToolNotFound,
                                     "Tool not found: " + name,
                                     nlohmann::ordered_json{{"name", name}}));
    }

    auto validated = ValidateArguments(definition->input_schema, raw_arguments);
    if (validated.IsErr()) {
        LogInfo("dispatch", "Rejected call to " + name + ": " +
                                validated.Error().message);
        return R::Err(validated.Error());
    }

    return R::Ok(RunHandler(name, *handler, validated.Value()));
}

ToolResult ToolDispatcher::RunHandler(const std::string& name,
                                      const ToolHandler& handler,
                                      const nlohmann::ordered_json& arguments) {
    InFlightGuard guard(idle_mutex_, idle_cv_, in_flight_);

    auto token = cancel_source_.Token();
    if (options_.call_timeout.count() > 0) {
        token = token.WithTimeout(options_.call_timeout);
    }

    LogDebug("dispatch", "Calling " + name + " with " + arguments.dump());

    ToolResult result;
    try {
        result = handler(arguments, token);
    } catch (const std::exception& e) {
        LogWarn("dispatch", "Tool " + name + " threw: " + e.what());
        return ToolResult::Failure(std::string("Tool execution failed: ") + e.what());
    } catch (...) {
        LogWarn("dispatch", "Tool " + name + " threw a non-standard exception");
        return ToolResult::Failure("Tool execution failed: unknown exception");
    }

    if (token.IsCancelled()) {
        const auto reason = token.DeadlineExpired()
            ? "timed out after " + std::to_string(options_.call_timeout.count()) + "ms"
            : std::string("cancelled");
        LogWarn("dispatch", "Tool " + name + " " + reason + "; result discarded");
        return ToolResult::Failure("Tool '" + name + "' " + reason);
    }

    if (result.is_error) {
        LogInfo("dispatch", "Tool " + name + " reported an error");
    } else if (result.content.empty()) {
        result.content.push_back(ToolContent{"text", ""});
    }
    return result;
}

size_t ToolDispatcher::InFlight() const {
    std::lock_guard<std::mutex> lock(idle_mutex_);
    return in_flight_;
}

bool ToolDispatcher::WaitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return in_flight_ == 0; });
}

void ToolDispatcher::CancelInFlight() {
    cancel_source_.Cancel();
}

void ToolDispatcher::ResetCancellation() {
    cancel_source_.Reset();
}

} // namespace embedded_mcp
