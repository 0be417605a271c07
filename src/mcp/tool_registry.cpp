#include <embedded_mcp/mcp/tool_registry.hpp>

#include <algorithm>
#include <set>

namespace embedded_mcp {

namespace {

Result<void, std::string> ValidateParam(const std::string& tool,
                                        const ParamSchema& param) {
    const auto where = tool + "." + param.name;
    if (param.name.empty()) {
        return Result<void, std::string>::Err(
            "Tool '" + tool + "' declares a parameter with an empty name");
    }
    if (param.enum_values.has_value()) {
        if (param.type != ParamType::String) {
            return Result<void, std::string>::Err(
                where + ": enum is only supported on string parameters");
        }
        if (param.enum_values->empty()) {
            return Result<void, std::string>::Err(where + ": enum must not be empty");
        }
    }
    if (param.default_value.has_value()) {
        const auto& def = *param.default_value;
        if (!MatchesType(param.type, def)) {
            return Result<void, std::string>::Err(
                where + ": default does not match type " +
                ParamTypeName(param.type));
        }
        if (param.enum_values.has_value()) {
            const auto& values = *param.enum_values;
            if (std::find(values.begin(), values.end(),
                          def.get<std::string>()) == values.end()) {
                return Result<void, std::string>::Err(
                    where + ": default is not one of the enum values");
            }
        }
    }
    return Result<void, std::string>::Ok();
}

Result<void, std::string> ValidateEntry(const ToolEntry& entry) {
    const auto& def = entry.definition;
    if (def.name.empty()) {
        return Result<void, std::string>::Err("Tool name must not be empty");
    }
    if (!entry.handler) {
        return Result<void, std::string>::Err(
            "Tool '" + def.name + "' has no handler");
    }

    std::set<std::string> seen;
    for (const auto& param : def.input_schema.properties) {
        if (!seen.insert(param.name).second) {
            return Result<void, std::string>::Err(
                "Tool '" + def.name + "' declares parameter '" + param.name +
                "' twice");
        }
        auto checked = ValidateParam(def.name, param);
        if (checked.IsErr()) return checked;
    }

    for (const auto& req : def.input_schema.required) {
        if (seen.count(req) == 0) {
            return Result<void, std::string>::Err(
                "Tool '" + def.name + "' requires undeclared parameter '" +
                req + "'");
        }
    }
    return Result<void, std::string>::Ok();
}

} // anonymous namespace

Result<ToolRegistry, std::string> ToolRegistry::Create(
    std::vector<ToolEntry> entries) {
    ToolRegistry registry;
    for (auto& entry : entries) {
        auto checked = ValidateEntry(entry);
        if (checked.IsErr()) {
            return Result<ToolRegistry, std::string>::Err(checked.Error());
        }
        if (registry.handlers_.count(entry.definition.name) > 0) {
            return Result<ToolRegistry, std::string>::Err(
                "Duplicate tool name: " + entry.definition.name);
        }
        registry.handlers_.emplace(entry.definition.name, std::move(entry.handler));
        registry.definitions_.push_back(std::move(entry.definition));
    }
    return Result<ToolRegistry, std::string>::Ok(std::move(registry));
}

const ToolDefinition* ToolRegistry::FindDefinition(std::string_view name) const {
    auto it = std::find_if(definitions_.begin(), definitions_.end(),
                           [&](const ToolDefinition& d) { return d.name == name; });
    return it == definitions_.end() ? nullptr : &*it;
}

const ToolHandler* ToolRegistry::FindHandler(std::string_view name) const {
    auto it = handlers_.find(name);
    return it == handlers_.end() ? nullptr : &it->second;
}

} // namespace embedded_mcp
