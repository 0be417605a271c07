#pragma once

#include <embedded_mcp/automation/i_automation_backend.hpp>
#include <embedded_mcp/core/result.hpp>
#include <embedded_mcp/mcp/tool_registry.hpp>

#include <memory>
#include <string>
#include <vector>

namespace embedded_mcp {

// Numeric arguments are clamped to these bounds before reaching the backend.
constexpr long long kMaxTimeoutMs = 600000;
constexpr long long kMaxHierarchyDepth = 1000;

// Tool declarations for the UI automation actions, in discovery order:
// tapButton, inputText, scroll, getScreenInfo. Handlers share `backend`
// and may run concurrently.
std::vector<ToolEntry> AutomationToolEntries(
    std::shared_ptr<IAutomationBackend> backend);

Result<ToolRegistry, std::string> BuildAutomationRegistry(
    std::shared_ptr<IAutomationBackend> backend);

} // namespace embedded_mcp
