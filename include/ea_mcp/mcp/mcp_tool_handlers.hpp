#pragma once

#include <ea_mcp/diagram/diagram_builder.hpp>
#include <ea_mcp/ea/i_ea_session.hpp>
#include <ea_mcp/mcp/tool_registry.hpp>

#include <nlohmann/json.hpp>

namespace ea_mcp {

// Register the diagram and lifeline tools with the MCP tool registry:
//   create_{sequence,class,use_case,activity}_diagram
//   create_{actor,boundary,control,entity,database,use_case}_lifeline
// Each tool handler captures &session by reference: one session shared
// across all tool calls, used by one call at a time.
void RegisterEaTools(ToolRegistry& registry, IEaSession& session);

// Tool payload serialization, shared with tests.
[[nodiscard]] nlohmann::json CreatedElementToJson(const CreatedElement& created,
                                                  bool with_features);
[[nodiscard]] nlohmann::json DiagramOutcomeToJson(const DiagramOutcome& outcome,
                                                  DiagramKind kind);

} // namespace ea_mcp
