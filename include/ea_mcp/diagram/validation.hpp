#pragma once

#include <ea_mcp/core/result.hpp>
#include <ea_mcp/diagram/diagram_request.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace ea_mcp {

// Tool name for a diagram kind ("create_sequence_diagram", ...).
[[nodiscard]] std::string DiagramToolName(DiagramKind kind);

// Tool name for a lifeline type ("create_actor_lifeline", ...).
// Only lifeline types have a tool.
[[nodiscard]] std::string LifelineToolName(ElementType type);

// ---------------------------------------------------------------------------
// Parameter validation for the create_*_diagram tools.
//
// Pure: never touches the repository. On success the request mirrors the
// input exactly (names, order, GUID spelling). Errors:
//   MissingParameter    required field absent (elements[i].type for sequences)
//   InvalidParameter    wrong JSON type, empty name, malformed array entry
//   InvalidGuid         package_guid is not GUID syntax
//   UnknownElementType  type outside the vocabulary allowed for `kind`
// The first error found is reported, scanning fields in schema order.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<DiagramRequest, Error> ValidateDiagramRequest(
    DiagramKind kind, const nlohmann::json& params);

// Parameter validation for create_<type>_lifeline. `type` must be a lifeline
// type; it is fixed by the tool, not read from params.
[[nodiscard]] Result<LifelineRequest, Error> ValidateLifelineRequest(
    ElementType type, const nlohmann::json& params);

// JSON Schema advertised in tools/list for each tool.
[[nodiscard]] nlohmann::json DiagramToolSchema(DiagramKind kind);
[[nodiscard]] nlohmann::json LifelineToolSchema();

} // namespace ea_mcp
