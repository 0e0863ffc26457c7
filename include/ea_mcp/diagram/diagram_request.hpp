#pragma once

#include <ea_mcp/core/types.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ea_mcp {

// ---------------------------------------------------------------------------
// ElementSpec — one element requested by a tool caller.
// ---------------------------------------------------------------------------
struct ElementSpec {
    std::string name;
    ElementType type = ElementType::Class;
    std::optional<std::string> stereotype;
    std::vector<std::string> attributes;  // classes only
    std::vector<std::string> methods;     // classes only
};

// ---------------------------------------------------------------------------
// Kind-specific payloads. Field names match the tool parameters.
// ---------------------------------------------------------------------------
struct SequencePayload {
    std::vector<ElementSpec> elements;
};

struct ClassPayload {
    std::vector<ElementSpec> classes;
};

struct UseCasePayload {
    std::vector<std::string> actors;
    std::vector<std::string> use_cases;
};

struct ActivityPayload {
    std::vector<std::string> activities;
    std::vector<std::string> decisions;
};

using DiagramPayload =
    std::variant<SequencePayload, ClassPayload, UseCasePayload, ActivityPayload>;

// ---------------------------------------------------------------------------
// DiagramRequest — a validated create_*_diagram invocation.
// The payload alternative always corresponds to `kind`.
// ---------------------------------------------------------------------------
struct DiagramRequest {
    Guid package_guid;
    std::string name;
    DiagramKind kind;
    DiagramPayload payload;
};

// ---------------------------------------------------------------------------
// LifelineRequest — a validated create_*_lifeline invocation.
// ---------------------------------------------------------------------------
struct LifelineRequest {
    Guid diagram_guid;
    ElementSpec element;
};

} // namespace ea_mcp
