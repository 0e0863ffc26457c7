#include <ea_mcp/mcp/mcp_tool_handlers.hpp>

#include <ea_mcp/core/log.hpp>
#include <ea_mcp/diagram/validation.hpp>

#include <string>

namespace ea_mcp {

namespace {

nlohmann::json FeaturesToJson(const std::vector<FeatureInfo>& features) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& f : features) {
        arr.push_back({{"guid", f.guid},
                       {"name", f.name},
                       {"kind", std::string(FeatureKindName(f.kind))}});
    }
    return arr;
}

nlohmann::json DiagramInfoToJson(const DiagramInfo& diagram) {
    return {{"guid", diagram.guid},
            {"name", diagram.name},
            {"type", diagram.type}};
}

nlohmann::json ElementsToJson(const std::vector<CreatedElement>& elements,
                              bool with_features) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& e : elements) {
        arr.push_back(CreatedElementToJson(e, with_features));
    }
    return arr;
}

// ---------------------------------------------------------------------------
// Handlers
// ---------------------------------------------------------------------------

ToolResult HandleCreateDiagram(DiagramKind kind, const nlohmann::json& params,
                               IEaSession& session) {
    auto request = ValidateDiagramRequest(kind, params);
    if (request.IsErr()) {
        LogWarn("mcp", request.Error().ToString());
        return MakeToolErrorResult(request.Error());
    }

    auto builder = MakeDiagramBuilder(kind);
    auto built = builder->Build(request.Value(), session);
    if (built.IsErr()) {
        const auto& failure = built.Error();
        nlohmann::json extra = nlohmann::json::object();
        if (failure.partial.has_value()) {
            extra["diagram_guid"] = failure.partial->diagram.guid;
            extra["elements"] = ElementsToJson(failure.partial->elements,
                                               kind == DiagramKind::Class);
        }
        return MakeToolErrorResult(failure.error, extra);
    }
    return MakeTextResult(DiagramOutcomeToJson(built.Value(), kind), false);
}

ToolResult HandleCreateLifeline(ElementType type, const nlohmann::json& params,
                                IEaSession& session) {
    auto request = ValidateLifelineRequest(type, params);
    if (request.IsErr()) {
        LogWarn("mcp", request.Error().ToString());
        return MakeToolErrorResult(request.Error());
    }

    auto created = CreateLifeline(request.Value(), session);
    if (created.IsErr()) {
        return MakeToolErrorResult(created.Error());
    }
    const auto& element = created.Value();
    return MakeTextResult({{"status", "success"},
                           {"element_guid", element.element.guid},
                           {"element", CreatedElementToJson(element, false)}},
                          false);
}

std::string DiagramDescription(DiagramKind kind) {
    switch (kind) {
        case DiagramKind::Sequence:
            return "Creates a sequence diagram in Enterprise Architect with one "
                   "lifeline per element, laid out left to right.";
        case DiagramKind::Class:
            return "Creates a class diagram in Enterprise Architect. Each class "
                   "gets its attributes and methods in the given order.";
        case DiagramKind::UseCase:
            return "Creates a use case diagram in Enterprise Architect with the "
                   "given actors and use cases. No connectors are drawn.";
        case DiagramKind::Activity:
            return "Creates an activity diagram in Enterprise Architect with the "
                   "given activities and decisions. No control flows are drawn.";
    }
    return {};
}

std::string LifelineDescription(ElementType type) {
    switch (type) {
        case ElementType::Actor:
            return "Creates an actor lifeline on a sequence diagram.";
        case ElementType::Boundary:
            return "Creates a boundary lifeline on a sequence diagram.";
        case ElementType::Control:
            return "Creates a control lifeline on a sequence diagram.";
        case ElementType::Entity:
            return "Creates an entity lifeline on a sequence diagram.";
        case ElementType::Database:
            return "Creates a database lifeline on a sequence diagram.";
        case ElementType::UseCase:
            return "Creates a use case lifeline on a sequence diagram.";
        default:
            return {};
    }
}

} // namespace

nlohmann::json CreatedElementToJson(const CreatedElement& created,
                                    bool with_features) {
    const auto& e = created.element;
    nlohmann::json j = {
        {"guid", e.guid},
        {"name", e.name},
        {"type", std::string(ElementTypeName(created.type))},
        {"ea_type", e.type},
        {"stereotype", e.stereotype},
        {"left", e.position.left},
        {"top", e.position.top},
    };
    if (with_features) {
        j["attributes"] = FeaturesToJson(created.attributes);
        j["methods"] = FeaturesToJson(created.methods);
    }
    return j;
}

nlohmann::json DiagramOutcomeToJson(const DiagramOutcome& outcome,
                                    DiagramKind kind) {
    return {
        {"status", "success"},
        {"diagram_guid", outcome.diagram.guid},
        {"diagram", DiagramInfoToJson(outcome.diagram)},
        {"elements", ElementsToJson(outcome.elements, kind == DiagramKind::Class)},
    };
}

void RegisterEaTools(ToolRegistry& registry, IEaSession& session) {
    for (auto kind : {DiagramKind::Sequence, DiagramKind::Class,
                      DiagramKind::UseCase, DiagramKind::Activity}) {
        registry.Register(
            DiagramToolName(kind), DiagramDescription(kind),
            DiagramToolSchema(kind),
            [&session, kind](const nlohmann::json& params) -> ToolResult {
                return HandleCreateDiagram(kind, params, session);
            });
    }

    for (auto type : AllowedElementTypes(DiagramKind::Sequence)) {
        registry.Register(
            LifelineToolName(type),
            LifelineDescription(type),
            LifelineToolSchema(),
            [&session, type](const nlohmann::json& params) -> ToolResult {
                return HandleCreateLifeline(type, params, session);
            });
    }
}

} // namespace ea_mcp
