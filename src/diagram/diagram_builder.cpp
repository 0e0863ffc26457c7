#include <ea_mcp/diagram/diagram_builder.hpp>

#include <ea_mcp/core/log.hpp>
#include <ea_mcp/diagram/validation.hpp>

#include <string>
#include <utility>

namespace ea_mcp {

namespace {

using BuildResult = Result<DiagramOutcome, BuildFailure>;

BuildResult Fail(Error error, std::optional<DiagramOutcome> partial) {
    if (partial.has_value()) {
        LogWarn("builder", error.operation + ": stopped after " +
                               std::to_string(partial->elements.size()) +
                               " element(s): " + error.message);
    } else {
        LogWarn("builder", error.ToString());
    }
    return BuildResult::Err(BuildFailure{std::move(error), std::move(partial)});
}

// EA represents every sequence participant as an "Object" carrying the
// lifeline stereotype; the other vocabulary entries map to EA types of the
// same name.
NewElement ToNewElement(const ElementSpec& spec, Position position) {
    NewElement element;
    element.name = spec.name;
    element.position = position;
    if (IsLifelineType(spec.type)) {
        element.type = "Object";
        element.stereotype = LifelineStereotype(spec.type);
    } else {
        element.type = std::string(ElementTypeName(spec.type));
    }
    if (spec.stereotype.has_value() && !spec.stereotype->empty()) {
        element.stereotype = *spec.stereotype;
    }
    return element;
}

ElementSpec NamedSpec(const std::string& name, ElementType type) {
    ElementSpec spec;
    spec.name = name;
    spec.type = type;
    return spec;
}

// Creates the diagram. Connection errors pass through unchanged; any other
// repository refusal becomes DiagramCreationFailed.
BuildResult StartDiagram(const DiagramRequest& request, DiagramKind kind,
                         IEaSession& session) {
    const std::string op = DiagramToolName(kind);
    if (request.kind != kind) {
        return Fail(Error::Internal(op, "request is for a " +
                                            std::string(DiagramTypeName(request.kind)) +
                                            " diagram"),
                    std::nullopt);
    }

    LogInfo("builder", "Creating " + std::string(DiagramTypeName(kind)) +
                           " diagram '" + request.name + "' in " +
                           request.package_guid.Value());
    auto created = session.CreateDiagram(request.package_guid, request.name, kind);
    if (created.IsErr()) {
        const auto& err = created.Error();
        if (err.kind == ErrorKind::EaConnection) {
            return Fail(err, std::nullopt);
        }
        return Fail(Error::DiagramCreationFailed(op, err.message), std::nullopt);
    }

    DiagramOutcome outcome;
    outcome.diagram = std::move(created).Value();
    return BuildResult::Ok(std::move(outcome));
}

Result<void, Error> AttachFeatures(IEaSession& session, const std::string& op,
                                   const std::string& field, std::size_t index,
                                   const ElementSpec& spec,
                                   CreatedElement& created) {
    auto element_guid = Guid::Create(created.element.guid);
    if (element_guid.IsErr()) {
        return Result<void, Error>::Err(Error::ElementCreationFailed(
            op, field, index,
            "repository returned an invalid element GUID '" +
                created.element.guid + "'"));
    }

    auto attach = [&](FeatureKind kind, const std::vector<std::string>& names,
                      std::vector<FeatureInfo>& out) -> Result<void, Error> {
        for (const auto& name : names) {
            auto feature = session.AttachFeature(element_guid.Value(), kind, name);
            if (feature.IsErr()) {
                return Result<void, Error>::Err(Error::ElementCreationFailed(
                    op, field, index,
                    std::string(FeatureKindName(kind)) + " '" + name +
                        "': " + feature.Error().message));
            }
            out.push_back(std::move(feature).Value());
        }
        return Result<void, Error>::Ok();
    };

    auto attributes = attach(FeatureKind::Attribute, spec.attributes, created.attributes);
    if (attributes.IsErr()) {
        return attributes;
    }
    return attach(FeatureKind::Method, spec.methods, created.methods);
}

// Places one element and appends it to the outcome. Features are attached
// only when `with_features` is set; a failed feature still leaves the
// element in the outcome since it exists in the repository.
Result<void, Error> PlaceElement(IEaSession& session, DiagramOutcome& outcome,
                                 const Guid& diagram_guid, const std::string& op,
                                 const std::string& field, std::size_t index,
                                 const ElementSpec& spec, Position position,
                                 bool with_features) {
    LogDebug("builder", "Adding " + std::string(ElementTypeName(spec.type)) +
                            " '" + spec.name + "' at (" +
                            std::to_string(position.left) + ", " +
                            std::to_string(position.top) + ")");
    auto added = session.AddElement(diagram_guid, ToNewElement(spec, position));
    if (added.IsErr()) {
        return Result<void, Error>::Err(
            Error::ElementCreationFailed(op, field, index, added.Error().message));
    }

    CreatedElement created;
    created.element = std::move(added).Value();
    created.type = spec.type;
    outcome.elements.push_back(std::move(created));

    if (!with_features) {
        return Result<void, Error>::Ok();
    }
    return AttachFeatures(session, op, field, index, spec, outcome.elements.back());
}

Result<Guid, Error> DiagramGuidOf(const DiagramOutcome& outcome,
                                  const std::string& op) {
    auto guid = Guid::Create(outcome.diagram.guid);
    if (guid.IsErr()) {
        return Result<Guid, Error>::Err(Error::DiagramCreationFailed(
            op, "repository returned an invalid diagram GUID '" +
                    outcome.diagram.guid + "'"));
    }
    return Result<Guid, Error>::Ok(std::move(guid).Value());
}

bool SameGuid(const std::string& a, const std::string& b) {
    auto ga = Guid::Create(a);
    auto gb = Guid::Create(b);
    if (ga.IsOk() && gb.IsOk()) {
        return ga.Value() == gb.Value();
    }
    return a == b;
}

// Lays the diagram out and copies the reported positions onto `elements`.
// The elements already exist, so a layout failure is logged and they keep
// the positions they were created at.
void ApplyLayout(IEaSession& session, const Guid& diagram_guid,
                 std::vector<CreatedElement>& elements) {
    auto laid_out = session.LayoutDiagram(diagram_guid);
    if (laid_out.IsErr()) {
        LogWarn("builder", "Layout of " + diagram_guid.Value() +
                               " skipped: " + laid_out.Error().message);
        return;
    }
    for (const auto& info : laid_out.Value()) {
        for (auto& created : elements) {
            if (SameGuid(created.element.guid, info.guid)) {
                created.element.position = info.position;
            }
        }
    }
}

// Shared driver: start the diagram, then place each (field, specs) group in
// order. `features` is honoured for the class diagram only.
struct ElementGroup {
    std::string field;
    std::vector<ElementSpec> specs;
};

BuildResult BuildGroups(const DiagramRequest& request, DiagramKind kind,
                        IEaSession& session, const std::vector<ElementGroup>& groups,
                        bool features) {
    auto started = StartDiagram(request, kind, session);
    if (started.IsErr()) {
        return started;
    }
    DiagramOutcome outcome = std::move(started).Value();
    const std::string op = DiagramToolName(kind);

    auto diagram_guid = DiagramGuidOf(outcome, op);
    if (diagram_guid.IsErr()) {
        return Fail(diagram_guid.Error(), std::move(outcome));
    }

    for (const auto& group : groups) {
        for (std::size_t i = 0; i < group.specs.size(); ++i) {
            const auto& spec = group.specs[i];
            auto placed = PlaceElement(session, outcome, diagram_guid.Value(), op,
                                       group.field, i, spec,
                                       DefaultPosition(kind, spec.type, i), features);
            if (placed.IsErr()) {
                return Fail(placed.Error(), std::move(outcome));
            }
        }
    }

    ApplyLayout(session, diagram_guid.Value(), outcome.elements);
    LogInfo("builder", "Created diagram " + outcome.diagram.guid + " with " +
                           std::to_string(outcome.elements.size()) + " element(s)");
    return BuildResult::Ok(std::move(outcome));
}

std::vector<ElementSpec> NamedSpecs(const std::vector<std::string>& names,
                                    ElementType type) {
    std::vector<ElementSpec> specs;
    specs.reserve(names.size());
    for (const auto& name : names) {
        specs.push_back(NamedSpec(name, type));
    }
    return specs;
}

template <typename Payload>
const Payload* PayloadOf(const DiagramRequest& request) {
    return std::get_if<Payload>(&request.payload);
}

BuildResult PayloadMismatch(DiagramKind kind) {
    return Fail(Error::Internal(DiagramToolName(kind),
                                "payload does not match diagram kind"),
                std::nullopt);
}

} // namespace

// ===========================================================================
// Builders
// ===========================================================================

Result<DiagramOutcome, BuildFailure> SequenceDiagramBuilder::Build(
    const DiagramRequest& request, IEaSession& session) const {
    const auto* payload = PayloadOf<SequencePayload>(request);
    if (payload == nullptr) {
        return PayloadMismatch(Kind());
    }
    return BuildGroups(request, Kind(), session, {{"elements", payload->elements}},
                       false);
}

Result<DiagramOutcome, BuildFailure> ClassDiagramBuilder::Build(
    const DiagramRequest& request, IEaSession& session) const {
    const auto* payload = PayloadOf<ClassPayload>(request);
    if (payload == nullptr) {
        return PayloadMismatch(Kind());
    }
    return BuildGroups(request, Kind(), session, {{"classes", payload->classes}},
                       true);
}

Result<DiagramOutcome, BuildFailure> UseCaseDiagramBuilder::Build(
    const DiagramRequest& request, IEaSession& session) const {
    const auto* payload = PayloadOf<UseCasePayload>(request);
    if (payload == nullptr) {
        return PayloadMismatch(Kind());
    }
    return BuildGroups(request, Kind(), session,
                       {{"actors", NamedSpecs(payload->actors, ElementType::Actor)},
                        {"use_cases",
                         NamedSpecs(payload->use_cases, ElementType::UseCase)}},
                       false);
}

Result<DiagramOutcome, BuildFailure> ActivityDiagramBuilder::Build(
    const DiagramRequest& request, IEaSession& session) const {
    const auto* payload = PayloadOf<ActivityPayload>(request);
    if (payload == nullptr) {
        return PayloadMismatch(Kind());
    }
    return BuildGroups(
        request, Kind(), session,
        {{"activities", NamedSpecs(payload->activities, ElementType::Activity)},
         {"decisions", NamedSpecs(payload->decisions, ElementType::Decision)}},
        false);
}

std::unique_ptr<IDiagramBuilder> MakeDiagramBuilder(DiagramKind kind) {
    switch (kind) {
        case DiagramKind::Sequence: return std::make_unique<SequenceDiagramBuilder>();
        case DiagramKind::Class:    return std::make_unique<ClassDiagramBuilder>();
        case DiagramKind::UseCase:  return std::make_unique<UseCaseDiagramBuilder>();
        case DiagramKind::Activity: return std::make_unique<ActivityDiagramBuilder>();
    }
    return nullptr;
}

// ===========================================================================
// CreateLifeline
// ===========================================================================

Result<CreatedElement, Error> CreateLifeline(const LifelineRequest& request,
                                             IEaSession& session) {
    const auto& spec = request.element;
    const std::string op = IsLifelineType(spec.type)
                               ? LifelineToolName(spec.type)
                               : std::string("create_lifeline");
    if (!IsLifelineType(spec.type)) {
        return Result<CreatedElement, Error>::Err(Error::Internal(
            op, std::string(ElementTypeName(spec.type)) + " is not a lifeline type"));
    }

    // Placed at the start of the row; the layout below moves it after the
    // lifelines already on the diagram.
    const Position position = DefaultPosition(DiagramKind::Sequence, spec.type, 0);
    LogInfo("builder", "Adding " + LifelineStereotype(spec.type) + " lifeline '" +
                           spec.name + "' to " + request.diagram_guid.Value());
    auto added = session.AddElement(request.diagram_guid, ToNewElement(spec, position));
    if (added.IsErr()) {
        const auto& err = added.Error();
        if (err.kind == ErrorKind::EaConnection) {
            return Result<CreatedElement, Error>::Err(err);
        }
        LogWarn("builder", op + ": " + err.message);
        return Result<CreatedElement, Error>::Err(
            Error::ElementCreationFailed(op, "name", 0, err.message));
    }

    std::vector<CreatedElement> created(1);
    created[0].element = std::move(added).Value();
    created[0].type = spec.type;
    ApplyLayout(session, request.diagram_guid, created);
    return Result<CreatedElement, Error>::Ok(std::move(created[0]));
}

} // namespace ea_mcp
