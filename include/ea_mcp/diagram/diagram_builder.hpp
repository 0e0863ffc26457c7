#pragma once

#include <ea_mcp/core/result.hpp>
#include <ea_mcp/diagram/diagram_request.hpp>
#include <ea_mcp/diagram/layout.hpp>
#include <ea_mcp/ea/i_ea_session.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace ea_mcp {

// ---------------------------------------------------------------------------
// CreatedElement — an element placed by a builder, with the features that
// were attached to it (classes only).
// ---------------------------------------------------------------------------
struct CreatedElement {
    ElementInfo element;
    ElementType type = ElementType::Class;
    std::vector<FeatureInfo> attributes;
    std::vector<FeatureInfo> methods;
};

// ---------------------------------------------------------------------------
// DiagramOutcome — the diagram and its elements, in creation order.
// ---------------------------------------------------------------------------
struct DiagramOutcome {
    DiagramInfo diagram;
    std::vector<CreatedElement> elements;
};

// ---------------------------------------------------------------------------
// BuildFailure — why a build stopped, and what it left in the repository.
//
// `partial` is empty when the diagram itself could not be created. Otherwise
// it holds the diagram and exactly the elements created before the failure;
// nothing is rolled back.
// ---------------------------------------------------------------------------
struct BuildFailure {
    Error error;
    std::optional<DiagramOutcome> partial;
};

// ---------------------------------------------------------------------------
// IDiagramBuilder — turns a validated request into repository calls.
//
// Elements are created in request order; the order also fixes each element's
// default position (see DefaultPosition), so it is observable in the model.
// A successful build ends with IEaSession::LayoutDiagram; the positions in
// the outcome are the ones the layout reported.
// ---------------------------------------------------------------------------
class IDiagramBuilder {
public:
    virtual ~IDiagramBuilder() = default;

    [[nodiscard]] virtual DiagramKind Kind() const noexcept = 0;

    [[nodiscard]] virtual Result<DiagramOutcome, BuildFailure> Build(
        const DiagramRequest& request, IEaSession& session) const = 0;
};

// One lifeline per element, in order.
class SequenceDiagramBuilder final : public IDiagramBuilder {
public:
    [[nodiscard]] DiagramKind Kind() const noexcept override {
        return DiagramKind::Sequence;
    }
    [[nodiscard]] Result<DiagramOutcome, BuildFailure> Build(
        const DiagramRequest& request, IEaSession& session) const override;
};

// One class per entry; its attributes then its methods are attached before
// the next class is created.
class ClassDiagramBuilder final : public IDiagramBuilder {
public:
    [[nodiscard]] DiagramKind Kind() const noexcept override {
        return DiagramKind::Class;
    }
    [[nodiscard]] Result<DiagramOutcome, BuildFailure> Build(
        const DiagramRequest& request, IEaSession& session) const override;
};

// Actors, then use cases. No connectors.
class UseCaseDiagramBuilder final : public IDiagramBuilder {
public:
    [[nodiscard]] DiagramKind Kind() const noexcept override {
        return DiagramKind::UseCase;
    }
    [[nodiscard]] Result<DiagramOutcome, BuildFailure> Build(
        const DiagramRequest& request, IEaSession& session) const override;
};

// Activities, then decisions. No control flows.
class ActivityDiagramBuilder final : public IDiagramBuilder {
public:
    [[nodiscard]] DiagramKind Kind() const noexcept override {
        return DiagramKind::Activity;
    }
    [[nodiscard]] Result<DiagramOutcome, BuildFailure> Build(
        const DiagramRequest& request, IEaSession& session) const override;
};

[[nodiscard]] std::unique_ptr<IDiagramBuilder> MakeDiagramBuilder(DiagramKind kind);

// Places a single lifeline on an existing diagram, then lays the diagram out
// again so the new lifeline lands to the right of the existing ones.
[[nodiscard]] Result<CreatedElement, Error> CreateLifeline(
    const LifelineRequest& request, IEaSession& session);

} // namespace ea_mcp
