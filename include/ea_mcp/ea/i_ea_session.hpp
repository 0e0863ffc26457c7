#pragma once

#include <ea_mcp/core/result.hpp>
#include <ea_mcp/core/types.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace ea_mcp {

// ---------------------------------------------------------------------------
// DiagramInfo — a diagram created in the repository.
// ---------------------------------------------------------------------------
struct DiagramInfo {
    std::string guid;
    std::string name;
    std::string type;
};

// ---------------------------------------------------------------------------
// NewElement — what a builder asks the session to place on a diagram.
// `type` is the EA element type string ("Object", "Class", "Actor", ...).
// ---------------------------------------------------------------------------
struct NewElement {
    std::string name;
    std::string type;
    std::string stereotype;
    Position position;
};

// ---------------------------------------------------------------------------
// ElementInfo — an element created on a diagram.
// ---------------------------------------------------------------------------
struct ElementInfo {
    std::string guid;
    std::string name;
    std::string type;
    std::string stereotype;
    Position position;
};

// ---------------------------------------------------------------------------
// FeatureInfo — an attribute or method attached to an element.
// ---------------------------------------------------------------------------
struct FeatureInfo {
    std::string guid;
    std::string name;
    FeatureKind kind = FeatureKind::Attribute;
};

// ---------------------------------------------------------------------------
// IEaSession — abstract handle to an open EA repository.
//
// The builders depend on this interface only; it hides how the repository is
// reached and kept alive. The handle is long-lived and borrowed by each tool
// call; it is used by one caller at a time.
//
// Methods return Result<T, Error> and never throw on expected failures:
//   - ErrorKind::NotFound      the package / diagram / element GUID is unknown
//   - ErrorKind::EaConnection  the repository is unavailable or unwritable
// ---------------------------------------------------------------------------
class IEaSession {
public:
    virtual ~IEaSession() = default;

    // Non-copyable, non-movable (polymorphic base).
    IEaSession(const IEaSession&) = delete;
    IEaSession& operator=(const IEaSession&) = delete;
    IEaSession(IEaSession&&) = delete;
    IEaSession& operator=(IEaSession&&) = delete;

    [[nodiscard]] virtual Result<DiagramInfo, Error> CreateDiagram(
        const Guid& package_guid,
        std::string_view name,
        DiagramKind kind) = 0;

    [[nodiscard]] virtual Result<ElementInfo, Error> AddElement(
        const Guid& diagram_guid,
        const NewElement& element) = 0;

    [[nodiscard]] virtual Result<FeatureInfo, Error> AttachFeature(
        const Guid& element_guid,
        FeatureKind kind,
        std::string_view name) = 0;

    // Re-spaces every element on the diagram on the default grid and returns
    // them, in diagram order, with their new positions.
    [[nodiscard]] virtual Result<std::vector<ElementInfo>, Error> LayoutDiagram(
        const Guid& diagram_guid) = 0;

protected:
    IEaSession() = default;
};

} // namespace ea_mcp
