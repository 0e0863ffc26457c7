#pragma once

#include <ea_mcp/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ea_mcp {

// ---------------------------------------------------------------------------
// Guid — validated EA GUID.
//
// Rules:
//   - 32 hex digits grouped 8-4-4-4-12, separated by '-'
//   - Optionally wrapped in braces: {XXXXXXXX-XXXX-XXXX-XXXX-XXXXXXXXXXXX}
//   - Either case; the value is kept exactly as given
// ---------------------------------------------------------------------------
class Guid {
public:
    static Result<Guid, std::string> Create(std::string_view value);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    // Braced, upper-case form. Two GUIDs name the same object when their
    // canonical forms are equal.
    [[nodiscard]] std::string Canonical() const;

    bool operator==(const Guid& other) const { return Canonical() == other.Canonical(); }
    bool operator!=(const Guid& other) const { return !(*this == other); }

    Guid(const Guid&) = default;
    Guid& operator=(const Guid&) = default;
    Guid(Guid&&) noexcept = default;
    Guid& operator=(Guid&&) noexcept = default;

private:
    explicit Guid(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// DiagramKind — the four diagram kinds the builders can create.
// ---------------------------------------------------------------------------
enum class DiagramKind {
    Sequence,
    Class,
    UseCase,
    Activity,
};

// EA diagram type string ("Sequence", "Class", "UseCase", "Activity").
[[nodiscard]] std::string_view DiagramTypeName(DiagramKind kind);

// Inverse of DiagramTypeName; exact match.
[[nodiscard]] std::optional<DiagramKind> ParseDiagramType(std::string_view name);

// ---------------------------------------------------------------------------
// ElementType — the fixed element vocabulary accepted from tool callers.
// ---------------------------------------------------------------------------
enum class ElementType {
    Actor,
    Boundary,
    Control,
    Entity,
    Database,
    UseCase,
    Class,
    Activity,
    Decision,
};

[[nodiscard]] std::string_view ElementTypeName(ElementType type);

// Exact, case-sensitive match against the vocabulary.
[[nodiscard]] std::optional<ElementType> ParseElementType(std::string_view name);

// Element types valid on a diagram of the given kind, in vocabulary order.
[[nodiscard]] const std::vector<ElementType>& AllowedElementTypes(DiagramKind kind);

[[nodiscard]] bool IsAllowedOn(DiagramKind kind, ElementType type);

[[nodiscard]] bool IsLifelineType(ElementType type);

// Lower-case stereotype EA uses for a lifeline of this type
// ("actor", "boundary", ..., "use_case"). Empty for non-lifeline types.
[[nodiscard]] std::string LifelineStereotype(ElementType type);

// ---------------------------------------------------------------------------
// FeatureKind — class features attachable to an element.
// ---------------------------------------------------------------------------
enum class FeatureKind {
    Attribute,
    Method,
};

[[nodiscard]] std::string_view FeatureKindName(FeatureKind kind);

// ---------------------------------------------------------------------------
// Position — top-left corner of a diagram object, in diagram units.
// ---------------------------------------------------------------------------
struct Position {
    int left = 0;
    int top = 0;

    bool operator==(const Position& other) const {
        return left == other.left && top == other.top;
    }
    bool operator!=(const Position& other) const { return !(*this == other); }
};

} // namespace ea_mcp
