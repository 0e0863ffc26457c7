#include <ea_mcp/core/types.hpp>

#include <algorithm>
#include <array>
#include <cctype>

namespace ea_mcp {

namespace {

bool IsHexDigit(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') ||
           (c >= 'A' && c <= 'F');
}

// Checks the 8-4-4-4-12 grouping of an unbraced GUID body.
bool IsGuidBody(std::string_view body) {
    constexpr std::array<size_t, 5> kGroups = {8, 4, 4, 4, 12};
    size_t pos = 0;
    for (size_t g = 0; g < kGroups.size(); ++g) {
        if (g > 0) {
            if (pos >= body.size() || body[pos] != '-') return false;
            ++pos;
        }
        for (size_t i = 0; i < kGroups[g]; ++i, ++pos) {
            if (pos >= body.size() || !IsHexDigit(body[pos])) return false;
        }
    }
    return pos == body.size();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Guid
// ---------------------------------------------------------------------------
Result<Guid, std::string> Guid::Create(std::string_view value) {
    if (value.empty()) {
        return Result<Guid, std::string>::Err("GUID must not be empty");
    }

    auto body = value;
    if (body.front() == '{' || body.back() == '}') {
        if (body.size() < 2 || body.front() != '{' || body.back() != '}') {
            return Result<Guid, std::string>::Err(
                "GUID braces must enclose the whole value");
        }
        body = body.substr(1, body.size() - 2);
    }

    if (!IsGuidBody(body)) {
        return Result<Guid, std::string>::Err(
            "GUID must have the form XXXXXXXX-XXXX-XXXX-XXXX-XXXXXXXXXXXX "
            "(hex digits, optional braces)");
    }

    return Result<Guid, std::string>::Ok(Guid(std::string(value)));
}

std::string Guid::Canonical() const {
    std::string canonical;
    canonical.reserve(38);
    if (value_.front() != '{') canonical += '{';
    for (char c : value_) {
        canonical += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (value_.back() != '}') canonical += '}';
    return canonical;
}

// ---------------------------------------------------------------------------
// DiagramKind
// ---------------------------------------------------------------------------
std::string_view DiagramTypeName(DiagramKind kind) {
    switch (kind) {
        case DiagramKind::Sequence: return "Sequence";
        case DiagramKind::Class:    return "Class";
        case DiagramKind::UseCase:  return "UseCase";
        case DiagramKind::Activity: return "Activity";
    }
    return "Class";
}

std::optional<DiagramKind> ParseDiagramType(std::string_view name) {
    for (auto kind : {DiagramKind::Sequence, DiagramKind::Class,
                      DiagramKind::UseCase, DiagramKind::Activity}) {
        if (DiagramTypeName(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// ElementType
// ---------------------------------------------------------------------------
std::string_view ElementTypeName(ElementType type) {
    switch (type) {
        case ElementType::Actor:    return "Actor";
        case ElementType::Boundary: return "Boundary";
        case ElementType::Control:  return "Control";
        case ElementType::Entity:   return "Entity";
        case ElementType::Database: return "Database";
        case ElementType::UseCase:  return "UseCase";
        case ElementType::Class:    return "Class";
        case ElementType::Activity: return "Activity";
        case ElementType::Decision: return "Decision";
    }
    return "";
}

std::optional<ElementType> ParseElementType(std::string_view name) {
    static const std::array<ElementType, 9> kAll = {
        ElementType::Actor,   ElementType::Boundary, ElementType::Control,
        ElementType::Entity,  ElementType::Database, ElementType::UseCase,
        ElementType::Class,   ElementType::Activity, ElementType::Decision,
    };
    for (auto type : kAll) {
        if (ElementTypeName(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

const std::vector<ElementType>& AllowedElementTypes(DiagramKind kind) {
    static const std::vector<ElementType> kSequence = {
        ElementType::Actor,  ElementType::Boundary, ElementType::Control,
        ElementType::Entity, ElementType::Database, ElementType::UseCase,
    };
    static const std::vector<ElementType> kClass = {ElementType::Class};
    static const std::vector<ElementType> kUseCase = {
        ElementType::Actor, ElementType::UseCase,
    };
    static const std::vector<ElementType> kActivity = {
        ElementType::Activity, ElementType::Decision,
    };

    switch (kind) {
        case DiagramKind::Sequence: return kSequence;
        case DiagramKind::Class:    return kClass;
        case DiagramKind::UseCase:  return kUseCase;
        case DiagramKind::Activity: return kActivity;
    }
    return kClass;
}

bool IsAllowedOn(DiagramKind kind, ElementType type) {
    const auto& allowed = AllowedElementTypes(kind);
    return std::find(allowed.begin(), allowed.end(), type) != allowed.end();
}

bool IsLifelineType(ElementType type) {
    return IsAllowedOn(DiagramKind::Sequence, type);
}

std::string LifelineStereotype(ElementType type) {
    switch (type) {
        case ElementType::Actor:    return "actor";
        case ElementType::Boundary: return "boundary";
        case ElementType::Control:  return "control";
        case ElementType::Entity:   return "entity";
        case ElementType::Database: return "database";
        case ElementType::UseCase:  return "use_case";
        default:                    return "";
    }
}

// ---------------------------------------------------------------------------
// FeatureKind
// ---------------------------------------------------------------------------
std::string_view FeatureKindName(FeatureKind kind) {
    switch (kind) {
        case FeatureKind::Attribute: return "attribute";
        case FeatureKind::Method:    return "method";
    }
    return "attribute";
}

} // namespace ea_mcp
