#include <ea_mcp/diagram/layout.hpp>

namespace ea_mcp {

namespace {

std::size_t LaneOf(DiagramKind kind, ElementType type) {
    switch (kind) {
        case DiagramKind::UseCase:  return type == ElementType::Actor ? 0 : 1;
        case DiagramKind::Activity: return type == ElementType::Decision ? 1 : 0;
        default:                    return 0;
    }
}

} // namespace

Position DefaultPosition(DiagramKind kind, ElementType type, std::size_t index) {
    const int i = static_cast<int>(index);
    switch (kind) {
        case DiagramKind::Sequence:
            return Position{100 + 200 * i, 100};
        case DiagramKind::Class:
            return Position{100 + 300 * i, 100};
        case DiagramKind::UseCase:
            if (type == ElementType::Actor) {
                return Position{50, 100 + 150 * i};
            }
            return Position{300, 100 + 150 * i};
        case DiagramKind::Activity:
            if (type == ElementType::Decision) {
                return Position{100 + 200 * i, 200};
            }
            return Position{100 + 200 * i, 100};
    }
    return Position{};
}

std::vector<Position> GridPositions(DiagramKind kind,
                                    const std::vector<ElementType>& types) {
    std::size_t next[2] = {0, 0};
    std::vector<Position> positions;
    positions.reserve(types.size());
    for (auto type : types) {
        auto& index = next[LaneOf(kind, type)];
        positions.push_back(DefaultPosition(kind, type, index++));
    }
    return positions;
}

} // namespace ea_mcp
