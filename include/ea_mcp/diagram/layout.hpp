#pragma once

#include <ea_mcp/core/types.hpp>

#include <cstddef>
#include <vector>

namespace ea_mcp {

// Default position of the index-th element of `type` on a `kind` diagram:
//   sequence  x=100+200i y=100      class      x=100+300i y=100
//   actors    x=50 y=100+150i       use cases  x=300 y=100+150i
//   activity  x=100+200i y=100      decisions  x=100+200i y=200
[[nodiscard]] Position DefaultPosition(DiagramKind kind, ElementType type,
                                       std::size_t index);

// Positions for every element of a diagram, given in diagram order.
//
// Elements are numbered per lane and placed with DefaultPosition. Sequence
// and class diagrams have one lane; use case diagrams split actors from the
// rest; activity diagrams split decisions from the rest. A diagram built in
// one go therefore keeps the positions its builder assigned.
[[nodiscard]] std::vector<Position> GridPositions(DiagramKind kind,
                                                  const std::vector<ElementType>& types);

} // namespace ea_mcp
