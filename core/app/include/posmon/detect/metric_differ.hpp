#pragma once

#include <optional>

namespace posmon {

// -----------------------------------------------------------------------------
// pnlDelta(previous, current)
// -----------------------------------------------------------------------------
// current - previous when both aggregates are known, otherwise std::nullopt.
// Never fabricates a value and never throws: "no delta available" is a normal
// outcome that sinks render as such.
// -----------------------------------------------------------------------------
std::optional<double> pnlDelta(std::optional<double> previous,
                               std::optional<double> current) noexcept;

}  // namespace posmon
