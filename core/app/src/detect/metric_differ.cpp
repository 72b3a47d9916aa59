#include "posmon/detect/metric_differ.hpp"

namespace posmon {

std::optional<double> pnlDelta(std::optional<double> previous,
                               std::optional<double> current) noexcept {
  if (!previous || !current) {
    return std::nullopt;
  }
  return *current - *previous;
}

}  // namespace posmon
