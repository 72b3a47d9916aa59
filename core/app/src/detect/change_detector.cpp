#include "posmon/detect/change_detector.hpp"

#include <utility>

namespace posmon {

ChangeDetector::Observation ChangeDetector::observe(
    domain::NormalizedState state) {
  Observation result;

  if (!baseline_) {
    baseline_ = std::move(state);
    result.decision = Decision::Baseline;
    return result;
  }

  if (baseline_->comparison_key == state.comparison_key) {
    result.decision = Decision::Unchanged;
    return result;
  }

  result.decision = Decision::Changed;
  result.previous = std::exchange(*baseline_, std::move(state));
  return result;
}

}  // namespace posmon
