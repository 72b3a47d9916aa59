#pragma once

#include "posmon/time/i_time_provider.hpp"

namespace posmon {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
// Used by main() for the running monitor. Stateless; system_clock::now() is
// safe to call from any thread, so no locking is needed.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace posmon
