// === Visit Throttle ==========================================================
//
// Process-wide pause applied when the shared hashing quota runs dry. The
// scheduler skips passes and worker threads hold their scans while it is
// engaged.

#pragma once

#include <mutex>
#include <optional>

#include "spawnwatch/types.hpp"

namespace spawnwatch {

class VisitThrottle final {
  public:
    /** @brief Pause visits until @p until; an earlier deadline never shortens an active pause. */
    void engage(TimePoint until);
    [[nodiscard]] bool active(TimePoint now) const;
    /** @brief End of the current pause, if one was ever engaged. */
    [[nodiscard]] std::optional<TimePoint> until() const;

  private:
    mutable std::mutex mutex_;
    std::optional<TimePoint> until_;
};

}  // namespace spawnwatch
