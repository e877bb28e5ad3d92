#include "spawnwatch/visit_throttle.hpp"

#include <algorithm>

namespace spawnwatch {

void VisitThrottle::engage(TimePoint until) {
    std::scoped_lock lock(mutex_);
    until_ = until_.has_value() ? std::max(*until_, until) : until;
}

bool VisitThrottle::active(TimePoint now) const {
    std::scoped_lock lock(mutex_);
    return until_.has_value() && now < *until_;
}

std::optional<TimePoint> VisitThrottle::until() const {
    std::scoped_lock lock(mutex_);
    return until_;
}

}  // namespace spawnwatch
