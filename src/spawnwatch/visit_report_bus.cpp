#include "spawnwatch/visit_report_bus.hpp"

namespace spawnwatch {

void VisitReportBus::publish(const VisitReport& report) {
    std::scoped_lock lock(mutex_);
    queue_reports_.push(report);
}

std::optional<VisitReport> VisitReportBus::try_consume() {
    std::scoped_lock lock(mutex_);
    if (queue_reports_.empty()) {
        return std::nullopt;
    }
    VisitReport report = std::move(queue_reports_.front());
    queue_reports_.pop();
    return report;
}

}  // namespace spawnwatch
