#include "spawnwatch/fleet_monitor.hpp"

#include <stdexcept>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace spawnwatch {

FleetMonitor::FleetMonitor(Duration silence_threshold)
    : silence_threshold_(silence_threshold),
      logger_(get_logger()) {
    if (silence_threshold_.count() <= 0.0) {
        throw std::invalid_argument("FleetMonitor silence threshold must be positive");
    }
}

void FleetMonitor::ingest_report(const VisitReport& report) {
    std::scoped_lock lock(mutex_);
    if (!first_activity_.has_value() || report.timestamp < *first_activity_) {
        first_activity_ = report.timestamp;
    }
    ++map_outcomes_[report.outcome];
    if (report.outcome == "visited") {
        ++visits_;
        sightings_ += report.sightings;
        discovered_ += report.discovered;
    }
    map_latest_reports_[report.worker_id] = report;
}

void FleetMonitor::record_pass(const SchedulePassResult& result) {
    std::scoped_lock lock(mutex_);
    ++passes_;
    if (result.skipped_throttled || result.skipped_challenges) {
        ++skipped_passes_;
    }
    deferred_ += result.deferred;
    suppressed_ += result.suppressed;
    dropped_expired_ += result.dropped_expired;
}

std::optional<VisitReport> FleetMonitor::latest_report_for(const std::string& worker_id) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_report = map_latest_reports_.find(worker_id);
    if (iterator_report == map_latest_reports_.end()) {
        return std::nullopt;
    }
    return iterator_report->second;
}

FleetHealthSummary FleetMonitor::summary(TimePoint now,
                                         const std::vector<WorkerState>& workers,
                                         const AccountCounts& accounts,
                                         const CatalogCounts& catalog) const {
    std::scoped_lock lock(mutex_);
    FleetHealthSummary fleet_summary{};
    fleet_summary.visits = visits_;
    fleet_summary.sightings = sightings_;
    fleet_summary.discovered = discovered_;
    fleet_summary.map_outcomes = map_outcomes_;
    fleet_summary.passes = passes_;
    fleet_summary.skipped_passes = skipped_passes_;
    fleet_summary.deferred = deferred_;
    fleet_summary.suppressed = suppressed_;
    fleet_summary.dropped_expired = dropped_expired_;
    fleet_summary.accounts = accounts;
    fleet_summary.catalog = catalog;

    const auto threshold = to_clock_duration(silence_threshold_);
    for (const WorkerState& state : workers) {
        ++fleet_summary.map_worker_status[state.status];
        if (state.status == WorkerStatus::Retired || !first_activity_.has_value()) {
            continue;
        }
        const auto iterator_report = map_latest_reports_.find(state.identifier);
        const TimePoint last_heard = iterator_report == map_latest_reports_.end()
            ? *first_activity_
            : iterator_report->second.timestamp;
        if (now - last_heard > threshold) {
            fleet_summary.list_silent_workers.push_back(state.identifier);
        }
    }
    return fleet_summary;
}

void FleetMonitor::log_summary(const FleetHealthSummary& fleet_summary) const {
    const auto status_count = [&fleet_summary](WorkerStatus status) -> std::size_t {
        const auto iterator_status = fleet_summary.map_worker_status.find(status);
        return iterator_status == fleet_summary.map_worker_status.end() ? 0 : iterator_status->second;
    };

    logger_->info(
        R"({{"component":"monitor","visits":{},"sightings":{},"discovered":{},"passes":{},"skipped":{},"deferred":{},"suppressed":{},"dropped":{},)"
        R"("workers":{{"idle":{},"traveling":{},"visiting":{},"recovering":{},"retired":{}}},)"
        R"("accounts":{{"healthy":{},"cooldown":{},"captcha":{},"banned":{}}},)"
        R"("catalog":{{"none":{},"estimated":{},"confirmed":{},"stale":{}}}}})",
        fleet_summary.visits,
        fleet_summary.sightings,
        fleet_summary.discovered,
        fleet_summary.passes,
        fleet_summary.skipped_passes,
        fleet_summary.deferred,
        fleet_summary.suppressed,
        fleet_summary.dropped_expired,
        status_count(WorkerStatus::Idle),
        status_count(WorkerStatus::Traveling),
        status_count(WorkerStatus::Visiting),
        status_count(WorkerStatus::Recovering),
        status_count(WorkerStatus::Retired),
        fleet_summary.accounts.healthy,
        fleet_summary.accounts.cooldown,
        fleet_summary.accounts.captcha_pending,
        fleet_summary.accounts.banned,
        fleet_summary.catalog.none,
        fleet_summary.catalog.estimated,
        fleet_summary.catalog.confirmed,
        fleet_summary.catalog.stale
    );
    if (!fleet_summary.list_silent_workers.empty()) {
        logger_->warn("Workers without a report for {:.0f}s: {}",
                      silence_threshold_.count(),
                      fmt::join(fleet_summary.list_silent_workers, ", "));
    }
}

}  // namespace spawnwatch
