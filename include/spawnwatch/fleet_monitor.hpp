// === Fleet Monitor ===========================================================
//
// Aggregates visit reports and scheduler pass counters into a periodic
// fleet-health summary. Flags workers that have gone silent, the way an
// observer flags stale telemetry, and logs the summary as a structured line.

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "spawnwatch/account_manager.hpp"
#include "spawnwatch/logging.hpp"
#include "spawnwatch/scheduler.hpp"
#include "spawnwatch/spawn_catalog.hpp"
#include "spawnwatch/visit_report_bus.hpp"
#include "spawnwatch/worker_pool.hpp"

namespace spawnwatch {

/** @brief Aggregated fleet health as of one instant. */
struct FleetHealthSummary final {
    std::size_t visits{};
    std::size_t sightings{};
    std::size_t discovered{};
    std::map<std::string, std::size_t> map_outcomes{};  /**< Report count per outcome label. */
    std::size_t passes{};
    std::size_t skipped_passes{};
    std::size_t deferred{};
    std::size_t suppressed{};
    std::size_t dropped_expired{};
    std::map<WorkerStatus, std::size_t> map_worker_status{};
    std::vector<std::string> list_silent_workers{};      /**< Active workers with no recent report. */
    AccountCounts accounts{};
    CatalogCounts catalog{};
};

class FleetMonitor final {
  public:
    /** @param silence_threshold Time without a report after which an active worker is flagged. */
    explicit FleetMonitor(Duration silence_threshold);

    /** @brief Consume a report from the bus. */
    void ingest_report(const VisitReport& report);
    /** @brief Fold one scheduler pass into the counters. */
    void record_pass(const SchedulePassResult& result);
    /** @brief Most recent report seen for @p worker_id. */
    [[nodiscard]] std::optional<VisitReport> latest_report_for(const std::string& worker_id) const;

    /** @brief Summarize fleet health as of @p now. */
    [[nodiscard]] FleetHealthSummary summary(TimePoint now,
                                             const std::vector<WorkerState>& workers,
                                             const AccountCounts& accounts,
                                             const CatalogCounts& catalog) const;
    /** @brief Emit @p fleet_summary through the shared logger. */
    void log_summary(const FleetHealthSummary& fleet_summary) const;

  private:
    Duration silence_threshold_;
    std::optional<TimePoint> first_activity_;
    mutable std::mutex mutex_;
    std::size_t visits_{};
    std::size_t sightings_{};
    std::size_t discovered_{};
    std::map<std::string, std::size_t> map_outcomes_;
    std::size_t passes_{};
    std::size_t skipped_passes_{};
    std::size_t deferred_{};
    std::size_t suppressed_{};
    std::size_t dropped_expired_{};
    std::unordered_map<std::string, VisitReport> map_latest_reports_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace spawnwatch
