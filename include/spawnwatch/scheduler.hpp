// === Scheduler ===============================================================
//
// Dispatch pass that matches idle workers to due spawn points under the
// per-worker speed limit. Targets are taken earliest deadline first; each goes
// to the eligible idle worker needing the lowest travel speed. Targets nobody
// can reach in time are deferred, targets already covered by a nearby visit
// are suppressed, and leftover idle workers get exploration work.

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "spawnwatch/account_manager.hpp"
#include "spawnwatch/logging.hpp"
#include "spawnwatch/spawn_catalog.hpp"
#include "spawnwatch/visit_throttle.hpp"
#include "spawnwatch/worker_pool.hpp"

namespace spawnwatch {

/**
 * @brief Dispatch tunables.
 *
 * The suppression pair decides when a pending visit already covers a target:
 * it must lie within suppression_radius_m and run no later than the target's
 * deadline nor more than suppression_slack before its window opens.
 */
struct SchedulerConfig final {
    RegionBounds region{};
    Duration scan_horizon{Duration{60.0}};
    Duration visit_delay{Duration{1.0}};           /**< Wait after a window opens before scanning. */
    Duration exploration_deadline{Duration{60.0}};
    double suppression_radius_m{70.0};
    Duration suppression_slack{Duration{30.0}};
    std::size_t max_pending_challenges{0};         /**< Pause dispatch above this many; 0 disables. */
    std::size_t exploration_candidates{512};
    Duration min_time_to_deadline{Duration{0.001}}; /**< Floor of the required-speed denominator. */
};

/** @brief Counters describing one dispatch pass. */
struct SchedulePassResult final {
    std::size_t assigned_due{};
    std::size_t assigned_exploration{};
    std::size_t deferred{};
    std::size_t dropped_expired{};
    std::size_t suppressed{};
    bool skipped_throttled{};
    bool skipped_challenges{};
};

/** @brief Travel speed needed to reach @p target from @p from by @p deadline. */
[[nodiscard]] double required_speed_mps(const GeodeticCoordinate& from,
                                        const GeodeticCoordinate& target,
                                        TimePoint now,
                                        TimePoint deadline,
                                        Duration min_time_to_deadline);

class Scheduler final {
  public:
    Scheduler(SchedulerConfig config,
              SpawnCatalog& catalog,
              WorkerPool& worker_pool,
              AccountManager& account_manager,
              VisitThrottle& throttle);

    [[nodiscard]] const SchedulerConfig& config() const noexcept;

    /** @brief Run one dispatch pass at @p now. */
    SchedulePassResult run_pass(TimePoint now);

  private:
    /**
     * @brief A dispatched visit remembered for suppression.
     *
     * A record covers targets only while its task is still pending in the
     * worker pool or after the visit reached the catalog (settled). Records
     * whose visit was abandoned are forgotten so the target can be handed out
     * again within the same window.
     */
    struct DispatchRecord final {
        std::uint64_t task_id;
        TargetKind kind;
        std::string target_id;
        GeodeticCoordinate position;
        TimePoint dispatched_at;
        TimePoint scheduled_time;
        TimePoint deadline;
        bool settled;
    };

    void assign_exploration(std::vector<WorkerState>& list_idle, TimePoint now, SchedulePassResult& result);
    bool dispatch(const WorkerState& worker, VisitTask task, TimePoint now);
    void prune_dispatches(TimePoint now);
    /** @brief Settle records whose visit landed; forget others no longer pending. */
    void refresh_dispatches();

    SchedulerConfig config_;
    SpawnCatalog& catalog_;
    WorkerPool& worker_pool_;
    AccountManager& account_manager_;
    VisitThrottle& throttle_;
    std::mutex pass_mutex_;
    std::vector<DispatchRecord> list_dispatches_;
    std::atomic<std::uint64_t> next_task_id_{1};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace spawnwatch
