// === Tracker Runtime =========================================================
//
// Coordinates initialization and the worker, scheduler and monitor threads of
// the tracker. Responsible for wiring configuration, collaborators, the spawn
// catalog, account manager, worker pool, executor, scheduler and recovery
// controller together.
//
// Threads
// - One worker thread per slot: waits for a task, holds until its scheduled
//   time (and any throttle), runs the visit, hands the outcome to recovery.
// - Scheduler thread: recovery poll, account rotation, staleness sweep and a
//   dispatch pass on a fixed interval, or sooner when a worker frees up. All
//   assignments and restarts of idle workers happen on this thread.
// - Monitor thread: drains visit reports and logs the fleet summary.

#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "spawnwatch/account_manager.hpp"
#include "spawnwatch/collaborators.hpp"
#include "spawnwatch/configuration.hpp"
#include "spawnwatch/failure_recovery.hpp"
#include "spawnwatch/fleet_monitor.hpp"
#include "spawnwatch/logging.hpp"
#include "spawnwatch/scheduler.hpp"
#include "spawnwatch/spawn_catalog.hpp"
#include "spawnwatch/visit_executor.hpp"
#include "spawnwatch/visit_report_bus.hpp"
#include "spawnwatch/visit_throttle.hpp"
#include "spawnwatch/worker_pool.hpp"

namespace spawnwatch {

/** @brief External systems the runtime talks to. */
struct TrackerCollaborators final {
    ScanClientPtr client{};
    HashingQuotaClientPtr quota{};
    SpawnStorePtr store{};
    /** @brief Challenge-resolution hook polled from the scheduler thread; may be empty. */
    std::function<void(AccountManager&, TimePoint)> challenge_solver{};
};

/** @brief High-level orchestrator managing worker, scheduler and monitor threads. */
class TrackerRuntime final {
  public:
    TrackerRuntime(Configuration configuration, TrackerCollaborators collaborators);
    ~TrackerRuntime();

    TrackerRuntime(const TrackerRuntime&) = delete;
    TrackerRuntime& operator=(const TrackerRuntime&) = delete;

    /** @brief Seed the catalog from the store and start the fleet. */
    void initialize();
    /** @brief Start background threads. */
    void run();
    /** @brief Stop threads and wait for them. */
    void shutdown();

    /** @brief Ask the scheduler for an early pass. */
    void wake_scheduler();

    [[nodiscard]] const SpawnCatalog& catalog() const noexcept;
    [[nodiscard]] const WorkerPool& worker_pool() const noexcept;
    [[nodiscard]] const AccountManager& account_manager() const noexcept;

  private:
    void worker_loop(const std::string& worker_id);
    void scheduler_loop();
    void monitor_loop();
    /** @brief Hold until @p task may start; false when the runtime is stopping. */
    bool wait_until_ready(const VisitTask& task);
    void drain_reports();

    Configuration configuration_;
    TrackerCollaborators collaborators_;
    SpawnCatalog catalog_;
    AccountManager account_manager_;
    WorkerPool worker_pool_;
    VisitThrottle throttle_;
    VisitExecutor executor_;
    Scheduler scheduler_;
    FailureRecoveryController recovery_;
    VisitReportBus report_bus_;
    FleetMonitor monitor_;
    std::atomic<bool> flag_running_{false};
    std::mutex mutex_signal_;
    std::condition_variable cv_signal_;
    bool flag_wake_pending_{false};
    std::vector<std::thread> list_worker_threads_;
    std::thread scheduler_thread_;
    std::thread monitor_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace spawnwatch
