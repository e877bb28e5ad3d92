#include "spawnwatch/tracker_runtime.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include "spawnwatch/visit_outcome.hpp"

namespace spawnwatch {

namespace {
constexpr Duration k_task_poll_interval{0.5};         /**< Worker wake-up cadence while idle. */
constexpr Duration k_report_drain_interval{1.0};      /**< Monitor drains the bus this often. */
constexpr Duration k_stale_sweep_interval{60.0};      /**< Catalog staleness sweep cadence. */
constexpr double k_silence_threshold_factor{10.0};    /**< Silence threshold relative to the monitor interval. */
}  // namespace

TrackerRuntime::TrackerRuntime(Configuration configuration, TrackerCollaborators collaborators)
    : configuration_(std::move(configuration)),
      collaborators_(std::move(collaborators)),
      catalog_(configuration_.catalog),
      account_manager_(configuration_.accounts),
      worker_pool_(configuration_.pool, account_manager_),
      throttle_(),
      executor_(configuration_.executor, collaborators_.client, catalog_, collaborators_.store),
      scheduler_(configuration_.scheduler, catalog_, worker_pool_, account_manager_, throttle_),
      recovery_(configuration_.recovery, worker_pool_, account_manager_, throttle_, collaborators_.quota),
      report_bus_(),
      monitor_(configuration_.monitor_interval * k_silence_threshold_factor),
      logger_(get_logger()) {}

TrackerRuntime::~TrackerRuntime() {
    shutdown();
}

/**
 * @brief Load persisted spawn points and bind accounts to the fleet.
 */
void TrackerRuntime::initialize() {
    logger_->info("Initializing tracker runtime");
    if (collaborators_.store != nullptr) {
        try {
            catalog_.load(collaborators_.store->load_spawn_points());
        } catch (const std::exception& exc) {
            logger_->warn("Starting with an empty catalog; store load failed: {}", exc.what());
        }
    }
    worker_pool_.start(grid_start_positions(configuration_.region, configuration_.pool.fleet_size), WallClock::now());
}

/**
 * @brief Start one thread per worker slot plus the scheduler and monitor threads.
 */
void TrackerRuntime::run() {
    if (flag_running_.exchange(true)) {
        return;
    }
    logger_->info("Starting tracker with {} workers", worker_pool_.size());
    for (const WorkerState& state : worker_pool_.snapshot()) {
        list_worker_threads_.emplace_back(&TrackerRuntime::worker_loop, this, state.identifier);
    }
    scheduler_thread_ = std::thread(&TrackerRuntime::scheduler_loop, this);
    monitor_thread_ = std::thread(&TrackerRuntime::monitor_loop, this);
}

/**
 * @brief Stop all threads; in-flight client calls are abandoned by their timeouts.
 */
void TrackerRuntime::shutdown() {
    if (!flag_running_.exchange(false)) {
        return;
    }
    logger_->info("Shutting down tracker runtime");
    worker_pool_.stop();
    {
        std::scoped_lock lock(mutex_signal_);
        flag_wake_pending_ = true;
    }
    cv_signal_.notify_all();
    for (std::thread& worker_thread : list_worker_threads_) {
        if (worker_thread.joinable()) {
            worker_thread.join();
        }
    }
    list_worker_threads_.clear();
    if (scheduler_thread_.joinable()) {
        scheduler_thread_.join();
    }
    if (monitor_thread_.joinable()) {
        monitor_thread_.join();
    }
    drain_reports();
    monitor_.log_summary(monitor_.summary(WallClock::now(), worker_pool_.snapshot(), account_manager_.counts(), catalog_.counts()));
}

void TrackerRuntime::wake_scheduler() {
    {
        std::scoped_lock lock(mutex_signal_);
        flag_wake_pending_ = true;
    }
    cv_signal_.notify_all();
}

const SpawnCatalog& TrackerRuntime::catalog() const noexcept {
    return catalog_;
}

const WorkerPool& TrackerRuntime::worker_pool() const noexcept {
    return worker_pool_;
}

const AccountManager& TrackerRuntime::account_manager() const noexcept {
    return account_manager_;
}

/**
 * @brief Per-slot loop: claim a task, wait for its start, visit, recover.
 */
void TrackerRuntime::worker_loop(const std::string& worker_id) {
    while (flag_running_.load()) {
        try {
            const std::optional<VisitTask> task = worker_pool_.wait_for_task(worker_id, k_task_poll_interval);
            if (!task.has_value()) {
                continue;
            }
            if (!wait_until_ready(*task)) {
                break;
            }
            const TimePoint start = WallClock::now();
            if (start > task->deadline) {
                worker_pool_.cancel_task(worker_id);
                wake_scheduler();
                continue;
            }
            const std::optional<WorkerState> state = worker_pool_.begin_visit(worker_id, task->task_id, start);
            if (!state.has_value()) {
                continue;
            }

            const VisitOutcome visit_outcome = executor_.visit(*state, *task);
            const TimePoint finished = WallClock::now();
            const RecoveryAction action = recovery_.handle(worker_id, *task, visit_outcome, finished);

            VisitReport report{};
            report.worker_id = worker_id;
            report.account = state->account.has_value() ? state->account->username : std::string{};
            report.kind = task->kind;
            report.target_id = task->target_id;
            report.outcome = std::string{outcome_label(visit_outcome)};
            report.action = action;
            if (const auto* visited = std::get_if<outcome::Visited>(&visit_outcome)) {
                report.sightings = visited->sightings;
                report.discovered = visited->discovered;
            }
            report.timestamp = finished;
            report_bus_.publish(report);
            wake_scheduler();
        } catch (const std::exception& exc) {
            logger_->error("Worker loop error on {}: {}", worker_id, exc.what());
        }
    }
}

/**
 * @brief Fixed-interval dispatch loop that also drives time-based recovery.
 */
void TrackerRuntime::scheduler_loop() {
    TimePoint next_stale_sweep = WallClock::now();
    while (flag_running_.load()) {
        const TimePoint now = WallClock::now();
        try {
            if (collaborators_.challenge_solver) {
                collaborators_.challenge_solver(account_manager_, now);
            }
            recovery_.poll(now);
            recovery_.rotate_least_productive(now);
            if (now >= next_stale_sweep) {
                catalog_.mark_stale(now);
                next_stale_sweep = now + to_clock_duration(k_stale_sweep_interval);
            }
            monitor_.record_pass(scheduler_.run_pass(now));
        } catch (const std::exception& exc) {
            logger_->error("Scheduler loop error: {}", exc.what());
        }

        std::unique_lock lock(mutex_signal_);
        cv_signal_.wait_for(lock, configuration_.scheduler_interval, [this]() {
            return flag_wake_pending_ || !flag_running_.load();
        });
        flag_wake_pending_ = false;
    }
}

/**
 * @brief Drain visit reports and periodically log the fleet summary.
 */
void TrackerRuntime::monitor_loop() {
    TimePoint next_summary = WallClock::now() + to_clock_duration(configuration_.monitor_interval);
    while (flag_running_.load()) {
        try {
            drain_reports();
            const TimePoint now = WallClock::now();
            if (now >= next_summary) {
                monitor_.log_summary(monitor_.summary(now, worker_pool_.snapshot(), account_manager_.counts(), catalog_.counts()));
                next_summary = now + to_clock_duration(configuration_.monitor_interval);
            }
        } catch (const std::exception& exc) {
            logger_->error("Monitor loop error: {}", exc.what());
        }
        std::unique_lock lock(mutex_signal_);
        cv_signal_.wait_for(lock, k_report_drain_interval, [this]() { return !flag_running_.load(); });
    }
}

bool TrackerRuntime::wait_until_ready(const VisitTask& task) {
    std::unique_lock lock(mutex_signal_);
    while (flag_running_.load()) {
        const TimePoint now = WallClock::now();
        if (now > task.deadline) {
            return true;
        }
        TimePoint ready_at = task.scheduled_time;
        if (const std::optional<TimePoint> throttled_until = throttle_.until(); throttled_until.has_value()) {
            ready_at = std::max(ready_at, *throttled_until);
        }
        if (now >= ready_at) {
            return true;
        }
        cv_signal_.wait_until(lock, std::min(ready_at, task.deadline));
    }
    return false;
}

void TrackerRuntime::drain_reports() {
    while (std::optional<VisitReport> report = report_bus_.try_consume()) {
        monitor_.ingest_report(*report);
    }
}

}  // namespace spawnwatch
