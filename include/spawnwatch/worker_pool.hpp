// === Worker Pool =============================================================
//
// Owns the fixed fleet of worker slots and their state machines:
//
//   idle -> traveling -> visiting -> idle
//   any  -> recovering            (failure)
//   recovering -> retired         (no account available)
//
// The scheduler reads snapshots and calls assign(); worker threads block in
// wait_for_task() and report progress through begin_visit()/complete();
// the failure recovery controller drives restart(), defer_retry() and
// await_challenge().

#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "spawnwatch/account_manager.hpp"
#include "spawnwatch/logging.hpp"
#include "spawnwatch/types.hpp"

namespace spawnwatch {

/** @brief Unit of work handed to a single worker. */
struct VisitTask final {
    std::uint64_t task_id{};
    TargetKind kind{TargetKind::Spawn};
    std::string target_id{};              /**< Spawn identifier or exploration cell identifier. */
    GeodeticCoordinate position{};
    std::string worker_id{};
    TimePoint scheduled_time{};           /**< Earliest moment the scan should run. */
    TimePoint deadline{};                 /**< Result is discarded after this instant. */
    std::size_t attempt{1};
};

/** @brief Observable state of one worker slot. */
struct WorkerState final {
    std::string identifier{};
    std::size_t index{};
    WorkerStatus status{WorkerStatus::Idle};
    std::optional<AccountCredential> account{};
    GeodeticCoordinate position{};
    double speed_limit_mps{};
    std::optional<TimePoint> busy_until{};
    std::optional<VisitTask> active_task{};
    bool task_claimed{};                          /**< Worker thread picked up active_task. */
    std::optional<VisitTask> pending_retry{};     /**< Task to re-run once resume_at passes. */
    std::optional<TimePoint> resume_at{};
    std::optional<std::string> awaiting_account{};/**< Challenged account the slot waits on. */
    std::optional<TimePoint> recovering_since{};
    std::size_t consecutive_failures{};
    std::size_t visits{};
    std::size_t sightings{};
    std::size_t account_sightings{};              /**< Sightings under the current account. */
    std::optional<TimePoint> account_bound_at{};
    std::optional<TimePoint> last_visit_at{};
};

/** @brief Fleet sizing and movement limits. */
struct WorkerPoolConfig final {
    std::size_t fleet_size{};
    double speed_limit_mps{};
};

/**
 * @brief Spread @p count start positions over a grid covering @p region.
 */
[[nodiscard]] std::vector<GeodeticCoordinate> grid_start_positions(const RegionBounds& region, std::size_t count);

class WorkerPool final {
  public:
    WorkerPool(WorkerPoolConfig config, AccountManager& account_manager);

    /**
     * @brief Create the fleet at @p start_positions and bind an account to each slot.
     *
     * Slots that cannot get an account start retired.
     */
    void start(const std::vector<GeodeticCoordinate>& start_positions, TimePoint now);

    /** @brief Workers that are idle and bound to a healthy account. */
    [[nodiscard]] std::vector<WorkerState> idle_workers() const;
    [[nodiscard]] std::vector<WorkerState> snapshot() const;
    [[nodiscard]] std::optional<WorkerState> worker(const std::string& worker_id) const;
    /** @brief Tasks currently assigned or in flight. */
    [[nodiscard]] std::vector<VisitTask> active_tasks() const;
    [[nodiscard]] std::size_t size() const;

    /**
     * @brief Hand @p task to an idle worker.
     *
     * @throws std::logic_error if the worker is not idle, has no account, or
     *         the deadline already passed.
     */
    void assign(const std::string& worker_id, VisitTask task, TimePoint now);

    /** @brief Block until the slot has an unclaimed task, the timeout elapses, or the pool stops. */
    [[nodiscard]] std::optional<VisitTask> wait_for_task(const std::string& worker_id, Duration timeout);
    /** @brief Traveling -> visiting; returns the state the executor should use. */
    [[nodiscard]] std::optional<WorkerState> begin_visit(const std::string& worker_id, std::uint64_t task_id, TimePoint now);
    /** @brief Finish the active task and return to idle. */
    void complete(const std::string& worker_id, TimePoint now);
    /** @brief Drop the active task without running it (deadline passed). */
    void cancel_task(const std::string& worker_id);

    void record_visit(const std::string& worker_id, std::size_t sightings, TimePoint now);
    /** @brief Increment and return the consecutive failure count. */
    std::size_t record_failure(const std::string& worker_id);
    void reset_failures(const std::string& worker_id);

    /** @brief Move to recovering until @p resume_at, optionally re-running @p retry afterwards. */
    void defer_retry(const std::string& worker_id, std::optional<VisitTask> retry, TimePoint resume_at, TimePoint now);
    /** @brief Move to recovering until @p username is resolved. */
    void await_challenge(const std::string& worker_id, const std::string& username, TimePoint now);
    /** @brief Recovering -> idle, or straight back to traveling when a retry is still viable. */
    bool resume(const std::string& worker_id, TimePoint now);

    /**
     * @brief Release the current binding and acquire a fresh account.
     *
     * The worker keeps its position. Returns false when the slot had to retire.
     */
    bool restart(const std::string& worker_id, TimePoint now);
    /** @brief Bind accounts to retired slots while any are available; returns how many came back. */
    std::size_t revive_retired(TimePoint now);

    /** @brief Wake all waiting worker threads; wait_for_task returns nullopt afterwards. */
    void stop();

  private:
    WorkerState* find_locked(const std::string& worker_id);
    const WorkerState* find_locked(const std::string& worker_id) const;
    void clear_task_locked(WorkerState& state);

    WorkerPoolConfig config_;
    AccountManager& account_manager_;
    mutable std::mutex mutex_;
    std::condition_variable cv_task_;
    std::vector<WorkerState> list_workers_;
    std::unordered_map<std::string, std::size_t> map_worker_index_;
    bool stopping_{false};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace spawnwatch
