#include "spawnwatch/scheduler.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <unordered_set>

#include "spawnwatch/geodesy.hpp"

namespace spawnwatch {

namespace {

/** @brief How a candidate target relates to visits already dispatched. */
enum class Coverage {
    Open,        /**< Nothing covers it yet. */
    Dispatched,  /**< This very target already has a visit for the window. */
    Nearby       /**< Another visit close enough in space and time scans it. */
};

}  // namespace

double required_speed_mps(const GeodeticCoordinate& from,
                          const GeodeticCoordinate& target,
                          TimePoint now,
                          TimePoint deadline,
                          Duration min_time_to_deadline) {
    const Duration remaining = std::max(std::chrono::duration_cast<Duration>(deadline - now), min_time_to_deadline);
    return haversine_distance_m(from, target) / remaining.count();
}

Scheduler::Scheduler(SchedulerConfig config,
                     SpawnCatalog& catalog,
                     WorkerPool& worker_pool,
                     AccountManager& account_manager,
                     VisitThrottle& throttle)
    : config_(config),
      catalog_(catalog),
      worker_pool_(worker_pool),
      account_manager_(account_manager),
      throttle_(throttle),
      logger_(get_logger()) {
    if (config_.scan_horizon.count() <= 0.0) {
        throw std::invalid_argument("Scheduler scan horizon must be positive");
    }
    if (config_.exploration_deadline.count() <= 0.0) {
        throw std::invalid_argument("Scheduler exploration deadline must be positive");
    }
    if (config_.min_time_to_deadline.count() <= 0.0) {
        throw std::invalid_argument("Scheduler minimum time to deadline must be positive");
    }
    if (config_.suppression_radius_m < 0.0) {
        throw std::invalid_argument("Scheduler suppression radius cannot be negative");
    }
}

const SchedulerConfig& Scheduler::config() const noexcept {
    return config_;
}

SchedulePassResult Scheduler::run_pass(TimePoint now) {
    std::scoped_lock lock(pass_mutex_);
    SchedulePassResult result{};

    if (throttle_.active(now)) {
        result.skipped_throttled = true;
        logger_->debug(R"({{"component":"scheduler","action":"skip","reason":"throttled"}})");
        return result;
    }
    if (config_.max_pending_challenges > 0) {
        const std::size_t pending = account_manager_.pending_challenges();
        if (pending > config_.max_pending_challenges) {
            result.skipped_challenges = true;
            logger_->warn(
                R"({{"component":"scheduler","action":"skip","reason":"challenges","pending":{},"limit":{}}})",
                pending,
                config_.max_pending_challenges
            );
            return result;
        }
    }

    prune_dispatches(now);
    refresh_dispatches();
    std::vector<WorkerState> list_idle = worker_pool_.idle_workers();
    DueTargetSequence due_targets = catalog_.due_targets(now, config_.scan_horizon);

    while (std::optional<DueTarget> target = due_targets.next()) {
        if (target->deadline <= now) {
            ++result.dropped_expired;
            continue;
        }
        const Coverage coverage = [this, &target]() {
            Coverage found = Coverage::Open;
            for (const DispatchRecord& record : list_dispatches_) {
                if (record.scheduled_time > target->deadline
                    || record.scheduled_time + to_clock_duration(config_.suppression_slack) < target->window_start) {
                    continue;
                }
                if (record.target_id == target->spawn_id) {
                    return Coverage::Dispatched;
                }
                if (haversine_distance_m(record.position, target->position) <= config_.suppression_radius_m) {
                    found = Coverage::Nearby;
                }
            }
            return found;
        }();
        if (coverage == Coverage::Dispatched) {
            continue;
        }
        if (coverage == Coverage::Nearby) {
            ++result.suppressed;
            continue;
        }

        auto iterator_best = list_idle.end();
        double best_speed_mps = 0.0;
        for (auto iterator_worker = list_idle.begin(); iterator_worker != list_idle.end(); ++iterator_worker) {
            const double speed_mps = required_speed_mps(
                iterator_worker->position, target->position, now, target->deadline, config_.min_time_to_deadline);
            if (speed_mps > iterator_worker->speed_limit_mps) {
                continue;
            }
            if (iterator_best == list_idle.end()
                || speed_mps < best_speed_mps
                || (speed_mps == best_speed_mps && iterator_worker->index < iterator_best->index)) {
                iterator_best = iterator_worker;
                best_speed_mps = speed_mps;
            }
        }
        if (iterator_best == list_idle.end()) {
            ++result.deferred;
            continue;
        }

        const Duration travel_time{haversine_distance_m(iterator_best->position, target->position) / iterator_best->speed_limit_mps};
        VisitTask task{};
        task.task_id = next_task_id_.fetch_add(1);
        task.kind = TargetKind::Spawn;
        task.target_id = target->spawn_id;
        task.position = target->position;
        task.deadline = target->deadline;
        task.scheduled_time = std::min(
            std::max(now + to_clock_duration(travel_time), target->window_start + to_clock_duration(config_.visit_delay)),
            target->deadline
        );
        if (dispatch(*iterator_best, std::move(task), now)) {
            ++result.assigned_due;
        }
        list_idle.erase(iterator_best);
    }

    if (!list_idle.empty()) {
        assign_exploration(list_idle, now, result);
    }

    if (result.assigned_due + result.assigned_exploration + result.deferred + result.suppressed + result.dropped_expired > 0) {
        logger_->info(
            R"({{"component":"scheduler","action":"pass","due":{},"exploration":{},"deferred":{},"suppressed":{},"dropped":{}}})",
            result.assigned_due,
            result.assigned_exploration,
            result.deferred,
            result.suppressed,
            result.dropped_expired
        );
    }
    return result;
}

void Scheduler::assign_exploration(std::vector<WorkerState>& list_idle, TimePoint now, SchedulePassResult& result) {
    const std::vector<ExplorationTarget> list_targets = catalog_.exploration_targets(
        config_.region, now, std::max(config_.exploration_candidates, list_idle.size()));
    const TimePoint deadline = now + to_clock_duration(config_.exploration_deadline);

    for (const ExplorationTarget& target : list_targets) {
        if (list_idle.empty()) {
            break;
        }
        const bool covered = std::any_of(list_dispatches_.begin(), list_dispatches_.end(), [this, &target, now](const DispatchRecord& record) {
            return record.deadline >= now
                && (record.target_id == target.identifier
                    || haversine_distance_m(record.position, target.position) <= config_.suppression_radius_m);
        });
        if (covered) {
            continue;
        }

        auto iterator_nearest = list_idle.end();
        double nearest_m = 0.0;
        for (auto iterator_worker = list_idle.begin(); iterator_worker != list_idle.end(); ++iterator_worker) {
            const double distance_m = haversine_distance_m(iterator_worker->position, target.position);
            if (required_speed_mps(iterator_worker->position, target.position, now, deadline, config_.min_time_to_deadline)
                > iterator_worker->speed_limit_mps) {
                continue;
            }
            if (iterator_nearest == list_idle.end()
                || distance_m < nearest_m
                || (distance_m == nearest_m && iterator_worker->index < iterator_nearest->index)) {
                iterator_nearest = iterator_worker;
                nearest_m = distance_m;
            }
        }
        if (iterator_nearest == list_idle.end()) {
            continue;
        }

        VisitTask task{};
        task.task_id = next_task_id_.fetch_add(1);
        task.kind = TargetKind::Exploration;
        task.target_id = target.identifier;
        task.position = target.position;
        task.deadline = deadline;
        task.scheduled_time = std::min(now + to_clock_duration(Duration{nearest_m / iterator_nearest->speed_limit_mps}), deadline);
        if (dispatch(*iterator_nearest, std::move(task), now)) {
            ++result.assigned_exploration;
        }
        list_idle.erase(iterator_nearest);
    }
}

bool Scheduler::dispatch(const WorkerState& worker, VisitTask task, TimePoint now) {
    DispatchRecord record{task.task_id, task.kind, task.target_id, task.position, now, task.scheduled_time, task.deadline, false};
    try {
        worker_pool_.assign(worker.identifier, std::move(task), now);
    } catch (const std::logic_error& exc) {
        // The worker changed state since the idle snapshot was taken.
        logger_->warn("Assignment to {} rejected: {}", worker.identifier, exc.what());
        return false;
    }
    list_dispatches_.push_back(std::move(record));
    return true;
}

void Scheduler::refresh_dispatches() {
    std::unordered_set<std::uint64_t> set_pending;
    for (const VisitTask& task : worker_pool_.active_tasks()) {
        set_pending.insert(task.task_id);
    }

    for (DispatchRecord& record : list_dispatches_) {
        if (record.settled || record.kind != TargetKind::Spawn || set_pending.count(record.task_id) > 0) {
            continue;
        }
        const std::optional<SpawnPoint> point = catalog_.get(record.target_id);
        record.settled = point.has_value() && point->last_visited_at.has_value() && *point->last_visited_at > record.dispatched_at;
    }

    const auto size_before = list_dispatches_.size();
    list_dispatches_.erase(
        std::remove_if(list_dispatches_.begin(), list_dispatches_.end(), [&set_pending](const DispatchRecord& record) {
            return !record.settled && set_pending.count(record.task_id) == 0;
        }),
        list_dispatches_.end()
    );
    const std::size_t forgotten_count = size_before - list_dispatches_.size();

    if (forgotten_count > 0) {
        logger_->debug(R"({{"component":"scheduler","action":"forget_finished","count":{}}})", forgotten_count);
    }
}

void Scheduler::prune_dispatches(TimePoint now) {
    const TimePoint horizon_start = now - to_clock_duration(catalog_.config().cycle_period + config_.suppression_slack);
    list_dispatches_.erase(
        std::remove_if(list_dispatches_.begin(), list_dispatches_.end(), [horizon_start](const DispatchRecord& record) {
            return record.scheduled_time < horizon_start;
        }),
        list_dispatches_.end()
    );
}

}  // namespace spawnwatch
