#include "spawnwatch/worker_pool.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

namespace spawnwatch {

namespace {
constexpr char k_worker_prefix[] = "worker-"; /**< Worker identifiers are the prefix plus the slot index. */
}

std::vector<GeodeticCoordinate> grid_start_positions(const RegionBounds& region, std::size_t count) {
    std::vector<GeodeticCoordinate> list_positions;
    if (count == 0) {
        return list_positions;
    }
    const auto rows = std::max<std::size_t>(1, static_cast<std::size_t>(std::floor(std::sqrt(static_cast<double>(count)))));
    const std::size_t columns = (count + rows - 1) / rows;
    const double part_lat = (region.north_deg - region.south_deg) / static_cast<double>(rows);
    const double part_lon = (region.east_deg - region.west_deg) / static_cast<double>(columns);

    list_positions.reserve(count);
    for (std::size_t index = 0; index < count; ++index) {
        const std::size_t row = index / columns;
        const std::size_t column = index % columns;
        list_positions.push_back(GeodeticCoordinate{
            region.south_deg + part_lat * static_cast<double>(row) + part_lat / 2.0,
            region.west_deg + part_lon * static_cast<double>(column) + part_lon / 2.0
        });
    }
    return list_positions;
}

WorkerPool::WorkerPool(WorkerPoolConfig config, AccountManager& account_manager)
    : config_(config),
      account_manager_(account_manager),
      logger_(get_logger()) {
    if (config_.fleet_size == 0) {
        throw std::invalid_argument("WorkerPool fleet size must be positive");
    }
    if (config_.speed_limit_mps <= 0.0) {
        throw std::invalid_argument("WorkerPool speed limit must be positive");
    }
}

void WorkerPool::start(const std::vector<GeodeticCoordinate>& start_positions, TimePoint now) {
    if (start_positions.size() < config_.fleet_size) {
        throw std::invalid_argument("WorkerPool needs one start position per worker");
    }
    std::scoped_lock lock(mutex_);
    if (!list_workers_.empty()) {
        throw std::logic_error("WorkerPool already started");
    }
    list_workers_.reserve(config_.fleet_size);
    for (std::size_t index = 0; index < config_.fleet_size; ++index) {
        WorkerState state{};
        state.identifier = fmt::format("{}{}", k_worker_prefix, index);
        state.index = index;
        state.position = start_positions[index];
        state.speed_limit_mps = config_.speed_limit_mps;
        try {
            state.account = account_manager_.acquire(state.identifier, now).credential;
            state.account_bound_at = now;
            state.status = WorkerStatus::Idle;
        } catch (const NoAccountAvailable& exc) {
            logger_->warn("{} starts retired: {}", state.identifier, exc.what());
            state.status = WorkerStatus::Retired;
        }
        map_worker_index_.emplace(state.identifier, index);
        list_workers_.push_back(std::move(state));
    }
    logger_->info("Worker pool started with {} workers", list_workers_.size());
}

std::vector<WorkerState> WorkerPool::idle_workers() const {
    std::scoped_lock lock(mutex_);
    std::vector<WorkerState> list_idle;
    for (const WorkerState& state : list_workers_) {
        if (state.status != WorkerStatus::Idle || !state.account.has_value() || state.active_task.has_value()) {
            continue;
        }
        if (account_manager_.health(state.account->username) != AccountHealth::Healthy) {
            continue;
        }
        list_idle.push_back(state);
    }
    return list_idle;
}

std::vector<WorkerState> WorkerPool::snapshot() const {
    std::scoped_lock lock(mutex_);
    return list_workers_;
}

std::optional<WorkerState> WorkerPool::worker(const std::string& worker_id) const {
    std::scoped_lock lock(mutex_);
    const WorkerState* state = find_locked(worker_id);
    if (state == nullptr) {
        return std::nullopt;
    }
    return *state;
}

std::vector<VisitTask> WorkerPool::active_tasks() const {
    std::scoped_lock lock(mutex_);
    std::vector<VisitTask> list_tasks;
    for (const WorkerState& state : list_workers_) {
        if (state.active_task.has_value()) {
            list_tasks.push_back(*state.active_task);
        }
        if (state.pending_retry.has_value()) {
            list_tasks.push_back(*state.pending_retry);
        }
    }
    return list_tasks;
}

std::size_t WorkerPool::size() const {
    std::scoped_lock lock(mutex_);
    return list_workers_.size();
}

void WorkerPool::assign(const std::string& worker_id, VisitTask task, TimePoint now) {
    {
        std::scoped_lock lock(mutex_);
        WorkerState* state = find_locked(worker_id);
        if (state == nullptr) {
            throw std::logic_error("Unknown worker " + worker_id);
        }
        if (state->status != WorkerStatus::Idle || state->active_task.has_value()) {
            throw std::logic_error(fmt::format("{} is {} and cannot take a task", worker_id, to_string(state->status)));
        }
        if (!state->account.has_value()) {
            throw std::logic_error(worker_id + " has no bound account");
        }
        if (task.deadline < now) {
            throw std::logic_error(fmt::format("Task {} for {} has a deadline in the past", task.target_id, worker_id));
        }
        task.worker_id = worker_id;
        state->status = WorkerStatus::Traveling;
        state->busy_until = task.deadline;
        state->active_task = std::move(task);
        state->task_claimed = false;
        logger_->debug(
            R"({{"component":"pool","action":"assign","worker":"{}","target":"{}","kind":"{}"}})",
            worker_id,
            state->active_task->target_id,
            to_string(state->active_task->kind)
        );
    }
    cv_task_.notify_all();
}

std::optional<VisitTask> WorkerPool::wait_for_task(const std::string& worker_id, Duration timeout) {
    std::unique_lock lock(mutex_);
    const bool ready = cv_task_.wait_for(lock, timeout, [this, &worker_id]() {
        if (stopping_) {
            return true;
        }
        const WorkerState* state = find_locked(worker_id);
        return state != nullptr && state->active_task.has_value() && !state->task_claimed;
    });
    if (!ready || stopping_) {
        return std::nullopt;
    }
    WorkerState* state = find_locked(worker_id);
    state->task_claimed = true;
    return state->active_task;
}

std::optional<WorkerState> WorkerPool::begin_visit(const std::string& worker_id, std::uint64_t task_id, TimePoint now) {
    std::scoped_lock lock(mutex_);
    WorkerState* state = find_locked(worker_id);
    if (state == nullptr || !state->active_task.has_value() || state->active_task->task_id != task_id) {
        return std::nullopt;
    }
    if (state->status != WorkerStatus::Traveling || !state->account.has_value()) {
        return std::nullopt;
    }
    state->status = WorkerStatus::Visiting;
    state->position = state->active_task->position;
    state->last_visit_at = now;
    return *state;
}

void WorkerPool::complete(const std::string& worker_id, TimePoint) {
    {
        std::scoped_lock lock(mutex_);
        WorkerState* state = find_locked(worker_id);
        if (state == nullptr) {
            return;
        }
        clear_task_locked(*state);
        if (state->status != WorkerStatus::Retired) {
            state->status = WorkerStatus::Idle;
        }
    }
    cv_task_.notify_all();
}

void WorkerPool::cancel_task(const std::string& worker_id) {
    std::scoped_lock lock(mutex_);
    WorkerState* state = find_locked(worker_id);
    if (state == nullptr || !state->active_task.has_value()) {
        return;
    }
    logger_->info(
        R"({{"component":"pool","action":"cancel","worker":"{}","target":"{}"}})",
        worker_id,
        state->active_task->target_id
    );
    clear_task_locked(*state);
    state->status = WorkerStatus::Idle;
}

void WorkerPool::record_visit(const std::string& worker_id, std::size_t sightings, TimePoint now) {
    std::scoped_lock lock(mutex_);
    WorkerState* state = find_locked(worker_id);
    if (state == nullptr) {
        return;
    }
    ++state->visits;
    state->sightings += sightings;
    state->account_sightings += sightings;
    state->last_visit_at = now;
}

std::size_t WorkerPool::record_failure(const std::string& worker_id) {
    std::scoped_lock lock(mutex_);
    WorkerState* state = find_locked(worker_id);
    if (state == nullptr) {
        return 0;
    }
    return ++state->consecutive_failures;
}

void WorkerPool::reset_failures(const std::string& worker_id) {
    std::scoped_lock lock(mutex_);
    WorkerState* state = find_locked(worker_id);
    if (state != nullptr) {
        state->consecutive_failures = 0;
    }
}

void WorkerPool::defer_retry(const std::string& worker_id, std::optional<VisitTask> retry, TimePoint resume_at, TimePoint now) {
    std::scoped_lock lock(mutex_);
    WorkerState* state = find_locked(worker_id);
    if (state == nullptr || state->status == WorkerStatus::Retired) {
        return;
    }
    clear_task_locked(*state);
    state->status = WorkerStatus::Recovering;
    state->pending_retry = std::move(retry);
    state->resume_at = resume_at;
    state->recovering_since = now;
}

void WorkerPool::await_challenge(const std::string& worker_id, const std::string& username, TimePoint now) {
    std::scoped_lock lock(mutex_);
    WorkerState* state = find_locked(worker_id);
    if (state == nullptr) {
        return;
    }
    clear_task_locked(*state);
    state->status = WorkerStatus::Recovering;
    state->awaiting_account = username;
    state->recovering_since = now;
    if (state->account.has_value() && state->account->username == username) {
        state->account.reset();
        state->account_bound_at.reset();
    }
}

bool WorkerPool::resume(const std::string& worker_id, TimePoint now) {
    bool dispatched = false;
    {
        std::scoped_lock lock(mutex_);
        WorkerState* state = find_locked(worker_id);
        if (state == nullptr || state->status != WorkerStatus::Recovering || state->awaiting_account.has_value()) {
            return false;
        }
        if (!state->account.has_value()) {
            return false;
        }
        std::optional<VisitTask> retry = std::move(state->pending_retry);
        state->pending_retry.reset();
        state->resume_at.reset();
        state->recovering_since.reset();
        state->status = WorkerStatus::Idle;
        if (retry.has_value() && retry->deadline >= now) {
            retry->scheduled_time = std::max(retry->scheduled_time, now);
            ++retry->attempt;
            state->status = WorkerStatus::Traveling;
            state->busy_until = retry->deadline;
            state->active_task = std::move(retry);
            state->task_claimed = false;
            dispatched = true;
        }
    }
    cv_task_.notify_all();
    return dispatched;
}

bool WorkerPool::restart(const std::string& worker_id, TimePoint now) {
    std::scoped_lock lock(mutex_);
    WorkerState* state = find_locked(worker_id);
    if (state == nullptr) {
        return false;
    }
    if (state->account.has_value()) {
        account_manager_.release(state->account->username, now);
    }
    const std::optional<std::string> previous_account = state->account.has_value()
        ? std::optional<std::string>{state->account->username}
        : state->awaiting_account;
    clear_task_locked(*state);
    state->account.reset();
    state->account_bound_at.reset();
    state->account_sightings = 0;
    state->pending_retry.reset();
    state->resume_at.reset();
    state->awaiting_account.reset();
    state->consecutive_failures = 0;

    try {
        state->account = account_manager_.acquire(worker_id, now).credential;
    } catch (const NoAccountAvailable& exc) {
        state->status = WorkerStatus::Retired;
        state->recovering_since.reset();
        logger_->warn(
            R"({{"component":"pool","action":"retire","worker":"{}","reason":"{}"}})",
            worker_id,
            exc.what()
        );
        return false;
    }
    state->account_bound_at = now;
    state->recovering_since.reset();
    state->status = WorkerStatus::Idle;
    logger_->info(
        R"({{"component":"pool","action":"restart","worker":"{}","from":"{}","to":"{}"}})",
        worker_id,
        previous_account.value_or(""),
        state->account->username
    );
    return true;
}

std::size_t WorkerPool::revive_retired(TimePoint now) {
    std::scoped_lock lock(mutex_);
    std::size_t revived = 0;
    for (WorkerState& state : list_workers_) {
        if (state.status != WorkerStatus::Retired) {
            continue;
        }
        try {
            state.account = account_manager_.acquire(state.identifier, now).credential;
        } catch (const NoAccountAvailable&) {
            break;
        }
        state.account_bound_at = now;
        state.account_sightings = 0;
        state.consecutive_failures = 0;
        state.status = WorkerStatus::Idle;
        ++revived;
        logger_->info(R"({{"component":"pool","action":"revive","worker":"{}","account":"{}"}})", state.identifier, state.account->username);
    }
    return revived;
}

void WorkerPool::stop() {
    {
        std::scoped_lock lock(mutex_);
        stopping_ = true;
    }
    cv_task_.notify_all();
}

WorkerState* WorkerPool::find_locked(const std::string& worker_id) {
    const auto iterator_index = map_worker_index_.find(worker_id);
    if (iterator_index == map_worker_index_.end()) {
        return nullptr;
    }
    return &list_workers_[iterator_index->second];
}

const WorkerState* WorkerPool::find_locked(const std::string& worker_id) const {
    const auto iterator_index = map_worker_index_.find(worker_id);
    if (iterator_index == map_worker_index_.end()) {
        return nullptr;
    }
    return &list_workers_[iterator_index->second];
}

void WorkerPool::clear_task_locked(WorkerState& state) {
    state.active_task.reset();
    state.task_claimed = false;
    state.busy_until.reset();
}

}  // namespace spawnwatch
