#include "spawnwatch/failure_recovery.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <stdexcept>
#include <vector>

namespace spawnwatch {

std::string_view to_string(RecoveryAction action) noexcept {
    switch (action) {
        case RecoveryAction::Completed:
            return "completed";
        case RecoveryAction::RetryScheduled:
            return "retry_scheduled";
        case RecoveryAction::BackingOff:
            return "backing_off";
        case RecoveryAction::Restarted:
            return "restarted";
        case RecoveryAction::AwaitingChallenge:
            return "awaiting_challenge";
        case RecoveryAction::Throttled:
            return "throttled";
        case RecoveryAction::Retired:
            return "retired";
    }
    return "unknown";
}

FailureRecoveryController::FailureRecoveryController(RecoveryConfig config,
                                                     WorkerPool& worker_pool,
                                                     AccountManager& account_manager,
                                                     VisitThrottle& throttle,
                                                     HashingQuotaClientPtr quota)
    : config_(config),
      worker_pool_(worker_pool),
      account_manager_(account_manager),
      throttle_(throttle),
      quota_(std::move(quota)),
      logger_(get_logger()) {
    if (config_.transient_retry_ceiling == 0 || config_.protocol_retry_ceiling == 0) {
        throw std::invalid_argument("FailureRecoveryController retry ceilings must be positive");
    }
    if (config_.backoff_base.count() <= 0.0 || config_.backoff_cap < config_.backoff_base) {
        throw std::invalid_argument("FailureRecoveryController backoff must be positive and capped above its base");
    }
}

const RecoveryConfig& FailureRecoveryController::config() const noexcept {
    return config_;
}

RecoveryAction FailureRecoveryController::handle(const std::string& worker_id,
                                                 const VisitTask& task,
                                                 const VisitOutcome& visit_outcome,
                                                 TimePoint now) {
    const std::optional<WorkerState> worker = worker_pool_.worker(worker_id);
    const std::string username = (worker.has_value() && worker->account.has_value()) ? worker->account->username : std::string{};

    return std::visit(
        OutcomeVisitor{
            [&](const outcome::Visited& visited) {
                if (!visited.late) {
                    worker_pool_.record_visit(worker_id, visited.sightings, now);
                }
                worker_pool_.reset_failures(worker_id);
                worker_pool_.complete(worker_id, now);
                return RecoveryAction::Completed;
            },
            [&](const outcome::Transient& transient) {
                logger_->warn(
                    R"({{"component":"recovery","outcome":"transient","worker":"{}","target":"{}","detail":"{}"}})",
                    worker_id,
                    task.target_id,
                    transient.detail
                );
                return retry_or_restart(worker_id, task, config_.transient_retry_ceiling, now);
            },
            [&](const outcome::ProtocolError& protocol_error) {
                logger_->error(
                    R"({{"component":"recovery","outcome":"protocol_error","worker":"{}","target":"{}","detail":"{}"}})",
                    worker_id,
                    task.target_id,
                    protocol_error.detail
                );
                return retry_or_restart(worker_id, task, config_.protocol_retry_ceiling, now);
            },
            [&](const outcome::Challenged& challenged) {
                if (username.empty()) {
                    return restart(worker_id, now);
                }
                logger_->warn("{} was challenged on {}: {}", username, worker_id, challenged.detail);
                account_manager_.mark_challenged(username);
                worker_pool_.await_challenge(worker_id, username, now);
                return RecoveryAction::AwaitingChallenge;
            },
            [&](const outcome::Banned& banned) {
                logger_->warn("{} was banned on {}: {}", username, worker_id, banned.detail);
                if (!username.empty()) {
                    account_manager_.mark_banned(username);
                }
                return restart(worker_id, now);
            },
            [&](const outcome::RateLimited& rate_limited) {
                const Duration pause = throttle_duration(rate_limited);
                const TimePoint resume_at = now + to_clock_duration(pause);
                throttle_.engage(resume_at);
                logger_->warn(
                    R"({{"component":"recovery","outcome":"rate_limited","worker":"{}","pause_s":{:.1f},"detail":"{}"}})",
                    worker_id,
                    pause.count(),
                    rate_limited.detail
                );
                std::optional<VisitTask> retry;
                if (resume_at < task.deadline) {
                    retry = task;
                }
                worker_pool_.defer_retry(worker_id, std::move(retry), resume_at, now);
                return RecoveryAction::Throttled;
            },
        },
        visit_outcome
    );
}

RecoveryPollResult FailureRecoveryController::poll(TimePoint now) {
    RecoveryPollResult result{};
    for (const WorkerState& state : worker_pool_.snapshot()) {
        if (state.status != WorkerStatus::Recovering) {
            continue;
        }
        if (state.awaiting_account.has_value()) {
            const std::optional<AccountHealth> health = account_manager_.health(*state.awaiting_account);
            const bool settled = health != AccountHealth::CaptchaPending;
            const bool timed_out = state.recovering_since.has_value()
                && now - *state.recovering_since >= to_clock_duration(config_.challenge_timeout);
            if (!settled && !timed_out) {
                continue;
            }
            if (timed_out && !settled) {
                logger_->warn("Challenge on {} unresolved after {:.0f}s; rebinding {}",
                              *state.awaiting_account,
                              config_.challenge_timeout.count(),
                              state.identifier);
            }
            if (restart(state.identifier, now) == RecoveryAction::Restarted) {
                ++result.restarted;
            } else {
                ++result.retired;
            }
            continue;
        }
        if (state.resume_at.has_value() && *state.resume_at <= now) {
            worker_pool_.resume(state.identifier, now);
            ++result.resumed;
        }
    }

    if (account_manager_.available(now) > 0) {
        result.revived = worker_pool_.revive_retired(now);
    }
    return result;
}

std::optional<std::string> FailureRecoveryController::rotate_least_productive(TimePoint now) {
    if (!last_rotation_.has_value()) {
        last_rotation_ = now;
        return std::nullopt;
    }
    const auto interval = to_clock_duration(config_.rotation_interval);
    if (now - *last_rotation_ < interval) {
        return std::nullopt;
    }
    last_rotation_ = now;
    if (account_manager_.available(now) == 0) {
        return std::nullopt;
    }

    std::optional<WorkerState> slowest;
    double slowest_rate = 0.0;
    for (const WorkerState& state : worker_pool_.idle_workers()) {
        if (!state.account_bound_at.has_value() || now - *state.account_bound_at < interval) {
            continue;
        }
        const double minutes = std::chrono::duration_cast<Duration>(now - *state.account_bound_at).count() / 60.0;
        const double rate = static_cast<double>(state.account_sightings) / minutes;
        if (!slowest.has_value() || rate < slowest_rate) {
            slowest = state;
            slowest_rate = rate;
        }
    }
    if (!slowest.has_value()) {
        return std::nullopt;
    }

    logger_->info(
        R"({{"component":"recovery","action":"rotate","worker":"{}","account":"{}","sightings_per_min":{:.2f}}})",
        slowest->identifier,
        slowest->account.has_value() ? slowest->account->username : std::string{},
        slowest_rate
    );
    worker_pool_.restart(slowest->identifier, now);
    return slowest->identifier;
}

Duration FailureRecoveryController::backoff_for(std::size_t failures) const {
    const double exponent = failures == 0 ? 0.0 : static_cast<double>(failures - 1);
    return std::min(Duration{config_.backoff_base.count() * std::pow(2.0, exponent)}, config_.backoff_cap);
}

RecoveryAction FailureRecoveryController::retry_or_restart(const std::string& worker_id,
                                                           const VisitTask& task,
                                                           std::size_t ceiling,
                                                           TimePoint now) {
    const std::size_t failures = worker_pool_.record_failure(worker_id);
    if (failures >= ceiling) {
        logger_->warn("{} failed {} times in a row; restarting", worker_id, failures);
        return restart(worker_id, now);
    }

    const TimePoint resume_at = now + to_clock_duration(backoff_for(failures));
    if (resume_at < task.deadline) {
        worker_pool_.defer_retry(worker_id, task, resume_at, now);
        return RecoveryAction::RetryScheduled;
    }
    worker_pool_.defer_retry(worker_id, std::nullopt, resume_at, now);
    return RecoveryAction::BackingOff;
}

RecoveryAction FailureRecoveryController::restart(const std::string& worker_id, TimePoint now) {
    return worker_pool_.restart(worker_id, now) ? RecoveryAction::Restarted : RecoveryAction::Retired;
}

Duration FailureRecoveryController::throttle_duration(const outcome::RateLimited& rate_limited) {
    if (rate_limited.retry_after.has_value() && rate_limited.retry_after->count() > 0.0) {
        return *rate_limited.retry_after;
    }
    if (quota_ == nullptr) {
        return config_.rate_limit_cooldown;
    }
    try {
        const std::int64_t remaining = quota_->remaining_quota();
        return remaining <= 0 ? config_.rate_limit_cooldown : config_.short_cooldown;
    } catch (const std::exception& exc) {
        logger_->warn("Hashing quota lookup failed, assuming exhausted: {}", exc.what());
        return config_.rate_limit_cooldown;
    }
}

}  // namespace spawnwatch
