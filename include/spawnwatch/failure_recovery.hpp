// === Failure Recovery Controller =============================================
//
// Reacts to visit outcomes so one bad account or flaky call never stalls the
// fleet:
//
//   Transient / ProtocolError  backoff and retry, restart past the ceiling
//   Challenged                 bench the account, wait for resolution
//   Banned                     retire the account, rebind the worker
//   RateLimited                engage the process-wide throttle
//
// poll() advances time-based recovery (backoffs, challenge waits, retired
// slots) and rotate_least_productive() swaps out the weakest account.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "spawnwatch/account_manager.hpp"
#include "spawnwatch/collaborators.hpp"
#include "spawnwatch/logging.hpp"
#include "spawnwatch/visit_outcome.hpp"
#include "spawnwatch/visit_throttle.hpp"
#include "spawnwatch/worker_pool.hpp"

namespace spawnwatch {

struct RecoveryConfig final {
    std::size_t transient_retry_ceiling{3};
    std::size_t protocol_retry_ceiling{2};
    Duration backoff_base{Duration{2.0}};
    Duration backoff_cap{Duration{60.0}};
    Duration challenge_timeout{Duration{300.0}};
    Duration rate_limit_cooldown{Duration{60.0}};  /**< Pause when the hashing quota is exhausted. */
    Duration short_cooldown{Duration{5.0}};        /**< Pause when quota remains. */
    Duration rotation_interval{Duration{600.0}};
};

/** @brief What the controller did with a worker after an outcome. */
enum class RecoveryAction {
    Completed,
    RetryScheduled,
    BackingOff,
    Restarted,
    AwaitingChallenge,
    Throttled,
    Retired
};

[[nodiscard]] std::string_view to_string(RecoveryAction action) noexcept;

/** @brief Counters from one poll(). */
struct RecoveryPollResult final {
    std::size_t resumed{};
    std::size_t restarted{};
    std::size_t retired{};
    std::size_t revived{};
};

class FailureRecoveryController final {
  public:
    /**
     * @param quota Hashing quota collaborator; may be null, in which case
     *        rate limits always use the full cooldown.
     */
    FailureRecoveryController(RecoveryConfig config,
                              WorkerPool& worker_pool,
                              AccountManager& account_manager,
                              VisitThrottle& throttle,
                              HashingQuotaClientPtr quota);

    [[nodiscard]] const RecoveryConfig& config() const noexcept;

    /** @brief Apply @p visit_outcome of @p task to worker @p worker_id. */
    RecoveryAction handle(const std::string& worker_id, const VisitTask& task, const VisitOutcome& visit_outcome, TimePoint now);

    /** @brief Resume backoffs, settle challenge waits and revive retired slots. */
    RecoveryPollResult poll(TimePoint now);

    /**
     * @brief Rebind the idle worker with the fewest sightings per minute.
     *
     * Runs at most once per rotation interval and only when a spare healthy
     * account exists. Returns the rotated worker.
     */
    std::optional<std::string> rotate_least_productive(TimePoint now);

    /** @brief Backoff applied after the @p failures-th consecutive failure. */
    [[nodiscard]] Duration backoff_for(std::size_t failures) const;

  private:
    RecoveryAction retry_or_restart(const std::string& worker_id,
                                    const VisitTask& task,
                                    std::size_t ceiling,
                                    TimePoint now);
    RecoveryAction restart(const std::string& worker_id, TimePoint now);
    [[nodiscard]] Duration throttle_duration(const outcome::RateLimited& rate_limited);

    RecoveryConfig config_;
    WorkerPool& worker_pool_;
    AccountManager& account_manager_;
    VisitThrottle& throttle_;
    HashingQuotaClientPtr quota_;
    std::optional<TimePoint> last_rotation_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace spawnwatch
