// === Account Manager =========================================================
//
// Tracks credential health and hands out exclusive account bindings. Healthy
// accounts are issued least-recently-used first to spread request volume.
// Health transitions:
//
//   healthy -> cooldown -> healthy
//   healthy -> captcha_pending -> healthy (external resolve) | banned
//   healthy -> banned (terminal)

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "spawnwatch/logging.hpp"
#include "spawnwatch/types.hpp"

namespace spawnwatch {

/** @brief Credential material handed to the client on login. */
struct AccountCredential final {
    std::string username{};
    std::string password{};
    std::string provider{"ptc"};
};

/** @brief Account record including health bookkeeping. */
struct Account final {
    AccountCredential credential{};
    AccountHealth health{AccountHealth::Healthy};
    std::optional<TimePoint> cooldown_until{};
    std::optional<TimePoint> last_used{};
    std::optional<std::string> bound_worker{};
    std::size_t challenge_count{};
};

/** @brief Raised by AccountManager::acquire when nothing can be issued. */
class NoAccountAvailable final : public std::runtime_error {
  public:
    explicit NoAccountAvailable(const std::string& message);
};

/** @brief Number of accounts in each health state. */
struct AccountCounts final {
    std::size_t healthy{};
    std::size_t cooldown{};
    std::size_t captcha_pending{};
    std::size_t banned{};
    std::size_t bound{};
};

class AccountManager final {
  public:
    /**
     * @brief Build the pool from the configured credentials.
     *
     * @throws std::invalid_argument when the list is empty or holds duplicates.
     */
    explicit AccountManager(const std::vector<AccountCredential>& credentials);

    /**
     * @brief Bind the least-recently-used healthy account to @p worker_id.
     *
     * @throws NoAccountAvailable when every account is bound or unhealthy.
     */
    Account acquire(const std::string& worker_id, TimePoint now);

    /** @brief Return a bound account to the pool. */
    bool release(const std::string& username, TimePoint now);
    /** @brief Park an account pending an external challenge resolution. */
    bool mark_challenged(const std::string& username);
    /** @brief Called by the challenge-resolution collaborator. */
    bool resolve(const std::string& username);
    /** @brief Retire an account permanently. */
    bool mark_banned(const std::string& username);
    /** @brief Withhold an account until @p until. */
    bool mark_cooldown(const std::string& username, TimePoint until);

    [[nodiscard]] std::optional<AccountHealth> health(const std::string& username) const;
    [[nodiscard]] std::size_t pending_challenges() const;
    /** @brief Healthy accounts (cooldown expired included) not bound to any worker. */
    [[nodiscard]] std::size_t available(TimePoint now) const;
    [[nodiscard]] AccountCounts counts() const;
    [[nodiscard]] std::vector<Account> snapshot() const;

  private:
    /** @brief Locate an account or log the unknown name (lock held). */
    Account* find_locked(const std::string& username, std::string_view operation);
    [[nodiscard]] static bool is_issuable(const Account& account, TimePoint now) noexcept;

    mutable std::mutex mutex_;
    std::map<std::string, Account> map_accounts_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace spawnwatch
