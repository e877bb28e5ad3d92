#include "spawnwatch/account_manager.hpp"

#include <fmt/format.h>

namespace spawnwatch {

NoAccountAvailable::NoAccountAvailable(const std::string& message)
    : std::runtime_error(message) {}

AccountManager::AccountManager(const std::vector<AccountCredential>& credentials)
    : logger_(get_logger()) {
    if (credentials.empty()) {
        throw std::invalid_argument("AccountManager requires at least one account");
    }
    for (const AccountCredential& credential : credentials) {
        if (credential.username.empty()) {
            throw std::invalid_argument("AccountManager account username cannot be empty");
        }
        Account account{};
        account.credential = credential;
        const auto [iterator_account, inserted] = map_accounts_.emplace(credential.username, std::move(account));
        if (!inserted) {
            throw std::invalid_argument("Duplicate account " + credential.username);
        }
    }
    logger_->info("Account manager loaded {} accounts", map_accounts_.size());
}

Account AccountManager::acquire(const std::string& worker_id, TimePoint now) {
    std::scoped_lock lock(mutex_);
    Account* selected = nullptr;
    for (auto& [username, account] : map_accounts_) {
        if (!is_issuable(account, now)) {
            continue;
        }
        // std::map iteration order makes the username the tie-breaker.
        if (selected == nullptr || account.last_used < selected->last_used) {
            selected = &account;
        }
    }
    if (selected == nullptr) {
        throw NoAccountAvailable(fmt::format("No healthy unbound account for {}", worker_id));
    }

    if (selected->health == AccountHealth::Cooldown) {
        logger_->info("Account {} finished cooldown", selected->credential.username);
        selected->health = AccountHealth::Healthy;
        selected->cooldown_until.reset();
    }
    selected->bound_worker = worker_id;
    selected->last_used = now;
    logger_->info(
        R"({{"component":"accounts","action":"acquire","account":"{}","worker":"{}"}})",
        selected->credential.username,
        worker_id
    );
    return *selected;
}

bool AccountManager::release(const std::string& username, TimePoint now) {
    std::scoped_lock lock(mutex_);
    Account* account = find_locked(username, "release");
    if (account == nullptr) {
        return false;
    }
    if (!account->bound_worker.has_value()) {
        return false;
    }
    account->bound_worker.reset();
    account->last_used = now;
    logger_->debug(R"({{"component":"accounts","action":"release","account":"{}"}})", username);
    return true;
}

bool AccountManager::mark_challenged(const std::string& username) {
    std::scoped_lock lock(mutex_);
    Account* account = find_locked(username, "mark_challenged");
    if (account == nullptr) {
        return false;
    }
    if (account->health == AccountHealth::Banned || account->health == AccountHealth::CaptchaPending) {
        logger_->warn("Account {} cannot enter captcha_pending from {}", username, to_string(account->health));
        return false;
    }
    account->health = AccountHealth::CaptchaPending;
    account->bound_worker.reset();
    ++account->challenge_count;
    logger_->warn(
        R"({{"component":"accounts","action":"challenged","account":"{}","challenges":{}}})",
        username,
        account->challenge_count
    );
    return true;
}

bool AccountManager::resolve(const std::string& username) {
    std::scoped_lock lock(mutex_);
    Account* account = find_locked(username, "resolve");
    if (account == nullptr) {
        return false;
    }
    if (account->health != AccountHealth::CaptchaPending) {
        logger_->warn("Ignoring resolution for {} in state {}", username, to_string(account->health));
        return false;
    }
    account->health = AccountHealth::Healthy;
    logger_->info(R"({{"component":"accounts","action":"resolved","account":"{}"}})", username);
    return true;
}

bool AccountManager::mark_banned(const std::string& username) {
    std::scoped_lock lock(mutex_);
    Account* account = find_locked(username, "mark_banned");
    if (account == nullptr) {
        return false;
    }
    if (account->health == AccountHealth::Banned) {
        return false;
    }
    account->health = AccountHealth::Banned;
    account->bound_worker.reset();
    account->cooldown_until.reset();
    logger_->warn(R"({{"component":"accounts","action":"banned","account":"{}"}})", username);
    return true;
}

bool AccountManager::mark_cooldown(const std::string& username, TimePoint until) {
    std::scoped_lock lock(mutex_);
    Account* account = find_locked(username, "mark_cooldown");
    if (account == nullptr) {
        return false;
    }
    if (account->health != AccountHealth::Healthy && account->health != AccountHealth::Cooldown) {
        logger_->warn("Account {} cannot cool down from {}", username, to_string(account->health));
        return false;
    }
    account->health = AccountHealth::Cooldown;
    account->cooldown_until = until;
    account->bound_worker.reset();
    logger_->info(R"({{"component":"accounts","action":"cooldown","account":"{}"}})", username);
    return true;
}

std::optional<AccountHealth> AccountManager::health(const std::string& username) const {
    std::scoped_lock lock(mutex_);
    const auto iterator_account = map_accounts_.find(username);
    if (iterator_account == map_accounts_.end()) {
        return std::nullopt;
    }
    return iterator_account->second.health;
}

std::size_t AccountManager::pending_challenges() const {
    std::scoped_lock lock(mutex_);
    std::size_t pending = 0;
    for (const auto& [username, account] : map_accounts_) {
        if (account.health == AccountHealth::CaptchaPending) {
            ++pending;
        }
    }
    return pending;
}

std::size_t AccountManager::available(TimePoint now) const {
    std::scoped_lock lock(mutex_);
    std::size_t issuable = 0;
    for (const auto& [username, account] : map_accounts_) {
        if (is_issuable(account, now)) {
            ++issuable;
        }
    }
    return issuable;
}

AccountCounts AccountManager::counts() const {
    std::scoped_lock lock(mutex_);
    AccountCounts account_counts{};
    for (const auto& [username, account] : map_accounts_) {
        switch (account.health) {
            case AccountHealth::Healthy:
                ++account_counts.healthy;
                break;
            case AccountHealth::Cooldown:
                ++account_counts.cooldown;
                break;
            case AccountHealth::CaptchaPending:
                ++account_counts.captcha_pending;
                break;
            case AccountHealth::Banned:
                ++account_counts.banned;
                break;
        }
        if (account.bound_worker.has_value()) {
            ++account_counts.bound;
        }
    }
    return account_counts;
}

std::vector<Account> AccountManager::snapshot() const {
    std::scoped_lock lock(mutex_);
    std::vector<Account> list_accounts;
    list_accounts.reserve(map_accounts_.size());
    for (const auto& [username, account] : map_accounts_) {
        list_accounts.push_back(account);
    }
    return list_accounts;
}

Account* AccountManager::find_locked(const std::string& username, std::string_view operation) {
    const auto iterator_account = map_accounts_.find(username);
    if (iterator_account == map_accounts_.end()) {
        logger_->error("{} requested for unknown account {}", operation, username);
        return nullptr;
    }
    return &iterator_account->second;
}

bool AccountManager::is_issuable(const Account& account, TimePoint now) noexcept {
    if (account.bound_worker.has_value()) {
        return false;
    }
    if (account.health == AccountHealth::Healthy) {
        return true;
    }
    return account.health == AccountHealth::Cooldown
        && account.cooldown_until.has_value()
        && *account.cooldown_until <= now;
}

}  // namespace spawnwatch
