#include "spawnwatch/simulated_world.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <thread>

#include <fmt/format.h>

#include "spawnwatch/geodesy.hpp"

namespace spawnwatch {

namespace {
constexpr std::array<double, 2> k_spawn_durations_s{900.0, 1800.0};
constexpr double k_login_failure_share{0.25};  /**< Login failures as a share of failure_rate. */

/** @brief Cumulative shares of each failure kind once a failure is drawn. */
constexpr double k_transient_share{0.45};
constexpr double k_challenged_share{0.65};
constexpr double k_protocol_share{0.80};
constexpr double k_rate_limited_share{0.90};
}  // namespace

SimulatedWorld::SimulatedWorld(SimulationConfig config, const RegionBounds& region)
    : config_(config),
      random_engine_(config.seed),
      logger_(get_logger()) {
    if (!region.is_valid()) {
        throw std::invalid_argument("SimulatedWorld region is invalid");
    }
    if (config_.cycle_period.count() <= 0.0 || config_.max_latency < config_.min_latency) {
        throw std::invalid_argument("SimulatedWorld timing configuration is inconsistent");
    }

    std::uniform_real_distribution<double> latitude(region.south_deg, region.north_deg);
    std::uniform_real_distribution<double> longitude(region.west_deg, region.east_deg);
    std::uniform_real_distribution<double> phase(0.0, config_.cycle_period.count());
    std::uniform_int_distribution<std::size_t> duration_index(0, k_spawn_durations_s.size() - 1);
    list_spawns_.reserve(config_.spawn_count);
    for (std::size_t index = 0; index < config_.spawn_count; ++index) {
        HiddenSpawn spawn{};
        spawn.position = GeodeticCoordinate{latitude(random_engine_), longitude(random_engine_)};
        spawn.phase_s = phase(random_engine_);
        spawn.duration_s = std::min(k_spawn_durations_s[duration_index(random_engine_)], config_.cycle_period.count());
        list_spawns_.push_back(spawn);
    }
    logger_->info("Simulated world seeded with {} hidden spawn points", list_spawns_.size());
}

LoginResponse SimulatedWorld::login(const AccountCredential& credential, Duration) {
    std::scoped_lock lock(mutex_);
    std::uniform_real_distribution<double> roll(0.0, 1.0);
    if (roll(random_engine_) < config_.failure_rate * k_login_failure_share) {
        return AuthError{"auth service unavailable"};
    }
    return Session{credential.username, fmt::format("{}-{}", credential.username, ++session_counter_), WallClock::now()};
}

ScanResponse SimulatedWorld::scan(const Session& session, const GeodeticCoordinate& position, Duration timeout) {
    Duration latency{};
    {
        std::scoped_lock lock(mutex_);
        std::uniform_real_distribution<double> latency_roll(config_.min_latency.count(), config_.max_latency.count());
        latency = std::min(Duration{latency_roll(random_engine_)}, timeout);
    }
    std::this_thread::sleep_for(latency);

    const TimePoint now = WallClock::now();
    std::scoped_lock lock(mutex_);
    if (set_banned_.count(session.username) > 0) {
        return ScanFailure{ScanFailureKind::Banned, "account is banned", std::nullopt};
    }
    if (map_challenged_since_.count(session.username) > 0) {
        return ScanFailure{ScanFailureKind::Challenged, "challenge still pending", std::nullopt};
    }

    if (config_.hash_quota_per_minute > 0) {
        const double epoch_s = to_epoch_seconds(now);
        const auto minute = static_cast<std::int64_t>(std::floor(epoch_s / 60.0));
        if (minute != quota_minute_) {
            quota_minute_ = minute;
            quota_used_ = 0;
        }
        if (quota_used_ >= config_.hash_quota_per_minute) {
            const Duration retry_after{static_cast<double>(minute + 1) * 60.0 - epoch_s};
            return ScanFailure{ScanFailureKind::RateLimited, "hash quota exhausted", retry_after};
        }
        ++quota_used_;
    }

    std::uniform_real_distribution<double> roll(0.0, 1.0);
    if (roll(random_engine_) < config_.failure_rate) {
        return inject_failure(session.username, now);
    }

    ScanResult result{};
    result.scanned_at = now;
    const double epoch_s = to_epoch_seconds(now);
    const double cycle_s = config_.cycle_period.count();
    for (std::size_t index = 0; index < list_spawns_.size(); ++index) {
        const HiddenSpawn& spawn = list_spawns_[index];
        if (haversine_distance_m(position, spawn.position) > config_.scan_radius_m) {
            continue;
        }
        const double into_window_s = std::fmod(std::fmod(epoch_s - spawn.phase_s, cycle_s) + cycle_s, cycle_s);
        if (into_window_s >= spawn.duration_s) {
            result.nearby_spawn_points.push_back(spawn.position);
            continue;
        }
        EntitySighting sighting{};
        sighting.position = spawn.position;
        sighting.observed_at = now;
        const double remaining_s = spawn.duration_s - into_window_s;
        if (remaining_s <= config_.reveal_window.count()) {
            sighting.expires_at = now + to_clock_duration(Duration{remaining_s});
        }
        sighting.attributes["entity_id"] = std::to_string(index % 151 + 1);
        result.sightings.push_back(std::move(sighting));
    }
    return result;
}

std::int64_t SimulatedWorld::remaining_quota() {
    std::scoped_lock lock(mutex_);
    if (config_.hash_quota_per_minute <= 0) {
        return std::numeric_limits<std::int64_t>::max();
    }
    const auto minute = static_cast<std::int64_t>(std::floor(to_epoch_seconds(WallClock::now()) / 60.0));
    if (minute != quota_minute_) {
        return config_.hash_quota_per_minute;
    }
    return std::max<std::int64_t>(0, config_.hash_quota_per_minute - quota_used_);
}

std::size_t SimulatedWorld::solve_challenges(AccountManager& account_manager, TimePoint now) {
    std::vector<std::string> list_solved;
    {
        std::scoped_lock lock(mutex_);
        for (auto iterator_challenge = map_challenged_since_.begin(); iterator_challenge != map_challenged_since_.end();) {
            if (now - iterator_challenge->second >= to_clock_duration(config_.challenge_solve_delay)) {
                list_solved.push_back(iterator_challenge->first);
                iterator_challenge = map_challenged_since_.erase(iterator_challenge);
            } else {
                ++iterator_challenge;
            }
        }
    }
    std::size_t resolved = 0;
    for (const std::string& username : list_solved) {
        if (account_manager.resolve(username)) {
            ++resolved;
        }
    }
    return resolved;
}

const std::vector<HiddenSpawn>& SimulatedWorld::hidden_spawns() const noexcept {
    return list_spawns_;
}

ScanFailure SimulatedWorld::inject_failure(const std::string& username, TimePoint now) {
    std::uniform_real_distribution<double> roll(0.0, 1.0);
    const double kind_roll = roll(random_engine_);
    if (kind_roll < k_transient_share) {
        return ScanFailure{ScanFailureKind::Transient, "connection reset", std::nullopt};
    }
    if (kind_roll < k_challenged_share) {
        map_challenged_since_[username] = now;
        return ScanFailure{ScanFailureKind::Challenged, "captcha required", std::nullopt};
    }
    if (kind_roll < k_protocol_share) {
        return ScanFailure{ScanFailureKind::ProtocolError, "unexpected response envelope", std::nullopt};
    }
    if (kind_roll < k_rate_limited_share) {
        return ScanFailure{ScanFailureKind::RateLimited, "hashing server busy", std::nullopt};
    }
    set_banned_.insert(username);
    return ScanFailure{ScanFailureKind::Banned, "account banned", std::nullopt};
}

}  // namespace spawnwatch
