#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include "spawnwatch/account_manager.hpp"
#include "spawnwatch/collaborators.hpp"
#include "spawnwatch/geodesy.hpp"

namespace spawnwatch::test {

/** @brief Client replaying queued responses; an empty queue yields an empty scan. */
class ScriptedClient final : public ScanClient {
  public:
    LoginResponse login(const AccountCredential& credential, Duration) override {
        std::scoped_lock lock(mutex_);
        ++login_calls_;
        if (!queue_logins_.empty()) {
            LoginResponse response = queue_logins_.front();
            queue_logins_.pop_front();
            return response;
        }
        return Session{credential.username, "token-" + credential.username, WallClock::now()};
    }

    ScanResponse scan(const Session&, const GeodeticCoordinate& position, Duration) override {
        Duration delay{};
        bool should_throw = false;
        ScanResponse response = ScanResult{WallClock::now(), {}, {}};
        {
            std::scoped_lock lock(mutex_);
            ++scan_calls_;
            list_scanned_positions_.push_back(position);
            delay = scan_delay_;
            should_throw = throw_on_scan_;
            if (!queue_scans_.empty()) {
                response = queue_scans_.front();
                queue_scans_.pop_front();
            }
        }
        if (delay.count() > 0.0) {
            std::this_thread::sleep_for(delay);
        }
        if (should_throw) {
            throw std::runtime_error("malformed envelope");
        }
        return response;
    }

    void push_login(LoginResponse response) {
        std::scoped_lock lock(mutex_);
        queue_logins_.push_back(std::move(response));
    }

    void push_scan(ScanResponse response) {
        std::scoped_lock lock(mutex_);
        queue_scans_.push_back(std::move(response));
    }

    void set_scan_delay(Duration delay) {
        std::scoped_lock lock(mutex_);
        scan_delay_ = delay;
    }

    void set_throw_on_scan(bool should_throw) {
        std::scoped_lock lock(mutex_);
        throw_on_scan_ = should_throw;
    }

    [[nodiscard]] std::size_t login_calls() const {
        std::scoped_lock lock(mutex_);
        return login_calls_;
    }

    [[nodiscard]] std::size_t scan_calls() const {
        std::scoped_lock lock(mutex_);
        return scan_calls_;
    }

  private:
    mutable std::mutex mutex_;
    std::deque<LoginResponse> queue_logins_;
    std::deque<ScanResponse> queue_scans_;
    std::vector<GeodeticCoordinate> list_scanned_positions_;
    Duration scan_delay_{};
    bool throw_on_scan_{};
    std::size_t login_calls_{};
    std::size_t scan_calls_{};
};

/** @brief Store keeping everything in memory, optionally failing every write. */
class RecordingStore final : public SpawnStore {
  public:
    std::vector<SpawnPoint> load_spawn_points() override {
        std::scoped_lock lock(mutex_);
        return list_seed_points;
    }

    void save_sighting(const Sighting& sighting) override {
        std::scoped_lock lock(mutex_);
        if (fail_writes) {
            throw std::runtime_error("disk full");
        }
        list_sightings.push_back(sighting);
    }

    void save_spawn_point(const SpawnPoint& point) override {
        std::scoped_lock lock(mutex_);
        if (fail_writes) {
            throw std::runtime_error("disk full");
        }
        list_points.push_back(point);
    }

    std::vector<SpawnPoint> list_seed_points;
    std::vector<Sighting> list_sightings;
    std::vector<SpawnPoint> list_points;
    bool fail_writes{};

  private:
    std::mutex mutex_;
};

/** @brief Quota collaborator returning a fixed value. */
class FixedQuota final : public HashingQuotaClient {
  public:
    explicit FixedQuota(std::int64_t remaining) : remaining_(remaining) {}

    std::int64_t remaining_quota() override {
        return remaining_;
    }

  private:
    std::int64_t remaining_;
};

inline std::vector<AccountCredential> make_credentials(std::size_t count) {
    std::vector<AccountCredential> list_credentials;
    for (std::size_t index = 0; index < count; ++index) {
        list_credentials.push_back(AccountCredential{fmt::format("account-{}", index), "secret", "ptc"});
    }
    return list_credentials;
}

inline TimePoint at_seconds(double epoch_seconds) {
    return from_epoch_seconds(epoch_seconds);
}

/** @brief Point @p metres due north of @p origin. */
inline GeodeticCoordinate north_of(const GeodeticCoordinate& origin, double metres) {
    return offset_coordinate(origin, 0.0, metres);
}

}  // namespace spawnwatch::test
