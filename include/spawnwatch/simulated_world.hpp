// === Simulated World =========================================================
//
// Reference stand-in for the remote service so the tracker can run end to end
// without a network client. Hidden spawn points recur once per cycle with a
// fixed phase and duration; scans report what is active within the scan
// radius. Failures (timeouts, challenges, bans, quota exhaustion, malformed
// responses) are injected at a configurable rate, and solve_challenges()
// plays the role of the external challenge solver.

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "spawnwatch/account_manager.hpp"
#include "spawnwatch/collaborators.hpp"
#include "spawnwatch/logging.hpp"
#include "spawnwatch/types.hpp"

namespace spawnwatch {

struct SimulationConfig final {
    std::size_t spawn_count{200};
    double failure_rate{0.02};                       /**< Chance a scan fails in some way. */
    std::uint32_t seed{7};
    double scan_radius_m{70.0};
    Duration reveal_window{Duration{90.0}};          /**< Expiration is reported only this close to it. */
    Duration cycle_period{Duration{3600.0}};
    std::int64_t hash_quota_per_minute{0};           /**< 0 means unlimited. */
    Duration min_latency{Duration{0.02}};
    Duration max_latency{Duration{0.08}};
    Duration challenge_solve_delay{Duration{30.0}};
};

/** @brief A spawn point known only to the simulated service. */
struct HiddenSpawn final {
    GeodeticCoordinate position{};
    double phase_s{};     /**< Offset of the window start within the cycle. */
    double duration_s{};
};

class SimulatedWorld final : public ScanClient, public HashingQuotaClient {
  public:
    SimulatedWorld(SimulationConfig config, const RegionBounds& region);

    LoginResponse login(const AccountCredential& credential, Duration timeout) override;
    ScanResponse scan(const Session& session, const GeodeticCoordinate& position, Duration timeout) override;
    std::int64_t remaining_quota() override;

    /** @brief Resolve challenges older than the solve delay; returns how many were resolved. */
    std::size_t solve_challenges(AccountManager& account_manager, TimePoint now);

    [[nodiscard]] const std::vector<HiddenSpawn>& hidden_spawns() const noexcept;

  private:
    [[nodiscard]] ScanFailure inject_failure(const std::string& username, TimePoint now);

    SimulationConfig config_;
    std::vector<HiddenSpawn> list_spawns_;
    std::mutex mutex_;
    std::mt19937 random_engine_;
    std::uint64_t session_counter_{};
    std::set<std::string> set_banned_;
    std::unordered_map<std::string, TimePoint> map_challenged_since_;
    std::int64_t quota_used_{};
    std::int64_t quota_minute_{};
    std::shared_ptr<spdlog::logger> logger_;
};

using SimulatedWorldPtr = std::shared_ptr<SimulatedWorld>;

}  // namespace spawnwatch
