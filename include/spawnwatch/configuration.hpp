// === Configuration ===========================================================
//
// Exposes the strongly-typed configuration consumed across the tracker:
// region, fleet, catalog, dispatch, recovery, executor and simulation knobs.
// `ConfigurationLoader` translates environment variables (and an optional
// accounts CSV) into these structures so downstream modules never touch
// `std::getenv` directly.

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "spawnwatch/account_manager.hpp"
#include "spawnwatch/failure_recovery.hpp"
#include "spawnwatch/scheduler.hpp"
#include "spawnwatch/simulated_world.hpp"
#include "spawnwatch/spawn_catalog.hpp"
#include "spawnwatch/types.hpp"
#include "spawnwatch/visit_executor.hpp"
#include "spawnwatch/worker_pool.hpp"

namespace spawnwatch {

/** @brief Fatal configuration problem detected at startup. */
class ConfigurationError final : public std::runtime_error {
  public:
    explicit ConfigurationError(const std::string& message);
};

/**
 * @brief Immutable bundle of runtime knobs for the tracker.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct Configuration final {
    std::string log_directory{};
    std::string log_level{};                    /**< Empty keeps the logger default. */
    std::filesystem::path data_directory{};     /**< Home of the file-backed spawn store. */
    RegionBounds region{};
    std::vector<AccountCredential> accounts{};
    WorkerPoolConfig pool{};
    CatalogConfig catalog{};
    SchedulerConfig scheduler{};
    RecoveryConfig recovery{};
    VisitExecutorConfig executor{};
    SimulationConfig simulation{};
    Duration scheduler_interval{Duration{1.0}};
    Duration monitor_interval{Duration{30.0}};
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    /**
     * @brief Build and validate the configuration; initializes the logger.
     *
     * @throws ConfigurationError on zero accounts, invalid region bounds or a
     *         zero fleet size.
     */
    static Configuration load();

    /** @brief Parse `south,west,north,east` (two corners in degrees). */
    static RegionBounds parse_region_bounds(std::string_view raw_region);
    /** @brief Parse `user:pass[:provider];user:pass[:provider]`. */
    static std::vector<AccountCredential> parse_accounts(std::string_view raw_accounts);
    /** @brief Read a CSV with a `username,password,provider` header. */
    static std::vector<AccountCredential> load_accounts_csv(const std::filesystem::path& csv_path);
    /** @brief Reject configurations the tracker cannot run with. */
    static void validate(const Configuration& configuration);
};

}  // namespace spawnwatch
