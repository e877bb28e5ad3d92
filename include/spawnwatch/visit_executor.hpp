// === Visit Executor ==========================================================
//
// Performs one visit on behalf of a worker: logs in (session cached per
// account), scans the target position, folds the scan into the spawn catalog,
// persists sightings and changed points, and classifies the result into a
// VisitOutcome. Every client call is bounded by a timeout and runs on a fixed
// set of call threads; the executor never retries on its own.

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "spawnwatch/client_call_pool.hpp"
#include "spawnwatch/collaborators.hpp"
#include "spawnwatch/logging.hpp"
#include "spawnwatch/spawn_catalog.hpp"
#include "spawnwatch/visit_outcome.hpp"
#include "spawnwatch/worker_pool.hpp"

namespace spawnwatch {

/** @brief Timeouts applied to client calls. */
struct VisitExecutorConfig final {
    Duration login_timeout{Duration{10.0}};
    Duration visit_timeout{Duration{10.0}};
    std::size_t call_threads{4};  /**< Upper bound on client calls in flight, overrunning ones included. */
};

class VisitExecutor final {
  public:
    /**
     * @param client  Network client; required.
     * @param store   Persistence; may be null to run without one.
     */
    VisitExecutor(VisitExecutorConfig config, ScanClientPtr client, SpawnCatalog& catalog, SpawnStorePtr store);

    /** @brief Run @p task with the account bound to @p worker. */
    VisitOutcome visit(const WorkerState& worker, const VisitTask& task);

    /** @brief Drop the cached session of @p username so the next visit logs in again. */
    void forget_session(const std::string& username);

  private:
    /** @brief Cached session for @p credential, logging in when absent. */
    std::optional<VisitOutcome> ensure_session(const AccountCredential& credential, Session& session);
    VisitOutcome apply_scan(const VisitTask& task, const ScanResult& result);
    VisitOutcome classify_failure(const std::string& username, const ScanFailure& failure);
    void persist_sighting(const Sighting& sighting);
    void persist_point(const SpawnPoint& point);

    VisitExecutorConfig config_;
    ScanClientPtr client_;
    SpawnCatalog& catalog_;
    SpawnStorePtr store_;
    ClientCallPool call_pool_;
    std::mutex session_mutex_;
    std::unordered_map<std::string, Session> map_sessions_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace spawnwatch
