// === External Collaborators ==================================================
//
// Interfaces for the systems the tracker depends on but does not implement:
// the network client of the remote service, the persistent store, and the
// hashing-quota service. The core only sees the classified result shapes
// declared here, never wire details.

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "spawnwatch/account_manager.hpp"
#include "spawnwatch/spawn_point.hpp"
#include "spawnwatch/types.hpp"

namespace spawnwatch {

/** @brief Authenticated client session bound to one account. */
struct Session final {
    std::string username{};
    std::string token{};
    TimePoint established_at{};
};

/** @brief Login rejection or failure to reach the auth service. */
struct AuthError final {
    std::string detail{};
};

using LoginResponse = std::variant<Session, AuthError>;

/** @brief Entity reported by a scan. */
struct EntitySighting final {
    GeodeticCoordinate position{};
    TimePoint observed_at{};
    std::optional<TimePoint> expires_at{};
    std::map<std::string, std::string> attributes{};
};

/** @brief Payload of a successful scan. */
struct ScanResult final {
    TimePoint scanned_at{};
    std::vector<EntitySighting> sightings{};
    std::vector<GeodeticCoordinate> nearby_spawn_points{}; /**< Spawn points listed without an entity. */
};

/** @brief Failure classes the client distinguishes. */
enum class ScanFailureKind {
    Transient,
    Challenged,
    Banned,
    RateLimited,
    ProtocolError
};

struct ScanFailure final {
    ScanFailureKind kind{ScanFailureKind::Transient};
    std::string detail{};
    std::optional<Duration> retry_after{};
};

using ScanResponse = std::variant<ScanResult, ScanFailure>;

/**
 * @brief Network client of the remote service.
 *
 * Implementations must honour @p timeout; the executor also abandons calls
 * that overrun it.
 */
class ScanClient {
  public:
    virtual ~ScanClient() = default;

    virtual LoginResponse login(const AccountCredential& credential, Duration timeout) = 0;
    virtual ScanResponse scan(const Session& session, const GeodeticCoordinate& position, Duration timeout) = 0;
};

/** @brief Best-effort persistence for catalog state and sightings. */
class SpawnStore {
  public:
    virtual ~SpawnStore() = default;

    virtual std::vector<SpawnPoint> load_spawn_points() = 0;
    virtual void save_sighting(const Sighting& sighting) = 0;
    virtual void save_spawn_point(const SpawnPoint& point) = 0;
};

/** @brief Shared hashing-quota service consulted when throttling. */
class HashingQuotaClient {
  public:
    virtual ~HashingQuotaClient() = default;

    virtual std::int64_t remaining_quota() = 0;
};

using ScanClientPtr = std::shared_ptr<ScanClient>;
using SpawnStorePtr = std::shared_ptr<SpawnStore>;
using HashingQuotaClientPtr = std::shared_ptr<HashingQuotaClient>;

}  // namespace spawnwatch
