// === Spawn Point Records =====================================================
//
// Value types describing spawn points, the observations that refine them, and
// the immutable sightings persisted through the store.

#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include "spawnwatch/types.hpp"

namespace spawnwatch {

/**
 * @brief Catalog entry for one spawn point.
 */
struct SpawnPoint final {
    std::string identifier{};                               /**< Position-derived identity. */
    GeodeticCoordinate position{};                          /**< Fixed location of the spawn point. */
    std::optional<TimePoint> known_expiration{};            /**< Latest observed expiration instant. */
    std::optional<Duration> duration_estimate{};            /**< Learned length of the active window. */
    Duration duration_lower_bound{Duration{0.0}};           /**< Largest remaining time ever observed. */
    TimePoint last_seen{};                                  /**< Most recent sighting or discovery. */
    std::optional<TimePoint> last_observed_at{};            /**< Newest observation applied (replay guard). */
    std::optional<TimePoint> last_visited_at{};             /**< Newest sighting or miss; not persisted. */
    SpawnConfidence confidence{SpawnConfidence::None};      /**< Trust in known_expiration. */
    std::size_t consistent_observations{};                  /**< Timed observations agreeing on the phase. */
    bool stale{};                                           /**< Silent for longer than the staleness limit. */
};

/**
 * @brief Immutable record of an entity seen at a spawn point.
 */
struct Sighting final {
    std::string spawn_id{};
    GeodeticCoordinate position{};
    TimePoint observed_at{};
    std::optional<TimePoint> expires_at{};
    std::map<std::string, std::string> attributes{}; /**< Opaque entity attributes from the client. */
};

/**
 * @brief What a visit learned about a single spawn point.
 */
enum class ObservationKind {
    Sighted,    /**< Entity present. */
    Missed,     /**< Point visited while its entity was absent. */
    Discovered  /**< Service listed the point without an entity. */
};

/** @brief Input to SpawnCatalog::upsert. */
struct Observation final {
    ObservationKind kind{ObservationKind::Sighted};
    GeodeticCoordinate position{};
    TimePoint observed_at{};
    std::optional<TimePoint> expires_at{}; /**< Only meaningful for Sighted. */
};

/**
 * @brief Derive the catalog identity of a position (about 1 m resolution).
 */
[[nodiscard]] std::string make_spawn_id(const GeodeticCoordinate& position);

}  // namespace spawnwatch
