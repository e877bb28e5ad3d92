// === Spawn Catalog ===========================================================
//
// Authoritative in-memory view of known spawn points and their learned
// expiration windows. Produces deadline-ordered due targets for the scheduler
// and under-sampled exploration targets for idle workers.
//
// Locking: every entry carries its own mutex so upserts on different points
// never contend. The entry map sits behind a shared mutex that is only taken
// exclusively to insert a new point; the due-list scan holds it shared while
// copying entries one at a time.

#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "spawnwatch/logging.hpp"
#include "spawnwatch/spawn_point.hpp"
#include "spawnwatch/types.hpp"

namespace spawnwatch {

/**
 * @brief Tunables for expiration learning and exploration.
 */
struct CatalogConfig final {
    Duration cycle_period{Duration{3600.0}};         /**< Spawn points reappear once per cycle. */
    Duration default_duration{Duration{900.0}};      /**< Window length assumed until learned. */
    Duration consistency_tolerance{Duration{5.0}};   /**< Max phase disagreement for "consistent". */
    Duration stale_after{Duration{86'400.0}};        /**< Silence after which a point is stale. */
    double smoothing_alpha{0.5};                     /**< Weight of a new duration sample. */
    double exploration_cell_m{140.0};                /**< Edge length of exploration grid cells. */
    std::size_t max_exploration_cells{250'000};      /**< Cells enumerated per exploration query. */
};

/** @brief A spawn point whose next activity window falls inside the horizon. */
struct DueTarget final {
    std::string spawn_id{};
    GeodeticCoordinate position{};
    TimePoint window_start{};
    TimePoint deadline{};
    SpawnConfidence confidence{SpawnConfidence::None};
};

/**
 * @brief Restartable, lazily ordered sequence of due targets.
 *
 * Holds a consistent copy of the candidates taken at scan time; ordering by
 * deadline is produced incrementally as next() is called.
 */
class DueTargetSequence final {
  public:
    explicit DueTargetSequence(std::vector<DueTarget> targets);

    /** @brief Next target by earliest deadline, or nullopt when exhausted. */
    [[nodiscard]] std::optional<DueTarget> next();
    /** @brief Restart iteration from the earliest deadline. */
    void rewind();
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

  private:
    std::vector<DueTarget> list_source_;
    std::vector<DueTarget> list_heap_;
};

/** @brief Flavour of discovery target. */
enum class ExplorationKind {
    Mystery,  /**< Known spawn point with unknown timing. */
    Cell      /**< Grid cell of the scan region. */
};

/** @brief Location worth a discovery scan. */
struct ExplorationTarget final {
    ExplorationKind kind{ExplorationKind::Cell};
    std::string identifier{};
    GeodeticCoordinate position{};
    std::optional<TimePoint> last_visited{};
};

/** @brief Result of applying one observation. */
struct UpsertResult final {
    std::optional<SpawnPoint> point{}; /**< Entry after the update; empty when ignored. */
    bool created{};
    bool changed{};
};

/** @brief Number of catalog entries per confidence level. */
struct CatalogCounts final {
    std::size_t none{};
    std::size_t estimated{};
    std::size_t confirmed{};
    std::size_t stale{};
};

class SpawnCatalog final {
  public:
    explicit SpawnCatalog(CatalogConfig config);

    [[nodiscard]] const CatalogConfig& config() const noexcept;

    /** @brief Seed entries loaded from the store; existing identities are kept. */
    void load(const std::vector<SpawnPoint>& points);

    /** @brief Record or refine a spawn point from one observation. */
    UpsertResult upsert(const Observation& observation);

    /** @brief Spawn points whose activity window overlaps [now, now + horizon]. */
    [[nodiscard]] DueTargetSequence due_targets(TimePoint now, Duration horizon) const;

    /** @brief Under-sampled locations inside @p region, highest priority first. */
    [[nodiscard]] std::vector<ExplorationTarget> exploration_targets(const RegionBounds& region, TimePoint now, std::size_t limit) const;

    /** @brief Remember that the grid cell containing @p position was scanned. */
    void record_exploration(const GeodeticCoordinate& position, TimePoint visited_at);

    /** @brief Flag points silent for longer than stale_after; returns how many were newly flagged. */
    std::size_t mark_stale(TimePoint now);

    /** @brief Next expiration of @p point at or after @p now, advancing whole cycles. */
    [[nodiscard]] std::optional<TimePoint> next_expiration(const SpawnPoint& point, TimePoint now) const;

    [[nodiscard]] std::optional<SpawnPoint> get(const std::string& spawn_id) const;
    [[nodiscard]] std::vector<SpawnPoint> snapshot() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] CatalogCounts counts() const;

  private:
    struct Entry final {
        mutable std::mutex mutex;
        SpawnPoint point;
    };

    using CellKey = std::pair<long long, long long>;

    /** @brief Apply @p observation to an existing entry (entry lock held). */
    bool apply_observation(SpawnPoint& point, const Observation& observation);
    void apply_timed_sighting(SpawnPoint& point, const Observation& observation);
    void apply_miss(SpawnPoint& point, const Observation& observation);
    [[nodiscard]] double cycle_phase_seconds(TimePoint time_point) const;
    [[nodiscard]] CellKey cell_key_for(const GeodeticCoordinate& position) const;
    [[nodiscard]] GeodeticCoordinate cell_center(const CellKey& key) const;
    [[nodiscard]] double longitude_step_for_row(long long row) const;

    CatalogConfig config_;
    mutable std::shared_mutex map_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Entry>> map_entries_;
    mutable std::mutex exploration_mutex_;
    std::map<CellKey, TimePoint> map_explored_cells_;
    mutable std::size_t exploration_rotation_{};     /**< Lattice offset for oversized regions. */
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace spawnwatch
