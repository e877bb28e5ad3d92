// === Core Types ==============================================================
//
// Collects shared type aliases and lightweight structs/enums used throughout
// the tracker (time primitives, geodetic coordinates, region bounds, and the
// lifecycle enums for spawn points, accounts, and workers).

#pragma once

#include <chrono>
#include <string_view>

namespace spawnwatch {

/**
 * @brief Wall clock used across the tracker. Spawn cycles are aligned to
 *        wall-clock hours, so persisted timestamps must survive restarts.
 */
using WallClock = std::chrono::system_clock;

/**
 * @brief Alias for timestamps captured from the wall clock.
 */
using TimePoint = std::chrono::time_point<WallClock>;

/**
 * @brief Alias for durations measured in seconds with double precision.
 */
using Duration = std::chrono::duration<double>;

/**
 * @brief Represents a latitude/longitude pair in decimal degrees.
 */
struct GeodeticCoordinate final {
    double latitude_deg{};   /**< Latitude in decimal degrees. */
    double longitude_deg{};  /**< Longitude in decimal degrees. */
};

/**
 * @brief Axis-aligned latitude/longitude rectangle describing the scan area.
 */
struct RegionBounds final {
    double south_deg{};
    double west_deg{};
    double north_deg{};
    double east_deg{};

    [[nodiscard]] bool contains(const GeodeticCoordinate& point) const noexcept;
    [[nodiscard]] GeodeticCoordinate center() const noexcept;
    /** @brief True when the corners describe a non-empty area on the globe. */
    [[nodiscard]] bool is_valid() const noexcept;
};

/**
 * @brief How much the catalog trusts a spawn point's expiration estimate.
 */
enum class SpawnConfidence {
    None,       /**< Position known, timing unknown. */
    Estimated,  /**< A single timed observation. */
    Confirmed   /**< Two or more consistent timed observations. */
};

/**
 * @brief Health state machine for credentials.
 */
enum class AccountHealth {
    Healthy,         /**< Available for binding. */
    Cooldown,        /**< Temporarily parked until cooldown_until. */
    CaptchaPending,  /**< Waiting for an external challenge resolution. */
    Banned           /**< Terminal; never issued again. */
};

/**
 * @brief Enumerates the lifecycle states for workers.
 */
enum class WorkerStatus {
    Idle,        /**< Awaiting an assignment. */
    Traveling,   /**< Assigned and moving toward the target. */
    Visiting,    /**< Client call in flight. */
    Recovering,  /**< Backing off or waiting on account recovery. */
    Retired      /**< No account could be bound. */
};

/**
 * @brief Identifies what a visit is for.
 */
enum class TargetKind {
    Spawn,       /**< Known spawn point with a deadline. */
    Exploration  /**< Discovery scan of an under-sampled area. */
};

[[nodiscard]] std::string_view to_string(SpawnConfidence confidence) noexcept;
[[nodiscard]] std::string_view to_string(AccountHealth health) noexcept;
[[nodiscard]] std::string_view to_string(WorkerStatus status) noexcept;
[[nodiscard]] std::string_view to_string(TargetKind kind) noexcept;

/**
 * @brief Convert a floating-point duration into the wall clock's tick type.
 */
[[nodiscard]] inline WallClock::duration to_clock_duration(Duration duration) {
    return std::chrono::duration_cast<WallClock::duration>(duration);
}

/**
 * @brief Seconds since the Unix epoch, used for persistence and cycle math.
 */
[[nodiscard]] inline double to_epoch_seconds(TimePoint time_point) {
    return std::chrono::duration_cast<Duration>(time_point.time_since_epoch()).count();
}

[[nodiscard]] inline TimePoint from_epoch_seconds(double seconds) {
    return TimePoint{to_clock_duration(Duration{seconds})};
}

}  // namespace spawnwatch
