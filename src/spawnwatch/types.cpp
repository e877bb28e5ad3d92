#include "spawnwatch/types.hpp"

namespace spawnwatch {

bool RegionBounds::contains(const GeodeticCoordinate& point) const noexcept {
    return point.latitude_deg >= south_deg && point.latitude_deg <= north_deg
        && point.longitude_deg >= west_deg && point.longitude_deg <= east_deg;
}

GeodeticCoordinate RegionBounds::center() const noexcept {
    return GeodeticCoordinate{(south_deg + north_deg) / 2.0, (west_deg + east_deg) / 2.0};
}

bool RegionBounds::is_valid() const noexcept {
    const bool latitudes_in_range = south_deg >= -90.0 && north_deg <= 90.0;
    const bool longitudes_in_range = west_deg >= -180.0 && east_deg <= 180.0;
    return latitudes_in_range && longitudes_in_range && north_deg > south_deg && east_deg > west_deg;
}

std::string_view to_string(SpawnConfidence confidence) noexcept {
    switch (confidence) {
        case SpawnConfidence::None:
            return "none";
        case SpawnConfidence::Estimated:
            return "estimated";
        case SpawnConfidence::Confirmed:
            return "confirmed";
    }
    return "unknown";
}

std::string_view to_string(AccountHealth health) noexcept {
    switch (health) {
        case AccountHealth::Healthy:
            return "healthy";
        case AccountHealth::Cooldown:
            return "cooldown";
        case AccountHealth::CaptchaPending:
            return "captcha_pending";
        case AccountHealth::Banned:
            return "banned";
    }
    return "unknown";
}

std::string_view to_string(WorkerStatus status) noexcept {
    switch (status) {
        case WorkerStatus::Idle:
            return "idle";
        case WorkerStatus::Traveling:
            return "traveling";
        case WorkerStatus::Visiting:
            return "visiting";
        case WorkerStatus::Recovering:
            return "recovering";
        case WorkerStatus::Retired:
            return "retired";
    }
    return "unknown";
}

std::string_view to_string(TargetKind kind) noexcept {
    switch (kind) {
        case TargetKind::Spawn:
            return "spawn";
        case TargetKind::Exploration:
            return "exploration";
    }
    return "unknown";
}

}  // namespace spawnwatch
