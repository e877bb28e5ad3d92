#include "spawnwatch/spawn_catalog.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

#include "spawnwatch/geodesy.hpp"

namespace spawnwatch {

namespace {

/**
 * @brief Heap ordering that surfaces the earliest deadline first.
 */
bool later_deadline(const DueTarget& lhs, const DueTarget& rhs) {
    if (lhs.deadline != rhs.deadline) {
        return lhs.deadline > rhs.deadline;
    }
    return lhs.spawn_id > rhs.spawn_id;
}

/**
 * @brief Older (or never) visited targets first; identifier breaks ties.
 */
bool less_recently_visited(const ExplorationTarget& lhs, const ExplorationTarget& rhs) {
    if (lhs.last_visited != rhs.last_visited) {
        if (!lhs.last_visited.has_value()) {
            return true;
        }
        if (!rhs.last_visited.has_value()) {
            return false;
        }
        return *lhs.last_visited < *rhs.last_visited;
    }
    return lhs.identifier < rhs.identifier;
}

}  // namespace

std::string make_spawn_id(const GeodeticCoordinate& position) {
    return fmt::format("{:.5f}_{:.5f}", position.latitude_deg, position.longitude_deg);
}

DueTargetSequence::DueTargetSequence(std::vector<DueTarget> targets)
    : list_source_(std::move(targets)) {
    std::make_heap(list_source_.begin(), list_source_.end(), later_deadline);
    list_heap_ = list_source_;
}

std::optional<DueTarget> DueTargetSequence::next() {
    if (list_heap_.empty()) {
        return std::nullopt;
    }
    std::pop_heap(list_heap_.begin(), list_heap_.end(), later_deadline);
    DueTarget target = std::move(list_heap_.back());
    list_heap_.pop_back();
    return target;
}

void DueTargetSequence::rewind() {
    list_heap_ = list_source_;
}

std::size_t DueTargetSequence::size() const noexcept {
    return list_source_.size();
}

bool DueTargetSequence::empty() const noexcept {
    return list_source_.empty();
}

SpawnCatalog::SpawnCatalog(CatalogConfig config)
    : config_(config),
      logger_(get_logger()) {
    if (config_.cycle_period.count() <= 0.0) {
        throw std::invalid_argument("SpawnCatalog cycle period must be positive");
    }
    if (config_.default_duration.count() <= 0.0 || config_.default_duration > config_.cycle_period) {
        throw std::invalid_argument("SpawnCatalog default duration must lie within the cycle period");
    }
    if (config_.smoothing_alpha <= 0.0 || config_.smoothing_alpha > 1.0) {
        throw std::invalid_argument("SpawnCatalog smoothing alpha must be in (0, 1]");
    }
    if (config_.exploration_cell_m <= 0.0) {
        throw std::invalid_argument("SpawnCatalog exploration cell size must be positive");
    }
}

const CatalogConfig& SpawnCatalog::config() const noexcept {
    return config_;
}

void SpawnCatalog::load(const std::vector<SpawnPoint>& points) {
    std::unique_lock lock(map_mutex_);
    std::size_t loaded_count = 0;
    for (const SpawnPoint& point : points) {
        SpawnPoint normalized = point;
        normalized.identifier = make_spawn_id(point.position);
        auto [iterator_entry, inserted] = map_entries_.try_emplace(normalized.identifier, nullptr);
        if (!inserted) {
            continue;
        }
        iterator_entry->second = std::make_unique<Entry>();
        iterator_entry->second->point = std::move(normalized);
        ++loaded_count;
    }
    logger_->info("Spawn catalog loaded {} of {} stored points", loaded_count, points.size());
}

UpsertResult SpawnCatalog::upsert(const Observation& observation) {
    const std::string spawn_id = make_spawn_id(observation.position);

    {
        std::shared_lock lock(map_mutex_);
        const auto iterator_entry = map_entries_.find(spawn_id);
        if (iterator_entry != map_entries_.end()) {
            Entry& entry = *iterator_entry->second;
            std::scoped_lock entry_lock(entry.mutex);
            const bool changed = apply_observation(entry.point, observation);
            return UpsertResult{entry.point, false, changed};
        }
    }

    if (observation.kind == ObservationKind::Missed) {
        logger_->debug("Ignoring miss at unknown spawn point {}", spawn_id);
        return UpsertResult{};
    }

    std::unique_lock lock(map_mutex_);
    auto [iterator_entry, inserted] = map_entries_.try_emplace(spawn_id, nullptr);
    if (inserted) {
        iterator_entry->second = std::make_unique<Entry>();
        SpawnPoint& point = iterator_entry->second->point;
        point.identifier = spawn_id;
        point.position = observation.position;
        point.last_seen = observation.observed_at;
    }
    Entry& entry = *iterator_entry->second;
    std::scoped_lock entry_lock(entry.mutex);
    const bool changed = apply_observation(entry.point, observation);
    if (inserted) {
        logger_->debug(
            R"({{"component":"catalog","action":"discovered","spawn":"{}","confidence":"{}"}})",
            spawn_id,
            to_string(entry.point.confidence)
        );
    }
    return UpsertResult{entry.point, inserted, changed || inserted};
}

bool SpawnCatalog::apply_observation(SpawnPoint& point, const Observation& observation) {
    if (point.last_observed_at.has_value() && observation.observed_at <= *point.last_observed_at) {
        return false;
    }
    point.last_observed_at = observation.observed_at;

    switch (observation.kind) {
        case ObservationKind::Sighted: {
            point.last_visited_at = observation.observed_at;
            point.last_seen = std::max(point.last_seen, observation.observed_at);
            point.stale = false;
            if (observation.expires_at.has_value() && *observation.expires_at > observation.observed_at) {
                apply_timed_sighting(point, observation);
            }
            break;
        }
        case ObservationKind::Discovered: {
            point.last_seen = std::max(point.last_seen, observation.observed_at);
            point.stale = false;
            break;
        }
        case ObservationKind::Missed: {
            point.last_visited_at = observation.observed_at;
            apply_miss(point, observation);
            break;
        }
    }
    return true;
}

void SpawnCatalog::apply_timed_sighting(SpawnPoint& point, const Observation& observation) {
    const TimePoint expires_at = *observation.expires_at;
    const Duration remaining = expires_at - observation.observed_at;

    if (!point.known_expiration.has_value()) {
        point.known_expiration = expires_at;
        point.consistent_observations = 1;
        point.confidence = SpawnConfidence::Estimated;
    } else {
        const double phase_difference = std::fabs(cycle_phase_seconds(expires_at) - cycle_phase_seconds(*point.known_expiration));
        const double circular_difference = std::min(phase_difference, config_.cycle_period.count() - phase_difference);
        if (circular_difference <= config_.consistency_tolerance.count()) {
            ++point.consistent_observations;
            if (point.consistent_observations >= 2) {
                point.confidence = SpawnConfidence::Confirmed;
            }
            point.known_expiration = std::max(*point.known_expiration, expires_at);
        } else {
            logger_->warn(
                R"({{"component":"catalog","action":"expiration_shift","spawn":"{}","phase_delta_s":{:.1f},"confidence":"{}"}})",
                point.identifier,
                circular_difference,
                to_string(point.confidence)
            );
            point.known_expiration = expires_at;
            point.consistent_observations = 1;
            if (point.confidence == SpawnConfidence::None) {
                point.confidence = SpawnConfidence::Estimated;
            }
        }
    }

    point.duration_lower_bound = std::max(point.duration_lower_bound, remaining);
    const Duration current = point.duration_estimate.value_or(config_.default_duration);
    point.duration_estimate = std::min(std::max(current, point.duration_lower_bound), config_.cycle_period);
}

void SpawnCatalog::apply_miss(SpawnPoint& point, const Observation& observation) {
    if (!point.known_expiration.has_value()) {
        return;
    }
    const std::optional<TimePoint> expiration = next_expiration(point, observation.observed_at);
    if (!expiration.has_value()) {
        return;
    }
    const Duration current = point.duration_estimate.value_or(config_.default_duration);
    const TimePoint predicted_start = *expiration - to_clock_duration(current);
    if (observation.observed_at < predicted_start) {
        return;
    }
    // Absent inside the predicted window: the real window starts after this visit.
    const Duration upper_bound = *expiration - observation.observed_at;
    if (upper_bound >= current) {
        return;
    }
    const Duration smoothed{config_.smoothing_alpha * upper_bound.count() + (1.0 - config_.smoothing_alpha) * current.count()};
    point.duration_estimate = std::max(smoothed, point.duration_lower_bound);
}

DueTargetSequence SpawnCatalog::due_targets(TimePoint now, Duration horizon) const {
    const TimePoint horizon_end = now + to_clock_duration(horizon);
    std::vector<DueTarget> list_due;

    std::shared_lock lock(map_mutex_);
    list_due.reserve(map_entries_.size());
    for (const auto& [spawn_id, entry] : map_entries_) {
        std::scoped_lock entry_lock(entry->mutex);
        const SpawnPoint& point = entry->point;
        if (point.stale) {
            continue;
        }
        const std::optional<TimePoint> expiration = next_expiration(point, now);
        if (!expiration.has_value()) {
            continue;
        }
        const Duration duration = point.duration_estimate.value_or(config_.default_duration);
        const TimePoint window_start = *expiration - to_clock_duration(duration);
        if (window_start > horizon_end) {
            continue;
        }
        list_due.push_back(DueTarget{spawn_id, point.position, window_start, *expiration, point.confidence});
    }
    return DueTargetSequence{std::move(list_due)};
}

std::vector<ExplorationTarget> SpawnCatalog::exploration_targets(const RegionBounds& region, TimePoint, std::size_t limit) const {
    std::vector<ExplorationTarget> list_mysteries;
    {
        std::shared_lock lock(map_mutex_);
        for (const auto& [spawn_id, entry] : map_entries_) {
            std::scoped_lock entry_lock(entry->mutex);
            const SpawnPoint& point = entry->point;
            if (point.stale || point.confidence != SpawnConfidence::None || !region.contains(point.position)) {
                continue;
            }
            list_mysteries.push_back(ExplorationTarget{ExplorationKind::Mystery, spawn_id, point.position, point.last_observed_at});
        }
    }
    std::sort(list_mysteries.begin(), list_mysteries.end(), less_recently_visited);
    if (list_mysteries.size() >= limit) {
        list_mysteries.resize(limit);
        return list_mysteries;
    }

    std::vector<ExplorationTarget> list_cells;
    {
        std::scoped_lock lock(exploration_mutex_);
        const CellKey south_west = cell_key_for(GeodeticCoordinate{region.south_deg, region.west_deg});
        const CellKey north_east = cell_key_for(GeodeticCoordinate{region.north_deg, region.east_deg});
        const double middle_step_lon = longitude_step_for_row((south_west.first + north_east.first) / 2);
        const double row_count = static_cast<double>(north_east.first - south_west.first + 1);
        const double column_count = std::floor(region.east_deg / middle_step_lon) - std::floor(region.west_deg / middle_step_lon) + 1.0;

        // Oversized regions are sampled on a coarser lattice whose offset
        // rotates every call, so all rows and columns take turns.
        long long stride = 1;
        const double cell_budget = static_cast<double>(std::max<std::size_t>(config_.max_exploration_cells, 1));
        if (row_count * column_count > cell_budget) {
            stride = static_cast<long long>(std::ceil(std::sqrt(row_count * column_count / cell_budget)));
        }
        const long long lattice_offset = static_cast<long long>(exploration_rotation_++ % static_cast<std::size_t>(stride * stride));
        const long long row_offset = lattice_offset / stride;
        const long long column_offset = lattice_offset % stride;

        for (long long row = south_west.first + row_offset; row <= north_east.first; row += stride) {
            const double step_lon = longitude_step_for_row(row);
            const auto first_column = static_cast<long long>(std::floor(region.west_deg / step_lon));
            const auto last_column = static_cast<long long>(std::floor(region.east_deg / step_lon));
            for (long long column = first_column + column_offset; column <= last_column; column += stride) {
                if (list_cells.size() >= config_.max_exploration_cells) {
                    break;
                }
                const CellKey key{row, column};
                std::optional<TimePoint> last_visited;
                const auto iterator_cell = map_explored_cells_.find(key);
                if (iterator_cell != map_explored_cells_.end()) {
                    last_visited = iterator_cell->second;
                }
                list_cells.push_back(ExplorationTarget{
                    ExplorationKind::Cell,
                    fmt::format("cell:{}:{}", row, column),
                    cell_center(key),
                    last_visited
                });
            }
        }
    }

    const std::size_t remaining = limit - list_mysteries.size();
    const auto middle = list_cells.begin() + static_cast<std::ptrdiff_t>(std::min(remaining, list_cells.size()));
    std::partial_sort(list_cells.begin(), middle, list_cells.end(), less_recently_visited);
    list_mysteries.insert(list_mysteries.end(), list_cells.begin(), middle);
    return list_mysteries;
}

void SpawnCatalog::record_exploration(const GeodeticCoordinate& position, TimePoint visited_at) {
    std::scoped_lock lock(exploration_mutex_);
    TimePoint& last_visited = map_explored_cells_[cell_key_for(position)];
    last_visited = std::max(last_visited, visited_at);
}

std::size_t SpawnCatalog::mark_stale(TimePoint now) {
    const TimePoint cutoff = now - to_clock_duration(config_.stale_after);
    std::size_t flagged_count = 0;
    std::shared_lock lock(map_mutex_);
    for (const auto& [spawn_id, entry] : map_entries_) {
        std::scoped_lock entry_lock(entry->mutex);
        SpawnPoint& point = entry->point;
        if (!point.stale && point.last_seen < cutoff) {
            point.stale = true;
            ++flagged_count;
        }
    }
    if (flagged_count > 0) {
        logger_->info(R"({{"component":"catalog","action":"mark_stale","count":{}}})", flagged_count);
    }
    return flagged_count;
}

std::optional<TimePoint> SpawnCatalog::next_expiration(const SpawnPoint& point, TimePoint now) const {
    if (!point.known_expiration.has_value()) {
        return std::nullopt;
    }
    const TimePoint known = *point.known_expiration;
    if (known >= now) {
        return known;
    }
    const double cycles_elapsed = std::ceil((now - known) / config_.cycle_period);
    return known + to_clock_duration(config_.cycle_period * cycles_elapsed);
}

std::optional<SpawnPoint> SpawnCatalog::get(const std::string& spawn_id) const {
    std::shared_lock lock(map_mutex_);
    const auto iterator_entry = map_entries_.find(spawn_id);
    if (iterator_entry == map_entries_.end()) {
        return std::nullopt;
    }
    std::scoped_lock entry_lock(iterator_entry->second->mutex);
    return iterator_entry->second->point;
}

std::vector<SpawnPoint> SpawnCatalog::snapshot() const {
    std::vector<SpawnPoint> list_points;
    std::shared_lock lock(map_mutex_);
    list_points.reserve(map_entries_.size());
    for (const auto& [spawn_id, entry] : map_entries_) {
        std::scoped_lock entry_lock(entry->mutex);
        list_points.push_back(entry->point);
    }
    return list_points;
}

std::size_t SpawnCatalog::size() const {
    std::shared_lock lock(map_mutex_);
    return map_entries_.size();
}

CatalogCounts SpawnCatalog::counts() const {
    CatalogCounts catalog_counts{};
    std::shared_lock lock(map_mutex_);
    for (const auto& [spawn_id, entry] : map_entries_) {
        std::scoped_lock entry_lock(entry->mutex);
        switch (entry->point.confidence) {
            case SpawnConfidence::None:
                ++catalog_counts.none;
                break;
            case SpawnConfidence::Estimated:
                ++catalog_counts.estimated;
                break;
            case SpawnConfidence::Confirmed:
                ++catalog_counts.confirmed;
                break;
        }
        if (entry->point.stale) {
            ++catalog_counts.stale;
        }
    }
    return catalog_counts;
}

double SpawnCatalog::cycle_phase_seconds(TimePoint time_point) const {
    const double phase = std::fmod(to_epoch_seconds(time_point), config_.cycle_period.count());
    return phase < 0.0 ? phase + config_.cycle_period.count() : phase;
}

SpawnCatalog::CellKey SpawnCatalog::cell_key_for(const GeodeticCoordinate& position) const {
    const double step_lat = config_.exploration_cell_m / metres_per_degree_latitude();
    const auto row = static_cast<long long>(std::floor(position.latitude_deg / step_lat));
    const double step_lon = longitude_step_for_row(row);
    const auto column = static_cast<long long>(std::floor(position.longitude_deg / step_lon));
    return CellKey{row, column};
}

GeodeticCoordinate SpawnCatalog::cell_center(const CellKey& key) const {
    const double step_lat = config_.exploration_cell_m / metres_per_degree_latitude();
    const double step_lon = longitude_step_for_row(key.first);
    return GeodeticCoordinate{
        (static_cast<double>(key.first) + 0.5) * step_lat,
        (static_cast<double>(key.second) + 0.5) * step_lon
    };
}

double SpawnCatalog::longitude_step_for_row(long long row) const {
    const double step_lat = config_.exploration_cell_m / metres_per_degree_latitude();
    const GeodeticCoordinate row_center{(static_cast<double>(row) + 0.5) * step_lat, 0.0};
    return config_.exploration_cell_m / metres_per_degree_longitude(row_center);
}

}  // namespace spawnwatch
