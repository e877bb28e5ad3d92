#include "spawnwatch/file_spawn_store.hpp"

#include <fstream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include <fmt/format.h>

namespace spawnwatch {

namespace {
constexpr char k_spawn_points_file[] = "spawn_points.csv";
constexpr char k_sightings_file[] = "sightings.csv";
constexpr char k_spawn_points_header[] =
    "identifier,latitude,longitude,known_expiration,duration_estimate,duration_lower_bound,"
    "last_seen,last_observed_at,confidence,consistent_observations,stale";
constexpr char k_sightings_header[] = "spawn_id,latitude,longitude,observed_at,expires_at,attributes";
constexpr std::size_t k_spawn_point_fields{11};

std::string format_optional_time(const std::optional<TimePoint>& time_point) {
    return time_point.has_value() ? fmt::format("{:.3f}", to_epoch_seconds(*time_point)) : std::string{};
}

std::optional<TimePoint> parse_optional_time(const std::string& field) {
    if (field.empty()) {
        return std::nullopt;
    }
    return from_epoch_seconds(std::stod(field));
}

std::vector<std::string> split_fields(const std::string& line) {
    std::vector<std::string> list_fields;
    std::stringstream stream_line(line);
    std::string field;
    while (std::getline(stream_line, field, ',')) {
        list_fields.push_back(field);
    }
    if (!line.empty() && line.back() == ',') {
        list_fields.emplace_back();
    }
    return list_fields;
}

SpawnConfidence parse_confidence(const std::string& field) {
    if (field == "confirmed") {
        return SpawnConfidence::Confirmed;
    }
    if (field == "estimated") {
        return SpawnConfidence::Estimated;
    }
    if (field == "none") {
        return SpawnConfidence::None;
    }
    throw std::invalid_argument("unknown confidence " + field);
}

SpawnPoint parse_spawn_point(const std::vector<std::string>& list_fields) {
    SpawnPoint point{};
    point.identifier = list_fields[0];
    point.position = GeodeticCoordinate{std::stod(list_fields[1]), std::stod(list_fields[2])};
    point.known_expiration = parse_optional_time(list_fields[3]);
    if (!list_fields[4].empty()) {
        point.duration_estimate = Duration{std::stod(list_fields[4])};
    }
    point.duration_lower_bound = Duration{std::stod(list_fields[5])};
    point.last_seen = from_epoch_seconds(std::stod(list_fields[6]));
    point.last_observed_at = parse_optional_time(list_fields[7]);
    point.confidence = parse_confidence(list_fields[8]);
    point.consistent_observations = static_cast<std::size_t>(std::stoul(list_fields[9]));
    point.stale = list_fields[10] == "1";
    return point;
}
}  // namespace

FileSpawnStore::FileSpawnStore(std::filesystem::path data_directory)
    : path_spawn_points_(data_directory / k_spawn_points_file),
      path_sightings_(data_directory / k_sightings_file),
      logger_(get_logger()) {
    std::error_code error_directory;
    std::filesystem::create_directories(data_directory, error_directory);
    if (error_directory) {
        throw std::runtime_error("Unable to create data directory at " + data_directory.string());
    }
}

std::vector<SpawnPoint> FileSpawnStore::load_spawn_points() {
    std::scoped_lock lock(mutex_);
    std::vector<SpawnPoint> list_points;
    std::ifstream stream_points(path_spawn_points_);
    if (!stream_points) {
        return list_points;
    }

    std::unordered_map<std::string, std::size_t> map_point_index;
    std::string line;
    std::size_t line_number = 0;
    std::size_t skipped = 0;
    while (std::getline(stream_points, line)) {
        ++line_number;
        if (line_number == 1 || line.empty()) {
            continue;
        }
        const std::vector<std::string> list_fields = split_fields(line);
        if (list_fields.size() != k_spawn_point_fields) {
            ++skipped;
            continue;
        }
        SpawnPoint point{};
        try {
            point = parse_spawn_point(list_fields);
        } catch (const std::logic_error& exc) {
            logger_->warn("Skipping malformed spawn point row {}: {}", line_number, exc.what());
            ++skipped;
            continue;
        }
        const auto [iterator_index, inserted] = map_point_index.emplace(point.identifier, list_points.size());
        if (inserted) {
            list_points.push_back(std::move(point));
        } else {
            list_points[iterator_index->second] = std::move(point);
        }
    }
    logger_->info("Loaded {} spawn points from {} ({} rows skipped)", list_points.size(), path_spawn_points_.string(), skipped);
    return list_points;
}

void FileSpawnStore::save_sighting(const Sighting& sighting) {
    std::string attributes;
    for (const auto& [key, value] : sighting.attributes) {
        if (!attributes.empty()) {
            attributes += '|';
        }
        attributes += key + '=' + value;
    }
    append_line(
        path_sightings_,
        k_sightings_header,
        fmt::format("{},{:.7f},{:.7f},{},{},{}",
                    sighting.spawn_id,
                    sighting.position.latitude_deg,
                    sighting.position.longitude_deg,
                    format_optional_time(sighting.observed_at),
                    format_optional_time(sighting.expires_at),
                    attributes)
    );
}

void FileSpawnStore::save_spawn_point(const SpawnPoint& point) {
    append_line(
        path_spawn_points_,
        k_spawn_points_header,
        fmt::format("{},{:.7f},{:.7f},{},{},{:.3f},{:.3f},{},{},{},{}",
                    point.identifier,
                    point.position.latitude_deg,
                    point.position.longitude_deg,
                    format_optional_time(point.known_expiration),
                    point.duration_estimate.has_value() ? fmt::format("{:.3f}", point.duration_estimate->count()) : std::string{},
                    point.duration_lower_bound.count(),
                    to_epoch_seconds(point.last_seen),
                    format_optional_time(point.last_observed_at),
                    to_string(point.confidence),
                    point.consistent_observations,
                    point.stale ? 1 : 0)
    );
}

const std::filesystem::path& FileSpawnStore::spawn_points_path() const noexcept {
    return path_spawn_points_;
}

const std::filesystem::path& FileSpawnStore::sightings_path() const noexcept {
    return path_sightings_;
}

void FileSpawnStore::append_line(const std::filesystem::path& path_file, const char* header, const std::string& line) {
    std::scoped_lock lock(mutex_);
    const bool needs_header = !std::filesystem::exists(path_file) || std::filesystem::file_size(path_file) == 0;
    std::ofstream stream_file(path_file, std::ios::app);
    if (!stream_file) {
        throw std::runtime_error("Unable to open " + path_file.string() + " for append");
    }
    if (needs_header) {
        stream_file << header << '\n';
    }
    stream_file << line << '\n';
    if (!stream_file) {
        throw std::runtime_error("Write to " + path_file.string() + " failed");
    }
}

}  // namespace spawnwatch
