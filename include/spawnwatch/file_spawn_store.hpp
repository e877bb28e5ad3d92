// === File Spawn Store ========================================================
//
// Reference SpawnStore writing append-only CSV files into a data directory:
// spawn_points.csv (one row per saved state, the last row per identifier wins
// on load) and sightings.csv.

#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

#include "spawnwatch/collaborators.hpp"
#include "spawnwatch/logging.hpp"

namespace spawnwatch {

class FileSpawnStore final : public SpawnStore {
  public:
    /** @throws std::runtime_error when @p data_directory cannot be created. */
    explicit FileSpawnStore(std::filesystem::path data_directory);

    std::vector<SpawnPoint> load_spawn_points() override;
    void save_sighting(const Sighting& sighting) override;
    void save_spawn_point(const SpawnPoint& point) override;

    [[nodiscard]] const std::filesystem::path& spawn_points_path() const noexcept;
    [[nodiscard]] const std::filesystem::path& sightings_path() const noexcept;

  private:
    void append_line(const std::filesystem::path& path_file, const char* header, const std::string& line);

    std::filesystem::path path_spawn_points_;
    std::filesystem::path path_sightings_;
    std::mutex mutex_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace spawnwatch
