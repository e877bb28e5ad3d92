#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>

#include "spawnwatch/configuration.hpp"
#include "spawnwatch/file_spawn_store.hpp"
#include "spawnwatch/logging.hpp"
#include "spawnwatch/simulated_world.hpp"
#include "spawnwatch/tracker_runtime.hpp"
#include "spawnwatch/version.hpp"

namespace {
std::atomic<bool> should_terminate{false};

void handle_signal(int) {
    should_terminate.store(true);
}
}  // namespace

int main() {
    using namespace spawnwatch;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        Configuration configuration = ConfigurationLoader::load();
        if (!configuration.log_level.empty()) {
            set_log_level(configuration.log_level);
        }
        get_logger()->info("spawnwatch {} starting", k_version);

        SimulationConfig simulation = configuration.simulation;
        simulation.cycle_period = configuration.catalog.cycle_period;
        simulation.scan_radius_m = configuration.scheduler.suppression_radius_m;
        auto world = std::make_shared<SimulatedWorld>(simulation, configuration.region);

        TrackerCollaborators collaborators{};
        collaborators.client = world;
        collaborators.quota = world;
        collaborators.store = std::make_shared<FileSpawnStore>(configuration.data_directory);
        collaborators.challenge_solver = [world](AccountManager& account_manager, TimePoint now) {
            world->solve_challenges(account_manager, now);
        };

        TrackerRuntime runtime{std::move(configuration), std::move(collaborators)};
        runtime.initialize();
        runtime.run();

        while (!should_terminate.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        runtime.shutdown();
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
