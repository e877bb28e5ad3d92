#include <algorithm>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "test_fakes.hpp"
#include "spawnwatch/spawn_catalog.hpp"

using namespace spawnwatch;
using spawnwatch::test::at_seconds;
using spawnwatch::test::north_of;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    spawnwatch::test::ensure_logger_initialized();
    return true;
}();

constexpr double k_t0{1'700'000'000.0};
const GeodeticCoordinate k_origin{32.7473, -117.1661};

Observation sighted(const GeodeticCoordinate& position, double observed_s, std::optional<double> expires_s) {
    Observation observation{};
    observation.kind = ObservationKind::Sighted;
    observation.position = position;
    observation.observed_at = at_seconds(observed_s);
    if (expires_s.has_value()) {
        observation.expires_at = at_seconds(*expires_s);
    }
    return observation;
}

Observation missed(const GeodeticCoordinate& position, double observed_s) {
    return Observation{ObservationKind::Missed, position, at_seconds(observed_s), std::nullopt};
}

Observation discovered(const GeodeticCoordinate& position, double observed_s) {
    return Observation{ObservationKind::Discovered, position, at_seconds(observed_s), std::nullopt};
}
}  // namespace

TEST_CASE("SpawnCatalog creates an estimated point from a timed sighting") {
    SpawnCatalog catalog{CatalogConfig{}};

    const UpsertResult result = catalog.upsert(sighted(k_origin, k_t0, k_t0 + 600.0));

    REQUIRE(result.created);
    REQUIRE(result.changed);
    REQUIRE(result.point.has_value());
    REQUIRE(result.point->confidence == SpawnConfidence::Estimated);
    REQUIRE(result.point->known_expiration == at_seconds(k_t0 + 600.0));
    REQUIRE(result.point->duration_lower_bound.count() == Approx(600.0));
    REQUIRE(result.point->duration_estimate->count() == Approx(900.0));
    REQUIRE(catalog.size() == 1);
}

TEST_CASE("SpawnCatalog ignores replayed observations") {
    SpawnCatalog catalog{CatalogConfig{}};
    const Observation observation = sighted(k_origin, k_t0, k_t0 + 600.0);

    catalog.upsert(observation);
    const UpsertResult replay = catalog.upsert(observation);

    REQUIRE_FALSE(replay.created);
    REQUIRE_FALSE(replay.changed);
    REQUIRE(replay.point->consistent_observations == 1);

    const UpsertResult older = catalog.upsert(sighted(k_origin, k_t0 - 30.0, k_t0 + 570.0));
    REQUIRE_FALSE(older.changed);
    REQUIRE(catalog.get(make_spawn_id(k_origin))->last_observed_at == at_seconds(k_t0));
}

TEST_CASE("SpawnCatalog confirms consistent sightings and never lowers confidence") {
    SpawnCatalog catalog{CatalogConfig{}};

    catalog.upsert(sighted(k_origin, k_t0, k_t0 + 600.0));
    const UpsertResult confirmed = catalog.upsert(sighted(k_origin, k_t0 + 3'610.0, k_t0 + 4'203.0));
    REQUIRE(confirmed.point->confidence == SpawnConfidence::Confirmed);
    REQUIRE(confirmed.point->consistent_observations == 2);

    const UpsertResult shifted = catalog.upsert(sighted(k_origin, k_t0 + 7'205.0, k_t0 + 8'100.0));
    REQUIRE(shifted.changed);
    REQUIRE(shifted.point->confidence == SpawnConfidence::Confirmed);
    REQUIRE(shifted.point->known_expiration == at_seconds(k_t0 + 8'100.0));
}

TEST_CASE("SpawnCatalog shrinks the duration estimate on misses inside the predicted window") {
    SpawnCatalog catalog{CatalogConfig{}};
    catalog.upsert(sighted(k_origin, k_t0, k_t0 + 600.0));

    // Next expiration is t0 + 4200; the predicted window opens 900 s earlier.
    catalog.upsert(missed(k_origin, k_t0 + 3'500.0));
    REQUIRE(catalog.get(make_spawn_id(k_origin))->duration_estimate->count() == Approx(800.0));

    catalog.upsert(missed(k_origin, k_t0 + 3'550.0));
    REQUIRE(catalog.get(make_spawn_id(k_origin))->duration_estimate->count() == Approx(725.0));

    catalog.upsert(missed(k_origin, k_t0 + 3'650.0));
    catalog.upsert(missed(k_origin, k_t0 + 3'700.0));
    const SpawnPoint point = *catalog.get(make_spawn_id(k_origin));
    REQUIRE(point.duration_estimate->count() == Approx(point.duration_lower_bound.count()));
    REQUIRE(point.confidence == SpawnConfidence::Estimated);
}

TEST_CASE("SpawnCatalog ignores a miss before the predicted window") {
    SpawnCatalog catalog{CatalogConfig{}};
    catalog.upsert(sighted(k_origin, k_t0, k_t0 + 600.0));

    catalog.upsert(missed(k_origin, k_t0 + 1'000.0));

    REQUIRE(catalog.get(make_spawn_id(k_origin))->duration_estimate->count() == Approx(900.0));
}

TEST_CASE("SpawnCatalog ignores a miss at an unknown point") {
    SpawnCatalog catalog{CatalogConfig{}};

    const UpsertResult result = catalog.upsert(missed(k_origin, k_t0));

    REQUIRE_FALSE(result.point.has_value());
    REQUIRE(catalog.size() == 0);
}

TEST_CASE("SpawnCatalog due targets come soonest expiration first and can be rewound") {
    SpawnCatalog catalog{CatalogConfig{}};
    const GeodeticCoordinate later = north_of(k_origin, 200.0);
    const GeodeticCoordinate sooner = north_of(k_origin, 400.0);
    const GeodeticCoordinate far_future = north_of(k_origin, 600.0);
    const GeodeticCoordinate untimed = north_of(k_origin, 800.0);

    catalog.upsert(sighted(later, k_t0, k_t0 + 100.0));
    catalog.upsert(sighted(sooner, k_t0, k_t0 + 50.0));
    catalog.upsert(sighted(far_future, k_t0 - 2'000.0, k_t0 - 1'900.0));
    catalog.upsert(discovered(untimed, k_t0));

    DueTargetSequence sequence = catalog.due_targets(at_seconds(k_t0), Duration{300.0});
    REQUIRE(sequence.size() == 2);

    const auto first = sequence.next();
    const auto second = sequence.next();
    REQUIRE(first->spawn_id == make_spawn_id(sooner));
    REQUIRE(second->spawn_id == make_spawn_id(later));
    REQUIRE(second->deadline == at_seconds(k_t0 + 100.0));
    REQUIRE_FALSE(sequence.next().has_value());

    sequence.rewind();
    REQUIRE(sequence.next()->spawn_id == make_spawn_id(sooner));
}

TEST_CASE("SpawnCatalog projects known expirations into the current cycle") {
    SpawnCatalog catalog{CatalogConfig{}};
    catalog.upsert(sighted(k_origin, k_t0, k_t0 + 600.0));
    const SpawnPoint point = *catalog.get(make_spawn_id(k_origin));

    REQUIRE(catalog.next_expiration(point, at_seconds(k_t0 + 500.0)) == at_seconds(k_t0 + 600.0));
    REQUIRE(catalog.next_expiration(point, at_seconds(k_t0 + 601.0)) == at_seconds(k_t0 + 4'200.0));
    REQUIRE(catalog.next_expiration(point, at_seconds(k_t0 + 10'000.0)) == at_seconds(k_t0 + 11'400.0));

    DueTargetSequence sequence = catalog.due_targets(at_seconds(k_t0 + 3'500.0), Duration{60.0});
    REQUIRE(sequence.next()->deadline == at_seconds(k_t0 + 4'200.0));
}

TEST_CASE("SpawnCatalog drops stale points from due targets until seen again") {
    SpawnCatalog catalog{CatalogConfig{}};
    catalog.upsert(sighted(k_origin, k_t0, k_t0 + 600.0));

    const double later_s = k_t0 + 86'400.0 + 10.0;
    REQUIRE(catalog.mark_stale(at_seconds(later_s)) == 1);
    REQUIRE(catalog.mark_stale(at_seconds(later_s)) == 0);
    REQUIRE(catalog.due_targets(at_seconds(later_s), Duration{3'600.0}).empty());
    REQUIRE(catalog.get(make_spawn_id(k_origin))->confidence == SpawnConfidence::Estimated);

    catalog.upsert(sighted(k_origin, later_s + 1.0, std::nullopt));
    REQUIRE_FALSE(catalog.get(make_spawn_id(k_origin))->stale);
    REQUIRE_FALSE(catalog.due_targets(at_seconds(later_s), Duration{3'600.0}).empty());
}

TEST_CASE("SpawnCatalog exploration puts mysteries first, least recently observed first") {
    SpawnCatalog catalog{CatalogConfig{}};
    const GeodeticCoordinate older = north_of(k_origin, 100.0);
    const GeodeticCoordinate newer = north_of(k_origin, 300.0);
    catalog.upsert(discovered(newer, k_t0 + 10.0));
    catalog.upsert(discovered(older, k_t0));
    catalog.upsert(sighted(north_of(k_origin, 500.0), k_t0, k_t0 + 600.0));

    const RegionBounds region{k_origin.latitude_deg - 0.01, k_origin.longitude_deg - 0.01, k_origin.latitude_deg + 0.01, k_origin.longitude_deg + 0.01};
    const std::vector<ExplorationTarget> list_targets = catalog.exploration_targets(region, at_seconds(k_t0 + 20.0), 5);

    REQUIRE(list_targets.size() == 5);
    REQUIRE(list_targets[0].kind == ExplorationKind::Mystery);
    REQUIRE(list_targets[0].identifier == make_spawn_id(older));
    REQUIRE(list_targets[1].identifier == make_spawn_id(newer));
    for (std::size_t index = 2; index < list_targets.size(); ++index) {
        REQUIRE(list_targets[index].kind == ExplorationKind::Cell);
    }
}

TEST_CASE("SpawnCatalog exploration visits fresh cells before explored ones") {
    SpawnCatalog catalog{CatalogConfig{}};
    const RegionBounds region{k_origin.latitude_deg, k_origin.longitude_deg, k_origin.latitude_deg + 0.002, k_origin.longitude_deg + 0.002};

    const std::vector<ExplorationTarget> list_before = catalog.exploration_targets(region, at_seconds(k_t0), 1'000);
    REQUIRE(list_before.size() > 1);

    catalog.record_exploration(list_before.front().position, at_seconds(k_t0));
    const std::vector<ExplorationTarget> list_after = catalog.exploration_targets(region, at_seconds(k_t0 + 1.0), 1'000);

    REQUIRE(list_after.size() == list_before.size());
    REQUIRE(list_after.back().identifier == list_before.front().identifier);
    REQUIRE(list_after.back().last_visited == at_seconds(k_t0));
    REQUIRE_FALSE(list_after.front().last_visited.has_value());
}

TEST_CASE("SpawnCatalog exploration samples the whole of an oversized region") {
    CatalogConfig config{};
    config.max_exploration_cells = 40;
    SpawnCatalog catalog{config};
    const RegionBounds region{k_origin.latitude_deg, k_origin.longitude_deg, k_origin.latitude_deg + 0.02, k_origin.longitude_deg + 0.02};

    const std::vector<ExplorationTarget> list_first = catalog.exploration_targets(region, at_seconds(k_t0), 1'000);
    const std::vector<ExplorationTarget> list_second = catalog.exploration_targets(region, at_seconds(k_t0), 1'000);

    REQUIRE_FALSE(list_first.empty());
    REQUIRE(list_first.size() <= 40);
    double northmost_deg = region.south_deg;
    double southmost_deg = region.north_deg;
    for (const ExplorationTarget& target : list_first) {
        northmost_deg = std::max(northmost_deg, target.position.latitude_deg);
        southmost_deg = std::min(southmost_deg, target.position.latitude_deg);
    }
    REQUIRE(northmost_deg > region.north_deg - 0.006);
    REQUIRE(southmost_deg < region.south_deg + 0.006);

    std::set<std::string> set_first;
    for (const ExplorationTarget& target : list_first) {
        set_first.insert(target.identifier);
    }
    bool rotated = false;
    for (const ExplorationTarget& target : list_second) {
        rotated = rotated || set_first.count(target.identifier) == 0;
    }
    REQUIRE(rotated);
}

TEST_CASE("SpawnCatalog load keeps position-derived identities unique") {
    SpawnCatalog catalog{CatalogConfig{}};
    SpawnPoint stored{};
    stored.identifier = "legacy-id";
    stored.position = k_origin;
    stored.known_expiration = at_seconds(k_t0);
    stored.confidence = SpawnConfidence::Confirmed;

    catalog.load({stored, stored});

    REQUIRE(catalog.size() == 1);
    REQUIRE(catalog.get(make_spawn_id(k_origin))->confidence == SpawnConfidence::Confirmed);
    REQUIRE(catalog.counts().confirmed == 1);
}

TEST_CASE("SpawnCatalog accepts concurrent upserts") {
    SpawnCatalog catalog{CatalogConfig{}};
    constexpr std::size_t k_threads{4};
    constexpr std::size_t k_points_per_thread{50};

    std::vector<std::thread> list_threads;
    for (std::size_t thread_index = 0; thread_index < k_threads; ++thread_index) {
        list_threads.emplace_back([&catalog, thread_index]() {
            for (std::size_t point_index = 0; point_index < k_points_per_thread; ++point_index) {
                const double offset_m = static_cast<double>(point_index * k_threads + thread_index) * 20.0;
                catalog.upsert(sighted(north_of(k_origin, offset_m), k_t0, k_t0 + 600.0));
                catalog.upsert(sighted(k_origin, k_t0 + static_cast<double>(point_index), std::nullopt));
            }
        });
    }
    for (std::thread& thread : list_threads) {
        thread.join();
    }

    REQUIRE(catalog.size() == k_threads * k_points_per_thread);
}
