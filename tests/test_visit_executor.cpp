#include <memory>
#include <stdexcept>
#include <string>
#include <variant>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "test_fakes.hpp"
#include "spawnwatch/visit_executor.hpp"

using namespace spawnwatch;
using spawnwatch::test::RecordingStore;
using spawnwatch::test::ScriptedClient;
using spawnwatch::test::north_of;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    spawnwatch::test::ensure_logger_initialized();
    return true;
}();

const GeodeticCoordinate k_target{32.7473, -117.1661};

WorkerState make_worker(const std::string& username = "account-0") {
    WorkerState worker{};
    worker.identifier = "worker-0";
    worker.status = WorkerStatus::Visiting;
    worker.account = AccountCredential{username, "secret", "ptc"};
    worker.position = k_target;
    worker.speed_limit_mps = 8.5;
    return worker;
}

VisitTask make_spawn_task(Duration time_to_deadline = Duration{60.0}) {
    VisitTask task{};
    task.task_id = 1;
    task.kind = TargetKind::Spawn;
    task.target_id = make_spawn_id(k_target);
    task.position = k_target;
    task.worker_id = "worker-0";
    task.scheduled_time = WallClock::now();
    task.deadline = WallClock::now() + to_clock_duration(time_to_deadline);
    return task;
}

EntitySighting make_entity(const GeodeticCoordinate& position, Duration remaining) {
    const TimePoint now = WallClock::now();
    return EntitySighting{position, now, now + to_clock_duration(remaining), {{"species", "16"}}};
}

struct ExecutorFixture {
    std::shared_ptr<ScriptedClient> client{std::make_shared<ScriptedClient>()};
    std::shared_ptr<RecordingStore> store{std::make_shared<RecordingStore>()};
    SpawnCatalog catalog{CatalogConfig{}};
    VisitExecutor executor{VisitExecutorConfig{Duration{1.0}, Duration{0.2}}, client, catalog, store};
};
}  // namespace

TEST_CASE("VisitExecutor requires a client and positive timeouts") {
    SpawnCatalog catalog{CatalogConfig{}};

    REQUIRE_THROWS_AS(VisitExecutor(VisitExecutorConfig{}, nullptr, catalog, nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(
        VisitExecutor(VisitExecutorConfig{Duration{0.0}, Duration{1.0}}, std::make_shared<ScriptedClient>(), catalog, nullptr),
        std::invalid_argument
    );
    REQUIRE_THROWS_AS(
        VisitExecutor(VisitExecutorConfig{Duration{1.0}, Duration{1.0}, 0}, std::make_shared<ScriptedClient>(), catalog, nullptr),
        std::invalid_argument
    );
}

TEST_CASE("VisitExecutor folds sightings and nearby points into the catalog") {
    ExecutorFixture fixture;
    const GeodeticCoordinate nearby = north_of(k_target, 40.0);
    fixture.client->push_scan(ScanResult{WallClock::now(), {make_entity(k_target, Duration{600.0})}, {nearby}});

    const VisitOutcome result = fixture.executor.visit(make_worker(), make_spawn_task());

    const auto* visited = std::get_if<outcome::Visited>(&result);
    REQUIRE(visited != nullptr);
    REQUIRE(visited->sightings == 1);
    REQUIRE(visited->discovered == 2);
    REQUIRE_FALSE(visited->late);
    REQUIRE(fixture.catalog.get(make_spawn_id(k_target))->confidence == SpawnConfidence::Estimated);
    REQUIRE(fixture.catalog.get(make_spawn_id(nearby))->confidence == SpawnConfidence::None);
    REQUIRE(fixture.store->list_sightings.size() == 1);
    REQUIRE(fixture.store->list_sightings.front().attributes.at("species") == "16");
    REQUIRE(fixture.store->list_points.size() == 2);
}

TEST_CASE("VisitExecutor caches sessions per account") {
    ExecutorFixture fixture;

    fixture.executor.visit(make_worker(), make_spawn_task());
    fixture.executor.visit(make_worker(), make_spawn_task());
    REQUIRE(fixture.client->login_calls() == 1);

    fixture.executor.visit(make_worker("account-1"), make_spawn_task());
    REQUIRE(fixture.client->login_calls() == 2);
    REQUIRE(fixture.client->scan_calls() == 3);
}

TEST_CASE("VisitExecutor reports login rejection as transient") {
    ExecutorFixture fixture;
    fixture.client->push_login(AuthError{"bad password"});

    const VisitOutcome result = fixture.executor.visit(make_worker(), make_spawn_task());

    REQUIRE(std::holds_alternative<outcome::Transient>(result));
    REQUIRE(fixture.client->scan_calls() == 0);
}

TEST_CASE("VisitExecutor reports a scan that overruns its timeout as transient") {
    ExecutorFixture fixture;
    fixture.client->set_scan_delay(Duration{0.6});

    const VisitOutcome result = fixture.executor.visit(make_worker(), make_spawn_task());

    REQUIRE(std::holds_alternative<outcome::Transient>(result));
    REQUIRE(outcome_label(result) == "transient");
}

TEST_CASE("VisitExecutor classifies scan failures and drops sessions of flagged accounts") {
    ExecutorFixture fixture;
    fixture.client->push_scan(ScanFailure{ScanFailureKind::Challenged, "captcha", std::nullopt});
    fixture.client->push_scan(ScanFailure{ScanFailureKind::RateLimited, "quota", Duration{12.0}});

    const VisitOutcome challenged = fixture.executor.visit(make_worker(), make_spawn_task());
    REQUIRE(std::holds_alternative<outcome::Challenged>(challenged));

    const VisitOutcome limited = fixture.executor.visit(make_worker(), make_spawn_task());
    const auto* rate_limited = std::get_if<outcome::RateLimited>(&limited);
    REQUIRE(rate_limited != nullptr);
    REQUIRE(rate_limited->retry_after->count() == Approx(12.0));
    REQUIRE(fixture.client->login_calls() == 2);
}

TEST_CASE("VisitExecutor turns client exceptions into protocol errors") {
    ExecutorFixture fixture;
    fixture.client->set_throw_on_scan(true);

    const VisitOutcome result = fixture.executor.visit(make_worker(), make_spawn_task());

    REQUIRE(std::holds_alternative<outcome::ProtocolError>(result));
}

TEST_CASE("VisitExecutor discards results that arrive after the deadline") {
    ExecutorFixture fixture;
    fixture.client->set_scan_delay(Duration{0.05});
    fixture.client->push_scan(ScanResult{WallClock::now(), {make_entity(k_target, Duration{600.0})}, {}});

    const VisitOutcome result = fixture.executor.visit(make_worker(), make_spawn_task(Duration{0.01}));

    const auto* visited = std::get_if<outcome::Visited>(&result);
    REQUIRE(visited != nullptr);
    REQUIRE(visited->late);
    REQUIRE(outcome_label(result) == "late");
    REQUIRE(fixture.catalog.size() == 0);
    REQUIRE(fixture.store->list_sightings.empty());
}

TEST_CASE("VisitExecutor records a miss when the target is absent") {
    ExecutorFixture fixture;
    const TimePoint now = WallClock::now();
    // Known point whose window should already be open.
    fixture.catalog.upsert(Observation{
        ObservationKind::Sighted,
        k_target,
        now - to_clock_duration(Duration{3'500.0}),
        now - to_clock_duration(Duration{3'000.0})
    });
    const Duration estimate_before = *fixture.catalog.get(make_spawn_id(k_target))->duration_estimate;

    fixture.client->push_scan(ScanResult{now, {}, {}});
    const VisitOutcome result = fixture.executor.visit(make_worker(), make_spawn_task());

    REQUIRE(std::holds_alternative<outcome::Visited>(result));
    REQUIRE(*fixture.catalog.get(make_spawn_id(k_target))->duration_estimate < estimate_before);
    REQUIRE(fixture.store->list_points.size() == 1);
}

TEST_CASE("VisitExecutor refines the duration when the scan lists the absent target") {
    ExecutorFixture fixture;
    const TimePoint now = WallClock::now();
    // Expires 600 s out, so the default 900 s window opened 300 s ago.
    fixture.catalog.upsert(Observation{
        ObservationKind::Sighted,
        k_target,
        now - to_clock_duration(Duration{3'300.0}),
        now - to_clock_duration(Duration{3'000.0})
    });
    const Duration estimate_before = *fixture.catalog.get(make_spawn_id(k_target))->duration_estimate;
    const GeodeticCoordinate neighbour = north_of(k_target, 40.0);

    fixture.client->push_scan(ScanResult{now, {}, {k_target, neighbour}});
    const VisitOutcome result = fixture.executor.visit(make_worker(), make_spawn_task());

    REQUIRE(std::holds_alternative<outcome::Visited>(result));
    REQUIRE(estimate_before.count() == Approx(900.0));
    REQUIRE(fixture.catalog.get(make_spawn_id(k_target))->duration_estimate->count() == Approx(750.0).margin(1.0));
    REQUIRE(fixture.catalog.get(make_spawn_id(neighbour)).has_value());
}

TEST_CASE("VisitExecutor refuses new calls while every call thread is held") {
    auto client = std::make_shared<ScriptedClient>();
    client->set_scan_delay(Duration{1.0});
    SpawnCatalog catalog{CatalogConfig{}};
    VisitExecutorConfig config{Duration{1.0}, Duration{0.2}};
    config.call_threads = 1;
    VisitExecutor executor{config, client, catalog, nullptr};

    const VisitOutcome overran = executor.visit(make_worker(), make_spawn_task());
    const VisitOutcome refused = executor.visit(make_worker(), make_spawn_task());

    REQUIRE(std::holds_alternative<outcome::Transient>(overran));
    REQUIRE(std::holds_alternative<outcome::Transient>(refused));
    REQUIRE(client->scan_calls() == 1);
}

TEST_CASE("VisitExecutor keeps catalog updates when the store fails") {
    ExecutorFixture fixture;
    fixture.store->fail_writes = true;
    fixture.client->push_scan(ScanResult{WallClock::now(), {make_entity(k_target, Duration{300.0})}, {}});

    const VisitOutcome result = fixture.executor.visit(make_worker(), make_spawn_task());

    REQUIRE(std::holds_alternative<outcome::Visited>(result));
    REQUIRE(fixture.catalog.size() == 1);
}

TEST_CASE("VisitExecutor marks exploration cells as visited") {
    ExecutorFixture fixture;
    VisitTask task = make_spawn_task();
    task.kind = TargetKind::Exploration;
    task.target_id = "cell:0:0";
    const RegionBounds region{k_target.latitude_deg - 0.0005, k_target.longitude_deg - 0.0005, k_target.latitude_deg + 0.0005, k_target.longitude_deg + 0.0005};

    fixture.executor.visit(make_worker(), task);

    bool cell_marked = false;
    for (const ExplorationTarget& target : fixture.catalog.exploration_targets(region, WallClock::now(), 100)) {
        cell_marked = cell_marked || target.last_visited.has_value();
    }
    REQUIRE(cell_marked);
    REQUIRE(fixture.catalog.size() == 0);
}
