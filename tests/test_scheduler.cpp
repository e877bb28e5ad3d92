#include <set>
#include <string>
#include <vector>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "test_fakes.hpp"
#include "spawnwatch/failure_recovery.hpp"
#include "spawnwatch/geodesy.hpp"
#include "spawnwatch/scheduler.hpp"

using namespace spawnwatch;
using spawnwatch::test::at_seconds;
using spawnwatch::test::make_credentials;
using spawnwatch::test::north_of;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    spawnwatch::test::ensure_logger_initialized();
    return true;
}();

constexpr double k_t0{1'700'000'000.0};
const GeodeticCoordinate k_spawn{32.7473, -117.1661};

/** @brief Catalog, accounts, pool and scheduler wired for a fixed fleet. */
struct DispatchFixture {
    DispatchFixture(const std::vector<GeodeticCoordinate>& start_positions, double speed_limit_mps, std::size_t account_count = 0)
        : accounts(make_credentials(account_count == 0 ? start_positions.size() : account_count)),
          pool(WorkerPoolConfig{start_positions.size(), speed_limit_mps}, accounts) {
        pool.start(start_positions, at_seconds(k_t0));
    }

    void add_spawn(const GeodeticCoordinate& position, double expires_in_s) {
        catalog.upsert(Observation{ObservationKind::Sighted, position, at_seconds(k_t0), at_seconds(k_t0 + expires_in_s)});
    }

    Scheduler make_scheduler(SchedulerConfig config = SchedulerConfig{}) {
        return Scheduler{config, catalog, pool, accounts, throttle};
    }

    SpawnCatalog catalog{CatalogConfig{}};
    AccountManager accounts;
    WorkerPool pool;
    VisitThrottle throttle;
};
}  // namespace

TEST_CASE("required_speed_mps divides distance by the time left") {
    const GeodeticCoordinate target = north_of(k_spawn, 100.0);

    REQUIRE(required_speed_mps(k_spawn, target, at_seconds(0.0), at_seconds(10.0), Duration{0.001}) == Approx(10.0).epsilon(0.01));
    REQUIRE(required_speed_mps(k_spawn, target, at_seconds(20.0), at_seconds(10.0), Duration{0.001}) > 1'000.0);
}

TEST_CASE("Scheduler gives a target to the worker needing the lowest speed") {
    // worker-0 needs 5 m/s, worker-1 only 3 m/s.
    DispatchFixture fixture({north_of(k_spawn, 500.0), north_of(k_spawn, 300.0)}, 8.5);
    fixture.add_spawn(k_spawn, 100.0);
    Scheduler scheduler = fixture.make_scheduler();

    const SchedulePassResult result = scheduler.run_pass(at_seconds(k_t0));

    REQUIRE(result.assigned_due == 1);
    const WorkerState chosen = *fixture.pool.worker("worker-1");
    REQUIRE(chosen.active_task.has_value());
    REQUIRE(chosen.active_task->kind == TargetKind::Spawn);
    REQUIRE(chosen.active_task->target_id == make_spawn_id(k_spawn));
    REQUIRE(chosen.active_task->deadline == at_seconds(k_t0 + 100.0));
    REQUIRE(chosen.active_task->scheduled_time >= at_seconds(k_t0));
    REQUIRE(chosen.active_task->scheduled_time <= chosen.active_task->deadline);
}

TEST_CASE("Scheduler breaks speed ties by worker index") {
    DispatchFixture fixture({north_of(k_spawn, 300.0), north_of(k_spawn, 300.0)}, 8.5);
    fixture.add_spawn(k_spawn, 100.0);
    Scheduler scheduler = fixture.make_scheduler();

    scheduler.run_pass(at_seconds(k_t0));

    REQUIRE(fixture.pool.worker("worker-0")->active_task->kind == TargetKind::Spawn);
}

TEST_CASE("Scheduler defers targets no worker can reach in time") {
    // 600 m in 100 s needs 6 m/s against a 5 m/s limit.
    DispatchFixture fixture({north_of(k_spawn, 600.0)}, 5.0);
    fixture.add_spawn(k_spawn, 100.0);
    Scheduler scheduler = fixture.make_scheduler();

    const SchedulePassResult result = scheduler.run_pass(at_seconds(k_t0));

    REQUIRE(result.deferred == 1);
    REQUIRE(result.assigned_due == 0);
    const std::optional<WorkerState> worker = fixture.pool.worker("worker-0");
    REQUIRE_FALSE((worker->active_task.has_value() && worker->active_task->kind == TargetKind::Spawn));
}

TEST_CASE("Scheduler never assigns a task that breaks the speed limit") {
    std::vector<GeodeticCoordinate> list_starts;
    for (std::size_t index = 0; index < 6; ++index) {
        list_starts.push_back(north_of(k_spawn, 150.0 * static_cast<double>(index)));
    }
    DispatchFixture fixture(list_starts, 4.0);
    const GeodeticCoordinate row_start = offset_coordinate(k_spawn, 180.0, 200.0);
    for (std::size_t index = 0; index < 10; ++index) {
        fixture.add_spawn(offset_coordinate(row_start, 90.0, 90.0 * static_cast<double>(index)), 40.0 + 15.0 * static_cast<double>(index));
    }
    const std::vector<WorkerState> list_before = fixture.pool.snapshot();
    Scheduler scheduler = fixture.make_scheduler();
    const TimePoint now = at_seconds(k_t0);

    scheduler.run_pass(now);

    std::set<std::string> set_targets;
    for (const VisitTask& task : fixture.pool.active_tasks()) {
        const WorkerState& origin = list_before.at(fixture.pool.worker(task.worker_id)->index);
        REQUIRE(task.deadline >= now);
        REQUIRE(required_speed_mps(origin.position, task.position, now, task.deadline, Duration{0.001}) <= origin.speed_limit_mps + 1e-9);
        REQUIRE(set_targets.insert(task.target_id).second);
    }
}

TEST_CASE("Scheduler suppresses targets already covered by a nearby visit") {
    DispatchFixture fixture({north_of(k_spawn, 300.0), north_of(k_spawn, 320.0)}, 8.5);
    fixture.add_spawn(k_spawn, 100.0);
    fixture.add_spawn(north_of(k_spawn, 30.0), 110.0);
    Scheduler scheduler = fixture.make_scheduler();

    const SchedulePassResult first = scheduler.run_pass(at_seconds(k_t0));
    REQUIRE(first.assigned_due == 1);
    REQUIRE(first.suppressed == 1);

    const SchedulePassResult second = scheduler.run_pass(at_seconds(k_t0 + 1.0));
    REQUIRE(second.assigned_due == 0);
    REQUIRE(second.suppressed == 1);
    REQUIRE(second.deferred == 0);
}

TEST_CASE("Scheduler hands a target out again after its visit failed") {
    DispatchFixture fixture({north_of(k_spawn, 300.0), north_of(k_spawn, 320.0)}, 8.5, 3);
    fixture.add_spawn(k_spawn, 100.0);
    FailureRecoveryController recovery{RecoveryConfig{}, fixture.pool, fixture.accounts, fixture.throttle, nullptr};
    Scheduler scheduler = fixture.make_scheduler();

    REQUIRE(scheduler.run_pass(at_seconds(k_t0)).assigned_due == 1);
    const VisitTask task = *fixture.pool.worker("worker-0")->active_task;
    recovery.handle("worker-0", task, outcome::Banned{"account terminated"}, at_seconds(k_t0 + 1.0));

    const SchedulePassResult retried = scheduler.run_pass(at_seconds(k_t0 + 2.0));

    REQUIRE(retried.assigned_due == 1);
    std::size_t spawn_tasks = 0;
    for (const VisitTask& active : fixture.pool.active_tasks()) {
        if (active.target_id == make_spawn_id(k_spawn)) {
            ++spawn_tasks;
        }
    }
    REQUIRE(spawn_tasks == 1);
}

TEST_CASE("Scheduler keeps a completed visit covering its target") {
    DispatchFixture fixture({north_of(k_spawn, 300.0), north_of(k_spawn, 320.0)}, 8.5);
    fixture.add_spawn(k_spawn, 100.0);
    Scheduler scheduler = fixture.make_scheduler();

    REQUIRE(scheduler.run_pass(at_seconds(k_t0)).assigned_due == 1);
    fixture.catalog.upsert(Observation{ObservationKind::Missed, k_spawn, at_seconds(k_t0 + 1.0), std::nullopt});
    fixture.pool.complete("worker-0", at_seconds(k_t0 + 1.0));

    const SchedulePassResult second = scheduler.run_pass(at_seconds(k_t0 + 2.0));

    REQUIRE(second.assigned_due == 0);
    REQUIRE(second.deferred == 0);
}

TEST_CASE("Scheduler skips passes while the throttle is engaged") {
    DispatchFixture fixture({north_of(k_spawn, 100.0)}, 8.5);
    fixture.add_spawn(k_spawn, 100.0);
    fixture.throttle.engage(at_seconds(k_t0 + 10.0));
    Scheduler scheduler = fixture.make_scheduler();

    const SchedulePassResult throttled = scheduler.run_pass(at_seconds(k_t0));
    REQUIRE(throttled.skipped_throttled);
    REQUIRE(fixture.pool.active_tasks().empty());

    const SchedulePassResult resumed = scheduler.run_pass(at_seconds(k_t0 + 10.0));
    REQUIRE_FALSE(resumed.skipped_throttled);
    REQUIRE(resumed.assigned_due == 1);
}

TEST_CASE("Scheduler pauses while too many challenges are pending") {
    DispatchFixture fixture({north_of(k_spawn, 100.0)}, 8.5, 3);
    fixture.add_spawn(k_spawn, 100.0);
    fixture.accounts.mark_challenged("account-1");
    fixture.accounts.mark_challenged("account-2");
    SchedulerConfig config{};
    config.max_pending_challenges = 1;
    Scheduler scheduler = fixture.make_scheduler(config);

    const SchedulePassResult result = scheduler.run_pass(at_seconds(k_t0));

    REQUIRE(result.skipped_challenges);
    REQUIRE(fixture.pool.active_tasks().empty());
}

TEST_CASE("Scheduler sends leftover idle workers exploring") {
    DispatchFixture fixture({k_spawn}, 8.5);
    SchedulerConfig config{};
    config.region = RegionBounds{k_spawn.latitude_deg - 0.002, k_spawn.longitude_deg - 0.002, k_spawn.latitude_deg + 0.002, k_spawn.longitude_deg + 0.002};
    Scheduler scheduler = fixture.make_scheduler(config);

    const SchedulePassResult result = scheduler.run_pass(at_seconds(k_t0));

    REQUIRE(result.assigned_exploration == 1);
    const VisitTask task = *fixture.pool.worker("worker-0")->active_task;
    REQUIRE(task.kind == TargetKind::Exploration);
    REQUIRE(task.deadline == at_seconds(k_t0 + 60.0));
    REQUIRE(haversine_distance_m(k_spawn, task.position) <= 8.5 * 60.0);
}

TEST_CASE("Scheduler explores mystery spawn points before grid cells") {
    DispatchFixture fixture({k_spawn}, 8.5);
    const GeodeticCoordinate mystery = north_of(k_spawn, 50.0);
    fixture.catalog.upsert(Observation{ObservationKind::Discovered, mystery, at_seconds(k_t0 - 10.0), std::nullopt});
    SchedulerConfig config{};
    config.region = RegionBounds{k_spawn.latitude_deg - 0.002, k_spawn.longitude_deg - 0.002, k_spawn.latitude_deg + 0.002, k_spawn.longitude_deg + 0.002};
    Scheduler scheduler = fixture.make_scheduler(config);

    scheduler.run_pass(at_seconds(k_t0));

    REQUIRE(fixture.pool.worker("worker-0")->active_task->target_id == make_spawn_id(mystery));
}
