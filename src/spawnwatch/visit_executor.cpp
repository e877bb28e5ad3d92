#include "spawnwatch/visit_executor.hpp"

#include <future>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace spawnwatch {

namespace {

/**
 * @brief Run @p call on @p call_pool and wait at most @p timeout.
 *
 * Returns nullopt when the call overran or no call thread was free. An
 * overrunning call keeps its thread until the client returns; the result is
 * dropped. Exceptions thrown by the call propagate.
 */
template <typename Result>
std::optional<Result> call_with_timeout(ClientCallPool& call_pool, std::function<Result()> call, Duration timeout) {
    std::optional<std::future<Result>> future = call_pool.try_submit<Result>(std::move(call));
    if (!future.has_value()) {
        return std::nullopt;
    }
    if (future->wait_for(to_clock_duration(timeout)) != std::future_status::ready) {
        return std::nullopt;
    }
    return future->get();
}

}  // namespace

VisitExecutor::VisitExecutor(VisitExecutorConfig config, ScanClientPtr client, SpawnCatalog& catalog, SpawnStorePtr store)
    : config_(config),
      client_(std::move(client)),
      catalog_(catalog),
      store_(std::move(store)),
      call_pool_(config_.call_threads == 0 ? 1 : config_.call_threads),
      logger_(get_logger()) {
    if (client_ == nullptr) {
        throw std::invalid_argument("VisitExecutor requires a client");
    }
    if (config_.login_timeout.count() <= 0.0 || config_.visit_timeout.count() <= 0.0) {
        throw std::invalid_argument("VisitExecutor timeouts must be positive");
    }
    if (config_.call_threads == 0) {
        throw std::invalid_argument("VisitExecutor needs at least one call thread");
    }
}

VisitOutcome VisitExecutor::visit(const WorkerState& worker, const VisitTask& task) {
    if (!worker.account.has_value()) {
        return outcome::Transient{worker.identifier + " has no bound account"};
    }
    const AccountCredential& credential = *worker.account;

    try {
        Session session{};
        if (std::optional<VisitOutcome> login_failure = ensure_session(credential, session)) {
            return std::move(*login_failure);
        }

        ScanClientPtr client = client_;
        const GeodeticCoordinate position = task.position;
        const Duration timeout = config_.visit_timeout;
        if (call_pool_.taken() >= call_pool_.size()) {
            return outcome::Transient{"every client call thread is held by an unfinished call"};
        }
        std::optional<ScanResponse> response = call_with_timeout<ScanResponse>(
            call_pool_,
            [client, session, position, timeout]() { return client->scan(session, position, timeout); },
            timeout
        );
        if (!response.has_value()) {
            return outcome::Transient{fmt::format("scan timed out after {:.1f}s", timeout.count())};
        }

        if (const ScanFailure* failure = std::get_if<ScanFailure>(&*response)) {
            return classify_failure(credential.username, *failure);
        }

        if (WallClock::now() > task.deadline) {
            logger_->info(
                R"({{"component":"executor","action":"late","worker":"{}","target":"{}"}})",
                worker.identifier,
                task.target_id
            );
            return outcome::Visited{0, 0, true};
        }
        return apply_scan(task, std::get<ScanResult>(*response));
    } catch (const std::exception& exc) {
        logger_->error(
            R"({{"component":"executor","action":"client_exception","worker":"{}","detail":"{}"}})",
            worker.identifier,
            exc.what()
        );
        return outcome::ProtocolError{exc.what()};
    }
}

void VisitExecutor::forget_session(const std::string& username) {
    std::scoped_lock lock(session_mutex_);
    map_sessions_.erase(username);
}

std::optional<VisitOutcome> VisitExecutor::ensure_session(const AccountCredential& credential, Session& session) {
    {
        std::scoped_lock lock(session_mutex_);
        const auto iterator_session = map_sessions_.find(credential.username);
        if (iterator_session != map_sessions_.end()) {
            session = iterator_session->second;
            return std::nullopt;
        }
    }

    if (call_pool_.taken() >= call_pool_.size()) {
        return VisitOutcome{outcome::Transient{"every client call thread is held by an unfinished call"}};
    }
    ScanClientPtr client = client_;
    const Duration timeout = config_.login_timeout;
    std::optional<LoginResponse> response = call_with_timeout<LoginResponse>(
        call_pool_,
        [client, credential, timeout]() { return client->login(credential, timeout); },
        timeout
    );
    if (!response.has_value()) {
        return VisitOutcome{outcome::Transient{fmt::format("login for {} timed out", credential.username)}};
    }
    if (const AuthError* auth_error = std::get_if<AuthError>(&*response)) {
        logger_->warn("Login failed for {}: {}", credential.username, auth_error->detail);
        return VisitOutcome{outcome::Transient{"login failed: " + auth_error->detail}};
    }

    session = std::get<Session>(*response);
    std::scoped_lock lock(session_mutex_);
    map_sessions_[credential.username] = session;
    return std::nullopt;
}

VisitOutcome VisitExecutor::apply_scan(const VisitTask& task, const ScanResult& result) {
    std::unordered_map<std::string, SpawnPoint> map_changed_points;
    std::size_t discovered = 0;
    bool target_sighted = false;

    const auto track = [&map_changed_points, &discovered](const UpsertResult& upsert_result) {
        if (upsert_result.created) {
            ++discovered;
        }
        if (upsert_result.changed && upsert_result.point.has_value()) {
            map_changed_points[upsert_result.point->identifier] = *upsert_result.point;
        }
    };

    for (const EntitySighting& entity : result.sightings) {
        Sighting sighting{};
        sighting.spawn_id = make_spawn_id(entity.position);
        sighting.position = entity.position;
        sighting.observed_at = entity.observed_at;
        sighting.expires_at = entity.expires_at;
        sighting.attributes = entity.attributes;
        if (sighting.spawn_id == task.target_id) {
            target_sighted = true;
        }

        track(catalog_.upsert(Observation{ObservationKind::Sighted, entity.position, entity.observed_at, entity.expires_at}));
        persist_sighting(sighting);
    }

    for (const GeodeticCoordinate& nearby : result.nearby_spawn_points) {
        // A listed but inactive target is recorded as a miss below.
        if (task.kind == TargetKind::Spawn && !target_sighted && make_spawn_id(nearby) == task.target_id) {
            continue;
        }
        track(catalog_.upsert(Observation{ObservationKind::Discovered, nearby, result.scanned_at, std::nullopt}));
    }

    if (task.kind == TargetKind::Spawn && !target_sighted) {
        track(catalog_.upsert(Observation{ObservationKind::Missed, task.position, result.scanned_at, std::nullopt}));
    }
    if (task.kind == TargetKind::Exploration) {
        catalog_.record_exploration(task.position, result.scanned_at);
    }

    for (const auto& [spawn_id, point] : map_changed_points) {
        persist_point(point);
    }

    logger_->debug(
        R"({{"component":"executor","action":"visited","worker":"{}","target":"{}","sightings":{},"discovered":{},"target_sighted":{}}})",
        task.worker_id,
        task.target_id,
        result.sightings.size(),
        discovered,
        target_sighted
    );
    return outcome::Visited{result.sightings.size(), discovered, false};
}

VisitOutcome VisitExecutor::classify_failure(const std::string& username, const ScanFailure& failure) {
    switch (failure.kind) {
        case ScanFailureKind::Transient:
            return outcome::Transient{failure.detail};
        case ScanFailureKind::Challenged:
            forget_session(username);
            return outcome::Challenged{failure.detail};
        case ScanFailureKind::Banned:
            forget_session(username);
            return outcome::Banned{failure.detail};
        case ScanFailureKind::RateLimited:
            return outcome::RateLimited{failure.detail, failure.retry_after};
        case ScanFailureKind::ProtocolError:
            return outcome::ProtocolError{failure.detail};
    }
    return outcome::ProtocolError{"unclassified scan failure: " + failure.detail};
}

void VisitExecutor::persist_sighting(const Sighting& sighting) {
    if (store_ == nullptr) {
        return;
    }
    try {
        store_->save_sighting(sighting);
    } catch (const std::exception& exc) {
        logger_->warn("Failed to persist sighting at {}: {}", sighting.spawn_id, exc.what());
    }
}

void VisitExecutor::persist_point(const SpawnPoint& point) {
    if (store_ == nullptr) {
        return;
    }
    try {
        store_->save_spawn_point(point);
    } catch (const std::exception& exc) {
        logger_->warn("Failed to persist spawn point {}: {}", point.identifier, exc.what());
    }
}

}  // namespace spawnwatch
