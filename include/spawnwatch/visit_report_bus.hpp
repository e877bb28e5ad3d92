// === Visit Report Bus ========================================================
//
// Provides a minimal thread-safe queue carrying per-visit reports from worker
// threads to the fleet monitor.

#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

#include "spawnwatch/failure_recovery.hpp"
#include "spawnwatch/types.hpp"

namespace spawnwatch {

/** @brief Summary of one finished visit and the recovery decision it caused. */
struct VisitReport final {
    std::string worker_id{};
    std::string account{};
    TargetKind kind{TargetKind::Spawn};
    std::string target_id{};
    std::string outcome{};        /**< outcome_label() of the visit result. */
    RecoveryAction action{RecoveryAction::Completed};
    std::size_t sightings{};
    std::size_t discovered{};
    TimePoint timestamp{};
};

/** @brief Thread-safe FIFO used to exchange visit reports. */
class VisitReportBus final {
  public:
    /** @brief Publish a report to the consumer. */
    void publish(const VisitReport& report);
    /** @brief Attempt to consume a pending report without blocking. */
    [[nodiscard]] std::optional<VisitReport> try_consume();

  private:
    mutable std::mutex mutex_;
    std::queue<VisitReport> queue_reports_;
};

}  // namespace spawnwatch
