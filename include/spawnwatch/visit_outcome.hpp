// === Visit Outcome ===========================================================
//
// Closed result type reported by VisitExecutor for every visit. The failure
// recovery controller consumes it exhaustively with std::visit.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "spawnwatch/types.hpp"

namespace spawnwatch {

namespace outcome {

/** @brief Scan succeeded. */
struct Visited final {
    std::size_t sightings{};   /**< Entities seen. */
    std::size_t discovered{};  /**< Spawn points newly added to the catalog. */
    bool late{};               /**< Deadline passed first; result discarded. */
};

/** @brief Network trouble, timeout, or failed login. */
struct Transient final {
    std::string detail{};
};

/** @brief Anti-automation challenge issued to the account. */
struct Challenged final {
    std::string detail{};
};

/** @brief Account banned by the service. */
struct Banned final {
    std::string detail{};
};

/** @brief Shared hashing quota exhausted. */
struct RateLimited final {
    std::string detail{};
    std::optional<Duration> retry_after{};
};

/** @brief Unexpected response shape. */
struct ProtocolError final {
    std::string detail{};
};

}  // namespace outcome

using VisitOutcome = std::variant<
    outcome::Visited,
    outcome::Transient,
    outcome::Challenged,
    outcome::Banned,
    outcome::RateLimited,
    outcome::ProtocolError>;

/** @brief Overload set for exhaustive std::visit over VisitOutcome. */
template <typename... Handlers>
struct OutcomeVisitor : Handlers... {
    using Handlers::operator()...;
};

template <typename... Handlers>
OutcomeVisitor(Handlers...) -> OutcomeVisitor<Handlers...>;

/** @brief Short label used in logs and fleet statistics. */
[[nodiscard]] std::string_view outcome_label(const VisitOutcome& visit_outcome) noexcept;

}  // namespace spawnwatch
