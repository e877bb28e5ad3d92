#include "spawnwatch/visit_outcome.hpp"

namespace spawnwatch {

std::string_view outcome_label(const VisitOutcome& visit_outcome) noexcept {
    return std::visit(
        OutcomeVisitor{
            [](const outcome::Visited& visited) -> std::string_view { return visited.late ? "late" : "visited"; },
            [](const outcome::Transient&) -> std::string_view { return "transient"; },
            [](const outcome::Challenged&) -> std::string_view { return "challenged"; },
            [](const outcome::Banned&) -> std::string_view { return "banned"; },
            [](const outcome::RateLimited&) -> std::string_view { return "rate_limited"; },
            [](const outcome::ProtocolError&) -> std::string_view { return "protocol_error"; },
        },
        visit_outcome
    );
}

}  // namespace spawnwatch
