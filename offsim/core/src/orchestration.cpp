#include <offsim/core/orchestration.hpp>
#include <offsim/core/statistics_sink.hpp>

namespace offsim::core {

std::string_view to_string(Scenario scenario) noexcept {
    switch (scenario) {
    case Scenario::SingleTier: return "SINGLE_TIER";
    case Scenario::TwoTier: return "TWO_TIER";
    case Scenario::TwoTierWithEo: return "TWO_TIER_WITH_EO";
    case Scenario::ThreeTier: return "THREE_TIER";
    }
    return "UNKNOWN";
}

std::optional<Scenario> parse_scenario(std::string_view name) noexcept {
    for (auto scenario : {Scenario::SingleTier, Scenario::TwoTier,
                          Scenario::TwoTierWithEo, Scenario::ThreeTier}) {
        if (name == to_string(scenario)) {
            return scenario;
        }
    }
    return std::nullopt;
}

std::string_view to_string(Outcome outcome) noexcept {
    switch (outcome) {
    case Outcome::Completed: return "completed";
    case Outcome::RejectedCapacity: return "rejected_capacity";
    case Outcome::RejectedBandwidth: return "rejected_bandwidth";
    case Outcome::FailedMobility: return "failed_mobility";
    case Outcome::Incomplete: return "incomplete";
    }
    return "unknown";
}

std::string_view to_string(Stage stage) noexcept {
    switch (stage) {
    case Stage::Decision: return "decision";
    case Stage::Upload: return "upload";
    case Stage::Execution: return "execution";
    case Stage::Download: return "download";
    }
    return "unknown";
}

} // namespace offsim::core
