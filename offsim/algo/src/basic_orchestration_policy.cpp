#include <offsim/algo/basic_orchestration_policy.hpp>

#include <offsim/algo/worst_fit_selector.hpp>

#include <offsim/core/compute_oracle.hpp>
#include <offsim/core/error.hpp>

#include <string>
#include <utility>

namespace offsim::algo {

BasicOrchestrationPolicy::BasicOrchestrationPolicy(core::Scenario scenario,
                                                   const std::vector<core::TaskType>& task_types,
                                                   std::unique_ptr<VmSelector> edge_selector,
                                                   uint64_t seed)
    : scenario_(scenario)
    , task_types_(task_types)
    , edge_selector_(std::move(edge_selector))
    , cloud_selector_(std::make_unique<WorstFitSelector>())
    , rng_(static_cast<std::mt19937::result_type>(seed)) {
    if (!edge_selector_) {
        throw core::OutOfRangeError("BasicOrchestrationPolicy requires an edge VM selector");
    }
}

bool BasicOrchestrationPolicy::draw_cloud(const core::TaskType& type) {
    std::uniform_real_distribution<double> percent(0.0, 100.0);
    return percent(rng_) < type.cloud_selection_percent;
}

core::OrchestrationDecision BasicOrchestrationPolicy::place_on(
    core::Tier tier, VmSelector& selector, const core::Task& task,
    const core::SystemSnapshot& snapshot) {
    std::optional<core::AccessPointId> access_point;
    if (tier == core::Tier::Edge && scenario_ != core::Scenario::TwoTierWithEo) {
        access_point = snapshot.device_location.access_point;
    }

    auto candidates = snapshot.resources.candidates(tier, task.device(), access_point);
    double required = snapshot.resources.predict_utilization(tier, task.app_type());

    auto index = selector.select(candidates, required, snapshot.resources, rng_);
    if (!index) {
        return core::OrchestrationDecision::reject(tier);
    }
    return core::OrchestrationDecision::place(candidates[*index]);
}

core::OrchestrationDecision BasicOrchestrationPolicy::select_target(
    const core::Task& task, const core::SystemSnapshot& snapshot) {
    if (task.app_type() >= task_types_.size()) {
        throw core::OutOfRangeError("Unknown application type " +
                                    std::to_string(task.app_type()) + " for task " +
                                    std::to_string(task.id()));
    }
    const auto& type = task_types_[task.app_type()];

    switch (scenario_) {
    case core::Scenario::SingleTier:
        return place_on(core::Tier::Edge, *edge_selector_, task, snapshot);

    case core::Scenario::ThreeTier:
        if (type.mobile_utilization > 0.0) {
            auto local = place_on(core::Tier::Mobile, *cloud_selector_, task, snapshot);
            if (!local.rejected()) {
                return local;
            }
        }
        [[fallthrough]];
    case core::Scenario::TwoTier:
    case core::Scenario::TwoTierWithEo:
        if (draw_cloud(type)) {
            return place_on(core::Tier::Cloud, *cloud_selector_, task, snapshot);
        }
        return place_on(core::Tier::Edge, *edge_selector_, task, snapshot);
    }
    return core::OrchestrationDecision::reject(core::Tier::Edge);
}

} // namespace offsim::algo
