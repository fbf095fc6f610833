#include <offsim/algo/vm_selector.hpp>

#include <offsim/algo/best_fit_selector.hpp>
#include <offsim/algo/first_fit_selector.hpp>
#include <offsim/algo/next_fit_selector.hpp>
#include <offsim/algo/random_fit_selector.hpp>
#include <offsim/algo/worst_fit_selector.hpp>

namespace offsim::algo {

namespace {
constexpr double kFitEpsilon = 1e-9;
} // namespace

bool fits(const core::ComputeResourceOracle& resources, const core::ResourceRef& resource,
          double required) {
    return required <= resources.residual_capacity(resource) + kFitEpsilon;
}

std::unique_ptr<VmSelector> make_vm_selector(std::string_view name) {
    if (name == "RANDOM_FIT") {
        return std::make_unique<RandomFitSelector>();
    }
    if (name == "FIRST_FIT") {
        return std::make_unique<FirstFitSelector>();
    }
    if (name == "NEXT_FIT") {
        return std::make_unique<NextFitSelector>();
    }
    if (name == "BEST_FIT") {
        return std::make_unique<BestFitSelector>();
    }
    if (name == "WORST_FIT") {
        return std::make_unique<WorstFitSelector>();
    }
    return nullptr;
}

} // namespace offsim::algo
