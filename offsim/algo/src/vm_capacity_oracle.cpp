#include <offsim/algo/vm_capacity_oracle.hpp>

#include <offsim/core/error.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace offsim::algo {

namespace {

// Tolerance on the 100 % budget for accumulated rounding
constexpr double kCapacityEpsilon = 1e-9;

std::string describe(const core::ResourceRef& ref) {
    return std::string(core::to_string(ref.tier)) + " host " + std::to_string(ref.host) +
           " vm " + std::to_string(ref.vm);
}

} // namespace

VmCapacityOracle::VmCapacityOracle(const core::SimulationConfig& config,
                                   std::size_t device_count)
    : task_types_(config.task_types) {
    uint32_t host = 0;
    for (const auto& dc : config.edge_datacenters) {
        for (const auto& spec : dc.hosts) {
            edge_host_offset_.push_back(edge_.size());
            uint32_t vm = 0;
            for (const auto& vm_spec : spec.vms) {
                edge_.push_back(Vm{{core::Tier::Edge, host, vm++, dc.access_point.id},
                                   vm_spec.mips, 0.0});
            }
            ++host;
        }
    }
    edge_host_offset_.push_back(edge_.size());

    for (uint32_t h = 0; h < config.cloud.host_count; ++h) {
        cloud_host_offset_.push_back(cloud_.size());
        for (uint32_t v = 0; v < config.cloud.vms_per_host; ++v) {
            cloud_.push_back(Vm{{core::Tier::Cloud, h, v, 0}, config.cloud.vm.mips, 0.0});
        }
    }
    cloud_host_offset_.push_back(cloud_.size());

    if (config.mobile.enabled) {
        for (std::size_t d = 0; d < device_count; ++d) {
            mobile_.push_back(Vm{{core::Tier::Mobile, static_cast<uint32_t>(d), 0, 0},
                                 config.mobile.vm.mips, 0.0});
        }
    }
}

const std::vector<VmCapacityOracle::Vm>& VmCapacityOracle::tier_vms(
    core::Tier tier) const noexcept {
    switch (tier) {
    case core::Tier::Edge: return edge_;
    case core::Tier::Cloud: return cloud_;
    case core::Tier::Mobile: return mobile_;
    }
    return edge_;
}

const VmCapacityOracle::Vm& VmCapacityOracle::lookup(const core::ResourceRef& resource) const {
    std::size_t index = 0;
    bool found = false;
    switch (resource.tier) {
    case core::Tier::Edge:
    case core::Tier::Cloud: {
        const auto& offsets =
            (resource.tier == core::Tier::Edge) ? edge_host_offset_ : cloud_host_offset_;
        if (resource.host + 1 < offsets.size()) {
            index = offsets[resource.host] + resource.vm;
            found = index < offsets[resource.host + 1];
        }
        break;
    }
    case core::Tier::Mobile:
        index = resource.host;
        found = resource.vm == 0 && index < mobile_.size();
        break;
    }
    if (!found) {
        throw core::OutOfRangeError("Unknown compute resource: " + describe(resource));
    }
    return tier_vms(resource.tier)[index];
}

VmCapacityOracle::Vm& VmCapacityOracle::lookup(const core::ResourceRef& resource) {
    return const_cast<Vm&>(std::as_const(*this).lookup(resource));
}

double VmCapacityOracle::predict_utilization(core::Tier tier, core::AppTypeId app_type) const {
    if (app_type >= task_types_.size()) {
        throw core::OutOfRangeError("Unknown application type " + std::to_string(app_type));
    }
    const auto& type = task_types_[app_type];
    switch (tier) {
    case core::Tier::Edge: return type.edge_utilization;
    case core::Tier::Cloud: return type.cloud_utilization;
    case core::Tier::Mobile: return type.mobile_utilization;
    }
    return 0.0;
}

bool VmCapacityOracle::check_capacity(const core::ResourceRef& resource,
                                      const core::Task& task) const {
    const Vm& vm = lookup(resource);
    double required = predict_utilization(resource.tier, task.app_type());
    return vm.used + required <= 100.0 + kCapacityEpsilon;
}

std::optional<core::ServiceTimeEstimate> VmCapacityOracle::bind(const core::ResourceRef& resource,
                                                                const core::Task& task) {
    if (!check_capacity(resource, task)) {
        return std::nullopt;
    }
    Vm& vm = lookup(resource);
    double required = predict_utilization(resource.tier, task.app_type());
    vm.used += required;

    double seconds = (vm.mips > 0.0) ? task.properties().length_mi / vm.mips : 0.0;
    return core::ServiceTimeEstimate{core::duration_from_seconds(seconds), required};
}

void VmCapacityOracle::release(const core::ResourceRef& resource, const core::Task& task) {
    Vm& vm = lookup(resource);
    vm.used = std::max(0.0, vm.used - predict_utilization(resource.tier, task.app_type()));
}

std::vector<core::ResourceRef> VmCapacityOracle::candidates(
    core::Tier tier, core::DeviceId device,
    std::optional<core::AccessPointId> access_point) const {
    std::vector<core::ResourceRef> result;
    if (tier == core::Tier::Mobile) {
        if (device < mobile_.size()) {
            result.push_back(mobile_[device].ref);
        }
        return result;
    }
    for (const auto& vm : tier_vms(tier)) {
        if (tier == core::Tier::Edge && access_point && vm.ref.access_point != *access_point) {
            continue;
        }
        result.push_back(vm.ref);
    }
    return result;
}

double VmCapacityOracle::residual_capacity(const core::ResourceRef& resource) const {
    return 100.0 - lookup(resource).used;
}

double VmCapacityOracle::utilization(const core::ResourceRef& resource) const {
    return lookup(resource).used;
}

double VmCapacityOracle::average_utilization(core::Tier tier) const {
    const auto& vms = tier_vms(tier);
    if (vms.empty()) {
        return 0.0;
    }
    double total = 0.0;
    for (const auto& vm : vms) {
        total += vm.used;
    }
    return total / static_cast<double>(vms.size());
}

} // namespace offsim::algo
