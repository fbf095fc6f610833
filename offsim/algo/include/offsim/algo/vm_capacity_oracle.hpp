#pragma once

#include <offsim/core/compute_oracle.hpp>
#include <offsim/core/config.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace offsim::algo {

/// @brief Reference compute oracle: VMs with a utilization budget.
///
/// Every VM (edge, cloud, and one per device when mobile execution is
/// enabled) has 100 % of capacity. Binding a task reserves the utilization
/// predicted for its application type on that tier and fails when the VM
/// would exceed 100 %. The service time is the task length divided by the
/// VM's MIPS; it does not depend on co-located tasks.
///
/// Edge hosts are numbered across datacenters in configuration order, so a
/// ResourceRef's `host` is a global edge host index.
///
/// @ingroup algo_compute
class VmCapacityOracle : public core::ComputeResourceOracle {
public:
    /// @param config Datacenters, VM specs and the task-type table.
    /// @param device_count Number of devices (mobile VMs).
    VmCapacityOracle(const core::SimulationConfig& config, std::size_t device_count);

    [[nodiscard]] bool check_capacity(const core::ResourceRef& resource,
                                      const core::Task& task) const override;
    [[nodiscard]] std::optional<core::ServiceTimeEstimate> bind(const core::ResourceRef& resource,
                                                                const core::Task& task) override;
    void release(const core::ResourceRef& resource, const core::Task& task) override;
    [[nodiscard]] double predict_utilization(core::Tier tier,
                                             core::AppTypeId app_type) const override;
    [[nodiscard]] std::vector<core::ResourceRef> candidates(
        core::Tier tier, core::DeviceId device,
        std::optional<core::AccessPointId> access_point) const override;
    [[nodiscard]] double residual_capacity(const core::ResourceRef& resource) const override;
    [[nodiscard]] double average_utilization(core::Tier tier) const override;

    /// @brief Current utilization (percent) of @p resource.
    [[nodiscard]] double utilization(const core::ResourceRef& resource) const;

private:
    struct Vm {
        core::ResourceRef ref;
        double mips{0.0};
        double used{0.0};
    };

    Vm& lookup(const core::ResourceRef& resource);
    const Vm& lookup(const core::ResourceRef& resource) const;
    const std::vector<Vm>& tier_vms(core::Tier tier) const noexcept;

    const std::vector<core::TaskType>& task_types_;
    // Flat VM lists per tier; index_ maps (host, vm) to a position
    std::vector<Vm> edge_;
    std::vector<Vm> cloud_;
    std::vector<Vm> mobile_;
    std::vector<std::size_t> edge_host_offset_;
    std::vector<std::size_t> cloud_host_offset_;
};

} // namespace offsim::algo
