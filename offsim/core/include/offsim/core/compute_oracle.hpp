#pragma once

#include <offsim/core/task.hpp>
#include <offsim/core/types.hpp>

#include <optional>
#include <vector>

namespace offsim::core {

/// @brief Result of binding a task to a resource.
/// @ingroup core_compute
struct ServiceTimeEstimate {
    Duration service_time;   ///< Time from bind to execution completion.
    double utilization{0.0}; ///< Share of the VM (percent) held until release.
};

/// @brief Capacity and placement authority for compute resources.
///
/// The oracle owns the VM state; policies only read it through the
/// SystemSnapshot, and only the TaskOffloadingManager binds and releases.
/// bind() returning `std::nullopt` is the capacity rejection that turns a
/// task into RejectedCapacity.
///
/// @see OrchestrationPolicy, TaskOffloadingManager
/// @ingroup core_compute
class ComputeResourceOracle {
public:
    virtual ~ComputeResourceOracle() = default;

    /// @brief Whether @p resource could accept @p task right now.
    [[nodiscard]] virtual bool check_capacity(const ResourceRef& resource,
                                              const Task& task) const = 0;

    /// @brief Reserve @p resource for @p task.
    /// @return Service time estimate, or `std::nullopt` if the resource is full.
    /// @throws OutOfRangeError if @p resource does not exist.
    [[nodiscard]] virtual std::optional<ServiceTimeEstimate> bind(const ResourceRef& resource,
                                                                  const Task& task) = 0;

    /// @brief Return the capacity held by @p task on @p resource.
    virtual void release(const ResourceRef& resource, const Task& task) = 0;

    /// @brief Utilization (percent) a task of @p app_type puts on a VM of @p tier.
    [[nodiscard]] virtual double predict_utilization(Tier tier, AppTypeId app_type) const = 0;

    /// @brief Resources of @p tier a task of @p device may be placed on.
    /// @param tier Tier to enumerate.
    /// @param device Generating device (selects its VM for Tier::Mobile).
    /// @param access_point Restrict edge resources to this access point, if set.
    [[nodiscard]] virtual std::vector<ResourceRef> candidates(
        Tier tier, DeviceId device, std::optional<AccessPointId> access_point) const = 0;

    /// @brief Unused capacity of @p resource in percent.
    [[nodiscard]] virtual double residual_capacity(const ResourceRef& resource) const = 0;

    /// @brief Mean utilization (percent) over all VMs of @p tier.
    [[nodiscard]] virtual double average_utilization(Tier tier) const = 0;

protected:
    ComputeResourceOracle() = default;
    ComputeResourceOracle(const ComputeResourceOracle&) = default;
    ComputeResourceOracle& operator=(const ComputeResourceOracle&) = default;
};

} // namespace offsim::core
