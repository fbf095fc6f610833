#pragma once

#include <offsim/core/location.hpp>
#include <offsim/core/task.hpp>
#include <offsim/core/types.hpp>

namespace offsim::core {

/// @brief Analytic network delay model.
///
/// Delays are returned in seconds. A value `<= 0` is the saturation
/// sentinel: the link cannot carry the transfer and the task is rejected
/// for bandwidth. The start/finish hooks bracket every transfer the
/// TaskOffloadingManager performs; models that estimate load from live
/// link occupancy maintain their counters there, the others ignore them.
///
/// @see TaskOffloadingManager
/// @ingroup core_network
class NetworkModel {
public:
    virtual ~NetworkModel() = default;

    /// @brief Delay to move the input of @p task from the device to @p target.
    /// @param task Task being uploaded.
    /// @param device_location Device location when the upload starts.
    /// @param target Resource selected for the task.
    /// @param now Current virtual time.
    /// @return Delay in seconds, or a value `<= 0` if the link is saturated.
    [[nodiscard]] virtual double upload_delay(const Task& task, const Location& device_location,
                                              const ResourceRef& target, TimePoint now) const = 0;

    /// @brief Delay to move the output of @p task from @p source back to the device.
    /// @return Delay in seconds, or a value `<= 0` if the link is saturated.
    [[nodiscard]] virtual double download_delay(const Task& task, const Location& device_location,
                                                const ResourceRef& source, TimePoint now) const = 0;

    virtual void upload_started(const Location& device_location, const ResourceRef& target) = 0;
    virtual void upload_finished(const Location& device_location, const ResourceRef& target) = 0;
    virtual void download_started(const Location& device_location, const ResourceRef& source) = 0;
    virtual void download_finished(const Location& device_location, const ResourceRef& source) = 0;

protected:
    NetworkModel() = default;
    NetworkModel(const NetworkModel&) = default;
    NetworkModel& operator=(const NetworkModel&) = default;
};

} // namespace offsim::core
