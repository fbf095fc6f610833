#pragma once

#include <offsim/core/location.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace offsim::core {

/// @brief One row of the task-type table.
///
/// Sizes are in KB, lengths in million instructions, times in seconds and
/// utilizations in percent of one VM.
///
/// @ingroup core_config
struct TaskType {
    std::string name;
    double usage_percent{0.0};           ///< Share of devices running this application.
    double cloud_selection_percent{0.0}; ///< Probability (%) of sending a task to the cloud.
    double mean_interarrival{0.0};       ///< Mean Poisson inter-arrival time.
    double active_period{0.0};           ///< Length of an active (task generating) period.
    double idle_period{0.0};             ///< Length of an idle period.
    double mean_input_kb{0.0};
    double mean_output_kb{0.0};
    double mean_length_mi{0.0};
    uint32_t required_cores{1};
    double edge_utilization{0.0};
    double cloud_utilization{0.0};
    double mobile_utilization{0.0};
    double delay_sensitivity{0.0};
    double max_delay{0.0};
};

/// @brief Capacity of one virtual machine.
/// @ingroup core_config
struct VmSpec {
    uint32_t cores{1};
    double mips{0.0};
    double ram_mb{0.0};
    double storage_mb{0.0};
};

/// @brief A physical edge host and its VMs.
/// @ingroup core_config
struct HostSpec {
    uint32_t cores{1};
    double mips{0.0};
    std::vector<VmSpec> vms;
};

/// @brief An edge datacenter attached to one access point.
/// @ingroup core_config
struct EdgeDatacenterSpec {
    AccessPoint access_point;
    std::vector<HostSpec> hosts;
};

/// @brief Homogeneous cloud datacenter.
/// @ingroup core_config
struct CloudSpec {
    uint32_t host_count{1};
    uint32_t vms_per_host{1};
    VmSpec vm;
};

/// @brief VM available on every mobile device (three-tier scenario).
/// @ingroup core_config
struct MobileSpec {
    bool enabled{false};
    VmSpec vm;
};

/// @brief Queueing discipline of the WLAN access link.
/// @ingroup core_config
enum class QueueDiscipline {
    MM1,
    MM2,
};

/// @brief Which network delay model a run uses.
/// @ingroup core_config
enum class NetworkModelKind {
    Averaged,        ///< Fixed device count per access point.
    AccessPointLoad, ///< Device count at the serving access point from mobility.
    Contention,      ///< Live count of active transfers on the link.
};

/// @brief Link parameters.
/// @ingroup core_config
struct NetworkSettings {
    NetworkModelKind model{NetworkModelKind::AccessPointLoad};
    QueueDiscipline wlan_discipline{QueueDiscipline::MM1};
    double wlan_bandwidth_kbps{0.0};
    double wan_bandwidth_kbps{0.0};
    double wlan_propagation_delay{0.0};
    double wan_propagation_delay{0.0};
    double lan_internal_delay{0.0};
    /// Delays above this are treated as a saturated link (seconds).
    double max_queueing_delay{5.0};
};

/// @brief Which mobility model a run uses.
/// @ingroup core_config
enum class MobilityKind {
    Nomadic,
    Waypoint,
};

/// @brief Mobility parameters.
///
/// `mean_dwell_time[c]` is the mean sojourn time (seconds) at an access point
/// of attractiveness class `c` for the nomadic model. The waypoint model
/// moves in a `area_width` x `area_height` rectangle.
///
/// @ingroup core_config
struct MobilitySettings {
    MobilityKind kind{MobilityKind::Nomadic};
    std::vector<double> mean_dwell_time;
    double area_width{0.0};
    double area_height{0.0};
    double min_speed{1.0};
    double max_speed{1.0};
    double min_pause{0.0};
    double max_pause{0.0};
};

/// @brief Run-level settings, including the batch plan.
/// @ingroup core_config
struct SimulationSettings {
    double duration{0.0};          ///< Simulation horizon in seconds.
    double warm_up{0.0};           ///< Tasks created earlier are not summarised.
    double task_start_offset{0.0}; ///< Earliest task creation time.
    double load_log_interval{0.0}; ///< VM load sampling period; 0 disables it.
    uint64_t seed{0};
    uint32_t iterations{1};
    std::vector<uint32_t> device_counts;
    std::vector<std::string> scenarios;
    std::vector<std::string> policies;
};

/// @brief Complete, immutable input of a simulation.
///
/// Loaded once before any run and passed by const reference to every
/// component that needs it.
///
/// @ingroup core_config
struct SimulationConfig {
    SimulationSettings simulation;
    NetworkSettings network;
    MobilitySettings mobility;
    std::vector<TaskType> task_types;
    std::vector<EdgeDatacenterSpec> edge_datacenters;
    CloudSpec cloud;
    MobileSpec mobile;

    /// @brief Access points of all edge datacenters, in datacenter order.
    [[nodiscard]] std::vector<AccessPoint> access_points() const;
};

} // namespace offsim::core
