#include <offsim/io/config_loader.hpp>
#include <offsim/io/error.hpp>

#include <offsim/core/orchestration.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fstream>
#include <sstream>
#include <utility>
#include <string>
#include <vector>

namespace offsim::io {

namespace {

using namespace offsim::core;

// Slack on the usage percentage sum for values like 33.3 + 33.3 + 33.4
constexpr double kPercentEpsilon = 1e-6;

// Helper to get required member with error context
const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name,
                                   const std::string& context) {
    if (!obj.HasMember(name)) {
        throw ConfigError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

double get_double(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsNumber()) {
        throw ConfigError(std::string("field '") + name + "' must be a number", context);
    }
    return member.GetDouble();
}

uint64_t get_uint64(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsUint64()) {
        throw ConfigError(std::string("field '") + name + "' must be a non-negative integer",
                          context);
    }
    return member.GetUint64();
}

uint32_t get_uint32(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsUint()) {
        throw ConfigError(std::string("field '") + name + "' must be a non-negative integer",
                          context);
    }
    return member.GetUint();
}

std::string get_string(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsString()) {
        throw ConfigError(std::string("field '") + name + "' must be a string", context);
    }
    return member.GetString();
}

const rapidjson::Value& get_array(const rapidjson::Value& val, const char* name,
                                  const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsArray()) {
        throw ConfigError(std::string("field '") + name + "' must be an array", context);
    }
    return member;
}

const rapidjson::Value& get_object(const rapidjson::Value& val, const char* name,
                                   const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsObject()) {
        throw ConfigError(std::string("field '") + name + "' must be an object", context);
    }
    return member;
}

// Optional getters: absent means default, present with the wrong type is an error
double get_double_or(const rapidjson::Value& val, const char* name, double default_val,
                     const std::string& context) {
    if (!val.HasMember(name)) {
        return default_val;
    }
    return get_double(val, name, context);
}

uint32_t get_uint32_or(const rapidjson::Value& val, const char* name, uint32_t default_val,
                       const std::string& context) {
    if (!val.HasMember(name)) {
        return default_val;
    }
    return get_uint32(val, name, context);
}

bool get_bool_or(const rapidjson::Value& val, const char* name, bool default_val,
                 const std::string& context) {
    if (!val.HasMember(name)) {
        return default_val;
    }
    const auto& member = val[name];
    if (!member.IsBool()) {
        throw ConfigError(std::string("field '") + name + "' must be a boolean", context);
    }
    return member.GetBool();
}

std::string indexed(const std::string& prefix, rapidjson::SizeType idx) {
    return prefix + "[" + std::to_string(idx) + "]";
}

void require_non_negative(double value, const char* name, const std::string& context) {
    if (value < 0.0) {
        throw ConfigError(std::string("field '") + name + "' must not be negative", context);
    }
}

void require_positive(double value, const char* name, const std::string& context) {
    if (value <= 0.0) {
        throw ConfigError(std::string("field '") + name + "' must be positive", context);
    }
}

VmSpec parse_vm(const rapidjson::Value& obj, const std::string& ctx) {
    if (!obj.IsObject()) {
        throw ConfigError("VM must be an object", ctx);
    }
    VmSpec vm;
    vm.cores = get_uint32_or(obj, "cores", 1, ctx);
    vm.mips = get_double(obj, "mips", ctx);
    vm.ram_mb = get_double_or(obj, "ram_mb", 0.0, ctx);
    vm.storage_mb = get_double_or(obj, "storage_mb", 0.0, ctx);
    require_positive(vm.mips, "mips", ctx);
    return vm;
}

void load_simulation(const rapidjson::Value& obj, SimulationSettings& sim) {
    const std::string ctx = "simulation";
    sim.duration = get_double(obj, "duration", ctx);
    sim.warm_up = get_double_or(obj, "warm_up", 0.0, ctx);
    sim.task_start_offset = get_double_or(obj, "task_start_offset", 0.0, ctx);
    sim.load_log_interval = get_double_or(obj, "load_log_interval", 0.0, ctx);
    if (obj.HasMember("seed")) {
        sim.seed = get_uint64(obj, "seed", ctx);
    }
    sim.iterations = get_uint32_or(obj, "iterations", 1, ctx);

    require_positive(sim.duration, "duration", ctx);
    require_non_negative(sim.warm_up, "warm_up", ctx);
    require_non_negative(sim.task_start_offset, "task_start_offset", ctx);
    require_non_negative(sim.load_log_interval, "load_log_interval", ctx);

    if (obj.HasMember("device_counts")) {
        const auto& counts = get_array(obj, "device_counts", ctx);
        for (rapidjson::SizeType idx = 0; idx < counts.Size(); ++idx) {
            if (!counts[idx].IsUint() || counts[idx].GetUint() == 0) {
                throw ConfigError("must be a positive integer", indexed(ctx + ".device_counts", idx));
            }
            sim.device_counts.push_back(counts[idx].GetUint());
        }
    }

    auto load_names = [&](const char* name, std::vector<std::string>& out) {
        if (!obj.HasMember(name)) {
            return;
        }
        const auto& names = get_array(obj, name, ctx);
        for (rapidjson::SizeType idx = 0; idx < names.Size(); ++idx) {
            if (!names[idx].IsString()) {
                throw ConfigError("must be a string", indexed(ctx + "." + name, idx));
            }
            out.emplace_back(names[idx].GetString());
        }
    };
    load_names("scenarios", sim.scenarios);
    load_names("policies", sim.policies);
}

void load_network(const rapidjson::Value& obj, NetworkSettings& net) {
    const std::string ctx = "network";
    if (obj.HasMember("model")) {
        std::string model = get_string(obj, "model", ctx);
        if (model == "averaged") {
            net.model = NetworkModelKind::Averaged;
        } else if (model == "access_point_load") {
            net.model = NetworkModelKind::AccessPointLoad;
        } else if (model == "contention") {
            net.model = NetworkModelKind::Contention;
        } else {
            throw ConfigError("unknown network model '" + model + "'", ctx);
        }
    }
    if (obj.HasMember("wlan_discipline")) {
        std::string discipline = get_string(obj, "wlan_discipline", ctx);
        if (discipline == "MM1") {
            net.wlan_discipline = QueueDiscipline::MM1;
        } else if (discipline == "MM2") {
            net.wlan_discipline = QueueDiscipline::MM2;
        } else {
            throw ConfigError("unknown queue discipline '" + discipline + "'", ctx);
        }
    }

    net.wlan_bandwidth_kbps = get_double(obj, "wlan_bandwidth_kbps", ctx);
    net.wan_bandwidth_kbps = get_double(obj, "wan_bandwidth_kbps", ctx);
    net.wlan_propagation_delay = get_double_or(obj, "wlan_propagation_delay", 0.0, ctx);
    net.wan_propagation_delay = get_double_or(obj, "wan_propagation_delay", 0.0, ctx);
    net.lan_internal_delay = get_double_or(obj, "lan_internal_delay", 0.0, ctx);
    net.max_queueing_delay = get_double_or(obj, "max_queueing_delay", 5.0, ctx);

    require_positive(net.wlan_bandwidth_kbps, "wlan_bandwidth_kbps", ctx);
    require_positive(net.wan_bandwidth_kbps, "wan_bandwidth_kbps", ctx);
    require_non_negative(net.wlan_propagation_delay, "wlan_propagation_delay", ctx);
    require_non_negative(net.wan_propagation_delay, "wan_propagation_delay", ctx);
    require_non_negative(net.lan_internal_delay, "lan_internal_delay", ctx);
    require_non_negative(net.max_queueing_delay, "max_queueing_delay", ctx);
}

void load_mobility(const rapidjson::Value& obj, MobilitySettings& mob) {
    const std::string ctx = "mobility";
    std::string model = get_string(obj, "model", ctx);
    if (model == "nomadic") {
        mob.kind = MobilityKind::Nomadic;
    } else if (model == "waypoint") {
        mob.kind = MobilityKind::Waypoint;
    } else {
        throw ConfigError("unknown mobility model '" + model + "'", ctx);
    }

    if (obj.HasMember("mean_dwell_time")) {
        const auto& dwell = get_array(obj, "mean_dwell_time", ctx);
        for (rapidjson::SizeType idx = 0; idx < dwell.Size(); ++idx) {
            if (!dwell[idx].IsNumber() || dwell[idx].GetDouble() <= 0.0) {
                throw ConfigError("must be a positive number",
                                  indexed(ctx + ".mean_dwell_time", idx));
            }
            mob.mean_dwell_time.push_back(dwell[idx].GetDouble());
        }
    }

    mob.area_width = get_double_or(obj, "area_width", 0.0, ctx);
    mob.area_height = get_double_or(obj, "area_height", 0.0, ctx);
    mob.min_speed = get_double_or(obj, "min_speed", 1.0, ctx);
    mob.max_speed = get_double_or(obj, "max_speed", mob.min_speed, ctx);
    mob.min_pause = get_double_or(obj, "min_pause", 0.0, ctx);
    mob.max_pause = get_double_or(obj, "max_pause", mob.min_pause, ctx);

    if (mob.kind == MobilityKind::Waypoint) {
        require_positive(mob.area_width, "area_width", ctx);
        require_positive(mob.area_height, "area_height", ctx);
        require_positive(mob.min_speed, "min_speed", ctx);
        require_non_negative(mob.min_pause, "min_pause", ctx);
        if (mob.max_speed < mob.min_speed) {
            throw ConfigError("max_speed must not be below min_speed", ctx);
        }
        if (mob.max_pause < mob.min_pause) {
            throw ConfigError("max_pause must not be below min_pause", ctx);
        }
    }
}

TaskType parse_task_type(const rapidjson::Value& obj, const std::string& ctx) {
    if (!obj.IsObject()) {
        throw ConfigError("task type must be an object", ctx);
    }
    TaskType type;
    type.name = get_string(obj, "name", ctx);
    type.usage_percent = get_double(obj, "usage_percent", ctx);
    type.cloud_selection_percent = get_double_or(obj, "cloud_selection_percent", 0.0, ctx);
    type.mean_interarrival = get_double(obj, "mean_interarrival", ctx);
    type.active_period = get_double(obj, "active_period", ctx);
    type.idle_period = get_double(obj, "idle_period", ctx);
    type.mean_input_kb = get_double(obj, "mean_input_kb", ctx);
    type.mean_output_kb = get_double(obj, "mean_output_kb", ctx);
    type.mean_length_mi = get_double(obj, "mean_length_mi", ctx);
    type.required_cores = get_uint32_or(obj, "required_cores", 1, ctx);
    type.edge_utilization = get_double(obj, "edge_utilization", ctx);
    type.cloud_utilization = get_double(obj, "cloud_utilization", ctx);
    type.mobile_utilization = get_double_or(obj, "mobile_utilization", 0.0, ctx);
    type.delay_sensitivity = get_double_or(obj, "delay_sensitivity", 0.0, ctx);
    type.max_delay = get_double_or(obj, "max_delay", 0.0, ctx);

    for (auto [value, name] : {std::pair{type.usage_percent, "usage_percent"},
                               std::pair{type.cloud_selection_percent, "cloud_selection_percent"},
                               std::pair{type.edge_utilization, "edge_utilization"},
                               std::pair{type.cloud_utilization, "cloud_utilization"},
                               std::pair{type.mobile_utilization, "mobile_utilization"}}) {
        if (value < 0.0 || value > 100.0) {
            throw ConfigError(std::string("field '") + name + "' must be within [0, 100]", ctx);
        }
    }
    require_non_negative(type.idle_period, "idle_period", ctx);
    require_non_negative(type.mean_input_kb, "mean_input_kb", ctx);
    require_non_negative(type.mean_output_kb, "mean_output_kb", ctx);
    require_non_negative(type.mean_length_mi, "mean_length_mi", ctx);
    if (type.usage_percent > 0.0) {
        require_positive(type.mean_interarrival, "mean_interarrival", ctx);
        require_positive(type.active_period, "active_period", ctx);
    }
    return type;
}

EdgeDatacenterSpec parse_datacenter(const rapidjson::Value& obj, const std::string& ctx) {
    if (!obj.IsObject()) {
        throw ConfigError("datacenter must be an object", ctx);
    }
    EdgeDatacenterSpec dc;

    std::string ap_ctx = ctx + ".access_point";
    const auto& ap = get_object(obj, "access_point", ctx);
    dc.access_point.id = get_uint32(ap, "id", ap_ctx);
    dc.access_point.place_class = static_cast<int>(get_uint32_or(ap, "place_class", 0, ap_ctx));
    dc.access_point.x = get_double_or(ap, "x", 0.0, ap_ctx);
    dc.access_point.y = get_double_or(ap, "y", 0.0, ap_ctx);

    const auto& hosts = get_array(obj, "hosts", ctx);
    if (hosts.Empty()) {
        throw ConfigError("hosts array cannot be empty", ctx);
    }
    for (rapidjson::SizeType hidx = 0; hidx < hosts.Size(); ++hidx) {
        std::string host_ctx = indexed(ctx + ".hosts", hidx);
        const auto& host_obj = hosts[hidx];
        if (!host_obj.IsObject()) {
            throw ConfigError("host must be an object", host_ctx);
        }
        HostSpec host;
        host.cores = get_uint32_or(host_obj, "cores", 1, host_ctx);
        host.mips = get_double_or(host_obj, "mips", 0.0, host_ctx);

        const auto& vms = get_array(host_obj, "vms", host_ctx);
        if (vms.Empty()) {
            throw ConfigError("vms array cannot be empty", host_ctx);
        }
        for (rapidjson::SizeType vidx = 0; vidx < vms.Size(); ++vidx) {
            host.vms.push_back(parse_vm(vms[vidx], indexed(host_ctx + ".vms", vidx)));
        }
        dc.hosts.push_back(std::move(host));
    }
    return dc;
}

SimulationConfig load_document(const rapidjson::Document& doc) {
    SimulationConfig config;

    load_simulation(get_object(doc, "simulation", "config"), config.simulation);
    load_network(get_object(doc, "network", "config"), config.network);
    load_mobility(get_object(doc, "mobility", "config"), config.mobility);

    const auto& types = get_array(doc, "task_types", "config");
    for (rapidjson::SizeType idx = 0; idx < types.Size(); ++idx) {
        config.task_types.push_back(parse_task_type(types[idx], indexed("task_types", idx)));
    }

    const auto& dcs = get_array(doc, "edge_datacenters", "config");
    for (rapidjson::SizeType idx = 0; idx < dcs.Size(); ++idx) {
        config.edge_datacenters.push_back(parse_datacenter(dcs[idx], indexed("edge_datacenters", idx)));
    }

    const auto& cloud = get_object(doc, "cloud", "config");
    config.cloud.host_count = get_uint32(cloud, "host_count", "cloud");
    config.cloud.vms_per_host = get_uint32(cloud, "vms_per_host", "cloud");
    config.cloud.vm = parse_vm(get_object(cloud, "vm", "cloud"), "cloud.vm");

    if (doc.HasMember("mobile")) {
        const auto& mobile = get_object(doc, "mobile", "config");
        config.mobile.enabled = get_bool_or(mobile, "enabled", true, "mobile");
        if (config.mobile.enabled) {
            config.mobile.vm = parse_vm(get_object(mobile, "vm", "mobile"), "mobile.vm");
        }
    }

    validate_config(config);
    return config;
}

} // anonymous namespace

void validate_config(const SimulationConfig& config) {
    const auto& sim = config.simulation;
    if (sim.duration <= 0.0) {
        throw ConfigError("field 'duration' must be positive", "simulation");
    }
    if (sim.warm_up >= sim.duration) {
        throw ConfigError("warm_up must be shorter than duration", "simulation");
    }
    if (sim.iterations == 0) {
        throw ConfigError("field 'iterations' must be at least 1", "simulation");
    }
    for (std::size_t idx = 0; idx < sim.scenarios.size(); ++idx) {
        if (!parse_scenario(sim.scenarios[idx])) {
            throw ConfigError("unknown scenario '" + sim.scenarios[idx] + "'",
                              "simulation.scenarios[" + std::to_string(idx) + "]");
        }
    }

    if (config.network.wlan_bandwidth_kbps <= 0.0 || config.network.wan_bandwidth_kbps <= 0.0) {
        throw ConfigError("link bandwidths must be positive", "network");
    }

    if (config.task_types.empty()) {
        throw ConfigError("at least one task type is required", "task_types");
    }
    double usage = 0.0;
    for (std::size_t idx = 0; idx < config.task_types.size(); ++idx) {
        const auto& type = config.task_types[idx];
        usage += type.usage_percent;
        if (type.usage_percent > 0.0 &&
            (type.mean_interarrival <= 0.0 || type.active_period <= 0.0)) {
            throw ConfigError("mean_interarrival and active_period must be positive",
                              "task_types[" + std::to_string(idx) + "]");
        }
    }
    if (usage > 100.0 + kPercentEpsilon) {
        throw ConfigError("usage percentages sum to " + std::to_string(usage) + " (> 100)",
                          "task_types");
    }

    if (config.edge_datacenters.empty()) {
        throw ConfigError("at least one edge datacenter is required", "edge_datacenters");
    }
    for (std::size_t idx = 0; idx < config.edge_datacenters.size(); ++idx) {
        const auto& ap = config.edge_datacenters[idx].access_point;
        std::string ctx = "edge_datacenters[" + std::to_string(idx) + "]";
        if (ap.id != idx) {
            throw ConfigError("access point id " + std::to_string(ap.id) +
                                  " must equal the datacenter index",
                              ctx);
        }
        if (config.mobility.kind == MobilityKind::Nomadic) {
            auto place = static_cast<std::size_t>(ap.place_class);
            if (ap.place_class < 0 || place >= config.mobility.mean_dwell_time.size()) {
                throw ConfigError("no mean dwell time for place class " +
                                      std::to_string(ap.place_class),
                                  ctx);
            }
        }
    }

    if (config.cloud.host_count == 0 || config.cloud.vms_per_host == 0) {
        throw ConfigError("cloud needs at least one host and one VM per host", "cloud");
    }
}

SimulationConfig load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_config_from_string(oss.str());
}

SimulationConfig load_config_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw ConfigError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw ConfigError("root must be an object", "config");
    }

    return load_document(doc);
}

} // namespace offsim::io
