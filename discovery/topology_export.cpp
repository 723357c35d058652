#include "discovery/topology_export.hpp"
#include "discovery/discovery_manager.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>

namespace switchscan::discovery {

nlohmann::json switch_to_json(const SwitchInfo& info) {
    nlohmann::json neighbors = nlohmann::json::array();
    for (const auto& neighbor : info.neighbors) {
        nlohmann::json entry = {
            {"address", neighbor.address},
            {"local_port", neighbor.local_port},
            {"remote_port", neighbor.remote_port},
            {"system_name", neighbor.system_name},
            {"chassis_id", neighbor.chassis_id}
        };
        for (const auto& [key, value] : neighbor.properties) {
            if (!entry.contains(key)) {
                entry[key] = value;
            }
        }
        neighbors.push_back(std::move(entry));
    }

    return {
        {"address", info.address},
        {"type", info.type},
        {"attributes", info.attributes},
        {"neighbors", std::move(neighbors)}
    };
}

nlohmann::json topology_to_json(const NetworkTopology& topology) {
    nlohmann::json switches = nlohmann::json::object();
    for (const auto& [address, info] : topology.get_switches()) {
        switches[address] = switch_to_json(info);
    }

    return {
        {"discovery_timestamp", format_timestamp(topology.get_discovery_timestamp())},
        {"switches", std::move(switches)}
    };
}

nlohmann::json stats_to_json(const TopologyStats& stats) {
    return {
        {"total_switches", stats.total_switches},
        {"switch_types", stats.switch_types},
        {"total_neighbors", stats.total_neighbors},
        {"discovery_timestamp", format_timestamp(stats.discovery_timestamp)},
        {"discovered_ips", stats.discovered_ips},
        {"failed_ips", stats.failed_ips},
        {"pending_ips", stats.pending_ips}
    };
}

std::string topology_filename(const std::string& seed_ip) {
    std::string name = seed_ip;
    std::replace(name.begin(), name.end(), '.', '_');
    std::replace(name.begin(), name.end(), ':', '_');
    return "topology_" + name + ".json";
}

namespace {

void emit_yaml(YAML::Emitter& out, const nlohmann::json& value) {
    if (value.is_object()) {
        out << YAML::BeginMap;
        for (auto it = value.begin(); it != value.end(); ++it) {
            out << YAML::Key << it.key() << YAML::Value;
            emit_yaml(out, it.value());
        }
        out << YAML::EndMap;
    } else if (value.is_array()) {
        out << YAML::BeginSeq;
        for (const auto& item : value) {
            emit_yaml(out, item);
        }
        out << YAML::EndSeq;
    } else if (value.is_string()) {
        out << YAML::DoubleQuoted << value.get<std::string>();
    } else if (value.is_boolean()) {
        out << value.get<bool>();
    } else if (value.is_number_unsigned()) {
        out << value.get<uint64_t>();
    } else if (value.is_number_integer()) {
        out << value.get<int64_t>();
    } else if (value.is_number_float()) {
        out << value.get<double>();
    } else {
        out << YAML::Null;
    }
}

} // namespace

std::string render_topology(const NetworkTopology& topology, OutputFormat format) {
    nlohmann::json document = topology_to_json(topology);

    if (format == OutputFormat::YAML) {
        // Invalid UTF-8 is replaced in the dump before yaml-cpp sees it
        nlohmann::json clean = nlohmann::json::parse(
            document.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        YAML::Emitter out;
        out.SetIndent(2);
        emit_yaml(out, clean);
        if (!out.good()) {
            throw std::runtime_error("YAML encoding failed: " + out.GetLastError());
        }
        return std::string(out.c_str()) + "\n";
    }

    return document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

bool save_topology(const NetworkTopology& topology, const std::string& path, OutputFormat format) {
    std::string text;
    try {
        text = render_topology(topology, format);
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to save topology to {}: {}", path, e.what());
        return false;
    } catch (const std::runtime_error& e) {
        spdlog::error("Failed to save topology to {}: {}", path, e.what());
        return false;
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        spdlog::error("Failed to save topology: cannot open {}", path);
        return false;
    }

    file << text;
    if (!file.good()) {
        spdlog::error("Failed to save topology: write to {} failed", path);
        return false;
    }

    spdlog::info("Topology saved to {}", path);
    return true;
}

} // namespace switchscan::discovery
