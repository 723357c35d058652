#include "vendors/nomad/nomad_discovery.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace switchscan::discovery::vendors {

std::map<std::string, std::string> NomadDiscovery::parse_uname(const std::string& output) {
    std::map<std::string, std::string> identity;

    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream words(line);
        std::string kernel_name, hostname, release;
        if (!(words >> kernel_name >> hostname >> release)) {
            continue;
        }
        if (kernel_name != "Linux") {
            continue;
        }
        identity["hostname"] = hostname;
        identity["firmware"] = release;
        break;
    }
    return identity;
}

std::vector<NeighborInfo> NomadDiscovery::parse_lldpcli(const std::string& output) {
    static const std::regex header(R"(^\s*Interface:\s*([^,\s]+))");

    std::vector<NeighborInfo> neighbors;
    for (const auto& block : parsing::split_blocks(output, header)) {
        std::smatch match;
        if (!std::regex_search(block, match, header)) {
            continue;
        }

        NeighborInfo neighbor;
        neighbor.local_port = match[1].str();

        for (const auto& [raw_key, value] : parsing::parse_key_values(block)) {
            std::string key = parsing::to_lower(raw_key);
            if (key == "chassisid") {
                neighbor.chassis_id = parsing::strip_subtype(value);
            } else if (key == "portid") {
                neighbor.remote_port = parsing::strip_subtype(value);
            } else if (key == "sysname") {
                neighbor.system_name = value;
            } else if (key == "mgmtip") {
                // IPv6 management addresses are listed too; the first IPv4 wins
                if (neighbor.address.empty() && parsing::is_valid_ipv4(value)) {
                    neighbor.address = value;
                }
            } else if (key == "portdescr" || key == "sysdescr") {
                if (!value.empty()) neighbor.properties[key] = value;
            }
        }

        if (neighbor.address.empty()) {
            spdlog::debug("Skipping lldpd neighbor on {}: no IPv4 management address", neighbor.local_port);
            continue;
        }
        neighbors.push_back(std::move(neighbor));
    }
    return neighbors;
}

} // namespace switchscan::discovery::vendors
