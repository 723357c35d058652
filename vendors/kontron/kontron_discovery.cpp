#include "vendors/kontron/kontron_discovery.hpp"
#include <spdlog/spdlog.h>

namespace switchscan::discovery::vendors {

void KontronDiscovery::prepare_session(ICliSession& session) {
    // Unpaged output; older firmware rejects the command and pages instead
    std::string reply = session.execute("terminal length 0");
    if (reply.find('%') != std::string::npos) {
        spdlog::debug("{} does not support 'terminal length 0'", get_host());
    }
}

std::map<std::string, std::string> KontronDiscovery::parse_version(const std::string& output) {
    return parsing::normalize_identity(parsing::parse_key_values(output));
}

std::vector<NeighborInfo> KontronDiscovery::parse_neighbor_detail(const std::string& output) {
    static const std::regex header(R"(^\s*Local (Interface|Intf)\s*:)", std::regex_constants::icase);

    std::vector<NeighborInfo> neighbors;
    for (const auto& block : parsing::split_blocks(output, header)) {
        NeighborInfo neighbor;
        for (const auto& [raw_key, value] : parsing::parse_key_values(block)) {
            std::string key = parsing::to_lower(raw_key);
            if (key == "local interface" || key == "local intf") {
                neighbor.local_port = value;
            } else if (key == "chassis id") {
                neighbor.chassis_id = value;
            } else if (key == "port id") {
                neighbor.remote_port = value;
            } else if (key == "system name") {
                neighbor.system_name = value;
            } else if (key.find("management address") != std::string::npos ||
                       key == "ip" || key == "ipv4 address") {
                if (neighbor.address.empty()) {
                    neighbor.address = parsing::extract_ipv4(value).value_or("");
                }
            } else if (!value.empty()) {
                neighbor.properties[key] = value;
            }
        }

        if (neighbor.address.empty()) {
            spdlog::debug("Skipping Kontron neighbor on {}: no IPv4 management address", neighbor.local_port);
            continue;
        }
        neighbors.push_back(std::move(neighbor));
    }
    return neighbors;
}

} // namespace switchscan::discovery::vendors
