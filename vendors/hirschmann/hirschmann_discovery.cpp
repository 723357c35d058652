#include "vendors/hirschmann/hirschmann_discovery.hpp"
#include <spdlog/spdlog.h>
#include <cctype>
#include <sstream>

namespace switchscan::discovery::vendors {

std::map<std::string, std::string> HirschmannDiscovery::parse_system_info(const std::string& output) {
    return parsing::normalize_identity(parsing::parse_key_values(output));
}

std::vector<NeighborInfo> HirschmannDiscovery::parse_remote_data(const std::string& output) {
    static const std::regex header(R"(^\s*Remote data,\s*(\S+)\s*-\s*#\d+)", std::regex_constants::icase);

    std::vector<NeighborInfo> neighbors;
    for (const auto& block : parsing::split_blocks(output, header)) {
        std::smatch match;
        if (!std::regex_search(block, match, header)) {
            continue;
        }

        NeighborInfo neighbor;
        neighbor.local_port = match[1].str();

        // The management address list may continue on unlabeled lines
        bool in_address_list = false;
        std::istringstream lines(block);
        std::string line;
        while (std::getline(lines, line)) {
            bool indented = !line.empty() && std::isspace(static_cast<unsigned char>(line[0]));
            auto fields = parsing::parse_key_values(line);
            if (fields.empty() || (in_address_list && indented)) {
                if (in_address_list && neighbor.address.empty()) {
                    neighbor.address = parsing::extract_ipv4(line).value_or("");
                }
                continue;
            }

            const auto& [raw_key, value] = fields.front();
            std::string key = parsing::to_lower(raw_key);
            in_address_list = false;

            if (key == "chassis id") {
                neighbor.chassis_id = value;
            } else if (key == "port id") {
                neighbor.remote_port = value;
            } else if (key == "system name") {
                neighbor.system_name = value;
            } else if (key.find("management address") != std::string::npos) {
                if (key.find("ipv4") != std::string::npos || key.find("ipv6") == std::string::npos) {
                    in_address_list = true;
                    if (neighbor.address.empty()) {
                        neighbor.address = parsing::extract_ipv4(value).value_or("");
                    }
                }
            } else if (!value.empty()) {
                neighbor.properties[key] = value;
            }
        }

        if (neighbor.address.empty()) {
            spdlog::debug("Skipping Hirschmann neighbor on {}: no IPv4 management address", neighbor.local_port);
            continue;
        }
        neighbors.push_back(std::move(neighbor));
    }
    return neighbors;
}

} // namespace switchscan::discovery::vendors
