#include "vendors/lantech/lantech_discovery.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace switchscan::discovery::vendors {

std::map<std::string, std::string> LantechDiscovery::parse_system(const std::string& output) {
    return parsing::normalize_identity(parsing::parse_key_values(output));
}

std::vector<NeighborInfo> LantechDiscovery::parse_neighbor_table(const std::string& output) {
    std::vector<NeighborInfo> neighbors;

    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream columns(line);
        std::vector<std::string> tokens;
        std::string token;
        while (columns >> token) {
            tokens.push_back(token);
        }

        // Header, separator and wrapped lines carry no address column
        size_t address_column = tokens.size();
        for (size_t i = 1; i < tokens.size(); ++i) {
            if (parsing::is_valid_ipv4(tokens[i])) {
                address_column = i;
                break;
            }
        }
        if (address_column == tokens.size()) {
            continue;
        }

        NeighborInfo neighbor;
        neighbor.address = tokens[address_column];
        neighbor.local_port = tokens[0];
        if (address_column > 1) neighbor.chassis_id = tokens[1];
        if (address_column > 2) neighbor.remote_port = tokens[2];
        for (size_t i = 3; i < address_column; ++i) {
            if (!neighbor.system_name.empty()) neighbor.system_name += ' ';
            neighbor.system_name += tokens[i];
        }
        neighbors.push_back(std::move(neighbor));
    }

    spdlog::debug("Parsed {} Lantech LLDP rows", neighbors.size());
    return neighbors;
}

} // namespace switchscan::discovery::vendors
