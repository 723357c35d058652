#pragma once

#include "discovery/cli_switch_discovery.hpp"

namespace switchscan::discovery::vendors {

// Hirschmann / Belden HiOS and Classic switches
class HirschmannDiscovery : public CliSwitchDiscovery {
public:
    using CliSwitchDiscovery::CliSwitchDiscovery;

    std::string get_vendor() const override { return "hirschmann"; }

    // "show system info": dotted key/value listing
    static std::map<std::string, std::string> parse_system_info(const std::string& output);

    // "show lldp remote-data": one "Remote data, <port> - #<n>" block per neighbor
    static std::vector<NeighborInfo> parse_remote_data(const std::string& output);

protected:
    std::string identity_command() const override { return "show system info"; }
    std::string neighbor_command() const override { return "show lldp remote-data"; }

    std::map<std::string, std::string> parse_identity(const std::string& output) const override {
        return parse_system_info(output);
    }
    std::vector<NeighborInfo> parse_neighbors(const std::string& output) const override {
        return parse_remote_data(output);
    }
};

} // namespace switchscan::discovery::vendors
