#pragma once

#include "discovery/cli_switch_discovery.hpp"

namespace switchscan::discovery::vendors {

// Lantech industrial managed switches
class LantechDiscovery : public CliSwitchDiscovery {
public:
    using CliSwitchDiscovery::CliSwitchDiscovery;

    std::string get_vendor() const override { return "lantech"; }

    static std::map<std::string, std::string> parse_system(const std::string& output);

    // Column table: Local Port, Chassis ID, Remote Port, System Name, Management Address
    static std::vector<NeighborInfo> parse_neighbor_table(const std::string& output);

protected:
    std::string identity_command() const override { return "show system"; }
    std::string neighbor_command() const override { return "show lldp neighbor"; }

    std::map<std::string, std::string> parse_identity(const std::string& output) const override {
        return parse_system(output);
    }
    std::vector<NeighborInfo> parse_neighbors(const std::string& output) const override {
        return parse_neighbor_table(output);
    }
};

} // namespace switchscan::discovery::vendors
