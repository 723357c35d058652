#pragma once

#include "discovery/cli_switch_discovery.hpp"

namespace switchscan::discovery::vendors {

// Nomad Digital Linux gateways running lldpd
class NomadDiscovery : public CliSwitchDiscovery {
public:
    using CliSwitchDiscovery::CliSwitchDiscovery;

    std::string get_vendor() const override { return "nomad"; }

    // "uname -a": Linux <hostname> <kernel> ...
    static std::map<std::string, std::string> parse_uname(const std::string& output);

    // "lldpcli show neighbors": blocks opened by "Interface: <if>, via: LLDP"
    static std::vector<NeighborInfo> parse_lldpcli(const std::string& output);

protected:
    std::string identity_command() const override { return "uname -a"; }
    std::string neighbor_command() const override { return "lldpcli show neighbors"; }

    std::map<std::string, std::string> parse_identity(const std::string& output) const override {
        return parse_uname(output);
    }
    std::vector<NeighborInfo> parse_neighbors(const std::string& output) const override {
        return parse_lldpcli(output);
    }
};

} // namespace switchscan::discovery::vendors
