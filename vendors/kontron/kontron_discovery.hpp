#pragma once

#include "discovery/cli_switch_discovery.hpp"

namespace switchscan::discovery::vendors {

// Kontron managed switches with an IOS-like shell
class KontronDiscovery : public CliSwitchDiscovery {
public:
    using CliSwitchDiscovery::CliSwitchDiscovery;

    std::string get_vendor() const override { return "kontron"; }

    static std::map<std::string, std::string> parse_version(const std::string& output);

    // "show lldp neighbors detail": blocks opened by "Local Interface:"
    static std::vector<NeighborInfo> parse_neighbor_detail(const std::string& output);

protected:
    std::string identity_command() const override { return "show version"; }
    std::string neighbor_command() const override { return "show lldp neighbors detail"; }

    void prepare_session(ICliSession& session) override;

    std::map<std::string, std::string> parse_identity(const std::string& output) const override {
        return parse_version(output);
    }
    std::vector<NeighborInfo> parse_neighbors(const std::string& output) const override {
        return parse_neighbor_detail(output);
    }
};

} // namespace switchscan::discovery::vendors
