#pragma once

#include "discovery/discovery_interface.hpp"
#include "discovery/ssh_session.hpp"
#include <regex>
#include <utility>

namespace switchscan::discovery {

// Shared flow for vendors driven through a management shell: log in, read
// identity, read the LLDP table, log out. Vendors provide commands and parsers.
class CliSwitchDiscovery : public IVendorDiscovery {
public:
    CliSwitchDiscovery(std::string host, std::string username, std::string password,
                       SessionOptions options = {},
                       SessionFactory session_factory = SshSession::factory());

    SwitchInfo discover() override;

    const std::string& get_host() const { return host_; }

protected:
    virtual std::string identity_command() const = 0;
    virtual std::string neighbor_command() const = 0;
    virtual std::map<std::string, std::string> parse_identity(const std::string& output) const = 0;
    virtual std::vector<NeighborInfo> parse_neighbors(const std::string& output) const = 0;

    // Hook for session setup such as disabling the pager
    virtual void prepare_session(ICliSession& /* session */) {}

private:
    std::string host_;
    Credentials credentials_;
    SessionOptions options_;
    SessionFactory session_factory_;
};

// Text helpers shared by the vendor parsers
namespace parsing {

std::string trim(const std::string& text);
std::string to_lower(std::string text);

// First dotted-quad in `text` with every octet <= 255
std::optional<std::string> extract_ipv4(const std::string& text);
bool is_valid_ipv4(const std::string& text);

// "Key : value", "Key: value" and "Key.......value" lines, in order
std::vector<std::pair<std::string, std::string>> parse_key_values(const std::string& output);

// Maps vendor field names onto hostname / model / firmware / serial / mac
std::map<std::string, std::string> normalize_identity(
    const std::vector<std::pair<std::string, std::string>>& fields);

// Splits output into blocks, each starting at a line matching `header`
std::vector<std::string> split_blocks(const std::string& output, const std::regex& header);

// Drops an LLDP subtype prefix: "mac 00:11:22:33:44:55" -> "00:11:22:33:44:55"
std::string strip_subtype(const std::string& value);

} // namespace parsing

} // namespace switchscan::discovery
