#include "discovery/session_factory.hpp"
#include "discovery/ssh_session.hpp"
#include "discovery/telnet_session.hpp"
#include <algorithm>
#include <cctype>

namespace switchscan::discovery {

Transport parse_transport(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "ssh") {
        return Transport::SSH;
    }
    if (lowered == "telnet") {
        return Transport::TELNET;
    }
    throw std::invalid_argument("Unknown transport '" + name + "' (expected ssh or telnet)");
}

const char* to_string(Transport transport) {
    switch (transport) {
        case Transport::SSH: return "ssh";
        case Transport::TELNET: return "telnet";
    }
    return "unknown";
}

uint16_t default_port(Transport transport) {
    return transport == Transport::TELNET ? SWITCHSCAN_DEFAULT_TELNET_PORT : SWITCHSCAN_DEFAULT_SSH_PORT;
}

SessionFactory make_session_factory(Transport transport) {
    if (transport == Transport::TELNET) {
        return TelnetSession::factory();
    }
    return SshSession::factory();
}

} // namespace switchscan::discovery
