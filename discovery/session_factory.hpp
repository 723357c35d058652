#pragma once

#include "discovery/discovery_interface.hpp"

namespace switchscan::discovery {

// Management shell transport used for probing and discovery
enum class Transport {
    SSH,
    TELNET
};

// Accepts "ssh" or "telnet" in any case; throws std::invalid_argument otherwise
Transport parse_transport(const std::string& name);
const char* to_string(Transport transport);

uint16_t default_port(Transport transport);

SessionFactory make_session_factory(Transport transport);

} // namespace switchscan::discovery
