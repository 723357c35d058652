#pragma once

#include "discovery/discovery_manager.hpp"

namespace switchscan::discovery::vendors {

// Registers hirschmann, lantech, kontron and nomad, all sharing one session setup
void register_builtin_vendors(VendorRegistry& registry,
                              const SessionOptions& options,
                              SessionFactory session_factory);

} // namespace switchscan::discovery::vendors
