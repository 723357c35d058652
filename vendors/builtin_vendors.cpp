#include "vendors/builtin_vendors.hpp"
#include "vendors/hirschmann/hirschmann_discovery.hpp"
#include "vendors/lantech/lantech_discovery.hpp"
#include "vendors/kontron/kontron_discovery.hpp"
#include "vendors/nomad/nomad_discovery.hpp"

namespace switchscan::discovery::vendors {

void register_builtin_vendors(VendorRegistry& registry,
                              const SessionOptions& options,
                              SessionFactory session_factory) {
    registry.register_vendor("hirschmann", SWITCHSCAN_VENDOR_FACTORY(HirschmannDiscovery, options, session_factory));
    registry.register_vendor("lantech", SWITCHSCAN_VENDOR_FACTORY(LantechDiscovery, options, session_factory));
    registry.register_vendor("kontron", SWITCHSCAN_VENDOR_FACTORY(KontronDiscovery, options, session_factory));
    registry.register_vendor("nomad", SWITCHSCAN_VENDOR_FACTORY(NomadDiscovery, options, session_factory));
}

} // namespace switchscan::discovery::vendors
