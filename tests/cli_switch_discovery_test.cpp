#include "discovery/session_factory.hpp"
#include "vendors/builtin_vendors.hpp"
#include "vendors/hirschmann/hirschmann_discovery.hpp"
#include "vendors/kontron/kontron_discovery.hpp"
#include "fakes.hpp"
#include "gtest/gtest.h"

using namespace switchscan::discovery;
using namespace switchscan::discovery::vendors;
using switchscan::discovery::testing::FakeCliSession;

namespace {

using Script = FakeCliSession::Script;

SessionFactory scripted(std::shared_ptr<Script> script, std::vector<Credentials>* logins = nullptr) {
    return [script, logins](const std::string& /* host */, const Credentials& creds, const SessionOptions& /* options */)
               -> std::unique_ptr<ICliSession> {
        if (logins) logins->push_back(creds);
        return std::make_unique<FakeCliSession>(script);
    };
}

std::shared_ptr<Script> hirschmann_script() {
    auto script = std::make_shared<Script>();
    script->replies["show system info"] =
        "System Name........................... SW-CORE-1\n"
        "Firmware software release (RAM)....... HiOS-2A-08.0.00\n";
    script->replies["show lldp remote-data"] =
        "Remote data, 1/1 - #1\n"
        "Port ID............................... 1/3\n"
        "IPv4 Management address............... 192.168.1.32\n"
        "\n"
        "Remote data, 1/2 - #2\n"
        "Port ID............................... 1/8\n"
        "IPv4 Management address............... 192.168.1.33\n";
    return script;
}

} // namespace

TEST(CliSwitchDiscovery, ReadsIdentityAndNeighbors)
{
    auto script = hirschmann_script();
    std::vector<Credentials> logins;
    HirschmannDiscovery discovery("192.168.1.31", "admin", "private", SessionOptions(), scripted(script, &logins));

    SwitchInfo info = discovery.discover();
    EXPECT_EQ(info.address, "192.168.1.31");
    EXPECT_EQ(info.type, "hirschmann");
    EXPECT_EQ(info.attributes["hostname"], "SW-CORE-1");
    EXPECT_EQ(info.attributes["firmware"], "HiOS-2A-08.0.00");
    ASSERT_EQ(info.neighbors.size(), 2u);
    EXPECT_EQ(info.neighbors[1].address, "192.168.1.33");

    EXPECT_EQ(script->commands, (std::vector<std::string>{"show system info", "show lldp remote-data"}));
    EXPECT_EQ(script->opened, 1);
    EXPECT_EQ(script->closed, 1);
    ASSERT_EQ(logins.size(), 1u);
    EXPECT_EQ(logins[0], (Credentials{"admin", "private"}));
}

TEST(CliSwitchDiscovery, UnparseableNeighborTableShortensRecord)
{
    auto script = hirschmann_script();
    script->replies["show lldp remote-data"] = "Error: LLDP is disabled\x1b[0m\n";
    HirschmannDiscovery discovery("192.168.1.31", "admin", "private", SessionOptions(), scripted(script));

    SwitchInfo info = discovery.discover();
    EXPECT_TRUE(info.neighbors.empty());
    EXPECT_EQ(info.attributes["hostname"], "SW-CORE-1");
}

TEST(CliSwitchDiscovery, DroppedSessionIsTransportError)
{
    auto script = hirschmann_script();
    script->drop_on = "show lldp remote-data";
    HirschmannDiscovery discovery("192.168.1.31", "admin", "private", SessionOptions(), scripted(script));

    EXPECT_THROW(discovery.discover(), TransportError);
}

TEST(CliSwitchDiscovery, UnreachableHostIsTransportError)
{
    auto script = hirschmann_script();
    script->unreachable = true;
    HirschmannDiscovery discovery("192.168.1.31", "admin", "private", SessionOptions(), scripted(script));

    EXPECT_THROW(discovery.discover(), TransportError);
    EXPECT_TRUE(script->commands.empty());
}

TEST(CliSwitchDiscovery, KontronDisablesPagerFirst)
{
    auto script = std::make_shared<Script>();
    script->replies["terminal length 0"] = "";
    script->replies["show lldp neighbors detail"] =
        "Local Interface: Gi1/0/1\n"
        "Management Address: 192.168.1.50\n";
    KontronDiscovery discovery("192.168.1.49", "admin", "private", SessionOptions(), scripted(script));

    SwitchInfo info = discovery.discover();
    EXPECT_EQ(info.type, "kontron");
    ASSERT_EQ(info.neighbors.size(), 1u);
    ASSERT_EQ(script->commands.size(), 3u);
    EXPECT_EQ(script->commands[0], "terminal length 0");
    EXPECT_EQ(script->commands[1], "show version");
}

TEST(CliSwitchDiscovery, RequiresSessionFactory)
{
    EXPECT_THROW(HirschmannDiscovery discovery("192.168.1.31", "admin", "private", SessionOptions(), SessionFactory()),
                 std::invalid_argument);
}

TEST(BuiltinVendors, RegistersAllFour)
{
    VendorRegistry registry;
    register_builtin_vendors(registry, SessionOptions(), scripted(std::make_shared<Script>()));

    EXPECT_EQ(registry.get_registered_vendors(),
              (std::vector<std::string>{"hirschmann", "kontron", "lantech", "nomad"}));

    for (const auto& vendor : registry.get_registered_vendors()) {
        auto strategy = registry.create(vendor, "10.0.0.1", Credentials{"admin", "private"});
        ASSERT_TRUE(strategy != nullptr);
        EXPECT_EQ(strategy->get_vendor(), vendor);
    }
    EXPECT_TRUE(registry.create("cisco", "10.0.0.1", Credentials{"admin", "private"}) == nullptr);
}

TEST(BuiltinVendors, StrategiesUseSuppliedSessions)
{
    auto script = std::make_shared<Script>();
    script->replies["uname -a"] = "Linux ndl-gw-07 4.14.98 #1 SMP armv7l GNU/Linux\n";
    VendorRegistry registry;
    register_builtin_vendors(registry, SessionOptions(), scripted(script));

    auto strategy = registry.create("nomad", "192.168.1.60", Credentials{"root", "nomad"});
    ASSERT_TRUE(strategy != nullptr);
    SwitchInfo info = strategy->discover();
    EXPECT_EQ(info.attributes["hostname"], "ndl-gw-07");
    EXPECT_TRUE(info.neighbors.empty());
    EXPECT_EQ(script->commands, (std::vector<std::string>{"uname -a", "lldpcli show neighbors"}));
}

TEST(CliSwitchDiscovery, NullSessionIsTransportError)
{
    SessionFactory no_sessions = [](const std::string&, const Credentials&, const SessionOptions&)
        -> std::unique_ptr<ICliSession> { return nullptr; };
    HirschmannDiscovery discovery("192.168.1.31", "admin", "private", SessionOptions(), no_sessions);

    EXPECT_THROW(discovery.discover(), TransportError);
}

TEST(BuiltinVendors, SessionsGetTransportPort)
{
    auto script = hirschmann_script();
    std::vector<uint16_t> ports;
    SessionFactory recording = [script, &ports](const std::string&, const Credentials&, const SessionOptions& options)
        -> std::unique_ptr<ICliSession> {
        ports.push_back(options.port);
        return std::make_unique<FakeCliSession>(script);
    };

    VendorRegistry ssh_registry;
    register_builtin_vendors(ssh_registry, SessionOptions(), recording);
    ssh_registry.create("hirschmann", "192.168.1.31", Credentials{"admin", "private"})->discover();

    SessionOptions telnet_options;
    telnet_options.port = default_port(parse_transport("telnet"));
    VendorRegistry telnet_registry;
    register_builtin_vendors(telnet_registry, telnet_options, recording);
    telnet_registry.create("hirschmann", "192.168.1.31", Credentials{"admin", "private"})->discover();

    EXPECT_EQ(ports, (std::vector<uint16_t>{22, 23}));
}
