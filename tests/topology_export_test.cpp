#include "discovery/discovery_manager.hpp"
#include "discovery/topology_export.hpp"
#include "gtest/gtest.h"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <cstdio>
#include <fstream>

using namespace switchscan::discovery;

namespace {

NetworkTopology sample_topology() {
    NetworkTopology topology;
    topology.set_discovery_timestamp(std::chrono::system_clock::now());

    SwitchInfo core;
    core.address = "192.168.1.31";
    core.type = "hirschmann";
    core.attributes["hostname"] = "SW-CORE-1";
    NeighborInfo uplink;
    uplink.address = "192.168.1.32";
    uplink.local_port = "1/1";
    uplink.remote_port = "1/3";
    uplink.system_name = "SW-CORE-2";
    uplink.chassis_id = "00:80:63:11:22:33";
    uplink.properties["portdescr"] = "Module: 1 Port: 3";
    uplink.properties["address"] = "shadowed";
    core.neighbors.push_back(uplink);
    topology.add_switch(core);

    SwitchInfo edge;
    edge.address = "192.168.1.32";
    edge.type = "lantech";
    topology.add_switch(edge);
    return topology;
}

} // namespace

TEST(TopologyExport, SnapshotLayout)
{
    nlohmann::json document = topology_to_json(sample_topology());

    ASSERT_TRUE(document.contains("discovery_timestamp"));
    EXPECT_TRUE(document["discovery_timestamp"].is_string());
    ASSERT_TRUE(document["switches"].is_object());
    EXPECT_EQ(document["switches"].size(), 2u);

    const auto& core = document["switches"]["192.168.1.31"];
    EXPECT_EQ(core["address"], "192.168.1.31");
    EXPECT_EQ(core["type"], "hirschmann");
    EXPECT_EQ(core["attributes"]["hostname"], "SW-CORE-1");
    ASSERT_EQ(core["neighbors"].size(), 1u);

    const auto& neighbor = core["neighbors"][0];
    EXPECT_EQ(neighbor["address"], "192.168.1.32");
    EXPECT_EQ(neighbor["local_port"], "1/1");
    EXPECT_EQ(neighbor["remote_port"], "1/3");
    EXPECT_EQ(neighbor["system_name"], "SW-CORE-2");
    EXPECT_EQ(neighbor["chassis_id"], "00:80:63:11:22:33");
    EXPECT_EQ(neighbor["portdescr"], "Module: 1 Port: 3");

    const auto& edge = document["switches"]["192.168.1.32"];
    EXPECT_TRUE(edge["neighbors"].is_array());
    EXPECT_TRUE(edge["neighbors"].empty());
    EXPECT_TRUE(edge["attributes"].is_object());
}

TEST(TopologyExport, EmptyTopology)
{
    NetworkTopology topology;
    topology.set_discovery_timestamp(std::chrono::system_clock::now());

    nlohmann::json document = topology_to_json(topology);
    EXPECT_TRUE(document["switches"].is_object());
    EXPECT_TRUE(document["switches"].empty());
}

TEST(TopologyExport, StatsLayout)
{
    TopologyStats stats;
    stats.total_switches = 2;
    stats.switch_types["hirschmann"] = 1;
    stats.switch_types["lantech"] = 1;
    stats.total_neighbors = 1;
    stats.discovered_ips = {"192.168.1.31", "192.168.1.32"};
    stats.failed_ips = {"192.168.1.99"};

    nlohmann::json document = stats_to_json(stats);
    EXPECT_EQ(document["total_switches"], 2);
    EXPECT_EQ(document["switch_types"]["lantech"], 1);
    EXPECT_EQ(document["total_neighbors"], 1);
    EXPECT_EQ(document["discovered_ips"].size(), 2u);
    EXPECT_EQ(document["failed_ips"][0], "192.168.1.99");
    EXPECT_TRUE(document["pending_ips"].empty());
}

TEST(TopologyExport, FilenameFromSeed)
{
    EXPECT_EQ(topology_filename("192.168.1.31"), "topology_192_168_1_31.json");
    EXPECT_EQ(topology_filename("fe80::1"), "topology_fe80__1.json");
}

TEST(TopologyExport, SaveWritesParsableFile)
{
    std::string path = ::testing::TempDir() + "switchscan_topology.json";
    ASSERT_TRUE(save_topology(sample_topology(), path));

    std::ifstream file(path);
    nlohmann::json document = nlohmann::json::parse(file);
    EXPECT_EQ(document["switches"].size(), 2u);
    file.close();
    EXPECT_EQ(std::remove(path.c_str()), 0);
}

TEST(TopologyExport, SaveReportsUnwritablePath)
{
    EXPECT_FALSE(save_topology(sample_topology(), "/nonexistent-dir/topology.json"));
}

TEST(TopologyExport, InvalidUtf8IsReplaced)
{
    NetworkTopology topology = sample_topology();
    SwitchInfo office;
    office.address = "192.168.1.40";
    office.type = "kontron";
    office.attributes["location"] = "Schaltschrank B\xFC" "ro";
    topology.add_switch(office);

    EXPECT_NO_THROW(render_topology(topology, OutputFormat::JSON));

    std::string path = ::testing::TempDir() + "switchscan_latin1.json";
    ASSERT_TRUE(save_topology(topology, path));

    std::ifstream file(path);
    nlohmann::json document = nlohmann::json::parse(file);
    std::string location = document["switches"]["192.168.1.40"]["attributes"]["location"];
    EXPECT_EQ(location, "Schaltschrank B\xEF\xBF\xBDro");
    file.close();
    EXPECT_EQ(std::remove(path.c_str()), 0);
}

TEST(TopologyExport, YamlInventory)
{
    std::string text = render_topology(sample_topology(), OutputFormat::YAML);
    EXPECT_NE(text.find("discovery_timestamp"), std::string::npos);
    EXPECT_NE(text.find("switches:"), std::string::npos);

    YAML::Node inventory = YAML::Load(text);
    ASSERT_TRUE(inventory["switches"].IsMap());
    EXPECT_EQ(inventory["switches"].size(), 2u);
    const YAML::Node core = inventory["switches"]["192.168.1.31"];
    EXPECT_EQ(core["type"].as<std::string>(), "hirschmann");
    EXPECT_EQ(core["attributes"]["hostname"].as<std::string>(), "SW-CORE-1");
    ASSERT_TRUE(core["neighbors"].IsSequence());
    EXPECT_EQ(core["neighbors"][0]["remote_port"].as<std::string>(), "1/3");
    EXPECT_TRUE(inventory["switches"]["192.168.1.32"]["neighbors"].IsSequence());
}

TEST(TopologyExport, SaveYamlInventory)
{
    std::string path = ::testing::TempDir() + "switchscan_inventory.yaml";
    ASSERT_TRUE(save_topology(sample_topology(), path, OutputFormat::YAML));

    YAML::Node inventory = YAML::LoadFile(path);
    EXPECT_EQ(inventory["switches"].size(), 2u);
    EXPECT_EQ(std::remove(path.c_str()), 0);
}
