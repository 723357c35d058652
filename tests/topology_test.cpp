#include "discovery/topology.hpp"
#include "gtest/gtest.h"

using namespace switchscan::discovery;

namespace {

SwitchInfo make_switch(const std::string& address, const std::string& type, size_t neighbor_count) {
    SwitchInfo info;
    info.address = address;
    info.type = type;
    for (size_t i = 0; i < neighbor_count; ++i) {
        NeighborInfo neighbor;
        neighbor.address = "10.0.1." + std::to_string(i);
        info.neighbors.push_back(neighbor);
    }
    return info;
}

} // namespace

TEST(NetworkTopology, StartsEmpty)
{
    NetworkTopology topology;
    EXPECT_TRUE(topology.empty());
    EXPECT_FALSE(topology.has_discovery_timestamp());
    EXPECT_EQ(topology.count_neighbor_edges(), 0u);
    EXPECT_EQ(topology.get_switch("10.0.0.1"), nullptr);
}

TEST(NetworkTopology, AddAndLookup)
{
    NetworkTopology topology;
    topology.add_switch(make_switch("10.0.0.1", "hirschmann", 2));

    ASSERT_TRUE(topology.contains("10.0.0.1"));
    const SwitchInfo* info = topology.get_switch("10.0.0.1");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->type, "hirschmann");
    EXPECT_EQ(info->neighbors.size(), 2u);
}

TEST(NetworkTopology, RediscoveryReplacesRecord)
{
    NetworkTopology topology;
    topology.add_switch(make_switch("10.0.0.1", "hirschmann", 3));

    SwitchInfo replacement = make_switch("10.0.0.1", "lantech", 1);
    replacement.attributes["hostname"] = "sw-1";
    topology.add_switch(replacement);

    EXPECT_EQ(topology.size(), 1u);
    const SwitchInfo* info = topology.get_switch("10.0.0.1");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->type, "lantech");
    EXPECT_EQ(info->neighbors.size(), 1u);
    EXPECT_EQ(info->attributes.at("hostname"), "sw-1");
}

TEST(NetworkTopology, KeysMatchRecordAddresses)
{
    NetworkTopology topology;
    topology.add_switch(make_switch("10.0.0.1", "kontron", 0));
    topology.add_switch(make_switch("10.0.0.2", "nomad", 0));

    for (const auto& [address, info] : topology.get_switches()) {
        EXPECT_EQ(address, info.address);
    }
}

TEST(NetworkTopology, TimestampIsSetOnce)
{
    NetworkTopology topology;
    auto first = std::chrono::system_clock::now();
    topology.set_discovery_timestamp(first);
    topology.set_discovery_timestamp(first + std::chrono::hours(1));

    EXPECT_TRUE(topology.has_discovery_timestamp());
    EXPECT_EQ(topology.get_discovery_timestamp(), first);
}

TEST(NetworkTopology, CountsEdgesAndTypes)
{
    NetworkTopology topology;
    topology.add_switch(make_switch("10.0.0.1", "hirschmann", 2));
    topology.add_switch(make_switch("10.0.0.2", "hirschmann", 1));
    topology.add_switch(make_switch("10.0.0.3", "", 4));

    EXPECT_EQ(topology.count_neighbor_edges(), 7u);
    auto types = topology.count_switch_types();
    EXPECT_EQ(types.at("hirschmann"), 2u);
    EXPECT_EQ(types.at("unknown"), 1u);
}

TEST(FormatTimestamp, IsoLayout)
{
    std::string text = format_timestamp(std::chrono::system_clock::now());
    ASSERT_EQ(text.size(), 26u);
    EXPECT_EQ(text[4], '-');
    EXPECT_EQ(text[10], 'T');
    EXPECT_EQ(text[19], '.');
}
