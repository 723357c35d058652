#pragma once

#include "discovery/topology.hpp"
#include <nlohmann/json_fwd.hpp>

namespace switchscan::discovery {

struct TopologyStats;

// Snapshot document: {"discovery_timestamp": ..., "switches": {address: {...}}}
nlohmann::json topology_to_json(const NetworkTopology& topology);
nlohmann::json switch_to_json(const SwitchInfo& info);
nlohmann::json stats_to_json(const TopologyStats& stats);

enum class OutputFormat {
    JSON,
    YAML
};

// Per-run topology file name for a seed: topology_192_168_1_31.json
std::string topology_filename(const std::string& seed_ip);

// Snapshot text with two-space indentation. Bytes that are not valid UTF-8
// (device output in a legacy code page) become U+FFFD.
std::string render_topology(const NetworkTopology& topology, OutputFormat format);

// Renders, then writes. Returns false and logs on encoding or I/O failure;
// an existing file is left untouched when rendering fails.
bool save_topology(const NetworkTopology& topology, const std::string& path,
                   OutputFormat format = OutputFormat::JSON);

} // namespace switchscan::discovery
