#pragma once

#include "discovery/discovery_interface.hpp"
#include <unordered_map>

namespace switchscan::discovery {

// Aggregate of all discovered devices, keyed by management address
class NetworkTopology {
public:
    using SwitchMap = std::unordered_map<std::string, SwitchInfo>;

    NetworkTopology();

    // The timestamp is fixed by the first call; later calls are ignored.
    void set_discovery_timestamp(std::chrono::system_clock::time_point timestamp);
    std::chrono::system_clock::time_point get_discovery_timestamp() const { return discovery_timestamp_; }
    bool has_discovery_timestamp() const { return timestamp_set_; }

    // Insert or replace. The key is always the record's own address.
    void add_switch(SwitchInfo switch_info);

    const SwitchInfo* get_switch(const std::string& address) const;
    bool contains(const std::string& address) const;

    const SwitchMap& get_switches() const { return switches_; }
    size_t size() const { return switches_.size(); }
    bool empty() const { return switches_.empty(); }

    // Sum of per-device neighbor list lengths (directed edges)
    size_t count_neighbor_edges() const;

    // Vendor tag -> device count; untyped devices count as "unknown"
    std::map<std::string, uint32_t> count_switch_types() const;

private:
    SwitchMap switches_;
    std::chrono::system_clock::time_point discovery_timestamp_;
    bool timestamp_set_;
};

// ISO-8601 local time with microseconds, e.g. 2024-03-01T10:15:30.123456
std::string format_timestamp(std::chrono::system_clock::time_point timestamp);

} // namespace switchscan::discovery
