#pragma once

#include "discovery/discovery_interface.hpp"
#include "discovery/topology.hpp"
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>

namespace switchscan::discovery {

// Registry mapping vendor tags to strategy factories
class VendorRegistry {
public:
    VendorRegistry() = default;

    // Replaces any factory already registered under the same tag
    void register_vendor(const std::string& vendor, VendorFactory factory);
    bool unregister_vendor(const std::string& vendor);

    bool has_vendor(const std::string& vendor) const;
    std::vector<std::string> get_registered_vendors() const;

    // Returns nullptr for an unregistered tag
    std::unique_ptr<IVendorDiscovery> create(const std::string& vendor,
                                             const std::string& host,
                                             const Credentials& credentials) const;

private:
    std::unordered_map<std::string, VendorFactory> factories_;
};

// Result of visiting one address
struct NodeOutcome {
    std::optional<SwitchInfo> switch_info;
    FailureKind failure = FailureKind::CLASSIFICATION;
    std::string message;

    bool ok() const { return switch_info.has_value(); }

    static NodeOutcome success(SwitchInfo info);
    static NodeOutcome failed(FailureKind kind, std::string message);
};

// Summary derived from a finished crawl
struct TopologyStats {
    uint32_t total_switches = 0;
    std::map<std::string, uint32_t> switch_types;
    uint32_t total_neighbors = 0;
    std::chrono::system_clock::time_point discovery_timestamp;
    std::vector<std::string> discovered_ips;
    std::vector<std::string> failed_ips;
    std::vector<std::string> pending_ips;  // Left unvisited by cancellation
};

struct FailureRecord {
    FailureKind kind;
    std::string message;
};

// Worklist-driven crawl from a seed address
class DiscoveryEngine {
public:
    struct EngineConfig {
        uint32_t workers = 1;  // 1 = sequential crawl on the calling thread
    };

    DiscoveryEngine(std::shared_ptr<IVendorProbe> probe,
                    std::shared_ptr<const VendorRegistry> registry);
    DiscoveryEngine(std::shared_ptr<IVendorProbe> probe,
                    std::shared_ptr<const VendorRegistry> registry,
                    const EngineConfig& config);
    ~DiscoveryEngine();

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    bool configure(const std::map<std::string, std::string>& config);
    std::map<std::string, std::string> get_configuration_schema() const;
    const EngineConfig& get_config() const { return config_; }

    // Runs one crawl. Per-node failures are recorded, never thrown.
    const NetworkTopology& discover_network(const std::string& seed_ip);

    // Stops the crawl before the next worklist pop; safe from any thread.
    // Sticky for the lifetime of the engine.
    void cancel();
    bool is_cancelled() const { return cancelled_.load(); }

    const NetworkTopology& get_topology() const { return topology_; }
    TopologyStats get_topology_stats() const;

    const std::unordered_set<std::string>& get_discovered() const { return discovered_; }
    const std::unordered_set<std::string>& get_failed() const { return failed_; }
    const std::unordered_set<std::string>& get_seen() const { return seen_; }
    const std::unordered_set<std::string>& get_candidates() const { return candidates_; }
    const std::unordered_map<std::string, FailureRecord>& failure_reasons() const { return failure_reasons_; }

    void print_discovery_summary() const;

private:
    std::shared_ptr<IVendorProbe> probe_;
    std::shared_ptr<const VendorRegistry> registry_;
    EngineConfig config_;

    // Crawl state, guarded by state_mutex_ while workers run
    NetworkTopology topology_;
    std::unordered_set<std::string> candidates_;
    std::unordered_set<std::string> seen_;
    std::unordered_set<std::string> discovered_;
    std::unordered_set<std::string> failed_;
    std::unordered_map<std::string, FailureRecord> failure_reasons_;
    uint32_t in_flight_;
    uint32_t visited_count_;

    std::mutex state_mutex_;
    std::condition_variable state_cv_;
    std::atomic<bool> cancelled_;

    void reset(const std::string& seed_ip);
    void worker_loop();
    bool next_candidate(std::string& address);
    void record_outcome(const std::string& address, NodeOutcome outcome);
    NodeOutcome discover_node(const std::string& address);
};

} // namespace switchscan::discovery
