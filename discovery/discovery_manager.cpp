#include "discovery/discovery_manager.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace switchscan::discovery {

void VendorRegistry::register_vendor(const std::string& vendor, VendorFactory factory) {
    factories_[vendor] = std::move(factory);
}

bool VendorRegistry::unregister_vendor(const std::string& vendor) {
    return factories_.erase(vendor) > 0;
}

bool VendorRegistry::has_vendor(const std::string& vendor) const {
    return factories_.find(vendor) != factories_.end();
}

std::vector<std::string> VendorRegistry::get_registered_vendors() const {
    std::vector<std::string> vendors;
    vendors.reserve(factories_.size());
    for (const auto& [vendor, factory] : factories_) {
        vendors.push_back(vendor);
    }
    std::sort(vendors.begin(), vendors.end());
    return vendors;
}

std::unique_ptr<IVendorDiscovery> VendorRegistry::create(const std::string& vendor,
                                                         const std::string& host,
                                                         const Credentials& credentials) const {
    auto it = factories_.find(vendor);
    if (it == factories_.end() || !it->second) {
        return nullptr;
    }
    return it->second(host, credentials.username, credentials.password);
}

NodeOutcome NodeOutcome::success(SwitchInfo info) {
    NodeOutcome outcome;
    outcome.switch_info = std::move(info);
    return outcome;
}

NodeOutcome NodeOutcome::failed(FailureKind kind, std::string message) {
    NodeOutcome outcome;
    outcome.failure = kind;
    outcome.message = std::move(message);
    return outcome;
}

DiscoveryEngine::DiscoveryEngine(std::shared_ptr<IVendorProbe> probe,
                                 std::shared_ptr<const VendorRegistry> registry)
    : DiscoveryEngine(std::move(probe), std::move(registry), EngineConfig{}) {}

DiscoveryEngine::DiscoveryEngine(std::shared_ptr<IVendorProbe> probe,
                                 std::shared_ptr<const VendorRegistry> registry,
                                 const EngineConfig& config)
    : probe_(std::move(probe)), registry_(std::move(registry)), config_(config),
      in_flight_(0), visited_count_(0), cancelled_(false) {
    if (!probe_ || !registry_) {
        throw std::invalid_argument("DiscoveryEngine requires a vendor probe and a vendor registry");
    }
    if (config_.workers == 0) {
        config_.workers = 1;
    }
}

DiscoveryEngine::~DiscoveryEngine() = default;

bool DiscoveryEngine::configure(const std::map<std::string, std::string>& config) {
    auto workers_it = config.find("workers");
    if (workers_it != config.end()) {
        try {
            int workers = std::stoi(workers_it->second);
            if (workers < 1) {
                spdlog::warn("Ignoring workers={}: must be at least 1", workers_it->second);
                return false;
            }
            config_.workers = static_cast<uint32_t>(workers);
        } catch (const std::exception& e) {
            spdlog::warn("Ignoring workers={}: {}", workers_it->second, e.what());
            return false;
        }
    }
    return true;
}

std::map<std::string, std::string> DiscoveryEngine::get_configuration_schema() const {
    return {
        {"workers", "Number of concurrent discovery workers (default: 1, sequential)"}
    };
}

void DiscoveryEngine::cancel() {
    cancelled_.store(true);
    state_cv_.notify_all();
}

void DiscoveryEngine::reset(const std::string& seed_ip) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    topology_ = NetworkTopology();
    topology_.set_discovery_timestamp(std::chrono::system_clock::now());
    candidates_.clear();
    seen_.clear();
    discovered_.clear();
    failed_.clear();
    failure_reasons_.clear();
    in_flight_ = 0;
    visited_count_ = 0;
    candidates_.insert(seed_ip);
}

const NetworkTopology& DiscoveryEngine::discover_network(const std::string& seed_ip) {
    spdlog::info("Starting network discovery from seed IP: {}", seed_ip);
    reset(seed_ip);

    if (config_.workers <= 1) {
        worker_loop();
    } else {
        spdlog::debug("Starting {} discovery workers", config_.workers);
        std::vector<std::thread> workers;
        workers.reserve(config_.workers);
        for (uint32_t i = 0; i < config_.workers; ++i) {
            workers.emplace_back(&DiscoveryEngine::worker_loop, this);
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    if (cancelled_.load()) {
        spdlog::warn("Discovery cancelled with {} candidates left unvisited", candidates_.size());
    }
    spdlog::info("Checked all available {} switches", visited_count_);

    print_discovery_summary();
    return topology_;
}

void DiscoveryEngine::worker_loop() {
    std::string address;
    while (next_candidate(address)) {
        spdlog::debug("Looking at {}", address);
        NodeOutcome outcome = discover_node(address);
        record_outcome(address, std::move(outcome));
    }
}

bool DiscoveryEngine::next_candidate(std::string& address) {
    std::unique_lock<std::mutex> lock(state_mutex_);

    // Another worker's node may still enqueue neighbors
    state_cv_.wait(lock, [this] {
        return cancelled_.load() || !candidates_.empty() || in_flight_ == 0;
    });

    if (cancelled_.load() || candidates_.empty()) {
        return false;
    }

    auto it = candidates_.begin();
    address = *it;
    candidates_.erase(it);
    seen_.insert(address);
    ++in_flight_;
    return true;
}

void DiscoveryEngine::record_outcome(const std::string& address, NodeOutcome outcome) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);

        if (outcome.ok()) {
            SwitchInfo& info = *outcome.switch_info;
            for (const auto& neighbor : info.neighbors) {
                if (neighbor.address.empty()) {
                    continue;
                }
                if (seen_.find(neighbor.address) == seen_.end()) {
                    candidates_.insert(neighbor.address);
                }
            }
            info.address = address;
            topology_.add_switch(std::move(info));
            discovered_.insert(address);
        } else {
            failed_.insert(address);
            failure_reasons_[address] = FailureRecord{outcome.failure, outcome.message};
        }

        --in_flight_;
        ++visited_count_;
        spdlog::debug("Looked at {} switches", visited_count_);
    }
    state_cv_.notify_all();
}

NodeOutcome DiscoveryEngine::discover_node(const std::string& address) {
    ProbeResult probed;
    try {
        probed = probe_->probe(address);
    } catch (const std::exception& e) {
        spdlog::error("Vendor probe failed for {}: {}", address, e.what());
        return NodeOutcome::failed(FailureKind::CLASSIFICATION, e.what());
    }

    if (!probed.credentials) {
        spdlog::warn("No credentials returned for {}", address);
        return NodeOutcome::failed(FailureKind::CREDENTIAL, "no usable credentials");
    }
    if (!probed.vendor) {
        spdlog::warn("Failed to detect vendor for {}", address);
        return NodeOutcome::failed(FailureKind::CLASSIFICATION, "vendor not detected");
    }

    const std::string& vendor = *probed.vendor;
    std::unique_ptr<IVendorDiscovery> strategy;
    try {
        strategy = registry_->create(vendor, address, *probed.credentials);
    } catch (const std::exception& e) {
        spdlog::error("Cannot create {} discovery for {}: {}", vendor, address, e.what());
        return NodeOutcome::failed(FailureKind::CLASSIFICATION, e.what());
    }
    if (!strategy) {
        spdlog::warn("No discovery strategy registered for vendor '{}' ({})", vendor, address);
        return NodeOutcome::failed(FailureKind::CLASSIFICATION, "unregistered vendor: " + vendor);
    }

    try {
        SwitchInfo info = strategy->discover();
        if (info.type.empty()) {
            info.type = vendor;
        }
        return NodeOutcome::success(std::move(info));
    } catch (const TransportError& e) {
        spdlog::error("Discovery failed for {}: {}", address, e.what());
        return NodeOutcome::failed(FailureKind::TRANSPORT, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error discovering {} ({}): {}", address, vendor, e.what());
        return NodeOutcome::failed(FailureKind::TRANSPORT, e.what());
    }
}

TopologyStats DiscoveryEngine::get_topology_stats() const {
    TopologyStats stats;
    stats.total_switches = static_cast<uint32_t>(topology_.size());
    stats.switch_types = topology_.count_switch_types();
    stats.total_neighbors = static_cast<uint32_t>(topology_.count_neighbor_edges());
    stats.discovery_timestamp = topology_.get_discovery_timestamp();

    stats.discovered_ips.assign(discovered_.begin(), discovered_.end());
    stats.failed_ips.assign(failed_.begin(), failed_.end());
    stats.pending_ips.assign(candidates_.begin(), candidates_.end());
    std::sort(stats.discovered_ips.begin(), stats.discovered_ips.end());
    std::sort(stats.failed_ips.begin(), stats.failed_ips.end());
    std::sort(stats.pending_ips.begin(), stats.pending_ips.end());

    return stats;
}

void DiscoveryEngine::print_discovery_summary() const {
    TopologyStats stats = get_topology_stats();

    spdlog::info(std::string(60, '='));
    spdlog::info("NETWORK DISCOVERY SUMMARY");
    spdlog::info(std::string(60, '='));
    spdlog::info("Successfully discovered: {} switches", stats.discovered_ips.size());
    spdlog::info("Failed to discover: {} switches", stats.failed_ips.size());
    spdlog::info("Discovery timestamp: {}", format_timestamp(stats.discovery_timestamp));

    if (!stats.discovered_ips.empty()) {
        spdlog::info("Discovered switches:");
        for (const auto& ip : stats.discovered_ips) {
            const SwitchInfo* info = topology_.get_switch(ip);
            if (info) {
                spdlog::info("   {} - {} ({} neighbors)", ip, info->type, info->neighbors.size());
            }
        }
    }

    if (!stats.failed_ips.empty()) {
        spdlog::info("Failed switches:");
        for (const auto& ip : stats.failed_ips) {
            auto reason = failure_reasons_.find(ip);
            if (reason != failure_reasons_.end()) {
                spdlog::info("   {} ({}: {})", ip, to_string(reason->second.kind), reason->second.message);
            } else {
                spdlog::info("   {}", ip);
            }
        }
    }

    if (!stats.pending_ips.empty()) {
        spdlog::info("Not visited: {} switches", stats.pending_ips.size());
    }

    spdlog::info(std::string(60, '='));
}

} // namespace switchscan::discovery
