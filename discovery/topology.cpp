#include "discovery/topology.hpp"
#include <sstream>
#include <iomanip>
#include <ctime>

namespace switchscan::discovery {

const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::CLASSIFICATION: return "classification";
        case FailureKind::CREDENTIAL: return "credential";
        case FailureKind::TRANSPORT: return "transport";
        case FailureKind::PARSE: return "parse";
    }
    return "unknown";
}

NetworkTopology::NetworkTopology()
    : discovery_timestamp_(), timestamp_set_(false) {}

void NetworkTopology::set_discovery_timestamp(std::chrono::system_clock::time_point timestamp) {
    if (timestamp_set_) {
        return;
    }
    discovery_timestamp_ = timestamp;
    timestamp_set_ = true;
}

void NetworkTopology::add_switch(SwitchInfo switch_info) {
    std::string key = switch_info.address;
    switches_[key] = std::move(switch_info);
}

const SwitchInfo* NetworkTopology::get_switch(const std::string& address) const {
    auto it = switches_.find(address);
    if (it == switches_.end()) {
        return nullptr;
    }
    return &it->second;
}

bool NetworkTopology::contains(const std::string& address) const {
    return switches_.find(address) != switches_.end();
}

size_t NetworkTopology::count_neighbor_edges() const {
    size_t total = 0;
    for (const auto& [address, info] : switches_) {
        total += info.neighbors.size();
    }
    return total;
}

std::map<std::string, uint32_t> NetworkTopology::count_switch_types() const {
    std::map<std::string, uint32_t> counts;
    for (const auto& [address, info] : switches_) {
        counts[info.type.empty() ? "unknown" : info.type]++;
    }
    return counts;
}

std::string format_timestamp(std::chrono::system_clock::time_point timestamp) {
    auto seconds = std::chrono::system_clock::to_time_t(timestamp);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
        timestamp.time_since_epoch()).count() % 1000000;
    if (micros < 0) {
        micros += 1000000;
    }

    std::tm local_tm{};
    localtime_r(&seconds, &local_tm);

    std::ostringstream out;
    out << std::put_time(&local_tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(6) << std::setfill('0') << micros;
    return out.str();
}

} // namespace switchscan::discovery
