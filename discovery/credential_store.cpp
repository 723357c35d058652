#include "discovery/credential_store.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>

namespace switchscan::discovery {

std::shared_ptr<CredentialStore> CredentialStore::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open credentials file: " + path);
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid credentials file " + path + ": " + e.what());
    }

    auto store = from_json(document);
    spdlog::debug("Loaded credentials from {} ({} hosts, {} vendors)",
                  path, store->host_count(), store->vendor_count());
    return store;
}

std::shared_ptr<CredentialStore> CredentialStore::from_json(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw std::runtime_error("Credentials document must be a JSON object");
    }

    auto store = std::make_shared<CredentialStore>();

    if (document.contains("default")) {
        store->set_default(parse_entry(document["default"], "default"));
    }

    if (document.contains("vendors")) {
        const auto& vendors = document["vendors"];
        if (!vendors.is_object()) {
            throw std::runtime_error("Credentials section 'vendors' must be an object");
        }
        for (auto it = vendors.begin(); it != vendors.end(); ++it) {
            store->set_vendor(it.key(), parse_entry(it.value(), "vendors." + it.key()));
        }
    }

    if (document.contains("hosts")) {
        const auto& hosts = document["hosts"];
        if (!hosts.is_object()) {
            throw std::runtime_error("Credentials section 'hosts' must be an object");
        }
        for (auto it = hosts.begin(); it != hosts.end(); ++it) {
            store->set_host(it.key(), parse_entry(it.value(), "hosts." + it.key()));
        }
    }

    return store;
}

Credentials CredentialStore::parse_entry(const nlohmann::json& entry, const std::string& where) {
    if (!entry.is_object() ||
        !entry.contains("username") || !entry["username"].is_string() ||
        !entry.contains("password") || !entry["password"].is_string()) {
        throw std::runtime_error("Credentials entry '" + where + "' needs string username and password");
    }
    return Credentials{entry["username"].get<std::string>(), entry["password"].get<std::string>()};
}

void CredentialStore::set_host(const std::string& address, const Credentials& credentials) {
    hosts_[address] = credentials;
}

void CredentialStore::set_vendor(const std::string& vendor, const Credentials& credentials) {
    if (vendors_.find(vendor) == vendors_.end()) {
        vendor_order_.push_back(vendor);
    }
    vendors_[vendor] = credentials;
}

std::optional<Credentials> CredentialStore::resolve(const std::string& address) const {
    auto it = hosts_.find(address);
    if (it != hosts_.end()) {
        return it->second;
    }
    return default_;
}

std::optional<Credentials> CredentialStore::resolve_vendor(const std::string& vendor) const {
    auto it = vendors_.find(vendor);
    if (it != vendors_.end()) {
        return it->second;
    }
    return default_;
}

std::vector<Credentials> CredentialStore::candidates(const std::string& address) const {
    std::vector<Credentials> result;
    auto add_unique = [&result](const Credentials& creds) {
        if (std::find(result.begin(), result.end(), creds) == result.end()) {
            result.push_back(creds);
        }
    };

    auto host_it = hosts_.find(address);
    if (host_it != hosts_.end()) {
        add_unique(host_it->second);
    }
    for (const auto& vendor : vendor_order_) {
        add_unique(vendors_.at(vendor));
    }
    if (default_) {
        add_unique(*default_);
    }
    return result;
}

} // namespace switchscan::discovery
