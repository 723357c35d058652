#pragma once

#include "discovery/discovery_interface.hpp"
#include <unordered_map>
#include <nlohmann/json_fwd.hpp>

namespace switchscan::discovery {

// Credentials loaded from a JSON document with "default", "vendors" and "hosts" sections
class CredentialStore : public ICredentialSource {
public:
    CredentialStore() = default;

    // Throws std::runtime_error if the file is missing or malformed
    static std::shared_ptr<CredentialStore> load_from_file(const std::string& path);
    static std::shared_ptr<CredentialStore> from_json(const nlohmann::json& document);

    std::optional<Credentials> resolve(const std::string& address) const override;
    std::vector<Credentials> candidates(const std::string& address) const override;

    // Credentials for a known vendor, falling back to the default entry
    std::optional<Credentials> resolve_vendor(const std::string& vendor) const;

    void set_default(const Credentials& credentials) { default_ = credentials; }
    void set_host(const std::string& address, const Credentials& credentials);
    void set_vendor(const std::string& vendor, const Credentials& credentials);

    size_t host_count() const { return hosts_.size(); }
    size_t vendor_count() const { return vendor_order_.size(); }

private:
    std::optional<Credentials> default_;
    std::unordered_map<std::string, Credentials> hosts_;
    std::unordered_map<std::string, Credentials> vendors_;
    std::vector<std::string> vendor_order_;

    static Credentials parse_entry(const nlohmann::json& entry, const std::string& where);
};

} // namespace switchscan::discovery
