#pragma once

#include "discovery/discovery_interface.hpp"
#include <regex>

namespace switchscan::discovery {

// Classifies a device by logging in and matching banner and command output against vendor signatures
class SwitchDetector : public IVendorProbe {
public:
    struct VendorSignature {
        std::string vendor;
        std::string pattern;
        std::regex regex;
    };

    SwitchDetector(std::shared_ptr<const ICredentialSource> credentials,
                   SessionFactory session_factory,
                   SessionOptions options = {});

    ProbeResult probe(const std::string& address) override;

    // Signatures are tried in insertion order; first match wins
    void add_signature(const std::string& vendor, const std::string& pattern);
    void clear_signatures();
    const std::vector<VendorSignature>& get_signatures() const { return signatures_; }

    void set_classification_commands(std::vector<std::string> commands);
    const std::vector<std::string>& get_classification_commands() const { return commands_; }

    // Vendor whose signature matches `text`, if any
    std::optional<std::string> classify(const std::string& text) const;

private:
    std::shared_ptr<const ICredentialSource> credentials_;
    SessionFactory session_factory_;
    SessionOptions options_;
    std::vector<VendorSignature> signatures_;
    std::vector<std::string> commands_;

    void install_default_signatures();
    std::optional<std::string> classify_session(ICliSession& session, const std::string& address) const;
};

} // namespace switchscan::discovery
