#include "discovery/switch_detector.hpp"
#include <spdlog/spdlog.h>

namespace switchscan::discovery {

SwitchDetector::SwitchDetector(std::shared_ptr<const ICredentialSource> credentials,
                               SessionFactory session_factory,
                               SessionOptions options)
    : credentials_(std::move(credentials)),
      session_factory_(std::move(session_factory)),
      options_(options) {
    if (!credentials_ || !session_factory_) {
        throw std::invalid_argument("SwitchDetector requires a credential source and a session factory");
    }

    commands_ = {"show system info", "show version", "uname -a"};
    install_default_signatures();
}

void SwitchDetector::install_default_signatures() {
    add_signature("hirschmann", R"(Hirschmann|HiOS|Belden)");
    add_signature("lantech", R"(Lantech)");
    add_signature("kontron", R"(Kontron)");
    add_signature("nomad", R"(Nomad|\bNDL\b|Linux)");
}

void SwitchDetector::add_signature(const std::string& vendor, const std::string& pattern) {
    signatures_.push_back({vendor, pattern, std::regex(pattern, std::regex_constants::icase)});
}

void SwitchDetector::clear_signatures() {
    signatures_.clear();
}

void SwitchDetector::set_classification_commands(std::vector<std::string> commands) {
    commands_ = std::move(commands);
}

std::optional<std::string> SwitchDetector::classify(const std::string& text) const {
    for (const auto& signature : signatures_) {
        if (std::regex_search(text, signature.regex)) {
            return signature.vendor;
        }
    }
    return std::nullopt;
}

std::optional<std::string> SwitchDetector::classify_session(ICliSession& session,
                                                            const std::string& address) const {
    auto vendor = classify(session.banner());
    if (vendor) {
        return vendor;
    }

    for (const auto& command : commands_) {
        std::string output;
        try {
            output = session.execute(command);
        } catch (const TransportError& e) {
            spdlog::debug("Classification command '{}' failed on {}: {}", command, address, e.what());
            break;
        }

        vendor = classify(output);
        if (vendor) {
            return vendor;
        }
    }
    return std::nullopt;
}

ProbeResult SwitchDetector::probe(const std::string& address) {
    ProbeResult result;

    auto candidates = credentials_->candidates(address);
    if (candidates.empty()) {
        spdlog::warn("No credentials configured for {}", address);
        return result;
    }

    for (const auto& credentials : candidates) {
        std::unique_ptr<ICliSession> session;
        try {
            session = session_factory_(address, credentials, options_);
            if (!session) {
                throw TransportError("No session available for " + address);
            }
            session->open();
        } catch (const AuthenticationError& e) {
            spdlog::debug("Login as {} rejected by {}: {}", credentials.username, address, e.what());
            continue;
        } catch (const std::exception& e) {
            spdlog::warn("Cannot reach {}: {}", address, e.what());
            return result;
        }

        result.credentials = credentials;
        try {
            result.vendor = classify_session(*session, address);
        } catch (const std::exception& e) {
            spdlog::warn("Classification of {} aborted: {}", address, e.what());
        }
        session->close();

        if (result.vendor) {
            spdlog::debug("Detected {} at {}", *result.vendor, address);
        } else {
            spdlog::warn("No vendor signature matched {}", address);
        }
        return result;
    }

    spdlog::warn("All {} credential sets rejected by {}", candidates.size(), address);
    return result;
}

} // namespace switchscan::discovery
