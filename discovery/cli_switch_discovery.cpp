#include "discovery/cli_switch_discovery.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace switchscan::discovery {

CliSwitchDiscovery::CliSwitchDiscovery(std::string host, std::string username, std::string password,
                                       SessionOptions options, SessionFactory session_factory)
    : host_(std::move(host)),
      credentials_{std::move(username), std::move(password)},
      options_(options),
      session_factory_(std::move(session_factory)) {
    if (!session_factory_) {
        throw std::invalid_argument("CliSwitchDiscovery requires a session factory");
    }
}

SwitchInfo CliSwitchDiscovery::discover() {
    SwitchInfo info;
    info.address = host_;
    info.type = get_vendor();

    auto session = session_factory_(host_, credentials_, options_);
    if (!session) {
        throw TransportError("No session available for " + host_);
    }
    session->open();
    prepare_session(*session);

    std::string identity_output = session->execute(identity_command());
    std::string neighbor_output = session->execute(neighbor_command());
    session->close();

    // Unparseable output shortens the record instead of failing the node
    try {
        info.attributes = parse_identity(identity_output);
    } catch (const std::exception& e) {
        spdlog::warn("Could not parse {} identity of {}: {}", info.type, host_, e.what());
    }

    try {
        info.neighbors = parse_neighbors(neighbor_output);
    } catch (const std::exception& e) {
        spdlog::warn("Could not parse {} neighbor table of {}: {}", info.type, host_, e.what());
    }

    spdlog::debug("{} {} reports {} neighbors", info.type, host_, info.neighbors.size());
    return info;
}

namespace parsing {

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(text.rbegin(), text.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool is_valid_ipv4(const std::string& text) {
    static const std::regex ipv4(R"((\d{1,3})\.(\d{1,3})\.(\d{1,3})\.(\d{1,3}))");
    std::smatch match;
    if (!std::regex_match(text, match, ipv4)) {
        return false;
    }
    for (size_t i = 1; i <= 4; ++i) {
        if (std::stoi(match[i].str()) > 255) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> extract_ipv4(const std::string& text) {
    static const std::regex candidate(R"((^|[^\d.])(\d{1,3}(?:\.\d{1,3}){3})(?!\d)(?!\.\d))");
    auto begin = std::sregex_iterator(text.begin(), text.end(), candidate);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        std::string address = (*it)[2].str();
        if (is_valid_ipv4(address)) {
            return address;
        }
    }
    return std::nullopt;
}

std::vector<std::pair<std::string, std::string>> parse_key_values(const std::string& output) {
    // Key and value separated by a run of dots or a colon. Keys may not start with a digit
    // so interface names and addresses are not split.
    static const std::regex dotted(R"(^\s*([A-Za-z][^.:]*?)\s*\.{2,}\s*(.*?)\s*$)");
    static const std::regex colon(R"(^\s*([A-Za-z][^:]*?)\s*:\s*(.*?)\s*$)");

    std::vector<std::pair<std::string, std::string>> fields;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        std::smatch match;
        if (std::regex_match(line, match, dotted) || std::regex_match(line, match, colon)) {
            fields.emplace_back(match[1].str(), match[2].str());
        }
    }
    return fields;
}

std::map<std::string, std::string> normalize_identity(
    const std::vector<std::pair<std::string, std::string>>& fields) {
    std::map<std::string, std::string> identity;

    auto assign = [&identity](const std::string& field, const std::string& value) {
        if (!value.empty() && identity.find(field) == identity.end()) {
            identity[field] = value;
        }
    };

    for (const auto& [raw_key, value] : fields) {
        std::string key = to_lower(raw_key);
        if (key == "system name" || key == "hostname" || key == "host name" || key == "sysname") {
            assign("hostname", value);
        } else if (key.find("hardware description") != std::string::npos ||
                   key == "model" || key == "model name" || key == "product" || key == "device type") {
            assign("model", value);
        } else if (key.find("firmware") != std::string::npos ||
                   key.find("software version") != std::string::npos ||
                   key.find("software release") != std::string::npos) {
            assign("firmware", value);
        } else if (key.find("serial") != std::string::npos) {
            assign("serial", value);
        } else if (key.find("mac address") != std::string::npos) {
            assign("mac", value);
        } else if (key == "system description") {
            assign("description", value);
        } else if (key == "system location" || key == "location") {
            assign("location", value);
        }
    }
    return identity;
}

std::vector<std::string> split_blocks(const std::string& output, const std::regex& header) {
    std::vector<std::string> blocks;
    std::istringstream stream(output);
    std::string line;
    bool in_block = false;
    while (std::getline(stream, line)) {
        if (std::regex_search(line, header)) {
            blocks.emplace_back();
            in_block = true;
        }
        if (in_block) {
            blocks.back() += line;
            blocks.back() += '\n';
        }
    }
    return blocks;
}

std::string strip_subtype(const std::string& value) {
    static const std::vector<std::string> subtypes = {
        "mac", "local", "ifname", "ifalias", "ip", "ifindex", "chassis-component", "port-component"};

    std::string trimmed = trim(value);
    auto space = trimmed.find(' ');
    if (space == std::string::npos) {
        return trimmed;
    }
    std::string head = to_lower(trimmed.substr(0, space));
    if (std::find(subtypes.begin(), subtypes.end(), head) != subtypes.end()) {
        return trim(trimmed.substr(space + 1));
    }
    return trimmed;
}

} // namespace parsing

} // namespace switchscan::discovery
