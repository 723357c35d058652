#pragma once

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <chrono>
#include <stdexcept>
#include <cstdint>

namespace switchscan::discovery {

// Discovery API version, reported by the command-line tool
#define SWITCHSCAN_API_VERSION "1.0.0"

// Default management ports per CLI transport
#define SWITCHSCAN_DEFAULT_SSH_PORT 22
#define SWITCHSCAN_DEFAULT_TELNET_PORT 23

// Why a single node could not be discovered
enum class FailureKind {
    CLASSIFICATION,  // Vendor could not be determined, or has no registered strategy
    CREDENTIAL,      // No usable credentials resolved
    TRANSPORT,       // Session unreachable, rejected or dropped
    PARSE            // Vendor output unparseable (absorbed by strategies in practice)
};

const char* to_string(FailureKind kind);

// Transient login pair; never stored in the topology
struct Credentials {
    std::string username;
    std::string password;
};

inline bool operator==(const Credentials& a, const Credentials& b) {
    return a.username == b.username && a.password == b.password;
}

inline bool operator!=(const Credentials& a, const Credentials& b) {
    return !(a == b);
}

// One row of a device's own neighbor table. Directed: the remote end has not confirmed it.
struct NeighborInfo {
    std::string address;      // Neighbor management address
    std::string local_port;   // Port on the reporting device
    std::string remote_port;  // Port ID advertised by the neighbor
    std::string system_name;
    std::string chassis_id;
    std::map<std::string, std::string> properties;
};

// Device record produced by a vendor strategy
struct SwitchInfo {
    std::string address;
    std::string type;  // Vendor tag
    std::map<std::string, std::string> attributes;  // hostname, model, firmware, serial, mac...
    std::vector<NeighborInfo> neighbors;
};

// Session-level failure: cannot connect, dropped, timed out
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

// Credentials were rejected by the device
class AuthenticationError : public TransportError {
public:
    explicit AuthenticationError(const std::string& what) : TransportError(what) {}
};

// Per-session tuning shared by probe and strategies
struct SessionOptions {
    uint16_t port = SWITCHSCAN_DEFAULT_SSH_PORT;
    std::chrono::milliseconds timeout{10000};
};

// Prompt-delimited command channel to a device's management shell
class ICliSession {
public:
    virtual ~ICliSession() = default;

    // Connects and logs in. Throws AuthenticationError or TransportError.
    virtual void open() = 0;

    // Runs one command and returns its output without echo and trailing prompt.
    virtual std::string execute(const std::string& command) = 0;

    // Text received before the first prompt (login banner, MOTD)
    virtual std::string banner() const = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

using SessionFactory = std::function<std::unique_ptr<ICliSession>(
    const std::string& host, const Credentials& credentials, const SessionOptions& options)>;

// Credential lookup collaborator
class ICredentialSource {
public:
    virtual ~ICredentialSource() = default;

    virtual std::optional<Credentials> resolve(const std::string& address) const = 0;

    // Ordered login attempts for a device of unknown vendor
    virtual std::vector<Credentials> candidates(const std::string& address) const {
        auto creds = resolve(address);
        if (creds) return {*creds};
        return {};
    }
};

struct ProbeResult {
    std::optional<std::string> vendor;
    std::optional<Credentials> credentials;
};

// Vendor classification. Failure is reported through empty optionals, never by throwing.
class IVendorProbe {
public:
    virtual ~IVendorProbe() = default;
    virtual ProbeResult probe(const std::string& address) = 0;
};

// Main strategy interface - one implementation per switch vendor
class IVendorDiscovery {
public:
    virtual ~IVendorDiscovery() = default;

    virtual std::string get_vendor() const = 0;

    // Opens its own session and returns the device with its neighbor table.
    // Throws TransportError on session failure; garbled output only shortens the result.
    virtual SwitchInfo discover() = 0;
};

// Strategy factory signature
using VendorFactory = std::function<std::unique_ptr<IVendorDiscovery>(
    const std::string& host, const std::string& username, const std::string& password)>;

// Factory constructing VendorClass(host, username, password, extra...)
template <typename VendorClass, typename... Extra>
VendorFactory make_vendor_factory(Extra... extra) {
    return [=](const std::string& host, const std::string& username, const std::string& password)
               -> std::unique_ptr<IVendorDiscovery> {
        return std::make_unique<VendorClass>(host, username, password, extra...);
    };
}

} // namespace switchscan::discovery

// Macro to simplify strategy registration. Needs at least one constructor
// argument after the class; use make_vendor_factory<VendorClass>() for none.
#define SWITCHSCAN_VENDOR_FACTORY(VendorClass, ...) \
    ::switchscan::discovery::make_vendor_factory<VendorClass>(__VA_ARGS__)
