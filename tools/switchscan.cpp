#include "discovery/credential_store.hpp"
#include "discovery/discovery_manager.hpp"
#include "discovery/switch_detector.hpp"
#include "discovery/session_factory.hpp"
#include "discovery/topology_export.hpp"
#include "vendors/builtin_vendors.hpp"

#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <filesystem>
#include <thread>

#include <pthread.h>
#include <signal.h>

namespace fs = std::filesystem;
using namespace switchscan::discovery;

namespace {

// Turns SIGINT/SIGTERM into an engine cancellation. SIGUSR1 releases the watcher after a normal finish.
class InterruptWatcher {
public:
    explicit InterruptWatcher(DiscoveryEngine& engine) : engine_(engine), interrupted_(false) {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        sigaddset(&signals_, SIGUSR1);
        if (pthread_sigmask(SIG_BLOCK, &signals_, nullptr) != 0) {
            throw std::runtime_error("Cannot block termination signals");
        }
        thread_ = std::thread([this] { wait_for_signal(); });
    }

    ~InterruptWatcher() {
        if (thread_.joinable()) {
            if (!interrupted_.load()) {
                pthread_kill(thread_.native_handle(), SIGUSR1);
            }
            thread_.join();
        }
    }

    bool interrupted() const { return interrupted_.load(); }

private:
    DiscoveryEngine& engine_;
    sigset_t signals_;
    std::atomic<bool> interrupted_;
    std::thread thread_;

    void wait_for_signal() {
        int sig = 0;
        if (sigwait(&signals_, &sig) != 0 || sig == SIGUSR1) {
            return;
        }
        interrupted_.store(true);
        spdlog::warn("Discovery interrupted by user");
        engine_.cancel();
    }
};

} // namespace

int main(int argc, char** argv) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    cxxopts::Options options("switchscan", "Network Switch Discovery Tool");
    options.positional_help("<seed_ip>");
    options.add_options()
        ("seed_ip", "Starting IP address for network discovery", cxxopts::value<std::string>())
        ("c,credentials", "Path to credentials file", cxxopts::value<std::string>()->default_value("credentials.json"))
        ("o,output-dir", "Output directory for results", cxxopts::value<std::string>()->default_value("output"))
        ("w,workers", "Concurrent discovery workers", cxxopts::value<uint32_t>()->default_value("1"))
        ("t,timeout-ms", "Per-session I/O timeout in milliseconds", cxxopts::value<uint32_t>()->default_value("10000"))
        ("T,transport", "Management shell transport (ssh or telnet)", cxxopts::value<std::string>()->default_value("ssh"))
        ("p,port", "Management CLI port (default: 22 for ssh, 23 for telnet)", cxxopts::value<uint16_t>())
        ("v,verbose", "Enable verbose output")
        ("h,help", "Print usage");
    options.parse_positional({"seed_ip"});

    try {
        auto args = options.parse(argc, argv);
        if (args.count("help")) {
            spdlog::info("\n{}", options.help());
            return 0;
        }
        if (!args.count("seed_ip")) {
            spdlog::error("Missing seed IP\n{}", options.help());
            return 1;
        }

        if (args.count("verbose")) {
            spdlog::set_level(spdlog::level::debug);
        }

        const auto seed_ip = args["seed_ip"].as<std::string>();
        const auto credentials_file = args["credentials"].as<std::string>();
        const auto output_dir = args["output-dir"].as<std::string>();

        spdlog::info("Network Switch Discovery Tool v{}", SWITCHSCAN_API_VERSION);
        spdlog::info(std::string(40, '='));
        spdlog::info("Seed IP: {}", seed_ip);
        spdlog::info("Credentials: {}", credentials_file);
        spdlog::info("Output Directory: {}", output_dir);

        const Transport transport = parse_transport(args["transport"].as<std::string>());
        SessionOptions session_options;
        session_options.port = args.count("port") ? args["port"].as<uint16_t>() : default_port(transport);
        spdlog::info("Transport: {} (port {})", to_string(transport), session_options.port);
        session_options.timeout = std::chrono::milliseconds(args["timeout-ms"].as<uint32_t>());

        auto credentials = CredentialStore::load_from_file(credentials_file);
        const SessionFactory sessions = make_session_factory(transport);
        auto detector = std::make_shared<SwitchDetector>(credentials, sessions, session_options);
        auto registry = std::make_shared<VendorRegistry>();
        vendors::register_builtin_vendors(*registry, session_options, sessions);

        DiscoveryEngine::EngineConfig engine_config;
        engine_config.workers = args["workers"].as<uint32_t>();
        DiscoveryEngine engine(detector, registry, engine_config);

        fs::create_directories(output_dir);

        bool interrupted = false;
        {
            InterruptWatcher watcher(engine);
            engine.discover_network(seed_ip);
            interrupted = watcher.interrupted();
        }

        const auto topology_path = (fs::path(output_dir) / topology_filename(seed_ip)).string();
        const auto inventory_path = (fs::path(output_dir) / "inventory.yaml").string();
        bool saved = save_topology(engine.get_topology(), topology_path);
        saved = save_topology(engine.get_topology(), inventory_path, OutputFormat::YAML) && saved;

        auto stats = engine.get_topology_stats();
        spdlog::info("Discovery {}!", interrupted ? "interrupted" : "completed");
        spdlog::info("Results saved to:");
        spdlog::info("  - Topology (JSON): {}", topology_path);
        spdlog::info("  - Inventory (YAML): {}", inventory_path);
        spdlog::info("Discovery Statistics:");
        spdlog::info("  - Total switches discovered: {}", stats.total_switches);
        for (const auto& [type, count] : stats.switch_types) {
            spdlog::info("  - {}: {}", type, count);
        }
        spdlog::info("  - Total neighbor connections: {}", stats.total_neighbors);
        spdlog::info("  - Failed switches: {}", stats.failed_ips.size());

        if (interrupted || !saved) {
            return 1;
        }
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Discovery failed: {}", e.what());
        return 1;
    }
}
