/**
 * hotspotd
 * Wi-Fi hotspot backend: pre-flight safety checks, access point lifecycle,
 * VPN-aware NAT routing and status publication.
 */

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include "api/server.hpp"
#include "core/config.hpp"
#include "core/controller.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "infrastructure/access_point.hpp"
#include "infrastructure/capability_prober.hpp"
#include "infrastructure/command_runner.hpp"
#include "infrastructure/firewall_manager.hpp"
#include "infrastructure/interface_inventory.hpp"
#include "services/status_publisher.hpp"

// Command line argument parsing
#include <getopt.h>

namespace hotspot
{

    namespace
    {
        constexpr const char *kVersion = "0.3.0";
        constexpr auto kStopWait = std::chrono::seconds(5);

        std::atomic<bool> g_stop_requested{false};

        enum LongOption
        {
            OPT_HIDDEN = 256,
            OPT_EXCLUDE_VPN,
            OPT_FORCE_SINGLE,
            OPT_STOP,
            OPT_BLOCK_MAC,
            OPT_ALLOW_MAC,
            OPT_DNS,
            OPT_IDLE_OFF,
            OPT_API_PORT,
            OPT_CHECK,
            OPT_LIST_INTERFACES,
            OPT_VERSION
        };
    } // namespace

    /**
     * Signal handler for graceful shutdown. The control loop notices the flag.
     */
    void signal_handler(int)
    {
        g_stop_requested = true;
    }

    void setup_signal_handlers()
    {
        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGQUIT, signal_handler);
    }

    /**
     * Check if running with required privileges
     */
    bool check_root_privileges()
    {
        if (geteuid() != 0)
        {
            std::cerr << "ERROR: Root privileges are required to create an access point and edit firewall rules." << std::endl;
            std::cerr << "Please run with: sudo hotspotd ..." << std::endl;
            return false;
        }
        return true;
    }

    void print_usage(const char *program_name)
    {
        std::cout << "hotspotd - Wi-Fi hotspot backend\n\n";
        std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
        std::cout << "Hotspot options:\n";
        std::cout << "  -s, --ssid NAME              Network name (1-32 bytes)\n";
        std::cout << "  -p, --password SECRET        WPA2 passphrase (8-63 characters)\n";
        std::cout << "  -i, --interface IFACE        Wi-Fi interface to host the hotspot (default: auto)\n";
        std::cout << "  -b, --band g|a               2.4 GHz (g) or 5 GHz (a)\n";
        std::cout << "      --hidden                 Do not broadcast the SSID\n";
        std::cout << "      --dns ADDRESS            DNS server handed to clients\n";
        std::cout << "  -t, --timer MINUTES          Stop automatically after 1-120 minutes\n";
        std::cout << "      --idle-off MINUTES       Stop after MINUTES without clients (0 disables)\n";
        std::cout << "      --block-mac MAC          Deny a client (repeatable)\n";
        std::cout << "      --allow-mac MAC          Allow only listed clients (repeatable)\n";
        std::cout << "      --exclude-vpn            Route through the physical uplink, never a VPN\n";
        std::cout << "      --force-single-interface Share the uplink adapter even if it disconnects it\n\n";
        std::cout << "Control:\n";
        std::cout << "      --stop                   Stop the running hotspot and clean up\n";
        std::cout << "      --check                  Run pre-flight checks and print the verdict\n";
        std::cout << "      --list-interfaces        List interfaces with their capabilities\n";
        std::cout << "  -c, --config FILE            Settings file (JSON)\n";
        std::cout << "  -v, --verbose                Increase verbosity (-v for INFO, -vv for DEBUG)\n";
        std::cout << "  -l, --log-file FILE          Log to file instead of console\n";
        std::cout << "      --api-port PORT          Serve the status API on 127.0.0.1:PORT\n";
        std::cout << "  -h, --help                   Show this help message\n";
        std::cout << "      --version                Show version information\n\n";
        std::cout << "Examples:\n";
        std::cout << "  " << program_name << " -s CoffeeShop -p 'longpassword'\n";
        std::cout << "  " << program_name << " -s Lab -p 'longpassword' -b a -t 30 --exclude-vpn\n";
        std::cout << "  " << program_name << " --check -i wlan1\n";
        std::cout << "  " << program_name << " --stop\n";
        std::cout << std::endl;
    }

    void print_version()
    {
        std::cout << "hotspotd v" << kVersion << std::endl;
        std::cout << "Built for Linux with NetworkManager, iw and iptables" << std::endl;
    }

    struct Arguments
    {
        std::string config_file;
        int verbosity = 0;
        std::string log_file;

        std::optional<std::string> ssid;
        std::optional<std::string> password;
        std::optional<std::string> interface;
        std::optional<std::string> band;
        std::optional<std::string> dns;
        std::optional<int> timer;
        std::optional<int> idle_off;
        std::optional<int> api_port;
        std::vector<std::string> block_macs;
        std::vector<std::string> allow_macs;
        bool hidden = false;
        bool exclude_vpn = false;
        bool force_single_interface = false;

        bool stop = false;
        bool check = false;
        bool list_interfaces = false;
        bool help = false;
        bool version = false;
    };

    int parse_number(const char *option, const char *value)
    {
        const std::string message = std::string("Option ") + option + " expects a number, got '" + value + "'";

        size_t consumed = 0;
        int number = 0;
        try
        {
            number = std::stoi(value, &consumed);
        }
        catch (const std::logic_error &)
        {
            throw core::HotspotError(core::ErrorKind::InvalidConfig, message);
        }
        if (consumed != std::string(value).size())
        {
            throw core::HotspotError(core::ErrorKind::InvalidConfig, message);
        }
        return number;
    }

    /**
     * Throws HotspotError(InvalidConfig) for malformed arguments
     */
    Arguments parse_arguments(int argc, char *argv[])
    {
        Arguments args;

        static struct option long_options[] = {
            {"ssid", required_argument, 0, 's'},
            {"password", required_argument, 0, 'p'},
            {"interface", required_argument, 0, 'i'},
            {"band", required_argument, 0, 'b'},
            {"timer", required_argument, 0, 't'},
            {"hidden", no_argument, 0, OPT_HIDDEN},
            {"exclude-vpn", no_argument, 0, OPT_EXCLUDE_VPN},
            {"force-single-interface", no_argument, 0, OPT_FORCE_SINGLE},
            {"stop", no_argument, 0, OPT_STOP},
            {"block-mac", required_argument, 0, OPT_BLOCK_MAC},
            {"allow-mac", required_argument, 0, OPT_ALLOW_MAC},
            {"dns", required_argument, 0, OPT_DNS},
            {"idle-off", required_argument, 0, OPT_IDLE_OFF},
            {"api-port", required_argument, 0, OPT_API_PORT},
            {"check", no_argument, 0, OPT_CHECK},
            {"list-interfaces", no_argument, 0, OPT_LIST_INTERFACES},
            {"config", required_argument, 0, 'c'},
            {"verbose", no_argument, 0, 'v'},
            {"log-file", required_argument, 0, 'l'},
            {"help", no_argument, 0, 'h'},
            {"version", no_argument, 0, OPT_VERSION},
            {0, 0, 0, 0}};

        int c;
        int option_index = 0;

        while ((c = getopt_long(argc, argv, "s:p:i:b:t:c:vl:h", long_options, &option_index)) != -1)
        {
            switch (c)
            {
            case 's':
                args.ssid = optarg;
                break;
            case 'p':
                args.password = optarg;
                break;
            case 'i':
                args.interface = optarg;
                break;
            case 'b':
                args.band = optarg;
                break;
            case 't':
                args.timer = parse_number("--timer", optarg);
                break;
            case OPT_HIDDEN:
                args.hidden = true;
                break;
            case OPT_EXCLUDE_VPN:
                args.exclude_vpn = true;
                break;
            case OPT_FORCE_SINGLE:
                args.force_single_interface = true;
                break;
            case OPT_STOP:
                args.stop = true;
                break;
            case OPT_BLOCK_MAC:
                args.block_macs.push_back(optarg);
                break;
            case OPT_ALLOW_MAC:
                args.allow_macs.push_back(optarg);
                break;
            case OPT_DNS:
                args.dns = optarg;
                break;
            case OPT_IDLE_OFF:
                args.idle_off = parse_number("--idle-off", optarg);
                break;
            case OPT_API_PORT:
                args.api_port = parse_number("--api-port", optarg);
                break;
            case OPT_CHECK:
                args.check = true;
                break;
            case OPT_LIST_INTERFACES:
                args.list_interfaces = true;
                break;
            case 'c':
                args.config_file = optarg;
                break;
            case 'v':
                args.verbosity++;
                break;
            case 'l':
                args.log_file = optarg;
                break;
            case 'h':
                args.help = true;
                break;
            case OPT_VERSION:
                args.version = true;
                break;
            case '?':
                // getopt_long already printed an error message
                throw core::HotspotError(core::ErrorKind::InvalidConfig, "Invalid command line; see --help");
            default:
                throw core::HotspotError(core::ErrorKind::InvalidConfig, "Unknown option: " + std::to_string(c));
            }
        }

        if (optind < argc)
        {
            throw core::HotspotError(core::ErrorKind::InvalidConfig,
                                     std::string("Unexpected argument: ") + argv[optind]);
        }

        return args;
    }

    /**
     * Command-line flags override the settings file
     */
    void apply_overrides(const Arguments &args, core::HotspotConfig &config)
    {
        if (!args.block_macs.empty() && !args.allow_macs.empty())
        {
            throw core::HotspotError(core::ErrorKind::InvalidConfig,
                                     "--block-mac and --allow-mac cannot be combined");
        }

        auto &settings = config.hotspot;
        if (args.ssid)
        {
            settings.ssid = *args.ssid;
        }
        if (args.password)
        {
            settings.password = *args.password;
        }
        if (args.interface)
        {
            settings.interface = *args.interface;
        }
        if (args.band)
        {
            settings.band = *args.band;
        }
        if (args.dns)
        {
            settings.dns = *args.dns;
        }
        if (args.idle_off)
        {
            settings.idle_off = *args.idle_off;
        }
        if (args.hidden)
        {
            settings.hidden = true;
        }
        if (!args.block_macs.empty())
        {
            settings.mac_mode = "block";
            settings.blocked_macs = args.block_macs;
        }
        if (!args.allow_macs.empty())
        {
            settings.mac_mode = "allow";
            settings.allowed_macs = args.allow_macs;
        }
        if (args.api_port)
        {
            if (*args.api_port <= 0 || *args.api_port > 65535)
            {
                throw core::HotspotError(core::ErrorKind::InvalidConfig, "--api-port must be between 1 and 65535");
            }
            config.api.enabled = true;
            config.api.port = *args.api_port;
        }
    }

    core::HotspotSession build_session(const Arguments &args, const core::HotspotConfig &config)
    {
        auto session = config.to_session();
        if (args.timer)
        {
            session.timer_minutes = *args.timer;
        }
        session.exclude_vpn = args.exclude_vpn;
        session.force_single_interface = args.force_single_interface;
        return session;
    }

    /**
     * Everything that talks to the system, wired once per process
     */
    struct Backend
    {
        std::shared_ptr<infrastructure::CommandRunner> runner;
        std::shared_ptr<infrastructure::InterfaceInventory> inventory;
        std::shared_ptr<infrastructure::CapabilityProber> prober;
        std::shared_ptr<infrastructure::FirewallManager> firewall;
        std::shared_ptr<infrastructure::AccessPointManager> access_point;
        std::shared_ptr<services::StatusPublisher> publisher;
    };

    Backend make_backend(const std::shared_ptr<core::HotspotConfig> &config)
    {
        Backend backend;
        backend.runner = std::make_shared<infrastructure::SystemCommandRunner>();
        backend.inventory = std::make_shared<infrastructure::InterfaceInventory>(backend.runner, config);
        backend.prober = std::make_shared<infrastructure::CapabilityProber>(backend.runner, config);
        backend.firewall = std::make_shared<infrastructure::FirewallManager>(backend.runner, config);
        backend.access_point = std::make_shared<infrastructure::AccessPointManager>(backend.runner, config);
        backend.publisher = std::make_shared<services::StatusPublisher>(config);
        return backend;
    }

    core::ControllerDependencies make_dependencies(const Backend &backend)
    {
        core::ControllerDependencies deps;
        deps.inventory = backend.inventory;
        deps.prober = backend.prober;
        deps.firewall = backend.firewall;
        deps.access_point = backend.access_point;
        deps.publisher = backend.publisher;
        return deps;
    }

    bool process_alive(pid_t pid)
    {
        return pid > 0 && kill(pid, 0) == 0;
    }

    /**
     * --stop: signal the running backend, then remove whatever it left behind
     */
    int stop_backend(const std::shared_ptr<core::HotspotConfig> &config)
    {
        auto logger = core::get_logger("main");
        std::cout << "Stopping hotspot..." << std::endl;

        auto backend = make_backend(config);
        bool backend_found = false;

        auto pid = services::StatusPublisher::read_pid_record(config->paths.pid_file);
        if (pid && *pid != getpid() && process_alive(*pid))
        {
            backend_found = true;
            if (kill(*pid, SIGTERM) != 0)
            {
                logger->error("Failed to signal backend", core::LogContext().add("pid", *pid));
            }

            auto deadline = std::chrono::steady_clock::now() + kStopWait;
            while (process_alive(*pid) && std::chrono::steady_clock::now() < deadline)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(250));
            }
            if (process_alive(*pid))
            {
                logger->warning("Backend did not exit in time, cleaning up anyway", core::LogContext().add("pid", *pid));
            }
        }

        bool clean = true;
        if (!backend.access_point->remove_stale_profile())
        {
            clean = false;
        }
        if (!backend.firewall->remove_all_chains())
        {
            clean = false;
        }
        if (!backend.publisher->clear_pid_record())
        {
            clean = false;
        }

        if (!backend_found)
        {
            services::StatusDetails details;
            details.message = "Hotspot stopped";
            if (!backend.publisher->publish(core::HotspotState::Idle, std::nullopt, details))
            {
                logger->warning("Status file not updated", core::LogContext().add("path", config->paths.status_file));
            }
        }

        if (!clean)
        {
            std::cerr << "Hotspot stopped, but some leftovers could not be removed (see log)." << std::endl;
            return core::exit_code_for(core::ErrorKind::ApplyFailure);
        }

        std::cout << "Hotspot stopped." << std::endl;
        return 0;
    }

    /**
     * --list-interfaces
     */
    int list_interfaces(const std::shared_ptr<core::HotspotConfig> &config)
    {
        auto backend = make_backend(config);
        auto interfaces = backend.inventory->list_interfaces();

        std::vector<std::string> wireless;
        for (const auto &iface : interfaces)
        {
            if (iface.is_wireless())
            {
                wireless.push_back(iface.name);
            }
        }
        auto capabilities = backend.prober->probe_all(wireless);

        for (auto &iface : interfaces)
        {
            std::vector<std::string> tags;
            auto caps = capabilities.find(iface.name);
            if (caps != capabilities.end())
            {
                tags = infrastructure::capability_tags(caps->second);
            }

            std::cout << std::left << std::setw(16) << iface.name << std::setw(12)
                      << infrastructure::to_string(iface.kind)
                      << infrastructure::make_interface_label(iface, tags);
            if (caps != capabilities.end() && caps->second.reachable)
            {
                std::cout << "  {" << infrastructure::concurrency_label(caps->second) << "}";
            }
            std::cout << std::endl;
        }
        return 0;
    }

    void print_warnings(const std::vector<std::string> &warnings)
    {
        for (const auto &warning : warnings)
        {
            std::cout << "[!] " << warning << std::endl;
        }
    }

    void print_failure(const core::StartResult &result)
    {
        std::cerr << "\n[ERROR] Cannot start hotspot (" << result.error.code() << "):" << std::endl;
        std::cerr << result.message << std::endl;
    }

    /**
     * --check
     */
    int check_session(const std::shared_ptr<core::HotspotConfig> &config, const core::HotspotSession &session)
    {
        auto backend = make_backend(config);
        auto deps = make_dependencies(backend);
        deps.publisher.reset(); // a dry run publishes nothing
        core::HotspotController controller(config, deps);

        auto result = controller.dry_run(session);
        print_warnings(result.warnings);

        if (!result.ok)
        {
            print_failure(result);
            return result.exit_code();
        }

        std::cout << "Pre-flight checks passed." << std::endl;
        std::cout << "  Hotspot interface:  " << result.hotspot_interface << std::endl;
        std::cout << "  Internet interface: " << result.internet_interface.value_or("none") << std::endl;
        if (result.verdict && result.verdict->overridden)
        {
            std::cout << "  Single-adapter lockout overridden" << std::endl;
        }
        if (result.plan)
        {
            std::cout << "  Firewall rules" << (result.plan->vpn_pinned ? " (VPN pinned)" : "") << ":" << std::endl;
            for (const auto &rule : result.plan->rules)
            {
                std::cout << "    " << rule.describe() << std::endl;
            }
        }
        return 0;
    }

    /**
     * Default mode: start the hotspot and serve it until stopped
     */
    int run_hotspot(const std::shared_ptr<core::HotspotConfig> &config, const core::HotspotSession &session)
    {
        auto logger = core::get_logger("main");

        auto pid = services::StatusPublisher::read_pid_record(config->paths.pid_file);
        if (pid && *pid != getpid() && process_alive(*pid))
        {
            std::cerr << "ERROR: A hotspot backend is already running (pid " << *pid << ")." << std::endl;
            std::cerr << "Stop it first with: hotspotd --stop" << std::endl;
            return core::exit_code_for(core::ErrorKind::SessionActive);
        }

        setup_signal_handlers();

        auto backend = make_backend(config);
        if (!backend.publisher->write_pid_record(getpid()))
        {
            logger->warning("Continuing without a PID record; --stop will only clean up leftovers");
        }

        core::HotspotController controller(config, make_dependencies(backend));

        std::unique_ptr<api::StatusApiServer> api_server;
        if (config->api.enabled)
        {
            api::StatusProviders providers;
            providers.status = [publisher = backend.publisher]() { return publisher->latest(); };
            providers.interfaces = [&controller]() { return controller.last_inventory(); };
            providers.capabilities = [&controller]() { return controller.last_capabilities(); };

            api_server = std::make_unique<api::StatusApiServer>(providers);
            if (!api_server->start(config->api.host, static_cast<uint16_t>(config->api.port)))
            {
                api_server.reset();
            }
        }

        std::cout << "Running pre-flight checks..." << std::endl;
        auto pending = controller.request_start(session);
        controller.poll(std::chrono::system_clock::now());
        auto result = pending.get();

        print_warnings(result.warnings);
        if (!result.ok)
        {
            print_failure(result);
            if (api_server)
            {
                api_server->stop();
            }
            if (!backend.publisher->clear_pid_record())
            {
                logger->warning("PID record left behind", core::LogContext().add("path", config->paths.pid_file));
            }
            return result.exit_code();
        }

        std::cout << result.message << std::endl;
        std::cout << "Internet source: " << result.internet_interface.value_or("none") << std::endl;
        if (session.timer_minutes)
        {
            std::cout << "Auto-off in " << *session.timer_minutes << " minutes" << std::endl;
        }

        controller.run(g_stop_requested);

        if (api_server)
        {
            api_server->stop();
        }
        if (!backend.publisher->clear_pid_record())
        {
            logger->warning("PID record left behind", core::LogContext().add("path", config->paths.pid_file));
        }

        auto error = controller.last_error();
        if (error && error->kind != core::ErrorKind::None)
        {
            std::cerr << "Hotspot stopped: " << error->message << std::endl;
            return error->exit_code();
        }

        logger->info("Hotspot backend exiting");
        return 0;
    }

} // namespace hotspot

/**
 * Main entry point
 */
int main(int argc, char *argv[])
{
    using namespace hotspot;

    try
    {
        auto args = parse_arguments(argc, argv);

        if (args.help)
        {
            print_usage(argv[0]);
            return 0;
        }

        if (args.version)
        {
            print_version();
            return 0;
        }

        // Setup logging
        core::LogLevel log_level = core::LogLevel::WARNING;
        if (args.verbosity == 1)
        {
            log_level = core::LogLevel::INFO;
        }
        else if (args.verbosity >= 2)
        {
            log_level = core::LogLevel::DEBUG;
        }

        core::setup_logging(log_level, args.log_file, args.log_file.empty());
        auto logger = core::get_logger("main");

        std::shared_ptr<core::HotspotConfig> config;
        if (args.config_file.empty())
        {
            config = std::make_shared<core::HotspotConfig>();
        }
        else
        {
            config = core::HotspotConfig::from_file(args.config_file);
        }

        // Settings-file logging applies only when the command line says nothing
        if (args.verbosity == 0 && args.log_file.empty() &&
            (!config->logging.log_file.empty() || config->logging.log_level != "WARNING"))
        {
            core::setup_logging(core::parse_log_level(config->logging.log_level), config->logging.log_file,
                                config->logging.log_file.empty());
        }

        if (args.list_interfaces)
        {
            return list_interfaces(config);
        }

        if (args.stop)
        {
            if (!check_root_privileges())
            {
                return core::exit_code_for(core::ErrorKind::PrivilegeRequired);
            }
            return stop_backend(config);
        }

        apply_overrides(args, *config);
        if (!config->validate())
        {
            std::cerr << "ERROR: Invalid configuration (see log for details)" << std::endl;
            return core::exit_code_for(core::ErrorKind::InvalidConfig);
        }

        auto session = build_session(args, *config);

        if (args.check)
        {
            return check_session(config, session);
        }

        if (!check_root_privileges())
        {
            return core::exit_code_for(core::ErrorKind::PrivilegeRequired);
        }

        logger->info("Starting hotspot backend",
                     core::LogContext().add("ssid", session.ssid).add("config_file", args.config_file));
        return run_hotspot(config, session);
    }
    catch (const core::HotspotError &e)
    {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return core::exit_code_for(e.kind());
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return core::exit_code_for(core::ErrorKind::Internal);
    }
}
