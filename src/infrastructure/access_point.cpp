/**
 * WiFi Access Point Manager Implementation
 * Brings the hotspot up and down through nmcli connection profiles
 */

#include "infrastructure/access_point.hpp"
#include "infrastructure/command_runner.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"

#include <sstream>

namespace hotspot
{
    namespace infrastructure
    {

        AccessPointManager::AccessPointManager(std::shared_ptr<CommandRunner> runner,
                                               const std::shared_ptr<core::HotspotConfig> &config)
            : runner_(std::move(runner)), config_(config), logger_(core::get_logger("access_point")),
              connection_name_(config->controller.connection_name)
        {
        }

        bool AccessPointManager::bring_up(const core::HotspotSession &session)
        {
            interface_ = session.hotspot_interface;
            logger_->info("Setting up WiFi Access Point",
                          core::LogContext()
                              .add("ssid", session.ssid)
                              .add("interface", interface_)
                              .add("band", core::to_string(session.band)));

            if (!run_nmcli({"radio", "wifi", "on"}))
            {
                logger_->warning("Could not enable the WiFi radio");
            }

            // The interface may still be associated as a station; NetworkManager re-takes it for the AP
            if (!run_nmcli({"device", "disconnect", interface_}))
            {
                logger_->debug("Interface was not connected", core::LogContext().add("interface", interface_));
            }
            remove_stale_profile();

            if (!create_profile(session))
            {
                logger_->error("Failed to create hotspot connection");
                return false;
            }

            if (!activate_profile(interface_))
            {
                logger_->error("Failed to activate hotspot connection");
                remove_stale_profile();
                return false;
            }

            up_ = true;
            logger_->info("WiFi Access Point active",
                          core::LogContext()
                              .add("ssid", session.ssid)
                              .add("interface", interface_)
                              .add("address", session.ap_address)
                              .add("hidden", session.hidden));
            return true;
        }

        bool AccessPointManager::tear_down()
        {
            if (!up_)
            {
                return true;
            }

            logger_->info("Tearing down WiFi Access Point", core::LogContext().add("interface", interface_));

            bool down = run_nmcli({"connection", "down", connection_name_});
            bool deleted = run_nmcli({"connection", "delete", connection_name_});
            up_ = false;

            if (!deleted)
            {
                logger_->warning("Hotspot connection could not be deleted",
                                 core::LogContext().add("connection", connection_name_).add("was_down", down));
                return false;
            }
            return true;
        }

        bool AccessPointManager::remove_stale_profile()
        {
            logger_->debug("Removing existing connection", core::LogContext().add("connection", connection_name_));

            // Absence of the profile makes delete fail; that is the desired end state
            if (!run_nmcli({"connection", "delete", connection_name_}))
            {
                logger_->debug("No existing connection to remove");
            }
            return true;
        }

        bool AccessPointManager::verify_connection_active()
        {
            std::string output;
            if (!run_nmcli({"-t", "-f", "NAME", "connection", "show", "--active"}, &output))
            {
                return false;
            }

            std::istringstream stream(output);
            std::string line;
            while (std::getline(stream, line))
            {
                if (line == connection_name_)
                {
                    return true;
                }
            }
            return false;
        }

        std::optional<int> AccessPointManager::count_connected_clients(const std::string &interface)
        {
            auto result = runner_->run({"iw", "dev", interface, "station", "dump"},
                                       std::chrono::milliseconds(config_->probe.command_timeout_ms));
            if (!result.ok())
            {
                return std::nullopt;
            }

            int stations = 0;
            std::istringstream stream(result.output);
            std::string line;
            while (std::getline(stream, line))
            {
                if (line.compare(0, 8, "Station ") == 0)
                {
                    ++stations;
                }
            }
            return stations;
        }

        bool AccessPointManager::create_profile(const core::HotspotSession &session)
        {
            std::vector<std::string> command = {
                "connection", "add",
                "type", "wifi",
                "ifname", session.hotspot_interface,
                "con-name", connection_name_,
                "autoconnect", "no",
                "ssid", session.ssid,
                "mode", "ap",
                "802-11-wireless.band", core::band_to_nmcli(session.band),
                "802-11-wireless.hidden", session.hidden ? "yes" : "no",
                "wifi-sec.key-mgmt", "wpa-psk",
                "wifi-sec.psk", session.password,
                "wifi-sec.proto", "rsn",     // WPA2 only
                "wifi-sec.pairwise", "ccmp",
                "wifi-sec.group", "ccmp",
                "ipv4.method", "shared",
                "ipv4.addresses", session.ap_address,
                "ipv6.method", "ignore"};

            if (session.dns_override)
            {
                command.insert(command.end(), {"ipv4.dns", *session.dns_override, "ipv4.ignore-auto-dns", "yes"});
            }

            logger_->debug("Creating hotspot connection",
                           core::LogContext().add("connection", connection_name_).add("ssid", session.ssid));

            std::string output;
            if (!run_nmcli(command, &output))
            {
                logger_->error("nmcli connection add failed", core::LogContext().add("output", output));
                return false;
            }
            return true;
        }

        bool AccessPointManager::activate_profile(const std::string &interface)
        {
            logger_->info("Activating hotspot connection", core::LogContext().add("connection", connection_name_));

            std::chrono::milliseconds timeout(config_->controller.activation_timeout_ms);
            auto wait_seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout).count();

            std::string output;
            if (!run_nmcli({"-w", std::to_string(wait_seconds), "connection", "up", connection_name_, "ifname", interface},
                           &output, timeout + std::chrono::seconds(1)))
            {
                logger_->error("nmcli connection up failed", core::LogContext().add("output", output));
                return false;
            }
            return true;
        }

        bool AccessPointManager::run_nmcli(const std::vector<std::string> &args, std::string *output,
                                           std::optional<std::chrono::milliseconds> timeout)
        {
            std::vector<std::string> argv = {"nmcli"};
            argv.insert(argv.end(), args.begin(), args.end());

            auto result = runner_->run(argv, timeout.value_or(std::chrono::milliseconds(config_->probe.command_timeout_ms)));
            if (output)
            {
                *output = result.output;
            }
            return result.ok();
        }

    } // namespace infrastructure
} // namespace hotspot
