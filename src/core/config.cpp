#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <fstream>

namespace hotspot
{
    namespace core
    {

        // HotspotSettings implementation
        void HotspotSettings::from_json(const nlohmann::json &j)
        {
            if (j.contains("ssid"))
                ssid = j["ssid"];
            if (j.contains("password"))
                password = j["password"];
            if (j.contains("interface") && !j["interface"].is_null())
                interface = j["interface"];
            if (j.contains("band"))
                band = j["band"];
            if (j.contains("auto_off"))
                auto_off = j["auto_off"];
            if (j.contains("idle_off"))
                idle_off = j["idle_off"];
            if (j.contains("hidden"))
                hidden = j["hidden"];
            if (j.contains("dns") && !j["dns"].is_null())
                dns = j["dns"];
            if (j.contains("mac_mode"))
                mac_mode = j["mac_mode"];
            if (j.contains("blocked_macs"))
                blocked_macs = j["blocked_macs"].get<std::vector<std::string>>();
            if (j.contains("allowed_macs"))
                allowed_macs = j["allowed_macs"].get<std::vector<std::string>>();
            if (j.contains("route_vpn"))
                route_vpn = j["route_vpn"];
        }

        nlohmann::json HotspotSettings::to_json() const
        {
            return nlohmann::json{
                {"ssid", ssid},
                {"password", password},
                {"interface", interface},
                {"band", band},
                {"auto_off", auto_off},
                {"idle_off", idle_off},
                {"hidden", hidden},
                {"dns", dns},
                {"mac_mode", mac_mode},
                {"blocked_macs", blocked_macs},
                {"allowed_macs", allowed_macs},
                {"route_vpn", route_vpn}};
        }

        // PathsConfig implementation
        void PathsConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("pid_file"))
                pid_file = j["pid_file"];
            if (j.contains("status_file"))
                status_file = j["status_file"];
            if (j.contains("ip_forward_file"))
                ip_forward_file = j["ip_forward_file"];
            if (j.contains("sys_class_net"))
                sys_class_net = j["sys_class_net"];
        }

        nlohmann::json PathsConfig::to_json() const
        {
            return nlohmann::json{
                {"pid_file", pid_file},
                {"status_file", status_file},
                {"ip_forward_file", ip_forward_file},
                {"sys_class_net", sys_class_net}};
        }

        // ProbeConfig implementation
        void ProbeConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("command_timeout_ms"))
                command_timeout_ms = j["command_timeout_ms"];
            if (j.contains("upstream_probe_address"))
                upstream_probe_address = j["upstream_probe_address"];
        }

        nlohmann::json ProbeConfig::to_json() const
        {
            return nlohmann::json{
                {"command_timeout_ms", command_timeout_ms},
                {"upstream_probe_address", upstream_probe_address}};
        }

        // ControllerConfig implementation
        void ControllerConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("tick_interval_ms"))
                tick_interval_ms = j["tick_interval_ms"];
            if (j.contains("idle_sample_interval"))
                idle_sample_interval = j["idle_sample_interval"];
            if (j.contains("activation_timeout_ms"))
                activation_timeout_ms = j["activation_timeout_ms"];
            if (j.contains("connection_name"))
                connection_name = j["connection_name"];
            if (j.contains("ap_address"))
                ap_address = j["ap_address"];
        }

        nlohmann::json ControllerConfig::to_json() const
        {
            return nlohmann::json{
                {"tick_interval_ms", tick_interval_ms},
                {"idle_sample_interval", idle_sample_interval},
                {"activation_timeout_ms", activation_timeout_ms},
                {"connection_name", connection_name},
                {"ap_address", ap_address}};
        }

        // LoggingConfig implementation
        void LoggingConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("log_level"))
                log_level = j["log_level"];
            if (j.contains("log_file") && !j["log_file"].is_null())
                log_file = j["log_file"];
        }

        nlohmann::json LoggingConfig::to_json() const
        {
            nlohmann::json j{{"log_level", log_level}};
            if (!log_file.empty())
            {
                j["log_file"] = log_file;
            }
            return j;
        }

        // ApiConfig implementation
        void ApiConfig::from_json(const nlohmann::json &j)
        {
            if (j.contains("enabled"))
                enabled = j["enabled"];
            if (j.contains("host"))
                host = j["host"];
            if (j.contains("port"))
                port = j["port"];
        }

        nlohmann::json ApiConfig::to_json() const
        {
            return nlohmann::json{
                {"enabled", enabled},
                {"host", host},
                {"port", port}};
        }

        // HotspotConfig implementation
        std::unique_ptr<HotspotConfig> HotspotConfig::from_file(const std::string &config_path)
        {
            std::ifstream file(config_path);
            if (!file.is_open())
            {
                get_logger("config")->info("Configuration file not found, using defaults",
                                           LogContext().add("path", config_path));
                return std::make_unique<HotspotConfig>();
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw HotspotError(ErrorKind::InvalidConfig,
                                   "Invalid JSON in configuration file: " + std::string(e.what()));
            }

            return from_json(j);
        }

        std::unique_ptr<HotspotConfig> HotspotConfig::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw HotspotError(ErrorKind::InvalidConfig, "Configuration root must be a JSON object");
            }

            auto config = std::make_unique<HotspotConfig>();

            try
            {
                config->hotspot.from_json(j);

                if (j.contains("paths"))
                {
                    config->paths.from_json(j["paths"]);
                }
                if (j.contains("probe"))
                {
                    config->probe.from_json(j["probe"]);
                }
                if (j.contains("controller"))
                {
                    config->controller.from_json(j["controller"]);
                }
                if (j.contains("logging"))
                {
                    config->logging.from_json(j["logging"]);
                }
                if (j.contains("api"))
                {
                    config->api.from_json(j["api"]);
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                throw HotspotError(ErrorKind::InvalidConfig,
                                   "Invalid value in configuration: " + std::string(e.what()));
            }

            return config;
        }

        nlohmann::json HotspotConfig::to_json() const
        {
            nlohmann::json j = hotspot.to_json();
            j["paths"] = paths.to_json();
            j["probe"] = probe.to_json();
            j["controller"] = controller.to_json();
            j["logging"] = logging.to_json();
            j["api"] = api.to_json();
            return j;
        }

        void HotspotConfig::save_to_file(const std::string &config_path) const
        {
            std::ofstream file(config_path);
            if (!file.is_open())
            {
                throw HotspotError(ErrorKind::InvalidConfig, "Cannot open configuration file for writing: " + config_path);
            }

            file << to_json().dump(4, ' ', false, nlohmann::json::error_handler_t::replace);
        }

        bool HotspotConfig::validate() const
        {
            auto logger = get_logger("config");

            if (!parse_band(hotspot.band))
            {
                logger->error("Configuration validation error: band must be 'bg' or 'a'",
                              LogContext().add("band", hotspot.band));
                return false;
            }

            if (hotspot.mac_mode != "block" && hotspot.mac_mode != "allow")
            {
                logger->error("Configuration validation error: mac_mode must be 'block' or 'allow'",
                              LogContext().add("mac_mode", hotspot.mac_mode));
                return false;
            }

            if (hotspot.auto_off < 0 || hotspot.auto_off > kMaxTimerMinutes)
            {
                logger->error("Configuration validation error: auto_off must be between 0 and 120");
                return false;
            }

            if (probe.command_timeout_ms <= 0)
            {
                logger->error("Configuration validation error: probe.command_timeout_ms must be positive");
                return false;
            }

            if (controller.tick_interval_ms <= 0 || controller.idle_sample_interval <= 0)
            {
                logger->error("Configuration validation error: controller intervals must be positive");
                return false;
            }

            if (controller.connection_name.empty())
            {
                logger->error("Configuration validation error: controller.connection_name cannot be empty");
                return false;
            }

            if (api.port < 1 || api.port > 65535)
            {
                logger->error("Configuration validation error: api.port must be between 1 and 65535");
                return false;
            }

            return true;
        }

        HotspotSession HotspotConfig::to_session() const
        {
            HotspotSession session;
            session.ssid = hotspot.ssid;
            session.password = hotspot.password;
            session.hotspot_interface = hotspot.interface;
            session.hidden = hotspot.hidden;
            session.vpn_routing = hotspot.route_vpn;
            session.idle_off_minutes = hotspot.idle_off;
            session.ap_address = controller.ap_address;

            auto band = parse_band(hotspot.band);
            if (!band)
            {
                throw HotspotError(ErrorKind::InvalidConfig, "Unknown band: " + hotspot.band);
            }
            session.band = *band;

            // auto_off of 0 in the settings file means no timer
            if (hotspot.auto_off > 0)
            {
                session.timer_minutes = hotspot.auto_off;
            }

            if (!hotspot.dns.empty())
            {
                session.dns_override = hotspot.dns;
            }

            if (hotspot.mac_mode == "allow")
            {
                session.mac_filter.mode = MacFilterMode::Allow;
                for (const auto &mac : hotspot.allowed_macs)
                {
                    session.mac_filter.addresses.insert(normalize_mac(mac));
                }
            }
            else if (hotspot.mac_mode == "block")
            {
                session.mac_filter.mode = MacFilterMode::Block;
                for (const auto &mac : hotspot.blocked_macs)
                {
                    session.mac_filter.addresses.insert(normalize_mac(mac));
                }
            }
            else
            {
                throw HotspotError(ErrorKind::InvalidConfig, "Unknown mac_mode: " + hotspot.mac_mode);
            }

            return session;
        }

    } // namespace core
} // namespace hotspot
