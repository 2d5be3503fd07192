#ifndef HOTSPOT_CORE_CONFIG_HPP
#define HOTSPOT_CORE_CONFIG_HPP

#include <string>
#include <vector>
#include <memory>
#include <nlohmann/json.hpp>

#include "core/session.hpp"

namespace hotspot
{
    namespace core
    {

        /**
         * Hotspot settings, stored at the top level of the settings file
         */
        struct HotspotSettings
        {
            std::string ssid = "MintHotspot";
            std::string password = "password123";
            std::string interface; // Empty means auto-select
            std::string band = "bg";
            int auto_off = 0; // Minutes, 0 disables the timer
            int idle_off = 0;
            bool hidden = false;
            std::string dns;
            std::string mac_mode = "block";
            std::vector<std::string> blocked_macs;
            std::vector<std::string> allowed_macs;
            bool route_vpn = true;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Filesystem locations used by the backend
         */
        struct PathsConfig
        {
            std::string pid_file = "/tmp/hotspot_backend.pid";
            std::string status_file = "/tmp/hotspot_status.json";
            std::string ip_forward_file = "/proc/sys/net/ipv4/ip_forward";
            std::string sys_class_net = "/sys/class/net";

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * External probe configuration
         */
        struct ProbeConfig
        {
            int command_timeout_ms = 5000;
            std::string upstream_probe_address = "1.1.1.1";

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Lifecycle controller timing and NetworkManager profile
         */
        struct ControllerConfig
        {
            int tick_interval_ms = 1000;
            int idle_sample_interval = 5; // Seconds
            int activation_timeout_ms = 30000;
            std::string connection_name = "hotspotd-ap";
            std::string ap_address = "10.42.0.1/24";

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        struct LoggingConfig
        {
            std::string log_level = "WARNING";
            std::string log_file; // Empty means console output

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Loopback status API
         */
        struct ApiConfig
        {
            bool enabled = false;
            std::string host = "127.0.0.1";
            int port = 8765;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Complete backend configuration
         */
        class HotspotConfig
        {
        public:
            HotspotSettings hotspot;
            PathsConfig paths;
            ProbeConfig probe;
            ControllerConfig controller;
            LoggingConfig logging;
            ApiConfig api;

        public:
            HotspotConfig() = default;

            // Factory methods. A missing file yields defaults; malformed JSON throws InvalidConfig.
            static std::unique_ptr<HotspotConfig> from_file(const std::string &config_path);
            static std::unique_ptr<HotspotConfig> from_json(const nlohmann::json &j);

            nlohmann::json to_json() const;
            void save_to_file(const std::string &config_path) const;

            bool validate() const;

            /**
             * Builds the session requested by this configuration.
             * Throws HotspotError(InvalidConfig) for unknown band or filter mode.
             */
            HotspotSession to_session() const;
        };

    } // namespace core
} // namespace hotspot

#endif // HOTSPOT_CORE_CONFIG_HPP
