#ifndef HOTSPOT_INFRASTRUCTURE_ACCESS_POINT_HPP
#define HOTSPOT_INFRASTRUCTURE_ACCESS_POINT_HPP

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/session.hpp"

namespace hotspot
{
    namespace core
    {
        class HotspotConfig;
        class Logger;
    }
    namespace infrastructure
    {
        class CommandRunner;
    }
}

namespace hotspot
{
    namespace infrastructure
    {

        /**
         * WiFi Access Point Manager
         * Creates the AP as a NetworkManager connection profile in shared mode,
         * so NetworkManager runs the DHCP/DNS service for the hotspot subnet.
         */
        class AccessPointManager
        {
        public:
            AccessPointManager(std::shared_ptr<CommandRunner> runner,
                               const std::shared_ptr<core::HotspotConfig> &config);

            // Access point lifecycle
            bool bring_up(const core::HotspotSession &session);
            bool tear_down();
            bool is_up() const { return up_; }

            // Deletes a profile left behind by a previous process
            bool remove_stale_profile();

            bool verify_connection_active();

            // Associated stations, or nullopt when the station list cannot be read
            std::optional<int> count_connected_clients(const std::string &interface);

            const std::string &connection_name() const { return connection_name_; }

        private:
            bool create_profile(const core::HotspotSession &session);
            bool activate_profile(const std::string &interface);

            bool run_nmcli(const std::vector<std::string> &args, std::string *output = nullptr,
                           std::optional<std::chrono::milliseconds> timeout = std::nullopt);

            std::shared_ptr<CommandRunner> runner_;
            std::shared_ptr<core::HotspotConfig> config_;
            std::shared_ptr<core::Logger> logger_;

            std::string connection_name_;
            std::string interface_;
            bool up_ = false;
        };

    } // namespace infrastructure
} // namespace hotspot

#endif // HOTSPOT_INFRASTRUCTURE_ACCESS_POINT_HPP
