#ifndef HOTSPOT_CORE_SESSION_HPP
#define HOTSPOT_CORE_SESSION_HPP

#include <chrono>
#include <optional>
#include <set>
#include <string>

namespace hotspot
{
    namespace core
    {

        enum class Band
        {
            TwoPointFourGHz,
            FiveGHz
        };

        enum class MacFilterMode
        {
            Block,
            Allow
        };

        struct MacFilter
        {
            MacFilterMode mode = MacFilterMode::Block;
            std::set<std::string> addresses;
        };

        /**
         * Lifecycle states of the single hotspot session
         */
        enum class HotspotState
        {
            Idle,
            Validating,
            Starting,
            Running,
            Stopping,
            Failed
        };

        using TimePoint = std::chrono::system_clock::time_point;

        /**
         * One hotspot session, owned by the lifecycle controller
         */
        struct HotspotSession
        {
            std::string ssid;
            std::string password;
            std::string hotspot_interface; // empty: pick one automatically
            std::optional<std::string> internet_interface;
            Band band = Band::TwoPointFourGHz;
            bool hidden = false;
            std::optional<std::string> dns_override;
            MacFilter mac_filter;

            std::optional<int> timer_minutes;
            int idle_off_minutes = 0;
            std::optional<TimePoint> auto_off_deadline;
            std::optional<TimePoint> started_at;

            bool vpn_routing = true;
            bool exclude_vpn = false;
            bool force_single_interface = false;

            std::string ap_address = "10.42.0.1/24";
        };

        // Length and range limits of the command surface
        constexpr std::size_t kMinPasswordLength = 8;
        constexpr std::size_t kMaxPasswordLength = 63;
        constexpr std::size_t kMaxSsidLength = 32;
        constexpr int kMinTimerMinutes = 1;
        constexpr int kMaxTimerMinutes = 120;
        constexpr int kMaxIdleOffMinutes = 720;

        /**
         * Rejects a session whose fields cannot produce a valid AP.
         * Throws HotspotError(InvalidConfig); never touches the system.
         */
        void validate_session(const HotspotSession &session);

        bool is_valid_mac(const std::string &mac);
        std::string normalize_mac(const std::string &mac);
        bool is_valid_ipv4(const std::string &address);

        std::optional<Band> parse_band(const std::string &value);
        const char *band_to_nmcli(Band band);
        const char *to_string(Band band);

        const char *to_string(MacFilterMode mode);
        const char *to_string(HotspotState state);

        /**
         * "10.42.0.1/24" -> "10.42.0.0/24". Throws HotspotError(InvalidConfig) on malformed input.
         */
        std::string subnet_of(const std::string &cidr_address);

    } // namespace core
} // namespace hotspot

#endif // HOTSPOT_CORE_SESSION_HPP
