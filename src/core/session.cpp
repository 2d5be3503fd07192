#include "core/session.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <regex>

namespace hotspot
{
    namespace core
    {

        void validate_session(const HotspotSession &session)
        {
            if (session.ssid.empty() || session.ssid.size() > kMaxSsidLength)
            {
                throw HotspotError(ErrorKind::InvalidConfig, "SSID must be between 1 and 32 characters");
            }

            if (session.password.size() < kMinPasswordLength)
            {
                throw HotspotError(ErrorKind::InvalidConfig, "Password must be at least 8 characters for WPA2 security");
            }
            if (session.password.size() > kMaxPasswordLength)
            {
                throw HotspotError(ErrorKind::InvalidConfig, "Password must not exceed 63 characters");
            }

            if (session.timer_minutes &&
                (*session.timer_minutes < kMinTimerMinutes || *session.timer_minutes > kMaxTimerMinutes))
            {
                throw HotspotError(ErrorKind::InvalidConfig, "Timer must be between 1 and 120 minutes");
            }

            if (session.idle_off_minutes < 0 || session.idle_off_minutes > kMaxIdleOffMinutes)
            {
                throw HotspotError(ErrorKind::InvalidConfig, "Idle auto-off must be between 0 and 720 minutes");
            }

            if (session.dns_override && !is_valid_ipv4(*session.dns_override))
            {
                throw HotspotError(ErrorKind::InvalidConfig, "DNS override must be an IPv4 address: " + *session.dns_override);
            }

            for (const auto &mac : session.mac_filter.addresses)
            {
                if (!is_valid_mac(mac))
                {
                    throw HotspotError(ErrorKind::InvalidConfig, "Invalid MAC address: " + mac);
                }
            }

            if (session.internet_interface && session.internet_interface->empty())
            {
                throw HotspotError(ErrorKind::InvalidConfig, "Internet interface name cannot be empty");
            }

            subnet_of(session.ap_address);
        }

        bool is_valid_mac(const std::string &mac)
        {
            static const std::regex mac_regex(R"(^([0-9A-Fa-f]{2}:){5}[0-9A-Fa-f]{2}$)");
            return std::regex_match(mac, mac_regex);
        }

        std::string normalize_mac(const std::string &mac)
        {
            std::string normalized = mac;
            std::replace(normalized.begin(), normalized.end(), '-', ':');
            std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return normalized;
        }

        bool is_valid_ipv4(const std::string &address)
        {
            in_addr parsed{};
            return inet_pton(AF_INET, address.c_str(), &parsed) == 1;
        }

        std::optional<Band> parse_band(const std::string &value)
        {
            if (value == "g" || value == "bg" || value == "2.4")
            {
                return Band::TwoPointFourGHz;
            }
            if (value == "a" || value == "5")
            {
                return Band::FiveGHz;
            }
            return std::nullopt;
        }

        const char *band_to_nmcli(Band band)
        {
            return band == Band::FiveGHz ? "a" : "bg";
        }

        const char *to_string(Band band)
        {
            return band == Band::FiveGHz ? "5GHz" : "2.4GHz";
        }

        const char *to_string(MacFilterMode mode)
        {
            return mode == MacFilterMode::Allow ? "allow" : "block";
        }

        const char *to_string(HotspotState state)
        {
            switch (state)
            {
            case HotspotState::Idle:
                return "Idle";
            case HotspotState::Validating:
                return "Validating";
            case HotspotState::Starting:
                return "Starting";
            case HotspotState::Running:
                return "Running";
            case HotspotState::Stopping:
                return "Stopping";
            case HotspotState::Failed:
                return "Failed";
            }
            return "Unknown";
        }

        std::string subnet_of(const std::string &cidr_address)
        {
            auto slash = cidr_address.find('/');
            if (slash == std::string::npos)
            {
                throw HotspotError(ErrorKind::InvalidConfig, "AP address must be in CIDR form: " + cidr_address);
            }

            std::string address = cidr_address.substr(0, slash);
            int prefix = 0;
            try
            {
                prefix = std::stoi(cidr_address.substr(slash + 1));
            }
            catch (const std::exception &)
            {
                throw HotspotError(ErrorKind::InvalidConfig, "Invalid prefix length in AP address: " + cidr_address);
            }

            in_addr parsed{};
            if (inet_pton(AF_INET, address.c_str(), &parsed) != 1 || prefix < 8 || prefix > 30)
            {
                throw HotspotError(ErrorKind::InvalidConfig, "Invalid AP address: " + cidr_address);
            }

            uint32_t host = ntohl(parsed.s_addr);
            uint32_t mask = prefix == 0 ? 0 : (0xFFFFFFFFu << (32 - prefix));
            in_addr network{};
            network.s_addr = htonl(host & mask);

            char buffer[INET_ADDRSTRLEN] = {};
            inet_ntop(AF_INET, &network, buffer, sizeof(buffer));
            return std::string(buffer) + "/" + std::to_string(prefix);
        }

    } // namespace core
} // namespace hotspot
