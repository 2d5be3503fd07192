#ifndef HOTSPOT_INFRASTRUCTURE_CAPABILITY_PROBER_HPP
#define HOTSPOT_INFRASTRUCTURE_CAPABILITY_PROBER_HPP

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

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
         * Current operating mode of a wireless interface (`iw dev <if> info` type)
         */
        enum class InterfaceMode
        {
            Managed,
            Monitor,
            AP,
            Unknown
        };

        /**
         * Interface types as named in nl80211 mode and combination listings
         */
        enum class InterfaceRole
        {
            Managed,
            AP,
            APVlan,
            IBSS,
            Monitor,
            MeshPoint,
            P2PClient,
            P2PGO,
            P2PDevice,
            Other
        };

        struct CombinationLimit
        {
            std::set<InterfaceRole> roles;
            int max = 0;
        };

        /**
         * One entry of the radio's "valid interface combinations" matrix
         */
        struct ConcurrencyGroup
        {
            std::set<InterfaceRole> interfaces;
            bool same_channel_required = true;
            std::vector<CombinationLimit> limits;
            int max_total = 0;
            int max_channels = 1;

            // A station and an access point can be held at the same time
            bool allows_sta_ap() const;
        };

        struct RfkillState
        {
            bool soft_blocked = false;
            bool hard_blocked = false;

            bool blocked() const { return soft_blocked || hard_blocked; }
        };

        struct DevInfo
        {
            int wiphy = -1;
            InterfaceMode mode = InterfaceMode::Unknown;
        };

        struct PhyInfo
        {
            std::set<InterfaceRole> supported_modes;
            bool supports_24ghz = false;
            bool supports_5ghz = false;
            std::vector<ConcurrencyGroup> combinations;
        };

        /**
         * Capabilities of one wireless interface, derived fresh for each decision
         */
        struct CapabilitySet
        {
            std::string interface;
            std::string phy;
            bool reachable = true;
            bool supports_ap = false;
            bool supports_24ghz = false;
            bool supports_5ghz = false;
            InterfaceMode current_mode = InterfaceMode::Unknown;
            RfkillState rfkill;
            std::set<InterfaceRole> supported_modes;
            std::vector<ConcurrencyGroup> concurrency_groups;

            bool supports_sta_ap_concurrency() const;
            bool sta_ap_same_channel_only() const;

            // Stand-in for a device that vanished or could not be queried
            static CapabilitySet unreachable(const std::string &interface);
        };

        // Pure parsers over iw/rfkill output
        InterfaceRole parse_role(const std::string &name);
        InterfaceMode parse_mode(const std::string &name);
        std::vector<ConcurrencyGroup> parse_combinations(const std::string &raw);
        PhyInfo parse_phy_info(const std::string &raw);
        DevInfo parse_dev_info(const std::string &raw);
        RfkillState parse_rfkill(const std::string &raw, const std::string &phy);

        const char *to_string(InterfaceMode mode);
        const char *to_string(InterfaceRole role);

        // Short tags for interface labels, e.g. {"AP", "5GHz"}
        std::vector<std::string> capability_tags(const CapabilitySet &capabilities);

        // "STA+AP (same channel)", "STA+AP (multi-channel)" or "no STA+AP"
        std::string concurrency_label(const CapabilitySet &capabilities);

        /**
         * Queries iw and rfkill for wireless interface capabilities. Read-only.
         */
        class CapabilityProber
        {
        public:
            CapabilityProber(std::shared_ptr<CommandRunner> runner,
                             const std::shared_ptr<core::HotspotConfig> &config);

            /**
             * Throws HotspotError(DeviceUnreachable) when the device cannot be queried.
             */
            CapabilitySet probe(const std::string &interface);

            CapabilitySet probe_or_assume_incapable(const std::string &interface);

            // Independent interfaces are probed concurrently
            std::map<std::string, CapabilitySet> probe_all(const std::vector<std::string> &interfaces);

        private:
            std::shared_ptr<CommandRunner> runner_;
            std::shared_ptr<core::HotspotConfig> config_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace hotspot

#endif // HOTSPOT_INFRASTRUCTURE_CAPABILITY_PROBER_HPP
