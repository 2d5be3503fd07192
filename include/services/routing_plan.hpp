#ifndef HOTSPOT_SERVICES_ROUTING_PLAN_HPP
#define HOTSPOT_SERVICES_ROUTING_PLAN_HPP

#include <memory>
#include <string>
#include <vector>

#include "core/session.hpp"
#include "infrastructure/interface_inventory.hpp"

namespace hotspot
{
    namespace core
    {
        class Logger;
    }
}

namespace hotspot
{
    namespace services
    {

        // Dedicated chains, jumped to from FORWARD and POSTROUTING
        constexpr const char *kForwardChain = "HOTSPOT_FWD";
        constexpr const char *kNatChain = "HOTSPOT_NAT";
        constexpr const char *kRuleComment = "hotspotd";

        /**
         * One iptables rule, expressed as the arguments after `-t <table> -A <chain>`
         */
        struct FirewallRule
        {
            std::string table = "filter";
            std::string chain = kForwardChain;
            std::string source;
            std::string in_interface;
            std::string out_interface;
            std::vector<std::string> match_args;
            std::string target;
            std::vector<std::string> target_args;
            std::string comment;

            std::vector<std::string> to_args() const;
            std::string describe() const;

            bool operator==(const FirewallRule &other) const;
            bool operator!=(const FirewallRule &other) const { return !(*this == other); }
        };

        /**
         * Ordered rule set for one session. Every NAT rule names exactly one
         * literal egress device; that pinning is what makes a dropped VPN
         * stop forwarded traffic instead of leaking it through another route.
         */
        struct RoutingPlan
        {
            std::string hotspot_interface;
            std::string egress_interface;
            std::string subnet;
            bool vpn_pinned = false;
            std::vector<FirewallRule> rules;

            const FirewallRule *nat_rule() const;
            bool references_interface(const std::string &name) const;
        };

        // True for names iptables would treat as a wildcard or no interface at all
        bool is_wildcard_interface(const std::string &name);

        class RoutingPlanGenerator
        {
        public:
            RoutingPlanGenerator();

            /**
             * Throws HotspotError(NoInternetSource) when no egress can be resolved.
             * With VPN routing the egress is always a tunnel device; a missing VPN
             * never falls back to a physical interface.
             */
            RoutingPlan build_plan(const core::HotspotSession &session,
                                   const std::vector<infrastructure::NetworkInterface> &inventory) const;

        private:
            std::string resolve_vpn_egress(const core::HotspotSession &session,
                                           const std::vector<infrastructure::NetworkInterface> &inventory) const;

            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace hotspot

#endif // HOTSPOT_SERVICES_ROUTING_PLAN_HPP
