#include "services/routing_plan.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <sstream>

namespace hotspot
{
    namespace services
    {

        using infrastructure::InterfaceKind;
        using infrastructure::NetworkInterface;

        // FirewallRule implementation
        std::vector<std::string> FirewallRule::to_args() const
        {
            std::vector<std::string> args;
            if (!source.empty())
            {
                args.insert(args.end(), {"-s", source});
            }
            if (!in_interface.empty())
            {
                args.insert(args.end(), {"-i", in_interface});
            }
            if (!out_interface.empty())
            {
                args.insert(args.end(), {"-o", out_interface});
            }
            args.insert(args.end(), match_args.begin(), match_args.end());
            if (!comment.empty())
            {
                args.insert(args.end(), {"-m", "comment", "--comment", comment});
            }
            args.insert(args.end(), {"-j", target});
            args.insert(args.end(), target_args.begin(), target_args.end());
            return args;
        }

        std::string FirewallRule::describe() const
        {
            std::ostringstream ss;
            ss << "-t " << table << " -A " << chain;
            for (const auto &arg : to_args())
            {
                ss << " " << arg;
            }
            return ss.str();
        }

        bool FirewallRule::operator==(const FirewallRule &other) const
        {
            return table == other.table && chain == other.chain && to_args() == other.to_args();
        }

        // RoutingPlan implementation
        const FirewallRule *RoutingPlan::nat_rule() const
        {
            for (const auto &rule : rules)
            {
                if (rule.table == "nat")
                {
                    return &rule;
                }
            }
            return nullptr;
        }

        bool RoutingPlan::references_interface(const std::string &name) const
        {
            return std::any_of(rules.begin(), rules.end(), [&name](const FirewallRule &rule) {
                return rule.in_interface == name || rule.out_interface == name;
            });
        }

        bool is_wildcard_interface(const std::string &name)
        {
            return name.empty() || name == "any" || name.find('+') != std::string::npos ||
                   name.find('*') != std::string::npos;
        }

        // RoutingPlanGenerator implementation
        RoutingPlanGenerator::RoutingPlanGenerator()
            : logger_(core::get_logger("routing_plan"))
        {
        }

        RoutingPlan RoutingPlanGenerator::build_plan(const core::HotspotSession &session,
                                                     const std::vector<NetworkInterface> &inventory) const
        {
            RoutingPlan plan;
            plan.hotspot_interface = session.hotspot_interface;
            plan.subnet = core::subnet_of(session.ap_address);

            if (session.vpn_routing)
            {
                plan.egress_interface = resolve_vpn_egress(session, inventory);
                plan.vpn_pinned = true;
            }
            else
            {
                if (!session.internet_interface)
                {
                    throw core::HotspotError(core::ErrorKind::NoInternetSource, "No internet source interface available");
                }
                plan.egress_interface = *session.internet_interface;
            }

            if (is_wildcard_interface(plan.egress_interface))
            {
                throw core::HotspotError(core::ErrorKind::NoInternetSource,
                                         "Egress interface must be a literal device name: '" + plan.egress_interface + "'");
            }
            if (is_wildcard_interface(plan.hotspot_interface))
            {
                throw core::HotspotError(core::ErrorKind::InvalidConfig, "Hotspot interface is not set");
            }
            if (plan.egress_interface == plan.hotspot_interface)
            {
                throw core::HotspotError(core::ErrorKind::NoInternetSource,
                                         "Internet source " + plan.egress_interface + " is the hotspot interface itself");
            }

            const std::string &ap = plan.hotspot_interface;
            const std::string &egress = plan.egress_interface;

            FirewallRule masquerade;
            masquerade.table = "nat";
            masquerade.chain = kNatChain;
            masquerade.source = plan.subnet;
            masquerade.out_interface = egress;
            masquerade.target = "MASQUERADE";
            masquerade.comment = kRuleComment;
            plan.rules.push_back(masquerade);

            FirewallRule mss_clamp;
            mss_clamp.in_interface = ap;
            mss_clamp.out_interface = egress;
            mss_clamp.match_args = {"-p", "tcp", "--tcp-flags", "SYN,RST", "SYN"};
            mss_clamp.target = "TCPMSS";
            mss_clamp.target_args = {"--clamp-mss-to-pmtu"};
            mss_clamp.comment = kRuleComment;
            plan.rules.push_back(mss_clamp);

            FirewallRule return_path;
            return_path.in_interface = egress;
            return_path.out_interface = ap;
            return_path.match_args = {"-m", "state", "--state", "RELATED,ESTABLISHED"};
            return_path.target = "ACCEPT";
            return_path.comment = kRuleComment;
            plan.rules.push_back(return_path);

            const auto &filter = session.mac_filter;
            for (const auto &mac : filter.addresses)
            {
                FirewallRule mac_rule;
                mac_rule.in_interface = ap;
                mac_rule.match_args = {"-m", "mac", "--mac-source", mac};
                mac_rule.comment = kRuleComment;
                if (filter.mode == core::MacFilterMode::Block)
                {
                    mac_rule.target = "DROP";
                }
                else
                {
                    mac_rule.out_interface = egress;
                    mac_rule.target = "ACCEPT";
                }
                plan.rules.push_back(mac_rule);
            }

            // An allow list admits only its own entries, even when it is empty
            if (filter.mode == core::MacFilterMode::Block)
            {
                FirewallRule forward;
                forward.source = plan.subnet;
                forward.in_interface = ap;
                forward.out_interface = egress;
                forward.target = "ACCEPT";
                forward.comment = kRuleComment;
                plan.rules.push_back(forward);
            }

            // Anything from the AP not accepted above, including traffic towards other egress devices
            FirewallRule default_deny;
            default_deny.in_interface = ap;
            default_deny.target = "DROP";
            default_deny.comment = kRuleComment;
            plan.rules.push_back(default_deny);

            logger_->info("Routing plan built",
                          core::LogContext()
                              .add("hotspot", ap)
                              .add("egress", egress)
                              .add("subnet", plan.subnet)
                              .add("vpn", plan.vpn_pinned)
                              .add("rules", plan.rules.size()));
            return plan;
        }

        std::string RoutingPlanGenerator::resolve_vpn_egress(const core::HotspotSession &session,
                                                             const std::vector<NetworkInterface> &inventory) const
        {
            std::vector<const NetworkInterface *> tunnels;
            for (const auto &iface : inventory)
            {
                if (iface.kind == InterfaceKind::VpnTunnel)
                {
                    tunnels.push_back(&iface);
                }
            }

            if (tunnels.empty())
            {
                throw core::HotspotError(core::ErrorKind::NoInternetSource,
                                         "VPN routing requested but no VPN interface is present");
            }

            const NetworkInterface *chosen = nullptr;
            if (session.internet_interface)
            {
                for (const auto *tunnel : tunnels)
                {
                    if (tunnel->name == *session.internet_interface)
                    {
                        chosen = tunnel;
                    }
                }
            }
            if (!chosen)
            {
                for (const auto *tunnel : tunnels)
                {
                    if (tunnel->carries_internet)
                    {
                        chosen = tunnel;
                        break;
                    }
                }
            }
            if (!chosen)
            {
                chosen = tunnels.front();
            }

            if (session.internet_interface && *session.internet_interface != chosen->name)
            {
                logger_->info("Re-pinning egress to detected VPN interface",
                              core::LogContext().add("previous", *session.internet_interface).add("vpn", chosen->name));
            }
            return chosen->name;
        }

    } // namespace services
} // namespace hotspot
