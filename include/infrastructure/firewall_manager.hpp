#ifndef HOTSPOT_INFRASTRUCTURE_FIREWALL_MANAGER_HPP
#define HOTSPOT_INFRASTRUCTURE_FIREWALL_MANAGER_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "services/routing_plan.hpp"

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
        struct CommandResult;
    }
}

namespace hotspot
{
    namespace infrastructure
    {

        /**
         * Applies routing plans to iptables and manages IPv4 forwarding.
         * Rules live in dedicated chains so that re-applying a plan replaces
         * it instead of stacking duplicates.
         */
        class FirewallManager
        {
        public:
            FirewallManager(std::shared_ptr<CommandRunner> runner,
                            const std::shared_ptr<core::HotspotConfig> &config);

            // Replaces any previously applied plan. Returns false on the first failing command.
            bool apply(const services::RoutingPlan &plan);

            // Deletes the active plan's rules in reverse order, then the chains
            bool remove();

            // Removes the chains and jumps regardless of what this process applied (used by --stop)
            bool remove_all_chains();

            bool enable_ip_forwarding();
            bool restore_ip_forwarding();

            std::optional<services::RoutingPlan> active_plan() const;

        private:
            struct ChainLink
            {
                const char *table;
                const char *chain;
                const char *parent;
            };

            bool apply_rules(const services::RoutingPlan &plan);
            // Deletes every FORWARD rule tagged as a reload guard, including ones left by a crashed run
            bool remove_reload_guards();

            bool ensure_chain(const ChainLink &link);
            bool ensure_jump(const ChainLink &link);
            bool unlink_and_delete(const ChainLink &link);

            CommandResult iptables(const std::vector<std::string> &args);

            static const std::vector<ChainLink> &chain_links();

            std::shared_ptr<CommandRunner> runner_;
            std::shared_ptr<core::HotspotConfig> config_;
            std::shared_ptr<core::Logger> logger_;

            mutable std::mutex mutex_;
            std::optional<services::RoutingPlan> active_plan_;
            std::optional<std::string> previous_forwarding_;
        };

    } // namespace infrastructure
} // namespace hotspot

#endif // HOTSPOT_INFRASTRUCTURE_FIREWALL_MANAGER_HPP
