#include "infrastructure/firewall_manager.hpp"
#include "infrastructure/command_runner.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"

#include <fstream>
#include <sstream>

namespace hotspot
{
    namespace infrastructure
    {

        namespace
        {
            constexpr int kMaxJumpRemovals = 16;
            constexpr const char *kReloadComment = "hotspotd-reload";

            // Holds AP traffic in FORWARD while HOTSPOT_FWD is being refilled
            services::FirewallRule reload_guard(const std::string &hotspot_interface)
            {
                services::FirewallRule guard;
                guard.chain = "FORWARD";
                guard.in_interface = hotspot_interface;
                guard.target = "DROP";
                guard.comment = kReloadComment;
                return guard;
            }
        }

        FirewallManager::FirewallManager(std::shared_ptr<CommandRunner> runner,
                                         const std::shared_ptr<core::HotspotConfig> &config)
            : runner_(std::move(runner)), config_(config), logger_(core::get_logger("firewall"))
        {
        }

        const std::vector<FirewallManager::ChainLink> &FirewallManager::chain_links()
        {
            static const std::vector<ChainLink> links = {
                {"nat", services::kNatChain, "POSTROUTING"},
                {"filter", services::kForwardChain, "FORWARD"}};
            return links;
        }

        bool FirewallManager::apply(const services::RoutingPlan &plan)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            logger_->info("Applying firewall rules",
                          core::LogContext()
                              .add("hotspot", plan.hotspot_interface)
                              .add("egress", plan.egress_interface)
                              .add("rules", plan.rules.size()));

            if (!active_plan_)
            {
                return apply_rules(plan);
            }

            // Replacing a live plan: the flushed chain must not let AP traffic through
            auto guard = reload_guard(plan.hotspot_interface);
            std::vector<std::string> insert = {"-t", guard.table, "-I", guard.chain, "1"};
            auto guard_args = guard.to_args();
            insert.insert(insert.end(), guard_args.begin(), guard_args.end());
            if (!iptables(insert).ok())
            {
                logger_->error("Failed to hold hotspot traffic for reload", core::LogContext().add("rule", guard.describe()));
                return false;
            }

            bool applied = apply_rules(plan);

            if (!remove_reload_guards())
            {
                logger_->error("Failed to release hotspot traffic after reload",
                               core::LogContext().add("rule", guard.describe()));
                return false;
            }
            return applied;
        }

        bool FirewallManager::apply_rules(const services::RoutingPlan &plan)
        {
            for (const auto &link : chain_links())
            {
                if (!ensure_chain(link))
                {
                    return false;
                }
                if (!iptables({"-t", link.table, "-F", link.chain}).ok())
                {
                    logger_->error("Failed to flush chain", core::LogContext().add("chain", link.chain));
                    return false;
                }
            }

            // Mark the plan active before appending so a partial apply can still be removed
            active_plan_ = plan;

            for (const auto &rule : plan.rules)
            {
                std::vector<std::string> args = {"-t", rule.table, "-A", rule.chain};
                auto rule_args = rule.to_args();
                args.insert(args.end(), rule_args.begin(), rule_args.end());

                if (!iptables(args).ok())
                {
                    logger_->error("Failed to add firewall rule", core::LogContext().add("rule", rule.describe()));
                    return false;
                }
            }

            for (const auto &link : chain_links())
            {
                if (!ensure_jump(link))
                {
                    return false;
                }
            }

            logger_->info("Firewall rules applied");
            return true;
        }

        bool FirewallManager::remove()
        {
            std::lock_guard<std::mutex> lock(mutex_);

            bool success = true;
            if (active_plan_)
            {
                logger_->info("Removing firewall rules", core::LogContext().add("egress", active_plan_->egress_interface));

                const auto &rules = active_plan_->rules;
                for (auto it = rules.rbegin(); it != rules.rend(); ++it)
                {
                    std::vector<std::string> args = {"-t", it->table, "-D", it->chain};
                    auto rule_args = it->to_args();
                    args.insert(args.end(), rule_args.begin(), rule_args.end());

                    // A rule that failed to apply is absent; that is not an error here
                    if (!iptables(args).ok())
                    {
                        logger_->debug("Rule not present", core::LogContext().add("rule", it->describe()));
                    }
                }
            }

            success = remove_reload_guards() && success;
            for (auto it = chain_links().rbegin(); it != chain_links().rend(); ++it)
            {
                success = unlink_and_delete(*it) && success;
            }

            active_plan_.reset();
            return success;
        }

        bool FirewallManager::remove_all_chains()
        {
            std::lock_guard<std::mutex> lock(mutex_);

            bool success = remove_reload_guards();
            for (auto it = chain_links().rbegin(); it != chain_links().rend(); ++it)
            {
                success = unlink_and_delete(*it) && success;
            }
            active_plan_.reset();
            return success;
        }

        bool FirewallManager::enable_ip_forwarding()
        {
            std::lock_guard<std::mutex> lock(mutex_);

            const std::string &path = config_->paths.ip_forward_file;

            std::ifstream current(path);
            std::string value;
            if (current >> value)
            {
                if (!previous_forwarding_)
                {
                    previous_forwarding_ = value;
                }
            }
            current.close();

            if (value == "1")
            {
                logger_->debug("IP forwarding already enabled");
                return true;
            }

            std::ofstream out(path);
            if (!out.is_open() || !(out << "1\n"))
            {
                logger_->error("Failed to enable IP forwarding", core::LogContext().add("path", path));
                return false;
            }

            logger_->info("IP forwarding enabled", core::LogContext().add("previous", value.empty() ? "unknown" : value));
            return true;
        }

        bool FirewallManager::restore_ip_forwarding()
        {
            std::lock_guard<std::mutex> lock(mutex_);

            if (!previous_forwarding_)
            {
                return true;
            }

            std::string previous = *previous_forwarding_;
            previous_forwarding_.reset();
            if (previous == "1")
            {
                return true;
            }

            std::ofstream out(config_->paths.ip_forward_file);
            if (!out.is_open() || !(out << previous << "\n"))
            {
                logger_->error("Failed to restore IP forwarding", core::LogContext().add("value", previous));
                return false;
            }

            logger_->info("IP forwarding restored", core::LogContext().add("value", previous));
            return true;
        }

        std::optional<services::RoutingPlan> FirewallManager::active_plan() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return active_plan_;
        }

        bool FirewallManager::ensure_chain(const ChainLink &link)
        {
            if (iptables({"-t", link.table, "-n", "-L", link.chain}).ok())
            {
                return true;
            }

            if (!iptables({"-t", link.table, "-N", link.chain}).ok())
            {
                logger_->error("Failed to create chain",
                               core::LogContext().add("table", link.table).add("chain", link.chain));
                return false;
            }
            return true;
        }

        bool FirewallManager::ensure_jump(const ChainLink &link)
        {
            if (iptables({"-t", link.table, "-C", link.parent, "-j", link.chain}).ok())
            {
                return true;
            }

            if (!iptables({"-t", link.table, "-I", link.parent, "1", "-j", link.chain}).ok())
            {
                logger_->error("Failed to link chain",
                               core::LogContext().add("parent", link.parent).add("chain", link.chain));
                return false;
            }
            return true;
        }

        bool FirewallManager::unlink_and_delete(const ChainLink &link)
        {
            for (int i = 0; i < kMaxJumpRemovals; ++i)
            {
                if (!iptables({"-t", link.table, "-D", link.parent, "-j", link.chain}).ok())
                {
                    break;
                }
            }

            if (!iptables({"-t", link.table, "-n", "-L", link.chain}).ok())
            {
                return true;
            }

            bool flushed = iptables({"-t", link.table, "-F", link.chain}).ok();
            bool deleted = iptables({"-t", link.table, "-X", link.chain}).ok();
            if (!flushed || !deleted)
            {
                logger_->warning("Failed to delete chain", core::LogContext().add("chain", link.chain));
                return false;
            }
            return true;
        }

        bool FirewallManager::remove_reload_guards()
        {
            auto listing = iptables({"-t", "filter", "-S", "FORWARD"});
            if (!listing.ok())
            {
                logger_->warning("Cannot list FORWARD chain");
                return false;
            }

            bool success = true;
            std::istringstream lines(listing.output);
            std::string line;
            while (std::getline(lines, line))
            {
                if (line.find(std::string("--comment ") + kReloadComment) == std::string::npos)
                {
                    continue;
                }

                std::vector<std::string> args = {"-t", "filter"};
                std::istringstream words(line);
                std::string word;
                while (words >> word)
                {
                    args.push_back(args.size() == 2 && word == "-A" ? "-D" : word);
                }
                if (!iptables(args).ok())
                {
                    logger_->error("Failed to delete reload guard", core::LogContext().add("rule", line));
                    success = false;
                }
            }
            return success;
        }

        CommandResult FirewallManager::iptables(const std::vector<std::string> &args)
        {
            std::vector<std::string> argv = {"iptables", "-w"};
            argv.insert(argv.end(), args.begin(), args.end());
            return runner_->run(argv, std::chrono::milliseconds(config_->probe.command_timeout_ms));
        }

    } // namespace infrastructure
} // namespace hotspot
