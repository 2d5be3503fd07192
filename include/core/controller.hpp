#ifndef HOTSPOT_CORE_CONTROLLER_HPP
#define HOTSPOT_CORE_CONTROLLER_HPP

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "core/session.hpp"
#include "infrastructure/capability_prober.hpp"
#include "infrastructure/interface_inventory.hpp"
#include "services/routing_plan.hpp"
#include "services/safety_evaluator.hpp"

// Forward declarations
namespace hotspot
{
    namespace core
    {
        class HotspotConfig;
        class Logger;
    }
    namespace infrastructure
    {
        class AccessPointManager;
        class FirewallManager;
    }
    namespace services
    {
        class StatusPublisher;
    }
}

namespace hotspot
{
    namespace core
    {

        /**
         * Outcome of a start request or a --check dry run
         */
        struct StartResult
        {
            bool ok = false;
            ErrorInfo error;
            std::string message;
            std::vector<std::string> warnings;
            std::string hotspot_interface;
            std::optional<std::string> internet_interface;
            std::optional<services::SafetyVerdict> verdict;
            std::optional<services::RoutingPlan> plan;

            int exit_code() const { return ok ? 0 : error.exit_code(); }
        };

        using Clock = std::function<TimePoint()>;

        struct ControllerDependencies
        {
            std::shared_ptr<infrastructure::InterfaceInventory> inventory;
            std::shared_ptr<infrastructure::CapabilityProber> prober;
            std::shared_ptr<infrastructure::FirewallManager> firewall;
            std::shared_ptr<infrastructure::AccessPointManager> access_point;
            std::shared_ptr<services::StatusPublisher> publisher;
            Clock clock; // defaults to the system clock
        };

        /**
         * Hotspot lifecycle controller
         * Owns the single hotspot session and drives it through
         * Idle -> Validating -> Starting -> Running -> Stopping -> Idle.
         *
         * Start/stop requests are queued and executed, together with the
         * timer tick, by whichever thread calls poll() or run(). Nothing
         * mutates network state outside that loop.
         */
        class HotspotController
        {
        public:
            HotspotController(std::shared_ptr<HotspotConfig> config, ControllerDependencies dependencies);
            ~HotspotController();

            // Requests, safe from any thread
            std::future<StartResult> request_start(const HotspotSession &session);
            void request_stop();

            // Processes queued requests, then runs one timer tick at `now`
            void poll(TimePoint now);

            /**
             * Control loop. Returns once the session has ended (Idle or Failed).
             * Setting stop_requested issues a stop on the next iteration.
             */
            void run(const std::atomic<bool> &stop_requested);

            // Validation and planning without any mutation (--check)
            StartResult dry_run(const HotspotSession &session);

            // Observers
            HotspotState state() const;
            std::optional<HotspotSession> session() const;
            std::optional<ErrorInfo> last_error() const;
            std::vector<infrastructure::NetworkInterface> last_inventory() const;
            std::map<std::string, infrastructure::CapabilitySet> last_capabilities() const;

        private:
            enum class CommandType
            {
                Start,
                Stop
            };

            struct Command
            {
                CommandType type;
                HotspotSession session;
                std::shared_ptr<std::promise<StartResult>> promise;
            };

            /**
             * Everything the start sequence needs, gathered without side effects
             */
            struct Assessment
            {
                HotspotSession session;
                std::vector<infrastructure::NetworkInterface> inventory;
                std::map<std::string, infrastructure::CapabilitySet> capabilities;
                services::SafetyVerdict verdict;
            };

            // Command handling
            StartResult handle_start(HotspotSession session, TimePoint now);
            void handle_stop(const std::string &reason, const std::optional<ErrorInfo> &error = std::nullopt);

            Assessment assess(HotspotSession session);
            StartResult start_session(Assessment &assessment, TimePoint now);
            void rollback();
            StartResult fail(ErrorInfo error, const std::vector<std::string> &warnings = {});

            // Running-state checks
            void tick(TimePoint now);
            bool check_auto_off(TimePoint now);
            bool check_idle(TimePoint now);
            void monitor_upstream();

            void set_state(HotspotState state, const std::string &message,
                           const std::optional<ErrorInfo> &error = std::nullopt);

            std::shared_ptr<HotspotConfig> config_;
            std::shared_ptr<Logger> logger_;

            ControllerDependencies deps_;
            services::SafetyEvaluator evaluator_;
            services::RoutingPlanGenerator plan_generator_;

            // Request queue
            std::mutex queue_mutex_;
            std::condition_variable queue_cv_;
            std::deque<Command> commands_;

            // Session state, written by the control loop only
            mutable std::mutex state_mutex_;
            HotspotState state_ = HotspotState::Idle;
            std::optional<HotspotSession> session_;
            std::optional<ErrorInfo> last_error_;
            std::vector<std::string> warnings_;
            std::vector<infrastructure::NetworkInterface> last_inventory_;
            std::map<std::string, infrastructure::CapabilitySet> last_capabilities_;

            // Idle auto-off bookkeeping
            std::optional<TimePoint> last_idle_sample_;
            std::optional<TimePoint> idle_since_;
            bool upstream_lost_logged_ = false;
        };

    } // namespace core
} // namespace hotspot

#endif // HOTSPOT_CORE_CONTROLLER_HPP
