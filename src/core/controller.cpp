#include "core/controller.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "infrastructure/access_point.hpp"
#include "infrastructure/firewall_manager.hpp"
#include "services/status_publisher.hpp"

#include <algorithm>

namespace hotspot
{
    namespace core
    {

        using infrastructure::CapabilitySet;
        using infrastructure::InterfaceKind;
        using infrastructure::NetworkInterface;

        namespace
        {
            bool session_in_progress(HotspotState state)
            {
                return state == HotspotState::Validating || state == HotspotState::Starting ||
                       state == HotspotState::Running || state == HotspotState::Stopping;
            }

            bool is_vpn_interface(const std::vector<NetworkInterface> &inventory, const std::string &name)
            {
                return std::any_of(inventory.begin(), inventory.end(), [&name](const NetworkInterface &iface) {
                    return iface.name == name && iface.kind == InterfaceKind::VpnTunnel;
                });
            }

            void label_interfaces(std::vector<NetworkInterface> &inventory,
                                  const std::map<std::string, CapabilitySet> &capabilities)
            {
                for (auto &iface : inventory)
                {
                    auto it = capabilities.find(iface.name);
                    std::vector<std::string> tags;
                    if (it != capabilities.end())
                    {
                        tags = infrastructure::capability_tags(it->second);
                    }
                    iface.label = infrastructure::make_interface_label(iface, tags);
                }
            }
        } // namespace

        HotspotController::HotspotController(std::shared_ptr<HotspotConfig> config, ControllerDependencies dependencies)
            : config_(std::move(config)), logger_(get_logger("controller")), deps_(std::move(dependencies))
        {
            if (!deps_.clock)
            {
                deps_.clock = []() { return std::chrono::system_clock::now(); };
            }
        }

        HotspotController::~HotspotController()
        {
            if (state() == HotspotState::Running)
            {
                handle_stop("Backend shutting down");
            }
        }

        std::future<StartResult> HotspotController::request_start(const HotspotSession &session)
        {
            auto promise = std::make_shared<std::promise<StartResult>>();
            auto future = promise->get_future();
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                commands_.push_back(Command{CommandType::Start, session, promise});
            }
            queue_cv_.notify_one();
            return future;
        }

        void HotspotController::request_stop()
        {
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                commands_.push_back(Command{CommandType::Stop, HotspotSession{}, nullptr});
            }
            queue_cv_.notify_one();
        }

        void HotspotController::poll(TimePoint now)
        {
            while (true)
            {
                Command command;
                {
                    std::lock_guard<std::mutex> lock(queue_mutex_);
                    if (commands_.empty())
                    {
                        break;
                    }
                    command = std::move(commands_.front());
                    commands_.pop_front();
                }

                if (command.type == CommandType::Stop)
                {
                    handle_stop("Hotspot stopped");
                    continue;
                }

                StartResult result;
                try
                {
                    result = handle_start(command.session, now);
                }
                catch (const std::exception &e)
                {
                    logger_->critical("Unexpected error while starting hotspot", LogContext().add("error", e.what()));
                    rollback();
                    result = fail(ErrorInfo{ErrorKind::Internal, {}, e.what()});
                }
                command.promise->set_value(result);
            }

            tick(now);
        }

        void HotspotController::run(const std::atomic<bool> &stop_requested)
        {
            bool stop_sent = false;
            while (true)
            {
                if (stop_requested.load() && !stop_sent)
                {
                    logger_->info("Stop requested by signal");
                    request_stop();
                    stop_sent = true;
                }

                poll(deps_.clock());

                HotspotState current = state();
                std::unique_lock<std::mutex> lock(queue_mutex_);
                if ((current == HotspotState::Idle || current == HotspotState::Failed) && commands_.empty())
                {
                    break;
                }
                queue_cv_.wait_for(lock, std::chrono::milliseconds(config_->controller.tick_interval_ms),
                                   [this]() { return !commands_.empty(); });
            }
        }

        StartResult HotspotController::dry_run(const HotspotSession &session)
        {
            StartResult result;
            Assessment assessment;
            try
            {
                assessment = assess(session);
            }
            catch (const HotspotError &e)
            {
                result.error = ErrorInfo{e.kind(), {}, e.what()};
                result.message = e.what();
                return result;
            }

            result.verdict = assessment.verdict;
            result.warnings = assessment.verdict.warnings;
            result.hotspot_interface = assessment.session.hotspot_interface;
            result.internet_interface = assessment.session.internet_interface;

            if (!assessment.verdict.allowed())
            {
                result.error = ErrorInfo{ErrorKind::Blocked, assessment.verdict.reasons, assessment.verdict.message};
                result.message = assessment.verdict.message;
                return result;
            }

            try
            {
                result.plan = plan_generator_.build_plan(assessment.session, assessment.inventory);
                result.internet_interface = result.plan->egress_interface;
            }
            catch (const HotspotError &e)
            {
                result.error = ErrorInfo{e.kind(), {}, e.what()};
                result.message = e.what();
                return result;
            }

            result.ok = true;
            result.message = assessment.verdict.message;
            return result;
        }

        HotspotState HotspotController::state() const
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            return state_;
        }

        std::optional<HotspotSession> HotspotController::session() const
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            return session_;
        }

        std::optional<ErrorInfo> HotspotController::last_error() const
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            return last_error_;
        }

        std::vector<NetworkInterface> HotspotController::last_inventory() const
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            return last_inventory_;
        }

        std::map<std::string, CapabilitySet> HotspotController::last_capabilities() const
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            return last_capabilities_;
        }

        StartResult HotspotController::handle_start(HotspotSession session, TimePoint now)
        {
            HotspotState current = state();
            if (session_in_progress(current))
            {
                logger_->warning("Start rejected, a session is already active",
                                 LogContext().add("state", to_string(current)));
                StartResult result;
                result.error = ErrorInfo{ErrorKind::SessionActive, {}, "A hotspot session is already active"};
                result.message = result.error.message;
                return result;
            }

            last_idle_sample_.reset();
            idle_since_.reset();
            upstream_lost_logged_ = false;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                session_ = session;
                last_error_.reset();
                warnings_.clear();
            }

            set_state(HotspotState::Validating, "Running pre-flight checks");

            Assessment assessment;
            try
            {
                assessment = assess(session);
            }
            catch (const HotspotError &e)
            {
                return fail(ErrorInfo{e.kind(), {}, e.what()});
            }

            if (!assessment.verdict.allowed())
            {
                return fail(ErrorInfo{ErrorKind::Blocked, assessment.verdict.reasons, assessment.verdict.message},
                            assessment.verdict.warnings);
            }

            for (const auto &warning : assessment.verdict.warnings)
            {
                logger_->warning(warning);
            }
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                session_ = assessment.session;
                warnings_ = assessment.verdict.warnings;
            }

            set_state(HotspotState::Starting, "Starting hotspot on " + assessment.session.hotspot_interface);
            return start_session(assessment, now);
        }

        HotspotController::Assessment HotspotController::assess(HotspotSession session)
        {
            validate_session(session);

            Assessment assessment;
            assessment.inventory = deps_.inventory->list_interfaces();

            std::vector<std::string> wireless;
            for (const auto &iface : assessment.inventory)
            {
                if (iface.is_wireless())
                {
                    wireless.push_back(iface.name);
                }
            }
            if (!session.hotspot_interface.empty() &&
                std::find(wireless.begin(), wireless.end(), session.hotspot_interface) == wireless.end())
            {
                wireless.push_back(session.hotspot_interface);
            }
            assessment.capabilities = deps_.prober->probe_all(wireless);

            auto upstream = deps_.inventory->detect_upstream_interface(session.exclude_vpn);

            if (session.hotspot_interface.empty())
            {
                std::vector<std::string> ap_capable;
                for (const auto &[name, caps] : assessment.capabilities)
                {
                    if (caps.reachable && caps.supports_ap)
                    {
                        ap_capable.push_back(name);
                    }
                }
                if (auto chosen = infrastructure::choose_hotspot_interface(assessment.inventory, ap_capable, upstream))
                {
                    session.hotspot_interface = *chosen;
                    logger_->info("Selected hotspot interface",
                                  LogContext().add("interface", *chosen).add("upstream", upstream.value_or("none")));
                }
            }

            if (!session.internet_interface)
            {
                session.internet_interface = upstream;
            }

            bool vpn_present = std::any_of(assessment.inventory.begin(), assessment.inventory.end(),
                                           [](const NetworkInterface &iface) { return iface.kind == InterfaceKind::VpnTunnel; });
            session.vpn_routing = session.vpn_routing && !session.exclude_vpn && vpn_present;

            // The lockout check concerns the physical adapter carrying the internet, not the tunnel on top of it
            std::optional<std::string> carrier = session.internet_interface;
            if (carrier && is_vpn_interface(assessment.inventory, *carrier))
            {
                auto physical = deps_.inventory->detect_upstream_interface(true);
                if (physical && !infrastructure::is_vpn_name(*physical))
                {
                    carrier = physical;
                }
            }

            assessment.verdict = evaluator_.evaluate(session.hotspot_interface, carrier, assessment.inventory,
                                                     assessment.capabilities, session.force_single_interface,
                                                     session.band);
            for (const auto &warning : services::SafetyEvaluator::ssid_warnings(session.ssid))
            {
                assessment.verdict.warnings.push_back(warning);
            }

            label_interfaces(assessment.inventory, assessment.capabilities);
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                last_inventory_ = assessment.inventory;
                last_capabilities_ = assessment.capabilities;
            }

            logger_->info("Safety verdict",
                          LogContext()
                              .add("hotspot", session.hotspot_interface)
                              .add("internet", session.internet_interface.value_or("none"))
                              .add("vpn_routing", session.vpn_routing)
                              .add("allowed", assessment.verdict.allowed())
                              .add("overridden", assessment.verdict.overridden));

            assessment.session = session;
            return assessment;
        }

        StartResult HotspotController::start_session(Assessment &assessment, TimePoint now)
        {
            HotspotSession &session = assessment.session;
            const auto &warnings = assessment.verdict.warnings;

            services::RoutingPlan plan;
            try
            {
                plan = plan_generator_.build_plan(session, assessment.inventory);
            }
            catch (const HotspotError &e)
            {
                return fail(ErrorInfo{e.kind(), {}, e.what()}, warnings);
            }

            if (!deps_.firewall->apply(plan))
            {
                rollback();
                return fail(ErrorInfo{ErrorKind::ApplyFailure, {}, "Failed to apply firewall rules"}, warnings);
            }

            if (!deps_.access_point->bring_up(session))
            {
                rollback();
                return fail(ErrorInfo{ErrorKind::ApplyFailure, {},
                                      "Failed to activate the access point on " + session.hotspot_interface},
                            warnings);
            }

            if (!deps_.firewall->enable_ip_forwarding())
            {
                rollback();
                return fail(ErrorInfo{ErrorKind::ApplyFailure, {}, "Failed to enable IP forwarding"}, warnings);
            }

            session.internet_interface = plan.egress_interface;
            session.started_at = now;
            if (session.timer_minutes)
            {
                session.auto_off_deadline = now + std::chrono::minutes(*session.timer_minutes);
            }
            idle_since_ = now;
            last_idle_sample_ = now;

            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                session_ = session;
            }

            std::string message = "Hotspot '" + session.ssid + "' is now active on " + session.hotspot_interface;
            set_state(HotspotState::Running, message);

            StartResult result;
            result.ok = true;
            result.message = message;
            result.warnings = warnings;
            result.hotspot_interface = session.hotspot_interface;
            result.internet_interface = plan.egress_interface;
            result.verdict = assessment.verdict;
            result.plan = plan;
            return result;
        }

        void HotspotController::rollback()
        {
            logger_->warning("Rolling back partial hotspot start");

            if (!deps_.firewall->restore_ip_forwarding())
            {
                logger_->error("Rollback: IP forwarding not restored");
            }
            if (!deps_.access_point->tear_down())
            {
                logger_->error("Rollback: access point not fully removed");
            }
            if (!deps_.firewall->remove())
            {
                logger_->error("Rollback: firewall chains not fully removed");
            }
        }

        StartResult HotspotController::fail(ErrorInfo error, const std::vector<std::string> &warnings)
        {
            logger_->error("Hotspot start failed",
                           LogContext().add("error_code", error.code()).add("message", error.message));
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                last_error_ = error;
                warnings_ = warnings;
            }

            set_state(HotspotState::Failed, error.message, error);

            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                session_.reset();
            }

            StartResult result;
            result.error = error;
            result.message = error.message;
            result.warnings = warnings;
            return result;
        }

        void HotspotController::handle_stop(const std::string &reason, const std::optional<ErrorInfo> &error)
        {
            HotspotState current = state();
            if (current != HotspotState::Running)
            {
                logger_->debug("Stop ignored", LogContext().add("state", to_string(current)));
                return;
            }

            logger_->info("Stopping hotspot", LogContext().add("reason", reason));
            set_state(HotspotState::Stopping, "Stopping hotspot");

            if (!deps_.access_point->tear_down())
            {
                logger_->error("Access point teardown incomplete");
            }
            if (!deps_.firewall->remove())
            {
                logger_->error("Firewall cleanup incomplete");
            }
            if (!deps_.firewall->restore_ip_forwarding())
            {
                logger_->error("IP forwarding not restored");
            }

            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                session_.reset();
                warnings_.clear();
                last_error_ = error;
            }
            last_idle_sample_.reset();
            idle_since_.reset();

            set_state(HotspotState::Idle, reason, error);
        }

        void HotspotController::tick(TimePoint now)
        {
            if (state() != HotspotState::Running)
            {
                return;
            }

            if (check_auto_off(now) || check_idle(now))
            {
                return;
            }
            monitor_upstream();
        }

        bool HotspotController::check_auto_off(TimePoint now)
        {
            std::optional<TimePoint> deadline;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (session_)
                {
                    deadline = session_->auto_off_deadline;
                }
            }

            if (!deadline || now < *deadline)
            {
                return false;
            }

            handle_stop("Auto-off timer expired");
            return true;
        }

        bool HotspotController::check_idle(TimePoint now)
        {
            int idle_minutes = 0;
            std::string interface;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (!session_)
                {
                    return false;
                }
                idle_minutes = session_->idle_off_minutes;
                interface = session_->hotspot_interface;
            }

            if (idle_minutes <= 0)
            {
                return false;
            }
            if (last_idle_sample_ && now - *last_idle_sample_ < std::chrono::seconds(config_->controller.idle_sample_interval))
            {
                return false;
            }
            last_idle_sample_ = now;

            auto clients = deps_.access_point->count_connected_clients(interface);
            if (!clients)
            {
                return false;
            }
            if (*clients > 0)
            {
                idle_since_.reset();
                return false;
            }

            if (!idle_since_)
            {
                idle_since_ = now;
            }
            if (now - *idle_since_ >= std::chrono::minutes(idle_minutes))
            {
                handle_stop("No clients connected for " + std::to_string(idle_minutes) + " minutes");
                return true;
            }
            return false;
        }

        void HotspotController::monitor_upstream()
        {
            auto plan = deps_.firewall->active_plan();
            std::optional<HotspotSession> session = this->session();
            if (!plan || !session)
            {
                return;
            }

            std::vector<NetworkInterface> inventory;
            try
            {
                inventory = deps_.inventory->list_interfaces();
            }
            catch (const HotspotError &e)
            {
                logger_->warning("Upstream check skipped", LogContext().add("error", e.what()));
                return;
            }

            HotspotSession candidate = *session;
            candidate.internet_interface = plan->egress_interface;
            if (!session->vpn_routing)
            {
                auto upstream = deps_.inventory->detect_upstream_interface(session->exclude_vpn);
                if (!upstream || *upstream == plan->egress_interface || *upstream == session->hotspot_interface)
                {
                    return;
                }
                candidate.internet_interface = upstream;
                // A tunnel that comes up mid-session is pinned like one present at start
                candidate.vpn_routing = !session->exclude_vpn && is_vpn_interface(inventory, *upstream);
            }

            services::RoutingPlan next;
            try
            {
                next = plan_generator_.build_plan(candidate, inventory);
            }
            catch (const HotspotError &e)
            {
                if (!upstream_lost_logged_)
                {
                    logger_->warning("Internet source unavailable, keeping current rules; forwarded traffic is dropped",
                                     LogContext().add("egress", plan->egress_interface).add("error", e.what()));
                    upstream_lost_logged_ = true;
                }
                return;
            }
            upstream_lost_logged_ = false;

            if (next.egress_interface == plan->egress_interface)
            {
                return;
            }

            logger_->info("Internet source changed",
                          LogContext().add("previous", plan->egress_interface).add("current", next.egress_interface));

            if (!deps_.firewall->apply(next))
            {
                handle_stop("Failed to re-apply firewall rules",
                            ErrorInfo{ErrorKind::ApplyFailure, {}, "Failed to re-apply firewall rules for " + next.egress_interface});
                return;
            }

            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (session_)
                {
                    session_->internet_interface = next.egress_interface;
                    session_->vpn_routing = candidate.vpn_routing;
                }
            }
            set_state(HotspotState::Running,
                      "Hotspot '" + session->ssid + "' now routes through " + next.egress_interface);
        }

        void HotspotController::set_state(HotspotState state, const std::string &message,
                                          const std::optional<ErrorInfo> &error)
        {
            services::StatusDetails details;
            details.message = message;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                state_ = state;
                details.warnings = warnings_;
                if (session_)
                {
                    details.ssid = session_->ssid;
                    details.interface = session_->hotspot_interface;
                    details.internet_interface = session_->internet_interface;
                    details.started_at = session_->started_at;
                    details.auto_off_deadline = session_->auto_off_deadline;
                }
            }

            logger_->info("State changed", LogContext().add("state", to_string(state)).add("message", message));

            if (deps_.publisher && !deps_.publisher->publish(state, error, details))
            {
                logger_->warning("Continuing without status publication");
            }
        }

    } // namespace core
} // namespace hotspot
