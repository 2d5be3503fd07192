// tests/unit/test_controller.cpp
#include <gtest/gtest.h>

#include "core/controller.hpp"
#include "infrastructure/access_point.hpp"
#include "infrastructure/firewall_manager.hpp"
#include "services/status_publisher.hpp"
#include "support/fixtures.hpp"

#include <algorithm>

using namespace hotspot;
using namespace hotspot::core;
using namespace hotspot::test_support;
using namespace std::chrono_literals;

namespace
{
    const char *kDefaultRoutesVpnFirst =
        "default dev wg0 scope link metric 50\n"
        "default via 192.168.1.1 dev wlan0 proto dhcp metric 600\n";

    bool contains(const std::vector<std::string> &rule, const std::string &value)
    {
        return std::find(rule.begin(), rule.end(), value) != rule.end();
    }
}

class ControllerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        runner_ = std::make_shared<FakeCommandRunner>();
        runner_->attach(&iptables_);

        auto config = temp_.config();
        ControllerDependencies deps;
        deps.inventory = std::make_shared<infrastructure::InterfaceInventory>(runner_, config);
        deps.prober = std::make_shared<infrastructure::CapabilityProber>(runner_, config);
        deps.firewall = std::make_shared<infrastructure::FirewallManager>(runner_, config);
        deps.access_point = std::make_shared<infrastructure::AccessPointManager>(runner_, config);
        deps.publisher = std::make_shared<services::StatusPublisher>(config);
        deps.clock = [this]() { return now_; };
        controller_ = std::make_unique<HotspotController>(config, deps);
    }

    void TearDown() override
    {
        controller_.reset();
    }

    HotspotSession make_session(const std::string &hotspot = "wlan1") const
    {
        HotspotSession session;
        session.ssid = "MyHotspot";
        session.password = "password123";
        session.hotspot_interface = hotspot;
        return session;
    }

    StartResult start(const HotspotSession &session)
    {
        auto result = controller_->request_start(session);
        controller_->poll(now_);
        return result.get();
    }

    void advance(std::chrono::seconds by)
    {
        now_ += by;
        controller_->poll(now_);
    }

    // wlan0 carries the internet, wlan1 is a spare AP-capable adapter
    void two_adapter_host()
    {
        script_host(*runner_, kNmcliDevicesTwoAdapters, "wlan0");
        script_radio(*runner_, "wlan0", 0, kIwPhyDualBandSameChannel);
        script_radio(*runner_, "wlan1", 1, kIwPhyMultiChannel);
    }

    // Only wlan0, which is also the internet connection and cannot do STA+AP
    void single_adapter_host()
    {
        script_host(*runner_, kNmcliDevicesSingleWifi, "wlan0");
        script_radio(*runner_, "wlan0", 0, kIwPhySingleBandNoConcurrency);
    }

    // Two adapters, internet through a WireGuard tunnel over wlan0
    void vpn_host()
    {
        script_host(*runner_, kNmcliDevicesWithVpn, "wg0");
        runner_->respond({"ip", "-4", "route", "show", "default"}, kDefaultRoutesVpnFirst);
        script_radio(*runner_, "wlan0", 0, kIwPhyDualBandSameChannel);
        script_radio(*runner_, "wlan1", 1, kIwPhyMultiChannel);
    }

    nlohmann::json status_file() const
    {
        return nlohmann::json::parse(temp_.read(temp_.config()->paths.status_file));
    }

    TempConfig temp_;
    IptablesSimulator iptables_;
    std::shared_ptr<FakeCommandRunner> runner_;
    std::unique_ptr<HotspotController> controller_;
    TimePoint now_ = TimePoint(std::chrono::hours(24 * 365 * 50));
};

// ==================== Validation Tests ====================

TEST_F(ControllerTest, ShortPasswordRejectedBeforeProbing)
{
    two_adapter_host();
    auto session = make_session();
    session.password = "1234567";

    auto result = start(session);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ErrorKind::InvalidConfig);
    EXPECT_EQ(result.exit_code(), 2);
    EXPECT_EQ(controller_->state(), HotspotState::Failed);

    EXPECT_EQ(runner_->count_calls({"iw"}), 0);
    EXPECT_EQ(runner_->count_calls({"nmcli"}), 0);
    EXPECT_EQ(runner_->count_calls({"iptables"}), 0);
}

TEST_F(ControllerTest, MissingNetworkManagerIsServiceUnavailable)
{
    two_adapter_host();
    runner_->respond({"nmcli", "-t"}, not_installed());

    auto result = start(make_session());
    EXPECT_EQ(result.error.kind, ErrorKind::ServiceUnavailable);
    EXPECT_EQ(result.exit_code(), 3);
    EXPECT_TRUE(runner_->mutating_calls().empty());
}

// ==================== Start Tests ====================

TEST_F(ControllerTest, StartOnSpareAdapter)
{
    two_adapter_host();

    auto result = start(make_session());
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.hotspot_interface, "wlan1");
    EXPECT_EQ(result.internet_interface, "wlan0");
    EXPECT_EQ(result.message, "Hotspot 'MyHotspot' is now active on wlan1");
    EXPECT_EQ(controller_->state(), HotspotState::Running);

    auto session = controller_->session();
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->started_at, now_);
    EXPECT_FALSE(session->auto_off_deadline.has_value());
    EXPECT_FALSE(session->vpn_routing);

    EXPECT_EQ(iptables_.jump_count("nat", "POSTROUTING", "HOTSPOT_NAT"), 1);
    EXPECT_EQ(temp_.read(temp_.config()->paths.ip_forward_file), "1\n");
    EXPECT_TRUE(runner_->called({"nmcli", "connection", "add"}));

    auto status = status_file();
    EXPECT_EQ(status["status"], "active");
    EXPECT_EQ(status["interface"], "wlan1");
    EXPECT_EQ(status["internet_interface"], "wlan0");
    EXPECT_FALSE(status["started_at"].is_null());
}

TEST_F(ControllerTest, AutoSelectsSpareAdapter)
{
    two_adapter_host();

    auto result = start(make_session(""));
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.hotspot_interface, "wlan1");

    auto inventory = controller_->last_inventory();
    auto wlan1 = std::find_if(inventory.begin(), inventory.end(),
                              [](const infrastructure::NetworkInterface &iface) { return iface.name == "wlan1"; });
    ASSERT_NE(wlan1, inventory.end());
    EXPECT_NE(wlan1->label.find("AP"), std::string::npos);
    EXPECT_EQ(controller_->last_capabilities().count("wlan1"), 1u);
}

TEST_F(ControllerTest, SecondStartIsSessionActive)
{
    two_adapter_host();
    ASSERT_TRUE(start(make_session()).ok);
    runner_->clear_calls();

    auto other = make_session();
    other.ssid = "OtherNet";
    auto result = start(other);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ErrorKind::SessionActive);
    EXPECT_EQ(result.exit_code(), 7);

    EXPECT_EQ(controller_->state(), HotspotState::Running);
    EXPECT_EQ(controller_->session()->ssid, "MyHotspot");
    EXPECT_TRUE(runner_->mutating_calls().empty());
}

TEST_F(ControllerTest, SingleAdapterBlockedWithoutMutation)
{
    single_adapter_host();

    auto result = start(make_session("wlan0"));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ErrorKind::Blocked);
    ASSERT_EQ(result.error.reasons.size(), 1u);
    EXPECT_EQ(result.error.reasons[0], BlockReason::SingleAdapterLockout);
    EXPECT_EQ(result.exit_code(), 15);
    EXPECT_EQ(controller_->state(), HotspotState::Failed);
    EXPECT_FALSE(controller_->session().has_value());

    EXPECT_TRUE(runner_->mutating_calls().empty());

    auto status = status_file();
    EXPECT_EQ(status["status"], "error");
    EXPECT_EQ(status["error_code"], "SingleAdapterLockout");
    EXPECT_EQ(status["message"], remedy_for(BlockReason::SingleAdapterLockout));
}

TEST_F(ControllerTest, FailedAttemptCanBeRetried)
{
    single_adapter_host();
    EXPECT_FALSE(start(make_session("wlan0")).ok);

    two_adapter_host();
    EXPECT_TRUE(start(make_session()).ok);
    EXPECT_EQ(controller_->state(), HotspotState::Running);
    EXPECT_FALSE(controller_->last_error().has_value());
}

TEST_F(ControllerTest, PublishFailureDoesNotAbortStart)
{
    two_adapter_host();
    temp_.config()->paths.status_file = (temp_.dir() / "missing" / "status.json").string();

    auto result = start(make_session());
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(controller_->state(), HotspotState::Running);
}

// ==================== Rollback Tests ====================

TEST_F(ControllerTest, AccessPointFailureRollsBack)
{
    two_adapter_host();
    runner_->fail({"nmcli", "-w"}, 4);

    auto result = start(make_session());
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.kind, ErrorKind::ApplyFailure);
    EXPECT_EQ(result.exit_code(), 6);
    EXPECT_EQ(controller_->state(), HotspotState::Failed);

    EXPECT_EQ(iptables_.managed_rule_count(), 0u);
    EXPECT_FALSE(iptables_.chain_exists("filter", "HOTSPOT_FWD"));
    EXPECT_FALSE(iptables_.chain_exists("nat", "HOTSPOT_NAT"));
    EXPECT_EQ(temp_.read(temp_.config()->paths.ip_forward_file), "0\n");
}

TEST_F(ControllerTest, FirewallFailureNeverStartsAccessPoint)
{
    two_adapter_host();
    iptables_.fail_on("RELATED,ESTABLISHED");

    auto result = start(make_session());
    EXPECT_EQ(result.error.kind, ErrorKind::ApplyFailure);
    EXPECT_FALSE(runner_->called({"nmcli", "connection", "add"}));
    EXPECT_EQ(iptables_.managed_rule_count(), 0u);
}

// ==================== Stop Tests ====================

TEST_F(ControllerTest, StopRemovesEverything)
{
    two_adapter_host();
    iptables_.add_foreign_rule("filter", "FORWARD", {"-i", "docker0", "-j", "ACCEPT"});
    ASSERT_TRUE(start(make_session()).ok);

    controller_->request_stop();
    controller_->poll(now_);

    EXPECT_EQ(controller_->state(), HotspotState::Idle);
    EXPECT_FALSE(controller_->session().has_value());
    EXPECT_EQ(iptables_.managed_rule_count(), 0u);
    EXPECT_EQ(iptables_.rules("filter", "FORWARD").size(), 1u);
    EXPECT_TRUE(runner_->called({"nmcli", "connection", "down", "hotspotd-ap"}));
    EXPECT_EQ(temp_.read(temp_.config()->paths.ip_forward_file), "0\n");

    auto status = status_file();
    EXPECT_EQ(status["status"], "idle");
    EXPECT_EQ(status["is_error"], false);

    // A second stop is a no-op
    runner_->clear_calls();
    controller_->request_stop();
    controller_->poll(now_);
    EXPECT_TRUE(runner_->mutating_calls().empty());
}

TEST_F(ControllerTest, RunLoopHonoursStopFlag)
{
    two_adapter_host();
    ASSERT_TRUE(start(make_session()).ok);

    std::atomic<bool> stop_requested{true};
    controller_->run(stop_requested);

    EXPECT_EQ(controller_->state(), HotspotState::Idle);
    EXPECT_EQ(iptables_.managed_rule_count(), 0u);
}

// ==================== Timer Tests ====================

TEST_F(ControllerTest, AutoOffAtDeadline)
{
    two_adapter_host();
    auto session = make_session();
    session.timer_minutes = 30;
    auto started = now_;
    ASSERT_TRUE(start(session).ok);

    EXPECT_EQ(controller_->session()->auto_off_deadline, started + 30min);
    EXPECT_DOUBLE_EQ(status_file()["auto_off_deadline"].get<double>(), services::to_epoch_seconds(started + 30min));

    advance(29min);
    advance(59s);
    EXPECT_EQ(controller_->state(), HotspotState::Running);

    advance(1s);
    EXPECT_EQ(controller_->state(), HotspotState::Idle);
    EXPECT_EQ(iptables_.managed_rule_count(), 0u);
    EXPECT_EQ(status_file()["message"], "Auto-off timer expired");
}

TEST_F(ControllerTest, IdleAutoOffAfterQuietPeriod)
{
    two_adapter_host();
    runner_->respond({"iw", "dev", "wlan1", "station", "dump"}, kStationDumpTwoClients);
    auto session = make_session();
    session.idle_off_minutes = 10;
    ASSERT_TRUE(start(session).ok);

    advance(10min);
    EXPECT_EQ(controller_->state(), HotspotState::Running);

    runner_->respond({"iw", "dev", "wlan1", "station", "dump"}, "");
    advance(5min);
    advance(9min);
    EXPECT_EQ(controller_->state(), HotspotState::Running);

    advance(1min);
    EXPECT_EQ(controller_->state(), HotspotState::Idle);
}

TEST_F(ControllerTest, UnreadableStationListKeepsRunning)
{
    two_adapter_host();
    runner_->fail({"iw", "dev", "wlan1", "station", "dump"});
    auto session = make_session();
    session.idle_off_minutes = 1;
    ASSERT_TRUE(start(session).ok);

    advance(5min);
    EXPECT_EQ(controller_->state(), HotspotState::Running);
}

// ==================== VPN Routing Tests ====================

TEST_F(ControllerTest, VpnRoutingPinsTunnel)
{
    vpn_host();

    auto result = start(make_session());
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.internet_interface, "wg0");
    ASSERT_TRUE(result.plan.has_value());
    EXPECT_TRUE(result.plan->vpn_pinned);

    auto nat = iptables_.rules("nat", "HOTSPOT_NAT");
    ASSERT_EQ(nat.size(), 1u);
    EXPECT_TRUE(contains(nat[0], "wg0"));
    for (const auto &rule : iptables_.rules("filter", "HOTSPOT_FWD"))
    {
        EXPECT_FALSE(contains(rule, "wlan0"));
    }
}

TEST_F(ControllerTest, ExcludeVpnRoutesDirectly)
{
    vpn_host();
    auto session = make_session();
    session.exclude_vpn = true;

    auto result = start(session);
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.internet_interface, "wlan0");
    EXPECT_FALSE(controller_->session()->vpn_routing);
}

TEST_F(ControllerTest, RepinsWhenTunnelChanges)
{
    vpn_host();
    ASSERT_TRUE(start(make_session()).ok);

    runner_->respond({"nmcli", "-t", "-f", "DEVICE,TYPE,STATE,CONNECTION", "device"},
                     "wlan0:wifi:connected:HomeNet\n"
                     "wlan1:wifi:connected:hotspotd-ap\n"
                     "wg1:wireguard:connected (externally):wg1\n");
    runner_->respond({"ip", "route", "get"}, route_via("wg1"));
    advance(2s);

    EXPECT_EQ(controller_->state(), HotspotState::Running);
    auto nat = iptables_.rules("nat", "HOTSPOT_NAT");
    ASSERT_EQ(nat.size(), 1u);
    EXPECT_TRUE(contains(nat[0], "wg1"));
    EXPECT_FALSE(contains(nat[0], "wg0"));
    EXPECT_EQ(controller_->session()->internet_interface, "wg1");
    EXPECT_EQ(status_file()["internet_interface"], "wg1");
}

TEST_F(ControllerTest, VanishedTunnelKeepsPinnedRules)
{
    vpn_host();
    ASSERT_TRUE(start(make_session()).ok);

    runner_->respond({"nmcli", "-t", "-f", "DEVICE,TYPE,STATE,CONNECTION", "device"},
                     "wlan0:wifi:connected:HomeNet\n"
                     "wlan1:wifi:connected:hotspotd-ap\n");
    runner_->respond({"ip", "route", "get"}, route_via("wlan0"));
    advance(2s);
    advance(2s);

    EXPECT_EQ(controller_->state(), HotspotState::Running);
    auto nat = iptables_.rules("nat", "HOTSPOT_NAT");
    ASSERT_EQ(nat.size(), 1u);
    EXPECT_TRUE(contains(nat[0], "wg0"));
    EXPECT_FALSE(contains(nat[0], "wlan0"));
}

TEST_F(ControllerTest, TunnelUpAfterStartIsPinnedWhenItVanishes)
{
    two_adapter_host();
    auto result = start(make_session());
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_FALSE(controller_->session()->vpn_routing);

    runner_->respond({"nmcli", "-t", "-f", "DEVICE,TYPE,STATE,CONNECTION", "device"},
                     "wlan0:wifi:connected:HomeNet\n"
                     "wlan1:wifi:connected:hotspotd-ap\n"
                     "wg0:wireguard:connected (externally):wg0\n");
    runner_->respond({"ip", "route", "get"}, route_via("wg0"));
    advance(2s);

    auto nat = iptables_.rules("nat", "HOTSPOT_NAT");
    ASSERT_EQ(nat.size(), 1u);
    EXPECT_TRUE(contains(nat[0], "wg0"));
    EXPECT_TRUE(controller_->session()->vpn_routing);

    runner_->respond({"nmcli", "-t", "-f", "DEVICE,TYPE,STATE,CONNECTION", "device"},
                     "wlan0:wifi:connected:HomeNet\n"
                     "wlan1:wifi:connected:hotspotd-ap\n");
    runner_->respond({"ip", "route", "get"}, route_via("wlan0"));
    advance(2s);
    advance(2s);

    EXPECT_EQ(controller_->state(), HotspotState::Running);
    nat = iptables_.rules("nat", "HOTSPOT_NAT");
    ASSERT_EQ(nat.size(), 1u);
    EXPECT_TRUE(contains(nat[0], "wg0"));
    EXPECT_FALSE(contains(nat[0], "wlan0"));
    EXPECT_EQ(controller_->session()->internet_interface, "wg0");
}

TEST_F(ControllerTest, FailedReapplyStopsHotspot)
{
    vpn_host();
    ASSERT_TRUE(start(make_session()).ok);

    runner_->respond({"nmcli", "-t", "-f", "DEVICE,TYPE,STATE,CONNECTION", "device"},
                     "wlan0:wifi:connected:HomeNet\n"
                     "wlan1:wifi:connected:hotspotd-ap\n"
                     "wg1:wireguard:connected (externally):wg1\n");
    iptables_.fail_on("-o wg1");
    advance(2s);

    EXPECT_EQ(controller_->state(), HotspotState::Idle);
    ASSERT_TRUE(controller_->last_error().has_value());
    EXPECT_EQ(controller_->last_error()->kind, ErrorKind::ApplyFailure);
    EXPECT_EQ(iptables_.managed_rule_count(), 0u);
    EXPECT_EQ(status_file()["error_code"], "ApplyFailure");
}

// ==================== Dry Run Tests ====================

TEST_F(ControllerTest, DryRunDoesNotMutate)
{
    vpn_host();

    auto result = controller_->dry_run(make_session());
    EXPECT_TRUE(result.ok) << result.message;
    ASSERT_TRUE(result.verdict.has_value());
    EXPECT_TRUE(result.verdict->allowed());
    ASSERT_TRUE(result.plan.has_value());
    EXPECT_EQ(result.plan->egress_interface, "wg0");

    EXPECT_TRUE(runner_->mutating_calls().empty());
    EXPECT_EQ(controller_->state(), HotspotState::Idle);
    EXPECT_FALSE(std::filesystem::exists(temp_.config()->paths.status_file));
}

TEST_F(ControllerTest, DryRunReportsBlock)
{
    single_adapter_host();

    auto result = controller_->dry_run(make_session("wlan0"));
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.exit_code(), 15);
    EXPECT_FALSE(result.plan.has_value());
    EXPECT_TRUE(runner_->mutating_calls().empty());
}
