// tests/unit/test_interface_inventory.cpp
#include <gtest/gtest.h>

#include "core/errors.hpp"
#include "infrastructure/interface_inventory.hpp"
#include "support/fixtures.hpp"

#include <filesystem>
#include <fstream>

using namespace hotspot::infrastructure;
using namespace hotspot::test_support;
namespace fs = std::filesystem;

// ==================== Classification Tests ====================

TEST(ClassifyInterfaceTest, ClassificationTable)
{
    struct Case
    {
        InterfaceSnapshot snapshot;
        InterfaceKind expected;
    };

    const std::vector<Case> cases = {
        {{"wlan0", "wifi", "pci", "iwlwifi"}, InterfaceKind::BuiltInWifi},
        {{"wlp2s0", "wifi", "pci", "ath10k_pci"}, InterfaceKind::BuiltInWifi},
        {{"wlx00c0ca123456", "wifi", "usb", "rtl8xxxu"}, InterfaceKind::UsbWifi},
        {{"wlan1", "", "usb", ""}, InterfaceKind::UsbWifi},
        {{"eth0", "ethernet", "pci", "r8169"}, InterfaceKind::Ethernet},
        {{"enp0s31f6", "ethernet", "pci", "e1000e"}, InterfaceKind::Ethernet},
        {{"enx0a1b2c3d4e5f", "ethernet", "usb", "rndis_host"}, InterfaceKind::PhoneTether},
        {{"usb0", "ethernet", "usb", ""}, InterfaceKind::PhoneTether},
        {{"wwan0", "gsm", "usb", "qmi_wwan"}, InterfaceKind::MobileBroadband},
        {{"cdc-wdm0", "gsm", "", ""}, InterfaceKind::MobileBroadband},
        {{"tun0", "tun", "", ""}, InterfaceKind::VpnTunnel},
        {{"wg0", "wireguard", "", ""}, InterfaceKind::VpnTunnel},
        {{"proton0", "vpn", "", ""}, InterfaceKind::VpnTunnel},
        {{"ppp0", "ppp", "", ""}, InterfaceKind::VpnTunnel},
        {{"br0", "bridge", "", ""}, InterfaceKind::Bridge},
        {{"dummy0", "dummy", "", ""}, InterfaceKind::Unknown},
    };

    for (const auto &c : cases)
    {
        EXPECT_EQ(classify_interface(c.snapshot), c.expected) << c.snapshot.name;
    }
}

TEST(ClassifyInterfaceTest, IsPureOverSnapshot)
{
    InterfaceSnapshot snapshot{"wlan1", "wifi", "usb", "mt76x2u"};
    EXPECT_EQ(classify_interface(snapshot), classify_interface(snapshot));
}

// ==================== Parser Tests ====================

TEST(NmcliParserTest, TerseEscapes)
{
    auto fields = split_terse_line(R"(wlan0:wifi:connected:Cafe\:Guest\\5G)");
    ASSERT_EQ(fields.size(), 4u);
    EXPECT_EQ(fields[3], "Cafe:Guest\\5G");
}

TEST(NmcliParserTest, DevicesWithoutConnection)
{
    auto records = parse_nmcli_devices(kNmcliDevicesTwoAdapters);
    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[0].device, "wlan0");
    EXPECT_EQ(records[0].connection, "HomeNet");
    EXPECT_EQ(records[1].device, "wlan1");
    EXPECT_TRUE(records[1].connection.empty());
    EXPECT_EQ(records[2].state, "unavailable");
}

TEST(RouteParserTest, RouteGetAndDefaults)
{
    EXPECT_EQ(parse_route_device(route_via("wg0")), "wg0");
    EXPECT_FALSE(parse_route_device("unreachable 1.1.1.1").has_value());

    auto devices = parse_default_route_devices(
        "default dev wg0 scope link\n"
        "default via 192.168.1.1 dev wlan0 proto dhcp metric 600\n");
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0], "wg0");
    EXPECT_EQ(devices[1], "wlan0");
}

TEST(InterfaceLabelTest, LabelCarriesTagsAndNetwork)
{
    NetworkInterface iface;
    iface.name = "wlan1";
    iface.kind = InterfaceKind::UsbWifi;
    iface.connected_network = "Office";

    EXPECT_EQ(make_interface_label(iface, {"AP", "5GHz"}), "USB Wi-Fi Adapter [AP, 5GHz] -> Office (wlan1)");
}

TEST(ChooseInterfaceTest, PrefersUsbAdapterThatIsNotUpstream)
{
    NetworkInterface builtin;
    builtin.name = "wlan0";
    builtin.kind = InterfaceKind::BuiltInWifi;
    NetworkInterface second_builtin = builtin;
    second_builtin.name = "wlan2";
    NetworkInterface usb;
    usb.name = "wlan1";
    usb.kind = InterfaceKind::UsbWifi;

    std::vector<NetworkInterface> interfaces = {builtin, second_builtin, usb};
    EXPECT_EQ(choose_hotspot_interface(interfaces, {"wlan0", "wlan1", "wlan2"}, std::string("wlan0")), "wlan1");
    EXPECT_EQ(choose_hotspot_interface(interfaces, {"wlan0", "wlan2"}, std::string("wlan0")), "wlan2");

    // Only the upstream adapter can host an AP: it is still returned, the lockout check decides
    EXPECT_EQ(choose_hotspot_interface(interfaces, {"wlan0"}, std::string("wlan0")), "wlan0");
    EXPECT_FALSE(choose_hotspot_interface(interfaces, {}, std::string("wlan0")).has_value());
}

// ==================== Inventory Tests ====================

class InterfaceInventoryTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        runner_ = std::make_shared<FakeCommandRunner>();
        inventory_ = std::make_unique<InterfaceInventory>(runner_, temp_.config());
    }

    TempConfig temp_;
    std::shared_ptr<FakeCommandRunner> runner_;
    std::unique_ptr<InterfaceInventory> inventory_;
};

TEST_F(InterfaceInventoryTest, ListsDevicesAndMarksUpstream)
{
    script_host(*runner_, kNmcliDevicesTwoAdapters, "wlan0");

    auto interfaces = inventory_->list_interfaces();
    ASSERT_EQ(interfaces.size(), 3u); // lo is ignored

    EXPECT_EQ(interfaces[0].name, "wlan0");
    EXPECT_TRUE(interfaces[0].carries_internet);
    EXPECT_EQ(interfaces[0].connected_network, "HomeNet");
    EXPECT_TRUE(interfaces[0].admin_up);

    EXPECT_EQ(interfaces[1].name, "wlan1");
    EXPECT_FALSE(interfaces[1].carries_internet);
    EXPECT_FALSE(interfaces[1].connected_network.has_value());

    EXPECT_EQ(interfaces[2].name, "eth0");
    EXPECT_EQ(interfaces[2].kind, InterfaceKind::Ethernet);
    EXPECT_FALSE(interfaces[2].admin_up);
}

TEST_F(InterfaceInventoryTest, NetworkManagerDownIsServiceUnavailable)
{
    runner_->respond({"nmcli"}, not_installed());

    try
    {
        inventory_->list_interfaces();
        FAIL() << "expected HotspotError";
    }
    catch (const hotspot::core::HotspotError &e)
    {
        EXPECT_EQ(e.kind(), hotspot::core::ErrorKind::ServiceUnavailable);
    }
}

TEST_F(InterfaceInventoryTest, UpstreamFallsBackToDefaultRoute)
{
    runner_->fail({"ip", "route", "get"}, 2);
    runner_->respond({"ip", "-4", "route", "show", "default"}, "default via 10.0.0.1 dev eth0 proto dhcp\n");

    EXPECT_EQ(inventory_->detect_upstream_interface(false), "eth0");
}

TEST_F(InterfaceInventoryTest, ExcludeVpnSkipsTunnelRoutes)
{
    runner_->respond({"ip", "route", "get"}, route_via("wg0"));
    runner_->respond({"ip", "-4", "route", "show", "default"},
                     "default dev wg0 scope link\n"
                     "default via 192.168.1.1 dev wlan0 proto dhcp metric 600\n");

    EXPECT_EQ(inventory_->detect_upstream_interface(false), "wg0");
    EXPECT_EQ(inventory_->detect_upstream_interface(true), "wlan0");
}

TEST_F(InterfaceInventoryTest, ReadsBusDriverAndFlagsFromSysfs)
{
    const fs::path sys = temp_.config()->paths.sys_class_net;
    const fs::path device = temp_.dir() / "devices" / "pci0000:00" / "usb1" / "1-2" / "1-2:1.0";
    fs::create_directories(device);
    fs::create_directories(sys / "wlan1");
    fs::create_symlink(device, sys / "wlan1" / "device");
    fs::create_symlink("../../../../../bus/usb/drivers/mt76x2u", device / "driver");
    std::ofstream(sys / "wlan1" / "flags") << "0x1002\n"; // IFF_UP clear

    script_host(*runner_, "wlan1:wifi:disconnected:--\n", "eth0");

    auto interfaces = inventory_->list_interfaces();
    ASSERT_EQ(interfaces.size(), 1u);
    EXPECT_EQ(interfaces[0].bus, "usb");
    EXPECT_EQ(interfaces[0].driver, "mt76x2u");
    EXPECT_EQ(interfaces[0].kind, InterfaceKind::UsbWifi);
    EXPECT_FALSE(interfaces[0].admin_up);
}
