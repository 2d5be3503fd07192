// tests/support/fixtures.hpp
#pragma once

#include "core/config.hpp"
#include "support/fake_command_runner.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <unistd.h>

namespace hotspot
{
    namespace test_support
    {

        // ==================== Sample tool output ====================

        inline const char *kNmcliDevicesSingleWifi =
            "wlan0:wifi:connected:HomeNet\n"
            "p2p-dev-wlan0:wifi-p2p:disconnected:--\n"
            "lo:loopback:connected (externally):lo\n";

        inline const char *kNmcliDevicesTwoAdapters =
            "wlan0:wifi:connected:HomeNet\n"
            "wlan1:wifi:disconnected:--\n"
            "eth0:ethernet:unavailable:--\n"
            "lo:loopback:connected (externally):lo\n";

        inline const char *kNmcliDevicesWithVpn =
            "wlan0:wifi:connected:HomeNet\n"
            "wlan1:wifi:disconnected:--\n"
            "wg0:wireguard:connected (externally):wg0\n"
            "lo:loopback:connected (externally):lo\n";

        inline const char *kNmcliDevicesEthernetUplink =
            "eth0:ethernet:connected:Wired connection 1\n"
            "wlan0:wifi:disconnected:--\n";

        inline std::string iw_dev_info(const std::string &interface, int wiphy, const std::string &type = "managed")
        {
            return "Interface " + interface + "\n"
                   "\tifindex 3\n"
                   "\twdev 0x1\n"
                   "\taddr 3c:a9:f4:10:20:30\n"
                   "\ttype " + type + "\n"
                   "\twiphy " + std::to_string(wiphy) + "\n"
                   "\tchannel 6 (2437 MHz), width: 20 MHz, center1: 2437 MHz\n"
                   "\ttxpower 22.00 dBm\n";
        }

        // Dual band, AP capable, STA+AP on one channel (typical Intel card)
        inline const char *kIwPhyDualBandSameChannel =
            "Wiphy phy0\n"
            "\tmax # scan SSIDs: 20\n"
            "\tBand 1:\n"
            "\t\tFrequencies:\n"
            "\t\t\t* 2412 MHz [1] (22.0 dBm)\n"
            "\t\t\t* 2437 MHz [6] (22.0 dBm)\n"
            "\t\t\t* 2484 MHz [14] (disabled)\n"
            "\tBand 2:\n"
            "\t\tFrequencies:\n"
            "\t\t\t* 5180 MHz [36] (22.0 dBm)\n"
            "\t\t\t* 5500 MHz [100] (22.0 dBm) (radar detection)\n"
            "\tSupported interface modes:\n"
            "\t\t * IBSS\n"
            "\t\t * managed\n"
            "\t\t * AP\n"
            "\t\t * AP/VLAN\n"
            "\t\t * monitor\n"
            "\t\t * P2P-client\n"
            "\t\t * P2P-GO\n"
            "\t\t * P2P-device\n"
            "\tvalid interface combinations:\n"
            "\t\t * #{ managed } <= 1, #{ AP, P2P-client, P2P-GO } <= 1, #{ P2P-device } <= 1,\n"
            "\t\t   total <= 3, #channels <= 1\n"
            "\tHT Capabilities:\n"
            "\t\tMax AMSDU length: 3839 bytes\n";

        // 2.4 GHz only, AP capable, one interface at a time
        inline const char *kIwPhySingleBandNoConcurrency =
            "Wiphy phy0\n"
            "\tBand 1:\n"
            "\t\tFrequencies:\n"
            "\t\t\t* 2412 MHz [1] (20.0 dBm)\n"
            "\t\t\t* 2462 MHz [11] (20.0 dBm)\n"
            "\tSupported interface modes:\n"
            "\t\t * managed\n"
            "\t\t * AP\n"
            "\t\t * monitor\n"
            "\tvalid interface combinations:\n"
            "\t\t * #{ managed, AP } <= 1,\n"
            "\t\t   total <= 1, #channels <= 1\n";

        // STA+AP on different channels (e.g. mt76 dongles)
        inline const char *kIwPhyMultiChannel =
            "Wiphy phy1\n"
            "\tBand 1:\n"
            "\t\tFrequencies:\n"
            "\t\t\t* 2412 MHz [1] (20.0 dBm)\n"
            "\tBand 2:\n"
            "\t\tFrequencies:\n"
            "\t\t\t* 5180 MHz [36] (23.0 dBm)\n"
            "\tSupported interface modes:\n"
            "\t\t * managed\n"
            "\t\t * AP\n"
            "\t\t * mesh point\n"
            "\tvalid interface combinations:\n"
            "\t\t * #{ managed } <= 2, #{ AP, mesh point } <= 2,\n"
            "\t\t   total <= 4, #channels <= 2\n";

        // No AP mode at all
        inline const char *kIwPhyNoAp =
            "Wiphy phy2\n"
            "\tBand 1:\n"
            "\t\tFrequencies:\n"
            "\t\t\t* 2412 MHz [1] (20.0 dBm)\n"
            "\tSupported interface modes:\n"
            "\t\t * managed\n"
            "\t\t * monitor\n";

        inline const char *kRfkillClear =
            "0: hci0: Bluetooth\n"
            "\tSoft blocked: no\n"
            "\tHard blocked: no\n"
            "1: phy0: Wireless LAN\n"
            "\tSoft blocked: no\n"
            "\tHard blocked: no\n";

        inline const char *kRfkillPhy0Soft =
            "0: hci0: Bluetooth\n"
            "\tSoft blocked: yes\n"
            "\tHard blocked: no\n"
            "1: phy0: Wireless LAN\n"
            "\tSoft blocked: yes\n"
            "\tHard blocked: no\n"
            "2: phy1: Wireless LAN\n"
            "\tSoft blocked: no\n"
            "\tHard blocked: no\n";

        inline const char *kRfkillPlatformHard =
            "0: ideapad_wlan: Wireless LAN\n"
            "\tSoft blocked: no\n"
            "\tHard blocked: yes\n"
            "1: phy0: Wireless LAN\n"
            "\tSoft blocked: no\n"
            "\tHard blocked: no\n";

        inline const char *kStationDumpTwoClients =
            "Station 4a:11:22:33:44:55 (on wlan1)\n"
            "\tinactive time:\t120 ms\n"
            "\trx bytes:\t10412\n"
            "Station 6c:aa:bb:cc:dd:ee (on wlan1)\n"
            "\tinactive time:\t880 ms\n";

        inline std::string route_via(const std::string &device)
        {
            return "1.1.1.1 via 192.168.1.1 dev " + device + " src 192.168.1.23 uid 0\n    cache\n";
        }

        // ==================== Test configuration ====================

        /**
         * Configuration whose files live in a private temp directory.
         * The sysfs root does not exist, so admin state falls back to nmcli.
         */
        class TempConfig
        {
        public:
            TempConfig()
            {
                static int counter = 0;
                dir_ = std::filesystem::temp_directory_path() /
                       ("hotspotd_test_" + std::to_string(getpid()) + "_" + std::to_string(++counter));
                std::filesystem::create_directories(dir_);

                config_ = std::make_shared<core::HotspotConfig>();
                config_->paths.pid_file = (dir_ / "hotspot.pid").string();
                config_->paths.status_file = (dir_ / "status.json").string();
                config_->paths.ip_forward_file = (dir_ / "ip_forward").string();
                config_->paths.sys_class_net = (dir_ / "sys_class_net").string();
                config_->probe.command_timeout_ms = 1000;
                config_->controller.idle_sample_interval = 5;

                std::ofstream(config_->paths.ip_forward_file) << "0\n";
            }

            ~TempConfig()
            {
                std::error_code ec;
                std::filesystem::remove_all(dir_, ec);
            }

            std::shared_ptr<core::HotspotConfig> config() const { return config_; }
            const std::filesystem::path &dir() const { return dir_; }

            std::string read(const std::string &path) const
            {
                std::ifstream in(path);
                std::stringstream buffer;
                buffer << in.rdbuf();
                return buffer.str();
            }

        private:
            std::filesystem::path dir_;
            std::shared_ptr<core::HotspotConfig> config_;
        };

        /**
         * Scripts a host: nmcli device list, upstream route and per-interface iw output
         */
        inline void script_host(FakeCommandRunner &runner, const std::string &nmcli_devices,
                                const std::string &upstream_device)
        {
            runner.respond({"nmcli", "-t", "-f", "DEVICE,TYPE,STATE,CONNECTION", "device"}, nmcli_devices);
            runner.respond({"ip", "route", "get"}, route_via(upstream_device));
            runner.respond({"ip", "-4", "route", "show", "default"},
                           "default via 192.168.1.1 dev " + upstream_device + " proto dhcp metric 600\n");
            runner.respond({"rfkill", "list"}, kRfkillClear);
        }

        inline void script_radio(FakeCommandRunner &runner, const std::string &interface, int wiphy,
                                 const std::string &phy_info, const std::string &type = "managed")
        {
            runner.respond({"iw", "dev", interface, "info"}, iw_dev_info(interface, wiphy, type));
            runner.respond({"iw", "phy", "phy" + std::to_string(wiphy), "info"}, phy_info);
        }

    } // namespace test_support
} // namespace hotspot
