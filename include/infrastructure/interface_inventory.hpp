#ifndef HOTSPOT_INFRASTRUCTURE_INTERFACE_INVENTORY_HPP
#define HOTSPOT_INFRASTRUCTURE_INTERFACE_INVENTORY_HPP

#include <memory>
#include <optional>
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

        enum class InterfaceKind
        {
            BuiltInWifi,
            UsbWifi,
            Ethernet,
            MobileBroadband,
            PhoneTether,
            VpnTunnel,
            Bridge,
            Unknown
        };

        /**
         * Raw facts about one device, gathered before classification
         */
        struct InterfaceSnapshot
        {
            std::string name;
            std::string nm_type; // wifi, ethernet, gsm, tun, wireguard, bridge, ...
            std::string bus;     // usb, pci, sdio, or empty for virtual devices
            std::string driver;
        };

        struct NetworkInterface
        {
            std::string name;
            InterfaceKind kind = InterfaceKind::Unknown;
            bool admin_up = false;
            std::optional<std::string> connected_network;
            bool carries_internet = false;

            std::string nm_type;
            std::string nm_state;
            std::string driver;
            std::string bus;
            std::string label;

            bool is_wireless() const
            {
                return kind == InterfaceKind::BuiltInWifi || kind == InterfaceKind::UsbWifi;
            }
        };

        /**
         * One parsed line of `nmcli -t -f DEVICE,TYPE,STATE,CONNECTION device`
         */
        struct NmDeviceRecord
        {
            std::string device;
            std::string type;
            std::string state;
            std::string connection;
        };

        // Pure helpers
        InterfaceKind classify_interface(const InterfaceSnapshot &snapshot);
        std::vector<std::string> split_terse_line(const std::string &line);
        std::vector<NmDeviceRecord> parse_nmcli_devices(const std::string &output);
        std::optional<std::string> parse_route_device(const std::string &output);
        std::vector<std::string> parse_default_route_devices(const std::string &output);
        bool is_ignored_device(const std::string &name, const std::string &nm_type);
        bool is_vpn_name(const std::string &name);
        const char *to_string(InterfaceKind kind);

        /**
         * Presentation label such as "USB Wi-Fi Adapter [AP, 5GHz] (wlan1)".
         * The capability tags are supplied by the caller.
         */
        std::string make_interface_label(const NetworkInterface &iface, const std::vector<std::string> &tags);

        /**
         * Picks a hotspot interface among the AP-capable wireless candidates,
         * preferring one that is not the upstream, USB adapters first.
         */
        std::optional<std::string> choose_hotspot_interface(const std::vector<NetworkInterface> &interfaces,
                                                            const std::vector<std::string> &ap_capable,
                                                            const std::optional<std::string> &upstream);

        /**
         * Enumerates network devices through NetworkManager and sysfs. Read-only.
         */
        class InterfaceInventory
        {
        public:
            InterfaceInventory(std::shared_ptr<CommandRunner> runner,
                               const std::shared_ptr<core::HotspotConfig> &config);

            /**
             * Throws HotspotError(ServiceUnavailable) when NetworkManager cannot be queried.
             */
            std::vector<NetworkInterface> list_interfaces();

            /**
             * Device carrying the default route. With exclude_vpn, tunnel
             * devices are skipped in favour of a physical default route.
             */
            std::optional<std::string> detect_upstream_interface(bool exclude_vpn = false);

        private:
            bool read_admin_up(const std::string &name, const std::string &nm_state) const;
            std::string read_bus(const std::string &name) const;
            std::string read_driver(const std::string &name) const;

            std::shared_ptr<CommandRunner> runner_;
            std::shared_ptr<core::HotspotConfig> config_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace hotspot

#endif // HOTSPOT_INFRASTRUCTURE_INTERFACE_INVENTORY_HPP
