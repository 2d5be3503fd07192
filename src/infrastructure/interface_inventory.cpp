#include "infrastructure/interface_inventory.hpp"
#include "infrastructure/command_runner.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

namespace hotspot
{
    namespace infrastructure
    {

        namespace
        {
            bool starts_with(const std::string &value, const std::string &prefix)
            {
                return value.compare(0, prefix.size(), prefix) == 0;
            }

            bool starts_with_any(const std::string &value, std::initializer_list<const char *> prefixes)
            {
                for (const char *prefix : prefixes)
                {
                    if (starts_with(value, prefix))
                    {
                        return true;
                    }
                }
                return false;
            }

            bool is_tether_driver(const std::string &driver)
            {
                return driver == "rndis_host" || driver == "cdc_ether" || driver == "cdc_ncm" ||
                       driver == "ipheth";
            }

            constexpr unsigned long kIffUp = 0x1;
        } // namespace

        InterfaceKind classify_interface(const InterfaceSnapshot &snapshot)
        {
            const std::string &name = snapshot.name;
            const std::string &type = snapshot.nm_type;

            if (is_vpn_name(name) || type == "tun" || type == "wireguard" || type == "vpn" || type == "ppp")
            {
                return InterfaceKind::VpnTunnel;
            }

            if (starts_with(name, "ww") || type == "gsm" || type == "cdma" || type == "modem")
            {
                return InterfaceKind::MobileBroadband;
            }

            if (type == "bridge" || starts_with(name, "br"))
            {
                return InterfaceKind::Bridge;
            }

            bool wifi = type == "wifi" || (type.empty() && starts_with(name, "wl"));
            if (wifi)
            {
                return snapshot.bus == "usb" ? InterfaceKind::UsbWifi : InterfaceKind::BuiltInWifi;
            }

            bool ethernet = type == "ethernet" || (type.empty() && starts_with_any(name, {"en", "eth", "usb"}));
            if (ethernet)
            {
                if (is_tether_driver(snapshot.driver) || starts_with(name, "usb"))
                {
                    return InterfaceKind::PhoneTether;
                }
                return InterfaceKind::Ethernet;
            }

            return InterfaceKind::Unknown;
        }

        bool is_vpn_name(const std::string &name)
        {
            return starts_with_any(name, {"tun", "tap", "wg", "ppp"});
        }

        bool is_ignored_device(const std::string &name, const std::string &nm_type)
        {
            if (name == "lo" || starts_with_any(name, {"docker", "br-", "veth", "virbr", "p2p-"}))
            {
                return true;
            }
            return nm_type == "wifi-p2p" || nm_type == "loopback";
        }

        std::vector<std::string> split_terse_line(const std::string &line)
        {
            std::vector<std::string> fields;
            std::string current;
            for (size_t i = 0; i < line.size(); ++i)
            {
                char c = line[i];
                if (c == '\\' && i + 1 < line.size())
                {
                    current += line[++i];
                }
                else if (c == ':')
                {
                    fields.push_back(current);
                    current.clear();
                }
                else
                {
                    current += c;
                }
            }
            fields.push_back(current);
            return fields;
        }

        std::vector<NmDeviceRecord> parse_nmcli_devices(const std::string &output)
        {
            std::vector<NmDeviceRecord> records;
            std::istringstream stream(output);
            std::string line;
            while (std::getline(stream, line))
            {
                if (!line.empty() && line.back() == '\r')
                {
                    line.pop_back();
                }
                auto fields = split_terse_line(line);
                if (fields.size() < 3 || fields[0].empty())
                {
                    continue;
                }

                NmDeviceRecord record;
                record.device = fields[0];
                record.type = fields[1];
                record.state = fields[2];
                if (fields.size() > 3 && fields[3] != "--")
                {
                    record.connection = fields[3];
                }
                records.push_back(record);
            }
            return records;
        }

        std::optional<std::string> parse_route_device(const std::string &output)
        {
            static const std::regex dev_regex(R"(\bdev\s+(\S+))");
            std::smatch match;
            if (std::regex_search(output, match, dev_regex))
            {
                return match[1].str();
            }
            return std::nullopt;
        }

        std::vector<std::string> parse_default_route_devices(const std::string &output)
        {
            std::vector<std::string> devices;
            std::istringstream stream(output);
            std::string line;
            while (std::getline(stream, line))
            {
                if (auto device = parse_route_device(line))
                {
                    devices.push_back(*device);
                }
            }
            return devices;
        }

        const char *to_string(InterfaceKind kind)
        {
            switch (kind)
            {
            case InterfaceKind::BuiltInWifi:
                return "built-in-wifi";
            case InterfaceKind::UsbWifi:
                return "usb-wifi";
            case InterfaceKind::Ethernet:
                return "ethernet";
            case InterfaceKind::MobileBroadband:
                return "mobile-broadband";
            case InterfaceKind::PhoneTether:
                return "phone-tether";
            case InterfaceKind::VpnTunnel:
                return "vpn-tunnel";
            case InterfaceKind::Bridge:
                return "bridge";
            case InterfaceKind::Unknown:
                return "unknown";
            }
            return "unknown";
        }

        std::string make_interface_label(const NetworkInterface &iface, const std::vector<std::string> &tags)
        {
            std::ostringstream label;
            switch (iface.kind)
            {
            case InterfaceKind::UsbWifi:
                label << "USB Wi-Fi Adapter";
                break;
            case InterfaceKind::BuiltInWifi:
                label << (iface.bus == "pci" ? "Built-in Wi-Fi" : "Wi-Fi");
                break;
            case InterfaceKind::Ethernet:
                label << (iface.bus == "usb" ? "USB Ethernet" : "Ethernet");
                break;
            case InterfaceKind::PhoneTether:
                label << "Phone Tether";
                break;
            case InterfaceKind::MobileBroadband:
                label << "Mobile Broadband";
                break;
            case InterfaceKind::VpnTunnel:
                label << "VPN Tunnel";
                break;
            case InterfaceKind::Bridge:
                label << "Bridge";
                break;
            case InterfaceKind::Unknown:
                label << (iface.nm_type.empty() ? "Network Device" : iface.nm_type);
                break;
            }

            if (!tags.empty())
            {
                label << " [";
                for (size_t i = 0; i < tags.size(); ++i)
                {
                    if (i > 0)
                        label << ", ";
                    label << tags[i];
                }
                label << "]";
            }

            if (iface.connected_network)
            {
                label << " -> " << *iface.connected_network;
            }

            label << " (" << iface.name << ")";
            return label.str();
        }

        std::optional<std::string> choose_hotspot_interface(const std::vector<NetworkInterface> &interfaces,
                                                            const std::vector<std::string> &ap_capable,
                                                            const std::optional<std::string> &upstream)
        {
            auto capable = [&ap_capable](const NetworkInterface &iface) {
                return iface.is_wireless() &&
                       std::find(ap_capable.begin(), ap_capable.end(), iface.name) != ap_capable.end();
            };

            const NetworkInterface *fallback = nullptr;
            const NetworkInterface *best = nullptr;
            for (const auto &iface : interfaces)
            {
                if (!capable(iface))
                {
                    continue;
                }
                if (!fallback)
                {
                    fallback = &iface;
                }
                if (upstream && iface.name == *upstream)
                {
                    continue;
                }
                if (!best || (iface.kind == InterfaceKind::UsbWifi && best->kind != InterfaceKind::UsbWifi))
                {
                    best = &iface;
                }
            }

            if (best)
            {
                return best->name;
            }
            if (fallback)
            {
                return fallback->name;
            }
            return std::nullopt;
        }

        // InterfaceInventory implementation
        InterfaceInventory::InterfaceInventory(std::shared_ptr<CommandRunner> runner,
                                               const std::shared_ptr<core::HotspotConfig> &config)
            : runner_(std::move(runner)), config_(config), logger_(core::get_logger("interface_inventory"))
        {
        }

        std::vector<NetworkInterface> InterfaceInventory::list_interfaces()
        {
            std::chrono::milliseconds timeout(config_->probe.command_timeout_ms);

            auto result = runner_->run({"nmcli", "-t", "-f", "DEVICE,TYPE,STATE,CONNECTION", "device"}, timeout);
            if (!result.ok())
            {
                std::string why = !result.launched ? "nmcli not available"
                                  : result.timed_out ? "nmcli timed out"
                                                     : "nmcli exited with code " + std::to_string(result.exit_code);
                logger_->error("NetworkManager unreachable", core::LogContext().add("reason", why));
                throw core::HotspotError(core::ErrorKind::ServiceUnavailable,
                                         "NetworkManager is not reachable: " + why);
            }

            auto upstream = detect_upstream_interface(false);

            std::vector<NetworkInterface> interfaces;
            for (const auto &record : parse_nmcli_devices(result.output))
            {
                if (is_ignored_device(record.device, record.type))
                {
                    continue;
                }

                NetworkInterface iface;
                iface.name = record.device;
                iface.nm_type = record.type;
                iface.nm_state = record.state;
                iface.bus = read_bus(record.device);
                iface.driver = read_driver(record.device);
                iface.admin_up = read_admin_up(record.device, record.state);
                iface.kind = classify_interface({iface.name, iface.nm_type, iface.bus, iface.driver});
                if (!record.connection.empty() && starts_with(record.state, "connected"))
                {
                    iface.connected_network = record.connection;
                }
                iface.carries_internet = upstream && *upstream == iface.name;
                iface.label = make_interface_label(iface, {});

                interfaces.push_back(iface);
            }

            logger_->debug("Interface inventory refreshed", core::LogContext().add("count", interfaces.size()));
            return interfaces;
        }

        std::optional<std::string> InterfaceInventory::detect_upstream_interface(bool exclude_vpn)
        {
            std::chrono::milliseconds timeout(config_->probe.command_timeout_ms);

            if (!exclude_vpn)
            {
                auto route = runner_->run({"ip", "route", "get", config_->probe.upstream_probe_address}, timeout);
                if (route.ok())
                {
                    if (auto device = parse_route_device(route.output))
                    {
                        return device;
                    }
                }
            }

            auto defaults = runner_->run({"ip", "-4", "route", "show", "default"}, timeout);
            if (!defaults.ok())
            {
                return std::nullopt;
            }

            auto candidates = parse_default_route_devices(defaults.output);
            if (candidates.empty())
            {
                return std::nullopt;
            }
            if (!exclude_vpn)
            {
                return candidates.front();
            }

            for (const auto &candidate : candidates)
            {
                if (!is_vpn_name(candidate))
                {
                    return candidate;
                }
            }
            return candidates.front();
        }

        bool InterfaceInventory::read_admin_up(const std::string &name, const std::string &nm_state) const
        {
            std::filesystem::path flags_path = std::filesystem::path(config_->paths.sys_class_net) / name / "flags";
            std::ifstream flags_file(flags_path);
            std::string flags_str;
            if (flags_file >> flags_str)
            {
                try
                {
                    return (std::stoul(flags_str, nullptr, 16) & kIffUp) != 0;
                }
                catch (const std::exception &)
                {
                    logger_->debug("Unparseable interface flags",
                                   core::LogContext().add("interface", name).add("flags", flags_str));
                }
            }
            return nm_state != "unavailable" && nm_state != "unmanaged";
        }

        std::string InterfaceInventory::read_bus(const std::string &name) const
        {
            std::error_code ec;
            auto device = std::filesystem::canonical(
                std::filesystem::path(config_->paths.sys_class_net) / name / "device", ec);
            if (ec)
            {
                return "";
            }

            const std::string path = device.string();
            if (path.find("/usb") != std::string::npos)
                return "usb";
            if (path.find("/mmc") != std::string::npos || path.find("sdio") != std::string::npos)
                return "sdio";
            if (path.find("/pci") != std::string::npos)
                return "pci";
            return "";
        }

        std::string InterfaceInventory::read_driver(const std::string &name) const
        {
            std::error_code ec;
            auto driver = std::filesystem::read_symlink(
                std::filesystem::path(config_->paths.sys_class_net) / name / "device" / "driver", ec);
            if (ec)
            {
                return "";
            }
            return driver.filename().string();
        }

    } // namespace infrastructure
} // namespace hotspot
