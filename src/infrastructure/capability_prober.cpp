#include "infrastructure/capability_prober.hpp"
#include "infrastructure/command_runner.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <future>
#include <limits>
#include <stdexcept>
#include <regex>
#include <sstream>

namespace hotspot
{
    namespace infrastructure
    {

        namespace
        {
            std::string trim(const std::string &value)
            {
                const char *whitespace = " \t\r\n";
                auto start = value.find_first_not_of(whitespace);
                if (start == std::string::npos)
                {
                    return "";
                }
                auto end = value.find_last_not_of(whitespace);
                return value.substr(start, end - start + 1);
            }

            // Digits matched by a regex; a value too large for int means "no practical limit"
            int parse_count(const std::string &digits)
            {
                try
                {
                    return std::stoi(digits);
                }
                catch (const std::out_of_range &)
                {
                    return std::numeric_limits<int>::max();
                }
            }

            // Tabs count as 8 columns, as iw prints them
            int indent_of(const std::string &line)
            {
                int indent = 0;
                for (char c : line)
                {
                    if (c == '\t')
                        indent += 8;
                    else if (c == ' ')
                        indent += 1;
                    else
                        break;
                }
                return indent;
            }

            std::vector<std::string> split_lines(const std::string &raw)
            {
                std::vector<std::string> lines;
                std::istringstream stream(raw);
                std::string line;
                while (std::getline(stream, line))
                {
                    lines.push_back(line);
                }
                return lines;
            }

            /**
             * Bullet entries of every section introduced by `header`. Lines
             * nested deeper than the bullet that do not start with '*' are
             * continuations of the previous entry.
             */
            std::vector<std::string> section_entries(const std::vector<std::string> &lines, const std::string &header)
            {
                std::vector<std::string> entries;
                for (size_t i = 0; i < lines.size(); ++i)
                {
                    if (trim(lines[i]).compare(0, header.size(), header) != 0)
                    {
                        continue;
                    }

                    int base = indent_of(lines[i]);
                    bool have_entry = false;
                    size_t j = i + 1;
                    for (; j < lines.size(); ++j)
                    {
                        std::string text = trim(lines[j]);
                        if (text.empty())
                        {
                            continue;
                        }
                        if (indent_of(lines[j]) <= base)
                        {
                            break;
                        }
                        if (text[0] == '*')
                        {
                            entries.push_back(trim(text.substr(1)));
                            have_entry = true;
                        }
                        else if (have_entry)
                        {
                            entries.back() += " " + text;
                        }
                    }
                    i = j - 1;
                }
                return entries;
            }
        } // namespace

        // ConcurrencyGroup implementation
        bool ConcurrencyGroup::allows_sta_ap() const
        {
            if (!interfaces.count(InterfaceRole::Managed) || !interfaces.count(InterfaceRole::AP))
            {
                return false;
            }

            int total = max_total;
            if (total <= 0)
            {
                for (const auto &limit : limits)
                {
                    total += limit.max;
                }
            }
            if (total < 2)
            {
                return false;
            }

            for (const auto &limit : limits)
            {
                bool has_sta = limit.roles.count(InterfaceRole::Managed) > 0;
                bool has_ap = limit.roles.count(InterfaceRole::AP) > 0;
                if (has_sta && has_ap && limit.max < 2)
                {
                    return false;
                }
            }
            return true;
        }

        // CapabilitySet implementation
        bool CapabilitySet::supports_sta_ap_concurrency() const
        {
            return std::any_of(concurrency_groups.begin(), concurrency_groups.end(),
                               [](const ConcurrencyGroup &group) { return group.allows_sta_ap(); });
        }

        bool CapabilitySet::sta_ap_same_channel_only() const
        {
            bool any = false;
            for (const auto &group : concurrency_groups)
            {
                if (!group.allows_sta_ap())
                {
                    continue;
                }
                if (!group.same_channel_required)
                {
                    return false;
                }
                any = true;
            }
            return any;
        }

        CapabilitySet CapabilitySet::unreachable(const std::string &interface)
        {
            CapabilitySet capabilities;
            capabilities.interface = interface;
            capabilities.reachable = false;
            return capabilities;
        }

        InterfaceRole parse_role(const std::string &name)
        {
            static const std::map<std::string, InterfaceRole> roles = {
                {"managed", InterfaceRole::Managed},
                {"AP", InterfaceRole::AP},
                {"AP/VLAN", InterfaceRole::APVlan},
                {"IBSS", InterfaceRole::IBSS},
                {"monitor", InterfaceRole::Monitor},
                {"mesh point", InterfaceRole::MeshPoint},
                {"P2P-client", InterfaceRole::P2PClient},
                {"P2P-GO", InterfaceRole::P2PGO},
                {"P2P-device", InterfaceRole::P2PDevice}};

            auto it = roles.find(trim(name));
            return it != roles.end() ? it->second : InterfaceRole::Other;
        }

        InterfaceMode parse_mode(const std::string &name)
        {
            if (name == "managed")
                return InterfaceMode::Managed;
            if (name == "monitor")
                return InterfaceMode::Monitor;
            if (name == "AP")
                return InterfaceMode::AP;
            return InterfaceMode::Unknown;
        }

        std::vector<ConcurrencyGroup> parse_combinations(const std::string &raw)
        {
            static const std::regex limit_regex(R"(#\{\s*([^}]*)\}\s*<=\s*(\d+))");
            static const std::regex total_regex(R"(total\s*<=\s*(\d+))");
            static const std::regex channels_regex(R"(#channels\s*<=\s*(\d+))");

            std::vector<ConcurrencyGroup> groups;
            for (const auto &entry : section_entries(split_lines(raw), "valid interface combinations:"))
            {
                ConcurrencyGroup group;

                for (auto it = std::sregex_iterator(entry.begin(), entry.end(), limit_regex);
                     it != std::sregex_iterator(); ++it)
                {
                    CombinationLimit limit;
                    limit.max = parse_count((*it)[2].str());

                    std::istringstream names((*it)[1].str());
                    std::string name;
                    while (std::getline(names, name, ','))
                    {
                        name = trim(name);
                        if (name.empty())
                        {
                            continue;
                        }
                        InterfaceRole role = parse_role(name);
                        limit.roles.insert(role);
                        group.interfaces.insert(role);
                    }
                    group.limits.push_back(limit);
                }

                std::smatch match;
                if (std::regex_search(entry, match, total_regex))
                {
                    group.max_total = parse_count(match[1].str());
                }
                if (std::regex_search(entry, match, channels_regex))
                {
                    group.max_channels = parse_count(match[1].str());
                }
                group.same_channel_required = group.max_channels <= 1;

                if (!group.limits.empty())
                {
                    groups.push_back(group);
                }
            }
            return groups;
        }

        PhyInfo parse_phy_info(const std::string &raw)
        {
            static const std::regex frequency_regex(R"(^(\d+)(?:\.\d+)?\s*MHz)");

            PhyInfo info;
            auto lines = split_lines(raw);

            for (const auto &mode : section_entries(lines, "Supported interface modes:"))
            {
                info.supported_modes.insert(parse_role(mode));
            }

            for (const auto &entry : section_entries(lines, "Frequencies:"))
            {
                std::smatch match;
                if (!std::regex_search(entry, match, frequency_regex))
                {
                    continue;
                }
                if (entry.find("disabled") != std::string::npos)
                {
                    continue;
                }

                int mhz = parse_count(match[1].str());
                if (mhz >= 2400 && mhz <= 2500)
                {
                    info.supports_24ghz = true;
                }
                else if (mhz >= 4900 && mhz <= 5900)
                {
                    info.supports_5ghz = true;
                }
            }

            info.combinations = parse_combinations(raw);
            return info;
        }

        DevInfo parse_dev_info(const std::string &raw)
        {
            DevInfo info;
            for (const auto &line : split_lines(raw))
            {
                std::istringstream fields(trim(line));
                std::string key;
                std::string value;
                if (!(fields >> key >> value))
                {
                    continue;
                }

                if (key == "type")
                {
                    info.mode = parse_mode(value);
                }
                else if (key == "wiphy")
                {
                    try
                    {
                        info.wiphy = std::stoi(value);
                    }
                    catch (const std::exception &)
                    {
                        info.wiphy = -1;
                    }
                }
            }
            return info;
        }

        RfkillState parse_rfkill(const std::string &raw, const std::string &phy)
        {
            static const std::regex header_regex(R"(^\s*\d+:\s*([^:]+):\s*(.+?)\s*$)");

            RfkillState state;
            bool relevant = false;
            for (const auto &line : split_lines(raw))
            {
                std::smatch match;
                if (std::regex_match(line, match, header_regex))
                {
                    std::string name = match[1].str();
                    std::string type = match[2].str();
                    bool is_wlan = type == "Wireless LAN";
                    bool is_phy = name.compare(0, 3, "phy") == 0;

                    // Platform switches (e.g. dell-wifi, ideapad_wlan) block every radio
                    relevant = is_wlan && (phy.empty() || name == phy || !is_phy);
                    continue;
                }

                if (!relevant)
                {
                    continue;
                }

                std::string text = trim(line);
                if (text == "Soft blocked: yes")
                {
                    state.soft_blocked = true;
                }
                else if (text == "Hard blocked: yes")
                {
                    state.hard_blocked = true;
                }
            }
            return state;
        }

        const char *to_string(InterfaceMode mode)
        {
            switch (mode)
            {
            case InterfaceMode::Managed:
                return "managed";
            case InterfaceMode::Monitor:
                return "monitor";
            case InterfaceMode::AP:
                return "AP";
            case InterfaceMode::Unknown:
                return "unknown";
            }
            return "unknown";
        }

        const char *to_string(InterfaceRole role)
        {
            switch (role)
            {
            case InterfaceRole::Managed:
                return "managed";
            case InterfaceRole::AP:
                return "AP";
            case InterfaceRole::APVlan:
                return "AP/VLAN";
            case InterfaceRole::IBSS:
                return "IBSS";
            case InterfaceRole::Monitor:
                return "monitor";
            case InterfaceRole::MeshPoint:
                return "mesh point";
            case InterfaceRole::P2PClient:
                return "P2P-client";
            case InterfaceRole::P2PGO:
                return "P2P-GO";
            case InterfaceRole::P2PDevice:
                return "P2P-device";
            case InterfaceRole::Other:
                return "other";
            }
            return "other";
        }

        std::vector<std::string> capability_tags(const CapabilitySet &capabilities)
        {
            std::vector<std::string> tags;
            if (!capabilities.reachable)
            {
                return tags;
            }
            if (capabilities.supports_ap)
            {
                tags.push_back("AP");
            }
            if (capabilities.supports_5ghz)
            {
                tags.push_back("5GHz");
            }
            if (capabilities.rfkill.blocked())
            {
                tags.push_back("rfkill");
            }
            return tags;
        }

        std::string concurrency_label(const CapabilitySet &capabilities)
        {
            if (!capabilities.supports_sta_ap_concurrency())
            {
                return "no STA+AP";
            }
            return capabilities.sta_ap_same_channel_only() ? "STA+AP (same channel)" : "STA+AP (multi-channel)";
        }

        // CapabilityProber implementation
        CapabilityProber::CapabilityProber(std::shared_ptr<CommandRunner> runner,
                                           const std::shared_ptr<core::HotspotConfig> &config)
            : runner_(std::move(runner)), config_(config), logger_(core::get_logger("capability_prober"))
        {
        }

        CapabilitySet CapabilityProber::probe(const std::string &interface)
        {
            std::chrono::milliseconds timeout(config_->probe.command_timeout_ms);

            auto dev = runner_->run({"iw", "dev", interface, "info"}, timeout);
            if (!dev.ok())
            {
                throw core::HotspotError(core::ErrorKind::DeviceUnreachable,
                                         "Cannot query wireless device " + interface);
            }

            DevInfo dev_info = parse_dev_info(dev.output);
            if (dev_info.wiphy < 0)
            {
                throw core::HotspotError(core::ErrorKind::DeviceUnreachable,
                                         "No wiphy reported for " + interface);
            }

            CapabilitySet capabilities;
            capabilities.interface = interface;
            capabilities.phy = "phy" + std::to_string(dev_info.wiphy);
            capabilities.current_mode = dev_info.mode;

            auto phy = runner_->run({"iw", "phy", capabilities.phy, "info"}, timeout);
            if (!phy.ok())
            {
                throw core::HotspotError(core::ErrorKind::DeviceUnreachable,
                                         "Cannot query radio " + capabilities.phy + " of " + interface);
            }

            PhyInfo phy_info = parse_phy_info(phy.output);
            capabilities.supported_modes = phy_info.supported_modes;
            capabilities.supports_ap = phy_info.supported_modes.count(InterfaceRole::AP) > 0;
            capabilities.supports_24ghz = phy_info.supports_24ghz;
            capabilities.supports_5ghz = phy_info.supports_5ghz;
            capabilities.concurrency_groups = phy_info.combinations;

            auto rfkill = runner_->run({"rfkill", "list"}, timeout);
            if (rfkill.ok())
            {
                capabilities.rfkill = parse_rfkill(rfkill.output, capabilities.phy);
            }
            else
            {
                logger_->debug("rfkill unavailable, assuming radio not blocked",
                               core::LogContext().add("interface", interface));
            }

            logger_->debug("Probed wireless capabilities",
                           core::LogContext()
                               .add("interface", interface)
                               .add("phy", capabilities.phy)
                               .add("mode", to_string(capabilities.current_mode))
                               .add("ap", capabilities.supports_ap)
                               .add("5ghz", capabilities.supports_5ghz)
                               .add("rfkill", capabilities.rfkill.blocked())
                               .add("concurrency", concurrency_label(capabilities)));
            return capabilities;
        }

        CapabilitySet CapabilityProber::probe_or_assume_incapable(const std::string &interface)
        {
            try
            {
                return probe(interface);
            }
            catch (const core::HotspotError &e)
            {
                if (e.kind() != core::ErrorKind::DeviceUnreachable)
                {
                    throw;
                }
                logger_->warning("Device unreachable, assuming no AP capability",
                                 core::LogContext().add("interface", interface).add("error", e.what()));
                return CapabilitySet::unreachable(interface);
            }
        }

        std::map<std::string, CapabilitySet> CapabilityProber::probe_all(const std::vector<std::string> &interfaces)
        {
            std::map<std::string, std::future<CapabilitySet>> pending;
            for (const auto &interface : interfaces)
            {
                if (pending.count(interface))
                {
                    continue;
                }
                pending.emplace(interface, std::async(std::launch::async, [this, interface]() {
                                    return probe_or_assume_incapable(interface);
                                }));
            }

            std::map<std::string, CapabilitySet> results;
            for (auto &[interface, future] : pending)
            {
                results.emplace(interface, future.get());
            }
            return results;
        }

    } // namespace infrastructure
} // namespace hotspot
