#include "services/safety_evaluator.hpp"

#include <algorithm>

namespace hotspot
{
    namespace services
    {

        namespace
        {
            using infrastructure::CapabilitySet;
            using infrastructure::NetworkInterface;

            const NetworkInterface *find_interface(const std::vector<NetworkInterface> &inventory,
                                                   const std::string &name)
            {
                auto it = std::find_if(inventory.begin(), inventory.end(),
                                       [&name](const NetworkInterface &iface) { return iface.name == name; });
                return it != inventory.end() ? &*it : nullptr;
            }

            const CapabilitySet *find_capabilities(const std::map<std::string, CapabilitySet> &capabilities,
                                                   const std::string &name)
            {
                auto it = capabilities.find(name);
                return it != capabilities.end() ? &it->second : nullptr;
            }

            SafetyVerdict block(core::BlockReason reason, std::vector<std::string> warnings)
            {
                SafetyVerdict verdict;
                verdict.outcome = VerdictOutcome::Block;
                verdict.reasons.push_back(reason);
                verdict.warnings = std::move(warnings);
                verdict.message = core::remedy_for(reason);
                return verdict;
            }

            // Same name, or two wireless interfaces sharing one radio
            bool same_adapter(const std::string &hotspot_interface,
                              const std::string &internet_interface,
                              const std::vector<NetworkInterface> &inventory,
                              const std::map<std::string, CapabilitySet> &capabilities)
            {
                if (hotspot_interface == internet_interface)
                {
                    return true;
                }

                const NetworkInterface *internet = find_interface(inventory, internet_interface);
                if (!internet || !internet->is_wireless())
                {
                    return false;
                }

                const CapabilitySet *hotspot_caps = find_capabilities(capabilities, hotspot_interface);
                const CapabilitySet *internet_caps = find_capabilities(capabilities, internet_interface);
                return hotspot_caps && internet_caps && !hotspot_caps->phy.empty() &&
                       hotspot_caps->phy == internet_caps->phy;
            }
        } // namespace

        std::optional<core::BlockReason> SafetyVerdict::primary_reason() const
        {
            if (reasons.empty())
            {
                return std::nullopt;
            }
            return reasons.front();
        }

        bool SafetyVerdict::operator==(const SafetyVerdict &other) const
        {
            return outcome == other.outcome && reasons == other.reasons && warnings == other.warnings &&
                   overridden == other.overridden && message == other.message;
        }

        SafetyVerdict SafetyEvaluator::evaluate(const std::string &hotspot_interface,
                                                const std::optional<std::string> &internet_interface,
                                                const std::vector<infrastructure::NetworkInterface> &inventory,
                                                const std::map<std::string, infrastructure::CapabilitySet> &capabilities,
                                                bool force_single_interface,
                                                core::Band band) const
        {
            std::vector<std::string> warnings;

            const NetworkInterface *hotspot = find_interface(inventory, hotspot_interface);
            const CapabilitySet *caps = find_capabilities(capabilities, hotspot_interface);

            if (!internet_interface || !find_interface(inventory, *internet_interface))
            {
                warnings.push_back("No internet source detected. Clients will not have internet access.");
            }
            if (hotspot && hotspot->connected_network &&
                (!internet_interface || *internet_interface != hotspot_interface))
            {
                warnings.push_back(hotspot_interface + " is connected to '" + *hotspot->connected_network +
                                   "' and will be disconnected.");
            }

            if (caps && caps->reachable && caps->rfkill.blocked())
            {
                return block(core::BlockReason::RFKillActive, warnings);
            }

            if (!caps || !caps->reachable || !caps->supports_ap)
            {
                return block(core::BlockReason::NoAPSupport, warnings);
            }

            if (caps->current_mode == infrastructure::InterfaceMode::Monitor)
            {
                return block(core::BlockReason::MonitorModeActive, warnings);
            }

            bool band_ok = band == core::Band::FiveGHz ? caps->supports_5ghz : caps->supports_24ghz;
            if (!band_ok)
            {
                return block(core::BlockReason::BandUnsupported, warnings);
            }

            if (!hotspot || !hotspot->admin_up)
            {
                return block(core::BlockReason::InterfaceDown, warnings);
            }

            SafetyVerdict verdict;
            verdict.message = "Pre-flight checks passed";

            if (internet_interface && same_adapter(hotspot_interface, *internet_interface, inventory, capabilities))
            {
                if (!caps->supports_sta_ap_concurrency())
                {
                    if (!force_single_interface)
                    {
                        return block(core::BlockReason::SingleAdapterLockout, warnings);
                    }
                    verdict.overridden = true;
                    warnings.push_back("Single adapter override: " + hotspot_interface +
                                       " cannot serve the hotspot and the internet connection at once. "
                                       "Internet access will be lost while the hotspot runs.");
                }
                else if (caps->sta_ap_same_channel_only())
                {
                    warnings.push_back("The access point will follow the channel of the current Wi-Fi connection.");
                }
            }

            verdict.warnings = std::move(warnings);
            return verdict;
        }

        std::vector<std::string> SafetyEvaluator::ssid_warnings(const std::string &ssid)
        {
            std::vector<std::string> warnings;
            bool ascii = std::all_of(ssid.begin(), ssid.end(),
                                     [](char c) { return static_cast<unsigned char>(c) < 0x80; });
            if (!ascii)
            {
                warnings.push_back("SSID contains non-ASCII characters and may not display correctly on all devices.");
            }
            return warnings;
        }

    } // namespace services
} // namespace hotspot
