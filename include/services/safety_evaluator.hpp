#ifndef HOTSPOT_SERVICES_SAFETY_EVALUATOR_HPP
#define HOTSPOT_SERVICES_SAFETY_EVALUATOR_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/errors.hpp"
#include "core/session.hpp"
#include "infrastructure/capability_prober.hpp"
#include "infrastructure/interface_inventory.hpp"

namespace hotspot
{
    namespace services
    {

        enum class VerdictOutcome
        {
            Allow,
            Block
        };

        struct SafetyVerdict
        {
            VerdictOutcome outcome = VerdictOutcome::Allow;
            std::vector<core::BlockReason> reasons;
            std::vector<std::string> warnings;
            bool overridden = false; // allowed only because of --force-single-interface
            std::string message;

            bool allowed() const { return outcome == VerdictOutcome::Allow; }
            std::optional<core::BlockReason> primary_reason() const;

            bool operator==(const SafetyVerdict &other) const;
            bool operator!=(const SafetyVerdict &other) const { return !(*this == other); }
        };

        /**
         * Go/no-go decision for a hotspot start. Stateless; equal inputs
         * always produce equal verdicts.
         *
         * Rules are checked in precedence order and the first failing rule
         * decides: RFKillActive, NoAPSupport, MonitorModeActive,
         * BandUnsupported, InterfaceDown, SingleAdapterLockout. Only the last
         * one yields to force_single_interface.
         */
        class SafetyEvaluator
        {
        public:
            SafetyVerdict evaluate(const std::string &hotspot_interface,
                                   const std::optional<std::string> &internet_interface,
                                   const std::vector<infrastructure::NetworkInterface> &inventory,
                                   const std::map<std::string, infrastructure::CapabilitySet> &capabilities,
                                   bool force_single_interface,
                                   core::Band band) const;

            // Non-blocking remarks about the SSID itself
            static std::vector<std::string> ssid_warnings(const std::string &ssid);
        };

    } // namespace services
} // namespace hotspot

#endif // HOTSPOT_SERVICES_SAFETY_EVALUATOR_HPP
