#include "core/errors.hpp"

namespace hotspot
{
    namespace core
    {

        int ErrorInfo::exit_code() const
        {
            if (kind == ErrorKind::Blocked && !reasons.empty())
            {
                return exit_code_for(reasons.front());
            }
            return exit_code_for(kind);
        }

        std::string ErrorInfo::code() const
        {
            if (kind == ErrorKind::Blocked && !reasons.empty())
            {
                return to_string(reasons.front());
            }
            return to_string(kind);
        }

        const char *to_string(ErrorKind kind)
        {
            switch (kind)
            {
            case ErrorKind::None:
                return "None";
            case ErrorKind::InvalidConfig:
                return "InvalidConfig";
            case ErrorKind::ServiceUnavailable:
                return "ServiceUnavailable";
            case ErrorKind::DeviceUnreachable:
                return "DeviceUnreachable";
            case ErrorKind::NoInternetSource:
                return "NoInternetSource";
            case ErrorKind::ApplyFailure:
                return "ApplyFailure";
            case ErrorKind::SessionActive:
                return "SessionActive";
            case ErrorKind::PrivilegeRequired:
                return "PrivilegeRequired";
            case ErrorKind::PublishFailure:
                return "PublishFailure";
            case ErrorKind::Blocked:
                return "Blocked";
            case ErrorKind::Internal:
                return "Internal";
            }
            return "Internal";
        }

        const char *to_string(BlockReason reason)
        {
            switch (reason)
            {
            case BlockReason::RFKillActive:
                return "RFKillActive";
            case BlockReason::NoAPSupport:
                return "NoAPSupport";
            case BlockReason::MonitorModeActive:
                return "MonitorModeActive";
            case BlockReason::BandUnsupported:
                return "BandUnsupported";
            case BlockReason::InterfaceDown:
                return "InterfaceDown";
            case BlockReason::SingleAdapterLockout:
                return "SingleAdapterLockout";
            }
            return "Unknown";
        }

        int exit_code_for(ErrorKind kind)
        {
            switch (kind)
            {
            case ErrorKind::None:
                return 0;
            case ErrorKind::InvalidConfig:
                return 2;
            case ErrorKind::ServiceUnavailable:
                return 3;
            case ErrorKind::DeviceUnreachable:
                return 4;
            case ErrorKind::NoInternetSource:
                return 5;
            case ErrorKind::ApplyFailure:
                return 6;
            case ErrorKind::SessionActive:
                return 7;
            case ErrorKind::PrivilegeRequired:
                return 8;
            case ErrorKind::PublishFailure:
            case ErrorKind::Blocked:
            case ErrorKind::Internal:
                return 1;
            }
            return 1;
        }

        int exit_code_for(BlockReason reason)
        {
            switch (reason)
            {
            case BlockReason::RFKillActive:
                return 10;
            case BlockReason::NoAPSupport:
                return 11;
            case BlockReason::MonitorModeActive:
                return 12;
            case BlockReason::BandUnsupported:
                return 13;
            case BlockReason::InterfaceDown:
                return 14;
            case BlockReason::SingleAdapterLockout:
                return 15;
            }
            return 1;
        }

        bool is_overridable(BlockReason reason)
        {
            return reason == BlockReason::SingleAdapterLockout;
        }

        std::string remedy_for(BlockReason reason)
        {
            switch (reason)
            {
            case BlockReason::RFKillActive:
                return "Wi-Fi is blocked by rfkill. Check the physical Wi-Fi switch or run: sudo rfkill unblock wifi";
            case BlockReason::NoAPSupport:
                return "The selected adapter does not support AP (Access Point) mode. Use a different Wi-Fi adapter.";
            case BlockReason::MonitorModeActive:
                return "The selected adapter is in monitor mode. Switch it back to managed mode before starting the hotspot.";
            case BlockReason::BandUnsupported:
                return "The selected adapter does not support the requested band. Use 2.4GHz (band g) instead.";
            case BlockReason::InterfaceDown:
                return "The selected interface is down or missing. Bring it up or check its driver.";
            case BlockReason::SingleAdapterLockout:
                return "Your only Wi-Fi adapter provides your internet connection and cannot run a hotspot at the same time. "
                       "Connect via Ethernet, add a second Wi-Fi adapter, or pass --force-single-interface if you accept losing connectivity.";
            }
            return "";
        }

    } // namespace core
} // namespace hotspot
