#ifndef HOTSPOT_CORE_ERRORS_HPP
#define HOTSPOT_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

namespace hotspot
{
    namespace core
    {

        /**
         * Failure taxonomy shared by every module. Each kind maps to a stable exit code.
         */
        enum class ErrorKind
        {
            None,
            InvalidConfig,
            ServiceUnavailable,
            DeviceUnreachable,
            NoInternetSource,
            ApplyFailure,
            SessionActive,
            PrivilegeRequired,
            PublishFailure,
            Blocked,
            Internal
        };

        /**
         * Reasons the safety evaluator can refuse a start request, in precedence order
         */
        enum class BlockReason
        {
            RFKillActive,
            NoAPSupport,
            MonitorModeActive,
            BandUnsupported,
            InterfaceDown,
            SingleAdapterLockout
        };

        class HotspotError : public std::runtime_error
        {
        public:
            HotspotError(ErrorKind kind, const std::string &message)
                : std::runtime_error(message), kind_(kind) {}

            ErrorKind kind() const noexcept { return kind_; }

        private:
            ErrorKind kind_;
        };

        /**
         * Last error of a start attempt, as reported to the caller and the status record
         */
        struct ErrorInfo
        {
            ErrorKind kind = ErrorKind::None;
            std::vector<BlockReason> reasons;
            std::string message;

            int exit_code() const;
            std::string code() const;
        };

        const char *to_string(ErrorKind kind);
        const char *to_string(BlockReason reason);

        int exit_code_for(ErrorKind kind);
        int exit_code_for(BlockReason reason);

        bool is_overridable(BlockReason reason);

        // Operator-facing remedy text, one per reason
        std::string remedy_for(BlockReason reason);

    } // namespace core
} // namespace hotspot

#endif // HOTSPOT_CORE_ERRORS_HPP
