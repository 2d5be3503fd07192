#ifndef HOTSPOT_SERVICES_STATUS_PUBLISHER_HPP
#define HOTSPOT_SERVICES_STATUS_PUBLISHER_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>
#include <nlohmann/json.hpp>

#include "core/errors.hpp"
#include "core/session.hpp"

namespace hotspot
{
    namespace core
    {
        class HotspotConfig;
        class Logger;
    }
}

namespace hotspot
{
    namespace services
    {

        /**
         * Session facts that accompany a state in the status record
         */
        struct StatusDetails
        {
            std::string message;
            std::vector<std::string> warnings;
            std::string ssid;
            std::string interface;
            std::optional<std::string> internet_interface;
            std::optional<core::TimePoint> started_at;
            std::optional<core::TimePoint> auto_off_deadline;
        };

        /**
         * The record written to the status file and served by the status API
         */
        struct StatusRecord
        {
            double timestamp = 0.0;
            std::string status = "idle";
            std::string state = "Idle";
            std::string message;
            bool is_error = false;
            std::string error_code;
            int exit_code = 0;
            std::vector<std::string> reasons;
            std::vector<std::string> warnings;
            std::optional<double> started_at;
            std::optional<double> auto_off_deadline;
            std::string ssid;
            std::string interface;
            std::string internet_interface;
            int pid = 0;

            nlohmann::json to_json() const;
        };

        // Lowercase status word used by the presentation layer
        const char *status_word(core::HotspotState state);

        double to_epoch_seconds(const core::TimePoint &time);

        /**
         * Publishes lifecycle transitions to the status file and keeps the PID record.
         * Publishing is best-effort: failures are logged and reported as false, never thrown.
         */
        class StatusPublisher
        {
        public:
            explicit StatusPublisher(const std::shared_ptr<core::HotspotConfig> &config);

            bool publish(core::HotspotState state,
                         const std::optional<core::ErrorInfo> &error,
                         const StatusDetails &details);

            StatusRecord latest() const;

            bool write_pid_record(pid_t pid);
            bool clear_pid_record();

            static std::optional<pid_t> read_pid_record(const std::string &path);

        private:
            bool write_atomically(const std::string &path, const std::string &content);

            std::shared_ptr<core::HotspotConfig> config_;
            std::shared_ptr<core::Logger> logger_;

            mutable std::mutex mutex_;
            StatusRecord latest_;
        };

    } // namespace services
} // namespace hotspot

#endif // HOTSPOT_SERVICES_STATUS_PUBLISHER_HPP
