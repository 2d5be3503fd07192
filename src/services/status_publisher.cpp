#include "services/status_publisher.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace hotspot
{
    namespace services
    {

        nlohmann::json StatusRecord::to_json() const
        {
            nlohmann::json j{
                {"timestamp", timestamp},
                {"status", status},
                {"state", state},
                {"message", message},
                {"is_error", is_error},
                {"error_code", error_code},
                {"exit_code", exit_code},
                {"reasons", reasons},
                {"warnings", warnings},
                {"ssid", ssid},
                {"interface", interface},
                {"internet_interface", internet_interface},
                {"pid", pid}};

            j["started_at"] = started_at ? nlohmann::json(*started_at) : nlohmann::json(nullptr);
            j["auto_off_deadline"] = auto_off_deadline ? nlohmann::json(*auto_off_deadline) : nlohmann::json(nullptr);
            return j;
        }

        const char *status_word(core::HotspotState state)
        {
            switch (state)
            {
            case core::HotspotState::Idle:
                return "idle";
            case core::HotspotState::Validating:
                return "validating";
            case core::HotspotState::Starting:
                return "starting";
            case core::HotspotState::Running:
                return "active";
            case core::HotspotState::Stopping:
                return "stopping";
            case core::HotspotState::Failed:
                return "error";
            }
            return "error";
        }

        double to_epoch_seconds(const core::TimePoint &time)
        {
            return std::chrono::duration<double>(time.time_since_epoch()).count();
        }

        StatusPublisher::StatusPublisher(const std::shared_ptr<core::HotspotConfig> &config)
            : config_(config), logger_(core::get_logger("status_publisher"))
        {
        }

        bool StatusPublisher::publish(core::HotspotState state,
                                      const std::optional<core::ErrorInfo> &error,
                                      const StatusDetails &details)
        {
            StatusRecord record;
            record.timestamp = to_epoch_seconds(std::chrono::system_clock::now());
            record.status = status_word(state);
            record.state = core::to_string(state);
            record.message = details.message;
            record.warnings = details.warnings;
            record.ssid = details.ssid;
            record.interface = details.interface;
            record.internet_interface = details.internet_interface.value_or("");
            record.pid = static_cast<int>(getpid());

            if (details.started_at)
            {
                record.started_at = to_epoch_seconds(*details.started_at);
            }
            if (details.auto_off_deadline)
            {
                record.auto_off_deadline = to_epoch_seconds(*details.auto_off_deadline);
            }

            if (error && error->kind != core::ErrorKind::None)
            {
                record.is_error = true;
                record.error_code = error->code();
                record.exit_code = error->exit_code();
                for (auto reason : error->reasons)
                {
                    record.reasons.push_back(core::to_string(reason));
                }
                if (record.message.empty())
                {
                    record.message = error->message;
                }
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                latest_ = record;
            }

            std::string serialized;
            try
            {
                // Interface names and SSIDs are raw bytes, not necessarily UTF-8
                serialized = record.to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            }
            catch (const nlohmann::json::exception &e)
            {
                logger_->error("Status record not serializable",
                               core::LogContext()
                                   .add("error_code", core::to_string(core::ErrorKind::PublishFailure))
                                   .add("error", e.what()));
                return false;
            }

            if (!write_atomically(config_->paths.status_file, serialized))
            {
                logger_->error("Status publish failed",
                               core::LogContext()
                                   .add("error_code", core::to_string(core::ErrorKind::PublishFailure))
                                   .add("path", config_->paths.status_file)
                                   .add("status", record.status));
                return false;
            }

            logger_->debug("Status published", core::LogContext().add("status", record.status).add("message", record.message));
            return true;
        }

        StatusRecord StatusPublisher::latest() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return latest_;
        }

        bool StatusPublisher::write_pid_record(pid_t pid)
        {
            if (!write_atomically(config_->paths.pid_file, std::to_string(pid) + "\n"))
            {
                logger_->error("Failed to write PID record", core::LogContext().add("path", config_->paths.pid_file));
                return false;
            }
            return true;
        }

        bool StatusPublisher::clear_pid_record()
        {
            std::error_code ec;
            std::filesystem::remove(config_->paths.pid_file, ec);
            if (ec)
            {
                logger_->warning("Failed to remove PID record",
                                 core::LogContext().add("path", config_->paths.pid_file).add("error", ec.message()));
                return false;
            }
            return true;
        }

        std::optional<pid_t> StatusPublisher::read_pid_record(const std::string &path)
        {
            std::ifstream file(path);
            std::string pid_str;
            if (!std::getline(file, pid_str))
            {
                return std::nullopt;
            }

            try
            {
                long pid = std::stol(pid_str);
                if (pid <= 0)
                {
                    return std::nullopt;
                }
                return static_cast<pid_t>(pid);
            }
            catch (const std::exception &)
            {
                return std::nullopt;
            }
        }

        bool StatusPublisher::write_atomically(const std::string &path, const std::string &content)
        {
            const std::string tmp_path = path + ".tmp";
            {
                std::ofstream out(tmp_path, std::ios::trunc);
                if (!out.is_open())
                {
                    return false;
                }
                out << content;
                out.flush();
                if (!out)
                {
                    return false;
                }
            }

            std::error_code ec;
            std::filesystem::rename(tmp_path, path, ec);
            if (ec)
            {
                std::filesystem::remove(tmp_path, ec);
                return false;
            }
            return true;
        }

    } // namespace services
} // namespace hotspot
