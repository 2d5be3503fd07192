#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace hotspot
{
    namespace core
    {

        namespace
        {
            std::string current_timestamp()
            {
                auto now = std::chrono::system_clock::now();
                auto seconds = std::chrono::system_clock::to_time_t(now);
                auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

                std::tm local{};
                localtime_r(&seconds, &local);

                std::ostringstream ss;
                ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3) << millis;
                return ss.str();
            }

            bool is_secret_key(const std::string &key)
            {
                std::string lower = key;
                std::transform(lower.begin(), lower.end(), lower.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return lower.find("password") != std::string::npos || lower.find("psk") != std::string::npos ||
                       lower.find("passphrase") != std::string::npos;
            }

            // nmcli output often carries spaces and quotes
            std::string quote_if_needed(const std::string &value)
            {
                if (!value.empty() && value.find_first_of(" \t\"=") == std::string::npos)
                {
                    return value;
                }

                std::string quoted = "\"";
                for (char c : value)
                {
                    if (c == '"' || c == '\\')
                    {
                        quoted += '\\';
                    }
                    quoted += (c == '\n' || c == '\r') ? ' ' : c;
                }
                quoted += '"';
                return quoted;
            }
        } // namespace

        // LogContext implementation
        LogContext &LogContext::set(const std::string &key, std::string value)
        {
            if (is_secret_key(key))
            {
                value = "***";
            }

            auto it = std::find_if(fields_.begin(), fields_.end(),
                                   [&key](const std::pair<std::string, std::string> &field) { return field.first == key; });
            if (it != fields_.end())
            {
                it->second = std::move(value);
            }
            else
            {
                fields_.emplace_back(key, std::move(value));
            }
            return *this;
        }

        std::string LogContext::format() const
        {
            std::string out;
            for (const auto &[key, value] : fields_)
            {
                if (!out.empty())
                {
                    out += ' ';
                }
                out += key + "=" + quote_if_needed(value);
            }
            return out;
        }

        // LogOutput implementation
        void LogOutput::configure(const std::string &log_file, bool console_output)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            console_output_ = console_output;

            if (log_file == file_name_ && (log_file.empty() || file_.is_open()))
            {
                return;
            }

            if (file_.is_open())
            {
                file_.close();
            }
            file_name_ = log_file;
            if (log_file.empty())
            {
                return;
            }

            file_.open(log_file, std::ios::app);
            if (!file_.is_open())
            {
                // Nowhere else to report it; fall back to the console
                std::cerr << "Failed to open log file: " << log_file << std::endl;
                console_output_ = true;
                file_name_.clear();
            }
        }

        void LogOutput::write(const std::string &line)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            // stdout is reserved for --list-interfaces and --check output
            if (console_output_)
            {
                std::cerr << line << std::endl;
            }
            if (file_.is_open())
            {
                file_ << line << std::endl;
            }
        }

        // Logger implementation
        Logger::Logger(std::string name, LogLevel level, std::shared_ptr<LogOutput> output)
            : name_(std::move(name)), level_(level), output_(std::move(output))
        {
        }

        void Logger::debug(const std::string &message, const LogContext &context)
        {
            log(LogLevel::DEBUG, message, context);
        }

        void Logger::info(const std::string &message, const LogContext &context)
        {
            log(LogLevel::INFO, message, context);
        }

        void Logger::warning(const std::string &message, const LogContext &context)
        {
            log(LogLevel::WARNING, message, context);
        }

        void Logger::error(const std::string &message, const LogContext &context)
        {
            log(LogLevel::ERROR, message, context);
        }

        void Logger::critical(const std::string &message, const LogContext &context)
        {
            log(LogLevel::CRITICAL, message, context);
        }

        void Logger::log(LogLevel level, const std::string &message, const LogContext &context)
        {
            if (level < level_.load())
            {
                return;
            }

            std::ostringstream line;
            line << current_timestamp() << " " << std::left << std::setw(5) << level_name(level) << " [" << name_ << "] "
                 << message;
            if (!context.empty())
            {
                line << " | " << context.format();
            }
            output_->write(line.str());
        }

        // LoggerManager implementation
        LoggerManager::LoggerManager()
            : output_(std::make_shared<LogOutput>())
        {
        }

        LoggerManager &LoggerManager::instance()
        {
            static LoggerManager instance;
            return instance;
        }

        void LoggerManager::setup_logging(LogLevel level, const std::string &log_file, bool console_output)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            level_ = level;
            output_->configure(log_file, console_output);
            for (auto &entry : loggers_)
            {
                entry.second->set_level(level);
            }
        }

        std::shared_ptr<Logger> LoggerManager::get_logger(const std::string &name)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto &logger = loggers_[name];
            if (!logger)
            {
                logger = std::make_shared<Logger>(name, level_, output_);
            }
            return logger;
        }

        LogLevel parse_log_level(const std::string &level_str)
        {
            std::string upper = level_str;
            std::transform(upper.begin(), upper.end(), upper.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

            static const std::map<std::string, LogLevel> levels = {
                {"DEBUG", LogLevel::DEBUG},
                {"INFO", LogLevel::INFO},
                {"WARN", LogLevel::WARNING},
                {"WARNING", LogLevel::WARNING},
                {"ERROR", LogLevel::ERROR},
                {"CRIT", LogLevel::CRITICAL},
                {"CRITICAL", LogLevel::CRITICAL}};

            auto it = levels.find(upper);
            return it != levels.end() ? it->second : LogLevel::WARNING;
        }

        const char *level_name(LogLevel level)
        {
            switch (level)
            {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARNING:
                return "WARN";
            case LogLevel::ERROR:
                return "ERROR";
            case LogLevel::CRITICAL:
                return "CRIT";
            }
            return "?";
        }

        std::shared_ptr<Logger> get_logger(const std::string &name)
        {
            return LoggerManager::instance().get_logger(name);
        }

        void setup_logging(LogLevel level, const std::string &log_file, bool console_output)
        {
            LoggerManager::instance().setup_logging(level, log_file, console_output);
        }

    } // namespace core
} // namespace hotspot
