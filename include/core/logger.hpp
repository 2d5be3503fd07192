#ifndef HOTSPOT_CORE_LOGGER_HPP
#define HOTSPOT_CORE_LOGGER_HPP

#include <atomic>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace hotspot
{
    namespace core
    {

        /**
         * Log levels
         */
        enum class LogLevel
        {
            DEBUG = 0,
            INFO = 1,
            WARNING = 2,
            ERROR = 3,
            CRITICAL = 4
        };

        /**
         * Structured key=value fields appended to a log line, in insertion order.
         * Values of secret keys (password, psk, passphrase) are never written.
         */
        class LogContext
        {
        public:
            LogContext() = default;

            template <typename T>
            LogContext &add(const std::string &key, const T &value)
            {
                std::ostringstream ss;
                ss << value;
                return set(key, ss.str());
            }

            LogContext &add(const std::string &key, bool value)
            {
                return set(key, value ? "true" : "false");
            }

            std::string format() const;
            bool empty() const { return fields_.empty(); }

        private:
            LogContext &set(const std::string &key, std::string value);

            std::vector<std::pair<std::string, std::string>> fields_;
        };

        /**
         * Destination shared by every logger of the process: stderr and/or one log file
         */
        class LogOutput
        {
        public:
            // An unopenable file falls back to console output
            void configure(const std::string &log_file, bool console_output);
            void write(const std::string &line);

        private:
            std::mutex mutex_;
            bool console_output_ = true;
            std::string file_name_;
            std::ofstream file_;
        };

        /**
         * Named logger; the name identifies the component in each line
         */
        class Logger
        {
        public:
            Logger(std::string name, LogLevel level, std::shared_ptr<LogOutput> output);

            void set_level(LogLevel level) { level_ = level; }
            LogLevel level() const { return level_; }

            void debug(const std::string &message, const LogContext &context = LogContext{});
            void info(const std::string &message, const LogContext &context = LogContext{});
            void warning(const std::string &message, const LogContext &context = LogContext{});
            void error(const std::string &message, const LogContext &context = LogContext{});
            void critical(const std::string &message, const LogContext &context = LogContext{});

            const std::string &name() const { return name_; }

        private:
            void log(LogLevel level, const std::string &message, const LogContext &context);

            std::string name_;
            std::atomic<LogLevel> level_;
            std::shared_ptr<LogOutput> output_;
        };

        /**
         * Logger registry. setup_logging() reconfigures loggers that already exist.
         */
        class LoggerManager
        {
        public:
            static LoggerManager &instance();

            void setup_logging(LogLevel level, const std::string &log_file, bool console_output);
            std::shared_ptr<Logger> get_logger(const std::string &name);

        private:
            LoggerManager();

            LogLevel level_ = LogLevel::WARNING;
            std::shared_ptr<LogOutput> output_;
            std::map<std::string, std::shared_ptr<Logger>> loggers_;
            std::mutex mutex_;
        };

        LogLevel parse_log_level(const std::string &level_str);
        const char *level_name(LogLevel level);

        std::shared_ptr<Logger> get_logger(const std::string &name);
        void setup_logging(LogLevel level = LogLevel::WARNING,
                           const std::string &log_file = "",
                           bool console_output = true);

    } // namespace core
} // namespace hotspot

#endif // HOTSPOT_CORE_LOGGER_HPP
