#ifndef HOTSPOT_INFRASTRUCTURE_COMMAND_RUNNER_HPP
#define HOTSPOT_INFRASTRUCTURE_COMMAND_RUNNER_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace hotspot
{
    namespace core
    {
        class Logger;
    }
}

namespace hotspot
{
    namespace infrastructure
    {

        struct CommandResult
        {
            int exit_code = -1;
            std::string output; // stdout only
            bool timed_out = false;
            bool launched = false;

            bool ok() const { return launched && !timed_out && exit_code == 0; }
        };

        /**
         * Runs external commands (nmcli, iw, iptables, ...) with a bounded duration.
         * Implementations never pass argv through a shell.
         */
        class CommandRunner
        {
        public:
            virtual ~CommandRunner() = default;

            virtual CommandResult run(const std::vector<std::string> &argv,
                                      std::chrono::milliseconds timeout) = 0;
        };

        /**
         * fork/execvp implementation. stderr goes to /dev/null; a child still
         * running at the deadline is killed and reaped.
         */
        class SystemCommandRunner : public CommandRunner
        {
        public:
            SystemCommandRunner();

            CommandResult run(const std::vector<std::string> &argv,
                              std::chrono::milliseconds timeout) override;

        private:
            std::shared_ptr<core::Logger> logger_;
        };

        // "iptables -t nat -A ..." for log lines; the value after a psk/password argument is masked
        std::string format_command(const std::vector<std::string> &argv);

    } // namespace infrastructure
} // namespace hotspot

#endif // HOTSPOT_INFRASTRUCTURE_COMMAND_RUNNER_HPP
