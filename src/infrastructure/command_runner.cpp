#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sstream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace hotspot
{
    namespace infrastructure
    {

        namespace
        {
            void close_fd(int &fd)
            {
                if (fd >= 0)
                {
                    ::close(fd);
                    fd = -1;
                }
            }

            int decode_status(int status)
            {
                if (WIFEXITED(status))
                {
                    return WEXITSTATUS(status);
                }
                if (WIFSIGNALED(status))
                {
                    return 128 + WTERMSIG(status);
                }
                return -1;
            }

            int wait_for_child(pid_t pid)
            {
                int status = 0;
                while (waitpid(pid, &status, 0) < 0)
                {
                    if (errno != EINTR)
                    {
                        return -1;
                    }
                }
                return decode_status(status);
            }

            // Returns false when the child is still running at the deadline
            bool wait_for_child_until(pid_t pid, std::chrono::steady_clock::time_point deadline, int &exit_code)
            {
                while (true)
                {
                    int status = 0;
                    pid_t done = waitpid(pid, &status, WNOHANG);
                    if (done == pid)
                    {
                        exit_code = decode_status(status);
                        return true;
                    }
                    if (done < 0 && errno != EINTR)
                    {
                        exit_code = -1;
                        return true;
                    }
                    if (std::chrono::steady_clock::now() >= deadline)
                    {
                        return false;
                    }
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                }
            }
        } // namespace

        SystemCommandRunner::SystemCommandRunner()
            : logger_(core::get_logger("command_runner"))
        {
        }

        CommandResult SystemCommandRunner::run(const std::vector<std::string> &argv,
                                               std::chrono::milliseconds timeout)
        {
            CommandResult result;
            if (argv.empty())
            {
                return result;
            }

            int out_pipe[2] = {-1, -1};
            int err_pipe[2] = {-1, -1}; // reports exec failure; closed on successful exec
            if (pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(err_pipe, O_CLOEXEC) != 0)
            {
                logger_->error("Failed to create pipes", core::LogContext().add("error", std::strerror(errno)));
                close_fd(out_pipe[0]);
                close_fd(out_pipe[1]);
                close_fd(err_pipe[0]);
                close_fd(err_pipe[1]);
                return result;
            }

            // Built before fork(): the child of a threaded process must not allocate
            std::vector<char *> args;
            args.reserve(argv.size() + 1);
            for (const auto &arg : argv)
            {
                args.push_back(const_cast<char *>(arg.c_str()));
            }
            args.push_back(nullptr);

            pid_t pid = fork();
            if (pid == 0)
            {
                // Child process
                dup2(out_pipe[1], STDOUT_FILENO);
                int devnull = open("/dev/null", O_RDWR);
                if (devnull >= 0)
                {
                    dup2(devnull, STDERR_FILENO);
                    dup2(devnull, STDIN_FILENO);
                }

                execvp(args[0], args.data());
                int exec_errno = errno;
                ssize_t ignored = write(err_pipe[1], &exec_errno, sizeof(exec_errno));
                (void)ignored;
                _exit(127);
            }

            close_fd(out_pipe[1]);
            close_fd(err_pipe[1]);

            if (pid < 0)
            {
                logger_->error("Failed to fork", core::LogContext().add("command", argv[0]));
                close_fd(out_pipe[0]);
                close_fd(err_pipe[0]);
                return result;
            }

            int exec_errno = 0;
            ssize_t n = 0;
            do
            {
                n = read(err_pipe[0], &exec_errno, sizeof(exec_errno));
            } while (n < 0 && errno == EINTR);
            close_fd(err_pipe[0]);

            if (n == static_cast<ssize_t>(sizeof(exec_errno)))
            {
                logger_->debug("Command could not be executed",
                               core::LogContext().add("command", argv[0]).add("error", std::strerror(exec_errno)));
                close_fd(out_pipe[0]);
                wait_for_child(pid);
                return result;
            }
            result.launched = true;

            const auto deadline = std::chrono::steady_clock::now() + timeout;
            char buffer[4096];
            while (true)
            {
                const auto now = std::chrono::steady_clock::now();
                if (now >= deadline)
                {
                    result.timed_out = true;
                    break;
                }
                const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

                pollfd pfd{};
                pfd.fd = out_pipe[0];
                pfd.events = POLLIN;
                int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()) + 1);
                if (ready < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    break;
                }
                if (ready == 0)
                {
                    continue;
                }

                ssize_t count = read(out_pipe[0], buffer, sizeof(buffer));
                if (count > 0)
                {
                    result.output.append(buffer, static_cast<std::size_t>(count));
                    continue;
                }
                if (count < 0 && errno == EINTR)
                {
                    continue;
                }
                break; // EOF
            }
            close_fd(out_pipe[0]);

            if (!result.timed_out && !wait_for_child_until(pid, deadline, result.exit_code))
            {
                result.timed_out = true;
            }

            if (result.timed_out)
            {
                logger_->warning("Command timed out, killing",
                                 core::LogContext().add("command", format_command(argv)).add("timeout_ms", timeout.count()));
                kill(pid, SIGKILL);
                result.exit_code = wait_for_child(pid);
            }

            logger_->debug("Command finished",
                           core::LogContext().add("command", format_command(argv)).add("exit_code", result.exit_code));
            return result;
        }

        namespace
        {
            // "wifi-sec.psk", "--password"; not values such as "wpa-psk"
            bool names_secret(const std::string &arg)
            {
                auto dot = arg.find_last_of('.');
                std::string name = dot == std::string::npos ? arg : arg.substr(dot + 1);
                auto start = name.find_first_not_of('-');
                name = start == std::string::npos ? std::string() : name.substr(start);
                std::transform(name.begin(), name.end(), name.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return name == "psk" || name == "password" || name == "passphrase";
            }
        } // namespace

        std::string format_command(const std::vector<std::string> &argv)
        {
            std::ostringstream cmd;
            bool mask_next = false;
            for (size_t i = 0; i < argv.size(); ++i)
            {
                if (i > 0)
                    cmd << " ";
                // nmcli takes secrets as "<setting> <value>" pairs
                cmd << (mask_next ? "***" : argv[i]);
                mask_next = !mask_next && names_secret(argv[i]);
            }
            return cmd.str();
        }

    } // namespace infrastructure
} // namespace hotspot
