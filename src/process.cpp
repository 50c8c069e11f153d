#include "runlet/process.hpp"

#include "runlet/format.hpp"

extern "C" {
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace runlet::literals;

namespace runlet::process {

    namespace detail {

        using clock = std::chrono::steady_clock;

        static constexpr size_t read_chunk_size = 4096U;
        static constexpr size_t write_chunk_size = 65536U;
        static constexpr auto reap_poll_interval = std::chrono::milliseconds{5};

        struct pipe_fds {
            int read_end{-1};
            int write_end{-1};
        };

        static void close_fd(int& fd) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }

        static void close_pipe(pipe_fds& p) {
            close_fd(p.read_end);
            close_fd(p.write_end);
        }

        // O_CLOEXEC keeps concurrently spawned children from inheriting each other's pipe ends
        static bool open_pipe(pipe_fds& p) {
            int fds[2]{};
            if (::pipe2(fds, O_CLOEXEC) != 0) {
                return false;
            }
            p.read_end = fds[0];
            p.write_end = fds[1];
            return true;
        }

        static void set_nonblocking(int fd) {
            int flags = ::fcntl(fd, F_GETFL, 0);
            if (flags >= 0) {
                (void)::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
            }
        }

        static int remaining_ms(clock::time_point deadline) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
            return left <= 0 ? 0 : static_cast<int>(std::min<long long>(left, 1'000'000'000LL));
        }

        static std::string drain_fd_nonblocking(int fd) {
            std::string buf{};
            char chunk[read_chunk_size]{};
            for (;;) {
                pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
                if (::poll(&pfd, 1, 0) <= 0) {
                    break;
                }
                auto n = ::read(fd, chunk, sizeof(chunk));
                if (n <= 0) {
                    break;
                }
                buf.append(chunk, static_cast<size_t>(n));
            }
            return buf;
        }

        static std::optional<int> try_reap(pid_t pid) {
            int status = 0;
            for (;;) {
                auto ret = ::waitpid(pid, &status, WNOHANG);
                if (ret == pid) {
                    return status;
                }
                if (ret < 0 && errno == EINTR) {
                    continue;
                }
                return std::nullopt;
            }
        }

        static int reap_blocking(pid_t pid) {
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            return status;
        }

        // SIGTERM, then SIGKILL once the grace period runs out
        static int terminate(pid_t pid, int grace_ms) {
            ::kill(pid, SIGTERM);
            auto grace_deadline = clock::now() + std::chrono::milliseconds(grace_ms);
            while (clock::now() < grace_deadline) {
                if (auto status = try_reap(pid)) {
                    return *status;
                }
                std::this_thread::sleep_for(reap_poll_interval);
            }
            ::kill(pid, SIGKILL);
            return reap_blocking(pid);
        }

        static void apply_status(process_outcome& outcome, int status) {
            if (WIFEXITED(status)) {
                outcome.exit_code = WEXITSTATUS(status);
            }
            else if (WIFSIGNALED(status)) {
                outcome.term_signal = WTERMSIG(status);
            }
        }

        static process_outcome spawn_failure(std::string message) {
            process_outcome outcome{};
            outcome.spawn_error = std::move(message);
            return outcome;
        }

        // a child that exits without reading stdin must not take the host down with it
        static void ignore_sigpipe() {
            static std::once_flag once{};
            std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
        }

        [[noreturn]] static void report_exec_failure(int status_fd) {
            int err = errno;
            (void)::write(status_fd, &err, sizeof(err));
            _exit(127);
        }

    }  // namespace detail

    process_outcome run_process(const process_spec& spec) {
        if (spec.argv.empty()) {
            return detail::spawn_failure("spawn failed: empty command");
        }
        const auto& program = spec.argv.front();
        detail::ignore_sigpipe();

        detail::pipe_fds in_pipe{};
        detail::pipe_fds out_pipe{};
        detail::pipe_fds err_pipe{};
        detail::pipe_fds status_pipe{};
        bool wants_stdin = spec.stdin_text.has_value();

        if ((wants_stdin && !detail::open_pipe(in_pipe)) || !detail::open_pipe(out_pipe) ||
            !detail::open_pipe(err_pipe) || !detail::open_pipe(status_pipe)) {
            int err = errno;
            detail::close_pipe(in_pipe);
            detail::close_pipe(out_pipe);
            detail::close_pipe(err_pipe);
            detail::close_pipe(status_pipe);
            return detail::spawn_failure("spawn {} failed: pipe(): {}"_format(program, std::strerror(err)));
        }

        // everything the child touches is prepared before fork
        std::vector<char*> argv{};
        std::vector<std::string> args = spec.argv;
        argv.reserve(args.size() + 1);
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);
        auto cwd = spec.cwd.string();

        auto pid = ::fork();
        if (pid < 0) {
            int err = errno;
            detail::close_pipe(in_pipe);
            detail::close_pipe(out_pipe);
            detail::close_pipe(err_pipe);
            detail::close_pipe(status_pipe);
            return detail::spawn_failure("spawn {} failed: fork(): {}"_format(program, std::strerror(err)));
        }

        if (pid == 0) {
            if (wants_stdin) {
                ::dup2(in_pipe.read_end, STDIN_FILENO);
            }
            else {
                int devnull = ::open("/dev/null", O_RDONLY);
                if (devnull >= 0) {
                    ::dup2(devnull, STDIN_FILENO);
                }
            }
            ::dup2(out_pipe.write_end, STDOUT_FILENO);
            ::dup2(err_pipe.write_end, STDERR_FILENO);
            ::signal(SIGPIPE, SIG_DFL);

            if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
                detail::report_exec_failure(status_pipe.write_end);
            }
            ::execvp(argv[0], argv.data());
            detail::report_exec_failure(status_pipe.write_end);
        }

        // parent
        detail::close_fd(in_pipe.read_end);
        detail::close_fd(out_pipe.write_end);
        detail::close_fd(err_pipe.write_end);
        detail::close_fd(status_pipe.write_end);

        // the status pipe closes on a successful exec; an errno arrives otherwise
        int child_errno = 0;
        ssize_t status_read = 0;
        do {
            status_read = ::read(status_pipe.read_end, &child_errno, sizeof(child_errno));
        } while (status_read < 0 && errno == EINTR);
        detail::close_fd(status_pipe.read_end);

        if (status_read == static_cast<ssize_t>(sizeof(child_errno))) {
            detail::close_pipe(in_pipe);
            detail::close_pipe(out_pipe);
            detail::close_pipe(err_pipe);
            (void)detail::reap_blocking(pid);
            if (!cwd.empty() && child_errno == ENOENT && !std::filesystem::is_directory(spec.cwd)) {
                return detail::spawn_failure("spawn {} failed: working directory {}: {}"_format(
                        program, cwd, std::strerror(child_errno)));
            }
            return detail::spawn_failure("spawn {} failed: {}"_format(program, std::strerror(child_errno)));
        }

        process_outcome outcome{};
        auto deadline = detail::clock::now() + std::chrono::milliseconds(spec.timeout_ms);

        std::string_view pending{};
        if (wants_stdin) {
            pending = *spec.stdin_text;
            detail::set_nonblocking(in_pipe.write_end);
            if (pending.empty()) {
                detail::close_fd(in_pipe.write_end);
            }
        }

        pollfd fds[3]{};
        fds[0] = {.fd = out_pipe.read_end, .events = POLLIN, .revents = 0};
        fds[1] = {.fd = err_pipe.read_end, .events = POLLIN, .revents = 0};
        fds[2] = {.fd = in_pipe.write_end, .events = POLLOUT, .revents = 0};

        auto all_closed = [&fds] { return fds[0].fd < 0 && fds[1].fd < 0 && fds[2].fd < 0; };
        std::optional<std::string> io_error{};

        while (!all_closed()) {
            auto wait_ms = detail::remaining_ms(deadline);
            if (wait_ms == 0) {
                outcome.timed_out = true;
                break;
            }

            int ret = ::poll(fds, 3, wait_ms);
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                io_error = "lost contact with {}: poll(): {}"_format(program, std::strerror(errno));
                break;
            }
            if (ret == 0) {
                outcome.timed_out = true;
                break;
            }

            char chunk[detail::read_chunk_size]{};
            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                    continue;
                }
                auto n = ::read(fds[i].fd, chunk, sizeof(chunk));
                if (n > 0) {
                    (i == 0 ? outcome.stdout_text : outcome.stderr_text).append(chunk, static_cast<size_t>(n));
                }
                else if (n == 0 || errno != EINTR) {
                    ::close(fds[i].fd);
                    fds[i].fd = -1;
                }
            }

            if (fds[2].fd >= 0 && (fds[2].revents & (POLLOUT | POLLERR | POLLHUP)) != 0) {
                auto len = std::min(pending.size(), detail::write_chunk_size);
                auto n = ::write(fds[2].fd, pending.data(), len);
                if (n > 0) {
                    pending.remove_prefix(static_cast<size_t>(n));
                }
                // EPIPE: the child stopped reading; the rest of the source is dropped
                if (pending.empty() || (n < 0 && errno != EAGAIN && errno != EINTR)) {
                    ::close(fds[2].fd);
                    fds[2].fd = -1;
                }
            }
        }

        detail::close_fd(fds[2].fd);

        // pipes may close before the child exits; keep honoring the deadline while reaping
        std::optional<int> status{};
        if (!outcome.timed_out && !io_error) {
            for (;;) {
                if ((status = detail::try_reap(pid))) {
                    break;
                }
                if (detail::remaining_ms(deadline) == 0) {
                    outcome.timed_out = true;
                    break;
                }
                std::this_thread::sleep_for(detail::reap_poll_interval);
            }
        }
        if (!status) {
            status = detail::terminate(pid, spec.kill_grace_ms);
        }

        // whatever the child flushed before it was killed
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd >= 0) {
                (i == 0 ? outcome.stdout_text : outcome.stderr_text) += detail::drain_fd_nonblocking(fds[i].fd);
                ::close(fds[i].fd);
                fds[i].fd = -1;
            }
        }

        if (io_error) {
            return detail::spawn_failure(std::move(*io_error));
        }

        detail::apply_status(outcome, *status);
        debug_log("child ", program, " pid=", pid, " exit=", outcome.exit_code.value_or(-1),
                  " signal=", outcome.term_signal.value_or(0), " timed_out=", outcome.timed_out);
        return outcome;
    }

}  // namespace runlet::process
