#include "cargomcp/process.hpp"

#include "cargomcp/errors.hpp"
#include "cargomcp/format.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

using namespace cargomcp::literals;
namespace fs = std::filesystem;

namespace cargomcp {

    namespace detail {

        using clock = std::chrono::steady_clock;

        // ── File descriptors ────────────────────────────────────────────

        struct unique_fd {
            int fd{-1};

            unique_fd() = default;
            explicit unique_fd(int f) : fd{f} {}
            ~unique_fd() { reset(); }

            unique_fd(unique_fd&& other) noexcept : fd{other.fd} { other.fd = -1; }
            unique_fd& operator=(unique_fd&& other) noexcept {
                if (this != &other) {
                    reset();
                    fd = other.fd;
                    other.fd = -1;
                }
                return *this;
            }

            unique_fd(const unique_fd&) = delete;
            unique_fd& operator=(const unique_fd&) = delete;

            void reset() {
                if (fd >= 0) {
                    ::close(fd);
                    fd = -1;
                }
            }
        };

        struct pipe_pair {
            unique_fd read_end{};
            unique_fd write_end{};
        };

        // Both ends are close-on-exec so concurrent children never inherit
        // each other's pipes.
        static pipe_pair make_pipe() {
            int fds[2]{};
#if CARGOMCP_PLATFORM_LINUX
            if (::pipe2(fds, O_CLOEXEC) != 0) {
                throw tool_error{error_kind::spawn_error, "pipe2() failed: {}"_format(std::strerror(errno))};
            }
#else
            if (::pipe(fds) != 0) {
                throw tool_error{error_kind::spawn_error, "pipe() failed: {}"_format(std::strerror(errno))};
            }
            ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
            ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
#endif
            return {unique_fd{fds[0]}, unique_fd{fds[1]}};
        }

        // ── Child environment ───────────────────────────────────────────

        static std::vector<std::string> build_environment(const process_spec& spec, const startup_config& cfg) {
            std::map<std::string, std::string> vars{};
            for (const auto& name : cfg.inherited_env) {
                if (const char* value = std::getenv(name.c_str())) {
                    vars[name] = value;
                }
            }
            for (const auto& [key, value] : spec.env) {
                vars[key] = value;
            }

            std::vector<std::string> env{};
            env.reserve(vars.size());
            for (const auto& [key, value] : vars) {
                env.push_back("{}={}"_format(key, value));
            }
            return env;
        }

        static std::vector<char*> to_c_array(std::vector<std::string>& values) {
            std::vector<char*> out{};
            out.reserve(values.size() + 1);
            for (auto& v : values) {
                out.push_back(v.data());
            }
            out.push_back(nullptr);
            return out;
        }

        // ── Exec status channel ─────────────────────────────────────────

        enum class child_stage : int { chdir = 1, exec = 2 };

        struct exec_failure {
            child_stage stage{};
            int error{};
        };

        // Runs in the forked child: only async-signal-safe calls from here on.
        [[noreturn]] static void report_and_exit(int status_fd, child_stage stage) {
            exec_failure failure{stage, errno};
            auto n = ::write(status_fd, &failure, sizeof(failure));
            (void)n;
            ::_exit(127);
        }

        static std::string drain_fd(int fd) {
            std::string buf{};
            std::array<char, 4096> chunk{};
            for (;;) {
                auto n = ::read(fd, chunk.data(), chunk.size());
                if (n < 0 && errno == EINTR) {
                    continue;
                }
                if (n <= 0) {
                    break;
                }
                buf.append(chunk.data(), static_cast<size_t>(n));
            }
            return buf;
        }

        static int wait_child(pid_t pid) {
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0) {
                if (errno != EINTR) {
                    break;
                }
            }
            return status;
        }

        // Reaps the child if it exits before the deadline; a child that closed
        // its output early is still bound by the timeout.
        static std::optional<int> wait_child_until(pid_t pid, clock::time_point deadline) {
            int status = 0;
            for (;;) {
                auto r = ::waitpid(pid, &status, WNOHANG);
                if (r == pid) {
                    return status;
                }
                if (r < 0 && errno != EINTR) {
                    return status;
                }
                if (clock::now() >= deadline) {
                    return std::nullopt;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }

        // The child leads its own process group so a timeout reaches the
        // compilers and test binaries it started.
        static void kill_group(pid_t pid) {
            if (::kill(-pid, SIGKILL) != 0) {
                ::kill(pid, SIGKILL);
            }
        }

    }  // namespace detail

    fs::path find_executable(const fs::path& program) {
        // the child changes directory before exec, so relative results are anchored here
        auto is_executable = [](const fs::path& p) {
            std::error_code ec{};
            return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
        };
        auto anchored = [](const fs::path& p) {
            std::error_code ec{};
            auto abs = fs::absolute(p, ec);
            return ec ? p : abs;
        };

        if (program.empty()) {
            return {};
        }
        if (program.string().find('/') != std::string::npos) {
            return is_executable(program) ? anchored(program) : fs::path{};
        }

        const char* path_env = std::getenv("PATH");
        std::string_view search{path_env != nullptr ? path_env : "/usr/bin:/bin"};
        while (true) {
            auto sep = search.find(':');
            auto dir = search.substr(0, sep);
            auto candidate = (dir.empty() ? fs::path{"."} : fs::path{dir}) / program;
            if (is_executable(candidate)) {
                return anchored(candidate);
            }
            if (sep == std::string_view::npos) {
                break;
            }
            search.remove_prefix(sep + 1);
        }
        return {};
    }

    process_result run_process(const process_spec& spec, const startup_config& cfg) {
        auto executable = find_executable(spec.program);
        if (executable.empty()) {
            throw tool_error{
                    error_kind::spawn_error, "executable '{}' not found or not executable"_format(spec.program)};
        }

        // everything the child needs is prepared before fork
        auto exe_str = executable.string();
        auto cwd_str = spec.working_directory.string();
        auto argv_storage = spec.argv;
        auto env_storage = detail::build_environment(spec, cfg);
        auto argv = detail::to_c_array(argv_storage);
        auto envp = detail::to_c_array(env_storage);

        detail::unique_fd dev_null{::open("/dev/null", O_RDONLY | O_CLOEXEC)};
        if (dev_null.fd < 0) {
            throw tool_error{error_kind::spawn_error, "cannot open /dev/null: {}"_format(std::strerror(errno))};
        }

        auto out_pipe = detail::make_pipe();
        auto err_pipe = detail::make_pipe();
        auto status_pipe = detail::make_pipe();

        auto start = detail::clock::now();
        auto pid = ::fork();
        if (pid < 0) {
            throw tool_error{error_kind::spawn_error, "fork() failed: {}"_format(std::strerror(errno))};
        }

        if (pid == 0) {
            ::setpgid(0, 0);
            ::dup2(dev_null.fd, STDIN_FILENO);
            ::dup2(out_pipe.write_end.fd, STDOUT_FILENO);
            ::dup2(err_pipe.write_end.fd, STDERR_FILENO);

            ::signal(SIGPIPE, SIG_DFL);

            if (::chdir(cwd_str.c_str()) != 0) {
                detail::report_and_exit(status_pipe.write_end.fd, detail::child_stage::chdir);
            }
            ::execve(exe_str.c_str(), argv.data(), envp.data());
            detail::report_and_exit(status_pipe.write_end.fd, detail::child_stage::exec);
        }

        // parent; also set here so the group exists before any kill
        ::setpgid(pid, pid);
        dev_null.reset();
        out_pipe.write_end.reset();
        err_pipe.write_end.reset();
        status_pipe.write_end.reset();

        // EOF on the status pipe means exec succeeded
        auto status_bytes = detail::drain_fd(status_pipe.read_end.fd);
        if (status_bytes.size() >= sizeof(detail::exec_failure)) {
            detail::exec_failure failure{};
            std::memcpy(&failure, status_bytes.data(), sizeof(failure));
            detail::wait_child(pid);
            auto what = failure.stage == detail::child_stage::chdir ? "chdir to '{}'"_format(cwd_str)
                                                                     : "exec of '{}'"_format(exe_str);
            throw tool_error{error_kind::spawn_error, "{} failed: {}"_format(what, std::strerror(failure.error))};
        }

        process_result result{};
        bool timed_out = false;
        int fds_open = 2;

        pollfd fds[2]{};
        fds[0] = {.fd = out_pipe.read_end.fd, .events = POLLIN, .revents = 0};
        fds[1] = {.fd = err_pipe.read_end.fd, .events = POLLIN, .revents = 0};

        std::optional<detail::clock::time_point> deadline{};
        if (cfg.tool_timeout_ms > 0) {
            deadline = start + std::chrono::milliseconds(cfg.tool_timeout_ms);
        }

        std::array<char, 65536> chunk{};
        while (fds_open > 0) {
            int wait_ms = -1;
            if (deadline) {
                auto remaining =
                        std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - detail::clock::now()).count();
                if (remaining <= 0) {
                    timed_out = true;
                    break;
                }
                wait_ms = static_cast<int>(remaining);
            }

            int ret = ::poll(fds, 2, wait_ms);
            if (ret < 0) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            if (ret == 0) {
                timed_out = true;
                break;
            }

            for (int i = 0; i < 2; ++i) {
                if (fds[i].fd < 0) {
                    continue;
                }
                if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                    auto n = ::read(fds[i].fd, chunk.data(), chunk.size());
                    if (n > 0) {
                        (i == 0 ? result.stdout_text : result.stderr_text).append(chunk.data(), static_cast<size_t>(n));
                    }
                    else if (n == 0 || errno != EINTR) {
                        fds[i].fd = -1;
                        --fds_open;
                    }
                }
            }
        }

        std::optional<int> reaped{};
        if (!timed_out && deadline) {
            reaped = detail::wait_child_until(pid, *deadline);
            timed_out = !reaped.has_value();
        }

        if (timed_out) {
            detail::kill_group(pid);
        }

        out_pipe.read_end.reset();
        err_pipe.read_end.reset();

        int status = reaped ? *reaped : detail::wait_child(pid);
        result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(detail::clock::now() - start);
        result.timed_out = timed_out;

        if (WIFEXITED(status) && !timed_out) {
            result.exit_code = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status)) {
            result.term_signal = WTERMSIG(status);
        }

        debug_log("{} exited: code={} signal={} timed_out={}"_format(
                spec.program, result.exit_code.value_or(-1), result.term_signal.value_or(0), timed_out));
        return result;
    }

}  // namespace cargomcp
