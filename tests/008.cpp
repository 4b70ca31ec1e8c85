#include "utils.hpp"

namespace cargomcp::test {

    namespace detail {

        struct mcp_process {
            pid_t pid{-1};
            int stdin_fd{-1};
            int stdout_fd{-1};
            int stderr_fd{-1};
            std::string read_buf{};

            mcp_process(const mcp_process&) = delete;
            mcp_process& operator=(const mcp_process&) = delete;

            explicit mcp_process(std::vector<std::string> extra_args) {
                int in_pipe[2]{};
                int out_pipe[2]{};
                int err_pipe[2]{};
                REQUIRE(::pipe(in_pipe) == 0);
                REQUIRE(::pipe(out_pipe) == 0);
                REQUIRE(::pipe(err_pipe) == 0);

                std::vector<std::string> args{CARGOMCP_CLI_PATH, "--quiet"};
                args.insert(args.end(), extra_args.begin(), extra_args.end());
                std::vector<char*> argv{};
                for (auto& a : args) {
                    argv.push_back(a.data());
                }
                argv.push_back(nullptr);

                pid = ::fork();
                REQUIRE(pid >= 0);

                if (pid == 0) {
                    ::close(in_pipe[1]);
                    ::close(out_pipe[0]);
                    ::close(err_pipe[0]);
                    ::dup2(in_pipe[0], STDIN_FILENO);
                    ::dup2(out_pipe[1], STDOUT_FILENO);
                    ::dup2(err_pipe[1], STDERR_FILENO);
                    ::close(in_pipe[0]);
                    ::close(out_pipe[1]);
                    ::close(err_pipe[1]);

                    ::execv(argv[0], argv.data());
                    _exit(127);
                }

                ::close(in_pipe[0]);
                ::close(out_pipe[1]);
                ::close(err_pipe[1]);
                stdin_fd = in_pipe[1];
                stdout_fd = out_pipe[0];
                stderr_fd = err_pipe[0];
            }

            ~mcp_process() {
                if (stdin_fd >= 0)
                    ::close(stdin_fd);
                if (pid > 0) {
                    ::kill(pid, SIGTERM);
                    ::waitpid(pid, nullptr, 0);
                }
                if (stdout_fd >= 0)
                    ::close(stdout_fd);
                if (stderr_fd >= 0)
                    ::close(stderr_fd);
            }

            void send_line(std::string_view line) {
                std::string msg{line};
                msg.push_back('\n');
                auto written = ::write(stdin_fd, msg.data(), msg.size());
                REQUIRE(written == static_cast<ssize_t>(msg.size()));
            }

            std::string recv_line(int timeout_ms = 15000) {
                auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

                for (;;) {
                    auto pos = read_buf.find('\n');
                    if (pos != std::string::npos) {
                        auto line = read_buf.substr(0, pos);
                        read_buf.erase(0, pos + 1);
                        return line;
                    }

                    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                             deadline - std::chrono::steady_clock::now())
                                             .count();
                    if (remaining <= 0) {
                        FAIL("mcp recv_line timed out after " << timeout_ms << "ms");
                    }

                    int poll_ms = remaining > 1000 ? 1000 : static_cast<int>(remaining);
                    pollfd pfd{.fd = stdout_fd, .events = POLLIN, .revents = 0};
                    int ret = ::poll(&pfd, 1, poll_ms);
                    if (ret < 0 && errno == EINTR)
                        continue;
                    if (ret == 0)
                        continue;
                    REQUIRE(ret > 0);

                    char chunk[4096]{};
                    auto n = ::read(stdout_fd, chunk, sizeof(chunk));
                    REQUIRE(n > 0);
                    read_buf.append(chunk, static_cast<size_t>(n));
                }
            }

            // closes stdin and collects the exit status
            int finish() {
                ::close(stdin_fd);
                stdin_fd = -1;
                int status = 0;
                REQUIRE(::waitpid(pid, &status, 0) == pid);
                pid = -1;
                return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            }

            std::string handshake() {
                send_line(
                        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{"protocolVersion":"2024-11-05","capabilities":{},"clientInfo":{"name":"test","version":"0.1"}}})");
                auto resp = recv_line();
                send_line(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
                return resp;
            }
        };

        inline std::string path_arguments(const fs::path& project, std::string_view extra = {}) {
            return R"({"path":)" + json_string(project.string()) + std::string{extra} + "}";
        }

    }  // namespace detail

    TEST_CASE("008: stdio server handshake and tool listing", "[008][e2e]") {
        detail::temp_dir temp{"cargomcp_e2e_list"};
        auto cargo = detail::write_echo_cargo(temp.path);

        detail::mcp_process mcp{{"--cargo", cargo.string()}};
        auto init = mcp.handshake();
        CHECK(detail::contains(init, R"("protocolVersion":"2024-11-05")"));
        CHECK(detail::contains(init, R"("serverInfo":{"name":"cargomcp","version":"0.1.0"})"));

        mcp.send_line(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
        auto resp = mcp.recv_line();
        CHECK(detail::contains(resp, R"("name":"cargo_check")"));
        CHECK(detail::contains(resp, R"("name":"cargo_run")"));
        CHECK(detail::contains(resp, R"("inputSchema")"));

        CHECK(mcp.finish() == 0);
    }

    TEST_CASE("008: clippy fix with caller environment", "[008][e2e]") {
        detail::temp_dir temp{"cargomcp_e2e_clippy"};
        auto cargo = detail::write_echo_cargo(temp.path);
        auto project = detail::make_project(temp.path / "demo");

        // the server inherits this; its children must not
        ::setenv("CARGOMCP_SENTINEL", "leaked", 1);
        detail::mcp_process mcp{{"--cargo", cargo.string()}};
        ::unsetenv("CARGOMCP_SENTINEL");
        mcp.handshake();

        mcp.send_line(detail::tool_call(
                2, "cargo_clippy", detail::path_arguments(project, R"(,"fix":true,"cargo_env":{"RUSTFLAGS":"-D warnings"})")));
        auto resp = mcp.recv_line();

        CHECK(detail::contains(resp, R"("id":2)"));
        CHECK(detail::contains(resp, R"("isError":false)"));
        CHECK(detail::contains(resp, R"(,"clippy","--fix"])"));
        CHECK(detail::contains(resp, R"(arg:clippy\narg:--fix\n)"));
        CHECK(detail::contains(resp, R"(RUSTFLAGS:-D warnings\n)"));
        CHECK(detail::contains(resp, R"(CARGOMCP_SENTINEL:unset\n)"));
        CHECK(detail::contains(resp, R"(STDERR:\nto stderr\n)"));
        CHECK(detail::contains(resp, "cwd:" + detail::fs::canonical(project).string()));
    }

    TEST_CASE("008: startup toolchain applies unless the request names one", "[008][e2e]") {
        detail::temp_dir temp{"cargomcp_e2e_toolchain"};
        auto cargo = detail::write_echo_cargo(temp.path);
        auto project = detail::make_project(temp.path / "demo");

        detail::mcp_process mcp{{"--cargo", cargo.string(), "--toolchain", "stable"}};
        mcp.handshake();

        mcp.send_line(detail::tool_call(2, "cargo_check", detail::path_arguments(project)));
        auto first = mcp.recv_line();
        CHECK(detail::contains(first, R"(arg:+stable\narg:check\n)"));

        mcp.send_line(detail::tool_call(3, "cargo_check", detail::path_arguments(project, R"(,"toolchain":"nightly")")));
        auto second = mcp.recv_line();
        CHECK(detail::contains(second, R"(arg:+nightly\narg:check\n)"));
        CHECK_FALSE(detail::contains(second, "+stable"));
    }

    TEST_CASE("008: missing build tool surfaces as a spawn error", "[008][e2e]") {
        detail::temp_dir temp{"cargomcp_e2e_spawn"};
        auto project = detail::make_project(temp.path / "demo");

        detail::mcp_process mcp{{"--cargo", (temp.path / "no-cargo-here").string()}};
        mcp.handshake();

        mcp.send_line(detail::tool_call(2, "cargo_build", detail::path_arguments(project)));
        auto resp = mcp.recv_line();
        CHECK(detail::contains(resp, R"("id":2)"));
        CHECK(detail::contains(resp, R"("code":-32002)"));
        CHECK(detail::contains(resp, R"("kind":"SpawnError")"));

        // the server keeps serving after a failed spawn
        mcp.send_line(R"({"jsonrpc":"2.0","id":3,"method":"ping"})");
        CHECK(mcp.recv_line() == R"({"jsonrpc":"2.0","id":3,"result":{}})");
    }

    TEST_CASE("008: timeout is reported in the tool result", "[008][e2e]") {
        detail::temp_dir temp{"cargomcp_e2e_timeout"};
        auto cargo = detail::write_script(temp.path / "slow-cargo", "echo compiling\nexec sleep 30\n");
        auto project = detail::make_project(temp.path / "demo");

        detail::mcp_process mcp{{"--cargo", cargo.string(), "--timeout-ms", "300"}};
        mcp.handshake();

        mcp.send_line(detail::tool_call(2, "cargo_bench", detail::path_arguments(project)));
        auto resp = mcp.recv_line();
        CHECK(detail::contains(resp, R"("isError":true)"));
        CHECK(detail::contains(resp, R"("timed_out":true)"));
        CHECK_FALSE(detail::contains(resp, R"("exit_code")"));
        CHECK(detail::contains(resp, "timed out after"));
    }

    TEST_CASE("008: binary output from the child stays valid JSON", "[008][e2e]") {
        detail::temp_dir temp{"cargomcp_e2e_bytes"};
        auto cargo = detail::write_script(temp.path / "bytes-cargo", "printf 'ok\\377\\n'\nprintf 'warn\\376\\n' >&2\n");
        auto project = detail::make_project(temp.path / "demo");

        detail::mcp_process mcp{{"--cargo", cargo.string()}};
        mcp.handshake();

        mcp.send_line(detail::tool_call(2, "cargo_run", detail::path_arguments(project)));
        auto resp = mcp.recv_line();
        CHECK(!glz::validate_json(resp));
        CHECK(utils::to_valid_utf8(resp) == resp);
        CHECK(detail::contains(resp, "ok\xEF\xBF\xBD"));
        CHECK(detail::contains(resp, "warn\xEF\xBF\xBD"));
        CHECK(detail::contains(resp, R"("success":true)"));
    }

    TEST_CASE("008: end of input waits for running calls", "[008][e2e]") {
        detail::temp_dir temp{"cargomcp_e2e_drain"};
        auto cargo = detail::write_script(temp.path / "slow-cargo", "sleep 1\necho \"done:$1\"\n");
        auto project = detail::make_project(temp.path / "demo");

        startup_config cfg{};
        cfg.cargo_path = cargo;

        std::istringstream in{
                detail::tool_call(1, "cargo_check", detail::path_arguments(project)) + "\n" +
                detail::tool_call(2, "cargo_clean", detail::path_arguments(project)) + "\n"};
        std::ostringstream out{};

        CHECK(mcp::run_mcp_server(cfg, in, out) == 0);

        auto lines = detail::split_lines(out.str());
        REQUIRE(lines.size() == 2U);
        auto all = lines[0] + lines[1];
        CHECK(detail::contains(all, R"(done:check\n)"));
        CHECK(detail::contains(all, R"(done:clean\n)"));
    }

}  // namespace cargomcp::test
