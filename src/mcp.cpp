#include "cargomcp/mcp.hpp"

#include "cargomcp/command.hpp"
#include "cargomcp/errors.hpp"
#include "cargomcp/format.hpp"
#include "cargomcp/project.hpp"
#include "cargomcp/tools.hpp"
#include "cargomcp/utils.hpp"

#include <glaze/ext/jsonrpc.hpp>
#include <glaze/glaze.hpp>

#include <algorithm>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

using namespace cargomcp::literals;
using namespace std::string_view_literals;

namespace cargomcp::mcp {

    namespace detail {

        static constexpr auto null_id = "null"sv;

        static constexpr auto server_instructions =
                R"(Runs whitelisted cargo commands against a Rust project. Every tool takes the project directory as 'path' (it must contain Cargo.toml), an optional 'toolchain' (e.g. 'stable', 'nightly', '1.70.0') and an optional 'cargo_env' map of environment variables for the cargo process. The child process does not inherit the server environment beyond what is needed to locate cargo.)"sv;

        // ── MCP protocol types ──────────────────────────────────────────

        struct server_info {
            std::string name{};
            std::string version{};
            struct glaze {
                using T = server_info;
                static constexpr auto value = glz::object(&T::name, &T::version);
            };
        };

        struct tools_capability {
            struct glaze {
                using T = tools_capability;
                static constexpr auto value = glz::object();
            };
        };

        struct server_capabilities {
            tools_capability tools{};
            struct glaze {
                using T = server_capabilities;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct initialize_result {
            std::string protocolVersion{};
            server_capabilities capabilities{};
            server_info serverInfo{};
            std::string instructions{};
            struct glaze {
                using T = initialize_result;
                static constexpr auto value = glz::object(
                        "protocolVersion",
                        &T::protocolVersion,
                        "capabilities",
                        &T::capabilities,
                        "serverInfo",
                        &T::serverInfo,
                        "instructions",
                        &T::instructions);
            };
        };

        struct empty_result {
            struct glaze {
                using T = empty_result;
                static constexpr auto value = glz::object();
            };
        };

        struct tool_listing {
            std::string name{};
            std::string description{};
            glz::raw_json inputSchema{};
            struct glaze {
                using T = tool_listing;
                static constexpr auto value = glz::object(&T::name, &T::description, "inputSchema", &T::inputSchema);
            };
        };

        struct tools_list_result {
            std::vector<tool_listing> tools{};
            struct glaze {
                using T = tools_list_result;
                static constexpr auto value = glz::object(&T::tools);
            };
        };

        struct tool_call_params {
            std::string name{};
            glz::raw_json arguments{};
            struct glaze {
                using T = tool_call_params;
                static constexpr auto value = glz::object(&T::name, &T::arguments);
            };
        };

        struct text_content {
            std::string type{"text"};
            std::string text{};
            struct glaze {
                using T = text_content;
                static constexpr auto value = glz::object(&T::type, &T::text);
            };
        };

        struct execution_summary {
            std::vector<std::string> command{};
            std::string working_directory{};
            std::optional<int> exit_code{};
            std::optional<int> term_signal{};
            bool timed_out{false};
            bool success{false};
            std::string stdout_text{};
            std::string stderr_text{};
            int64_t duration_ms{};
            bool truncated{false};
            struct glaze {
                using T = execution_summary;
                static constexpr auto value = glz::object(
                        "command",
                        &T::command,
                        "working_directory",
                        &T::working_directory,
                        "exit_code",
                        &T::exit_code,
                        "signal",
                        &T::term_signal,
                        "timed_out",
                        &T::timed_out,
                        "success",
                        &T::success,
                        "stdout",
                        &T::stdout_text,
                        "stderr",
                        &T::stderr_text,
                        "duration_ms",
                        &T::duration_ms,
                        "truncated",
                        &T::truncated);
            };
        };

        struct tool_call_result {
            std::vector<text_content> content{};
            bool isError{false};
            execution_summary structuredContent{};
            struct glaze {
                using T = tool_call_result;
                static constexpr auto value =
                        glz::object(&T::content, "isError", &T::isError, "structuredContent", &T::structuredContent);
            };
        };

        // ── Envelopes ───────────────────────────────────────────────────
        //
        // The id is echoed as the raw JSON text of the inbound id, owned by the
        // envelope so it outlives the line it was read from.

        template <typename Result>
        struct response_envelope {
            std::string jsonrpc{"2.0"};
            glz::raw_json id{};
            Result result{};
            struct glaze {
                using T = response_envelope;
                static constexpr auto value = glz::object("jsonrpc", &T::jsonrpc, "id", &T::id, "result", &T::result);
            };
        };

        struct error_body {
            int code{};
            std::string kind{};
            std::string message{};
            struct glaze {
                using T = error_body;
                static constexpr auto value = glz::object(&T::code, &T::kind, &T::message);
            };
        };

        struct error_envelope {
            std::string jsonrpc{"2.0"};
            glz::raw_json id{};
            error_body error{};
            struct glaze {
                using T = error_envelope;
                static constexpr auto value = glz::object("jsonrpc", &T::jsonrpc, "id", &T::id, "error", &T::error);
            };
        };

        // ── Response helpers ────────────────────────────────────────────

        template <typename T>
        static std::string to_json(const T& value) {
            std::string json{};
            if (auto ec = glz::write_json(value, json)) {
                throw std::runtime_error{"failed to encode response: {}"_format(glz::format_error(ec, json))};
            }
            return json;
        }

        template <typename T>
        static std::string make_response(std::string id, T&& result) {
            response_envelope<std::decay_t<T>> resp{};
            resp.id = glz::raw_json{std::move(id)};
            resp.result = std::forward<T>(result);
            return to_json(resp);
        }

        static std::string make_error_response(std::string id, error_kind kind, const std::string& message) {
            error_envelope resp{};
            resp.id = glz::raw_json{std::move(id)};
            resp.error = error_body{rpc_code(kind), std::string{to_string(kind)}, message};
            return to_json(resp);
        }

        static std::string id_text(const glz::rpc::id_t& id) {
            return to_json(id);
        }

        // ── Tool result encoding ────────────────────────────────────────

        // Keep the last `limit` bytes; the end of a build log carries the errors.
        static bool truncate_tail(std::string& text, size_t limit) {
            if (limit == 0 || text.size() <= limit) {
                return false;
            }
            auto cut = text.size() - limit;
            // do not start in the middle of a UTF-8 sequence
            while (cut < text.size() && (static_cast<unsigned char>(text[cut]) & 0xC0U) == 0x80U) {
                ++cut;
            }
            text = "[... {} bytes truncated ...]\n{}"_format(cut, std::string_view{text}.substr(cut));
            return true;
        }

        static void append_stream(std::string& report, std::string_view label, std::string_view text) {
            if (text.empty()) {
                return;
            }
            report += label;
            report += ":\n";
            report += text;
            if (text.back() != '\n') {
                report += '\n';
            }
            report += '\n';
        }

        static std::string render_report(
                const process_spec& spec, const process_result& proc, std::string_view out, std::string_view err) {
            std::string report = "=== cargo {} ===\n"_format(subcommand(spec.tool));
            report += "Working directory: {}\n"_format(spec.working_directory.string());
            report += "Command: {}\n\n"_format(display_command(spec));

            if (proc.success()) {
                report += "Command completed successfully\n\n";
            }
            else if (proc.timed_out) {
                report += "Command timed out after {} ms and was killed\n\n"_format(proc.duration.count());
            }
            else if (proc.term_signal) {
                report += "Command terminated by signal {}\n\n"_format(*proc.term_signal);
            }
            else {
                report += "Command failed with exit code: {}\n\n"_format(proc.exit_code.value_or(-1));
            }

            append_stream(report, "STDOUT", out);
            append_stream(report, "STDERR", err);
            if (out.empty() && err.empty()) {
                report += "No output produced\n";
            }
            return report;
        }

        static tool_call_result encode_tool_result(
                const process_spec& spec, process_result proc, const startup_config& cfg) {
            execution_summary summary{};
            summary.command = spec.argv;
            summary.working_directory = spec.working_directory.string();
            summary.exit_code = proc.exit_code;
            summary.term_signal = proc.term_signal;
            summary.timed_out = proc.timed_out;
            summary.success = proc.success();
            summary.duration_ms = proc.duration.count();

            bool cut_out = truncate_tail(proc.stdout_text, cfg.max_output_bytes);
            bool cut_err = truncate_tail(proc.stderr_text, cfg.max_output_bytes);
            summary.truncated = cut_out || cut_err;

            // child output is arbitrary bytes; the response must be valid JSON text
            proc.stdout_text = utils::to_valid_utf8(proc.stdout_text);
            proc.stderr_text = utils::to_valid_utf8(proc.stderr_text);

            tool_call_result result{};
            result.content.push_back(
                    text_content{.text = render_report(spec, proc, proc.stdout_text, proc.stderr_text)});
            result.isError = !summary.success;

            summary.stdout_text = std::move(proc.stdout_text);
            summary.stderr_text = std::move(proc.stderr_text);
            result.structuredContent = std::move(summary);
            return result;
        }

        // ── Handlers ────────────────────────────────────────────────────

        static std::string handle_initialize(std::string id) {
            initialize_result result{};
            result.protocolVersion = std::string{protocol_version};
            result.capabilities = server_capabilities{};
            result.serverInfo = server_info{.name = std::string{server_name}, .version = std::string{server_version}};
            result.instructions = std::string{server_instructions};

            return make_response(std::move(id), std::move(result));
        }

        static std::string handle_tools_list(std::string id) {
            tools_list_result result{};
            for (const auto& tool : tool_registry()) {
                result.tools.push_back(
                        tool_listing{
                                .name = std::string{tool.name},
                                .description = std::string{tool.description},
                                .inputSchema = glz::raw_json{std::string{tool.input_schema}},
                        });
            }
            return make_response(std::move(id), std::move(result));
        }

        static void log_request(const startup_config& cfg, std::string_view message) {
            if (cfg.verbose) {
                std::cerr << "cargomcp: {}\n"_format(message);
            }
        }

        // validated, precondition-checked work for one tools/call
        struct accepted_call {
            tool_arguments args;
            std::filesystem::path project_root;
        };

        static accepted_call accept_tool_call(std::string_view raw_params) {
            // glaze expects a null terminated buffer
            std::string buffer{raw_params.empty() ? "{}"sv : raw_params};

            tool_call_params params{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(params, buffer);
            if (ec) {
                throw tool_error{
                        error_kind::invalid_params,
                        "failed to parse tool call params: {}"_format(glz::format_error(ec, buffer))};
            }
            if (params.name.empty()) {
                throw tool_error{error_kind::invalid_params, "tool call params require a tool name"};
            }

            const auto* tool = find_tool(params.name);
            if (tool == nullptr) {
                throw tool_error{error_kind::unknown_tool, "unknown tool: {}"_format(params.name)};
            }

            std::string_view raw_arguments{params.arguments.str};
            if (raw_arguments == null_id) {
                raw_arguments = {};
            }

            auto args = validate_arguments(*tool, raw_arguments);
            auto root = resolve_project_root(project_path_of(args));
            return {std::move(args), std::move(root)};
        }

    }  // namespace detail

    // ── Response sink ───────────────────────────────────────────────────

    void response_sink::write_line(std::string_view json) {
        std::lock_guard lock{mutex_};
        out_ << json << '\n';
        out_.flush();
    }

    // ── Dispatcher ──────────────────────────────────────────────────────

    dispatcher::dispatcher(
            const startup_config& cfg, response_sink& sink, process_runner runner, worker_launcher launcher)
            : cfg_{cfg}, sink_{sink}, runner_{std::move(runner)}, launcher_{std::move(launcher)} {}

    dispatcher::dispatcher(const startup_config& cfg, response_sink& sink, process_runner runner)
            : dispatcher{
                      cfg,
                      sink,
                      std::move(runner),
                      [](std::function<void()> work) { return std::jthread{std::move(work)}; }} {}

    dispatcher::dispatcher(const startup_config& cfg, response_sink& sink)
            : dispatcher{cfg, sink, [&cfg](const process_spec& spec) { return run_process(spec, cfg); }} {}

    dispatcher::~dispatcher() {
        wait_idle();
    }

    void dispatcher::wait_idle() {
        // jthread joins on destruction
        units_.clear();
    }

    size_t dispatcher::in_flight() const {
        return static_cast<size_t>(std::ranges::count_if(units_, [](const unit& u) { return !u.done->load(); }));
    }

    void dispatcher::reap() {
        units_.remove_if([](const unit& u) { return u.done->load(); });
    }

    void dispatcher::handle_line(std::string_view line) {
        if (line.find_first_not_of(" \t\r\n") == std::string_view::npos) {
            return;
        }

        reap();

        std::string buffer{line};
        glz::rpc::generic_request_t request{};
        auto ec = glz::read_json(request, buffer);
        if (ec) {
            debug_log("parse error: ", glz::format_error(ec, buffer));
            sink_.write_line(detail::make_error_response(
                    std::string{detail::null_id}, error_kind::parse_error, "JSON parse error"));
            return;
        }

        bool is_notification = std::holds_alternative<glz::generic::null_t>(request.id);
        auto id = detail::id_text(request.id);

        if (request.method == "initialize"sv) {
            if (!is_notification) {
                sink_.write_line(detail::handle_initialize(std::move(id)));
            }
        }
        else if (request.method == "ping"sv) {
            if (!is_notification) {
                sink_.write_line(detail::make_response(std::move(id), detail::empty_result{}));
            }
        }
        else if (request.method.starts_with("notifications/"sv)) {
            // notification, no response
        }
        else if (request.method == "tools/list"sv) {
            if (!is_notification) {
                sink_.write_line(detail::handle_tools_list(std::move(id)));
            }
        }
        else if (request.method == "tools/call"sv) {
            if (is_notification) {
                debug_log("ignoring tools/call without id");
                return;
            }
            start_tool_call(std::move(id), request.params.str);
        }
        else if (!is_notification) {
            sink_.write_line(detail::make_error_response(
                    std::move(id),
                    error_kind::method_not_found,
                    "Unknown method: {}"_format(std::string_view{request.method})));
        }
    }

    void dispatcher::start_tool_call(std::string id, std::string_view raw_params) {
        std::optional<detail::accepted_call> accepted{};
        try {
            accepted = detail::accept_tool_call(raw_params);
        } catch (const tool_error& e) {
            detail::log_request(cfg_, "request {} rejected: {}: {}"_format(id, e.kind(), e.what()));
            sink_.write_line(detail::make_error_response(std::move(id), e.kind(), e.what()));
            return;
        }

        auto reply_id = id;
        auto done = std::make_shared<std::atomic<bool>>(false);
        auto work = [this, done, id = std::move(id), call = std::move(*accepted)]() {
            std::string response{};
            try {
                auto spec = build_command(call.args, call.project_root, cfg_);
                auto proc = runner_(spec);
                detail::log_request(
                        cfg_,
                        "request {} {}: exit={} {}ms"_format(
                                id,
                                to_string(spec.tool),
                                proc.exit_code ? std::to_string(*proc.exit_code) : "none",
                                proc.duration.count()));
                response = detail::make_response(id, detail::encode_tool_result(spec, std::move(proc), cfg_));
            } catch (const tool_error& e) {
                detail::log_request(cfg_, "request {} failed: {}: {}"_format(id, e.kind(), e.what()));
                response = detail::make_error_response(id, e.kind(), e.what());
            } catch (const std::exception& e) {
                detail::log_request(cfg_, "request {} failed: {}"_format(id, e.what()));
                response = detail::make_error_response(id, error_kind::internal_error, e.what());
            }
            sink_.write_line(response);
            done->store(true);
        };

        try {
            units_.push_back(unit{done, launcher_(std::move(work))});
        } catch (const std::system_error& e) {
            detail::log_request(cfg_, "request {} not started: {}"_format(reply_id, e.what()));
            sink_.write_line(detail::make_error_response(
                    std::move(reply_id), error_kind::internal_error, "cannot start worker: {}"_format(e.what())));
        }
    }

    // ── Server entry point ──────────────────────────────────────────────

    int run_mcp_server(const startup_config& cfg, std::istream& in, std::ostream& out) {
        response_sink sink{out};
        dispatcher server{cfg, sink};

        std::string line{};
        while (std::getline(in, line)) {
            server.handle_line(line);
        }

        server.wait_idle();
        return 0;
    }

    int run_mcp_server(const startup_config& cfg) {
        ::signal(SIGPIPE, SIG_IGN);

        if (!cfg.quiet) {
            std::cerr << "{} {}: serving {} cargo tools over stdio\n"_format(
                    server_name, server_version, tool_registry().size());
        }

        return run_mcp_server(cfg, std::cin, std::cout);
    }

}  // namespace cargomcp::mcp
