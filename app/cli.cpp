#include "cli.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cargomcp::cli {

    namespace detail {

        using namespace std::string_view_literals;

        static constexpr std::string_view trim_view(std::string_view value) {
            auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string_view::npos) {
                return {};
            }
            auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, (last - first) + 1U);
        }

        static std::optional<std::string> normalize_optional(std::string value) {
            auto trimmed = trim_view(value);
            if (trimmed.empty()) {
                return std::nullopt;
            }
            return std::string(trimmed);
        }

        static void print_config(const startup_config& cfg, std::ostream& os) {
            os << "cargo=" << cfg.cargo_path.string() << '\n';
            os << "toolchain=" << (cfg.default_toolchain ? *cfg.default_toolchain : "<none>") << '\n';
            os << "timeout_ms=" << cfg.tool_timeout_ms << '\n';
            os << "max_output_bytes=" << cfg.max_output_bytes << '\n';
            os << "inherit_env=" << utils::join_with_separator(cfg.inherited_env, ",") << '\n';
            os << "verbosity=" << (cfg.verbose ? "verbose" : cfg.quiet ? "quiet" : "normal") << '\n';
        }

    }  // namespace detail

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg) {
        CLI::App app{"cargomcp: MCP server exposing whitelisted cargo commands over stdio"};

        bool show_version = false;
        std::string cargo_arg{cfg.cargo_path.string()};
        std::string toolchain_arg{cfg.default_toolchain.value_or("")};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--cargo", cargo_arg, "cargo executable (name looked up on PATH, or a path)");
        app.add_option("--toolchain", toolchain_arg, "Default toolchain when a request names none")
                ->envname(std::string{default_toolchain_env});
        app.add_option("--timeout-ms", cfg.tool_timeout_ms, "Per-invocation time limit in ms (0 = none)")
                ->check(CLI::NonNegativeNumber);
        app.add_option("--max-output-bytes", cfg.max_output_bytes, "Per-stream output cap in bytes (0 = none)");
        app.add_option("--inherit-env", cfg.inherited_env, "Server variable passed to cargo (repeatable)");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress non-essential output");
        app.add_flag("--verbose", cfg.verbose, "Log every request to stderr");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            return std::optional<int>{app.exit(e)};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }

        cfg.default_toolchain = detail::normalize_optional(toolchain_arg);
        if (cfg.default_toolchain && !utils::is_valid_toolchain(*cfg.default_toolchain)) {
            std::cerr << "invalid --toolchain value: " << *cfg.default_toolchain
                      << " (expected letters, digits, '.', '_' or '-')\n";
            return std::optional<int>{2};
        }

        auto cargo = detail::trim_view(cargo_arg);
        if (cargo.empty()) {
            std::cerr << "--cargo must not be empty\n";
            return std::optional<int>{2};
        }
        cfg.cargo_path = std::string{cargo};

        for (const auto& name : cfg.inherited_env) {
            if (name.empty() || name.find('=') != std::string::npos) {
                std::cerr << "invalid --inherit-env name: '" << name << "'\n";
                return std::optional<int>{2};
            }
        }

        if (show_version) {
            std::cout << server_name << ' ' << server_version << '\n';
            return std::optional<int>{0};
        }

        if (cfg.print_config) {
            detail::print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

}  // namespace cargomcp::cli
