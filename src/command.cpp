#include "cargomcp/command.hpp"

#include "cargomcp/utils.hpp"

#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace cargomcp {

    namespace detail {

        using argv_t = std::vector<std::string>;

        static void push_package(argv_t& argv, const std::optional<std::string>& package) {
            if (package) {
                argv.emplace_back("-p");
                argv.push_back(*package);
            }
        }

        static void push_flag(argv_t& argv, bool enabled, std::string_view flag) {
            if (enabled) {
                argv.emplace_back(flag);
            }
        }

        static void push_features(argv_t& argv, const std::vector<std::string>& features) {
            if (!features.empty()) {
                argv.emplace_back("--features");
                argv.push_back(utils::join_with_separator(features, ","));
            }
        }

        // ── Per-tool argv tails ─────────────────────────────────────────

        static void append_tool_args(argv_t& argv, const check_args& args) {
            push_package(argv, args.package);
        }

        static void append_tool_args(argv_t& argv, const clippy_args& args) {
            push_package(argv, args.package);
            push_flag(argv, args.fix, "--fix");
        }

        static void append_tool_args(argv_t& argv, const test_args& args) {
            push_package(argv, args.package);
            if (args.test_name) {
                argv.push_back(*args.test_name);
            }
            if (args.no_capture) {
                argv.emplace_back("--");
                argv.emplace_back("--no-capture");
            }
        }

        static void append_tool_args(argv_t& argv, const fmt_check_args&) {
            argv.emplace_back("--check");
        }

        static void append_tool_args(argv_t& argv, const build_args& args) {
            push_package(argv, args.package);
            push_flag(argv, args.release, "--release");
        }

        static void append_tool_args(argv_t& argv, const bench_args& args) {
            push_package(argv, args.package);
            if (args.bench_name) {
                argv.push_back(*args.bench_name);
            }
            if (args.baseline) {
                argv.emplace_back("--");
                argv.emplace_back("--save-baseline");
                argv.push_back(*args.baseline);
            }
        }

        static void append_tool_args(argv_t& argv, const add_args& args) {
            push_package(argv, args.package);
            argv.insert(argv.end(), args.dependencies.begin(), args.dependencies.end());
            push_flag(argv, args.dev, "--dev");
            push_flag(argv, args.optional, "--optional");
            push_features(argv, args.features);
        }

        static void append_tool_args(argv_t& argv, const remove_args& args) {
            push_package(argv, args.package);
            argv.insert(argv.end(), args.dependencies.begin(), args.dependencies.end());
            push_flag(argv, args.dev, "--dev");
        }

        static void append_tool_args(argv_t& argv, const update_args& args) {
            push_package(argv, args.package);
            push_flag(argv, args.dry_run, "--dry-run");
            for (const auto& dep : args.dependencies) {
                argv.emplace_back("-p");
                argv.push_back(dep);
            }
        }

        static void append_tool_args(argv_t& argv, const clean_args& args) {
            push_package(argv, args.package);
            push_flag(argv, args.release, "--release");
        }

        static void append_tool_args(argv_t& argv, const run_args& args) {
            push_package(argv, args.package);
            if (args.bin) {
                argv.emplace_back("--bin");
                argv.push_back(*args.bin);
            }
            if (args.example) {
                argv.emplace_back("--example");
                argv.push_back(*args.example);
            }
            push_flag(argv, args.release, "--release");
            push_features(argv, args.features);
            push_flag(argv, args.all_features, "--all-features");
            push_flag(argv, args.no_default_features, "--no-default-features");
            if (!args.args.empty()) {
                argv.emplace_back("--");
                argv.insert(argv.end(), args.args.begin(), args.args.end());
            }
        }

    }  // namespace detail

    process_spec build_command(const tool_arguments& args, const fs::path& project_root, const startup_config& cfg) {
        process_spec spec{};
        spec.tool = kind_of(args);
        spec.program = cfg.cargo_path.string();
        spec.working_directory = project_root;
        spec.env = cargo_env_of(args);

        spec.argv.push_back(spec.program);

        const auto& toolchain = toolchain_of(args) ? toolchain_of(args) : cfg.default_toolchain;
        if (toolchain) {
            spec.argv.push_back("+" + *toolchain);
        }

        spec.argv.emplace_back(subcommand(spec.tool));
        std::visit([&](const auto& a) { detail::append_tool_args(spec.argv, a); }, args);

        return spec;
    }

    std::string display_command(const process_spec& spec) {
        std::vector<std::string> tokens{};
        tokens.reserve(spec.argv.size());
        for (const auto& token : spec.argv) {
            tokens.push_back(utils::display_quote(token));
        }
        return utils::join_with_separator(tokens, " ");
    }

}  // namespace cargomcp
