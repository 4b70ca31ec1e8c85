#pragma once

#include "config.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace cargomcp {

    enum class tool_kind : uint8_t {
        check,
        clippy,
        test,
        fmt_check,
        build,
        bench,
        add,
        remove,
        update,
        clean,
        run,
    };

    inline constexpr std::string_view to_string(tool_kind kind) {
        switch (kind) {
            case tool_kind::check:
                return "cargo_check"sv;
            case tool_kind::clippy:
                return "cargo_clippy"sv;
            case tool_kind::test:
                return "cargo_test"sv;
            case tool_kind::fmt_check:
                return "cargo_fmt_check"sv;
            case tool_kind::build:
                return "cargo_build"sv;
            case tool_kind::bench:
                return "cargo_bench"sv;
            case tool_kind::add:
                return "cargo_add"sv;
            case tool_kind::remove:
                return "cargo_remove"sv;
            case tool_kind::update:
                return "cargo_update"sv;
            case tool_kind::clean:
                return "cargo_clean"sv;
            case tool_kind::run:
                return "cargo_run"sv;
        }
        return "cargo_check"sv;
    }

    // fixed cargo subcommand token for each tool
    inline constexpr std::string_view subcommand(tool_kind kind) {
        switch (kind) {
            case tool_kind::check:
                return "check"sv;
            case tool_kind::clippy:
                return "clippy"sv;
            case tool_kind::test:
                return "test"sv;
            case tool_kind::fmt_check:
                return "fmt"sv;
            case tool_kind::build:
                return "build"sv;
            case tool_kind::bench:
                return "bench"sv;
            case tool_kind::add:
                return "add"sv;
            case tool_kind::remove:
                return "remove"sv;
            case tool_kind::update:
                return "update"sv;
            case tool_kind::clean:
                return "clean"sv;
            case tool_kind::run:
                return "run"sv;
        }
        return "check"sv;
    }

    struct tool_definition {
        tool_kind kind{};
        std::string_view name{};
        std::string_view description{};
        std::string_view input_schema{};
    };

    // all whitelisted tools, in listing order
    std::span<const tool_definition> tool_registry();

    // nullptr when `name` is not a registered tool
    const tool_definition* find_tool(std::string_view name);

    using env_overlay = std::map<std::string, std::string>;

    // ── Per-tool argument records ───────────────────────────────────────
    //
    // Every record carries path/toolchain/cargo_env; the rest is specific to
    // the tool. Optional booleans are already defaulted once validated.

    struct check_args {
        static constexpr auto kind = tool_kind::check;
        std::string path{};
        std::optional<std::string> package{};
        std::optional<std::string> toolchain{};
        env_overlay cargo_env{};
    };

    struct clippy_args {
        static constexpr auto kind = tool_kind::clippy;
        std::string path{};
        std::optional<std::string> package{};
        bool fix{false};
        std::optional<std::string> toolchain{};
        env_overlay cargo_env{};
    };

    struct test_args {
        static constexpr auto kind = tool_kind::test;
        std::string path{};
        std::optional<std::string> package{};
        std::optional<std::string> test_name{};
        bool no_capture{false};
        std::optional<std::string> toolchain{};
        env_overlay cargo_env{};
    };

    struct fmt_check_args {
        static constexpr auto kind = tool_kind::fmt_check;
        std::string path{};
        std::optional<std::string> toolchain{};
        env_overlay cargo_env{};
    };

    struct build_args {
        static constexpr auto kind = tool_kind::build;
        std::string path{};
        std::optional<std::string> package{};
        bool release{false};
        std::optional<std::string> toolchain{};
        env_overlay cargo_env{};
    };

    struct bench_args {
        static constexpr auto kind = tool_kind::bench;
        std::string path{};
        std::optional<std::string> package{};
        std::optional<std::string> bench_name{};
        std::optional<std::string> baseline{};
        std::optional<std::string> toolchain{};
        env_overlay cargo_env{};
    };

    struct add_args {
        static constexpr auto kind = tool_kind::add;
        std::string path{};
        std::vector<std::string> dependencies{};
        std::optional<std::string> package{};
        bool dev{false};
        bool optional{false};
        std::vector<std::string> features{};
        std::optional<std::string> toolchain{};
        env_overlay cargo_env{};
    };

    struct remove_args {
        static constexpr auto kind = tool_kind::remove;
        std::string path{};
        std::vector<std::string> dependencies{};
        std::optional<std::string> package{};
        bool dev{false};
        std::optional<std::string> toolchain{};
        env_overlay cargo_env{};
    };

    struct update_args {
        static constexpr auto kind = tool_kind::update;
        std::string path{};
        std::optional<std::string> package{};
        std::vector<std::string> dependencies{};
        bool dry_run{false};
        std::optional<std::string> toolchain{};
        env_overlay cargo_env{};
    };

    struct clean_args {
        static constexpr auto kind = tool_kind::clean;
        std::string path{};
        std::optional<std::string> package{};
        bool release{false};
        std::optional<std::string> toolchain{};
        env_overlay cargo_env{};
    };

    struct run_args {
        static constexpr auto kind = tool_kind::run;
        std::string path{};
        std::optional<std::string> package{};
        std::optional<std::string> bin{};
        std::optional<std::string> example{};
        bool release{false};
        std::vector<std::string> features{};
        bool all_features{false};
        bool no_default_features{false};
        std::vector<std::string> args{};
        std::optional<std::string> toolchain{};
        env_overlay cargo_env{};
    };

    using tool_arguments = std::variant<
            check_args,
            clippy_args,
            test_args,
            fmt_check_args,
            build_args,
            bench_args,
            add_args,
            remove_args,
            update_args,
            clean_args,
            run_args>;

    inline tool_kind kind_of(const tool_arguments& args) {
        return std::visit([](const auto& a) { return std::remove_cvref_t<decltype(a)>::kind; }, args);
    }

    inline const std::string& project_path_of(const tool_arguments& args) {
        return std::visit([](const auto& a) -> const std::string& { return a.path; }, args);
    }

    inline const std::optional<std::string>& toolchain_of(const tool_arguments& args) {
        return std::visit([](const auto& a) -> const std::optional<std::string>& { return a.toolchain; }, args);
    }

    inline const env_overlay& cargo_env_of(const tool_arguments& args) {
        return std::visit([](const auto& a) -> const env_overlay& { return a.cargo_env; }, args);
    }

    /*
     * Decode `raw_arguments` (a JSON object, empty means {}) against the closed
     * schema of `tool`. Unknown fields, wrong types, missing required fields and
     * values that could be read as flags all throw tool_error(validation_error).
     */
    tool_arguments validate_arguments(const tool_definition& tool, std::string_view raw_arguments);

}  // namespace cargomcp
