#include "cargomcp/tools.hpp"

#include "cargomcp/errors.hpp"
#include "cargomcp/format.hpp"

#include <glaze/glaze.hpp>

#include <algorithm>
#include <array>
#include <string>
#include <string_view>

using namespace cargomcp::literals;

namespace glz {

    template <>
    struct meta<cargomcp::check_args> {
        using T = cargomcp::check_args;
        static constexpr auto value =
                object("path", &T::path, "package", &T::package, "toolchain", &T::toolchain, "cargo_env", &T::cargo_env);
    };

    template <>
    struct meta<cargomcp::clippy_args> {
        using T = cargomcp::clippy_args;
        static constexpr auto value =
                object("path",
                       &T::path,
                       "package",
                       &T::package,
                       "fix",
                       &T::fix,
                       "toolchain",
                       &T::toolchain,
                       "cargo_env",
                       &T::cargo_env);
    };

    template <>
    struct meta<cargomcp::test_args> {
        using T = cargomcp::test_args;
        static constexpr auto value =
                object("path",
                       &T::path,
                       "package",
                       &T::package,
                       "test_name",
                       &T::test_name,
                       "no_capture",
                       &T::no_capture,
                       "toolchain",
                       &T::toolchain,
                       "cargo_env",
                       &T::cargo_env);
    };

    template <>
    struct meta<cargomcp::fmt_check_args> {
        using T = cargomcp::fmt_check_args;
        static constexpr auto value = object("path", &T::path, "toolchain", &T::toolchain, "cargo_env", &T::cargo_env);
    };

    template <>
    struct meta<cargomcp::build_args> {
        using T = cargomcp::build_args;
        static constexpr auto value =
                object("path",
                       &T::path,
                       "package",
                       &T::package,
                       "release",
                       &T::release,
                       "toolchain",
                       &T::toolchain,
                       "cargo_env",
                       &T::cargo_env);
    };

    template <>
    struct meta<cargomcp::bench_args> {
        using T = cargomcp::bench_args;
        static constexpr auto value =
                object("path",
                       &T::path,
                       "package",
                       &T::package,
                       "bench_name",
                       &T::bench_name,
                       "baseline",
                       &T::baseline,
                       "toolchain",
                       &T::toolchain,
                       "cargo_env",
                       &T::cargo_env);
    };

    template <>
    struct meta<cargomcp::add_args> {
        using T = cargomcp::add_args;
        static constexpr auto value =
                object("path",
                       &T::path,
                       "dependencies",
                       &T::dependencies,
                       "package",
                       &T::package,
                       "dev",
                       &T::dev,
                       "optional",
                       &T::optional,
                       "features",
                       &T::features,
                       "toolchain",
                       &T::toolchain,
                       "cargo_env",
                       &T::cargo_env);
    };

    template <>
    struct meta<cargomcp::remove_args> {
        using T = cargomcp::remove_args;
        static constexpr auto value =
                object("path",
                       &T::path,
                       "dependencies",
                       &T::dependencies,
                       "package",
                       &T::package,
                       "dev",
                       &T::dev,
                       "toolchain",
                       &T::toolchain,
                       "cargo_env",
                       &T::cargo_env);
    };

    template <>
    struct meta<cargomcp::update_args> {
        using T = cargomcp::update_args;
        static constexpr auto value =
                object("path",
                       &T::path,
                       "package",
                       &T::package,
                       "dependencies",
                       &T::dependencies,
                       "dry_run",
                       &T::dry_run,
                       "toolchain",
                       &T::toolchain,
                       "cargo_env",
                       &T::cargo_env);
    };

    template <>
    struct meta<cargomcp::clean_args> {
        using T = cargomcp::clean_args;
        static constexpr auto value =
                object("path",
                       &T::path,
                       "package",
                       &T::package,
                       "release",
                       &T::release,
                       "toolchain",
                       &T::toolchain,
                       "cargo_env",
                       &T::cargo_env);
    };

    template <>
    struct meta<cargomcp::run_args> {
        using T = cargomcp::run_args;
        static constexpr auto value =
                object("path",
                       &T::path,
                       "package",
                       &T::package,
                       "bin",
                       &T::bin,
                       "example",
                       &T::example,
                       "release",
                       &T::release,
                       "features",
                       &T::features,
                       "all_features",
                       &T::all_features,
                       "no_default_features",
                       &T::no_default_features,
                       "args",
                       &T::args,
                       "toolchain",
                       &T::toolchain,
                       "cargo_env",
                       &T::cargo_env);
    };

}  // namespace glz

namespace cargomcp {

    namespace detail {

        // ── Tool schemas ────────────────────────────────────────────────
        //
        // Every schema is closed: additionalProperties is false and the
        // validator rejects unknown keys to match.

        static constexpr auto check_description = R"(Run cargo check to verify the project compiles.)";
        static constexpr auto check_input_schema =
                R"json({"type": "object","properties": {"path": {"type": "string","description": "Rust project directory; must contain Cargo.toml"},"package": {"type": "string","description": "Workspace package to check (-p)"},"toolchain": {"type": "string","description": "Rust toolchain, e.g. 'stable', 'nightly', '1.70.0'"},"cargo_env": {"type": "object","additionalProperties": { "type": "string" },"description": "Environment variables for the cargo process"}},"required": ["path"],"additionalProperties": false})json"sv;

        static constexpr auto clippy_description = R"(Run cargo clippy lints, optionally applying automatic fixes.)";
        static constexpr auto clippy_input_schema =
                R"json({"type": "object","properties": {"path": {"type": "string","description": "Rust project directory; must contain Cargo.toml"},"package": {"type": "string","description": "Workspace package to lint (-p)"},"fix": {"type": "boolean","description": "Apply suggested fixes (--fix). Default false.","default": false},"toolchain": {"type": "string","description": "Rust toolchain, e.g. 'stable', 'nightly', '1.70.0'"},"cargo_env": {"type": "object","additionalProperties": { "type": "string" },"description": "Environment variables for the cargo process, e.g. {\"RUSTFLAGS\": \"-D warnings\"}"}},"required": ["path"],"additionalProperties": false})json"sv;

        static constexpr auto test_description = R"(Run cargo test, optionally filtered to one package or test name.)";
        static constexpr auto test_input_schema =
                R"json({"type": "object","properties": {"path": {"type": "string","description": "Rust project directory; must contain Cargo.toml"},"package": {"type": "string","description": "Workspace package to test (-p)"},"test_name": {"type": "string","description": "Test name filter"},"no_capture": {"type": "boolean","description": "Show test stdout/stderr (-- --no-capture). Default false.","default": false},"toolchain": {"type": "string","description": "Rust toolchain, e.g. 'stable', 'nightly', '1.70.0'"},"cargo_env": {"type": "object","additionalProperties": { "type": "string" },"description": "Environment variables for the cargo process"}},"required": ["path"],"additionalProperties": false})json"sv;

        static constexpr auto fmt_check_description = R"(Check formatting with cargo fmt --check without modifying files.)";
        static constexpr auto fmt_check_input_schema =
                R"json({"type": "object","properties": {"path": {"type": "string","description": "Rust project directory; must contain Cargo.toml"},"toolchain": {"type": "string","description": "Rust toolchain, e.g. 'stable', 'nightly', '1.70.0'"},"cargo_env": {"type": "object","additionalProperties": { "type": "string" },"description": "Environment variables for the cargo process"}},"required": ["path"],"additionalProperties": false})json"sv;

        static constexpr auto build_description = R"(Build the project with cargo build.)";
        static constexpr auto build_input_schema =
                R"json({"type": "object","properties": {"path": {"type": "string","description": "Rust project directory; must contain Cargo.toml"},"package": {"type": "string","description": "Workspace package to build (-p)"},"release": {"type": "boolean","description": "Build with the release profile. Default false.","default": false},"toolchain": {"type": "string","description": "Rust toolchain, e.g. 'stable', 'nightly', '1.70.0'"},"cargo_env": {"type": "object","additionalProperties": { "type": "string" },"description": "Environment variables for the cargo process"}},"required": ["path"],"additionalProperties": false})json"sv;

        static constexpr auto bench_description = R"(Run cargo bench, optionally one benchmark, saving results under a baseline name.)";
        static constexpr auto bench_input_schema =
                R"json({"type": "object","properties": {"path": {"type": "string","description": "Rust project directory; must contain Cargo.toml"},"package": {"type": "string","description": "Workspace package to benchmark (-p)"},"bench_name": {"type": "string","description": "Benchmark name filter"},"baseline": {"type": "string","description": "Baseline name passed as -- --save-baseline"},"toolchain": {"type": "string","description": "Rust toolchain, e.g. 'stable', 'nightly', '1.70.0'"},"cargo_env": {"type": "object","additionalProperties": { "type": "string" },"description": "Environment variables for the cargo process"}},"required": ["path"],"additionalProperties": false})json"sv;

        static constexpr auto add_description = R"(Add dependencies to Cargo.toml with cargo add.)";
        static constexpr auto add_input_schema =
                R"json({"type": "object","properties": {"path": {"type": "string","description": "Rust project directory; must contain Cargo.toml"},"dependencies": {"type": "array","items": { "type": "string" },"minItems": 1,"description": "Dependency specifiers, in order, e.g. ['serde', 'tokio@1.0']"},"package": {"type": "string","description": "Workspace package to modify (-p)"},"dev": {"type": "boolean","description": "Add as development dependencies. Default false.","default": false},"optional": {"type": "boolean","description": "Add as optional dependencies. Default false.","default": false},"features": {"type": "array","items": { "type": "string" },"description": "Features to enable, joined into --features"},"toolchain": {"type": "string","description": "Rust toolchain, e.g. 'stable', 'nightly', '1.70.0'"},"cargo_env": {"type": "object","additionalProperties": { "type": "string" },"description": "Environment variables for the cargo process"}},"required": ["path", "dependencies"],"additionalProperties": false})json"sv;

        static constexpr auto remove_description = R"(Remove dependencies from Cargo.toml with cargo remove.)";
        static constexpr auto remove_input_schema =
                R"json({"type": "object","properties": {"path": {"type": "string","description": "Rust project directory; must contain Cargo.toml"},"dependencies": {"type": "array","items": { "type": "string" },"minItems": 1,"description": "Dependencies to remove, in order"},"package": {"type": "string","description": "Workspace package to modify (-p)"},"dev": {"type": "boolean","description": "Remove from development dependencies. Default false.","default": false},"toolchain": {"type": "string","description": "Rust toolchain, e.g. 'stable', 'nightly', '1.70.0'"},"cargo_env": {"type": "object","additionalProperties": { "type": "string" },"description": "Environment variables for the cargo process"}},"required": ["path", "dependencies"],"additionalProperties": false})json"sv;

        static constexpr auto update_description = R"(Update Cargo.lock with cargo update, optionally limited to given dependencies.)";
        static constexpr auto update_input_schema =
                R"json({"type": "object","properties": {"path": {"type": "string","description": "Rust project directory; must contain Cargo.toml"},"package": {"type": "string","description": "Package to update (-p)"},"dependencies": {"type": "array","items": { "type": "string" },"description": "Dependencies to update, each passed as -p in the given order"},"dry_run": {"type": "boolean","description": "Report what would change without writing Cargo.lock. Default false.","default": false},"toolchain": {"type": "string","description": "Rust toolchain, e.g. 'stable', 'nightly', '1.70.0'"},"cargo_env": {"type": "object","additionalProperties": { "type": "string" },"description": "Environment variables for the cargo process"}},"required": ["path"],"additionalProperties": false})json"sv;

        static constexpr auto clean_description = R"(Remove build artifacts with cargo clean.)";
        static constexpr auto clean_input_schema =
                R"json({"type": "object","properties": {"path": {"type": "string","description": "Rust project directory; must contain Cargo.toml"},"package": {"type": "string","description": "Package whose artifacts to clean (-p)"},"release": {"type": "boolean","description": "Only clean release artifacts. Default false.","default": false},"toolchain": {"type": "string","description": "Rust toolchain, e.g. 'stable', 'nightly', '1.70.0'"},"cargo_env": {"type": "object","additionalProperties": { "type": "string" },"description": "Environment variables for the cargo process"}},"required": ["path"],"additionalProperties": false})json"sv;

        static constexpr auto run_description = R"(Build and run a binary or example with cargo run. Program arguments follow a -- separator.)";
        static constexpr auto run_input_schema =
                R"json({"type": "object","properties": {"path": {"type": "string","description": "Rust project directory; must contain Cargo.toml"},"package": {"type": "string","description": "Workspace package to run (-p)"},"bin": {"type": "string","description": "Binary target to run"},"example": {"type": "string","description": "Example target to run"},"release": {"type": "boolean","description": "Run with the release profile. Default false.","default": false},"features": {"type": "array","items": { "type": "string" },"description": "Features to enable, joined into --features"},"all_features": {"type": "boolean","description": "Enable all features. Default false.","default": false},"no_default_features": {"type": "boolean","description": "Disable default features. Default false.","default": false},"args": {"type": "array","items": { "type": "string" },"description": "Arguments passed to the program after --"},"toolchain": {"type": "string","description": "Rust toolchain, e.g. 'stable', 'nightly', '1.70.0'"},"cargo_env": {"type": "object","additionalProperties": { "type": "string" },"description": "Environment variables for the cargo process"}},"required": ["path"],"additionalProperties": false})json"sv;

        static constexpr std::array registry{
                tool_definition{tool_kind::check, to_string(tool_kind::check), check_description, check_input_schema},
                tool_definition{tool_kind::clippy, to_string(tool_kind::clippy), clippy_description, clippy_input_schema},
                tool_definition{tool_kind::test, to_string(tool_kind::test), test_description, test_input_schema},
                tool_definition{
                        tool_kind::fmt_check,
                        to_string(tool_kind::fmt_check),
                        fmt_check_description,
                        fmt_check_input_schema},
                tool_definition{tool_kind::build, to_string(tool_kind::build), build_description, build_input_schema},
                tool_definition{tool_kind::bench, to_string(tool_kind::bench), bench_description, bench_input_schema},
                tool_definition{tool_kind::add, to_string(tool_kind::add), add_description, add_input_schema},
                tool_definition{tool_kind::remove, to_string(tool_kind::remove), remove_description, remove_input_schema},
                tool_definition{tool_kind::update, to_string(tool_kind::update), update_description, update_input_schema},
                tool_definition{tool_kind::clean, to_string(tool_kind::clean), clean_description, clean_input_schema},
                tool_definition{tool_kind::run, to_string(tool_kind::run), run_description, run_input_schema},
        };

        static_assert(registry.size() == std::variant_size_v<tool_arguments>);

        // ── Field checks ────────────────────────────────────────────────

        [[noreturn]] static void reject(const tool_definition& tool, const std::string& message) {
            throw tool_error{error_kind::validation_error, "{}: {}"_format(tool.name, message)};
        }

        static void require_name(const tool_definition& tool, std::string_view field, const std::string& value) {
            if (value.empty()) {
                reject(tool, "'{}' must not be empty"_format(field));
            }
            if (utils::looks_like_flag(value)) {
                reject(tool, "'{}' must not start with '-': {}"_format(field, value));
            }
        }

        static void require_name(
                const tool_definition& tool, std::string_view field, const std::optional<std::string>& value) {
            if (value) {
                require_name(tool, field, *value);
            }
        }

        static void require_names(
                const tool_definition& tool, std::string_view field, const std::vector<std::string>& values) {
            for (const auto& value : values) {
                require_name(tool, field, value);
            }
        }

        template <typename Args>
        static void check_common(const tool_definition& tool, const Args& args) {
            if (args.path.empty()) {
                reject(tool, "missing required field 'path'");
            }
            if (args.toolchain && !utils::is_valid_toolchain(*args.toolchain)) {
                reject(tool, "invalid toolchain: '{}'"_format(*args.toolchain));
            }
            for (const auto& [key, value] : args.cargo_env) {
                if (key.empty() || key.find_first_of("=\0"sv) != std::string::npos) {
                    reject(tool, "invalid cargo_env variable name: '{}'"_format(key));
                }
                if (value.find('\0') != std::string::npos) {
                    reject(tool, "cargo_env value for '{}' contains a NUL byte"_format(key));
                }
            }
        }

        static void check_fields(const tool_definition& tool, const check_args& args) {
            require_name(tool, "package", args.package);
        }

        static void check_fields(const tool_definition& tool, const clippy_args& args) {
            require_name(tool, "package", args.package);
        }

        static void check_fields(const tool_definition& tool, const test_args& args) {
            require_name(tool, "package", args.package);
            require_name(tool, "test_name", args.test_name);
        }

        static void check_fields(const tool_definition&, const fmt_check_args&) {}

        static void check_fields(const tool_definition& tool, const build_args& args) {
            require_name(tool, "package", args.package);
        }

        static void check_fields(const tool_definition& tool, const bench_args& args) {
            require_name(tool, "package", args.package);
            require_name(tool, "bench_name", args.bench_name);
            require_name(tool, "baseline", args.baseline);
        }

        static void check_fields(const tool_definition& tool, const add_args& args) {
            if (args.dependencies.empty()) {
                reject(tool, "missing required field 'dependencies' (at least one dependency)");
            }
            require_names(tool, "dependencies", args.dependencies);
            require_name(tool, "package", args.package);
            require_names(tool, "features", args.features);
        }

        static void check_fields(const tool_definition& tool, const remove_args& args) {
            if (args.dependencies.empty()) {
                reject(tool, "missing required field 'dependencies' (at least one dependency)");
            }
            require_names(tool, "dependencies", args.dependencies);
            require_name(tool, "package", args.package);
        }

        static void check_fields(const tool_definition& tool, const update_args& args) {
            require_name(tool, "package", args.package);
            require_names(tool, "dependencies", args.dependencies);
        }

        static void check_fields(const tool_definition& tool, const clean_args& args) {
            require_name(tool, "package", args.package);
        }

        static void check_fields(const tool_definition& tool, const run_args& args) {
            require_name(tool, "package", args.package);
            require_name(tool, "bin", args.bin);
            require_name(tool, "example", args.example);
            require_names(tool, "features", args.features);
            if (args.bin && args.example) {
                reject(tool, "'bin' and 'example' are mutually exclusive");
            }
            if (!args.features.empty() && args.all_features) {
                reject(tool, "'features' and 'all_features' are mutually exclusive");
            }
        }

        template <typename Args>
        static tool_arguments decode(const tool_definition& tool, std::string_view raw_arguments) {
            // glaze expects a null terminated buffer
            std::string buffer{raw_arguments.empty() ? "{}"sv : raw_arguments};

            Args args{};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = true}>(args, buffer);
            if (ec) {
                reject(tool, "invalid arguments: {}"_format(glz::format_error(ec, buffer)));
            }

            check_common(tool, args);
            check_fields(tool, args);
            return tool_arguments{std::move(args)};
        }

    }  // namespace detail

    std::span<const tool_definition> tool_registry() {
        return detail::registry;
    }

    const tool_definition* find_tool(std::string_view name) {
        auto it = std::ranges::find(detail::registry, name, &tool_definition::name);
        if (it == detail::registry.end()) {
            return nullptr;
        }
        return &*it;
    }

    tool_arguments validate_arguments(const tool_definition& tool, std::string_view raw_arguments) {
        switch (tool.kind) {
            case tool_kind::check:
                return detail::decode<check_args>(tool, raw_arguments);
            case tool_kind::clippy:
                return detail::decode<clippy_args>(tool, raw_arguments);
            case tool_kind::test:
                return detail::decode<test_args>(tool, raw_arguments);
            case tool_kind::fmt_check:
                return detail::decode<fmt_check_args>(tool, raw_arguments);
            case tool_kind::build:
                return detail::decode<build_args>(tool, raw_arguments);
            case tool_kind::bench:
                return detail::decode<bench_args>(tool, raw_arguments);
            case tool_kind::add:
                return detail::decode<add_args>(tool, raw_arguments);
            case tool_kind::remove:
                return detail::decode<remove_args>(tool, raw_arguments);
            case tool_kind::update:
                return detail::decode<update_args>(tool, raw_arguments);
            case tool_kind::clean:
                return detail::decode<clean_args>(tool, raw_arguments);
            case tool_kind::run:
                return detail::decode<run_args>(tool, raw_arguments);
        }
        throw tool_error{error_kind::unknown_tool, "unregistered tool kind"};
    }

}  // namespace cargomcp
