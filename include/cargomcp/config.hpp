#pragma once

#include "utils.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cargomcp {

    using namespace std::string_view_literals;

    inline constexpr auto server_name = "cargomcp"sv;
    inline constexpr auto server_version = "0.1.0"sv;
    inline constexpr auto protocol_version = "2024-11-05"sv;

    inline constexpr auto manifest_file_name = "Cargo.toml"sv;
    inline constexpr auto default_toolchain_env = "CARGO_MCP_DEFAULT_TOOLCHAIN"sv;

    /*
     * cargomcp Startup Config Options
     *
     * Build tool
     * - cargo_path: Build tool executable. A bare name is looked up on the server's PATH.
     * - default_toolchain: Toolchain selector used when a request names none ("+<toolchain>").
     *
     * Child process policy
     * - inherited_env: Server variables copied into every child environment. Nothing else
     *   from the server environment reaches a child; the per-request cargo_env overlay is
     *   applied on top.
     * - tool_timeout_ms: Wall-clock limit per invocation, 0 disables it.
     * - max_output_bytes: Per-stream cap applied when a result is encoded, 0 disables it.
     *
     * Output
     * - quiet/verbose: Coarse stderr verbosity; stdout carries protocol traffic only.
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved startup config and exit.
     */
    struct startup_config {
        std::filesystem::path cargo_path{"cargo"};
        std::optional<std::string> default_toolchain{};

        std::vector<std::string> inherited_env{"PATH", "HOME", "CARGO_HOME", "RUSTUP_HOME"};
        int tool_timeout_ms{0};
        std::size_t max_output_bytes{4U << 20U};

        bool quiet{false};
        bool verbose{false};

        bool print_config{false};
    };

}  // namespace cargomcp
