#pragma once

#include "config.hpp"
#include "tools.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace cargomcp {

    // One fully determined child invocation. Built fresh per request.
    struct process_spec {
        tool_kind tool{};
        std::string program{};
        std::vector<std::string> argv{};
        std::filesystem::path working_directory{};
        // caller-supplied variables only; never a copy of the server environment
        env_overlay env{};
    };

    /*
     * Map validated arguments onto the build tool's argv. argv[0] is the
     * configured executable, followed by "+<toolchain>" when one is selected
     * (explicit argument first, then the startup default), the tool's fixed
     * subcommand and its flags in a fixed order. Pure; never touches the
     * filesystem.
     */
    process_spec build_command(
            const tool_arguments& args, const std::filesystem::path& project_root, const startup_config& cfg);

    // Space-joined argv with tokens quoted for reading, not for a shell.
    std::string display_command(const process_spec& spec);

}  // namespace cargomcp
