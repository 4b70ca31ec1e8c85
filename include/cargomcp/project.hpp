#pragma once

#include <filesystem>
#include <string_view>

namespace cargomcp {

    /*
     * Canonical directory of the project named by `path`. The manifest must sit
     * directly inside the resolved directory; parents are never consulted.
     * Relative paths resolve against the server's working directory and
     * symlinks are followed. Throws tool_error(invalid_project).
     */
    std::filesystem::path resolve_project_root(std::string_view path);

}  // namespace cargomcp
