#pragma once

#include "command.hpp"
#include "config.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace cargomcp {

    struct process_result {
        // absent when the child did not exit normally
        std::optional<int> exit_code{};
        std::optional<int> term_signal{};
        bool timed_out{false};
        std::string stdout_text{};
        std::string stderr_text{};
        std::chrono::milliseconds duration{};

        bool success() const { return exit_code && *exit_code == 0; }
    };

    /*
     * Spawn `spec` without a shell and wait for it, capturing stdout and stderr
     * separately and completely. The child sees only the variables named in
     * cfg.inherited_env plus spec.env, runs in spec.working_directory and reads
     * /dev/null. A non-zero exit is a normal result. Throws
     * tool_error(spawn_error) when the executable cannot be found or started.
     */
    process_result run_process(const process_spec& spec, const startup_config& cfg);

    // Locate `program` the way the server's PATH would; empty when not found.
    std::filesystem::path find_executable(const std::filesystem::path& program);

}  // namespace cargomcp
