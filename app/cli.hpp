#pragma once

#include "cargomcp.hpp"

#include <optional>

namespace cargomcp::cli {

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg);

}  // namespace cargomcp::cli
