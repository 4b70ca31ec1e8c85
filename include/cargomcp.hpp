#pragma once

#include "cargomcp/command.hpp"
#include "cargomcp/config.hpp"
#include "cargomcp/errors.hpp"
#include "cargomcp/format.hpp"
#include "cargomcp/mcp.hpp"
#include "cargomcp/process.hpp"
#include "cargomcp/project.hpp"
#include "cargomcp/tools.hpp"
#include "cargomcp/utils.hpp"
