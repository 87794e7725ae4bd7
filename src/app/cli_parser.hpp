#pragma once
#include "core/config/server_config.hpp"
#include "core/errors/tool_errors.hpp"

namespace toolsrv::app::cli {
    toolsrv::core::errors::Result<toolsrv::core::config::ServerConfig> parse_and_validate(int argc, char* argv[]);
}
