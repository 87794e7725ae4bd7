#pragma once

#include "core/errors/tool_errors.hpp"

namespace toolsrv::runtime {

// Ignores SIGPIPE and routes SIGTERM/SIGINT into a self-pipe. Returns its read end,
// which becomes readable once a termination signal arrives.
core::errors::Result<int> install_signal_handlers();

// Flushes stdio and leaves without running destructors, so in-flight workers are
// abandoned rather than joined.
[[noreturn]] void exit_process(int code);

}  // namespace toolsrv::runtime
