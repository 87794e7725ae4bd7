#pragma once

#include <string>
#include "core/config/server_config.hpp"
#include "policy/path_resolver.hpp"
#include "protocol/frame_codec.hpp"
#include "runtime/frame_writer.hpp"
#include "runtime/idle_watchdog.hpp"
#include "runtime/request_dispatcher.hpp"
#include "runtime/task_supervisor.hpp"
#include "session/credential_vault.hpp"
#include "tools/tool_host.hpp"

namespace toolsrv::runtime {

enum class ExitReason {
    Shutdown,     // shutdown request
    IdleTimeout,  // no request for idle_timeout_ms
    InputClosed,  // EOF or read error on the input channel
    Signal        // SIGTERM / SIGINT
};

std::string to_string(ExitReason reason);

struct LoopChannels {
    int input_fd = 0;
    int output_fd = 1;
    int signal_fd = -1;  // optional; readable once a termination signal arrived
};

// Single-threaded owner of the protocol: reads frames, dispatches them and writes
// every response. Tool calls run on supervisor threads.
class ServerLoop {
public:
    ServerLoop(core::config::ServerConfig config, LoopChannels channels);
    ServerLoop(const ServerLoop&) = delete;
    ServerLoop& operator=(const ServerLoop&) = delete;

    ExitReason run();

private:
    void flush_completions();
    ExitReason finish(ExitReason reason) const;

    core::config::ServerConfig config_;
    LoopChannels channels_;
    session::CredentialVault vault_;
    policy::PathResolver resolver_;
    tools::ToolHost host_;
    FrameWriter writer_;
    IdleWatchdog watchdog_;
    protocol::FrameDecoder decoder_;
    // Declared after host_ so workers are joined before the host goes away.
    TaskSupervisor supervisor_;
    RequestDispatcher dispatcher_;
};

}  // namespace toolsrv::runtime
