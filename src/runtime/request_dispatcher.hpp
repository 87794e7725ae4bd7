#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include "protocol/wire_contract.hpp"
#include "runtime/idle_watchdog.hpp"
#include "runtime/task_supervisor.hpp"
#include "session/credential_vault.hpp"
#include "tools/tool_host.hpp"

namespace toolsrv::runtime {

enum class DispatchOutcome {
    Continue,
    Shutdown
};

using ResponseSink = std::function<void(const protocol::Response&)>;

// Turns decoded frames into work. Runs on the loop thread only; tool execution is
// handed to the supervisor and its outcome comes back through complete().
class RequestDispatcher {
public:
    RequestDispatcher(session::CredentialVault& vault, const tools::ToolHost& host,
                      TaskSupervisor& supervisor, IdleWatchdog& watchdog,
                      ResponseSink sink);

    DispatchOutcome handle_payload(const std::string& payload);
    void handle_oversized(std::uint32_t declared_length);
    void complete(TaskCompletion completion);

private:
    DispatchOutcome dispatch(const protocol::Request& request);
    void start_execute(const protocol::ExecuteRequest& request);
    void store_credential(const protocol::CredentialDeliverRequest& request);

    session::CredentialVault& vault_;
    const tools::ToolHost& host_;
    TaskSupervisor& supervisor_;
    IdleWatchdog& watchdog_;
    ResponseSink sink_;
};

}  // namespace toolsrv::runtime
