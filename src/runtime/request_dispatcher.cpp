#include "runtime/request_dispatcher.hpp"

#include <exception>
#include <optional>
#include <type_traits>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "tools/tool_call.hpp"
#include "tools/tool_support.hpp"

namespace toolsrv::runtime {

using nlohmann::json;
using protocol::CredentialAckResponse;
using protocol::ErrorResponse;
using protocol::ResultResponse;

namespace {

constexpr std::size_t kInvalidJsonPreview = 100;

}  // namespace

RequestDispatcher::RequestDispatcher(session::CredentialVault& vault,
                                     const tools::ToolHost& host,
                                     TaskSupervisor& supervisor, IdleWatchdog& watchdog,
                                     ResponseSink sink)
    : vault_(vault),
      host_(host),
      supervisor_(supervisor),
      watchdog_(watchdog),
      sink_(std::move(sink)) {}

DispatchOutcome RequestDispatcher::handle_payload(const std::string& payload) {
    const json parsed = json::parse(payload, nullptr, false);
    if (parsed.is_discarded()) {
        LOG_WARN("Discarding frame with invalid JSON");
        sink_(ErrorResponse{std::nullopt,
                            "Invalid JSON: " + payload.substr(0, kInvalidJsonPreview)});
        return DispatchOutcome::Continue;
    }

    const std::optional<std::string> id = protocol::extract_request_id(parsed);
    try {
        auto decoded = protocol::decode_request(parsed);
        if (core::errors::is_error(decoded)) {
            const auto& error = core::errors::get_error(decoded);
            LOG_WARN("Rejected request [" + error.code + "]: " + error.message);
            sink_(ErrorResponse{id, error.message});
            return DispatchOutcome::Continue;
        }

        watchdog_.reset();
        return dispatch(core::errors::get_value(decoded));
    } catch (const std::exception& error) {
        LOG_ERROR(std::string("Request handling failed: ") + error.what());
        sink_(ErrorResponse{id, std::string("Internal error: ") + error.what()});
        return DispatchOutcome::Continue;
    }
}

void RequestDispatcher::handle_oversized(const std::uint32_t declared_length) {
    LOG_WARN("Skipping oversized frame of " + std::to_string(declared_length) + " bytes");
    sink_(ErrorResponse{std::nullopt, "Frame too large: " + std::to_string(declared_length)});
}

void RequestDispatcher::complete(TaskCompletion completion) {
    if (core::errors::is_error(completion.outcome)) {
        const auto& error = core::errors::get_error(completion.outcome);
        sink_(ErrorResponse{completion.request_id, error.message});
        return;
    }
    sink_(ResultResponse{completion.request_id,
                         std::move(core::errors::get_value(completion.outcome))});
}

DispatchOutcome RequestDispatcher::dispatch(const protocol::Request& request) {
    return std::visit(
        [this](const auto& message) -> DispatchOutcome {
            using T = std::decay_t<decltype(message)>;
            if constexpr (std::is_same_v<T, protocol::ExecuteRequest>) {
                start_execute(message);
                return DispatchOutcome::Continue;
            } else if constexpr (std::is_same_v<T, protocol::CredentialDeliverRequest>) {
                store_credential(message);
                return DispatchOutcome::Continue;
            } else {
                LOG_INFO("Shutdown requested");
                return DispatchOutcome::Shutdown;
            }
        },
        request);
}

void RequestDispatcher::start_execute(const protocol::ExecuteRequest& request) {
    auto call = tools::parse_tool_call(request.tool, request.args);
    if (core::errors::is_error(call)) {
        const auto started = tools::support::Clock::now();
        sink_(ResultResponse{request.id, tools::support::from_error(
                                             core::errors::get_error(call), started)});
        return;
    }

    LOG_DEBUG("Execute " + request.id + ": " +
              tools::tool_name(core::errors::get_value(call)));
    const tools::ToolHost& host = host_;
    const std::uint32_t timeout_ms = request.timeout_ms;
    supervisor_.launch(request.id, [&host, timeout_ms,
                                    call = std::move(core::errors::get_value(call))]() {
        return host.execute(call, timeout_ms);
    });
}

void RequestDispatcher::store_credential(const protocol::CredentialDeliverRequest& request) {
    auto stored = vault_.insert(request.name, request.value);
    if (core::errors::is_error(stored)) {
        const auto& error = core::errors::get_error(stored);
        LOG_WARN("Rejected credential [" + error.code + "]: " + error.message);
        sink_(ErrorResponse{std::nullopt, error.message});
        return;
    }
    LOG_INFO("Credential stored: " + request.name);
    sink_(CredentialAckResponse{core::errors::get_value(stored)});
}

}  // namespace toolsrv::runtime
