#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace toolsrv::protocol {

    // Inbound requests. "args" stays raw JSON until the tool call is decoded.
    struct ExecuteRequest {
        std::string id;
        std::string tool;
        nlohmann::json args = nlohmann::json::object();
        std::uint32_t timeout_ms = 0;
    };
    struct CredentialDeliverRequest { std::string name; std::string value; };
    struct ShutdownRequest {};

    using Request = std::variant<
        ExecuteRequest,
        CredentialDeliverRequest,
        ShutdownRequest
    >;

    // Outbound responses
    struct ResultResponse { std::string id; ToolResult result; };
    struct ErrorResponse { std::optional<std::string> id; std::string message; };
    struct CredentialAckResponse { std::string name; };

    using Response = std::variant<
        ResultResponse,
        ErrorResponse,
        CredentialAckResponse
    >;

    // Maps an already-parsed JSON payload onto a Request.
    core::errors::Result<Request> decode_request(const nlohmann::json& payload);

    // Best-effort id extraction for correlating error frames.
    std::optional<std::string> extract_request_id(const nlohmann::json& payload);

    nlohmann::json tool_result_to_json(const ToolResult& result);

    // Serializes a response; invalid UTF-8 in tool output is replaced, never thrown on.
    std::string serialize_response(const Response& response);

} // namespace toolsrv::protocol
