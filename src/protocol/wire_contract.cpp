#include "protocol/wire_contract.hpp"

#include <cmath>
#include <type_traits>

namespace toolsrv::protocol {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using nlohmann::json;

namespace {

ToolError invalid_request(const std::string& message) {
    return ToolError{ErrorCategory::Input, message, "invalid_request"};
}

core::errors::Result<std::string> required_string(const json& payload,
                                                  const char* field) {
    const auto it = payload.find(field);
    if (it == payload.end() || !it->is_string()) {
        return invalid_request(std::string("Missing or non-string \"") + field +
                               "\" field.");
    }
    return it->get<std::string>();
}

std::uint32_t clamp_timeout(const json& value) {
    if (!value.is_number()) {
        return 0;
    }
    const double raw = value.get<double>();
    if (!std::isfinite(raw) || raw <= 0.0) {
        return 0;
    }
    if (raw >= 4294967295.0) {
        return 4294967295u;
    }
    return static_cast<std::uint32_t>(raw);
}

}  // namespace

core::errors::Result<Request> decode_request(const json& payload) {
    if (!payload.is_object()) {
        return invalid_request("Request must be a JSON object.");
    }

    auto type = required_string(payload, "type");
    if (core::errors::is_error(type)) {
        return core::errors::get_error(type);
    }
    const std::string& kind = core::errors::get_value(type);

    if (kind == "execute") {
        ExecuteRequest request;
        auto id = required_string(payload, "id");
        if (core::errors::is_error(id)) {
            return core::errors::get_error(id);
        }
        auto tool = required_string(payload, "tool");
        if (core::errors::is_error(tool)) {
            return core::errors::get_error(tool);
        }
        request.id = core::errors::get_value(id);
        request.tool = core::errors::get_value(tool);

        const auto args = payload.find("args");
        if (args != payload.end() && !args->is_null()) {
            if (!args->is_object()) {
                return invalid_request("\"args\" must be a JSON object.");
            }
            request.args = *args;
        }

        const auto timeout = payload.find("timeoutMs");
        if (timeout != payload.end()) {
            request.timeout_ms = clamp_timeout(*timeout);
        }
        return request;
    }

    if (kind == "credential") {
        auto name = required_string(payload, "name");
        if (core::errors::is_error(name)) {
            return core::errors::get_error(name);
        }
        auto value = required_string(payload, "value");
        if (core::errors::is_error(value)) {
            return core::errors::get_error(value);
        }
        return CredentialDeliverRequest{core::errors::get_value(name),
                                        core::errors::get_value(value)};
    }

    if (kind == "shutdown") {
        return ShutdownRequest{};
    }

    return invalid_request("Unknown request type: " + kind);
}

std::optional<std::string> extract_request_id(const json& payload) {
    if (!payload.is_object()) {
        return std::nullopt;
    }
    const auto it = payload.find("id");
    if (it == payload.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

json tool_result_to_json(const ToolResult& result) {
    json payload;
    payload["ok"] = result.ok;
    payload["output"] = result.output;
    if (result.error_code.has_value()) {
        payload["errorCode"] = to_string(result.error_code.value());
    }
    payload["retryable"] = result.retryable;
    payload["provenance"] = to_string(result.provenance);
    payload["durationMs"] = static_cast<std::int64_t>(std::llround(result.duration_ms));
    if (result.cost.has_value()) {
        payload["cost"] = result.cost.value();
    }
    return payload;
}

std::string serialize_response(const Response& response) {
    json payload = std::visit(
        [](const auto& message) -> json {
            using T = std::decay_t<decltype(message)>;
            json out;
            if constexpr (std::is_same_v<T, ResultResponse>) {
                out["type"] = "result";
                out["id"] = message.id;
                out["result"] = tool_result_to_json(message.result);
            } else if constexpr (std::is_same_v<T, ErrorResponse>) {
                out["type"] = "error";
                if (message.id.has_value()) {
                    out["id"] = message.id.value();
                }
                out["message"] = message.message;
            } else {
                out["type"] = "credential_ack";
                out["name"] = message.name;
            }
            return out;
        },
        response);

    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace toolsrv::protocol
