#pragma once

#include <nlohmann/json.hpp>
#include <codenexus/core/types.h>

#include <string>
#include <string_view>

namespace codenexus::mcp {

using json = nlohmann::json;

template <typename T> using MCPResult = Result<T>;

using JsonParseResult = MCPResult<json>;
using MessageResult = MCPResult<json>;

// Protocol constants (constexpr for compile-time validation)
namespace protocol {
constexpr std::string_view JSONRPC_VERSION = "2.0";
constexpr std::string_view PROTOCOL_VERSION = "2024-11-05";
constexpr std::string_view METHOD_INITIALIZE = "initialize";
constexpr std::string_view METHOD_INITIALIZED = "notifications/initialized";
constexpr std::string_view METHOD_PING = "ping";
constexpr std::string_view METHOD_TOOLS_LIST = "tools/list";
constexpr std::string_view METHOD_TOOLS_CALL = "tools/call";
constexpr std::string_view METHOD_LOGGING_SET_LEVEL = "logging/setLevel";
constexpr std::string_view METHOD_SHUTDOWN = "shutdown";
constexpr std::string_view METHOD_EXIT = "exit";

// JSON-RPC 2.0 error codes
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;
} // namespace protocol

/**
 * Error document returned as the text of a failed tool call:
 *   {"error": {"code": "TAG_NOT_FOUND", "message": ..., "suggestion": ...}}
 */
inline json formatErrorResponse(const Error& error) {
    return json{{"error",
                 {{"code", errorCodeName(error.code)},
                  {"message", error.message},
                  {"suggestion", recoverySuggestion(error.code)}}}};
}

// JSON parsing utilities with error handling
namespace json_utils {
// Safe JSON parsing without exceptions
inline JsonParseResult parse_json(std::string_view input) noexcept {
    if (input.empty()) {
        return Error{ErrorCode::SerializationError, "Empty input string for JSON parsing"};
    }

    try {
        auto result = json::parse(input);
        return result;
    } catch (const json::parse_error& e) {
        return Error{ErrorCode::SerializationError, std::string("JSON parse error: ") + e.what() +
                                                        " at position " + std::to_string(e.byte)};
    } catch (const std::exception& e) {
        return Error{ErrorCode::SerializationError,
                     std::string("JSON parsing failed: ") + e.what()};
    }
}

// Validate JSON-RPC message structure
inline MCPResult<json> validate_jsonrpc_message(const json& msg) noexcept {
    if (!msg.is_object()) {
        return Error{ErrorCode::SerializationError, "Message must be a JSON object"};
    }

    if (!msg.contains("jsonrpc")) {
        return Error{ErrorCode::SerializationError, "Missing 'jsonrpc' field"};
    }

    const auto& version = msg["jsonrpc"];
    if (!version.is_string() || version.get<std::string>() != protocol::JSONRPC_VERSION) {
        return Error{ErrorCode::SerializationError, "Invalid or missing jsonrpc version"};
    }

    if (!msg.contains("method") || !msg["method"].is_string()) {
        return Error{ErrorCode::SerializationError, "Missing or non-string 'method' field"};
    }

    return msg;
}

// Safe JSON field access
template <typename T>
MCPResult<T> get_field(const json& obj, std::string_view field_name) noexcept {
    try {
        if (!obj.contains(field_name)) {
            return Error{ErrorCode::ConfigError,
                         std::string("Missing required field: ") + std::string(field_name)};
        }
        return obj[field_name].template get<T>();
    } catch (const std::exception& e) {
        return Error{ErrorCode::ConfigError,
                     std::string("Invalid field '") + std::string(field_name) + "': " + e.what()};
    }
}
} // namespace json_utils

} // namespace codenexus::mcp
