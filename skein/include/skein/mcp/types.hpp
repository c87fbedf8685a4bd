#pragma once
// MCP Types: Tool schema and result types
//
// Defines the data structures used for MCP tool registration
// and execution results.

#include "protocol.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace skein::mcp {

using json = nlohmann::json;

// Tool schema definition for MCP tools/list
struct ToolSchema {
    std::string name;
    std::string description;
    json input_schema;
};

// Tool execution result
//
// error_code == 0: a normal tool response (isError reports tool-level failure).
// error_code != 0: the handler answers with a JSON-RPC error object instead.
struct ToolResult {
    bool is_error = false;
    std::string content;      // Human-readable text response
    json structured;          // Optional structured JSON data
    int error_code = 0;

    // Convenience constructors
    static ToolResult ok(const std::string& text, const json& data = json()) {
        return {false, text, data, 0};
    }

    static ToolResult error(const std::string& message) {
        return {true, message, json(), 0};
    }

    static ToolResult rpc_error(int code, const std::string& message, const json& data = json()) {
        return {true, message, data, code};
    }

    // Valid request naming a strand that is not where the operation needs it
    static ToolResult not_found(const std::string& message, const std::string& strand_id) {
        return rpc_error(error::INVALID_PARAMS, message,
                         {{"kind", "not_found"}, {"strand_id", strand_id}});
    }
};

// Thrown by argument helpers; the handler maps it to INVALID_PARAMS
class InvalidParams : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Tool handler function type
using ToolHandler = std::function<ToolResult(const json&)>;

// Required, non-empty string argument
inline std::string require_text(const json& params, const char* key) {
    if (!params.contains(key)) {
        throw InvalidParams(std::string("Missing required argument: ") + key);
    }
    const auto& v = params.at(key);
    if (!v.is_string()) {
        throw InvalidParams(std::string("Argument '") + key + "' must be a string");
    }
    std::string text = v.get<std::string>();
    if (text.empty()) {
        throw InvalidParams(std::string("Argument '") + key + "' must not be empty");
    }
    return text;
}

// Optional integer argument clamped to [lo, hi]
inline size_t optional_limit(const json& params, const char* key,
                             size_t fallback, size_t lo = 1, size_t hi = 100) {
    if (!params.contains(key) || params.at(key).is_null()) return fallback;
    const auto& v = params.at(key);
    if (!v.is_number_integer()) {
        throw InvalidParams(std::string("Argument '") + key + "' must be an integer");
    }
    int64_t n = v.get<int64_t>();
    if (n < static_cast<int64_t>(lo)) return lo;
    if (n > static_cast<int64_t>(hi)) return hi;
    return static_cast<size_t>(n);
}

} // namespace skein::mcp
