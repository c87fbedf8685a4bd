#pragma once
// MCP Handler: Central request handler for all MCP tools
//
// Turns one JSON-RPC request into at most one response. Used by the
// stdio server and by the command-line tool runner.

#include "protocol.hpp"
#include "types.hpp"
#include "tools/strands.hpp"
#include "../strand_repository.hpp"
#include "../version.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace skein::mcp {

using json = nlohmann::json;

class Handler {
public:
    explicit Handler(StrandRepository* repo, std::string server_name = "skein")
        : repo_(repo), server_name_(std::move(server_name)) {
        register_all_tools();
    }

    // Process one request line. Returns the response line, or nullopt
    // when nothing should be written (notifications, unparseable input).
    std::optional<std::string> handle(const std::string& request_str) {
        json request;
        try {
            request = json::parse(request_str);
        } catch (const json::parse_error& e) {
            std::cerr << "[" << server_name_ << "] Parse error: " << e.what() << "\n";
            return std::nullopt;
        }

        json response = handle_request(request);
        if (response.is_null()) return std::nullopt;
        return response.dump();
    }

    json handle_request(const json& request) {
        std::string error_msg;
        if (!validate_request(request, error_msg)) {
            json id = request.is_object() ? request.value("id", json()) : json();
            return make_error(id, error::INVALID_REQUEST, error_msg);
        }

        auto info = parse_request(request);

        // Notifications are dispatched for their side effects but never answered
        json response = dispatch(info);
        if (info.is_notification) return json();
        return response;
    }

    // Run a tool directly, bypassing the envelope (CLI mode)
    json call_tool(const std::string& name, const json& arguments) {
        return handle_tools_call({{"name", name}, {"arguments", arguments}}, 0);
    }

    // Get list of available tools (for tools/list)
    const std::vector<ToolSchema>& tools() const { return tools_; }

    bool has_tool(const std::string& name) const { return handlers_.count(name) > 0; }

    bool shutdown_requested() const { return shutdown_requested_; }

private:
    StrandRepository* repo_;
    std::string server_name_;
    std::vector<ToolSchema> tools_;
    std::unordered_map<std::string, ToolHandler> handlers_;
    bool shutdown_requested_ = false;

    json dispatch(const RequestInfo& info) {
        if (info.method == "initialize") {
            return make_result(info.id, initialize_result());
        } else if (info.method == "initialized" || info.method == "notifications/initialized") {
            return json();  // Notification, no response
        } else if (info.method == "tools/list") {
            return handle_tools_list(info.id);
        } else if (info.method == "tools/call") {
            return handle_tools_call(info.params, info.id);
        } else if (info.method == "resources/list") {
            return make_result(info.id, {{"resources", json::array()}});
        } else if (info.method == "ping") {
            return make_result(info.id, json::object());
        } else if (info.method == "shutdown") {
            shutdown_requested_ = true;
            return make_result(info.id, json::object());
        }

        return make_error(info.id, error::METHOD_NOT_FOUND, "Method not found: " + info.method);
    }

    void register_all_tools() {
        tools::strands::register_schemas(tools_);
        tools::strands::register_handlers(repo_, handlers_);
    }

    json initialize_result() const {
        return {
            {"protocolVersion", SKEIN_PROTOCOL_VERSION},
            {"capabilities", {
                {"tools", json::object()}
            }},
            {"serverInfo", {
                {"name", server_name_},
                {"version", SKEIN_VERSION}
            }}
        };
    }

    json handle_tools_list(const json& id) const {
        json tools_array = json::array();
        for (const auto& tool : tools_) {
            tools_array.push_back({
                {"name", tool.name},
                {"description", tool.description},
                {"inputSchema", tool.input_schema}
            });
        }
        return make_result(id, {{"tools", tools_array}});
    }

    json handle_tools_call(const json& params, const json& id) {
        if (!params.contains("name") || !params["name"].is_string()) {
            return make_error(id, error::INVALID_PARAMS, "Missing tool name");
        }

        std::string name = params["name"];
        json arguments = params.value("arguments", json::object());
        if (arguments.is_null()) arguments = json::object();
        if (!arguments.is_object()) {
            return make_error(id, error::INVALID_PARAMS, "Tool arguments must be an object");
        }

        auto it = handlers_.find(name);
        if (it == handlers_.end()) {
            return make_error(id, error::METHOD_NOT_FOUND, "Tool not found: " + name);
        }

        try {
            ToolResult result = it->second(arguments);
            if (result.error_code != 0) {
                return make_error(id, result.error_code, result.content, result.structured);
            }
            return make_result(id, make_tool_response(result.content, result.is_error, result.structured));
        } catch (const InvalidParams& e) {
            return make_error(id, error::INVALID_PARAMS, e.what());
        } catch (const json::exception& e) {
            return make_error(id, error::INVALID_PARAMS,
                              std::string("Invalid arguments: ") + e.what());
        } catch (const std::exception& e) {
            std::cerr << "[" << server_name_ << "] Tool " << name << " failed: " << e.what() << "\n";
            return make_error(id, error::INTERNAL_ERROR,
                              std::string("Tool execution failed: ") + e.what());
        }
    }
};

} // namespace skein::mcp
