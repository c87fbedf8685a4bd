#pragma once
// MCP Server: Model Context Protocol over stdio
//
// One JSON-RPC request per input line, one response per output line.
// Requests are handled strictly in arrival order; a failing request
// never stops the loop.

#include "mcp/handler.hpp"
#include "strand_repository.hpp"
#include <atomic>
#include <iostream>
#include <string>

namespace skein {

class MCPServer {
public:
    explicit MCPServer(StrandRepository& repo, std::string server_name = "skein")
        : handler_(&repo, server_name)
        , server_name_(std::move(server_name))
        , running_(false)
    {}

    // Serve until EOF, shutdown request or stop()
    void run(std::istream& in = std::cin, std::ostream& out = std::cout) {
        running_ = true;
        std::string line;

        while (running_ && std::getline(in, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.find_first_not_of(" \t") == std::string::npos) continue;

            auto response = handler_.handle(line);
            if (response) {
                out << *response << "\n";
                out.flush();
            }

            if (handler_.shutdown_requested()) {
                std::cerr << "[" << server_name_ << "] Shutdown requested\n";
                running_ = false;
            }
        }
    }

    void stop() { running_ = false; }

    mcp::Handler& handler() { return handler_; }

private:
    mcp::Handler handler_;
    std::string server_name_;
    std::atomic<bool> running_;
};

} // namespace skein
