// Skein MCP Server
// Model Context Protocol server for chain-of-thought strands
//
// Reads JSON-RPC requests from stdin, one per line, and writes one
// response per line to stdout. Diagnostics go to stderr.
//
// Usage:
//   skein_mcp [options]
//
// Options:
//   --path FILE   Strand document (default: $SKEIN_DATA_PATH or ./data/strands.json)
//   --memory      Keep strands in memory only (nothing is written)

#include <skein/mcp.hpp>
#include <skein/config.hpp>
#include <skein/strand_store.hpp>
#include <skein/version.hpp>
#include <iostream>
#include <memory>
#include <string>
#include <cstdlib>
#include <cstring>
#include <csignal>

namespace {

void signal_handler(int sig) {
    (void)sig;
    // Every mutation is already on disk; nothing to flush
    std::_Exit(0);
}

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --path FILE   Strand document (default: $" << skein::DATA_PATH_ENV
              << " or " << skein::DEFAULT_DATA_PATH << ")\n"
              << "  --memory      Keep strands in memory only\n"
              << "  --version     Print version and exit\n"
              << "  --help        Show this help message\n";
}

} // namespace

int main(int argc, char* argv[]) {
    skein::ServerConfig config = skein::config_from_env();

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--path") == 0 && i + 1 < argc) {
            config.data_path = argv[++i];
        } else if (std::strcmp(argv[i], "--memory") == 0) {
            config.in_memory = true;
        } else if (std::strcmp(argv[i], "--version") == 0) {
            std::cout << "skein_mcp " << SKEIN_VERSION << "\n";
            return 0;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    std::unique_ptr<skein::StrandStore> store;
    if (config.in_memory) {
        store = std::make_unique<skein::MemoryStore>();
    } else {
        store = std::make_unique<skein::JsonFileStore>(config.data_path);
    }
    skein::StrandRepository repo(*store);

    std::signal(SIGTERM, signal_handler);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGHUP, signal_handler);

    std::cerr << "[skein_mcp] Skein MCP server v" << SKEIN_VERSION << " started\n";
    std::cerr << "[skein_mcp] Data: "
              << (config.in_memory ? std::string("(memory)") : config.data_path) << "\n";
    std::cerr << "[skein_mcp] Strands: " << repo.snapshot().size() << "\n";
    std::cerr << "[skein_mcp] Listening on stdin...\n";

    skein::MCPServer server(repo, "skein");
    server.run();

    std::cerr << "[skein_mcp] Shutdown complete\n";
    return 0;
}
