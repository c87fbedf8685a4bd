// skein: command-line access to chain-of-thought strands
//
// Usage: skein <tool> [positional] [--key value ...] [options]
//
// Examples:
//   skein create_strand "Bug triage" --initial_thought "Check logs"
//   skein append_to_strand strand_1 --thought "Found root cause"
//   skein search_strands "root cause" --limit 5
//   skein list_strands --status completed
//
// Options:
//   --path FILE   Strand document (default: $SKEIN_DATA_PATH or ./data/strands.json)
//   --json        Output structured JSON instead of text

#include <skein/mcp/handler.hpp>
#include <skein/config.hpp>
#include <skein/strand_store.hpp>
#include <skein/version.hpp>
#include <cctype>
#include <cstring>
#include <iostream>
#include <string>

namespace {

using json = nlohmann::json;

void print_usage(const char* prog, const skein::mcp::Handler& handler) {
    std::cerr << "Usage:\n"
              << "  " << prog << " <tool> [positional] [--key value ...] [options]\n"
              << "\n"
              << "Examples:\n"
              << "  " << prog << " create_strand \"Bug triage\" --initial_thought \"Check logs\"\n"
              << "  " << prog << " append_to_strand strand_1 --thought \"Found root cause\"\n"
              << "  " << prog << " search_strands \"root cause\"\n"
              << "\n"
              << "Tools:\n";
    for (const auto& tool : handler.tools()) {
        std::cerr << "  " << tool.name << "\n";
    }
    std::cerr << "\n"
              << "Options:\n"
              << "  --path FILE   Strand document (default: $" << skein::DATA_PATH_ENV
              << " or " << skein::DEFAULT_DATA_PATH << ")\n"
              << "  --json        Output structured JSON instead of text\n"
              << "  --version     Print version and exit\n"
              << "  --help        Show this help message\n";
}

// First positional argument fills this key
std::string positional_key(const std::string& tool) {
    if (tool == "search_strands" || tool == "search") return "query";
    if (tool == "create_strand" || tool == "create") return "topic";
    if (tool == "branch_strand" || tool == "branch") return "source_strand_id";
    if (tool == "get_strand" || tool == "get" ||
        tool == "append_to_strand" || tool == "append" ||
        tool == "complete_strand" || tool == "complete") return "strand_id";
    return "";
}

// Integer text becomes a number so range checks apply; anything else stays a string
json parse_value(const std::string& value) {
    bool is_integer = !value.empty();
    for (size_t j = 0; j < value.size(); ++j) {
        char c = value[j];
        if (c == '-' && j == 0 && value.size() > 1) continue;
        if (!std::isdigit(static_cast<unsigned char>(c))) { is_integer = false; break; }
    }
    if (is_integer && value.size() < 18) {
        return std::stoll(value);
    }
    return value;
}

int run_cli(skein::mcp::Handler& handler, const std::string& tool,
            const json& args, bool json_output) {
    json response = handler.call_tool(tool, args);

    if (response.contains("error")) {
        std::cerr << "Error: " << response["error"]["message"].get<std::string>() << "\n";
        return 1;
    }

    const json& result = response["result"];
    if (json_output) {
        if (result.contains("structured")) {
            std::cout << result["structured"].dump(2) << "\n";
        } else {
            std::cout << result.dump(2) << "\n";
        }
    } else {
        const auto& content = result["content"];
        if (content.is_array() && !content.empty() && content[0].contains("text")) {
            std::cout << content[0]["text"].get<std::string>() << "\n";
        }
    }
    return result.value("isError", false) ? 1 : 0;
}

} // namespace

int main(int argc, char* argv[]) {
    skein::ServerConfig config = skein::config_from_env();

    std::string tool;
    json args = json::object();
    bool help = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--path" && i + 1 < argc) {
            config.data_path = argv[++i];
        } else if (arg == "--json") {
            config.json_output = true;
        } else if (arg == "--help" || arg == "-h") {
            help = true;
        } else if (arg == "--version") {
            std::cout << "skein " << SKEIN_VERSION << "\n";
            return 0;
        } else if (arg.rfind("--", 0) == 0) {
            // Named argument: --key value
            std::string key = arg.substr(2);
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return 1;
            }
            std::string value = argv[++i];
            if (key == "limit") {
                args[key] = parse_value(value);
            } else {
                args[key] = value;
            }
        } else if (tool.empty()) {
            tool = arg;
        } else {
            std::string key = positional_key(tool);
            if (key.empty() || args.contains(key)) {
                std::cerr << "Unexpected argument: " << arg << "\n";
                return 1;
            }
            args[key] = arg;
        }
    }

    skein::JsonFileStore store(config.data_path);
    skein::StrandRepository repo(store);
    skein::mcp::Handler handler(&repo, "skein");

    if (help || tool.empty()) {
        print_usage(argv[0], handler);
        return help ? 0 : 1;
    }

    if (!handler.has_tool(tool)) {
        std::cerr << "Unknown tool: " << tool << "\n";
        print_usage(argv[0], handler);
        return 1;
    }

    return run_cli(handler, tool, args, config.json_output);
}
