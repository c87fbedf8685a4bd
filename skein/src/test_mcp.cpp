#include <skein/mcp.hpp>
#include <skein/strand_store.hpp>
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>

using namespace skein;
using json = nlohmann::json;

json request(const std::string& method, const json& params = json(), const json& id = 1) {
    json r = {{"jsonrpc", "2.0"}, {"method", method}, {"id", id}};
    if (!params.is_null()) r["params"] = params;
    return r;
}

json call(mcp::Handler& handler, const std::string& tool, const json& args, const json& id = 1) {
    return handler.handle_request(request("tools/call", {{"name", tool}, {"arguments", args}}, id));
}

std::string call_line(const std::string& tool, const json& args, int id) {
    return request("tools/call", {{"name", tool}, {"arguments", args}}, id).dump();
}

std::string text_of(const json& response) {
    return response["result"]["content"][0]["text"].get<std::string>();
}

int error_code(const json& response) {
    assert(response.contains("error"));
    return response["error"]["code"].get<int>();
}

void test_initialize() {
    std::cout << "Testing initialize..." << std::endl;

    MemoryStore store;
    StrandRepository repo(store);
    mcp::Handler handler(&repo);

    json resp = handler.handle_request(request("initialize", {{"protocolVersion", "2024-11-05"}}, 0));
    assert(resp["jsonrpc"] == "2.0");
    assert(resp["id"] == 0);
    assert(resp["result"]["protocolVersion"] == SKEIN_PROTOCOL_VERSION);
    assert(resp["result"]["serverInfo"]["name"] == "skein");
    assert(resp["result"]["serverInfo"]["version"] == SKEIN_VERSION);
    assert(resp["result"]["capabilities"].contains("tools"));

    // Notifications get no reply
    json note = {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}};
    assert(handler.handle_request(note).is_null());
    assert(!handler.handle(note.dump()));

    json resources = handler.handle_request(request("resources/list"));
    assert(resources["result"]["resources"].empty());

    json ping = handler.handle_request(request("ping"));
    assert(ping["result"].is_object());

    std::cout << "  PASS" << std::endl;
}

void test_tools_list() {
    std::cout << "Testing tools/list..." << std::endl;

    MemoryStore store;
    StrandRepository repo(store);
    mcp::Handler handler(&repo);

    json resp = handler.handle_request(request("tools/list"));
    const json& tools = resp["result"]["tools"];
    assert(tools.size() == 7);

    std::set<std::string> names;
    for (const auto& t : tools) {
        names.insert(t["name"].get<std::string>());
        assert(t.contains("description"));
        assert(t["inputSchema"]["type"] == "object");
    }
    for (const char* expected : {"create_strand", "append_to_strand", "get_strand", "list_strands",
                                 "search_strands", "complete_strand", "branch_strand"}) {
        assert(names.count(expected) == 1);
    }

    json branch_schema;
    for (const auto& t : tools) {
        if (t["name"] == "branch_strand") branch_schema = t["inputSchema"];
    }
    assert(branch_schema["required"].size() == 3);

    // Aliases are callable but not advertised
    assert(names.count("create") == 0);
    assert(handler.has_tool("create"));
    assert(handler.has_tool("add_to_strand"));

    std::cout << "  PASS" << std::endl;
}

void test_strand_tools() {
    std::cout << "Testing strand tools end to end..." << std::endl;

    MemoryStore store;
    StrandRepository repo(store);
    mcp::Handler handler(&repo);

    json created = call(handler, "create_strand",
                        {{"topic", "Bug triage"}, {"initial_thought", "Check logs"}}, "req-1");
    assert(created["id"] == "req-1");
    assert(text_of(created) == "CoT strand 'strand_1' created for topic: Bug triage");
    assert(created["result"]["isError"] == false);
    assert(created["result"]["structured"]["strand_id"] == "strand_1");

    json appended = call(handler, "append_to_strand",
                         {{"strand_id", "strand_1"}, {"thought", "Found root cause"}});
    assert(text_of(appended) == "Added thought to strand strand_1. Total thoughts: 2");
    assert(appended["result"]["structured"]["thought_count"] == 2);

    json got = call(handler, "get_strand", {{"strand_id", "strand_1"}});
    assert(text_of(got) ==
           "Strand strand_1: Bug triage\n\nThoughts:\n1. Check logs\n2. Found root cause\n\nStatus: Active");
    assert(got["result"]["structured"]["status"] == "active");

    json completed = call(handler, "complete_strand",
                          {{"strand_id", "strand_1"}, {"conclusion", "Patch applied"}});
    assert(text_of(completed) == "Strand strand_1 completed with conclusion: Patch applied");

    json late = call(handler, "append_to_strand", {{"strand_id", "strand_1"}, {"thought", "late"}});
    assert(error_code(late) == mcp::error::INVALID_PARAMS);
    assert(late["error"]["message"] == "Strand strand_1 not found");
    assert(late["error"]["data"]["kind"] == "not_found");
    assert(late["error"]["data"]["strand_id"] == "strand_1");

    json twice = call(handler, "complete_strand", {{"strand_id", "strand_1"}, {"conclusion", "again"}});
    assert(error_code(twice) == mcp::error::INVALID_PARAMS);

    json branched = call(handler, "branch_strand",
                         {{"source_strand_id", "strand_1"},
                          {"branch_topic", "Regression check"},
                          {"branch_thought", "Re-verify after patch"}});
    assert(text_of(branched) ==
           "Created branch 'strand_2' from 'strand_1' with topic: Regression check");
    assert(branched["result"]["structured"]["thought_count"] == 3);

    json branch_view = call(handler, "get_strand", {{"strand_id", "strand_2"}});
    assert(text_of(branch_view).find("Branched from: strand_1") != std::string::npos);
    assert(branch_view["result"]["structured"]["branched_from"] == "strand_1");

    json done_view = call(handler, "get_strand", {{"strand_id", "strand_1"}});
    assert(text_of(done_view).find("Conclusion: Patch applied") != std::string::npos);

    json bad_source = call(handler, "branch_strand",
                           {{"source_strand_id", "strand_42"},
                            {"branch_topic", "x"}, {"branch_thought", "y"}});
    assert(error_code(bad_source) == mcp::error::INVALID_PARAMS);
    assert(bad_source["error"]["message"] == "Source strand strand_42 not found");

    std::cout << "  PASS" << std::endl;
}

void test_list_and_search_tools() {
    std::cout << "Testing list and search tools..." << std::endl;

    MemoryStore store;
    StrandRepository repo(store);
    mcp::Handler handler(&repo);

    json empty = call(handler, "list_strands", json::object());
    assert(text_of(empty) == "No strands found.");

    call(handler, "create", {{"topic", "Cache design"}, {"initial_thought", "LRU?"}});
    call(handler, "create", {{"topic", "Storage"}, {"initial_thought", "bounded cache"}});
    call(handler, "complete", {{"strand_id", "strand_2"}, {"conclusion", "Use a ring buffer"}});

    json listed = call(handler, "list_strands", json::object());
    assert(text_of(listed) ==
           "Active Strands:\nstrand_1: Cache design (1 thoughts)\n\n"
           "Completed Strands:\nstrand_2: Storage (1 thoughts, COMPLETED)");
    assert(listed["result"]["structured"]["count"] == 2);

    json only_done = call(handler, "list_strands", {{"status", "completed"}});
    assert(only_done["result"]["structured"]["count"] == 1);
    assert(only_done["result"]["structured"]["strands"][0]["status"] == "completed");

    json capped = call(handler, "list_strands", {{"limit", 1}});
    assert(capped["result"]["structured"]["count"] == 1);

    // A null status behaves like an omitted one
    json null_status = call(handler, "list_strands", {{"status", nullptr}, {"limit", nullptr}});
    assert(null_status["result"]["structured"]["count"] == 2);

    json bad_status = call(handler, "list_strands", {{"status", "archived"}});
    assert(error_code(bad_status) == mcp::error::INVALID_PARAMS);

    json bad_limit = call(handler, "list_strands", {{"limit", "many"}});
    assert(error_code(bad_limit) == mcp::error::INVALID_PARAMS);

    json found = call(handler, "search_strands", {{"query", "CACHE"}});
    const json& results = found["result"]["structured"]["results"];
    assert(results.size() == 2);
    assert(results[0]["id"] == "strand_1" && results[0]["match"] == "topic");
    assert(results[1]["id"] == "strand_2" && results[1]["match"] == "content");
    assert(text_of(found).rfind("Found 2 strands matching 'CACHE':", 0) == 0);
    assert(text_of(found).find("[topic] strand_1: Cache design") != std::string::npos);

    json ring = call(handler, "search", {{"query", "ring buffer"}});
    assert(ring["result"]["structured"]["results"][0]["match"] == "conclusion");

    json none = call(handler, "search_strands", {{"query", "zebra"}});
    assert(text_of(none) == "No strands matching 'zebra'.");
    assert(none["result"]["structured"]["results"].empty());

    json empty_query = call(handler, "search_strands", {{"query", ""}});
    assert(error_code(empty_query) == mcp::error::INVALID_PARAMS);

    std::cout << "  PASS" << std::endl;
}

void test_error_tiers() {
    std::cout << "Testing error tiers..." << std::endl;

    MemoryStore store;
    StrandRepository repo(store);
    mcp::Handler handler(&repo);

    // Unparseable input: logged, no reply
    assert(!handler.handle("{not json"));

    json no_version = {{"method", "tools/list"}, {"id", 3}};
    json r1 = handler.handle_request(no_version);
    assert(error_code(r1) == mcp::error::INVALID_REQUEST);
    assert(r1["id"] == 3);

    assert(error_code(handler.handle_request(json::array())) == mcp::error::INVALID_REQUEST);

    json r2 = handler.handle_request(request("resources/read"));
    assert(error_code(r2) == mcp::error::METHOD_NOT_FOUND);

    json r3 = call(handler, "summon_dragon", json::object());
    assert(error_code(r3) == mcp::error::METHOD_NOT_FOUND);

    json r4 = handler.handle_request(request("tools/call", {{"arguments", json::object()}}));
    assert(error_code(r4) == mcp::error::INVALID_PARAMS);

    // Missing, mistyped and empty required arguments
    json r5 = call(handler, "create_strand", {{"topic", "only topic"}});
    assert(error_code(r5) == mcp::error::INVALID_PARAMS);
    assert(r5["error"]["message"] == "Missing required argument: initial_thought");
    assert(!r5["error"].contains("data"));

    json r6 = call(handler, "create_strand", {{"topic", 7}, {"initial_thought", "x"}});
    assert(error_code(r6) == mcp::error::INVALID_PARAMS);

    json r7 = call(handler, "append_to_strand", {{"strand_id", ""}, {"thought", "x"}});
    assert(error_code(r7) == mcp::error::INVALID_PARAMS);

    // Nothing was created by the rejected calls
    assert(repo.snapshot().counter == 0);

    std::cout << "  PASS" << std::endl;
}

void test_notification_requests() {
    std::cout << "Testing requests sent as notifications..." << std::endl;

    MemoryStore store;
    StrandRepository repo(store);
    mcp::Handler handler(&repo);

    auto notify = [](const std::string& method, const json& params) {
        return json{{"jsonrpc", "2.0"}, {"method", method}, {"params", params}};
    };

    assert(handler.handle_request(notify("initialize", json::object())).is_null());
    assert(handler.handle_request(notify("tools/list", json::object())).is_null());
    assert(!handler.handle(notify("ping", json::object()).dump()));

    // The call still runs, only the reply is suppressed
    json create = notify("tools/call", {{"name", "create_strand"},
                                        {"arguments", {{"topic", "quiet"}, {"initial_thought", "x"}}}});
    assert(handler.handle_request(create).is_null());
    assert(repo.get("strand_1")->strand.topic == "quiet");

    // Failures are not answered either
    json bad = notify("tools/call", {{"name", "get_strand"}, {"arguments", {{"strand_id", "strand_9"}}}});
    assert(handler.handle_request(bad).is_null());

    std::cout << "  PASS" << std::endl;
}

void test_storage_failure_tool() {
    std::cout << "Testing storage failure surfaces as internal error..." << std::endl;

    namespace fs = std::filesystem;
    std::string blocker = (fs::temp_directory_path() /
                           ("skein_mcp_blocker_" + std::to_string(::getpid()))).string();
    {
        std::ofstream out(blocker);
        out << "file, not directory";
    }

    JsonFileStore store(blocker + "/strands.json");
    StrandRepository repo(store);
    mcp::Handler handler(&repo);

    json r = call(handler, "create_strand", {{"topic", "t"}, {"initial_thought", "x"}});
    assert(error_code(r) == mcp::error::INTERNAL_ERROR);

    std::error_code ec;
    fs::remove(blocker, ec);

    std::cout << "  PASS" << std::endl;
}

void test_server_loop() {
    std::cout << "Testing stdio server loop..." << std::endl;

    MemoryStore store;
    StrandRepository repo(store);
    MCPServer server(repo);

    std::ostringstream script;
    script << request("initialize", json::object(), 1).dump() << "\n"
           << R"({"jsonrpc":"2.0","method":"notifications/initialized"})" << "\n"
           << "\n"
           << "garbage that is not json\n"
           << call_line("create_strand", {{"topic", "Loop"}, {"initial_thought", "first"}}, 2) << "\r\n"
           << call_line("append_to_strand", {{"strand_id", "strand_9"}, {"thought", "x"}}, 3) << "\n"
           << call_line("append_to_strand", {{"strand_id", "strand_1"}, {"thought", "second"}}, 4) << "\n"
           << request("shutdown", json(), 5).dump() << "\n"
           << call_line("create_strand", {{"topic", "never"}, {"initial_thought", "read"}}, 6) << "\n";

    std::istringstream in(script.str());
    std::ostringstream out;
    server.run(in, out);

    std::vector<json> responses;
    std::istringstream lines(out.str());
    std::string line;
    while (std::getline(lines, line)) {
        responses.push_back(json::parse(line));
    }

    // initialize, create, failed append, append, shutdown
    assert(responses.size() == 5);
    assert(responses[0]["id"] == 1);
    assert(responses[1]["id"] == 2 && responses[1].contains("result"));
    assert(responses[2]["id"] == 3 && error_code(responses[2]) == mcp::error::INVALID_PARAMS);
    assert(responses[3]["id"] == 4);
    assert(text_of(responses[3]) == "Added thought to strand strand_1. Total thoughts: 2");
    assert(responses[4]["id"] == 5);

    // The request after shutdown was never served
    assert(repo.snapshot().counter == 1);

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Skein MCP Tests ===" << std::endl;
    std::cout << std::endl;

    test_initialize();
    test_tools_list();
    test_strand_tools();
    test_list_and_search_tools();
    test_error_tiers();
    test_notification_requests();
    test_storage_failure_tool();
    test_server_loop();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
