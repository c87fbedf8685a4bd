#pragma once
// MCP Strand Tools: create, append, get, list, search, complete, branch
//
// Thin adapters between tool arguments and StrandRepository. Each tool
// validates its arguments, runs one repository operation and renders
// both a text answer and structured JSON.

#include "../types.hpp"
#include "../../strand_repository.hpp"
#include <sstream>
#include <unordered_map>
#include <vector>

namespace skein::mcp::tools::strands {

using json = nlohmann::json;

// Helper: strand metadata shared by list and search results
inline json strand_summary(const Strand& s, StrandStatus status) {
    json j = {
        {"id", s.id},
        {"topic", s.topic},
        {"thought_count", s.thoughts.size()},
        {"status", status_to_string(status)},
        {"created", format_timestamp(s.created)},
        {"last_updated", format_timestamp(s.last_updated)}
    };
    if (s.is_branch()) j["branched_from"] = s.branched_from;
    return j;
}

inline ToolResult operation_failure(StrandError err) {
    if (err == StrandError::IdConflict) {
        return ToolResult::rpc_error(error::INTERNAL_ERROR, "No free strand id available");
    }
    return ToolResult::rpc_error(error::INTERNAL_ERROR, "Failed to persist strands");
}

// Register strand tool schemas
inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "create_strand",
        "Create a new chain-of-thought reasoning strand with a topic and its first thought.",
        {
            {"type", "object"},
            {"properties", {
                {"topic", {{"type", "string"}, {"description", "Topic or problem being analyzed"}}},
                {"initial_thought", {{"type", "string"}, {"description", "Initial reasoning step"}}}
            }},
            {"required", {"topic", "initial_thought"}}
        }
    });

    tools.push_back({
        "append_to_strand",
        "Add a reasoning step to an active strand.",
        {
            {"type", "object"},
            {"properties", {
                {"strand_id", {{"type", "string"}, {"description", "ID of the strand to extend"}}},
                {"thought", {{"type", "string"}, {"description", "Next reasoning step"}}}
            }},
            {"required", {"strand_id", "thought"}}
        }
    });

    tools.push_back({
        "get_strand",
        "Retrieve a strand (active or completed) with its full thought history.",
        {
            {"type", "object"},
            {"properties", {
                {"strand_id", {{"type", "string"}, {"description", "ID of strand to retrieve"}}}
            }},
            {"required", {"strand_id"}}
        }
    });

    tools.push_back({
        "list_strands",
        "List strands with their topic, thought count and status.",
        {
            {"type", "object"},
            {"properties", {
                {"status", {{"type", "string"}, {"enum", {"active", "completed", "all"}},
                            {"default", "all"}}},
                {"limit", {{"type", "integer"}, {"minimum", 1}, {"maximum", 100},
                           {"default", DEFAULT_LIST_LIMIT}}}
            }},
            {"required", json::array()}
        }
    });

    tools.push_back({
        "search_strands",
        "Case-insensitive search over strand topics, thoughts and conclusions. "
        "Topic matches rank first; newer strands first within a tier.",
        {
            {"type", "object"},
            {"properties", {
                {"query", {{"type", "string"}, {"description", "Text to look for"}}},
                {"limit", {{"type", "integer"}, {"minimum", 1}, {"maximum", 100},
                           {"default", DEFAULT_SEARCH_LIMIT}}}
            }},
            {"required", {"query"}}
        }
    });

    tools.push_back({
        "complete_strand",
        "Mark an active strand as completed with a conclusion. Completed strands are frozen.",
        {
            {"type", "object"},
            {"properties", {
                {"strand_id", {{"type", "string"}, {"description", "ID of strand to complete"}}},
                {"conclusion", {{"type", "string"}, {"description", "Final conclusion or result"}}}
            }},
            {"required", {"strand_id", "conclusion"}}
        }
    });

    tools.push_back({
        "branch_strand",
        "Start a new strand from the full history of an existing one (active or completed) "
        "plus a new thought.",
        {
            {"type", "object"},
            {"properties", {
                {"source_strand_id", {{"type", "string"}, {"description", "ID of strand to branch from"}}},
                {"branch_topic", {{"type", "string"}, {"description", "Topic for the new branch"}}},
                {"branch_thought", {{"type", "string"}, {"description", "Initial thought for the branch"}}}
            }},
            {"required", {"source_strand_id", "branch_topic", "branch_thought"}}
        }
    });
}

// Tool implementations
inline ToolResult create(StrandRepository& repo, const json& params) {
    std::string topic = require_text(params, "topic");
    std::string initial_thought = require_text(params, "initial_thought");

    auto result = repo.create(topic, initial_thought);
    if (!result.ok()) return operation_failure(result.error);

    return ToolResult::ok(
        "CoT strand '" + result.strand.id + "' created for topic: " + topic,
        {{"strand_id", result.strand.id}, {"topic", topic}});
}

inline ToolResult append(StrandRepository& repo, const json& params) {
    std::string strand_id = require_text(params, "strand_id");
    std::string thought = require_text(params, "thought");

    auto result = repo.append(strand_id, thought);
    if (result.error == StrandError::NotFound) {
        return ToolResult::not_found("Strand " + strand_id + " not found", strand_id);
    }
    if (!result.ok()) return operation_failure(result.error);

    size_t count = result.strand.thoughts.size();
    return ToolResult::ok(
        "Added thought to strand " + strand_id + ". Total thoughts: " + std::to_string(count),
        {{"strand_id", strand_id}, {"thought_count", count},
         {"last_updated", format_timestamp(result.strand.last_updated)}});
}

inline ToolResult get(StrandRepository& repo, const json& params) {
    std::string strand_id = require_text(params, "strand_id");

    auto view = repo.get(strand_id);
    if (!view) {
        return ToolResult::not_found("Strand " + strand_id + " not found", strand_id);
    }

    const Strand& s = view->strand;
    std::ostringstream ss;
    ss << "Strand " << s.id << ": " << s.topic << "\n";
    if (s.is_branch()) ss << "Branched from: " << s.branched_from << "\n";
    ss << "\nThoughts:\n";
    for (size_t i = 0; i < s.thoughts.size(); ++i) {
        ss << (i + 1) << ". " << s.thoughts[i] << "\n";
    }
    ss << "\n";
    if (s.is_completed()) {
        ss << "Conclusion: " << s.conclusion;
    } else {
        ss << "Status: Active";
    }

    json data = s;
    data["status"] = status_to_string(view->status);
    return ToolResult::ok(ss.str(), data);
}

inline ToolResult list(StrandRepository& repo, const json& params) {
    std::string status = "all";
    if (params.contains("status") && !params.at("status").is_null()) {
        if (!params.at("status").is_string()) {
            throw InvalidParams("Argument 'status' must be a string");
        }
        status = params.at("status").get<std::string>();
    }
    auto filter = parse_status_filter(status);
    if (!filter) {
        throw InvalidParams("Argument 'status' must be one of: active, completed, all");
    }
    size_t limit = optional_limit(params, "limit", DEFAULT_LIST_LIMIT);

    auto views = repo.list(*filter, limit);

    std::ostringstream active_ss, completed_ss;
    json items = json::array();
    for (const auto& v : views) {
        const Strand& s = v.strand;
        items.push_back(strand_summary(s, v.status));
        if (v.status == StrandStatus::Active) {
            active_ss << s.id << ": " << s.topic << " (" << s.thoughts.size() << " thoughts)\n";
        } else {
            completed_ss << s.id << ": " << s.topic << " (" << s.thoughts.size()
                         << " thoughts, COMPLETED)\n";
        }
    }

    std::string text;
    if (!active_ss.str().empty()) text += "Active Strands:\n" + active_ss.str();
    if (!completed_ss.str().empty()) {
        if (!text.empty()) text += "\n";
        text += "Completed Strands:\n" + completed_ss.str();
    }
    if (text.empty()) {
        text = "No strands found.";
    } else {
        text.pop_back();  // trailing newline
    }

    return ToolResult::ok(text, {{"strands", items}, {"count", items.size()}});
}

inline ToolResult search(StrandRepository& repo, const json& params) {
    std::string query = require_text(params, "query");
    size_t limit = optional_limit(params, "limit", DEFAULT_SEARCH_LIMIT);

    auto hits = repo.search(query, limit);

    json results = json::array();
    std::ostringstream ss;
    if (hits.empty()) {
        ss << "No strands matching '" << query << "'.";
    } else {
        ss << "Found " << hits.size() << " strands matching '" << query << "':";
    }

    for (const auto& hit : hits) {
        const char* kind = match_kind_to_string(hit.kind);
        json entry = strand_summary(hit.strand, hit.status);
        entry["match"] = kind;
        results.push_back(entry);

        ss << "\n[" << kind << "] " << hit.strand.id << ": " << hit.strand.topic
           << " (" << hit.strand.thoughts.size() << " thoughts, "
           << status_to_string(hit.status) << ")";
    }

    return ToolResult::ok(ss.str(), {{"query", query}, {"results", results}});
}

inline ToolResult complete(StrandRepository& repo, const json& params) {
    std::string strand_id = require_text(params, "strand_id");
    std::string conclusion = require_text(params, "conclusion");

    auto result = repo.complete(strand_id, conclusion);
    if (result.error == StrandError::NotFound) {
        return ToolResult::not_found("Strand " + strand_id + " not found", strand_id);
    }
    if (!result.ok()) return operation_failure(result.error);

    return ToolResult::ok(
        "Strand " + strand_id + " completed with conclusion: " + conclusion,
        {{"strand_id", strand_id}, {"conclusion", conclusion},
         {"completed", format_timestamp(result.strand.completed)}});
}

inline ToolResult branch(StrandRepository& repo, const json& params) {
    std::string source_id = require_text(params, "source_strand_id");
    std::string topic = require_text(params, "branch_topic");
    std::string thought = require_text(params, "branch_thought");

    auto result = repo.branch(source_id, topic, thought);
    if (result.error == StrandError::NotFound) {
        return ToolResult::not_found("Source strand " + source_id + " not found", source_id);
    }
    if (!result.ok()) return operation_failure(result.error);

    const Strand& s = result.strand;
    return ToolResult::ok(
        "Created branch '" + s.id + "' from '" + source_id + "' with topic: " + topic,
        {{"strand_id", s.id}, {"branched_from", source_id}, {"topic", topic},
         {"thought_count", s.thoughts.size()}});
}

// Register strand tool handlers. Aliases are callable but not listed.
inline void register_handlers(StrandRepository* repo,
                              std::unordered_map<std::string, ToolHandler>& handlers) {
    auto wrap = [repo](ToolResult (*fn)(StrandRepository&, const json&)) -> ToolHandler {
        return [repo, fn](const json& p) { return fn(*repo, p); };
    };

    handlers["create_strand"] = wrap(create);
    handlers["append_to_strand"] = wrap(append);
    handlers["get_strand"] = wrap(get);
    handlers["list_strands"] = wrap(list);
    handlers["search_strands"] = wrap(search);
    handlers["complete_strand"] = wrap(complete);
    handlers["branch_strand"] = wrap(branch);

    handlers["create"] = wrap(create);
    handlers["append"] = wrap(append);
    handlers["get"] = wrap(get);
    handlers["list"] = wrap(list);
    handlers["search"] = wrap(search);
    handlers["complete"] = wrap(complete);
    handlers["branch"] = wrap(branch);

    handlers["create_cot_strand"] = wrap(create);
    handlers["add_to_strand"] = wrap(append);
}

} // namespace skein::mcp::tools::strands
