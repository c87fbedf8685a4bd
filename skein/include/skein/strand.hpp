#pragma once
// Strand: a named, append-only chain of reasoning steps
//
// A strand lives in exactly one of two states. Active strands accept new
// thoughts; completed strands are frozen with a conclusion. Branches copy
// the full history of their source and remember where they came from.

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace skein {

using json = nlohmann::json;

enum class StrandStatus : uint8_t {
    Active = 0,
    Completed = 1,
};

inline const char* status_to_string(StrandStatus status) {
    switch (status) {
        case StrandStatus::Active: return "active";
        case StrandStatus::Completed: return "completed";
    }
    return "unknown";
}

struct Strand {
    std::string id;
    std::string topic;
    std::vector<std::string> thoughts;   // Never empty
    Timestamp created = 0;
    Timestamp last_updated = 0;

    // Set together, exactly once, when the strand completes
    std::string conclusion;
    Timestamp completed = 0;

    std::string branched_from;           // Empty unless created by branch

    bool is_completed() const { return completed != 0; }
    bool is_branch() const { return !branched_from.empty(); }
};

// Strand ids are "strand_<n>" where n is the counter value at creation
constexpr const char* STRAND_ID_PREFIX = "strand_";

inline std::string make_strand_id(uint64_t seq) {
    return STRAND_ID_PREFIX + std::to_string(seq);
}

// Numeric suffix of a strand id, 0 if the id is not in canonical form
// or the number does not fit in 64 bits
inline uint64_t strand_seq(const std::string& id) {
    const std::string prefix = STRAND_ID_PREFIX;
    if (id.size() <= prefix.size() || id.compare(0, prefix.size(), prefix) != 0) {
        return 0;
    }
    uint64_t seq = 0;
    for (size_t i = prefix.size(); i < id.size(); ++i) {
        char c = id[i];
        if (c < '0' || c > '9') return 0;
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (seq > (UINT64_MAX - digit) / 10) return 0;
        seq = seq * 10 + digit;
    }
    return seq;
}

// The persisted aggregate
struct StrandSet {
    std::unordered_map<std::string, Strand> active;
    std::unordered_map<std::string, Strand> completed;
    uint64_t counter = 0;   // Last-assigned id number

    const Strand* find(const std::string& id) const {
        auto it = active.find(id);
        if (it != active.end()) return &it->second;
        it = completed.find(id);
        return (it != completed.end()) ? &it->second : nullptr;
    }

    size_t size() const { return active.size() + completed.size(); }
};

// Check the aggregate's structural invariants. Returns false and fills
// `error` with the first violation found.
inline bool validate(const StrandSet& set, std::string& error) {
    auto check = [&](const Strand& s, const std::string& key, bool in_completed) {
        if (s.id != key) {
            error = "strand keyed '" + key + "' carries id '" + s.id + "'";
            return false;
        }
        if (s.thoughts.empty()) {
            error = "strand " + key + " has no thoughts";
            return false;
        }
        if (in_completed != s.is_completed()) {
            error = "strand " + key + (in_completed ? " is completed without a completion time"
                                                    : " is active but has a completion time");
            return false;
        }
        if (in_completed == s.conclusion.empty()) {
            error = "strand " + key + (in_completed ? " is completed without a conclusion"
                                                    : " is active but has a conclusion");
            return false;
        }
        if (strand_seq(key) > set.counter) {
            error = "strand " + key + " is newer than counter " + std::to_string(set.counter);
            return false;
        }
        return true;
    };

    for (const auto& [id, strand] : set.active) {
        if (!check(strand, id, false)) return false;
        if (set.completed.count(id)) {
            error = "strand " + id + " is both active and completed";
            return false;
        }
    }
    for (const auto& [id, strand] : set.completed) {
        if (!check(strand, id, true)) return false;
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// JSON mapping
// ═══════════════════════════════════════════════════════════════════════════

inline void to_json(json& j, const Strand& s) {
    j = json{
        {"id", s.id},
        {"topic", s.topic},
        {"thoughts", s.thoughts},
        {"created", format_timestamp(s.created)},
        {"last_updated", format_timestamp(s.last_updated)}
    };
    if (s.is_completed()) {
        j["conclusion"] = s.conclusion;
        j["completed"] = format_timestamp(s.completed);
    }
    if (s.is_branch()) {
        j["branched_from"] = s.branched_from;
    }
}

// Timestamps may be ISO-8601 strings or raw millis
inline Timestamp timestamp_field(const json& j, const char* key) {
    if (!j.contains(key)) return 0;
    const auto& v = j.at(key);
    if (v.is_number_integer()) return v.get<Timestamp>();
    if (v.is_string()) {
        auto parsed = parse_timestamp(v.get<std::string>());
        if (parsed) return *parsed;
    }
    throw std::invalid_argument(std::string("invalid timestamp in '") + key + "'");
}

// Throws json::exception or std::invalid_argument on invalid input
inline void from_json(const json& j, Strand& s) {
    if (!j.is_object()) throw std::invalid_argument("strand must be an object");
    s.id = j.value("id", "");
    s.topic = j.at("topic").get<std::string>();
    s.thoughts = j.at("thoughts").get<std::vector<std::string>>();
    s.created = timestamp_field(j, "created");
    s.last_updated = timestamp_field(j, "last_updated");
    s.conclusion = j.value("conclusion", "");
    s.completed = timestamp_field(j, "completed");
    s.branched_from = j.value("branched_from", "");
}

inline void to_json(json& j, const StrandSet& set) {
    json active = json::object();
    for (const auto& [id, strand] : set.active) active[id] = strand;
    json completed = json::object();
    for (const auto& [id, strand] : set.completed) completed[id] = strand;

    j = json{
        {"active", active},
        {"completed", completed},
        {"counter", set.counter}
    };
}

namespace detail {
inline const json& field_or_legacy(const json& j, const char* key, const char* legacy_key) {
    if (j.contains(key)) return j.at(key);
    return j.at(legacy_key);
}

inline const json& object_field(const json& j, const char* key, const char* legacy_key) {
    const json& v = field_or_legacy(j, key, legacy_key);
    if (!v.is_object()) {
        throw std::invalid_argument(std::string("'") + key + "' must be an object");
    }
    return v;
}
} // namespace detail

// Accepts both the current layout and the older
// active_strands / completed_strands / strand_counter keys.
inline void from_json(const json& j, StrandSet& set) {
    set = StrandSet{};
    if (!j.is_object()) throw std::invalid_argument("strand document must be an object");

    for (const auto& [id, value] : detail::object_field(j, "active", "active_strands").items()) {
        Strand strand = value.get<Strand>();
        if (strand.id.empty()) strand.id = id;
        set.active.emplace(id, std::move(strand));
    }
    for (const auto& [id, value] : detail::object_field(j, "completed", "completed_strands").items()) {
        Strand strand = value.get<Strand>();
        if (strand.id.empty()) strand.id = id;
        set.completed.emplace(id, std::move(strand));
    }
    const json& counter = detail::field_or_legacy(j, "counter", "strand_counter");
    if (!counter.is_number_unsigned()) {
        throw std::invalid_argument("'counter' must be a non-negative integer");
    }
    set.counter = counter.get<uint64_t>();
}

} // namespace skein
