#pragma once
// Strand Repository: lifecycle and queries over the persisted strand set
//
// Each call loads the whole aggregate from the store, works on the
// in-memory copy and, for mutations, writes the whole aggregate back.
// Nothing is cached between calls, so a failed save leaves the store
// exactly as it was.
//
// Lifecycle:
//   create / branch  → new strand in `active`, fresh id from the counter
//   append           → only while active
//   complete         → moves active → completed, one-way

#include "strand.hpp"
#include "strand_store.hpp"
#include <algorithm>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace skein {

enum class StrandError : uint8_t {
    None = 0,
    NotFound = 1,        // Id absent from the collection the operation needs
    StorageFailed = 2,   // Transform succeeded but the save did not
    IdConflict = 3,      // Counter exhausted or next id already taken
};

// Outcome of a mutation. `strand` is the post-operation state when ok().
struct StrandResult {
    StrandError error = StrandError::None;
    Strand strand;

    bool ok() const { return error == StrandError::None; }

    static StrandResult success(Strand s) { return {StrandError::None, std::move(s)}; }
    static StrandResult failure(StrandError e) { return {e, Strand{}}; }
};

struct StrandView {
    Strand strand;
    StrandStatus status;
};

enum class StatusFilter : uint8_t {
    All = 0,
    Active = 1,
    Completed = 2,
};

inline std::optional<StatusFilter> parse_status_filter(const std::string& s) {
    if (s == "all") return StatusFilter::All;
    if (s == "active") return StatusFilter::Active;
    if (s == "completed") return StatusFilter::Completed;
    return std::nullopt;
}

enum class MatchKind : uint8_t {
    Topic = 0,
    Content = 1,       // One of the thoughts
    Conclusion = 2,
};

inline const char* match_kind_to_string(MatchKind kind) {
    switch (kind) {
        case MatchKind::Topic: return "topic";
        case MatchKind::Content: return "content";
        case MatchKind::Conclusion: return "conclusion";
    }
    return "unknown";
}

struct SearchHit {
    Strand strand;
    StrandStatus status;
    MatchKind kind;
};

constexpr size_t DEFAULT_LIST_LIMIT = 20;
constexpr size_t DEFAULT_SEARCH_LIMIT = 10;

class StrandRepository {
public:
    using Clock = std::function<Timestamp()>;

    explicit StrandRepository(StrandStore& store, Clock clock = now)
        : store_(store), clock_(std::move(clock)) {}

    StrandResult create(const std::string& topic, const std::string& initial_thought) {
        StrandSet set = store_.load();

        if (set.counter == UINT64_MAX) return StrandResult::failure(StrandError::IdConflict);
        Strand strand;
        strand.id = make_strand_id(++set.counter);
        strand.topic = topic;
        strand.thoughts.push_back(initial_thought);
        strand.created = clock_();
        strand.last_updated = strand.created;

        if (set.find(strand.id) || !set.active.emplace(strand.id, strand).second) {
            return StrandResult::failure(StrandError::IdConflict);
        }
        if (!store_.save(set)) return StrandResult::failure(StrandError::StorageFailed);
        return StrandResult::success(std::move(strand));
    }

    // Completed strands are frozen: appending to one is NotFound
    StrandResult append(const std::string& strand_id, const std::string& thought) {
        StrandSet set = store_.load();

        auto it = set.active.find(strand_id);
        if (it == set.active.end()) return StrandResult::failure(StrandError::NotFound);

        Strand& strand = it->second;
        strand.thoughts.push_back(thought);
        strand.last_updated = touch(strand.last_updated);

        Strand updated = strand;
        if (!store_.save(set)) return StrandResult::failure(StrandError::StorageFailed);
        return StrandResult::success(std::move(updated));
    }

    // Single use: a second call on the same id is NotFound
    StrandResult complete(const std::string& strand_id, const std::string& conclusion) {
        StrandSet set = store_.load();

        auto it = set.active.find(strand_id);
        if (it == set.active.end()) return StrandResult::failure(StrandError::NotFound);

        Strand strand = std::move(it->second);
        set.active.erase(it);
        strand.conclusion = conclusion;
        strand.completed = std::max(clock_(), strand.last_updated);

        if (!set.completed.emplace(strand_id, strand).second) {
            return StrandResult::failure(StrandError::IdConflict);
        }
        if (!store_.save(set)) return StrandResult::failure(StrandError::StorageFailed);
        return StrandResult::success(std::move(strand));
    }

    // The source may be active or completed and is never modified.
    // Lineage depth is unbounded: branches of branches are allowed.
    StrandResult branch(const std::string& source_strand_id,
                        const std::string& branch_topic,
                        const std::string& branch_thought) {
        StrandSet set = store_.load();

        const Strand* source = set.find(source_strand_id);
        if (!source) return StrandResult::failure(StrandError::NotFound);

        if (set.counter == UINT64_MAX) return StrandResult::failure(StrandError::IdConflict);
        Strand strand;
        strand.id = make_strand_id(++set.counter);
        strand.topic = branch_topic;
        strand.thoughts = source->thoughts;
        strand.thoughts.push_back(branch_thought);
        strand.created = clock_();
        strand.last_updated = strand.created;
        strand.branched_from = source_strand_id;

        if (set.find(strand.id) || !set.active.emplace(strand.id, strand).second) {
            return StrandResult::failure(StrandError::IdConflict);
        }
        if (!store_.save(set)) return StrandResult::failure(StrandError::StorageFailed);
        return StrandResult::success(std::move(strand));
    }

    std::optional<StrandView> get(const std::string& strand_id) const {
        StrandSet set = store_.load();

        auto it = set.active.find(strand_id);
        if (it != set.active.end()) return StrandView{it->second, StrandStatus::Active};
        it = set.completed.find(strand_id);
        if (it != set.completed.end()) return StrandView{it->second, StrandStatus::Completed};
        return std::nullopt;
    }

    // Active strands first, then completed; each group in creation order
    std::vector<StrandView> list(StatusFilter filter = StatusFilter::All,
                                 size_t limit = DEFAULT_LIST_LIMIT) const {
        StrandSet set = store_.load();
        std::vector<StrandView> result;

        if (filter != StatusFilter::Completed) {
            for (auto& s : in_creation_order(set.active)) {
                result.push_back({std::move(s), StrandStatus::Active});
            }
        }
        if (filter != StatusFilter::Active) {
            for (auto& s : in_creation_order(set.completed)) {
                result.push_back({std::move(s), StrandStatus::Completed});
            }
        }

        if (result.size() > limit) result.resize(limit);
        return result;
    }

    // Case-insensitive substring search over topic, thoughts and conclusion.
    // Topic hits rank above content hits; within a tier newest first, then
    // by id descending. An empty query matches nothing.
    std::vector<SearchHit> search(const std::string& query,
                                  size_t limit = DEFAULT_SEARCH_LIMIT) const {
        std::vector<SearchHit> hits;
        if (query.empty()) return hits;

        StrandSet set = store_.load();
        const std::string needle = to_lower(query);

        auto scan = [&](const std::unordered_map<std::string, Strand>& group,
                        StrandStatus status) {
            for (const auto& [id, strand] : group) {
                auto kind = match(strand, needle);
                if (kind) hits.push_back({strand, status, *kind});
            }
        };
        scan(set.active, StrandStatus::Active);
        scan(set.completed, StrandStatus::Completed);

        std::sort(hits.begin(), hits.end(), [](const SearchHit& a, const SearchHit& b) {
            int tier_a = a.kind == MatchKind::Topic ? 0 : 1;
            int tier_b = b.kind == MatchKind::Topic ? 0 : 1;
            if (tier_a != tier_b) return tier_a < tier_b;
            if (a.strand.created != b.strand.created) return a.strand.created > b.strand.created;
            return strand_seq(a.strand.id) > strand_seq(b.strand.id);
        });

        if (hits.size() > limit) hits.resize(limit);
        return hits;
    }

    // Full snapshot, for invariant checks and the CLI
    StrandSet snapshot() const { return store_.load(); }

private:
    StrandStore& store_;
    Clock clock_;

    // last_updated strictly increases even within one clock tick
    Timestamp touch(Timestamp previous) const {
        return std::max(clock_(), previous + 1);
    }

    static std::optional<MatchKind> match(const Strand& strand, const std::string& needle) {
        if (contains_ci(strand.topic, needle)) return MatchKind::Topic;
        for (const auto& thought : strand.thoughts) {
            if (contains_ci(thought, needle)) return MatchKind::Content;
        }
        if (strand.is_completed() && contains_ci(strand.conclusion, needle)) {
            return MatchKind::Conclusion;
        }
        return std::nullopt;
    }

    static std::vector<Strand> in_creation_order(const std::unordered_map<std::string, Strand>& group) {
        std::vector<Strand> strands;
        strands.reserve(group.size());
        for (const auto& [_, strand] : group) strands.push_back(strand);
        std::sort(strands.begin(), strands.end(), [](const Strand& a, const Strand& b) {
            uint64_t sa = strand_seq(a.id), sb = strand_seq(b.id);
            if (sa != sb) return sa < sb;
            return a.id < b.id;
        });
        return strands;
    }
};

} // namespace skein
