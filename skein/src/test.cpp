#include <skein/strand_repository.hpp>
#include <skein/strand_store.hpp>
#include <iostream>
#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace skein;
namespace fs = std::filesystem;

// Fresh path under the temp directory, removed on construction and destruction
struct TempFile {
    std::string path;

    explicit TempFile(const std::string& name) {
        path = (fs::temp_directory_path() /
                ("skein_test_" + name + "_" + std::to_string(::getpid()) + ".json")).string();
        std::error_code ec;
        fs::remove(path, ec);
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path, ec);
    }

    void write(const std::string& text) const {
        std::ofstream out(path, std::ios::binary);
        out << text;
    }
};

// Manually advanced clock
struct FakeClock {
    Timestamp t = 1700000000000;
    Timestamp operator()() const { return t; }
};

void assert_invariants(const StrandRepository& repo) {
    std::string error;
    bool ok = validate(repo.snapshot(), error);
    if (!ok) std::cerr << "  invariant violated: " << error << std::endl;
    assert(ok);
}

void test_timestamps() {
    std::cout << "Testing timestamp format/parse..." << std::endl;

    assert(format_timestamp(0) == "1970-01-01T00:00:00.000Z");
    assert(format_timestamp(1700000000123) == "2023-11-14T22:13:20.123Z");

    auto parsed = parse_timestamp("2023-11-14T22:13:20.123Z");
    assert(parsed && *parsed == 1700000000123);

    auto no_fraction = parse_timestamp("2023-11-14T22:13:20Z");
    assert(no_fraction && *no_fraction == 1700000000000);

    auto long_fraction = parse_timestamp("2023-11-14T22:13:20.123456Z");
    assert(long_fraction && *long_fraction == 1700000000123);

    assert(!parse_timestamp("yesterday"));
    assert(!parse_timestamp("2023-11-14T22:13:20.123"));

    std::cout << "  PASS" << std::endl;
}

void test_strand_ids() {
    std::cout << "Testing strand ids..." << std::endl;

    assert(make_strand_id(1) == "strand_1");
    assert(strand_seq("strand_42") == 42);
    assert(strand_seq("strand_") == 0);
    assert(strand_seq("strand_4x") == 0);
    assert(strand_seq("thread_4") == 0);
    assert(strand_seq("strand_18446744073709551615") == UINT64_MAX);
    assert(strand_seq("strand_18446744073709551616") == 0);
    assert(strand_seq("strand_99999999999999999999") == 0);

    std::cout << "  PASS" << std::endl;
}

void test_create_get() {
    std::cout << "Testing create then get..." << std::endl;

    MemoryStore store;
    StrandRepository repo(store);

    auto created = repo.create("Bug triage", "Check logs");
    assert(created.ok());
    assert(created.strand.id == "strand_1");
    assert(created.strand.topic == "Bug triage");

    auto view = repo.get("strand_1");
    assert(view);
    assert(view->status == StrandStatus::Active);
    assert(view->strand.thoughts.size() == 1);
    assert(view->strand.thoughts[0] == "Check logs");
    assert(view->strand.created == view->strand.last_updated);
    assert(!view->strand.is_completed());
    assert(!view->strand.is_branch());

    assert(!repo.get("strand_2"));
    assert(store.save_count() == 1);
    assert_invariants(repo);

    std::cout << "  PASS" << std::endl;
}

void test_append() {
    std::cout << "Testing append..." << std::endl;

    MemoryStore store;
    FakeClock clock;
    StrandRepository repo(store, std::ref(clock));

    auto created = repo.create("Loop", "step 0");
    Timestamp previous = created.strand.last_updated;

    // Clock never moves: last_updated must still strictly increase
    const size_t n = 5;
    for (size_t i = 1; i <= n; ++i) {
        auto r = repo.append("strand_1", "step " + std::to_string(i));
        assert(r.ok());
        assert(r.strand.thoughts.size() == i + 1);
        assert(r.strand.last_updated > previous);
        previous = r.strand.last_updated;
        assert_invariants(repo);
    }

    // Clock moving forward is picked up
    clock.t += 60000;
    auto r = repo.append("strand_1", "later");
    assert(r.ok());
    assert(r.strand.last_updated == clock.t);

    auto view = repo.get("strand_1");
    assert(view->strand.thoughts.size() == n + 2);
    assert(view->strand.thoughts.front() == "step 0");
    assert(view->strand.thoughts.back() == "later");

    auto missing = repo.append("strand_9", "nothing");
    assert(missing.error == StrandError::NotFound);

    std::cout << "  PASS" << std::endl;
}

void test_complete() {
    std::cout << "Testing complete..." << std::endl;

    MemoryStore store;
    StrandRepository repo(store);

    repo.create("Decide", "Option A or B");
    auto done = repo.complete("strand_1", "Option B");
    assert(done.ok());
    assert(done.strand.conclusion == "Option B");
    assert(done.strand.is_completed());
    assert_invariants(repo);

    StrandSet set = repo.snapshot();
    assert(set.active.count("strand_1") == 0);
    assert(set.completed.count("strand_1") == 1);

    // Completed strands are frozen
    auto append = repo.append("strand_1", "one more");
    assert(append.error == StrandError::NotFound);
    assert(repo.get("strand_1")->strand.thoughts.size() == 1);

    // Completion is single use
    auto again = repo.complete("strand_1", "Option A");
    assert(again.error == StrandError::NotFound);
    assert(repo.get("strand_1")->strand.conclusion == "Option B");

    assert(repo.complete("strand_7", "never existed").error == StrandError::NotFound);
    assert_invariants(repo);

    std::cout << "  PASS" << std::endl;
}

void test_branch() {
    std::cout << "Testing branch..." << std::endl;

    MemoryStore store;
    StrandRepository repo(store);

    repo.create("Root", "r1");
    repo.append("strand_1", "r2");
    repo.append("strand_1", "r3");

    // From an active source
    auto b1 = repo.branch("strand_1", "Fork", "f1");
    assert(b1.ok());
    assert(b1.strand.id == "strand_2");
    assert(b1.strand.branched_from == "strand_1");
    assert(b1.strand.thoughts.size() == 4);
    auto source = repo.get("strand_1")->strand;
    for (size_t i = 0; i < source.thoughts.size(); ++i) {
        assert(b1.strand.thoughts[i] == source.thoughts[i]);
    }
    assert(b1.strand.thoughts.back() == "f1");
    assert(source.thoughts.size() == 3);  // Source untouched

    // From a completed source; the branch still starts active
    repo.complete("strand_1", "done");
    auto b2 = repo.branch("strand_1", "Late fork", "f2");
    assert(b2.ok());
    assert(b2.strand.thoughts.size() == 4);
    assert(repo.get(b2.strand.id)->status == StrandStatus::Active);
    assert(repo.get("strand_1")->status == StrandStatus::Completed);

    // Branch of a branch: lineage depth is unbounded
    auto b3 = repo.branch("strand_2", "Fork of fork", "ff1");
    assert(b3.ok());
    assert(b3.strand.branched_from == "strand_2");
    assert(b3.strand.thoughts.size() == 5);

    // Lineage is a record, not a link
    repo.append("strand_2", "f1b");
    assert(repo.get(b3.strand.id)->strand.thoughts.size() == 5);

    auto missing = repo.branch("strand_99", "x", "y");
    assert(missing.error == StrandError::NotFound);
    assert(repo.snapshot().counter == 4);
    assert_invariants(repo);

    std::cout << "  PASS" << std::endl;
}

void test_list() {
    std::cout << "Testing list..." << std::endl;

    MemoryStore store;
    StrandRepository repo(store);

    assert(repo.list().empty());

    for (int i = 1; i <= 12; ++i) {
        repo.create("Topic " + std::to_string(i), "t");
    }
    repo.complete("strand_3", "c");
    repo.complete("strand_11", "c");

    auto all = repo.list();
    assert(all.size() == 12);
    // Active first in creation order (strand_10 after strand_9), then completed
    assert(all[0].strand.id == "strand_1");
    assert(all[1].strand.id == "strand_2");
    assert(all[2].strand.id == "strand_4");
    assert(all[8].strand.id == "strand_10");
    assert(all[9].strand.id == "strand_12");
    assert(all[10].strand.id == "strand_3");
    assert(all[10].status == StrandStatus::Completed);
    assert(all[11].strand.id == "strand_11");

    auto active = repo.list(StatusFilter::Active);
    assert(active.size() == 10);
    for (const auto& v : active) assert(v.status == StrandStatus::Active);

    auto completed = repo.list(StatusFilter::Completed);
    assert(completed.size() == 2);

    auto capped = repo.list(StatusFilter::All, 5);
    assert(capped.size() == 5);
    assert(capped[4].strand.id == "strand_6");

    assert(parse_status_filter("completed") == StatusFilter::Completed);
    assert(!parse_status_filter("archived"));

    std::cout << "  PASS" << std::endl;
}

void test_search_ranking() {
    std::cout << "Testing search ranking..." << std::endl;

    MemoryStore store;
    FakeClock clock;
    StrandRepository repo(store, std::ref(clock));

    repo.create("Cache design", "consider LRU");             // strand_1, topic hit
    clock.t += 1000;
    repo.create("Storage", "the CACHE must be bounded");     // strand_2, content hit
    clock.t += 1000;
    repo.create("Network", "retry policy");                  // strand_3, no hit
    clock.t += 1000;
    repo.create("cache invalidation", "hard problem");       // strand_4, topic hit
    clock.t += 1000;
    repo.create("Memory", "see cache notes");                // strand_5, content hit

    auto hits = repo.search("Cache");
    assert(hits.size() == 4);
    assert(hits[0].strand.id == "strand_4" && hits[0].kind == MatchKind::Topic);
    assert(hits[1].strand.id == "strand_1" && hits[1].kind == MatchKind::Topic);
    assert(hits[2].strand.id == "strand_5" && hits[2].kind == MatchKind::Content);
    assert(hits[3].strand.id == "strand_2" && hits[3].kind == MatchKind::Content);

    auto capped = repo.search("cache", 3);
    assert(capped.size() == 3);
    assert(capped[2].strand.id == "strand_5");

    // Same creation time: higher id first
    repo.create("tie", "a");   // strand_6
    repo.create("tie", "b");   // strand_7
    auto ties = repo.search("tie");
    assert(ties.size() == 2);
    assert(ties[0].strand.id == "strand_7");

    assert(repo.search("").empty());
    assert(repo.search("absent").empty());

    std::cout << "  PASS" << std::endl;
}

void test_search_conclusion() {
    std::cout << "Testing search by conclusion..." << std::endl;

    MemoryStore store;
    StrandRepository repo(store);

    repo.create("Outage", "pager fired");
    assert(repo.search("rollback").empty());

    repo.complete("strand_1", "Rollback fixed it");
    auto hits = repo.search("ROLLBACK");
    assert(hits.size() == 1);
    assert(hits[0].kind == MatchKind::Conclusion);
    assert(hits[0].status == StrandStatus::Completed);

    // Thought match wins over conclusion match
    auto pager = repo.search("pager");
    assert(pager.size() == 1 && pager[0].kind == MatchKind::Content);

    std::cout << "  PASS" << std::endl;
}

void test_scenario() {
    std::cout << "Testing bug triage scenario..." << std::endl;

    TempFile file("scenario");
    JsonFileStore store(file.path);
    StrandRepository repo(store);

    auto s1 = repo.create("Bug triage", "Check logs");
    assert(s1.strand.id == "strand_1" && s1.strand.thoughts.size() == 1);

    auto a = repo.append("strand_1", "Found root cause");
    assert(a.strand.thoughts.size() == 2);

    auto c = repo.complete("strand_1", "Patch applied");
    assert(c.ok());
    auto view = repo.get("strand_1");
    assert(view->status == StrandStatus::Completed);
    assert(view->strand.conclusion == "Patch applied");

    assert(repo.append("strand_1", "late").error == StrandError::NotFound);

    auto b = repo.branch("strand_1", "Regression check", "Re-verify after patch");
    assert(b.strand.id == "strand_2");
    assert(b.strand.thoughts.size() == 3);
    assert(b.strand.thoughts[0] == "Check logs");
    assert(b.strand.thoughts[1] == "Found root cause");
    assert(b.strand.thoughts[2] == "Re-verify after patch");
    assert(b.strand.branched_from == "strand_1");
    assert_invariants(repo);

    std::cout << "  PASS" << std::endl;
}

void test_persistence() {
    std::cout << "Testing persistence across instances..." << std::endl;

    TempFile file("persist");
    {
        JsonFileStore store(file.path);
        StrandRepository repo(store);
        repo.create("First", "one");
        repo.create("Second", "two");
        repo.complete("strand_1", "closed");
        repo.branch("strand_1", "Third", "three");
    }

    JsonFileStore store(file.path);
    StrandSet set = store.load();
    assert(set.counter == 3);
    assert(set.active.size() == 2);
    assert(set.completed.size() == 1);

    const Strand& first = set.completed.at("strand_1");
    assert(first.conclusion == "closed");
    assert(first.completed >= first.created);

    const Strand& third = set.active.at("strand_3");
    assert(third.branched_from == "strand_1");
    assert(third.thoughts.size() == 2);

    // Ids are never reissued
    StrandRepository repo(store);
    auto next = repo.create("Fourth", "four");
    assert(next.strand.id == "strand_4");

    // Persisted layout
    std::ifstream in(file.path);
    json doc = json::parse(in);
    assert(doc.contains("active") && doc.contains("completed") && doc.contains("counter"));
    assert(doc["counter"] == 4);
    assert(doc["completed"]["strand_1"]["conclusion"] == "closed");
    assert(doc["active"]["strand_3"]["branched_from"] == "strand_1");
    assert(!doc["active"]["strand_2"].contains("conclusion"));

    std::cout << "  PASS" << std::endl;
}

void test_store_recovery() {
    std::cout << "Testing store recovery..." << std::endl;

    {
        TempFile file("missing");
        JsonFileStore store(file.path);
        StrandSet set = store.load();
        assert(set.size() == 0 && set.counter == 0);
    }
    {
        TempFile file("garbage");
        file.write("{ this is not json");
        JsonFileStore store(file.path);
        StrandSet set = store.load();
        assert(set.size() == 0 && set.counter == 0);

        // And the repository starts over from there
        StrandRepository repo(store);
        assert(repo.create("Fresh", "start").strand.id == "strand_1");
    }
    {
        TempFile file("wrong_shape");
        file.write(R"({"active": [], "completed": {}, "counter": 3})");
        JsonFileStore store(file.path);
        assert(store.load().counter == 0);
    }
    {
        TempFile file("empty_thoughts");
        file.write(R"({"active": {"strand_1": {"id": "strand_1", "topic": "t", "thoughts": [],
                       "created": "2024-01-01T00:00:00.000Z",
                       "last_updated": "2024-01-01T00:00:00.000Z"}},
                       "completed": {}, "counter": 1})");
        JsonFileStore store(file.path);
        assert(store.load().size() == 0);
    }
    {
        TempFile file("duplicate");
        std::string strand = R"({"id": "strand_1", "topic": "t", "thoughts": ["a"],
                                "created": "2024-01-01T00:00:00.000Z",
                                "last_updated": "2024-01-01T00:00:00.000Z",
                                "conclusion": "c", "completed": "2024-01-02T00:00:00.000Z"})";
        file.write(R"({"active": {"strand_1": )" + strand +
                   R"(}, "completed": {"strand_1": )" + strand + R"(}, "counter": 1})");
        JsonFileStore store(file.path);
        assert(store.load().size() == 0);
    }
    {
        TempFile file("negative_counter");
        file.write(R"({"active": {"strand_1": {"id": "strand_1", "topic": "t", "thoughts": ["a"],
                       "created": "2024-01-01T00:00:00.000Z",
                       "last_updated": "2024-01-01T00:00:00.000Z"}},
                       "completed": {}, "counter": -2})");
        JsonFileStore store(file.path);
        StrandSet set = store.load();
        assert(set.size() == 0 && set.counter == 0);

        // Ids restart cleanly and every create is stored
        StrandRepository repo(store);
        assert(repo.create("a", "x").strand.id == "strand_1");
        assert(repo.create("b", "y").strand.id == "strand_2");
        assert(repo.create("c", "z").strand.id == "strand_3");
        assert(repo.snapshot().size() == 3);
    }
    {
        TempFile file("fractional_counter");
        file.write(R"({"active": {}, "completed": {}, "counter": 1.5})");
        JsonFileStore store(file.path);
        assert(store.load().counter == 0);
    }
    {
        TempFile file("active_with_conclusion");
        file.write(R"({"active": {"strand_1": {"id": "strand_1", "topic": "t", "thoughts": ["a"],
                       "created": "2024-01-01T00:00:00.000Z",
                       "last_updated": "2024-01-01T00:00:00.000Z",
                       "conclusion": "half done"}},
                       "completed": {}, "counter": 1})");
        JsonFileStore store(file.path);
        assert(store.load().size() == 0);
    }
    {
        TempFile file("completed_without_conclusion");
        file.write(R"({"active": {}, "completed": {"strand_1": {"id": "strand_1", "topic": "t",
                       "thoughts": ["a"],
                       "created": "2024-01-01T00:00:00.000Z",
                       "last_updated": "2024-01-01T00:00:00.000Z",
                       "completed": "2024-01-02T00:00:00.000Z"}},
                       "counter": 1})");
        JsonFileStore store(file.path);
        assert(store.load().size() == 0);
    }

    std::cout << "  PASS" << std::endl;
}

void test_id_conflicts() {
    std::cout << "Testing id conflicts..." << std::endl;

    Strand taken;
    taken.id = "strand_2";
    taken.topic = "taken";
    taken.thoughts = {"a"};
    taken.created = taken.last_updated = 1700000000000;

    {
        // Counter lags behind an existing id: the next id is refused, not overwritten
        MemoryStore store;
        StrandSet set;
        set.active.emplace(taken.id, taken);
        set.counter = 1;
        store.save(set);
        size_t saves = store.save_count();

        StrandRepository repo(store);
        auto created = repo.create("new", "x");
        assert(created.error == StrandError::IdConflict);
        auto branched = repo.branch("strand_2", "fork", "y");
        assert(branched.error == StrandError::IdConflict);
        assert(store.save_count() == saves);
        assert(repo.get("strand_2")->strand.topic == "taken");
    }
    {
        MemoryStore store;
        StrandSet set;
        set.counter = UINT64_MAX;
        store.save(set);

        StrandRepository repo(store);
        assert(repo.create("new", "x").error == StrandError::IdConflict);
        assert(repo.snapshot().size() == 0);
    }

    std::cout << "  PASS" << std::endl;
}

void test_store_legacy_layout() {
    std::cout << "Testing legacy layout..." << std::endl;

    TempFile file("legacy");
    file.write(R"({
      "active_strands": {
        "strand_2": {"id": "strand_2", "topic": "Open", "thoughts": ["a", "b"],
                     "created": "2024-05-01T10:00:00.000Z",
                     "last_updated": "2024-05-01T10:05:00.000Z",
                     "branched_from": "strand_1"}
      },
      "completed_strands": {
        "strand_1": {"id": "strand_1", "topic": "Closed", "thoughts": ["a"],
                     "created": "2024-05-01T09:00:00.000Z",
                     "last_updated": "2024-05-01T09:00:00.000Z",
                     "conclusion": "done", "completed": "2024-05-01T09:30:00.000Z"}
      },
      "strand_counter": 2
    })");

    JsonFileStore store(file.path);
    StrandSet set = store.load();
    assert(set.counter == 2);
    assert(set.active.at("strand_2").branched_from == "strand_1");
    assert(set.active.at("strand_2").last_updated == *parse_timestamp("2024-05-01T10:05:00.000Z"));
    assert(set.completed.at("strand_1").conclusion == "done");

    // Counter catches up with the highest id on disk
    TempFile lagging("lagging");
    lagging.write(R"({"active": {"strand_9": {"topic": "t", "thoughts": ["a"],
                      "created": 1700000000000, "last_updated": 1700000000000}},
                      "completed": {}, "counter": 2})");
    JsonFileStore lag_store(lagging.path);
    StrandSet lag_set = lag_store.load();
    assert(lag_set.counter == 9);
    assert(lag_set.active.at("strand_9").id == "strand_9");

    StrandRepository repo(lag_store);
    assert(repo.create("next", "x").strand.id == "strand_10");

    std::cout << "  PASS" << std::endl;
}

void test_save_failure() {
    std::cout << "Testing save failure..." << std::endl;

    // Parent "directory" is a regular file, so nothing can be written
    TempFile blocker("blocker");
    blocker.write("not a directory");
    JsonFileStore store(blocker.path + "/strands.json");
    StrandRepository repo(store);

    auto r = repo.create("Doomed", "no disk");
    assert(r.error == StrandError::StorageFailed);
    assert(repo.snapshot().size() == 0);

    std::cout << "  PASS" << std::endl;
}

void test_invariants_over_sequence() {
    std::cout << "Testing invariants over an operation sequence..." << std::endl;

    MemoryStore store;
    StrandRepository repo(store);

    for (int round = 0; round < 20; ++round) {
        auto c = repo.create("round " + std::to_string(round), "start");
        assert_invariants(repo);
        repo.append(c.strand.id, "middle");
        assert_invariants(repo);
        if (round % 3 == 0) {
            repo.complete(c.strand.id, "end");
            assert_invariants(repo);
        }
        if (round % 4 == 1) {
            repo.branch(c.strand.id, "fork " + std::to_string(round), "fork");
            assert_invariants(repo);
        }
        // Operations on ids that are gone or never existed change nothing
        repo.append("strand_0", "x");
        repo.complete("strand_1000", "x");
        assert_invariants(repo);
    }

    StrandSet set = repo.snapshot();
    assert(set.counter == set.size());
    for (const auto& [id, _] : set.active) {
        assert(set.completed.count(id) == 0);
    }

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Skein Strand Tests ===" << std::endl;
    std::cout << std::endl;

    test_timestamps();
    test_strand_ids();
    test_create_get();
    test_append();
    test_complete();
    test_branch();
    test_list();
    test_search_ranking();
    test_search_conclusion();
    test_scenario();
    test_invariants_over_sequence();

    std::cout << std::endl;
    std::cout << "=== Storage Tests ===" << std::endl;
    test_persistence();
    test_store_recovery();
    test_id_conflicts();
    test_store_legacy_layout();
    test_save_failure();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
