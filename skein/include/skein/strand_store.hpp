#pragma once
// Strand Store: durable home of the strand aggregate
//
// Every repository operation is a full read → transform → full write
// cycle against a store. The store is the only thing that touches the
// backing file.
//
// A missing, unreadable or malformed file loads as an empty aggregate.
// Strands are working scratch data, so losing them beats refusing service.
//
// No locking: two processes sharing one file race on load/save and the
// last writer wins.

#include "strand.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace skein {

class StrandStore {
public:
    virtual ~StrandStore() = default;

    // Never fails: corruption yields an empty aggregate
    virtual StrandSet load() = 0;

    // Replace the persisted aggregate. False if nothing was written.
    virtual bool save(const StrandSet& set) = 0;
};

// Keeps the aggregate in process memory (tests, --memory mode)
class MemoryStore : public StrandStore {
public:
    StrandSet load() override { return set_; }

    bool save(const StrandSet& set) override {
        set_ = set;
        ++saves_;
        return true;
    }

    size_t save_count() const { return saves_; }

private:
    StrandSet set_;
    size_t saves_ = 0;
};

// One JSON document, rewritten atomically on every save
class JsonFileStore : public StrandStore {
public:
    explicit JsonFileStore(std::string path) : path_(std::move(path)) {}

    const std::string& path() const { return path_; }

    StrandSet load() override {
        namespace fs = std::filesystem;

        std::error_code ec;
        if (!fs::exists(path_, ec)) {
            return StrandSet{};
        }

        std::ifstream in(path_, std::ios::binary);
        if (!in) {
            std::cerr << "[StrandStore] Cannot read " << path_ << ", starting empty\n";
            return StrandSet{};
        }
        std::stringstream buffer;
        buffer << in.rdbuf();

        StrandSet set;
        try {
            set = json::parse(buffer.str()).get<StrandSet>();
        } catch (const std::exception& e) {
            std::cerr << "[StrandStore] Corrupt " << path_ << " (" << e.what()
                      << "), starting empty\n";
            return StrandSet{};
        }

        // Ids are never reissued, even if the counter field lagged behind
        for (const auto& [id, _] : set.active) {
            set.counter = std::max(set.counter, strand_seq(id));
        }
        for (const auto& [id, _] : set.completed) {
            set.counter = std::max(set.counter, strand_seq(id));
        }

        std::string error;
        if (!validate(set, error)) {
            std::cerr << "[StrandStore] Invalid " << path_ << " (" << error
                      << "), starting empty\n";
            return StrandSet{};
        }
        return set;
    }

    bool save(const StrandSet& set) override {
        namespace fs = std::filesystem;

        fs::path parent = fs::path(path_).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            fs::create_directories(parent, ec);
            if (ec) {
                std::cerr << "[StrandStore] Cannot create " << parent.string()
                          << ": " << ec.message() << "\n";
                return false;
            }
        }

        const std::string text = json(set).dump(2);
        bool ok = safe_save(path_, [&text](FILE* f) {
            return std::fwrite(text.data(), 1, text.size(), f) == text.size();
        });
        if (!ok) {
            std::cerr << "[StrandStore] Failed to write " << path_ << "\n";
        }
        return ok;
    }

private:
    std::string path_;
};

} // namespace skein
