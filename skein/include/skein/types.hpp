#pragma once
// Core types: time, text helpers, atomic persistence
//
// Shared by the strand store, the repository and the MCP layer.

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>

// POSIX headers for atomic file persistence (must be outside namespace)
#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>

namespace skein {

// Timestamp as Unix millis
using Timestamp = int64_t;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// ═══════════════════════════════════════════════════════════════════════════
// ISO-8601 (UTC, millisecond precision): 2026-10-18T09:30:00.123Z
// ═══════════════════════════════════════════════════════════════════════════

inline std::string format_timestamp(Timestamp ts) {
    std::time_t secs = static_cast<std::time_t>(ts / 1000);
    int millis = static_cast<int>(ts % 1000);
    if (millis < 0) {
        millis += 1000;
        --secs;
    }

    std::tm tm{};
    ::gmtime_r(&secs, &tm);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
    return buf;
}

// Accepts "YYYY-MM-DDTHH:MM:SS[.fff]Z"; fraction digits beyond 3 are ignored
inline std::optional<Timestamp> parse_timestamp(const std::string& text) {
    int year, mon, day, hour, min, sec;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &mon, &day, &hour, &min, &sec, &consumed) != 6) {
        return std::nullopt;
    }

    int millis = 0;
    size_t pos = static_cast<size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 3) millis = millis * 10 + (text[pos] - '0');
            ++digits;
            ++pos;
        }
        if (digits == 0) return std::nullopt;
        for (; digits < 3; ++digits) millis *= 10;
    }
    if (pos >= text.size() || text[pos] != 'Z') return std::nullopt;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    std::time_t secs = ::timegm(&tm);
    if (secs == static_cast<std::time_t>(-1)) return std::nullopt;

    return static_cast<Timestamp>(secs) * 1000 + millis;
}

// ═══════════════════════════════════════════════════════════════════════════
// Text helpers
// ═══════════════════════════════════════════════════════════════════════════

// ASCII lowercase; multi-byte UTF-8 sequences pass through unchanged
inline std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

inline bool contains_ci(const std::string& haystack, const std::string& lowered_needle) {
    return to_lower(haystack).find(lowered_needle) != std::string::npos;
}

// ═══════════════════════════════════════════════════════════════════════════
// Atomic file persistence: write temp → fsync → rename → fsync dir
// ═══════════════════════════════════════════════════════════════════════════

// Fsync parent directory for durability
inline bool fsync_dir(const std::string& path) {
    auto slash = path.find_last_of('/');
    std::string dir = (slash == std::string::npos) ? "." : path.substr(0, slash);
    if (dir.empty()) dir = "/";
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if (dfd < 0) return false;
    int rc = ::fsync(dfd);
    ::close(dfd);
    return rc == 0;
}

// Atomic save: write to temp file, fsync, rename to final path
// Writer function takes FILE* and returns true on success
template <typename Writer>
bool safe_save(const std::string& path, Writer&& write_fn) {
    std::string tmp = path + ".tmp." + std::to_string(::getpid());
    FILE* f = ::fopen(tmp.c_str(), "wb");
    if (!f) return false;

    bool ok = write_fn(f);
    if (ok && ::fflush(f) == 0 && ::fsync(::fileno(f)) == 0) {
        ok = true;
    } else {
        ok = false;
    }

    if (::fclose(f) != 0) ok = false;
    if (!ok) { ::remove(tmp.c_str()); return false; }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        ::remove(tmp.c_str());
        return false;
    }

    fsync_dir(path);
    return true;
}

} // namespace skein
