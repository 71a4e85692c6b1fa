#pragma once
// Core types: the rows of the coordination store
//
// Agents, messages, file locks and memories. Time is Unix millis
// everywhere; formatting to ISO-8601 happens only at the edges.

#include <chrono>
#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace bridge {

// Timestamp as Unix millis
using Timestamp = int64_t;

// Current time as Timestamp
inline Timestamp now() {
    auto duration = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
}

// 2026-10-19T12:00:00Z
inline std::string format_timestamp(Timestamp ts) {
    std::time_t secs = static_cast<std::time_t>(ts / 1000);
    std::tm tm{};
    gmtime_r(&secs, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

struct Agent {
    std::string name;
    std::string program;
    std::string model;
    std::string task;
    std::string status;
    Timestamp registered_at = 0;
    Timestamp last_seen = 0;
};

// Optional fields for register(); unset fields are left alone on update
struct AgentInfo {
    std::optional<std::string> program;
    std::optional<std::string> model;
    std::optional<std::string> task;
    std::optional<std::string> status;
};

struct Message {
    int64_t id = 0;
    std::string sender;
    std::string recipient;
    std::string subject;
    std::string body;
    std::string thread_id;   // empty = no thread
    Timestamp created_at = 0;
    std::optional<Timestamp> read_at;
    std::optional<Timestamp> acked_at;

    bool read() const { return read_at.has_value(); }
    bool acknowledged() const { return acked_at.has_value(); }
};

struct FileLock {
    std::string path;
    std::string agent;
    std::string reason;
    Timestamp acquired_at = 0;
    Timestamp expires_at = 0;

    bool active_at(Timestamp t) const { return expires_at > t; }
};

enum class LockOutcome {
    Acquired,
    Renewed
};

struct LockResult {
    LockOutcome outcome = LockOutcome::Acquired;
    FileLock lock;
};

enum class UnlockOutcome {
    Released,
    NotLocked
};

struct Memory {
    int64_t id = 0;
    std::string content;
    std::vector<std::string> tags;
    Timestamp created_at = 0;
};

inline const char* to_string(LockOutcome o) {
    return o == LockOutcome::Renewed ? "renewed" : "acquired";
}

inline const char* to_string(UnlockOutcome o) {
    return o == UnlockOutcome::Released ? "released" : "not_locked";
}

// Whole seconds left on a lock, rounded up; 0 once expired
inline int64_t remaining_seconds(const FileLock& lock, Timestamp t) {
    if (lock.expires_at <= t) return 0;
    return (lock.expires_at - t + 999) / 1000;
}

} // namespace bridge
