#pragma once
// RPC Lock Tools: lock, unlock, locks
//
// Locks are advisory and time-bounded. A held lock makes lock() fail
// fast with a conflict naming the holder; expired locks are taken over
// silently.

#include "../types.hpp"
#include "../../store.hpp"
#include <sstream>
#include <unordered_map>

namespace bridge::rpc::tools::locks {

using json = nlohmann::json;

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "lock",
        "Lock a file for exclusive editing. Fails if another agent holds an "
        "unexpired lock on the path. Locking a path you already hold renews it.",
        {
            {"type", "object"},
            {"properties", {
                {"path", {{"type", "string"}, {"description", "File path to lock"}}},
                {"agent", {{"type", "string"}, {"description", "Your agent name"}}},
                {"reason", {{"type", "string"}, {"description", "Why you need the lock"}}},
                {"ttl_seconds", {{"type", "integer"}, {"minimum", 1}, {"default", 1800}}}
            }},
            {"required", {"path", "agent"}}
        }
    });

    tools.push_back({
        "unlock",
        "Release a file lock you hold.",
        {
            {"type", "object"},
            {"properties", {
                {"path", {{"type", "string"}}},
                {"agent", {{"type", "string"}, {"description", "Your agent name"}}}
            }},
            {"required", {"path", "agent"}}
        }
    });

    tools.push_back({
        "locks",
        "List file locks.",
        {
            {"type", "object"},
            {"properties", {
                {"active_only", {{"type", "boolean"}, {"default", true},
                                {"description", "Hide expired locks"}}},
                {"agent", {{"type", "string"}, {"description", "Filter by holder (optional)"}}}
            }},
            {"required", json::array()}
        }
    });
}

inline ToolResult lock(Store* store, const json& params) {
    std::string path = require_string(params, "path");
    std::string agent = require_string(params, "agent");
    std::string reason = get_string(params, "reason", "");

    int64_t ttl = store->config().default_lock_ttl_seconds;
    if (auto requested = optional_int(params, "ttl_seconds")) {
        if (*requested <= 0) throw invalid_input("ttl_seconds must be >= 1");
        ttl = *requested;
    }

    LockResult r = store->lock(path, agent, ttl, reason);
    int64_t remaining = remaining_seconds(r.lock, store->current_time());

    std::ostringstream ss;
    ss << (r.outcome == LockOutcome::Renewed ? "Renewed lock on " : "Locked ")
       << path << " for " << agent << " (expires " << format_timestamp(r.lock.expires_at)
       << ", " << remaining << "s)";

    return ToolResult::ok(ss.str(), {
        {"status", to_string(r.outcome)},
        {"lock", r.lock},
        {"remaining_seconds", remaining}
    });
}

inline ToolResult unlock(Store* store, const json& params) {
    std::string path = require_string(params, "path");
    std::string agent = require_string(params, "agent");

    UnlockOutcome outcome = store->unlock(path, agent);
    std::string text = outcome == UnlockOutcome::Released
        ? "Unlocked " + path
        : path + " was not locked";
    return ToolResult::ok(text, {{"status", to_string(outcome)}, {"path", path}});
}

inline ToolResult list_locks(Store* store, const json& params) {
    bool active_only = get_bool(params, "active_only", true);
    std::string agent = get_string(params, "agent", "");

    auto locks = store->list_locks(active_only, agent);
    Timestamp t = store->current_time();

    json rows = json::array();
    std::ostringstream ss;
    ss << locks.size() << (active_only ? " active" : "")
       << (locks.size() == 1 ? " lock" : " locks");
    if (!locks.empty()) ss << ":";

    for (const auto& l : locks) {
        int64_t remaining = remaining_seconds(l, t);
        json row = l;
        row["active"] = l.active_at(t);
        row["remaining_seconds"] = remaining;
        rows.push_back(row);

        ss << "\n  " << l.path << "  " << l.agent << "  ";
        if (l.active_at(t)) ss << "expires in " << remaining << "s";
        else ss << "expired " << format_timestamp(l.expires_at);
        if (!l.reason.empty()) ss << "  (" << l.reason << ")";
    }

    return ToolResult::ok(ss.str(), {{"locks", rows}});
}

inline void register_handlers(Store* store,
                              std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["lock"] = [store](const json& p) { return lock(store, p); };
    handlers["unlock"] = [store](const json& p) { return unlock(store, p); };
    handlers["locks"] = [store](const json& p) { return list_locks(store, p); };
}

} // namespace bridge::rpc::tools::locks
