#pragma once
// RPC Memory Tools: remember, recall, forget
//
// Shared notes any agent can read. Search is plain case-insensitive
// substring matching over content and tags.

#include "../types.hpp"
#include "../../store.hpp"
#include <sstream>
#include <unordered_map>

namespace bridge::rpc::tools::memory {

using json = nlohmann::json;

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "remember",
        "Store a memory/note for later, visible to every agent.",
        {
            {"type", "object"},
            {"properties", {
                {"content", {{"type", "string"}, {"description", "What to remember"}}},
                {"tags", {{"type", "array"}, {"items", {{"type", "string"}}}}}
            }},
            {"required", {"content"}}
        }
    });

    tools.push_back({
        "recall",
        "Search memories by case-insensitive substring over content and tags, "
        "newest first. An empty query returns the latest memories.",
        {
            {"type", "object"},
            {"properties", {
                {"query", {{"type", "string"}, {"description", "Search term"}}},
                {"limit", {{"type", "integer"}, {"minimum", 1}, {"default", 5}}}
            }},
            {"required", {"query"}}
        }
    });

    tools.push_back({
        "forget",
        "Delete a memory.",
        {
            {"type", "object"},
            {"properties", {
                {"id", {{"type", "integer"}, {"description", "Memory ID to delete"}}}
            }},
            {"required", {"id"}}
        }
    });
}

inline ToolResult remember(Store* store, const json& params) {
    Memory m = store->remember(require_string(params, "content"),
                               get_string_list(params, "tags"));
    return ToolResult::ok("Remembered #" + std::to_string(m.id),
                          {{"status", "stored"}, {"id", m.id}, {"memory", m}});
}

inline ToolResult recall(Store* store, const json& params) {
    std::string query = require_string(params, "query");
    int64_t limit = store->config().default_recall_limit;
    if (auto requested = optional_int(params, "limit")) {
        if (*requested <= 0 || *requested > INT32_MAX) throw invalid_input("limit must be >= 1");
        limit = *requested;
    }

    auto found = store->recall(query, static_cast<int>(limit));

    std::ostringstream ss;
    ss << "Found " << found.size() << (found.size() == 1 ? " memory" : " memories");
    if (!query.empty()) ss << " matching '" << query << "'";
    if (!found.empty()) ss << ":";
    for (const auto& m : found) {
        ss << "\n  #" << m.id << " " << format_timestamp(m.created_at);
        if (!m.tags.empty()) {
            ss << " [";
            for (size_t i = 0; i < m.tags.size(); ++i) {
                if (i) ss << ", ";
                ss << m.tags[i];
            }
            ss << "]";
        }
        ss << "\n      " << m.content;
    }

    return ToolResult::ok(ss.str(), {{"memories", found}});
}

inline ToolResult forget(Store* store, const json& params) {
    int64_t id = require_int(params, "id");
    store->forget(id);
    return ToolResult::ok("Forgot memory #" + std::to_string(id),
                          {{"status", "forgotten"}, {"id", id}});
}

inline void register_handlers(Store* store,
                              std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["remember"] = [store](const json& p) { return remember(store, p); };
    handlers["recall"] = [store](const json& p) { return recall(store, p); };
    handlers["forget"] = [store](const json& p) { return forget(store, p); };
}

} // namespace bridge::rpc::tools::memory
