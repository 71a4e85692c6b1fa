#pragma once
// RPC Types: tool schema, tool results, argument access, row encoding

#include "../error.hpp"
#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace bridge {

// JSON encoding of store rows (found by ADL from nlohmann::json)

inline void to_json(nlohmann::json& j, const Agent& a) {
    j = {
        {"name", a.name},
        {"program", a.program},
        {"model", a.model},
        {"task", a.task},
        {"status", a.status},
        {"registered_at", format_timestamp(a.registered_at)},
        {"last_seen", format_timestamp(a.last_seen)}
    };
}

inline void to_json(nlohmann::json& j, const Message& m) {
    j = {
        {"id", m.id},
        {"sender", m.sender},
        {"recipient", m.recipient},
        {"subject", m.subject},
        {"body", m.body},
        {"created_at", format_timestamp(m.created_at)},
        {"read", m.read()},
        {"acknowledged", m.acknowledged()}
    };
    if (!m.thread_id.empty()) j["thread_id"] = m.thread_id;
    if (m.read_at) j["read_at"] = format_timestamp(*m.read_at);
    if (m.acked_at) j["acked_at"] = format_timestamp(*m.acked_at);
}

inline void to_json(nlohmann::json& j, const FileLock& l) {
    j = {
        {"path", l.path},
        {"agent", l.agent},
        {"reason", l.reason},
        {"acquired_at", format_timestamp(l.acquired_at)},
        {"expires_at", format_timestamp(l.expires_at)}
    };
}

inline void to_json(nlohmann::json& j, const Memory& m) {
    j = {
        {"id", m.id},
        {"content", m.content},
        {"tags", m.tags},
        {"created_at", format_timestamp(m.created_at)}
    };
}

namespace rpc {

using json = nlohmann::json;

// Tool schema definition for tools/list
struct ToolSchema {
    std::string name;
    std::string description;
    json input_schema;
};

// Tool execution result
struct ToolResult {
    bool is_error = false;
    std::string content;      // Human-readable text response
    json structured;          // Structured JSON data

    static ToolResult ok(const std::string& text, const json& data = json()) {
        return {false, text, data};
    }

    static ToolResult error(const std::string& message, const json& data = json()) {
        return {true, message, data};
    }
};

using ToolHandler = std::function<ToolResult(const json&)>;

// ═══════════════════════════════════════════════════════════════════
// Argument access. Missing or mistyped arguments are InvalidInput.
// ═══════════════════════════════════════════════════════════════════

inline std::string require_string(const json& params, const char* key) {
    if (!params.contains(key) || params[key].is_null()) {
        throw invalid_input(std::string("Missing required parameter: ") + key);
    }
    if (!params[key].is_string()) {
        throw invalid_input(std::string("Parameter must be a string: ") + key);
    }
    return params[key].get<std::string>();
}

inline std::optional<std::string> optional_string(const json& params, const char* key) {
    if (!params.contains(key) || params[key].is_null()) return std::nullopt;
    if (!params[key].is_string()) {
        throw invalid_input(std::string("Parameter must be a string: ") + key);
    }
    return params[key].get<std::string>();
}

inline std::string get_string(const json& params, const char* key, const std::string& default_val) {
    return optional_string(params, key).value_or(default_val);
}

// Accepts integers and integral strings ("42"), which is what a CLI produces
inline std::optional<int64_t> optional_int(const json& params, const char* key) {
    if (!params.contains(key) || params[key].is_null()) return std::nullopt;
    const json& v = params[key];
    if (v.is_number_integer()) return v.get<int64_t>();
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        size_t pos = 0;
        try {
            long long n = std::stoll(s, &pos);
            if (pos == s.size()) return n;
        } catch (const std::exception&) {
            // fall through to the error below
        }
    }
    throw invalid_input(std::string("Parameter must be an integer: ") + key);
}

inline int64_t require_int(const json& params, const char* key) {
    auto v = optional_int(params, key);
    if (!v) throw invalid_input(std::string("Missing required parameter: ") + key);
    return *v;
}

inline bool get_bool(const json& params, const char* key, bool default_val) {
    if (!params.contains(key) || params[key].is_null()) return default_val;
    const json& v = params[key];
    if (v.is_boolean()) return v.get<bool>();
    if (v.is_string()) {
        const std::string s = v.get<std::string>();
        if (s == "true") return true;
        if (s == "false") return false;
    }
    throw invalid_input(std::string("Parameter must be a boolean: ") + key);
}

// Array of strings, or one comma-separated string
inline std::vector<std::string> get_string_list(const json& params, const char* key) {
    std::vector<std::string> out;
    if (!params.contains(key) || params[key].is_null()) return out;
    const json& v = params[key];

    if (v.is_array()) {
        for (const auto& item : v) {
            if (!item.is_string()) {
                throw invalid_input(std::string("Parameter must be a list of strings: ") + key);
            }
            out.push_back(item.get<std::string>());
        }
    } else if (v.is_string()) {
        std::string s = v.get<std::string>();
        size_t start = 0;
        while (start <= s.size()) {
            size_t comma = s.find(',', start);
            if (comma == std::string::npos) comma = s.size();
            std::string item = s.substr(start, comma - start);
            while (!item.empty() && item.front() == ' ') item.erase(item.begin());
            while (!item.empty() && item.back() == ' ') item.pop_back();
            if (!item.empty()) out.push_back(item);
            start = comma + 1;
        }
    } else {
        throw invalid_input(std::string("Parameter must be a list of strings: ") + key);
    }
    return out;
}

} // namespace rpc
} // namespace bridge
