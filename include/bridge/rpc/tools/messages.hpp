#pragma once
// RPC Messaging Tools: send, inbox, mark_read, ack
//
// Subjects conventionally start with a bracketed tag ([TASK], [DONE],
// [BLOCKED], [QUESTION], [HANDOFF]). The tags are advice for the agents
// only; nothing here parses them.

#include "../types.hpp"
#include "../../store.hpp"
#include <sstream>
#include <unordered_map>

namespace bridge::rpc::tools::messages {

using json = nlohmann::json;

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "send",
        "Send a message to another registered agent. Prefix the subject with "
        "[TASK], [DONE], [BLOCKED], [QUESTION] or [HANDOFF].",
        {
            {"type", "object"},
            {"properties", {
                {"sender", {{"type", "string"}, {"description", "Your agent name"}}},
                {"recipient", {{"type", "string"}, {"description", "Target agent name"}}},
                {"subject", {{"type", "string"}, {"description", "Message subject, e.g. '[TASK] build x'"}}},
                {"body", {{"type", "string"}, {"description", "Message body"}}},
                {"thread_id", {{"type", "string"}, {"description", "Thread ID for grouping"}}}
            }},
            {"required", {"sender", "recipient", "subject"}}
        }
    });

    tools.push_back({
        "inbox",
        "Fetch messages addressed to an agent, oldest first.",
        {
            {"type", "object"},
            {"properties", {
                {"agent", {{"type", "string"}, {"description", "Your agent name"}}},
                {"unread_only", {{"type", "boolean"}, {"default", false}}},
                {"limit", {{"type", "integer"}, {"minimum", 0}, {"default", 0},
                          {"description", "Oldest N messages; 0 for all"}}}
            }},
            {"required", {"agent"}}
        }
    });

    tools.push_back({
        "mark_read",
        "Mark a message as read.",
        {
            {"type", "object"},
            {"properties", {
                {"message_id", {{"type", "integer"}}},
                {"agent", {{"type", "string"}, {"description", "Your agent name; must be the recipient"}}}
            }},
            {"required", {"message_id"}}
        }
    });

    tools.push_back({
        "ack",
        "Acknowledge a message (independent of read).",
        {
            {"type", "object"},
            {"properties", {
                {"message_id", {{"type", "integer"}}},
                {"agent", {{"type", "string"}, {"description", "Your agent name; must be the recipient"}}}
            }},
            {"required", {"message_id"}}
        }
    });
}

inline void describe(std::ostringstream& ss, const Message& m) {
    ss << "\n  #" << m.id
       << " [" << (m.read() ? "read" : "unread") << (m.acknowledged() ? ", acked" : "") << "] "
       << format_timestamp(m.created_at) << " from " << m.sender << ": " << m.subject;
    if (!m.thread_id.empty()) ss << "  (thread " << m.thread_id << ")";
    if (!m.body.empty()) ss << "\n      " << m.body;
}

inline ToolResult send(Store* store, const json& params) {
    Message m = store->send(require_string(params, "sender"),
                            require_string(params, "recipient"),
                            require_string(params, "subject"),
                            get_string(params, "body", ""),
                            get_string(params, "thread_id", ""));

    return ToolResult::ok("Sent message #" + std::to_string(m.id) + " to " + m.recipient,
                          {{"status", "sent"}, {"id", m.id}, {"message", m}});
}

inline ToolResult inbox(Store* store, const json& params) {
    std::string agent = require_string(params, "agent");
    bool unread_only = get_bool(params, "unread_only", false);
    int64_t limit = optional_int(params, "limit").value_or(0);
    if (limit < 0 || limit > INT32_MAX) {
        throw invalid_input("limit must be >= 0");
    }

    auto msgs = store->inbox(agent, unread_only, static_cast<int>(limit));

    std::ostringstream ss;
    ss << msgs.size() << (unread_only ? " unread" : "")
       << (msgs.size() == 1 ? " message" : " messages") << " for " << agent;
    if (!msgs.empty()) ss << ":";
    for (const auto& m : msgs) describe(ss, m);

    return ToolResult::ok(ss.str(), {{"messages", msgs}});
}

inline ToolResult mark_read(Store* store, const json& params) {
    Message m = store->mark_read(require_int(params, "message_id"),
                                 get_string(params, "agent", ""));
    return ToolResult::ok("Message #" + std::to_string(m.id) + " marked read",
                          {{"status", "read"}, {"id", m.id}, {"message", m}});
}

inline ToolResult ack(Store* store, const json& params) {
    Message m = store->ack(require_int(params, "message_id"),
                           get_string(params, "agent", ""));
    return ToolResult::ok("Message #" + std::to_string(m.id) + " acknowledged",
                          {{"status", "acknowledged"}, {"id", m.id}, {"message", m}});
}

inline void register_handlers(Store* store,
                              std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["send"] = [store](const json& p) { return send(store, p); };
    handlers["inbox"] = [store](const json& p) { return inbox(store, p); };
    handlers["mark_read"] = [store](const json& p) { return mark_read(store, p); };
    handlers["ack"] = [store](const json& p) { return ack(store, p); };
}

} // namespace bridge::rpc::tools::messages
