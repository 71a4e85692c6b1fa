#pragma once
// RPC Handler: central request handler for all bridge tools
//
// Used by both surfaces:
// - bridge_mcp feeds it JSON-RPC lines from stdin
// - the bridge CLI calls tools directly through call()

#include "protocol.hpp"
#include "types.hpp"
#include "tools/agents.hpp"
#include "tools/messages.hpp"
#include "tools/locks.hpp"
#include "tools/memory.hpp"
#include "../log.hpp"
#include "../store.hpp"
#include "../version.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace bridge::rpc {

using json = nlohmann::json;

// Structured form of a store error, carried in isError tool results
inline json error_payload(const Error& e) {
    json err = {
        {"kind", to_string(e.kind())},
        {"message", e.what()}
    };
    if (auto* conflict = dynamic_cast<const LockConflict*>(&e)) {
        err["path"] = conflict->path();
        err["holder"] = conflict->holder();
        err["remaining_seconds"] = conflict->remaining_seconds();
    }
    return {{"error", err}};
}

class Handler {
public:
    explicit Handler(Store* store) : store_(store) {
        register_all_tools();
    }

    // One request line in, one reply line out. Empty when no reply is due.
    // Never throws: anything that escapes dispatch becomes an error frame.
    std::string handle(const std::string& line) {
        json frame;
        try {
            frame = dispatch(json::parse(line));
        } catch (const json::parse_error& e) {
            frame = reply::failure(nullptr, ErrorCode::ParseError,
                                   std::string("JSON parse error: ") + e.what());
        } catch (const std::exception& e) {
            log_error("rpc", "request failed: %s", e.what());
            frame = reply::failure(nullptr, ErrorCode::InternalError,
                                   std::string("Internal error: ") + e.what());
        }
        return frame.is_null() ? std::string() : encode(frame);
    }

    // Invoke one tool. Store errors come back as is_error results; an
    // unknown tool name throws InvalidInput.
    ToolResult call(const std::string& name, const json& arguments) {
        auto it = handlers_.find(name);
        if (it == handlers_.end()) {
            throw invalid_input("Unknown tool: " + name);
        }

        try {
            return it->second(arguments);
        } catch (const Error& e) {
            log_debug("rpc", "%s failed: %s", name.c_str(), e.what());
            return ToolResult::error(std::string("Error: ") + e.what(), error_payload(e));
        }
    }

    bool has_tool(const std::string& name) const { return handlers_.count(name) > 0; }

    const std::vector<ToolSchema>& tools() const { return tools_; }

private:
    Store* store_;
    std::vector<ToolSchema> tools_;
    std::unordered_map<std::string, ToolHandler> handlers_;

    void register_all_tools() {
        // Agent registry (register, agents)
        tools::agents::register_schemas(tools_);
        tools::agents::register_handlers(store_, handlers_);

        // Messaging (send, inbox, mark_read, ack)
        tools::messages::register_schemas(tools_);
        tools::messages::register_handlers(store_, handlers_);

        // File locks (lock, unlock, locks)
        tools::locks::register_schemas(tools_);
        tools::locks::register_handlers(store_, handlers_);

        // Shared memory (remember, recall, forget)
        tools::memory::register_schemas(tools_);
        tools::memory::register_handlers(store_, handlers_);
    }

    // ═══════════════════════════════════════════════════════════════════
    // JSON-RPC dispatch
    // ═══════════════════════════════════════════════════════════════════

    json dispatch(const json& frame) {
        Request req;
        std::string problem;
        if (!decode_request(frame, req, problem)) {
            json id = frame.is_object() ? frame.value("id", json()) : json();
            return reply::failure(id, ErrorCode::InvalidRequest, problem);
        }

        log_debug("rpc", "<- %s", req.method.c_str());
        if (req.is_notification()) return json();

        json out;
        if (req.method == "initialize") {
            out = reply::success(req.id, initialize_result());
        } else if (req.method == "ping") {
            out = reply::success(req.id, json::object());
        } else if (req.method == "tools/list") {
            out = reply::success(req.id, tools_list_result());
        } else if (req.method == "tools/call") {
            out = tools_call(req);
        } else {
            out = reply::failure(req.id, ErrorCode::MethodNotFound,
                                 "Unknown method: " + req.method);
        }

        // Id-less requests still run; the host just never hears back
        return req.wants_reply ? out : json();
    }

    json initialize_result() const {
        json info = {{"name", "agent-bridge"}, {"version", BRIDGE_VERSION}};
        json caps = {{"tools", json::object()}};
        return {
            {"protocolVersion", BRIDGE_MCP_PROTOCOL_VERSION},
            {"serverInfo", info},
            {"capabilities", caps}
        };
    }

    json tools_list_result() const {
        json listed = json::array();
        for (const auto& tool : tools_) {
            listed.push_back({
                {"name", tool.name},
                {"description", tool.description},
                {"inputSchema", tool.input_schema}
            });
        }
        return {{"tools", listed}};
    }

    json tools_call(const Request& req) {
        auto name_it = req.params.find("name");
        if (!req.params.is_object() || name_it == req.params.end() || !name_it->is_string()) {
            return reply::failure(req.id, ErrorCode::InvalidParams, "Missing tool name");
        }

        std::string name = name_it->get<std::string>();
        if (!has_tool(name)) {
            return reply::failure(req.id, ErrorCode::UnknownTool, "Unknown tool: " + name);
        }

        json arguments = req.params.value("arguments", json::object());
        if (arguments.is_null()) arguments = json::object();

        try {
            ToolResult result = call(name, arguments);
            return reply::success(req.id, reply::tool_output(result.content, result.is_error,
                                                             result.structured));
        } catch (const std::exception& e) {
            log_error("rpc", "%s: %s", name.c_str(), e.what());
            return reply::failure(req.id, ErrorCode::ToolFailed,
                                  std::string("Tool execution failed: ") + e.what());
        }
    }
};

} // namespace bridge::rpc
