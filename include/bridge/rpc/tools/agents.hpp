#pragma once
// RPC Agent Tools: register, agents

#include "../types.hpp"
#include "../../store.hpp"
#include <sstream>
#include <unordered_map>

namespace bridge::rpc::tools::agents {

using json = nlohmann::json;

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "register",
        "Register this agent with the bridge, or refresh its last-seen time. "
        "Call once at the start of a session. Re-registering is harmless.",
        {
            {"type", "object"},
            {"properties", {
                {"name", {{"type", "string"}, {"description", "Agent name (e.g. 'claude-1', 'opencode-1')"}}},
                {"program", {{"type", "string"}, {"description", "Agent program (claude-code, opencode)"}}},
                {"model", {{"type", "string"}, {"description", "Model being used"}}},
                {"task", {{"type", "string"}, {"description", "Current task description"}}},
                {"status", {{"type", "string"}, {"description", "Free-text status"}, {"default", "active"}}}
            }},
            {"required", {"name"}}
        }
    });

    tools.push_back({
        "agents",
        "List all registered agents, most recently active first.",
        {
            {"type", "object"},
            {"properties", json::object()},
            {"required", json::array()}
        }
    });
}

inline ToolResult register_agent(Store* store, const json& params) {
    std::string name = require_string(params, "name");

    AgentInfo info;
    info.program = optional_string(params, "program");
    info.model = optional_string(params, "model");
    info.task = optional_string(params, "task");
    info.status = optional_string(params, "status");

    Agent agent = store->register_agent(name, info);

    std::ostringstream ss;
    ss << "Registered " << agent.name << " (" << agent.program << ", " << agent.model << ")";
    return ToolResult::ok(ss.str(), {{"status", "registered"}, {"agent", agent}});
}

inline ToolResult list_agents(Store* store, const json&) {
    auto agents = store->list_agents();

    std::ostringstream ss;
    ss << agents.size() << (agents.size() == 1 ? " agent" : " agents");
    if (!agents.empty()) ss << ":";
    for (const auto& a : agents) {
        ss << "\n  " << a.name << "  [" << a.status << "]  "
           << a.program << "/" << a.model
           << "  last seen " << format_timestamp(a.last_seen);
        if (!a.task.empty()) ss << "\n      task: " << a.task;
    }

    return ToolResult::ok(ss.str(), {{"agents", agents}});
}

inline void register_handlers(Store* store,
                              std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["register"] = [store](const json& p) { return register_agent(store, p); };
    handlers["agents"] = [store](const json& p) { return list_agents(store, p); };
}

} // namespace bridge::rpc::tools::agents
